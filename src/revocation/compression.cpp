#include <credo/revocation/compression.hpp>
#include <limits>
#include <zlib.h>

namespace credo {

    namespace {
        // 15 window bits + 16 selects the gzip wrapper instead of raw zlib
        constexpr int GZIP_WINDOW_BITS = 15 + 16;
        constexpr size_t CHUNK_SIZE = 16384;
    } // namespace

    dp::Result<Bytes, dp::Error> gzipCompress(const Bytes &input) {
        if (input.size() > std::numeric_limits<uInt>::max()) {
            return dp::Result<Bytes, dp::Error>::err(operation_failed("gzipCompress", "input too large"));
        }
        z_stream stream{};
        if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            return dp::Result<Bytes, dp::Error>::err(operation_failed("gzipCompress", "deflateInit2 failed"));
        }

        stream.next_in = const_cast<Bytef *>(input.data());
        stream.avail_in = static_cast<uInt>(input.size());

        Bytes output;
        uint8_t chunk[CHUNK_SIZE];
        int status = Z_OK;
        do {
            stream.next_out = chunk;
            stream.avail_out = CHUNK_SIZE;
            status = deflate(&stream, Z_FINISH);
            if (status == Z_STREAM_ERROR) {
                deflateEnd(&stream);
                return dp::Result<Bytes, dp::Error>::err(operation_failed("gzipCompress", "deflate failed"));
            }
            output.insert(output.end(), chunk, chunk + (CHUNK_SIZE - stream.avail_out));
        } while (status != Z_STREAM_END);

        deflateEnd(&stream);
        return dp::Result<Bytes, dp::Error>::ok(std::move(output));
    }

    dp::Result<Bytes, dp::Error> gzipDecompress(const Bytes &input) {
        if (input.empty()) {
            return dp::Result<Bytes, dp::Error>::err(decode_failed("gzip: empty input"));
        }

        if (input.size() > std::numeric_limits<uInt>::max()) {
            return dp::Result<Bytes, dp::Error>::err(decode_failed("gzip: input too large"));
        }
        z_stream stream{};
        if (inflateInit2(&stream, GZIP_WINDOW_BITS) != Z_OK) {
            return dp::Result<Bytes, dp::Error>::err(decode_failed("gzip: inflateInit2 failed"));
        }

        stream.next_in = const_cast<Bytef *>(input.data());
        stream.avail_in = static_cast<uInt>(input.size());

        Bytes output;
        uint8_t chunk[CHUNK_SIZE];
        int status = Z_OK;
        while (status != Z_STREAM_END) {
            stream.next_out = chunk;
            stream.avail_out = CHUNK_SIZE;
            status = inflate(&stream, Z_NO_FLUSH);
            if (status != Z_OK && status != Z_STREAM_END) {
                std::string reason = stream.msg ? stream.msg : "corrupt stream";
                inflateEnd(&stream);
                return dp::Result<Bytes, dp::Error>::err(decode_failed("gzip: " + reason));
            }
            output.insert(output.end(), chunk, chunk + (CHUNK_SIZE - stream.avail_out));
            if (status == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
                // input exhausted before the gzip trailer
                inflateEnd(&stream);
                return dp::Result<Bytes, dp::Error>::err(decode_failed("gzip: truncated stream"));
            }
        }

        inflateEnd(&stream);
        return dp::Result<Bytes, dp::Error>::ok(std::move(output));
    }

} // namespace credo
