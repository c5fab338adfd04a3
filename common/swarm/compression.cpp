#include "compression.h"

#include <zlib.h>

#include <algorithm>

namespace swarm {

result<byte_buffer> zlib_compression_provider::compress(const std::string& text, int level) {
    level = std::clamp(level, 0, 9);

    uLongf dest_len = compressBound(static_cast<uLong>(text.size()));
    byte_buffer out(dest_len);

    const int rc = compress2(out.data(), &dest_len,
                             reinterpret_cast<const Bytef*>(text.data()),
                             static_cast<uLong>(text.size()), level);
    if (rc != Z_OK) {
        return result<byte_buffer>::failure(ERROR_TYPE_INTERNAL,
                                            "zlib compress failed with code " + std::to_string(rc));
    }
    out.resize(dest_len);
    return result<byte_buffer>::success(std::move(out));
}

result<std::string> zlib_compression_provider::decompress(const byte_buffer& data) {
    if (data.empty()) {
        return result<std::string>::failure(ERROR_TYPE_VALIDATION, "Compressed payload is empty");
    }

    z_stream stream = {};
    if (inflateInit(&stream) != Z_OK) {
        return result<std::string>::failure(ERROR_TYPE_INTERNAL, "zlib inflateInit failed");
    }

    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char chunk[16384];
    int rc = Z_OK;
    while (rc == Z_OK) {
        stream.next_out = reinterpret_cast<Bytef*>(chunk);
        stream.avail_out = sizeof(chunk);
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            break;
        }
        out.append(chunk, sizeof(chunk) - stream.avail_out);
        if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            // Input exhausted before the end of the stream
            rc = Z_DATA_ERROR;
            break;
        }
    }
    inflateEnd(&stream);

    if (rc != Z_STREAM_END) {
        return result<std::string>::failure(ERROR_TYPE_INTERNAL,
                                            "zlib decompress failed with code " + std::to_string(rc));
    }
    return result<std::string>::success(std::move(out));
}

std::unique_ptr<compression_provider> make_default_compression_provider() {
    return std::make_unique<zlib_compression_provider>();
}

} // namespace swarm
