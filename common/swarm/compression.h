#pragma once

#include "error.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace swarm {

using byte_buffer = std::vector<uint8_t>;

// Pluggable codec used by the context handoff manager
class compression_provider {
public:
    virtual ~compression_provider() = default;

    // level: 0 (store) .. 9 (smallest)
    virtual result<byte_buffer> compress(const std::string& text, int level) = 0;

    virtual result<std::string> decompress(const byte_buffer& data) = 0;

    virtual const char* name() const = 0;
};

// Deflate via zlib
class zlib_compression_provider : public compression_provider {
public:
    result<byte_buffer> compress(const std::string& text, int level) override;
    result<std::string> decompress(const byte_buffer& data) override;
    const char* name() const override { return "zlib"; }
};

std::unique_ptr<compression_provider> make_default_compression_provider();

} // namespace swarm
