#pragma once

#include <cstddef>
#include <string>

namespace mountproxy {
namespace protocol {

// zlib codecs for the Content-Encoding values the proxy can rewrite through.
class Compression {
public:
    enum class Encoding {
        kIdentity,
        kGzip,
        kDeflate,
        kUnknown,
    };

    // Inflated bodies larger than this are rejected.
    static constexpr size_t kMaxInflatedSize = 64 * 1024 * 1024;

    // One coding only; stacked values such as "gzip, br" are kUnknown.
    static Encoding ParseContentEncoding(const std::string& value);

    // Whole-body decode. kDeflate takes zlib-wrapped or raw streams.
    static bool Decompress(Encoding enc, const std::string& in, std::string* out);
    static bool Compress(Encoding enc, const std::string& in, std::string* out);
};

} // namespace protocol
} // namespace mountproxy
