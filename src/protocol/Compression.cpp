#include "mountproxy/protocol/Compression.h"
#include "mountproxy/protocol/HeaderSet.h"
#include "mountproxy/common/Logger.h"

#include <zlib.h>

#include <cstring>

namespace mountproxy {
namespace protocol {

namespace {

const int kGzipWindow = 16 + MAX_WBITS;
const int kZlibWindow = MAX_WBITS;
const int kRawWindow = -MAX_WBITS;
const size_t kChunk = 16 * 1024;

// Owns a z_stream for one pass in either direction.
class ZStream {
public:
    explicit ZStream(bool inflating) : inflating_(inflating), ready_(false) {
        std::memset(&zs_, 0, sizeof zs_);
    }
    ~ZStream() {
        if (!ready_) return;
        if (inflating_) {
            inflateEnd(&zs_);
        } else {
            deflateEnd(&zs_);
        }
    }
    ZStream(const ZStream&) = delete;
    ZStream& operator=(const ZStream&) = delete;

    bool init(int windowBits) {
        const int rc = inflating_
            ? inflateInit2(&zs_, windowBits)
            : deflateInit2(&zs_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8, Z_DEFAULT_STRATEGY);
        ready_ = rc == Z_OK;
        return ready_;
    }

    // Feeds all of in and collects the output until the stream ends.
    bool run(const std::string& in, std::string* out) {
        zs_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
        zs_.avail_in = static_cast<uInt>(in.size());
        out->clear();
        char chunk[kChunk];
        for (;;) {
            zs_.next_out = reinterpret_cast<Bytef*>(chunk);
            zs_.avail_out = sizeof chunk;
            const int rc = inflating_ ? inflate(&zs_, Z_NO_FLUSH) : deflate(&zs_, Z_FINISH);
            const size_t produced = sizeof chunk - zs_.avail_out;
            out->append(chunk, produced);
            if (rc == Z_STREAM_END) {
                return true;
            }
            if (rc != Z_OK && rc != Z_BUF_ERROR) {
                return false;
            }
            // Input exhausted without the end marker: truncated.
            if (produced == 0 && zs_.avail_in == 0) {
                return false;
            }
            if (out->size() > Compression::kMaxInflatedSize) {
                LOG_WARN << "Compression: output exceeds " << Compression::kMaxInflatedSize << " bytes";
                return false;
            }
        }
    }

private:
    z_stream zs_;
    const bool inflating_;
    bool ready_;
};

bool Inflate(const std::string& in, int windowBits, std::string* out) {
    ZStream zs(true);
    return zs.init(windowBits) && zs.run(in, out);
}

bool Deflate(const std::string& in, int windowBits, std::string* out) {
    ZStream zs(false);
    return zs.init(windowBits) && zs.run(in, out);
}

} // namespace

Compression::Encoding Compression::ParseContentEncoding(const std::string& value) {
    const std::string v = HeaderSet::ToLower(HeaderSet::Trim(value));
    if (v.empty() || v == "identity") return Encoding::kIdentity;
    if (v == "gzip" || v == "x-gzip") return Encoding::kGzip;
    if (v == "deflate") return Encoding::kDeflate;
    return Encoding::kUnknown;
}

bool Compression::Decompress(Encoding enc, const std::string& in, std::string* out) {
    switch (enc) {
        case Encoding::kIdentity:
            *out = in;
            return true;
        case Encoding::kGzip:
            return Inflate(in, kGzipWindow, out);
        case Encoding::kDeflate:
            return Inflate(in, kZlibWindow, out) || Inflate(in, kRawWindow, out);
        case Encoding::kUnknown:
            break;
    }
    return false;
}

bool Compression::Compress(Encoding enc, const std::string& in, std::string* out) {
    switch (enc) {
        case Encoding::kIdentity:
            *out = in;
            return true;
        case Encoding::kGzip:
            return Deflate(in, kGzipWindow, out);
        case Encoding::kDeflate:
            return Deflate(in, kZlibWindow, out);
        case Encoding::kUnknown:
            break;
    }
    return false;
}

} // namespace protocol
} // namespace mountproxy
