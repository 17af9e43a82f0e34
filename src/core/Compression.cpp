#include "runcatalog/Compression.hpp"

#include <iostream>

#include "runcatalog/Errors.hpp"

#ifdef RUNCATALOG_USE_ZSTD
#include <zstd.h>
#endif

namespace runcatalog {

namespace {

#ifdef RUNCATALOG_USE_ZSTD
bool compressZstd(const std::string& in, std::string& out, int level) {
    size_t maxSize = ZSTD_compressBound(in.size());
    out.resize(maxSize);
    size_t written = ZSTD_compress(out.data(), maxSize, in.data(), in.size(), level);
    if (ZSTD_isError(written)) return false;
    out.resize(written);
    return true;
}

bool decompressZstd(std::string_view in, std::string& out) {
    unsigned long long rawSize = ZSTD_getFrameContentSize(in.data(), in.size());
    if (rawSize == ZSTD_CONTENTSIZE_ERROR || rawSize == ZSTD_CONTENTSIZE_UNKNOWN) return false;
    out.resize(static_cast<size_t>(rawSize));
    size_t res = ZSTD_decompress(out.data(), out.size(), in.data(), in.size());
    if (ZSTD_isError(res)) return false;
    out.resize(res);
    return true;
}
#endif

} // namespace

std::string blockEncodingName(BlockEncoding encoding) {
    return encoding == BlockEncoding::Zstd ? "zstd" : "raw";
}

BlockEncoding parseBlockEncoding(const std::string& name) {
    if (name.empty() || name == "raw") return BlockEncoding::Raw;
    if (name == "zstd") return BlockEncoding::Zstd;
    throw ConfigurationError("unknown block encoding '" + name + "'");
}

bool zstdAvailable() {
#ifdef RUNCATALOG_USE_ZSTD
    return true;
#else
    return false;
#endif
}

BlockEncoding maybeCompress(std::string& payload, bool enable, int level) {
    if (!enable) return BlockEncoding::Raw;
#ifdef RUNCATALOG_USE_ZSTD
    std::string compressed;
    if (compressZstd(payload, compressed, level)) {
        payload.swap(compressed);
        return BlockEncoding::Zstd;
    }
#else
    (void)level;
#endif
    return BlockEncoding::Raw;
}

bool maybeDecompress(std::string_view in, BlockEncoding encoding, std::string& out) {
    if (encoding == BlockEncoding::Raw) {
        out.assign(in.begin(), in.end());
        return true;
    }
#ifdef RUNCATALOG_USE_ZSTD
    if (encoding == BlockEncoding::Zstd) {
        return decompressZstd(in, out);
    }
#endif
    std::cerr << "Compression: unsupported encoding=" << static_cast<int>(encoding) << "\n";
    return false;
}

} // namespace runcatalog
