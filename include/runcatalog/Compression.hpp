#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace runcatalog {

enum class BlockEncoding : std::uint16_t { Raw = 0, Zstd = 1 };

// Name used on the wire ("raw", "zstd"); parseBlockEncoding throws
// ConfigurationError for anything else.
std::string blockEncodingName(BlockEncoding encoding);
BlockEncoding parseBlockEncoding(const std::string& name);

// False when the library was built without zstd.
bool zstdAvailable();

// Compresses `payload` in place when asked and possible; returns the
// encoding the payload ends up in.
BlockEncoding maybeCompress(std::string& payload, bool enable, int level = 3);

// Returns false on a corrupt frame or an encoding this build cannot read.
bool maybeDecompress(std::string_view in, BlockEncoding encoding, std::string& out);

} // namespace runcatalog
