#pragma once

#include <cstdint>
#include <fstream>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace runcatalog {

struct LogRecord {
    std::uint64_t id = 0;
    nlohmann::json doc;
};

// Append-only insert log of one collection: <dataDir>/<collection>.log,
// length-prefixed JSON records each followed by a CRC32.
class LogStore {
public:
    LogStore(const std::string& dataDir, const std::string& collection);
    ~LogStore();

    // Replay all records; returns false on checksum/format failure.
    bool load(const std::function<void(const LogRecord&)>& onRecord);

    // Append a single record; returns false if the write failed.
    bool append(const LogRecord& record);

    bool good() const { return static_cast<bool>(stream_); }
    const std::string& path() const { return logPath_; }

private:
    std::string logPath_;
    std::ofstream stream_;

    void ensureOpen();
};

} // namespace runcatalog
