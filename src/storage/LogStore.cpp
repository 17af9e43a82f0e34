#include "runcatalog/LogStore.hpp"

#include <filesystem>
#include <iostream>
#include <string_view>

using json = nlohmann::json;

namespace runcatalog {

namespace {

constexpr std::uint32_t kMaxRecordBytes = 64u * 1024u * 1024u;

std::uint32_t crc32(std::string_view data) {
    std::uint32_t crc = 0xFFFFFFFFu;
    for (unsigned char b : data) {
        crc ^= b;
        for (int i = 0; i < 8; ++i) {
            std::uint32_t mask = (crc & 1u) ? 0xFFFFFFFFu : 0u;
            crc = (crc >> 1) ^ (0xEDB88320u & mask);
        }
    }
    return ~crc;
}

} // namespace

LogStore::LogStore(const std::string& dataDir, const std::string& collection) {
    std::filesystem::create_directories(dataDir);
    logPath_ = (std::filesystem::path(dataDir) / (collection + ".log")).string();
    ensureOpen();
}

LogStore::~LogStore() {
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }
}

void LogStore::ensureOpen() {
    if (!stream_.is_open()) {
        stream_.open(logPath_, std::ios::binary | std::ios::app);
    }
}

bool LogStore::load(const std::function<void(const LogRecord&)>& onRecord) {
    std::ifstream in(logPath_, std::ios::binary);
    if (!in) return true; // nothing to load is not an error

    while (true) {
        std::uint32_t len = 0;
        if (!in.read(reinterpret_cast<char*>(&len), sizeof(len))) break;
        if (len == 0 || len > kMaxRecordBytes) {
            std::cerr << "LogStore: suspicious record length " << len << " in " << logPath_ << "\n";
            return false;
        }

        std::string payload(len, '\0');
        if (!in.read(payload.data(), len)) {
            std::cerr << "LogStore: truncated record in " << logPath_ << "; stopping replay\n";
            break;
        }

        std::uint32_t storedCrc = 0;
        if (!in.read(reinterpret_cast<char*>(&storedCrc), sizeof(storedCrc))) break;

        if (crc32(payload) != storedCrc) {
            std::cerr << "LogStore: checksum mismatch in " << logPath_ << "; stopping replay\n";
            return false;
        }

        auto rec = json::parse(payload, nullptr, false);
        if (rec.is_discarded() || !rec.contains("id") || !rec.contains("doc")) {
            std::cerr << "LogStore: invalid record in " << logPath_ << "; skipping\n";
            continue;
        }

        LogRecord record;
        record.id = rec["id"].get<std::uint64_t>();
        record.doc = std::move(rec["doc"]);
        onRecord(record);
    }

    return true;
}

bool LogStore::append(const LogRecord& record) {
    ensureOpen();
    if (!stream_) return false;

    json rec = {
        {"id", record.id},
        {"doc", record.doc}
    };

    std::string payload = rec.dump();
    std::uint32_t len = static_cast<std::uint32_t>(payload.size());
    std::uint32_t checksum = crc32(payload);

    stream_.write(reinterpret_cast<const char*>(&len), sizeof(len));
    stream_.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    stream_.write(reinterpret_cast<const char*>(&checksum), sizeof(checksum));
    stream_.flush();
    return static_cast<bool>(stream_);
}

} // namespace runcatalog
