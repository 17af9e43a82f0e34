#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

#include "Catalog.hpp"
#include "CatalogHttpServer.hpp"

namespace runcatalog {

// Settings of runcatalog_server. Read from a JSON file, then overridden by
// RUNCATALOG_* environment variables.
struct CatalogConfig {
    std::string uri = "memory://localhost/catalog";
    std::string dataDir = "data";
    std::string host = "0.0.0.0";
    int port = 8080;
    std::size_t cursorBatchSize = ChunkedCursor::kDefaultBatchSize;
    std::size_t eventChunkSize = 1000;
    std::size_t fetchConcurrency = RemoteBlockArray::kDefaultParallelism;
    bool compressBlocks = true;
    std::string adminIdentity = "admin";
    // "unrestricted" or "allow_list"
    std::string accessPolicy = "unrestricted";
    nlohmann::json accessLists = nlohmann::json::object();

    // Missing keys keep their defaults. Throws ConfigurationError on wrong types.
    static CatalogConfig fromJson(const nlohmann::json& j);

    // Throws ConfigurationError if the file cannot be read or parsed.
    static CatalogConfig load(const std::string& path);

    // RUNCATALOG_URI, _DATA_DIR, _HOST, _PORT, _BATCH_SIZE, _CHUNK_SIZE,
    // _FETCH_CONCURRENCY, _COMPRESS. Malformed numbers are logged and ignored.
    void applyEnvironment();

    CatalogOptions catalogOptions() const;
    ServerOptions serverOptions() const;

    // Throws ConfigurationError for unknown kinds.
    std::shared_ptr<const AccessPolicy> makeAccessPolicy() const;
};

} // namespace runcatalog
