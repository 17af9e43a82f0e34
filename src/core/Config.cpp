#include "runcatalog/Config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

#include "runcatalog/Errors.hpp"

namespace runcatalog {

namespace {

template <typename T>
void readKey(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("config key '") + key + "': " + e.what());
    }
}

void readSize(const char* name, std::size_t& out) {
    const char* env = std::getenv(name);
    if (!env) return;
    try {
        auto v = std::stoull(env);
        if (v == 0) {
            std::cerr << "Config: ignoring " << name << "=0\n";
            return;
        }
        out = static_cast<std::size_t>(v);
    } catch (const std::exception&) {
        std::cerr << "Config: ignoring malformed " << name << "=" << env << "\n";
    }
}

} // namespace

CatalogConfig CatalogConfig::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("config must be a JSON object");
    }
    CatalogConfig c;
    readKey(j, "uri", c.uri);
    readKey(j, "data_dir", c.dataDir);
    readKey(j, "host", c.host);
    readKey(j, "port", c.port);
    readKey(j, "cursor_batch_size", c.cursorBatchSize);
    readKey(j, "event_chunk_size", c.eventChunkSize);
    readKey(j, "fetch_concurrency", c.fetchConcurrency);
    readKey(j, "compress_blocks", c.compressBlocks);
    readKey(j, "admin_identity", c.adminIdentity);
    readKey(j, "access_policy", c.accessPolicy);
    if (j.contains("access_lists")) {
        c.accessLists = j["access_lists"];
    }
    return c;
}

CatalogConfig CatalogConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("cannot open config file " + path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError("config file " + path + ": " + e.what());
    }
    return fromJson(j);
}

void CatalogConfig::applyEnvironment() {
    if (const char* env = std::getenv("RUNCATALOG_URI")) uri = env;
    if (const char* env = std::getenv("RUNCATALOG_DATA_DIR")) dataDir = env;
    if (const char* env = std::getenv("RUNCATALOG_HOST")) host = env;
    if (const char* envPort = std::getenv("RUNCATALOG_PORT")) {
        try {
            port = std::stoi(envPort);
        } catch (const std::exception&) {
            std::cerr << "Config: ignoring malformed RUNCATALOG_PORT=" << envPort << "\n";
        }
    }
    readSize("RUNCATALOG_BATCH_SIZE", cursorBatchSize);
    readSize("RUNCATALOG_CHUNK_SIZE", eventChunkSize);
    readSize("RUNCATALOG_FETCH_CONCURRENCY", fetchConcurrency);
    if (const char* envComp = std::getenv("RUNCATALOG_COMPRESS")) {
        std::string v(envComp);
        compressBlocks = !(v == "0" || v == "false" || v == "off");
    }
}

CatalogOptions CatalogConfig::catalogOptions() const {
    CatalogOptions options;
    options.cursorBatchSize = cursorBatchSize;
    options.eventChunkSize = eventChunkSize;
    options.fetchConcurrency = fetchConcurrency;
    return options;
}

ServerOptions CatalogConfig::serverOptions() const {
    ServerOptions options;
    options.host = host;
    options.port = port;
    options.adminIdentity = adminIdentity;
    options.compressBlocks = compressBlocks;
    return options;
}

std::shared_ptr<const AccessPolicy> CatalogConfig::makeAccessPolicy() const {
    if (accessPolicy == "unrestricted") {
        return std::make_shared<const UnrestrictedAccessPolicy>();
    }
    if (accessPolicy == "allow_list") {
        return std::make_shared<const AllowListedAccessPolicy>(AllowListedAccessPolicy::fromJson(accessLists));
    }
    throw ConfigurationError("unknown access policy '" + accessPolicy + "'");
}

} // namespace runcatalog
