#include "TestSupport.hpp"

#include <cstdio>
#include <fstream>

#include "runcatalog/Config.hpp"
#include "runcatalog/Errors.hpp"

using namespace runcatalog;

static void clearEnvironment() {
    for (const char* name : {"RUNCATALOG_URI", "RUNCATALOG_DATA_DIR", "RUNCATALOG_HOST", "RUNCATALOG_PORT",
                             "RUNCATALOG_BATCH_SIZE", "RUNCATALOG_CHUNK_SIZE", "RUNCATALOG_FETCH_CONCURRENCY",
                             "RUNCATALOG_COMPRESS"}) {
        unsetenv(name);
    }
}

static void testDefaultsAndJson() {
    CatalogConfig defaults;
    expect(defaults.uri == "memory://localhost/catalog" && defaults.port == 8080, "defaults");
    expect(defaults.cursorBatchSize == 100 && defaults.eventChunkSize == 1000 && defaults.fetchConcurrency == 8,
           "default sizes");

    json j = {
        {"uri", "file://localhost/beamline"},
        {"port", 9000},
        {"cursor_batch_size", 25},
        {"compress_blocks", false},
        {"access_policy", "allow_list"},
        {"access_lists", {{"alice", {"A"}}}},
        {"host", nullptr}
    };
    auto c = CatalogConfig::fromJson(j);
    expect(c.uri == "file://localhost/beamline" && c.port == 9000 && c.cursorBatchSize == 25, "keys read");
    expect(!c.compressBlocks && c.host == "0.0.0.0", "null keeps the default");
    expect(c.eventChunkSize == 1000, "missing keys keep defaults");

    auto options = c.catalogOptions();
    expect(options.cursorBatchSize == 25 && options.eventChunkSize == 1000, "catalog options");
    auto server = c.serverOptions();
    expect(server.port == 9000 && !server.compressBlocks && server.adminIdentity == "admin", "server options");

    json wrongType = {{"port", "eighty"}};
    expectThrows<ConfigurationError>([&] { CatalogConfig::fromJson(wrongType); }, "wrong type");
    expectThrows<ConfigurationError>([] { CatalogConfig::fromJson(json::array()); }, "config must be an object");
}

static void testLoad() {
    const std::string path = "testdata_config.json";
    {
        std::ofstream out(path);
        out << R"({"uri": "memory://localhost/loaded", "event_chunk_size": 64})";
    }
    auto c = CatalogConfig::load(path);
    expect(c.uri == "memory://localhost/loaded" && c.eventChunkSize == 64, "loaded from file");

    {
        std::ofstream out(path);
        out << "{not json";
    }
    expectThrows<ConfigurationError>([&] { CatalogConfig::load(path); }, "unparsable file");
    std::remove(path.c_str());
    expectThrows<ConfigurationError>([&] { CatalogConfig::load(path); }, "missing file");
}

static void testEnvironment() {
    clearEnvironment();
    setenv("RUNCATALOG_URI", "memory://localhost/env", 1);
    setenv("RUNCATALOG_PORT", "9100", 1);
    setenv("RUNCATALOG_BATCH_SIZE", "7", 1);
    setenv("RUNCATALOG_CHUNK_SIZE", "lots", 1);
    setenv("RUNCATALOG_FETCH_CONCURRENCY", "0", 1);
    setenv("RUNCATALOG_COMPRESS", "off", 1);

    CatalogConfig c;
    c.applyEnvironment();
    expect(c.uri == "memory://localhost/env" && c.port == 9100, "env strings");
    expect(c.cursorBatchSize == 7, "env size");
    expect(c.eventChunkSize == 1000, "malformed size ignored");
    expect(c.fetchConcurrency == 8, "zero size ignored");
    expect(!c.compressBlocks, "compression switched off");

    setenv("RUNCATALOG_PORT", "port", 1);
    CatalogConfig other;
    other.applyEnvironment();
    expect(other.port == 8080, "malformed port ignored");
    clearEnvironment();
}

static void testAccessPolicies() {
    CatalogConfig c;
    auto open = c.makeAccessPolicy();
    expect(open && open->modifyQueries({FullText{"x"}}, Identity::user("u")).size() == 1, "unrestricted by default");

    c.accessPolicy = "allow_list";
    c.accessLists = {{"alice", {"A"}}, {"carol", "*"}};
    auto lists = c.makeAccessPolicy();
    expect(lists->modifyQueries({}, Identity::user("alice")).size() == 1, "allow list restricts alice");
    expect(lists->modifyQueries({}, Identity::user("carol")).empty(), "carol sees everything");

    c.accessLists = {{"alice", 1}};
    expectThrows<ConfigurationError>([&] { c.makeAccessPolicy(); }, "bad access lists");
    c.accessPolicy = "ldap";
    expectThrows<ConfigurationError>([&] { c.makeAccessPolicy(); }, "unknown policy kind");
}

int main() {
    testDefaultsAndJson();
    testLoad();
    testEnvironment();
    testAccessPolicies();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
