#pragma once

#include <string>
#include <chrono>
#include "httplib.h"
#include "Catalog.hpp"
#include <nlohmann/json.hpp>

struct ServerOptions {
    std::string host = "0.0.0.0";
    int port = 8080;
    // X-Identity value that maps to the administrative identity
    std::string adminIdentity = "admin";
    bool compressBlocks = true;
    std::size_t maxPageSize = 500;
};

class CatalogHttpServer {
public:
    CatalogHttpServer(runcatalog::Catalog catalog, ServerOptions options = {});
    void run();

    // For tests: bind an ephemeral port, serve on another thread, stop.
    int bindToAnyPort();
    bool listenAfterBind();
    void waitUntilReady() const;
    void stop();

private:
    void setupRoutes();

    // Catalog view for the caller named by the X-Identity header.
    runcatalog::Catalog viewFor(const httplib::Request& req) const;

    runcatalog::Catalog catalog_;
    ServerOptions options_;
    httplib::Server server_;
    std::chrono::steady_clock::time_point startTime_;
};
