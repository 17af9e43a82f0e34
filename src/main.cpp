#include "CatalogHttpServer.hpp"
#include "runcatalog/Config.hpp"
#include <iostream>

int main(int argc, char** argv) {
    try {
        runcatalog::CatalogConfig config;
        if (argc > 1) {
            config = runcatalog::CatalogConfig::load(argv[1]);
        }
        config.applyEnvironment();

        auto catalog = runcatalog::Catalog::fromUri(config.uri, config.catalogOptions(),
                                                    config.makeAccessPolicy(), config.dataDir);
        CatalogHttpServer app(std::move(catalog), config.serverOptions());
        std::cout << "Starting server...\n";
        app.run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
