#include "runcatalog/StoreUri.hpp"

#include <filesystem>
#include <iostream>

#include "runcatalog/Errors.hpp"
#include "runcatalog/MemoryCollection.hpp"

namespace runcatalog {

StoreUri StoreUri::parse(const std::string& uri) {
    const auto schemeEnd = uri.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        throw ConfigurationError("Invalid URI: '" + uri + "' has no scheme");
    }

    StoreUri parsed;
    parsed.scheme = uri.substr(0, schemeEnd);

    std::string rest = uri.substr(schemeEnd + 3);
    const auto query = rest.find('?');
    if (query != std::string::npos) {
        parsed.options = rest.substr(query + 1);
        rest.resize(query);
    }

    const auto slash = rest.find('/');
    parsed.host = rest.substr(0, slash);
    if (slash != std::string::npos) {
        parsed.database = rest.substr(slash + 1);
        while (!parsed.database.empty() && parsed.database.back() == '/') {
            parsed.database.pop_back();
        }
    }

    if (parsed.database.empty()) {
        throw ConfigurationError("Invalid URI: '" + uri + "' Did you forget to include a database?");
    }
    if (parsed.database.find('/') != std::string::npos) {
        throw ConfigurationError("Invalid URI: '" + uri + "' database name cannot contain '/'");
    }
    return parsed;
}

std::shared_ptr<Database> openDatabase(const std::string& uri, const std::string& dataRoot) {
    const auto parsed = StoreUri::parse(uri);
    if (!parsed.options.empty()) {
        std::cerr << "StoreUri: ignoring options '" << parsed.options << "' for scheme " << parsed.scheme << "\n";
    }

    if (parsed.scheme == "memory") {
        return std::make_shared<MemoryDatabase>(parsed.database);
    }
    if (parsed.scheme == "file") {
        const std::filesystem::path root = dataRoot.empty() ? std::filesystem::path(".") : std::filesystem::path(dataRoot);
        return std::make_shared<MemoryDatabase>(parsed.database, (root / parsed.database).string());
    }

    std::cerr << "StoreUri: no driver for scheme " << parsed.scheme << "\n";
    throw ConfigurationError("Invalid URI: '" + uri + "' scheme '" + parsed.scheme + "' is not supported");
}

} // namespace runcatalog
