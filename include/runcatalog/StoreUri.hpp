#pragma once

#include <memory>
#include <string>

#include "runcatalog/DocumentCollection.hpp"

namespace runcatalog {

// scheme://host[:port]/database[?options]
struct StoreUri {
    std::string scheme;
    std::string host;
    std::string database;
    std::string options;

    // Throws ConfigurationError when the URI is malformed or names no database.
    static StoreUri parse(const std::string& uri);
};

// Opens the database a URI names. "memory" gives a fresh in-process database;
// "file" gives one persisted under <dataRoot>/<database>. Other schemes have
// no driver here and raise ConfigurationError. Neither in-process scheme
// takes options; any are logged and ignored.
std::shared_ptr<Database> openDatabase(const std::string& uri, const std::string& dataRoot = "");

} // namespace runcatalog
