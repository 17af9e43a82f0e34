#pragma once

#include <string>
#include <variant>

#include "runcatalog/DocumentCollection.hpp"

namespace runcatalog {

inline constexpr const char* kFullTextTag = "fulltext";
inline constexpr const char* kKeyLookupTag = "key_lookup";
inline constexpr const char* kRawMongoTag = "raw_mongo";

struct FullText {
    std::string text;
};

struct KeyLookup {
    std::string uid;
};

// A store-native predicate applied to run start documents.
struct RawMongo {
    Document start;
};

// Any other kind; only usable once a translator is registered for `tag`.
struct ExtensionQuery {
    std::string tag;
    Document params;
};

using Query = std::variant<FullText, KeyLookup, RawMongo, ExtensionQuery>;

std::string queryTag(const Query& query);

} // namespace runcatalog
