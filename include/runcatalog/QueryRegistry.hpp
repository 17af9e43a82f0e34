#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "runcatalog/Query.hpp"

namespace runcatalog {

// Maps query kinds (by tag) to functions producing store predicates.
// Nothing is registered implicitly; see registerDefaultQueries().
class QueryRegistry {
public:
    using Translator = std::function<Document(const Query&)>;

    // Re-registering a tag replaces its translator. The built-in tags are
    // reserved: registering one throws ConfigurationError.
    void registerQuery(const std::string& tag, Translator translator);

    static bool isBuiltinTag(const std::string& tag);

    bool supports(const std::string& tag) const;

    // Throws UnsupportedQueryKind for unregistered tags and for extension
    // queries carrying a built-in tag.
    Document translate(const Query& query) const;

    // AND of all predicates; {} (match everything) when empty.
    static Document combine(const std::vector<Document>& predicates);

    // Immutable registry holding the built-in kinds.
    static std::shared_ptr<const QueryRegistry> defaults();

private:
    std::unordered_map<std::string, Translator> translators_;

    friend void registerDefaultQueries(QueryRegistry& registry);
};

// FullText -> {"$text": {"$search": text}}
// KeyLookup -> {"uid": uid}
// RawMongo -> the predicate itself
void registerDefaultQueries(QueryRegistry& registry);

} // namespace runcatalog
