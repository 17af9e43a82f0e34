#include "runcatalog/QueryRegistry.hpp"

#include "runcatalog/Errors.hpp"

namespace runcatalog {

namespace {

struct TagVisitor {
    std::string operator()(const FullText&) const { return kFullTextTag; }
    std::string operator()(const KeyLookup&) const { return kKeyLookupTag; }
    std::string operator()(const RawMongo&) const { return kRawMongoTag; }
    std::string operator()(const ExtensionQuery& q) const { return q.tag; }
};

} // namespace

std::string queryTag(const Query& query) {
    return std::visit(TagVisitor{}, query);
}

bool QueryRegistry::isBuiltinTag(const std::string& tag) {
    return tag == kFullTextTag || tag == kKeyLookupTag || tag == kRawMongoTag;
}

void QueryRegistry::registerQuery(const std::string& tag, Translator translator) {
    if (isBuiltinTag(tag)) {
        throw ConfigurationError("query kind '" + tag + "' is built in and cannot be re-registered");
    }
    if (tag.empty()) {
        throw ConfigurationError("query kind tag must not be empty");
    }
    if (!translator) {
        throw ConfigurationError("translator for query kind '" + tag + "' is empty");
    }
    translators_[tag] = std::move(translator);
}

bool QueryRegistry::supports(const std::string& tag) const {
    return translators_.count(tag) > 0;
}

Document QueryRegistry::translate(const Query& query) const {
    const auto tag = queryTag(query);
    if (std::holds_alternative<ExtensionQuery>(query) && isBuiltinTag(tag)) {
        throw UnsupportedQueryKind(tag);
    }
    auto it = translators_.find(tag);
    if (it == translators_.end()) {
        throw UnsupportedQueryKind(tag);
    }
    return it->second(query);
}

Document QueryRegistry::combine(const std::vector<Document>& predicates) {
    if (predicates.empty()) {
        return Document::object();
    }
    Document combined = Document::object();
    combined["$and"] = predicates;
    return combined;
}

std::shared_ptr<const QueryRegistry> QueryRegistry::defaults() {
    static const std::shared_ptr<const QueryRegistry> registry = [] {
        auto r = std::make_shared<QueryRegistry>();
        registerDefaultQueries(*r);
        return std::shared_ptr<const QueryRegistry>(std::move(r));
    }();
    return registry;
}

void registerDefaultQueries(QueryRegistry& registry) {
    registry.translators_[kFullTextTag] = [](const Query& q) {
        return Document{{"$text", {{"$search", std::get<FullText>(q).text}}}};
    };
    registry.translators_[kKeyLookupTag] = [](const Query& q) {
        return Document{{"uid", std::get<KeyLookup>(q).uid}};
    };
    registry.translators_[kRawMongoTag] = [](const Query& q) {
        return std::get<RawMongo>(q).start;
    };
}

} // namespace runcatalog
