#include "Catalog.hpp"

#include <algorithm>
#include <iostream>

#include "runcatalog/Errors.hpp"
#include "runcatalog/StoreUri.hpp"

namespace runcatalog {

Catalog::Catalog(std::shared_ptr<Database> database,
                 Document metadata,
                 std::vector<Query> queries,
                 std::shared_ptr<const AccessPolicy> policy,
                 std::optional<Identity> identity,
                 CatalogOptions options)
    : database_(std::move(database)),
      metadata_(std::move(metadata)),
      queries_(std::move(queries)),
      policy_(std::move(policy)),
      identity_(std::move(identity)),
      options_(std::move(options)) {
    if (!database_) {
        throw ConfigurationError("Catalog needs a database");
    }
    if (options_.cursorBatchSize == 0 || options_.eventChunkSize == 0 || options_.fetchConcurrency == 0) {
        throw ConfigurationError("Catalog batch size, chunk size and fetch concurrency must be positive");
    }
    registry_ = options_.registry ? options_.registry : QueryRegistry::defaults();

    runStarts_ = database_->collection(kRunStartCollection);
    sources_.runStops = database_->collection(kRunStopCollection);
    sources_.descriptors = database_->collection(kDescriptorCollection);
    sources_.events = database_->collection(kEventCollection);
    sources_.cursorBatchSize = options_.cursorBatchSize;
    sources_.eventChunkSize = options_.eventChunkSize;
    sources_.fetchConcurrency = options_.fetchConcurrency;

    if (policy_ && !policy_->checkCompatibility(*this)) {
        throw ConfigurationError("access policy is not compatible with the run catalog");
    }
}

Catalog Catalog::fromUri(const std::string& uri,
                         CatalogOptions options,
                         std::shared_ptr<const AccessPolicy> policy,
                         const std::string& dataRoot) {
    auto database = openDatabase(uri, dataRoot);
    std::cerr << "Catalog: opened database '" << database->name() << "' from " << uri << "\n";
    return Catalog(std::move(database), Document::object(), {}, std::move(policy), std::nullopt, std::move(options));
}

//-------------------------------------------------------------
// Filters
//-------------------------------------------------------------
std::vector<Query> Catalog::effectiveQueries() const {
    if (!policy_) {
        return queries_;
    }
    return policy_->modifyQueries(queries_, identity_);
}

Document Catalog::effectiveFilter() const {
    std::vector<Document> predicates;
    for (const auto& query : effectiveQueries()) {
        predicates.push_back(registry_->translate(query));
    }
    return QueryRegistry::combine(predicates);
}

ChunkedCursor Catalog::runCursor(std::size_t skip, std::optional<std::size_t> limit) const {
    return ChunkedCursor(runStarts_, effectiveFilter(), CursorOptions{options_.cursorBatchSize, skip, limit});
}

// (skip, limit) for a positional range. Only negative bounds cost a count.
std::pair<std::size_t, std::optional<std::size_t>> Catalog::window(const Interval& range) const {
    if (range.needsLength()) {
        const auto bounds = range.resolve(length());
        return {bounds.first, bounds.second - bounds.first};
    }
    const auto begin = static_cast<std::size_t>(std::max<std::int64_t>(0, range.start.value_or(0)));
    if (!range.stop) {
        return {begin, std::nullopt};
    }
    const auto stop = static_cast<std::size_t>(*range.stop);
    return {begin, stop > begin ? stop - begin : 0};
}

std::string Catalog::uidOf(const Document& start) {
    auto it = start.find("uid");
    if (it == start.end() || !it->is_string()) {
        throw MalformedDocument("run start document has no string uid");
    }
    return it->get<std::string>();
}

//-------------------------------------------------------------
// Mapping
//-------------------------------------------------------------
Run Catalog::lookup(const std::string& uid) const {
    std::vector<Document> predicates;
    for (const auto& query : effectiveQueries()) {
        predicates.push_back(registry_->translate(query));
    }
    predicates.push_back(registry_->translate(KeyLookup{uid}));

    auto start = runStarts_->findOne(QueryRegistry::combine(predicates));
    if (!start) {
        throw NotFound(uid);
    }
    return Run::build(sources_, std::move(*start));
}

KeyCursor Catalog::iterate() const {
    auto cursor = std::make_shared<ChunkedCursor>(runCursor(0, std::nullopt));
    return KeyCursor([cursor]() -> std::optional<std::string> {
        auto doc = cursor->next();
        if (!doc) return std::nullopt;
        return uidOf(*doc);
    });
}

std::size_t Catalog::length() const {
    return runStarts_->countDocuments(effectiveFilter());
}

std::size_t Catalog::lengthHint() const {
    return runStarts_->estimatedDocumentCount();
}

std::vector<std::string> Catalog::keys(const Interval& range) const {
    const auto win = window(range);
    if (win.second && *win.second == 0) return {};
    auto cursor = runCursor(win.first, win.second);
    std::vector<std::string> out;
    while (auto doc = cursor.next()) {
        out.push_back(uidOf(*doc));
    }
    return out;
}

std::vector<Catalog::Item> Catalog::items(const Interval& range) const {
    const auto win = window(range);
    if (win.second && *win.second == 0) return {};
    auto cursor = runCursor(win.first, win.second);
    std::vector<Item> out;
    while (auto doc = cursor.next()) {
        auto uid = uidOf(*doc);
        out.emplace_back(std::move(uid), Run::build(sources_, std::move(*doc)));
    }
    return out;
}

Catalog::Item Catalog::itemAt(std::int64_t index) const {
    if (index < 0) {
        index = static_cast<std::int64_t>(resolveIndex(index, length()));
    }
    auto cursor = runCursor(static_cast<std::size_t>(index), 1);
    auto doc = cursor.next();
    if (!doc) {
        throw IndexOutOfRange("index " + std::to_string(index) + " out of range for catalog");
    }
    auto uid = uidOf(*doc);
    return Item(std::move(uid), Run::build(sources_, std::move(*doc)));
}

//-------------------------------------------------------------
// Views
//-------------------------------------------------------------
Catalog Catalog::search(const Query& query) const {
    registry_->translate(query);
    Catalog next(*this);
    next.queries_.push_back(query);
    return next;
}

Catalog Catalog::rebindIdentity(const Identity& identity) const {
    if (identity_) {
        throw AlreadyAuthenticated("catalog is already bound to identity '" + identity_->name() + "'");
    }
    if (policy_) {
        return policy_->filterResults(*this, identity);
    }
    return withIdentity(identity);
}

Catalog Catalog::withIdentity(const Identity& identity) const {
    Catalog next(*this);
    next.identity_ = identity;
    return next;
}

} // namespace runcatalog
