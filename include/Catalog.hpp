//Catalog.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "runcatalog/AccessPolicy.hpp"
#include "runcatalog/BlockArray.hpp"
#include "runcatalog/ChunkedCursor.hpp"
#include "runcatalog/DocumentCollection.hpp"
#include "runcatalog/Mapping.hpp"
#include "runcatalog/QueryRegistry.hpp"
#include "runcatalog/Run.hpp"

namespace runcatalog {

struct CatalogOptions {
    std::size_t cursorBatchSize = ChunkedCursor::kDefaultBatchSize;
    std::size_t eventChunkSize = 1000;
    std::size_t fetchConcurrency = RemoteBlockArray::kDefaultParallelism;
    // Null means QueryRegistry::defaults().
    std::shared_ptr<const QueryRegistry> registry;
};

// Root of the tree: run uid -> Run, over the run_start collection of a
// document database. A Catalog is an immutable view; search() and
// rebindIdentity() return new views sharing the same collections.
class Catalog final : public Mapping<Run> {
public:
    static constexpr const char* kRunStartCollection = "run_start";
    static constexpr const char* kRunStopCollection = "run_stop";
    static constexpr const char* kDescriptorCollection = "event_descriptor";
    static constexpr const char* kEventCollection = "event";

    // Throws ConfigurationError when `policy` is not compatible with this catalog.
    explicit Catalog(std::shared_ptr<Database> database,
                     Document metadata = Document::object(),
                     std::vector<Query> queries = {},
                     std::shared_ptr<const AccessPolicy> policy = nullptr,
                     std::optional<Identity> identity = std::nullopt,
                     CatalogOptions options = {});

    static Catalog fromUri(const std::string& uri,
                           CatalogOptions options = {},
                           std::shared_ptr<const AccessPolicy> policy = nullptr,
                           const std::string& dataRoot = "");

    NodeKind kind() const override { return NodeKind::RunCatalog; }

    // Mapping
    Run lookup(const std::string& uid) const override;
    KeyCursor iterate() const override;
    std::size_t length() const override;
    std::size_t lengthHint() const override;
    std::vector<std::string> keys(const Interval& range) const override;
    std::vector<Item> items(const Interval& range) const override;
    Item itemAt(std::int64_t index) const override;

    // New view with `query` ANDed onto the current ones. The query is
    // translated here so an unregistered kind fails immediately.
    Catalog search(const Query& query) const;

    // Throws AlreadyAuthenticated if this view already has an identity.
    Catalog rebindIdentity(const Identity& identity) const;

    // Copy bound to `identity`, without any check.
    Catalog withIdentity(const Identity& identity) const;

    const std::shared_ptr<Database>& database() const { return database_; }
    const Document& metadata() const { return metadata_; }
    const std::vector<Query>& queries() const { return queries_; }
    const std::shared_ptr<const AccessPolicy>& policy() const { return policy_; }
    const std::optional<Identity>& identity() const { return identity_; }
    const CatalogOptions& options() const { return options_; }
    const QueryRegistry& registry() const { return *registry_; }

    // Stored queries as the policy rewrites them for the current identity.
    std::vector<Query> effectiveQueries() const;

    // Store predicate for effectiveQueries(). Recomputed on every call.
    Document effectiveFilter() const;

private:
    std::shared_ptr<Database> database_;
    Document metadata_;
    std::vector<Query> queries_;
    std::shared_ptr<const AccessPolicy> policy_;
    std::optional<Identity> identity_;
    CatalogOptions options_;
    std::shared_ptr<const QueryRegistry> registry_;

    std::shared_ptr<const DocumentCollection> runStarts_;
    RunSources sources_;

    ChunkedCursor runCursor(std::size_t skip, std::optional<std::size_t> limit) const;
    std::pair<std::size_t, std::optional<std::size_t>> window(const Interval& range) const;
    static std::string uidOf(const Document& start);
};

} // namespace runcatalog
