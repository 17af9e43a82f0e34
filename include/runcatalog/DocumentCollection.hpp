#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace runcatalog {

using Document = nlohmann::json;
using DocId = std::uint64_t;

// Store-assigned, strictly increasing identifier carried by every document.
inline constexpr const char* kIdField = "_id";

struct SortKey {
    std::string field;
    int direction = 1; // 1 ascending, -1 descending
};

struct FindOptions {
    std::vector<SortKey> sort;
    std::size_t skip = 0;
    std::optional<std::size_t> limit;
    bool includeId = false;
};

// Query/cursor contract of a document store collection. Filters are
// Mongo-style predicate documents.
class DocumentCollection {
public:
    virtual ~DocumentCollection() = default;

    virtual const std::string& name() const = 0;

    virtual std::vector<Document> find(const Document& filter, const FindOptions& options = {}) const = 0;

    // First match in _id order, without _id. Empty if nothing matches.
    virtual std::optional<Document> findOne(const Document& filter) const;

    virtual std::size_t countDocuments(const Document& filter) const = 0;

    // Approximate size of the whole collection; ignores any filter.
    virtual std::size_t estimatedDocumentCount() const = 0;

    virtual std::vector<Document> aggregate(const std::vector<Document>& pipeline) const = 0;

    // Distinct values of `field` over matching documents, in first-seen order.
    virtual std::vector<Document> distinct(const std::string& field, const Document& filter) const = 0;

    virtual DocId insertOne(Document doc) = 0;
};

class Database {
public:
    virtual ~Database() = default;

    virtual const std::string& name() const = 0;

    // Returns the named collection, creating it on first use.
    virtual std::shared_ptr<DocumentCollection> collection(const std::string& name) = 0;
};

} // namespace runcatalog
