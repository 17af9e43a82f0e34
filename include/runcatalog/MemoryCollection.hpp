#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "runcatalog/DocumentCollection.hpp"
#include "runcatalog/LogStore.hpp"

namespace runcatalog {

// In-process document collection. Documents are kept in _id order; string
// fields feed an inverted index that answers $text. With a data directory,
// every insert is appended to a LogStore and replayed on open.
class MemoryCollection : public DocumentCollection {
public:
    explicit MemoryCollection(std::string name, const std::string& dataDir = "");
    ~MemoryCollection() override;

    const std::string& name() const override { return name_; }

    std::vector<Document> find(const Document& filter, const FindOptions& options = {}) const override;
    std::size_t countDocuments(const Document& filter) const override;
    std::size_t estimatedDocumentCount() const override;
    std::vector<Document> aggregate(const std::vector<Document>& pipeline) const override;
    std::vector<Document> distinct(const std::string& field, const Document& filter) const override;

    // Assigns the next _id (any caller-supplied _id is replaced).
    DocId insertOne(Document doc) override;

    bool persistenceEnabled() const { return persistenceEnabled_; }

private:
    std::string name_;
    DocId nextId_ = 1;
    bool persistenceEnabled_ = false;
    std::unique_ptr<LogStore> logStore_;

    // Forward index: _id -> document (stored with its _id)
    std::map<DocId, Document> documents_;

    // Inverted index: term -> ascending _ids
    std::unordered_map<std::string, std::vector<DocId>> invertedIndex_;

    mutable std::mutex mutex_;

    std::vector<const Document*> matchLocked(const Document& filter) const;
    std::vector<DocId> textSearchLocked(const std::string& query) const;

    void indexJsonRecursive(DocId id, const Document& node);
    void addPosting(const std::string& term, DocId id);

    void loadFromLog();
    void putDocumentInternal(DocId id, Document doc);
};

// Database of MemoryCollections, persisted under `dataDir` when it is set.
class MemoryDatabase : public Database {
public:
    explicit MemoryDatabase(std::string name, std::string dataDir = "");

    const std::string& name() const override { return name_; }
    std::shared_ptr<DocumentCollection> collection(const std::string& name) override;

    const std::string& dataDir() const { return dataDir_; }

private:
    std::string name_;
    std::string dataDir_;
    std::unordered_map<std::string, std::shared_ptr<MemoryCollection>> collections_;
    std::mutex mutex_;
};

} // namespace runcatalog
