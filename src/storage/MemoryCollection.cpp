//MemoryCollection.cpp
#include "runcatalog/MemoryCollection.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <iterator>

#include "runcatalog/Analyzer.hpp"
#include "runcatalog/Errors.hpp"
#include "runcatalog/algorithms/DocumentAlgorithms.hpp"

namespace runcatalog {

// -----------------------------------------------------------
// CTOR/DTOR
// -----------------------------------------------------------
MemoryCollection::MemoryCollection(std::string name, const std::string& dataDir)
    : name_(std::move(name)) {
    if (!dataDir.empty()) {
        logStore_ = std::make_unique<LogStore>(dataDir, name_);
        persistenceEnabled_ = logStore_->good();
        if (persistenceEnabled_) {
            loadFromLog();
        } else {
            std::cerr << "MemoryCollection: cannot open " << logStore_->path() << "; running without persistence\n";
        }
    }
}

MemoryCollection::~MemoryCollection() {
}

// -----------------------------------------------------------
// PUBLIC: Insert a document
// -----------------------------------------------------------
DocId MemoryCollection::insertOne(Document doc) {
    if (!doc.is_object()) {
        throw StoreError("collection " + name_ + " only stores objects");
    }

    std::lock_guard<std::mutex> lk(mutex_);
    DocId id = nextId_;
    doc.erase(kIdField);

    if (persistenceEnabled_ && !logStore_->append(LogRecord{id, doc})) {
        throw StoreError("failed to append to " + logStore_->path());
    }

    ++nextId_;
    putDocumentInternal(id, std::move(doc));
    return id;
}

// -----------------------------------------------------------
// PUBLIC: Queries
// -----------------------------------------------------------
std::vector<Document> MemoryCollection::find(const Document& filter, const FindOptions& options) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto hits = matchLocked(filter);

    // documents_ is already in ascending _id order.
    const bool idOrder = options.sort.empty() ||
        (options.sort.size() == 1 && options.sort[0].field == kIdField && options.sort[0].direction > 0);
    if (!idOrder) {
        static const Document kMissing;
        std::stable_sort(hits.begin(), hits.end(), [&](const Document* a, const Document* b) {
            for (const auto& key : options.sort) {
                const Document* va = algo::lookupPath(*a, key.field);
                const Document* vb = algo::lookupPath(*b, key.field);
                const Document& x = va ? *va : kMissing;
                const Document& y = vb ? *vb : kMissing;
                if (algo::lessThan(x, y)) return key.direction > 0;
                if (algo::lessThan(y, x)) return key.direction < 0;
            }
            return false;
        });
    }

    std::vector<Document> out;
    const std::size_t begin = std::min(options.skip, hits.size());
    std::size_t end = hits.size();
    if (options.limit && begin + *options.limit < end) {
        end = begin + *options.limit;
    }
    out.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
        Document doc = *hits[i];
        if (!options.includeId) {
            doc.erase(kIdField);
        }
        out.push_back(std::move(doc));
    }
    return out;
}

std::size_t MemoryCollection::countDocuments(const Document& filter) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return matchLocked(filter).size();
}

std::size_t MemoryCollection::estimatedDocumentCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return documents_.size();
}

std::vector<Document> MemoryCollection::aggregate(const std::vector<Document>& pipeline) const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<Document> docs;
    docs.reserve(documents_.size());
    for (const auto& kv : documents_) {
        docs.push_back(kv.second);
    }

    std::unordered_map<std::string, std::vector<DocId>> textHits;
    auto text = [this, &textHits](const Document& doc, const std::string& search) {
        auto it = textHits.find(search);
        if (it == textHits.end()) {
            it = textHits.emplace(search, textSearchLocked(search)).first;
        }
        auto idIt = doc.find(kIdField);
        if (idIt == doc.end() || !idIt->is_number_unsigned()) return false;
        return std::binary_search(it->second.begin(), it->second.end(), idIt->get<DocId>());
    };
    return algo::runPipeline(std::move(docs), pipeline, text);
}

std::vector<Document> MemoryCollection::distinct(const std::string& field, const Document& filter) const {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<Document> values;
    for (const Document* doc : matchLocked(filter)) {
        const Document* v = algo::lookupPath(*doc, field);
        if (!v) continue;
        if (std::find(values.begin(), values.end(), *v) == values.end()) {
            values.push_back(*v);
        }
    }
    return values;
}

// -----------------------------------------------------------
// PRIVATE: Filter evaluation
// -----------------------------------------------------------
std::vector<const Document*> MemoryCollection::matchLocked(const Document& filter) const {
    std::unordered_map<std::string, std::vector<DocId>> textHits;
    auto text = [this, &textHits](const Document& doc, const std::string& search) {
        auto it = textHits.find(search);
        if (it == textHits.end()) {
            it = textHits.emplace(search, textSearchLocked(search)).first;
        }
        return std::binary_search(it->second.begin(), it->second.end(), doc.at(kIdField).get<DocId>());
    };

    std::vector<const Document*> out;
    for (const auto& kv : documents_) {
        if (algo::matches(kv.second, filter, text)) {
            out.push_back(&kv.second);
        }
    }
    return out;
}

// AND semantics over the query terms.
std::vector<DocId> MemoryCollection::textSearchLocked(const std::string& query) const {
    auto terms = Analyzer::queryTerms(query);
    if (terms.empty()) return {};

    std::vector<DocId> result;
    bool first = true;
    for (const auto& term : terms) {
        auto it = invertedIndex_.find(term);
        if (it == invertedIndex_.end()) {
            return {}; // no documents contain this term
        }
        if (first) {
            result = it->second;
            first = false;
            continue;
        }
        std::vector<DocId> intersection;
        std::set_intersection(
            result.begin(), result.end(),
            it->second.begin(), it->second.end(),
            std::back_inserter(intersection)
        );
        result.swap(intersection);
        if (result.empty()) break;
    }
    return result;
}

// -----------------------------------------------------------
// PRIVATE: Full-text indexing
// -----------------------------------------------------------
void MemoryCollection::indexJsonRecursive(DocId id, const Document& node) {
    if (node.is_string()) {
        for (const auto& term : Analyzer::tokenize(node.get<std::string>())) {
            addPosting(term, id);
        }
    } else if (node.is_array()) {
        for (const auto& element : node) {
            indexJsonRecursive(id, element);
        }
    } else if (node.is_object()) {
        for (const auto& item : node.items()) {
            if (item.key() == kIdField) continue;
            indexJsonRecursive(id, item.value());
        }
    }
}

// Ids arrive in ascending order, so postings stay sorted.
void MemoryCollection::addPosting(const std::string& term, DocId id) {
    auto& vec = invertedIndex_[term];
    if (vec.empty() || vec.back() != id) {
        vec.push_back(id);
    }
}

// -----------------------------------------------------------
// PRIVATE: Persistence helpers
// -----------------------------------------------------------
void MemoryCollection::loadFromLog() {
    if (!logStore_) return;
    std::size_t replayed = 0;
    const bool ok = logStore_->load([this, &replayed](const LogRecord& rec) {
        putDocumentInternal(rec.id, rec.doc);
        nextId_ = std::max<DocId>(nextId_, rec.id + 1);
        ++replayed;
    });
    if (!ok) {
        std::cerr << "MemoryCollection: replay of " << logStore_->path() << " stopped early\n";
    }
    if (replayed > 0) {
        std::cerr << "MemoryCollection: " << name_ << " replayed " << replayed << " documents\n";
    }
}

void MemoryCollection::putDocumentInternal(DocId id, Document doc) {
    doc[kIdField] = id;
    auto& stored = documents_[id];
    stored = std::move(doc);
    indexJsonRecursive(id, stored);
}

// -----------------------------------------------------------
// MemoryDatabase
// -----------------------------------------------------------
MemoryDatabase::MemoryDatabase(std::string name, std::string dataDir)
    : name_(std::move(name)), dataDir_(std::move(dataDir)) {
    if (!dataDir_.empty()) {
        dataDir_ = std::filesystem::absolute(std::filesystem::path(dataDir_)).string();
        std::cerr << "MemoryDatabase: " << name_ << " dataDir=" << dataDir_ << "\n";
    }
}

std::shared_ptr<DocumentCollection> MemoryDatabase::collection(const std::string& name) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = collections_.find(name);
    if (it == collections_.end()) {
        it = collections_.emplace(name, std::make_shared<MemoryCollection>(name, dataDir_)).first;
    }
    return it->second;
}

} // namespace runcatalog
