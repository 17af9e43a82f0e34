#include "runcatalog/ChunkedCursor.hpp"

#include "runcatalog/Errors.hpp"

namespace runcatalog {

ChunkedCursor::ChunkedCursor(std::shared_ptr<const DocumentCollection> collection,
                             Document filter,
                             CursorOptions options)
    : collection_(std::move(collection)),
      filter_(std::move(filter)),
      options_(options),
      remaining_(options.limit) {
    if (!collection_) {
        throw ConfigurationError("ChunkedCursor needs a collection");
    }
    if (options_.batchSize == 0) {
        throw ConfigurationError("ChunkedCursor batch size must be positive");
    }
}

std::optional<Document> ChunkedCursor::next() {
    if (buffer_.empty()) {
        fetchRound();
    }
    if (buffer_.empty()) {
        return std::nullopt;
    }
    Document doc = std::move(buffer_.front());
    buffer_.pop_front();
    ++yielded_;
    return doc;
}

std::vector<Document> ChunkedCursor::drain() {
    std::vector<Document> out;
    while (auto doc = next()) {
        out.push_back(std::move(*doc));
    }
    return out;
}

void ChunkedCursor::fetchRound() {
    if (done_) return;
    if (remaining_ && *remaining_ == 0) {
        done_ = true;
        return;
    }

    std::size_t batch = options_.batchSize;
    if (remaining_ && *remaining_ < batch) {
        batch = *remaining_;
    }

    Document query = filter_;
    if (lastSeenId_) {
        Document after = {{kIdField, {{"$gt", *lastSeenId_}}}};
        query = Document::object();
        query["$and"] = Document::array({filter_, after});
    }

    FindOptions find;
    find.sort = {SortKey{kIdField, 1}};
    find.skip = firstRound_ ? options_.skip : 0;
    find.limit = batch;
    find.includeId = true;
    firstRound_ = false;

    std::vector<Document> docs;
    try {
        docs = collection_->find(query, find);
    } catch (...) {
        done_ = true;
        throw;
    }
    ++rounds_;

    if (docs.empty()) {
        done_ = true;
        return;
    }

    lastSeenId_ = docs.back().at(kIdField);
    for (auto& doc : docs) {
        doc.erase(kIdField);
        buffer_.push_back(std::move(doc));
    }
    if (remaining_) {
        *remaining_ -= docs.size() < *remaining_ ? docs.size() : *remaining_;
    }
}

} // namespace runcatalog
