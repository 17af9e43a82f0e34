#pragma once

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

#include "runcatalog/DocumentCollection.hpp"

namespace runcatalog {

struct CursorOptions {
    std::size_t batchSize = 100;
    std::size_t skip = 0;
    std::optional<std::size_t> limit;
};

// Pages through `filter` in rounds of at most batchSize documents sorted by
// _id, each round resuming after the last _id seen, so no store cursor stays
// open between rounds and memory is bounded by one batch.
//
// A document inserted mid-iteration with an _id above the last one seen may
// or may not show up in this pass; one at or below it never does. Nothing is
// yielded twice.
class ChunkedCursor {
public:
    static constexpr std::size_t kDefaultBatchSize = 100;

    ChunkedCursor(std::shared_ptr<const DocumentCollection> collection,
                  Document filter,
                  CursorOptions options = {});

    // Next matching document with _id stripped; empty once exhausted. A store
    // error exhausts the cursor and propagates.
    std::optional<Document> next();

    std::vector<Document> drain();

    bool exhausted() const { return done_ && buffer_.empty(); }
    std::size_t rounds() const { return rounds_; }
    std::size_t yielded() const { return yielded_; }

private:
    std::shared_ptr<const DocumentCollection> collection_;
    Document filter_;
    CursorOptions options_;

    std::deque<Document> buffer_;
    std::optional<Document> lastSeenId_;
    std::optional<std::size_t> remaining_;
    bool firstRound_ = true;
    bool done_ = false;
    std::size_t rounds_ = 0;
    std::size_t yielded_ = 0;

    void fetchRound();
};

} // namespace runcatalog
