#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "runcatalog/BlockArray.hpp"
#include "runcatalog/ChunkedCursor.hpp"
#include "runcatalog/Descriptor.hpp"
#include "runcatalog/Mapping.hpp"

namespace runcatalog {

// Collection handles and tunables a Run needs to build its streams. Held by
// value in thunks, so runs outlive the catalog that produced them.
struct RunSources {
    std::shared_ptr<const DocumentCollection> runStops;
    std::shared_ptr<const DocumentCollection> descriptors;
    std::shared_ptr<const DocumentCollection> events;
    std::size_t cursorBatchSize = ChunkedCursor::kDefaultBatchSize;
    std::size_t eventChunkSize = 1000;
    std::size_t fetchConcurrency = RemoteBlockArray::kDefaultParallelism;
};

struct EventStreamRecord {
    std::string streamName;
    std::vector<DescriptorDoc> descriptors;
    std::int64_t cutoffSeqNum = 0;
};

// Named sub-collection of a run: field name -> lazily built array. The field
// set comes from the first descriptor; all descriptors of a stream are
// assumed to declare the same fields.
class EventStream final : public NodeMapping<RemoteBlockArray> {
public:
    using ArrayFactory = std::function<RemoteBlockArray(const std::string& field, const FieldSpec& spec)>;

    // Throws EmptyStream when the record has no descriptors. No array is
    // built until its field is first looked up.
    static EventStream construct(EventStreamRecord record, ArrayFactory factory);

    // Loads the descriptors of (runUid, streamName) and snapshots the stream
    // length as the highest seq_num among their events.
    static EventStream build(const RunSources& sources, const std::string& runUid, const std::string& streamName);

    NodeKind kind() const override { return NodeKind::EventStream; }

    const std::string& streamName() const { return record_.streamName; }
    const std::vector<DescriptorDoc>& descriptors() const { return record_.descriptors; }
    std::int64_t cutoffSeqNum() const { return record_.cutoffSeqNum; }

    Document metadata() const;

private:
    EventStream(EventStreamRecord record, std::shared_ptr<const LazyNode<RemoteBlockArray>> fields);

    EventStreamRecord record_;
};

} // namespace runcatalog
