#include "runcatalog/EventStream.hpp"

#include "runcatalog/Errors.hpp"
#include "runcatalog/EventFieldSource.hpp"

namespace runcatalog {

EventStream::EventStream(EventStreamRecord record, std::shared_ptr<const LazyNode<RemoteBlockArray>> fields)
    : NodeMapping<RemoteBlockArray>(std::move(fields)), record_(std::move(record)) {
}

EventStream EventStream::construct(EventStreamRecord record, ArrayFactory factory) {
    if (record.descriptors.empty()) {
        throw EmptyStream("event stream '" + record.streamName + "' needs at least one event descriptor");
    }

    std::vector<std::pair<std::string, LazyNode<RemoteBlockArray>::Thunk>> entries;
    for (const auto& kv : record.descriptors.front().dataKeys) {
        const std::string field = kv.first;
        const FieldSpec spec = kv.second;
        entries.emplace_back(field, [factory, field, spec] { return factory(field, spec); });
    }

    auto fields = std::make_shared<const LazyNode<RemoteBlockArray>>(std::move(entries));
    return EventStream(std::move(record), std::move(fields));
}

EventStream EventStream::build(const RunSources& sources, const std::string& runUid, const std::string& streamName) {
    EventStreamRecord record;
    record.streamName = streamName;

    Document filter = {{"run_start", runUid}, {"name", streamName}};
    ChunkedCursor cursor(sources.descriptors, std::move(filter), CursorOptions{sources.cursorBatchSize, 0, std::nullopt});
    while (auto doc = cursor.next()) {
        record.descriptors.push_back(DescriptorDoc::fromJson(*doc));
    }
    if (record.descriptors.empty()) {
        throw EmptyStream("run " + runUid + " has no event descriptors for stream '" + streamName + "'");
    }

    std::vector<std::string> uids;
    for (const auto& d : record.descriptors) {
        uids.push_back(d.uid);
    }

    // seq_num may repeat, so the stream length is the highest seq_num rather
    // than the number of events. Taken once so the length stays stable while
    // events keep arriving.
    Document match = {{"$match", {{"descriptor", {{"$in", uids}}}}}};
    Document group = {{"$group", {{"_id", "descriptor"}, {"highest_seq_num", {{"$max", "$seq_num"}}}}}};
    const auto rows = sources.events->aggregate({match, group});
    if (!rows.empty() && rows.front().contains("highest_seq_num") && rows.front()["highest_seq_num"].is_number()) {
        record.cutoffSeqNum = rows.front()["highest_seq_num"].get<std::int64_t>();
    }

    auto events = sources.events;
    const auto cutoff = record.cutoffSeqNum;
    const auto chunkSize = sources.eventChunkSize;
    const auto batchSize = sources.cursorBatchSize;
    const auto parallel = sources.fetchConcurrency;
    ArrayFactory factory = [events, uids, cutoff, chunkSize, batchSize, parallel](const std::string& field, const FieldSpec& spec) {
        auto structure = EventFieldSource::structureFor(spec, cutoff, chunkSize);
        auto source = std::make_shared<const EventFieldSource>(events, uids, field, structure, batchSize);
        return RemoteBlockArray(std::move(structure), std::move(source), parallel);
    };

    return construct(std::move(record), std::move(factory));
}

Document EventStream::metadata() const {
    Document descriptors = Document::array();
    for (const auto& d : record_.descriptors) {
        descriptors.push_back(d.raw);
    }
    return {
        {"stream_name", record_.streamName},
        {"descriptors", descriptors},
        {"cutoff_seq_num", record_.cutoffSeqNum}
    };
}

} // namespace runcatalog
