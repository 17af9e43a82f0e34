#include "runcatalog/Run.hpp"

#include "runcatalog/Errors.hpp"

namespace runcatalog {

Run::Run(RunRecord record, std::shared_ptr<const LazyNode<EventStream>> streams)
    : NodeMapping<EventStream>(std::move(streams)), record_(std::move(record)) {
}

Run Run::build(const RunSources& sources, Document startDoc) {
    auto uidIt = startDoc.find("uid");
    if (uidIt == startDoc.end() || !uidIt->is_string()) {
        throw MalformedDocument("run start document has no string uid");
    }

    RunRecord record;
    record.uid = uidIt->get<std::string>();
    record.stop = sources.runStops->findOne({{"run_start", record.uid}});

    const auto names = sources.descriptors->distinct("name", {{"run_start", record.uid}});
    std::vector<std::pair<std::string, LazyNode<EventStream>::Thunk>> entries;
    for (const auto& name : names) {
        if (!name.is_string()) continue;
        const auto streamName = name.get<std::string>();
        const auto uid = record.uid;
        entries.emplace_back(streamName, [sources, uid, streamName] {
            return EventStream::build(sources, uid, streamName);
        });
    }

    record.start = std::move(startDoc);
    auto streams = std::make_shared<const LazyNode<EventStream>>(std::move(entries));
    return Run(std::move(record), std::move(streams));
}

Document Run::metadata() const {
    return {
        {"start", record_.start},
        {"stop", record_.stop ? *record_.stop : Document()}
    };
}

std::vector<std::pair<std::string, Document>> Run::documents() const {
    std::vector<std::pair<std::string, Document>> docs;
    docs.emplace_back("start", record_.start);
    if (record_.stop) {
        docs.emplace_back("stop", *record_.stop);
    }
    return docs;
}

} // namespace runcatalog
