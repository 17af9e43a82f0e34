#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "runcatalog/EventStream.hpp"

namespace runcatalog {

struct RunRecord {
    std::string uid;
    Document start;
    std::optional<Document> stop; // absent while the run is in progress
};

// One catalog entry: stream name -> EventStream, each built on first access.
// Copies share the same stream cache.
class Run final : public NodeMapping<EventStream> {
public:
    Run(RunRecord record, std::shared_ptr<const LazyNode<EventStream>> streams);

    // Looks up the stop document and the stream names of `startDoc`'s run.
    static Run build(const RunSources& sources, Document startDoc);

    NodeKind kind() const override { return NodeKind::Run; }

    const std::string& uid() const { return record_.uid; }
    const Document& start() const { return record_.start; }
    const std::optional<Document>& stop() const { return record_.stop; }
    bool complete() const { return record_.stop.has_value(); }

    // {"start": ..., "stop": ... or null}
    Document metadata() const;

    // ("start", doc) then ("stop", doc) if the run has ended.
    std::vector<std::pair<std::string, Document>> documents() const;

private:
    RunRecord record_;
};

} // namespace runcatalog
