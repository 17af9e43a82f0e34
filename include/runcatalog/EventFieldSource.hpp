#pragma once

#include <memory>
#include <string>
#include <vector>

#include "runcatalog/BlockArray.hpp"
#include "runcatalog/ChunkedCursor.hpp"
#include "runcatalog/Descriptor.hpp"

namespace runcatalog {

// Reads one data field of an event stream straight from the event
// collection. Row k of the array is the event with seq_num k+1; a block
// along axis 0 pages only the events in its seq_num range.
class EventFieldSource : public BlockSource {
public:
    EventFieldSource(std::shared_ptr<const DocumentCollection> events,
                     std::vector<std::string> descriptorUids,
                     std::string field,
                     ArrayStructure structure,
                     std::size_t batchSize = ChunkedCursor::kDefaultBatchSize);

    std::string key() const override;
    std::vector<std::uint8_t> fetchBlock(const BlockIndex& block, DType dtype, const Shape& blockShape) const override;

    // (cutoffSeqNum, *spec.shape), chunked along axis 0 by eventChunkSize.
    static ArrayStructure structureFor(const FieldSpec& spec, std::int64_t cutoffSeqNum, std::size_t eventChunkSize);

private:
    std::shared_ptr<const DocumentCollection> events_;
    std::vector<std::string> descriptorUids_;
    std::string field_;
    ArrayStructure structure_;
    std::size_t batchSize_;
};

} // namespace runcatalog
