#include "runcatalog/EventFieldSource.hpp"

#include <algorithm>
#include <cstring>
#include <functional>

#include "runcatalog/Errors.hpp"

namespace runcatalog {

namespace {

// Visit every index of `extent` in row-major order; a 0-d extent is visited once.
void forEachIndex(const Shape& extent, const std::function<void(const Shape&)>& visit) {
    if (elementCount(extent) == 0) return;
    Shape pos(extent.size(), 0);
    while (true) {
        visit(pos);
        bool advanced = false;
        for (std::size_t d = extent.size(); d-- > 0;) {
            if (++pos[d] < extent[d]) {
                advanced = true;
                break;
            }
            pos[d] = 0;
        }
        if (!advanced) return;
    }
}

// Missing or null values are written as zero.
void writeElement(std::uint8_t* dst, DType dtype, const Document* v) {
    switch (dtype) {
    case DType::Float64: {
        double x = 0.0;
        if (v && v->is_number()) x = v->get<double>();
        else if (v && v->is_boolean()) x = v->get<bool>() ? 1.0 : 0.0;
        std::memcpy(dst, &x, sizeof(x));
        break;
    }
    case DType::Int64: {
        std::int64_t x = 0;
        if (v && v->is_number_integer()) x = v->get<std::int64_t>();
        else if (v && v->is_number_float()) x = static_cast<std::int64_t>(v->get<double>());
        else if (v && v->is_boolean()) x = v->get<bool>() ? 1 : 0;
        std::memcpy(dst, &x, sizeof(x));
        break;
    }
    case DType::Bool: {
        std::uint8_t x = 0;
        if (v && v->is_boolean()) x = v->get<bool>() ? 1 : 0;
        else if (v && v->is_number()) x = v->get<double>() != 0.0 ? 1 : 0;
        *dst = x;
        break;
    }
    }
}

} // namespace

EventFieldSource::EventFieldSource(std::shared_ptr<const DocumentCollection> events,
                                   std::vector<std::string> descriptorUids,
                                   std::string field,
                                   ArrayStructure structure,
                                   std::size_t batchSize)
    : events_(std::move(events)),
      descriptorUids_(std::move(descriptorUids)),
      field_(std::move(field)),
      structure_(std::move(structure)),
      batchSize_(batchSize) {
    if (structure_.ndim() == 0) {
        throw ConfigurationError("event field " + field_ + " needs at least the event axis");
    }
    structure_.validate();
}

std::string EventFieldSource::key() const {
    std::string k = "event-field/";
    for (std::size_t i = 0; i < descriptorUids_.size(); ++i) {
        if (i) k += "+";
        k += descriptorUids_[i];
    }
    return k + "/" + field_;
}

ArrayStructure EventFieldSource::structureFor(const FieldSpec& spec, std::int64_t cutoffSeqNum, std::size_t eventChunkSize) {
    Shape shape{static_cast<std::size_t>(std::max<std::int64_t>(0, cutoffSeqNum))};
    Shape chunkLengths{std::max<std::size_t>(1, eventChunkSize)};
    for (auto extent : spec.shape) {
        shape.push_back(extent);
        chunkLengths.push_back(std::max<std::size_t>(1, extent));
    }
    return ArrayStructure::regular(std::move(shape), chunkLengths, fieldDType(spec));
}

std::vector<std::uint8_t> EventFieldSource::fetchBlock(const BlockIndex& block, DType dtype, const Shape& blockShape) const {
    const std::size_t ndim = structure_.ndim();
    if (block.size() != ndim || blockShape.size() != ndim) {
        throw BlockFetchFailure("block index does not match " + key());
    }

    Shape offset(ndim, 0);
    for (std::size_t d = 0; d < ndim; ++d) {
        if (block[d] >= structure_.chunks[d].size()) {
            throw BlockFetchFailure("block out of range for " + key());
        }
        for (std::size_t i = 0; i < block[d]; ++i) {
            offset[d] += structure_.chunks[d][i];
        }
    }

    const std::size_t item = itemSize(dtype);
    const Shape inner(blockShape.begin() + 1, blockShape.end());
    const std::size_t innerCount = elementCount(inner);
    std::vector<std::uint8_t> out(elementCount(blockShape) * item, 0);
    if (out.empty()) return out;

    const auto firstSeq = static_cast<std::int64_t>(offset[0]) + 1;
    const auto lastSeq = static_cast<std::int64_t>(offset[0] + blockShape[0]);
    Document filter = {
        {"descriptor", {{"$in", descriptorUids_}}},
        {"seq_num", {{"$gte", firstSeq}, {"$lte", lastSeq}}}
    };

    // Events arrive in insertion order, so a repeated seq_num keeps the
    // value inserted last.
    ChunkedCursor cursor(events_, std::move(filter), CursorOptions{batchSize_, 0, std::nullopt});
    while (auto event = cursor.next()) {
        auto seqIt = event->find("seq_num");
        if (seqIt == event->end() || !seqIt->is_number_integer()) continue;
        const auto seq = seqIt->get<std::int64_t>();
        if (seq < firstSeq || seq > lastSeq) continue;

        auto dataIt = event->find("data");
        if (dataIt == event->end() || !dataIt->is_object()) continue;
        auto valueIt = dataIt->find(field_);
        if (valueIt == dataIt->end()) continue;
        const Document& value = *valueIt;

        std::uint8_t* row = out.data() + static_cast<std::size_t>(seq - firstSeq) * innerCount * item;
        std::size_t k = 0;
        forEachIndex(inner, [&](const Shape& local) {
            const Document* elem = &value;
            for (std::size_t d = 0; d < local.size() && elem; ++d) {
                const std::size_t idx = offset[d + 1] + local[d];
                elem = (elem->is_array() && idx < elem->size()) ? &(*elem)[idx] : nullptr;
            }
            writeElement(row + k * item, dtype, elem);
            ++k;
        });
    }
    return out;
}

} // namespace runcatalog
