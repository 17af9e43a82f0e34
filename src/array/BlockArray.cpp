#include "runcatalog/BlockArray.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <iostream>

namespace runcatalog {

namespace {

Shape rowMajorStrides(const Shape& shape) {
    Shape strides(shape.size(), 1);
    for (std::size_t d = shape.size(); d-- > 1;) {
        strides[d - 1] = strides[d] * shape[d];
    }
    return strides;
}

// Copy the `extent` box at srcStart in src to dstStart in dst, one
// contiguous innermost run at a time.
void copyRegion(const NDArray& src, const Shape& srcStart, NDArray& dst, const Shape& dstStart, const Shape& extent) {
    const std::size_t item = itemSize(src.dtype);
    const std::size_t ndim = extent.size();
    if (elementCount(extent) == 0) return;
    if (ndim == 0) {
        std::memcpy(dst.data.data(), src.data.data(), item);
        return;
    }

    const auto srcStrides = rowMajorStrides(src.shape);
    const auto dstStrides = rowMajorStrides(dst.shape);
    const std::size_t run = extent[ndim - 1] * item;
    Shape pos(ndim - 1, 0);

    while (true) {
        std::size_t s = srcStart[ndim - 1];
        std::size_t t = dstStart[ndim - 1];
        for (std::size_t d = 0; d + 1 < ndim; ++d) {
            s += (srcStart[d] + pos[d]) * srcStrides[d];
            t += (dstStart[d] + pos[d]) * dstStrides[d];
        }
        std::memcpy(dst.data.data() + t * item, src.data.data() + s * item, run);

        bool advanced = false;
        for (std::size_t d = ndim - 1; d-- > 0;) {
            if (++pos[d] < extent[d]) {
                advanced = true;
                break;
            }
            pos[d] = 0;
        }
        if (!advanced) return;
    }
}

std::string describe(const BlockIndex& block) {
    std::string out = "(";
    for (std::size_t i = 0; i < block.size(); ++i) {
        if (i) out += ", ";
        out += std::to_string(block[i]);
    }
    return out + ")";
}

std::vector<BlockIndex> cartesian(const std::vector<std::vector<std::size_t>>& perAxis) {
    std::vector<BlockIndex> out;
    for (const auto& axis : perAxis) {
        if (axis.empty()) return out;
    }
    BlockIndex pos(perAxis.size(), 0);
    while (true) {
        BlockIndex block(perAxis.size());
        for (std::size_t d = 0; d < perAxis.size(); ++d) {
            block[d] = perAxis[d][pos[d]];
        }
        out.push_back(std::move(block));

        bool advanced = false;
        for (std::size_t d = perAxis.size(); d-- > 0;) {
            if (++pos[d] < perAxis[d].size()) {
                advanced = true;
                break;
            }
            pos[d] = 0;
        }
        if (!advanced) return out;
    }
}

} // namespace

std::size_t itemSize(DType dtype) {
    switch (dtype) {
    case DType::Float64: return sizeof(double);
    case DType::Int64: return sizeof(std::int64_t);
    case DType::Bool: return 1;
    }
    return 1;
}

std::string dtypeName(DType dtype) {
    switch (dtype) {
    case DType::Float64: return "float64";
    case DType::Int64: return "int64";
    case DType::Bool: return "bool";
    }
    return "unknown";
}

DType parseDType(const std::string& name) {
    if (name == "float64" || name == "<f8") return DType::Float64;
    if (name == "int64" || name == "<i8") return DType::Int64;
    if (name == "bool" || name == "|b1") return DType::Bool;
    throw UnsupportedDType("unsupported dtype '" + name + "'");
}

std::size_t elementCount(const Shape& shape) {
    std::size_t n = 1;
    for (auto extent : shape) n *= extent;
    return n;
}

// -----------------------------------------------------------
// ArrayStructure
// -----------------------------------------------------------
ArrayStructure ArrayStructure::regular(Shape shape, const Shape& chunkLengths, DType dtype) {
    if (chunkLengths.size() != shape.size()) {
        throw ConfigurationError("chunk lengths must give one entry per axis");
    }
    ArrayStructure s;
    s.dtype = dtype;
    s.chunks.resize(shape.size());
    for (std::size_t d = 0; d < shape.size(); ++d) {
        if (chunkLengths[d] == 0) {
            throw ConfigurationError("chunk length along axis " + std::to_string(d) + " must be positive");
        }
        for (std::size_t left = shape[d]; left > 0;) {
            const auto len = std::min(left, chunkLengths[d]);
            s.chunks[d].push_back(len);
            left -= len;
        }
    }
    s.shape = std::move(shape);
    return s;
}

ArrayStructure ArrayStructure::fromJson(const nlohmann::json& j) {
    ArrayStructure s;
    try {
        s.shape = j.at("shape").get<Shape>();
        s.chunks = j.at("chunks").get<Chunks>();
        s.dtype = parseDType(j.at("dtype").get<std::string>());
    } catch (const nlohmann::json::exception& e) {
        throw MalformedDocument(std::string("array structure: ") + e.what());
    }
    s.validate();
    return s;
}

nlohmann::json ArrayStructure::toJson() const {
    return {
        {"shape", shape},
        {"chunks", chunks},
        {"dtype", dtypeName(dtype)}
    };
}

void ArrayStructure::validate() const {
    if (chunks.size() != shape.size()) {
        throw ConfigurationError("chunks give " + std::to_string(chunks.size()) + " axes for a " +
                                 std::to_string(shape.size()) + "-d shape");
    }
    for (std::size_t d = 0; d < shape.size(); ++d) {
        std::size_t total = 0;
        for (auto len : chunks[d]) total += len;
        if (total != shape[d]) {
            throw ConfigurationError("chunks along axis " + std::to_string(d) + " sum to " + std::to_string(total) +
                                     ", expected " + std::to_string(shape[d]));
        }
    }
}

Shape ArrayStructure::blockCounts() const {
    Shape counts;
    counts.reserve(chunks.size());
    for (const auto& axis : chunks) counts.push_back(axis.size());
    return counts;
}

std::size_t ArrayStructure::blockCount() const {
    return elementCount(blockCounts());
}

std::vector<BlockIndex> ArrayStructure::blockIndices() const {
    std::vector<std::vector<std::size_t>> perAxis(chunks.size());
    for (std::size_t d = 0; d < chunks.size(); ++d) {
        for (std::size_t i = 0; i < chunks[d].size(); ++i) perAxis[d].push_back(i);
    }
    return cartesian(perAxis);
}

// -----------------------------------------------------------
// RemoteBlockArray
// -----------------------------------------------------------
RemoteBlockArray::RemoteBlockArray(ArrayStructure structure,
                                   std::shared_ptr<const BlockSource> source,
                                   std::size_t maxParallel)
    : structure_(std::move(structure)),
      source_(std::move(source)),
      maxParallel_(std::max<std::size_t>(1, maxParallel)) {
    if (!source_) {
        throw ConfigurationError("RemoteBlockArray needs a block source");
    }
    structure_.validate();
    offsets_.resize(structure_.ndim());
    for (std::size_t d = 0; d < structure_.ndim(); ++d) {
        std::size_t at = 0;
        offsets_[d].push_back(at);
        for (auto len : structure_.chunks[d]) {
            at += len;
            offsets_[d].push_back(at);
        }
    }
}

Shape RemoteBlockArray::blockShape(const BlockIndex& block) const {
    if (block.size() != structure_.ndim()) {
        throw IndexOutOfRange("block index " + describe(block) + " has the wrong number of axes");
    }
    Shape shape(block.size());
    for (std::size_t d = 0; d < block.size(); ++d) {
        if (block[d] >= structure_.chunks[d].size()) {
            throw IndexOutOfRange("block index " + describe(block) + " out of range along axis " + std::to_string(d));
        }
        shape[d] = structure_.chunks[d][block[d]];
    }
    return shape;
}

Shape RemoteBlockArray::blockOffset(const BlockIndex& block) const {
    blockShape(block); // bounds check
    Shape offset(block.size());
    for (std::size_t d = 0; d < block.size(); ++d) {
        offset[d] = offsets_[d][block[d]];
    }
    return offset;
}

NDArray RemoteBlockArray::fetchBlock(const BlockIndex& block) const {
    const auto shape = blockShape(block);
    std::vector<std::uint8_t> raw;
    try {
        raw = source_->fetchBlock(block, structure_.dtype, shape);
    } catch (const BlockFetchFailure&) {
        throw;
    } catch (const std::exception& e) {
        throw BlockFetchFailure("block " + describe(block) + " of " + source_->key() + ": " + e.what());
    }

    const std::size_t expected = elementCount(shape) * itemSize(structure_.dtype);
    if (raw.size() != expected) {
        throw BlockFetchFailure("block " + describe(block) + " of " + source_->key() + " has " +
                                std::to_string(raw.size()) + " bytes, expected " + std::to_string(expected));
    }
    return NDArray{shape, structure_.dtype, std::move(raw)};
}

std::vector<NDArray> RemoteBlockArray::fetchAll(const std::vector<BlockIndex>& blocks) const {
    std::vector<NDArray> results(blocks.size());

    for (std::size_t begin = 0; begin < blocks.size(); begin += maxParallel_) {
        const std::size_t end = std::min(blocks.size(), begin + maxParallel_);

        std::vector<std::future<NDArray>> futures;
        futures.reserve(end - begin);
        for (std::size_t i = begin; i < end; ++i) {
            futures.push_back(std::async(std::launch::async, [this, &blocks, i] {
                return fetchBlock(blocks[i]);
            }));
        }

        // Join the whole wave before deciding; later waves are never started
        // after a failure.
        std::exception_ptr firstError;
        for (std::size_t k = 0; k < futures.size(); ++k) {
            try {
                results[begin + k] = futures[k].get();
            } catch (const BlockFetchFailure& e) {
                if (!firstError) {
                    std::cerr << "RemoteBlockArray: " << e.what() << "\n";
                    firstError = std::current_exception();
                }
            }
        }
        if (firstError) {
            std::rethrow_exception(firstError);
        }
    }
    return results;
}

NDArray RemoteBlockArray::materialize() const {
    const auto blocks = structure_.blockIndices();
    auto parts = fetchAll(blocks);

    NDArray out{structure_.shape, structure_.dtype, {}};
    out.data.assign(elementCount(structure_.shape) * itemSize(structure_.dtype), 0);
    const Shape origin(structure_.ndim(), 0);
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        copyRegion(parts[i], origin, out, blockOffset(blocks[i]), parts[i].shape);
    }
    return out;
}

std::vector<BlockIndex> RemoteBlockArray::blocksIntersecting(
        const std::vector<std::pair<std::size_t, std::size_t>>& bounds) const {
    std::vector<std::vector<std::size_t>> perAxis(structure_.ndim());
    for (std::size_t d = 0; d < structure_.ndim(); ++d) {
        const auto& off = offsets_[d];
        for (std::size_t i = 0; i + 1 < off.size(); ++i) {
            if (off[i] < bounds[d].second && off[i + 1] > bounds[d].first) {
                perAxis[d].push_back(i);
            }
        }
    }
    return cartesian(perAxis);
}

NDArray RemoteBlockArray::slice(const Region& region) const {
    const std::size_t ndim = structure_.ndim();
    if (region.size() > ndim) {
        throw IndexOutOfRange("region has " + std::to_string(region.size()) + " axes for a " +
                              std::to_string(ndim) + "-d array");
    }

    std::vector<std::pair<std::size_t, std::size_t>> bounds(ndim);
    Shape outShape(ndim);
    for (std::size_t d = 0; d < ndim; ++d) {
        const Interval axis = d < region.size() ? region[d] : Interval::all();
        bounds[d] = axis.resolve(structure_.shape[d]);
        outShape[d] = bounds[d].second - bounds[d].first;
    }

    const auto blocks = blocksIntersecting(bounds);
    auto parts = fetchAll(blocks);

    NDArray out{outShape, structure_.dtype, {}};
    out.data.assign(elementCount(outShape) * itemSize(structure_.dtype), 0);
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        const auto offset = blockOffset(blocks[i]);
        Shape srcStart(ndim), dstStart(ndim), extent(ndim);
        for (std::size_t d = 0; d < ndim; ++d) {
            const auto lo = std::max(bounds[d].first, offset[d]);
            const auto hi = std::min(bounds[d].second, offset[d] + parts[i].shape[d]);
            srcStart[d] = lo - offset[d];
            dstStart[d] = lo - bounds[d].first;
            extent[d] = hi - lo;
        }
        copyRegion(parts[i], srcStart, out, dstStart, extent);
    }
    return out;
}

} // namespace runcatalog
