#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "runcatalog/Errors.hpp"
#include "runcatalog/Interval.hpp"

namespace runcatalog {

enum class DType { Float64, Int64, Bool };

std::size_t itemSize(DType dtype);
std::string dtypeName(DType dtype);
DType parseDType(const std::string& name); // throws UnsupportedDType

using Shape = std::vector<std::size_t>;
using Chunks = std::vector<std::vector<std::size_t>>;
using BlockIndex = std::vector<std::size_t>;
using Region = std::vector<Interval>;

std::size_t elementCount(const Shape& shape);

// Shape, per-axis block lengths and element type of a chunked array.
struct ArrayStructure {
    Shape shape;
    Chunks chunks;
    DType dtype = DType::Float64;

    // Split every axis into blocks of at most chunkLengths[d] elements.
    static ArrayStructure regular(Shape shape, const Shape& chunkLengths, DType dtype);

    static ArrayStructure fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;

    // Throws ConfigurationError unless every axis' chunks sum to its extent.
    void validate() const;

    std::size_t ndim() const { return shape.size(); }
    Shape blockCounts() const;
    std::size_t blockCount() const;

    // All block indices in row-major order.
    std::vector<BlockIndex> blockIndices() const;
};

// Dense row-major result of a fetch.
struct NDArray {
    Shape shape;
    DType dtype = DType::Float64;
    std::vector<std::uint8_t> data;

    std::size_t size() const { return elementCount(shape); }

    template <typename T>
    T at(const std::vector<std::size_t>& index) const {
        if (sizeof(T) != itemSize(dtype) || index.size() != shape.size()) {
            throw IndexOutOfRange("element access does not match array shape or dtype");
        }
        std::size_t linear = 0;
        for (std::size_t d = 0; d < shape.size(); ++d) {
            if (index[d] >= shape[d]) {
                throw IndexOutOfRange("index " + std::to_string(index[d]) + " out of range for axis " + std::to_string(d));
            }
            linear = linear * shape[d] + index[d];
        }
        T value;
        std::memcpy(&value, data.data() + linear * sizeof(T), sizeof(T));
        return value;
    }

    template <typename T>
    std::vector<T> values() const {
        if (sizeof(T) != itemSize(dtype)) {
            throw IndexOutOfRange("element type does not match array dtype");
        }
        std::vector<T> out(size());
        if (!out.empty()) {
            std::memcpy(out.data(), data.data(), out.size() * sizeof(T));
        }
        return out;
    }
};

// Where blocks come from. Implementations must tolerate concurrent
// fetchBlock calls.
class BlockSource {
public:
    virtual ~BlockSource() = default;

    // Stable name of the dataset this source serves.
    virtual std::string key() const = 0;

    // Raw row-major bytes of one block: itemSize(dtype) * elementCount(blockShape).
    virtual std::vector<std::uint8_t> fetchBlock(const BlockIndex& block, DType dtype, const Shape& blockShape) const = 0;
};

// N-dimensional array fetched block by block on demand. Immutable.
class RemoteBlockArray {
public:
    static constexpr std::size_t kDefaultParallelism = 8;

    RemoteBlockArray(ArrayStructure structure,
                     std::shared_ptr<const BlockSource> source,
                     std::size_t maxParallel = kDefaultParallelism);

    const ArrayStructure& structure() const { return structure_; }
    const Shape& shape() const { return structure_.shape; }
    DType dtype() const { return structure_.dtype; }
    std::size_t blockCount() const { return structure_.blockCount(); }
    std::string key() const { return source_->key(); }

    Shape blockShape(const BlockIndex& block) const;
    Shape blockOffset(const BlockIndex& block) const;

    // One block, size-checked. Any failure surfaces as BlockFetchFailure.
    NDArray fetchBlock(const BlockIndex& block) const;

    // Every block, fetched concurrently, assembled only if all succeed.
    NDArray materialize() const;

    // Only the blocks intersecting `region` (one Interval per leading axis;
    // missing axes are taken whole).
    NDArray slice(const Region& region) const;

    // Blocks intersecting the resolved per-axis [begin, end) bounds.
    std::vector<BlockIndex> blocksIntersecting(const std::vector<std::pair<std::size_t, std::size_t>>& bounds) const;

private:
    ArrayStructure structure_;
    std::shared_ptr<const BlockSource> source_;
    std::size_t maxParallel_;
    // offsets_[d][i]: start of block i along axis d; last entry is the extent.
    std::vector<std::vector<std::size_t>> offsets_;

    std::vector<NDArray> fetchAll(const std::vector<BlockIndex>& blocks) const;
};

} // namespace runcatalog
