#include "TestSupport.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

#include "runcatalog/BlockArray.hpp"
#include "runcatalog/Compression.hpp"
#include "runcatalog/Errors.hpp"

using namespace runcatalog;

namespace {

// Serves blocks of a dense row-major float64 array, recording every request.
class MatrixSource : public BlockSource {
public:
    MatrixSource(Shape shape, Shape chunk) : shape_(std::move(shape)), chunk_(std::move(chunk)) {}

    std::string key() const override { return "matrix"; }

    std::vector<std::uint8_t> fetchBlock(const BlockIndex& block, DType, const Shape& blockShape) const override {
        const int now = ++inFlight_;
        int seen = maxInFlight_.load();
        while (now > seen && !maxInFlight_.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));

        {
            std::lock_guard<std::mutex> lock(mutex_);
            requested_.push_back(block);
        }
        --inFlight_;

        if (failingBlock && block == *failingBlock) {
            throw std::runtime_error("disk on fire");
        }

        std::vector<double> values;
        for (std::size_t r = 0; r < blockShape[0]; ++r) {
            for (std::size_t c = 0; c < blockShape[1]; ++c) {
                const auto row = block[0] * chunk_[0] + r;
                const auto col = block[1] * chunk_[1] + c;
                values.push_back(static_cast<double>(row * shape_[1] + col));
            }
        }
        std::vector<std::uint8_t> bytes(values.size() * sizeof(double));
        std::memcpy(bytes.data(), values.data(), bytes.size());
        if (truncate) {
            bytes.pop_back();
        }
        return bytes;
    }

    std::vector<BlockIndex> requested() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requested_;
    }
    int maxInFlight() const { return maxInFlight_; }

    std::optional<BlockIndex> failingBlock;
    bool truncate = false;

private:
    Shape shape_;
    Shape chunk_;
    mutable std::mutex mutex_;
    mutable std::vector<BlockIndex> requested_;
    mutable std::atomic<int> inFlight_{0};
    mutable std::atomic<int> maxInFlight_{0};
};

} // namespace

static void testStructure() {
    auto s = ArrayStructure::regular({5, 4}, {2, 4}, DType::Float64);
    expect(s.chunks[0] == std::vector<std::size_t>({2, 2, 1}) && s.chunks[1] == std::vector<std::size_t>({4}),
           "regular chunking leaves a short last block");
    expect(s.blockCount() == 3 && s.blockIndices().back() == BlockIndex({2, 0}), "block indices row-major");

    auto roundTrip = ArrayStructure::fromJson(s.toJson());
    expect(roundTrip.shape == s.shape && roundTrip.chunks == s.chunks && roundTrip.dtype == s.dtype, "json form");

    json badSum = {{"shape", {4}}, {"chunks", {{3}}}, {"dtype", "float64"}};
    expectThrows<ConfigurationError>([&] { ArrayStructure::fromJson(badSum); }, "chunks must sum to the extent");
    json missing = {{"shape", {4}}};
    expectThrows<MalformedDocument>([&] { ArrayStructure::fromJson(missing); }, "missing chunks");
    expectThrows<ConfigurationError>([] { ArrayStructure::regular({4}, {0}, DType::Int64); }, "zero chunk length");

    expect(parseDType("float64") == DType::Float64 && parseDType("<i8") == DType::Int64 && parseDType("bool") == DType::Bool,
           "dtype names");
    expectThrows<UnsupportedDType>([] { parseDType("str"); }, "unknown dtype");
    expect(itemSize(DType::Int64) == 8 && itemSize(DType::Bool) == 1, "item sizes");

    auto scalar = ArrayStructure::regular({}, {}, DType::Float64);
    expect(scalar.blockCount() == 1 && elementCount(scalar.shape) == 1, "0-d array is one block of one element");
}

static void testMaterialize() {
    auto source = std::make_shared<MatrixSource>(Shape{4, 4}, Shape{2, 2});
    RemoteBlockArray array(ArrayStructure::regular({4, 4}, {2, 2}, DType::Float64), source);
    expect(array.blockCount() == 4 && array.key() == "matrix", "2x2 blocks");
    expect(array.blockOffset({1, 1}) == Shape({2, 2}) && array.blockShape({1, 0}) == Shape({2, 2}), "block geometry");
    expectThrows<IndexOutOfRange>([&] { array.blockShape({2, 0}); }, "block past the last");
    expectThrows<IndexOutOfRange>([&] { array.blockOffset({0}); }, "wrong number of axes");

    auto all = array.materialize();
    expect(all.shape == Shape({4, 4}), "materialized shape");
    auto values = all.values<double>();
    bool ordered = values.size() == 16;
    for (std::size_t i = 0; ordered && i < values.size(); ++i) {
        ordered = values[i] == static_cast<double>(i);
    }
    expect(ordered, "blocks reassembled row-major");
    expect(source->requested().size() == 4, "each block fetched once");

    auto block = array.fetchBlock({0, 1});
    expect(block.shape == Shape({2, 2}) && block.at<double>({1, 0}) == 6.0, "single block");

    auto ragged = std::make_shared<MatrixSource>(Shape{5, 3}, Shape{2, 2});
    RemoteBlockArray raggedArray(ArrayStructure::regular({5, 3}, {2, 2}, DType::Float64), ragged);
    auto r = raggedArray.materialize();
    expect(raggedArray.blockCount() == 6 && r.at<double>({4, 2}) == 14.0 && r.at<double>({2, 1}) == 7.0,
           "short edge blocks land at their offsets");
}

static void testSlice() {
    auto source = std::make_shared<MatrixSource>(Shape{6, 6}, Shape{2, 2});
    RemoteBlockArray array(ArrayStructure::regular({6, 6}, {2, 2}, DType::Float64), source);

    auto window = array.slice({Interval::range(1, 3), Interval::range(3, 5)});
    expect(window.shape == Shape({2, 2}), "slice shape");
    expect(window.at<double>({0, 0}) == 9.0 && window.at<double>({1, 1}) == 16.0, "slice values");

    std::set<BlockIndex> fetched;
    for (const auto& b : source->requested()) fetched.insert(b);
    std::set<BlockIndex> expected = {{0, 1}, {0, 2}, {1, 1}, {1, 2}};
    expect(fetched == expected && source->requested().size() == 4, "only intersecting blocks fetched");

    auto rows = array.slice({Interval::from(-1)});
    expect(rows.shape == Shape({1, 6}) && rows.at<double>({0, 5}) == 35.0, "missing axes taken whole");

    auto empty = array.slice({Interval::range(4, 2)});
    expect(empty.size() == 0, "empty region fetches nothing");
    expectThrows<IndexOutOfRange>([&] { array.slice({Interval::all(), Interval::all(), Interval::all()}); },
                                  "too many axes");
}

static void testFailures() {
    auto failing = std::make_shared<MatrixSource>(Shape{4, 4}, Shape{2, 2});
    failing->failingBlock = BlockIndex{1, 0};
    RemoteBlockArray array(ArrayStructure::regular({4, 4}, {2, 2}, DType::Float64), failing);
    try {
        array.materialize();
        expect(false, "a failed block must fail the whole array");
    } catch (const BlockFetchFailure& e) {
        expect(std::string(e.what()).find("disk on fire") != std::string::npos, "failure names the cause");
    }

    auto partial = array.slice({Interval::range(0, 2)});
    expect(partial.shape == Shape({2, 4}), "blocks away from the failure still load");

    auto truncated = std::make_shared<MatrixSource>(Shape{2, 2}, Shape{2, 2});
    truncated->truncate = true;
    RemoteBlockArray shortArray(ArrayStructure::regular({2, 2}, {2, 2}, DType::Float64), truncated);
    expectThrows<BlockFetchFailure>([&] { shortArray.fetchBlock({0, 0}); }, "payload size is checked");
    expectThrows<BlockFetchFailure>([&] { shortArray.materialize(); }, "size check applies to materialize");

    auto boolStructure = ArrayStructure::regular({2}, {1}, DType::Bool);
    expectThrows<ConfigurationError>([&] { RemoteBlockArray unsourced(boolStructure, nullptr); }, "source required");
}

static void testParallelism() {
    auto source = std::make_shared<MatrixSource>(Shape{8, 8}, Shape{1, 1});
    RemoteBlockArray narrow(ArrayStructure::regular({8, 8}, {1, 1}, DType::Float64), source, 3);
    narrow.materialize();
    expect(source->maxInFlight() <= 3, "at most maxParallel fetches in flight");
    expect(source->requested().size() == 64, "every block fetched");

    auto serial = std::make_shared<MatrixSource>(Shape{2, 2}, Shape{1, 1});
    RemoteBlockArray one(ArrayStructure::regular({2, 2}, {1, 1}, DType::Float64), serial, 0);
    one.materialize();
    expect(serial->maxInFlight() == 1, "parallelism below one is clamped to one");
}

static void testCompression() {
    expect(parseBlockEncoding("") == BlockEncoding::Raw && parseBlockEncoding("zstd") == BlockEncoding::Zstd,
           "encoding names");
    expectThrows<ConfigurationError>([] { parseBlockEncoding("gzip"); }, "unknown encoding");

    std::string payload(4096, 'a');
    const std::string original = payload;
    auto encoding = maybeCompress(payload, false);
    expect(encoding == BlockEncoding::Raw && payload == original, "disabled compression leaves the payload alone");

    encoding = maybeCompress(payload, true);
    std::string restored;
    expect(maybeDecompress(payload, encoding, restored) && restored == original, "compressed payload decodes");
    if (zstdAvailable()) {
        expect(encoding == BlockEncoding::Zstd && payload.size() < original.size(), "zstd shrinks repetitive data");
        std::string garbage = "not a frame";
        expect(!maybeDecompress(garbage, BlockEncoding::Zstd, restored), "corrupt frame rejected");
    }
}

int main() {
    testStructure();
    testMaterialize();
    testSlice();
    testFailures();
    testParallelism();
    testCompression();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
