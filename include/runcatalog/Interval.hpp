#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

namespace runcatalog {

// Half-open positional range. An absent start means 0, an absent stop means
// "to the end". Negative bounds count back from the end.
struct Interval {
    std::optional<std::int64_t> start;
    std::optional<std::int64_t> stop;

    static Interval all() { return Interval{}; }
    static Interval range(std::int64_t start, std::int64_t stop) { return Interval{start, stop}; }
    static Interval from(std::int64_t start) { return Interval{start, std::nullopt}; }
    static Interval upTo(std::int64_t stop) { return Interval{std::nullopt, stop}; }

    // True when resolving needs the total length (a negative bound).
    bool needsLength() const;

    // Clamp to [0, length] and return (begin, end) with begin <= end.
    std::pair<std::size_t, std::size_t> resolve(std::size_t length) const;
};

// Resolve a single (possibly negative) position; throws IndexOutOfRange.
std::size_t resolveIndex(std::int64_t index, std::size_t length);

} // namespace runcatalog
