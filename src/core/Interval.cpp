#include "runcatalog/Interval.hpp"

#include <algorithm>
#include <string>

#include "runcatalog/Errors.hpp"

namespace runcatalog {

namespace {

std::size_t clampBound(std::int64_t bound, std::size_t length) {
    const auto len = static_cast<std::int64_t>(length);
    if (bound < 0) {
        bound += len;
    }
    return static_cast<std::size_t>(std::clamp<std::int64_t>(bound, 0, len));
}

} // namespace

bool Interval::needsLength() const {
    return (start && *start < 0) || (stop && *stop < 0);
}

std::pair<std::size_t, std::size_t> Interval::resolve(std::size_t length) const {
    const std::size_t begin = start ? clampBound(*start, length) : 0;
    std::size_t end = stop ? clampBound(*stop, length) : length;
    if (end < begin) {
        end = begin;
    }
    return {begin, end};
}

std::size_t resolveIndex(std::int64_t index, std::size_t length) {
    const auto len = static_cast<std::int64_t>(length);
    const std::int64_t resolved = index < 0 ? index + len : index;
    if (resolved < 0 || resolved >= len) {
        throw IndexOutOfRange("index " + std::to_string(index) + " out of range for length " + std::to_string(length));
    }
    return static_cast<std::size_t>(resolved);
}

} // namespace runcatalog
