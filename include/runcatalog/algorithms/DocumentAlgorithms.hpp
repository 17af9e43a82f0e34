#pragma once

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace runcatalog::algo {

// Answers {"$text": {"$search": s}} for one document.
using TextMatcher = std::function<bool(const nlohmann::json& doc, const std::string& search)>;

// Dotted-path lookup ("data.x"); nullptr when any segment is missing.
const nlohmann::json* lookupPath(const nlohmann::json& doc, const std::string& path);

// Evaluate a Mongo-style filter. Supported: implicit equality, $eq $ne $gt
// $gte $lt $lte $in $nin $exists on fields, and $and $or $nor $text at the
// top level. Anything else raises StoreError.
bool matches(const nlohmann::json& doc, const nlohmann::json& filter, const TextMatcher& text);

// Ordering used by sort and by $min/$max: numbers against numbers, strings
// against strings, otherwise by type rank.
bool lessThan(const nlohmann::json& a, const nlohmann::json& b);

// Run an aggregation pipeline over already-loaded documents. Stages: $match,
// $group ($max $min $sum $first $last), $sort, $skip, $limit, $count.
std::vector<nlohmann::json> runPipeline(std::vector<nlohmann::json> docs,
                                        const std::vector<nlohmann::json>& pipeline,
                                        const TextMatcher& text);

} // namespace runcatalog::algo
