#include "runcatalog/algorithms/DocumentAlgorithms.hpp"

#include <algorithm>
#include <unordered_map>

#include "runcatalog/Errors.hpp"

using json = nlohmann::json;

namespace runcatalog::algo {

namespace {

int typeRank(const json& v) {
    if (v.is_null()) return 0;
    if (v.is_number()) return 1;
    if (v.is_string()) return 2;
    if (v.is_object()) return 3;
    if (v.is_array()) return 4;
    if (v.is_boolean()) return 5;
    return 6;
}

bool comparable(const json& a, const json& b) {
    return typeRank(a) == typeRank(b) && !a.is_null() && !a.is_structured();
}

bool isOperatorObject(const json& cond) {
    if (!cond.is_object() || cond.empty()) return false;
    for (const auto& item : cond.items()) {
        if (item.key().empty() || item.key()[0] != '$') return false;
    }
    return true;
}

// Equality with Mongo's array rule: a field holding an array matches a
// scalar target if any element equals it.
bool equalsValue(const json* value, const json& target) {
    if (!value) return target.is_null();
    if (*value == target) return true;
    if (value->is_array() && !target.is_array()) {
        return std::any_of(value->begin(), value->end(), [&](const json& e) { return e == target; });
    }
    return false;
}

template <typename Cmp>
bool compareValue(const json* value, const json& target, Cmp cmp) {
    if (!value) return false;
    if (value->is_array()) {
        return std::any_of(value->begin(), value->end(), [&](const json& e) {
            return comparable(e, target) && cmp(e, target);
        });
    }
    return comparable(*value, target) && cmp(*value, target);
}

bool inList(const json* value, const json& list, const std::string& op) {
    if (!list.is_array()) {
        throw StoreError(op + " needs an array");
    }
    return std::any_of(list.begin(), list.end(), [&](const json& t) { return equalsValue(value, t); });
}

bool matchField(const json* value, const json& cond) {
    if (!isOperatorObject(cond)) {
        return equalsValue(value, cond);
    }
    for (const auto& item : cond.items()) {
        const auto& op = item.key();
        const auto& arg = item.value();
        bool ok = false;
        if (op == "$eq") ok = equalsValue(value, arg);
        else if (op == "$ne") ok = !equalsValue(value, arg);
        else if (op == "$gt") ok = compareValue(value, arg, [](const json& a, const json& b) { return b < a; });
        else if (op == "$gte") ok = compareValue(value, arg, [](const json& a, const json& b) { return !(a < b); });
        else if (op == "$lt") ok = compareValue(value, arg, [](const json& a, const json& b) { return a < b; });
        else if (op == "$lte") ok = compareValue(value, arg, [](const json& a, const json& b) { return !(b < a); });
        else if (op == "$in") ok = inList(value, arg, op);
        else if (op == "$nin") ok = !inList(value, arg, op);
        else if (op == "$exists") ok = (value != nullptr) == (arg.is_boolean() ? arg.get<bool>() : arg != 0);
        else throw StoreError("unsupported field operator " + op);
        if (!ok) return false;
    }
    return true;
}

const json& subFilters(const json& cond, const std::string& op) {
    if (!cond.is_array()) {
        throw StoreError(op + " needs an array of filters");
    }
    return cond;
}

// "$field" references a document path, anything else is a literal.
json evalExpression(const json& doc, const json& expr) {
    if (expr.is_string()) {
        const auto& s = expr.get_ref<const std::string&>();
        if (!s.empty() && s[0] == '$') {
            const json* v = lookupPath(doc, s.substr(1));
            return v ? *v : json();
        }
    }
    return expr;
}

struct Accumulator {
    std::string op;
    json expr;
};

void accumulate(json& slot, bool& seen, const Accumulator& acc, const json& doc) {
    json v = evalExpression(doc, acc.expr);
    if (acc.op == "$sum") {
        if (!v.is_number()) return;
        if (!seen) {
            slot = v;
        } else if (slot.is_number_integer() && v.is_number_integer()) {
            slot = slot.get<std::int64_t>() + v.get<std::int64_t>();
        } else {
            slot = slot.get<double>() + v.get<double>();
        }
        seen = true;
    } else if (acc.op == "$max" || acc.op == "$min") {
        if (v.is_null()) return;
        if (!seen || (acc.op == "$max" ? lessThan(slot, v) : lessThan(v, slot))) {
            slot = v;
        }
        seen = true;
    } else if (acc.op == "$first") {
        if (!seen) slot = v;
        seen = true;
    } else if (acc.op == "$last") {
        slot = v;
        seen = true;
    } else {
        throw StoreError("unsupported accumulator " + acc.op);
    }
}

std::vector<json> groupStage(const std::vector<json>& docs, const json& spec) {
    if (!spec.is_object() || !spec.contains("_id")) {
        throw StoreError("$group needs an _id expression");
    }
    std::vector<std::pair<std::string, Accumulator>> accs;
    for (const auto& item : spec.items()) {
        if (item.key() == "_id") continue;
        const auto& body = item.value();
        if (!body.is_object() || body.size() != 1) {
            throw StoreError("$group field " + item.key() + " needs exactly one accumulator");
        }
        accs.push_back({item.key(), Accumulator{body.begin().key(), body.begin().value()}});
    }

    struct Group {
        json key;
        std::vector<json> values;
        std::vector<bool> seen;
    };
    std::vector<Group> groups;
    std::unordered_map<std::string, std::size_t> byKey;

    for (const auto& doc : docs) {
        json key = evalExpression(doc, spec["_id"]);
        auto dumped = key.dump();
        auto it = byKey.find(dumped);
        if (it == byKey.end()) {
            it = byKey.emplace(dumped, groups.size()).first;
            groups.push_back(Group{key, std::vector<json>(accs.size()), std::vector<bool>(accs.size(), false)});
        }
        auto& group = groups[it->second];
        for (std::size_t i = 0; i < accs.size(); ++i) {
            bool seen = group.seen[i];
            accumulate(group.values[i], seen, accs[i].second, doc);
            group.seen[i] = seen;
        }
    }

    std::vector<json> out;
    out.reserve(groups.size());
    for (auto& group : groups) {
        json row = {{"_id", group.key}};
        for (std::size_t i = 0; i < accs.size(); ++i) {
            if (!group.seen[i] && accs[i].second.op == "$sum") {
                row[accs[i].first] = 0;
            } else {
                row[accs[i].first] = group.values[i];
            }
        }
        out.push_back(std::move(row));
    }
    return out;
}

void sortDocs(std::vector<json>& docs, const json& spec) {
    if (!spec.is_object()) {
        throw StoreError("$sort needs an object");
    }
    std::vector<std::pair<std::string, int>> keys;
    for (const auto& item : spec.items()) {
        keys.emplace_back(item.key(), item.value().get<int>() < 0 ? -1 : 1);
    }
    static const json kMissing;
    std::stable_sort(docs.begin(), docs.end(), [&](const json& a, const json& b) {
        for (const auto& key : keys) {
            const json* va = lookupPath(a, key.first);
            const json* vb = lookupPath(b, key.first);
            const json& x = va ? *va : kMissing;
            const json& y = vb ? *vb : kMissing;
            if (lessThan(x, y)) return key.second > 0;
            if (lessThan(y, x)) return key.second < 0;
        }
        return false;
    });
}

} // namespace

const json* lookupPath(const json& doc, const std::string& path) {
    const json* node = &doc;
    std::size_t begin = 0;
    while (begin <= path.size()) {
        auto end = path.find('.', begin);
        if (end == std::string::npos) end = path.size();
        const auto segment = path.substr(begin, end - begin);
        if (!node->is_object()) return nullptr;
        auto it = node->find(segment);
        if (it == node->end()) return nullptr;
        node = &*it;
        begin = end + 1;
    }
    return node;
}

bool lessThan(const json& a, const json& b) {
    const int ra = typeRank(a);
    const int rb = typeRank(b);
    if (ra != rb) return ra < rb;
    return a < b;
}

bool matches(const json& doc, const json& filter, const TextMatcher& text) {
    if (!filter.is_object()) {
        throw StoreError("filter must be an object");
    }
    for (const auto& item : filter.items()) {
        const auto& key = item.key();
        const auto& cond = item.value();
        if (key == "$and") {
            for (const auto& sub : subFilters(cond, key)) {
                if (!matches(doc, sub, text)) return false;
            }
        } else if (key == "$or") {
            const auto& subs = subFilters(cond, key);
            if (!std::any_of(subs.begin(), subs.end(), [&](const json& sub) { return matches(doc, sub, text); })) {
                return false;
            }
        } else if (key == "$nor") {
            const auto& subs = subFilters(cond, key);
            if (std::any_of(subs.begin(), subs.end(), [&](const json& sub) { return matches(doc, sub, text); })) {
                return false;
            }
        } else if (key == "$text") {
            if (!cond.is_object() || !cond.contains("$search") || !cond["$search"].is_string()) {
                throw StoreError("$text needs a $search string");
            }
            if (!text) {
                throw StoreError("$text is not supported by this collection");
            }
            if (!text(doc, cond["$search"].get<std::string>())) return false;
        } else if (!key.empty() && key[0] == '$') {
            throw StoreError("unsupported top-level operator " + key);
        } else if (!matchField(lookupPath(doc, key), cond)) {
            return false;
        }
    }
    return true;
}

std::vector<json> runPipeline(std::vector<json> docs, const std::vector<json>& pipeline, const TextMatcher& text) {
    for (const auto& stage : pipeline) {
        if (!stage.is_object() || stage.size() != 1) {
            throw StoreError("each pipeline stage needs exactly one operator");
        }
        const auto& op = stage.begin().key();
        const auto& arg = stage.begin().value();
        if (op == "$match") {
            std::vector<json> kept;
            for (auto& doc : docs) {
                if (matches(doc, arg, text)) kept.push_back(std::move(doc));
            }
            docs.swap(kept);
        } else if (op == "$group") {
            docs = groupStage(docs, arg);
        } else if (op == "$sort") {
            sortDocs(docs, arg);
        } else if (op == "$skip") {
            auto n = std::min<std::size_t>(arg.get<std::size_t>(), docs.size());
            docs.erase(docs.begin(), docs.begin() + static_cast<std::ptrdiff_t>(n));
        } else if (op == "$limit") {
            auto n = arg.get<std::size_t>();
            if (docs.size() > n) docs.resize(n);
        } else if (op == "$count") {
            json row = {{arg.get<std::string>(), docs.size()}};
            docs.clear();
            docs.push_back(std::move(row));
        } else {
            throw StoreError("unsupported pipeline stage " + op);
        }
    }
    return docs;
}

} // namespace runcatalog::algo
