#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "runcatalog/Errors.hpp"

namespace runcatalog {

// Key -> thunk mapping that evaluates each value on first access and keeps
// it. Keys can be listed without evaluating anything. A thunk that throws
// leaves its slot unevaluated, so the next get() tries again; a value that
// was computed is never recomputed or evicted.
template <typename Value>
class LazyNode {
public:
    using Thunk = std::function<Value()>;

    explicit LazyNode(std::vector<std::pair<std::string, Thunk>> entries) {
        keys_.reserve(entries.size());
        for (auto& entry : entries) {
            auto slot = std::make_unique<Slot>();
            slot->thunk = std::move(entry.second);
            if (slots_.emplace(entry.first, std::move(slot)).second) {
                keys_.push_back(std::move(entry.first));
            }
        }
    }

    LazyNode(const LazyNode&) = delete;
    LazyNode& operator=(const LazyNode&) = delete;

    const std::vector<std::string>& keys() const { return keys_; }
    std::size_t size() const { return keys_.size(); }
    bool contains(const std::string& key) const { return slots_.count(key) > 0; }

    std::shared_ptr<const Value> get(const std::string& key) const {
        auto it = slots_.find(key);
        if (it == slots_.end()) {
            throw NotFound(key);
        }
        Slot& slot = *it->second;
        std::call_once(slot.once, [&slot] {
            slot.value = std::make_shared<const Value>(slot.thunk());
            slot.thunk = nullptr;
            slot.ready.store(true, std::memory_order_release);
        });
        return slot.value;
    }

    bool evaluated(const std::string& key) const {
        auto it = slots_.find(key);
        return it != slots_.end() && it->second->ready.load(std::memory_order_acquire);
    }

private:
    struct Slot {
        Thunk thunk;
        std::shared_ptr<const Value> value;
        std::once_flag once;
        std::atomic<bool> ready{false};
    };

    std::vector<std::string> keys_;
    std::unordered_map<std::string, std::unique_ptr<Slot>> slots_;
};

} // namespace runcatalog
