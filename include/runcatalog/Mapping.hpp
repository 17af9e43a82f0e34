#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "runcatalog/Errors.hpp"
#include "runcatalog/Interval.hpp"
#include "runcatalog/LazyNode.hpp"

namespace runcatalog {

enum class NodeKind { RunCatalog, Run, EventStream };

class Node {
public:
    virtual ~Node() = default;
    virtual NodeKind kind() const = 0;
};

// Pull-based key sequence; stopping early needs no teardown.
class KeyCursor {
public:
    using Pull = std::function<std::optional<std::string>()>;

    explicit KeyCursor(Pull pull) : pull_(std::move(pull)) {}

    static KeyCursor fromKeys(std::vector<std::string> keys) {
        auto shared = std::make_shared<std::vector<std::string>>(std::move(keys));
        auto pos = std::make_shared<std::size_t>(0);
        return KeyCursor([shared, pos]() -> std::optional<std::string> {
            if (*pos >= shared->size()) return std::nullopt;
            return (*shared)[(*pos)++];
        });
    }

    std::optional<std::string> next() { return pull_(); }

    std::vector<std::string> drain() {
        std::vector<std::string> out;
        while (auto key = next()) {
            out.push_back(std::move(*key));
        }
        return out;
    }

private:
    Pull pull_;
};

// Read interface shared by every level of the catalog tree.
template <typename Value>
class Mapping : public Node {
public:
    using Item = std::pair<std::string, Value>;

    // Throws NotFound.
    virtual Value lookup(const std::string& key) const = 0;
    virtual KeyCursor iterate() const = 0;
    virtual std::size_t length() const = 0;
    virtual std::size_t lengthHint() const { return length(); }

    virtual std::vector<std::string> keys(const Interval& range) const = 0;
    virtual std::vector<Item> items(const Interval& range) const = 0;

    // Throws IndexOutOfRange.
    virtual Item itemAt(std::int64_t index) const = 0;

    std::vector<Value> values(const Interval& range) const {
        std::vector<Value> out;
        for (auto& item : items(range)) {
            out.push_back(std::move(item.second));
        }
        return out;
    }

    std::string keyAt(std::int64_t index) const { return itemAt(index).first; }
    Value valueAt(std::int64_t index) const { return itemAt(index).second; }

    bool contains(const std::string& key) const {
        try {
            lookup(key);
            return true;
        } catch (const NotFound&) {
            return false;
        }
    }
};

// Mapping over an in-memory LazyNode: positions are the node's key order.
template <typename V>
class NodeMapping : public Mapping<std::shared_ptr<const V>> {
public:
    using Base = Mapping<std::shared_ptr<const V>>;
    using typename Base::Item;

    explicit NodeMapping(std::shared_ptr<const LazyNode<V>> node) : node_(std::move(node)) {}

    std::shared_ptr<const V> lookup(const std::string& key) const override { return node_->get(key); }

    KeyCursor iterate() const override { return KeyCursor::fromKeys(node_->keys()); }

    std::size_t length() const override { return node_->size(); }

    std::vector<std::string> keys(const Interval& range) const override {
        const auto bounds = range.resolve(node_->size());
        const auto& all = node_->keys();
        return std::vector<std::string>(all.begin() + static_cast<std::ptrdiff_t>(bounds.first),
                                        all.begin() + static_cast<std::ptrdiff_t>(bounds.second));
    }

    std::vector<Item> items(const Interval& range) const override {
        std::vector<Item> out;
        for (auto& key : keys(range)) {
            auto value = node_->get(key);
            out.emplace_back(std::move(key), std::move(value));
        }
        return out;
    }

    Item itemAt(std::int64_t index) const override {
        const auto& key = node_->keys()[resolveIndex(index, node_->size())];
        return Item(key, node_->get(key));
    }

    bool evaluated(const std::string& key) const { return node_->evaluated(key); }

private:
    std::shared_ptr<const LazyNode<V>> node_;
};

} // namespace runcatalog
