#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "runcatalog/Mapping.hpp"
#include "runcatalog/Query.hpp"

namespace runcatalog {

class Catalog;

// Who a catalog view is bound to. The administrative identity is never
// restricted by an allow list.
class Identity {
public:
    static Identity user(std::string name) { return Identity(std::move(name), false); }
    static Identity admin() { return Identity("admin", true); }

    const std::string& name() const { return name_; }
    bool isAdmin() const { return admin_; }

    bool operator==(const Identity& other) const { return name_ == other.name_ && admin_ == other.admin_; }
    bool operator!=(const Identity& other) const { return !(*this == other); }

private:
    Identity(std::string name, bool admin) : name_(std::move(name)), admin_(admin) {}

    std::string name_;
    bool admin_;
};

// Rewrites the query list of a catalog for an identity and produces
// identity-bound views. Implementations are immutable once built and may be
// shared by any number of catalogs.
class AccessPolicy {
public:
    virtual ~AccessPolicy() = default;

    // True only for node types this policy knows how to restrict.
    virtual bool checkCompatibility(const Node& node) const;

    virtual std::vector<Query> modifyQueries(const std::vector<Query>& queries,
                                             const std::optional<Identity>& identity) const = 0;

    // New catalog bound to `identity`; `catalog` is left untouched.
    virtual Catalog filterResults(const Catalog& catalog, const Identity& identity) const;
};

class UnrestrictedAccessPolicy final : public AccessPolicy {
public:
    std::vector<Query> modifyQueries(const std::vector<Query>& queries,
                                     const std::optional<Identity>& identity) const override;
};

// uids an identity may see, or every uid.
struct AccessList {
    bool all = false;
    std::set<std::string> uids;

    static AccessList everything() { return AccessList{true, {}}; }
    static AccessList of(std::set<std::string> uids) { return AccessList{false, std::move(uids)}; }
};

// Per-identity allow lists. Identities without an entry see nothing.
class AllowListedAccessPolicy final : public AccessPolicy {
public:
    explicit AllowListedAccessPolicy(std::map<std::string, AccessList> accessLists);

    // {"alice": ["A", "B"], "carol": "*"}
    static AllowListedAccessPolicy fromJson(const nlohmann::json& j);

    std::vector<Query> modifyQueries(const std::vector<Query>& queries,
                                     const std::optional<Identity>& identity) const override;

    const AccessList& accessListFor(const std::string& name) const;

private:
    std::map<std::string, AccessList> accessLists_;
};

} // namespace runcatalog
