#include "runcatalog/AccessPolicy.hpp"

#include "Catalog.hpp"
#include "runcatalog/Errors.hpp"

namespace runcatalog {

//-------------------------------------------------------------
// AccessPolicy
//-------------------------------------------------------------
bool AccessPolicy::checkCompatibility(const Node& node) const {
    return node.kind() == NodeKind::RunCatalog && dynamic_cast<const Catalog*>(&node) != nullptr;
}

Catalog AccessPolicy::filterResults(const Catalog& catalog, const Identity& identity) const {
    return catalog.withIdentity(identity);
}

//-------------------------------------------------------------
// UnrestrictedAccessPolicy
//-------------------------------------------------------------
std::vector<Query> UnrestrictedAccessPolicy::modifyQueries(const std::vector<Query>& queries,
                                                           const std::optional<Identity>&) const {
    return queries;
}

//-------------------------------------------------------------
// AllowListedAccessPolicy
//-------------------------------------------------------------
AllowListedAccessPolicy::AllowListedAccessPolicy(std::map<std::string, AccessList> accessLists)
    : accessLists_(std::move(accessLists)) {
}

AllowListedAccessPolicy AllowListedAccessPolicy::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("access lists must be a JSON object of identity -> uids");
    }
    std::map<std::string, AccessList> lists;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& value = it.value();
        if (value.is_string() && value.get<std::string>() == "*") {
            lists[it.key()] = AccessList::everything();
            continue;
        }
        if (!value.is_array()) {
            throw ConfigurationError("access list for '" + it.key() + "' must be an array of uids or \"*\"");
        }
        std::set<std::string> uids;
        for (const auto& uid : value) {
            if (!uid.is_string()) {
                throw ConfigurationError("access list for '" + it.key() + "' contains a non-string uid");
            }
            uids.insert(uid.get<std::string>());
        }
        lists[it.key()] = AccessList::of(std::move(uids));
    }
    return AllowListedAccessPolicy(std::move(lists));
}

const AccessList& AllowListedAccessPolicy::accessListFor(const std::string& name) const {
    static const AccessList empty;
    auto it = accessLists_.find(name);
    return it == accessLists_.end() ? empty : it->second;
}

std::vector<Query> AllowListedAccessPolicy::modifyQueries(const std::vector<Query>& queries,
                                                          const std::optional<Identity>& identity) const {
    if (identity && identity->isAdmin()) {
        return queries;
    }
    const AccessList unbound;
    const AccessList& list = identity ? accessListFor(identity->name()) : unbound;
    if (list.all) {
        return queries;
    }

    Document allowed = Document::array();
    for (const auto& uid : list.uids) {
        allowed.push_back(uid);
    }
    std::vector<Query> modified = queries;
    Document restriction = {{"uid", {{"$in", allowed}}}};
    modified.emplace_back(RawMongo{std::move(restriction)});
    return modified;
}

} // namespace runcatalog
