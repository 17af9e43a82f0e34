#include "TestSupport.hpp"

#include <thread>

#include "Catalog.hpp"
#include "runcatalog/Errors.hpp"

using namespace runcatalog;

static std::shared_ptr<MemoryDatabase> threeRuns() {
    auto db = std::make_shared<MemoryDatabase>("restricted");
    fixtures::insertRun(*db, "A", {{"purpose", "iron"}});
    fixtures::insertRun(*db, "B", {{"purpose", "iron"}});
    fixtures::insertRun(*db, "C", {{"purpose", "iron"}});
    return db;
}

static std::shared_ptr<const AllowListedAccessPolicy> alicePolicy() {
    std::map<std::string, AccessList> lists;
    lists["alice"] = AccessList::of({"A", "B"});
    lists["carol"] = AccessList::everything();
    return std::make_shared<const AllowListedAccessPolicy>(std::move(lists));
}

static void testModifyQueries() {
    auto policy = alicePolicy();
    std::vector<Query> queries = {FullText{"iron"}};

    auto admin = policy->modifyQueries(queries, Identity::admin());
    expect(admin.size() == 1, "admin queries unchanged");

    auto carol = policy->modifyQueries(queries, Identity::user("carol"));
    expect(carol.size() == 1, "everything list leaves queries unchanged");

    auto alice = policy->modifyQueries(queries, Identity::user("alice"));
    expect(alice.size() == 2 && queryTag(alice[1]) == kRawMongoTag, "restriction appended");
    json expected = {{"uid", {{"$in", {"A", "B"}}}}};
    expect(std::get<RawMongo>(alice[1]).start == expected, "restriction lists the allowed uids");
    expect(queries.size() == 1, "input queries not modified");

    auto stranger = policy->modifyQueries(queries, Identity::user("mallory"));
    expect(std::get<RawMongo>(stranger[1]).start["uid"]["$in"].empty(), "unknown identity gets the empty set");
    auto unbound = policy->modifyQueries(queries, std::nullopt);
    expect(unbound.size() == 2 && std::get<RawMongo>(unbound[1]).start["uid"]["$in"].empty(), "unbound gets the empty set");

    UnrestrictedAccessPolicy open;
    expect(open.modifyQueries(queries, Identity::user("anyone")).size() == 1, "unrestricted passes through");
}

static void testAllowListedCatalog() {
    Catalog catalog(threeRuns(), json::object(), {}, alicePolicy());

    auto alice = catalog.rebindIdentity(Identity::user("alice"));
    expect(alice.length() == 2, "alice sees her runs");
    expect(alice.keys(Interval::all()) == std::vector<std::string>({"A", "B"}), "alice keys");
    expect(alice.lookup("A").uid() == "A", "alice can open A");
    expectThrows<NotFound>([&] { alice.lookup("C"); }, "C exists but alice may not see it");
    expectThrows<IndexOutOfRange>([&] { alice.itemAt(2); }, "positions follow the restricted view");
    expect(alice.search(FullText{"iron"}).length() == 2, "search stays restricted");

    auto admin = catalog.rebindIdentity(Identity::admin());
    expect(admin.length() == 3 && admin.lookup("C").uid() == "C", "admin sees everything");

    expect(catalog.rebindIdentity(Identity::user("carol")).length() == 3, "everything list");
    expect(catalog.rebindIdentity(Identity::user("mallory")).length() == 0, "unknown identity sees nothing");
    expect(catalog.length() == 0, "unbound view sees nothing");

    expectThrows<AlreadyAuthenticated>([&] { alice.rebindIdentity(Identity::admin()); }, "cannot escalate a bound view");

    // Searching first and binding later still applies the restriction.
    auto searched = catalog.search(KeyLookup{"C"});
    expect(searched.rebindIdentity(Identity::user("alice")).length() == 0, "restriction recomputed per call");
    expect(searched.rebindIdentity(Identity::admin()).length() == 1, "admin view of the same search");
}

static void testConcurrentViews() {
    Catalog catalog(threeRuns(), json::object(), {}, alicePolicy());
    auto alice = catalog.rebindIdentity(Identity::user("alice"));
    auto admin = catalog.rebindIdentity(Identity::admin());

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&] {
            for (int k = 0; k < 20; ++k) {
                expect(alice.length() == 2, "alice view stable under concurrency");
                expect(admin.iterate().drain().size() == 3, "admin view stable under concurrency");
            }
        });
    }
    for (auto& t : threads) t.join();
}

static void testCompatibilityAndConfig() {
    auto db = threeRuns();
    Catalog catalog(db);
    auto run = catalog.lookup("A");
    UnrestrictedAccessPolicy open;
    expect(open.checkCompatibility(catalog), "catalog is compatible");
    expect(!open.checkCompatibility(run), "runs are not");

    auto bound = open.filterResults(catalog, Identity::user("bob"));
    expect(bound.identity()->name() == "bob" && !catalog.identity(), "filterResults returns a new bound view");

    auto parsed = AllowListedAccessPolicy::fromJson({{"alice", {"A", "B"}}, {"carol", "*"}, {"dave", json::array()}});
    expect(parsed.accessListFor("alice").uids.size() == 2, "uid list parsed");
    expect(parsed.accessListFor("carol").all, "\"*\" means everything");
    expect(parsed.accessListFor("dave").uids.empty() && !parsed.accessListFor("dave").all, "empty list");
    expect(parsed.accessListFor("nobody").uids.empty(), "missing identity");

    expectThrows<ConfigurationError>([] { AllowListedAccessPolicy::fromJson(json::array()); }, "lists must be an object");
    expectThrows<ConfigurationError>([] { AllowListedAccessPolicy::fromJson({{"alice", 3}}); }, "uids must be a list");
    expectThrows<ConfigurationError>([] { AllowListedAccessPolicy::fromJson({{"alice", {1, 2}}}); }, "uids are strings");

    expect(Identity::admin().isAdmin() && !Identity::user("admin").isAdmin(), "admin is a sentinel, not a name");
}

int main() {
    testModifyQueries();
    testAllowListedCatalog();
    testConcurrentViews();
    testCompatibilityAndConfig();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
