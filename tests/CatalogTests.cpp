#include "TestSupport.hpp"

#include "Catalog.hpp"
#include "runcatalog/Errors.hpp"

using namespace runcatalog;

namespace {

class RejectingPolicy : public AccessPolicy {
public:
    bool checkCompatibility(const Node&) const override { return false; }
    std::vector<Query> modifyQueries(const std::vector<Query>& queries, const std::optional<Identity>&) const override {
        return queries;
    }
};

std::shared_ptr<MemoryDatabase> sampleDatabase() {
    auto db = std::make_shared<MemoryDatabase>("catalog");
    fixtures::insertRun(*db, "A", {{"plan_name", "scan"}, {"purpose", "iron calibration"}});
    fixtures::insertRun(*db, "B", {{"plan_name", "count"}, {"purpose", "iron alignment"}});
    fixtures::insertRun(*db, "C", {{"plan_name", "scan"}, {"purpose", "gold calibration"}}, false);
    fixtures::insertDescriptor(*db, "A", "dA", "primary", fixtures::scalarKeys({"det"}));
    fixtures::insertEvent(*db, "dA", 1, {{"det", 5.0}});
    fixtures::insertEvent(*db, "dA", 2, {{"det", 6.0}});
    return db;
}

} // namespace

static void testMapping() {
    CatalogOptions options;
    options.cursorBatchSize = 2;
    Catalog catalog(sampleDatabase(), {{"beamline", "tst"}}, {}, nullptr, std::nullopt, options);

    expect(catalog.kind() == NodeKind::RunCatalog, "root kind");
    expect(catalog.metadata()["beamline"] == "tst", "metadata kept");
    expect(catalog.length() == 3 && catalog.lengthHint() == 3, "length and hint");
    expect(catalog.iterate().drain() == std::vector<std::string>({"A", "B", "C"}), "iteration in insertion order");

    auto a = catalog.lookup("A");
    expect(a.uid() == "A" && a.complete(), "lookup returns the run");
    expect(!catalog.lookup("C").complete(), "run without stop");
    expectThrows<NotFound>([&] { catalog.lookup("Z"); }, "unknown uid");
    expect(catalog.contains("B") && !catalog.contains("Z"), "contains");

    auto data = a.lookup("primary")->lookup("det")->materialize().values<double>();
    expect(data.size() == 2 && data[0] == 5.0 && data[1] == 6.0, "catalog -> run -> stream -> array");

    using Keys = std::vector<std::string>;
    expect(catalog.keys(Interval::all()) == Keys({"A", "B", "C"}), "all keys");
    expect(catalog.keys(Interval::range(1, 3)) == Keys({"B", "C"}), "half-open range");
    expect(catalog.keys(Interval::from(-2)) == Keys({"B", "C"}), "negative start");
    expect(catalog.keys(Interval::upTo(-1)) == Keys({"A", "B"}), "negative stop");
    expect(catalog.keys(Interval::range(2, 1)).empty(), "reversed range is empty");
    expect(catalog.keys(Interval::range(1, 100)) == Keys({"B", "C"}), "stop past the end");

    auto items = catalog.items(Interval::range(0, 2));
    expect(items.size() == 2 && items[1].first == "B" && items[1].second.uid() == "B", "items pair key and run");
    expect(catalog.values(Interval::from(2)).front().uid() == "C", "values");

    expect(catalog.keyAt(0) == "A" && catalog.keyAt(-1) == "C", "single positions");
    expect(catalog.valueAt(1).uid() == "B", "valueAt");
    expectThrows<IndexOutOfRange>([&] { catalog.itemAt(3); }, "position == length");
    expectThrows<IndexOutOfRange>([&] { catalog.itemAt(-4); }, "negative position before the start");
}

static void testPagedIteration() {
    auto db = std::make_shared<MemoryDatabase>("many");
    for (int i = 0; i < 23; ++i) {
        fixtures::insertRun(*db, "run-" + std::to_string(i), {{"n", i}});
    }
    for (std::size_t batch : {1, 4, 23, 100}) {
        CatalogOptions options;
        options.cursorBatchSize = batch;
        Catalog catalog(db, json::object(), {}, nullptr, std::nullopt, options);
        auto keys = catalog.iterate().drain();
        expect(keys.size() == catalog.length(), "iterating yields length() keys for batch " + std::to_string(batch));
        expect(keys.front() == "run-0" && keys.back() == "run-22", "order preserved for batch " + std::to_string(batch));
        expect(catalog.keys(Interval::range(20, 30)).size() == 3, "tail window for batch " + std::to_string(batch));
    }

    Catalog catalog(db);
    auto cursor = catalog.iterate();
    expect(*cursor.next() == "run-0", "stopping early needs no teardown");
}

static void testSearch() {
    Catalog catalog(sampleDatabase());

    auto iron = catalog.search(FullText{"iron"});
    expect(iron.keys(Interval::all()) == std::vector<std::string>({"A", "B"}), "full text search");

    json scans = {{"plan_name", "scan"}};
    auto ironScans = iron.search(RawMongo{scans});
    expect(ironScans.keys(Interval::all()) == std::vector<std::string>({"A"}), "searches are ANDed");
    expect(ironScans.length() == 1, "length honors every query");
    expectThrows<NotFound>([&] { ironScans.lookup("B"); }, "lookup honors every query");
    expect(ironScans.queries().size() == 2, "queries accumulate");

    expect(catalog.length() == 3 && catalog.queries().empty(), "search leaves the original untouched");
    expect(iron.length() == 2, "intermediate view untouched");

    auto byKey = catalog.search(KeyLookup{"C"});
    expect(byKey.length() == 1 && byKey.keyAt(0) == "C", "key lookup query");
    expect(catalog.search(FullText{"iron gold"}).length() == 0, "full text terms are ANDed");

    expectThrows<UnsupportedQueryKind>([&] { catalog.search(ExtensionQuery{"scan_id", {{"value", 1}}}); },
                                       "unregistered kind fails at search time");
    json byUid = {{"uid", "A"}};
    expectThrows<UnsupportedQueryKind>([&] { catalog.search(ExtensionQuery{kKeyLookupTag, byUid}); },
                                       "extension query cannot borrow a built-in tag");
    expectThrows<UnsupportedQueryKind>([&] { catalog.search(ExtensionQuery{kRawMongoTag, byUid}); },
                                       "nor the raw predicate tag");
    expect(catalog.queries().empty(), "rejected searches leave the catalog untouched");

    auto registry = std::make_shared<QueryRegistry>();
    registerDefaultQueries(*registry);
    registry->registerQuery("plan", [](const Query& q) {
        return json{{"plan_name", std::get<ExtensionQuery>(q).params.at("name")}};
    });
    CatalogOptions options;
    options.registry = registry;
    Catalog custom(sampleDatabase(), json::object(), {}, nullptr, std::nullopt, options);
    auto counts = custom.search(ExtensionQuery{"plan", {{"name", "count"}}});
    expect(counts.keys(Interval::all()) == std::vector<std::string>({"B"}), "registered extension kind");
    expect(&counts.registry() == registry.get(), "views share the registry");
}

static void testIdentityAndConstruction() {
    Catalog catalog(sampleDatabase());
    expect(!catalog.identity(), "fresh catalog is unbound");

    auto bound = catalog.rebindIdentity(Identity::user("alice"));
    expect(bound.identity() && bound.identity()->name() == "alice", "rebind binds");
    expect(!catalog.identity(), "rebind leaves the original unbound");
    expect(bound.length() == 3, "no policy, no restriction");
    expectThrows<AlreadyAuthenticated>([&] { bound.rebindIdentity(Identity::user("bob")); }, "second rebind");
    expectThrows<AlreadyAuthenticated>([&] { bound.rebindIdentity(Identity::admin()); }, "even to admin");

    expectThrows<ConfigurationError>([] {
        Catalog rejected(sampleDatabase(), json::object(), {}, std::make_shared<RejectingPolicy>());
    }, "incompatible policy");
    expectThrows<ConfigurationError>([] { Catalog missing(nullptr); }, "null database");

    auto fromUri = Catalog::fromUri("memory://localhost/empty");
    expect(fromUri.length() == 0 && fromUri.database()->name() == "empty", "catalog from URI");
    expectThrows<ConfigurationError>([] { Catalog::fromUri("memory://localhost"); }, "URI without database");

    // Runs keep their collections alive.
    std::optional<Run> kept;
    {
        Catalog scoped(sampleDatabase());
        kept = scoped.lookup("A");
    }
    expect(kept->lookup("primary")->cutoffSeqNum() == 2, "run outlives its catalog");
}

int main() {
    testMapping();
    testPagedIteration();
    testSearch();
    testIdentityAndConstruction();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
