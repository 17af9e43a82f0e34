#include "TestSupport.hpp"

#include "runcatalog/Errors.hpp"
#include "runcatalog/QueryRegistry.hpp"

using namespace runcatalog;

static void testDefaults() {
    auto registry = QueryRegistry::defaults();
    expect(registry == QueryRegistry::defaults(), "defaults() is shared");
    expect(registry->supports(kFullTextTag) && registry->supports(kKeyLookupTag) && registry->supports(kRawMongoTag),
           "built-in kinds registered");

    json expectedText = {{"$text", {{"$search", "dark current"}}}};
    expect(registry->translate(FullText{"dark current"}) == expectedText, "full text predicate");

    json expectedKey = {{"uid", "abc"}};
    expect(registry->translate(KeyLookup{"abc"}) == expectedKey, "key lookup predicate");

    json raw = {{"plan_name", {{"$in", {"scan", "count"}}}}};
    expect(registry->translate(RawMongo{raw}) == raw, "raw predicate passes through");

    try {
        registry->translate(ExtensionQuery{"scan_id", {{"value", 7}}});
        expect(false, "unregistered kind must fail");
    } catch (const UnsupportedQueryKind& e) {
        expect(e.tag() == "scan_id", "error names the tag");
    }
}

static void testExplicitRegistration() {
    QueryRegistry registry;
    expect(!registry.supports(kFullTextTag), "nothing registered implicitly");
    expectThrows<UnsupportedQueryKind>([&] { registry.translate(FullText{"x"}); }, "empty registry");

    registry.registerQuery("scan_id", [](const Query& q) {
        const auto& ext = std::get<ExtensionQuery>(q);
        return json{{"scan_id", ext.params.at("value")}};
    });
    json exact = {{"scan_id", 7}};
    expect(registry.translate(ExtensionQuery{"scan_id", {{"value", 7}}}) == exact, "extension kind");

    registry.registerQuery("scan_id", [](const Query& q) {
        const auto& ext = std::get<ExtensionQuery>(q);
        return json{{"scan_id", {{"$gte", ext.params.at("value")}}}};
    });
    json atLeast = {{"scan_id", {{"$gte", 7}}}};
    expect(registry.translate(ExtensionQuery{"scan_id", {{"value", 7}}}) == atLeast, "re-registering overwrites");

    expectThrows<ConfigurationError>([&] { registry.registerQuery("", [](const Query&) { return json::object(); }); },
                                     "empty tag");
    expectThrows<ConfigurationError>([&] { registry.registerQuery("x", QueryRegistry::Translator()); },
                                     "empty translator");

    registerDefaultQueries(registry);
    expect(registry.supports(kKeyLookupTag), "defaults can be added to any registry");
}

static void testReservedTags() {
    auto registry = QueryRegistry::defaults();
    for (const char* tag : {kFullTextTag, kKeyLookupTag, kRawMongoTag}) {
        expect(QueryRegistry::isBuiltinTag(tag), std::string(tag) + " is built in");
        json params = {{"uid", "A"}, {"text", "iron"}};
        try {
            registry->translate(ExtensionQuery{tag, params});
            expect(false, std::string("extension query tagged ") + tag + " must fail");
        } catch (const UnsupportedQueryKind& e) {
            expect(e.tag() == tag, "error names the reserved tag");
        }
    }
    expect(!QueryRegistry::isBuiltinTag("scan_id"), "extension tags are not built in");

    QueryRegistry custom;
    registerDefaultQueries(custom);
    expectThrows<ConfigurationError>([&] {
        custom.registerQuery(kKeyLookupTag, [](const Query& q) { return std::get<ExtensionQuery>(q).params; });
    }, "built-in kinds cannot be replaced");
    json expectedKey = {{"uid", "A"}};
    expect(custom.translate(KeyLookup{"A"}) == expectedKey, "built-in translator kept after a rejected registration");
}

static void testCombine() {
    expect(QueryRegistry::combine({}) == json::object(), "no predicates matches everything");

    json a = {{"uid", "A"}};
    json b = {{"$text", {{"$search", "x"}}}};
    auto both = QueryRegistry::combine({a, b});
    expect(both.contains("$and") && both["$and"].size() == 2, "AND of all predicates");
    expect(both["$and"][0] == a && both["$and"][1] == b, "order preserved");
}

static void testTags() {
    expect(queryTag(FullText{"x"}) == "fulltext", "fulltext tag");
    expect(queryTag(KeyLookup{"x"}) == "key_lookup", "key lookup tag");
    expect(queryTag(RawMongo{json::object()}) == "raw_mongo", "raw tag");
    expect(queryTag(ExtensionQuery{"custom", json::object()}) == "custom", "extension tag");
}

int main() {
    testDefaults();
    testExplicitRegistration();
    testReservedTags();
    testCombine();
    testTags();
    std::cout << "All tests passed." << std::endl;
    return 0;
}
