#include "container/Container.hpp"

#include <doctest/doctest.h>

using namespace RT;

namespace {

auto require(Expected<Container> result) -> Container {
    REQUIRE_MESSAGE(result.has_value(), describeError(result.error()));
    return std::move(*result);
}

// Three replicas that each wrote the same key plus one key of their own.
struct ThreeReplicas {
    Container r1;
    Container r2;
    Container r3;
};

auto makeThreeReplicas() -> ThreeReplicas {
    auto r1 = require(createContainer("r1").setContainer({"shared"}, 1));
    r1      = require(r1.setContainer({"only", "r1"}, "one"));
    auto r2 = require(createContainer("r2").setContainer({"shared"}, 2));
    r2      = require(r2.updateValue({"only", "r2"}, Json{{"nested", true}}));
    auto r3 = require(createContainer("r3").setContainer({"shared"}, 3));
    r3      = require(r3.setContainer({"list"}, Json{1, 2, 3}));
    return {r1, r2, r3};
}

} // namespace

TEST_SUITE("container") {

TEST_CASE("createContainer starts empty at version zero") {
    auto c = createContainer("replica-a");
    CHECK(c.id == "replica-a");
    CHECK(c.root == Trie::empty());
    CHECK(c.version.get("replica-a") == 0);
    CHECK(c.version.contains("replica-a"));
    CHECK_FALSE(c.toValue().has_value());
}

TEST_CASE("writes advance the owner's clock entry by one") {
    auto c0 = createContainer("r1");
    auto c1 = require(c0.setValue({"a"}, 1));
    auto c2 = require(c1.setContainer({"b"}, 2));
    auto c3 = require(c2.updateValue({"b"}, 3));
    auto c4 = c3.removeValue({"a"});
    auto c5 = c4.removePath({"a"});

    CHECK(c1.version.get("r1") == 1);
    CHECK(c2.version.get("r1") == 2);
    CHECK(c3.version.get("r1") == 3);
    CHECK(c4.version.get("r1") == 4);
    CHECK(c5.version.get("r1") == 5);
    CHECK(happensBefore(c0.version, c5.version));

    CHECK(c3.valueAt({"b"}) == Json(3));
    CHECK(c4.has({"a"}));
    CHECK_FALSE(c5.has({"a"}));
    CHECK(c5.toValue() == Json({{"b", 3}}));

    // earlier versions are untouched
    CHECK(c1.valueAt({"a"}) == Json(1));
    CHECK_FALSE(c0.has({"a"}));
}

TEST_CASE("failed writes leave the container unchanged") {
    auto c = require(createContainer("r1").setValue({"leaf"}, 1));
    auto failed = c.setValue({"leaf", "child"}, 2);
    REQUIRE_FALSE(failed.has_value());
    CHECK(failed.error().code == Error::Code::PathThroughLeaf);
    CHECK(c.version.get("r1") == 1);
    CHECK(c.valueAt({"leaf"}) == Json(1));
}

TEST_CASE("merge is idempotent") {
    auto [r1, r2, r3] = makeThreeReplicas();

    CHECK(mergeContainers(r1, r1) == r1);

    auto merged = mergeContainers(r1, r2);
    auto again  = mergeContainers(merged, r2);
    CHECK(again.sameState(merged));
    CHECK(again.root == merged.root);
}

TEST_CASE("merge is commutative") {
    auto [r1, r2, r3] = makeThreeReplicas();

    auto ab = mergeContainers(r1, r2);
    auto ba = mergeContainers(r2, r1);
    CHECK(ab.id == "r1");
    CHECK(ba.id == "r2");
    CHECK(ab.sameState(ba));
    CHECK(ab.toValue() == ba.toValue());
}

TEST_CASE("merge is associative") {
    auto [r1, r2, r3] = makeThreeReplicas();

    auto left  = mergeContainers(mergeContainers(r1, r2), r3);
    auto right = mergeContainers(r1, mergeContainers(r2, r3));
    CHECK(left.sameState(right));
    CHECK(left.valueAt({"shared"}) == Json(3));
    CHECK(left.version == VectorClock{{"r1", 2}, {"r2", 2}, {"r3", 2}});
    CHECK(left.valueAt({"only"}) == Json({{"r1", "one"}, {"r2", {{"nested", true}}}}));
    CHECK(left.valueAt({"list"}) == Json({1, 2, 3}));
}

TEST_CASE("a setContainer rewrite of a synced leaf converges") {
    auto r1 = require(createContainer("r1").setContainer({"t"}, "x"));
    auto r2 = mergeContainers(createContainer("r2"), r1);
    CHECK(r2.valueAt({"t"}) == Json("x"));

    SUBCASE("rewrite to a greater payload") {
        auto rewritten = require(r1.setContainer({"t"}, "y"));
        auto onR1      = mergeContainers(rewritten, r2);
        auto onR2      = mergeContainers(r2, rewritten);
        CHECK(onR1.sameState(onR2));
        CHECK(onR1.valueAt({"t"}) == Json("y"));
        CHECK(onR2.valueAt({"t"}) == Json("y"));
    }
    SUBCASE("rewrite to a smaller payload") {
        auto rewritten = require(r1.setContainer({"t"}, "a"));
        auto onR1      = mergeContainers(rewritten, r2);
        auto onR2      = mergeContainers(r2, rewritten);
        CHECK(onR1.sameState(onR2));
        CHECK(onR1.valueAt({"t"}) == onR2.valueAt({"t"}));
    }
}

TEST_CASE("updateValue on a shared leaf converges in both merge orders") {
    auto r1 = require(createContainer("r1").setContainer({"t"}, 1));
    auto r2 = mergeContainers(createContainer("r2"), r1);

    auto fromR1 = require(r1.updateValue({"t"}, 3));
    auto fromR2 = require(r2.updateValue({"t"}, 2));

    auto ab = mergeContainers(fromR1, fromR2);
    auto ba = mergeContainers(fromR2, fromR1);
    CHECK(ab.sameState(ba));
    // both writes carry lamport 2; r2 sorts after r1
    CHECK(ab.valueAt({"t"}) == Json(2));

    auto leaf = ab.get({"t"});
    REQUIRE(leaf);
    CHECK(leaf->container().version == VectorClock{{"r1", 2}, {"r2", 1}});

    auto settled = require(ab.updateValue({"t"}, 4));
    CHECK(mergeContainers(fromR2, settled).valueAt({"t"}) == Json(4));
    CHECK(mergeContainers(settled, fromR1).valueAt({"t"}) == Json(4));
}

TEST_CASE("rewrites of a shared leaf on three replicas merge associatively") {
    auto base = require(createContainer("r1").setContainer({"t"}, "base"));
    auto r2   = mergeContainers(createContainer("r2"), base);
    auto r3   = mergeContainers(createContainer("r3"), base);

    auto one   = require(base.setContainer({"t"}, "one"));
    auto two   = require(r2.updateValue({"t"}, "two"));
    auto three = require(r3.setContainer({"t"}, "three"));

    auto left  = mergeContainers(mergeContainers(one, two), three);
    auto right = mergeContainers(one, mergeContainers(two, three));
    CHECK(left.sameState(right));
    CHECK(left.sameState(mergeContainers(three, mergeContainers(two, one))));
    CHECK(left.sameState(mergeContainers(mergeContainers(three, one), two)));
    CHECK(left.valueAt({"t"}) == Json("two"));
    CHECK(left.version == VectorClock{{"r1", 2}, {"r2", 1}, {"r3", 1}});
}

TEST_CASE("a removed leaf comes back from a replica that still holds it") {
    auto r1 = require(createContainer("r1").setContainer({"k"}, "kept"));
    auto r2 = mergeContainers(createContainer("r2"), r1);

    auto cleared = r1.removeValue({"k"});
    CHECK_FALSE(cleared.valueAt({"k"}).has_value());

    auto ab = mergeContainers(cleared, r2);
    auto ba = mergeContainers(r2, cleared);
    CHECK(ab.valueAt({"k"}) == Json("kept"));
    CHECK(ab.sameState(ba));
}

TEST_CASE("concurrent writes on two replicas lose nothing") {
    auto base = require(createContainer("r1").setContainer({"doc", "title"}, "draft"));

    auto remote = base;
    remote.id   = "r2";

    auto local  = require(base.setContainer({"doc", "author"}, "ann"));
    auto edited = require(remote.setContainer({"doc", "tags"}, Json{"crdt"}));

    CHECK(compare(local.version, edited.version) == ClockOrdering::Concurrent);

    auto merged = mergeContainers(local, edited);
    CHECK(merged.valueAt({"doc"}) == Json({{"author", "ann"}, {"tags", {"crdt"}}, {"title", "draft"}}));
    CHECK(dominates(merged.version, local.version));
    CHECK(dominates(merged.version, edited.version));
    CHECK(merged.sameState(mergeContainers(edited, local)));
}

TEST_CASE("same replica keeps the newest version") {
    auto older = require(createContainer("r1").setContainer({"k"}, 1));
    auto newer = require(older.updateValue({"k"}, 2));

    auto forward  = mergeContainers(older, newer);
    auto backward = mergeContainers(newer, older);
    CHECK(forward.root == newer.root);
    CHECK(backward.root == newer.root);
    CHECK(forward == newer);
}

TEST_CASE("a forked replica is merged structurally") {
    auto base = require(createContainer("r1").setContainer({"k"}, 1));
    auto a    = require(base.setContainer({"a"}, "left"));
    auto b    = require(base.setContainer({"b"}, "right"));
    // both forks advanced r1 to 2, so the clocks are equal but the roots differ
    CHECK(compare(a.version, b.version) == ClockOrdering::Equal);
    auto joined = mergeContainers(a, b);
    CHECK(joined.has({"a"}));
    CHECK(joined.has({"b"}));
    CHECK(joined.sameState(mergeContainers(b, a)));
    CHECK(mergeContainers(a, a).root == a.root);

    auto c = require(b.setContainer({"c"}, "more"));
    auto d = a;
    d.version = d.version.withEntry("fork", 1);
    CHECK(compare(d.version, c.version) == ClockOrdering::Concurrent);
    auto merged = mergeContainers(d, c);
    CHECK(merged.has({"a"}));
    CHECK(merged.has({"b"}));
    CHECK(merged.has({"c"}));
}

TEST_CASE("merge report is filled through the container API") {
    auto a = require(createContainer("r1").setValue({"v"}, "mine"));
    auto b = require(createContainer("r2").setValue({"v"}, "theirs"));

    MergeReport report;
    auto merged = mergeContainers(a, b, {}, &report);
    CHECK(merged.valueAt({"v"}) == Json("theirs"));
    REQUIRE(report.conflicts.size() == 1);
    CHECK(report.conflicts[0].kind == MergeConflict::Kind::ValueValue);
}

} // TEST_SUITE
