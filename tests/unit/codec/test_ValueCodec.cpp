#include "codec/ValueCodec.hpp"
#include "trie/Trie.hpp"

#include <doctest/doctest.h>

using namespace RT;

TEST_SUITE("codec.value") {

TEST_CASE("classify shapes") {
    CHECK(Codec::classify(Json(1)) == Codec::ValueShape::Scalar);
    CHECK(Codec::classify(Json("s")) == Codec::ValueShape::Scalar);
    CHECK(Codec::classify(Json(nullptr)) == Codec::ValueShape::Scalar);
    CHECK(Codec::classify(Json::array()) == Codec::ValueShape::Sequence);
    CHECK(Codec::classify(Json::object()) == Codec::ValueShape::Record);
    CHECK(Codec::valueShapeToString(Codec::ValueShape::Record) == "record");
}

TEST_CASE("decompose lays out sequences and records") {
    Json value = {{"name", "alice"}, {"scores", {10, 20, 30}}};
    auto root  = Codec::decomposeValue(value);

    REQUIRE(root->isBranch());
    auto scores = root->child("scores");
    REQUIRE(scores);
    CHECK(scores->branch().children.size() == 3);
    CHECK(scores->child("2")->value().payload == 30);
    CHECK(root->child("name")->value().payload == "alice");
}

TEST_CASE("round trip through the trie") {
    SUBCASE("scalar") {
        CHECK(Codec::toValue(Codec::decomposeValue(Json(3.5))) == Json(3.5));
        CHECK(Codec::toValue(Codec::decomposeValue(Json(nullptr))) == Json(nullptr));
    }
    SUBCASE("nested array") {
        Json value = Json::array({Json::array({1, 2}), Json::array({3, Json::array({4, 5})})});
        CHECK(Codec::toValue(Codec::decomposeValue(value)) == value);
    }
    SUBCASE("record") {
        Json value = {{"a", 1}, {"b", "two"}, {"c", false}};
        CHECK(Codec::toValue(Codec::decomposeValue(value)) == value);
    }
    SUBCASE("mixed") {
        Json value = {{"users", {{{"id", 1}, {"tags", {"x"}}}, {{"id", 2}, {"tags", {"y", "z"}}}}}};
        CHECK(Codec::toValue(Codec::decomposeValue(value)) == value);
    }
    SUBCASE("more than ten elements keeps numeric order") {
        Json value = Json::array();
        for (int i = 0; i < 12; ++i) {
            value.push_back(i * i);
        }
        CHECK(Codec::toValue(Codec::decomposeValue(value)) == value);
    }
}

TEST_CASE("empty compounds exist but have no value") {
    auto root = Trie::setValue(Trie::empty(), {"list"}, Json::array());
    REQUIRE(root.has_value());
    CHECK(Trie::has(*root, {"list"}));
    CHECK_FALSE(Trie::valueAt(*root, {"list"}).has_value());

    CHECK_FALSE(Codec::toValue(Codec::decomposeValue(Json::object())).has_value());
    CHECK_FALSE(Codec::toValue(nullptr).has_value());
}

TEST_CASE("branches with gaps rebuild as records") {
    auto node = makeBranch({{"0", makeValue("a")}, {"2", makeValue("c")}});
    CHECK(Codec::toValue(node) == Json({{"0", "a"}, {"2", "c"}}));

    auto padded = makeBranch({{"00", makeValue(1)}});
    CHECK(Codec::toValue(padded) == Json({{"00", 1}}));

    // empty children are omitted before the sequence check
    auto withHole = makeBranch({{"0", makeValue("a")}, {"1", makeBranch()}});
    CHECK(Codec::toValue(withHole) == Json::array({"a"}));
}

TEST_CASE("container leaves rebuild their values") {
    auto root = Codec::decompose(Json{1, 2}, [](Json const& scalar) {
        return makeContainer(scalar, VectorClock{{"r1", 1}}, WriteStamp{1, "r1"});
    });
    CHECK(root->child("0")->isContainer());
    CHECK(Codec::toValue(root) == Json({1, 2}));
}

TEST_CASE("index segments") {
    CHECK(Codec::indexSegment(0) == "0");
    CHECK(Codec::indexSegment(42) == "42");
    CHECK(Codec::parseIndexSegment("0") == std::optional<std::size_t>{0});
    CHECK(Codec::parseIndexSegment("17") == std::optional<std::size_t>{17});
    CHECK_FALSE(Codec::parseIndexSegment("").has_value());
    CHECK_FALSE(Codec::parseIndexSegment("01").has_value());
    CHECK_FALSE(Codec::parseIndexSegment("-1").has_value());
    CHECK_FALSE(Codec::parseIndexSegment("1a").has_value());
}

} // TEST_SUITE
