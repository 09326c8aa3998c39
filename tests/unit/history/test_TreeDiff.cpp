#include "history/TreeDiff.hpp"

#include "DeltaSpaceTestHelper.hpp"

#include <doctest/doctest.h>

using namespace DS;
using namespace DS::History;
using nlohmann::json;

namespace {

auto encoded(Patch const& patch) -> json {
    return PatchCodec::encodePatch(patch);
}

} // namespace

TEST_SUITE("TreeDiff") {
    TEST_CASE("identical trees produce nothing") {
        auto root = DeltaSpaceTestHelper::tree(R"({"a": {"b": [1, 2, 3]}})");
        CHECK(diff(root, root).empty());

        auto copy = DeltaSpaceTestHelper::tree(R"({"a": {"b": [1, 2, 3]}})");
        CHECK(diff(root, copy).empty());
    }

    TEST_CASE("single scalar change") {
        auto before = DeltaSpaceTestHelper::tree(R"({"name": "Steve", "age": 36})");
        auto after  = DeltaSpaceTestHelper::tree(R"({"name": "Steve", "age": 37})");

        CHECK(encoded(diff(before, after)) == json::parse(R"([
            {"kind": "CHANGE", "path": ["age"], "oldValue": 36, "value": 37}
        ])"));
    }

    TEST_CASE("object keys: removals and changes first, then creations") {
        auto before = DeltaSpaceTestHelper::tree(R"({"a": 1, "b": 2, "c": 3})");
        auto after  = DeltaSpaceTestHelper::tree(R"({"a": 1, "c": 4, "d": 5})");

        CHECK(encoded(diff(before, after)) == json::parse(R"([
            {"kind": "REMOVE", "path": ["b"], "oldValue": 2},
            {"kind": "CHANGE", "path": ["c"], "oldValue": 3, "value": 4},
            {"kind": "CREATE", "path": ["d"], "value": 5}
        ])"));
    }

    TEST_CASE("deltas only pass through ancestors of the changed leaf") {
        auto before = DeltaSpaceTestHelper::tree(R"({"a": {"b": {"c": 1}, "d": [1, 2]}, "e": {"f": true}})");
        auto after  = DeltaSpaceTestHelper::tree(R"({"a": {"b": {"c": 2}, "d": [1, 2]}, "e": {"f": true}})");

        auto patch = diff(before, after);
        REQUIRE(patch.size() == 1);
        CHECK(toPointer(patch[0].path) == "/a/b/c");
        CHECK(patch[0].kind == DeltaKind::Change);
    }

    TEST_CASE("arrays compare by position") {
        auto before = DeltaSpaceTestHelper::tree(R"([1, 2, 3, 4, 5])");
        auto after  = DeltaSpaceTestHelper::tree(R"([1, 3, 5])");

        CHECK(encoded(diff(before, after)) == json::parse(R"([
            {"kind": "CHANGE", "path": [1], "oldValue": 2, "value": 3},
            {"kind": "CHANGE", "path": [2], "oldValue": 3, "value": 5},
            {"kind": "REMOVE", "path": [3], "oldValue": 4},
            {"kind": "REMOVE", "path": [4], "oldValue": 5}
        ])"));

        CHECK(encoded(diff(after, before)) == json::parse(R"([
            {"kind": "CHANGE", "path": [1], "oldValue": 3, "value": 2},
            {"kind": "CHANGE", "path": [2], "oldValue": 5, "value": 3},
            {"kind": "CREATE", "path": [3], "value": 4},
            {"kind": "CREATE", "path": [4], "value": 5}
        ])"));
    }

    TEST_CASE("kind changes replace the whole value") {
        auto before = DeltaSpaceTestHelper::tree(R"({"v": {"x": 1}, "n": 1})");
        auto after  = DeltaSpaceTestHelper::tree(R"({"v": [1], "n": 1.0})");

        CHECK(encoded(diff(before, after)) == json::parse(R"([
            {"kind": "CHANGE", "path": ["n"], "oldValue": 1, "value": 1.0},
            {"kind": "CHANGE", "path": ["v"], "oldValue": {"x": 1}, "value": [1]}
        ])"));
    }

    TEST_CASE("root level differences") {
        auto scalar = Node::integer(1);
        auto object = DeltaSpaceTestHelper::tree(R"({"a": 1})");

        auto replaced = diff(scalar, object);
        REQUIRE(replaced.size() == 1);
        CHECK(replaced[0].kind == DeltaKind::Change);
        CHECK(replaced[0].path.empty());

        auto created = diff(nullptr, object);
        REQUIRE(created.size() == 1);
        CHECK(created[0].kind == DeltaKind::Create);
        CHECK(created[0].value == object);

        auto removed = diff(object, nullptr);
        REQUIRE(removed.size() == 1);
        CHECK(removed[0].kind == DeltaKind::Remove);
        CHECK(removed[0].oldValue == object);
    }

    TEST_CASE("shared branches are skipped without descending") {
        auto shared = DeltaSpaceTestHelper::tree(R"({"deep": {"er": [1, 2, 3]}})");
        auto before = Node::object({{"keep", shared}, {"v", Node::integer(1)}});
        auto after  = Node::object({{"keep", shared}, {"v", Node::integer(2)}});

        auto patch = diff(before, after);
        REQUIRE(patch.size() == 1);
        CHECK(toPointer(patch[0].path) == "/v");
    }
}
