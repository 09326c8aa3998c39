#include "history/PatchCodec.hpp"

#include "DeltaSpaceTestHelper.hpp"

#include <doctest/doctest.h>

#include <string>

using namespace DS;
using namespace DS::History;
using nlohmann::json;

TEST_SUITE("PatchCodec") {
    TEST_CASE("encodes the interchange records") {
        Patch patch{
            Delta{.kind = DeltaKind::Change, .path = {std::string("age")}, .value = Node::integer(37), .oldValue = Node::integer(36)},
            Delta{.kind = DeltaKind::Create, .path = {std::string("items"), std::size_t{1}}, .value = DeltaSpaceTestHelper::tree(R"({"id": 2})"), .oldValue = nullptr},
        };

        auto encoded = PatchCodec::encodePatch(patch);
        CHECK(encoded == json::parse(R"([
            {"kind": "CHANGE", "path": ["age"], "oldValue": 36, "value": 37},
            {"kind": "CREATE", "path": ["items", 1], "value": {"id": 2}}
        ])"));
    }

    TEST_CASE("decodes what it encodes") {
        auto text = std::string(R"([
            {"kind": "REMOVE", "path": ["list", 0], "oldValue": "gone"},
            {"kind": "CHANGE", "path": [], "oldValue": null, "value": {"a": [1, 2]}}
        ])");

        auto patch = PatchCodec::patchFromString(text);
        REQUIRE(patch.has_value());
        REQUIRE(patch->size() == 2);
        CHECK((*patch)[0].kind == DeltaKind::Remove);
        CHECK(std::get<std::size_t>((*patch)[0].path[1]) == 0);
        CHECK_FALSE((*patch)[0].value);
        CHECK(*(*patch)[0].oldValue->asString() == "gone");
        CHECK((*patch)[1].path.empty());
        CHECK((*patch)[1].oldValue->isNull());

        CHECK(json::parse(PatchCodec::patchToString(*patch)) == json::parse(text));
    }

    TEST_CASE("rejects unknown kinds") {
        auto patch = PatchCodec::decodePatch(json::parse(R"([{"kind": "MOVE", "path": ["a"], "value": 1}])"));
        REQUIRE_FALSE(patch.has_value());
        CHECK(patch.error().code == Error::Code::MalformedDelta);
        REQUIRE(patch.error().message.has_value());
        CHECK(patch.error().message->find("delta 0: ") == 0);
    }

    TEST_CASE("rejects malformed paths and payloads") {
        auto negative = PatchCodec::decodeDelta(json::parse(R"({"kind": "CREATE", "path": [-1], "value": 1})"));
        REQUIRE_FALSE(negative.has_value());
        CHECK(negative.error().code == Error::Code::MalformedDelta);

        auto nested = PatchCodec::decodeDelta(json::parse(R"({"kind": "CREATE", "path": [["a"]], "value": 1})"));
        REQUIRE_FALSE(nested.has_value());
        CHECK(nested.error().code == Error::Code::MalformedDelta);

        auto noValue = PatchCodec::decodeDelta(json::parse(R"({"kind": "CHANGE", "path": ["a"], "oldValue": 1})"));
        REQUIRE_FALSE(noValue.has_value());
        CHECK(noValue.error().code == Error::Code::MalformedDelta);

        auto noOldValue = PatchCodec::decodeDelta(json::parse(R"({"kind": "REMOVE", "path": ["a"]})"));
        REQUIRE_FALSE(noOldValue.has_value());
        CHECK(noOldValue.error().code == Error::Code::MalformedDelta);

        auto notObject = PatchCodec::decodeDelta(json::parse("[1]"));
        REQUIRE_FALSE(notObject.has_value());
        CHECK(notObject.error().code == Error::Code::MalformedDelta);
    }

    TEST_CASE("history errors name the patch and delta") {
        auto history = PatchCodec::decodeHistory(json::parse(R"([
            [{"kind": "CREATE", "path": ["a"], "value": 1}],
            [{"kind": "CREATE", "path": "a", "value": 1}]
        ])"));
        REQUIRE_FALSE(history.has_value());
        REQUIRE(history.error().message.has_value());
        CHECK(history.error().message->find("patch 1: delta 0: ") == 0);

        auto good = PatchCodec::decodeHistory(json::parse(R"([[], [{"kind": "CREATE", "path": ["a"], "value": 1}]])"));
        REQUIRE(good.has_value());
        CHECK(good->size() == 2);
        CHECK(PatchCodec::encodeHistory(*good) == json::parse(R"([[], [{"kind": "CREATE", "path": ["a"], "value": 1}]])"));
    }

    TEST_CASE("invalid JSON text is malformed input") {
        auto parsed = PatchCodec::patchFromString("[{\"kind\": ");
        REQUIRE_FALSE(parsed.has_value());
        CHECK(parsed.error().code == Error::Code::MalformedInput);
    }

    TEST_CASE("text encoding replaces invalid UTF-8") {
        Patch patch{Delta{.kind = DeltaKind::Create, .path = {std::string("raw")}, .value = Node::string("\xff"), .oldValue = nullptr}};

        std::string text;
        CHECK_NOTHROW(text = PatchCodec::patchToString(patch));
        auto decoded = PatchCodec::patchFromString(text);
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->size() == 1);
        CHECK(*(*decoded)[0].value->asString() == "\xEF\xBF\xBD");
    }
}
