#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "mark_weave/Config.h"

using namespace mark_weave;
using nlohmann::json;

namespace {
	template<typename T>
	auto decodedValue(const json& value) -> T {
		auto res = ConfigDecoder<T>::decode(value);
		EXPECT_TRUE(std::holds_alternative<T>(res));
		return std::holds_alternative<T>(res) ? std::get<T>(res) : T{};
	}

	template<typename T>
	auto decodingError(const json& value) -> std::string {
		auto res = ConfigDecoder<T>::decode(value);
		if (const auto* err = std::get_if<DecodingError>(&res)) {
			return err->message;
		}
		return "<decoded>";
	}
}

TEST(Config, DottedPaths) {
	Config config{ json{ { "site", { { "title", "Weave" }, { "nav", { { "depth", 2 } } } } } } };
	EXPECT_EQ(config.get("site.title"), json("Weave"));
	EXPECT_EQ(config.get("site.nav.depth"), json(2));
	EXPECT_FALSE(config.get("site.author").has_value());
	EXPECT_FALSE(config.get("site.title.length").has_value());
}

TEST(Config, WithValueLeavesOriginalUntouched) {
	Config empty{};
	auto updated = empty.withValue("a.b", 5).withValue("a.c", "x");
	EXPECT_FALSE(empty.get("a").has_value());
	EXPECT_EQ(updated.get("a.b"), json(5));
	EXPECT_EQ(updated.get("a.c"), json("x"));
}

TEST(ConfigDecoder, Strings) {
	EXPECT_EQ(decodedValue<std::string>("text"), "text");
	EXPECT_EQ(decodedValue<std::string>(42), "42");
	EXPECT_EQ(decodedValue<std::string>(true), "true");
	EXPECT_EQ(decodingError<std::string>(json::array({ 1 })), "not a string: [1]");
}

TEST(ConfigDecoder, Integers) {
	EXPECT_EQ(decodedValue<int>(7), 7);
	EXPECT_EQ(decodedValue<int>("-12"), -12);
	EXPECT_EQ(decodingError<int>("foo"), "not an integer: foo");
	EXPECT_EQ(decodingError<int>("12px"), "not an integer: 12px");
	EXPECT_EQ(decodingError<int>(5000000000LL), "not an integer: 5000000000");
	EXPECT_EQ(decodedValue<long>(5000000000LL), 5000000000L);
}

TEST(ConfigDecoder, OtherTypes) {
	EXPECT_DOUBLE_EQ(decodedValue<double>("2.5"), 2.5);
	EXPECT_TRUE(decodedValue<bool>("true"));
	EXPECT_EQ(decodingError<bool>("yes"), "not a boolean: yes");
	EXPECT_EQ(decodedValue<std::vector<std::string>>(json::array({ "a", 1 })), (std::vector<std::string>{ "a", "1" }));
	EXPECT_EQ(decodingError<std::vector<std::string>>("a"), "not an array: a");
}

TEST(Config, RenderValue) {
	EXPECT_EQ(renderValue("plain"), "plain");
	EXPECT_EQ(renderValue(3), "3");
	EXPECT_EQ(renderValue(json{ { "a", 1 } }), "{\"a\":1}");
}

TEST(ObjectMembers, Syntax) {
	auto res = objectMembers().parse("a = 1\nb: \"two\" # comment\nc { d = [x, 2, true] }, e = some text }");
	ASSERT_TRUE(res);
	const auto& members = res.result();
	ASSERT_EQ(members.size(), 4u);
	EXPECT_EQ(members[0].key, "a");
	EXPECT_EQ(members[0].value, json(1));
	EXPECT_EQ(members[1].value, json("two"));
	EXPECT_EQ(members[2].value, (json{ { "d", json::array({ "x", 2, true }) } }));
	EXPECT_EQ(members[3].value, json("some text"));
	EXPECT_EQ(members[0].source, "a = 1");
	EXPECT_EQ(res.next().rest(), "}");
}

TEST(ObjectMembers, Errors) {
	auto missingValue = objectMembers().parse("a = ");
	ASSERT_FALSE(missingValue);
	EXPECT_EQ(missingValue.failure().message, "expected value but found end of input");

	auto missingSeparator = objectMembers().parse("a b");
	ASSERT_FALSE(missingSeparator);
	EXPECT_EQ(missingSeparator.failure().message, "expected '=' or ':' after key 'a'");

	auto unclosedArray = objectMembers().parse("a = [1, 2");
	ASSERT_FALSE(unclosedArray);
	EXPECT_EQ(unclosedArray.failure().message, "missing closing bracket of array");
}

TEST(ObjectMembers, NestingDepthIsLimited) {
	const std::string deepest(MAX_ATTRIBUTE_DEPTH, '[');
	auto allowed = objectMembers().parse("a = " + deepest + std::string(MAX_ATTRIBUTE_DEPTH, ']'));
	ASSERT_TRUE(allowed);
	EXPECT_EQ(allowed.result().size(), 1u);

	auto arrays = objectMembers().parse("a = [" + deepest + std::string(MAX_ATTRIBUTE_DEPTH + 1, ']'));
	ASSERT_FALSE(arrays);
	EXPECT_EQ(arrays.failure().message, "attribute values nested deeper than 64 levels");

	std::string objects;
	for (int i = 0; i < 200; ++i) {
		objects += "a = {";
	}
	auto nestedObjects = objectMembers().parse(objects);
	ASSERT_FALSE(nestedObjects);
	EXPECT_EQ(nestedObjects.failure().message, "attribute values nested deeper than 64 levels");
}

TEST(ParserSettings, FromJson) {
	auto parsed = ParserSettings::fromJson(json{
		{ "settings", { { "maxNestLevel", 5 }, { "defaultFence", "%%" } } },
		{ "config", { { "a", 1 } } },
		{ "path", "/docs/intro.md" } });
	ASSERT_TRUE(std::holds_alternative<ParserSettings>(parsed));
	const auto& settings = std::get<ParserSettings>(parsed);
	EXPECT_EQ(settings.maxNestLevel, 5);
	EXPECT_EQ(settings.defaultFence, "%%");
	ASSERT_NE(settings.cursor, nullptr);
	EXPECT_EQ(settings.cursor->path, "/docs/intro.md");
	EXPECT_EQ(settings.cursor->config.get("a"), json(1));
}

TEST(ParserSettings, Defaults) {
	auto parsed = ParserSettings::fromJson(json::object());
	ASSERT_TRUE(std::holds_alternative<ParserSettings>(parsed));
	const auto& settings = std::get<ParserSettings>(parsed);
	EXPECT_EQ(settings.maxNestLevel, 12);
	EXPECT_EQ(settings.defaultFence, "@:@");
	EXPECT_EQ(settings.cursor, nullptr);
}

TEST(ParserSettings, Rejects) {
	auto error = [](const json& doc) {
		auto parsed = ParserSettings::fromJson(doc);
		return std::holds_alternative<std::string>(parsed) ? std::get<std::string>(parsed) : std::string{ "<accepted>" };
	};
	EXPECT_EQ(error(json::array()), "settings document is not an object: []");
	EXPECT_EQ(error(json{ { "settings", { { "maxNestLevel", 0 } } } }), "maxNestLevel out of range: 0");
	EXPECT_EQ(error(json{ { "settings", { { "defaultFence", "" } } } }), "defaultFence must be a non-empty string: \"\"");
	EXPECT_EQ(error(json{ { "config", 3 } }), "config is not an object: 3");
}
