#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "mark_weave/Characters.h"
#include "mark_weave/PrefixedParser.h"

using namespace mark_weave;

namespace {
	auto tagged(std::string startChars, std::string literalText, std::string tag) -> PrefixedParser<std::string> {
		return prefixed(std::move(startChars), literal(std::move(literalText)).as(std::move(tag)));
	}
}

TEST(PrefixedParser, RejectsOtherStartCharacters) {
	auto p = tagged("*", "**", "strong");
	EXPECT_EQ(p.startChars(), "*");
	EXPECT_EQ(p.parse("**").result(), "strong");

	auto res = p.parse("_x");
	ASSERT_FALSE(res);
	EXPECT_EQ(res.failure().message, "unexpected start character '_'");
	EXPECT_FALSE(p.parse(""));
}

TEST(PrefixedParser, StartCharactersAreNormalized) {
	auto p = prefixed("ba*a", literal("x"));
	EXPECT_EQ(p.startChars(), "*ab");
	EXPECT_FALSE(p.isUnconditional());
	EXPECT_TRUE(PrefixedParser<std::string>::unconditional(literal("x")).isUnconditional());
}

TEST(PrefixedParser, MergedAlternation) {
	auto merged = tagged("*", "*", "emph").orElsePrefixed(tagged("_", "_", "under"));
	EXPECT_EQ(merged.startChars(), "*_");
	EXPECT_EQ(merged.parse("_").result(), "under");
	EXPECT_EQ(merged.parse("*").result(), "emph");
}

TEST(PrecedenceOrdering, ExtensionsAroundHostParsers) {
	std::vector<ParserDefinition<std::string>> host{
		{ tagged("a", "a", "host-high"), Precedence::High, false },
		{ tagged("a", "a", "host-low"), Precedence::Low, false } };
	std::vector<ParserDefinition<std::string>> extensions{
		{ tagged("a", "a", "ext-low"), Precedence::Low, true },
		{ tagged("a", "a", "ext-high"), Precedence::High, true } };

	auto ordered = orderByPrecedence(host, extensions);
	ASSERT_EQ(ordered.size(), 4u);
	std::vector<std::string> tags;
	for (const auto& p : ordered) {
		tags.push_back(p.parse("a").result());
	}
	EXPECT_EQ(tags, (std::vector<std::string>{ "ext-high", "host-high", "host-low", "ext-low" }));
}

TEST(PrefixedDispatch, HighExtensionBeatsLowHostParser) {
	int hostAttempts = 0;
	auto failingHost = prefixed("@", Parser<std::string>([&hostAttempts](const SourcePosition& in) -> Parsed<std::string> {
		++hostAttempts;
		return Failure{ "host parser never matches", in };
	}));
	std::vector<ParserDefinition<std::string>> host{ { failingHost, Precedence::Low, false } };
	std::vector<ParserDefinition<std::string>> extensions{ { prefixed("@", success(std::string{ "extension" })), Precedence::High, true } };
	PrefixedDispatch<std::string> dispatch{ orderByPrecedence(host, extensions) };

	auto res = dispatch.parse("@:x");
	ASSERT_TRUE(res);
	EXPECT_EQ(res.result(), "extension");
	EXPECT_EQ(hostAttempts, 0);
}

TEST(PrefixedDispatch, FallsThroughWithinOneCharacter) {
	PrefixedDispatch<std::string> dispatch{ { tagged("*", "**", "strong"), tagged("*", "*", "emph") } };
	EXPECT_EQ(dispatch.parse("**").result(), "strong");
	EXPECT_EQ(dispatch.parse("*x").result(), "emph");
	EXPECT_EQ(dispatch.startChars(), "*");
	EXPECT_TRUE(dispatch.parserFor('*').has_value());
	EXPECT_FALSE(dispatch.parserFor('_').has_value());
}

TEST(PrefixedDispatch, FallbackOnlyForUnclaimedCharacters) {
	auto fallback = PrefixedParser<std::string>::unconditional(anyChars().nonEmpty().map([](const std::string&) { return std::string{ "fallback" }; }));
	PrefixedDispatch<std::string> dispatch{ { tagged("*", "**", "strong"), fallback } };
	ASSERT_TRUE(dispatch.hasFallback());

	EXPECT_EQ(dispatch.parse("plain").result(), "fallback");
	// a claimed character is authoritative, even when its parsers fail
	auto res = dispatch.parse("*x");
	ASSERT_FALSE(res);
	EXPECT_EQ(res.failure().message, "'**' expected but '*x' found");
}

TEST(PrefixedDispatch, NoParserForCharacter) {
	PrefixedDispatch<std::string> dispatch{ { tagged("*", "*", "emph") } };
	auto res = dispatch.parse("x");
	ASSERT_FALSE(res);
	EXPECT_EQ(res.failure().message, "no parser registered for character 'x'");
	EXPECT_EQ(dispatch.parse("").failure().message, "unexpected end of input");
}
