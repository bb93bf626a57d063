#include <string>
#include <tuple>
#include <gtest/gtest.h>
#include "mark_weave/Characters.h"
#include "mark_weave/Parser.h"

using namespace mark_weave;

TEST(Combinators, SequenceCollectsResults) {
	auto p = seq(literal("a"), anyOf("b"), literal("c"));
	auto res = p.parse("abbbc!");
	ASSERT_TRUE(res);
	EXPECT_EQ(std::get<1>(res.result()), "bbb");
	EXPECT_EQ(res.next().rest(), "!");
}

TEST(Combinators, SequenceReportsFurthestOffset) {
	auto p = keepRight(literal("ab"), literal("cd"));
	auto res = p.parse("abce");
	ASSERT_FALSE(res);
	EXPECT_EQ(res.failure().pos.offset(), 2u);
	EXPECT_EQ(res.failure().message, "'cd' expected but 'ce' found");
	EXPECT_EQ(res.failure().maxOffset, 3u);
}

TEST(Combinators, AlternationKeepsFurthestFailure) {
	auto p = keepRight(literal("a"), literal("bc")).orElse(literal("x"));
	auto res = p.parse("abd");
	ASSERT_FALSE(res);
	EXPECT_EQ(res.failure().message, "'bc' expected but 'bd' found");
	EXPECT_EQ(res.failure().maxOffset, 2u);

	auto firstWins = literal("ab").orElse(literal("a")).parse("ab");
	ASSERT_TRUE(firstWins);
	EXPECT_EQ(firstWins.result(), "ab");
}

TEST(Combinators, FirstOfTriesInOrder) {
	auto p = firstOf<std::string>({ literal("abc"), literal("ab"), literal("a") });
	EXPECT_EQ(p.parse("abx").result(), "ab");
	EXPECT_FALSE(p.parse("x"));
	EXPECT_FALSE(firstOf<std::string>({}).parse("x"));
}

TEST(Combinators, MapAndFlatMap) {
	auto length = anyOf("a").map([](const std::string& s) { return s.size(); });
	EXPECT_EQ(length.parse("aaab").result(), 3u);

	// a digit n, then exactly n characters
	auto counted = oneIf(char_groups::digit()).flatMap([](char n) { return Parser<std::string>(anyChars().take(static_cast<UInt>(n - '0'))); });
	auto res = counted.parse("3abcdef");
	ASSERT_TRUE(res);
	EXPECT_EQ(res.result(), "abc");
	EXPECT_FALSE(counted.parse("5ab"));
}

TEST(Combinators, OptionalAndLookAhead) {
	auto maybe = opt(literal("x")).parse("y");
	ASSERT_TRUE(maybe);
	EXPECT_FALSE(maybe.result().has_value());
	EXPECT_EQ(maybe.next().offset(), 0u);

	auto peeked = lookAhead(literal("ab")).parse("abc");
	ASSERT_TRUE(peeked);
	EXPECT_EQ(peeked.next().offset(), 0u);

	EXPECT_TRUE(notFollowedBy(literal("x")).parse("y"));
	EXPECT_FALSE(notFollowedBy(literal("x")).parse("x"));
}

TEST(Combinators, SourceAndFailureMessage) {
	auto p = seq(literal("${"), anyBut("}"), literal("}")).source();
	EXPECT_EQ(p.parse("${key} tail").result(), "${key}");

	auto renamed = literal("a").withFailureMessage("an a is required").parse("b");
	ASSERT_FALSE(renamed);
	EXPECT_EQ(renamed.failure().message, "an a is required");
}

TEST(Combinators, EndOfInput) {
	EXPECT_TRUE(eof().parse(""));
	EXPECT_FALSE(eof().parse("x"));
	EXPECT_TRUE(keepLeft(literal("x"), eof()).parse("x"));
}

TEST(Repeat, Bounds) {
	auto ab = literal("ab");
	EXPECT_EQ(rep(ab).parse("ababx").result().size(), 2u);
	EXPECT_EQ(rep(ab).max(1).parse("abab").result().size(), 1u);
	EXPECT_TRUE(rep(ab).min(0).parse("x"));

	auto tooFew = rep(ab).min(3).parse("ababx");
	ASSERT_FALSE(tooFew);
	EXPECT_EQ(tooFew.failure().message, "expected at least 3 occurrences, got only 2");
	EXPECT_EQ(tooFew.failure().maxOffset, 4u);
}

TEST(Repeat, Separator) {
	auto list = rep(anyOf("abc").nonEmpty()).sep(literal(","));
	auto res = list.parse("a,bb,c;");
	ASSERT_TRUE(res);
	ASSERT_EQ(res.result().size(), 3u);
	EXPECT_EQ(res.result()[1], "bb");
	EXPECT_EQ(res.next().rest(), ";");

	// a trailing separator is not consumed
	auto trailing = list.parse("a,");
	ASSERT_TRUE(trailing);
	EXPECT_EQ(trailing.next().offset(), 1u);
}

TEST(Repeat, ZeroWidthSuccessTerminates) {
	// anyOf without minimum succeeds on every input, mostly without consuming anything
	auto res = rep(Parser<std::string>(anyOf("a"))).parse("aab");
	ASSERT_TRUE(res);
	ASSERT_EQ(res.result().size(), 1u);
	EXPECT_EQ(res.result()[0], "aa");
	EXPECT_EQ(res.next().offset(), 2u);

	auto never = rep(success(std::string{ "x" })).parse("anything");
	ASSERT_TRUE(never);
	EXPECT_TRUE(never.result().empty());
	EXPECT_EQ(never.next().offset(), 0u);
}

TEST(Lazily, BuildsOnFirstUse) {
	int built = 0;
	auto p = lazily<std::string>([&built] {
		++built;
		return literal("a");
	});
	EXPECT_EQ(built, 0);
	EXPECT_TRUE(p.parse("a"));
	EXPECT_TRUE(p.parse("a"));
	EXPECT_EQ(built, 1);
}

TEST(Failure, DescribeUsesFurthestPosition) {
	SourcePosition in{ "first line\nsecond" };
	Failure failure{ "expected 'x'", in, 13 };
	EXPECT_EQ(failure.describe(), "[2.3] failure: expected 'x'\n\nsecond\n  ^");

	auto best = furthest(Failure{ "near", in.consume(2) }, Failure{ "far", in.consume(5) });
	EXPECT_EQ(best.message, "far");
}
