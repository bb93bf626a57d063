#include <gtest/gtest.h>
#include "mark_weave/Characters.h"

using namespace mark_weave;

TEST(CharClassifier, SmallAndLargeSets) {
	auto two = CharClassifier::of("ab");
	EXPECT_EQ(two.mode(), CharClassifier::mode_e::Two);
	EXPECT_TRUE(two('a'));
	EXPECT_TRUE(two('b'));
	EXPECT_FALSE(two('c'));

	auto table = CharClassifier::of("xyz!");
	EXPECT_EQ(table.mode(), CharClassifier::mode_e::Table);
	EXPECT_TRUE(table('!'));
	EXPECT_TRUE(table('z'));
	EXPECT_FALSE(table('{'));
	EXPECT_FALSE(table(static_cast<char>(0xE4)));
}

TEST(CharClassifier, NegateAndAdd) {
	auto notA = CharClassifier::of("a").negate();
	EXPECT_FALSE(notA('a'));
	EXPECT_TRUE(notA('b'));

	auto digitsOrDash = char_groups::digit().add(CharClassifier::of("-"));
	EXPECT_TRUE(digitsOrDash('7'));
	EXPECT_TRUE(digitsOrDash('-'));
	EXPECT_FALSE(digitsOrDash('x'));

	EXPECT_TRUE(CharClassifier::nothing().isEmpty());
	EXPECT_TRUE(CharClassifier::everything()('\n'));
}

TEST(Characters, LongestRun) {
	auto res = anyOf("ab").parse("abbac");
	ASSERT_TRUE(res);
	EXPECT_EQ(res.result(), "abba");
	EXPECT_EQ(res.next().offset(), 4u);
}

TEST(Characters, EmptyRunSucceedsWithoutMinimum) {
	auto res = anyOf("ab").parse("xyz");
	ASSERT_TRUE(res);
	EXPECT_EQ(res.result(), "");
	EXPECT_EQ(res.next().offset(), 0u);
}

TEST(Characters, MinimumAndMaximum) {
	auto tooShort = anyOf("a").min(3).parse("aab");
	ASSERT_FALSE(tooShort);
	EXPECT_EQ(tooShort.failure().message, "expected at least 3 characters, got only 2");
	EXPECT_EQ(tooShort.failure().maxOffset, 2u);

	auto capped = anyOf("a").max(2).parse("aaaa");
	ASSERT_TRUE(capped);
	EXPECT_EQ(capped.result(), "aa");

	auto exact = anyChars().take(3).parse("abcdef");
	ASSERT_TRUE(exact);
	EXPECT_EQ(exact.result(), "abc");
}

TEST(Characters, AnyButAndRanges) {
	EXPECT_EQ(anyBut(",)").parse("abc, def").result(), "abc");
	EXPECT_EQ(anyIn({ { 'a', 'c' }, { '0', '1' } }).parse("ab10cd").result(), "ab10c");
	EXPECT_EQ(anyWhile([](char c) { return c == '.'; }).parse("...x").result(), "...");
}

TEST(Characters, SingleCharacters) {
	auto res = oneOf("xy").parse("yz");
	ASSERT_TRUE(res);
	EXPECT_EQ(res.result(), 'y');

	auto wrong = oneOf("xy").parse("z");
	ASSERT_FALSE(wrong);
	EXPECT_EQ(wrong.failure().message, "unexpected character 'z'");

	EXPECT_FALSE(oneChar().parse(""));
}

TEST(Characters, LineStructure) {
	auto eol = wsEol().parse(" \t\nnext");
	ASSERT_TRUE(eol);
	EXPECT_EQ(eol.next().offset(), 3u);
	EXPECT_TRUE(wsEol().parse("  "));
	EXPECT_FALSE(wsEol().parse("  x"));

	EXPECT_TRUE(blankLine().parse("   \nfoo"));
	EXPECT_FALSE(blankLine().parse(" foo\n"));

	auto line = restOfLine().parse("first\r\nsecond");
	ASSERT_TRUE(line);
	EXPECT_EQ(line.result(), "first");
	EXPECT_EQ(line.next().rest(), "second");
}

TEST(SourcePosition, LineAndColumn) {
	SourcePosition pos{ "abc\ndef\nghi" };
	auto at = pos.consume(5).position();
	EXPECT_EQ(at.line, 2u);
	EXPECT_EQ(at.column, 2u);
	EXPECT_EQ(at.lineContent, "def");
	EXPECT_EQ(at.lineContentWithCaret(), "def\n ^");
}

TEST(SourcePosition, ConsumeNeverPassesTheEnd) {
	SourcePosition pos{ "ab" };
	auto end = pos.consume(10);
	EXPECT_TRUE(end.atEnd());
	EXPECT_EQ(end.offset(), 2u);
	EXPECT_EQ(end.remaining(), 0u);
}
