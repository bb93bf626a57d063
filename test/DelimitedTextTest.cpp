#include <gtest/gtest.h>
#include "mark_weave/Characters.h"
#include "mark_weave/DelimitedText.h"

using namespace mark_weave;

TEST(DelimitedText, StopsAtDelimiterAndConsumesIt) {
	auto res = DelimitedText::delimitedBy("@:@").parse("abc @:@ rest");
	ASSERT_TRUE(res);
	EXPECT_EQ(res.result(), "abc ");
	EXPECT_EQ(res.next().rest(), " rest");
}

TEST(DelimitedText, PartialDelimiterIsText) {
	auto res = DelimitedText::delimitedBy("@:@").parse("a@:b@@:@");
	ASSERT_TRUE(res);
	EXPECT_EQ(res.result(), "a@:b@");
	EXPECT_TRUE(res.next().atEnd());
}

TEST(DelimitedText, KeepDelimiter) {
	auto res = DelimitedText::delimitedByChars(")").keepDelimiter().parse("abc)");
	ASSERT_TRUE(res);
	EXPECT_EQ(res.result(), "abc");
	EXPECT_EQ(res.next().rest(), ")");
}

TEST(DelimitedText, EndOfInputFailsUnlessAccepted) {
	auto missing = DelimitedText::delimitedByChars("]").parse("abc");
	ASSERT_FALSE(missing);
	EXPECT_EQ(missing.failure().message, "unexpected end of input");
	EXPECT_EQ(missing.failure().maxOffset, 3u);

	auto accepted = DelimitedText::delimitedByChars("]").acceptEof().parse("abc");
	ASSERT_TRUE(accepted);
	EXPECT_EQ(accepted.result(), "abc");

	auto all = DelimitedText::undelimited().parse("everything\nhere");
	ASSERT_TRUE(all);
	EXPECT_EQ(all.result(), "everything\nhere");
}

TEST(DelimitedText, NonEmpty) {
	EXPECT_FALSE(DelimitedText::delimitedByChars("]").nonEmpty().parse("]"));
	EXPECT_FALSE(DelimitedText::undelimited().nonEmpty().parse(""));
	EXPECT_TRUE(DelimitedText::delimitedByChars("]").nonEmpty().parse("a]"));
}

TEST(DelimitedText, FailOn) {
	auto res = DelimitedText::delimitedByChars("\"").failOn("\n").parse("ab\ncd\"");
	ASSERT_FALSE(res);
	EXPECT_EQ(res.failure().message, "unexpected character '\n'");
	EXPECT_EQ(res.failure().pos.offset(), 2u);
}

TEST(DelimitedText, ScanReportsNestedStarts) {
	auto text = DelimitedText::delimitedBy("}").withNestedStart(CharClassifier::of("*"));
	SourcePosition in{ "ab*c}" };

	auto first = text.scanNext(in);
	ASSERT_TRUE(first);
	EXPECT_EQ(first.result().text, "ab");
	EXPECT_EQ(first.result().stop, StopReason::NestedStart);
	EXPECT_EQ(first.result().startChar, '*');
	EXPECT_EQ(first.next().offset(), 2u);

	auto second = text.scanNext(first.next().consume(1));
	ASSERT_TRUE(second);
	EXPECT_EQ(second.result().text, "c");
	EXPECT_EQ(second.result().stop, StopReason::Delimiter);
	EXPECT_TRUE(second.next().atEnd());

	// as a plain parser the nested start is kept as text
	EXPECT_EQ(text.parse(in).result(), "ab*c");
}

TEST(DelimitedText, DelimiterWinsOverNestedStart) {
	auto text = DelimitedText::delimitedBy("@:@").withNestedStart(CharClassifier::of("@"));
	auto chunk = text.scanNext(SourcePosition{ "x@:@" });
	ASSERT_TRUE(chunk);
	EXPECT_EQ(chunk.result().stop, StopReason::Delimiter);
	EXPECT_EQ(chunk.result().text, "x");

	auto nested = text.scanNext(SourcePosition{ "x@:foo" });
	ASSERT_TRUE(nested);
	EXPECT_EQ(nested.result().stop, StopReason::NestedStart);
}

TEST(AnyUntil, DelimiterParser) {
	auto res = anyUntil(literal("-->")).parse("comment --> after");
	ASSERT_TRUE(res);
	EXPECT_EQ(res.result().text, "comment ");
	EXPECT_FALSE(res.result().onStopChar);
	EXPECT_EQ(res.next().rest(), " after");

	EXPECT_FALSE(anyUntil(literal("-->")).parse("never closed"));
}

TEST(AnyUntil, StopCharsAndMinimum) {
	auto stopped = anyUntil(literal("]")).stopChars("\n").parse("ab\ncd]");
	ASSERT_TRUE(stopped);
	EXPECT_EQ(stopped.result().text, "ab");
	EXPECT_TRUE(stopped.result().onStopChar);
	EXPECT_EQ(stopped.next().offset(), 2u);

	auto shortText = anyUntil(literal("]")).min(2).parse("a]b]");
	ASSERT_TRUE(shortText);
	EXPECT_EQ(shortText.result().text, "a]b");
}
