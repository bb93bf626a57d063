#include <string>
#include <gtest/gtest.h>
#include "mark_weave/BasicMarkup.h"
#include "mark_weave/DirectiveParsers.h"

using namespace mark_weave;

namespace {
	auto blockDecl() -> Parser<Declaration> {
		return declaration(backslashEscape(), "@:@", true);
	}

	auto spanDecl() -> Parser<Declaration> {
		return declaration(backslashEscape(), "@:@", false);
	}

	auto positionalValue(const Declaration& decl, UInt index) -> std::string {
		for (const auto& attr : decl.attributes) {
			if (const auto* idx = std::get_if<UInt>(&attr.key); idx and *idx == index) {
				return attr.value.get<std::string>();
			}
		}
		return "<missing>";
	}

	auto namedValue(const Declaration& decl, const std::string& key) -> nlohmann::json {
		for (const auto& attr : decl.attributes) {
			if (const auto* name = std::get_if<std::string>(&attr.key); name and *name == key) {
				return attr.value;
			}
		}
		return nullptr;
	}
}

TEST(DirectiveDeclaration, NameOnly) {
	auto res = spanDecl().parse("@:pageBreak rest");
	ASSERT_TRUE(res);
	EXPECT_EQ(res.result().name, "pageBreak");
	EXPECT_TRUE(res.result().attributes.empty());
	EXPECT_TRUE(res.result().attributeErrors.empty());
	EXPECT_EQ(res.result().fence, "@:@");
	EXPECT_EQ(res.next().rest(), " rest");
}

TEST(DirectiveDeclaration, NotADirective) {
	EXPECT_FALSE(spanDecl().parse("@ foo"));
	EXPECT_FALSE(spanDecl().parse("@:"));
	EXPECT_FALSE(spanDecl().parse("@:9lives"));
	EXPECT_FALSE(spanDecl().parse("foo"));
}

TEST(DirectiveDeclaration, PositionalAttributes) {
	auto res = spanDecl().parse("@:dir( one , \"two, three\",four)x");
	ASSERT_TRUE(res);
	ASSERT_EQ(res.result().attributes.size(), 3u);
	EXPECT_EQ(positionalValue(res.result(), 0), "one");
	EXPECT_EQ(positionalValue(res.result(), 1), "two, three");
	EXPECT_EQ(positionalValue(res.result(), 2), "four");
	EXPECT_EQ(res.next().rest(), "x");
}

TEST(DirectiveDeclaration, EmptyParenthesesAndEscapedQuotes) {
	auto empty = spanDecl().parse("@:dir()");
	ASSERT_TRUE(empty);
	EXPECT_TRUE(empty.result().attributes.empty());

	auto escaped = spanDecl().parse("@:dir(\"say \\\"hi\\\"\")");
	ASSERT_TRUE(escaped);
	EXPECT_EQ(positionalValue(escaped.result(), 0), "say \"hi\"");
}

TEST(DirectiveDeclaration, BrokenPositionalAttributesFail) {
	auto unclosed = spanDecl().parse("@:dir(foo bar");
	ASSERT_FALSE(unclosed);
	EXPECT_EQ(unclosed.failure().message, "missing closing parenthesis for positional attributes");

	auto stray = spanDecl().parse("@:dir(\"foo\" bar)");
	ASSERT_FALSE(stray);
	EXPECT_EQ(stray.failure().message, "expected ',' or ')' but found 'b'");

	auto emptyValue = spanDecl().parse("@:dir(a,,b)");
	ASSERT_FALSE(emptyValue);
	EXPECT_EQ(emptyValue.failure().message, "expected attribute value");

	auto unterminated = spanDecl().parse("@:dir(\"foo)\nbar");
	ASSERT_FALSE(unterminated);
	EXPECT_EQ(unterminated.failure().message, "unterminated quoted attribute value");
}

TEST(DirectiveDeclaration, AttributeSection) {
	auto res = spanDecl().parse("@:dir(pos) { name = foo, count: 3\n nested { flag = true } } after");
	ASSERT_TRUE(res);
	const auto& decl = res.result();
	EXPECT_TRUE(decl.attributeErrors.empty());
	EXPECT_EQ(positionalValue(decl, 0), "pos");
	EXPECT_EQ(namedValue(decl, "name"), "foo");
	EXPECT_EQ(namedValue(decl, "count"), 3);
	EXPECT_EQ(namedValue(decl, "nested"), (nlohmann::json{ { "flag", true } }));
	EXPECT_EQ(res.next().rest(), " after");
}

TEST(DirectiveDeclaration, DuplicateNamedAttributeKeepsFirst) {
	auto res = spanDecl().parse("@:dir { a = 1, a = 2 }");
	ASSERT_TRUE(res);
	EXPECT_EQ(namedValue(res.result(), "a"), 1);
	ASSERT_EQ(res.result().attributeErrors.size(), 1u);
	EXPECT_EQ(res.result().attributeErrors[0], "duplicate attribute 'a'");
}

TEST(DirectiveDeclaration, MalformedSectionIsReportedNotFailed) {
	auto res = spanDecl().parse("@:dir { = broken } tail");
	ASSERT_TRUE(res);
	ASSERT_EQ(res.result().attributeErrors.size(), 1u);
	EXPECT_EQ(res.result().attributeErrors[0], "invalid attribute section: expected attribute key but found '='");
	EXPECT_EQ(res.next().rest(), " tail");

	auto unclosed = spanDecl().parse("@:dir { a = 1 ");
	ASSERT_TRUE(unclosed);
	ASSERT_EQ(unclosed.result().attributeErrors.size(), 1u);
	EXPECT_EQ(unclosed.result().attributeErrors[0], "Missing closing brace for attribute section");

	// nothing to recover at when no closing brace follows at all
	EXPECT_FALSE(spanDecl().parse("@:dir { = broken"));
}

TEST(DirectiveDeclaration, CustomFenceOnlyForBlocks) {
	auto block = blockDecl().parse("@:dir(a) ^^^\nbody");
	ASSERT_TRUE(block);
	EXPECT_EQ(block.result().fence, "^^^");
	EXPECT_EQ(block.next().rest(), "\nbody");

	auto tooLong = blockDecl().parse("@:dir ^^^^\nbody");
	ASSERT_TRUE(tooLong);
	EXPECT_EQ(tooLong.result().fence, "@:@");
	EXPECT_EQ(tooLong.next().rest(), " ^^^^\nbody");

	auto span = spanDecl().parse("@:dir ^^^\nbody");
	ASSERT_TRUE(span);
	EXPECT_EQ(span.result().fence, "@:@");
}

TEST(DirectiveBodies, BlockBodyTrimsBlankLines) {
	auto res = blockBody("@:@").parse("\n\nfirst\n\nsecond\n  \n  @:@  \nafter");
	ASSERT_TRUE(res);
	EXPECT_EQ(res.result(), "first\n\nsecond");
	EXPECT_EQ(res.next().rest(), "after");

	auto unterminated = blockBody("@:@").parse("first\nsecond");
	ASSERT_FALSE(unterminated);
	EXPECT_EQ(unterminated.failure().message, "unterminated directive body, missing fence '@:@'");
}

TEST(DirectiveBodies, FenceMustBeAloneOnItsLine) {
	auto res = blockBody("@:@").parse("a @:@\n@:@ b\n@:@");
	ASSERT_TRUE(res);
	EXPECT_EQ(res.result(), "a @:@\n@:@ b");
	EXPECT_TRUE(res.next().atEnd());
}
