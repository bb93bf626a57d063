#include <iterator>
#include <random>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "TestHelpers.h"

using namespace mw_test;

namespace {
	auto randomInput(std::mt19937& gen, std::size_t maxLength) -> std::string {
		static const std::string pieces[] = { "@:", "@:@", "@:dir", "@:if", "@:else", "@:style", "(", ")", "\"", ",", "{", "}", "=",
			"${", "${?", "\\", "\n", "\n\n", " ", "^^", "a", "foo", "#", "x y" };
		std::uniform_int_distribution<std::size_t> pick{ 0, std::size(pieces) - 1 };
		std::uniform_int_distribution<std::size_t> length{ 0, maxLength };
		std::string res;
		for (auto n = length(gen); n > 0; --n) {
			res += pieces[pick(gen)];
		}
		return res;
	}

	auto countFlavor(const Element& root, Element::type_e flavor) -> std::size_t {
		std::size_t count = 0;
		for (auto it = root.walkBegin(); it != root.walkEnd(); ++it) {
			if (not it.retracting() and it->flavor == flavor) {
				++count;
			}
		}
		return count;
	}

	auto countInvalid(const Element& root) -> std::size_t {
		return countFlavor(root, Element::type_e::InvalidSpan) + countFlavor(root, Element::type_e::InvalidBlock);
	}

	auto repeated(const std::string& piece, int times) -> std::string {
		std::string res;
		for (int i = 0; i < times; ++i) {
			res += piece;
		}
		return res;
	}
}

TEST(Robustness, GarbageNeverFails) {
	std::mt19937 gen{ 20201019u };
	std::vector<ExtensionBundle> bundles{ standardDirectives(), testBundle(), separatorBundle() };
	for (int i = 0; i < 300; ++i) {
		auto input = randomInput(gen, 30);
		SCOPED_TRACE(input);

		auto doc = parseMarkup(input, bundles);
		EXPECT_EQ(doc.flavor, Element::type_e::RootElement);
		EXPECT_EQ(countFlavor(doc, Element::type_e::SeparatorMarker), 0u);

		auto tmpl = parseTemplate(input, bundles);
		EXPECT_EQ(tmpl.flavor, Element::type_e::TemplateRoot);
		EXPECT_EQ(countFlavor(tmpl, Element::type_e::SeparatorMarker), 0u);
	}
}

TEST(Robustness, InvalidElementsKeepTheirSource) {
	std::mt19937 gen{ 7u };
	for (int i = 0; i < 100; ++i) {
		auto input = randomInput(gen, 20);
		auto doc = parseMarkup(input, { standardDirectives(), testBundle() });
		for (auto it = doc.walkBegin(); it != doc.walkEnd(); ++it) {
			if (not it.retracting() and it->isInvalid()) {
				EXPECT_NE(input.find(invalidSource(*it)), std::string::npos) << input;
				EXPECT_FALSE(invalidMessage(*it).empty()) << input;
			}
		}
	}
}

TEST(Robustness, DeepSpanNesting) {
	auto input = "start " + repeated("@:dir(x) ", 100) + repeated(" @:@", 100) + " end";
	auto doc = markup(input);
	EXPECT_EQ(doc.flavor, Element::type_e::RootElement);
	EXPECT_GT(countInvalid(doc), 0u);
	EXPECT_LE(countFlavor(doc, Element::type_e::SpanSequence), 100u);
}

TEST(Robustness, NestingWithinTheLimit) {
	ParserSettings settings{};
	settings.maxNestLevel = 20;
	auto input = repeated("@:dir(x) ", 5) + "core" + repeated(" @:@", 5);
	auto doc = markup(input, settings);
	EXPECT_EQ(countInvalid(doc), 0u);
	EXPECT_EQ(countFlavor(doc, Element::type_e::SpanSequence), 5u);
}

TEST(Robustness, NestingLimitProducesInvalidSpans) {
	ParserSettings settings{};
	settings.maxNestLevel = 3;
	auto input = repeated("@:dir(x) ", 5) + "core" + repeated(" @:@", 5);
	auto doc = markup(input, settings);
	EXPECT_GT(countInvalid(doc), 0u);
}

TEST(Robustness, DeepBlockNesting) {
	// every level has its own fence, so that all thirty levels really nest
	std::string input;
	for (int i = 0; i < 30; ++i) {
		input += "@:dir(level, " + std::to_string(i) + ") " + std::to_string(i) + "!\n";
	}
	input += "innermost\n";
	for (int i = 29; i >= 0; --i) {
		input += std::to_string(i) + "!\n";
	}
	auto doc = markup(input);
	EXPECT_EQ(doc.flavor, Element::type_e::RootElement);
	ASSERT_EQ(doc.children.size(), 1u);
	EXPECT_GT(countFlavor(doc, Element::type_e::BlockSequence), 5u);
	EXPECT_GT(countInvalid(doc), 0u);
}

TEST(Robustness, DeepTemplateNesting) {
	auto input = repeated("@:if(a)", 60) + "x" + repeated("@:@", 60);
	auto doc = parseTemplate(input, { standardDirectives() }, withConfig({ { "a", true } }));
	EXPECT_EQ(doc.flavor, Element::type_e::TemplateRoot);
	EXPECT_GT(countInvalid(doc), 0u);
}

TEST(Robustness, DeeplyNestedAttributeValues) {
	const std::string brackets(100000, '[');
	auto doc = markup("@:dir(a, 1) { a = " + brackets + " }\nbody\n@:@");
	ASSERT_EQ(doc.children.size(), 1u);
	EXPECT_EQ(invalidMessage(doc.children[0]),
		"One or more errors processing directive 'dir': invalid attribute section: attribute values nested deeper than 64 levels");

	auto unclosed = markup("x @:dir(a) { a = " + brackets);
	EXPECT_EQ(unclosed.flavor, Element::type_e::RootElement);
	EXPECT_EQ(countInvalid(unclosed), 0u);
}

TEST(Robustness, WindowsLineEndings) {
	auto doc = markup("one\r\n\r\n@:dir(a, 1)\r\nbody\r\n@:@\r\n\r\ntwo");
	EXPECT_EQ(doc, root({ p("one"), elements::blockSequence({ p("a"), p("1"), p("body") }), p("two") }));
}
