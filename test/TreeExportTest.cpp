#include <string>
#include <utility>
#include <vector>
#include <gtest/gtest.h>
#include "TestHelpers.h"

using namespace mw_test;

TEST(DebugString, Document) {
	auto doc = root({ p("aa"), elements::pageBreak(), elements::fragment("side", elements::blockSequence({ p("x") }, { "note" })) });
	EXPECT_EQ(toDebugString(doc),
		"RootElement - Blocks: 3\n"
		". Paragraph - Spans: 1\n"
		". . Text - 'aa'\n"
		". PageBreak\n"
		". Fragment(side) - Blocks: 1\n"
		". . BlockSequence - Blocks: 1 styles: note\n"
		". . . Paragraph - Spans: 1\n"
		". . . . Text - 'x'\n");
}

TEST(DebugString, InvalidAndTemplateNodes) {
	auto doc = templateRoot({ ts("a"), elements::templateElement(elements::invalidSpan("bad", "@:x")) });
	EXPECT_EQ(toDebugString(doc),
		"TemplateRoot - Spans: 2\n"
		". TemplateString - 'a'\n"
		". TemplateElement - Spans: 1\n"
		". . InvalidSpan - 'bad' source: '@:x'\n");
}

TEST(DebugString, SingleNode) {
	EXPECT_EQ(toDebugString(text("alone")), "Text - 'alone'\n");
}

TEST(JsonExport, Structure) {
	auto doc = root({ p({ text("a"), elements::invalidSpan("oops", "@:y") }) });
	auto exported = toJson(doc);
	EXPECT_EQ(exported["type"], "RootElement");
	ASSERT_EQ(exported["children"].size(), 1u);
	const auto& para = exported["children"][0];
	EXPECT_EQ(para["type"], "Paragraph");
	ASSERT_EQ(para["children"].size(), 2u);
	EXPECT_EQ(para["children"][0]["content"], "a");
	EXPECT_EQ(para["children"][1]["message"], "oops");
	EXPECT_EQ(para["children"][1]["source"], "@:y");
	EXPECT_FALSE(para["children"][0].contains("children"));
}

TEST(JsonExport, NamesAndStyles) {
	auto exported = toJson(elements::fragment("nav", elements::spanSequence({}, { "a", "b" })));
	EXPECT_EQ(exported["name"], "nav");
	EXPECT_EQ(exported["children"][0]["styles"], (nlohmann::json{ "a", "b" }));
}

TEST(Walker, VisitsParentsTwice) {
	auto doc = root({ p("a"), p("b") });
	std::vector<std::pair<std::string, bool>> visits;
	for (auto it = doc.walkBegin(); it != doc.walkEnd(); ++it) {
		visits.emplace_back(elements::typeName(it->flavor), it.retracting());
	}
	std::vector<std::pair<std::string, bool>> expected{
		{ "RootElement", false },
		{ "Paragraph", false }, { "Text", false }, { "Paragraph", true },
		{ "Paragraph", false }, { "Text", false }, { "Paragraph", true },
		{ "RootElement", true } };
	EXPECT_EQ(visits, expected);
}
