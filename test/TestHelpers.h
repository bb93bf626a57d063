#ifndef MARK_WEAVE_TEST_HELPERS_H
#define MARK_WEAVE_TEST_HELPERS_H

#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "mark_weave/MarkWeave.h"

namespace mark_weave {
	// failure output of EXPECT_EQ on trees
	inline void PrintTo(const Element& el, std::ostream* os) {
		*os << "\n" << toDebugString(el);
	}
}

namespace mw_test {
	using namespace mark_weave;

	inline Element text(std::string content) { return elements::text(std::move(content)); }
	inline Element ts(std::string content) { return elements::templateString(std::move(content)); }
	inline Element p(std::string content) { return elements::paragraph({ text(std::move(content)) }); }
	inline Element p(std::vector<Element> spans) { return elements::paragraph(std::move(spans)); }
	inline Element root(std::vector<Element> blocks) { return elements::rootElement(std::move(blocks)); }
	inline Element templateRoot(std::vector<Element> spans) { return elements::templateRoot(std::move(spans)); }

	inline std::vector<Element> concat(std::vector<Element> a, const std::vector<Element>& b) {
		a.insert(a.end(), b.begin(), b.end());
		return a;
	}

	// dir(string, int) with a required body: the attributes as paragraphs, then the body
	inline Directive blockDir() {
		auto part = product(attribute(0).as<std::string>(), attribute(1).as<int>(), parsedBody())
			.mapN([](const std::string& a, const int& b, const std::vector<Element>& body) {
				return elements::blockSequence(concat({ p(a), p(std::to_string(b)) }, body));
			});
		return createDirective("dir", part);
	}

	// dir(string) with a body: the attribute as text, then the body
	inline Directive spanDir() {
		auto part = product(attribute(0).as<std::string>(), parsedBody())
			.mapN([](const std::string& a, const std::vector<Element>& body) {
				return elements::spanSequence(concat({ text(a) }, body));
			});
		return createDirective("dir", part);
	}

	inline Directive templateDir() {
		return createDirective("dir", attribute(0).as<std::string>().map([](const std::string& a) { return ts(a); }));
	}

	// dir with separators foo (exactly once) and bar(name) (at most once)
	inline Directive separatedBlockDir() {
		auto foo = separator("foo", 1, 1, parsedBody()
			.map([](const std::vector<Element>& body) { return concat({ p("foo") }, body); }));
		auto bar = separator("bar", 0, 1, product(attribute(0).as<std::string>(), parsedBody())
			.mapN([](const std::string& name, const std::vector<Element>& body) { return concat({ p(name) }, body); }));
		auto part = separatedBody<std::vector<Element>>({ foo, bar })
			.map([](const Multipart<std::vector<Element>>& parts) {
				auto blocks = parts.mainBody;
				for (const auto& child : parts.children) {
					blocks = concat(std::move(blocks), child);
				}
				return elements::blockSequence(std::move(blocks));
			});
		return createDirective("dir", part);
	}

	// The configuration value the attribute names as text, <none> when it is not set.
	inline Directive configValueDir() {
		auto part = product(attribute(0).as<std::string>(), cursor())
			.mapN([](const std::string& key, const std::shared_ptr<const DocumentCursor>& cur) {
				auto value = cur->config.get(key);
				return text(value ? renderValue(*value) : std::string{ "<none>" });
			});
		return createDirective("value", part);
	}

	inline ExtensionBundle testBundle() {
		ExtensionBundle bundle;
		bundle.name = "test directives";
		bundle.blockDirectives = { blockDir() };
		bundle.spanDirectives = { spanDir(), configValueDir() };
		bundle.templateDirectives = { templateDir() };
		return bundle;
	}

	inline ExtensionBundle separatorBundle() {
		ExtensionBundle bundle;
		bundle.name = "separator directives";
		bundle.blockDirectives = { separatedBlockDir() };
		return bundle;
	}

	inline ParserSettings withConfig(nlohmann::json config) {
		ParserSettings settings{};
		settings.cursor = std::make_shared<const DocumentCursor>(DocumentCursor{ "/doc.md", Config{ std::move(config) } });
		return settings;
	}

	inline Element markup(const std::string& input, const ParserSettings& settings = {}) {
		return parseMarkup(input, { testBundle() }, settings);
	}

	inline Element templ(const std::string& input, const ParserSettings& settings = {}) {
		return parseTemplate(input, { testBundle() }, settings);
	}

	// The single paragraph of a one-block document, or the root itself for anything else.
	inline std::vector<Element> spansOf(const Element& doc) {
		if (doc.children.size() == 1 and doc.children.front().flavor == Element::type_e::Paragraph) {
			return doc.children.front().children;
		}
		return doc.children;
	}

	inline std::string invalidMessage(const Element& el) {
		const auto* info = std::get_if<InvalidInfo>(&el.crtrstc);
		return info ? info->message : std::string{};
	}

	inline std::string invalidSource(const Element& el) {
		const auto* info = std::get_if<InvalidInfo>(&el.crtrstc);
		return info ? info->source : std::string{};
	}
}

#endif
