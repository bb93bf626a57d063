/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#include "mark_weave/MarkWeave.h"
#include <sstream>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include "mark_weave/Directives.h"

namespace {
	using mark_weave::Element;
	using type_e = Element::type_e;

	const char* childLabel(type_e flavor) noexcept {
		switch (flavor) {
		case type_e::RootElement:
		case type_e::BlockSequence:
		case type_e::Fragment:
			return "Blocks";
		default:
			return "Spans";
		}
	}

	void printNode(const Element& node, mark_weave::UInt depth, std::ostream& out) {
		for (mark_weave::UInt i = 0; i < depth; ++i) {
			out << ". ";
		}
		out << mark_weave::elements::typeName(node.flavor);
		if (const auto* fragment = std::get_if<mark_weave::FragmentInfo>(&node.crtrstc)) {
			out << '(' << fragment->name << ')';
		}
		if (const auto* sep = std::get_if<mark_weave::SeparatorInfo>(&node.crtrstc); sep and sep->directive) {
			out << '(' << sep->directive->name << ')';
		}

		if (node.flavor == type_e::Text or node.flavor == type_e::TemplateString) {
			out << " - '" << node.content << '\'';
		}
		else if (const auto* invalid = std::get_if<mark_weave::InvalidInfo>(&node.crtrstc)) {
			out << fmt::format(" - '{}' source: '{}'", invalid->message, invalid->source);
		}
		else if (node.flavor != type_e::PageBreak and node.flavor != type_e::SeparatorMarker) {
			out << " - " << childLabel(node.flavor) << ": " << node.children.size();
		}
		if (const auto* style = std::get_if<mark_weave::StyleInfo>(&node.crtrstc)) {
			out << fmt::format(" styles: {}", fmt::join(style->styles, ", "));
		}
		out << '\n';
	}
}

auto mark_weave::toDebugString(const Element& root) -> std::string {
	std::ostringstream out{};
	for (auto it = root.walkBegin(); it != root.walkEnd(); ++it) {
		if (it.retracting()) {
			continue;
		}
		printNode(*it, it.depth(), out);
	}
	return out.str();
}

auto mark_weave::toJson(const Element& root) -> nlohmann::json {
	nlohmann::json node = nlohmann::json::object();
	node["type"] = elements::typeName(root.flavor);
	if (root.flavor == Element::type_e::Text or root.flavor == Element::type_e::TemplateString) {
		node["content"] = root.content;
	}
	if (const auto* invalid = std::get_if<InvalidInfo>(&root.crtrstc)) {
		node["message"] = invalid->message;
		node["source"] = invalid->source;
	}
	else if (const auto* style = std::get_if<StyleInfo>(&root.crtrstc)) {
		node["styles"] = style->styles;
	}
	else if (const auto* fragment = std::get_if<FragmentInfo>(&root.crtrstc)) {
		node["name"] = fragment->name;
	}
	else if (const auto* sep = std::get_if<SeparatorInfo>(&root.crtrstc); sep and sep->directive) {
		node["name"] = sep->directive->name;
		node["source"] = sep->directive->source;
	}
	if (not root.children.empty()) {
		auto& children = node["children"] = nlohmann::json::array();
		for (const auto& child : root.children) {
			children.push_back(toJson(child));
		}
	}
	return node;
}
