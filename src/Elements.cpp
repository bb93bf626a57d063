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

#include "mark_weave/Elements.h"
#include "mark_weave/Directives.h"

namespace {
	using mark_weave::Element;

	bool sameCharacteristics(const Element& lhs, const Element& rhs) {
		if (lhs.crtrstc.index() != rhs.crtrstc.index()) {
			return false;
		}
		if (auto* invalid = std::get_if<mark_weave::InvalidInfo>(&lhs.crtrstc)) {
			const auto& other = std::get<mark_weave::InvalidInfo>(rhs.crtrstc);
			return invalid->message == other.message and invalid->source == other.source;
		}
		if (auto* style = std::get_if<mark_weave::StyleInfo>(&lhs.crtrstc)) {
			return style->styles == std::get<mark_weave::StyleInfo>(rhs.crtrstc).styles;
		}
		if (auto* fragment = std::get_if<mark_weave::FragmentInfo>(&lhs.crtrstc)) {
			return fragment->name == std::get<mark_weave::FragmentInfo>(rhs.crtrstc).name;
		}
		if (auto* sep = std::get_if<mark_weave::SeparatorInfo>(&lhs.crtrstc)) {
			const auto& other = std::get<mark_weave::SeparatorInfo>(rhs.crtrstc);
			if (not sep->directive or not other.directive) {
				return sep->directive == other.directive;
			}
			return sep->directive->name == other.directive->name and sep->directive->source == other.directive->source;
		}
		return true;
	}

	Element make(Element::type_e flavor, std::string content = {}, std::vector<Element> children = {}) {
		return Element{ flavor, std::move(content), std::move(children), std::monostate{} };
	}

	Element withStyles(Element el, std::vector<std::string> styles) {
		if (not styles.empty()) {
			el.crtrstc = mark_weave::StyleInfo{ std::move(styles) };
		}
		return el;
	}
}

bool mark_weave::Element::operator==(const Element& rhs) const {
	return flavor == rhs.flavor and
		content == rhs.content and
		children == rhs.children and
		sameCharacteristics(*this, rhs);
}

auto mark_weave::Element::const_walker::operator++() -> const_walker& {
	if (current_ == nullptr) {
		return *this;
	}
	if (not retracting_ and not current_->children.empty()) {
		parents_.push_back({ current_, 0 });
		current_ = &current_->children.front();
		return *this;
	}
	if (parents_.empty()) {
		current_ = nullptr;
		retracting_ = false;
		return *this;
	}
	auto& top = parents_.back();
	if (++top.childIndex < top.node->children.size()) {
		current_ = &top.node->children[top.childIndex];
		retracting_ = false;
	}
	else {
		// all children done; point to the parent once more
		current_ = top.node;
		parents_.pop_back();
		retracting_ = true;
	}
	return *this;
}

auto mark_weave::Element::const_walker::operator++(int) -> const_walker {
	const_walker itCopy = *this;
	++(*this);
	return itCopy;
}

namespace mark_weave::elements {
	Element text(std::string content) {
		return make(Element::type_e::Text, std::move(content));
	}

	Element templateString(std::string content) {
		return make(Element::type_e::TemplateString, std::move(content));
	}

	Element spanSequence(std::vector<Element> spans, std::vector<std::string> styles) {
		return withStyles(make(Element::type_e::SpanSequence, {}, std::move(spans)), std::move(styles));
	}

	Element paragraph(std::vector<Element> spans, std::vector<std::string> styles) {
		return withStyles(make(Element::type_e::Paragraph, {}, std::move(spans)), std::move(styles));
	}

	Element blockSequence(std::vector<Element> blocks, std::vector<std::string> styles) {
		return withStyles(make(Element::type_e::BlockSequence, {}, std::move(blocks)), std::move(styles));
	}

	Element invalidSpan(std::string message, std::string source) {
		auto el = make(Element::type_e::InvalidSpan);
		el.crtrstc = InvalidInfo{ std::move(message), std::move(source) };
		return el;
	}

	Element invalidBlock(std::string message, std::string source) {
		auto el = make(Element::type_e::InvalidBlock);
		el.crtrstc = InvalidInfo{ std::move(message), std::move(source) };
		return el;
	}

	Element templateElement(Element wrapped) {
		std::vector<Element> children;
		children.push_back(std::move(wrapped));
		return make(Element::type_e::TemplateElement, {}, std::move(children));
	}

	Element templateSpanSequence(std::vector<Element> spans) {
		return make(Element::type_e::TemplateSpanSequence, {}, std::move(spans));
	}

	Element templateRoot(std::vector<Element> spans) {
		return make(Element::type_e::TemplateRoot, {}, std::move(spans));
	}

	Element rootElement(std::vector<Element> blocks) {
		return make(Element::type_e::RootElement, {}, std::move(blocks));
	}

	Element separatorMarker(std::shared_ptr<const ParsedDirective> directive) {
		auto el = make(Element::type_e::SeparatorMarker);
		el.crtrstc = SeparatorInfo{ std::move(directive) };
		return el;
	}

	Element pageBreak() {
		return make(Element::type_e::PageBreak);
	}

	Element fragment(std::string name, Element content) {
		std::vector<Element> children;
		children.push_back(std::move(content));
		auto el = make(Element::type_e::Fragment, {}, std::move(children));
		el.crtrstc = FragmentInfo{ std::move(name) };
		return el;
	}

	const char* typeName(Element::type_e flavor) noexcept {
		switch (flavor) {
		case Element::type_e::Text: return "Text";
		case Element::type_e::TemplateString: return "TemplateString";
		case Element::type_e::SpanSequence: return "SpanSequence";
		case Element::type_e::Paragraph: return "Paragraph";
		case Element::type_e::BlockSequence: return "BlockSequence";
		case Element::type_e::InvalidSpan: return "InvalidSpan";
		case Element::type_e::InvalidBlock: return "InvalidBlock";
		case Element::type_e::TemplateElement: return "TemplateElement";
		case Element::type_e::TemplateSpanSequence: return "TemplateSpanSequence";
		case Element::type_e::TemplateRoot: return "TemplateRoot";
		case Element::type_e::RootElement: return "RootElement";
		case Element::type_e::SeparatorMarker: return "SeparatorMarker";
		case Element::type_e::PageBreak: return "PageBreak";
		case Element::type_e::Fragment: return "Fragment";
		}
		return "Unknown";
	}
}
