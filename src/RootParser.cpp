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

#include "mark_weave/RootParser.h"
#include <fmt/format.h>
#include <plog/Log.h>
#include "mark_weave/BasicMarkup.h"
#include "mark_weave/Characters.h"
#include "mark_weave/DirectiveParsers.h"
#include "mark_weave/InlineParsers.h"

namespace {
	using mark_weave::Element;
	using mark_weave::ParserBuilder;
	using mark_weave::ParserDefinition;

	auto defaultCursor() -> std::shared_ptr<const mark_weave::DocumentCursor> {
		return std::make_shared<const mark_weave::DocumentCursor>(mark_weave::DocumentCursor{ "/", mark_weave::Config{} });
	}

	bool holdsBlocks(const Element& el) noexcept {
		return el.flavor == Element::type_e::RootElement or
			el.flavor == Element::type_e::BlockSequence or
			el.flavor == Element::type_e::Fragment;
	}

	bool holdsTemplateSpans(const Element& el) noexcept {
		return el.flavor == Element::type_e::TemplateRoot or
			el.flavor == Element::type_e::TemplateSpanSequence;
	}

	void resolveSeparators(Element& parent) {
		for (auto& child : parent.children) {
			if (child.flavor != Element::type_e::SeparatorMarker) {
				resolveSeparators(child);
				continue;
			}
			const auto& info = std::get<mark_weave::SeparatorInfo>(child.crtrstc);
			auto message = fmt::format("Orphaned separator directive with name '{}'", info.directive->name);
			auto source = info.directive->source;
			PLOG_DEBUG << message;
			if (holdsBlocks(parent)) {
				child = mark_weave::elements::invalidBlock(std::move(message), std::move(source));
			}
			else if (holdsTemplateSpans(parent)) {
				child = mark_weave::elements::templateElement(mark_weave::elements::invalidSpan(std::move(message), std::move(source)));
			}
			else {
				child = mark_weave::elements::invalidSpan(std::move(message), std::move(source));
			}
		}
	}
}

mark_weave::RootParser::RootParser(const MarkupFormat& format, const std::vector<ExtensionBundle>& bundles, ParserSettings settings)
	: settings_{ std::move(settings) },
	cursor_{ settings_.cursor ? settings_.cursor : defaultCursor() },
	escapedChar_{ format.escapedChar ? format.escapedChar() : backslashEscape() } {

	std::vector<Directive> blockDirectives;
	std::vector<Directive> spanDirectives;
	for (const auto& bundle : bundles) {
		blockDirectives.insert(blockDirectives.end(), bundle.blockDirectives.begin(), bundle.blockDirectives.end());
		spanDirectives.insert(spanDirectives.end(), bundle.spanDirectives.begin(), bundle.spanDirectives.end());
	}
	blockDirectives_ = std::make_shared<const DirectiveRegistry>(blockDirectives);
	spanDirectives_ = std::make_shared<const DirectiveRegistry>(spanDirectives);

	std::vector<ParserDefinition<Element>> hostBlocks;
	std::vector<ParserDefinition<Element>> hostSpans;
	std::vector<ParserDefinition<Element>> extBlocks;
	std::vector<ParserDefinition<Element>> extSpans;
	auto build = [this](const std::vector<ParserBuilder>& builders, std::vector<ParserDefinition<Element>>& into, bool isExtension) {
		for (const auto& builder : builders) {
			into.push_back({ builder.build(*this), builder.precedence, isExtension });
		}
	};
	build(format.blockParsers, hostBlocks, false);
	build(format.spanParsers, hostSpans, false);
	for (const auto& bundle : bundles) {
		build(bundle.blockParsers, extBlocks, true);
		build(bundle.spanParsers, extSpans, true);
	}
	extBlocks.push_back({ directiveParser<BlockTraits>(*this, blockDirectives_), Precedence::High, true });
	extSpans.push_back({ directiveParser<SpanTraits>(*this, spanDirectives_), Precedence::High, true });
	extSpans.push_back({ contextReference(cursor_), Precedence::High, true });

	auto orderedBlocks = orderByPrecedence(hostBlocks, extBlocks);
	std::vector<Parser<Element>> unconditional;
	for (const auto& p : orderedBlocks) {
		if (p.isUnconditional()) {
			unconditional.push_back(p.underlying());
		}
	}
	if (not unconditional.empty()) {
		fallbackBlocks_ = firstOf(unconditional);
	}
	blockDispatch_.emplace(orderedBlocks);
	spanDispatch_.emplace(orderByPrecedence(hostSpans, extSpans));
	blocks_ = nestingGuard(blockList(), settings_.maxNestLevel);

	PLOG_DEBUG << fmt::format("root parser for '{}' with {} block and {} span parsers, block starts '{}', span starts '{}'",
		format.name, orderedBlocks.size(), hostSpans.size() + extSpans.size(), blockDispatch_->startChars(), spanDispatch_->startChars());
}

auto mark_weave::RootParser::recursiveSpans(const DelimitedText& text) const -> Parser<std::vector<Element>> {
	const RootParser* self = this;
	auto spans = lazily<std::vector<Element>>([self, text] { return inline_parsers::spans(text, *self->spanDispatch_); });
	return nestingGuard(spans, settings_.maxNestLevel);
}

auto mark_weave::RootParser::recursiveBlocks() const -> Parser<std::vector<Element>> {
	const RootParser* self = this;
	return lazily<std::vector<Element>>([self] { return *self->blocks_; });
}

auto mark_weave::RootParser::blockList() const -> Parser<std::vector<Element>> {
	const RootParser* self = this;
	return Parser<std::vector<Element>>([self](const SourcePosition& in) -> Parsed<std::vector<Element>> {
		auto advances = [](const auto& res, const SourcePosition& from) {
			return res and res.next().offset() > from.offset();
		};

		std::vector<Element> blocks;
		SourcePosition curr = in;
		while (true) {
			while (not curr.atEnd()) {
				auto blank = blankLine().parse(curr);
				if (not advances(blank, curr)) {
					break;
				}
				curr = blank.next();
			}
			if (curr.atEnd()) {
				break;
			}

			auto res = self->blockDispatch_->parse(curr);
			// unclaimed characters already went to the fallback inside the dispatch
			if (not advances(res, curr) and self->fallbackBlocks_ and self->blockDispatch_->parserFor(curr.peek())) {
				res = self->fallbackBlocks_->parse(curr);
			}
			if (advances(res, curr)) {
				blocks.push_back(std::move(res.result()));
				curr = res.next();
				continue;
			}

			auto line = restOfLine().parse(curr);
			blocks.push_back(elements::paragraph({ elements::text(line.result()) }));
			curr = line.next();
		}
		return Success<std::vector<Element>>{ std::move(blocks), curr };
	});
}

auto mark_weave::RootParser::interruptsParagraph(const SourcePosition& in) const -> bool {
	if (in.atEnd()) {
		return false;
	}
	auto claimed = blockDispatch_->parserFor(in.peek());
	if (not claimed) {
		return false;
	}
	auto res = claimed->parse(in);
	return res and res.next().offset() > in.offset();
}

auto mark_weave::RootParser::parseDocument(const std::string& input) const -> Element {
	auto res = blocks_->parse(SourcePosition{ input });
	if (!res) {
		PLOG_ERROR << "document could not be parsed: " << res.failure().describe();
		return elements::rootElement({ elements::invalidBlock(res.failure().message, input) });
	}
	return resolveOrphanedSeparators(elements::rootElement(std::move(res.result())));
}

auto mark_weave::resolveOrphanedSeparators(Element root) -> Element {
	resolveSeparators(root);
	return root;
}
