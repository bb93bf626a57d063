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

#include "mark_weave/TemplateParser.h"
#include <fmt/format.h>
#include <plog/Log.h>
#include "mark_weave/BasicMarkup.h"
#include "mark_weave/DirectiveParsers.h"
#include "mark_weave/InlineParsers.h"
#include "mark_weave/RootParser.h"

mark_weave::TemplateParser::TemplateParser(const std::vector<ExtensionBundle>& bundles, ParserSettings settings)
	: settings_{ std::move(settings) },
	cursor_{ settings_.cursor ? settings_.cursor : std::make_shared<const DocumentCursor>(DocumentCursor{ "/", Config{} }) },
	escapedChar_{ backslashEscape() } {

	std::vector<Directive> directives;
	for (const auto& bundle : bundles) {
		directives.insert(directives.end(), bundle.templateDirectives.begin(), bundle.templateDirectives.end());
	}
	directives_ = std::make_shared<const DirectiveRegistry>(directives);
	spanDispatch_.emplace(std::vector<PrefixedParser<Element>>{ directiveParser<TemplateTraits>(*this, directives_), contextReference(cursor_) });

	PLOG_DEBUG << fmt::format("template parser with {} directive(s)", directives.size());
}

auto mark_weave::TemplateParser::recursiveSpans(const DelimitedText& text) const -> Parser<std::vector<Element>> {
	const TemplateParser* self = this;
	auto spans = lazily<std::vector<Element>>([self, text] { return inline_parsers::spans(text, *self->spanDispatch_); });
	return nestingGuard(spans, settings_.maxNestLevel);
}

auto mark_weave::TemplateParser::recursiveBlocks() const -> Parser<std::vector<Element>> {
	return failure<std::vector<Element>>("templates do not contain blocks");
}

auto mark_weave::TemplateParser::parseTemplate(const std::string& input) const -> Element {
	auto res = recursiveSpans().parse(SourcePosition{ input });
	if (!res) {
		PLOG_ERROR << "template could not be parsed: " << res.failure().describe();
		return elements::templateRoot({ elements::templateElement(elements::invalidSpan(res.failure().message, input)) });
	}
	return resolveOrphanedSeparators(elements::templateRoot(asTemplateSpans(std::move(res.result()))));
}
