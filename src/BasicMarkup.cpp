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

#include "mark_weave/BasicMarkup.h"
#include "mark_weave/Characters.h"

auto mark_weave::backslashEscape() -> Parser<std::string> {
	return keepRight(literal("\\"), oneChar()).map([](char c) { return std::string(1, c); });
}

auto mark_weave::paragraphParser() -> ParserBuilder {
	return { [](const RecursiveParsers& rp) {
		const RecursiveParsers* recursive = &rp;
		return PrefixedParser<Element>::unconditional(Parser<Element>([recursive](const SourcePosition& in) -> Parsed<Element> {
			std::string text;
			SourcePosition curr = in;
			while (not curr.atEnd() and not blankLine().parse(curr)) {
				if (curr.offset() != in.offset() and recursive->interruptsParagraph(curr)) {
					break;
				}
				auto line = restOfLine().parse(curr);
				if (!line) {
					break;
				}
				if (not text.empty()) {
					text += '\n';
				}
				text += line.result();
				curr = line.next();
			}
			if (curr.offset() == in.offset()) {
				return Failure{ "expected paragraph text", in };
			}
			return Success<Element>{ elements::paragraph(recursive->parseSpans(text, in.nestLevel())), curr };
		}));
	}, Precedence::Low };
}

auto mark_weave::escapedTextParser() -> ParserBuilder {
	return { [](const RecursiveParsers& rp) {
		return prefixed("\\", rp.escapedChar().map([](const std::string& escaped) { return elements::text(escaped); }));
	}, Precedence::Low };
}

auto mark_weave::basicMarkup() -> MarkupFormat {
	return MarkupFormat{ "basic", { paragraphParser() }, { escapedTextParser() }, [] { return backslashEscape(); } };
}
