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
#include <exception>
#include <plog/Log.h>

auto mark_weave::parseMarkup(const std::string& input, const std::vector<ExtensionBundle>& bundles, const ParserSettings& settings) -> Element {
	try {
		RootParser parser{ basicMarkup(), bundles, settings };
		return parser.parseDocument(input);
	}
	catch (const std::exception& e) {
		PLOG_ERROR << "markup parsing aborted: " << e.what();
		return elements::rootElement({ elements::invalidBlock(e.what(), input) });
	}
}

auto mark_weave::parseTemplate(const std::string& input, const std::vector<ExtensionBundle>& bundles, const ParserSettings& settings) -> Element {
	try {
		TemplateParser parser{ bundles, settings };
		return parser.parseTemplate(input);
	}
	catch (const std::exception& e) {
		PLOG_ERROR << "template parsing aborted: " << e.what();
		return elements::templateRoot({ elements::templateElement(elements::invalidSpan(e.what(), input)) });
	}
}
