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

#include "mark_weave/Parser.h"
#include <algorithm>
#include <fmt/format.h>

namespace {
	auto describeFound(std::string_view found) -> std::string {
		return found.empty() ? std::string{ "end of input" } : fmt::format("'{}'", found);
	}
}

auto mark_weave::literal(std::string expected) -> Parser<std::string> {
	return Parser<std::string>([expected](const SourcePosition& in) -> Parsed<std::string> {
		auto rest = in.rest();
		if (rest.substr(0, expected.size()) == expected) {
			return Success<std::string>{ expected, in.consume(expected.size()) };
		}
		auto found = rest.substr(0, expected.size());
		auto mismatch = std::mismatch(found.begin(), found.end(), expected.begin()).first;
		Offset reached = in.offset() + static_cast<Offset>(mismatch - found.begin());
		return Failure{ fmt::format("'{}' expected but {} found", expected, describeFound(found)), in, reached };
	});
}

auto mark_weave::eof() -> Parser<Unit> {
	return Parser<Unit>([](const SourcePosition& in) -> Parsed<Unit> {
		if (in.atEnd()) {
			return Success<Unit>{ Unit{}, in };
		}
		return Failure{ fmt::format("expected end of input but found '{}'", in.peek()), in };
	});
}
