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

#include "mark_weave/Characters.h"
#include <fmt/format.h>
#include "MarkWeaveImpl.h"

namespace {
	using namespace mark_weave;

	auto buildCharacters(CharClassifier classifier, UInt min, UInt max) -> Parser<std::string>::function_type {
		return [classifier, min, max](const SourcePosition& in) -> Parsed<std::string> {
			auto rest = in.rest();
			Offset limit = max == UNBOUNDED ? rest.size() : std::min<Offset>(max, rest.size());
			Offset count = 0;
			while (count < limit and classifier(rest[count])) {
				++count;
			}
			if (count < min) {
				return Failure{ fmt::format("expected at least {} characters, got only {}", min, count), in, in.offset() + count };
			}
			return Success<std::string>{ std::string{ rest.substr(0, count) }, in.consume(count) };
		};
	}

	auto singleChar(CharClassifier classifier) -> Parser<char> {
		return Parser<char>([classifier](const SourcePosition& in) -> Parsed<char> {
			if (in.atEnd()) {
				return Failure{ "unexpected end of input", in };
			}
			if (not classifier(in.peek())) {
				return Failure{ fmt::format("unexpected character '{}'", in.peek()), in };
			}
			return Success<char>{ in.peek(), in.consume(1) };
		});
	}
}

mark_weave::Characters::Characters(CharClassifier classifier, UInt min, UInt max)
	: Parser<std::string>(buildCharacters(classifier, min, max)), classifier_{ std::move(classifier) }, min_{ min }, max_{ max } {}

auto mark_weave::anyOf(std::string_view chars) -> Characters {
	return Characters{ CharClassifier::of(chars) };
}

auto mark_weave::anyBut(std::string_view chars) -> Characters {
	return Characters{ CharClassifier::of(chars).negate() };
}

auto mark_weave::anyIn(std::initializer_list<CharRange> ranges) -> Characters {
	CharClassifier all{};
	for (const auto& r : ranges) {
		all = all.add(CharClassifier::range(r.first, r.last));
	}
	return Characters{ all };
}

auto mark_weave::anyWhile(CharClassifier::predicate_type p) -> Characters {
	return Characters{ CharClassifier::predicate(std::move(p)) };
}

auto mark_weave::anyWhile(CharClassifier classifier) -> Characters {
	return Characters{ std::move(classifier) };
}

auto mark_weave::anyChars() -> Characters {
	return Characters{ CharClassifier::everything() };
}

auto mark_weave::oneOf(std::string_view chars) -> Parser<char> {
	return singleChar(CharClassifier::of(chars));
}

auto mark_weave::oneIf(CharClassifier classifier) -> Parser<char> {
	return singleChar(std::move(classifier));
}

auto mark_weave::oneChar() -> Parser<char> {
	return singleChar(CharClassifier::everything());
}

auto mark_weave::ws() -> const Characters& {
	static const Characters parser{ char_groups::whitespace() };
	return parser;
}

auto mark_weave::wsOrNl() -> const Characters& {
	static const Characters parser{ char_groups::wsOrNl() };
	return parser;
}

auto mark_weave::wsEol() -> Parser<Unit> {
	return Parser<Unit>([](const SourcePosition& in) -> Parsed<Unit> {
		auto rest = in.rest();
		mw_impl::input_t input{ rest.data(), rest.data() + rest.size(), "wsEol" };
		if (mw_impl::tryWsEol(input)) {
			return Success<Unit>{ Unit{}, in.consume(mw_impl::consumed(input, rest)) };
		}
		return Failure{ "expected whitespace followed by end of line", in };
	});
}

auto mark_weave::blankLine() -> Parser<Unit> {
	return Parser<Unit>([](const SourcePosition& in) -> Parsed<Unit> {
		auto rest = in.rest();
		mw_impl::input_t input{ rest.data(), rest.data() + rest.size(), "blankLine" };
		if (mw_impl::tryBlankLine(input)) {
			return Success<Unit>{ Unit{}, in.consume(mw_impl::consumed(input, rest)) };
		}
		return Failure{ "expected blank line", in };
	});
}

auto mark_weave::restOfLine() -> Parser<std::string> {
	return Parser<std::string>([](const SourcePosition& in) -> Parsed<std::string> {
		if (in.atEnd()) {
			return Failure{ "unexpected end of input", in };
		}
		auto rest = in.rest();
		auto nl = rest.find('\n');
		if (nl == std::string_view::npos) {
			return Success<std::string>{ std::string{ rest }, in.consume(rest.size()) };
		}
		auto line = rest.substr(0, nl);
		if (not line.empty() and line.back() == '\r') {
			line.remove_suffix(1);
		}
		return Success<std::string>{ std::string{ line }, in.consume(nl + 1) };
	});
}
