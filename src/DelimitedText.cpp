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

#include "mark_weave/DelimitedText.h"
#include <fmt/format.h>

namespace {
	using namespace mark_weave;

	auto stopCharsOf(const DelimitedText::Options& options) -> CharClassifier {
		return options.delimiterStart.add(options.nestedStart).add(options.failOn);
	}

	auto scanChunk(const DelimitedText::Options& options, const CharClassifier& stopChars, const SourcePosition& in) -> Parsed<DelimitedChunk> {
		auto rest = in.rest();
		Offset i = 0;
		auto emptyFailure = [](const SourcePosition& at) {
			return Failure{ "expected at least 1 character, got only 0", at };
		};

		while (i < rest.size()) {
			char c = rest[i];
			if (not stopChars(c)) {
				++i;
				continue;
			}
			auto at = in.consume(i);
			if (options.delimiterStart(c)) {
				auto length = options.matcher ? options.matcher(at) : std::optional<Offset>{ 1 };
				if (length) {
					if (options.nonEmpty and i == 0) {
						return emptyFailure(at);
					}
					auto next = options.keepDelimiter ? at : at.consume(*length);
					return Success<DelimitedChunk>{ { std::string{ rest.substr(0, i) }, StopReason::Delimiter, c }, next };
				}
			}
			if (options.nestedStart(c)) {
				return Success<DelimitedChunk>{ { std::string{ rest.substr(0, i) }, StopReason::NestedStart, c }, at };
			}
			if (options.failOn(c)) {
				return Failure{ fmt::format("unexpected character '{}'", c), at };
			}
			++i;
		}

		auto end = in.consume(i);
		if (not options.undelimited and not options.acceptEof) {
			return Failure{ "unexpected end of input", end };
		}
		if (options.nonEmpty and i == 0) {
			return emptyFailure(end);
		}
		return Success<DelimitedChunk>{ { std::string{ rest }, StopReason::EndOfInput, '\0' }, end };
	}

	// As a plain parser nested start characters are kept as part of the text.
	auto buildDelimited(const DelimitedText::Options& options) -> Parser<std::string>::function_type {
		auto shared = std::make_shared<const DelimitedText::Options>(options);
		auto stopChars = stopCharsOf(options);
		return [shared, stopChars](const SourcePosition& in) -> Parsed<std::string> {
			std::string text;
			SourcePosition curr = in;
			while (true) {
				auto chunk = scanChunk(*shared, stopChars, curr);
				if (!chunk) {
					return Failure{ chunk.failure().message, in, chunk.failure().maxOffset };
				}
				text += chunk.result().text;
				if (chunk.result().stop != StopReason::NestedStart) {
					return Success<std::string>{ std::move(text), chunk.next() };
				}
				text.push_back(chunk.result().startChar);
				curr = chunk.next().consume(1);
			}
		};
	}
}

mark_weave::DelimitedText::DelimitedText(Options options)
	: Parser<std::string>(buildDelimited(options)), options_{ std::move(options) }, stopChars_{ stopCharsOf(options_) } {}

auto mark_weave::DelimitedText::undelimited() -> DelimitedText {
	Options options{};
	options.undelimited = true;
	return DelimitedText{ std::move(options) };
}

auto mark_weave::DelimitedText::delimitedByChars(std::string_view chars) -> DelimitedText {
	Options options{};
	options.delimiterStart = CharClassifier::of(chars);
	return DelimitedText{ std::move(options) };
}

auto mark_weave::DelimitedText::delimitedBy(std::string delimiter) -> DelimitedText {
	if (delimiter.empty()) {
		return undelimited();
	}
	if (delimiter.size() == 1) {
		return delimitedByChars(delimiter);
	}
	Options options{};
	options.delimiterStart = CharClassifier::of(delimiter.substr(0, 1));
	options.matcher = [delimiter](const SourcePosition& at) -> std::optional<Offset> {
		if (at.rest().substr(0, delimiter.size()) == delimiter) {
			return delimiter.size();
		}
		return std::nullopt;
	};
	return DelimitedText{ std::move(options) };
}

auto mark_weave::DelimitedText::acceptEof() const -> DelimitedText {
	Options options = options_;
	options.acceptEof = true;
	return DelimitedText{ std::move(options) };
}

auto mark_weave::DelimitedText::keepDelimiter() const -> DelimitedText {
	Options options = options_;
	options.keepDelimiter = true;
	return DelimitedText{ std::move(options) };
}

auto mark_weave::DelimitedText::nonEmpty() const -> DelimitedText {
	Options options = options_;
	options.nonEmpty = true;
	return DelimitedText{ std::move(options) };
}

auto mark_weave::DelimitedText::failOn(std::string_view chars) const -> DelimitedText {
	Options options = options_;
	options.failOn = options.failOn.add(CharClassifier::of(chars));
	return DelimitedText{ std::move(options) };
}

auto mark_weave::DelimitedText::withNestedStart(CharClassifier chars) const -> DelimitedText {
	Options options = options_;
	options.nestedStart = std::move(chars);
	return DelimitedText{ std::move(options) };
}

auto mark_weave::DelimitedText::scanNext(const SourcePosition& in) const -> Parsed<DelimitedChunk> {
	return scanChunk(options_, stopChars_, in);
}

mark_weave::AnyUntil::AnyUntil(Parser<Unit> delimiter, CharClassifier stopChars, UInt min)
	: Parser<UntilResult>([delimiter, stopChars, min](const SourcePosition& in) -> Parsed<UntilResult> {
		auto rest = in.rest();
		for (Offset i = 0;; ++i) {
			auto at = in.consume(i);
			if (i >= min) {
				auto res = delimiter.parse(at);
				if (res) {
					return Success<UntilResult>{ { std::string{ rest.substr(0, i) }, false }, res.next() };
				}
			}
			if (at.atEnd()) {
				return Failure{ "unexpected end of input", in, at.offset() };
			}
			if (stopChars(at.peek())) {
				if (i < min) {
					return Failure{ fmt::format("expected at least {} characters, got only {}", min, i), in, at.offset() };
				}
				return Success<UntilResult>{ { std::string{ rest.substr(0, i) }, true }, at };
			}
		}
	}), delimiter_{ std::move(delimiter) }, stopChars_{ std::move(stopChars) }, min_{ min } {}
