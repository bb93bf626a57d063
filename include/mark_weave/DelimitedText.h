#ifndef MARK_WEAVE_DELIMITED_TEXT_H
#define MARK_WEAVE_DELIMITED_TEXT_H

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include "mark_weave/CharClassifier.h"
#include "mark_weave/Parser.h"

namespace mark_weave {

	enum class StopReason : UTinyInt {
		Delimiter,
		NestedStart,
		EndOfInput
	};

	// A chunk of plain text and what ended it. For NestedStart the next position is at the start character.
	struct DelimitedChunk {
		std::string text;
		StopReason stop;
		char startChar;
	};

	/**
	Scans text up to an end delimiter while watching for the start characters of nested spans.

	The end delimiter is described by the characters it may start with plus a matcher that
	confirms a full match at a position, returning its length. The end delimiter takes
	priority over a nested span starting with the same character.
	*/
	class DelimitedText : public Parser<std::string> {
	public:
		using matcher_type = std::function<std::optional<Offset>(const SourcePosition&)>;

		struct Options {
			CharClassifier delimiterStart;
			matcher_type matcher;
			CharClassifier nestedStart;
			CharClassifier failOn;
			bool undelimited = false;
			bool acceptEof = false;
			bool keepDelimiter = false;
			bool nonEmpty = false;
		};

		MARKWEAVE_EXPORT explicit DelimitedText(Options options);

		// Text up to the end of input; never fails unless nonEmpty is requested.
		MARKWEAVE_EXPORT static DelimitedText undelimited();
		// Any one of the characters ends the text.
		MARKWEAVE_EXPORT static DelimitedText delimitedByChars(std::string_view chars);
		MARKWEAVE_EXPORT static DelimitedText delimitedBy(std::string delimiter);

		MARKWEAVE_EXPORT DelimitedText acceptEof() const;
		MARKWEAVE_EXPORT DelimitedText keepDelimiter() const;
		MARKWEAVE_EXPORT DelimitedText nonEmpty() const;
		MARKWEAVE_EXPORT DelimitedText failOn(std::string_view chars) const;
		MARKWEAVE_EXPORT DelimitedText withNestedStart(CharClassifier chars) const;

		// Scans to the next stop, reporting whether it was the delimiter, a nested start character or the end of input.
		MARKWEAVE_EXPORT Parsed<DelimitedChunk> scanNext(const SourcePosition& in) const;

		const Options& options() const noexcept { return options_; }

	private:
		Options options_;
		CharClassifier stopChars_;
	};

	struct UntilResult {
		std::string text;
		bool onStopChar;
	};

	/**
	Consumes characters until the delimiter parser succeeds, excluding what it matched from
	the text, or until one of the stop characters is reached. The end of input is a failure.
	*/
	class AnyUntil : public Parser<UntilResult> {
	public:
		MARKWEAVE_EXPORT explicit AnyUntil(Parser<Unit> delimiter, CharClassifier stopChars = {}, UInt min = 0);

		AnyUntil min(UInt n) const { return AnyUntil{ delimiter_, stopChars_, n }; }
		AnyUntil stopChars(std::string_view chars) const { return AnyUntil{ delimiter_, CharClassifier::of(chars), min_ }; }

	private:
		Parser<Unit> delimiter_;
		CharClassifier stopChars_;
		UInt min_;
	};

	template<typename T>
	AnyUntil anyUntil(Parser<T> delimiter) {
		return AnyUntil{ delimiter.discard() };
	}
}

#endif
