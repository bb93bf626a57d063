#ifndef MARK_WEAVE_CHARACTERS_H
#define MARK_WEAVE_CHARACTERS_H

#include <initializer_list>
#include <string>
#include <string_view>
#include "mark_weave/CharClassifier.h"
#include "mark_weave/Parser.h"

namespace mark_weave {

	/**
	Consumes the longest run of characters accepted by a classifier.
	Without a minimum the parser always succeeds, possibly with an empty string.
	*/
	class Characters : public Parser<std::string> {
	public:
		MARKWEAVE_EXPORT explicit Characters(CharClassifier classifier, UInt min = 0, UInt max = UNBOUNDED);

		Characters min(UInt n) const { return Characters{ classifier_, n, max_ }; }
		Characters max(UInt n) const { return Characters{ classifier_, min_, n }; }
		Characters take(UInt n) const { return Characters{ classifier_, n, n }; }
		Characters nonEmpty() const { return min(1); }

		const CharClassifier& classifier() const noexcept { return classifier_; }

	private:
		CharClassifier classifier_;
		UInt min_;
		UInt max_;
	};

	struct CharRange {
		char first;
		char last;
	};

	MARKWEAVE_EXPORT Characters anyOf(std::string_view chars);
	MARKWEAVE_EXPORT Characters anyBut(std::string_view chars);
	MARKWEAVE_EXPORT Characters anyIn(std::initializer_list<CharRange> ranges);
	MARKWEAVE_EXPORT Characters anyWhile(CharClassifier::predicate_type p);
	MARKWEAVE_EXPORT Characters anyWhile(CharClassifier classifier);
	MARKWEAVE_EXPORT Characters anyChars();

	// Exactly one character out of the set.
	MARKWEAVE_EXPORT Parser<char> oneOf(std::string_view chars);
	MARKWEAVE_EXPORT Parser<char> oneIf(CharClassifier classifier);
	MARKWEAVE_EXPORT Parser<char> oneChar();

	// Whitespace without newlines, possibly empty.
	MARKWEAVE_EXPORT const Characters& ws();
	MARKWEAVE_EXPORT const Characters& wsOrNl();
	// Optional whitespace followed by a newline or the end of input.
	MARKWEAVE_EXPORT Parser<Unit> wsEol();
	MARKWEAVE_EXPORT Parser<Unit> blankLine();
	// The rest of the current line including its newline, without the newline in the result.
	MARKWEAVE_EXPORT Parser<std::string> restOfLine();
}

#endif
