#ifndef MARK_WEAVE_BASIC_MARKUP_H
#define MARK_WEAVE_BASIC_MARKUP_H

#include <string>
#include "mark_weave/ParserBundle.h"
#include "markweave_export.h"

namespace mark_weave {

	// A backslash followed by any character, yielding that character.
	MARKWEAVE_EXPORT Parser<std::string> backslashEscape();

	// Consecutive non-blank lines, parsed as spans. Unconditional, so it catches every block nothing else claims.
	MARKWEAVE_EXPORT ParserBuilder paragraphParser();
	MARKWEAVE_EXPORT ParserBuilder escapedTextParser();

	/**
	The smallest host markup the directive engine needs: paragraphs separated by blank
	lines and backslash escapes, the latter at Low precedence so that extensions
	claiming the backslash win.
	*/
	MARKWEAVE_EXPORT MarkupFormat basicMarkup();
}

#endif
