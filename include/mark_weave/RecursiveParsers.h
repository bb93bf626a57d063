#ifndef MARK_WEAVE_RECURSIVE_PARSERS_H
#define MARK_WEAVE_RECURSIVE_PARSERS_H

#include <memory>
#include <string>
#include <vector>
#include "mark_weave/Config.h"
#include "mark_weave/DelimitedText.h"
#include "mark_weave/Elements.h"
#include "mark_weave/Parser.h"
#include "markweave_export.h"

namespace mark_weave {

	/**
	The fully assembled parsers of one markup format, handed to the individual block and
	span parsers so they can parse nested content with everything that is registered.
	Implementations must outlive every parser built from them.
	*/
	class RecursiveParsers {
	public:
		virtual ~RecursiveParsers() = default;

		// Spans up to the delimiter of text with all registered span parsers for nested spans.
		virtual Parser<std::vector<Element>> recursiveSpans(const DelimitedText& text) const = 0;
		// Blocks up to the end of input.
		virtual Parser<std::vector<Element>> recursiveBlocks() const = 0;
		// The host's escape sequence, yielding the escaped text.
		virtual Parser<std::string> escapedChar() const = 0;

		virtual NestLevel maxNestLevel() const noexcept = 0;
		virtual const std::string& defaultFence() const noexcept = 0;
		virtual const std::shared_ptr<const DocumentCursor>& cursor() const noexcept = 0;

		// Whether a block parser claiming the first character of in succeeds there; a paragraph ends in front of such a line.
		virtual bool interruptsParagraph(const SourcePosition&) const { return false; }

		Parser<std::vector<Element>> recursiveSpans() const { return recursiveSpans(DelimitedText::undelimited()); }

		// Parses a detached piece of source, typically a directive body, as if found at level.
		MARKWEAVE_EXPORT std::vector<Element> parseSpans(const std::string& source, NestLevel level) const;
		MARKWEAVE_EXPORT std::vector<Element> parseBlocks(const std::string& source, NestLevel level) const;
	};

	/**
	Runs p one nesting level deeper, failing without running it once the level has reached max.
	The returned position is back at the level of the input.
	*/
	MARKWEAVE_EXPORT Parser<std::vector<Element>> nestingGuard(Parser<std::vector<Element>> p, NestLevel max);
}

#endif
