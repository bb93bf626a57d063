#ifndef MARK_WEAVE_PARSER_BUNDLE_H
#define MARK_WEAVE_PARSER_BUNDLE_H

#include <functional>
#include <string>
#include <vector>
#include "mark_weave/Directives.h"
#include "mark_weave/PrefixedParser.h"
#include "mark_weave/RecursiveParsers.h"

namespace mark_weave {

	// Creates a block or span parser once the recursive parsers it may need exist.
	struct ParserBuilder {
		std::function<PrefixedParser<Element>(const RecursiveParsers&)> build;
		Precedence precedence = Precedence::High;
	};

	// The parsers of a host markup language.
	struct MarkupFormat {
		std::string name;
		std::vector<ParserBuilder> blockParsers;
		std::vector<ParserBuilder> spanParsers;
		// escape sequence used inside quoted attribute values and by the escape span parser
		std::function<Parser<std::string>()> escapedChar;
	};

	// Parsers and directives added on top of a host format.
	struct ExtensionBundle {
		std::string name;
		std::vector<ParserBuilder> blockParsers;
		std::vector<ParserBuilder> spanParsers;
		std::vector<Directive> blockDirectives;
		std::vector<Directive> spanDirectives;
		std::vector<Directive> templateDirectives;
	};
}

#endif
