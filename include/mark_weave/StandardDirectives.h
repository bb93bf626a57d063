#ifndef MARK_WEAVE_STANDARD_DIRECTIVES_H
#define MARK_WEAVE_STANDARD_DIRECTIVES_H

#include <nlohmann/json.hpp>
#include "mark_weave/ParserBundle.h"
#include "markweave_export.h"

namespace mark_weave {

	// true, or one of the strings "true", "yes", "on" and "enabled".
	MARKWEAVE_EXPORT bool isTruthy(const nlohmann::json& value);

	namespace standard_directives {
		/**
		@:if(config.key) ... @:elseIf(other.key) ... @:else ... @:@
		Picks the first branch whose configuration value is truthy, the else branch
		otherwise, or nothing.
		*/
		MARKWEAVE_EXPORT Directive templateIf();
		MARKWEAVE_EXPORT Directive blockIf();
		MARKWEAVE_EXPORT Directive spanIf();

		// @:fragment(name) with a block body
		MARKWEAVE_EXPORT Directive fragment();
		MARKWEAVE_EXPORT Directive pageBreak();
		// @:style(name1, name2) with a body the styles apply to
		MARKWEAVE_EXPORT Directive spanStyle();
		MARKWEAVE_EXPORT Directive blockStyle();
	}

	// All of the above, registered for their families.
	MARKWEAVE_EXPORT ExtensionBundle standardDirectives();
}

#endif
