#ifndef MARK_WEAVE_MARK_WEAVE_H
#define MARK_WEAVE_MARK_WEAVE_H

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "mark_weave/BasicMarkup.h"
#include "mark_weave/Config.h"
#include "mark_weave/Elements.h"
#include "mark_weave/ParserBundle.h"
#include "mark_weave/RootParser.h"
#include "mark_weave/StandardDirectives.h"
#include "mark_weave/TemplateParser.h"
#include "markweave_export.h"

namespace mark_weave {

	/**
	Parses a document of the basic markup with the given extensions. Never throws: the
	result is always a RootElement, with problems reported as invalid elements inside it.
	*/
	MARKWEAVE_EXPORT Element parseMarkup(const std::string& input,
		const std::vector<ExtensionBundle>& bundles = { standardDirectives() }, const ParserSettings& settings = {});

	// The template counterpart of parseMarkup, always returning a TemplateRoot.
	MARKWEAVE_EXPORT Element parseTemplate(const std::string& input,
		const std::vector<ExtensionBundle>& bundles = { standardDirectives() }, const ParserSettings& settings = {});

	// Indented one-line-per-element rendering used by mwdump and in test failure output.
	MARKWEAVE_EXPORT std::string toDebugString(const Element& root);
	MARKWEAVE_EXPORT nlohmann::json toJson(const Element& root);
}

#endif
