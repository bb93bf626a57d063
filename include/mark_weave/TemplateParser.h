#ifndef MARK_WEAVE_TEMPLATE_PARSER_H
#define MARK_WEAVE_TEMPLATE_PARSER_H

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "mark_weave/Config.h"
#include "mark_weave/ParserBundle.h"
#include "mark_weave/PrefixedParser.h"
#include "mark_weave/RecursiveParsers.h"
#include "markweave_export.h"

namespace mark_weave {

	/**
	Parses templates: literal template text with template directives and context
	references in between. Templates have no block structure.

	Parsers handed out by this object refer back to it and must not outlive it.
	*/
	class TemplateParser : public RecursiveParsers {
	public:
		MARKWEAVE_EXPORT explicit TemplateParser(const std::vector<ExtensionBundle>& bundles, ParserSettings settings = {});

		TemplateParser(const TemplateParser&) = delete;
		TemplateParser& operator=(const TemplateParser&) = delete;

		// Never fails, like RootParser::parseDocument.
		MARKWEAVE_EXPORT Element parseTemplate(const std::string& input) const;

		MARKWEAVE_EXPORT Parser<std::vector<Element>> recursiveSpans(const DelimitedText& text) const override;
		MARKWEAVE_EXPORT Parser<std::vector<Element>> recursiveBlocks() const override;
		Parser<std::string> escapedChar() const override { return escapedChar_; }

		NestLevel maxNestLevel() const noexcept override { return settings_.maxNestLevel; }
		const std::string& defaultFence() const noexcept override { return settings_.defaultFence; }
		const std::shared_ptr<const DocumentCursor>& cursor() const noexcept override { return cursor_; }

		using RecursiveParsers::recursiveSpans;

	private:
		ParserSettings settings_;
		std::shared_ptr<const DocumentCursor> cursor_;
		Parser<std::string> escapedChar_;
		std::shared_ptr<const DirectiveRegistry> directives_;
		std::optional<PrefixedDispatch<Element>> spanDispatch_;
	};
}

#endif
