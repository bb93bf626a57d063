#ifndef MARK_WEAVE_ROOT_PARSER_H
#define MARK_WEAVE_ROOT_PARSER_H

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
	Assembles the block and span parsers of a markup format and its extensions into one
	document parser. Directive parsers for the block and span directives of all bundles
	are added as High precedence extensions, together with context references.

	Parsers handed out by this object refer back to it and must not outlive it.
	*/
	class RootParser : public RecursiveParsers {
	public:
		MARKWEAVE_EXPORT RootParser(const MarkupFormat& format, const std::vector<ExtensionBundle>& bundles, ParserSettings settings = {});

		RootParser(const RootParser&) = delete;
		RootParser& operator=(const RootParser&) = delete;

		// Never fails: anything not understood ends up as text or as an invalid element.
		MARKWEAVE_EXPORT Element parseDocument(const std::string& input) const;

		MARKWEAVE_EXPORT Parser<std::vector<Element>> recursiveSpans(const DelimitedText& text) const override;
		MARKWEAVE_EXPORT Parser<std::vector<Element>> recursiveBlocks() const override;
		Parser<std::string> escapedChar() const override { return escapedChar_; }

		NestLevel maxNestLevel() const noexcept override { return settings_.maxNestLevel; }
		const std::string& defaultFence() const noexcept override { return settings_.defaultFence; }
		const std::shared_ptr<const DocumentCursor>& cursor() const noexcept override { return cursor_; }
		MARKWEAVE_EXPORT bool interruptsParagraph(const SourcePosition& in) const override;

		using RecursiveParsers::recursiveSpans;

	private:
		Parser<std::vector<Element>> blockList() const;

		ParserSettings settings_;
		std::shared_ptr<const DocumentCursor> cursor_;
		Parser<std::string> escapedChar_;
		std::shared_ptr<const DirectiveRegistry> blockDirectives_;
		std::shared_ptr<const DirectiveRegistry> spanDirectives_;
		std::optional<PrefixedDispatch<Element>> spanDispatch_;
		std::optional<PrefixedDispatch<Element>> blockDispatch_;
		std::optional<Parser<Element>> fallbackBlocks_;
		std::optional<Parser<std::vector<Element>>> blocks_;
	};

	/**
	Replaces every separator marker left in a finished tree, meaning one that no
	directive of its family consumed, by an invalid element at its place.
	*/
	MARKWEAVE_EXPORT Element resolveOrphanedSeparators(Element root);
}

#endif
