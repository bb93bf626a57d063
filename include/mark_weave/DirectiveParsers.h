#ifndef MARK_WEAVE_DIRECTIVE_PARSERS_H
#define MARK_WEAVE_DIRECTIVE_PARSERS_H

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "mark_weave/Directives.h"
#include "mark_weave/PrefixedParser.h"
#include "mark_weave/RecursiveParsers.h"
#include "markweave_export.h"

namespace mark_weave {

	// The textual shape of a directive occurrence up to its body.
	struct Declaration {
		std::string name;
		std::vector<Attribute> attributes;
		std::vector<std::string> attributeErrors;
		std::string fence;
	};

	/**
	@:name, then optional positional attributes in parentheses, then an optional attribute
	section in braces, then (only with customFence) an optional fence of up to three
	characters ending the line. A malformed attribute section does not fail the
	declaration; its problems end up in attributeErrors.
	*/
	MARKWEAVE_EXPORT Parser<Declaration> declaration(Parser<std::string> escapedChar, std::string defaultFence, bool customFence);

	// Span and template bodies: everything up to the fence, skipping over nested spans that contain one.
	MARKWEAVE_EXPORT Parser<std::string> spanBody(const RecursiveParsers& rp, const std::string& fence);
	// Block bodies: the lines up to a line holding only the fence, surrounding blank lines trimmed.
	MARKWEAVE_EXPORT Parser<std::string> blockBody(const std::string& fence);

	// ${key} or ${?key}, resolved against the configuration of the cursor.
	MARKWEAVE_EXPORT PrefixedParser<Element> contextReference(std::shared_ptr<const DocumentCursor> cursor);

	// Plain text becomes template text.
	MARKWEAVE_EXPORT std::vector<Element> asTemplateSpans(std::vector<Element> spans);

	/**
	Validates one occurrence against its registered directive. The result is either the
	directive's element or a single message combining every problem found.
	*/
	MARKWEAVE_EXPORT Validated<Element> evaluateDirective(const Directive* directive, const char* family, const DirectiveContext& ctx);

	struct BlockTraits {
		static constexpr const char* family = "block";
		static constexpr bool customFence = true;

		static Element invalid(std::string message, std::string source) { return elements::invalidBlock(std::move(message), std::move(source)); }
		MARKWEAVE_EXPORT static Parser<Unit> declarationEnd();
		static Parser<std::string> body(const RecursiveParsers&, const std::string& fence) { return blockBody(fence); }
		static std::vector<Element> parseBody(const RecursiveParsers& rp, const std::string& body, NestLevel level) { return rp.parseBlocks(body, level); }
		MARKWEAVE_EXPORT static std::string source(const SourcePosition& from, const SourcePosition& to);
	};

	struct SpanTraits {
		static constexpr const char* family = "span";
		static constexpr bool customFence = false;

		static Element invalid(std::string message, std::string source) { return elements::invalidSpan(std::move(message), std::move(source)); }
		static Parser<Unit> declarationEnd() { return success(Unit{}); }
		static Parser<std::string> body(const RecursiveParsers& rp, const std::string& fence) { return spanBody(rp, fence); }
		static std::vector<Element> parseBody(const RecursiveParsers& rp, const std::string& body, NestLevel level) { return rp.parseSpans(body, level); }
		static std::string source(const SourcePosition& from, const SourcePosition& to) { return std::string{ from.sliceTo(to) }; }
	};

	struct TemplateTraits {
		static constexpr const char* family = "template";
		static constexpr bool customFence = false;

		static Element invalid(std::string message, std::string source) {
			return elements::templateElement(elements::invalidSpan(std::move(message), std::move(source)));
		}
		static Parser<Unit> declarationEnd() { return success(Unit{}); }
		static Parser<std::string> body(const RecursiveParsers& rp, const std::string& fence) { return spanBody(rp, fence); }
		static std::vector<Element> parseBody(const RecursiveParsers& rp, const std::string& body, NestLevel level) {
			return asTemplateSpans(rp.parseSpans(body, level));
		}
		static std::string source(const SourcePosition& from, const SourcePosition& to) { return std::string{ from.sliceTo(to) }; }
	};

	/**
	The parser for the directives of one family, started by '@'.
	Names registered as separators produce a separator marker for the enclosing directive
	to pick up. A body is only looked for when the registered directive declares one.
	*/
	template<typename Traits>
	PrefixedParser<Element> directiveParser(const RecursiveParsers& rp, std::shared_ptr<const DirectiveRegistry> registry) {
		const RecursiveParsers* recursive = &rp;
		auto decl = keepLeft(declaration(rp.escapedChar(), rp.defaultFence(), Traits::customFence), Traits::declarationEnd());
		auto defaultBody = Traits::body(rp, rp.defaultFence());

		return PrefixedParser<Element>{ "@", Parser<Element>([recursive, registry, decl, defaultBody](const SourcePosition& in) -> Parsed<Element> {
			auto declared = decl.parse(in);
			if (!declared) {
				return declared.failure();
			}
			auto parsed = std::make_shared<ParsedDirective>();
			parsed->name = std::move(declared.result().name);
			parsed->attributes = std::move(declared.result().attributes);
			parsed->attributeErrors = std::move(declared.result().attributeErrors);
			parsed->fence = std::move(declared.result().fence);
			SourcePosition next = declared.next();

			if (registry->isSeparator(parsed->name)) {
				parsed->source = Traits::source(in, next);
				return Success<Element>{ elements::separatorMarker(std::move(parsed)), next };
			}

			const Directive* directive = registry->find(parsed->name);
			if (directive and directive->hasBody()) {
				auto bodyParser = parsed->fence == recursive->defaultFence() ? defaultBody : Traits::body(*recursive, parsed->fence);
				auto body = bodyParser.parse(next);
				if (body) {
					parsed->body = std::move(body.result());
					next = body.next();
				}
			}
			parsed->source = Traits::source(in, next);

			const NestLevel level = in.nestLevel();
			DirectiveContext ctx{ parsed,
				[recursive, level](const std::string& text) { return Traits::parseBody(*recursive, text, level); },
				[recursive, level](const std::string& text) { return recursive->parseSpans(text, level); },
				recursive->cursor(),
				std::nullopt };
			auto res = evaluateDirective(directive, Traits::family, ctx);
			if (not res.isValid()) {
				return Success<Element>{ Traits::invalid(res.errors().front(), parsed->source), next };
			}
			return Success<Element>{ std::move(res.value()), next };
		}) };
	}
}

#endif
