/*
MIT License

Copyright (c) 2020 Christian Greyeyes

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#include "mark_weave/DirectiveParsers.h"
#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <plog/Log.h>
#include "mark_weave/Characters.h"
#include "mark_weave/InlineParsers.h"
#include "MarkWeaveImpl.h"

namespace {
	using namespace mark_weave;

	auto inputAt(const SourcePosition& pos) -> mw_impl::input_t {
		auto rest = pos.rest();
		return mw_impl::input_t{ rest.data(), rest.data() + rest.size(), "directive" };
	}

	auto skipWs(const SourcePosition& pos) -> SourcePosition {
		return ws().parse(pos).next();
	}

	auto trimmed(std::string_view text) -> std::string {
		auto first = text.find_first_not_of(" \t");
		if (first == std::string_view::npos) {
			return {};
		}
		auto last = text.find_last_not_of(" \t");
		return std::string{ text.substr(first, last - first + 1) };
	}

	// "..." with the escapes of the host markup
	auto quotedText(Parser<std::string> escapedChar) -> Parser<std::string> {
		auto content = inline_parsers::text(DelimitedText::delimitedByChars("\"").failOn("\n"), { prefixed("\\", escapedChar) });
		return keepRight(literal("\""), content);
	}

	// ( value, "quoted value", ... )
	auto positionalAttributes(Parser<std::string> quoted) -> Parser<std::vector<std::string>> {
		return Parser<std::vector<std::string>>([quoted](const SourcePosition& in) -> Parsed<std::vector<std::string>> {
			std::vector<std::string> values;
			SourcePosition curr = skipWs(in.consume(1));
			if (not curr.atEnd() and curr.peek() == ')') {
				return Success<std::vector<std::string>>{ std::move(values), curr.consume(1) };
			}
			while (true) {
				curr = skipWs(curr);
				if (curr.atEnd()) {
					break;
				}
				if (curr.peek() == '"') {
					auto value = quoted.parse(curr);
					if (!value) {
						return Failure{ "unterminated quoted attribute value", curr, value.failure().maxOffset };
					}
					values.push_back(std::move(value.result()));
					curr = skipWs(value.next());
				}
				else {
					auto value = anyBut(",)\r\n").parse(curr);
					std::string text = trimmed(value.result());
					if (text.empty()) {
						return Failure{ "expected attribute value", curr };
					}
					values.push_back(std::move(text));
					curr = value.next();
				}
				if (curr.atEnd() or curr.peek() == '\n' or curr.peek() == '\r') {
					break;
				}
				if (curr.peek() == ')') {
					return Success<std::vector<std::string>>{ std::move(values), curr.consume(1) };
				}
				if (curr.peek() != ',') {
					return Failure{ fmt::format("expected ',' or ')' but found '{}'", curr.peek()), curr };
				}
				curr = curr.consume(1);
			}
			return Failure{ "missing closing parenthesis for positional attributes", in, curr.offset() };
		});
	}

	struct AttributeSection {
		std::vector<ObjectMember> members;
		std::vector<std::string> errors;
	};

	/**
	Optional whitespace and a brace delimited attribute section, absent when there is no
	opening brace. The closing brace is handled here so that a missing one is reported
	instead of failing the whole directive. Only a broken section without any closing
	brace in the rest of the input is a failure.
	*/
	auto attributeSection() -> Parser<std::optional<AttributeSection>> {
		auto members = objectMembers();
		return Parser<std::optional<AttributeSection>>([members](const SourcePosition& in) -> Parsed<std::optional<AttributeSection>> {
			SourcePosition open = skipWs(in);
			if (open.atEnd() or open.peek() != '{') {
				return Success<std::optional<AttributeSection>>{ std::nullopt, in };
			}
			AttributeSection section;
			auto res = members.parse(open.consume(1));
			if (!res) {
				const auto& failed = res.failure();
				auto rest = failed.pos.rest();
				auto close = rest.find('}');
				if (close == std::string_view::npos) {
					return Failure{ failed.message, failed.pos, failed.maxOffset };
				}
				section.errors.push_back(fmt::format("invalid attribute section: {}", failed.message));
				return Success<std::optional<AttributeSection>>{ std::move(section), failed.pos.consume(close + 1) };
			}
			section.members = std::move(res.result());
			SourcePosition next = res.next();
			if (not next.atEnd() and next.peek() == '}') {
				next = next.consume(1);
			}
			else {
				section.errors.push_back("Missing closing brace for attribute section");
			}
			return Success<std::optional<AttributeSection>>{ std::move(section), next };
		});
	}
}

auto mark_weave::declaration(Parser<std::string> escapedChar, std::string defaultFence, bool customFence) -> Parser<Declaration> {
	auto positional = positionalAttributes(quotedText(std::move(escapedChar)));
	auto section = attributeSection();

	return Parser<Declaration>([positional, section, defaultFence, customFence](const SourcePosition& in) -> Parsed<Declaration> {
		if (in.rest().substr(0, 2) != "@:") {
			return Failure{ "'@:' expected", in };
		}
		auto input = inputAt(in.consume(2));
		auto name = mw_impl::tryDirectiveName(input);
		if (not name) {
			return Failure{ "expected directive name", in.consume(2) };
		}
		Declaration decl{ *name, {}, {}, defaultFence };
		SourcePosition curr = in.consume(2 + name->size());

		if (not curr.atEnd() and curr.peek() == '(') {
			auto values = positional.parse(curr);
			if (!values) {
				return values.failure();
			}
			for (auto& value : values.result()) {
				decl.attributes.push_back({ AttributeKey{ static_cast<UInt>(decl.attributes.size()) }, nlohmann::json(std::move(value)) });
			}
			curr = values.next();
		}

		auto named = section.parse(curr);
		if (!named) {
			return named.failure();
		}
		if (named.result()) {
			for (auto& member : named.result()->members) {
				if (decl.attributes.end() != std::find_if(decl.attributes.begin(), decl.attributes.end(), [&member](const Attribute& a) {
					const auto* key = std::get_if<std::string>(&a.key);
					return key and *key == member.key;
				})) {
					decl.attributeErrors.push_back(fmt::format("duplicate attribute '{}'", member.key));
					continue;
				}
				decl.attributes.push_back({ AttributeKey{ member.key }, std::move(member.value) });
			}
			for (auto& error : named.result()->errors) {
				decl.attributeErrors.push_back(std::move(error));
			}
			curr = named.next();
		}

		if (customFence) {
			auto fenceInput = inputAt(curr);
			if (auto fence = mw_impl::tryFenceDecl(fenceInput)) {
				decl.fence = std::move(*fence);
				curr = curr.consume(mw_impl::consumed(fenceInput, curr.rest()));
			}
		}
		return Success<Declaration>{ std::move(decl), curr };
	});
}

auto mark_weave::spanBody(const RecursiveParsers& rp, const std::string& fence) -> Parser<std::string> {
	const auto fenceSize = fence.size();
	return rp.recursiveSpans(DelimitedText::delimitedBy(fence)).source().map([fenceSize](const std::string& source) {
		return source.substr(0, source.size() - fenceSize);
	});
}

auto mark_weave::blockBody(const std::string& fence) -> Parser<std::string> {
	return Parser<std::string>([fence](const SourcePosition& in) -> Parsed<std::string> {
		std::vector<std::string_view> lines;
		SourcePosition curr = in;
		while (true) {
			auto input = inputAt(curr);
			if (mw_impl::tryFenceLine(input, fence)) {
				curr = curr.consume(mw_impl::consumed(input, curr.rest()));
				break;
			}
			if (curr.atEnd()) {
				return Failure{ fmt::format("unterminated directive body, missing fence '{}'", fence), in, curr.offset() };
			}
			auto rest = curr.rest();
			auto eol = rest.find('\n');
			auto line = rest.substr(0, eol);
			if (not line.empty() and line.back() == '\r') {
				line.remove_suffix(1);
			}
			lines.push_back(line);
			curr = curr.consume(eol == std::string_view::npos ? rest.size() : eol + 1);
		}

		auto isBlank = [](std::string_view line) { return line.find_first_not_of(" \t") == std::string_view::npos; };
		auto first = lines.begin();
		auto last = lines.end();
		while (first != last and isBlank(*first)) {
			++first;
		}
		while (last != first and isBlank(*(last - 1))) {
			--last;
		}
		std::string body;
		for (auto it = first; it != last; ++it) {
			if (it != first) {
				body += '\n';
			}
			body.append(*it);
		}
		return Success<std::string>{ std::move(body), curr };
	});
}

auto mark_weave::BlockTraits::declarationEnd() -> Parser<Unit> {
	return wsEol();
}

auto mark_weave::BlockTraits::source(const SourcePosition& from, const SourcePosition& to) -> std::string {
	std::string text{ from.sliceTo(to) };
	if (not text.empty() and text.back() == '\n') {
		text.pop_back();
		if (not text.empty() and text.back() == '\r') {
			text.pop_back();
		}
	}
	return text;
}

auto mark_weave::contextReference(std::shared_ptr<const DocumentCursor> cursor) -> PrefixedParser<Element> {
	auto reference = seq(literal("${"), opt(oneOf("?")), anyBut("}\r\n").nonEmpty(), literal("}"));
	return prefixed("$", reference.withSource().map([cursor](const auto& parsed) -> Element {
		const bool isOptional = std::get<1>(parsed.first).has_value();
		const std::string& key = std::get<2>(parsed.first);
		std::optional<nlohmann::json> value = cursor ? cursor->config.get(key) : std::nullopt;
		if (value and not value->is_null()) {
			return elements::text(renderValue(*value));
		}
		if (isOptional) {
			return elements::text({});
		}
		PLOG_DEBUG << fmt::format("unresolved reference '{}'", key);
		return elements::invalidSpan(fmt::format("Missing required reference: '{}'", key), parsed.second);
	}));
}

auto mark_weave::asTemplateSpans(std::vector<Element> spans) -> std::vector<Element> {
	for (auto& span : spans) {
		if (span.isPlainText()) {
			span = elements::templateString(std::move(span.content));
		}
	}
	return spans;
}

auto mark_weave::evaluateDirective(const Directive* directive, const char* family, const DirectiveContext& ctx) -> Validated<Element> {
	const auto& name = ctx.directive->name;
	if (directive == nullptr) {
		PLOG_DEBUG << fmt::format("unknown {} directive '{}'", family, name);
		return Validated<Element>::invalid(fmt::format("No {} directive registered with name: {}", family, name));
	}
	ValidationErrors errors;
	for (const auto& error : ctx.directive->attributeErrors) {
		errors.add(error, error_origin::NamedAttribute);
	}
	auto res = directive->part(ctx);
	if (not res.isValid()) {
		errors.append(res.failure());
	}
	if (errors.empty()) {
		return res;
	}

	std::vector<std::size_t> order(errors.messages.size());
	for (std::size_t i = 0; i < order.size(); ++i) {
		order[i] = i;
	}
	std::stable_sort(order.begin(), order.end(), [&errors](std::size_t a, std::size_t b) {
		return errors.origins[a] < errors.origins[b];
	});
	std::vector<std::string> messages;
	for (auto i : order) {
		messages.push_back(std::move(errors.messages[i]));
	}
	auto message = fmt::format("One or more errors processing directive '{}': {}", name, fmt::join(messages, ", "));
	PLOG_DEBUG << message;
	return Validated<Element>::invalid(std::move(message));
}
