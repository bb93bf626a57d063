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

#include "mark_weave/Directives.h"
#include <algorithm>

auto mark_weave::ParsedDirective::positional(UInt index) const noexcept -> const nlohmann::json* {
	for (const auto& attr : attributes) {
		if (const auto* idx = std::get_if<UInt>(&attr.key); idx and *idx == index) {
			return &attr.value;
		}
	}
	return nullptr;
}

auto mark_weave::ParsedDirective::named(std::string_view key) const noexcept -> const nlohmann::json* {
	for (const auto& attr : attributes) {
		if (const auto* name = std::get_if<std::string>(&attr.key); name and *name == key) {
			return &attr.value;
		}
	}
	return nullptr;
}

auto mark_weave::detail::describeKey(const AttributeKey& key) -> std::string {
	if (const auto* idx = std::get_if<UInt>(&key)) {
		return fmt::format("positional attribute at index {}", *idx);
	}
	return fmt::format("attribute '{}'", std::get<std::string>(key));
}

auto mark_weave::detail::missingAttributeMessage(const AttributeKey& key) -> std::string {
	return fmt::format("required {} is missing", describeKey(key));
}

auto mark_weave::detail::conversionMessage(const AttributeKey& key, const std::string& reason) -> std::string {
	return fmt::format("error converting {}: {}", describeKey(key), reason);
}

auto mark_weave::detail::findAttribute(const ParsedDirective& directive, const AttributeKey& key) noexcept -> const nlohmann::json* {
	if (const auto* idx = std::get_if<UInt>(&key)) {
		return directive.positional(*idx);
	}
	return directive.named(std::get<std::string>(key));
}

auto mark_weave::detail::originOf(const AttributeKey& key) noexcept -> error_origin {
	return std::holds_alternative<UInt>(key) ? error_origin::PositionalAttribute : error_origin::NamedAttribute;
}

auto mark_weave::detail::bodyElements(const DirectiveContext& ctx) -> std::optional<std::vector<Element>> {
	if (ctx.preParsedBody) {
		return ctx.preParsedBody;
	}
	if (ctx.directive->body and ctx.parseBody) {
		return ctx.parseBody(*ctx.directive->body);
	}
	return std::nullopt;
}

auto mark_weave::allAttributes() -> DirectivePart<Attributes> {
	return DirectivePart<Attributes>([](const DirectiveContext& ctx) -> Validated<Attributes> {
		std::vector<std::pair<UInt, nlohmann::json>> indexed;
		nlohmann::json named = nlohmann::json::object();
		for (const auto& attr : ctx.directive->attributes) {
			if (const auto* idx = std::get_if<UInt>(&attr.key)) {
				indexed.emplace_back(*idx, attr.value);
			}
			else {
				named[std::get<std::string>(attr.key)] = attr.value;
			}
		}
		std::stable_sort(indexed.begin(), indexed.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
		Attributes res{ {}, Config{ std::move(named) } };
		for (auto& entry : indexed) {
			res.positional.push_back(std::move(entry.second));
		}
		return res;
	});
}

auto mark_weave::parsedBody() -> DirectivePart<std::vector<Element>> {
	return DirectivePart<std::vector<Element>>([](const DirectiveContext& ctx) -> Validated<std::vector<Element>> {
		auto body = detail::bodyElements(ctx);
		if (not body) {
			return Validated<std::vector<Element>>::invalid("required body is missing");
		}
		return std::move(*body);
	}, true);
}

auto mark_weave::rawBody() -> DirectivePart<std::string> {
	return DirectivePart<std::string>([](const DirectiveContext& ctx) -> Validated<std::string> {
		if (not ctx.directive->body) {
			return Validated<std::string>::invalid("required body is missing");
		}
		return *ctx.directive->body;
	}, true);
}

auto mark_weave::parser() -> DirectivePart<BodyParser> {
	return DirectivePart<BodyParser>([](const DirectiveContext& ctx) { return Validated<BodyParser>{ ctx.parseBody }; });
}

auto mark_weave::spanParser() -> DirectivePart<BodyParser> {
	return DirectivePart<BodyParser>([](const DirectiveContext& ctx) { return Validated<BodyParser>{ ctx.parseSpans }; });
}

auto mark_weave::cursor() -> DirectivePart<std::shared_ptr<const DocumentCursor>> {
	return DirectivePart<std::shared_ptr<const DocumentCursor>>([](const DirectiveContext& ctx) {
		return Validated<std::shared_ptr<const DocumentCursor>>{ ctx.cursor };
	});
}

mark_weave::DirectiveRegistry::DirectiveRegistry(const std::vector<Directive>& directives) {
	for (const auto& directive : directives) {
		if (byName_.count(directive.name) != 0) {
			PLOG_WARNING << fmt::format("directive '{}' registered more than once, keeping the first registration", directive.name);
			continue;
		}
		byName_.emplace(directive.name, directive);
		separators_.insert(directive.part.separators().begin(), directive.part.separators().end());
	}
}

auto mark_weave::DirectiveRegistry::find(std::string_view name) const -> const Directive* {
	auto it = byName_.find(name);
	return it == byName_.end() ? nullptr : &it->second;
}

auto mark_weave::DirectiveRegistry::isSeparator(std::string_view name) const -> bool {
	return separators_.find(name) != separators_.end();
}
