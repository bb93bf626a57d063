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

#include "mark_weave/StandardDirectives.h"
#include <optional>
#include <fmt/format.h>

namespace {
	using namespace mark_weave;

	struct Branch {
		std::optional<std::string> condition;
		std::vector<Element> body;
	};

	template<typename Wrap>
	Directive ifDirective(Wrap wrap) {
		auto elseIf = separator("elseIf", 0, UNBOUNDED, product(attribute(0).as<std::string>(), parsedBody())
			.mapN([](const std::string& condition, const std::vector<Element>& body) { return Branch{ condition, body }; }));
		auto otherwise = separator("else", 0, 1, parsedBody()
			.map([](const std::vector<Element>& body) { return Branch{ std::nullopt, body }; }));

		auto part = product(attribute(0).as<std::string>(), separatedBody<Branch>({ elseIf, otherwise }), cursor())
			.mapN([wrap](const std::string& condition, const Multipart<Branch>& parts, const std::shared_ptr<const DocumentCursor>& cursor) -> Element {
				auto holds = [&cursor](const std::string& key) {
					auto value = cursor ? cursor->config.get(key) : std::nullopt;
					return value and isTruthy(*value);
				};
				if (holds(condition)) {
					return wrap(parts.mainBody);
				}
				for (const auto& branch : parts.children) {
					if (not branch.condition or holds(*branch.condition)) {
						return wrap(branch.body);
					}
				}
				return wrap({});
			});
		return createDirective("if", part);
	}

	auto styleNames() -> DirectivePart<std::vector<std::string>> {
		return allAttributes().evalMap([](const Attributes& attributes) -> Decoded<std::vector<std::string>> {
			if (attributes.positional.empty()) {
				return DecodingError{ "at least one style name is required" };
			}
			std::vector<std::string> names;
			for (const auto& value : attributes.positional) {
				auto decoded = ConfigDecoder<std::string>::decode(value);
				if (auto* err = std::get_if<DecodingError>(&decoded)) {
					return DecodingError{ fmt::format("invalid style name: {}", err->message) };
				}
				names.push_back(std::get<std::string>(std::move(decoded)));
			}
			return names;
		});
	}
}

bool mark_weave::isTruthy(const nlohmann::json& value) {
	if (value.is_boolean()) {
		return value.get<bool>();
	}
	if (value.is_string()) {
		const auto& text = value.get_ref<const std::string&>();
		return text == "true" or text == "yes" or text == "on" or text == "enabled";
	}
	return false;
}

auto mark_weave::standard_directives::templateIf() -> Directive {
	return ifDirective([](std::vector<Element> spans) { return elements::templateSpanSequence(std::move(spans)); });
}

auto mark_weave::standard_directives::blockIf() -> Directive {
	return ifDirective([](std::vector<Element> blocks) { return elements::blockSequence(std::move(blocks)); });
}

auto mark_weave::standard_directives::spanIf() -> Directive {
	return ifDirective([](std::vector<Element> spans) { return elements::spanSequence(std::move(spans)); });
}

auto mark_weave::standard_directives::fragment() -> Directive {
	auto part = product(attribute(0).as<std::string>(), parsedBody())
		.mapN([](const std::string& name, const std::vector<Element>& body) {
			return elements::fragment(name, body.size() == 1 ? body.front() : elements::blockSequence(body));
		});
	return createDirective("fragment", part);
}

auto mark_weave::standard_directives::pageBreak() -> Directive {
	return createDirective("pageBreak", empty(elements::pageBreak()));
}

auto mark_weave::standard_directives::spanStyle() -> Directive {
	auto part = product(styleNames(), parsedBody())
		.mapN([](const std::vector<std::string>& styles, const std::vector<Element>& body) { return elements::spanSequence(body, styles); });
	return createDirective("style", part);
}

auto mark_weave::standard_directives::blockStyle() -> Directive {
	auto part = product(styleNames(), parsedBody())
		.mapN([](const std::vector<std::string>& styles, const std::vector<Element>& body) { return elements::blockSequence(body, styles); });
	return createDirective("style", part);
}

auto mark_weave::standardDirectives() -> ExtensionBundle {
	using namespace standard_directives;
	ExtensionBundle bundle;
	bundle.name = "standard directives";
	bundle.blockDirectives = { blockIf(), fragment(), pageBreak(), blockStyle() };
	bundle.spanDirectives = { spanIf(), spanStyle() };
	bundle.templateDirectives = { templateIf() };
	return bundle;
}
