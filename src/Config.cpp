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

#include "mark_weave/Config.h"
#include <charconv>
#include <limits>
#include <fmt/format.h>
#include "MarkWeaveImpl.h"

namespace {
	auto dumped(const nlohmann::json& value) -> std::string {
		return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
	}

	auto describe(const nlohmann::json& value) -> std::string {
		return value.is_string() ? value.get<std::string>() : dumped(value);
	}

	template<typename Int>
	auto decodeInteger(const nlohmann::json& value) -> mark_weave::Decoded<Int> {
		mark_weave::DecodingError failure{ fmt::format("not an integer: {}", describe(value)) };
		if (value.is_number_integer()) {
			auto wide = value.get<std::int64_t>();
			if (wide < std::numeric_limits<Int>::min() or wide > std::numeric_limits<Int>::max()) {
				return failure;
			}
			return static_cast<Int>(wide);
		}
		if (value.is_string()) {
			const auto& text = value.get_ref<const std::string&>();
			Int res{};
			auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), res);
			if (ec == std::errc{} and ptr == text.data() + text.size() and not text.empty()) {
				return res;
			}
		}
		return failure;
	}
}

auto mark_weave::Config::get(std::string_view path) const -> std::optional<nlohmann::json> {
	const nlohmann::json* curr = &root_;
	while (not path.empty()) {
		auto dot = path.find('.');
		std::string key{ path.substr(0, dot) };
		if (not curr->is_object()) {
			return std::nullopt;
		}
		auto it = curr->find(key);
		if (it == curr->end()) {
			return std::nullopt;
		}
		curr = &*it;
		path = dot == std::string_view::npos ? std::string_view{} : path.substr(dot + 1);
	}
	return *curr;
}

auto mark_weave::Config::withValue(std::string_view path, nlohmann::json value) const -> Config {
	nlohmann::json root = root_;
	nlohmann::json* curr = &root;
	while (true) {
		auto dot = path.find('.');
		std::string key{ path.substr(0, dot) };
		if (not curr->is_object()) {
			*curr = nlohmann::json::object();
		}
		if (dot == std::string_view::npos) {
			(*curr)[key] = std::move(value);
			break;
		}
		curr = &(*curr)[key];
		path = path.substr(dot + 1);
	}
	return Config{ std::move(root) };
}

auto mark_weave::ConfigDecoder<std::string>::decode(const nlohmann::json& value) -> Decoded<std::string> {
	if (value.is_string() or value.is_number() or value.is_boolean()) {
		return describe(value);
	}
	return DecodingError{ fmt::format("not a string: {}", dumped(value)) };
}

auto mark_weave::ConfigDecoder<int>::decode(const nlohmann::json& value) -> Decoded<int> {
	return decodeInteger<int>(value);
}

auto mark_weave::ConfigDecoder<long>::decode(const nlohmann::json& value) -> Decoded<long> {
	return decodeInteger<long>(value);
}

auto mark_weave::ConfigDecoder<double>::decode(const nlohmann::json& value) -> Decoded<double> {
	if (value.is_number()) {
		return value.get<double>();
	}
	if (value.is_string()) {
		const auto& text = value.get_ref<const std::string&>();
		double res{};
		auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), res);
		if (ec == std::errc{} and ptr == text.data() + text.size() and not text.empty()) {
			return res;
		}
	}
	return DecodingError{ fmt::format("not a number: {}", describe(value)) };
}

auto mark_weave::ConfigDecoder<bool>::decode(const nlohmann::json& value) -> Decoded<bool> {
	if (value.is_boolean()) {
		return value.get<bool>();
	}
	if (value.is_string()) {
		const auto& text = value.get_ref<const std::string&>();
		if (text == "true") {
			return true;
		}
		if (text == "false") {
			return false;
		}
	}
	return DecodingError{ fmt::format("not a boolean: {}", describe(value)) };
}

auto mark_weave::ConfigDecoder<std::vector<std::string>>::decode(const nlohmann::json& value) -> Decoded<std::vector<std::string>> {
	if (not value.is_array()) {
		return DecodingError{ fmt::format("not an array: {}", describe(value)) };
	}
	std::vector<std::string> res;
	for (const auto& el : value) {
		auto decoded = ConfigDecoder<std::string>::decode(el);
		if (auto* err = std::get_if<DecodingError>(&decoded)) {
			return *err;
		}
		res.push_back(std::get<0>(std::move(decoded)));
	}
	return res;
}

auto mark_weave::renderValue(const nlohmann::json& value) -> std::string {
	return describe(value);
}

namespace {
	using mark_weave::Offset;
	using mark_weave::ObjectMember;

	/**
	Recursive descent over the HOCON subset used for attribute sections. Lexical pieces
	come from the PEGTL rules; the reader only handles structure.
	*/
	class HoconReader {
	public:
		explicit HoconReader(std::string_view text) : text_{ text }, input_{ text.data(), text.data() + text.size(), "attributes" } {}

		Offset offset() const noexcept { return mw_impl::consumed(input_, text_); }
		const std::string& error() const noexcept { return error_; }

		// Members up to, not including, a closing brace or the end of input.
		bool members(std::vector<ObjectMember>& out) {
			while (true) {
				skipSeparators();
				if (input_.empty() or input_.peek_char() == '}') {
					return true;
				}
				Offset start = offset();
				auto key = mw_impl::tryHoconKey(input_);
				if (not key) {
					return fail(fmt::format("expected attribute key but found '{}'", input_.peek_char()));
				}
				skipBlanks();
				nlohmann::json value;
				if (not input_.empty() and input_.peek_char() == '{') {
					if (not object(value)) {
						return false;
					}
				}
				else if (not input_.empty() and (input_.peek_char() == '=' or input_.peek_char() == ':')) {
					input_.bump(1);
					skipBlanks();
					if (not anyValue(value)) {
						return false;
					}
				}
				else {
					return fail(fmt::format("expected '=' or ':' after key '{}'", *key));
				}
				out.push_back({ *key, std::move(value), std::string{ text_.substr(start, offset() - start) } });
				skipBlanks();
				if (not input_.empty() and input_.peek_char() != ',' and input_.peek_char() != '\n' and input_.peek_char() != '\r' and
					input_.peek_char() != '}' and input_.peek_char() != '#' and input_.peek_char() != '/') {
					return fail(fmt::format("unexpected character '{}' after value of '{}'", input_.peek_char(), *key));
				}
			}
		}

	private:
		bool fail(std::string message) {
			error_ = std::move(message);
			return false;
		}

		void skipBlanks() {
			while (not input_.empty() and (input_.peek_char() == ' ' or input_.peek_char() == '\t')) {
				input_.bump(1);
			}
		}

		void skipSeparators() {
			while (true) {
				mw_impl::skipHoconWs(input_);
				if (input_.empty() or input_.peek_char() != ',') {
					return;
				}
				input_.bump(1);
			}
		}

		bool enter() {
			if (depth_ >= mark_weave::MAX_ATTRIBUTE_DEPTH) {
				return fail(fmt::format("attribute values nested deeper than {} levels", mark_weave::MAX_ATTRIBUTE_DEPTH));
			}
			++depth_;
			return true;
		}

		bool object(nlohmann::json& out) {
			if (not enter()) {
				return false;
			}
			input_.bump(1);
			std::vector<ObjectMember> nested;
			if (not members(nested)) {
				return false;
			}
			if (input_.empty()) {
				return fail("missing closing brace of nested object");
			}
			input_.bump(1);
			--depth_;
			out = nlohmann::json::object();
			for (auto& m : nested) {
				if (not out.contains(m.key)) {
					out[m.key] = std::move(m.value);
				}
			}
			return true;
		}

		bool array(nlohmann::json& out) {
			if (not enter()) {
				return false;
			}
			input_.bump(1);
			out = nlohmann::json::array();
			while (true) {
				skipSeparators();
				if (input_.empty()) {
					return fail("missing closing bracket of array");
				}
				if (input_.peek_char() == ']') {
					input_.bump(1);
					--depth_;
					return true;
				}
				nlohmann::json el;
				if (not anyValue(el)) {
					return false;
				}
				out.push_back(std::move(el));
			}
		}

		bool anyValue(nlohmann::json& out) {
			if (input_.empty()) {
				return fail("expected value but found end of input");
			}
			switch (input_.peek_char()) {
			case '{':
				return object(out);
			case '[':
				return array(out);
			case '"':
				if (auto quoted = mw_impl::tryQuotedString(input_)) {
					out = *quoted;
					return true;
				}
				return fail("unterminated quoted string");
			default:
				break;
			}
			if (auto literal = mw_impl::tryHoconLiteral(input_)) {
				out = std::move(*literal);
				return true;
			}
			if (auto unquoted = mw_impl::tryHoconUnquoted(input_)) {
				out = std::move(*unquoted);
				return true;
			}
			return fail(fmt::format("expected value but found '{}'", input_.peek_char()));
		}

		std::string_view text_;
		mw_impl::input_t input_;
		std::string error_;
		mark_weave::UInt depth_ = 0;
	};
}

auto mark_weave::objectMembers() -> Parser<std::vector<ObjectMember>> {
	return Parser<std::vector<ObjectMember>>([](const SourcePosition& in) -> Parsed<std::vector<ObjectMember>> {
		HoconReader reader{ in.rest() };
		std::vector<ObjectMember> members;
		if (not reader.members(members)) {
			return Failure{ reader.error(), in.consume(reader.offset()) };
		}
		return Success<std::vector<ObjectMember>>{ std::move(members), in.consume(reader.offset()) };
	});
}

auto mark_weave::ParserSettings::fromJson(const nlohmann::json& doc) -> std::variant<ParserSettings, std::string> {
	ParserSettings settings{};
	if (not doc.is_object()) {
		return fmt::format("settings document is not an object: {}", dumped(doc));
	}
	if (auto it = doc.find("settings"); it != doc.end()) {
		if (auto lvl = it->find("maxNestLevel"); lvl != it->end()) {
			auto decoded = ConfigDecoder<int>::decode(*lvl);
			if (auto* err = std::get_if<DecodingError>(&decoded)) {
				return fmt::format("maxNestLevel: {}", err->message);
			}
			int value = std::get<int>(decoded);
			if (value < 1 or value > std::numeric_limits<NestLevel>::max()) {
				return fmt::format("maxNestLevel out of range: {}", value);
			}
			settings.maxNestLevel = static_cast<NestLevel>(value);
		}
		if (auto fence = it->find("defaultFence"); fence != it->end()) {
			if (not fence->is_string() or fence->get_ref<const std::string&>().empty()) {
				return fmt::format("defaultFence must be a non-empty string: {}", dumped(*fence));
			}
			settings.defaultFence = fence->get<std::string>();
		}
	}
	auto config = doc.find("config");
	auto path = doc.find("path");
	if (config != doc.end() or path != doc.end()) {
		DocumentCursor cursor{};
		if (config != doc.end()) {
			if (not config->is_object()) {
				return fmt::format("config is not an object: {}", dumped(*config));
			}
			cursor.config = Config{ *config };
		}
		if (path != doc.end()) {
			if (not path->is_string()) {
				return fmt::format("path is not a string: {}", dumped(*path));
			}
			cursor.path = path->get<std::string>();
		}
		settings.cursor = std::make_shared<const DocumentCursor>(std::move(cursor));
	}
	return settings;
}
