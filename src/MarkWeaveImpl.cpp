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

#include <string>
#include <charconv>
#include <stdexcept>
#include <cstdint>
#include "MarkWeaveImpl.h"

#include "tao/pegtl.hpp"

namespace mwlang {
	using namespace TAO_PEGTL_NAMESPACE;

	struct whitespace0 : star<blank> {};
	struct ws_eol : seq<whitespace0, eolf> {};
	struct blank_line : sor<seq<whitespace0, eol>, seq<plus<blank>, eof>> {};

	struct directive_name : seq<alpha, star<sor<alnum, one<'-', '_'>>>> {};

	struct fence_char : not_one<' ', '\t', '\r', '\n'> {};
	struct fence_token : rep_min_max<1, mw_impl::MAX_FENCE_SIZE, fence_char> {};
	struct fence_decl : seq<plus<blank>, fence_token, at<ws_eol>> {};

	struct qs_escaped : seq<one<'\\'>, any> {};
	struct qs_char : not_one<'"', '\\'> {};
	struct quoted_string : seq<one<'"'>, star<sor<qs_escaped, qs_char>>, one<'"'>> {};

	template <typename Rule>
	struct quoted_action : nothing<Rule> {};

	template<>
	struct quoted_action<qs_escaped> : require_apply {
		template<typename ParseInput>
		static void apply(const ParseInput& in, std::string& out) {
			char c = in.begin()[1];
			switch (c) {
			case 'n': out.push_back('\n'); break;
			case 't': out.push_back('\t'); break;
			case 'r': out.push_back('\r'); break;
			default: out.push_back(c); break;
			}
		}
	};

	template<>
	struct quoted_action<qs_char> : require_apply {
		template<typename ParseInput>
		static void apply(const ParseInput& in, std::string& out) {
			out.append(in.begin(), in.size());
		}
	};
}

namespace mwlang::hocon {
	using namespace TAO_PEGTL_NAMESPACE;

	struct comment : seq<sor<one<'#'>, two<'/'>>, until<eolf>> {};
	struct filler : star<sor<space, comment>> {};

	struct key : plus<sor<alnum, one<'-', '_'>>> {};

	struct value_end : at<whitespace0, sor<one<',', '}', ']', '#'>, eolf>> {};
	struct kw_true : keyword<'t', 'r', 'u', 'e'> {};
	struct kw_false : keyword<'f', 'a', 'l', 's', 'e'> {};
	struct kw_null : keyword<'n', 'u', 'l', 'l'> {};
	struct int_part : seq<opt<one<'-'>>, plus<digit>> {};
	struct frac_part : seq<one<'.'>, plus<digit>> {};
	struct exp_part : seq<one<'e', 'E'>, opt<one<'+', '-'>>, plus<digit>> {};
	struct number : seq<int_part, opt<frac_part>, opt<exp_part>> {};

	struct unquoted_char : not_one<',', '}', ']', '#', '{', '[', '"', '\r', '\n'> {};
	struct unquoted : plus<unquoted_char> {};
}

bool mw_impl::tryWsEol(input_t& input) noexcept {
	return mwlang::parse<mwlang::ws_eol>(input);
}

bool mw_impl::tryBlankLine(input_t& input) noexcept {
	return mwlang::parse<mwlang::blank_line>(input);
}

auto mw_impl::tryDirectiveName(input_t& input) -> std::optional<std::string> {
	const char* start = input.current();
	if (mwlang::parse<mwlang::directive_name>(input)) {
		return std::string{ start, input.current() };
	}
	return std::nullopt;
}

auto mw_impl::tryFenceDecl(input_t& input) -> std::optional<std::string> {
	const char* start = input.current();
	if (not mwlang::parse<mwlang::fence_decl>(input)) {
		return std::nullopt;
	}
	std::string_view matched{ start, static_cast<std::size_t>(input.current() - start) };
	auto tokenStart = matched.find_first_not_of(" \t");
	return std::string{ matched.substr(tokenStart) };
}

bool mw_impl::tryFenceLine(input_t& input, std::string_view fence) noexcept {
	auto marker = input.mark<peggi::rewind_mode::required>();
	mwlang::parse<mwlang::whitespace0>(input);
	if (input.size(fence.size()) < fence.size() or std::string_view{ input.current(), fence.size() } != fence) {
		return marker(false);
	}
	input.bump(fence.size());
	return marker(mwlang::parse<mwlang::ws_eol>(input));
}

auto mw_impl::tryQuotedString(input_t& input) -> std::optional<std::string> {
	std::string out;
	if (mwlang::parse<mwlang::quoted_string, mwlang::quoted_action>(input, out)) {
		return out;
	}
	return std::nullopt;
}

auto mw_impl::tryHoconKey(input_t& input) -> std::optional<std::string> {
	if (auto quoted = tryQuotedString(input)) {
		return quoted;
	}
	const char* start = input.current();
	if (mwlang::parse<mwlang::hocon::key>(input)) {
		return std::string{ start, input.current() };
	}
	return std::nullopt;
}

auto mw_impl::tryHoconLiteral(input_t& input) -> std::optional<nlohmann::json> {
	using namespace mwlang::hocon;
	if (mwlang::parse<mwlang::seq<kw_true, value_end>>(input)) {
		return nlohmann::json(true);
	}
	if (mwlang::parse<mwlang::seq<kw_false, value_end>>(input)) {
		return nlohmann::json(false);
	}
	if (mwlang::parse<mwlang::seq<kw_null, value_end>>(input)) {
		return nlohmann::json(nullptr);
	}
	const char* start = input.current();
	auto marker = input.mark<peggi::rewind_mode::required>();
	if (not mwlang::parse<mwlang::seq<number, value_end>>(input)) {
		return std::nullopt;
	}
	std::string_view text{ start, static_cast<std::size_t>(input.current() - start) };
	if (text.find_first_of(".eE") == std::string_view::npos) {
		std::int64_t value{};
		auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
		if (ec == std::errc{} and ptr == text.data() + text.size()) {
			static_cast<void>(marker(true));
			return nlohmann::json(value);
		}
		// out of range integers stay text
		return std::nullopt;
	}
	try {
		double value = std::stod(std::string{ text });
		static_cast<void>(marker(true));
		return nlohmann::json(value);
	}
	catch (const std::out_of_range&) {
		return std::nullopt;
	}
}

auto mw_impl::tryHoconUnquoted(input_t& input) -> std::optional<std::string> {
	const char* start = input.current();
	if (not mwlang::parse<mwlang::hocon::unquoted>(input)) {
		return std::nullopt;
	}
	std::string value{ start, input.current() };
	auto last = value.find_last_not_of(" \t");
	value.erase(last == std::string::npos ? 0 : last + 1);
	return value;
}

void mw_impl::skipHoconWs(input_t& input) noexcept {
	mwlang::parse<mwlang::hocon::filler>(input);
}
