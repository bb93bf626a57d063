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

#ifndef MARK_WEAVE_IMPL_H
#define MARK_WEAVE_IMPL_H
#include <string>
#include <string_view>
#include <optional>
#include <nlohmann/json.hpp>
#include <tao/pegtl/memory_input.hpp>
#include "mark_weave/IntegralTypes.h"

namespace mw_impl {
	namespace peggi = TAO_PEGTL_NAMESPACE;
	using input_t = peggi::memory_input<peggi::tracking_mode::eager>;

	inline auto consumed(const input_t& input, std::string_view from) noexcept -> mark_weave::Offset {
		return static_cast<mark_weave::Offset>(input.current() - from.data());
	}

	// [ \t]* followed by a newline or the end of input
	bool tryWsEol(input_t& input) noexcept;
	bool tryBlankLine(input_t& input) noexcept;

	// a letter, then letters, digits, '-' or '_'
	auto tryDirectiveName(input_t& input) -> std::optional<std::string>;

	constexpr mark_weave::UInt MAX_FENCE_SIZE = 3;
	// whitespace followed by 1 to MAX_FENCE_SIZE non-whitespace characters that end the line
	auto tryFenceDecl(input_t& input) -> std::optional<std::string>;
	// a line consisting solely of the fence, surrounded by optional whitespace
	bool tryFenceLine(input_t& input, std::string_view fence) noexcept;

	// "..." with backslash escapes; the result is unescaped
	auto tryQuotedString(input_t& input) -> std::optional<std::string>;

	auto tryHoconKey(input_t& input) -> std::optional<std::string>;
	// true, false, null and numbers, which must end where an unquoted string would end
	auto tryHoconLiteral(input_t& input) -> std::optional<nlohmann::json>;
	// an unquoted string up to ',', '}', ']', '#' or a newline, trailing whitespace trimmed
	auto tryHoconUnquoted(input_t& input) -> std::optional<std::string>;
	// whitespace, newlines and '#' or '//' comments
	void skipHoconWs(input_t& input) noexcept;
}
#endif
