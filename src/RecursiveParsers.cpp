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

#include "mark_weave/RecursiveParsers.h"
#include <fmt/format.h>
#include <plog/Log.h>

auto mark_weave::RecursiveParsers::parseSpans(const std::string& source, NestLevel level) const -> std::vector<Element> {
	auto res = recursiveSpans().parse(SourcePosition{ source, level });
	if (!res) {
		return { elements::invalidSpan(res.failure().message, source) };
	}
	return std::move(res.result());
}

auto mark_weave::RecursiveParsers::parseBlocks(const std::string& source, NestLevel level) const -> std::vector<Element> {
	auto res = recursiveBlocks().parse(SourcePosition{ source, level });
	if (!res) {
		return { elements::invalidBlock(res.failure().message, source) };
	}
	return std::move(res.result());
}

auto mark_weave::nestingGuard(Parser<std::vector<Element>> p, NestLevel max) -> Parser<std::vector<Element>> {
	return Parser<std::vector<Element>>([p, max](const SourcePosition& in) -> Parsed<std::vector<Element>> {
		if (in.nestLevel() >= max) {
			PLOG_DEBUG << fmt::format("nesting limit {} reached at offset {}", max, in.offset());
			return Failure{ fmt::format("maximum nesting level of {} exceeded", max), in };
		}
		auto res = p.parse(in.nested());
		if (!res) {
			return Failure{ res.failure().message, in.atOffset(res.failure().pos.offset()), res.failure().maxOffset };
		}
		return Success<std::vector<Element>>{ std::move(res.result()), in.atOffset(res.next().offset()) };
	});
}
