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

#include "mark_weave/SourcePosition.h"
#include <algorithm>
#include <fmt/format.h>

namespace mark_weave {

	SourceText::SourceText(std::string value) : value_{ std::move(value) }, lineStarts_{ 0 } {
		for (Offset pos = 0, len = value_.size(); pos < len; ++pos) {
			if (value_[pos] == '\n') {
				lineStarts_.push_back(pos + 1);
			}
		}
		lineStarts_.push_back(value_.size());
	}

	std::string LineColumn::lineContentWithCaret() const {
		return fmt::format("{}\n{: <{}}^", lineContent, "", column - 1);
	}

	std::string LineColumn::toString() const {
		return fmt::format("{}.{}", line, column);
	}

	SourcePosition::SourcePosition(std::string input, NestLevel nestLevel)
		: source_{ std::make_shared<const SourceText>(std::move(input)) }, offset_{ 0 }, nestLevel_{ nestLevel } {}

	std::string_view SourcePosition::capture(Offset numChars) const noexcept {
		return input().substr(std::min(offset_, input().size()), numChars);
	}

	std::string_view SourcePosition::sliceTo(const SourcePosition& later) const noexcept {
		if (later.offset_ <= offset_) {
			return {};
		}
		return capture(later.offset_ - offset_);
	}

	SourcePosition SourcePosition::consume(Offset numChars) const noexcept {
		if (numChars == 0) {
			return *this;
		}
		return { source_, std::min(offset_ + numChars, source_->value().size()), nestLevel_ };
	}

	LineColumn SourcePosition::position() const {
		const auto& starts = source_->lineStarts();
		// the last entry marks the end of input and never starts a line of its own
		auto it = std::upper_bound(starts.begin(), starts.end() - 1, offset_);
		auto lineIndex = static_cast<Offset>(std::distance(starts.begin(), it)) - 1;
		Offset lineStart = starts[lineIndex];
		Offset lineEnd = starts[lineIndex + 1];
		std::string content{ source_->value().substr(lineStart, lineEnd - lineStart) };
		if (!content.empty() && content.back() == '\n') {
			content.pop_back();
		}
		return { static_cast<UInt>(lineIndex + 1), static_cast<UInt>(offset_ - lineStart + 1), std::move(content) };
	}
}
