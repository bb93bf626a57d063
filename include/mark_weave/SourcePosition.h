#ifndef MARK_WEAVE_SOURCE_POSITION_H
#define MARK_WEAVE_SOURCE_POSITION_H

#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "mark_weave/IntegralTypes.h"
#include "markweave_export.h"

namespace mark_weave {

	// Immutable input text shared by every position derived from it.
	class SourceText {
	public:
		MARKWEAVE_EXPORT explicit SourceText(std::string value);

		const std::string& value() const noexcept { return value_; }

		// Offsets of every line start, including the first line and the end of input.
		const std::vector<Offset>& lineStarts() const noexcept { return lineStarts_; }

	private:
		std::string value_;
		std::vector<Offset> lineStarts_;
	};

	struct LineColumn {
		UInt line;
		UInt column;
		std::string lineContent;

		MARKWEAVE_EXPORT std::string lineContentWithCaret() const;
		MARKWEAVE_EXPORT std::string toString() const;
	};

	/**
	An offset into a shared source text plus the markup nesting level it was reached at.
	Positions are values: every consume() returns a new position.
	*/
	class SourcePosition {
	public:
		MARKWEAVE_EXPORT explicit SourcePosition(std::string input, NestLevel nestLevel = 0);
		SourcePosition(std::shared_ptr<const SourceText> source, Offset offset, NestLevel nestLevel) noexcept
			: source_{ std::move(source) }, offset_{ offset }, nestLevel_{ nestLevel } {}

		bool atEnd() const noexcept { return offset_ >= source_->value().size(); }
		Offset offset() const noexcept { return offset_; }
		Offset remaining() const noexcept { return atEnd() ? 0 : source_->value().size() - offset_; }
		NestLevel nestLevel() const noexcept { return nestLevel_; }

		// pre: !atEnd()
		char peek() const noexcept { return source_->value()[offset_]; }
		// pre: relative < remaining()
		char charAt(Offset relative) const noexcept { return source_->value()[offset_ + relative]; }

		std::string_view input() const noexcept { return source_->value(); }
		std::string_view rest() const noexcept { return input().substr(offset_); }
		MARKWEAVE_EXPORT std::string_view capture(Offset numChars) const noexcept;
		// Source text between this position and a later one.
		MARKWEAVE_EXPORT std::string_view sliceTo(const SourcePosition& later) const noexcept;

		MARKWEAVE_EXPORT SourcePosition consume(Offset numChars) const noexcept;
		SourcePosition atOffset(Offset absolute) const noexcept { return { source_, absolute, nestLevel_ }; }
		SourcePosition nested() const noexcept { return { source_, offset_, static_cast<NestLevel>(nestLevel_ + 1) }; }

		MARKWEAVE_EXPORT LineColumn position() const;

		const std::shared_ptr<const SourceText>& source() const noexcept { return source_; }

	private:
		std::shared_ptr<const SourceText> source_;
		Offset offset_;
		NestLevel nestLevel_;
	};
}

#endif
