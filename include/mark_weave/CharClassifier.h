#ifndef MARK_WEAVE_CHAR_CLASSIFIER_H
#define MARK_WEAVE_CHAR_CLASSIFIER_H

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "mark_weave/IntegralTypes.h"
#include "markweave_export.h"

namespace mark_weave {

	/**
	An immutable predicate over single characters.

	One or two characters are compared directly, larger sets use a lookup table sized to
	the highest character code of the set; anything above it classifies as false without
	touching the table. Arbitrary predicates are supported but lose the O(1) guarantee
	of the underlying test.
	*/
	class CharClassifier {
	public:
		using predicate_type = std::function<bool(char)>;

		enum class mode_e : UTinyInt {
			Nothing,
			One,
			Two,
			Table,
			Predicate,
			Everything
		};

		MARKWEAVE_EXPORT CharClassifier() noexcept;

		MARKWEAVE_EXPORT static CharClassifier of(std::string_view chars);
		MARKWEAVE_EXPORT static CharClassifier range(char first, char last);
		MARKWEAVE_EXPORT static CharClassifier predicate(predicate_type p);
		static CharClassifier everything() noexcept { return CharClassifier{ mode_e::Everything }; }
		static CharClassifier nothing() noexcept { return CharClassifier{}; }

		bool operator()(char c) const noexcept {
			return matches(c) != negated_;
		}

		MARKWEAVE_EXPORT CharClassifier negate() const;
		// Union of both character sets.
		MARKWEAVE_EXPORT CharClassifier add(const CharClassifier& other) const;

		mode_e mode() const noexcept { return mode_; }
		bool isNegated() const noexcept { return negated_; }
		bool isEmpty() const noexcept { return mode_ == mode_e::Nothing and not negated_; }

		// The enumerated characters of a non-negated set classifier, empty for predicates.
		const std::string& chars() const noexcept { return chars_; }

	private:
		explicit CharClassifier(mode_e mode) noexcept : mode_{ mode } {}

		bool matches(char c) const noexcept {
			switch (mode_) {
			case mode_e::Nothing:
				return false;
			case mode_e::One:
				return c == c1_;
			case mode_e::Two:
				return c == c1_ or c == c2_;
			case mode_e::Table: {
				auto code = static_cast<unsigned char>(c);
				return code < table_->size() and (*table_)[code];
			}
			case mode_e::Predicate:
				return (*predicate_)(c);
			case mode_e::Everything:
				return true;
			}
			return false;
		}

		mode_e mode_{ mode_e::Nothing };
		bool negated_{ false };
		char c1_{};
		char c2_{};
		std::string chars_;
		std::shared_ptr<const std::vector<bool>> table_;
		std::shared_ptr<const predicate_type> predicate_;
	};

	namespace char_groups {
		MARKWEAVE_EXPORT const CharClassifier& digit();
		MARKWEAVE_EXPORT const CharClassifier& alpha();
		MARKWEAVE_EXPORT const CharClassifier& alphaNum();
		MARKWEAVE_EXPORT const CharClassifier& whitespace();
		MARKWEAVE_EXPORT const CharClassifier& wsOrNl();
	}
}

#endif
