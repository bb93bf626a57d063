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

#include "mark_weave/CharClassifier.h"
#include <algorithm>

namespace {
	bool isSetMode(const mark_weave::CharClassifier& c) noexcept {
		using mode_e = mark_weave::CharClassifier::mode_e;
		return not c.isNegated() and (c.mode() == mode_e::One or c.mode() == mode_e::Two or c.mode() == mode_e::Table);
	}
}

mark_weave::CharClassifier::CharClassifier() noexcept = default;

auto mark_weave::CharClassifier::of(std::string_view chars) -> CharClassifier {
	std::string unique{ chars };
	std::sort(unique.begin(), unique.end());
	unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

	CharClassifier res{};
	res.chars_ = unique;
	switch (unique.size()) {
	case 0:
		res.mode_ = mode_e::Nothing;
		break;
	case 1:
		res.mode_ = mode_e::One;
		res.c1_ = unique[0];
		break;
	case 2:
		res.mode_ = mode_e::Two;
		res.c1_ = unique[0];
		res.c2_ = unique[1];
		break;
	default: {
		UInt maxCode = 0;
		for (char c : unique) {
			maxCode = std::max<UInt>(maxCode, static_cast<unsigned char>(c));
		}
		auto table = std::make_shared<std::vector<bool>>(maxCode + 1, false);
		for (char c : unique) {
			(*table)[static_cast<unsigned char>(c)] = true;
		}
		res.mode_ = mode_e::Table;
		res.table_ = std::move(table);
		break;
	}
	}
	return res;
}

auto mark_weave::CharClassifier::range(char first, char last) -> CharClassifier {
	std::string chars;
	for (int c = static_cast<unsigned char>(first); c <= static_cast<unsigned char>(last); ++c) {
		chars.push_back(static_cast<char>(c));
	}
	return of(chars);
}

auto mark_weave::CharClassifier::predicate(predicate_type p) -> CharClassifier {
	CharClassifier res{ mode_e::Predicate };
	res.predicate_ = std::make_shared<const predicate_type>(std::move(p));
	return res;
}

auto mark_weave::CharClassifier::negate() const -> CharClassifier {
	CharClassifier res = *this;
	res.negated_ = not negated_;
	return res;
}

auto mark_weave::CharClassifier::add(const CharClassifier& other) const -> CharClassifier {
	if (isEmpty()) {
		return other;
	}
	if (other.isEmpty()) {
		return *this;
	}
	if (isSetMode(*this) and isSetMode(other)) {
		return of(chars_ + other.chars_);
	}
	CharClassifier left = *this;
	CharClassifier right = other;
	return predicate([left, right](char c) { return left(c) or right(c); });
}

namespace mark_weave::char_groups {
	const CharClassifier& digit() {
		static const CharClassifier group = CharClassifier::range('0', '9');
		return group;
	}

	const CharClassifier& alpha() {
		static const CharClassifier group = CharClassifier::range('a', 'z').add(CharClassifier::range('A', 'Z'));
		return group;
	}

	const CharClassifier& alphaNum() {
		static const CharClassifier group = alpha().add(digit());
		return group;
	}

	const CharClassifier& whitespace() {
		static const CharClassifier group = CharClassifier::of(" \t");
		return group;
	}

	const CharClassifier& wsOrNl() {
		static const CharClassifier group = CharClassifier::of(" \t\r\n");
		return group;
	}
}
