#ifndef MARK_WEAVE_PREFIXED_PARSER_H
#define MARK_WEAVE_PREFIXED_PARSER_H

#include <array>
#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <fmt/format.h>
#include <plog/Log.h>
#include "mark_weave/CharClassifier.h"
#include "mark_weave/Parser.h"

namespace mark_weave {

	enum class Precedence : UTinyInt {
		High,
		Low
	};

	/**
	A parser that declares the characters a successful match may start with.
	With a non-empty start set it fails immediately on any other first character, without
	running the underlying parser. An empty start set makes the parser unconditional.
	*/
	template<typename T>
	class PrefixedParser : public Parser<T> {
	public:
		PrefixedParser(std::string startChars, Parser<T> underlying)
			: Parser<T>(guard(startChars, underlying)), startChars_{ normalize(std::move(startChars)) }, underlying_{ std::move(underlying) } {}

		static PrefixedParser unconditional(Parser<T> p) { return PrefixedParser{ std::string{}, std::move(p) }; }

		const std::string& startChars() const noexcept { return startChars_; }
		bool isUnconditional() const noexcept { return startChars_.empty(); }
		// The parser without the start character check.
		const Parser<T>& underlying() const noexcept { return underlying_; }

		template<typename F>
		auto mapPrefixed(F f) const -> PrefixedParser<std::decay_t<std::invoke_result_t<const F&, const T&>>> {
			using U = std::decay_t<std::invoke_result_t<const F&, const T&>>;
			return PrefixedParser<U>{ startChars_, underlying_.map(std::move(f)) };
		}

		// Alternation that keeps dispatch information: the start sets are merged.
		PrefixedParser orElsePrefixed(const PrefixedParser& other) const {
			if (isUnconditional() or other.isUnconditional()) {
				return unconditional(underlying_.orElse(other.underlying_));
			}
			return PrefixedParser{ startChars_ + other.startChars_, Parser<T>(*this).orElse(other) };
		}

	private:
		static std::string normalize(std::string chars) {
			std::sort(chars.begin(), chars.end());
			chars.erase(std::unique(chars.begin(), chars.end()), chars.end());
			return chars;
		}

		static typename Parser<T>::function_type guard(const std::string& startChars, Parser<T> underlying) {
			if (startChars.empty()) {
				return [underlying](const SourcePosition& in) { return underlying.parse(in); };
			}
			auto accepted = CharClassifier::of(startChars);
			return [accepted, underlying](const SourcePosition& in) -> Parsed<T> {
				if (in.atEnd()) {
					return Failure{ "unexpected end of input", in };
				}
				if (not accepted(in.peek())) {
					return Failure{ fmt::format("unexpected start character '{}'", in.peek()), in };
				}
				return underlying.parse(in);
			};
		}

		std::string startChars_;
		Parser<T> underlying_;
	};

	template<typename T>
	PrefixedParser<T> prefixed(std::string startChars, Parser<T> p) {
		return PrefixedParser<T>{ std::move(startChars), std::move(p) };
	}

	// A parser contributed by the host markup or by an extension, with its tier.
	template<typename T>
	struct ParserDefinition {
		PrefixedParser<T> parser;
		Precedence precedence = Precedence::High;
		bool isExtension = false;
	};

	/**
	Orders parser definitions for dispatch: High precedence extensions first, then High
	precedence host parsers, then Low host parsers, then Low extensions, each keeping
	registration order.
	*/
	template<typename T>
	std::vector<PrefixedParser<T>> orderByPrecedence(const std::vector<ParserDefinition<T>>& hostParsers,
		const std::vector<ParserDefinition<T>>& extensionParsers) {
		std::vector<PrefixedParser<T>> ordered;
		auto append = [&ordered](const std::vector<ParserDefinition<T>>& defs, Precedence tier) {
			for (const auto& def : defs) {
				if (def.precedence == tier) {
					ordered.push_back(def.parser);
				}
			}
		};
		append(extensionParsers, Precedence::High);
		append(hostParsers, Precedence::High);
		append(hostParsers, Precedence::Low);
		append(extensionParsers, Precedence::Low);
		return ordered;
	}

	/**
	Dispatches on the first character of the input in O(1).

	Parsers claiming the same start character are merged by ordered alternation. Parsers
	without start characters form the fallback, used only for characters nobody claimed.
	A group registered for a character is authoritative: its failure is the result.
	*/
	template<typename T>
	class PrefixedDispatch : public Parser<T> {
	public:
		explicit PrefixedDispatch(const std::vector<PrefixedParser<T>>& ordered)
			: PrefixedDispatch(buildTable(ordered)) {}

		// Every character some parser claimed, sorted.
		const std::string& startChars() const noexcept { return table_->startChars; }
		bool hasFallback() const noexcept { return table_->fallback.has_value(); }

		// The merged parser registered for c, if any.
		std::optional<Parser<T>> parserFor(char c) const {
			auto idx = table_->index[static_cast<unsigned char>(c)];
			if (idx < 0) {
				return std::nullopt;
			}
			return table_->groups[static_cast<std::size_t>(idx)];
		}

	private:
		struct Table {
			std::array<int, 256> index;
			std::vector<Parser<T>> groups;
			std::optional<Parser<T>> fallback;
			std::string startChars;
		};

		explicit PrefixedDispatch(std::shared_ptr<const Table> table)
			: Parser<T>(dispatch(table)), table_{ std::move(table) } {}

		static std::shared_ptr<const Table> buildTable(const std::vector<PrefixedParser<T>>& ordered) {
			auto table = std::make_shared<Table>();
			table->index.fill(-1);

			std::array<std::vector<Parser<T>>, 256> perChar;
			std::vector<Parser<T>> unconditional;
			for (const auto& p : ordered) {
				if (p.isUnconditional()) {
					unconditional.push_back(p.underlying());
					continue;
				}
				for (char c : p.startChars()) {
					perChar[static_cast<unsigned char>(c)].push_back(p.underlying());
				}
			}
			for (std::size_t c = 0; c < perChar.size(); ++c) {
				if (perChar[c].empty()) {
					continue;
				}
				PLOG_DEBUG << fmt::format("{} parser(s) registered for start character '{}'", perChar[c].size(), static_cast<char>(c));
				table->index[c] = static_cast<int>(table->groups.size());
				table->groups.push_back(perChar[c].size() == 1 ? perChar[c].front() : firstOf(perChar[c]));
				table->startChars.push_back(static_cast<char>(c));
			}
			if (not unconditional.empty()) {
				PLOG_DEBUG << fmt::format("{} unconditional fallback parser(s)", unconditional.size());
				table->fallback = unconditional.size() == 1 ? unconditional.front() : firstOf(unconditional);
			}
			return table;
		}

		static typename Parser<T>::function_type dispatch(std::shared_ptr<const Table> table) {
			return [table](const SourcePosition& in) -> Parsed<T> {
				if (not in.atEnd()) {
					auto idx = table->index[static_cast<unsigned char>(in.peek())];
					if (idx >= 0) {
						return table->groups[static_cast<std::size_t>(idx)].parse(in);
					}
				}
				if (table->fallback) {
					return table->fallback->parse(in);
				}
				if (in.atEnd()) {
					return Failure{ "unexpected end of input", in };
				}
				return Failure{ fmt::format("no parser registered for character '{}'", in.peek()), in };
			};
		}

		std::shared_ptr<const Table> table_;
	};
}

#endif
