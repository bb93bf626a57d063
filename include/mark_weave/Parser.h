#ifndef MARK_WEAVE_PARSER_H
#define MARK_WEAVE_PARSER_H

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <fmt/format.h>
#include "mark_weave/Parsed.h"

namespace mark_weave {

	using Unit = std::monostate;

	/**
	A parser is a pure function from an input position to a Parsed<T>. Copies share the
	same underlying function, so parsers are cheap to pass around and safe to use from
	several threads at once.
	*/
	template<typename T>
	class Parser {
	public:
		using value_type = T;
		using function_type = std::function<Parsed<T>(const SourcePosition&)>;

		explicit Parser(function_type fn) : fn_{ std::make_shared<const function_type>(std::move(fn)) } {}

		Parsed<T> parse(const SourcePosition& in) const { return (*fn_)(in); }
		Parsed<T> parse(std::string input) const { return parse(SourcePosition{ std::move(input) }); }

		template<typename F>
		auto map(F f) const -> Parser<std::decay_t<std::invoke_result_t<const F&, const T&>>> {
			using U = std::decay_t<std::invoke_result_t<const F&, const T&>>;
			auto self = *this;
			return Parser<U>([self, f](const SourcePosition& in) -> Parsed<U> {
				auto res = self.parse(in);
				if (!res) {
					return res.failure();
				}
				return Success<U>{ f(res.result()), res.next() };
			});
		}

		// f produces the parser that continues from where this one stopped.
		template<typename F>
		auto flatMap(F f) const -> std::decay_t<std::invoke_result_t<const F&, const T&>> {
			using P = std::decay_t<std::invoke_result_t<const F&, const T&>>;
			using U = typename P::value_type;
			auto self = *this;
			return P([self, f](const SourcePosition& in) -> Parsed<U> {
				auto res = self.parse(in);
				if (!res) {
					return res.failure();
				}
				auto second = f(res.result()).parse(res.next());
				if (!second) {
					auto fail = second.failure();
					fail.maxOffset = std::max(fail.maxOffset, res.next().offset());
					return fail;
				}
				return second;
			});
		}

		// Ordered alternation; a failure of both keeps the one that got further.
		Parser<T> orElse(Parser<T> other) const {
			auto self = *this;
			return Parser<T>([self, other](const SourcePosition& in) -> Parsed<T> {
				auto first = self.parse(in);
				if (first) {
					return first;
				}
				auto second = other.parse(in);
				if (second) {
					return second;
				}
				return furthest(first.failure(), second.failure());
			});
		}

		template<typename U>
		Parser<U> as(U value) const {
			return map([value](const T&) { return value; });
		}

		Parser<Unit> discard() const {
			return map([](const T&) { return Unit{}; });
		}

		// The consumed input instead of the result.
		Parser<std::string> source() const {
			auto self = *this;
			return Parser<std::string>([self](const SourcePosition& in) -> Parsed<std::string> {
				auto res = self.parse(in);
				if (!res) {
					return res.failure();
				}
				return Success<std::string>{ std::string{ in.sliceTo(res.next()) }, res.next() };
			});
		}

		Parser<std::pair<T, std::string>> withSource() const {
			auto self = *this;
			return Parser<std::pair<T, std::string>>([self](const SourcePosition& in) -> Parsed<std::pair<T, std::string>> {
				auto res = self.parse(in);
				if (!res) {
					return res.failure();
				}
				return Success<std::pair<T, std::string>>{ { std::move(res.result()), std::string{ in.sliceTo(res.next()) } }, res.next() };
			});
		}

		// Replaces the message of a failure, keeping its position.
		Parser<T> withFailureMessage(std::string message) const {
			auto self = *this;
			return Parser<T>([self, message](const SourcePosition& in) -> Parsed<T> {
				auto res = self.parse(in);
				if (!res) {
					return Failure{ message, res.failure().pos, res.failure().maxOffset };
				}
				return res;
			});
		}

	private:
		std::shared_ptr<const function_type> fn_;
	};

	template<typename T>
	Parser<std::decay_t<T>> success(T value) {
		using U = std::decay_t<T>;
		return Parser<U>([value](const SourcePosition& in) -> Parsed<U> {
			return Success<U>{ value, in };
		});
	}

	template<typename T>
	Parser<T> failure(std::string message) {
		return Parser<T>([message](const SourcePosition& in) -> Parsed<T> {
			return Failure{ message, in };
		});
	}

	namespace detail {
		template<typename... Ts, std::size_t... Is>
		auto runSeq(const std::tuple<Parser<Ts>...>& parsers, const SourcePosition& in, std::index_sequence<Is...>) -> Parsed<std::tuple<Ts...>> {
			std::tuple<std::optional<Ts>...> values;
			SourcePosition curr = in;
			std::optional<Failure> failed;
			auto step = [&](auto& slot, const auto& parser) {
				if (failed) {
					return;
				}
				auto res = parser.parse(curr);
				if (!res) {
					failed = res.failure();
					return;
				}
				slot = std::move(res.result());
				curr = res.next();
			};
			(step(std::get<Is>(values), std::get<Is>(parsers)), ...);
			if (failed) {
				return *failed;
			}
			return Success<std::tuple<Ts...>>{ std::tuple<Ts...>{ std::move(*std::get<Is>(values))... }, curr };
		}
	}

	// Runs all parsers in order, collecting every result.
	template<typename... Ts>
	Parser<std::tuple<Ts...>> seq(Parser<Ts>... parsers) {
		auto all = std::make_tuple(std::move(parsers)...);
		return Parser<std::tuple<Ts...>>([all](const SourcePosition& in) {
			return detail::runSeq(all, in, std::index_sequence_for<Ts...>{});
		});
	}

	template<typename A, typename B>
	Parser<A> keepLeft(Parser<A> left, Parser<B> right) {
		return seq(std::move(left), std::move(right)).map([](const std::tuple<A, B>& t) { return std::get<0>(t); });
	}

	template<typename A, typename B>
	Parser<B> keepRight(Parser<A> left, Parser<B> right) {
		return seq(std::move(left), std::move(right)).map([](const std::tuple<A, B>& t) { return std::get<1>(t); });
	}

	template<typename T>
	Parser<std::optional<T>> opt(Parser<T> p) {
		return Parser<std::optional<T>>([p](const SourcePosition& in) -> Parsed<std::optional<T>> {
			auto res = p.parse(in);
			if (!res) {
				return Success<std::optional<T>>{ std::nullopt, in };
			}
			return Success<std::optional<T>>{ std::move(res.result()), res.next() };
		});
	}

	// Succeeds with the result of p without consuming any input.
	template<typename T>
	Parser<T> lookAhead(Parser<T> p) {
		return Parser<T>([p](const SourcePosition& in) -> Parsed<T> {
			auto res = p.parse(in);
			if (!res) {
				return res;
			}
			return Success<T>{ std::move(res.result()), in };
		});
	}

	template<typename T>
	Parser<Unit> notFollowedBy(Parser<T> p) {
		return Parser<Unit>([p](const SourcePosition& in) -> Parsed<Unit> {
			auto res = p.parse(in);
			if (res) {
				return Failure{ fmt::format("unexpected input '{}'", in.sliceTo(res.next())), in };
			}
			return Success<Unit>{ Unit{}, in };
		});
	}

	/**
	Ordered alternation over any number of candidates: returns the first success, or the
	failure that reached the furthest offset when none succeeds.
	*/
	template<typename T>
	Parser<T> firstOf(std::vector<Parser<T>> candidates) {
		return Parser<T>([candidates](const SourcePosition& in) -> Parsed<T> {
			std::optional<Failure> best;
			for (const auto& candidate : candidates) {
				auto res = candidate.parse(in);
				if (res) {
					return res;
				}
				best = best ? furthest(std::move(*best), std::move(res.failure())) : std::move(res.failure());
			}
			if (best) {
				return *best;
			}
			return Failure{ "no alternatives to try", in };
		});
	}

	// Builds the wrapped parser on first use. Used for recursive grammar definitions.
	template<typename T>
	Parser<T> lazily(std::function<Parser<T>()> factory) {
		struct Cell {
			std::once_flag once;
			std::optional<Parser<T>> parser;
		};
		auto cell = std::make_shared<Cell>();
		return Parser<T>([cell, factory](const SourcePosition& in) -> Parsed<T> {
			std::call_once(cell->once, [&] { cell->parser.emplace(factory()); });
			return cell->parser->parse(in);
		});
	}

	MARKWEAVE_EXPORT Parser<std::string> literal(std::string expected);

	MARKWEAVE_EXPORT Parser<Unit> eof();

	/**
	Repetition of a parser with optional bounds and separator.
	A zero-width success of the repeated parser ends the repetition without being
	counted, so repetition terminates on finite input.
	*/
	template<typename T>
	class Repeat : public Parser<std::vector<T>> {
	public:
		explicit Repeat(Parser<T> p, UInt min = 0, UInt max = UNBOUNDED, std::optional<Parser<Unit>> separator = std::nullopt)
			: Parser<std::vector<T>>(build(p, min, max, separator)), parser_{ std::move(p) }, min_{ min }, max_{ max }, separator_{ std::move(separator) } {}

		Repeat min(UInt n) const { return Repeat{ parser_, n, max_, separator_ }; }
		Repeat max(UInt n) const { return Repeat{ parser_, min_, n, separator_ }; }
		Repeat take(UInt n) const { return Repeat{ parser_, n, n, separator_ }; }

		template<typename S>
		Repeat sep(Parser<S> separator) const { return Repeat{ parser_, min_, max_, separator.discard() }; }

	private:
		static typename Parser<std::vector<T>>::function_type build(Parser<T> p, UInt min, UInt max, std::optional<Parser<Unit>> separator) {
			return [p, min, max, separator](const SourcePosition& in) -> Parsed<std::vector<T>> {
				std::vector<T> results;
				SourcePosition curr = in;
				std::optional<Failure> lastFailure;
				while (results.size() < max) {
					SourcePosition attempt = curr;
					if (separator and not results.empty()) {
						auto sepRes = separator->parse(curr);
						if (!sepRes) {
							lastFailure = sepRes.failure();
							break;
						}
						attempt = sepRes.next();
					}
					auto res = p.parse(attempt);
					if (!res) {
						lastFailure = res.failure();
						break;
					}
					if (res.next().offset() <= curr.offset()) {
						break;
					}
					results.push_back(std::move(res.result()));
					curr = res.next();
				}
				if (results.size() < min) {
					Offset reached = lastFailure ? lastFailure->maxOffset : curr.offset();
					return Failure{ fmt::format("expected at least {} occurrences, got only {}", min, results.size()), curr, reached };
				}
				return Success<std::vector<T>>{ std::move(results), curr };
			};
		}

		Parser<T> parser_;
		UInt min_;
		UInt max_;
		std::optional<Parser<Unit>> separator_;
	};

	template<typename T>
	Repeat<T> rep(Parser<T> p) {
		return Repeat<T>{ std::move(p) };
	}
}

#endif
