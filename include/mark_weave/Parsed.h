#ifndef MARK_WEAVE_PARSED_H
#define MARK_WEAVE_PARSED_H

#include <algorithm>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include "mark_weave/SourcePosition.h"
#include "markweave_export.h"

namespace mark_weave {

	template<typename T>
	struct Success {
		T result;
		SourcePosition next;
	};

	/**
	A parser failure. maxOffset is the furthest offset any attempted branch got to
	before giving up, which is not necessarily the offset of pos.
	*/
	struct Failure {
		std::string message;
		SourcePosition pos;
		Offset maxOffset;

		Failure(std::string msg, SourcePosition at) : message{ std::move(msg) }, pos{ std::move(at) }, maxOffset{ pos.offset() } {}
		Failure(std::string msg, SourcePosition at, Offset furthest)
			: message{ std::move(msg) }, pos{ std::move(at) }, maxOffset{ std::max(furthest, pos.offset()) } {}

		// [line.column] failure: message, followed by the offending line and a caret
		MARKWEAVE_EXPORT std::string describe() const;
	};

	// The furthest of two failures, keeping the largest maxOffset of both.
	MARKWEAVE_EXPORT Failure furthest(Failure a, Failure b);

	template<typename T>
	class Parsed {
	public:
		using value_type = T;

		Parsed(Success<T> s) : v_{ std::move(s) } {}
		Parsed(Failure f) : v_{ std::move(f) } {}

		bool isSuccess() const noexcept { return std::holds_alternative<Success<T>>(v_); }
		explicit operator bool() const noexcept { return isSuccess(); }

		const T& result() const { return std::get<Success<T>>(v_).result; }
		T& result() { return std::get<Success<T>>(v_).result; }
		const SourcePosition& next() const { return std::get<Success<T>>(v_).next; }
		const Failure& failure() const { return std::get<Failure>(v_); }
		Failure& failure() { return std::get<Failure>(v_); }

		Offset maxOffset() const noexcept {
			return isSuccess() ? next().offset() : failure().maxOffset;
		}

		template<typename F>
		auto map(F&& f) const& -> Parsed<std::decay_t<std::invoke_result_t<F, const T&>>> {
			if (isSuccess()) {
				return Success<std::decay_t<std::invoke_result_t<F, const T&>>>{ f(result()), next() };
			}
			return failure();
		}

		template<typename U>
		Parsed<U> castFailure() const { return failure(); }

	private:
		std::variant<Success<T>, Failure> v_;
	};
}

#endif
