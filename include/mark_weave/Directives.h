#ifndef MARK_WEAVE_DIRECTIVES_H
#define MARK_WEAVE_DIRECTIVES_H

#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>
#include <vector>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>
#include <plog/Log.h>
#include "mark_weave/Config.h"
#include "mark_weave/Elements.h"
#include "markweave_export.h"

namespace mark_weave {

	// Key of an attribute: the index of a positional attribute or the name of a named one.
	using AttributeKey = std::variant<UInt, std::string>;

	struct Attribute {
		AttributeKey key;
		nlohmann::json value;
	};

	/**
	A directive occurrence as it was written, before validation.
	Positional attributes come first in attributes, followed by the named ones in the
	order they were declared. A duplicate name keeps its first value and adds an entry
	to attributeErrors.
	*/
	struct ParsedDirective {
		std::string name;
		std::vector<Attribute> attributes;
		std::vector<std::string> attributeErrors;
		std::optional<std::string> body;
		std::string fence;
		std::string source;

		MARKWEAVE_EXPORT const nlohmann::json* positional(UInt index) const noexcept;
		MARKWEAVE_EXPORT const nlohmann::json* named(std::string_view key) const noexcept;
	};

	// What a validation error is about. Combined messages list positional attribute errors first, then named ones, then the rest.
	enum class error_origin : UTinyInt {
		PositionalAttribute, NamedAttribute, Body
	};

	// Messages and, at the same index, their origins.
	struct ValidationErrors {
		std::vector<std::string> messages;
		std::vector<error_origin> origins;

		void add(std::string message, error_origin origin) {
			messages.push_back(std::move(message));
			origins.push_back(origin);
		}
		void append(const ValidationErrors& other) {
			messages.insert(messages.end(), other.messages.begin(), other.messages.end());
			origins.insert(origins.end(), other.origins.begin(), other.origins.end());
		}
		bool empty() const noexcept { return messages.empty(); }
	};

	// A value or the complete, ordered list of problems found while producing it.
	template<typename T>
	class Validated {
	public:
		Validated(T value) : v_{ std::in_place_index<0>, std::move(value) } {}
		Validated(ValidationErrors errors) : v_{ std::in_place_index<1>, std::move(errors) } {}

		static Validated invalid(std::string message, error_origin origin = error_origin::Body) {
			ValidationErrors errors;
			errors.add(std::move(message), origin);
			return errors;
		}

		bool isValid() const noexcept { return v_.index() == 0; }
		const T& value() const { return std::get<0>(v_); }
		T& value() { return std::get<0>(v_); }
		const std::vector<std::string>& errors() const { return std::get<1>(v_).messages; }
		const ValidationErrors& failure() const { return std::get<1>(v_); }

	private:
		std::variant<T, ValidationErrors> v_;
	};

	using BodyParser = std::function<std::vector<Element>(const std::string&)>;

	// Everything a directive part may ask for while validating one occurrence.
	struct DirectiveContext {
		std::shared_ptr<const ParsedDirective> directive;
		// parses a body the way the directive's family does (blocks, spans or template spans)
		BodyParser parseBody;
		BodyParser parseSpans;
		std::shared_ptr<const DocumentCursor> cursor;
		// separators receive the content up to the next separator already parsed
		std::optional<std::vector<Element>> preParsedBody;
	};

	template<typename T>
	class DirectivePart {
	public:
		using value_type = T;
		using function_type = std::function<Validated<T>(const DirectiveContext&)>;

		explicit DirectivePart(function_type fn, bool hasBody = false, std::vector<std::string> separators = {}, error_origin origin = error_origin::Body)
			: fn_{ std::make_shared<const function_type>(std::move(fn)) }, hasBody_{ hasBody }, separators_{ std::move(separators) }, origin_{ origin } {}

		Validated<T> operator()(const DirectiveContext& ctx) const { return (*fn_)(ctx); }

		bool hasBody() const noexcept { return hasBody_; }
		// Names of the separator directives this part splits the body with.
		const std::vector<std::string>& separators() const noexcept { return separators_; }
		error_origin origin() const noexcept { return origin_; }

		template<typename F>
		auto map(F f) const -> DirectivePart<std::decay_t<std::invoke_result_t<const F&, const T&>>> {
			using U = std::decay_t<std::invoke_result_t<const F&, const T&>>;
			auto self = *this;
			return DirectivePart<U>([self, f](const DirectiveContext& ctx) -> Validated<U> {
				auto res = self(ctx);
				if (not res.isValid()) {
					return res.failure();
				}
				return f(res.value());
			}, hasBody_, separators_, origin_);
		}

		// Like map, but f may reject the value by returning a DecodingError.
		template<typename F>
		auto evalMap(F f) const -> DirectivePart<std::variant_alternative_t<0, std::decay_t<std::invoke_result_t<const F&, const T&>>>> {
			using U = std::variant_alternative_t<0, std::decay_t<std::invoke_result_t<const F&, const T&>>>;
			auto self = *this;
			return DirectivePart<U>([self, f](const DirectiveContext& ctx) -> Validated<U> {
				auto res = self(ctx);
				if (not res.isValid()) {
					return res.failure();
				}
				auto mapped = f(res.value());
				if (auto* err = std::get_if<DecodingError>(&mapped)) {
					return Validated<U>::invalid(err->message, self.origin());
				}
				return std::get<0>(std::move(mapped));
			}, hasBody_, separators_, origin_);
		}

	private:
		std::shared_ptr<const function_type> fn_;
		bool hasBody_;
		std::vector<std::string> separators_;
		error_origin origin_;
	};

	namespace detail {
		MARKWEAVE_EXPORT std::string describeKey(const AttributeKey& key);
		MARKWEAVE_EXPORT std::string missingAttributeMessage(const AttributeKey& key);
		MARKWEAVE_EXPORT std::string conversionMessage(const AttributeKey& key, const std::string& reason);
		MARKWEAVE_EXPORT const nlohmann::json* findAttribute(const ParsedDirective& directive, const AttributeKey& key) noexcept;
		MARKWEAVE_EXPORT error_origin originOf(const AttributeKey& key) noexcept;
		// The body as parsed elements, when there is one.
		MARKWEAVE_EXPORT std::optional<std::vector<Element>> bodyElements(const DirectiveContext& ctx);

		template<typename T>
		Validated<std::optional<T>> lookupAttribute(const AttributeKey& key, const DirectiveContext& ctx) {
			const nlohmann::json* raw = findAttribute(*ctx.directive, key);
			if (raw == nullptr) {
				return std::optional<T>{};
			}
			auto decoded = ConfigDecoder<T>::decode(*raw);
			if (auto* err = std::get_if<DecodingError>(&decoded)) {
				return Validated<std::optional<T>>::invalid(conversionMessage(key, err->message), originOf(key));
			}
			return std::optional<T>{ std::get<0>(std::move(decoded)) };
		}
	}

	/**
	A single attribute, decoded as T and required unless optional() is used.
	attribute(0) and attribute("name") start out as raw JSON; as<T>() picks the decoder.
	*/
	template<typename T>
	class AttributePart : public DirectivePart<T> {
	public:
		explicit AttributePart(AttributeKey key) : DirectivePart<T>(required(key), false, {}, detail::originOf(key)), key_{ std::move(key) } {}

		template<typename U>
		AttributePart<U> as() const { return AttributePart<U>{ key_ }; }

		DirectivePart<std::optional<T>> optional() const {
			auto key = key_;
			return DirectivePart<std::optional<T>>([key](const DirectiveContext& ctx) {
				return detail::lookupAttribute<T>(key, ctx);
			}, false, {}, detail::originOf(key));
		}

	private:
		static typename DirectivePart<T>::function_type required(AttributeKey key) {
			return [key](const DirectiveContext& ctx) -> Validated<T> {
				auto res = detail::lookupAttribute<T>(key, ctx);
				if (not res.isValid()) {
					return res.failure();
				}
				if (not res.value()) {
					return Validated<T>::invalid(detail::missingAttributeMessage(key), detail::originOf(key));
				}
				return std::move(*res.value());
			};
		}

		AttributeKey key_;
	};

	inline AttributePart<nlohmann::json> attribute(UInt index) { return AttributePart<nlohmann::json>{ AttributeKey{ index } }; }
	inline AttributePart<nlohmann::json> attribute(std::string name) { return AttributePart<nlohmann::json>{ AttributeKey{ std::move(name) } }; }

	struct Attributes {
		std::vector<nlohmann::json> positional;
		Config named;
	};

	MARKWEAVE_EXPORT DirectivePart<Attributes> allAttributes();
	MARKWEAVE_EXPORT DirectivePart<std::vector<Element>> parsedBody();
	MARKWEAVE_EXPORT DirectivePart<std::string> rawBody();
	// The body parser of the directive's family, for directives that parse text they produce themselves.
	MARKWEAVE_EXPORT DirectivePart<BodyParser> parser();
	MARKWEAVE_EXPORT DirectivePart<BodyParser> spanParser();
	MARKWEAVE_EXPORT DirectivePart<std::shared_ptr<const DocumentCursor>> cursor();

	template<typename T>
	DirectivePart<T> empty(T value) {
		return DirectivePart<T>([value](const DirectiveContext&) { return Validated<T>{ value }; });
	}

	/**
	Combines parts so that all of them are evaluated and all of their errors reported,
	in the order the parts were given.
	*/
	template<typename... Ts>
	class PartProduct {
	public:
		explicit PartProduct(DirectivePart<Ts>... parts) : parts_{ std::move(parts)... } {}

		template<typename F>
		auto mapN(F f) const -> DirectivePart<std::decay_t<std::invoke_result_t<const F&, const Ts&...>>> {
			using R = std::decay_t<std::invoke_result_t<const F&, const Ts&...>>;
			auto parts = parts_;
			bool hasBody = std::apply([](const auto&... p) { return (p.hasBody() or ...); }, parts_);
			std::vector<std::string> separators;
			std::apply([&separators](const auto&... p) {
				(separators.insert(separators.end(), p.separators().begin(), p.separators().end()), ...);
			}, parts_);

			return DirectivePart<R>([parts, f](const DirectiveContext& ctx) -> Validated<R> {
				auto results = std::apply([&ctx](const auto&... p) { return std::tuple<Validated<Ts>...>{ p(ctx)... }; }, parts);
				ValidationErrors errors;
				std::apply([&errors](const auto&... v) {
					((v.isValid() ? void() : errors.append(v.failure())), ...);
				}, results);
				if (not errors.empty()) {
					return errors;
				}
				return std::apply([&f](const auto&... v) { return Validated<R>{ f(v.value()...) }; }, results);
			}, hasBody, std::move(separators));
		}

	private:
		std::tuple<DirectivePart<Ts>...> parts_;
	};

	template<typename... Ps>
	PartProduct<typename Ps::value_type...> product(const Ps&... parts) {
		return PartProduct<typename Ps::value_type...>{ DirectivePart<typename Ps::value_type>(parts)... };
	}

	// A named sub-marker splitting the body of its parent directive.
	template<typename T>
	struct SeparatorDirective {
		std::string name;
		UInt min;
		UInt max;
		DirectivePart<T> part;
	};

	template<typename T>
	SeparatorDirective<T> separator(std::string name, UInt min, UInt max, DirectivePart<T> part) {
		if (min > max) {
			PLOG_WARNING << fmt::format("separator directive '{}' declares min {} above max {}, using max {}", name, min, max, min);
			max = min;
		}
		return SeparatorDirective<T>{ std::move(name), min, max, std::move(part) };
	}

	template<typename T>
	struct Multipart {
		std::vector<Element> mainBody;
		std::vector<T> children;
	};

	/**
	The parsed body split at every separator directive of the given set. Each separator is
	validated with its own part, receiving the content up to the next separator as its
	body, and the number of occurrences of each is checked against its bounds.
	*/
	template<typename T>
	DirectivePart<Multipart<T>> separatedBody(std::vector<SeparatorDirective<T>> separators) {
		std::vector<std::string> names;
		for (const auto& sep : separators) {
			names.push_back(sep.name);
		}
		return DirectivePart<Multipart<T>>([separators](const DirectiveContext& ctx) -> Validated<Multipart<T>> {
			auto body = detail::bodyElements(ctx);
			if (not body) {
				return Validated<Multipart<T>>::invalid("required body is missing");
			}

			Multipart<T> res;
			ValidationErrors errors;
			std::vector<UInt> counts(separators.size(), 0);
			std::optional<std::size_t> currentSep;
			std::shared_ptr<const ParsedDirective> currentMarker;
			std::vector<Element> currentContent;

			auto finishPart = [&]() {
				if (not currentSep) {
					return;
				}
				const auto& sep = separators[*currentSep];
				DirectiveContext sepCtx = ctx;
				sepCtx.directive = currentMarker;
				sepCtx.preParsedBody = std::move(currentContent);
				currentContent.clear();
				auto validated = sep.part(sepCtx);
				if (validated.isValid()) {
					res.children.push_back(std::move(validated.value()));
				}
				else {
					errors.add(fmt::format("One or more errors processing separator directive '{}': {}", sep.name, fmt::join(validated.errors(), ", ")),
						error_origin::Body);
				}
			};

			for (auto& el : *body) {
				if (const auto* marker = std::get_if<SeparatorInfo>(&el.crtrstc); marker and el.flavor == Element::type_e::SeparatorMarker) {
					auto found = std::find_if(separators.begin(), separators.end(), [&](const SeparatorDirective<T>& s) { return s.name == marker->directive->name; });
					if (found != separators.end()) {
						finishPart();
						currentSep = static_cast<std::size_t>(found - separators.begin());
						currentMarker = marker->directive;
						++counts[*currentSep];
						continue;
					}
				}
				(currentSep ? currentContent : res.mainBody).push_back(std::move(el));
			}
			finishPart();

			for (std::size_t i = 0; i < separators.size(); ++i) {
				if (counts[i] < separators[i].min) {
					errors.add(fmt::format("too few occurrences of separator directive '{}': expected min: {}, actual: {}", separators[i].name, separators[i].min, counts[i]),
						error_origin::Body);
				}
				if (counts[i] > separators[i].max) {
					errors.add(fmt::format("too many occurrences of separator directive '{}': expected max: {}, actual: {}", separators[i].name, separators[i].max, counts[i]),
						error_origin::Body);
				}
			}
			if (not errors.empty()) {
				return errors;
			}
			return res;
		}, true, std::move(names));
	}

	// A directive as registered for one family.
	struct Directive {
		std::string name;
		DirectivePart<Element> part;

		bool hasBody() const noexcept { return part.hasBody(); }
	};

	inline Directive createDirective(std::string name, DirectivePart<Element> part) {
		return Directive{ std::move(name), std::move(part) };
	}

	// Directives of one family by name, fixed at construction. The first registration of a name wins.
	class DirectiveRegistry {
	public:
		DirectiveRegistry() = default;
		MARKWEAVE_EXPORT explicit DirectiveRegistry(const std::vector<Directive>& directives);

		MARKWEAVE_EXPORT const Directive* find(std::string_view name) const;
		MARKWEAVE_EXPORT bool isSeparator(std::string_view name) const;
		bool empty() const noexcept { return byName_.empty(); }

	private:
		std::map<std::string, Directive, std::less<>> byName_;
		std::set<std::string, std::less<>> separators_;
	};
}

#endif
