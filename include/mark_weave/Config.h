#ifndef MARK_WEAVE_CONFIG_H
#define MARK_WEAVE_CONFIG_H

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "mark_weave/IntegralTypes.h"
#include "mark_weave/Parser.h"
#include "markweave_export.h"

namespace mark_weave {

	struct DecodingError {
		std::string message;
	};

	// A decoded value or the reason it could not be decoded.
	template<typename T>
	using Decoded = std::variant<T, DecodingError>;

	class Config {
	public:
		Config() : root_(nlohmann::json::object()) {}
		explicit Config(nlohmann::json root) : root_{ std::move(root) } {}

		// Resolves a dotted path (a.b.c) against nested objects.
		MARKWEAVE_EXPORT std::optional<nlohmann::json> get(std::string_view path) const;
		MARKWEAVE_EXPORT Config withValue(std::string_view path, nlohmann::json value) const;

		const nlohmann::json& root() const noexcept { return root_; }

	private:
		nlohmann::json root_;
	};

	template<typename T>
	struct ConfigDecoder;

	template<>
	struct ConfigDecoder<std::string> {
		MARKWEAVE_EXPORT static Decoded<std::string> decode(const nlohmann::json& value);
	};

	template<>
	struct ConfigDecoder<int> {
		MARKWEAVE_EXPORT static Decoded<int> decode(const nlohmann::json& value);
	};

	template<>
	struct ConfigDecoder<long> {
		MARKWEAVE_EXPORT static Decoded<long> decode(const nlohmann::json& value);
	};

	template<>
	struct ConfigDecoder<double> {
		MARKWEAVE_EXPORT static Decoded<double> decode(const nlohmann::json& value);
	};

	template<>
	struct ConfigDecoder<bool> {
		MARKWEAVE_EXPORT static Decoded<bool> decode(const nlohmann::json& value);
	};

	template<>
	struct ConfigDecoder<std::vector<std::string>> {
		MARKWEAVE_EXPORT static Decoded<std::vector<std::string>> decode(const nlohmann::json& value);
	};

	template<>
	struct ConfigDecoder<nlohmann::json> {
		static Decoded<nlohmann::json> decode(const nlohmann::json& value) { return value; }
	};

	// Text form of a value as it appears in rendered output: strings verbatim, everything else dumped.
	MARKWEAVE_EXPORT std::string renderValue(const nlohmann::json& value);

	/**
	The members of a HOCON-style object without its surrounding braces:
	key = value, key: value or key { ... }, separated by commas or newlines.
	Stops in front of the closing brace, which the caller handles.
	*/
	struct ObjectMember {
		std::string key;
		nlohmann::json value;
		std::string source;
	};
	MARKWEAVE_EXPORT Parser<std::vector<ObjectMember>> objectMembers();

	// Objects and arrays nested deeper than this inside an attribute section are a failure.
	constexpr UInt MAX_ATTRIBUTE_DEPTH = 64;

	// The position of the document being parsed within its tree, plus its configuration.
	struct DocumentCursor {
		std::string path;
		Config config;
	};

	struct ParserSettings {
		NestLevel maxNestLevel = 12;
		std::string defaultFence = "@:@";
		std::shared_ptr<const DocumentCursor> cursor;

		// {"settings": {"maxNestLevel": 12, "defaultFence": "@:@"}, "config": {...}, "path": "..."}
		MARKWEAVE_EXPORT static std::variant<ParserSettings, std::string> fromJson(const nlohmann::json& doc);
	};
}

#endif
