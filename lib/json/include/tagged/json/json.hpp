#pragma once
#include <djson/json.hpp>
#include <fmt/format.h>
#include <tagged/core/tagged.hpp>
#include <tagged/util/error.hpp>
#include <tagged/util/logger.hpp>
#include <cmath>
#include <concepts>
#include <limits>
#include <string>
#include <string_view>

namespace tagged {
///
/// \brief Raw types written as a single JSON value (boolean, number or string).
///
template <typename Type>
concept JsonScalar = std::is_arithmetic_v<Type> || std::same_as<Type, std::string>;

///
/// \brief Raw types with their own structured encoder: bool to_json(dj::Json&, Type const&), found by ADL.
///
template <typename Type>
concept JsonEncodable = requires(dj::Json& out, Type const& value) {
	{ to_json(out, value) } -> std::convertible_to<bool>;
};

///
/// \brief Raw types with their own structured decoder: bool from_json(dj::Json const&, Type&), found by ADL.
///
template <typename Type>
concept JsonDecodable = std::default_initializable<Type> && requires(dj::Json const& json, Type& out) {
	{ from_json(json, out) } -> std::convertible_to<bool>;
};

///
/// \brief Name of the kind of JSON value held (null, boolean, number, string, array, object).
///
std::string_view json_kind(dj::Json const& json);

namespace detail {
template <JsonScalar Raw>
void write_scalar(dj::Json& out, Raw const& raw) {
	if constexpr (std::same_as<Raw, bool>) {
		out = dj::Boolean{raw};
	} else {
		out = raw;
	}
}

template <JsonScalar Raw>
bool read_scalar(dj::Json const& json, Raw& out) {
	if constexpr (std::same_as<Raw, bool>) {
		if (!json.is_bool()) { return false; }
		out = json.as_bool().value;
	} else if constexpr (std::integral<Raw>) {
		if (!json.is_number()) { return false; }
		// must be a whole number within Raw's range
		auto const number = json.as<double>();
		auto const bound = std::ldexp(1.0, std::numeric_limits<Raw>::digits);
		auto const lower = std::is_signed_v<Raw> ? -bound : 0.0;
		if (std::trunc(number) != number || number < lower || number >= bound) { return false; }
		out = static_cast<Raw>(number);
	} else if constexpr (std::is_arithmetic_v<Raw>) {
		if (!json.is_number()) { return false; }
		out = json.as<Raw>();
	} else {
		if (!json.is_string()) { return false; }
		out = std::string{json.as_string()};
	}
	return true;
}
} // namespace detail

///
/// \brief Encode a tagged value: as a single value when Raw is scalar, else through Raw's own to_json.
///
template <typename Tag, typename Raw>
	requires(JsonScalar<Raw> || JsonEncodable<Raw>)
bool to_json(dj::Json& out, Tagged<Tag, Raw> const& value) {
	if constexpr (JsonScalar<Raw>) {
		detail::write_scalar(out, value.raw());
		return true;
	} else {
		return to_json(out, value.raw());
	}
}

///
/// \brief Decode a tagged value: as a single value first, then through Raw's own from_json.
///
/// The single value attempt is expected to fail for structured Raw types and is only logged.
/// \throws DecodeError if the structured attempt fails too (or Raw has no structured decoder)
///
template <typename Tag, typename Raw>
	requires(JsonScalar<Raw> || JsonDecodable<Raw>)
bool from_json(dj::Json const& json, Tagged<Tag, Raw>& out) {
	if constexpr (JsonScalar<Raw>) {
		if (detail::read_scalar(json, out.raw())) { return true; }
		logger::debug("[tagged] JSON {} is not a single value of the raw type, trying structured decoding", json_kind(json));
	}
	if constexpr (JsonDecodable<Raw>) {
		auto raw = Raw{};
		if (!from_json(json, raw)) { throw DecodeError{fmt::format("Structured decoding from JSON {} failed", json_kind(json))}; }
		out = Tagged<Tag, Raw>(std::move(raw));
		return true;
	} else {
		throw DecodeError{fmt::format("Cannot decode JSON {}: no structured decoder for the raw type", json_kind(json))};
	}
}

///
/// \brief Encode value into a new JSON document.
/// \throws EncodeError if Raw's structured encoder reports failure
///
template <TaggedType Type>
dj::Json encode(Type const& value) {
	auto ret = dj::Json{};
	if (!to_json(ret, value)) { throw EncodeError{"Structured encoding failed"}; }
	return ret;
}

template <TaggedType Type>
	requires(std::default_initializable<Type>)
Type decode(dj::Json const& json) {
	auto ret = Type{};
	if (!from_json(json, ret)) { throw DecodeError{fmt::format("Decoding from JSON {} failed", json_kind(json))}; }
	return ret;
}
} // namespace tagged
