#pragma once
#include <fmt/format.h>
#include <tagged/core/tagged.hpp>
#include <tagged/util/error.hpp>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace tagged {
template <typename Type>
concept Formattable = fmt::is_formattable<Type>::value;

///
/// \brief Raw types that can be rebuilt exactly from their own description.
///
template <typename Type>
concept LosslessStringConvertible = std::is_arithmetic_v<Type> || std::constructible_from<Type, std::string_view>;

///
/// \brief Description of the raw value; the tag contributes nothing.
///
template <typename Tag, Formattable Raw>
std::string to_string(Tagged<Tag, Raw> const& value) {
	return fmt::format("{}", value.raw());
}

///
/// \brief Parse text into a tagged value.
/// \returns Empty if text is not a complete description of a Raw
///
template <TaggedType Type>
	requires(LosslessStringConvertible<typename Type::raw_type>)
std::optional<Type> parse(std::string_view const text) {
	using Raw = typename Type::raw_type;
	if constexpr (std::same_as<Raw, bool>) {
		if (text == "true") { return Type(true); }
		if (text == "false") { return Type(false); }
		return {};
	} else if constexpr (std::same_as<Raw, char>) {
		// described as the character itself
		if (text.size() != 1) { return {}; }
		return Type(text.front());
	} else if constexpr (std::is_arithmetic_v<Raw>) {
		auto raw = Raw{};
		auto const* last = text.data() + text.size();
		auto const [ptr, ec] = std::from_chars(text.data(), last, raw);
		if (ec != std::errc{} || ptr != last) { return {}; }
		return Type(raw);
	} else {
		return Type(Raw(text));
	}
}

///
/// \brief Parse text into a tagged value.
/// \throws ParseError if text is not a complete description of a Raw
///
template <TaggedType Type>
	requires(LosslessStringConvertible<typename Type::raw_type>)
Type parse_or_throw(std::string_view const text) {
	if (auto ret = parse<Type>(text)) { return std::move(*ret); }
	throw ParseError{fmt::format("Failed to parse tagged value from [{}]", text)};
}
} // namespace tagged

///
/// \brief Formats a tagged value exactly like its raw value, format spec included.
///
template <typename Tag, typename Raw, typename Char>
	requires(fmt::is_formattable<Raw, Char>::value)
struct fmt::formatter<tagged::Tagged<Tag, Raw>, Char> : fmt::formatter<Raw, Char> {
	template <typename FormatContext>
	auto format(tagged::Tagged<Tag, Raw> const& value, FormatContext& ctx) const -> decltype(ctx.out()) {
		return fmt::formatter<Raw, Char>::format(value.raw(), ctx);
	}
};
