#pragma once
#include <tagged/util/error.hpp>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <type_traits>
#include <utility>

namespace tagged {
///
/// \brief Types of scalar literals: bool, character, integer and floating point.
///
template <typename Type>
concept ScalarLiteral = std::is_arithmetic_v<Type>;

template <typename Raw, std::size_t N>
concept StringLiteralConstructible = !std::is_arithmetic_v<Raw> && std::convertible_to<char const (&)[N], Raw>;

///
/// \brief Element type of array / key-value literals (value_type), or an unusable placeholder.
///
struct NoElement {};

template <typename Raw>
struct LiteralElement {
	using type = NoElement;
};

template <typename Raw>
	requires(requires { typename Raw::value_type; })
struct LiteralElement<Raw> {
	using type = typename Raw::value_type;
};

template <typename Raw>
using literal_element_t = typename LiteralElement<Raw>::type;

///
/// \brief Literal kinds an arithmetic Raw accepts.
///
/// bool only from bool, integers only from integers (character literals included), floating point from any number.
///
template <typename Raw, typename Literal>
concept ArithmeticLiteral = std::is_arithmetic_v<Raw> && ScalarLiteral<Literal> && (std::same_as<Raw, bool> == std::same_as<Literal, bool>) &&
							(std::floating_point<Raw> || std::integral<Literal>);

///
/// \brief Scalar literals that implicitly construct Raw.
///
/// Non-arithmetic Raw types must accept the literal implicitly themselves.
///
template <typename Raw, typename Literal>
concept LiteralFor = ScalarLiteral<Literal> && ((std::is_arithmetic_v<Raw> && ArithmeticLiteral<Raw, Literal>) ||
												(!std::is_arithmetic_v<Raw> && std::convertible_to<Literal, Raw>));

///
/// \brief Whether an integer value survives conversion to Raw unchanged.
///
template <std::integral Raw, std::integral Value>
constexpr bool fits(Value const value) {
	auto const ret = static_cast<Raw>(value);
	return static_cast<Value>(ret) == value && (value < Value{}) == (ret < Raw{});
}

///
/// \brief Construct Raw from a scalar literal at compile time.
///
/// Integer literals that do not fit an integral Raw are rejected (evaluating the throw is ill-formed in a constant expression).
///
template <typename Raw, ScalarLiteral Literal>
	requires(LiteralFor<Raw, Literal>)
consteval Raw from_literal(Literal literal) {
	if constexpr (std::is_arithmetic_v<Raw>) {
		if constexpr (std::integral<Raw> && !std::same_as<Raw, bool>) {
			if (!fits<Raw>(literal)) { throw Error{"Integer literal out of range"}; }
		}
		return static_cast<Raw>(literal);
	} else {
		return literal;
	}
}
} // namespace tagged
