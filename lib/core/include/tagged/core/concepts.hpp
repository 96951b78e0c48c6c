#pragma once
#include <concepts>
#include <cstddef>
#include <functional>
#include <ranges>
#include <type_traits>
#include <utility>

namespace tagged {
template <typename Tag, typename Raw>
class Tagged;

template <typename Type>
struct IsTagged : std::false_type {};

template <typename Tag, typename Raw>
struct IsTagged<Tagged<Tag, Raw>> : std::true_type {};

///
/// \brief Any instantiation of Tagged (ignoring cv-ref qualifiers).
///
template <typename Type>
concept TaggedType = IsTagged<std::remove_cvref_t<Type>>::value;

///
/// \brief Types with an enabled std::hash specialization.
///
template <typename Type>
concept Hashable = requires(Type const& t) {
	{ std::hash<Type>{}(t) } -> std::convertible_to<std::size_t>;
};

///
/// \brief Types ordered by operator< (with or without operator<=>).
///
template <typename Type>
concept LessThanComparable = requires(Type const& a, Type const& b) {
	{ a < b } -> std::convertible_to<bool>;
};

///
/// \brief Types with a zero (value-initialized) and closed addition / subtraction.
///
template <typename Type>
concept Additive = !std::same_as<Type, bool> && std::default_initializable<Type> && requires(Type a, Type const& b) {
	{ a + b } -> std::convertible_to<Type>;
	{ a - b } -> std::convertible_to<Type>;
	a += b;
	a -= b;
};

///
/// \brief Types that can be iterated.
///
template <typename Type>
concept Iterable = std::ranges::range<Type>;

///
/// \brief Types that can be walked multiple times with a stable, comparable position.
///
template <typename Type>
concept Collection = std::ranges::forward_range<Type const> && std::ranges::common_range<Type const>;

///
/// \brief Types where the difference of two values is a stride that can advance a value.
///
template <typename Type>
concept Strideable = requires(Type const& a, Type const& b) {
	b - a;
	{ a + (b - a) } -> std::convertible_to<Type>;
};

template <Strideable Type>
using stride_t = decltype(std::declval<Type const&>() - std::declval<Type const&>());

template <typename Type>
concept Identifiable = requires(Type const& t) { t.id(); };
} // namespace tagged
