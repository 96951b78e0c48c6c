#pragma once
#include <tagged/core/arithmetic.hpp>
#include <tagged/core/concepts.hpp>
#include <tagged/core/floating_point.hpp>
#include <tagged/core/literal.hpp>
#include <tagged/core/sequence.hpp>
#include <tagged/defines.hpp>
#include <compare>
#include <exception>
#include <functional>
#include <memory>
#include <utility>

namespace tagged {
template <typename Func, typename Arg>
using mapped_t = std::remove_cvref_t<std::invoke_result_t<Func, Arg>>;

///
/// \brief Raw value made a distinct type by a compile-time-only Tag.
///
/// Tag is never instantiated (it may be incomplete) and occupies no storage:
/// a Tagged<Tag, Raw> has exactly the layout of Raw. Values with different tags do not
/// convert into each other; use coerce() to re-tag explicitly.
///
/// Capabilities of Raw are forwarded only when Raw has them; each is a separate base:
/// AdditiveOps, FloatingPointOps, BinaryFloatingPointOps, SequenceOps, CollectionOps, StrideOps.
/// Equality, ordering and hashing (std::hash) are forwarded here.
///
template <typename Tag, typename Raw>
class TAGGED_EMPTY_BASES Tagged : public AdditiveOps<Tagged<Tag, Raw>, Raw>,
			   public FloatingPointOps<Tagged<Tag, Raw>, Raw>,
			   public BinaryFloatingPointOps<Tagged<Tag, Raw>, Raw>,
			   public SequenceOps<Tagged<Tag, Raw>, Raw>,
			   public CollectionOps<Tagged<Tag, Raw>, Raw>,
			   public StrideOps<Tagged<Tag, Raw>, Raw> {
  public:
	using tag_type = Tag;
	using raw_type = Raw;

	constexpr Tagged()
		requires(std::default_initializable<Raw>)
		: m_raw() {
		static_assert(sizeof(Tagged) == sizeof(Raw) && alignof(Tagged) == alignof(Raw));
	}

	explicit constexpr Tagged(Raw raw) : m_raw(std::move(raw)) { static_assert(sizeof(Tagged) == sizeof(Raw) && alignof(Tagged) == alignof(Raw)); }

	///
	/// \brief Explicit conversion from another arithmetic type (eg an int count into a floating point Raw).
	///
	/// Preferred over the literal constructor whenever both apply, so runtime values are accepted here.
	///
	template <ScalarLiteral Value>
		requires(LiteralFor<Raw, Value> && std::is_arithmetic_v<Raw>)
	explicit constexpr Tagged(Value value) : Tagged(static_cast<Raw>(value)) {}

	///
	/// \brief Construct Raw in place.
	///
	template <typename... Args>
		requires(std::constructible_from<Raw, Args...>)
	explicit constexpr Tagged(std::in_place_t, Args&&... args) : m_raw(std::forward<Args>(args)...) {}

	///
	/// \brief Implicit construction from a scalar literal (42, 1.5, true, 'c').
	///
	/// consteval: only constant expressions are accepted, runtime values need the explicit constructor.
	/// Only literal kinds Raw accepts without loss qualify: no 9.99 into an integer, no 2 into a bool,
	/// no integer out of Raw's range.
	///
	template <ScalarLiteral Literal>
		requires(LiteralFor<Raw, Literal>)
	consteval Tagged(Literal literal) : m_raw(from_literal<Raw>(literal)) {}

	///
	/// \brief Implicit construction from a string literal.
	///
	template <std::size_t N>
		requires(StringLiteralConstructible<Raw, N>)
	constexpr Tagged(char const (&literal)[N]) : m_raw(literal) {}

	///
	/// \brief Implicit construction from an array or key-value literal ({1, 2, 3}, {{"a", 1}}).
	///
	constexpr Tagged(std::initializer_list<literal_element_t<Raw>> elements)
		requires(std::constructible_from<Raw, std::initializer_list<literal_element_t<Raw>>>)
		: m_raw(elements) {}

	constexpr Raw& raw() & { return m_raw; }
	constexpr Raw const& raw() const& { return m_raw; }
	constexpr Raw&& raw() && { return std::move(m_raw); }

	constexpr Raw* operator->() { return std::addressof(m_raw); }
	constexpr Raw const* operator->() const { return std::addressof(m_raw); }

	///
	/// \brief Read a member of Raw without unwrapping.
	/// \param member Pointer to a data member or member function of Raw
	///
	template <typename Member>
		requires(std::invocable<Member, Raw const&>)
	constexpr decltype(auto) get(Member member) const {
		return std::invoke(member, m_raw);
	}

	///
	/// \brief Transform the raw value, keeping the tag.
	///
	template <typename Func>
	constexpr Tagged<Tag, mapped_t<Func, Raw const&>> map(Func&& func) const& {
		return Tagged<Tag, mapped_t<Func, Raw const&>>(std::invoke(std::forward<Func>(func), m_raw));
	}

	template <typename Func>
	constexpr Tagged<Tag, mapped_t<Func, Raw&&>> map(Func&& func) && {
		return Tagged<Tag, mapped_t<Func, Raw&&>>(std::invoke(std::forward<Func>(func), std::move(m_raw)));
	}

	///
	/// \brief Re-tag the raw value as Other, leaving it untouched.
	///
	/// The caller vouches that the value is meaningful under the new tag.
	///
	template <typename Other>
	constexpr Tagged<Other, Raw> coerce() const& {
		return Tagged<Other, Raw>(m_raw);
	}

	template <typename Other>
	constexpr Tagged<Other, Raw> coerce() && {
		return Tagged<Other, Raw>(std::move(m_raw));
	}

	char const* what() const noexcept
		requires(std::derived_from<Raw, std::exception>)
	{
		return m_raw.what();
	}

	constexpr decltype(auto) id() const
		requires(Identifiable<Raw>)
	{
		return m_raw.id();
	}

	friend constexpr bool operator==(Tagged const& lhs, Tagged const& rhs)
		requires(std::equality_comparable<Raw>)
	{
		return lhs.m_raw == rhs.m_raw;
	}

	friend constexpr auto operator<=>(Tagged const& lhs, Tagged const& rhs)
		requires(std::three_way_comparable<Raw>)
	{
		return lhs.m_raw <=> rhs.m_raw;
	}

	// Raw ordered by operator< alone
	friend constexpr bool operator<(Tagged const& lhs, Tagged const& rhs)
		requires(!std::three_way_comparable<Raw> && LessThanComparable<Raw>)
	{
		return lhs.m_raw < rhs.m_raw;
	}

	friend constexpr bool operator>(Tagged const& lhs, Tagged const& rhs)
		requires(!std::three_way_comparable<Raw> && LessThanComparable<Raw>)
	{
		return rhs.m_raw < lhs.m_raw;
	}

	friend constexpr bool operator<=(Tagged const& lhs, Tagged const& rhs)
		requires(!std::three_way_comparable<Raw> && LessThanComparable<Raw>)
	{
		return !(rhs.m_raw < lhs.m_raw);
	}

	friend constexpr bool operator>=(Tagged const& lhs, Tagged const& rhs)
		requires(!std::three_way_comparable<Raw> && LessThanComparable<Raw>)
	{
		return !(lhs.m_raw < rhs.m_raw);
	}

  private:
	Raw m_raw;
};

///
/// \brief Re-tag value as Other.
///
template <typename Other, TaggedType Type>
constexpr auto coerce(Type&& value) {
	return std::forward<Type>(value).template coerce<Other>();
}
} // namespace tagged

namespace std {
template <typename Tag, tagged::Hashable Raw>
struct hash<tagged::Tagged<Tag, Raw>> {
	std::size_t operator()(tagged::Tagged<Tag, Raw> const& value) const { return std::hash<Raw>{}(value.raw()); }
};
} // namespace std
