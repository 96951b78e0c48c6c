#pragma once
#include <tagged/core/concepts.hpp>
#include <iterator>
#include <ranges>

namespace tagged {
///
/// \brief Iteration forwarding: empty unless Raw is Iterable.
///
template <typename Derived, typename Raw>
struct SequenceOps {};

///
/// \brief Forwards begin() / end() to Raw; the wrapper is a range, never an iterator.
///
/// Elements are yielded exactly as Raw yields them (untagged).
///
template <typename Derived, Iterable Raw>
struct SequenceOps<Derived, Raw> {
	constexpr auto begin() { return std::ranges::begin(underlying()); }
	constexpr auto end() { return std::ranges::end(underlying()); }

	constexpr auto begin() const
		requires(std::ranges::range<Raw const>)
	{
		return std::ranges::begin(underlying());
	}

	constexpr auto end() const
		requires(std::ranges::range<Raw const>)
	{
		return std::ranges::end(underlying());
	}

	constexpr auto size() const
		requires(std::ranges::sized_range<Raw const>)
	{
		return std::ranges::size(underlying());
	}

	constexpr bool empty() const
		requires(std::ranges::sized_range<Raw const> || std::ranges::forward_range<Raw const>)
	{
		return std::ranges::empty(underlying());
	}

  private:
	constexpr Raw& underlying() { return static_cast<Derived&>(*this).raw(); }
	constexpr Raw const& underlying() const { return static_cast<Derived const&>(*this).raw(); }
};

///
/// \brief Positional access forwarding: empty unless Raw is a Collection.
///
template <typename Derived, typename Raw>
struct CollectionOps {};

///
/// \brief Forwards start / end index, index successor and subscript to Raw.
///
/// Index is the raw (const) iterator. Raw's own operator[] (eg positions in a vector, keys in a map)
/// is forwarded too, wherever it is callable.
///
template <typename Derived, Collection Raw>
struct CollectionOps<Derived, Raw> {
	using Index = std::ranges::iterator_t<Raw const>;
	using Element = std::ranges::range_value_t<Raw const>;

	constexpr Index start_index() const { return std::ranges::begin(underlying()); }
	constexpr Index end_index() const { return std::ranges::end(underlying()); }
	constexpr Index index_after(Index index) const { return std::ranges::next(index); }

	constexpr decltype(auto) operator[](Index index) const { return *index; }

	template <typename Key>
		requires(requires(Raw const& raw, Key&& key) { raw[std::forward<Key>(key)]; })
	constexpr decltype(auto) operator[](Key&& key) const {
		return underlying()[std::forward<Key>(key)];
	}

	template <typename Key>
		requires(requires(Raw& raw, Key&& key) { raw[std::forward<Key>(key)]; })
	constexpr decltype(auto) operator[](Key&& key) {
		return underlying()[std::forward<Key>(key)];
	}

  private:
	constexpr Raw& underlying() { return static_cast<Derived&>(*this).raw(); }
	constexpr Raw const& underlying() const { return static_cast<Derived const&>(*this).raw(); }
};

///
/// \brief Stride forwarding: empty unless Raw is Strideable.
///
template <typename Derived, typename Raw>
struct StrideOps {};

///
/// \brief distance_to() yields the raw stride (a measurement, untagged); advanced_by() keeps the tag.
///
template <typename Derived, Strideable Raw>
struct StrideOps<Derived, Raw> {
	using Stride = stride_t<Raw>;

	constexpr Stride distance_to(Derived const& other) const { return other.raw() - underlying(); }
	constexpr Derived advanced_by(Stride const& stride) const { return Derived(static_cast<Raw>(underlying() + stride)); }

  private:
	constexpr Raw const& underlying() const { return static_cast<Derived const&>(*this).raw(); }
};
} // namespace tagged
