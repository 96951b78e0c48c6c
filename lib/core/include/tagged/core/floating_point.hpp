#pragma once
#include <tagged/core/concepts.hpp>
#include <tagged/core/float_traits.hpp>

namespace tagged {
///
/// \brief Floating point forwarding: empty unless Raw is FloatingPoint.
///
template <typename Derived, typename Raw>
struct FloatingPointOps {};

///
/// \brief Forwards the FloatTraits<Raw> contract, re-wrapping results of type Raw under the same tag.
///
template <typename Derived, FloatingPoint Raw>
struct FloatingPointOps<Derived, Raw> {
	using Traits = FloatTraits<Raw>;
	using exponent_type = typename Traits::exponent_type;

	static constexpr int radix() { return Traits::radix; }
	static constexpr Derived nan() { return Derived(Traits::nan()); }
	static constexpr Derived signaling_nan() { return Derived(Traits::signaling_nan()); }
	static constexpr Derived infinity() { return Derived(Traits::infinity()); }
	static constexpr Derived greatest_finite_magnitude() { return Derived(Traits::greatest_finite_magnitude()); }
	static constexpr Derived least_normal_magnitude() { return Derived(Traits::least_normal_magnitude()); }
	static constexpr Derived least_nonzero_magnitude() { return Derived(Traits::least_nonzero_magnitude()); }
	static constexpr Derived pi() { return Derived(Traits::pi()); }

	static Derived make(Sign sign, exponent_type exponent, Derived const& significand) { return Derived(Traits::make(sign, exponent, significand.raw())); }
	static Derived with_sign_of(Derived const& sign_of, Derived const& magnitude_of) { return Derived(Traits::with_sign_of(sign_of.raw(), magnitude_of.raw())); }

	///
	/// \brief Construct from an integer only if it is exactly representable.
	///
	template <std::integral Integer>
	static std::optional<Derived> exactly(Integer value) {
		if (auto const ret = Traits::exactly(value)) { return Derived(*ret); }
		return {};
	}

	Sign sign() const { return Traits::sign(underlying()); }
	exponent_type exponent() const { return Traits::exponent(underlying()); }
	Derived significand() const { return Derived(Traits::significand(underlying())); }
	Derived magnitude() const { return Derived(Traits::magnitude(underlying())); }
	Derived ulp() const { return Derived(Traits::ulp(underlying())); }
	Derived next_up() const { return Derived(Traits::next_up(underlying())); }

	friend constexpr Derived operator-(Derived const& value) { return Derived(-value.raw()); }
	friend constexpr Derived operator*(Derived const& lhs, Derived const& rhs) { return Derived(lhs.raw() * rhs.raw()); }
	friend constexpr Derived operator/(Derived const& lhs, Derived const& rhs) { return Derived(lhs.raw() / rhs.raw()); }

	friend constexpr Derived& operator*=(Derived& lhs, Derived const& rhs) {
		lhs.raw() *= rhs.raw();
		return lhs;
	}

	friend constexpr Derived& operator/=(Derived& lhs, Derived const& rhs) {
		lhs.raw() /= rhs.raw();
		return lhs;
	}

	void form_remainder(Derived const& other) { underlying() = Traits::remainder(underlying(), other.raw()); }
	void form_truncating_remainder(Derived const& other) { underlying() = Traits::truncating_remainder(underlying(), other.raw()); }
	void form_square_root() { underlying() = Traits::square_root(underlying()); }
	void add_product(Derived const& lhs, Derived const& rhs) { underlying() = Traits::add_product(underlying(), lhs.raw(), rhs.raw()); }
	void round(RoundingRule rule) { underlying() = Traits::round(underlying(), rule); }

	Derived remainder(Derived const& other) const { return Derived(Traits::remainder(underlying(), other.raw())); }
	Derived truncating_remainder(Derived const& other) const { return Derived(Traits::truncating_remainder(underlying(), other.raw())); }
	Derived square_root() const { return Derived(Traits::square_root(underlying())); }
	Derived rounded(RoundingRule rule) const { return Derived(Traits::round(underlying(), rule)); }

	bool is_normal() const { return Traits::is_normal(underlying()); }
	bool is_finite() const { return Traits::is_finite(underlying()); }
	bool is_zero() const { return Traits::is_zero(underlying()); }
	bool is_subnormal() const { return Traits::is_subnormal(underlying()); }
	bool is_infinite() const { return Traits::is_infinite(underlying()); }
	bool is_nan() const { return Traits::is_nan(underlying()); }
	bool is_signaling_nan() const { return Traits::is_signaling_nan(underlying()); }
	bool is_canonical() const { return Traits::is_canonical(underlying()); }

	bool is_equal(Derived const& other) const { return Traits::is_equal(underlying(), other.raw()); }
	bool is_less(Derived const& other) const { return Traits::is_less(underlying(), other.raw()); }
	bool is_less_or_equal(Derived const& other) const { return Traits::is_less_or_equal(underlying(), other.raw()); }
	bool is_totally_ordered_below_or_equal(Derived const& other) const { return Traits::is_totally_ordered_below_or_equal(underlying(), other.raw()); }

  private:
	Raw& underlying() { return static_cast<Derived&>(*this).raw(); }
	Raw const& underlying() const { return static_cast<Derived const&>(*this).raw(); }
};

///
/// \brief Bit pattern forwarding: empty unless Raw is BinaryFloatingPoint.
///
template <typename Derived, typename Raw>
struct BinaryFloatingPointOps {};

template <typename Derived, BinaryFloatingPoint Raw>
struct BinaryFloatingPointOps<Derived, Raw> {
	using Traits = FloatTraits<Raw>;
	using bits_type = typename Traits::bits_type;

	static constexpr int exponent_bit_count() { return Traits::exponent_bit_count; }
	static constexpr int significand_bit_count() { return Traits::significand_bit_count; }

	static constexpr Derived make_from_bits(Sign sign, bits_type exponent_bits, bits_type significand_bits) {
		return Derived(Traits::make_from_bits(sign, exponent_bits, significand_bits));
	}

	constexpr bits_type exponent_bit_pattern() const { return Traits::exponent_bit_pattern(underlying()); }
	constexpr bits_type significand_bit_pattern() const { return Traits::significand_bit_pattern(underlying()); }
	Derived binade() const { return Derived(Traits::binade(underlying())); }
	int significand_width() const { return Traits::significand_width(underlying()); }

  private:
	constexpr Raw const& underlying() const { return static_cast<Derived const&>(*this).raw(); }
};

template <typename Type, typename Raw>
struct TaggedBinaryTraits {};

template <typename Type, BinaryFloatingPoint Raw>
struct TaggedBinaryTraits<Type, Raw> {
	using bits_type = typename FloatTraits<Raw>::bits_type;

	static constexpr int exponent_bit_count = FloatTraits<Raw>::exponent_bit_count;
	static constexpr int significand_bit_count = FloatTraits<Raw>::significand_bit_count;

	static constexpr Type make_from_bits(Sign sign, bits_type exponent_bits, bits_type significand_bits) {
		return Type::make_from_bits(sign, exponent_bits, significand_bits);
	}

	static constexpr bits_type exponent_bit_pattern(Type const& value) { return value.exponent_bit_pattern(); }
	static constexpr bits_type significand_bit_pattern(Type const& value) { return value.significand_bit_pattern(); }
	static Type binade(Type const& value) { return value.binade(); }
	static int significand_width(Type const& value) { return value.significand_width(); }
};

///
/// \brief Tagged floating point values are themselves FloatingPoint, so tags can nest.
///
template <typename Tag, FloatingPoint Raw>
struct FloatTraits<Tagged<Tag, Raw>> : TaggedBinaryTraits<Tagged<Tag, Raw>, Raw> {
	using Type = Tagged<Tag, Raw>;
	using exponent_type = typename FloatTraits<Raw>::exponent_type;

	static constexpr bool is_specialized = true;
	static constexpr bool is_binary = FloatTraits<Raw>::is_binary;
	static constexpr int radix = FloatTraits<Raw>::radix;

	static constexpr Type nan() { return Type::nan(); }
	static constexpr Type signaling_nan() { return Type::signaling_nan(); }
	static constexpr Type infinity() { return Type::infinity(); }
	static constexpr Type greatest_finite_magnitude() { return Type::greatest_finite_magnitude(); }
	static constexpr Type least_normal_magnitude() { return Type::least_normal_magnitude(); }
	static constexpr Type least_nonzero_magnitude() { return Type::least_nonzero_magnitude(); }
	static constexpr Type pi() { return Type::pi(); }

	static Sign sign(Type const& value) { return value.sign(); }
	static exponent_type exponent(Type const& value) { return value.exponent(); }
	static Type significand(Type const& value) { return value.significand(); }
	static Type make(Sign sign, exponent_type exponent, Type const& significand) { return Type::make(sign, exponent, significand); }
	static Type with_sign_of(Type const& sign_of, Type const& magnitude_of) { return Type::with_sign_of(sign_of, magnitude_of); }
	static Type magnitude(Type const& value) { return value.magnitude(); }
	static Type ulp(Type const& value) { return value.ulp(); }

	template <std::integral Integer>
	static std::optional<Type> exactly(Integer value) {
		return Type::exactly(value);
	}

	static Type remainder(Type const& lhs, Type const& rhs) { return lhs.remainder(rhs); }
	static Type truncating_remainder(Type const& lhs, Type const& rhs) { return lhs.truncating_remainder(rhs); }
	static Type square_root(Type const& value) { return value.square_root(); }

	static Type add_product(Type value, Type const& lhs, Type const& rhs) {
		value.add_product(lhs, rhs);
		return value;
	}

	static Type next_up(Type const& value) { return value.next_up(); }
	static Type round(Type const& value, RoundingRule rule) { return value.rounded(rule); }

	static bool is_normal(Type const& value) { return value.is_normal(); }
	static bool is_finite(Type const& value) { return value.is_finite(); }
	static bool is_zero(Type const& value) { return value.is_zero(); }
	static bool is_subnormal(Type const& value) { return value.is_subnormal(); }
	static bool is_infinite(Type const& value) { return value.is_infinite(); }
	static bool is_nan(Type const& value) { return value.is_nan(); }
	static bool is_signaling_nan(Type const& value) { return value.is_signaling_nan(); }
	static bool is_canonical(Type const& value) { return value.is_canonical(); }

	static bool is_equal(Type const& lhs, Type const& rhs) { return lhs.is_equal(rhs); }
	static bool is_less(Type const& lhs, Type const& rhs) { return lhs.is_less(rhs); }
	static bool is_less_or_equal(Type const& lhs, Type const& rhs) { return lhs.is_less_or_equal(rhs); }
	static bool is_totally_ordered_below_or_equal(Type const& lhs, Type const& rhs) { return lhs.is_totally_ordered_below_or_equal(rhs); }
};
} // namespace tagged
