#pragma once
#include <bit>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <numbers>
#include <optional>
#include <type_traits>

namespace tagged {
enum class Sign : std::uint8_t { ePlus, eMinus };

enum class RoundingRule : std::uint8_t {
	eToNearestOrAwayFromZero,
	eToNearestOrEven,
	eUp,
	eDown,
	eTowardZero,
	eAwayFromZero,
};

///
/// \brief Floating point contract of a raw type.
///
/// Like std::numeric_limits, the primary template is unspecialized (is_specialized == false).
/// Specializations provide special values, decomposition, arithmetic helpers,
/// classification and comparison predicates; binary types also expose their bit patterns.
///
template <typename Type>
struct FloatTraits {
	static constexpr bool is_specialized = false;
	static constexpr bool is_binary = false;
};

template <typename Type>
concept FloatingPoint = FloatTraits<Type>::is_specialized;

template <typename Type>
concept BinaryFloatingPoint = FloatingPoint<Type> && FloatTraits<Type>::is_binary;

///
/// \brief IEEE 754 binary32 / binary64.
///
template <typename Type>
concept Ieee754 = (std::same_as<Type, float> || std::same_as<Type, double>) && std::numeric_limits<Type>::is_iec559;

template <Ieee754 Type>
struct FloatTraits<Type> {
	using exponent_type = int;
	using bits_type = std::conditional_t<sizeof(Type) == sizeof(std::uint32_t), std::uint32_t, std::uint64_t>;
	using signed_bits_type = std::make_signed_t<bits_type>;

	static constexpr bool is_specialized = true;
	static constexpr bool is_binary = true;
	static constexpr int radix = std::numeric_limits<Type>::radix;

	static constexpr int significand_bit_count = std::numeric_limits<Type>::digits - 1;
	static constexpr int exponent_bit_count = static_cast<int>(sizeof(Type)) * 8 - 1 - significand_bit_count;

	static constexpr bits_type sign_mask = bits_type{1} << (sizeof(Type) * 8 - 1);
	static constexpr bits_type exponent_mask = (bits_type{1} << exponent_bit_count) - 1;
	static constexpr bits_type significand_mask = (bits_type{1} << significand_bit_count) - 1;
	static constexpr bits_type quiet_bit = bits_type{1} << (significand_bit_count - 1);

	static constexpr Type nan() { return std::numeric_limits<Type>::quiet_NaN(); }
	static constexpr Type signaling_nan() { return std::numeric_limits<Type>::signaling_NaN(); }
	static constexpr Type infinity() { return std::numeric_limits<Type>::infinity(); }
	static constexpr Type greatest_finite_magnitude() { return std::numeric_limits<Type>::max(); }
	static constexpr Type least_normal_magnitude() { return std::numeric_limits<Type>::min(); }
	static constexpr Type least_nonzero_magnitude() { return std::numeric_limits<Type>::denorm_min(); }
	static constexpr Type pi() { return std::numbers::pi_v<Type>; }

	static constexpr bits_type bits(Type value) { return std::bit_cast<bits_type>(value); }
	static constexpr Type from_bits(bits_type bits) { return std::bit_cast<Type>(bits); }

	static constexpr Sign sign(Type value) { return (bits(value) & sign_mask) ? Sign::eMinus : Sign::ePlus; }

	static exponent_type exponent(Type value) {
		if (!std::isfinite(value)) { return std::numeric_limits<exponent_type>::max(); }
		if (value == Type{0}) { return std::numeric_limits<exponent_type>::min(); }
		return std::ilogb(value);
	}

	///
	/// \brief Magnitude scaled into [1, 2) for finite non-zero values.
	///
	static Type significand(Type value) {
		if (std::isnan(value)) { return nan(); }
		if (std::isinf(value)) { return infinity(); }
		if (value == Type{0}) { return Type{0}; }
		return std::scalbn(std::fabs(value), -std::ilogb(value));
	}

	static Type make(Sign sign, exponent_type exponent, Type significand) {
		auto const ret = std::scalbn(significand, exponent);
		return sign == Sign::eMinus ? -ret : ret;
	}

	static Type with_sign_of(Type sign_of, Type magnitude_of) { return std::copysign(magnitude_of, sign_of); }
	static Type magnitude(Type value) { return std::fabs(value); }

	static Type ulp(Type value) {
		if (!std::isfinite(value)) { return nan(); }
		if (std::isnormal(value)) { return std::scalbn(Type{1}, std::ilogb(value) - significand_bit_count); }
		return least_nonzero_magnitude();
	}

	template <std::integral Integer>
	static std::optional<Type> exactly(Integer value) {
		auto const ret = static_cast<Type>(value);
		auto const bound = std::ldexp(Type{1}, std::numeric_limits<Integer>::digits);
		auto const lower = std::is_signed_v<Integer> ? -bound : Type{0};
		if (ret < lower || ret >= bound) { return {}; }
		if (static_cast<Integer>(ret) != value) { return {}; }
		return ret;
	}

	static Type remainder(Type lhs, Type rhs) { return std::remainder(lhs, rhs); }
	static Type truncating_remainder(Type lhs, Type rhs) { return std::fmod(lhs, rhs); }
	static Type square_root(Type value) { return std::sqrt(value); }
	static Type add_product(Type value, Type lhs, Type rhs) { return std::fma(lhs, rhs, value); }
	static Type next_up(Type value) { return std::nextafter(value, infinity()); }

	static Type round(Type value, RoundingRule rule) {
		switch (rule) {
		case RoundingRule::eToNearestOrAwayFromZero: return std::round(value);
		case RoundingRule::eToNearestOrEven: {
			// remainder() rounds the quotient to even on ties
			if (!std::isfinite(value)) { return value; }
			return std::copysign(value - std::remainder(value, Type{1}), value);
		}
		case RoundingRule::eUp: return std::ceil(value);
		case RoundingRule::eDown: return std::floor(value);
		case RoundingRule::eAwayFromZero: return std::signbit(value) ? std::floor(value) : std::ceil(value);
		default:
		case RoundingRule::eTowardZero: return std::trunc(value);
		}
	}

	static bool is_normal(Type value) { return std::isnormal(value); }
	static bool is_finite(Type value) { return std::isfinite(value); }
	static bool is_zero(Type value) { return value == Type{0}; }
	static bool is_subnormal(Type value) { return std::fpclassify(value) == FP_SUBNORMAL; }
	static bool is_infinite(Type value) { return std::isinf(value); }
	static bool is_nan(Type value) { return std::isnan(value); }
	static bool is_signaling_nan(Type value) { return std::isnan(value) && (bits(value) & quiet_bit) == 0; }
	static constexpr bool is_canonical(Type) { return true; }

	static constexpr bool is_equal(Type lhs, Type rhs) { return lhs == rhs; }
	static constexpr bool is_less(Type lhs, Type rhs) { return lhs < rhs; }
	static constexpr bool is_less_or_equal(Type lhs, Type rhs) { return lhs <= rhs; }

	///
	/// \brief IEEE 754 totalOrder: -NaN < -inf < ... < -0 < +0 < ... < +inf < +NaN.
	///
	static constexpr bool is_totally_ordered_below_or_equal(Type lhs, Type rhs) { return total_order_key(lhs) <= total_order_key(rhs); }

	static constexpr Type make_from_bits(Sign sign, bits_type exponent_bits, bits_type significand_bits) {
		auto ret = (exponent_bits & exponent_mask) << significand_bit_count;
		ret |= significand_bits & significand_mask;
		if (sign == Sign::eMinus) { ret |= sign_mask; }
		return from_bits(ret);
	}

	static constexpr bits_type exponent_bit_pattern(Type value) { return (bits(value) >> significand_bit_count) & exponent_mask; }
	static constexpr bits_type significand_bit_pattern(Type value) { return bits(value) & significand_mask; }

	static Type binade(Type value) {
		if (!std::isfinite(value)) { return nan(); }
		constexpr auto keep = sign_mask | (exponent_mask << significand_bit_count);
		if (is_subnormal(value)) {
			constexpr auto scale = static_cast<Type>(bits_type{1} << significand_bit_count);
			return from_bits(bits(value * scale) & keep) / scale;
		}
		return from_bits(bits(value) & keep);
	}

	static int significand_width(Type value) {
		auto const pattern = significand_bit_pattern(value);
		auto const trailing = std::countr_zero(pattern);
		if (std::isnormal(value)) { return pattern == 0 ? 0 : significand_bit_count - trailing; }
		if (is_subnormal(value)) { return std::numeric_limits<bits_type>::digits - (trailing + std::countl_zero(pattern) + 1); }
		return -1;
	}

  private:
	// negative values have every non-sign bit flipped so that integer order matches totalOrder
	static constexpr signed_bits_type total_order_key(Type value) {
		auto const key = std::bit_cast<signed_bits_type>(value);
		return key ^ static_cast<signed_bits_type>(static_cast<bits_type>(key >> (sizeof(Type) * 8 - 1)) >> 1);
	}
};
} // namespace tagged
