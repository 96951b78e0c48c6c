#include <gtest/gtest.h>
#include <tagged/core/tagged.hpp>
#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numbers>

namespace {
using Metres = tagged::Tagged<struct MetresTag, double>;
using Feet = tagged::Tagged<struct FeetTag, double>;
using Ratio = tagged::Tagged<struct RatioTag, float>;
using Count = tagged::Tagged<struct CountTag, int>;

template <typename Lhs, typename Rhs>
concept Multipliable = requires(Lhs lhs, Rhs rhs) { lhs * rhs; };

static_assert(tagged::FloatingPoint<double>);
static_assert(tagged::BinaryFloatingPoint<float>);
static_assert(!tagged::FloatingPoint<int>);
static_assert(tagged::FloatingPoint<Metres>);
static_assert(tagged::BinaryFloatingPoint<Metres>);
static_assert(!tagged::FloatingPoint<Count>);
static_assert(Multipliable<Metres, Metres>);
static_assert(!Multipliable<Metres, Feet>);
static_assert(Metres::radix() == 2);
static_assert(Metres::exponent_bit_count() == 11 && Metres::significand_bit_count() == 52);
static_assert(Ratio::exponent_bit_count() == 8 && Ratio::significand_bit_count() == 23);

std::uint64_t bits(double value) { return std::bit_cast<std::uint64_t>(value); }

TEST(FloatingPoint, specialValues) {
	EXPECT_TRUE(std::isnan(Metres::nan().raw()));
	EXPECT_TRUE(std::isnan(Metres::signaling_nan().raw()));
	EXPECT_EQ(Metres::infinity().raw(), std::numeric_limits<double>::infinity());
	EXPECT_EQ(Metres::greatest_finite_magnitude().raw(), std::numeric_limits<double>::max());
	EXPECT_EQ(Metres::least_normal_magnitude().raw(), std::numeric_limits<double>::min());
	EXPECT_EQ(Metres::least_nonzero_magnitude().raw(), std::numeric_limits<double>::denorm_min());
	EXPECT_EQ(Metres::pi().raw(), std::numbers::pi);
	EXPECT_EQ(Ratio::pi().raw(), std::numbers::pi_v<float>);
}

TEST(FloatingPoint, arithmeticForwards) {
	for (double const a : {-2.5, 0.0, 0.1, 3.0}) {
		for (double const b : {-1.0, 0.3, 7.0}) {
			EXPECT_EQ((Metres{a} + Metres{b}).raw(), a + b);
			EXPECT_EQ((Metres{a} - Metres{b}).raw(), a - b);
			EXPECT_EQ((Metres{a} * Metres{b}).raw(), a * b);
			EXPECT_EQ((Metres{a} / Metres{b}).raw(), a / b);
		}
	}
	EXPECT_EQ((-Metres{2.0}).raw(), -2.0);

	auto value = Metres{3.0};
	value *= Metres{4.0};
	value /= Metres{8.0};
	EXPECT_EQ(value, Metres{1.5});
}

TEST(FloatingPoint, divisionByZeroIsRaw) {
	EXPECT_EQ((Metres{1.0} / Metres{0.0}).raw(), std::numeric_limits<double>::infinity());
	EXPECT_TRUE((Metres{0.0} / Metres{0.0}).is_nan());
	EXPECT_TRUE((Metres::nan() + Metres{1.0}).is_nan());
}

TEST(FloatingPoint, decomposition) {
	auto const value = Metres{-12.0};
	EXPECT_EQ(value.sign(), tagged::Sign::eMinus);
	EXPECT_EQ(Metres{0.0}.sign(), tagged::Sign::ePlus);
	EXPECT_EQ(Metres{-0.0}.sign(), tagged::Sign::eMinus);
	EXPECT_EQ(value.exponent(), 3);
	EXPECT_EQ(value.significand(), Metres{1.5});
	EXPECT_EQ(value.magnitude(), Metres{12.0});
	EXPECT_EQ(Metres::make(value.sign(), value.exponent(), value.significand()), value);
	EXPECT_EQ(Metres::with_sign_of(Metres{-1.0}, Metres{4.0}), Metres{-4.0});
	EXPECT_EQ(Metres{0.0}.exponent(), std::numeric_limits<int>::min());
	EXPECT_EQ(Metres::infinity().exponent(), std::numeric_limits<int>::max());
}

TEST(FloatingPoint, exactly) {
	EXPECT_EQ(Metres::exactly(42), Metres{42.0});
	EXPECT_EQ(Metres::exactly((std::int64_t{1} << 53) + 1), std::nullopt);
	EXPECT_EQ(Ratio::exactly(16777217), std::nullopt);
	EXPECT_EQ(Ratio::exactly(16777216), Ratio{16777216.0f});
}

TEST(FloatingPoint, remainders) {
	auto value = Metres{7.0};
	value.form_remainder(Metres{4.0});
	EXPECT_EQ(value.raw(), std::remainder(7.0, 4.0));
	EXPECT_EQ(value.raw(), -1.0);

	value = Metres{7.0};
	value.form_truncating_remainder(Metres{4.0});
	EXPECT_EQ(value.raw(), 3.0);

	EXPECT_EQ(Metres{-7.0}.truncating_remainder(Metres{4.0}).raw(), std::fmod(-7.0, 4.0));
	EXPECT_EQ(Metres{10.0}.remainder(Metres{3.0}).raw(), std::remainder(10.0, 3.0));
}

TEST(FloatingPoint, squareRootAndFma) {
	auto value = Metres{2.0};
	value.form_square_root();
	EXPECT_EQ(value.raw(), std::sqrt(2.0));
	EXPECT_EQ(Metres{16.0}.square_root(), Metres{4.0});

	auto sum = Metres{0.1};
	sum.add_product(Metres{0.2}, Metres{0.3});
	EXPECT_EQ(sum.raw(), std::fma(0.2, 0.3, 0.1));
}

TEST(FloatingPoint, nextUpAndUlp) {
	EXPECT_EQ(Metres{1.0}.next_up().raw(), std::nextafter(1.0, 2.0));
	EXPECT_EQ(Metres{-0.0}.next_up().raw(), std::numeric_limits<double>::denorm_min());
	EXPECT_EQ(Metres::infinity().next_up(), Metres::infinity());
	EXPECT_EQ(Metres{1.0}.ulp().raw(), std::numeric_limits<double>::epsilon());
	EXPECT_EQ(Metres{0.0}.ulp().raw(), std::numeric_limits<double>::denorm_min());
	EXPECT_TRUE(Metres::infinity().ulp().is_nan());
}

TEST(FloatingPoint, rounding) {
	using tagged::RoundingRule;
	struct Case {
		double value;
		double nearest_away;
		double nearest_even;
		double up;
		double down;
		double toward_zero;
		double away;
	};
	for (auto const& c : {
			 Case{2.5, 3.0, 2.0, 3.0, 2.0, 2.0, 3.0},
			 Case{3.5, 4.0, 4.0, 4.0, 3.0, 3.0, 4.0},
			 Case{-2.5, -3.0, -2.0, -2.0, -3.0, -2.0, -3.0},
			 Case{1.2, 1.0, 1.0, 2.0, 1.0, 1.0, 2.0},
			 Case{-1.7, -2.0, -2.0, -1.0, -2.0, -1.0, -2.0},
		 }) {
		auto const value = Metres{c.value};
		EXPECT_EQ(value.rounded(RoundingRule::eToNearestOrAwayFromZero).raw(), c.nearest_away) << c.value;
		EXPECT_EQ(value.rounded(RoundingRule::eToNearestOrEven).raw(), c.nearest_even) << c.value;
		EXPECT_EQ(value.rounded(RoundingRule::eUp).raw(), c.up) << c.value;
		EXPECT_EQ(value.rounded(RoundingRule::eDown).raw(), c.down) << c.value;
		EXPECT_EQ(value.rounded(RoundingRule::eTowardZero).raw(), c.toward_zero) << c.value;
		EXPECT_EQ(value.rounded(RoundingRule::eAwayFromZero).raw(), c.away) << c.value;
	}

	auto value = Metres{-0.4};
	value.round(RoundingRule::eToNearestOrEven);
	EXPECT_EQ(value.sign(), tagged::Sign::eMinus);
	EXPECT_TRUE(value.is_zero());
	EXPECT_TRUE(Metres::nan().rounded(RoundingRule::eToNearestOrEven).is_nan());
}

TEST(FloatingPoint, classification) {
	auto const subnormal = Metres::least_nonzero_magnitude();
	EXPECT_TRUE(Metres{1.0}.is_normal());
	EXPECT_FALSE(subnormal.is_normal());
	EXPECT_TRUE(subnormal.is_subnormal());
	EXPECT_TRUE(Metres{1.0}.is_finite());
	EXPECT_FALSE(Metres::infinity().is_finite());
	EXPECT_TRUE(Metres::infinity().is_infinite());
	EXPECT_TRUE(Metres{-0.0}.is_zero());
	EXPECT_TRUE(Metres::nan().is_nan());
	EXPECT_FALSE(Metres::nan().is_signaling_nan());
	EXPECT_TRUE(Metres::signaling_nan().is_signaling_nan());
	EXPECT_TRUE(Ratio::signaling_nan().is_signaling_nan());
	EXPECT_TRUE(Metres{1.0}.is_canonical());
}

TEST(FloatingPoint, comparisonPredicates) {
	EXPECT_TRUE(Metres{1.0}.is_equal(Metres{1.0}));
	EXPECT_TRUE(Metres{0.0}.is_equal(Metres{-0.0}));
	EXPECT_FALSE(Metres::nan().is_equal(Metres::nan()));
	EXPECT_TRUE(Metres{1.0}.is_less(Metres{2.0}));
	EXPECT_TRUE(Metres{2.0}.is_less_or_equal(Metres{2.0}));
	EXPECT_FALSE(Metres::nan().is_less_or_equal(Metres{2.0}));
}

TEST(FloatingPoint, totalOrder) {
	auto const nan = Metres::nan();
	auto const negative_nan = -Metres::nan();
	auto const inf = Metres::infinity();
	EXPECT_TRUE(Metres{-0.0}.is_totally_ordered_below_or_equal(Metres{0.0}));
	EXPECT_FALSE(Metres{0.0}.is_totally_ordered_below_or_equal(Metres{-0.0}));
	EXPECT_TRUE(inf.is_totally_ordered_below_or_equal(nan));
	EXPECT_FALSE(nan.is_totally_ordered_below_or_equal(inf));
	EXPECT_TRUE(negative_nan.is_totally_ordered_below_or_equal(-inf));
	EXPECT_TRUE(Metres{-2.0}.is_totally_ordered_below_or_equal(Metres{-1.0}));
	EXPECT_TRUE(Metres{1.0}.is_totally_ordered_below_or_equal(Metres{1.0}));
	EXPECT_TRUE(nan.is_totally_ordered_below_or_equal(nan));
}

TEST(FloatingPoint, bitPatterns) {
	auto const value = Metres{-1.5};
	EXPECT_EQ(value.exponent_bit_pattern(), 1023u);
	EXPECT_EQ(value.significand_bit_pattern(), std::uint64_t{1} << 51);
	EXPECT_EQ(Metres::make_from_bits(tagged::Sign::eMinus, 1023u, std::uint64_t{1} << 51), value);
	EXPECT_EQ(bits(Metres::make_from_bits(tagged::Sign::ePlus, 0u, 1u).raw()), 1u);
	EXPECT_EQ(Ratio{1.0f}.exponent_bit_pattern(), 127u);
}

TEST(FloatingPoint, binadeAndSignificandWidth) {
	EXPECT_EQ(Metres{-12.0}.binade(), Metres{-8.0});
	EXPECT_EQ(Metres{1.0}.binade(), Metres{1.0});
	auto const subnormal = Metres::least_nonzero_magnitude() * Metres{3.0};
	EXPECT_EQ(subnormal.binade(), Metres::least_nonzero_magnitude() * Metres{2.0});
	EXPECT_TRUE(Metres::infinity().binade().is_nan());

	EXPECT_EQ(Metres{1.0}.significand_width(), 0);
	EXPECT_EQ(Metres{1.5}.significand_width(), 1);
	EXPECT_EQ(Metres{1.25}.significand_width(), 2);
	EXPECT_EQ(Metres::least_nonzero_magnitude().significand_width(), 0);
	EXPECT_EQ(Metres{0.0}.significand_width(), -1);
}

TEST(FloatingPoint, nestedTagsForwardToInnerTag) {
	using Length = tagged::Tagged<struct LengthTag, Metres>;
	static_assert(sizeof(Length) == sizeof(double));
	auto const length = Length{Metres{9.0}};
	EXPECT_EQ(length.square_root().raw(), Metres{3.0});
	EXPECT_EQ(Length::pi().raw().raw(), std::numbers::pi);
	EXPECT_EQ(length.exponent_bit_pattern(), Metres{9.0}.exponent_bit_pattern());
	EXPECT_TRUE(Length::nan().is_nan());
	EXPECT_EQ((length * Length{Metres{2.0}}).raw(), Metres{18.0});
}
} // namespace
