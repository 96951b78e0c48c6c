#pragma once
#include <tagged/core/concepts.hpp>

namespace tagged {
///
/// \brief Additive forwarding: empty unless Raw is Additive.
///
template <typename Derived, typename Raw>
struct AdditiveOps {};

///
/// \brief Forwards zero, +, -, += and -= to Raw.
///
/// Both operands must be the same Derived (same tag), so mixing tags does not compile.
///
template <typename Derived, Additive Raw>
struct AdditiveOps<Derived, Raw> {
	static constexpr Derived zero() { return Derived(Raw{}); }

	friend constexpr Derived operator+(Derived const& lhs, Derived const& rhs) { return Derived(static_cast<Raw>(lhs.raw() + rhs.raw())); }
	friend constexpr Derived operator-(Derived const& lhs, Derived const& rhs) { return Derived(static_cast<Raw>(lhs.raw() - rhs.raw())); }

	friend constexpr Derived& operator+=(Derived& lhs, Derived const& rhs) {
		lhs.raw() += rhs.raw();
		return lhs;
	}

	friend constexpr Derived& operator-=(Derived& lhs, Derived const& rhs) {
		lhs.raw() -= rhs.raw();
		return lhs;
	}
};
} // namespace tagged
