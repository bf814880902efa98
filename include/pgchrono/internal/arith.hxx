/* Integer arithmetic helpers: floored division, overflow-checked operations.
 *
 * Do not include this header directly.  The pgchrono headers do it for you.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_ARITH
#define PGCHRONO_H_ARITH

#include <concepts>
#include <limits>

#include "pgchrono/except.hxx"
#include "pgchrono/internal/concat.hxx"


namespace pgchrono::internal
{
/// Integer division, rounding towards negative infinity.
template<std::signed_integral T>
[[nodiscard]] constexpr T floor_div(T num, T denom) noexcept
{
  T const q{static_cast<T>(num / denom)};
  return ((num % denom) != 0 and ((num < 0) != (denom < 0))) ?
           static_cast<T>(q - 1) :
           q;
}


/// Remainder to go with `floor_div`: always has the sign of `denom`.
template<std::signed_integral T>
[[nodiscard]] constexpr T floor_mod(T num, T denom) noexcept
{
  return static_cast<T>(num - floor_div(num, denom) * denom);
}


/// Would `lhs + rhs` overflow `T`?
template<std::signed_integral T>
[[nodiscard]] constexpr bool add_overflows(T lhs, T rhs) noexcept
{
  constexpr T top{std::numeric_limits<T>::max()},
    bottom{std::numeric_limits<T>::min()};
  return (rhs > 0 and lhs > top - rhs) or (rhs < 0 and lhs < bottom - rhs);
}


/// Would `lhs * rhs` overflow `T`?
template<std::signed_integral T>
[[nodiscard]] constexpr bool mul_overflows(T lhs, T rhs) noexcept
{
  constexpr T top{std::numeric_limits<T>::max()},
    bottom{std::numeric_limits<T>::min()};
  if (lhs == 0 or rhs == 0)
    return false;
  if (lhs > 0)
    return (rhs > 0) ? (lhs > top / rhs) : (rhs < bottom / lhs);
  else
    return (rhs > 0) ? (lhs < bottom / rhs) : (lhs < top / rhs);
}


/// Add two integers, or throw `range_error` if the result won't fit.
template<std::signed_integral T>
[[nodiscard]] constexpr T
checked_add(T lhs, T rhs, char const what[], sl loc = sl::current())
{
  if (add_overflows(lhs, rhs)) [[unlikely]]
    throw range_error{concat("Overflow in ", what, "."), loc};
  return static_cast<T>(lhs + rhs);
}


/// Multiply two integers, or throw `range_error` if the result won't fit.
template<std::signed_integral T>
[[nodiscard]] constexpr T
checked_mul(T lhs, T rhs, char const what[], sl loc = sl::current())
{
  if (mul_overflows(lhs, rhs)) [[unlikely]]
    throw range_error{concat("Overflow in ", what, "."), loc};
  return static_cast<T>(lhs * rhs);
}
} // namespace pgchrono::internal
#endif
