/* String conversion definitions.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgchrono/strconv instead.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_STRCONV
#define PGCHRONO_H_STRCONV

#if !defined(PGCHRONO_HEADER_PRE)
#  error "Include pgchrono headers as <pgchrono/header>, not <pgchrono/header.hxx>."
#endif

#include <cstring>
#include <span>
#include <string>
#include <string_view>

#include "pgchrono/except.hxx"
#include "pgchrono/types.hxx"


namespace pgchrono
{
/**
 * @defgroup stringconversion String conversion
 *
 * Every temporal value type has a text representation: the one PostgreSQL
 * accepts as input and, with `DateStyle` set to `ISO` and `IntervalStyle` set
 * to `iso_8601`, produces as output.  The SQL literals are built from these.
 *
 * Each conversion is defined by a specialisation of @c string_traits.  Until
 * you need top performance, all you need are @c pgchrono::to_string and
 * @c pgchrono::from_string.
 *
 * Text conversions are lossless: they keep up to 9 fractional digits of a
 * second.  It's the SQL literal renderer that insists on PostgreSQL's
 * microsecond resolution.
 */
//@{

/// Contextual parameters for string conversions implementations.
struct conversion_context final
{
  /// A `std::source_location` for the call.
  /** When pgchrono throws an error, it will generally try to include this
   * information to help you debug the problem.
   *
   * If you don't pass a source location, this will use the location in the
   * source code where you created this `ctx`.
   */
  sl loc = sl::current();

  constexpr conversion_context(sl lc = sl::current()) : loc{lc} {}
};


/// Convenience alias: `const` reference to a @ref pgchrono::conversion_context.
using ctx = conversion_context const &;


/// Traits class for use in string conversions.
/** There is a specialisation for each temporal value type that has a text
 * representation.
 */
template<typename TYPE> struct string_traits final
{
  /// Is conversion from `TYPE` to strings supported?
  static constexpr bool converts_to_string{false};

  /// Is conversion from `string_view` to `TYPE` supported?
  static constexpr bool converts_from_string{false};

  /// Return a @c string_view representing `value`.
  /** Uses `buf` to store the string's contents, if needed.  The resulting
   * view is valid for as long as the buffer remains accessible and
   * unmodified.
   *
   * @throws pgchrono::conversion_overrun if `buf` is not large enough.
   */
  [[nodiscard]] static inline std::string_view
  to_buf(std::span<char> buf, TYPE const &value, ctx = {});

  /// Write value's string representation into buffer.
  /** Writes starting exactly at the beginning of the buffer.  Returns the
   * number of bytes written.  There is no terminating zero.
   */
  static inline std::size_t
  into_buf(std::span<char> buf, TYPE const &value, ctx = {});

  /// Parse a string representation of a @c TYPE value.
  /** Throws @c conversion_error if @c text does not meet the expected format
   * for a value of this type.
   */
  [[nodiscard]] static inline TYPE
  from_string(std::string_view text, ctx = {});

  /// Estimate how much buffer space is needed to represent value.
  /** The estimate may be a little pessimistic, if it saves time.
   */
  [[nodiscard]] static inline std::size_t
  size_buffer(TYPE const &value) noexcept;
};


/// Represent `value` as text, optionally using `buf` as storage.
template<typename TYPE>
[[nodiscard]] inline std::string_view
to_buf(std::span<char> buf, TYPE const &value, ctx c = {})
{
  return string_traits<TYPE>::to_buf(buf, value, c);
}


/// Write a text representation of `value` into `buf`.
/** @return The number of text bytes written into `buf`.  There is no
 * terminating zero.
 */
template<typename TYPE>
inline std::size_t into_buf(std::span<char> buf, TYPE const &value, ctx c = {})
{
  return string_traits<TYPE>::into_buf(buf, value, c);
}


/// Estimate how much buffer space is needed to represent `value`.
template<typename TYPE>
[[nodiscard]] inline std::size_t size_buffer(TYPE const &value) noexcept
{
  return string_traits<TYPE>::size_buffer(value);
}


/// Parse a value in postgres' text format as a TYPE.
/** Only the kinds of strings that come out of PostgreSQL (with ISO date
 * style) and out of to_string() can be converted.  Whitespace is not stripped
 * away.
 */
template<typename TYPE>
[[nodiscard]] inline TYPE from_string(std::string_view text, ctx c = {})
{
  return string_traits<TYPE>::from_string(text, c);
}


/// Convert a value to a readable string that PostgreSQL will understand.
template<typename TYPE>
[[nodiscard]] inline std::string to_string(TYPE const &value, ctx c = {})
{
  std::string buf;
  buf.resize(string_traits<TYPE>::size_buffer(value));
  auto const len{string_traits<TYPE>::into_buf(buf, value, c)};
  buf.resize(len);
  return buf;
}
//@}
} // namespace pgchrono


namespace pgchrono::internal
{
/// Is `c` an ASCII digit?
[[nodiscard]] constexpr inline bool is_digit(int c) noexcept
{
  return (c >= '0') and (c <= '9');
}


/// Compute numeric value of given textual digit (assuming that it is a digit).
[[nodiscard]] constexpr int digit_to_number(char c) noexcept
{
  return c - '0';
}


/// Represent a single-digit number as text.
[[nodiscard]] constexpr char number_to_digit(int i) noexcept
{
  return static_cast<char>(i + '0');
}


/// Copy a fixed string into a buffer, returning the position right after it.
inline char *copy_into(char *here, std::string_view text) noexcept
{
  return here + text.copy(here, std::size(text));
}


/// Complain that `buf` is too small for what we need to write into it.
[[noreturn]] PGCHRONO_LIBEXPORT PGCHRONO_COLD void
throw_overrun(std::string_view what, sl loc);


/// Common `into_buf()` implementation: `to_buf()`, then move into place.
template<typename TYPE>
inline std::size_t
into_buf_via_to_buf(std::span<char> buf, TYPE const &value, ctx c)
{
  std::string_view const out{string_traits<TYPE>::to_buf(buf, value, c)};
  auto const sz{std::size(out)};
  // Source and destination may overlap.
  if (not std::empty(out)) [[likely]]
    std::memmove(std::data(buf), std::data(out), sz);
  return sz;
}
} // namespace pgchrono::internal
#endif
