/* Efficient concatenation of strings and numbers.
 *
 * Do not include this header directly.  The pgchrono headers do it for you.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_CONCAT
#define PGCHRONO_H_CONCAT

#include <charconv>
#include <concepts>
#include <string>
#include <string_view>


namespace pgchrono::internal
{
/// Append a piece of text.
inline void append_to(std::string &out, std::string_view text)
{
  out.append(text);
}


/// Append a single character.
inline void append_to(std::string &out, char c)
{
  out.push_back(c);
}


/// Append the decimal representation of an integer.
template<std::integral T>
  requires(not std::same_as<T, char> and not std::same_as<T, bool>)
inline void append_to(std::string &out, T value)
{
  // Enough for a 64-bit value plus sign.
  char buf[24];
  auto const res{std::to_chars(std::begin(buf), std::end(buf), value)};
  out.append(std::begin(buf), res.ptr);
}


/// Efficiently combine a bunch of items into one big string.
/** Use this as an optimised version of string concatentation.  It takes just
 * about any type; it will represent text as-is and integers in decimal.
 */
template<typename... TYPE> [[nodiscard]] inline std::string concat(TYPE... item)
{
  std::string out;
  (append_to(out, item), ...);
  return out;
}
} // namespace pgchrono::internal
#endif
