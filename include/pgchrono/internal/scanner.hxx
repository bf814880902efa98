/* Cursor for parsing text representations of temporal values.
 *
 * Do not include this header directly.  The pgchrono headers do it for you.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_SCANNER
#define PGCHRONO_H_SCANNER

#include <cstdint>
#include <string_view>

#include "pgchrono/except.hxx"
#include "pgchrono/internal/concat.hxx"
#include "pgchrono/strconv.hxx"


namespace pgchrono::internal
{
/// Left-to-right reader for a piece of text in some fixed format.
/** Any mismatch throws `conversion_error`, naming the kind of value (`what`)
 * and quoting the full input.
 */
class scanner final
{
public:
  scanner(std::string_view text, std::string_view what, sl loc) noexcept :
          m_text{text}, m_what{what}, m_loc{loc}
  {}

  [[nodiscard]] bool at_end() const noexcept
  {
    return m_pos >= std::size(m_text);
  }

  /// Next character, or a zero byte if there is none.
  [[nodiscard]] char peek() const noexcept
  {
    return at_end() ? '\0' : m_text[m_pos];
  }

  [[nodiscard]] std::string_view rest() const noexcept
  {
    return m_text.substr(m_pos);
  }

  /// Skip `c` if it's next.
  bool accept(char c) noexcept
  {
    if (peek() != c)
      return false;
    ++m_pos;
    return true;
  }

  /// Skip `word` if it's next.
  bool accept(std::string_view word) noexcept
  {
    if (not rest().starts_with(word))
      return false;
    m_pos += std::size(word);
    return true;
  }

  void expect(char c)
  {
    if (not accept(c))
      fail();
  }

  void expect_end()
  {
    if (not at_end())
      fail();
  }

  /// Number of consecutive digits starting at the current position.
  [[nodiscard]] std::size_t count_digits() const noexcept
  {
    std::size_t here{m_pos};
    while (here < std::size(m_text) and is_digit(m_text[here])) ++here;
    return here - m_pos;
  }

  /// Read an unsigned decimal number of `min_len` to `max_len` digits.
  std::int64_t digits(std::size_t min_len, std::size_t max_len = 18)
  {
    auto const len{count_digits()};
    if (len < min_len or len > max_len)
      fail();
    std::int64_t value{0};
    for (std::size_t i{0}; i < len; ++i)
      value = 10 * value + digit_to_number(m_text[m_pos++]);
    return value;
  }

  /// Read exactly `len` digits, even if more digits follow.
  std::int64_t fixed_digits(std::size_t len)
  {
    if (count_digits() < len)
      fail();
    std::int64_t value{0};
    for (std::size_t i{0}; i < len; ++i)
      value = 10 * value + digit_to_number(m_text[m_pos++]);
    return value;
  }

  /// Read an optionally signed decimal number.
  std::int64_t signed_digits()
  {
    bool const negative{accept('-')};
    if (not negative)
      accept('+');
    auto const value{digits(1)};
    return negative ? -value : value;
  }

  /// Read the digits of a decimal fraction, and scale them to nanoseconds.
  /** Accepts 1 to 9 digits.  The decimal point must already be consumed.
   */
  std::int64_t fraction_nanos()
  {
    auto const len{count_digits()};
    if (len < 1 or len > 9)
      fail();
    auto value{digits(len, len)};
    for (auto i{len}; i < 9; ++i) value *= 10;
    return value;
  }

  [[noreturn]] void fail() const
  {
    throw conversion_error{concat("Invalid ", m_what, ": '", m_text, "'."), m_loc};
  }

  [[nodiscard]] sl location() const noexcept { return m_loc; }

private:
  std::string_view m_text;
  std::string_view m_what;
  sl m_loc;
  std::size_t m_pos{0};
};
} // namespace pgchrono::internal
#endif
