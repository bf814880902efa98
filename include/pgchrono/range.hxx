/* Ranges over temporal values, and half-open intervals.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgchrono/range instead.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_RANGE
#define PGCHRONO_H_RANGE

#if !defined(PGCHRONO_HEADER_PRE)
#  error "Include pgchrono headers as <pgchrono/header>, not <pgchrono/header.hxx>."
#endif

#include <algorithm>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "pgchrono/internal/concat.hxx"
#include "pgchrono/strconv.hxx"
#include "pgchrono/time.hxx"


namespace pgchrono
{
/// An @e unlimited boundary value to a @c pgchrono::range.
/** Use this as a lower or upper bound for a range if the range should extend
 * to infinity on that side.
 */
struct no_bound
{
  template<typename TYPE>
  constexpr bool extends_down_to(TYPE const &) const noexcept
  {
    return true;
  }
  template<typename TYPE>
  constexpr bool extends_up_to(TYPE const &) const noexcept
  {
    return true;
  }
};


/// An @e inclusive boundary value to a @c pgchrono::range.
/** Use this as a lower or upper bound for a range if the range should include
 * the value.
 */
template<typename TYPE> class inclusive_bound
{
public:
  inclusive_bound() = delete;
  explicit inclusive_bound(TYPE const &value) : m_value{value} {}

  [[nodiscard]] TYPE const &get() const & noexcept { return m_value; }

  /// Would this bound, as a lower bound, include value?
  [[nodiscard]] bool extends_down_to(TYPE const &value) const
  {
    return not(value < m_value);
  }

  /// Would this bound, as an upper bound, include value?
  [[nodiscard]] bool extends_up_to(TYPE const &value) const
  {
    return not(m_value < value);
  }

private:
  TYPE m_value;
};


/// An @e exclusive boundary value to a @c pgchrono::range.
/** Use this as a lower or upper bound for a range if the range should @e not
 * include the value.
 */
template<typename TYPE> class exclusive_bound
{
public:
  exclusive_bound() = delete;
  explicit exclusive_bound(TYPE const &value) : m_value{value} {}

  [[nodiscard]] TYPE const &get() const & noexcept { return m_value; }

  /// Would this bound, as a lower bound, include value?
  [[nodiscard]] bool extends_down_to(TYPE const &value) const
  {
    return m_value < value;
  }

  /// Would this bound, as an upper bound, include value?
  [[nodiscard]] bool extends_up_to(TYPE const &value) const
  {
    return value < m_value;
  }

private:
  TYPE m_value;
};


/// A range boundary value.
/** A range bound is either no bound at all; or an inclusive bound; or an
 * exclusive bound.  Pass one of the three to the constructor.
 */
template<typename TYPE> class range_bound
{
public:
  range_bound() = delete;
  range_bound(no_bound) noexcept : m_bound{} {}
  range_bound(inclusive_bound<TYPE> const &bound) : m_bound{bound} {}
  range_bound(exclusive_bound<TYPE> const &bound) : m_bound{bound} {}

  bool operator==(range_bound const &rhs) const
  {
    if (this->is_limited())
      return (
        rhs.is_limited() and (this->is_inclusive() == rhs.is_inclusive()) and
        (*this->value() == *rhs.value()));
    else
      return not rhs.is_limited();
  }

  /// Is this a finite bound?
  [[nodiscard]] bool is_limited() const noexcept
  {
    return not std::holds_alternative<no_bound>(m_bound);
  }

  /// Is this boundary an inclusive one?
  [[nodiscard]] bool is_inclusive() const noexcept
  {
    return std::holds_alternative<inclusive_bound<TYPE>>(m_bound);
  }

  /// Is this boundary an exclusive one?
  [[nodiscard]] bool is_exclusive() const noexcept
  {
    return std::holds_alternative<exclusive_bound<TYPE>>(m_bound);
  }

  /// Would this bound, as a lower bound, include @c value?
  [[nodiscard]] bool extends_down_to(TYPE const &value) const
  {
    return std::visit(
      [&value](auto const &bound) { return bound.extends_down_to(value); },
      m_bound);
  }

  /// Would this bound, as an upper bound, include @c value?
  [[nodiscard]] bool extends_up_to(TYPE const &value) const
  {
    return std::visit(
      [&value](auto const &bound) { return bound.extends_up_to(value); },
      m_bound);
  }

  /// Return bound value, or @c nullptr if it's not limited.
  [[nodiscard]] TYPE const *value() const & noexcept
  {
    return std::visit(
      [](auto const &bound) noexcept {
        using bound_t = std::decay_t<decltype(bound)>;
        if constexpr (std::is_same_v<bound_t, no_bound>)
          return static_cast<TYPE const *>(nullptr);
        else
          return &bound.get();
      },
      m_bound);
  }

private:
  std::variant<no_bound, inclusive_bound<TYPE>, exclusive_bound<TYPE>> m_bound;
};


/// A C++ equivalent to PostgreSQL's range types.
/** PostgreSQL's temporal range types are `daterange`, `tsrange`, and
 * `tstzrange`.  For documentation, see:
 * https://www.postgresql.org/docs/current/rangetypes.html
 *
 * The value type must be copyable and default-constructible, and support the
 * less-than @c (<) and equals @c (==) comparisons.
 */
template<typename TYPE> class range
{
public:
  /// Create a range.
  /** For each of the two bounds, pass a @c no_bound, @c inclusive_bound, or
   * @c exclusive_bound.
   *
   * @throws range_error if the lower bound lies above the upper bound.
   */
  range(
    range_bound<TYPE> lower, range_bound<TYPE> upper,
    sl loc = sl::current()) :
          m_lower{std::move(lower)}, m_upper{std::move(upper)}
  {
    if (
      m_lower.is_limited() and m_upper.is_limited() and
      (*m_upper.value() < *m_lower.value()))
      throw range_error{
        internal::concat(
          "Range's lower bound (", to_string(*m_lower.value()),
          ") is greater than its upper bound (", to_string(*m_upper.value()),
          ")."),
        loc};
  }

  /// Create an empty range.
  /** SQL has a separate literal to denote an empty range, but any range which
   * encompasses no values is an empty range.
   */
  range() :
          m_lower{exclusive_bound<TYPE>{TYPE{}}},
          m_upper{exclusive_bound<TYPE>{TYPE{}}}
  {}

  bool operator==(range const &rhs) const
  {
    return (this->lower_bound() == rhs.lower_bound() and
            this->upper_bound() == rhs.upper_bound()) or
           (this->empty() and rhs.empty());
  }

  /// Is this range clearly empty?
  /** An empty range encompasses no values.
   *
   * It is possible to "fool" this.  For example, a date range with exclusive
   * bounds of one day and the next encompasses no values, but its @c empty()
   * will return false.  PostgreSQL, by contrast, will notice.
   */
  [[nodiscard]] bool empty() const
  {
    return (m_lower.is_exclusive() or m_upper.is_exclusive()) and
           m_lower.is_limited() and m_upper.is_limited() and
           not(*m_lower.value() < *m_upper.value());
  }

  /// Does this range encompass @c value?
  [[nodiscard]] bool contains(TYPE const &value) const
  {
    return m_lower.extends_down_to(value) and m_upper.extends_up_to(value);
  }

  [[nodiscard]] range_bound<TYPE> const &lower_bound() const & noexcept
  {
    return m_lower;
  }
  [[nodiscard]] range_bound<TYPE> const &upper_bound() const & noexcept
  {
    return m_upper;
  }

private:
  range_bound<TYPE> m_lower, m_upper;
};


/// A half-open interval between two instants: `[start, end)`.
/** Either end may be absent, meaning the interval is unbounded on that side.
 */
class PGCHRONO_LIBEXPORT interval
{
public:
  /// The interval covering all of time.
  interval() noexcept = default;

  /** @throws argument_error if `end` comes before `start`.
   */
  interval(
    std::optional<instant> start, std::optional<instant> end,
    sl loc = sl::current());

  [[nodiscard]] std::optional<instant> const &start() const noexcept
  {
    return m_start;
  }
  [[nodiscard]] std::optional<instant> const &end() const noexcept
  {
    return m_end;
  }

  [[nodiscard]] bool contains(instant const &when) const noexcept;

  /// The equivalent `tstzrange`: `[start, end)`, with absent ends unbounded.
  [[nodiscard]] range<instant> to_range() const;

  bool operator==(interval const &) const noexcept = default;

private:
  std::optional<instant> m_start, m_end;
};


/// A closed interval of dates: `[start, end]`.
class PGCHRONO_LIBEXPORT date_interval
{
public:
  /// The single day 1970-01-01.
  date_interval() noexcept = default;

  /** @throws argument_error if `end` comes before `start`.
   */
  date_interval(local_date start, local_date end, sl loc = sl::current());

  [[nodiscard]] local_date const &start() const noexcept { return m_start; }
  [[nodiscard]] local_date const &end() const noexcept { return m_end; }

  [[nodiscard]] bool contains(local_date const &day) const noexcept
  {
    return not(day < m_start) and not(m_end < day);
  }

  /// Number of days in the interval, counting both ends.
  [[nodiscard]] std::int64_t length() const noexcept
  {
    return m_end.days_since_epoch() - m_start.days_since_epoch() + 1;
  }

  /// The equivalent `daterange`: `[start, end]`.
  [[nodiscard]] range<local_date> to_range() const;

  bool operator==(date_interval const &) const noexcept = default;

private:
  local_date m_start, m_end;
};


/// String conversions for a @c range type.
/** Bounds come out unquoted.  On input, bounds may be double-quoted, as
 * PostgreSQL does for `tsrange` and `tstzrange` values containing spaces.
 */
template<typename TYPE> struct string_traits<range<TYPE>> final
{
  static constexpr bool converts_to_string{
    string_traits<TYPE>::converts_to_string};
  static constexpr bool converts_from_string{
    string_traits<TYPE>::converts_from_string};

  [[nodiscard]] static inline std::string_view
  to_buf(std::span<char> buf, range<TYPE> const &value, ctx c = {})
  {
    return {std::data(buf), into_buf(buf, value, c)};
  }

  static inline std::size_t
  into_buf(std::span<char> buf, range<TYPE> const &value, ctx c = {})
  {
    if (value.empty())
    {
      if (std::size(buf) < std::size(s_empty))
        internal::throw_overrun("range", c.loc);
      return s_empty.copy(std::data(buf), std::size(s_empty));
    }
    if (std::size(buf) < size_buffer(value))
      internal::throw_overrun("range", c.loc);

    std::size_t here{0};
    buf[here++] = value.lower_bound().is_inclusive() ? '[' : '(';
    if (TYPE const *lower{value.lower_bound().value()}; lower != nullptr)
      here += pgchrono::into_buf(buf.subspan(here), *lower, c);
    buf[here++] = ',';
    if (TYPE const *upper{value.upper_bound().value()}; upper != nullptr)
      here += pgchrono::into_buf(buf.subspan(here), *upper, c);
    buf[here++] = value.upper_bound().is_inclusive() ? ']' : ')';
    return here;
  }

  [[nodiscard]] static inline range<TYPE>
  from_string(std::string_view text, ctx c = {})
  {
    if (std::size(text) < 3)
      throw conversion_error{err_bad_input(text), c.loc};
    bool left_inc{false};
    switch (text[0])
    {
    case '[': left_inc = true; break;

    case '(': break;

    case 'e':
    case 'E':
      if (
        (std::size(text) != std::size(s_empty)) or
        (text[1] != 'm' and text[1] != 'M') or
        (text[2] != 'p' and text[2] != 'P') or
        (text[3] != 't' and text[3] != 'T') or
        (text[4] != 'y' and text[4] != 'Y'))
        throw conversion_error{err_bad_input(text), c.loc};
      return {};

    default: throw conversion_error{err_bad_input(text), c.loc};
    }

    std::size_t pos{1};
    auto const lower_text{parse_bound(text, pos, c)};
    if (pos >= std::size(text) or text[pos] != ',')
      throw conversion_error{err_bad_input(text), c.loc};
    ++pos;
    auto const upper_text{parse_bound(text, pos, c)};
    if (pos + 1 != std::size(text))
      throw conversion_error{err_bad_input(text), c.loc};
    bool right_inc{false};
    switch (text[pos])
    {
    case ']': right_inc = true; break;
    case ')': break;
    default: throw conversion_error{err_bad_input(text), c.loc};
    }

    auto const make_bound{
      [&c](std::optional<std::string> const &bound_text,
           bool inclusive) -> range_bound<TYPE> {
        if (not bound_text.has_value())
          return no_bound{};
        auto const value{pgchrono::from_string<TYPE>(*bound_text, c)};
        if (inclusive)
          return inclusive_bound<TYPE>{value};
        else
          return exclusive_bound<TYPE>{value};
      }};
    return {
      make_bound(lower_text, left_inc), make_bound(upper_text, right_inc),
      c.loc};
  }

  [[nodiscard]] static inline std::size_t
  size_buffer(range<TYPE> const &value) noexcept
  {
    TYPE const *lower{value.lower_bound().value()},
      *upper{value.upper_bound().value()};
    std::size_t const lsz{
      (lower == nullptr) ? 0 : pgchrono::size_buffer(*lower)},
      usz{(upper == nullptr) ? 0 : pgchrono::size_buffer(*upper)};
    return std::max(1 + lsz + 1 + usz + 1, std::size(s_empty));
  }

private:
  static constexpr std::string_view s_empty{"empty"};

  /// Compose error message for invalid range input.
  static std::string err_bad_input(std::string_view text)
  {
    return internal::concat("Invalid range input: '", text, "'.");
  }

  /// Parse one bound, starting at `pos`, and leave `pos` at the delimiter.
  /** Returns no value for an empty (unbounded) bound.  A bound may be
   * quoted, with backslash escapes and doubled quotes inside.
   */
  static std::optional<std::string>
  parse_bound(std::string_view text, std::size_t &pos, ctx c)
  {
    auto const end{std::size(text)};
    if (pos < end and text[pos] == '"')
    {
      std::string out;
      ++pos;
      for (;;)
      {
        if (pos >= end)
          throw conversion_error{err_bad_input(text), c.loc};
        char const ch{text[pos++]};
        if (ch == '\\')
        {
          if (pos >= end)
            throw conversion_error{err_bad_input(text), c.loc};
          out.push_back(text[pos++]);
        }
        else if (ch == '"')
        {
          if (pos < end and text[pos] == '"')
            out.push_back(text[pos++]);
          else
            break;
        }
        else
        {
          out.push_back(ch);
        }
      }
      return out;
    }

    auto const start{pos};
    while (pos < end and text[pos] != ',' and text[pos] != ')' and
           text[pos] != ']')
      ++pos;
    if (pos == start)
      return {};
    return std::string{text.substr(start, pos - start)};
  }
};


/// Text for an interval: the text for its `tstzrange`.
template<> struct PGCHRONO_LIBEXPORT string_traits<interval> final
{
  static constexpr bool converts_to_string{true};
  static constexpr bool converts_from_string{true};

  [[nodiscard]] static std::string_view
  to_buf(std::span<char> buf, interval const &value, ctx c = {})
  {
    return string_traits<range<instant>>::to_buf(buf, value.to_range(), c);
  }

  static std::size_t
  into_buf(std::span<char> buf, interval const &value, ctx c = {})
  {
    return string_traits<range<instant>>::into_buf(buf, value.to_range(), c);
  }

  /// Parse a `tstzrange`.  Only `[start,end)` shapes fit an interval.
  /** Also accepts `empty`, as an interval starting and ending at the epoch.
   */
  [[nodiscard]] static interval from_string(std::string_view text, ctx = {});

  [[nodiscard]] static std::size_t size_buffer(interval const &) noexcept
  {
    return 2 * string_traits<instant>::size_buffer(instant{}) + 3;
  }
};


/// Text for a date interval: the text for its `daterange`.
template<> struct PGCHRONO_LIBEXPORT string_traits<date_interval> final
{
  static constexpr bool converts_to_string{true};
  static constexpr bool converts_from_string{true};

  [[nodiscard]] static std::string_view
  to_buf(std::span<char> buf, date_interval const &value, ctx c = {})
  {
    return string_traits<range<local_date>>::to_buf(buf, value.to_range(), c);
  }

  static std::size_t
  into_buf(std::span<char> buf, date_interval const &value, ctx c = {})
  {
    return string_traits<range<local_date>>::into_buf(
      buf, value.to_range(), c);
  }

  /// Parse a `daterange`, with any combination of bound types.
  /** PostgreSQL normalises date ranges to `[start,end)` form.  That comes out
   * as the inclusive interval `start` to the day before `end`.
   */
  [[nodiscard]] static date_interval
  from_string(std::string_view text, ctx = {});

  [[nodiscard]] static std::size_t size_buffer(date_interval const &) noexcept
  {
    return 2 * string_traits<local_date>::size_buffer(local_date{}) + 3;
  }
};
} // namespace pgchrono
#endif
