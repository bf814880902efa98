/* Calendar periods and fixed durations.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgchrono/period instead.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_PERIOD
#define PGCHRONO_H_PERIOD

#if !defined(PGCHRONO_HEADER_PRE)
#  error "Include pgchrono headers as <pgchrono/header>, not <pgchrono/header.hxx>."
#endif

#include <compare>
#include <cstdint>
#include <optional>
#include <utility>

#include "pgchrono/strconv.hxx"
#include "pgchrono/types.hxx"


namespace pgchrono
{
/// A calendar period: years, months, weeks, days, and time units.
/** The units are kept separately.  A period of one day is not the same as a
 * period of 24 hours, and a period of 90 minutes stays 90 minutes.
 *
 * Combine periods of different units by adding them up:
 * `period::from_years(1) + period::from_days(2)`.
 */
class PGCHRONO_LIBEXPORT period
{
public:
  constexpr period() noexcept = default;

  [[nodiscard]] static constexpr period zero() noexcept { return {}; }

  [[nodiscard]] static constexpr period from_years(std::int32_t n) noexcept
  {
    period p;
    p.m_years = n;
    return p;
  }
  [[nodiscard]] static constexpr period from_months(std::int32_t n) noexcept
  {
    period p;
    p.m_months = n;
    return p;
  }
  [[nodiscard]] static constexpr period from_weeks(std::int32_t n) noexcept
  {
    period p;
    p.m_weeks = n;
    return p;
  }
  [[nodiscard]] static constexpr period from_days(std::int32_t n) noexcept
  {
    period p;
    p.m_days = n;
    return p;
  }
  [[nodiscard]] static constexpr period from_hours(std::int64_t n) noexcept
  {
    period p;
    p.m_hours = n;
    return p;
  }
  [[nodiscard]] static constexpr period from_minutes(std::int64_t n) noexcept
  {
    period p;
    p.m_minutes = n;
    return p;
  }
  [[nodiscard]] static constexpr period from_seconds(std::int64_t n) noexcept
  {
    period p;
    p.m_seconds = n;
    return p;
  }
  [[nodiscard]] static constexpr period
  from_milliseconds(std::int64_t n) noexcept
  {
    period p;
    p.m_milliseconds = n;
    return p;
  }
  [[nodiscard]] static constexpr period
  from_nanoseconds(std::int64_t n) noexcept
  {
    period p;
    p.m_nanoseconds = n;
    return p;
  }

  /// Period of `n` ticks (of 100 nanoseconds each), stored as nanoseconds.
  /** @throws range_error if the nanoseconds don't fit in 64 bits.
   */
  [[nodiscard]] static period
  from_ticks(std::int64_t n, sl loc = sl::current());

  [[nodiscard]] constexpr std::int32_t years() const noexcept
  {
    return m_years;
  }
  [[nodiscard]] constexpr std::int32_t months() const noexcept
  {
    return m_months;
  }
  [[nodiscard]] constexpr std::int32_t weeks() const noexcept
  {
    return m_weeks;
  }
  [[nodiscard]] constexpr std::int32_t days() const noexcept
  {
    return m_days;
  }
  [[nodiscard]] constexpr std::int64_t hours() const noexcept
  {
    return m_hours;
  }
  [[nodiscard]] constexpr std::int64_t minutes() const noexcept
  {
    return m_minutes;
  }
  [[nodiscard]] constexpr std::int64_t seconds() const noexcept
  {
    return m_seconds;
  }
  [[nodiscard]] constexpr std::int64_t milliseconds() const noexcept
  {
    return m_milliseconds;
  }
  [[nodiscard]] constexpr std::int64_t nanoseconds() const noexcept
  {
    return m_nanoseconds;
  }

  [[nodiscard]] constexpr bool is_zero() const noexcept
  {
    return *this == period{};
  }

  /// Years and months, as a number of months.
  [[nodiscard]] constexpr std::int64_t total_months() const noexcept
  {
    return std::int64_t{m_years} * 12 + m_months;
  }

  /// Weeks and days, as a number of days.
  [[nodiscard]] constexpr std::int64_t total_days() const noexcept
  {
    return std::int64_t{m_weeks} * 7 + m_days;
  }

  /// All time units added up as nanoseconds, if that fits in 64 bits.
  [[nodiscard]] std::optional<std::int64_t> time_nanoseconds() const noexcept;

  /// Add up two periods, unit by unit.
  /** @throws range_error if any unit overflows.
   */
  [[nodiscard]] period operator+(period const &rhs) const;

  constexpr bool operator==(period const &) const noexcept = default;

private:
  std::int32_t m_years{0}, m_months{0}, m_weeks{0}, m_days{0};
  std::int64_t m_hours{0}, m_minutes{0}, m_seconds{0}, m_milliseconds{0},
    m_nanoseconds{0};
};


/// A fixed length of time, with nanosecond resolution.
/** Unlike a @ref period, a duration knows nothing about calendars: a day is
 * always exactly 24 hours.  Durations can be negative.  The magnitude is
 * limited to 2^24 days.
 */
class PGCHRONO_LIBEXPORT duration
{
public:
  static constexpr std::int64_t max_days{std::int64_t{1} << 24};

  constexpr duration() noexcept = default;

  [[nodiscard]] static constexpr duration zero() noexcept { return {}; }

  [[nodiscard]] static duration
  from_days(std::int64_t n, sl loc = sl::current());
  [[nodiscard]] static duration
  from_hours(std::int64_t n, sl loc = sl::current());
  [[nodiscard]] static duration
  from_minutes(std::int64_t n, sl loc = sl::current());
  [[nodiscard]] static duration
  from_seconds(std::int64_t n, sl loc = sl::current());
  [[nodiscard]] static duration
  from_milliseconds(std::int64_t n, sl loc = sl::current());
  [[nodiscard]] static duration
  from_ticks(std::int64_t n, sl loc = sl::current());
  [[nodiscard]] static duration
  from_nanoseconds(std::int64_t n, sl loc = sl::current());

  /// Whole days, truncated towards zero.
  [[nodiscard]] std::int64_t days() const noexcept;

  /// Hours into the last day, truncated towards zero: -23 to 23.
  [[nodiscard]] std::int64_t hours() const noexcept;

  /// Minutes into the last hour, truncated towards zero: -59 to 59.
  [[nodiscard]] std::int64_t minutes() const noexcept;

  /// Seconds into the last minute, truncated towards zero: -59 to 59.
  [[nodiscard]] std::int64_t seconds() const noexcept;

  /// Nanoseconds into the last second, with the duration's sign.
  [[nodiscard]] std::int64_t subsecond_nanoseconds() const noexcept;

  /// Days, rounded down.  The nanosecond-of-day counts up from there.
  [[nodiscard]] constexpr std::int64_t floor_days() const noexcept
  {
    return m_days;
  }
  [[nodiscard]] constexpr std::int64_t nanosecond_of_floor_day() const noexcept
  {
    return m_nanos;
  }

  [[nodiscard]] constexpr bool is_negative() const noexcept
  {
    return m_days < 0;
  }

  [[nodiscard]] duration operator+(duration const &rhs) const;
  [[nodiscard]] duration operator-(duration const &rhs) const;
  [[nodiscard]] duration operator-() const;

  constexpr auto operator<=>(duration const &) const noexcept = default;

private:
  /// Normalise, and check range.
  static duration
  make(std::int64_t days, std::int64_t nanos, char const what[], sl loc);

  /// Whole days and remaining nanoseconds, without sign.
  std::pair<std::int64_t, std::int64_t> magnitude() const noexcept;

  std::int64_t m_days{0};
  /// Nanoseconds into the day.  Always non-negative.
  std::int64_t m_nanos{0};
};


[[nodiscard]] PGCHRONO_LIBEXPORT duration
operator-(instant const &lhs, instant const &rhs);


/// ISO 8601 text for a period, as PostgreSQL's `iso_8601` style writes it.
/** Weeks fold into days.  The time units are added up and then split into
 * hours, minutes, and seconds, which all get the same sign.  Hours do not
 * carry over into days.  A zero period is `P0D`.
 *
 * @throws unrepresentable_value if the time units overflow 64-bit
 * nanoseconds.
 */
template<> struct PGCHRONO_LIBEXPORT string_traits<period> final
{
  static constexpr bool converts_to_string{true};
  static constexpr bool converts_from_string{true};

  [[nodiscard]] static std::string_view
  to_buf(std::span<char> buf, period const &value, ctx = {});

  static std::size_t
  into_buf(std::span<char> buf, period const &value, ctx c = {})
  {
    return internal::into_buf_via_to_buf(buf, value, c);
  }

  [[nodiscard]] static period from_string(std::string_view text, ctx = {});

  [[nodiscard]] static constexpr std::size_t
  size_buffer(period const &) noexcept
  {
    return 96;
  }
};


/// ISO 8601 text for a duration: hours, minutes, seconds, e.g. `PT26H3M`.
/** Days become hours.  A zero duration is `PT0S`.
 */
template<> struct PGCHRONO_LIBEXPORT string_traits<duration> final
{
  static constexpr bool converts_to_string{true};
  static constexpr bool converts_from_string{true};

  [[nodiscard]] static std::string_view
  to_buf(std::span<char> buf, duration const &value, ctx = {});

  static std::size_t
  into_buf(std::span<char> buf, duration const &value, ctx c = {})
  {
    return internal::into_buf_via_to_buf(buf, value, c);
  }

  [[nodiscard]] static duration
  from_string(std::string_view text, ctx = {});

  [[nodiscard]] static constexpr std::size_t
  size_buffer(duration const &) noexcept
  {
    return 48;
  }
};
} // namespace pgchrono
#endif
