/* Calendar, clock, and timeline value types.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgchrono/time instead.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_TIME
#define PGCHRONO_H_TIME

#if !defined(PGCHRONO_HEADER_PRE)
#  error "Include pgchrono headers as <pgchrono/header>, not <pgchrono/header.hxx>."
#endif

#include <chrono>
#include <compare>
#include <cstdint>

#include "pgchrono/strconv.hxx"
#include "pgchrono/types.hxx"


namespace pgchrono
{
/// A calendar date in the proleptic Gregorian calendar, without a time zone.
/** Years are astronomical: year 0 is 1 BC, year -1 is 2 BC, and so on.  The
 * supported years run from -9998 up to and including 9999.
 *
 * The earliest and latest supported dates double as sentinels: PostgreSQL
 * sees them as `-infinity` and `infinity`.
 */
class PGCHRONO_LIBEXPORT local_date
{
public:
  static constexpr int min_year{-9998};
  static constexpr int max_year{9999};

  /// The Unix epoch: 1970-01-01.
  constexpr local_date() noexcept = default;

  /// Create a date.
  /** @throws argument_error if there is no such date, or the year is out of
   * range.
   */
  local_date(int year, int month, int day, sl loc = sl::current());

  explicit local_date(
    std::chrono::year_month_day const &ymd, sl loc = sl::current());

  /// The date `days` days after 1970-01-01.
  [[nodiscard]] static local_date
  from_days_since_epoch(std::int64_t days, sl loc = sl::current());

  /// Is there such a date in our supported range?
  [[nodiscard]] static bool is_valid(int year, int month, int day) noexcept;

  [[nodiscard]] static constexpr local_date min() noexcept
  {
    return local_date{min_year, 1, 1, unchecked{}};
  }
  [[nodiscard]] static constexpr local_date max() noexcept
  {
    return local_date{max_year, 12, 31, unchecked{}};
  }

  [[nodiscard]] constexpr int year() const noexcept { return m_year; }
  [[nodiscard]] constexpr int month() const noexcept { return m_month; }
  [[nodiscard]] constexpr int day() const noexcept { return m_day; }

  [[nodiscard]] std::chrono::year_month_day ymd() const noexcept;
  [[nodiscard]] std::int64_t days_since_epoch() const noexcept;

  [[nodiscard]] local_date
  plus_days(std::int64_t days, sl loc = sl::current()) const;

  /// Add months.  Clips the day to the end of the month, if needed.
  [[nodiscard]] local_date
  plus_months(std::int64_t months, sl loc = sl::current()) const;

  [[nodiscard]] local_date
  plus_years(std::int64_t years, sl loc = sl::current()) const;

  constexpr auto operator<=>(local_date const &) const noexcept = default;

private:
  struct unchecked
  {};
  constexpr local_date(int year, int month, int day, unchecked) noexcept :
          m_year{year},
          m_month{static_cast<std::int8_t>(month)},
          m_day{static_cast<std::int8_t>(day)}
  {}

  std::int32_t m_year{1970};
  std::int8_t m_month{1};
  std::int8_t m_day{1};
};


/// A time of day, with nanosecond resolution, without a time zone.
class PGCHRONO_LIBEXPORT local_time
{
public:
  /// Midnight.
  constexpr local_time() noexcept = default;

  /// Create a time of day.
  /** @throws argument_error if any field is out of range.
   */
  local_time(
    int hour, int minute, int second = 0, int millisecond = 0,
    sl loc = sl::current());

  [[nodiscard]] static local_time from_hour_minute_second_nanosecond(
    int hour, int minute, int second, std::int64_t nanosecond,
    sl loc = sl::current());

  [[nodiscard]] static local_time
  from_nanosecond_of_day(std::int64_t nanos, sl loc = sl::current());

  [[nodiscard]] static constexpr local_time min() noexcept
  {
    return local_time{};
  }
  [[nodiscard]] static constexpr local_time max() noexcept
  {
    return local_time{nanos_per_day - 1, unchecked{}};
  }

  [[nodiscard]] constexpr int hour() const noexcept
  {
    return static_cast<int>(m_nanos / (3600 * nanos_per_second));
  }
  [[nodiscard]] constexpr int minute() const noexcept
  {
    return static_cast<int>((m_nanos / (60 * nanos_per_second)) % 60);
  }
  [[nodiscard]] constexpr int second() const noexcept
  {
    return static_cast<int>((m_nanos / nanos_per_second) % 60);
  }
  [[nodiscard]] constexpr std::int64_t nanosecond_of_second() const noexcept
  {
    return m_nanos % nanos_per_second;
  }
  [[nodiscard]] constexpr std::int64_t nanosecond_of_day() const noexcept
  {
    return m_nanos;
  }

  /// Add (or subtract) nanoseconds, wrapping around midnight.
  [[nodiscard]] local_time plus_nanoseconds(std::int64_t nanos) const noexcept;

  constexpr auto operator<=>(local_time const &) const noexcept = default;

private:
  struct unchecked
  {};
  constexpr local_time(std::int64_t nanos, unchecked) noexcept :
          m_nanos{nanos}
  {}

  std::int64_t m_nanos{0};
};


/// A date and time of day, without a time zone.
class PGCHRONO_LIBEXPORT local_date_time
{
public:
  /// Midnight at the start of 1970-01-01.
  constexpr local_date_time() noexcept = default;

  local_date_time(
    int year, int month, int day, int hour, int minute, int second = 0,
    int millisecond = 0, sl loc = sl::current());

  constexpr local_date_time(
    local_date const &date, local_time const &time) noexcept :
          m_date{date}, m_time{time}
  {}

  [[nodiscard]] static constexpr local_date_time min() noexcept
  {
    return {local_date::min(), local_time::min()};
  }
  [[nodiscard]] static constexpr local_date_time max() noexcept
  {
    return {local_date::max(), local_time::max()};
  }

  [[nodiscard]] constexpr local_date const &date() const noexcept
  {
    return m_date;
  }
  [[nodiscard]] constexpr local_time const &time() const noexcept
  {
    return m_time;
  }

  [[nodiscard]] local_date_time
  plus_nanoseconds(std::int64_t nanos, sl loc = sl::current()) const;

  /// Add a calendar period.
  /** Adds the years, then the months (clipping the day to the end of the
   * month), then weeks and days, and finally the time units.
   */
  [[nodiscard]] local_date_time
  plus(period const &p, sl loc = sl::current()) const;

  [[nodiscard]] offset_date_time with_offset(offset const &off) const noexcept;

  /// This local date/time, interpreted as UTC.
  [[nodiscard]] zoned_date_time in_utc(sl loc = sl::current()) const;

  /// This local date/time in `zone`.
  /** If the time is ambiguous, picks the earlier of the two candidates.  If
   * it falls into a gap, shifts it forward by the length of the gap.
   */
  [[nodiscard]] zoned_date_time
  in_zone_leniently(time_zone const &zone, sl loc = sl::current()) const;

  constexpr auto
  operator<=>(local_date_time const &) const noexcept = default;

private:
  local_date m_date;
  local_time m_time;
};


[[nodiscard]] PGCHRONO_LIBEXPORT local_date_time
operator+(local_date_time const &lhs, period const &rhs);


/// A fixed offset from UTC, in whole seconds.  At most 18 hours either way.
class PGCHRONO_LIBEXPORT offset
{
public:
  static constexpr int max_seconds{18 * 3600};

  /// UTC.
  constexpr offset() noexcept = default;

  [[nodiscard]] static offset
  from_seconds(int seconds, sl loc = sl::current());
  [[nodiscard]] static offset from_hours(int hours, sl loc = sl::current());

  /// Offset of `hours * 3600 + minutes * 60` seconds.
  /** So for a negative offset, pass negative minutes as well.
   */
  [[nodiscard]] static offset
  from_hours_and_minutes(int hours, int minutes, sl loc = sl::current());

  [[nodiscard]] static constexpr offset zero() noexcept { return offset{}; }

  [[nodiscard]] constexpr int seconds() const noexcept { return m_seconds; }
  [[nodiscard]] constexpr std::int64_t nanoseconds() const noexcept
  {
    return m_seconds * nanos_per_second;
  }

  constexpr auto operator<=>(offset const &) const noexcept = default;

private:
  explicit constexpr offset(int seconds) noexcept : m_seconds{seconds} {}

  int m_seconds{0};
};


/// A time of day with a UTC offset.
class PGCHRONO_LIBEXPORT offset_time
{
public:
  constexpr offset_time() noexcept = default;
  constexpr offset_time(local_time const &time, offset const &off) noexcept :
          m_time{time}, m_offset{off}
  {}

  [[nodiscard]] constexpr local_time const &time() const noexcept
  {
    return m_time;
  }
  [[nodiscard]] constexpr offset const &utc_offset() const noexcept
  {
    return m_offset;
  }

  constexpr bool operator==(offset_time const &) const noexcept = default;

private:
  local_time m_time;
  offset m_offset;
};


/// A local date and time, with a UTC offset.
/** Two of these are equal only if both their local values and offsets are
 * equal.  Ordering however goes by point on the timeline first, and then by
 * offset.
 */
class PGCHRONO_LIBEXPORT offset_date_time
{
public:
  constexpr offset_date_time() noexcept = default;
  constexpr offset_date_time(
    local_date_time const &local, offset const &off) noexcept :
          m_local{local}, m_offset{off}
  {}

  [[nodiscard]] constexpr local_date_time const &local() const noexcept
  {
    return m_local;
  }
  [[nodiscard]] constexpr offset const &utc_offset() const noexcept
  {
    return m_offset;
  }

  /// The point on the timeline.
  /** @throws range_error if that falls outside the supported instants.
   */
  [[nodiscard]] instant to_instant(sl loc = sl::current()) const;

  constexpr bool
  operator==(offset_date_time const &) const noexcept = default;

  [[nodiscard]] bool operator<(offset_date_time const &rhs) const noexcept;

private:
  local_date_time m_local;
  offset m_offset;
};


/// A point on the global timeline, with nanosecond resolution.
/** Supported instants run from the start of local_date::min() up to the end
 * of local_date::max(), UTC.  Those two extremes are PostgreSQL's
 * `-infinity` and `infinity`.
 */
class PGCHRONO_LIBEXPORT instant
{
public:
  /// The Unix epoch.
  constexpr instant() noexcept = default;

  /// Instant from "ticks" (units of 100 nanoseconds) since the Unix epoch.
  [[nodiscard]] static instant
  from_unix_time_ticks(std::int64_t ticks, sl loc = sl::current());

  [[nodiscard]] static instant
  from_unix_time_seconds(std::int64_t seconds, sl loc = sl::current());

  [[nodiscard]] static instant from_utc(
    int year, int month, int day, int hour, int minute, int second = 0,
    sl loc = sl::current());

  /// Instant from day number since the Unix epoch plus nanoseconds.
  /** The nanoseconds may be outside the day; they carry over.
   */
  [[nodiscard]] static instant from_days_and_nanoseconds(
    std::int64_t days, std::int64_t nanos, sl loc = sl::current());

  [[nodiscard]] static constexpr instant min() noexcept
  {
    return instant{-4'371'223, 0};
  }
  [[nodiscard]] static constexpr instant max() noexcept
  {
    return instant{2'932'896, nanos_per_day - 1};
  }

  /// Ticks since the epoch, rounded down.
  [[nodiscard]] constexpr std::int64_t unix_time_ticks() const noexcept
  {
    return m_days * (nanos_per_day / nanos_per_tick) +
           m_nanos / nanos_per_tick;
  }

  [[nodiscard]] constexpr std::int64_t days_since_epoch() const noexcept
  {
    return m_days;
  }
  [[nodiscard]] constexpr std::int64_t nanosecond_of_day() const noexcept
  {
    return m_nanos;
  }

  [[nodiscard]] instant
  plus_nanoseconds(std::int64_t nanos, sl loc = sl::current()) const;

  /// The UTC wall-clock date and time of this instant.
  [[nodiscard]] local_date_time utc_date_time() const;

  [[nodiscard]] offset_date_time
  with_offset(offset const &off, sl loc = sl::current()) const;
  [[nodiscard]] zoned_date_time in_utc() const;
  [[nodiscard]] zoned_date_time in_zone(time_zone const &zone) const;

  constexpr auto operator<=>(instant const &) const noexcept = default;

private:
  constexpr instant(std::int32_t days, std::int64_t nanos) noexcept :
          m_days{days}, m_nanos{nanos}
  {}

  std::int32_t m_days{0};
  /// Nanoseconds into the day.  Always non-negative.
  std::int64_t m_nanos{0};
};


template<> struct PGCHRONO_LIBEXPORT string_traits<local_date> final
{
  static constexpr bool converts_to_string{true};
  static constexpr bool converts_from_string{true};

  [[nodiscard]] static std::string_view
  to_buf(std::span<char> buf, local_date const &value, ctx = {});

  static std::size_t
  into_buf(std::span<char> buf, local_date const &value, ctx c = {})
  {
    return internal::into_buf_via_to_buf(buf, value, c);
  }

  [[nodiscard]] static local_date from_string(std::string_view text, ctx = {});

  [[nodiscard]] static constexpr std::size_t
  size_buffer(local_date const &) noexcept
  {
    return 16;
  }
};


template<> struct PGCHRONO_LIBEXPORT string_traits<local_time> final
{
  static constexpr bool converts_to_string{true};
  static constexpr bool converts_from_string{true};

  [[nodiscard]] static std::string_view
  to_buf(std::span<char> buf, local_time const &value, ctx = {});

  static std::size_t
  into_buf(std::span<char> buf, local_time const &value, ctx c = {})
  {
    return internal::into_buf_via_to_buf(buf, value, c);
  }

  [[nodiscard]] static local_time from_string(std::string_view text, ctx = {});

  [[nodiscard]] static constexpr std::size_t
  size_buffer(local_time const &) noexcept
  {
    return 24;
  }
};


template<> struct PGCHRONO_LIBEXPORT string_traits<local_date_time> final
{
  static constexpr bool converts_to_string{true};
  static constexpr bool converts_from_string{true};

  [[nodiscard]] static std::string_view
  to_buf(std::span<char> buf, local_date_time const &value, ctx = {});

  static std::size_t
  into_buf(std::span<char> buf, local_date_time const &value, ctx c = {})
  {
    return internal::into_buf_via_to_buf(buf, value, c);
  }

  /// Parse a date and time.  Accepts a space or a `T` in between.
  [[nodiscard]] static local_date_time
  from_string(std::string_view text, ctx = {});

  [[nodiscard]] static constexpr std::size_t
  size_buffer(local_date_time const &) noexcept
  {
    return 40;
  }
};


/// Text form of an offset: `Z`, `+02`, `-02:30`, or `+01:02:03`.
template<> struct PGCHRONO_LIBEXPORT string_traits<offset> final
{
  static constexpr bool converts_to_string{true};
  static constexpr bool converts_from_string{true};

  [[nodiscard]] static std::string_view
  to_buf(std::span<char> buf, offset const &value, ctx = {});

  static std::size_t
  into_buf(std::span<char> buf, offset const &value, ctx c = {})
  {
    return internal::into_buf_via_to_buf(buf, value, c);
  }

  [[nodiscard]] static offset from_string(std::string_view text, ctx = {});

  [[nodiscard]] static constexpr std::size_t
  size_buffer(offset const &) noexcept
  {
    return 12;
  }
};


template<> struct PGCHRONO_LIBEXPORT string_traits<offset_time> final
{
  static constexpr bool converts_to_string{true};
  static constexpr bool converts_from_string{true};

  [[nodiscard]] static std::string_view
  to_buf(std::span<char> buf, offset_time const &value, ctx = {});

  static std::size_t
  into_buf(std::span<char> buf, offset_time const &value, ctx c = {})
  {
    return internal::into_buf_via_to_buf(buf, value, c);
  }

  [[nodiscard]] static offset_time
  from_string(std::string_view text, ctx = {});

  [[nodiscard]] static constexpr std::size_t
  size_buffer(offset_time const &) noexcept
  {
    return 36;
  }
};


template<> struct PGCHRONO_LIBEXPORT string_traits<offset_date_time> final
{
  static constexpr bool converts_to_string{true};
  static constexpr bool converts_from_string{true};

  [[nodiscard]] static std::string_view
  to_buf(std::span<char> buf, offset_date_time const &value, ctx = {});

  static std::size_t
  into_buf(std::span<char> buf, offset_date_time const &value, ctx c = {})
  {
    return internal::into_buf_via_to_buf(buf, value, c);
  }

  [[nodiscard]] static offset_date_time
  from_string(std::string_view text, ctx = {});

  [[nodiscard]] static constexpr std::size_t
  size_buffer(offset_date_time const &) noexcept
  {
    return 56;
  }
};


/// Text form of an instant: its UTC date and time, suffixed with `Z`.
template<> struct PGCHRONO_LIBEXPORT string_traits<instant> final
{
  static constexpr bool converts_to_string{true};
  static constexpr bool converts_from_string{true};

  [[nodiscard]] static std::string_view
  to_buf(std::span<char> buf, instant const &value, ctx = {});

  static std::size_t
  into_buf(std::span<char> buf, instant const &value, ctx c = {})
  {
    return internal::into_buf_via_to_buf(buf, value, c);
  }

  /// Parse a date and time with offset, and convert to UTC.
  [[nodiscard]] static instant from_string(std::string_view text, ctx = {});

  [[nodiscard]] static constexpr std::size_t
  size_buffer(instant const &) noexcept
  {
    return 56;
  }
};
} // namespace pgchrono


namespace pgchrono::internal
{
/// Write date, `T`, time, and offset text, and then ` BC` if applicable.
/** This is the text layout that PostgreSQL accepts for a `timestamptz`.
 *
 * The buffer must have room for at least 56 bytes.
 *
 * @return A pointer to the character right after the text.
 */
PGCHRONO_LIBEXPORT char *write_date_time_offset(
  char *here, local_date_time const &local, offset const &off);


/// Write a nonzero fraction of a second as a decimal point and digits.
/** Writes as many digits (up to 9) as needed to represent `nanos` exactly.
 * Writes nothing if `nanos` is zero.
 */
PGCHRONO_LIBEXPORT char *
write_fraction(char *here, std::int64_t nanos) noexcept;
} // namespace pgchrono::internal
#endif
