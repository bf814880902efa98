/** Implementation of the calendar, clock, and timeline value types.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgchrono-source.hxx"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <tuple>

#include "pgchrono/internal/header-pre.hxx"

#include "pgchrono/internal/arith.hxx"
#include "pgchrono/internal/concat.hxx"
#include "pgchrono/internal/scanner.hxx"
#include "pgchrono/period.hxx"
#include "pgchrono/time.hxx"

#include "pgchrono/internal/header-post.hxx"


namespace
{
using namespace std::literals;
using pgchrono::internal::concat;
using pgchrono::internal::floor_div;
using pgchrono::internal::floor_mod;


/// Because the C++ Core Guidelines don't like numeric constants...
constexpr int ten{10};

constexpr std::int64_t nanos_per_hour{3600 * pgchrono::nanos_per_second},
  nanos_per_minute{60 * pgchrono::nanos_per_second},
  nanos_per_milli{1'000'000};

/// Day numbers of local_date::min() and local_date::max().
constexpr std::int64_t min_day{-4'371'223}, max_day{2'932'896};

constexpr auto s_infinity{"infinity"sv}, s_neg_infinity{"-infinity"sv},
  s_bc{" BC"sv};


/// Write a number of exactly two digits.
inline char *two_digits_into_buf(char *here, int value) noexcept
{
  *here++ = pgchrono::internal::number_to_digit(value / ten);
  *here++ = pgchrono::internal::number_to_digit(value % ten);
  return here;
}


/// Render the numeric part of a year value into a buffer.
/** Converts the year from "common era" (with a Year Zero) to "anno domini"
 * (without a Year Zero).
 *
 * Doesn't render the sign.  When you're rendering a date, you indicate a
 * negative year by suffixing "BC" at the very end.
 *
 * @return A pointer to the character right after the last digit.
 */
inline char *year_into_buf(char *here, int year) noexcept
{
  // Our year zero is 1 BC in the postgres calendar; our 1 BC is postgres 2 BC,
  // and so on.
  int const absy{std::abs(year) + int{year <= 0}};

  constexpr int hundred{100}, thousand{1000};

  // PostgreSQL requires year input to be at least 3 digits long, or it won't
  // be able to deduce the date format correctly.  However on output it always
  // writes years as at least 4 digits, and we'll do the same.
  if (absy < thousand) [[unlikely]]
  {
    *here++ = '0';
    if (absy < hundred)
      *here++ = '0';
    if (absy < ten)
      *here++ = '0';
  }
  // Years have at most 5 digits, so this can't fail.
  return std::to_chars(here, here + 5, absy).ptr;
}


/// Write a date without its era suffix: `YYYY-MM-DD`.
inline char *date_into_buf(char *here, pgchrono::local_date const &value)
{
  here = year_into_buf(here, value.year());
  *here++ = '-';
  here = two_digits_into_buf(here, value.month());
  *here++ = '-';
  return two_digits_into_buf(here, value.day());
}


/// Write ` BC` if `year` needs it.
inline char *era_into_buf(char *here, int year) noexcept
{
  if (year <= 0) [[unlikely]]
    here = pgchrono::internal::copy_into(here, s_bc);
  return here;
}


/// Write a time of day: `HH:MM:SS`, plus a fraction if there is one.
inline char *time_into_buf(char *here, pgchrono::local_time const &value)
{
  here = two_digits_into_buf(here, value.hour());
  *here++ = ':';
  here = two_digits_into_buf(here, value.minute());
  *here++ = ':';
  here = two_digits_into_buf(here, value.second());
  return pgchrono::internal::write_fraction(here, value.nanosecond_of_second());
}


/// Write a UTC offset: `Z`, `+HH`, `+HH:MM`, or `+HH:MM:SS`.
inline char *offset_into_buf(char *here, pgchrono::offset const &value)
{
  int const secs{value.seconds()};
  if (secs == 0)
  {
    *here++ = 'Z';
    return here;
  }
  *here++ = (secs < 0) ? '-' : '+';
  int const abss{std::abs(secs)};
  here = two_digits_into_buf(here, abss / 3600);
  int const minutes{(abss / 60) % 60}, seconds{abss % 60};
  if (minutes != 0 or seconds != 0)
  {
    *here++ = ':';
    here = two_digits_into_buf(here, minutes);
  }
  if (seconds != 0)
  {
    *here++ = ':';
    here = two_digits_into_buf(here, seconds);
  }
  return here;
}


/// Check that `buf` can hold what this type's `size_buffer()` promises.
template<typename TYPE>
inline void
check_room(std::span<char> buf, TYPE const &value, std::string_view what, pgchrono::sl loc)
{
  if (std::size(buf) < pgchrono::string_traits<TYPE>::size_buffer(value))
    [[unlikely]]
    pgchrono::internal::throw_overrun(what, loc);
}


/// View on the part of `buf` up to `end`.
inline std::string_view written(std::span<char> buf, char const *end) noexcept
{
  return {std::data(buf), static_cast<std::size_t>(end - std::data(buf))};
}


/// Date fields as they appear in text, with a year in "anno domini."
struct date_fields
{
  int year, month, day;
};


/// Parse `YYYY-MM-DD`.  Years have at least 4 digits.
date_fields parse_date_fields(pgchrono::internal::scanner &s)
{
  auto const year{s.digits(4, 5)};
  s.expect('-');
  auto const month{s.digits(2, 2)};
  s.expect('-');
  auto const day{s.digits(2, 2)};
  return {
    static_cast<int>(year), static_cast<int>(month), static_cast<int>(day)};
}


/// Turn parsed date fields plus optional ` BC` into a valid date.
pgchrono::local_date
make_date(pgchrono::internal::scanner &s, date_fields const &fields, bool bc)
{
  // There is no year zero in text.
  if (fields.year == 0)
    s.fail();
  int const year{bc ? (1 - fields.year) : fields.year};
  if (not pgchrono::local_date::is_valid(year, fields.month, fields.day))
    s.fail();
  return pgchrono::local_date{year, fields.month, fields.day, s.location()};
}


/// Parse `HH:MM[:SS[.fraction]]`.
pgchrono::local_time parse_time(pgchrono::internal::scanner &s)
{
  auto const hour{s.digits(2, 2)};
  s.expect(':');
  auto const minute{s.digits(2, 2)};
  std::int64_t second{0}, nanos{0};
  if (s.accept(':'))
  {
    second = s.digits(2, 2);
    if (s.accept('.'))
      nanos = s.fraction_nanos();
  }
  if (hour >= 24 or minute >= 60 or second >= 60)
    s.fail();
  return pgchrono::local_time::from_nanosecond_of_day(
    hour * nanos_per_hour + minute * nanos_per_minute +
      second * pgchrono::nanos_per_second + nanos,
    s.location());
}


/// Parse `Z` or a signed offset: `+HH`, `+HH:MM`, `+HHMM`, `+HH:MM:SS`.
pgchrono::offset parse_offset(pgchrono::internal::scanner &s)
{
  if (s.accept('Z'))
    return pgchrono::offset::zero();
  bool negative{false};
  if (s.accept('-'))
    negative = true;
  else
    s.expect('+');
  // The hours are always two digits.  In "+HHMM" the minutes follow directly.
  auto const hours{s.fixed_digits(2)};
  std::int64_t minutes{0}, seconds{0};
  if (s.accept(':') or s.count_digits() == 2)
  {
    minutes = s.digits(2, 2);
    if (s.accept(':'))
      seconds = s.digits(2, 2);
  }
  if (minutes >= 60 or seconds >= 60)
    s.fail();
  auto const total{hours * 3600 + minutes * 60 + seconds};
  if (total > pgchrono::offset::max_seconds)
    s.fail();
  return pgchrono::offset::from_seconds(
    static_cast<int>(negative ? -total : total), s.location());
}


/// Parse the separator between date and time: `T` or a space.
void parse_date_time_separator(pgchrono::internal::scanner &s)
{
  if (not s.accept('T') and not s.accept(' '))
    s.fail();
}


/// Full date-time-offset parse, as used for `timestamptz` text.
pgchrono::offset_date_time parse_offset_date_time(pgchrono::internal::scanner &s)
{
  auto const fields{parse_date_fields(s)};
  parse_date_time_separator(s);
  auto const time{parse_time(s)};
  auto const off{parse_offset(s)};
  bool const bc{s.accept(s_bc)};
  s.expect_end();
  return {{make_date(s, fields, bc), time}, off};
}


/// Compute the UTC day and nanosecond-of-day for a local time and offset.
/** Unlike instant construction, this never fails.
 */
std::pair<std::int64_t, std::int64_t>
utc_parts(pgchrono::local_date_time const &local, pgchrono::offset const &off)
{
  auto const nanos{local.time().nanosecond_of_day() - off.nanoseconds()};
  return {
    local.date().days_since_epoch() + floor_div(nanos, pgchrono::nanos_per_day),
    floor_mod(nanos, pgchrono::nanos_per_day)};
}
} // namespace


namespace pgchrono
{
local_date::local_date(int year, int month, int day, sl loc) :
        local_date{year, month, day, unchecked{}}
{
  if (not is_valid(year, month, day))
    throw argument_error{
      concat("Invalid date: year ", year, ", month ", month, ", day ", day, "."),
      loc};
}


local_date::local_date(std::chrono::year_month_day const &ymd, sl loc) :
        local_date{
          int{ymd.year()}, static_cast<int>(unsigned{ymd.month()}),
          static_cast<int>(unsigned{ymd.day()}), loc}
{}


bool local_date::is_valid(int year, int month, int day) noexcept
{
  if (year < min_year or year > max_year)
    return false;
  if (month < 1 or month > 12 or day < 1 or day > 31)
    return false;
  return std::chrono::year_month_day{
    std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
    std::chrono::day{static_cast<unsigned>(day)}}
    .ok();
}


local_date local_date::from_days_since_epoch(std::int64_t days, sl loc)
{
  if (days < min_day or days > max_day)
    throw argument_error{
      concat("Day number out of range for a date: ", days, "."), loc};
  std::chrono::year_month_day const ymd{
    std::chrono::sys_days{std::chrono::days{days}}};
  return local_date{
    int{ymd.year()}, static_cast<int>(unsigned{ymd.month()}),
    static_cast<int>(unsigned{ymd.day()}), unchecked{}};
}


std::chrono::year_month_day local_date::ymd() const noexcept
{
  return {
    std::chrono::year{m_year},
    std::chrono::month{static_cast<unsigned>(m_month)},
    std::chrono::day{static_cast<unsigned>(m_day)}};
}


std::int64_t local_date::days_since_epoch() const noexcept
{
  return std::chrono::sys_days{ymd()}.time_since_epoch().count();
}


local_date local_date::plus_days(std::int64_t days, sl loc) const
{
  auto const target{
    internal::checked_add(days_since_epoch(), days, "date arithmetic", loc)};
  if (target < min_day or target > max_day)
    throw range_error{"Date arithmetic went out of range.", loc};
  return from_days_since_epoch(target, loc);
}


local_date local_date::plus_months(std::int64_t months, sl loc) const
{
  auto const total{internal::checked_add(
    std::int64_t{m_year} * 12 + (m_month - 1), months, "date arithmetic",
    loc)};
  auto const year{floor_div(total, std::int64_t{12})};
  auto const month{static_cast<int>(floor_mod(total, std::int64_t{12}) + 1)};
  if (year < min_year or year > max_year)
    throw range_error{"Date arithmetic went out of range.", loc};
  std::chrono::year_month_day_last const last{
    std::chrono::year{static_cast<int>(year)},
    std::chrono::month_day_last{
      std::chrono::month{static_cast<unsigned>(month)}}};
  int const day{
    std::min(int{m_day}, static_cast<int>(unsigned{last.day()}))};
  return local_date{static_cast<int>(year), month, day, unchecked{}};
}


local_date local_date::plus_years(std::int64_t years, sl loc) const
{
  return plus_months(
    internal::checked_mul(years, std::int64_t{12}, "date arithmetic", loc),
    loc);
}


local_time::local_time(
  int hour, int minute, int second, int millisecond, sl loc)
{
  if (
    hour < 0 or hour >= 24 or minute < 0 or minute >= 60 or second < 0 or
    second >= 60 or millisecond < 0 or millisecond >= 1000)
    throw argument_error{
      concat(
        "Invalid time of day: ", hour, ":", minute, ":", second, ".",
        millisecond, "."),
      loc};
  m_nanos = hour * nanos_per_hour + minute * nanos_per_minute +
            second * nanos_per_second + millisecond * nanos_per_milli;
}


local_time local_time::from_hour_minute_second_nanosecond(
  int hour, int minute, int second, std::int64_t nanosecond, sl loc)
{
  if (nanosecond < 0 or nanosecond >= nanos_per_second)
    throw argument_error{
      concat("Nanosecond out of range: ", nanosecond, "."), loc};
  return local_time{hour, minute, second, 0, loc}.plus_nanoseconds(
    nanosecond);
}


local_time local_time::from_nanosecond_of_day(std::int64_t nanos, sl loc)
{
  if (nanos < 0 or nanos >= nanos_per_day)
    throw argument_error{
      concat("Nanosecond of day out of range: ", nanos, "."), loc};
  return local_time{nanos, unchecked{}};
}


local_time local_time::plus_nanoseconds(std::int64_t nanos) const noexcept
{
  return local_time{
    floor_mod(m_nanos + floor_mod(nanos, nanos_per_day), nanos_per_day),
    unchecked{}};
}


local_date_time::local_date_time(
  int year, int month, int day, int hour, int minute, int second,
  int millisecond, sl loc) :
        m_date{year, month, day, loc},
        m_time{hour, minute, second, millisecond, loc}
{}


local_date_time
local_date_time::plus_nanoseconds(std::int64_t nanos, sl loc) const
{
  auto days{floor_div(nanos, nanos_per_day)};
  auto time{m_time.nanosecond_of_day() + floor_mod(nanos, nanos_per_day)};
  if (time >= nanos_per_day)
  {
    time -= nanos_per_day;
    ++days;
  }
  return {
    m_date.plus_days(days, loc), local_time::from_nanosecond_of_day(time, loc)};
}


local_date_time local_date_time::plus(period const &p, sl loc) const
{
  auto const date{
    m_date.plus_years(p.years(), loc)
      .plus_months(p.months(), loc)
      .plus_days(std::int64_t{p.weeks()} * 7 + p.days(), loc)};

  // Add up the time units as whole days plus a small remainder, so that
  // nothing overflows.
  std::int64_t carry{0}, rest{m_time.nanosecond_of_day()};
  auto const add{[&carry, &rest, loc](std::int64_t value, std::int64_t unit) {
    auto const per_day{nanos_per_day / unit};
    carry = internal::checked_add(
      carry, value / per_day, "date/time arithmetic", loc);
    rest += (value % per_day) * unit;
  }};
  add(p.hours(), nanos_per_hour);
  add(p.minutes(), nanos_per_minute);
  add(p.seconds(), nanos_per_second);
  add(p.milliseconds(), nanos_per_milli);
  add(p.nanoseconds(), 1);

  auto const days{internal::checked_add(
    carry, floor_div(rest, nanos_per_day), "date/time arithmetic", loc)};
  return {
    date.plus_days(days, loc),
    local_time::from_nanosecond_of_day(floor_mod(rest, nanos_per_day), loc)};
}


offset_date_time local_date_time::with_offset(offset const &off) const noexcept
{
  return {*this, off};
}


local_date_time operator+(local_date_time const &lhs, period const &rhs)
{
  return lhs.plus(rhs);
}


offset offset::from_seconds(int seconds, sl loc)
{
  if (seconds < -max_seconds or seconds > max_seconds)
    throw argument_error{
      concat("UTC offset out of range: ", seconds, " seconds."), loc};
  return offset{seconds};
}


offset offset::from_hours(int hours, sl loc)
{
  if (hours < -18 or hours > 18)
    throw argument_error{
      concat("UTC offset out of range: ", hours, " hours."), loc};
  return from_seconds(hours * 3600, loc);
}


offset offset::from_hours_and_minutes(int hours, int minutes, sl loc)
{
  if (hours < -18 or hours > 18 or minutes <= -60 or minutes >= 60)
    throw argument_error{
      concat(
        "UTC offset out of range: ", hours, " hours and ", minutes,
        " minutes."),
      loc};
  return from_seconds(hours * 3600 + minutes * 60, loc);
}


instant offset_date_time::to_instant(sl loc) const
{
  return instant::from_days_and_nanoseconds(
           m_local.date().days_since_epoch(), 0, loc)
    .plus_nanoseconds(
      m_local.time().nanosecond_of_day() - m_offset.nanoseconds(), loc);
}


bool offset_date_time::operator<(offset_date_time const &rhs) const noexcept
{
  return std::tuple_cat(utc_parts(m_local, m_offset), std::tuple{m_offset}) <
         std::tuple_cat(
           utc_parts(rhs.m_local, rhs.m_offset), std::tuple{rhs.m_offset});
}


instant instant::from_unix_time_ticks(std::int64_t ticks, sl loc)
{
  constexpr std::int64_t ticks_per_day{nanos_per_day / nanos_per_tick};
  return from_days_and_nanoseconds(
    floor_div(ticks, ticks_per_day),
    floor_mod(ticks, ticks_per_day) * nanos_per_tick, loc);
}


instant instant::from_unix_time_seconds(std::int64_t seconds, sl loc)
{
  constexpr std::int64_t seconds_per_day{86'400};
  return from_days_and_nanoseconds(
    floor_div(seconds, seconds_per_day),
    floor_mod(seconds, seconds_per_day) * nanos_per_second, loc);
}


instant instant::from_utc(
  int year, int month, int day, int hour, int minute, int second, sl loc)
{
  local_date_time const utc{year, month, day, hour, minute, second, 0, loc};
  return from_days_and_nanoseconds(
    utc.date().days_since_epoch(), utc.time().nanosecond_of_day(), loc);
}


instant
instant::from_days_and_nanoseconds(std::int64_t days, std::int64_t nanos, sl loc)
{
  auto const day{internal::checked_add(
    days, floor_div(nanos, nanos_per_day), "instant construction", loc)};
  if (day < min_day or day > max_day)
    throw argument_error{
      concat("Instant out of range: day ", day, " after the epoch."), loc};
  return instant{
    static_cast<std::int32_t>(day), floor_mod(nanos, nanos_per_day)};
}


instant instant::plus_nanoseconds(std::int64_t nanos, sl loc) const
{
  std::int64_t day{m_days + floor_div(nanos, nanos_per_day)};
  auto time{m_nanos + floor_mod(nanos, nanos_per_day)};
  if (time >= nanos_per_day)
  {
    time -= nanos_per_day;
    ++day;
  }
  if (day < min_day or day > max_day)
    throw range_error{"Instant arithmetic went out of range.", loc};
  return instant{static_cast<std::int32_t>(day), time};
}


local_date_time instant::utc_date_time() const
{
  return {
    local_date::from_days_since_epoch(m_days),
    local_time::from_nanosecond_of_day(m_nanos)};
}


offset_date_time instant::with_offset(offset const &off, sl loc) const
{
  return {utc_date_time().plus_nanoseconds(off.nanoseconds(), loc), off};
}


std::string_view string_traits<local_date>::to_buf(
  std::span<char> buf, local_date const &value, ctx c)
{
  check_room(buf, value, "date", c.loc);
  if (value == local_date::min()) [[unlikely]]
    return s_neg_infinity;
  if (value == local_date::max()) [[unlikely]]
    return s_infinity;
  auto here{date_into_buf(std::data(buf), value)};
  here = era_into_buf(here, value.year());
  return written(buf, here);
}


local_date
string_traits<local_date>::from_string(std::string_view text, ctx c)
{
  if (text == s_infinity)
    return local_date::max();
  if (text == s_neg_infinity)
    return local_date::min();
  internal::scanner s{text, "date", c.loc};
  auto const fields{parse_date_fields(s)};
  bool const bc{s.accept(s_bc)};
  s.expect_end();
  return make_date(s, fields, bc);
}


std::string_view string_traits<local_time>::to_buf(
  std::span<char> buf, local_time const &value, ctx c)
{
  check_room(buf, value, "time", c.loc);
  return written(buf, time_into_buf(std::data(buf), value));
}


local_time
string_traits<local_time>::from_string(std::string_view text, ctx c)
{
  internal::scanner s{text, "time", c.loc};
  auto const value{parse_time(s)};
  s.expect_end();
  return value;
}


std::string_view string_traits<local_date_time>::to_buf(
  std::span<char> buf, local_date_time const &value, ctx c)
{
  check_room(buf, value, "timestamp", c.loc);
  if (value == local_date_time::min()) [[unlikely]]
    return s_neg_infinity;
  if (value == local_date_time::max()) [[unlikely]]
    return s_infinity;
  auto here{date_into_buf(std::data(buf), value.date())};
  *here++ = 'T';
  here = time_into_buf(here, value.time());
  here = era_into_buf(here, value.date().year());
  return written(buf, here);
}


local_date_time
string_traits<local_date_time>::from_string(std::string_view text, ctx c)
{
  if (text == s_infinity)
    return local_date_time::max();
  if (text == s_neg_infinity)
    return local_date_time::min();
  internal::scanner s{text, "timestamp", c.loc};
  auto const fields{parse_date_fields(s)};
  parse_date_time_separator(s);
  auto const time{parse_time(s)};
  bool const bc{s.accept(s_bc)};
  s.expect_end();
  return {make_date(s, fields, bc), time};
}


std::string_view
string_traits<offset>::to_buf(std::span<char> buf, offset const &value, ctx c)
{
  check_room(buf, value, "UTC offset", c.loc);
  return written(buf, offset_into_buf(std::data(buf), value));
}


offset string_traits<offset>::from_string(std::string_view text, ctx c)
{
  internal::scanner s{text, "UTC offset", c.loc};
  auto const value{parse_offset(s)};
  s.expect_end();
  return value;
}


std::string_view string_traits<offset_time>::to_buf(
  std::span<char> buf, offset_time const &value, ctx c)
{
  check_room(buf, value, "time with time zone", c.loc);
  auto here{time_into_buf(std::data(buf), value.time())};
  here = offset_into_buf(here, value.utc_offset());
  return written(buf, here);
}


offset_time
string_traits<offset_time>::from_string(std::string_view text, ctx c)
{
  internal::scanner s{text, "time with time zone", c.loc};
  auto const time{parse_time(s)};
  auto const off{parse_offset(s)};
  s.expect_end();
  return {time, off};
}


std::string_view string_traits<offset_date_time>::to_buf(
  std::span<char> buf, offset_date_time const &value, ctx c)
{
  check_room(buf, value, "timestamp with offset", c.loc);
  return written(
    buf, internal::write_date_time_offset(
           std::data(buf), value.local(), value.utc_offset()));
}


offset_date_time
string_traits<offset_date_time>::from_string(std::string_view text, ctx c)
{
  internal::scanner s{text, "timestamp with offset", c.loc};
  return parse_offset_date_time(s);
}


std::string_view
string_traits<instant>::to_buf(std::span<char> buf, instant const &value, ctx c)
{
  check_room(buf, value, "instant", c.loc);
  if (value == instant::min()) [[unlikely]]
    return s_neg_infinity;
  if (value == instant::max()) [[unlikely]]
    return s_infinity;
  return written(
    buf, internal::write_date_time_offset(
           std::data(buf), value.utc_date_time(), offset::zero()));
}


instant string_traits<instant>::from_string(std::string_view text, ctx c)
{
  if (text == s_infinity)
    return instant::max();
  if (text == s_neg_infinity)
    return instant::min();
  internal::scanner s{text, "timestamp with time zone", c.loc};
  return parse_offset_date_time(s).to_instant(c.loc);
}
} // namespace pgchrono


namespace pgchrono::internal
{
char *write_date_time_offset(
  char *here, local_date_time const &local, offset const &off)
{
  here = date_into_buf(here, local.date());
  *here++ = 'T';
  here = time_into_buf(here, local.time());
  here = offset_into_buf(here, off);
  return era_into_buf(here, local.date().year());
}


char *write_fraction(char *here, std::int64_t nanos) noexcept
{
  if (nanos == 0)
    return here;
  *here++ = '.';
  char digits[9];
  for (int i{8}; i >= 0; --i)
  {
    digits[i] = number_to_digit(static_cast<int>(nanos % ten));
    nanos /= ten;
  }
  int len{9};
  while (digits[len - 1] == '0') --len;
  return std::copy(digits, digits + len, here);
}
} // namespace pgchrono::internal
