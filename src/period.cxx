/** Implementation of periods and durations.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgchrono-source.hxx"

#include <charconv>
#include <cstdlib>
#include <limits>

#include "pgchrono/internal/header-pre.hxx"

#include "pgchrono/internal/arith.hxx"
#include "pgchrono/internal/concat.hxx"
#include "pgchrono/internal/scanner.hxx"
#include "pgchrono/period.hxx"
#include "pgchrono/time.hxx"

#include "pgchrono/internal/header-post.hxx"


namespace
{
using pgchrono::internal::add_overflows;
using pgchrono::internal::floor_div;
using pgchrono::internal::floor_mod;
using pgchrono::internal::mul_overflows;

constexpr std::int64_t nanos_per_milli{1'000'000},
  nanos_per_minute{60 * pgchrono::nanos_per_second},
  nanos_per_hour{60 * nanos_per_minute};


/// Write `value` followed by `unit`, if `value` is nonzero.
char *field_into_buf(char *here, std::int64_t value, char unit) noexcept
{
  if (value == 0)
    return here;
  // At most 20 characters, including sign.
  here = std::to_chars(here, here + 20, value).ptr;
  *here++ = unit;
  return here;
}


/// Write hours, minutes, seconds, and fraction for a signed time span.
/** The span is `hours` plus `rest` nanoseconds, with `rest` less than an
 * hour; the sign goes in front of each nonzero field.  Writes nothing for
 * zero.
 */
char *time_fields_into_buf(
  char *here, bool negative, std::int64_t hours, std::int64_t rest) noexcept
{
  if (hours == 0 and rest == 0)
    return here;
  *here++ = 'T';
  auto const minutes{rest / nanos_per_minute},
    seconds{(rest / pgchrono::nanos_per_second) % 60},
    fraction{rest % pgchrono::nanos_per_second};
  std::int64_t const sign{negative ? -1 : 1};
  here = field_into_buf(here, sign * hours, 'H');
  here = field_into_buf(here, sign * minutes, 'M');
  if (seconds != 0 or fraction != 0)
  {
    if (negative)
      *here++ = '-';
    here = std::to_chars(here, here + 20, seconds).ptr;
    here = pgchrono::internal::write_fraction(here, fraction);
    *here++ = 'S';
  }
  return here;
}


/// One number in an ISO 8601 duration, with the unit letter following it.
struct iso_field
{
  bool negative;
  std::int64_t whole;
  /// Fraction in nanoseconds, if the number had a decimal point.
  std::int64_t fraction;
  bool has_fraction;
  char unit;
};


iso_field parse_field(pgchrono::internal::scanner &s)
{
  iso_field f{};
  f.negative = s.accept('-');
  if (not f.negative)
    s.accept('+');
  f.whole = s.digits(1);
  if (s.accept('.'))
  {
    f.has_fraction = true;
    f.fraction = s.fraction_nanos();
  }
  f.unit = s.peek();
  if (f.unit == '\0')
    s.fail();
  s.expect(f.unit);
  return f;
}


std::int32_t
to_int32(pgchrono::internal::scanner &s, std::int64_t value)
{
  if (
    value < std::numeric_limits<std::int32_t>::min() or
    value > std::numeric_limits<std::int32_t>::max())
    s.fail();
  return static_cast<std::int32_t>(value);
}


/// Parse an ISO 8601 duration: `P[nY][nM][nW][nD][T[nH][nM][n[.f]S]]`.
/** Calls `on_field` for each field, with `true` for fields in the time part.
 */
template<typename HANDLER>
void parse_iso(pgchrono::internal::scanner &s, HANDLER on_field)
{
  s.expect('P');
  bool any{false};
  // Units must come in order.
  std::string_view date_units{"YMWD"};
  while (not s.at_end() and s.peek() != 'T')
  {
    auto const f{parse_field(s)};
    auto const pos{date_units.find(f.unit)};
    if (pos == std::string_view::npos or f.has_fraction)
      s.fail();
    date_units.remove_prefix(pos + 1);
    on_field(f, false);
    any = true;
  }
  if (s.accept('T'))
  {
    std::string_view time_units{"HMS"};
    bool any_time{false};
    while (not s.at_end())
    {
      auto const f{parse_field(s)};
      auto const pos{time_units.find(f.unit)};
      if (pos == std::string_view::npos or (f.has_fraction and f.unit != 'S'))
        s.fail();
      time_units.remove_prefix(pos + 1);
      on_field(f, true);
      any_time = true;
    }
    if (not any_time)
      s.fail();
    any = true;
  }
  if (not any)
    s.fail();
}
} // namespace


namespace pgchrono
{
period period::from_ticks(std::int64_t n, sl loc)
{
  return from_nanoseconds(
    internal::checked_mul(n, nanos_per_tick, "period construction", loc));
}


std::optional<std::int64_t> period::time_nanoseconds() const noexcept
{
  std::int64_t total{m_nanoseconds};
  std::pair<std::int64_t, std::int64_t> const parts[]{
    {m_hours, nanos_per_hour},
    {m_minutes, nanos_per_minute},
    {m_seconds, nanos_per_second},
    {m_milliseconds, nanos_per_milli},
  };
  for (auto const &[count, unit] : parts)
  {
    if (mul_overflows(count, unit) or add_overflows(total, count * unit))
      return {};
    total += count * unit;
  }
  return total;
}


period period::operator+(period const &rhs) const
{
  constexpr char what[]{"period addition"};
  using internal::checked_add;
  period sum;
  sum.m_years = checked_add(m_years, rhs.m_years, what);
  sum.m_months = checked_add(m_months, rhs.m_months, what);
  sum.m_weeks = checked_add(m_weeks, rhs.m_weeks, what);
  sum.m_days = checked_add(m_days, rhs.m_days, what);
  sum.m_hours = checked_add(m_hours, rhs.m_hours, what);
  sum.m_minutes = checked_add(m_minutes, rhs.m_minutes, what);
  sum.m_seconds = checked_add(m_seconds, rhs.m_seconds, what);
  sum.m_milliseconds = checked_add(m_milliseconds, rhs.m_milliseconds, what);
  sum.m_nanoseconds = checked_add(m_nanoseconds, rhs.m_nanoseconds, what);
  return sum;
}


duration duration::make(
  std::int64_t days, std::int64_t nanos, char const what[], sl loc)
{
  auto const floor{
    internal::checked_add(days, floor_div(nanos, nanos_per_day), what, loc)};
  if (floor < -max_days or floor >= max_days)
    throw range_error{internal::concat("Duration out of range in ", what, "."), loc};
  duration d;
  d.m_days = floor;
  d.m_nanos = floor_mod(nanos, nanos_per_day);
  return d;
}


duration duration::from_days(std::int64_t n, sl loc)
{
  return make(n, 0, "duration construction", loc);
}


duration duration::from_hours(std::int64_t n, sl loc)
{
  return make(
    floor_div(n, std::int64_t{24}), floor_mod(n, std::int64_t{24}) * nanos_per_hour,
    "duration construction", loc);
}


duration duration::from_minutes(std::int64_t n, sl loc)
{
  constexpr std::int64_t per_day{24 * 60};
  return make(
    floor_div(n, per_day), floor_mod(n, per_day) * nanos_per_minute,
    "duration construction", loc);
}


duration duration::from_seconds(std::int64_t n, sl loc)
{
  constexpr std::int64_t per_day{24 * 60 * 60};
  return make(
    floor_div(n, per_day), floor_mod(n, per_day) * nanos_per_second,
    "duration construction", loc);
}


duration duration::from_milliseconds(std::int64_t n, sl loc)
{
  constexpr std::int64_t per_day{nanos_per_day / nanos_per_milli};
  return make(
    floor_div(n, per_day), floor_mod(n, per_day) * nanos_per_milli,
    "duration construction", loc);
}


duration duration::from_ticks(std::int64_t n, sl loc)
{
  constexpr std::int64_t per_day{nanos_per_day / nanos_per_tick};
  return make(
    floor_div(n, per_day), floor_mod(n, per_day) * nanos_per_tick,
    "duration construction", loc);
}


duration duration::from_nanoseconds(std::int64_t n, sl loc)
{
  return make(0, n, "duration construction", loc);
}


std::pair<std::int64_t, std::int64_t> duration::magnitude() const noexcept
{
  if (m_days >= 0)
    return {m_days, m_nanos};
  else if (m_nanos == 0)
    return {-m_days, 0};
  else
    return {-m_days - 1, nanos_per_day - m_nanos};
}


std::int64_t duration::days() const noexcept
{
  auto const sign{is_negative() ? -1 : 1};
  return sign * magnitude().first;
}


std::int64_t duration::hours() const noexcept
{
  auto const sign{is_negative() ? -1 : 1};
  return sign * (magnitude().second / nanos_per_hour);
}


std::int64_t duration::minutes() const noexcept
{
  auto const sign{is_negative() ? -1 : 1};
  return sign * ((magnitude().second / nanos_per_minute) % 60);
}


std::int64_t duration::seconds() const noexcept
{
  auto const sign{is_negative() ? -1 : 1};
  return sign * ((magnitude().second / nanos_per_second) % 60);
}


std::int64_t duration::subsecond_nanoseconds() const noexcept
{
  auto const sign{is_negative() ? -1 : 1};
  return sign * (magnitude().second % nanos_per_second);
}


duration duration::operator+(duration const &rhs) const
{
  return make(
    m_days + rhs.m_days, m_nanos + rhs.m_nanos, "duration addition",
    sl::current());
}


duration duration::operator-() const
{
  return make(-m_days, -m_nanos, "duration negation", sl::current());
}


duration duration::operator-(duration const &rhs) const
{
  return *this + -rhs;
}


duration operator-(instant const &lhs, instant const &rhs)
{
  return duration::from_days(lhs.days_since_epoch() - rhs.days_since_epoch()) +
         duration::from_nanoseconds(
           lhs.nanosecond_of_day() - rhs.nanosecond_of_day());
}


std::string_view
string_traits<period>::to_buf(std::span<char> buf, period const &value, ctx c)
{
  if (std::size(buf) < size_buffer(value)) [[unlikely]]
    internal::throw_overrun("interval", c.loc);
  if (value.is_zero())
    return "P0D";
  auto const time{value.time_nanoseconds()};
  if (not time.has_value() or *time == std::numeric_limits<std::int64_t>::min())
    throw unrepresentable_value{
      "Time units of period do not fit in 64-bit nanoseconds.", c.loc};

  auto const data{std::data(buf)};
  auto here{data};
  *here++ = 'P';
  here = field_into_buf(here, value.years(), 'Y');
  here = field_into_buf(here, value.months(), 'M');
  here = field_into_buf(here, value.total_days(), 'D');
  auto const magnitude{(*time < 0) ? -*time : *time};
  here = time_fields_into_buf(
    here, *time < 0, magnitude / nanos_per_hour, magnitude % nanos_per_hour);
  // The fields may all cancel out, e.g. a week minus seven days.
  if (here == data + 1)
    return "P0D";
  return {data, static_cast<std::size_t>(here - data)};
}


period string_traits<period>::from_string(std::string_view text, ctx c)
{
  internal::scanner s{text, "interval", c.loc};
  period result;
  parse_iso(s, [&s, &result](iso_field const &f, bool time_part) {
    auto const value{f.negative ? -f.whole : f.whole};
    if (not time_part)
    {
      switch (f.unit)
      {
      case 'Y': result = result + period::from_years(to_int32(s, value)); break;
      case 'M': result = result + period::from_months(to_int32(s, value)); break;
      case 'W': result = result + period::from_weeks(to_int32(s, value)); break;
      case 'D': result = result + period::from_days(to_int32(s, value)); break;
      default: s.fail();
      }
      return;
    }
    switch (f.unit)
    {
    case 'H': result = result + period::from_hours(value); break;
    case 'M': result = result + period::from_minutes(value); break;
    case 'S':
      {
        auto const fraction{f.negative ? -f.fraction : f.fraction};
        result = result + period::from_seconds(value) +
                 period::from_milliseconds(fraction / nanos_per_milli) +
                 period::from_nanoseconds(fraction % nanos_per_milli);
      }
      break;
    default: s.fail();
    }
  });
  return result;
}


std::string_view string_traits<duration>::to_buf(
  std::span<char> buf, duration const &value, ctx c)
{
  if (std::size(buf) < size_buffer(value)) [[unlikely]]
    internal::throw_overrun("duration", c.loc);
  if (value == duration::zero())
    return "PT0S";
  auto const data{std::data(buf)};
  auto here{data};
  *here++ = 'P';
  // Days fold into hours.  At most 2^24 days, so no overflow.
  auto const hours{
    std::abs(value.days()) * 24 + std::abs(value.hours())};
  auto const rest{
    std::abs(value.minutes()) * nanos_per_minute +
    std::abs(value.seconds()) * nanos_per_second +
    std::abs(value.subsecond_nanoseconds())};
  here = time_fields_into_buf(here, value.is_negative(), hours, rest);
  return {data, static_cast<std::size_t>(here - data)};
}


duration string_traits<duration>::from_string(std::string_view text, ctx c)
{
  internal::scanner s{text, "duration", c.loc};
  auto result{duration::zero()};
  parse_iso(s, [&s, &result, &c](iso_field const &f, bool time_part) {
    auto const value{f.negative ? -f.whole : f.whole};
    if (not time_part)
    {
      if (f.unit != 'D')
        s.fail();
      result = result + duration::from_days(value, c.loc);
      return;
    }
    switch (f.unit)
    {
    case 'H': result = result + duration::from_hours(value, c.loc); break;
    case 'M': result = result + duration::from_minutes(value, c.loc); break;
    case 'S':
      result = result + duration::from_seconds(value, c.loc) +
               duration::from_nanoseconds(
                 f.negative ? -f.fraction : f.fraction, c.loc);
      break;
    default: s.fail();
    }
  });
  return result;
}
} // namespace pgchrono
