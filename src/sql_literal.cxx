/** Rendering of temporal values as typed SQL literals.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgchrono-source.hxx"

#include <cstdlib>
#include <limits>

#include "pgchrono/internal/header-pre.hxx"

#include "pgchrono/internal/arith.hxx"
#include "pgchrono/internal/concat.hxx"
#include "pgchrono/literal.hxx"

#include "pgchrono/internal/header-post.hxx"


namespace
{
using namespace std::literals;
using pgchrono::internal::concat;

/// Nanoseconds in PostgreSQL's time unit, the microsecond.
constexpr std::int64_t nanos_per_micro{1'000};

/// PostgreSQL's limit on UTC offsets, in seconds (exclusive).
constexpr int max_sql_offset_seconds{16 * 3600};


/// PostgreSQL's earliest date, 4714-11-24 BC.
pgchrono::local_date const &earliest_sql_date()
{
  static pgchrono::local_date const day{-4713, 11, 24};
  return day;
}


[[noreturn]] void
throw_unrepresentable(std::string_view what, std::string_view why, pgchrono::sl loc)
{
  throw pgchrono::unrepresentable_value{
    concat("Cannot write ", what, " as SQL: ", why, "."), loc};
}


void check_micros(std::int64_t nanos, std::string_view what, pgchrono::sl loc)
{
  if (nanos % nanos_per_micro != 0)
    throw_unrepresentable(what, "it has sub-microsecond precision"sv, loc);
}


void check_day(
  std::int64_t days_since_epoch, std::string_view what, pgchrono::sl loc)
{
  if (days_since_epoch < earliest_sql_date().days_since_epoch())
    throw_unrepresentable(what, "it lies before 4714-11-24 BC"sv, loc);
}


void check_offset(pgchrono::offset const &off, pgchrono::sl loc)
{
  if (std::abs(off.seconds()) >= max_sql_offset_seconds)
    throw_unrepresentable(
      concat("UTC offset ", pgchrono::to_string(off)),
      "PostgreSQL supports offsets of less than 16 hours"sv, loc);
}


std::string date_text(pgchrono::local_date const &value, pgchrono::sl loc)
{
  if (value != pgchrono::local_date::min())
    check_day(value.days_since_epoch(), "date"sv, loc);
  return pgchrono::to_string(value);
}


std::string time_text(pgchrono::local_time const &value, pgchrono::sl loc)
{
  check_micros(value.nanosecond_of_day(), "time"sv, loc);
  return pgchrono::to_string(value);
}


std::string
timestamp_text(pgchrono::local_date_time const &value, pgchrono::sl loc)
{
  if (
    value == pgchrono::local_date_time::min() or
    value == pgchrono::local_date_time::max())
    return pgchrono::to_string(value);
  check_day(value.date().days_since_epoch(), "timestamp"sv, loc);
  check_micros(value.time().nanosecond_of_day(), "timestamp"sv, loc);
  return pgchrono::to_string(value);
}


std::string instant_text(pgchrono::instant const &value, pgchrono::sl loc)
{
  if (value == pgchrono::instant::min() or value == pgchrono::instant::max())
    return pgchrono::to_string(value);
  check_day(value.days_since_epoch(), "instant"sv, loc);
  check_micros(value.nanosecond_of_day(), "instant"sv, loc);
  return pgchrono::to_string(value);
}


std::string
offset_date_time_text(pgchrono::offset_date_time const &value, pgchrono::sl loc)
{
  auto const &local{value.local()};
  if (local == pgchrono::local_date_time::min())
    return "-infinity";
  if (local == pgchrono::local_date_time::max())
    return "infinity";
  check_offset(value.utc_offset(), loc);
  check_micros(local.time().nanosecond_of_day(), "timestamp"sv, loc);
  // PostgreSQL checks the date in UTC.
  auto const utc_day{
    local.date().days_since_epoch() +
    pgchrono::internal::floor_div(
      local.time().nanosecond_of_day() - value.utc_offset().nanoseconds(),
      pgchrono::nanos_per_day)};
  check_day(utc_day, "timestamp"sv, loc);
  return pgchrono::to_string(value);
}


std::string zoned_text(pgchrono::zoned_date_time const &value, pgchrono::sl loc)
{
  auto const &when{value.to_instant()};
  if (when == pgchrono::instant::min())
    return "-infinity";
  if (when == pgchrono::instant::max())
    return "infinity";
  return offset_date_time_text(value.to_offset_date_time(), loc);
}


/// Append a range bound, in double quotes if `quote` is set.
void append_bound(std::string &out, std::string const &text, bool quote)
{
  if (quote)
    out.push_back('"');
  out.append(text);
  if (quote)
    out.push_back('"');
}


/// Range text, without the outer single quotes.
template<typename TYPE, typename RENDER>
std::string
range_text(pgchrono::range<TYPE> const &value, bool quote, RENDER const &render)
{
  if (value.empty())
    return "empty";
  std::string out;
  out.push_back(value.lower_bound().is_inclusive() ? '[' : '(');
  if (TYPE const *lower{value.lower_bound().value()}; lower != nullptr)
    append_bound(out, render(*lower), quote);
  out.push_back(',');
  if (TYPE const *upper{value.upper_bound().value()}; upper != nullptr)
    append_bound(out, render(*upper), quote);
  out.push_back(value.upper_bound().is_inclusive() ? ']' : ')');
  return out;
}


/// Apply `convert` to each bound of a range, keeping bound types.
template<typename OUT, typename IN, typename CONVERT>
pgchrono::range<OUT> map_range(
  pgchrono::range<IN> const &value, CONVERT const &convert, pgchrono::sl loc)
{
  if (value.empty())
    return {};
  auto const map_bound{
    [&convert](pgchrono::range_bound<IN> const &bound)
      -> pgchrono::range_bound<OUT> {
      if (not bound.is_limited())
        return pgchrono::no_bound{};
      else if (bound.is_inclusive())
        return pgchrono::inclusive_bound<OUT>{convert(*bound.value())};
      else
        return pgchrono::exclusive_bound<OUT>{convert(*bound.value())};
    }};
  return {map_bound(value.lower_bound()), map_bound(value.upper_bound()), loc};
}


std::string quoted_literal(std::string_view text, std::string_view type)
{
  return concat("'", text, "'::", type);
}


std::string instant_range_literal(
  pgchrono::range<pgchrono::instant> const &value, pgchrono::sl loc)
{
  return quoted_literal(
    range_text(
      value, true,
      [loc](pgchrono::instant const &v) { return instant_text(v, loc); }),
    "tstzrange"sv);
}


template<typename ELEMENT, typename RENDER>
std::string multirange_literal(
  std::vector<ELEMENT> const &values, std::string_view type,
  RENDER const &render)
{
  std::string text{"{"};
  bool first{true};
  for (auto const &value : values)
  {
    if (not first)
      text.push_back(',');
    first = false;
    text.append(render(value));
  }
  text.push_back('}');
  return quoted_literal(text, type);
}
} // namespace


namespace pgchrono
{
std::string to_sql_literal(local_date const &value, sl loc)
{
  return concat("DATE '", date_text(value, loc), "'");
}


std::string to_sql_literal(local_time const &value, sl loc)
{
  return concat("TIME '", time_text(value, loc), "'");
}


std::string to_sql_literal(local_date_time const &value, sl loc)
{
  return concat("TIMESTAMP '", timestamp_text(value, loc), "'");
}


std::string to_sql_literal(offset_time const &value, sl loc)
{
  check_micros(value.time().nanosecond_of_day(), "time"sv, loc);
  check_offset(value.utc_offset(), loc);
  return concat("TIMETZ '", to_string(value), "'");
}


std::string to_sql_literal(offset_date_time const &value, sl loc)
{
  return concat("TIMESTAMPTZ '", offset_date_time_text(value, loc), "'");
}


std::string to_sql_literal(instant const &value, sl loc)
{
  return concat("TIMESTAMPTZ '", instant_text(value, loc), "'");
}


std::string to_sql_literal(zoned_date_time const &value, sl loc)
{
  return concat("TIMESTAMPTZ '", zoned_text(value, loc), "'");
}


std::string to_sql_literal(period const &value, sl loc)
{
  constexpr std::int64_t lo{std::numeric_limits<std::int32_t>::min()},
    hi{std::numeric_limits<std::int32_t>::max()};
  auto const months{value.total_months()}, days{value.total_days()};
  if (months < lo or months > hi)
    throw_unrepresentable("period"sv, "its months overflow 32 bits"sv, loc);
  if (days < lo or days > hi)
    throw_unrepresentable("period"sv, "its days overflow 32 bits"sv, loc);
  auto const time{value.time_nanoseconds()};
  if (not time.has_value())
    throw_unrepresentable(
      "period"sv, "its time units overflow 64-bit nanoseconds"sv, loc);
  check_micros(*time, "period"sv, loc);
  return concat("INTERVAL '", to_string(value, loc), "'");
}


std::string to_sql_literal(duration const &value, sl loc)
{
  check_micros(value.subsecond_nanoseconds(), "duration"sv, loc);
  return concat("INTERVAL '", to_string(value, loc), "'");
}


std::string to_sql_literal(interval const &value, sl loc)
{
  return quoted_literal(
    range_text(
      value.to_range(), false,
      [loc](instant const &v) { return instant_text(v, loc); }),
    "tstzrange"sv);
}


std::string to_sql_literal(date_interval const &value, sl loc)
{
  return to_sql_literal(value.to_range(), loc);
}


std::string to_sql_literal(range<local_date> const &value, sl loc)
{
  return quoted_literal(
    range_text(
      value, false, [loc](local_date const &v) { return date_text(v, loc); }),
    "daterange"sv);
}


std::string to_sql_literal(range<local_date_time> const &value, sl loc)
{
  return quoted_literal(
    range_text(
      value, true,
      [loc](local_date_time const &v) { return timestamp_text(v, loc); }),
    "tsrange"sv);
}


std::string to_sql_literal(range<instant> const &value, sl loc)
{
  return instant_range_literal(value, loc);
}


std::string to_sql_literal(range<zoned_date_time> const &value, sl loc)
{
  return instant_range_literal(
    map_range<instant>(
      value, [](zoned_date_time const &v) { return v.to_instant(); }, loc),
    loc);
}


std::string to_sql_literal(range<offset_date_time> const &value, sl loc)
{
  return instant_range_literal(
    map_range<instant>(
      value,
      [loc](offset_date_time const &v) {
        if (v.local() == local_date_time::min())
          return instant::min();
        if (v.local() == local_date_time::max())
          return instant::max();
        return v.to_instant(loc);
      },
      loc),
    loc);
}


std::string to_sql_literal(std::vector<interval> const &value, sl loc)
{
  return multirange_literal(
    value, "tstzmultirange"sv, [loc](interval const &v) {
      return range_text(
        v.to_range(), false,
        [loc](instant const &i) { return instant_text(i, loc); });
    });
}


std::string to_sql_literal(std::vector<date_interval> const &value, sl loc)
{
  return multirange_literal(
    value, "datemultirange"sv, [loc](date_interval const &v) {
      return range_text(
        v.to_range(), false,
        [loc](local_date const &d) { return date_text(d, loc); });
    });
}


std::string to_sql_literal(temporal_value const &value, sl loc)
{
  return std::visit(
    [loc](auto const &v) { return to_sql_literal(v, loc); }, value);
}


std::string to_timestamp_literal(instant const &value, sl loc)
{
  if (value == instant::min())
    return "TIMESTAMP '-infinity'";
  if (value == instant::max())
    return "TIMESTAMP 'infinity'";
  check_day(value.days_since_epoch(), "instant"sv, loc);
  return to_sql_literal(value.utc_date_time(), loc);
}
} // namespace pgchrono
