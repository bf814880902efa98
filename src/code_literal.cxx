/** Rendering of temporal values as C++ source code.
 *
 * Each rendering is an expression which, compiled against pgchrono, yields a
 * value equal to the one rendered.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgchrono-source.hxx"

#include <limits>

#include "pgchrono/internal/header-pre.hxx"

#include "pgchrono/internal/concat.hxx"
#include "pgchrono/literal.hxx"

#include "pgchrono/internal/header-post.hxx"


namespace
{
using namespace std::literals;
using pgchrono::internal::concat;

constexpr std::int64_t nanos_per_milli{1'000'000};


/// Decimal literal for `value`.
/** There is no single C++ literal for the most negative 64-bit integer: the
 * minus is an operator, and the positive number doesn't fit.
 */
std::string int_literal(std::int64_t value, pgchrono::sl loc)
{
  if (value == std::numeric_limits<std::int64_t>::min())
    throw pgchrono::unrepresentable_value{
      concat(
        "Cannot write ", value, " as a single C++ integer literal."),
      loc};
  return concat(value);
}


/// C++ spelling of the value type of a range.
template<typename TYPE> constexpr std::string_view type_name{};
template<>
constexpr std::string_view type_name<pgchrono::local_date>{
  "pgchrono::local_date"};
template<>
constexpr std::string_view type_name<pgchrono::local_date_time>{
  "pgchrono::local_date_time"};
template<>
constexpr std::string_view type_name<pgchrono::instant>{"pgchrono::instant"};
template<>
constexpr std::string_view type_name<pgchrono::zoned_date_time>{
  "pgchrono::zoned_date_time"};
template<>
constexpr std::string_view type_name<pgchrono::offset_date_time>{
  "pgchrono::offset_date_time"};
template<>
constexpr std::string_view type_name<pgchrono::interval>{"pgchrono::interval"};
template<>
constexpr std::string_view type_name<pgchrono::date_interval>{
  "pgchrono::date_interval"};


/// Append " + " between terms of a sum.
void add_term(std::string &out, std::string_view term)
{
  if (not std::empty(out))
    out.append(" + ");
  out.append(term);
}


template<typename TYPE>
std::string
bound_literal(pgchrono::range_bound<TYPE> const &bound, pgchrono::sl loc)
{
  if (not bound.is_limited())
    return "pgchrono::no_bound{}";
  return concat(
    bound.is_inclusive() ? "pgchrono::inclusive_bound<"sv :
                           "pgchrono::exclusive_bound<"sv,
    type_name<TYPE>, ">{", pgchrono::to_code_literal(*bound.value(), loc),
    "}");
}


template<typename TYPE>
std::string
range_literal(pgchrono::range<TYPE> const &value, pgchrono::sl loc)
{
  if (value.empty())
    return concat("pgchrono::range<", type_name<TYPE>, ">{}");
  return concat(
    "pgchrono::range<", type_name<TYPE>, ">{",
    bound_literal(value.lower_bound(), loc), ", ",
    bound_literal(value.upper_bound(), loc), "}");
}


template<typename TYPE>
std::string
vector_literal(std::vector<TYPE> const &values, pgchrono::sl loc)
{
  std::string out{concat("std::vector<", type_name<TYPE>, ">{")};
  bool first{true};
  for (auto const &value : values)
  {
    if (not first)
      out.append(", ");
    first = false;
    out.append(pgchrono::to_code_literal(value, loc));
  }
  out.push_back('}');
  return out;
}
} // namespace


namespace pgchrono
{
std::string to_code_literal(local_date const &value, sl)
{
  if (value == local_date::min())
    return "pgchrono::local_date::min()";
  if (value == local_date::max())
    return "pgchrono::local_date::max()";
  return concat(
    "pgchrono::local_date{", value.year(), ", ", value.month(), ", ",
    value.day(), "}");
}


std::string to_code_literal(local_time const &value, sl)
{
  auto const nanos{value.nanosecond_of_second()};
  if (nanos % nanos_per_milli != 0)
    return concat(
      "pgchrono::local_time::from_hour_minute_second_nanosecond(",
      value.hour(), ", ", value.minute(), ", ", value.second(), ", ", nanos,
      ")");

  std::string out{
    concat("pgchrono::local_time{", value.hour(), ", ", value.minute())};
  if (value.second() != 0 or nanos != 0)
    out += concat(", ", value.second());
  if (nanos != 0)
    out += concat(", ", nanos / nanos_per_milli);
  out.push_back('}');
  return out;
}


std::string to_code_literal(local_date_time const &value, sl)
{
  if (value == local_date_time::min())
    return "pgchrono::local_date_time::min()";
  if (value == local_date_time::max())
    return "pgchrono::local_date_time::max()";

  auto const &date{value.date()};
  auto const &time{value.time()};
  auto const nanos{time.nanosecond_of_second()};
  bool const whole_millis{nanos % nanos_per_milli == 0};
  std::string out{concat(
    "pgchrono::local_date_time{", date.year(), ", ", date.month(), ", ",
    date.day(), ", ", time.hour(), ", ", time.minute())};
  if (time.second() != 0 or nanos != 0)
    out += concat(", ", time.second());
  if (nanos != 0 and whole_millis)
    out += concat(", ", nanos / nanos_per_milli);
  out.push_back('}');
  if (not whole_millis)
    out += concat(".plus_nanoseconds(", nanos, ")");
  return out;
}


std::string to_code_literal(offset const &value, sl)
{
  auto const seconds{value.seconds()};
  if (seconds == 0)
    return "pgchrono::offset::zero()";
  if (seconds % 3600 == 0)
    return concat("pgchrono::offset::from_hours(", seconds / 3600, ")");
  if (seconds % 60 == 0)
    return concat(
      "pgchrono::offset::from_hours_and_minutes(", seconds / 3600, ", ",
      (seconds % 3600) / 60, ")");
  return concat("pgchrono::offset::from_seconds(", seconds, ")");
}


std::string to_code_literal(offset_time const &value, sl loc)
{
  return concat(
    "pgchrono::offset_time{", to_code_literal(value.time(), loc), ", ",
    to_code_literal(value.utc_offset(), loc), "}");
}


std::string to_code_literal(offset_date_time const &value, sl loc)
{
  return concat(
    "pgchrono::offset_date_time{", to_code_literal(value.local(), loc), ", ",
    to_code_literal(value.utc_offset(), loc), "}");
}


std::string to_code_literal(instant const &value, sl loc)
{
  if (value == instant::min())
    return "pgchrono::instant::min()";
  if (value == instant::max())
    return "pgchrono::instant::max()";
  std::string out{concat(
    "pgchrono::instant::from_unix_time_ticks(",
    int_literal(value.unix_time_ticks(), loc), ")")};
  // Ticks round down, so the remainder is never negative.
  auto const rest{value.nanosecond_of_day() % nanos_per_tick};
  if (rest != 0)
    out += concat(".plus_nanoseconds(", rest, ")");
  return out;
}


std::string to_code_literal(zoned_date_time const &value, sl loc)
{
  return concat(
    "pgchrono::zoned_date_time{", to_code_literal(value.to_instant(), loc),
    ", pgchrono::time_zone_source::standard().for_id(",
    quote_code_string(value.zone().id()), ")}");
}


std::string to_code_literal(period const &value, sl loc)
{
  std::string out;
  auto const term{[&out, loc](std::string_view unit, std::int64_t n) {
    if (n != 0)
      add_term(
        out, concat("pgchrono::period::from_", unit, "(", int_literal(n, loc),
                    ")"));
  }};
  term("years"sv, value.years());
  term("months"sv, value.months());
  term("weeks"sv, value.weeks());
  term("days"sv, value.days());
  term("hours"sv, value.hours());
  term("minutes"sv, value.minutes());
  term("seconds"sv, value.seconds());
  term("milliseconds"sv, value.milliseconds());
  term("nanoseconds"sv, value.nanoseconds());
  if (std::empty(out))
    return "pgchrono::period::zero()";
  return out;
}


std::string to_code_literal(duration const &value, sl loc)
{
  std::string out;
  auto const term{[&out, loc](std::string_view unit, std::int64_t n) {
    if (n != 0)
      add_term(
        out, concat(
               "pgchrono::duration::from_", unit, "(", int_literal(n, loc),
               ")"));
  }};
  auto const subsecond{value.subsecond_nanoseconds()};
  term("days"sv, value.days());
  term("hours"sv, value.hours());
  term("minutes"sv, value.minutes());
  term("seconds"sv, value.seconds());
  term("milliseconds"sv, subsecond / nanos_per_milli);
  term("nanoseconds"sv, subsecond % nanos_per_milli);
  if (std::empty(out))
    return "pgchrono::duration::zero()";
  return out;
}


std::string to_code_literal(interval const &value, sl loc)
{
  auto const &start{value.start()};
  auto const &end{value.end()};
  if (start.has_value() and end.has_value())
    return concat(
      "pgchrono::interval{", to_code_literal(*start, loc), ", ",
      to_code_literal(*end, loc), "}");

  auto const bound{[loc](std::optional<instant> const &when) {
    if (not when.has_value())
      return "std::nullopt"s;
    return concat(
      "std::optional<pgchrono::instant>{", to_code_literal(*when, loc), "}");
  }};
  return concat("pgchrono::interval{", bound(start), ", ", bound(end), "}");
}


std::string to_code_literal(date_interval const &value, sl loc)
{
  return concat(
    "pgchrono::date_interval{", to_code_literal(value.start(), loc), ", ",
    to_code_literal(value.end(), loc), "}");
}


std::string to_code_literal(range<local_date> const &value, sl loc)
{
  return range_literal(value, loc);
}


std::string to_code_literal(range<local_date_time> const &value, sl loc)
{
  return range_literal(value, loc);
}


std::string to_code_literal(range<instant> const &value, sl loc)
{
  return range_literal(value, loc);
}


std::string to_code_literal(range<zoned_date_time> const &value, sl loc)
{
  return range_literal(value, loc);
}


std::string to_code_literal(range<offset_date_time> const &value, sl loc)
{
  return range_literal(value, loc);
}


std::string to_code_literal(std::vector<interval> const &value, sl loc)
{
  return vector_literal(value, loc);
}


std::string to_code_literal(std::vector<date_interval> const &value, sl loc)
{
  return vector_literal(value, loc);
}


std::string to_code_literal(temporal_value const &value, sl loc)
{
  return std::visit(
    [loc](auto const &v) { return to_code_literal(v, loc); }, value);
}


std::string quote_code_string(std::string_view text)
{
  std::string out{"\""};
  for (char const c : text)
  {
    switch (c)
    {
    case '"': out.append("\\\""); break;
    case '\\': out.append("\\\\"); break;
    case '\n': out.append("\\n"); break;
    case '\r': out.append("\\r"); break;
    case '\t': out.append("\\t"); break;
    default:
      if (static_cast<unsigned char>(c) < 0x20 or c == 0x7f)
      {
        // Octal escapes stop after three digits, unlike hex ones.
        auto const code{static_cast<unsigned char>(c)};
        out.push_back('\\');
        out.push_back(internal::number_to_digit(code >> 6));
        out.push_back(internal::number_to_digit((code >> 3) & 7));
        out.push_back(internal::number_to_digit(code & 7));
      }
      else
      {
        out.push_back(c);
      }
      break;
    }
  }
  out.push_back('"');
  return out;
}
} // namespace pgchrono
