/** Implementation of the type mapping source.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgchrono-source.hxx"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdlib>
#include <utility>

#include "pgchrono/internal/header-pre.hxx"

#include "pgchrono/internal/concat.hxx"
#include "pgchrono/literal.hxx"
#include "pgchrono/mapping.hxx"

#include "pgchrono/internal/header-post.hxx"


namespace
{
using namespace std::literals;
using pgchrono::value_kind;
using pgchrono::internal::concat;

constexpr std::string_view timestamp_name{"timestamp without time zone"sv},
  timestamptz_name{"timestamp with time zone"sv};


/// A PostgreSQL store type that we know about.
struct store_type_info
{
  /// Canonical name.
  std::string_view name;
  /// Short alias, if any.
  std::string_view alias;
  pgchrono::oid type_oid;
  /// Does the type take a fractional-seconds precision facet?
  bool takes_precision;
  /// Canonical name of the element type, for range and multirange types.
  std::string_view subtype;
  value_kind default_kind;
};


constexpr std::array<store_type_info, 11> store_types{{
  {"date"sv, ""sv, 1082, false, ""sv, value_kind::local_date},
  {"time without time zone"sv, "time"sv, 1083, true, ""sv,
   value_kind::local_time},
  {"time with time zone"sv, "timetz"sv, 1266, true, ""sv,
   value_kind::offset_time},
  {timestamp_name, "timestamp"sv, 1114, true, ""sv,
   value_kind::local_date_time},
  {timestamptz_name, "timestamptz"sv, 1184, true, ""sv, value_kind::instant},
  {"interval"sv, ""sv, 1186, true, ""sv, value_kind::period},
  {"daterange"sv, ""sv, 3912, false, "date"sv, value_kind::date_interval},
  {"tsrange"sv, ""sv, 3908, false, timestamp_name,
   value_kind::local_date_time_range},
  {"tstzrange"sv, ""sv, 3910, false, timestamptz_name, value_kind::interval},
  {"datemultirange"sv, ""sv, 4535, false, "daterange"sv,
   value_kind::date_interval_multirange},
  {"tstzmultirange"sv, ""sv, 4534, false, "tstzrange"sv,
   value_kind::interval_multirange},
}};


struct compatibility_entry
{
  value_kind kind;
  std::string_view store_type;
  pgchrono::compatibility level;
};


/// Every combination that is not listed here is rejected.
/** For each kind, the first entry is its default store type.
 */
constexpr std::array<compatibility_entry, 19> compatibility_table{{
  {value_kind::local_date, "date"sv, pgchrono::compatibility::allowed},
  {value_kind::local_time, "time without time zone"sv,
   pgchrono::compatibility::allowed},
  {value_kind::local_date_time, timestamp_name,
   pgchrono::compatibility::allowed},
  {value_kind::offset_time, "time with time zone"sv,
   pgchrono::compatibility::allowed},
  {value_kind::offset_date_time, timestamptz_name,
   pgchrono::compatibility::allowed},
  {value_kind::instant, timestamptz_name, pgchrono::compatibility::allowed},
  {value_kind::instant, timestamp_name,
   pgchrono::compatibility::legacy_allowed},
  {value_kind::zoned_date_time, timestamptz_name,
   pgchrono::compatibility::allowed},
  {value_kind::period, "interval"sv, pgchrono::compatibility::allowed},
  {value_kind::duration, "interval"sv, pgchrono::compatibility::allowed},
  {value_kind::interval, "tstzrange"sv, pgchrono::compatibility::allowed},
  {value_kind::date_interval, "daterange"sv,
   pgchrono::compatibility::allowed},
  {value_kind::date_range, "daterange"sv, pgchrono::compatibility::allowed},
  {value_kind::local_date_time_range, "tsrange"sv,
   pgchrono::compatibility::allowed},
  {value_kind::instant_range, "tstzrange"sv,
   pgchrono::compatibility::allowed},
  {value_kind::zoned_date_time_range, "tstzrange"sv,
   pgchrono::compatibility::allowed},
  {value_kind::offset_date_time_range, "tstzrange"sv,
   pgchrono::compatibility::allowed},
  {value_kind::interval_multirange, "tstzmultirange"sv,
   pgchrono::compatibility::allowed},
  {value_kind::date_interval_multirange, "datemultirange"sv,
   pgchrono::compatibility::allowed},
}};


/// Kind of the elements of a range or multirange kind.
std::optional<value_kind> element_kind(value_kind kind) noexcept
{
  switch (kind)
  {
  case value_kind::interval: return value_kind::instant;
  case value_kind::date_interval: return value_kind::local_date;
  case value_kind::date_range: return value_kind::local_date;
  case value_kind::local_date_time_range: return value_kind::local_date_time;
  case value_kind::instant_range: return value_kind::instant;
  case value_kind::zoned_date_time_range: return value_kind::zoned_date_time;
  case value_kind::offset_date_time_range:
    return value_kind::offset_date_time;
  case value_kind::interval_multirange: return value_kind::interval;
  case value_kind::date_interval_multirange: return value_kind::date_interval;
  default: return {};
  }
}


store_type_info const *find_store_type(std::string_view name) noexcept
{
  auto const found{std::find_if(
    std::begin(store_types), std::end(store_types),
    [name](store_type_info const &info) {
      return info.name == name or
             (not std::empty(info.alias) and info.alias == name);
    })};
  return (found == std::end(store_types)) ? nullptr : &*found;
}


/// A store type name, taken apart.
struct parsed_store_type
{
  store_type_info const *info;
  std::optional<int> precision;
};


inline bool is_space(char c) noexcept
{
  return c == ' ' or c == '\t' or c == '\n' or c == '\r' or c == '\f' or
         c == '\v';
}


/// Lower-case `text`, trim it, and collapse runs of whitespace.
std::string normalise(std::string_view text)
{
  std::string out;
  out.reserve(std::size(text));
  bool space{false};
  for (char const c : text)
  {
    if (is_space(c))
    {
      space = true;
      continue;
    }
    if (space and not std::empty(out))
      out.push_back(' ');
    space = false;
    out.push_back(
      (c >= 'A' and c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c);
  }
  return out;
}


/// Parse a store type name, e.g. `TIMESTAMP(3) WITH TIME ZONE`.
std::optional<parsed_store_type> parse_store_type(std::string_view text)
{
  auto name{normalise(text)};
  std::optional<int> precision;
  if (auto const open{name.find('(')}; open != std::string::npos)
  {
    auto const close{name.find(')', open)};
    if (close == std::string::npos)
      return {};
    auto const digits{std::string_view{name}.substr(open + 1, close - open - 1)};
    int value{0};
    auto const res{std::from_chars(
      std::data(digits), std::data(digits) + std::size(digits), value)};
    if (
      std::empty(digits) or res.ec != std::errc{} or
      res.ptr != std::data(digits) + std::size(digits) or value < 0 or
      value > 6)
      return {};
    precision = value;

    std::string_view left{std::string_view{name}.substr(0, open)},
      right{std::string_view{name}.substr(close + 1)};
    if (not std::empty(left) and left.back() == ' ')
      left.remove_suffix(1);
    if (not std::empty(right) and right.front() == ' ')
      right.remove_prefix(1);
    name = std::empty(right) ? std::string{left} : concat(left, ' ', right);
  }

  auto const info{find_store_type(name)};
  if (info == nullptr)
    return {};
  if (precision.has_value() and not info->takes_precision)
    return {};
  return parsed_store_type{info, precision};
}


/// Canonical name with a precision facet, after the first word.
std::string with_precision(std::string_view name, std::optional<int> precision)
{
  if (not precision.has_value())
    return std::string{name};
  auto const space{name.find(' ')};
  if (space == std::string_view::npos)
    return concat(name, '(', *precision, ')');
  return concat(
    name.substr(0, space), '(', *precision, ')', name.substr(space));
}


bool is_truthy(std::string_view text)
{
  auto const value{normalise(text)};
  return value == "1"sv or value == "true"sv or value == "on"sv or
         value == "yes"sv;
}
} // namespace


namespace pgchrono
{
std::string_view name_of(value_kind kind) noexcept
{
  switch (kind)
  {
  case value_kind::local_date: return "local_date"sv;
  case value_kind::local_time: return "local_time"sv;
  case value_kind::local_date_time: return "local_date_time"sv;
  case value_kind::offset_time: return "offset_time"sv;
  case value_kind::offset_date_time: return "offset_date_time"sv;
  case value_kind::instant: return "instant"sv;
  case value_kind::zoned_date_time: return "zoned_date_time"sv;
  case value_kind::period: return "period"sv;
  case value_kind::duration: return "duration"sv;
  case value_kind::interval: return "interval"sv;
  case value_kind::date_interval: return "date_interval"sv;
  case value_kind::date_range: return "range<local_date>"sv;
  case value_kind::local_date_time_range: return "range<local_date_time>"sv;
  case value_kind::instant_range: return "range<instant>"sv;
  case value_kind::zoned_date_time_range: return "range<zoned_date_time>"sv;
  case value_kind::offset_date_time_range: return "range<offset_date_time>"sv;
  case value_kind::interval_multirange: return "interval multirange"sv;
  case value_kind::date_interval_multirange:
    return "date_interval multirange"sv;
  }
  return "unknown value kind"sv;
}


mapping_options mapping_options::from_env()
{
  mapping_options options;
  if (char const *const value{
        std::getenv("PGCHRONO_LEGACY_TIMESTAMP_BEHAVIOR")};
      value != nullptr)
    options.legacy_timestamp_behavior = is_truthy(value);
  return options;
}


type_mapping::type_mapping(
  value_kind kind, std::string store_type, std::optional<int> precision,
  oid type_oid, std::shared_ptr<type_mapping const> subtype, bool legacy) :
        m_kind{kind},
        m_store_type{std::move(store_type)},
        m_precision{precision},
        m_oid{type_oid},
        m_subtype{std::move(subtype)},
        m_legacy{legacy}
{}


std::string
type_mapping::sql_literal(temporal_value const &value, sl loc) const
{
  if (kind_of(value) != m_kind)
    throw usage_error{
      concat(
        "Mapping of ", name_of(m_kind), " to '", m_store_type,
        "' cannot render a ", name_of(kind_of(value)), "."),
      loc};
  if (m_legacy)
    return to_timestamp_literal(std::get<instant>(value), loc);
  return to_sql_literal(value, loc);
}


mapping_source::mapping_source(mapping_options options) :
        m_options{std::move(options)}
{}


mapping_source const &mapping_source::instance()
{
  static mapping_source const source{mapping_options::from_env()};
  return source;
}


compatibility
mapping_source::compatible(value_kind kind, std::string_view store_type)
{
  auto const parsed{parse_store_type(store_type)};
  if (not parsed.has_value())
    return compatibility::rejected;
  for (auto const &entry : compatibility_table)
    if (entry.kind == kind and entry.store_type == parsed->info->name)
      return entry.level;
  return compatibility::rejected;
}


std::optional<type_mapping> mapping_source::find_mapping(value_kind kind) const
{
  if (kind == value_kind::instant and m_options.legacy_timestamp_behavior)
    return find_mapping(kind, timestamp_name);
  for (auto const &entry : compatibility_table)
    if (entry.kind == kind)
      return find_mapping(kind, entry.store_type);
  return {};
}


std::optional<type_mapping>
mapping_source::find_mapping(std::string_view store_type) const
{
  auto const parsed{parse_store_type(store_type)};
  if (not parsed.has_value())
    return {};
  auto kind{parsed->info->default_kind};
  if (
    m_options.legacy_timestamp_behavior and
    parsed->info->name == timestamp_name)
    kind = value_kind::instant;
  return find_mapping(kind, store_type);
}


std::optional<type_mapping>
mapping_source::find_mapping(value_kind kind, std::string_view store_type) const
{
  auto const parsed{parse_store_type(store_type)};
  if (not parsed.has_value())
    return {};
  auto const level{compatible(kind, parsed->info->name)};
  if (level == compatibility::rejected)
    return {};

  auto const &info{*parsed->info};
  if (
    level == compatibility::legacy_allowed and
    not m_options.legacy_timestamp_behavior and m_options.notice_handler)
    m_options.notice_handler(concat(
      "Mapping ", name_of(kind), " to '", info.name,
      "' for compatibility with a legacy schema.  Values will be stored as "
      "UTC wall-clock times.\n"));

  std::shared_ptr<type_mapping const> subtype;
  if (not std::empty(info.subtype))
  {
    auto const element{element_kind(kind)};
    if (not element.has_value())
      throw internal_error{concat(
        "No element kind for ", name_of(kind), " in '", info.name, "'.")};
    auto sub{find_mapping(*element, info.subtype)};
    if (not sub.has_value())
      throw internal_error{concat(
        "No mapping for ", name_of(*element), " in '", info.subtype, "'.")};
    subtype = std::make_shared<type_mapping const>(std::move(*sub));
  }

  return type_mapping{
    kind,
    with_precision(info.name, parsed->precision),
    parsed->precision,
    info.type_oid,
    std::move(subtype),
    level == compatibility::legacy_allowed};
}
} // namespace pgchrono
