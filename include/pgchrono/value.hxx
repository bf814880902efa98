/* A temporal value of any supported kind.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgchrono/value instead.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_VALUE
#define PGCHRONO_H_VALUE

#if !defined(PGCHRONO_HEADER_PRE)
#  error "Include pgchrono headers as <pgchrono/header>, not <pgchrono/header.hxx>."
#endif

#include <string_view>
#include <variant>
#include <vector>

#include "pgchrono/period.hxx"
#include "pgchrono/range.hxx"
#include "pgchrono/time.hxx"
#include "pgchrono/zone.hxx"


namespace pgchrono
{
/// Any one temporal value that can go into a database column.
/** The order of the alternatives matches the order of @ref value_kind.
 */
using temporal_value = std::variant<
  local_date, local_time, local_date_time, offset_time, offset_date_time,
  instant, zoned_date_time, period, duration, interval, date_interval,
  range<local_date>, range<local_date_time>, range<instant>,
  range<zoned_date_time>, range<offset_date_time>, std::vector<interval>,
  std::vector<date_interval>>;


/// The kinds of temporal value.
enum class value_kind
{
  local_date,
  local_time,
  local_date_time,
  offset_time,
  offset_date_time,
  instant,
  zoned_date_time,
  period,
  duration,
  interval,
  date_interval,
  date_range,
  local_date_time_range,
  instant_range,
  zoned_date_time_range,
  offset_date_time_range,
  interval_multirange,
  date_interval_multirange,
};


/// What kind of value is this?
[[nodiscard]] inline value_kind kind_of(temporal_value const &value) noexcept
{
  return static_cast<value_kind>(value.index());
}


/// Human-readable name for a value kind, e.g. for error messages.
[[nodiscard]] PGCHRONO_LIBEXPORT std::string_view
name_of(value_kind kind) noexcept;
} // namespace pgchrono
#endif
