/** Implementation of instant intervals and date intervals.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgchrono-source.hxx"

#include "pgchrono/internal/header-pre.hxx"

#include "pgchrono/internal/concat.hxx"
#include "pgchrono/range.hxx"

#include "pgchrono/internal/header-post.hxx"


namespace pgchrono
{
interval::interval(
  std::optional<instant> start, std::optional<instant> end, sl loc) :
        m_start{start}, m_end{end}
{
  if (m_start.has_value() and m_end.has_value() and *m_end < *m_start)
    throw argument_error{
      internal::concat(
        "Interval ends (", to_string(*m_end), ") before it starts (",
        to_string(*m_start), ")."),
      loc};
}


bool interval::contains(instant const &when) const noexcept
{
  return (not m_start.has_value() or not(when < *m_start)) and
         (not m_end.has_value() or when < *m_end);
}


range<instant> interval::to_range() const
{
  range_bound<instant> lower{no_bound{}}, upper{no_bound{}};
  if (m_start.has_value())
    lower = inclusive_bound<instant>{*m_start};
  if (m_end.has_value())
    upper = exclusive_bound<instant>{*m_end};
  return {lower, upper};
}


date_interval::date_interval(local_date start, local_date end, sl loc) :
        m_start{start}, m_end{end}
{
  if (m_end < m_start)
    throw argument_error{
      internal::concat(
        "Date interval ends (", to_string(m_end), ") before it starts (",
        to_string(m_start), ")."),
      loc};
}


range<local_date> date_interval::to_range() const
{
  return {inclusive_bound<local_date>{m_start}, inclusive_bound<local_date>{m_end}};
}


interval string_traits<interval>::from_string(std::string_view text, ctx c)
{
  auto const value{pgchrono::from_string<range<instant>>(text, c)};
  if (value.empty())
    return {instant{}, instant{}, c.loc};

  auto const &lower{value.lower_bound()}, &upper{value.upper_bound()};
  if (lower.is_exclusive() or upper.is_inclusive())
    throw conversion_error{
      internal::concat(
        "Range does not have the [start,end) shape of an interval: '", text,
        "'."),
      c.loc};
  std::optional<instant> start, end;
  if (lower.is_limited())
    start = *lower.value();
  if (upper.is_limited())
    end = *upper.value();
  return {start, end, c.loc};
}


date_interval
string_traits<date_interval>::from_string(std::string_view text, ctx c)
{
  auto const value{pgchrono::from_string<range<local_date>>(text, c)};
  if (value.empty())
    throw conversion_error{
      internal::concat("Empty range can't be a date interval: '", text, "'."),
      c.loc};

  auto const &lower{value.lower_bound()}, &upper{value.upper_bound()};
  auto start{lower.is_limited() ? *lower.value() : local_date::min()};
  auto end{upper.is_limited() ? *upper.value() : local_date::max()};
  if (lower.is_exclusive())
    start = start.plus_days(1, c.loc);
  if (upper.is_exclusive())
    end = end.plus_days(-1, c.loc);
  if (end < start)
    throw conversion_error{
      internal::concat("Range holds no dates: '", text, "'."), c.loc};
  return {start, end, c.loc};
}
} // namespace pgchrono
