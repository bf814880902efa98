/** Implementation of time zones and zoned date/time values.
 *
 * Named zones come from the IANA database, by way of Abseil.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgchrono-source.hxx"

#include <utility>

#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include "pgchrono/internal/header-pre.hxx"

#include "pgchrono/internal/concat.hxx"
#include "pgchrono/zone.hxx"

#include "pgchrono/internal/header-post.hxx"


namespace
{
using namespace std::literals;

constexpr std::int64_t seconds_per_day{86'400};


/// Local date/time of `when` at offset `off`.
/** The sentinel instants map to the sentinel local date/times.
 */
pgchrono::local_date_time local_at(
  pgchrono::instant const &when, pgchrono::offset const &off, pgchrono::sl loc)
{
  if (when == pgchrono::instant::min())
    return pgchrono::local_date_time::min();
  if (when == pgchrono::instant::max())
    return pgchrono::local_date_time::max();
  return when.with_offset(off, loc).local();
}


/// Parse a fixed-offset zone identifier: `UTC`, `UTC+02`, `UTC-02:30` etc.
std::optional<pgchrono::offset> parse_fixed_id(std::string_view id)
{
  if (id == "UTC"sv)
    return pgchrono::offset::zero();
  if (not id.starts_with("UTC"sv))
    return {};
  auto const body{id.substr(3)};
  auto const size{std::size(body)};
  if (size < 3 or (body[0] != '+' and body[0] != '-'))
    return {};

  // Two digits at `pos`, or -1.
  auto const two_digits{[&body, size](std::size_t pos) {
    if (
      pos + 2 > size or not pgchrono::internal::is_digit(body[pos]) or
      not pgchrono::internal::is_digit(body[pos + 1]))
      return -1;
    return 10 * pgchrono::internal::digit_to_number(body[pos]) +
           pgchrono::internal::digit_to_number(body[pos + 1]);
  }};

  int fields[3]{two_digits(1), 0, 0};
  if (fields[0] < 0)
    return {};
  std::size_t pos{3};
  for (int i{1}; i < 3 and pos < size; ++i, pos += 3)
  {
    if (body[pos] != ':')
      return {};
    fields[i] = two_digits(pos + 1);
    if (fields[i] < 0 or fields[i] >= 60)
      return {};
  }
  if (pos != size)
    return {};

  int const total{fields[0] * 3600 + fields[1] * 60 + fields[2]};
  if (total > pgchrono::offset::max_seconds)
    return {};
  return pgchrono::offset::from_seconds((body[0] == '-') ? -total : total);
}


/// Seconds since the epoch, rounded down.
std::int64_t unix_seconds(pgchrono::instant const &when) noexcept
{
  return when.days_since_epoch() * seconds_per_day +
         when.nanosecond_of_day() / pgchrono::nanos_per_second;
}
} // namespace


namespace pgchrono
{
time_zone::time_zone() :
        m_id{"UTC"}, m_zone{absl::UTCTimeZone()}, m_fixed{offset::zero()}
{}


time_zone::time_zone(
  std::string id, absl::TimeZone zone, std::optional<offset> fixed) :
        m_id{std::move(id)}, m_zone{zone}, m_fixed{fixed}
{}


offset time_zone::offset_at(instant const &when) const
{
  if (m_fixed.has_value())
    return *m_fixed;
  auto const info{m_zone.At(absl::FromUnixSeconds(unix_seconds(when)))};
  return offset::from_seconds(info.offset);
}


instant
time_zone::resolve_leniently(local_date_time const &local, sl loc) const
{
  if (m_fixed.has_value())
    return offset_date_time{local, *m_fixed}.to_instant(loc);

  auto const &date{local.date()};
  auto const &time{local.time()};
  absl::CivilSecond const civil{date.year(),   date.month(),  date.day(),
                                time.hour(),   time.minute(), time.second()};
  // For a skipped time, "pre" applies the offset from before the transition,
  // which pushes the result forward past the gap.  For a repeated time, it
  // is the earlier of the two.
  auto const info{m_zone.At(civil)};
  return instant::from_unix_time_seconds(absl::ToUnixSeconds(info.pre), loc)
    .plus_nanoseconds(time.nanosecond_of_second(), loc);
}


time_zone_source::time_zone_source() = default;


time_zone_source const &time_zone_source::standard()
{
  static time_zone_source const instance;
  return instance;
}


time_zone time_zone_source::for_id(std::string_view id, sl loc) const
{
  auto zone{find(id)};
  if (not zone.has_value())
    throw argument_error{
      internal::concat("Unknown time zone: '", id, "'."), loc};
  return std::move(*zone);
}


std::optional<time_zone> time_zone_source::find(std::string_view id) const
{
  if (auto const fixed{parse_fixed_id(id)}; fixed.has_value())
    return for_offset(*fixed);
  absl::TimeZone zone;
  if (std::empty(id) or not absl::LoadTimeZone(std::string{id}, &zone))
    return {};
  return time_zone{std::string{id}, zone, std::nullopt};
}


time_zone time_zone_source::for_offset(offset const &off) const
{
  if (off == offset::zero())
    return m_utc;
  return time_zone{
    internal::concat("UTC", to_string(off)),
    absl::FixedTimeZone(off.seconds()), off};
}


zoned_date_time::zoned_date_time(instant const &when, time_zone zone, sl loc) :
        m_instant{when},
        m_zone{std::move(zone)},
        m_offset{m_zone.offset_at(when)},
        m_local{local_at(when, m_offset, loc)}
{}


bool zoned_date_time::operator<(zoned_date_time const &rhs) const noexcept
{
  if (m_instant != rhs.m_instant)
    return m_instant < rhs.m_instant;
  return m_zone.id() < rhs.m_zone.id();
}


zoned_date_time local_date_time::in_utc(sl loc) const
{
  return {
    instant::from_days_and_nanoseconds(
      m_date.days_since_epoch(), m_time.nanosecond_of_day(), loc),
    time_zone_source::standard().utc(), loc};
}


zoned_date_time
local_date_time::in_zone_leniently(time_zone const &zone, sl loc) const
{
  return {zone.resolve_leniently(*this, loc), zone, loc};
}


zoned_date_time instant::in_utc() const
{
  return {*this, time_zone_source::standard().utc()};
}


zoned_date_time instant::in_zone(time_zone const &zone) const
{
  return {*this, zone};
}


std::string_view string_traits<zoned_date_time>::to_buf(
  std::span<char> buf, zoned_date_time const &value, ctx c)
{
  if (std::size(buf) < size_buffer(value)) [[unlikely]]
    internal::throw_overrun("zoned date/time", c.loc);
  if (value.to_instant() == instant::min()) [[unlikely]]
    return "-infinity";
  if (value.to_instant() == instant::max()) [[unlikely]]
    return "infinity";
  auto const end{internal::write_date_time_offset(
    std::data(buf), value.local(), value.utc_offset())};
  return {std::data(buf), static_cast<std::size_t>(end - std::data(buf))};
}
} // namespace pgchrono
