/* Time zones, the time zone registry, and zoned date/time values.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgchrono/zone instead.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_ZONE
#define PGCHRONO_H_ZONE

#if !defined(PGCHRONO_HEADER_PRE)
#  error "Include pgchrono headers as <pgchrono/header>, not <pgchrono/header.hxx>."
#endif

#include <optional>
#include <string>
#include <string_view>

#include <absl/time/time.h>

#include "pgchrono/strconv.hxx"
#include "pgchrono/time.hxx"


namespace pgchrono
{
/// A time zone: a rule for mapping instants to UTC offsets.
/** A zone is either a named zone from the IANA time zone database, such as
 * `Europe/Amsterdam`, or a fixed offset.  Fixed-offset zones have identifiers
 * like `UTC`, `UTC+02`, `UTC-02:30`, or `UTC+01:02:03`.
 *
 * Get these from a @ref time_zone_source.  Zones compare equal if their
 * identifiers are equal.
 */
class PGCHRONO_LIBEXPORT time_zone
{
public:
  /// UTC.
  time_zone();

  [[nodiscard]] std::string const &id() const noexcept { return m_id; }

  /// The offset, if this is a fixed-offset zone.
  [[nodiscard]] std::optional<offset> const &fixed_offset() const noexcept
  {
    return m_fixed;
  }

  /// Offset from UTC in effect at `when`.
  [[nodiscard]] offset offset_at(instant const &when) const;

  /// Map a local date/time in this zone to an instant.
  /** For an ambiguous local time, picks the earlier instant.  For a local
   * time skipped by a transition, shifts forward by the length of the gap.
   */
  [[nodiscard]] instant
  resolve_leniently(local_date_time const &local, sl loc = sl::current()) const;

  bool operator==(time_zone const &rhs) const noexcept
  {
    return m_id == rhs.m_id;
  }

private:
  friend class time_zone_source;
  time_zone(std::string id, absl::TimeZone zone, std::optional<offset> fixed);

  std::string m_id;
  absl::TimeZone m_zone;
  std::optional<offset> m_fixed;
};


/// Registry of time zones: the IANA database plus fixed-offset zones.
/** There is one standard registry, which you get from `standard()`.  It reads
 * the time zone database that Abseil finds on the system.
 */
class PGCHRONO_LIBEXPORT time_zone_source
{
public:
  time_zone_source(time_zone_source const &) = delete;
  time_zone_source &operator=(time_zone_source const &) = delete;

  /// The process-wide registry.
  [[nodiscard]] static time_zone_source const &standard();

  /// Look up a zone by identifier.
  /** @throws argument_error if there is no such zone.
   */
  [[nodiscard]] time_zone
  for_id(std::string_view id, sl loc = sl::current()) const;

  /// Look up a zone by identifier, if it exists.
  [[nodiscard]] std::optional<time_zone> find(std::string_view id) const;

  /// The fixed-offset zone for `off`.  For a zero offset, that's `UTC`.
  [[nodiscard]] time_zone for_offset(offset const &off) const;

  [[nodiscard]] time_zone const &utc() const noexcept { return m_utc; }

private:
  time_zone_source();

  time_zone m_utc;
};


/// An instant, as seen in a particular time zone.
/** Equality requires both the same instant and the same zone.  Ordering goes
 * by instant first, and then by zone identifier.
 */
class PGCHRONO_LIBEXPORT zoned_date_time
{
public:
  /// The Unix epoch, in UTC.
  zoned_date_time() = default;

  /** @throws range_error if the local date/time in `zone` falls outside the
   * supported range.
   */
  zoned_date_time(instant const &when, time_zone zone, sl loc = sl::current());

  [[nodiscard]] instant const &to_instant() const noexcept
  {
    return m_instant;
  }
  [[nodiscard]] time_zone const &zone() const noexcept { return m_zone; }
  [[nodiscard]] offset const &utc_offset() const noexcept { return m_offset; }
  [[nodiscard]] local_date_time const &local() const noexcept
  {
    return m_local;
  }
  [[nodiscard]] offset_date_time to_offset_date_time() const noexcept
  {
    return {m_local, m_offset};
  }

  bool operator==(zoned_date_time const &rhs) const noexcept
  {
    return m_instant == rhs.m_instant and m_zone == rhs.m_zone;
  }
  [[nodiscard]] bool operator<(zoned_date_time const &rhs) const noexcept;

private:
  instant m_instant;
  time_zone m_zone;
  offset m_offset;
  local_date_time m_local;
};


/// Text for a zoned value: its local date and time, and offset.
/** This loses the zone identifier.  There is no conversion from text, since
 * text from PostgreSQL does not carry a zone.
 */
template<> struct PGCHRONO_LIBEXPORT string_traits<zoned_date_time> final
{
  static constexpr bool converts_to_string{true};
  static constexpr bool converts_from_string{false};

  [[nodiscard]] static std::string_view
  to_buf(std::span<char> buf, zoned_date_time const &value, ctx = {});

  static std::size_t
  into_buf(std::span<char> buf, zoned_date_time const &value, ctx c = {})
  {
    return internal::into_buf_via_to_buf(buf, value, c);
  }

  [[nodiscard]] static constexpr std::size_t
  size_buffer(zoned_date_time const &) noexcept
  {
    return 56;
  }
};
} // namespace pgchrono
#endif
