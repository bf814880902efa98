/* Basic type aliases and forward declarations.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_TYPES
#define PGCHRONO_H_TYPES

#if !defined(PGCHRONO_HEADER_PRE)
#  error "Include pgchrono headers as <pgchrono/header>, not <pgchrono/header.hxx>."
#endif

#include <cstdint>
#include <source_location>


namespace pgchrono
{
/// Convenience alias: a source location, for error reporting.
using sl = std::source_location;


/// PostgreSQL database type OID, as libpq reports it.
using oid = unsigned int;


/// Nanoseconds in a second.
inline constexpr std::int64_t nanos_per_second{1'000'000'000};

/// Nanoseconds in a day.
inline constexpr std::int64_t nanos_per_day{86'400 * nanos_per_second};

/// Nanoseconds in a "tick," the 100-nanosecond unit of many time libraries.
inline constexpr std::int64_t nanos_per_tick{100};


class local_date;
class local_time;
class local_date_time;
class offset;
class offset_time;
class offset_date_time;
class instant;
class time_zone;
class time_zone_source;
class zoned_date_time;
class period;
class duration;
class interval;
class date_interval;
template<typename TYPE> class range;

class type_mapping;
class mapping_source;
} // namespace pgchrono
#endif
