/* Definition of pgchrono exception classes.
 *
 * pgchrono::conversion_error, pgchrono::unrepresentable_value, ...
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgchrono/except instead.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_EXCEPT
#define PGCHRONO_H_EXCEPT

#if !defined(PGCHRONO_HEADER_PRE)
#  error "Include pgchrono headers as <pgchrono/header>, not <pgchrono/header.hxx>."
#endif

#include <stdexcept>
#include <string>

#include "pgchrono/types.hxx"


namespace pgchrono
{
/**
 * @addtogroup exception Exception classes
 *
 * All exceptions that pgchrono throws are derived from the standard library's
 * exception classes, so you can catch them as `std::exception` if you don't
 * care about the specifics.  Each carries the source location of the call
 * into pgchrono that led to the error, where available.
 *
 * Looking up a mapping that does not exist is not an error.  The lookup
 * functions return an empty `std::optional` for that.
 *
 * @{
 */

/// Run-time failure encountered by pgchrono, similar to std::runtime_error.
/** This is what you get when something outside the library's control goes
 * wrong, such as a time zone database that can't be read.
 */
struct PGCHRONO_LIBEXPORT failure : std::runtime_error
{
  explicit failure(std::string const &, sl = sl::current());

  sl location;
};


/// Internal error in pgchrono library.
struct PGCHRONO_LIBEXPORT internal_error : std::logic_error
{
  explicit internal_error(std::string const &, sl = sl::current());

  sl location;
};


/// Error in usage of pgchrono library, similar to std::logic_error.
/** For example, asking a `type_mapping` for `date` to render a `period`.
 */
struct PGCHRONO_LIBEXPORT usage_error : std::logic_error
{
  explicit usage_error(std::string const &, sl = sl::current());

  sl location;
};


/// Invalid argument passed to pgchrono, similar to std::invalid_argument.
/** Constructing February 30th gets you one of these.  So does an offset of
 * more than 18 hours, or a time zone identifier nobody has heard of.
 */
struct PGCHRONO_LIBEXPORT argument_error : std::invalid_argument
{
  explicit argument_error(std::string const &, sl = sl::current());

  sl location;
};


/// Value conversion failed, e.g. when parsing "yesterday" as a date.
struct PGCHRONO_LIBEXPORT conversion_error : std::domain_error
{
  explicit conversion_error(std::string const &, sl = sl::current());

  sl location;
};


/// Could not convert value to string: not enough buffer space.
struct PGCHRONO_LIBEXPORT conversion_overrun : conversion_error
{
  explicit conversion_overrun(std::string const &, sl = sl::current());
};


/// A value has no literal representation in the requested target.
/** PostgreSQL stores times with microsecond resolution, so a time with a
 * nonzero nanoseconds remainder has no exact SQL literal.  Nor does a date
 * before 4714-11-24 BC, or an offset of 16 hours or more.
 *
 * The library won't round or truncate such values for you.  It throws this.
 */
struct PGCHRONO_LIBEXPORT unrepresentable_value : conversion_error
{
  explicit unrepresentable_value(std::string const &, sl = sl::current());
};


/// Something is out of range, similar to std::out_of_range.
struct PGCHRONO_LIBEXPORT range_error : std::out_of_range
{
  explicit range_error(std::string const &, sl = sl::current());

  sl location;
};

/**
 * @}
 */


/// Describe a source location, for human consumption.
[[nodiscard]] PGCHRONO_LIBEXPORT std::string source_loc(sl loc);
} // namespace pgchrono
#endif
