/* Rendering temporal values as SQL literals and as C++ source code.
 *
 * DO NOT INCLUDE THIS FILE DIRECTLY; include pgchrono/literal instead.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_LITERAL
#define PGCHRONO_H_LITERAL

#if !defined(PGCHRONO_HEADER_PRE)
#  error "Include pgchrono headers as <pgchrono/header>, not <pgchrono/header.hxx>."
#endif

#include <string>
#include <vector>

#include "pgchrono/value.hxx"


/**
 * @defgroup literals SQL and C++ literals
 *
 * The SQL literals are typed, e.g. `DATE '2018-04-20'` or
 * `'[2020-01-01,2020-12-25]'::daterange`, so that PostgreSQL never has to
 * guess.  They carry up to 6 fractional digits, PostgreSQL's resolution.  A
 * value that can't be expressed exactly in SQL is an error, never silently
 * truncated: the functions throw @ref unrepresentable_value.
 *
 * The C++ literals are expressions which, when compiled against this library,
 * produce a value equal to the original.
 */
//@{
namespace pgchrono
{
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(local_date const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(local_time const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(local_date_time const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(offset_time const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(offset_date_time const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(instant const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(zoned_date_time const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(period const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(duration const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(interval const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(date_interval const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(range<local_date> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(range<local_date_time> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(range<instant> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(range<zoned_date_time> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(range<offset_date_time> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(std::vector<interval> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(std::vector<date_interval> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_sql_literal(temporal_value const &value, sl loc = sl::current());


/// Render an instant as a `timestamp without time zone` literal.
/** This is for legacy schemas which store instants in a `timestamp` column.
 * The literal holds the UTC wall-clock time, with no offset.
 */
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_timestamp_literal(instant const &value, sl loc = sl::current());


[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(local_date const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(local_time const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(local_date_time const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(offset const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(offset_time const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(offset_date_time const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(instant const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(zoned_date_time const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(period const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(duration const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(interval const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(date_interval const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(range<local_date> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(range<local_date_time> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(range<instant> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(range<zoned_date_time> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(range<offset_date_time> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(std::vector<interval> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(std::vector<date_interval> const &value, sl loc = sl::current());
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
to_code_literal(temporal_value const &value, sl loc = sl::current());


/// Quote a string as a C++ string literal, with escapes as needed.
[[nodiscard]] PGCHRONO_LIBEXPORT std::string
quote_code_string(std::string_view text);
} // namespace pgchrono
//@}
#endif
