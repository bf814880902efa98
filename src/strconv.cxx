/** Implementation of string conversion support.
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
#include "pgchrono/strconv.hxx"

#include "pgchrono/internal/header-post.hxx"


namespace pgchrono::internal
{
void throw_overrun(std::string_view what, sl loc)
{
  throw conversion_overrun{
    concat("Not enough buffer space to convert ", what, " to string."), loc};
}
} // namespace pgchrono::internal
