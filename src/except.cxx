/** Implementation of pgchrono exception classes.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#include "pgchrono-source.hxx"

#include "pgchrono/internal/header-pre.hxx"

#include "pgchrono/except.hxx"
#include "pgchrono/internal/concat.hxx"

#include "pgchrono/internal/header-post.hxx"


pgchrono::failure::failure(std::string const &whatarg, sl loc) :
        std::runtime_error{whatarg}, location{loc}
{}


pgchrono::internal_error::internal_error(std::string const &whatarg, sl loc) :
        std::logic_error{
          internal::concat("pgchrono internal error: ", whatarg)},
        location{loc}
{}


pgchrono::usage_error::usage_error(std::string const &whatarg, sl loc) :
        std::logic_error{whatarg}, location{loc}
{}


pgchrono::argument_error::argument_error(std::string const &whatarg, sl loc) :
        invalid_argument{whatarg}, location{loc}
{}


pgchrono::conversion_error::conversion_error(
  std::string const &whatarg, sl loc) :
        domain_error{whatarg}, location{loc}
{}


pgchrono::conversion_overrun::conversion_overrun(
  std::string const &whatarg, sl loc) :
        conversion_error{whatarg, loc}
{}


pgchrono::unrepresentable_value::unrepresentable_value(
  std::string const &whatarg, sl loc) :
        conversion_error{whatarg, loc}
{}


pgchrono::range_error::range_error(std::string const &whatarg, sl loc) :
        out_of_range{whatarg}, location{loc}
{}


std::string pgchrono::source_loc(sl loc)
{
  char const *const func{loc.function_name()};
  if ((func == nullptr) or (func[0] == '\0'))
    return internal::concat(loc.file_name(), ":", loc.line());
  return internal::concat(
    loc.file_name(), ":", loc.line(), " (", func, ")");
}
