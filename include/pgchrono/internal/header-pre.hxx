/* Compiler settings for compiling pgchrono headers, and workarounds for all.
 *
 * Include this before including any other pgchrono headers from within
 * pgchrono.  And to balance it out, also include header-post.hxx at the end of
 * the batch of headers.
 *
 * The public pgchrono headers (e.g. `<pgchrono/time>`) include this already;
 * there's no need to do this from within an application.
 *
 * Include this file at the highest aggregation level possible to avoid nesting
 * and to keep things simple.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */

#if __has_include(<version>)
#  include <version>
#endif

// NO GUARD HERE! This part should be included every time this file is.
#if defined(_MSC_VER)

// Save compiler's warning state, and set warning level 4 for maximum
// sensitivity to warnings.
#  pragma warning(push, 4)

// Visual C++ generates some entirely unreasonable warnings.  Disable them.
#  pragma warning(disable : 4061 4251 4275 4275 4511 4512 4514 4623 4625)
#  pragma warning(disable : 4626 4702 4820 4868 5026 5027 5031 5045 6294)

#endif // _MSC_VER


#if defined(PGCHRONO_HEADER_PRE)
#  error "Avoid nesting #include of pgchrono/internal/header-pre.hxx."
#endif

#define PGCHRONO_HEADER_PRE


#if __has_cpp_attribute(gnu::pure)
/// Declare function "pure": no side effects, only reads globals and its args.
/** Be careful with exceptions.  The compiler may elide calls, which may stop
 * an exception from happening; or reorder them, moving a call outside of a
 * `try` block that was meant to catch the exception.
 */
#  define PGCHRONO_PURE [[gnu::pure]]
#else
#  define PGCHRONO_PURE /* pure */
#endif


#if __has_cpp_attribute(gnu::cold)
/// Tell the compiler to optimise a function for size, not speed.
#  define PGCHRONO_COLD [[gnu::cold]]
#else
#  define PGCHRONO_COLD /* cold */
#endif


// Workarounds for Windows
#ifdef _WIN32

#  if defined(PGCHRONO_SHARED) && !defined(PGCHRONO_LIBEXPORT)
#    define PGCHRONO_LIBEXPORT __declspec(dllimport)
#  endif // PGCHRONO_SHARED && !PGCHRONO_LIBEXPORT

#elif defined(__GNUC__) // !_WIN32

#  define PGCHRONO_LIBEXPORT [[gnu::visibility("default")]]
#  define PGCHRONO_PRIVATE [[gnu::visibility("hidden")]]

#endif // __GNUC__


#ifndef PGCHRONO_LIBEXPORT
#  define PGCHRONO_LIBEXPORT /* libexport */
#endif

#ifndef PGCHRONO_PRIVATE
#  define PGCHRONO_PRIVATE /* private */
#endif
