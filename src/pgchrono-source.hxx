/* Compiler settings for compiling pgchrono itself.
 *
 * Include this header in every source file that goes into the pgchrono
 * library binary, and nowhere else.
 *
 * To ensure this, include this file once, as the very first header, in each
 * compilation unit for the library.
 *
 * DO NOT INCLUDE THIS FILE when building client programs.
 *
 * Copyright (c) 2000-2026, Jeroen T. Vermeulen.
 *
 * See COPYING for copyright license.  If you did not receive a file called
 * COPYING with this source code, please notify the distributor of this
 * mistake, or contact the author.
 */
#ifndef PGCHRONO_H_SOURCE
#define PGCHRONO_H_SOURCE

// Tell the headers that we're building the library itself.
#define PGCHRONO_INTERNAL

#ifdef _WIN32
#  ifdef PGCHRONO_SHARED
// We're building pgchrono as a shared library.
#    undef PGCHRONO_LIBEXPORT
#    define PGCHRONO_LIBEXPORT __declspec(dllexport)
#  endif // PGCHRONO_SHARED
#endif // _WIN32

#endif
