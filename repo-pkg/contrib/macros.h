// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Macros Header - Compiler attributes and small helpers shared by the
   repository libraries and the builder

   ##################################################################### */
									/*}}}*/
#ifndef REPO_MACROS_H
#define REPO_MACROS_H

// GCC and clang spell all of them the same way, others get nothing
#if defined(__GNUC__)
#define REPO_ATTRIBUTE(...)	__attribute__((__VA_ARGS__))
#else
#define REPO_ATTRIBUTE(...)
#endif

#define REPO_PURE		REPO_ATTRIBUTE(pure)
#define REPO_COLD		REPO_ATTRIBUTE(cold)
#define REPO_UNUSED		REPO_ATTRIBUTE(unused)
#define REPO_PRINTF(n)		REPO_ATTRIBUTE(format(printf, n, n + 1))
#define REPO_NONNULL(...)	REPO_ATTRIBUTE(nonnull(__VA_ARGS__))

// visibility of the symbols of the shared libraries
#define REPO_PUBLIC		REPO_ATTRIBUTE(visibility("default"))
#define REPO_HIDDEN		REPO_ATTRIBUTE(visibility("hidden"))

// chunk size for reading and hashing files, a multiple of the page size
static constexpr unsigned long long REPO_BUFFER_SIZE = 64 * 1024;

#endif
