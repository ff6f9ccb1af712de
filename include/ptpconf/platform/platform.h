// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#pragma once

/*
 * Platform detection macros for ptpconf
 */

/* Native Windows (not Cygwin) */
#if defined(_WIN32) && !defined(__CYGWIN__)
#define PTPCONF_PLATFORM_WIN_NATIVE 1
#else
#define PTPCONF_PLATFORM_WIN_NATIVE 0
#endif

/* Compiler detection */
#if defined(_MSC_VER)
#define PTPCONF_COMPILER_MSVC 1
#else
#define PTPCONF_COMPILER_MSVC 0
#endif
