// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#pragma once

/**
 * @file
 * @brief POSIX compatibility wrappers for string helpers.
 *
 * Include this header instead of using POSIX-specific string functions
 * directly so the library also builds with MSVC.
 */

#include <ptpconf/platform/platform.h>

/* ============================================================================
 * String Functions (strdup, strcasecmp)
 * ============================================================================ */

#if PTPCONF_PLATFORM_WIN_NATIVE
#include <string.h>
#define ptpconf_strdup      _strdup
#define ptpconf_strcasecmp  _stricmp
#else
#include <string.h>
#include <strings.h>
#define ptpconf_strdup      strdup
#define ptpconf_strcasecmp  strcasecmp
#endif

/* ============================================================================
 * GCC/Clang Attribute Compatibility
 * ============================================================================ */

#if PTPCONF_COMPILER_MSVC
#define PTPCONF_ATTR_PRINTF(fmt_idx, arg_idx)
#else
#define PTPCONF_ATTR_PRINTF(fmt_idx, arg_idx) __attribute__((format(printf, fmt_idx, arg_idx)))
#endif
