// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Strict scalar parsers for option values.
 */

#ifndef PTPCONF_CORE_VALUE_H
#define PTPCONF_CORE_VALUE_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Parse a boolean option value.
 *
 * Surrounding whitespace is ignored. Accepted spellings are
 * `1 t T TRUE true True` and `0 f F FALSE false False`.
 *
 * @param v   Value text (may be NULL).
 * @param out Receives 1 or 0.
 * @return 0 on success, -1 when `v` is not a boolean.
 */
int ptpconf_parse_bool(const char* v, int* out);

/**
 * @brief Parse a base-10 integer option value.
 *
 * Surrounding whitespace is ignored; the remaining text must be an optional
 * sign followed by digits only and fit in an int.
 *
 * @return 0 on success, -1 on any parse failure (out untouched).
 */
int ptpconf_parse_int(const char* v, int* out);

/**
 * @brief Copy `src` without leading/trailing whitespace into `dst`.
 *
 * @return 0 on success, -1 if the trimmed text did not fit (dst truncated).
 */
int ptpconf_trim_copy(char* dst, size_t dst_size, const char* src);

#ifdef __cplusplus
}
#endif

#endif /* PTPCONF_CORE_VALUE_H */
