// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Status codes and error detail record shared by ptpconf operations.
 *
 * Fallible operations return 0 on success and -1 on failure, and fill an
 * optional `ptpconf_error_t` describing what went wrong.
 */

#ifndef PTPCONF_CORE_STATUS_H
#define PTPCONF_CORE_STATUS_H

#include <ptpconf/platform/posix_compat.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Status taxonomy.
 *
 * Only the fatal codes are ever returned through `ptpconf_error_t`. The
 * integer/boolean parse codes describe recoverable conditions that are logged
 * and replaced by defaults.
 */
typedef enum {
    PTPCONF_OK = 0,
    PTPCONF_ERR_MALFORMED_SECTION,      /**< Section header without closing ']' */
    PTPCONF_ERR_OPTION_OUTSIDE_SECTION, /**< Option line before any section header */
    PTPCONF_ERR_INTEGER_PARSE,          /**< Non-fatal: integer option not parseable */
    PTPCONF_ERR_BOOLEAN_PARSE,          /**< Non-fatal: boolean option not parseable */
    PTPCONF_ERR_STRUCTURE_MISMATCH,     /**< Device count differs between extraction and rendering */
    PTPCONF_ERR_IO,                     /**< File missing or unreadable */
    PTPCONF_ERR_NOMEM,                  /**< Allocation failure */
    PTPCONF_ERR_INVALID_ARG             /**< NULL or otherwise unusable argument */
} ptpconf_status_t;

/**
 * @brief Error detail filled by fallible operations.
 */
typedef struct {
    ptpconf_status_t code; /**< Status code (PTPCONF_OK when no error) */
    int line_number;       /**< 1-based input line, 0 if not applicable */
    char message[256];     /**< Human-readable description */
} ptpconf_error_t;

/**
 * @brief Stable short name for a status code (e.g., "MalformedSection").
 */
const char* ptpconf_status_str(ptpconf_status_t code);

/** @brief Reset an error record to PTPCONF_OK. NULL is ignored. */
void ptpconf_error_clear(ptpconf_error_t* err);

/**
 * @brief Fill an error record. NULL is ignored.
 *
 * @param err    Error record.
 * @param code   Status code.
 * @param line   Input line number (0 if not applicable).
 * @param format printf-style message.
 */
void ptpconf_error_set(ptpconf_error_t* err, ptpconf_status_t code, int line, const char* format, ...)
    PTPCONF_ATTR_PRINTF(4, 5);

#ifdef __cplusplus
}
#endif

#endif /* PTPCONF_CORE_STATUS_H */
