// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#ifndef PTPCONF_LOG_H
#define PTPCONF_LOG_H

/**
 * @file
 * @brief Runtime logging interface used across ptpconf components.
 *
 * Declares log severity levels, the core logging write routine, and convenience
 * macros. Messages are written to `stderr` and filtered by a runtime threshold.
 */

/**
 * @brief Log severity levels for runtime logging.
 */
typedef enum { LOG_LEVEL_ERROR = 0, LOG_LEVEL_WARN = 1, LOG_LEVEL_INFO = 2, LOG_LEVEL_DEBUG = 3 } ptpconf_log_level_t;

/* Compile-time log level control (default to INFO) */
#ifndef PTPCONF_LOG_LEVEL
#define PTPCONF_LOG_LEVEL LOG_LEVEL_INFO
#endif

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Write a formatted log message to the logging sink.
 *
 * Messages whose `level` is above the runtime threshold are dropped.
 *
 * @param level  Log severity level.
 * @param format printf-style format string.
 * @param ...    Variadic arguments corresponding to `format`.
 */
void ptpconf_log_write(ptpconf_log_level_t level, const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

/**
 * @brief Set the runtime threshold; messages above `level` are suppressed.
 */
void ptpconf_log_set_level(ptpconf_log_level_t level);

/** @brief Current runtime threshold. */
ptpconf_log_level_t ptpconf_log_get_level(void);

/**
 * @brief Parse a level name ("error", "warn", "info", "debug") or digit.
 *
 * @param s   Level text (case-insensitive).
 * @param out Receives the parsed level.
 * @return 0 on success, -1 when `s` is not a recognized level.
 */
int ptpconf_log_level_from_string(const char* s, ptpconf_log_level_t* out);

#ifdef __cplusplus
}
#endif

/* Logging macros route through ptpconf_log_write to allow runtime gating */

/* Error messages */
#define LOG_ERROR(...)                                                                                                 \
    do {                                                                                                               \
        ptpconf_log_write(LOG_LEVEL_ERROR, __VA_ARGS__);                                                               \
    } while (0)

/* Warning messages */
#define LOG_WARN(...)                                                                                                  \
    do {                                                                                                               \
        ptpconf_log_write(LOG_LEVEL_WARN, __VA_ARGS__);                                                                \
    } while (0)

/* Info messages */
#define LOG_INFO(...)                                                                                                  \
    do {                                                                                                               \
        ptpconf_log_write(LOG_LEVEL_INFO, __VA_ARGS__);                                                                \
    } while (0)

/* Debug messages - compile-time gated */
#if PTPCONF_LOG_LEVEL >= LOG_LEVEL_DEBUG
#define LOG_DEBUG(...)                                                                                                 \
    do {                                                                                                               \
        ptpconf_log_write(LOG_LEVEL_DEBUG, __VA_ARGS__);                                                               \
    } while (0)
#else
#define LOG_DEBUG(...)                                                                                                 \
    do {                                                                                                               \
        /* Debug logging disabled */                                                                                   \
    } while (0)
#endif

/* Convenience macros for specific message types */

/* For warnings with WARNING: prefix */
#define LOG_WARNING(...) LOG_WARN("WARNING: " __VA_ARGS__)

/* For notices with NOTICE: prefix */
#define LOG_NOTICE(...)  LOG_INFO("NOTICE: " __VA_ARGS__)

#endif /* PTPCONF_LOG_H */
