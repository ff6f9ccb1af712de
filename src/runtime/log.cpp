// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Runtime logging implementation.
 *
 * Implements the low-level write routine used by logging macros to emit
 * messages to `stderr`, gated by a process-wide severity threshold.
 */

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <ptpconf/platform/posix_compat.h>
#include <ptpconf/runtime/log.h>

static std::atomic<int> g_log_level(PTPCONF_LOG_LEVEL);

/**
 * @brief Write a formatted log message to the logging sink.
 *
 * @param level  Log severity level; dropped when above the runtime threshold.
 * @param format printf-style format string.
 * @param ...    Variadic arguments corresponding to `format`.
 */
void
ptpconf_log_write(ptpconf_log_level_t level, const char* format, ...) {
    if (format == nullptr) {
        return;
    }
    if ((int)level > g_log_level.load(std::memory_order_relaxed)) {
        return;
    }

    va_list args;
    va_start(args, format);
    /* Format into a temporary buffer so a message is emitted with a single write. */
    char buf[4096];
    vsnprintf(buf, sizeof(buf), format, args);
    va_end(args);

    fputs(buf, stderr);
}

void
ptpconf_log_set_level(ptpconf_log_level_t level) {
    int v = (int)level;
    if (v < LOG_LEVEL_ERROR) {
        v = LOG_LEVEL_ERROR;
    }
    if (v > LOG_LEVEL_DEBUG) {
        v = LOG_LEVEL_DEBUG;
    }
    g_log_level.store(v, std::memory_order_relaxed);
}

ptpconf_log_level_t
ptpconf_log_get_level(void) {
    return (ptpconf_log_level_t)g_log_level.load(std::memory_order_relaxed);
}

int
ptpconf_log_level_from_string(const char* s, ptpconf_log_level_t* out) {
    if (!s || !*s || !out) {
        return -1;
    }
    if (ptpconf_strcasecmp(s, "error") == 0 || ptpconf_strcasecmp(s, "0") == 0) {
        *out = LOG_LEVEL_ERROR;
        return 0;
    }
    if (ptpconf_strcasecmp(s, "warn") == 0 || ptpconf_strcasecmp(s, "warning") == 0
        || ptpconf_strcasecmp(s, "1") == 0) {
        *out = LOG_LEVEL_WARN;
        return 0;
    }
    if (ptpconf_strcasecmp(s, "info") == 0 || ptpconf_strcasecmp(s, "2") == 0) {
        *out = LOG_LEVEL_INFO;
        return 0;
    }
    if (ptpconf_strcasecmp(s, "debug") == 0 || ptpconf_strcasecmp(s, "3") == 0) {
        *out = LOG_LEVEL_DEBUG;
        return 0;
    }
    return -1;
}
