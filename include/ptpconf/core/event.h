// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Time event source selection for ts2phc interfaces.
 */

#ifndef PTPCONF_CORE_EVENT_H
#define PTPCONF_CORE_EVENT_H

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Source of the time events driving an interface.
 */
typedef enum {
    PTPCONF_SOURCE_GNSS = 0, /**< GNSS receiver is the ts2phc master */
    PTPCONF_SOURCE_PPS       /**< External 1PPS input */
} ptpconf_event_source_t;

/**
 * @brief Map a `ts2phc.master` flag to an event source.
 *
 * Never fails: anything that is not a true boolean (including NULL and
 * unparseable text) yields PTPCONF_SOURCE_PPS.
 */
ptpconf_event_source_t ptpconf_resolve_source(const char* flag);

/** @brief "GNSS" or "PPS". */
const char* ptpconf_event_source_str(ptpconf_event_source_t src);

#ifdef __cplusplus
}
#endif

#endif /* PTPCONF_CORE_EVENT_H */
