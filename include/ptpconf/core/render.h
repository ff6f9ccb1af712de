// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Serialize a parsed configuration back to daemon configuration text.
 *
 * Output layout:
 *
 *   #profile: <profile name>
 *   <blank line>
 *   [global]
 *   key value
 *   [eth0]
 *   key value
 *
 * Options are written in the order they were parsed.
 */

#ifndef PTPCONF_CORE_RENDER_H
#define PTPCONF_CORE_RENDER_H

#include <ptpconf/core/conf.h>
#include <ptpconf/core/event.h>
#include <ptpconf/core/status.h>
#include <ptpconf/synce/relations.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Interface described by a ptp4l/ts2phc port section.
 */
typedef struct {
    char* name;                    /**< Section name without brackets */
    ptpconf_event_source_t source; /**< Time event source */
    int is_master;                 /**< masterOnly set to a true value */
    char phc_id[32];               /**< PHC identity; filled by the caller, empty here */
} ptpconf_iface_t;

typedef struct {
    ptpconf_iface_t* items; /**< Interfaces in section order */
    int count;              /**< Number of interfaces */
    int capacity;           /**< Allocated capacity */
} ptpconf_ifaces_t;

/**
 * @brief Result of a render call.
 */
typedef struct {
    char* text;              /**< Rendered configuration (heap, NUL-terminated) */
    ptpconf_ifaces_t ifaces; /**< Interface list; its order is the interface mapping */
} ptpconf_render_t;

void ptpconf_render_init(ptpconf_render_t* out);
void ptpconf_render_free(ptpconf_render_t* out);

/**
 * @brief Render a ptp4l/ts2phc configuration and collect its interfaces.
 *
 * Every section other than [global] and [nmea] is an interface. Its event
 * source comes from its own `ts2phc.master`, else from the most recent [nmea]
 * section's `ts2phc.master`, else PPS.
 *
 * @param conf Parsed document (not modified).
 * @param out  Receives text and interfaces; freed first.
 * @param err  Optional error detail.
 * @return 0 on success, -1 on failure.
 */
int ptpconf_render_ptp4l(const ptpconf_conf_t* conf, ptpconf_render_t* out, ptpconf_error_t* err);

/**
 * @brief Render a synce4l configuration with clock ids injected.
 *
 * Relations are extracted from `conf` and clock ids assigned from `settings`
 * ("clockId[<port>]" keys). Each device section lacking a `clock_id` option is
 * written with `clock_id <id>` of the device at the same position. Fails with
 * StructuralMismatch when the device count differs from the number of device
 * sections.
 *
 * @param conf      Parsed document (not modified).
 * @param settings  Settings mapping (may be NULL).
 * @param out       Receives the text; `out->ifaces` stays empty.
 * @param relations Receives the relations with assigned clock ids; freed first.
 * @param err       Optional error detail.
 * @return 0 on success, -1 on failure.
 */
int ptpconf_render_synce4l(const ptpconf_conf_t* conf, const ptpconf_options_t* settings, ptpconf_render_t* out,
                           ptpconf_synce_relations_t* relations, ptpconf_error_t* err);

#ifdef __cplusplus
}
#endif

#endif /* PTPCONF_CORE_RENDER_H */
