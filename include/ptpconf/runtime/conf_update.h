// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Holder for the applied ptp4l configuration of a node.
 *
 * Keeps the default ptp4l configuration loaded from disk and the text of the
 * name and text of the last applied profile, so that a repeated update of the
 * same profile is detected and skipped. Calls on one holder must be serialized by the owner.
 */

#ifndef PTPCONF_RUNTIME_CONF_UPDATE_H
#define PTPCONF_RUNTIME_CONF_UPDATE_H

#include <ptpconf/core/conf.h>
#include <ptpconf/core/status.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct {
    char* default_conf;    /**< Default ptp4l configuration text (heap) */
    char* applied_conf;    /**< Text of the last applied profile, NULL if none */
    char* applied_profile; /**< Name of the last applied profile, NULL if none */
    int generation;        /**< Number of applied updates */
} ptpconf_conf_update_t;

/**
 * @brief Read a whole file into a heap NUL-terminated buffer.
 *
 * A missing file and a read failure are both reported as PTPCONF_ERR_IO with
 * distinct messages.
 *
 * @param path    File path.
 * @param out     Receives the buffer (caller frees with free()).
 * @param out_len Receives the byte count (may be NULL).
 * @param err     Optional error detail.
 * @return 0 on success, -1 on failure.
 */
int ptpconf_read_file(const char* path, char** out, size_t* out_len, ptpconf_error_t* err);

/**
 * @brief Initialize a holder by loading the default configuration.
 *
 * @param upd  Holder to initialize.
 * @param path Default ptp4l configuration path; NULL uses the runtime config.
 * @param err  Optional error detail.
 * @return 0 on success, -1 when the file is missing or unreadable.
 */
int ptpconf_conf_update_init(ptpconf_conf_update_t* upd, const char* path, ptpconf_error_t* err);

/**
 * @brief Parse and record a profile's configuration.
 *
 * NULL or empty `text` selects the default configuration. When both the
 * profile name and the resulting text equal the last applied ones nothing is
 * parsed and 0 is returned.
 *
 * @param upd          Holder.
 * @param profile_name Profile name stored in `out` for the rendered header.
 * @param text         Profile configuration text.
 * @param out          Receives the parsed document when 1 is returned.
 * @param err          Optional error detail.
 * @return 1 when a new configuration was applied, 0 when unchanged, -1 on a
 *         parse failure (applied state untouched).
 */
int ptpconf_conf_update_apply(ptpconf_conf_update_t* upd, const char* profile_name, const char* text,
                              ptpconf_conf_t* out, ptpconf_error_t* err);

void ptpconf_conf_update_free(ptpconf_conf_update_t* upd);

#ifdef __cplusplus
}
#endif

#endif /* PTPCONF_RUNTIME_CONF_UPDATE_H */
