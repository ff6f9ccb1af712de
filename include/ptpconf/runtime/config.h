// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Runtime configuration API and environment documentation.
 *
 * Exposes typed configuration parsed from environment variables and accessors
 * to initialize and retrieve the immutable configuration.
 */

#ifndef PTPCONF_RUNTIME_CONFIG_H
#define PTPCONF_RUNTIME_CONFIG_H

#include <ptpconf/runtime/log.h>

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Runtime configuration (environment variables)
 *
 * Precedence: CLI > environment > built-in defaults. This module parses
 * environment variables once (during init) and exposes a typed config.
 *
 * - PTPCONF_PTP4L_CONF
 *     Path of the default ptp4l configuration used when a profile carries no
 *     configuration text. Default: /etc/ptp4l.conf.
 * - PTPCONF_LOG_LEVEL
 *     Runtime log threshold. Values: error|warn|info|debug or 0..3. Default: info.
 * - PTPCONF_PROFILE
 *     Profile name written into the "#profile:" header of rendered output.
 *     Default: "default".
 */

/** Built-in default ptp4l configuration path. */
#define PTPCONF_DEFAULT_PTP4L_CONF "/etc/ptp4l.conf"

typedef struct ptpconfRuntimeConfig {
    /* Default ptp4l configuration path */
    int ptp4l_conf_path_is_set;
    char ptp4l_conf_path[1024];

    /* Log threshold */
    int log_level_is_set;
    ptpconf_log_level_t log_level;

    /* Profile name for the rendered header */
    int profile_name_is_set;
    char profile_name[64];
} ptpconfRuntimeConfig;

/**
 * @brief Parse environment variables and initialize the runtime configuration.
 *
 * Applies the log level to the logging module.
 *
 * @note Safe to call multiple times; the most recent call wins.
 */
void ptpconf_config_init(void);

/**
 * @brief Get the current runtime configuration.
 *
 * Initializes from the environment on first use.
 */
const ptpconfRuntimeConfig* ptpconf_get_config(void);

#ifdef __cplusplus
}
#endif

#endif /* PTPCONF_RUNTIME_CONFIG_H */
