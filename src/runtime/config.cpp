// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Runtime configuration parser for environment-derived settings.
 *
 * Parses environment variables into a typed `ptpconfRuntimeConfig` and exposes
 * an immutable accessor. Intended to be called early during application init.
 */

#include <ptpconf/runtime/config.h>
#include <ptpconf/runtime/log.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

static ptpconfRuntimeConfig g_config;
static int g_config_inited = 0;

/**
 * @brief Check whether an environment string is set and non-empty.
 *
 * @param v Environment value string pointer (may be NULL).
 * @return 1 if set and non-empty; otherwise 0.
 */
static int
env_is_set(const char* v) {
    return v && v[0] != '\0';
}

void
ptpconf_config_init(void) {
    ptpconfRuntimeConfig c;
    memset(&c, 0, sizeof(c));

    /* PTP4L_CONF */
    const char* path = getenv("PTPCONF_PTP4L_CONF");
    c.ptp4l_conf_path_is_set = env_is_set(path);
    snprintf(c.ptp4l_conf_path, sizeof c.ptp4l_conf_path, "%s",
             c.ptp4l_conf_path_is_set ? path : PTPCONF_DEFAULT_PTP4L_CONF);

    /* LOG_LEVEL */
    const char* lvl = getenv("PTPCONF_LOG_LEVEL");
    c.log_level = LOG_LEVEL_INFO;
    if (env_is_set(lvl)) {
        if (ptpconf_log_level_from_string(lvl, &c.log_level) == 0) {
            c.log_level_is_set = 1;
        } else {
            LOG_WARNING("Ignoring PTPCONF_LOG_LEVEL='%s' (expected error|warn|info|debug)\n", lvl);
            c.log_level = LOG_LEVEL_INFO;
        }
    }

    /* PROFILE */
    const char* prof = getenv("PTPCONF_PROFILE");
    c.profile_name_is_set = env_is_set(prof);
    snprintf(c.profile_name, sizeof c.profile_name, "%s", c.profile_name_is_set ? prof : "default");

    g_config = c;
    g_config_inited = 1;
    ptpconf_log_set_level(g_config.log_level);
}

const ptpconfRuntimeConfig*
ptpconf_get_config(void) {
    if (!g_config_inited) {
        ptpconf_config_init();
    }
    return &g_config;
}
