// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * Unit tests for environment-derived runtime configuration and log gating.
 */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <ptpconf/runtime/config.h>
#include <ptpconf/runtime/log.h>

#include "test_support.h"

static int
test_defaults(void) {
    unsetenv("PTPCONF_PTP4L_CONF");
    unsetenv("PTPCONF_LOG_LEVEL");
    unsetenv("PTPCONF_PROFILE");
    ptpconf_config_init();
    const ptpconfRuntimeConfig* c = ptpconf_get_config();
    int rc = 0;
    if (c->ptp4l_conf_path_is_set || strcmp(c->ptp4l_conf_path, PTPCONF_DEFAULT_PTP4L_CONF) != 0) {
        fprintf(stderr, "FAIL: default conf path is %s\n", c->ptp4l_conf_path);
        rc = 1;
    }
    if (c->log_level_is_set || c->log_level != LOG_LEVEL_INFO) {
        fprintf(stderr, "FAIL: default log level should be info\n");
        rc = 1;
    }
    if (c->profile_name_is_set || strcmp(c->profile_name, "default") != 0) {
        fprintf(stderr, "FAIL: default profile is %s\n", c->profile_name);
        rc = 1;
    }
    return rc;
}

static int
test_env_overrides(void) {
    setenv("PTPCONF_PTP4L_CONF", "/run/ptp/ptp4l.0.conf", 1);
    setenv("PTPCONF_LOG_LEVEL", "warn", 1);
    setenv("PTPCONF_PROFILE", "t-bc", 1);
    ptpconf_config_init();
    const ptpconfRuntimeConfig* c = ptpconf_get_config();
    int rc = 0;
    if (!c->ptp4l_conf_path_is_set || strcmp(c->ptp4l_conf_path, "/run/ptp/ptp4l.0.conf") != 0) {
        fprintf(stderr, "FAIL: PTPCONF_PTP4L_CONF not applied\n");
        rc = 1;
    }
    if (!c->log_level_is_set || c->log_level != LOG_LEVEL_WARN || ptpconf_log_get_level() != LOG_LEVEL_WARN) {
        fprintf(stderr, "FAIL: PTPCONF_LOG_LEVEL not applied\n");
        rc = 1;
    }
    if (!c->profile_name_is_set || strcmp(c->profile_name, "t-bc") != 0) {
        fprintf(stderr, "FAIL: PTPCONF_PROFILE not applied\n");
        rc = 1;
    }

    setenv("PTPCONF_LOG_LEVEL", "loud", 1);
    ptpconf_config_init();
    if (ptpconf_get_config()->log_level_is_set || ptpconf_get_config()->log_level != LOG_LEVEL_INFO) {
        fprintf(stderr, "FAIL: invalid log level should fall back to info\n");
        rc = 1;
    }

    unsetenv("PTPCONF_PTP4L_CONF");
    unsetenv("PTPCONF_LOG_LEVEL");
    unsetenv("PTPCONF_PROFILE");
    return rc;
}

static int
test_log_level_from_string(void) {
    struct {
        const char* s;
        int ok;
        ptpconf_log_level_t want;
    } cases[] = {
        {"error", 1, LOG_LEVEL_ERROR}, {"WARN", 1, LOG_LEVEL_WARN}, {"warning", 1, LOG_LEVEL_WARN},
        {"Info", 1, LOG_LEVEL_INFO},   {"3", 1, LOG_LEVEL_DEBUG},   {"", 0, LOG_LEVEL_ERROR},
        {"4", 0, LOG_LEVEL_ERROR},     {"verbose", 0, LOG_LEVEL_ERROR},
    };
    int rc = 0;
    for (size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); i++) {
        ptpconf_log_level_t lvl = LOG_LEVEL_ERROR;
        int ok = ptpconf_log_level_from_string(cases[i].s, &lvl) == 0;
        if (ok != cases[i].ok || (ok && lvl != cases[i].want)) {
            fprintf(stderr, "FAIL: log_level_from_string('%s')\n", cases[i].s);
            rc = 1;
        }
    }
    return rc;
}

static int
test_log_threshold_gates_output(void) {
    ptpconf_test_capture_stderr cap;
    if (ptpconf_test_capture_stderr_begin(&cap, "ptpconf_log") != 0) {
        fprintf(stderr, "FAIL: could not capture stderr\n");
        return 1;
    }
    ptpconf_log_set_level(LOG_LEVEL_WARN);
    LOG_ERROR("error-line\n");
    LOG_WARNING("warning-line\n");
    LOG_INFO("info-line\n");
    ptpconf_log_set_level(LOG_LEVEL_INFO);
    LOG_NOTICE("notice-line\n");
    (void)ptpconf_test_capture_stderr_end(&cap);

    char buf[1024];
    int rc = 0;
    if (ptpconf_test_read_file(cap.path, buf, sizeof buf) < 0) {
        fprintf(stderr, "FAIL: could not read captured output\n");
        rc = 1;
    } else {
        if (!strstr(buf, "error-line") || !strstr(buf, "WARNING: warning-line")) {
            fprintf(stderr, "FAIL: error/warning should be written: %s\n", buf);
            rc = 1;
        }
        if (strstr(buf, "info-line")) {
            fprintf(stderr, "FAIL: info should be dropped at warn level\n");
            rc = 1;
        }
        if (!strstr(buf, "NOTICE: notice-line")) {
            fprintf(stderr, "FAIL: notice should be written at info level\n");
            rc = 1;
        }
    }
    (void)remove(cap.path);
    return rc;
}

int
main(void) {
    int rc = 0;
    rc |= test_defaults();
    rc |= test_env_overrides();
    rc |= test_log_level_from_string();
    rc |= test_log_threshold_gates_output();
    if (rc == 0) {
        printf("All runtime_config tests passed\n");
    }
    return rc;
}
