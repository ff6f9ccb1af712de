// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * Default configuration loading and applied-configuration bookkeeping.
 */

#include <ptpconf/platform/posix_compat.h>
#include <ptpconf/runtime/conf_update.h>
#include <ptpconf/runtime/config.h>
#include <ptpconf/runtime/log.h>

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <sys/stat.h>

int
ptpconf_read_file(const char* path, char** out, size_t* out_len, ptpconf_error_t* err) {
    ptpconf_error_clear(err);
    if (!path || !*path || !out) {
        ptpconf_error_set(err, PTPCONF_ERR_INVALID_ARG, 0, "No config path provided");
        return -1;
    }
    *out = NULL;
    if (out_len) {
        *out_len = 0;
    }

    struct stat st;
    if (stat(path, &st) != 0) {
        if (errno == ENOENT) {
            ptpconf_error_set(err, PTPCONF_ERR_IO, 0, "%s doesn't exist", path);
        } else {
            ptpconf_error_set(err, PTPCONF_ERR_IO, 0, "unknown error searching for %s: %s", path, strerror(errno));
        }
        return -1;
    }

    FILE* fp = fopen(path, "rb");
    if (!fp) {
        ptpconf_error_set(err, PTPCONF_ERR_IO, 0, "failed to read %s: %s", path, strerror(errno));
        return -1;
    }

    size_t cap = 4096;
    size_t len = 0;
    char* buf = (char*)malloc(cap);
    if (!buf) {
        fclose(fp);
        ptpconf_error_set(err, PTPCONF_ERR_NOMEM, 0, "Out of memory reading %s", path);
        return -1;
    }
    for (;;) {
        if (len + 1 >= cap) {
            char* nb = (char*)realloc(buf, cap * 2);
            if (!nb) {
                free(buf);
                fclose(fp);
                ptpconf_error_set(err, PTPCONF_ERR_NOMEM, 0, "Out of memory reading %s", path);
                return -1;
            }
            buf = nb;
            cap *= 2;
        }
        size_t n = fread(buf + len, 1, cap - len - 1, fp);
        len += n;
        if (n == 0) {
            break;
        }
    }
    int read_failed = ferror(fp);
    fclose(fp);
    if (read_failed) {
        free(buf);
        ptpconf_error_set(err, PTPCONF_ERR_IO, 0, "failed to read %s", path);
        return -1;
    }
    buf[len] = '\0';
    *out = buf;
    if (out_len) {
        *out_len = len;
    }
    return 0;
}

int
ptpconf_conf_update_init(ptpconf_conf_update_t* upd, const char* path, ptpconf_error_t* err) {
    ptpconf_error_clear(err);
    if (!upd) {
        ptpconf_error_set(err, PTPCONF_ERR_INVALID_ARG, 0, "No update holder provided");
        return -1;
    }
    memset(upd, 0, sizeof(*upd));
    if (!path) {
        path = ptpconf_get_config()->ptp4l_conf_path;
    }
    ptpconf_error_t e;
    if (ptpconf_read_file(path, &upd->default_conf, NULL, &e) != 0) {
        LOG_ERROR("ptpconf: %s\n", e.message);
        if (err) {
            *err = e;
        }
        return -1;
    }
    LOG_DEBUG("ptpconf: loaded default configuration from %s\n", path);
    return 0;
}

int
ptpconf_conf_update_apply(ptpconf_conf_update_t* upd, const char* profile_name, const char* text,
                          ptpconf_conf_t* out, ptpconf_error_t* err) {
    ptpconf_error_clear(err);
    if (!upd || !out) {
        ptpconf_error_set(err, PTPCONF_ERR_INVALID_ARG, 0, "No update holder or output document provided");
        return -1;
    }
    if (!profile_name) {
        profile_name = "";
    }

    const char* effective = (text && *text) ? text : upd->default_conf;
    if (!effective) {
        effective = "";
    }
    if (upd->applied_conf && upd->applied_profile && strcmp(upd->applied_profile, profile_name) == 0
        && strcmp(upd->applied_conf, effective) == 0) {
        return 0;
    }

    char* copy = ptpconf_strdup(effective);
    char* name = ptpconf_strdup(profile_name);
    if (!copy || !name) {
        free(copy);
        free(name);
        ptpconf_error_set(err, PTPCONF_ERR_NOMEM, 0, "Out of memory recording applied configuration");
        return -1;
    }
    if (ptpconf_conf_parse(effective, out, err) != 0) {
        free(copy);
        free(name);
        return -1;
    }
    ptpconf_conf_set_profile_name(out, profile_name);

    free(upd->applied_conf);
    upd->applied_conf = copy;
    free(upd->applied_profile);
    upd->applied_profile = name;
    upd->generation++;
    LOG_INFO("ptpconf: load profile %s (clock role %s)\n", upd->applied_profile,
             ptpconf_clock_role_str(out->clock_role));
    return 1;
}

void
ptpconf_conf_update_free(ptpconf_conf_update_t* upd) {
    if (!upd) {
        return;
    }
    free(upd->default_conf);
    free(upd->applied_conf);
    free(upd->applied_profile);
    memset(upd, 0, sizeof(*upd));
}
