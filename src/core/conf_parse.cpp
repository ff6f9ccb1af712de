// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * Line-oriented parser for ptp4l/ts2phc/synce4l configuration text.
 *
 * Each non-comment line is either a section header ("[name]") or a
 * "key value" option belonging to the most recent header. The value is
 * everything after the first space, so "key  a b" stores " a b".
 */

#include <ptpconf/core/conf.h>
#include <ptpconf/core/value.h>
#include <ptpconf/platform/posix_compat.h>
#include <ptpconf/runtime/log.h>

#include <ctype.h>
#include <stdlib.h>
#include <string.h>

#include "conf_internal.h"

/* Trim in place: returns the first non-blank character, truncates trailing blanks. */
static char*
trim_line(char* s) {
    while (*s && isspace((unsigned char)*s)) {
        s++;
    }
    size_t n = strlen(s);
    while (n > 0 && isspace((unsigned char)s[n - 1])) {
        s[--n] = '\0';
    }
    return s;
}

/* masterOnly 0 / serverOnly 0 / slaveOnly 1 / clientOnly 1 */
static int
is_slave_option(const char* key, const char* value) {
    char v[8];
    if (ptpconf_trim_copy(v, sizeof v, value) != 0) {
        return 0;
    }
    if (strcmp(key, "masterOnly") == 0 || strcmp(key, "serverOnly") == 0) {
        return strcmp(v, "0") == 0;
    }
    if (strcmp(key, "slaveOnly") == 0 || strcmp(key, "clientOnly") == 0) {
        return strcmp(v, "1") == 0;
    }
    return 0;
}

static ptpconf_clock_role_t
classify_clock_role(int has_slave, int section_count) {
    if (!has_slave) {
        return PTPCONF_CLOCK_GM;
    }
    return section_count > 2 ? PTPCONF_CLOCK_BC : PTPCONF_CLOCK_OC;
}

/*
 * Close the open section. A repeated [global] is folded into the first one so
 * the document keeps a single global section.
 */
static int
flush_section(ptpconf_conf_t* out, ptpconf_section_t* cur) {
    if (strcmp(cur->header, PTPCONF_GLOBAL_SECTION) == 0) {
        for (int i = 0; i < out->count; i++) {
            if (strcmp(out->sections[i].header, PTPCONF_GLOBAL_SECTION) == 0) {
                int rc = ptpconf_options_copy(&out->sections[i].options, &cur->options);
                conf_section_free(cur);
                return rc;
            }
        }
    }
    return conf_append_section(out, cur);
}

int
ptpconf_conf_parse(const char* text, ptpconf_conf_t* out, ptpconf_error_t* err) {
    ptpconf_error_t e;
    ptpconf_error_clear(&e);
    ptpconf_error_clear(err);
    if (!out) {
        ptpconf_error_set(err, PTPCONF_ERR_INVALID_ARG, 0, "No output document provided");
        return -1;
    }
    ptpconf_conf_free(out);

    char* buf = ptpconf_strdup(text ? text : "");
    if (!buf) {
        ptpconf_error_set(err, PTPCONF_ERR_NOMEM, 0, "Out of memory copying configuration text");
        return -1;
    }

    ptpconf_section_t cur;
    conf_section_init(&cur);
    int have_cur = 0;
    int have_global = 0;
    int has_slave = 0;
    int line_num = 0;
    int rc = 0;

    char* next = buf;
    while (next) {
        char* raw = next;
        char* nl = strchr(raw, '\n');
        if (nl) {
            *nl = '\0';
            next = nl + 1;
        } else {
            next = NULL;
        }
        line_num++;

        char* p = trim_line(raw);
        if (p[0] == '\0' || p[0] == '#') {
            continue;
        }

        if (p[0] == '[') {
            char* end = strchr(p, ']');
            if (!end) {
                ptpconf_error_set(&e, PTPCONF_ERR_MALFORMED_SECTION, line_num, "Section missing closing ']': %s", p);
                rc = -1;
                break;
            }
            if (have_cur && flush_section(out, &cur) != 0) {
                ptpconf_error_set(&e, PTPCONF_ERR_NOMEM, line_num, "Out of memory appending section");
                rc = -1;
                break;
            }
            /* Anything after the first ']' is dropped */
            if (conf_section_open(&cur, p, (size_t)(end - p) + 1) != 0) {
                ptpconf_error_set(&e, PTPCONF_ERR_NOMEM, line_num, "Out of memory opening section");
                have_cur = 0;
                rc = -1;
                break;
            }
            have_cur = 1;
            if (strcmp(cur.header, PTPCONF_GLOBAL_SECTION) == 0) {
                have_global = 1;
            }
            continue;
        }

        if (!have_cur) {
            ptpconf_error_set(&e, PTPCONF_ERR_OPTION_OUTSIDE_SECTION, line_num, "Config option not in section: %s", p);
            rc = -1;
            break;
        }

        char* sp = strchr(p, ' ');
        if (!sp) {
            LOG_DEBUG("ptpconf: line %d in %s has no value, ignored\n", line_num, cur.header);
            continue;
        }
        *sp = '\0';
        const char* key = p;
        const char* value = sp + 1;
        if (ptpconf_options_set(&cur.options, key, value) != 0) {
            ptpconf_error_set(&e, PTPCONF_ERR_NOMEM, line_num, "Out of memory storing option %s", key);
            rc = -1;
            break;
        }
        if (is_slave_option(key, value)) {
            has_slave = 1;
        }
    }

    if (rc == 0 && have_cur) {
        if (flush_section(out, &cur) != 0) {
            ptpconf_error_set(&e, PTPCONF_ERR_NOMEM, line_num, "Out of memory appending section");
            rc = -1;
        }
    }
    if (rc == 0 && !have_global) {
        static const char global_header[] = PTPCONF_GLOBAL_SECTION;
        if (conf_section_open(&cur, global_header, sizeof(global_header) - 1) != 0
            || conf_append_section(out, &cur) != 0) {
            ptpconf_error_set(&e, PTPCONF_ERR_NOMEM, 0, "Out of memory adding [global]");
            rc = -1;
        }
    }

    conf_section_free(&cur);
    free(buf);

    if (rc != 0) {
        LOG_ERROR("ptpconf: %s (line %d): %s\n", ptpconf_status_str(e.code), e.line_number, e.message);
        if (err) {
            *err = e;
        }
        ptpconf_conf_free(out);
        return -1;
    }

    out->clock_role = classify_clock_role(has_slave, out->count);
    LOG_DEBUG("ptpconf: parsed %d sections, clock role %s\n", out->count, ptpconf_clock_role_str(out->clock_role));
    return 0;
}
