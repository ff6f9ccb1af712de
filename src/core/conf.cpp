// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * Container helpers for the configuration model: ordered options, sections
 * and the document.
 */

#include <ptpconf/core/conf.h>
#include <ptpconf/platform/posix_compat.h>
#include <ptpconf/runtime/log.h>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "conf_internal.h"

// Ordered options --------------------------------------------------------------

void
ptpconf_options_init(ptpconf_options_t* opts) {
    if (!opts) {
        return;
    }
    opts->items = NULL;
    opts->count = 0;
    opts->capacity = 0;
}

static int
options_reserve(ptpconf_options_t* opts, int need) {
    if (need <= opts->capacity) {
        return 0;
    }
    int cap = opts->capacity > 0 ? opts->capacity * 2 : 8;
    while (cap < need) {
        cap *= 2;
    }
    ptpconf_option_t* items = (ptpconf_option_t*)realloc(opts->items, (size_t)cap * sizeof(*items));
    if (!items) {
        return -1;
    }
    opts->items = items;
    opts->capacity = cap;
    return 0;
}

int
ptpconf_options_set(ptpconf_options_t* opts, const char* key, const char* value) {
    if (!opts || !key || !value) {
        return -1;
    }
    for (int i = 0; i < opts->count; i++) {
        if (strcmp(opts->items[i].key, key) == 0) {
            char* v = ptpconf_strdup(value);
            if (!v) {
                return -1;
            }
            free(opts->items[i].value);
            opts->items[i].value = v;
            return 0;
        }
    }
    if (options_reserve(opts, opts->count + 1) != 0) {
        return -1;
    }
    char* k = ptpconf_strdup(key);
    char* v = ptpconf_strdup(value);
    if (!k || !v) {
        free(k);
        free(v);
        return -1;
    }
    opts->items[opts->count].key = k;
    opts->items[opts->count].value = v;
    opts->count++;
    return 0;
}

const char*
ptpconf_options_get(const ptpconf_options_t* opts, const char* key) {
    if (!opts || !key) {
        return NULL;
    }
    for (int i = 0; i < opts->count; i++) {
        if (strcmp(opts->items[i].key, key) == 0) {
            return opts->items[i].value;
        }
    }
    return NULL;
}

int
ptpconf_options_copy(ptpconf_options_t* dst, const ptpconf_options_t* src) {
    if (!dst || !src) {
        return -1;
    }
    for (int i = 0; i < src->count; i++) {
        if (ptpconf_options_set(dst, src->items[i].key, src->items[i].value) != 0) {
            return -1;
        }
    }
    return 0;
}

void
ptpconf_options_free(ptpconf_options_t* opts) {
    if (!opts) {
        return;
    }
    for (int i = 0; i < opts->count; i++) {
        free(opts->items[i].key);
        free(opts->items[i].value);
    }
    free(opts->items);
    ptpconf_options_init(opts);
}

// Sections ---------------------------------------------------------------------

ptpconf_section_kind_t
ptpconf_section_kind_of(const char* header) {
    if (!header) {
        return PTPCONF_SECTION_PLAIN;
    }
    if (strncmp(header, "[<", 2) == 0) {
        return PTPCONF_SECTION_DEVICE;
    }
    if (strncmp(header, "[{", 2) == 0) {
        return PTPCONF_SECTION_EXTERNAL_SOURCE;
    }
    return PTPCONF_SECTION_PLAIN;
}

int
ptpconf_section_strip_name(const char* header, char* out, size_t out_size) {
    if (!out || out_size == 0) {
        return -1;
    }
    out[0] = '\0';
    if (!header) {
        return 0;
    }
    size_t n = 0;
    for (const char* p = header; *p; ++p) {
        if (strchr("{}<>[] ", *p)) {
            continue;
        }
        if (n + 1 >= out_size) {
            out[n] = '\0';
            return -1;
        }
        out[n++] = *p;
    }
    out[n] = '\0';
    return 0;
}

void
conf_section_init(ptpconf_section_t* sec) {
    sec->header = NULL;
    sec->name = NULL;
    sec->kind = PTPCONF_SECTION_PLAIN;
    ptpconf_options_init(&sec->options);
}

int
conf_section_open(ptpconf_section_t* sec, const char* header, size_t header_len) {
    conf_section_init(sec);
    sec->header = (char*)malloc(header_len + 1);
    sec->name = (char*)malloc(header_len + 1);
    if (!sec->header || !sec->name) {
        conf_section_free(sec);
        return -1;
    }
    memcpy(sec->header, header, header_len);
    sec->header[header_len] = '\0';
    (void)ptpconf_section_strip_name(sec->header, sec->name, header_len + 1);
    sec->kind = ptpconf_section_kind_of(sec->header);
    return 0;
}

void
conf_section_free(ptpconf_section_t* sec) {
    if (!sec) {
        return;
    }
    free(sec->header);
    free(sec->name);
    ptpconf_options_free(&sec->options);
    conf_section_init(sec);
}

// Document ---------------------------------------------------------------------

void
ptpconf_conf_init(ptpconf_conf_t* conf) {
    if (!conf) {
        return;
    }
    conf->sections = NULL;
    conf->count = 0;
    conf->capacity = 0;
    conf->clock_role = PTPCONF_CLOCK_GM;
    conf->profile_name[0] = '\0';
}

void
ptpconf_conf_free(ptpconf_conf_t* conf) {
    if (!conf) {
        return;
    }
    for (int i = 0; i < conf->count; i++) {
        conf_section_free(&conf->sections[i]);
    }
    free(conf->sections);
    ptpconf_conf_init(conf);
}

int
conf_append_section(ptpconf_conf_t* conf, ptpconf_section_t* sec) {
    if (conf->count >= conf->capacity) {
        int cap = conf->capacity > 0 ? conf->capacity * 2 : 8;
        ptpconf_section_t* s = (ptpconf_section_t*)realloc(conf->sections, (size_t)cap * sizeof(*s));
        if (!s) {
            return -1;
        }
        conf->sections = s;
        conf->capacity = cap;
    }
    /* ownership of the heap members moves into the document */
    conf->sections[conf->count++] = *sec;
    conf_section_init(sec);
    return 0;
}

void
ptpconf_conf_set_profile_name(ptpconf_conf_t* conf, const char* name) {
    if (!conf) {
        return;
    }
    int n = snprintf(conf->profile_name, sizeof conf->profile_name, "%s", name ? name : "");
    if (n >= (int)sizeof conf->profile_name) {
        LOG_WARNING("ptpconf: profile name '%s' truncated to %d characters\n", name,
                    (int)sizeof conf->profile_name - 1);
    }
}

const ptpconf_section_t*
ptpconf_conf_find_section(const ptpconf_conf_t* conf, const char* header) {
    if (!conf || !header) {
        return NULL;
    }
    for (int i = 0; i < conf->count; i++) {
        if (strcmp(conf->sections[i].header, header) == 0) {
            return &conf->sections[i];
        }
    }
    return NULL;
}

int
ptpconf_conf_count_kind(const ptpconf_conf_t* conf, ptpconf_section_kind_t kind) {
    if (!conf) {
        return 0;
    }
    int n = 0;
    for (int i = 0; i < conf->count; i++) {
        if (conf->sections[i].kind == kind) {
            n++;
        }
    }
    return n;
}

const char*
ptpconf_clock_role_str(ptpconf_clock_role_t role) {
    switch (role) {
        case PTPCONF_CLOCK_GM: return "GM";
        case PTPCONF_CLOCK_BC: return "BC";
        case PTPCONF_CLOCK_OC: return "OC";
    }
    return "unknown";
}
