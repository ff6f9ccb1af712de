// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * ptp4l/ts2phc and synce4l renderers.
 */

#include <ptpconf/core/render.h>
#include <ptpconf/core/value.h>
#include <ptpconf/platform/posix_compat.h>
#include <ptpconf/runtime/log.h>

#include <stdlib.h>
#include <string.h>
#include <string>

void
ptpconf_render_init(ptpconf_render_t* out) {
    if (!out) {
        return;
    }
    out->text = NULL;
    out->ifaces.items = NULL;
    out->ifaces.count = 0;
    out->ifaces.capacity = 0;
}

void
ptpconf_render_free(ptpconf_render_t* out) {
    if (!out) {
        return;
    }
    free(out->text);
    for (int i = 0; i < out->ifaces.count; i++) {
        free(out->ifaces.items[i].name);
    }
    free(out->ifaces.items);
    ptpconf_render_init(out);
}

static int
ifaces_push(ptpconf_ifaces_t* list, const char* name, ptpconf_event_source_t source, int is_master) {
    if (list->count >= list->capacity) {
        int cap = list->capacity > 0 ? list->capacity * 2 : 8;
        ptpconf_iface_t* items = (ptpconf_iface_t*)realloc(list->items, (size_t)cap * sizeof(*items));
        if (!items) {
            return -1;
        }
        list->items = items;
        list->capacity = cap;
    }
    ptpconf_iface_t* it = &list->items[list->count];
    memset(it, 0, sizeof(*it));
    it->name = ptpconf_strdup(name);
    if (!it->name) {
        return -1;
    }
    it->source = source;
    it->is_master = is_master;
    list->count++;
    return 0;
}

/* ts2phc.master of a section; a non-boolean value falls back to PPS */
static ptpconf_event_source_t
section_source(const ptpconf_section_t* sec, const char* flag) {
    int v = 0;
    if (ptpconf_parse_bool(flag, &v) != 0) {
        LOG_WARNING("ptpconf: %s: ts2phc.master '%s' is not a boolean (%s), using PPS\n", sec->header, flag,
                    ptpconf_status_str(PTPCONF_ERR_BOOLEAN_PARSE));
    }
    return ptpconf_resolve_source(flag);
}

static std::string
render_header(const ptpconf_conf_t* conf) {
    return std::string("#profile: ") + conf->profile_name + "\n";
}

static void
append_options(std::string& text, const ptpconf_options_t* opts) {
    for (int i = 0; i < opts->count; i++) {
        text += "\n";
        text += opts->items[i].key;
        text += " ";
        text += opts->items[i].value;
    }
}

static int
finish_text(const std::string& text, ptpconf_render_t* out, ptpconf_error_t* err) {
    out->text = ptpconf_strdup(text.c_str());
    if (!out->text) {
        ptpconf_error_set(err, PTPCONF_ERR_NOMEM, 0, "Out of memory storing rendered text");
        return -1;
    }
    return 0;
}

int
ptpconf_render_ptp4l(const ptpconf_conf_t* conf, ptpconf_render_t* out, ptpconf_error_t* err) {
    ptpconf_error_clear(err);
    if (!conf || !out) {
        ptpconf_error_set(err, PTPCONF_ERR_INVALID_ARG, 0, "No document or output provided");
        return -1;
    }
    ptpconf_render_free(out);

    std::string text = render_header(conf);
    ptpconf_event_source_t nmea_source = PTPCONF_SOURCE_PPS;

    for (int i = 0; i < conf->count; i++) {
        const ptpconf_section_t* sec = &conf->sections[i];
        text += "\n";
        text += sec->header;

        int is_nmea = strcmp(sec->header, PTPCONF_NMEA_SECTION) == 0;
        if (is_nmea) {
            const char* src = ptpconf_options_get(&sec->options, "ts2phc.master");
            if (src) {
                nmea_source = section_source(sec, src);
            }
        }

        if (!is_nmea && strcmp(sec->header, PTPCONF_GLOBAL_SECTION) != 0) {
            const char* src = ptpconf_options_get(&sec->options, "ts2phc.master");
            ptpconf_event_source_t source = src ? section_source(sec, src) : nmea_source;

            int is_master = 0;
            const char* master_only = ptpconf_options_get(&sec->options, "masterOnly");
            if (master_only && ptpconf_parse_bool(master_only, &is_master) != 0) {
                LOG_WARNING("ptpconf: %s: masterOnly '%s' is not a boolean (%s), treated as false\n", sec->header,
                            master_only, ptpconf_status_str(PTPCONF_ERR_BOOLEAN_PARSE));
                is_master = 0;
            }

            /* interface name: header without the square brackets */
            std::string name = sec->header;
            std::string::size_type pos;
            while ((pos = name.find_first_of("[]")) != std::string::npos) {
                name.erase(pos, 1);
            }
            if (ifaces_push(&out->ifaces, name.c_str(), source, is_master) != 0) {
                ptpconf_error_set(err, PTPCONF_ERR_NOMEM, 0, "Out of memory collecting interfaces");
                ptpconf_render_free(out);
                return -1;
            }
        }

        append_options(text, &sec->options);
    }

    if (finish_text(text, out, err) != 0) {
        ptpconf_render_free(out);
        return -1;
    }
    return 0;
}

int
ptpconf_render_synce4l(const ptpconf_conf_t* conf, const ptpconf_options_t* settings, ptpconf_render_t* out,
                       ptpconf_synce_relations_t* relations, ptpconf_error_t* err) {
    ptpconf_error_clear(err);
    if (!conf || !out || !relations) {
        ptpconf_error_set(err, PTPCONF_ERR_INVALID_ARG, 0, "No document, output or relations provided");
        return -1;
    }
    ptpconf_render_free(out);

    if (ptpconf_synce_extract_relations(conf, relations) != 0) {
        ptpconf_error_set(err, PTPCONF_ERR_NOMEM, 0, "Out of memory extracting SyncE relations");
        return -1;
    }
    if (ptpconf_synce_assign_clock_ids(relations, settings) < 0) {
        ptpconf_error_set(err, PTPCONF_ERR_NOMEM, 0, "Out of memory assigning clock ids");
        ptpconf_synce_relations_free(relations);
        return -1;
    }

    int device_sections = ptpconf_conf_count_kind(conf, PTPCONF_SECTION_DEVICE);
    if (device_sections != relations->count) {
        LOG_ERROR("synce: %d device sections but %d SyncE devices extracted\n", device_sections, relations->count);
        ptpconf_error_set(err, PTPCONF_ERR_STRUCTURE_MISMATCH, 0,
                          "%d device sections but %d SyncE devices extracted", device_sections, relations->count);
        ptpconf_synce_relations_free(relations);
        return -1;
    }

    std::string text = render_header(conf);
    int device_idx = 0;
    for (int i = 0; i < conf->count; i++) {
        const ptpconf_section_t* sec = &conf->sections[i];
        text += "\n";
        text += sec->header;
        append_options(text, &sec->options);

        if (sec->kind != PTPCONF_SECTION_DEVICE) {
            continue;
        }
        const ptpconf_synce_config_t* dev = &relations->devices[device_idx++];
        if (ptpconf_options_get(&sec->options, "clock_id") == NULL && dev->clock_id) {
            text += "\nclock_id ";
            text += dev->clock_id;
        }
    }

    if (finish_text(text, out, err) != 0) {
        ptpconf_synce_relations_free(relations);
        return -1;
    }
    return 0;
}
