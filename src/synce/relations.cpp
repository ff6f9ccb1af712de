// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * SyncE device configuration containers and clock id assignment.
 */

#include <ptpconf/platform/posix_compat.h>
#include <ptpconf/runtime/log.h>
#include <ptpconf/synce/relations.h>

#include <stdlib.h>
#include <string.h>
#include <string>

void
ptpconf_synce_config_init(ptpconf_synce_config_t* cfg) {
    if (!cfg) {
        return;
    }
    memset(cfg, 0, sizeof(*cfg));
    cfg->network_option = PTPCONF_SYNCE_NETWORK_OPT_1;
    cfg->extended_tlv = PTPCONF_SYNCE_EXTENDED_TLV_DISABLED;
}

void
ptpconf_synce_config_free(ptpconf_synce_config_t* cfg) {
    if (!cfg) {
        return;
    }
    free(cfg->name);
    for (int i = 0; i < cfg->iface_count; i++) {
        free(cfg->ifaces[i]);
    }
    free(cfg->ifaces);
    free(cfg->clock_id);
    free(cfg->external_source);
    for (int i = 0; i < cfg->last_ql_count; i++) {
        free(cfg->last_ql_state[i].iface);
    }
    free(cfg->last_ql_state);
    ptpconf_synce_config_init(cfg);
}

int
ptpconf_synce_config_set_str(char** field, const char* value) {
    if (!field) {
        return -1;
    }
    char* v = NULL;
    if (value) {
        v = ptpconf_strdup(value);
        if (!v) {
            return -1;
        }
    }
    free(*field);
    *field = v;
    return 0;
}

int
ptpconf_synce_config_add_iface(ptpconf_synce_config_t* cfg, const char* iface) {
    if (!cfg || !iface) {
        return -1;
    }
    char** ifaces = (char**)realloc(cfg->ifaces, (size_t)(cfg->iface_count + 1) * sizeof(*ifaces));
    if (!ifaces) {
        return -1;
    }
    cfg->ifaces = ifaces;
    cfg->ifaces[cfg->iface_count] = ptpconf_strdup(iface);
    if (!cfg->ifaces[cfg->iface_count]) {
        return -1;
    }
    cfg->iface_count++;
    return 0;
}

int
ptpconf_synce_config_copy(ptpconf_synce_config_t* dst, const ptpconf_synce_config_t* src) {
    if (!dst || !src) {
        return -1;
    }
    if (ptpconf_synce_config_set_str(&dst->name, src->name) != 0
        || ptpconf_synce_config_set_str(&dst->clock_id, src->clock_id) != 0
        || ptpconf_synce_config_set_str(&dst->external_source, src->external_source) != 0) {
        return -1;
    }
    for (int i = 0; i < src->iface_count; i++) {
        if (ptpconf_synce_config_add_iface(dst, src->ifaces[i]) != 0) {
            return -1;
        }
    }
    dst->network_option = src->network_option;
    dst->extended_tlv = src->extended_tlv;
    /* runtime QL state is not carried over */
    return 0;
}

void
ptpconf_synce_relations_init(ptpconf_synce_relations_t* rel) {
    if (!rel) {
        return;
    }
    rel->devices = NULL;
    rel->count = 0;
    rel->capacity = 0;
}

void
ptpconf_synce_relations_free(ptpconf_synce_relations_t* rel) {
    if (!rel) {
        return;
    }
    for (int i = 0; i < rel->count; i++) {
        ptpconf_synce_config_free(&rel->devices[i]);
    }
    free(rel->devices);
    ptpconf_synce_relations_init(rel);
}

int
ptpconf_synce_register_device(ptpconf_synce_relations_t* rel, const ptpconf_synce_config_t* cfg) {
    if (!rel || !cfg) {
        return -1;
    }
    if (rel->count >= rel->capacity) {
        int cap = rel->capacity > 0 ? rel->capacity * 2 : 4;
        ptpconf_synce_config_t* d = (ptpconf_synce_config_t*)realloc(rel->devices, (size_t)cap * sizeof(*d));
        if (!d) {
            return -1;
        }
        rel->devices = d;
        rel->capacity = cap;
    }
    ptpconf_synce_config_t* slot = &rel->devices[rel->count];
    ptpconf_synce_config_init(slot);
    if (ptpconf_synce_config_copy(slot, cfg) != 0) {
        ptpconf_synce_config_free(slot);
        return -1;
    }
    rel->count++;
    LOG_DEBUG("synce: registered device %s with %d ports\n", slot->name ? slot->name : "", slot->iface_count);
    return 0;
}

const ptpconf_synce_config_t*
ptpconf_synce_find_device(const ptpconf_synce_relations_t* rel, const char* name) {
    if (!rel || !name) {
        return NULL;
    }
    for (int i = 0; i < rel->count; i++) {
        if (rel->devices[i].name && strcmp(rel->devices[i].name, name) == 0) {
            return &rel->devices[i];
        }
    }
    return NULL;
}

int
ptpconf_synce_assign_clock_ids(ptpconf_synce_relations_t* rel, const ptpconf_options_t* settings) {
    if (!rel) {
        return -1;
    }
    int missing = 0;
    for (int i = 0; i < rel->count; i++) {
        ptpconf_synce_config_t* dev = &rel->devices[i];
        if (dev->clock_id && dev->clock_id[0] != '\0') {
            continue;
        }
        for (int j = 0; j < dev->iface_count; j++) {
            std::string key = std::string(PTPCONF_SYNCE_CLOCK_ID_KEY "[") + dev->ifaces[j] + "]";
            const char* id = ptpconf_options_get(settings, key.c_str());
            if (id && *id) {
                if (ptpconf_synce_config_set_str(&dev->clock_id, id) != 0) {
                    return -1;
                }
                break;
            }
        }
        if (!dev->clock_id || dev->clock_id[0] == '\0') {
            LOG_WARNING("synce: no clock id found for device %s\n", dev->name ? dev->name : "");
            missing++;
        }
    }
    return missing;
}
