// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * Fold over configuration sections that groups port sections under the most
 * recent SyncE device section.
 *
 *   [<synce1>]      opens device "synce1"
 *   network_option 2
 *   [{gnss}]        external source of synce1
 *   [eth0]          port of synce1
 *   [eth1]          port of synce1
 *   [<synce2>]      closes synce1, opens synce2
 *   [eth2]          port of synce2
 *
 * Ports seen while no device is open are not part of any device and are
 * dropped.
 */

#include <ptpconf/core/value.h>
#include <ptpconf/runtime/log.h>
#include <ptpconf/synce/relations.h>

#include <stdlib.h>
#include <string.h>

/* Device being accumulated while scanning sections */
typedef struct {
    ptpconf_synce_config_t dev;
    int open; /* dev.name is non-empty */
} synce_accumulator_t;

static int
acc_flush(synce_accumulator_t* acc, ptpconf_synce_relations_t* out) {
    int rc = 0;
    if (acc->open) {
        rc = ptpconf_synce_register_device(out, &acc->dev);
    }
    ptpconf_synce_config_free(&acc->dev);
    acc->open = 0;
    return rc;
}

static void
parse_int_option(const ptpconf_section_t* sec, const char* key, int* field, int defv) {
    const char* v = ptpconf_options_get(&sec->options, key);
    if (!v) {
        return;
    }
    int x = 0;
    if (ptpconf_parse_int(v, &x) != 0) {
        LOG_ERROR("synce: error parsing `%s` value '%s' in %s, keeping default %d\n", key, v, sec->header, defv);
        *field = defv;
        return;
    }
    *field = x;
}

static int
acc_open_device(synce_accumulator_t* acc, const ptpconf_section_t* sec) {
    ptpconf_synce_config_init(&acc->dev);
    if (sec->name[0] == '\0') {
        LOG_WARNING("synce: device section %s has no name, ignored\n", sec->header);
        return 0;
    }
    if (ptpconf_synce_config_set_str(&acc->dev.name, sec->name) != 0) {
        return -1;
    }
    parse_int_option(sec, "network_option", &acc->dev.network_option, PTPCONF_SYNCE_NETWORK_OPT_1);
    parse_int_option(sec, "extended_tlv", &acc->dev.extended_tlv, PTPCONF_SYNCE_EXTENDED_TLV_DISABLED);

    const char* clock_id = ptpconf_options_get(&sec->options, "clock_id");
    if (clock_id) {
        size_t len = strlen(clock_id) + 1;
        char* id = (char*)malloc(len);
        if (!id || ptpconf_trim_copy(id, len, clock_id) != 0) {
            free(id);
            return -1;
        }
        if (id[0] == '\0') {
            free(id);
        } else {
            acc->dev.clock_id = id;
        }
    }
    acc->open = 1;
    return 0;
}

int
ptpconf_synce_extract_relations(const ptpconf_conf_t* conf, ptpconf_synce_relations_t* out) {
    if (!out) {
        return -1;
    }
    ptpconf_synce_relations_free(out);
    if (!conf) {
        return 0;
    }

    synce_accumulator_t acc;
    ptpconf_synce_config_init(&acc.dev);
    acc.open = 0;

    for (int i = 0; i < conf->count; i++) {
        const ptpconf_section_t* sec = &conf->sections[i];
        int rc = 0;
        switch (sec->kind) {
            case PTPCONF_SECTION_DEVICE:
                rc = acc_flush(&acc, out);
                if (rc == 0) {
                    rc = acc_open_device(&acc, sec);
                }
                break;
            case PTPCONF_SECTION_EXTERNAL_SOURCE:
                if (acc.open) {
                    rc = ptpconf_synce_config_set_str(&acc.dev.external_source, sec->name);
                }
                break;
            case PTPCONF_SECTION_PLAIN:
                if (strcmp(sec->header, PTPCONF_GLOBAL_SECTION) == 0) {
                    break;
                }
                if (acc.open) {
                    rc = ptpconf_synce_config_add_iface(&acc.dev, sec->name);
                } else {
                    LOG_DEBUG("synce: port %s precedes any device section, ignored\n", sec->header);
                }
                break;
        }
        if (rc != 0) {
            LOG_ERROR("synce: out of memory building relations\n");
            ptpconf_synce_config_free(&acc.dev);
            ptpconf_synce_relations_free(out);
            return -1;
        }
    }

    if (acc_flush(&acc, out) != 0) {
        LOG_ERROR("synce: out of memory building relations\n");
        ptpconf_synce_relations_free(out);
        return -1;
    }
    return 0;
}
