// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief SyncE device/port relations derived from a synce4l configuration.
 *
 * Device sections ("[<synce1>]") open a logical SyncE device; every plain
 * port section that follows ("[eth0]") belongs to that device until the next
 * device section. An external source section ("[{gnss}]") names the frequency
 * source of the open device.
 */

#ifndef PTPCONF_SYNCE_RELATIONS_H
#define PTPCONF_SYNCE_RELATIONS_H

#include <ptpconf/core/conf.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define PTPCONF_SYNCE_NETWORK_OPT_1         1
#define PTPCONF_SYNCE_NETWORK_OPT_2         2
#define PTPCONF_SYNCE_EXTENDED_TLV_DISABLED 0
#define PTPCONF_SYNCE_EXTENDED_TLV_ENABLED  1

/** Prefix of the per-interface clock id keys in the settings mapping: "clockId[eth0]". */
#define PTPCONF_SYNCE_CLOCK_ID_KEY "clockId"

/**
 * @brief Last quality level seen on a port (owned by the SyncE runtime).
 */
typedef struct {
    char* iface;          /**< Port name */
    int priority;         /**< QL priority */
    uint8_t ssm;          /**< SSM code */
    uint8_t extended_ssm; /**< Enhanced SSM code (extended TLV) */
} ptpconf_synce_ql_info_t;

/**
 * @brief Configuration of one SyncE device.
 */
typedef struct {
    char* name;            /**< Device name without delimiters */
    char** ifaces;         /**< Port names in source order */
    int iface_count;       /**< Number of ports */
    char* clock_id;        /**< Assigned clock identity, NULL until known */
    int network_option;    /**< network_option, default 1 */
    int extended_tlv;      /**< extended_tlv, default disabled */
    char* external_source; /**< External source name, NULL if none */

    /* Runtime state owned by the SyncE runtime; only initialized here */
    ptpconf_synce_ql_info_t* last_ql_state;
    int last_ql_count;
    char last_clock_state[32];
} ptpconf_synce_config_t;

/**
 * @brief Ordered SyncE devices.
 */
typedef struct {
    ptpconf_synce_config_t* devices; /**< Heap array in source order */
    int count;                       /**< Number of devices */
    int capacity;                    /**< Allocated capacity */
} ptpconf_synce_relations_t;

/** @brief Initialize with defaults (network option 1, extended TLV disabled). */
void ptpconf_synce_config_init(ptpconf_synce_config_t* cfg);
void ptpconf_synce_config_free(ptpconf_synce_config_t* cfg);

/** @brief Append a port name. @return 0 on success, -1 on allocation failure. */
int ptpconf_synce_config_add_iface(ptpconf_synce_config_t* cfg, const char* iface);

/** @brief Replace a string member (name, clock_id, external_source). NULL clears it. */
int ptpconf_synce_config_set_str(char** field, const char* value);

/** @brief Deep copy `src` into an initialized `dst`. */
int ptpconf_synce_config_copy(ptpconf_synce_config_t* dst, const ptpconf_synce_config_t* src);

void ptpconf_synce_relations_init(ptpconf_synce_relations_t* rel);
void ptpconf_synce_relations_free(ptpconf_synce_relations_t* rel);

/**
 * @brief Register a device configuration (deep copy appended at the end).
 *
 * @return 0 on success, -1 on allocation failure or NULL arguments.
 */
int ptpconf_synce_register_device(ptpconf_synce_relations_t* rel, const ptpconf_synce_config_t* cfg);

/** @brief Device named `name`, or NULL. */
const ptpconf_synce_config_t* ptpconf_synce_find_device(const ptpconf_synce_relations_t* rel, const char* name);

/**
 * @brief Assign clock ids from a settings mapping.
 *
 * For every device that has no clock id yet, the first port `p` for which
 * `settings` holds "clockId[p]" supplies the device's clock id.
 *
 * @return Number of devices that still have no clock id, or -1 on allocation failure.
 */
int ptpconf_synce_assign_clock_ids(ptpconf_synce_relations_t* rel, const ptpconf_options_t* settings);

/**
 * @brief Build relations from a parsed document.
 *
 * `out` is freed and re-initialized first. Malformed `network_option` or
 * `extended_tlv` values are logged and the defaults kept.
 *
 * @return 0 on success, -1 on allocation failure.
 */
int ptpconf_synce_extract_relations(const ptpconf_conf_t* conf, ptpconf_synce_relations_t* out);

#ifdef __cplusplus
}
#endif

#endif /* PTPCONF_SYNCE_RELATIONS_H */
