// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief In-memory model of a ptp4l-style configuration and its parser.
 *
 * A configuration is an ordered list of bracketed sections, each holding an
 * ordered list of `key value` options. Three header shapes are recognized:
 *
 *   [eth0]       plain section (interface, [global], [nmea], ...)
 *   [<synce1>]   SyncE device marker; groups the plain sections that follow
 *   [{gnss}]     external source marker for the open SyncE device
 *
 * All heap-owning types follow an init/free pairing; a freed object is left in
 * the initialized (empty) state and may be reused.
 */

#ifndef PTPCONF_CORE_CONF_H
#define PTPCONF_CORE_CONF_H

#include <ptpconf/core/status.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/** Header of the mandatory global section. */
#define PTPCONF_GLOBAL_SECTION "[global]"
/** Header of the ts2phc NMEA section. */
#define PTPCONF_NMEA_SECTION   "[nmea]"

/* ============================================================================
 * Ordered options
 * ============================================================================ */

/**
 * @brief A single `key value` pair (heap strings).
 */
typedef struct {
    char* key;
    char* value;
} ptpconf_option_t;

/**
 * @brief Ordered key/value list; insertion order is preserved.
 */
typedef struct {
    ptpconf_option_t* items; /**< Heap array of options */
    int count;               /**< Number of options */
    int capacity;            /**< Allocated capacity */
} ptpconf_options_t;

void ptpconf_options_init(ptpconf_options_t* opts);

/**
 * @brief Insert or replace an option.
 *
 * A new key is appended; an existing key keeps its position and gets the new
 * value.
 *
 * @return 0 on success, -1 on allocation failure or NULL arguments.
 */
int ptpconf_options_set(ptpconf_options_t* opts, const char* key, const char* value);

/** @brief Value for `key`, or NULL when absent. */
const char* ptpconf_options_get(const ptpconf_options_t* opts, const char* key);

/** @brief Deep copy `src` into an initialized, empty `dst`. */
int ptpconf_options_copy(ptpconf_options_t* dst, const ptpconf_options_t* src);

void ptpconf_options_free(ptpconf_options_t* opts);

/* ============================================================================
 * Sections and document
 * ============================================================================ */

/**
 * @brief Section shape, decided once from the header text.
 */
typedef enum {
    PTPCONF_SECTION_PLAIN = 0,      /**< [name] */
    PTPCONF_SECTION_DEVICE,         /**< [<name>] */
    PTPCONF_SECTION_EXTERNAL_SOURCE /**< [{name}] */
} ptpconf_section_kind_t;

typedef struct {
    char* header;                /**< Verbatim header, e.g. "[<synce1>]" */
    char* name;                  /**< Header without delimiters, e.g. "synce1" */
    ptpconf_section_kind_t kind; /**< Header shape */
    ptpconf_options_t options;   /**< Options in source order */
} ptpconf_section_t;

/**
 * @brief Clock role of the node, derived from slave-facing option lines.
 */
typedef enum {
    PTPCONF_CLOCK_GM = 0, /**< Grandmaster: no slave-facing port */
    PTPCONF_CLOCK_BC,     /**< Boundary clock: slave port plus two or more sections besides global */
    PTPCONF_CLOCK_OC      /**< Ordinary clock: single slave port */
} ptpconf_clock_role_t;

typedef struct {
    ptpconf_section_t* sections; /**< Heap array in source order */
    int count;                   /**< Number of sections */
    int capacity;                /**< Allocated capacity */
    ptpconf_clock_role_t clock_role;
    char profile_name[64]; /**< Written into the rendered header line */
} ptpconf_conf_t;

void ptpconf_conf_init(ptpconf_conf_t* conf);
void ptpconf_conf_free(ptpconf_conf_t* conf);

/**
 * @brief Parse configuration text.
 *
 * `out` is freed and re-initialized first. On success it holds every section
 * in source order with exactly one "[global]" section (appended empty when the
 * text has none) and the derived clock role.
 *
 * @param text Configuration text; NULL or empty yields a lone "[global]".
 * @param out  Receives the document.
 * @param err  Optional error detail (MalformedSection, OptionOutsideSection).
 * @return 0 on success, -1 on failure (`out` left empty).
 */
int ptpconf_conf_parse(const char* text, ptpconf_conf_t* out, ptpconf_error_t* err);

/** @brief Set the profile name used by the renderers (truncated to fit, with a warning). */
void ptpconf_conf_set_profile_name(ptpconf_conf_t* conf, const char* name);

/** @brief First section whose verbatim header equals `header`, or NULL. */
const ptpconf_section_t* ptpconf_conf_find_section(const ptpconf_conf_t* conf, const char* header);

/** @brief Number of sections of the given kind. */
int ptpconf_conf_count_kind(const ptpconf_conf_t* conf, ptpconf_section_kind_t kind);

/** @brief "GM", "BC" or "OC". */
const char* ptpconf_clock_role_str(ptpconf_clock_role_t role);

/** @brief Classify a header by its opening delimiters. */
ptpconf_section_kind_t ptpconf_section_kind_of(const char* header);

/**
 * @brief Strip `< > [ ] { }` and spaces from a header.
 *
 * @return 0 on success, -1 if the result was truncated.
 */
int ptpconf_section_strip_name(const char* header, char* out, size_t out_size);

#ifdef __cplusplus
}
#endif

#endif /* PTPCONF_CORE_CONF_H */
