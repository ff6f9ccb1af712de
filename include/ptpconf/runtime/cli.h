// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/**
 * @file
 * @brief Command-line surface of ptpconf-render.
 *
 *   ptpconf-render [-s] [-p profile] [-c clockId[iface]=id]... [-v] [file]
 */
#pragma once

#include <ptpconf/core/conf.h>
#include <stdio.h>

#ifdef __cplusplus
extern "C" {
#endif

/** Exit statuses returned by ptpconf_cli_run. */
#define PTPCONF_EXIT_OK    0
#define PTPCONF_EXIT_ERROR 1

/**
 * @brief Parse a `key=value` argument into the settings mapping.
 *
 * @param settings Settings mapping to extend (repeated keys replace).
 * @param arg      Argument text; the key must be non-empty.
 * @return 0 on success, -1 on a malformed argument or allocation failure.
 */
int ptpconf_cli_add_setting(ptpconf_options_t* settings, const char* arg);

/** @brief Print the usage text for `prog` to `fp`. */
void ptpconf_cli_usage(FILE* fp, const char* prog);

/**
 * @brief Run ptpconf-render: parse arguments, load, apply and render.
 *
 * The rendered text, clock role, interface list and SyncE devices are
 * written to `out`; diagnostics go to stderr. The file defaults to the
 * runtime config path and the profile name to the runtime profile.
 *
 * @param argc Argument count.
 * @param argv Argument vector (may be permuted by getopt).
 * @param out  Output stream for the rendered result.
 * @return PTPCONF_EXIT_OK on success (and for -h), PTPCONF_EXIT_ERROR on any
 *         fatal error.
 */
int ptpconf_cli_run(int argc, char** argv, FILE* out);

#ifdef __cplusplus
}
#endif
