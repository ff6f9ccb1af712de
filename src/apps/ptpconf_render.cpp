// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#include <ptpconf/runtime/cli.h>
#include <ptpconf/runtime/config.h>

#include <stdio.h>

int
main(int argc, char** argv) {
    ptpconf_config_init();
    return ptpconf_cli_run(argc, argv, stdout);
}
