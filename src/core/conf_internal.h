// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * Private helpers shared by the configuration model implementation units.
 */

#pragma once

#include <ptpconf/core/conf.h>

void conf_section_init(ptpconf_section_t* sec);
int conf_section_open(ptpconf_section_t* sec, const char* header, size_t header_len);
void conf_section_free(ptpconf_section_t* sec);

/* Moves `sec` into `conf`; `sec` is re-initialized on success. */
int conf_append_section(ptpconf_conf_t* conf, ptpconf_section_t* sec);
