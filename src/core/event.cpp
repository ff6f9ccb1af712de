// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

#include <ptpconf/core/event.h>
#include <ptpconf/core/value.h>

ptpconf_event_source_t
ptpconf_resolve_source(const char* flag) {
    int is_master = 0;
    if (ptpconf_parse_bool(flag, &is_master) == 0 && is_master) {
        return PTPCONF_SOURCE_GNSS;
    }
    return PTPCONF_SOURCE_PPS;
}

const char*
ptpconf_event_source_str(ptpconf_event_source_t src) {
    return src == PTPCONF_SOURCE_GNSS ? "GNSS" : "PPS";
}
