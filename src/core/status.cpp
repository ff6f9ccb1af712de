// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * Status names and error record helpers.
 */

#include <ptpconf/core/status.h>

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

const char*
ptpconf_status_str(ptpconf_status_t code) {
    switch (code) {
        case PTPCONF_OK: return "OK";
        case PTPCONF_ERR_MALFORMED_SECTION: return "MalformedSection";
        case PTPCONF_ERR_OPTION_OUTSIDE_SECTION: return "OptionOutsideSection";
        case PTPCONF_ERR_INTEGER_PARSE: return "IntegerParse";
        case PTPCONF_ERR_BOOLEAN_PARSE: return "BooleanParse";
        case PTPCONF_ERR_STRUCTURE_MISMATCH: return "StructuralMismatch";
        case PTPCONF_ERR_IO: return "IO";
        case PTPCONF_ERR_NOMEM: return "NoMemory";
        case PTPCONF_ERR_INVALID_ARG: return "InvalidArgument";
    }
    return "Unknown";
}

void
ptpconf_error_clear(ptpconf_error_t* err) {
    if (!err) {
        return;
    }
    err->code = PTPCONF_OK;
    err->line_number = 0;
    err->message[0] = '\0';
}

void
ptpconf_error_set(ptpconf_error_t* err, ptpconf_status_t code, int line, const char* format, ...) {
    if (!err) {
        return;
    }
    err->code = code;
    err->line_number = line;
    err->message[0] = '\0';
    if (!format) {
        return;
    }
    va_list args;
    va_start(args, format);
    vsnprintf(err->message, sizeof err->message, format, args);
    va_end(args);
    err->message[sizeof err->message - 1] = '\0';
}
