// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * Strict scalar parsers shared by the renderers and the SyncE extractor.
 */

#include <ptpconf/core/value.h>

#include <ctype.h>
#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>

int
ptpconf_trim_copy(char* dst, size_t dst_size, const char* src) {
    if (!dst || dst_size == 0) {
        return -1;
    }
    dst[0] = '\0';
    if (!src) {
        return 0;
    }
    while (*src && isspace((unsigned char)*src)) {
        src++;
    }
    size_t n = strlen(src);
    while (n > 0 && isspace((unsigned char)src[n - 1])) {
        n--;
    }
    int rc = 0;
    if (n >= dst_size) {
        n = dst_size - 1;
        rc = -1;
    }
    memcpy(dst, src, n);
    dst[n] = '\0';
    return rc;
}

int
ptpconf_parse_bool(const char* v, int* out) {
    char buf[16];
    if (!v || !out || ptpconf_trim_copy(buf, sizeof buf, v) != 0) {
        return -1;
    }
    static const char* const truthy[] = {"1", "t", "T", "TRUE", "true", "True", NULL};
    static const char* const falsy[] = {"0", "f", "F", "FALSE", "false", "False", NULL};
    for (int i = 0; truthy[i]; i++) {
        if (strcmp(buf, truthy[i]) == 0) {
            *out = 1;
            return 0;
        }
    }
    for (int i = 0; falsy[i]; i++) {
        if (strcmp(buf, falsy[i]) == 0) {
            *out = 0;
            return 0;
        }
    }
    return -1;
}

int
ptpconf_parse_int(const char* v, int* out) {
    char buf[32];
    if (!v || !out || ptpconf_trim_copy(buf, sizeof buf, v) != 0 || buf[0] == '\0') {
        return -1;
    }
    /* strtol would skip blanks after a sign */
    if ((buf[0] == '+' || buf[0] == '-') && !isdigit((unsigned char)buf[1])) {
        return -1;
    }
    errno = 0;
    char* end = NULL;
    long x = strtol(buf, &end, 10);
    if (end == buf || *end != '\0' || errno == ERANGE || x < INT_MIN || x > INT_MAX) {
        return -1;
    }
    *out = (int)x;
    return 0;
}
