// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * Unit tests for scalar value parsing and event source resolution.
 */

#include <stdio.h>
#include <string.h>

#include <ptpconf/core/event.h>
#include <ptpconf/core/value.h>

static int
test_resolve_source(void) {
    struct {
        const char* flag;
        ptpconf_event_source_t want;
    } cases[] = {
        {"true", PTPCONF_SOURCE_GNSS}, {"1", PTPCONF_SOURCE_GNSS},     {" True ", PTPCONF_SOURCE_GNSS},
        {"t", PTPCONF_SOURCE_GNSS},    {"false", PTPCONF_SOURCE_PPS},  {"0", PTPCONF_SOURCE_PPS},
        {"yes", PTPCONF_SOURCE_PPS},   {"garbage", PTPCONF_SOURCE_PPS}, {"", PTPCONF_SOURCE_PPS},
        {NULL, PTPCONF_SOURCE_PPS},
    };
    int rc = 0;
    for (size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); i++) {
        ptpconf_event_source_t got = ptpconf_resolve_source(cases[i].flag);
        if (got != cases[i].want) {
            fprintf(stderr, "FAIL: resolve_source('%s') = %s, expected %s\n", cases[i].flag ? cases[i].flag : "(null)",
                    ptpconf_event_source_str(got), ptpconf_event_source_str(cases[i].want));
            rc |= 1;
        }
    }
    return rc;
}

static int
test_parse_bool(void) {
    int rc = 0;
    const char* truthy[] = {"1", "t", "T", "TRUE", "true", "True"};
    const char* falsy[] = {"0", "f", "F", "FALSE", "false", "False"};
    for (size_t i = 0; i < 6; i++) {
        int v = -1;
        if (ptpconf_parse_bool(truthy[i], &v) != 0 || v != 1) {
            fprintf(stderr, "FAIL: parse_bool('%s') should be true\n", truthy[i]);
            rc |= 1;
        }
        v = -1;
        if (ptpconf_parse_bool(falsy[i], &v) != 0 || v != 0) {
            fprintf(stderr, "FAIL: parse_bool('%s') should be false\n", falsy[i]);
            rc |= 1;
        }
    }
    const char* bad[] = {"", "yes", "no", "tRUE", "2", "on"};
    for (size_t i = 0; i < 6; i++) {
        int v = 7;
        if (ptpconf_parse_bool(bad[i], &v) == 0) {
            fprintf(stderr, "FAIL: parse_bool('%s') should fail\n", bad[i]);
            rc |= 1;
        }
        if (v != 7) {
            fprintf(stderr, "FAIL: parse_bool('%s') modified output on failure\n", bad[i]);
            rc |= 1;
        }
    }
    return rc;
}

static int
test_parse_int(void) {
    int rc = 0;
    struct {
        const char* s;
        int want;
    } good[] = {{"2", 2}, {" 1 ", 1}, {"-4", -4}, {"+7", 7}, {"0", 0}, {"2147483647", 2147483647}};
    for (size_t i = 0; i < sizeof(good) / sizeof(good[0]); i++) {
        int v = -99;
        if (ptpconf_parse_int(good[i].s, &v) != 0 || v != good[i].want) {
            fprintf(stderr, "FAIL: parse_int('%s') = %d, expected %d\n", good[i].s, v, good[i].want);
            rc |= 1;
        }
    }
    const char* bad[] = {"", "abc", "2x", "- 1", "+", "1.5", "99999999999", "0x10"};
    for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); i++) {
        int v = 0;
        if (ptpconf_parse_int(bad[i], &v) == 0) {
            fprintf(stderr, "FAIL: parse_int('%s') should fail (got %d)\n", bad[i], v);
            rc |= 1;
        }
    }
    return rc;
}

static int
test_trim_copy(void) {
    int rc = 0;
    char buf[8];
    if (ptpconf_trim_copy(buf, sizeof buf, "  eth0 \t") != 0 || strcmp(buf, "eth0") != 0) {
        fprintf(stderr, "FAIL: trim_copy gave '%s'\n", buf);
        rc |= 1;
    }
    if (ptpconf_trim_copy(buf, sizeof buf, "0123456789") == 0 || strlen(buf) != sizeof buf - 1) {
        fprintf(stderr, "FAIL: trim_copy should truncate and report\n");
        rc |= 1;
    }
    return rc;
}

int
main(void) {
    int rc = 0;
    rc |= test_resolve_source();
    rc |= test_parse_bool();
    rc |= test_parse_int();
    rc |= test_trim_copy();
    if (rc == 0) {
        printf("All event_source tests passed\n");
    }
    return rc;
}
