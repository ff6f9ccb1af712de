// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * Unit tests for synce4l rendering with clock id injection.
 */

#include <stdio.h>
#include <string.h>

#include <ptpconf/core/conf.h>
#include <ptpconf/core/render.h>
#include <ptpconf/runtime/log.h>
#include <ptpconf/synce/relations.h>

static int
render_synce(const char* text, const ptpconf_options_t* settings, ptpconf_render_t* out,
             ptpconf_synce_relations_t* rel, ptpconf_error_t* err) {
    ptpconf_conf_t conf;
    ptpconf_conf_init(&conf);
    if (ptpconf_conf_parse(text, &conf, err) != 0) {
        fprintf(stderr, "FAIL: parse failed\n");
        return -2;
    }
    ptpconf_conf_set_profile_name(&conf, "synce");
    int r = ptpconf_render_synce4l(&conf, settings, out, rel, err);
    ptpconf_conf_free(&conf);
    return r;
}

static int
test_clock_id_injected_per_device(void) {
    static const char* text = "[global]\n"
                              "logging_level 7\n"
                              "[<synce1>]\n"
                              "network_option 2\n"
                              "[ens7f0]\n"
                              "[<synce2>]\n"
                              "[ens8f0]\n";
    ptpconf_options_t settings;
    ptpconf_options_init(&settings);
    (void)ptpconf_options_set(&settings, "clockId[ens7f0]", "0x1111");
    (void)ptpconf_options_set(&settings, "clockId[ens8f0]", "0x2222");

    ptpconf_render_t out;
    ptpconf_render_init(&out);
    ptpconf_synce_relations_t rel;
    ptpconf_synce_relations_init(&rel);
    ptpconf_error_t err;
    int rc = 0;
    if (render_synce(text, &settings, &out, &rel, &err) != 0) {
        fprintf(stderr, "FAIL: render failed: %s\n", err.message);
        rc = 1;
    } else {
        static const char* want = "#profile: synce\n"
                                  "\n[global]"
                                  "\nlogging_level 7"
                                  "\n[<synce1>]"
                                  "\nnetwork_option 2"
                                  "\nclock_id 0x1111"
                                  "\n[ens7f0]"
                                  "\n[<synce2>]"
                                  "\nclock_id 0x2222"
                                  "\n[ens8f0]";
        if (strcmp(out.text, want) != 0) {
            fprintf(stderr, "FAIL: rendered text mismatch:\n%s\n--- expected ---\n%s\n", out.text, want);
            rc = 1;
        }
        if (rel.count != 2 || strcmp(rel.devices[1].clock_id, "0x2222") != 0) {
            fprintf(stderr, "FAIL: relations should carry the assigned ids\n");
            rc = 1;
        }
        if (out.ifaces.count != 0) {
            fprintf(stderr, "FAIL: synce rendering does not collect interfaces\n");
            rc = 1;
        }
    }
    ptpconf_synce_relations_free(&rel);
    ptpconf_render_free(&out);
    ptpconf_options_free(&settings);
    return rc;
}

static int
test_existing_clock_id_kept_and_alignment(void) {
    static const char* text = "[<a>]\n"
                              "clock_id 0xown\n"
                              "[eth0]\n"
                              "[<b>]\n"
                              "[eth1]\n";
    ptpconf_options_t settings;
    ptpconf_options_init(&settings);
    (void)ptpconf_options_set(&settings, "clockId[eth0]", "0xfromsettings0");
    (void)ptpconf_options_set(&settings, "clockId[eth1]", "0xfromsettings1");

    ptpconf_render_t out;
    ptpconf_render_init(&out);
    ptpconf_synce_relations_t rel;
    ptpconf_synce_relations_init(&rel);
    int rc = 0;
    if (render_synce(text, &settings, &out, &rel, NULL) != 0) {
        fprintf(stderr, "FAIL: render failed\n");
        rc = 1;
    } else {
        if (strstr(out.text, "0xfromsettings0") != NULL) {
            fprintf(stderr, "FAIL: existing clock_id was overwritten\n");
            rc = 1;
        }
        if (strstr(out.text, "\n[<b>]\nclock_id 0xfromsettings1\n[eth1]") == NULL) {
            fprintf(stderr, "FAIL: device b should get its own id:\n%s\n", out.text);
            rc = 1;
        }
        const char* first = strstr(out.text, "clock_id");
        if (!first || strncmp(first, "clock_id 0xown", 14) != 0) {
            fprintf(stderr, "FAIL: device a keeps its own clock_id\n");
            rc = 1;
        }
    }
    ptpconf_synce_relations_free(&rel);
    ptpconf_render_free(&out);
    ptpconf_options_free(&settings);
    return rc;
}

static int
test_missing_id_not_injected(void) {
    ptpconf_render_t out;
    ptpconf_render_init(&out);
    ptpconf_synce_relations_t rel;
    ptpconf_synce_relations_init(&rel);
    int rc = 0;
    if (render_synce("[<a>]\n[eth0]\n", NULL, &out, &rel, NULL) != 0) {
        fprintf(stderr, "FAIL: render without settings failed\n");
        rc = 1;
    } else if (strstr(out.text, "clock_id") != NULL) {
        fprintf(stderr, "FAIL: no clock_id line expected without an id\n");
        rc = 1;
    }
    ptpconf_synce_relations_free(&rel);
    ptpconf_render_free(&out);
    return rc;
}

static int
test_device_count_mismatch(void) {
    ptpconf_render_t out;
    ptpconf_render_init(&out);
    ptpconf_synce_relations_t rel;
    ptpconf_synce_relations_init(&rel);
    ptpconf_error_t err;
    int rc = 0;
    if (render_synce("[<>]\n[eth0]\n[<b>]\n[eth1]\n", NULL, &out, &rel, &err) == 0) {
        fprintf(stderr, "FAIL: unnamed device section should fail rendering\n");
        rc = 1;
    } else if (err.code != PTPCONF_ERR_STRUCTURE_MISMATCH) {
        fprintf(stderr, "FAIL: expected StructuralMismatch, got %s\n", ptpconf_status_str(err.code));
        rc = 1;
    }
    if (out.text != NULL || rel.count != 0) {
        fprintf(stderr, "FAIL: failed render must not leave output behind\n");
        rc = 1;
    }
    ptpconf_synce_relations_free(&rel);
    ptpconf_render_free(&out);
    return rc;
}

int
main(void) {
    /* the mismatch case logs at error level */
    ptpconf_log_set_level(LOG_LEVEL_ERROR);

    int rc = 0;
    rc |= test_clock_id_injected_per_device();
    rc |= test_existing_clock_id_kept_and_alignment();
    rc |= test_missing_id_not_injected();
    rc |= test_device_count_mismatch();
    if (rc == 0) {
        printf("All render_synce4l tests passed\n");
    }
    return rc;
}
