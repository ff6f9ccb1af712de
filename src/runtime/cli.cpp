// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Copyright (C) 2025 by arancormonk <180709949+arancormonk@users.noreply.github.com>
 */

/*
 * ptpconf-render: parse a ptp4l/ts2phc/synce4l configuration file and print
 * the rendered configuration together with the derived topology.
 */

#include <ptpconf/core/render.h>
#include <ptpconf/runtime/cli.h>
#include <ptpconf/runtime/conf_update.h>
#include <ptpconf/runtime/config.h>
#include <ptpconf/runtime/log.h>
#include <ptpconf/synce/relations.h>

#include <stdio.h>
#include <string.h>
#include <unistd.h>

void
ptpconf_cli_usage(FILE* fp, const char* prog) {
    fprintf(fp,
            "Usage: %s [-s] [-p profile] [-c clockId[iface]=id]... [-v] [file]\n"
            "  -s         render as synce4l configuration (inject clock_id per device)\n"
            "  -p name    profile name for the #profile header (env PTPCONF_PROFILE)\n"
            "  -c k=v     add a settings entry, e.g. -c clockId[eth0]=0x507c6fffff1fb1b8\n"
            "  -v         debug logging\n"
            "  file       configuration file (default: PTPCONF_PTP4L_CONF or %s)\n",
            prog, PTPCONF_DEFAULT_PTP4L_CONF);
}

int
ptpconf_cli_add_setting(ptpconf_options_t* settings, const char* arg) {
    if (!settings || !arg) {
        return -1;
    }
    const char* eq = strchr(arg, '=');
    if (!eq || eq == arg) {
        LOG_ERROR("Invalid setting '%s' (expected key=value)\n", arg);
        return -1;
    }
    size_t klen = (size_t)(eq - arg);
    char key[256];
    if (klen >= sizeof key) {
        LOG_ERROR("Setting key too long: %s\n", arg);
        return -1;
    }
    memcpy(key, arg, klen);
    key[klen] = '\0';
    return ptpconf_options_set(settings, key, eq + 1);
}

static void
print_ifaces(FILE* out, const ptpconf_ifaces_t* ifaces) {
    for (int i = 0; i < ifaces->count; i++) {
        const ptpconf_iface_t* it = &ifaces->items[i];
        fprintf(out, "#iface: %s source=%s master=%d\n", it->name, ptpconf_event_source_str(it->source),
                it->is_master);
    }
}

static void
print_relations(FILE* out, const ptpconf_synce_relations_t* rel) {
    for (int i = 0; i < rel->count; i++) {
        const ptpconf_synce_config_t* d = &rel->devices[i];
        fprintf(out, "#device: %s clock_id=%s network_option=%d extended_tlv=%d external_source=%s ports=", d->name,
                d->clock_id ? d->clock_id : "-", d->network_option, d->extended_tlv,
                d->external_source ? d->external_source : "-");
        for (int j = 0; j < d->iface_count; j++) {
            fprintf(out, "%s%s", j ? "," : "", d->ifaces[j]);
        }
        fprintf(out, "\n");
    }
}

/* Load, apply and render one file; returns 0 on success. */
static int
render_file(const char* path, const char* profile, int synce, const ptpconf_options_t* settings, FILE* out) {
    ptpconf_error_t err;
    ptpconf_conf_update_t upd;
    if (ptpconf_conf_update_init(&upd, path, &err) != 0) {
        fprintf(stderr, "%s: %s\n", ptpconf_status_str(err.code), err.message);
        return -1;
    }

    ptpconf_conf_t conf;
    ptpconf_conf_init(&conf);
    if (ptpconf_conf_update_apply(&upd, profile, NULL, &conf, &err) < 0) {
        fprintf(stderr, "%s: line %d: %s\n", ptpconf_status_str(err.code), err.line_number, err.message);
        ptpconf_conf_update_free(&upd);
        return -1;
    }

    ptpconf_render_t rendered;
    ptpconf_render_init(&rendered);
    ptpconf_synce_relations_t rel;
    ptpconf_synce_relations_init(&rel);

    int rc = synce ? ptpconf_render_synce4l(&conf, settings, &rendered, &rel, &err)
                   : ptpconf_render_ptp4l(&conf, &rendered, &err);
    if (rc != 0) {
        fprintf(stderr, "%s: %s\n", ptpconf_status_str(err.code), err.message);
    } else {
        fprintf(out, "%s\n", rendered.text);
        fprintf(out, "#clock_role: %s\n", ptpconf_clock_role_str(conf.clock_role));
        print_ifaces(out, &rendered.ifaces);
        print_relations(out, &rel);
    }

    ptpconf_synce_relations_free(&rel);
    ptpconf_render_free(&rendered);
    ptpconf_conf_free(&conf);
    ptpconf_conf_update_free(&upd);
    return rc;
}

int
ptpconf_cli_run(int argc, char** argv, FILE* out) {
    const ptpconfRuntimeConfig* cfg = ptpconf_get_config();
    const char* prog = argc > 0 && argv[0] ? argv[0] : "ptpconf-render";

    int synce = 0;
    const char* profile = cfg->profile_name;
    ptpconf_options_t settings;
    ptpconf_options_init(&settings);

    /* allow repeated runs in one process */
#ifdef __GLIBC__
    optind = 0;
#else
    optind = 1;
#endif
    int c;
    while ((c = getopt(argc, argv, "sp:c:vh")) != -1) {
        switch (c) {
            case 's': synce = 1; break;
            case 'p': profile = optarg; break;
            case 'c':
                if (ptpconf_cli_add_setting(&settings, optarg) != 0) {
                    ptpconf_options_free(&settings);
                    return PTPCONF_EXIT_ERROR;
                }
                break;
            case 'v': ptpconf_log_set_level(LOG_LEVEL_DEBUG); break;
            case 'h':
                ptpconf_cli_usage(out, prog);
                ptpconf_options_free(&settings);
                return PTPCONF_EXIT_OK;
            default:
                ptpconf_cli_usage(stderr, prog);
                ptpconf_options_free(&settings);
                return PTPCONF_EXIT_ERROR;
        }
    }
    const char* path = optind < argc ? argv[optind] : NULL;

    int rc = render_file(path, profile, synce, &settings, out);
    ptpconf_options_free(&settings);
    return rc == 0 ? PTPCONF_EXIT_OK : PTPCONF_EXIT_ERROR;
}
