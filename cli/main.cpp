/*
 * main.cpp: Headless frontend
 *
 * Loads a raw image, then either prints a listing (--list N), serves
 * commands over TCP (--port), or reads commands from stdin and writes
 * one JSON reply per line to stdout.
 */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "cmd.hpp"
#include "session.hpp"

/* ========================================================================
 * Usage
 * ======================================================================== */

static void usage(const char *prog) {
    fprintf(stderr,
        "Usage: %s [options] <image>\n"
        "       %s --cmd \"command\" [--port N]\n"
        "\n"
        "Options:\n"
        "  --arch NAME         x86_64, arm, aarch64, riscv64, mips\n"
        "  --base ADDR         Load address in hex (default: 0)\n"
        "  --entry ADDR        Entry point in hex (default: base)\n"
        "  --big-endian        Big-endian instruction words (arm, mips)\n"
        "  --debug FILE        Debug JSON (default: <image>.dbg.json)\n"
        "  --workers N         Sweep worker threads (default: all cores)\n"
        "  --follow-pointers   Seed targets of jumps through code pointers\n"
        "  --discard-overlap   Drop colliding runs instead of marking them\n"
        "  --sweep-past-jumps  Keep decoding after a jump to undiscovered code\n"
        "  --list N            Print N listing rows from the entry and exit\n"
        "  --port N            Serve commands on TCP port N\n"
        "  --cmd \"command\"     Send command to running instance and exit\n"
        "\n", prog, prog);
}

static void print_rows(const std::vector<scroll::Row> &rows)
{
    for (auto &r : rows) {
        if (r.kind == scroll::RowKind::LABEL || r.kind == scroll::RowKind::SECTION) {
            printf("\n%s\n", r.text().c_str());
            continue;
        }
        std::string text = r.text();
        if (r.location && r.location->line)
            printf("%-60s ; %s:%u\n", text.c_str(),
                   r.location->file.c_str(), r.location->line);
        else
            printf("%s\n", text.c_str());
    }
}

/* ========================================================================
 * Main
 * ======================================================================== */

int main(int argc, char **argv) {
    const char *image_path = NULL;
    const char *cmd_str    = NULL;
    int port = -1;
    long list_rows = -1;

    session::LoadOptions opts;
    proc::ProcessorConfig cfg;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--arch") == 0 && i + 1 < argc) {
            const arch::Arch *a = arch::arch_by_name(argv[++i]);
            if (!a) {
                fprintf(stderr, "Unknown architecture: %s\n", argv[i]);
                return 1;
            }
            opts.raw.machine = a->machine;
        } else if (strcmp(argv[i], "--base") == 0 && i + 1 < argc) {
            opts.raw.base = strtoull(argv[++i], NULL, 16);
        } else if (strcmp(argv[i], "--entry") == 0 && i + 1 < argc) {
            opts.raw.entry = strtoull(argv[++i], NULL, 16);
        } else if (strcmp(argv[i], "--big-endian") == 0) {
            opts.raw.big_endian = true;
        } else if (strcmp(argv[i], "--debug") == 0 && i + 1 < argc) {
            opts.debug_path = argv[++i];
        } else if (strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            cfg.workers = (unsigned)atoi(argv[++i]);
        } else if (strcmp(argv[i], "--follow-pointers") == 0) {
            cfg.indirect = proc::IndirectPolicy::FOLLOW_POINTERS;
        } else if (strcmp(argv[i], "--discard-overlap") == 0) {
            cfg.overlap = proc::OverlapPolicy::DISCARD_RUN;
        } else if (strcmp(argv[i], "--sweep-past-jumps") == 0) {
            cfg.sweep_past_branch = true;
        } else if (strcmp(argv[i], "--list") == 0 && i + 1 < argc) {
            list_rows = atol(argv[++i]);
        } else if (strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port = atoi(argv[++i]);
        } else if (strcmp(argv[i], "--cmd") == 0 && i + 1 < argc) {
            cmd_str = argv[++i];
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else if (!image_path && argv[i][0] != '-') {
            image_path = argv[i];
        } else {
            fprintf(stderr, "Unknown argument: %s\n", argv[i]);
            usage(argv[0]);
            return 1;
        }
    }

    /* Client mode */
    if (cmd_str)
        return cmd::client(cmd_str, port > 0 ? port : cmd::DEFAULT_PORT);

    session::Session ses(cfg);
    cmd::Console console(ses, opts);

    if (image_path) {
        opts.path = image_path;
        session::LoadStatus st = ses.load_file(opts);
        if (!st.ok()) {
            fprintf(stderr, "[dissect] Cannot load %s: %s\n", image_path, st.message.c_str());
            return 1;
        }
    }

    if (list_rows >= 0) {
        auto *view = console.view();
        if (!view) {
            usage(argv[0]);
            return 1;
        }
        print_rows(view->extend(scroll::Direction::FORWARD, (size_t)list_rows));
        return 0;
    }

    if (port > 0) {
        if (cmd::server_init(port) < 0)
            return 1;
        while (console.running())
            cmd::check_socket_commands(console, 100);
        cmd::server_shutdown();
        return 0;
    }

    char line[4096];
    while (console.running() && fgets(line, sizeof(line), stdin))
        cmd::process_command(console, line, stdout);
    return 0;
}
