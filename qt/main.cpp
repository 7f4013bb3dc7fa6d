/*
 * Qt frontend for Dissect
 */

#include <QApplication>
#include <cstdio>
#include <cstring>
#include <cstdlib>

#include "MainWindow.h"

#include "cmd.hpp"
#include "session.hpp"

/* Usage */
static void usage(const char *prog) {
    fprintf(stderr,
        "Usage: %s [options] [image]\n"
        "       %s --cmd \"command\" [--port N]\n"
        "\n"
        "Options:\n"
        "  --arch NAME         x86_64, arm, aarch64, riscv64, mips\n"
        "  --base ADDR         Load address in hex (default: 0)\n"
        "  --entry ADDR        Entry point in hex (default: base)\n"
        "  --big-endian        Big-endian instruction words (arm, mips)\n"
        "  --debug FILE        Debug JSON (default: <image>.dbg.json)\n"
        "  --workers N         Sweep worker threads (default: all cores)\n"
        "  --port N            TCP command port (default: 2783)\n"
        "  --no-server         Do not listen for commands\n"
        "  --cmd \"command\"     Send command to running instance and exit\n"
        "\n"
        "The image can also be opened from the File menu.\n"
        "\n", prog, prog);
}

int main(int argc, char **argv) {
    const char *image_path = nullptr;
    int port = cmd::DEFAULT_PORT;
    bool serve = true;

    /* Pre-parse for --cmd (before QApplication, which modifies argv) */
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--cmd") == 0 && i + 1 < argc) {
            const char *cmd_str = argv[i + 1];
            for (int j = 1; j < argc; j++) {
                if (strcmp(argv[j], "--port") == 0 && j + 1 < argc)
                    port = atoi(argv[j + 1]);
            }
            return cmd::client(cmd_str, port);
        }
    }

    QApplication app(argc, argv);

    session::LoadOptions opts;
    opts.raw.machine = arch::Machine::X86_64;
    proc::ProcessorConfig cfg;

    /* Parse remaining args */
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--arch") == 0 && i + 1 < argc) {
            const arch::Arch *a = arch::arch_by_name(argv[++i]);
            if (!a) {
                fprintf(stderr, "Unknown architecture: %s\n", argv[i]);
                return 1;
            }
            opts.raw.machine = a->machine;
        } else if (strcmp(argv[i], "--base") == 0 && i + 1 < argc) {
            opts.raw.base = strtoull(argv[++i], nullptr, 16);
        } else if (strcmp(argv[i], "--entry") == 0 && i + 1 < argc) {
            opts.raw.entry = strtoull(argv[++i], nullptr, 16);
        } else if (strcmp(argv[i], "--big-endian") == 0) {
            opts.raw.big_endian = true;
        } else if (strcmp(argv[i], "--debug") == 0 && i + 1 < argc) {
            opts.debug_path = argv[++i];
        } else if (strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            cfg.workers = (unsigned)atoi(argv[++i]);
        } else if (strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port = atoi(argv[++i]);
        } else if (strcmp(argv[i], "--no-server") == 0) {
            serve = false;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else if (!image_path) {
            image_path = argv[i];
        }
    }

    session::Session ses(cfg);
    cmd::Console console(ses, opts);

    auto *win = new MainWindow(ses, console);

    if (serve && cmd::server_init(port) >= 0)
        win->serveCommands();

    win->show();

    if (image_path) {
        opts.path = image_path;
        win->startLoad(opts);
    }

    int ret = app.exec();

    delete win;
    if (serve)
        cmd::server_shutdown();
    return ret;
}
