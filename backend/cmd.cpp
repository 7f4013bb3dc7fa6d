/*
 * cmd.cpp: TCP command server, client, and command processing
 *
 * Server: listens on a TCP port, accepts one-shot connections,
 *         reads a command line, passes it to process_command,
 *         writes the JSON response, and closes the connection.
 *
 * Client: connects to a running instance, sends one command,
 *         prints the JSON response, and exits.
 */

#include <stdio.h>
#include <stdlib.h>
#include <stdarg.h>
#include <stdint.h>
#include <string.h>
#include <strings.h>
#include <ctype.h>
#include <unistd.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>

#include <algorithm>
#include <cinttypes>
#include <string>
#include <vector>

#include "cmd.hpp"

#define CMD_BUF_SIZE 4096

namespace cmd {

/* ========================================================================
 * TCP command server
 * ======================================================================== */

static int listen_fd = -1;

int server_init(int port)
{
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        perror("[dissect] socket");
        return -1;
    }

    int opt = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (bind(fd, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
        perror("[dissect] bind");
        close(fd);
        return -1;
    }

    if (listen(fd, 4) < 0) {
        perror("[dissect] listen");
        close(fd);
        return -1;
    }

    fprintf(stderr, "[dissect] Listening on port %d\n", port);
    listen_fd = fd;
    return fd;
}

void check_socket_commands(Console &console, int timeout_ms)
{
    if (listen_fd < 0) return;

    struct pollfd pfd = {};
    pfd.fd = listen_fd;
    pfd.events = POLLIN;
    while (poll(&pfd, 1, timeout_ms) > 0 && (pfd.revents & POLLIN)) {
        timeout_ms = 0;
        int client_fd = accept(listen_fd, NULL, NULL);
        if (client_fd < 0) return;

        /* Read timeout so a stuck client can't block the loop */
        struct timeval tv = { .tv_sec = 2, .tv_usec = 0 };
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        char cmd_buf[CMD_BUF_SIZE];
        size_t pos = 0;
        while (pos < CMD_BUF_SIZE - 1) {
            ssize_t n = read(client_fd, &cmd_buf[pos], 1);
            if (n <= 0) break;
            if (cmd_buf[pos] == '\n') break;
            pos++;
        }
        cmd_buf[pos] = '\0';

        FILE *client_file = fdopen(dup(client_fd), "w");
        if (client_file) {
            process_command(console, cmd_buf, client_file);
            fflush(client_file);
            fclose(client_file);
        } else {
            perror("[dissect] fdopen");
        }

        close(client_fd);
    }
}

void server_shutdown()
{
    if (listen_fd >= 0) {
        close(listen_fd);
        listen_fd = -1;
    }
}

/* ========================================================================
 * TCP command client
 * ======================================================================== */

bool request(const char *cmd_str, int port, std::string &reply)
{
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) { perror("socket"); return false; }

    struct sockaddr_in addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons((uint16_t)port);
    inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);

    if (connect(fd, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
        perror("connect");
        close(fd);
        return false;
    }

    dprintf(fd, "%s\n", cmd_str);

    reply.clear();
    char buf[CMD_BUF_SIZE];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n <= 0) break;
        reply.append(buf, (size_t)n);
    }
    close(fd);
    return true;
}

int client(const char *cmd_str, int port)
{
    std::string reply;
    if (!request(cmd_str, port, reply)) return 1;

    /* Strip trailing newline(s) for clean output */
    while (!reply.empty() && reply.back() == '\n') reply.pop_back();
    printf("%s\n", reply.c_str());
    return 0;
}

/* ========================================================================
 * Utility: JSON output (to a FILE*)
 * ======================================================================== */

static void json_ok_f(FILE *out, const char *fmt, ...)
{
    va_list ap;
    fprintf(out, "{\"ok\":true");
    if (fmt) {
        fprintf(out, ",");
        va_start(ap, fmt);
        vfprintf(out, fmt, ap);
        va_end(ap);
    }
    fprintf(out, "}\n");
    fflush(out);
}

/* Quoted, escaped JSON string */
static std::string json_str(const std::string &s)
{
    std::string out = "\"";
    char buf[8];
    for (char c : s) {
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n";  break;
        case '\r': out += "\\r";  break;
        case '\t': out += "\\t";  break;
        default:
            if ((unsigned char)c < 0x20) {
                snprintf(buf, sizeof(buf), "\\u%04x", (unsigned char)c);
                out += buf;
            } else {
                out += c;
            }
            break;
        }
    }
    out += '"';
    return out;
}

/* Message is formatted first, then escaped as a JSON string */
static void json_error_f(FILE *out, const char *fmt, ...)
{
    va_list ap;
    va_start(ap, fmt);
    int n = vsnprintf(NULL, 0, fmt, ap);
    va_end(ap);

    std::string msg(n > 0 ? (size_t)n : 0, '\0');
    if (n > 0) {
        va_start(ap, fmt);
        vsnprintf(&msg[0], msg.size() + 1, fmt, ap);
        va_end(ap);
    }
    fprintf(out, "{\"ok\":false,\"error\":%s}\n", json_str(msg).c_str());
    fflush(out);
}

/* ========================================================================
 * Command table and suggestions
 * ======================================================================== */

static const struct { const char *name; const char *usage; } commands[] = {
    {"load",    "load <path> [arch] [base] [entry]"},
    {"info",    "info"},
    {"goto",    "goto <addr|symbol>"},
    {"list",    "list [count]"},
    {"back",    "back [count]"},
    {"lookup",  "lookup <addr>"},
    {"symbol",  "symbol <name>"},
    {"resolve", "resolve <addr>"},
    {"hex",     "hex <addr> [rows]"},
    {"seeds",   "seeds"},
    {"help",    "help"},
    {"quit",    "quit"},
};

unsigned edit_distance(const char *a, const char *b)
{
    size_t la = strlen(a), lb = strlen(b);
    std::vector<unsigned> prev2(lb + 1), prev(lb + 1), cur(lb + 1);
    for (size_t j = 0; j <= lb; j++) prev[j] = (unsigned)j;

    for (size_t i = 1; i <= la; i++) {
        cur[0] = (unsigned)i;
        for (size_t j = 1; j <= lb; j++) {
            unsigned sub = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            unsigned del = prev[j] + 1;
            unsigned ins = cur[j - 1] + 1;
            cur[j] = std::min(sub, std::min(del, ins));
            /* adjacent transposition counts as one edit */
            if (i > 1 && j > 1 && a[i - 1] == b[j - 2] && a[i - 2] == b[j - 1])
                cur[j] = std::min(cur[j], prev2[j - 2] + 1);
        }
        std::swap(prev2, prev);
        std::swap(prev, cur);
    }
    return prev[lb];
}

const char *suggest_command(const char *unknown)
{
    const char *best = nullptr;
    unsigned best_d = ~0u;
    for (auto &c : commands) {
        unsigned d = edit_distance(unknown, c.name);
        if (d < best_d) {
            best_d = d;
            best = c.name;
        }
    }
    return best_d <= 2 ? best : nullptr;
}

/* ========================================================================
 * Helpers
 * ======================================================================== */

scroll::ScrollBuffer<scroll::ListingSource> *Console::view()
{
    auto st = session_.current();
    if (!st) return nullptr;
    if (st != view_state_) {
        view_state_ = st;
        view_ = std::make_unique<scroll::ScrollBuffer<scroll::ListingSource>>(*st->listing);
        view_->set_anchor(st->image->entry);
    }
    return view_.get();
}

static bool is_hex_string(const char *s)
{
    if (!*s) return false;
    for (; *s; s++)
        if (!isxdigit((unsigned char)*s)) return false;
    return true;
}

bool parse_addr(const session::State &st, const char *arg, uint64_t &out)
{
    if (strncasecmp(arg, "0x", 2) == 0 && is_hex_string(arg + 2)) {
        out = strtoull(arg + 2, nullptr, 16);
        return true;
    }
    for (auto &s : st.image->symbols) {
        if (s.name == arg || s.display == arg) {
            out = s.addr;
            return true;
        }
    }
    for (auto &f : st.vault.functions()) {
        if (f.name == arg) {
            out = f.start;
            return true;
        }
    }
    if (is_hex_string(arg)) {
        out = strtoull(arg, nullptr, 16);
        return true;
    }
    return false;
}

static const char *row_kind_name(scroll::RowKind kind)
{
    switch (kind) {
    case scroll::RowKind::LABEL:       return "label";
    case scroll::RowKind::INSTRUCTION: return "instruction";
    case scroll::RowKind::ERROR:       return "error";
    case scroll::RowKind::BYTES:       return "bytes";
    case scroll::RowKind::SECTION:     return "section";
    }
    return "?";
}

static void write_rows(FILE *out, const std::vector<scroll::Row> &rows)
{
    fprintf(out, "{\"ok\":true,\"rows\":[");
    for (size_t i = 0; i < rows.size(); i++) {
        const scroll::Row &r = rows[i];
        fprintf(out, "%s{\"row\":%zu,\"kind\":\"%s\",\"addr\":\"0x%" PRIx64 "\",\"text\":%s",
                i ? "," : "", r.index, row_kind_name(r.kind), r.address,
                json_str(r.text()).c_str());
        if (r.location && r.location->line) {
            fprintf(out, ",\"file\":%s,\"line\":%u",
                    json_str(r.location->file).c_str(), r.location->line);
        }
        if (r.location && !r.location->function.empty())
            fprintf(out, ",\"function\":%s", json_str(r.location->function).c_str());

        bool first = true;
        for (auto &t : r.tokens) {
            if (!t.has_target || t.kind == tokens::Kind::LABEL) continue;
            fprintf(out, "%s{\"text\":%s,\"kind\":\"%s\",\"target\":\"0x%" PRIx64 "\"}",
                    first ? ",\"refs\":[" : ",", json_str(t.text).c_str(),
                    tokens::kind_name(t.kind), t.target);
            first = false;
        }
        if (!first) fputc(']', out);
        fputc('}', out);
    }
    fprintf(out, "]}\n");
    fflush(out);
}

static size_t parse_count(const char *arg, int nargs, int idx, size_t dflt)
{
    if (nargs <= idx) return dflt;
    long v = strtol(arg, nullptr, 0);
    if (v <= 0) return dflt;
    return v > 1000 ? 1000 : (size_t)v;
}

/* ========================================================================
 * Command processing
 * ======================================================================== */

void process_command(Console &console, char *line, FILE *out)
{
    /* Strip trailing newline/whitespace */
    size_t len = strlen(line);
    while (len > 0 && (line[len-1] == '\n' || line[len-1] == '\r' ||
                       line[len-1] == ' '))
        line[--len] = '\0';

    if (len == 0) return;

    char cmd[64] = {0};
    char arg1[256] = {0};
    char arg2[256] = {0};
    char rest[CMD_BUF_SIZE] = {0};
    int nargs = sscanf(line, "%63s %255s %255s %[^\n]", cmd, arg1, arg2, rest);

    session::Session &ses = console.session();

    /* --- quit --- */
    if (strcmp(cmd, "quit") == 0) {
        json_ok_f(out, NULL);
        console.stop();
        return;
    }

    /* --- help --- */
    if (strcmp(cmd, "help") == 0) {
        fprintf(out, "{\"ok\":true,\"commands\":[");
        for (size_t i = 0; i < sizeof(commands) / sizeof(commands[0]); i++)
            fprintf(out, "%s%s", i ? "," : "", json_str(commands[i].usage).c_str());
        fprintf(out, "]}\n");
        fflush(out);
        return;
    }

    /* --- load <path> [arch] [base] [entry] --- */
    if (strcmp(cmd, "load") == 0) {
        if (nargs < 2) { json_error_f(out, "usage: load <path> [arch] [base] [entry]"); return; }

        session::LoadOptions opts = console.defaults();
        opts.path = arg1;
        opts.debug_path.clear();
        if (nargs >= 3) {
            const arch::Arch *a = arch::arch_by_name(arg2);
            if (!a) { json_error_f(out, "unknown arch: %s", arg2); return; }
            opts.raw.machine = a->machine;
        }
        if (nargs >= 4) {
            char base_s[64] = {0}, entry_s[64] = {0};
            int n = sscanf(rest, "%63s %63s", base_s, entry_s);
            if (n >= 1) opts.raw.base = strtoull(base_s, nullptr, 16);
            if (n >= 2) opts.raw.entry = strtoull(entry_s, nullptr, 16);
            else opts.raw.entry.reset();
        }

        session::LoadStatus st = ses.load_file(opts);
        if (!st.ok()) {
            fprintf(out, "{\"ok\":false,\"error\":%s,\"code\":\"%s\"}\n",
                    json_str(st.message).c_str(), session::error_name(st.code));
            fflush(out);
            return;
        }
        auto cur = ses.current();
        json_ok_f(out, "\"path\":%s,\"instructions\":%zu,\"rows\":%zu",
                  json_str(cur->name).c_str(), cur->analysis.stream.size(),
                  cur->listing->size());
        return;
    }

    auto st = ses.current();
    bool known = false;
    for (auto &c : commands)
        if (strcmp(cmd, c.name) == 0) known = true;
    if (known && !st) {
        json_error_f(out, "nothing loaded");
        return;
    }

    /* --- info --- */
    if (strcmp(cmd, "info") == 0) {
        const proc::Stats &s = st->analysis.stats;
        json_ok_f(out, "\"path\":%s,\"arch\":\"%s\",\"entry\":\"0x%" PRIx64 "\","
                  "\"sections\":%zu,\"symbols\":%zu,\"instructions\":%zu,"
                  "\"invalid\":%zu,\"seeds\":%zu,\"rounds\":%zu,\"rows\":%zu,"
                  "\"records\":%zu,\"functions\":%zu,\"conflicts\":%zu",
                  json_str(st->name).c_str(), st->analysis.arch->name, st->image->entry,
                  st->image->sections.size(), st->image->symbols.size(),
                  s.instructions, s.invalid, st->analysis.seeds.size(), s.rounds,
                  st->listing->size(), st->vault.records().size(),
                  st->vault.functions().size(), st->vault.conflicts().size());
        return;
    }

    /* --- goto <addr|symbol> --- */
    if (strcmp(cmd, "goto") == 0) {
        if (nargs < 2) { json_error_f(out, "usage: goto <addr|symbol>"); return; }
        uint64_t addr;
        if (!parse_addr(*st, arg1, addr)) { json_error_f(out, "bad address: %s", arg1); return; }
        auto *view = console.view();
        view->set_anchor(addr);
        auto rows = view->peek(1);
        if (rows.empty()) { json_error_f(out, "empty listing"); return; }
        json_ok_f(out, "\"row\":%zu,\"addr\":\"0x%" PRIx64 "\"",
                  rows[0].index, rows[0].address);
        return;
    }

    /* --- list [n] / back [n] --- */
    if (strcmp(cmd, "list") == 0 || strcmp(cmd, "back") == 0) {
        size_t n = parse_count(arg1, nargs, 1, 20);
        auto dir = cmd[0] == 'l' ? scroll::Direction::FORWARD : scroll::Direction::BACKWARD;
        write_rows(out, console.view()->extend(dir, n));
        return;
    }

    /* --- lookup <addr> --- */
    if (strcmp(cmd, "lookup") == 0) {
        if (nargs < 2) { json_error_f(out, "usage: lookup <addr>"); return; }
        uint64_t addr;
        if (!parse_addr(*st, arg1, addr)) { json_error_f(out, "bad address: %s", arg1); return; }

        char addr_s[32];
        snprintf(addr_s, sizeof(addr_s), "\"addr\":\"0x%" PRIx64 "\"", addr);
        std::string body = addr_s;
        if (auto loc = st->vault.lookup(addr)) {
            body += ",\"symbol\":" + json_str(loc->symbol);
            body += ",\"function\":" + json_str(loc->function);
            if (loc->line)
                body += ",\"file\":" + json_str(loc->file) + ",\"line\":" + std::to_string(loc->line);
        }
        if (auto near = st->vault.nearest_symbol(addr))
            body += ",\"nearest\":" + json_str(near->name) + ",\"offset\":" + std::to_string(near->offset);
        json_ok_f(out, "%s", body.c_str());
        return;
    }

    /* --- symbol <name> --- */
    if (strcmp(cmd, "symbol") == 0) {
        if (nargs < 2) { json_error_f(out, "usage: symbol <name>"); return; }
        for (auto &s : st->image->symbols) {
            if (s.name == arg1 || s.display == arg1) {
                json_ok_f(out, "\"name\":%s,\"display\":%s,\"addr\":\"0x%" PRIx64 "\","
                          "\"kind\":\"%s\",\"intrinsic\":%s",
                          json_str(s.name).c_str(), json_str(s.display).c_str(), s.addr,
                          image::kind_name(s.kind), s.intrinsic ? "true" : "false");
                return;
            }
        }
        json_error_f(out, "unknown symbol: %s", arg1);
        return;
    }

    /* --- resolve <addr> --- */
    if (strcmp(cmd, "resolve") == 0) {
        if (nargs < 2) { json_error_f(out, "usage: resolve <addr>"); return; }
        uint64_t addr;
        if (!parse_addr(*st, arg1, addr)) { json_error_f(out, "bad address: %s", arg1); return; }
        auto row = ses.resolve_reference(addr);
        if (!row) { json_error_f(out, "unresolved: 0x%" PRIx64, addr); return; }
        json_ok_f(out, "\"row\":%zu", *row);
        return;
    }

    /* --- hex <addr> [rows] --- */
    if (strcmp(cmd, "hex") == 0) {
        if (nargs < 2) { json_error_f(out, "usage: hex <addr> [rows]"); return; }
        uint64_t addr;
        if (!parse_addr(*st, arg1, addr)) { json_error_f(out, "bad address: %s", arg1); return; }
        size_t n = parse_count(arg2, nargs, 2, 8);
        scroll::ScrollBuffer<scroll::HexSource> buf(*st->hex, n);
        buf.set_anchor(addr);
        write_rows(out, buf.extend(scroll::Direction::FORWARD, n));
        return;
    }

    /* --- seeds --- */
    if (strcmp(cmd, "seeds") == 0) {
        fprintf(out, "{\"ok\":true,\"seeds\":[");
        bool first = true;
        for (auto &s : st->analysis.seeds) {
            fprintf(out, "%s{\"addr\":\"0x%" PRIx64 "\",\"origin\":\"%s\"}",
                    first ? "" : ",", s.addr, proc::origin_name(s.origin));
            first = false;
        }
        fprintf(out, "]}\n");
        fflush(out);
        return;
    }

    if (const char *guess = suggest_command(cmd))
        json_error_f(out, "unknown command: %s (did you mean %s?)", cmd, guess);
    else
        json_error_f(out, "unknown command: %s", cmd);
}

} // namespace cmd
