/*
 * cmd.hpp: Command processing, TCP command server and client
 *
 * Every command writes exactly one JSON object followed by a newline:
 * {"ok":true,...} or {"ok":false,"error":"..."}.
 */

#ifndef DS_CMD_H
#define DS_CMD_H

#include "scroll.hpp"
#include "session.hpp"

#include <cstdio>
#include <memory>
#include <string>

namespace cmd {

constexpr int DEFAULT_PORT = 2783;

/*
 * Command-line state on top of a session: defaults for "load" and the
 * listing position used by goto/list/back.
 */
class Console {
public:
    explicit Console(session::Session &s, session::LoadOptions defaults = {})
        : session_(s), defaults_(std::move(defaults)) {}

    session::Session &session() { return session_; }
    const session::LoadOptions &defaults() const { return defaults_; }

    bool running() const { return running_; }
    void stop() { running_ = false; }

    /* Listing view over the current state; rebuilt after a reload. */
    scroll::ScrollBuffer<scroll::ListingSource> *view();
    std::shared_ptr<const session::State> view_state() const { return view_state_; }

private:
    session::Session    &session_;
    session::LoadOptions defaults_;
    bool                 running_ = true;
    std::shared_ptr<const session::State> view_state_;
    std::unique_ptr<scroll::ScrollBuffer<scroll::ListingSource>> view_;
};

/* Parse and execute one command line (modified in place). */
void process_command(Console &console, char *line, FILE *out);

/* Closest known command within edit distance 2, else nullptr. */
const char *suggest_command(const char *unknown);

/* Edit distance with adjacent transpositions counted as one edit. */
unsigned edit_distance(const char *a, const char *b);

/* "0x..." or bare hex, or a symbol or function name (raw or demangled). */
bool parse_addr(const session::State &st, const char *arg, uint64_t &out);

/* ---- TCP server (one command per connection) ---- */

/* Port 0 binds an ephemeral port; returns the listening fd or -1. */
int  server_init(int port);
void check_socket_commands(Console &console, int timeout_ms = 0);
void server_shutdown();

/* Send one command to a running instance; reply holds the raw JSON line. */
bool request(const char *cmd_str, int port, std::string &reply);

/* Send one command to a running instance and print the reply. */
int client(const char *cmd_str, int port);

} // namespace cmd

#endif // DS_CMD_H
