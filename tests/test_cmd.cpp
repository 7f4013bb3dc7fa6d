/*
 * test_cmd.cpp: Command console
 */

#include <gtest/gtest.h>

#include "cmd.hpp"
#include "helpers.hpp"

#include <cstdio>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

using testutil::TempFile;

namespace {

/* Run one command line and capture its JSON reply */
std::string run(cmd::Console &console, const std::string &line)
{
    std::vector<char> buf(line.begin(), line.end());
    buf.push_back('\0');
    FILE *out = tmpfile();
    if (!out) {
        ADD_FAILURE() << "tmpfile failed";
        return {};
    }
    cmd::process_command(console, buf.data(), out);
    fflush(out);
    rewind(out);
    std::string reply;
    char chunk[512];
    size_t n;
    while ((n = fread(chunk, 1, sizeof(chunk), out)) > 0)
        reply.append(chunk, n);
    fclose(out);
    return reply;
}

bool contains(const std::string &haystack, const std::string &needle)
{
    return haystack.find(needle) != std::string::npos;
}

/* Console with a small x86 image loaded from disk */
class LoadedConsole : public ::testing::Test {
protected:
    LoadedConsole()
        : bin_(testutil::bytes_str({0x55, 0x89, 0xc8, 0xe8, 0x01, 0x00, 0x00, 0x00,
                                    0xc3, 0xc3})),
          dbg_(loader::default_debug_path(bin_.path()),
               R"([{"kind": "function", "name": "main", "addr": "0x1000", "end": "0x1009"},
                   {"kind": "function", "name": "leaf", "addr": "0x1009", "end": "0x100a"},
                   {"kind": "line", "addr": "0x1001", "end": "0x1003", "file": "main.c", "line": 4}])"),
          console_(ses_)
    {
        std::string reply = run(console_, "load " + bin_.path() + " x86_64 1000");
        EXPECT_TRUE(contains(reply, "\"ok\":true")) << reply;
    }

    TempFile         bin_;
    TempFile         dbg_;
    session::Session ses_;
    cmd::Console     console_;
};

/* Port the listening socket was bound to */
int bound_port(int fd)
{
    struct sockaddr_in addr = {};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, (struct sockaddr *)&addr, &len) < 0)
        return -1;
    return ntohs(addr.sin_port);
}

} // namespace

TEST(Commands, EditDistance)
{
    EXPECT_EQ(cmd::edit_distance("goto", "goto"), 0u);
    EXPECT_EQ(cmd::edit_distance("got", "goto"), 1u);
    EXPECT_EQ(cmd::edit_distance("lsit", "list"), 1u);
    EXPECT_EQ(cmd::edit_distance("hlep", "help"), 1u);
    EXPECT_EQ(cmd::edit_distance("hlep", "hex"), 2u);
    EXPECT_EQ(cmd::edit_distance("ab", "ba"), 1u);
    EXPECT_EQ(cmd::edit_distance("", "info"), 4u);
}

TEST(Commands, Suggestions)
{
    EXPECT_STREQ(cmd::suggest_command("lookp"), "lookup");
    EXPECT_STREQ(cmd::suggest_command("quti"), "quit");
    EXPECT_STREQ(cmd::suggest_command("hlep"), "help");
    EXPECT_STREQ(cmd::suggest_command("seesd"), "seeds");
    EXPECT_EQ(cmd::suggest_command("disassemble"), nullptr);
}

TEST(Commands, HelpAndQuit)
{
    session::Session ses;
    cmd::Console console(ses);

    std::string help = run(console, "help");
    EXPECT_TRUE(contains(help, "\"commands\":["));
    EXPECT_TRUE(contains(help, "goto <addr|symbol>"));

    EXPECT_TRUE(console.running());
    EXPECT_EQ(run(console, "quit\n"), "{\"ok\":true}\n");
    EXPECT_FALSE(console.running());
}

TEST(Commands, NothingLoaded)
{
    session::Session ses;
    cmd::Console console(ses);
    EXPECT_EQ(run(console, "info"), "{\"ok\":false,\"error\":\"nothing loaded\"}\n");
    EXPECT_EQ(run(console, "   "), "");
}

TEST(Commands, UnknownCommandSuggestsNearest)
{
    session::Session ses;
    cmd::Console console(ses);
    EXPECT_TRUE(contains(run(console, "hlep"), "did you mean help?"));
    EXPECT_EQ(run(console, "frobnicate"),
              "{\"ok\":false,\"error\":\"unknown command: frobnicate\"}\n");
}

TEST(Commands, LoadErrorsCarryCode)
{
    session::Session ses;
    cmd::Console console(ses);
    EXPECT_TRUE(contains(run(console, "load"), "usage: load"));
    EXPECT_TRUE(contains(run(console, "load /nonexistent x86_64"), "\"code\":\"io\""));
    EXPECT_TRUE(contains(run(console, "load /nonexistent z80"), "unknown arch: z80"));
}

TEST(Commands, ErrorTextIsEscaped)
{
    session::Session ses;
    cmd::Console console(ses);
    EXPECT_EQ(run(console, "load /nonexistent z\"80\\"),
              "{\"ok\":false,\"error\":\"unknown arch: z\\\"80\\\\\"}\n");
    EXPECT_EQ(run(console, "zz\"zzzzzz"),
              "{\"ok\":false,\"error\":\"unknown command: zz\\\"zzzzzz\"}\n");
}

TEST_F(LoadedConsole, Info)
{
    std::string reply = run(console_, "info");
    EXPECT_TRUE(contains(reply, "\"arch\":\"x86_64\"")) << reply;
    EXPECT_TRUE(contains(reply, "\"entry\":\"0x1000\"")) << reply;
    EXPECT_TRUE(contains(reply, "\"functions\":2")) << reply;
    EXPECT_TRUE(contains(reply, "\"instructions\":5")) << reply;
}

TEST_F(LoadedConsole, GotoAndList)
{
    std::string reply = run(console_, "goto leaf");
    EXPECT_TRUE(contains(reply, "\"addr\":\"0x1009\"")) << reply;

    reply = run(console_, "goto 0x1002");
    EXPECT_TRUE(contains(reply, "\"addr\":\"0x1001\"")) << reply;

    reply = run(console_, "list 2");
    EXPECT_TRUE(contains(reply, "mov eax, ecx")) << reply;
    EXPECT_TRUE(contains(reply, "\"file\":\"main.c\",\"line\":4")) << reply;
    EXPECT_TRUE(contains(reply, "call leaf")) << reply;

    EXPECT_TRUE(contains(run(console_, "goto nowhere"), "bad address: nowhere"));
    EXPECT_EQ(run(console_, "goto a\"b"),
              "{\"ok\":false,\"error\":\"bad address: a\\\"b\"}\n");
}

TEST_F(LoadedConsole, LookupSymbolResolve)
{
    std::string reply = run(console_, "lookup 0x1002");
    EXPECT_TRUE(contains(reply, "main.c")) << reply;

    reply = run(console_, "symbol main");
    EXPECT_TRUE(contains(reply, "\"addr\":\"0x1000\"")) << reply;
    EXPECT_TRUE(contains(run(console_, "symbol nope"), "unknown symbol: nope"));

    EXPECT_TRUE(contains(run(console_, "resolve 0x1009"), "\"row\":"));
    EXPECT_TRUE(contains(run(console_, "resolve 0x1002"), "unresolved: 0x1002"));
}

TEST_F(LoadedConsole, HexAndSeeds)
{
    std::string reply = run(console_, "hex 0x1000 1");
    EXPECT_TRUE(contains(reply, "55 89 c8 e8")) << reply;

    reply = run(console_, "seeds");
    EXPECT_TRUE(contains(reply, "{\"addr\":\"0x1000\",\"origin\":\"entry\"}")) << reply;
    EXPECT_TRUE(contains(reply, "\"addr\":\"0x1009\"")) << reply;
}

TEST_F(LoadedConsole, ParseAddr)
{
    auto st = ses_.current();
    ASSERT_NE(st, nullptr);
    uint64_t addr = 0;
    EXPECT_TRUE(cmd::parse_addr(*st, "0x1003", addr));
    EXPECT_EQ(addr, 0x1003u);
    EXPECT_TRUE(cmd::parse_addr(*st, "1009", addr));
    EXPECT_EQ(addr, 0x1009u);
    EXPECT_TRUE(cmd::parse_addr(*st, "leaf", addr));
    EXPECT_EQ(addr, 0x1009u);
    EXPECT_FALSE(cmd::parse_addr(*st, "missing", addr));
}

TEST(CommandServer, LoopbackRoundTrip)
{
    session::Session ses;
    cmd::Console console(ses);
    int fd = cmd::server_init(0);
    ASSERT_GE(fd, 0);
    int port = bound_port(fd);
    ASSERT_GT(port, 0);

    std::string reply;
    bool sent = false;
    std::thread peer([&] { sent = cmd::request("info", port, reply); });
    cmd::check_socket_commands(console, 5000);
    peer.join();

    EXPECT_TRUE(sent);
    EXPECT_EQ(reply, "{\"ok\":false,\"error\":\"nothing loaded\"}\n");

    std::thread quitter([&] { sent = cmd::request("quit", port, reply); });
    cmd::check_socket_commands(console, 5000);
    quitter.join();
    EXPECT_EQ(reply, "{\"ok\":true}\n");
    EXPECT_FALSE(console.running());

    cmd::server_shutdown();
    EXPECT_FALSE(cmd::request("info", port, reply));
}

TEST(CommandServer, PollWithoutListenerReturns)
{
    session::Session ses;
    cmd::Console console(ses);
    cmd::server_shutdown();
    cmd::check_socket_commands(console, 10);
    EXPECT_TRUE(console.running());
}
