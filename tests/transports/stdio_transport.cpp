#include "mcpdiff/client/transport.hpp"
#include "mcpdiff/exceptions.hpp"
#include "mcpdiff/settings.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#ifndef MCPDIFF_FAKE_SERVER
#define MCPDIFF_FAKE_SERVER "./mcpdiff_fake_mcp_server"
#endif

using mcpdiff::Json;
using mcpdiff::ServerCommand;
using mcpdiff::Settings;
using mcpdiff::client::StdioTransport;

static ServerCommand sh(const std::string& script)
{
    return ServerCommand{"sh", {"-c", script}, "", {}};
}

static Settings quick_settings()
{
    Settings s;
    s.read_timeout = std::chrono::milliseconds(2000);
    s.stop_grace = std::chrono::milliseconds(1000);
    return s;
}

int main()
{
    std::cout << "Test: noise and notifications before the response...\n";
    {
        ServerCommand cmd{MCPDIFF_FAKE_SERVER, {"--noise", "--notify"}, "", {}};
        StdioTransport tx("fake", cmd, quick_settings());
        tx.send(Json{{"jsonrpc", "2.0"},
                     {"id", 1001},
                     {"method", "initialize"},
                     {"params", {{"protocolVersion", "2024-11-05"}}}});
        auto resp = tx.receive_matching(1001);
        assert(resp["id"] == 1001);
        assert(resp["result"]["serverInfo"]["name"] == "fake-bitbucket");

        tx.send(Json{{"jsonrpc", "2.0"}, {"id", 1002}, {"method", "tools/list"}, {"params", Json::object()}});
        auto tools = tx.receive_matching(1002);
        assert(tools["result"]["tools"].size() == 9);
        tx.close();
        assert(tx.exit_code().has_value());
        std::cout << "  [PASS] responses correlated through noise\n";
    }

    std::cout << "Test: early exit surfaces TransportError with stderr...\n";
    {
        StdioTransport tx("TypeScript", sh("echo boom-on-stderr >&2; exit 1"), quick_settings());
        bool caught = false;
        std::string msg;
        try
        {
            tx.send(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}, {"params", {}}});
            tx.receive_matching(1);
        }
        catch (const mcpdiff::TransportError& e)
        {
            caught = true;
            msg = e.what();
        }
        assert(caught);
        assert(msg.find("[TypeScript]") == 0);
        assert(msg.find("boom-on-stderr") != std::string::npos);
        std::cout << "  [PASS] " << msg << "\n";
    }

    std::cout << "Test: unresponsive server triggers timeout...\n";
    {
        Settings s = quick_settings();
        s.read_timeout = std::chrono::milliseconds(300);
        StdioTransport tx("slow", ServerCommand{"sleep", {"30"}, "", {}}, s);
        auto start = std::chrono::steady_clock::now();
        bool caught = false;
        try
        {
            tx.send(Json{{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/list"}, {"params", {}}});
            tx.receive_matching(5);
        }
        catch (const mcpdiff::TimeoutError&)
        {
            caught = true;
        }
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(caught);
        assert(elapsed < std::chrono::seconds(5));
        tx.close();
        std::cout << "  [PASS] TimeoutError within bound\n";
    }

    std::cout << "Test: non-existent command fails to start...\n";
    {
        bool caught = false;
        try
        {
            StdioTransport tx("ghost", ServerCommand{"nonexistent_cmd_abc123", {}, "", {}},
                              quick_settings());
        }
        catch (const mcpdiff::TransportError& e)
        {
            caught = true;
            assert(std::string(e.what()).find("[ghost]") == 0);
        }
        assert(caught);
        std::cout << "  [PASS] TransportError at spawn\n";
    }

    std::cout << "Test: close escalates to SIGKILL when SIGTERM is ignored...\n";
    {
        Settings s = quick_settings();
        s.stop_grace = std::chrono::milliseconds(200);
        StdioTransport tx(
            "stubborn",
            sh(R"SH(trap '' TERM; echo '{"jsonrpc":"2.0","id":1,"result":{}}'; exec sleep 30)SH"), s);
        tx.receive_matching(1); // trap is installed once this arrives
        auto start = std::chrono::steady_clock::now();
        tx.close();
        auto elapsed = std::chrono::steady_clock::now() - start;
        assert(tx.exit_code().has_value());
        assert(*tx.exit_code() == 128 + 9);
        assert(elapsed < std::chrono::seconds(5));
        tx.close(); // idempotent
        std::cout << "  [PASS] killed after grace period\n";
    }

    std::cout << "Test: environment overlay and working directory...\n";
    {
        ServerCommand cmd =
            sh(R"SH(printf '{"jsonrpc":"2.0","id":1,"result":{"v":"%s","cwd":"%s","path_set":"%s"}}\n' "$MCPDIFF_TEST_VAR" "$(pwd)" "${PATH:+yes}")SH");
        cmd.environment["MCPDIFF_TEST_VAR"] = "hello";
        cmd.working_directory = "/";
        StdioTransport tx("env", cmd, quick_settings());
        auto resp = tx.receive_matching(1);
        assert(resp["result"]["v"] == "hello");
        assert(resp["result"]["cwd"] == "/");
        assert(resp["result"]["path_set"] == "yes"); // inherited, not replaced
        std::cout << "  [PASS] variables merged over inherited environment\n";
    }

    std::cout << "Test: large stderr output does not block the response...\n";
    {
        StdioTransport tx(
            "chatty",
            sh(R"SH(head -c 200000 /dev/zero | tr '\0' x >&2; echo '{"jsonrpc":"2.0","id":1,"result":{}}')SH"),
            quick_settings());
        auto resp = tx.receive_matching(1);
        assert(resp.contains("result"));
        assert(!tx.captured_stderr().empty());
        assert(tx.captured_stderr().size() <= 64 * 1024);
        std::cout << "  [PASS] stderr drained while waiting\n";
    }

    std::cout << "Test: stderr is mirrored to the given stream...\n";
    {
        std::ostringstream ss;
        ServerCommand cmd{MCPDIFF_FAKE_SERVER, {"--stderr", "mirror-me"}, "", {}};
        {
            StdioTransport tx("mirror", cmd, quick_settings(), &ss);
            tx.send(Json{{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}, {"params", Json::object()}});
            tx.receive_matching(2);
            tx.close();
        }
        assert(ss.str().find("mirror-me") != std::string::npos);
        std::cout << "  [PASS] stderr mirrored\n";
    }

    std::cout << "\n[OK] stdio transport tests passed\n";
    return 0;
}
