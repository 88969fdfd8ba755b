#include "mcpdiff/client/transport.hpp"
#include "mcpdiff/exceptions.hpp"
#include "mcpdiff/util/log.hpp"

#include "../test_helpers.hpp"

#include <cassert>
#include <iostream>
#include <string>

int main()
{
    using mcpdiff::Json;
    using mcpdiff::client::MemoryTransport;

    std::cout << "Test: send frames one object per line...\n";
    {
        MemoryTransport tx("A");
        tx.send(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "m"}, {"params", {{"s", "a\nb"}}}});
        assert(tx.sent_lines().size() == 1);
        const auto& line = tx.sent_lines()[0];
        assert(line.back() == '\n');
        assert(line.find('\n') == line.size() - 1);
        assert(tx.sent()[0]["params"]["s"] == "a\nb");
        std::cout << "  [PASS] newline-terminated single line\n";
    }

    std::cout << "Test: malformed lines and notifications are skipped...\n";
    {
        MemoryTransport tx("A");
        tx.push_line("not json{");
        tx.push_line("");
        tx.push_line("42");
        tx.push_message(Json{{"jsonrpc", "2.0"}, {"method", "notifications/message"}, {"params", {}}});
        tx.push_message(Json{{"jsonrpc", "2.0"}, {"id", 7}, {"result", {{"ok", true}}}});
        auto resp = tx.receive_matching(7);
        assert(resp["id"] == 7);
        assert(resp["result"]["ok"] == true);
        std::cout << "  [PASS] matching response returned after noise\n";
    }

    std::cout << "Test: notification with a non-string method is skipped...\n";
    {
        MemoryTransport tx("A");
        tx.push_message(Json{{"jsonrpc", "2.0"}, {"method", 5}});
        tx.push_message(Json{{"jsonrpc", "2.0"}, {"params", {{"x", 1}}}});
        tx.push_message(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"ok", true}}}});
        auto previous = mcpdiff::log::level();
        mcpdiff::log::set_level(mcpdiff::log::Level::Debug);
        auto resp = tx.receive_matching(1);
        mcpdiff::log::set_level(previous);
        assert(resp["result"]["ok"] == true);
        std::cout << "  [PASS] response returned after malformed notifications\n";
    }

    std::cout << "Test: a notification is never returned...\n";
    {
        MemoryTransport tx("A");
        tx.push_message(Json{{"jsonrpc", "2.0"}, {"method", "notifications/progress"}});
        tx.close_output();
        auto msg = expect_throw<mcpdiff::TransportError>([&] { tx.receive_matching(1); });
        (void)msg;
        std::cout << "  [PASS] end of stream reached instead\n";
    }

    std::cout << "Test: out-of-order response is a protocol error...\n";
    {
        MemoryTransport tx("Python");
        tx.push_message(Json{{"jsonrpc", "2.0"}, {"id", 99}, {"result", {}}});
        auto msg = expect_throw<mcpdiff::ProtocolError>([&] { tx.receive_matching(3); });
        assert(msg.find("[Python]") == 0);
        assert(msg.find("expected id 3") != std::string::npos);
        std::cout << "  [PASS] ProtocolError raised\n";
    }

    std::cout << "Test: string id does not match an integer request...\n";
    {
        MemoryTransport tx("A");
        tx.push_message(Json{{"jsonrpc", "2.0"}, {"id", "5"}, {"result", {}}});
        expect_throw<mcpdiff::ProtocolError>([&] { tx.receive_matching(5); });
        std::cout << "  [PASS] ProtocolError raised\n";
    }

    std::cout << "Test: end of stream carries the error stream...\n";
    {
        MemoryTransport tx("TypeScript");
        tx.set_stderr("Configuration error: token missing");
        tx.push_line("garbage");
        tx.close_output();
        auto msg = expect_throw<mcpdiff::TransportError>([&] { tx.receive_matching(1); });
        assert(msg.find("[TypeScript]") == 0);
        assert(msg.find("Configuration error: token missing") != std::string::npos);
        std::cout << "  [PASS] stderr attached to TransportError\n";
    }

    std::cout << "Test: timeout is distinct from end of stream...\n";
    {
        MemoryTransport tx("A");
        auto msg = expect_throw<mcpdiff::TimeoutError>([&] { tx.receive_matching(11); });
        assert(msg.find("request 11") != std::string::npos);
        std::cout << "  [PASS] TimeoutError raised\n";
    }

    std::cout << "Test: late response to a timed-out request is dropped...\n";
    {
        MemoryTransport tx("A");
        expect_throw<mcpdiff::TimeoutError>([&] { tx.receive_matching(20); });
        tx.push_message(Json{{"jsonrpc", "2.0"}, {"id", 20}, {"result", {{"late", true}}}});
        tx.push_message(Json{{"jsonrpc", "2.0"}, {"id", 21}, {"result", {{"late", false}}}});
        auto resp = tx.receive_matching(21);
        assert(resp["result"]["late"] == false);
        std::cout << "  [PASS] stale id skipped, next response matched\n";
    }

    std::cout << "Test: write failure surfaces TransportError...\n";
    {
        MemoryTransport tx("A");
        tx.fail_writes();
        expect_throw<mcpdiff::TransportError>([&] { tx.send(Json{{"id", 1}}); });
        tx.fail_writes(false);
        tx.close();
        expect_throw<mcpdiff::TransportError>([&] { tx.send(Json{{"id", 2}}); });
        assert(tx.closed());
        std::cout << "  [PASS] failed and closed writes throw\n";
    }

    std::cout << "\n[OK] line transport tests passed\n";
    return 0;
}
