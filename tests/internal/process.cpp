#include "internal/process.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

using namespace mcpdiff::process;
using namespace std::chrono_literals;

int main()
{
    std::cout << "Test: partial lines survive a read timeout...\n";
    {
        Process p;
        p.spawn("sh", {"-c", "printf abc; sleep 0.5; printf 'def\\r\\nxyz'"});
        auto first = p.stdout_pipe().read_line(100ms);
        assert(first.status == LineStatus::Timeout);
        auto second = p.stdout_pipe().read_line(5000ms);
        assert(second.status == LineStatus::Line);
        assert(second.line == "abcdef");
        auto third = p.stdout_pipe().read_line(5000ms);
        assert(third.status == LineStatus::Line);
        assert(third.line == "xyz");
        auto fourth = p.stdout_pipe().read_line(5000ms);
        assert(fourth.status == LineStatus::Eof);
        assert(p.wait() == 0);
        std::cout << "  [PASS] buffered across timeout, unterminated tail returned at EOF\n";
    }

    std::cout << "Test: read_available never blocks...\n";
    {
        Process p;
        p.spawn("sh", {"-c", "echo oops >&2; sleep 1"});
        std::string collected;
        auto start = std::chrono::steady_clock::now();
        while (collected.find("oops") == std::string::npos &&
               std::chrono::steady_clock::now() - start < 3s)
            collected += p.stderr_pipe().read_available();
        assert(collected.find("oops") != std::string::npos);
        assert(p.stderr_pipe().read_available().empty());
        p.kill();
        p.wait();
        std::cout << "  [PASS] stderr drained without blocking\n";
    }

    std::cout << "Test: wait_for is bounded...\n";
    {
        Process p;
        p.spawn("sleep", {"30"});
        assert(p.is_running());
        auto code = p.wait_for(100ms);
        assert(!code.has_value());
        p.terminate();
        code = p.wait_for(5000ms);
        assert(code.has_value());
        assert(*code == 128 + 15);
        assert(!p.is_running());
        std::cout << "  [PASS] timed out, then reaped after SIGTERM\n";
    }

    std::cout << "Test: exec failure is reported...\n";
    {
        Process p;
        bool caught = false;
        try
        {
            p.spawn("nonexistent_cmd_abc123", {});
        }
        catch (const ProcessError& e)
        {
            caught = true;
            assert(std::string(e.what()).find("nonexistent_cmd_abc123") != std::string::npos);
        }
        assert(caught);
        std::cout << "  [PASS] ProcessError thrown\n";
    }

    std::cout << "Test: find_executable...\n";
    {
        assert(find_executable("sh").has_value());
        assert(!find_executable("nonexistent_cmd_abc123").has_value());
        std::cout << "  [PASS] PATH lookup\n";
    }

    std::cout << "\n[OK] process tests passed\n";
    return 0;
}
