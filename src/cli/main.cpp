#include "mcpdiff/client/session.hpp"
#include "mcpdiff/client/tool_client.hpp"
#include "mcpdiff/evaluation/evaluator.hpp"
#include "mcpdiff/exceptions.hpp"
#include "mcpdiff/settings.hpp"
#include "mcpdiff/util/log.hpp"
#include "mcpdiff/version.hpp"

#include "internal/process.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

static constexpr int EXIT_MISMATCH = 1;
static constexpr int EXIT_USAGE = 2;
static constexpr int EXIT_FATAL = 3;

static int usage(int exit_code = EXIT_USAGE)
{
    std::cout << "mcpdiff " << mcpdiff::VERSION_STRING << "\n";
    std::cout << "Usage:\n";
    std::cout << "  mcpdiff --help\n";
    std::cout << "  mcpdiff [run] [server options] [--single] [--repo <slug>] [--plan <file.json>]\n";
    std::cout << "          [--root <dir>] [--timeout-ms <n>]\n";
    std::cout << "  mcpdiff probe [--stdio <command>] [--stdio-arg <arg>]... [--cwd <dir>]\n";
    std::cout << "          [--label <name>] [--expect-config-error] [--timeout-ms <n>]\n";
    std::cout << "\n";
    std::cout << "Server options (run):\n";
    std::cout << "  --primary <command>          Primary server (default: node <root>/typescript/dist/index.js)\n";
    std::cout << "    --primary-arg <arg>        Repeatable args for --primary\n";
    std::cout << "    --primary-cwd <dir>        Working directory of the primary server\n";
    std::cout << "    --primary-label <name>     Label used in reports (default: TypeScript)\n";
    std::cout << "  --secondary <command>        Secondary server (default: uv run python -m src.server)\n";
    std::cout << "    --secondary-arg <arg>      Repeatable args for --secondary\n";
    std::cout << "    --secondary-cwd <dir>      Working directory (default: <root>/python)\n";
    std::cout << "    --secondary-label <name>   Label used in reports (default: Python)\n";
    std::cout << "  --single                     Only run the primary server\n";
    std::cout << "\n";
    std::cout << "Environment:\n";
    std::cout << "  BITBUCKET_WORKSPACE, BITBUCKET_EMAIL, BITBUCKET_API_TOKEN   required by run\n";
    std::cout << "  MCPDIFF_LOG_LEVEL, MCPDIFF_READ_TIMEOUT_MS, MCPDIFF_STOP_GRACE_MS\n";
    std::cout << "\n";
    std::cout << "Exit status: 0 all calls matched, 1 differences or call errors,\n";
    std::cout << "             2 usage or configuration error, 3 fatal run error\n";
    return exit_code;
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static std::vector<std::string> consume_flag_values(std::vector<std::string>& args,
                                                    const std::string& flag)
{
    std::vector<std::string> values;
    while (auto v = consume_flag_value(args, flag))
        values.push_back(*v);
    return values;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static std::optional<long long> parse_positive(const std::string& s)
{
    try
    {
        size_t pos = 0;
        long long v = std::stoll(s, &pos, 10);
        if (pos != s.size() || v <= 0)
            return std::nullopt;
        return v;
    }
    catch (const std::exception&)
    {
        return std::nullopt;
    }
}

/// Applies --timeout-ms; false when the value is invalid
static bool apply_timeout(std::vector<std::string>& args, mcpdiff::Settings& settings)
{
    auto timeout = consume_flag_value(args, "--timeout-ms");
    if (!timeout)
        return true;
    auto ms = parse_positive(*timeout);
    if (!ms)
    {
        std::cerr << "Invalid --timeout-ms: " << *timeout << "\n";
        return false;
    }
    settings.read_timeout = std::chrono::milliseconds(*ms);
    return true;
}

struct ServerEntry
{
    std::string label;
    mcpdiff::ServerCommand command;
    bool is_default = false;
};

static ServerEntry parse_server(std::vector<std::string>& args, const std::string& role,
                               ServerEntry defaults)
{
    ServerEntry entry = std::move(defaults);
    entry.is_default = true;
    if (auto cmd = consume_flag_value(args, "--" + role))
    {
        entry.command.executable = *cmd;
        entry.command.args = consume_flag_values(args, "--" + role + "-arg");
        entry.command.working_directory.clear();
        entry.is_default = false;
    }
    if (auto cwd = consume_flag_value(args, "--" + role + "-cwd"))
        entry.command.working_directory = *cwd;
    if (auto label = consume_flag_value(args, "--" + role + "-label"))
        entry.label = *label;
    return entry;
}

static bool check_executable(const ServerEntry& entry)
{
    if (mcpdiff::process::find_executable(entry.command.executable))
        return true;
    std::cerr << "Error: " << entry.label << " command not found: " << entry.command.executable
              << "\n";
    return false;
}

static std::string describe(const mcpdiff::ServerCommand& command)
{
    std::string out = command.executable;
    for (const auto& a : command.args)
        out += " " + a;
    if (!command.working_directory.empty())
        out += "  (in " + command.working_directory + ")";
    return out;
}

static std::unique_ptr<mcpdiff::client::Session> make_session(const ServerEntry& entry,
                                                              const mcpdiff::Settings& settings)
{
    return std::make_unique<mcpdiff::client::Session>(
        entry.label, mcpdiff::client::stdio_transport_factory(entry.label, entry.command, settings),
        settings);
}

static int run_command(std::vector<std::string> args, mcpdiff::Settings settings)
{
    namespace fs = std::filesystem;
    using namespace mcpdiff;

    if (!apply_timeout(args, settings))
        return EXIT_USAGE;

    fs::path root = consume_flag_value(args, "--root").value_or(".");
    bool single = consume_flag(args, "--single");
    auto repo = consume_flag_value(args, "--repo");
    auto plan_path = consume_flag_value(args, "--plan");

    fs::path ts_dist = root / "typescript" / "dist" / "index.js";
    ServerEntry primary =
        parse_server(args, "primary", {"TypeScript", {"node", {ts_dist.string()}, "", {}}, true});
    ServerEntry secondary = parse_server(
        args, "secondary",
        {"Python", {"uv", {"run", "python", "-m", "src.server"}, (root / "python").string(), {}},
         true});

    if (!args.empty())
    {
        std::cerr << "Unknown option: " << args.front() << "\n";
        return usage();
    }

    // Preconditions are checked before anything is spawned
    auto credentials = Credentials::from_env();
    auto missing = credentials.missing();
    if (!missing.empty())
    {
        std::cout << "Error: Missing required environment variables:";
        for (const auto& m : missing)
            std::cout << " " << m;
        std::cout << "\n\nSet them with:\n";
        std::cout << "  export BITBUCKET_WORKSPACE=your-workspace\n";
        std::cout << "  export BITBUCKET_EMAIL=your-email@example.com\n";
        std::cout << "  export BITBUCKET_API_TOKEN=your-api-token\n";
        return EXIT_USAGE;
    }

    if (primary.is_default && !fs::exists(ts_dist))
    {
        std::cout << "Error: TypeScript build not found at " << ts_dist.string() << "\n";
        std::cout << "Run: cd typescript && npm run build\n";
        return EXIT_USAGE;
    }
    if (!check_executable(primary) || (!single && !check_executable(secondary)))
        return EXIT_USAGE;

    evaluation::EvaluationOptions options;
    try
    {
        if (plan_path)
            options.plan = evaluation::TestPlan::load(*plan_path);
    }
    catch (const ConfigError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
    options.sample_resource = repo;
    options.progress = &std::cout;

    auto env = credentials.to_environment();
    primary.command.environment.insert(env.begin(), env.end());
    secondary.command.environment.insert(env.begin(), env.end());

    const std::string rule(60, '=');
    std::cout << rule << "\n";
    std::cout << "MCP DIFFERENTIAL EVALUATION\n";
    std::cout << rule << "\n";
    std::cout << "\nWorkspace: " << credentials.workspace << "\n";
    std::cout << primary.label << ": " << describe(primary.command) << "\n";
    if (!single)
        std::cout << secondary.label << ": " << describe(secondary.command) << "\n";

    evaluation::Evaluator evaluator(make_session(primary, settings),
                                    single ? nullptr : make_session(secondary, settings),
                                    std::move(options));
    try
    {
        auto report = evaluator.run();
        evaluation::print_summary(std::cout, report);
        return report.success() ? EXIT_SUCCESS : EXIT_MISMATCH;
    }
    catch (const Error& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_FATAL;
    }
}

static int probe_command(std::vector<std::string> args, mcpdiff::Settings settings)
{
    using namespace mcpdiff;

    if (!apply_timeout(args, settings))
        return EXIT_USAGE;

    ServerEntry entry;
    entry.label = consume_flag_value(args, "--label").value_or("server");
    entry.command.executable = consume_flag_value(args, "--stdio").value_or("node");
    entry.command.args = consume_flag_values(args, "--stdio-arg");
    if (entry.command.args.empty() && entry.command.executable == "node")
        entry.command.args = {"typescript/dist/index.js"};
    entry.command.working_directory = consume_flag_value(args, "--cwd").value_or("");
    bool expect_config_error = consume_flag(args, "--expect-config-error");

    if (!args.empty())
    {
        std::cerr << "Unknown option: " << args.front() << "\n";
        return usage();
    }

    std::cout << "\nTesting " << entry.label << " server startup...\n";
    client::Session session(
        entry.label, client::stdio_transport_factory(entry.label, entry.command, settings), settings);

    int status = EXIT_SUCCESS;
    try
    {
        session.start();
        if (session.initialize_failed())
        {
            if (expect_config_error)
            {
                std::cout << "  [OK] Server responded with expected config error\n";
            }
            else
            {
                std::cout << "  [FAIL] Error: " << session.initialize_response()["error"].dump()
                          << "\n";
                status = EXIT_MISMATCH;
            }
        }
        else
        {
            const auto& result = session.initialize_response().value("result", Json::object());
            const auto info = result.value("serverInfo", Json::object());
            std::cout << "  [OK] Server initialized successfully\n";
            std::cout << "    Server: " << info.value("name", std::string("unknown")) << "\n";
            std::cout << "    Version: " << info.value("version", std::string("unknown")) << "\n";

            client::ToolClient tools(session);
            std::cout << "  [OK] Listed " << tools.list_tools().size() << " tools\n";
        }
    }
    catch (const TransportError& e)
    {
        std::string message = e.what();
        if (expect_config_error && message.find("Configuration error") != std::string::npos)
        {
            std::cout << "  [OK] Server exited with expected config error\n";
        }
        else
        {
            std::cout << "  [FAIL] " << message << "\n";
            status = EXIT_MISMATCH;
        }
    }
    catch (const Error& e)
    {
        std::cout << "  [FAIL] " << e.what() << "\n";
        status = EXIT_MISMATCH;
    }
    session.stop();

    if (status == EXIT_SUCCESS)
        std::cout << "\n[OK] All startup tests passed!\n";
    return status;
}

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    if (!args.empty() && (args[0] == "--help" || args[0] == "-h" || args[0] == "help"))
        return usage(EXIT_SUCCESS);

    mcpdiff::Settings settings = mcpdiff::Settings::from_env();
    mcpdiff::log::set_level(mcpdiff::log::parse_level(settings.log_level));

    if (!args.empty() && args[0] == "probe")
        return probe_command(std::vector<std::string>(args.begin() + 1, args.end()), settings);
    if (!args.empty() && args[0] == "run")
        args.erase(args.begin());
    return run_command(std::move(args), settings);
}
