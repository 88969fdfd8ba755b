#include "mcpdiff/evaluation/evaluator.hpp"

#include "mcpdiff/client/tool_client.hpp"
#include "mcpdiff/exceptions.hpp"
#include "mcpdiff/util/log.hpp"

#include <iostream>

namespace mcpdiff::evaluation
{

namespace
{

// Discards everything; stands in when no progress stream was given
class NullBuffer : public std::streambuf
{
  protected:
    int overflow(int c) override
    {
        return c;
    }
};

std::string join(const std::vector<std::string>& items)
{
    std::string out;
    for (size_t i = 0; i < items.size(); ++i)
        out += (i ? ", " : "") + items[i];
    return out;
}

} // namespace

std::string to_string(EvaluationState state)
{
    switch (state)
    {
    case EvaluationState::Idle:
        return "idle";
    case EvaluationState::StartingSessions:
        return "starting-sessions";
    case EvaluationState::ListingTools:
        return "listing-tools";
    case EvaluationState::DiscoveringSampleResource:
        return "discovering-sample-resource";
    case EvaluationState::RunningFixedPlan:
        return "running-fixed-plan";
    case EvaluationState::StoppingSessions:
        return "stopping-sessions";
    case EvaluationState::Done:
        return "done";
    }
    return "unknown";
}

Evaluator::Evaluator(std::unique_ptr<client::Session> primary,
                     std::unique_ptr<client::Session> secondary, EvaluationOptions options)
    : primary_(std::move(primary)), secondary_(std::move(secondary)), options_(std::move(options))
{
    if (!primary_)
        throw Error("Evaluator requires a primary session");
    options_.compare.label_b = primary_->label();
    if (secondary_)
        options_.compare.label_a = secondary_->label();
}

std::ostream& Evaluator::progress()
{
    static NullBuffer null_buffer;
    static std::ostream null_stream(&null_buffer);
    return options_.progress ? *options_.progress : null_stream;
}

EvaluationReport Evaluator::run()
{
    if (state_ != EvaluationState::Idle)
        throw Error("evaluation has already run (state: " + to_string(state_) + ")");

    // Sessions are released on every exit path
    struct StopGuard
    {
        Evaluator* self;
        ~StopGuard()
        {
            self->stop_sessions();
        }
    } guard{this};

    start_sessions();
    ToolSetReport tool_set = list_tools();

    std::optional<std::string> sample = options_.sample_resource;
    if (!sample)
        sample = discover_sample_resource();

    state_ = EvaluationState::RunningFixedPlan;
    progress() << "\n--- Testing Read-Only Tools ---\n";

    std::vector<ComparisonOutcome> results;
    const auto& plan = options_.plan;
    for (const auto& call : plan.calls)
    {
        progress() << "\nTesting: " << call.tool << "\n";
        results.push_back(run_call(call.tool, call.arguments));
    }

    if (sample)
    {
        for (const auto& call : plan.repo_calls)
        {
            progress() << "\nTesting: " << call.tool << " (repo=" << *sample << ")\n";
            results.push_back(run_call(call.tool, plan.scoped_arguments(call, *sample)));
        }
    }

    return EvaluationReport(std::move(results), std::move(tool_set), std::move(sample));
}

void Evaluator::start_sessions()
{
    state_ = EvaluationState::StartingSessions;
    progress() << "Starting MCP servers...\n";

    primary_->start();
    progress() << "  [OK] " << primary_->label() << " server started\n";

    if (secondary_)
    {
        secondary_->start();
        progress() << "  [OK] " << secondary_->label() << " server started\n";
    }
}

ToolSetReport Evaluator::list_tools()
{
    state_ = EvaluationState::ListingTools;
    progress() << "\n--- Tool Listing ---\n";

    ToolSetReport report;
    client::ToolClient primary_client(*primary_);
    auto primary_tools = primary_client.list_tools();
    report.primary_count = primary_tools.size();
    progress() << primary_->label() << ": " << primary_tools.size() << " tools\n";

    if (!secondary_)
        return report;

    client::ToolClient secondary_client(*secondary_);
    auto secondary_tools = secondary_client.list_tools();
    report.secondary_count = secondary_tools.size();
    progress() << secondary_->label() << ": " << secondary_tools.size() << " tools\n";

    auto diff = compare_tool_sets(primary_tools, secondary_tools);
    report.compared = true;
    report.missing_in_primary = diff.missing_in_a;
    report.missing_in_secondary = diff.missing_in_b;

    if (!report.missing_in_primary.empty())
        progress() << "  [WARN] Missing in " << primary_->label() << ": "
                   << join(report.missing_in_primary) << "\n";
    if (!report.missing_in_secondary.empty())
        progress() << "  [WARN] Missing in " << secondary_->label() << ": "
                   << join(report.missing_in_secondary) << "\n";
    if (report.matches())
        progress() << "  [OK] Tool sets match!\n";
    return report;
}

std::optional<std::string> Evaluator::discover_sample_resource()
{
    state_ = EvaluationState::DiscoveringSampleResource;
    progress() << "\n--- Finding test repository ---\n";

    const auto& step = options_.plan.discovery;
    try
    {
        client::ToolClient client(*primary_);
        auto result = client.call_tool(step.tool, step.arguments);
        auto* structured = std::get_if<StructuredResult>(&result);
        if (structured && structured->value.is_object())
        {
            auto it = structured->value.find(step.collection);
            if (it != structured->value.end() && it->is_array() && !it->empty())
            {
                const auto& first = it->front();
                if (first.is_object() && first.contains(step.field) && first[step.field].is_string())
                {
                    auto name = first[step.field].get<std::string>();
                    progress() << "  Using repository: " << name << "\n";
                    return name;
                }
            }
        }
    }
    catch (const Error& e)
    {
        log::warn(std::string("sample resource discovery failed: ") + e.what());
    }
    catch (const Json::exception& e)
    {
        log::warn(std::string("sample resource discovery failed: ") + e.what());
    }

    progress() << "  [WARN] No repositories found, skipping repo-specific tests\n";
    return std::nullopt;
}

void Evaluator::report_side(const std::string& label, const ToolResult& result)
{
    if (auto* err = std::get_if<ErrorResult>(&result))
        progress() << "  " << label << ": [WARN] " << err->error.dump() << "\n";
    else if (carries_error(result))
        progress() << "  " << label << ": [WARN] " << as_json(result)["error"].dump() << "\n";
    else
        progress() << "  " << label << ": [OK]\n";
}

ComparisonOutcome Evaluator::run_call(const std::string& tool, const Json& arguments)
{
    ComparisonOutcome outcome;
    outcome.tool_name = tool;

    try
    {
        client::ToolClient primary_client(*primary_);
        outcome.primary_result = primary_client.call_tool(tool, arguments);
        report_side(primary_->label(), *outcome.primary_result);

        if (secondary_)
        {
            client::ToolClient secondary_client(*secondary_);
            outcome.secondary_result = secondary_client.call_tool(tool, arguments);
            report_side(secondary_->label(), *outcome.secondary_result);

            outcome.differences =
                compare_results(*outcome.secondary_result, *outcome.primary_result, options_.compare);
            if (outcome.differences.empty())
            {
                progress() << "  [OK] Results match\n";
            }
            else
            {
                outcome.success = false;
                progress() << "  Differences: " << join(outcome.differences) << "\n";
            }
        }
    }
    catch (const std::exception& e)
    {
        // One call's failure never aborts the rest of the plan
        outcome.success = false;
        outcome.error_message = e.what();
        progress() << "  [FAIL] Error: " << e.what() << "\n";
    }

    return outcome;
}

void Evaluator::stop_sessions() noexcept
{
    state_ = EvaluationState::StoppingSessions;
    progress() << "\n--- Stopping servers ---\n";

    primary_->stop();
    progress() << "  [OK] " << primary_->label() << " server stopped\n";
    if (secondary_)
    {
        secondary_->stop();
        progress() << "  [OK] " << secondary_->label() << " server stopped\n";
    }
    state_ = EvaluationState::Done;
}

} // namespace mcpdiff::evaluation
