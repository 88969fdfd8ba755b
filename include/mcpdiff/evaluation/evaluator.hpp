#pragma once
/// @file evaluation/evaluator.hpp
/// @brief Drives the test plan across one or two sessions
/// @details The primary session is always run and is used for discovery. With a
///          secondary session every call is issued to the primary, awaited, then
///          issued to the secondary, and the results are compared with the
///          secondary as side A and the primary as side B. Both sessions are
///          stopped before run() returns, including when it throws.

#include "mcpdiff/client/session.hpp"
#include "mcpdiff/compare.hpp"
#include "mcpdiff/evaluation/plan.hpp"
#include "mcpdiff/evaluation/report.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace mcpdiff::evaluation
{

enum class EvaluationState
{
    Idle,
    StartingSessions,
    ListingTools,
    DiscoveringSampleResource,
    RunningFixedPlan,
    StoppingSessions,
    Done,
};

std::string to_string(EvaluationState state);

struct EvaluationOptions
{
    TestPlan plan = TestPlan::builtin();
    /// Labels are taken from the sessions; only the ignore list is used
    CompareOptions compare;
    /// Skips discovery when set
    std::optional<std::string> sample_resource;
    /// Human-readable progress (nullptr for silence). Caller keeps ownership.
    std::ostream* progress = nullptr;
};

class Evaluator
{
  public:
    /// @param secondary nullptr selects single-implementation mode
    Evaluator(std::unique_ptr<client::Session> primary, std::unique_ptr<client::Session> secondary,
              EvaluationOptions options = {});

    /// Run the plan once.
    /// @throws the session's error when a session fails to start, or ToolListError,
    ///         after both sessions have been stopped
    EvaluationReport run();

    EvaluationState state() const
    {
        return state_;
    }

    const client::Session& primary() const
    {
        return *primary_;
    }

    /// nullptr in single-implementation mode
    const client::Session* secondary() const
    {
        return secondary_.get();
    }

  private:
    void start_sessions();
    ToolSetReport list_tools();
    std::optional<std::string> discover_sample_resource();
    ComparisonOutcome run_call(const std::string& tool, const Json& arguments);
    void stop_sessions() noexcept;
    void report_side(const std::string& label, const ToolResult& result);

    std::ostream& progress();

    std::unique_ptr<client::Session> primary_;
    std::unique_ptr<client::Session> secondary_;
    EvaluationOptions options_;
    EvaluationState state_ = EvaluationState::Idle;
};

} // namespace mcpdiff::evaluation
