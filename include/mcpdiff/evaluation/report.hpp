#pragma once
/// @file evaluation/report.hpp
/// @brief Per-call outcomes and the final verdict of an evaluation run

#include "mcpdiff/tool_result.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace mcpdiff::evaluation
{

struct ComparisonOutcome
{
    std::string tool_name;
    bool success{true};
    /// Local failure (exception) while invoking the tool
    std::optional<std::string> error_message;
    /// Reported divergence; empty when the results matched
    std::vector<std::string> differences;
    std::optional<ToolResult> primary_result;
    std::optional<ToolResult> secondary_result;
};

/// Tool listing comparison; informational, does not affect the verdict
struct ToolSetReport
{
    bool compared{false};
    std::size_t primary_count{0};
    std::size_t secondary_count{0};
    std::vector<std::string> missing_in_primary;
    std::vector<std::string> missing_in_secondary;

    bool matches() const
    {
        return missing_in_primary.empty() && missing_in_secondary.empty();
    }
};

/// Immutable once produced
class EvaluationReport
{
  public:
    EvaluationReport(std::vector<ComparisonOutcome> results, ToolSetReport tool_set,
                     std::optional<std::string> sample_resource);

    const std::vector<ComparisonOutcome>& results() const
    {
        return results_;
    }

    const ToolSetReport& tool_set() const
    {
        return tool_set_;
    }

    const std::optional<std::string>& sample_resource() const
    {
        return sample_resource_;
    }

    std::size_t passed() const;
    std::size_t failed() const;

    /// True iff every planned call succeeded with no differences
    bool success() const
    {
        return failed() == 0;
    }

  private:
    std::vector<ComparisonOutcome> results_;
    ToolSetReport tool_set_;
    std::optional<std::string> sample_resource_;
};

/// Banner, pass/fail tally and the detail of every failed call
void print_summary(std::ostream& out, const EvaluationReport& report);

} // namespace mcpdiff::evaluation
