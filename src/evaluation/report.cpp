#include "mcpdiff/evaluation/report.hpp"

#include <algorithm>

namespace mcpdiff::evaluation
{

EvaluationReport::EvaluationReport(std::vector<ComparisonOutcome> results, ToolSetReport tool_set,
                                   std::optional<std::string> sample_resource)
    : results_(std::move(results)), tool_set_(std::move(tool_set)),
      sample_resource_(std::move(sample_resource))
{
}

std::size_t EvaluationReport::passed() const
{
    return static_cast<std::size_t>(std::count_if(results_.begin(), results_.end(),
                                                  [](const auto& r) { return r.success; }));
}

std::size_t EvaluationReport::failed() const
{
    return results_.size() - passed();
}

void print_summary(std::ostream& out, const EvaluationReport& report)
{
    const std::string rule(60, '=');
    out << "\n" << rule << "\n";
    out << "EVALUATION SUMMARY\n";
    out << rule << "\n";

    out << "\nTotal tests: " << report.results().size() << "\n";
    out << "Passed: " << report.passed() << "\n";
    out << "Failed: " << report.failed() << "\n";

    if (report.failed() > 0)
    {
        out << "\nFailed tests:\n";
        for (const auto& r : report.results())
        {
            if (r.success)
                continue;
            out << "  - " << r.tool_name << "\n";
            if (r.error_message)
                out << "    Error: " << *r.error_message << "\n";
            for (const auto& d : r.differences)
                out << "    Diff: " << d << "\n";
        }
    }
    out.flush();
}

} // namespace mcpdiff::evaluation
