#pragma once
/// @file compare.hpp
/// @brief Structural comparison of two implementations' results
/// @details Only shape is compared: top-level key sets, the length of
///          sequence-valued fields and the JSON type of each shared field.
///          Scalar values are never compared, and two errors always match.

#include "mcpdiff/tool_result.hpp"
#include "mcpdiff/types.hpp"

#include <set>
#include <string>
#include <vector>

namespace mcpdiff
{

/// Timestamp-like fields that legitimately differ between runs
const std::set<std::string>& default_volatile_fields();

struct CompareOptions
{
    std::set<std::string> ignore_fields = default_volatile_fields();
    std::string label_a{"A"};
    std::string label_b{"B"};
};

/// Human-readable differences between `a` and `b`; empty means no divergence.
std::vector<std::string> compare_results(const ToolResult& a, const ToolResult& b,
                                         const CompareOptions& options = {});

/// Name-projection set difference between two tool listings
struct ToolSetDiff
{
    std::vector<std::string> missing_in_a; ///< Present in b only, sorted
    std::vector<std::string> missing_in_b; ///< Present in a only, sorted

    bool matches() const
    {
        return missing_in_a.empty() && missing_in_b.empty();
    }
};

ToolSetDiff compare_tool_sets(const std::vector<ToolInfo>& a, const std::vector<ToolInfo>& b);

} // namespace mcpdiff
