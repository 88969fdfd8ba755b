#include "mcpdiff/compare.hpp"

#include "mcpdiff/util/json.hpp"

#include <algorithm>
#include <iterator>

namespace mcpdiff
{

namespace
{

constexpr const char* ROOT_KEY = "result";

std::set<std::string> key_set(const Json& obj, const std::set<std::string>& ignore)
{
    std::set<std::string> keys;
    for (auto it = obj.begin(); it != obj.end(); ++it)
        if (!ignore.count(it.key()))
            keys.insert(it.key());
    return keys;
}

std::string format_keys(const std::vector<std::string>& keys)
{
    std::string out = "[";
    for (size_t i = 0; i < keys.size(); ++i)
    {
        if (i > 0)
            out += ", ";
        out += keys[i];
    }
    return out + "]";
}

std::vector<std::string> minus(const std::set<std::string>& lhs, const std::set<std::string>& rhs)
{
    std::vector<std::string> out;
    std::set_difference(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), std::back_inserter(out));
    return out;
}

// Appends the difference (if any) between two values found under `key`
void compare_values(const std::string& key, const Json& a, const Json& b,
                    const CompareOptions& options, std::vector<std::string>& out)
{
    if (a.is_array() && b.is_array())
    {
        if (a.size() != b.size())
            out.push_back("Array '" + key + "' length differs: " + options.label_a + "=" +
                          std::to_string(a.size()) + ", " + options.label_b + "=" +
                          std::to_string(b.size()));
        return;
    }

    auto shape_a = util::json::shape_name(a);
    auto shape_b = util::json::shape_name(b);
    if (shape_a != shape_b)
        out.push_back("Type mismatch for '" + key + "': " + options.label_a + "=" + shape_a + ", " +
                      options.label_b + "=" + shape_b);
}

} // namespace

const std::set<std::string>& default_volatile_fields()
{
    static const std::set<std::string> fields = {"updated",    "created", "created_on",
                                                 "updated_on", "date",    "timestamp"};
    return fields;
}

std::vector<std::string> compare_results(const ToolResult& a, const ToolResult& b,
                                         const CompareOptions& options)
{
    std::vector<std::string> differences;

    const bool a_err = carries_error(a);
    const bool b_err = carries_error(b);
    if (a_err && !b_err)
        return {options.label_a + " returned error, " + options.label_b + " did not"};
    if (!a_err && b_err)
        return {options.label_b + " returned error, " + options.label_a + " did not"};
    if (a_err && b_err)
        return {};

    const Json va = as_json(a);
    const Json vb = as_json(b);

    // A decoded payload need not be a mapping; compare such values as a whole
    if (!va.is_object() || !vb.is_object())
    {
        compare_values(ROOT_KEY, va, vb, options, differences);
        return differences;
    }

    const auto keys_a = key_set(va, options.ignore_fields);
    const auto keys_b = key_set(vb, options.ignore_fields);

    auto missing_in_b = minus(keys_a, keys_b);
    auto missing_in_a = minus(keys_b, keys_a);
    if (!missing_in_b.empty())
        differences.push_back("Keys missing in " + options.label_b + ": " + format_keys(missing_in_b));
    if (!missing_in_a.empty())
        differences.push_back("Keys missing in " + options.label_a + ": " + format_keys(missing_in_a));

    for (const auto& key : keys_a)
    {
        if (!keys_b.count(key))
            continue;
        compare_values(key, va.at(key), vb.at(key), options, differences);
    }

    return differences;
}

ToolSetDiff compare_tool_sets(const std::vector<ToolInfo>& a, const std::vector<ToolInfo>& b)
{
    std::set<std::string> names_a;
    std::set<std::string> names_b;
    for (const auto& t : a)
        names_a.insert(t.name);
    for (const auto& t : b)
        names_b.insert(t.name);

    ToolSetDiff diff;
    diff.missing_in_b = minus(names_a, names_b);
    diff.missing_in_a = minus(names_b, names_a);
    return diff;
}

} // namespace mcpdiff
