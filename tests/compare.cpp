#include "mcpdiff/compare.hpp"

#include <cassert>
#include <iostream>
#include <string>

using namespace mcpdiff;

static ToolResult structured(const Json& v)
{
    return StructuredResult{v};
}

static ToolResult error_result(const std::string& message)
{
    return ErrorResult{Json{{"code", -32603}, {"message", message}}};
}

static CompareOptions labelled()
{
    CompareOptions o;
    o.label_a = "Python";
    o.label_b = "TypeScript";
    return o;
}

int main()
{
    std::cout << "Test: identical shape, different values...\n";
    {
        Json a = {{"repositories", Json::array({Json{{"name", "x"}}, Json{{"name", "y"}}})},
                  {"count", 2},
                  {"workspace", "acme"}};
        Json b = {{"repositories", Json::array({Json{{"name", "p"}}, Json{{"name", "q"}}})},
                  {"count", 7},
                  {"workspace", "other"}};
        assert(compare_results(structured(a), structured(b)).empty());
        std::cout << "  [PASS] scalar values are not compared\n";
    }

    std::cout << "Test: comparing a result with itself...\n";
    {
        Json a = {{"items", Json::array({1, 2, 3})}, {"next", nullptr}};
        assert(compare_results(structured(a), structured(a)).empty());
        assert(compare_results(RawTextResult{"hello"}, RawTextResult{"hello"}).empty());
        std::cout << "  [PASS] reflexive\n";
    }

    std::cout << "Test: missing keys are reported for each side...\n";
    {
        Json a = {{"branches", Json::array()}, {"page", 1}, {"size", 10}};
        Json b = {{"branches", Json::array()}, {"next", "cursor"}};
        auto diffs = compare_results(structured(a), structured(b), labelled());
        assert(diffs.size() == 2);
        assert(diffs[0] == "Keys missing in TypeScript: [page, size]");
        assert(diffs[1] == "Keys missing in Python: [next]");
        std::cout << "  [PASS] " << diffs[0] << " / " << diffs[1] << "\n";
    }

    std::cout << "Test: array length mismatch...\n";
    {
        Json a = {{"branches", Json::array({1, 2, 3, 4, 5})}};
        Json b = {{"branches", Json::array({1, 2, 3, 4, 5, 6, 7})}};
        auto diffs = compare_results(structured(a), structured(b), labelled());
        assert(diffs.size() == 1);
        assert(diffs[0] == "Array 'branches' length differs: Python=5, TypeScript=7");
        std::cout << "  [PASS] " << diffs[0] << "\n";
    }

    std::cout << "Test: type mismatch...\n";
    {
        Json a = {{"owner", "team"}, {"size", 10}, {"ratio", 0.5}};
        Json b = {{"owner", Json{{"name", "team"}}}, {"size", 1.5}, {"ratio", 0.25}};
        auto diffs = compare_results(structured(a), structured(b));
        assert(diffs.size() == 2);
        assert(diffs[0] == "Type mismatch for 'owner': A=string, B=object");
        assert(diffs[1] == "Type mismatch for 'size': A=integer, B=float");

        auto arr_vs_null = compare_results(structured(Json{{"tags", Json::array()}}),
                                           structured(Json{{"tags", nullptr}}));
        assert(arr_vs_null.size() == 1);
        assert(arr_vs_null[0] == "Type mismatch for 'tags': A=array, B=null");
        std::cout << "  [PASS] shapes compared, values ignored\n";
    }

    std::cout << "Test: volatile fields are ignored...\n";
    {
        Json a = {{"name", "r"}, {"updated_on", "2024-01-01"}, {"created_on", "2023-01-01"}};
        Json b = {{"name", "r"}, {"date", 1700000000}, {"timestamp", "now"}, {"updated", 1}};
        assert(compare_results(structured(a), structured(b)).empty());

        CompareOptions strict;
        strict.ignore_fields.clear();
        assert(!compare_results(structured(a), structured(b), strict).empty());

        CompareOptions custom;
        custom.ignore_fields = {"etag"};
        Json c = {{"name", "r"}, {"etag", "abc"}};
        Json d = {{"name", "r"}};
        assert(compare_results(structured(c), structured(d), custom).empty());
        std::cout << "  [PASS] ignore list applied to key sets\n";
    }

    std::cout << "Test: nested structure is not inspected...\n";
    {
        Json a = {{"page", Json{{"values", Json::array({1})}, {"size", 1}}}};
        Json b = {{"page", Json{{"other", true}}}};
        assert(compare_results(structured(a), structured(b)).empty());
        std::cout << "  [PASS] only top-level keys\n";
    }

    std::cout << "Test: exactly one side errored...\n";
    {
        Json ok = {{"projects", Json::array()}};
        auto diffs = compare_results(structured(ok), error_result("boom"), labelled());
        assert(diffs.size() == 1);
        assert(diffs[0] == "TypeScript returned error, Python did not");

        diffs = compare_results(error_result("boom"), structured(ok), labelled());
        assert(diffs.size() == 1);
        assert(diffs[0] == "Python returned error, TypeScript did not");

        auto payload_error = compare_results(structured(Json{{"error", "not found"}}), structured(ok));
        assert(payload_error.size() == 1);
        assert(payload_error[0] == "A returned error, B did not");
        std::cout << "  [PASS] error asymmetry is the only difference\n";
    }

    std::cout << "Test: both sides errored...\n";
    {
        assert(compare_results(error_result("one"), error_result("two")).empty());
        assert(compare_results(error_result("one"), structured(Json{{"error", "two"}})).empty());
        std::cout << "  [PASS] treated as a match\n";
    }

    std::cout << "Test: raw text compared as a mapping...\n";
    {
        Json structured_value = {{"raw", "something"}};
        assert(compare_results(RawTextResult{"No items"}, RawTextResult{"Other text"}).empty());
        assert(compare_results(RawTextResult{"text"}, structured(structured_value)).empty());

        auto diffs = compare_results(RawTextResult{"text"}, structured(Json{{"items", Json::array()}}));
        assert(diffs.size() == 2);
        assert(diffs[0] == "Keys missing in B: [raw]");
        assert(diffs[1] == "Keys missing in A: [items]");
        std::cout << "  [PASS] {\"raw\": text}\n";
    }

    std::cout << "Test: non-object payloads are compared as a whole...\n";
    {
        auto diffs = compare_results(structured(Json::array({1, 2})), structured(Json::array({1})));
        assert(diffs.size() == 1);
        assert(diffs[0] == "Array 'result' length differs: A=2, B=1");

        diffs = compare_results(structured(Json::array()), structured(Json{{"items", 1}}));
        assert(diffs.size() == 1);
        assert(diffs[0] == "Type mismatch for 'result': A=array, B=object");

        assert(compare_results(structured(Json(3)), structured(Json(4))).empty());
        std::cout << "  [PASS] root compared under 'result'\n";
    }

    std::cout << "Test: tool set difference...\n";
    {
        std::vector<ToolInfo> a = {{"list_projects", Json::object()}, {"list_tags", Json::object()},
                                   {"get_pipeline_logs", Json::object()}};
        std::vector<ToolInfo> b = {{"list_tags", Json::object()}, {"list_projects", Json::object()},
                                   {"list_webhooks", Json::object()}, {"list_branches", Json::object()}};
        auto diff = compare_tool_sets(a, b);
        assert(!diff.matches());
        assert(diff.missing_in_b == std::vector<std::string>({"get_pipeline_logs"}));
        assert(diff.missing_in_a == std::vector<std::string>({"list_branches", "list_webhooks"}));

        assert(compare_tool_sets(a, a).matches());
        assert(compare_tool_sets({}, {}).matches());
        std::cout << "  [PASS] sorted set difference by name\n";
    }

    std::cout << "\n[OK] compare tests passed\n";
    return 0;
}
