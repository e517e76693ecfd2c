#include <catch2/catch_test_macros.hpp>

#include <ctekit/cli/output_formatter.hpp>

#include <nlohmann/json.hpp>

#include <sstream>
#include <string>

using namespace ctekit;

// ===========================================================================
// PrintTable
// ===========================================================================

TEST_CASE("OutputFormatter: plain table aligns columns", "[cli][output]") {
    std::ostringstream out, err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintTable({"CTE", "Dependencies"},
                   {{"funnel_analysis", "conversion_events"}, {"base", "-"}});

    CHECK(out.str() ==
          "CTE              Dependencies     \n"
          "---------------  -----------------\n"
          "funnel_analysis  conversion_events\n"
          "base             -                \n");
    CHECK(err.str().empty());
}

TEST_CASE("OutputFormatter: JSON table is an array of objects", "[cli][output]") {
    std::ostringstream out, err;
    OutputFormatter fmt(true, false, out, err);

    fmt.PrintTable({"Name", "Dependencies"}, {{"a", "b, c"}, {"b", ""}});

    auto j = nlohmann::json::parse(out.str());
    REQUIRE(j.is_array());
    REQUIRE(j.size() == 2);
    CHECK(j[0]["Name"] == "a");
    CHECK(j[0]["Dependencies"] == "b, c");
    CHECK(j[1]["Dependencies"] == "");
}

TEST_CASE("OutputFormatter: JSON mode disables color", "[cli][output]") {
    std::ostringstream out, err;
    OutputFormatter fmt(true, true, out, err);
    CHECK(fmt.IsJsonMode());
    CHECK_FALSE(fmt.IsColorMode());
}

TEST_CASE("OutputFormatter: color table renders every cell", "[cli][output]") {
    std::ostringstream out, err;
    OutputFormatter fmt(false, true, out, err);

    fmt.PrintTable({"Name", "Description"}, {{"session_data", "one row per session"}});

    auto output = out.str();
    CHECK(output.find("Name") != std::string::npos);
    CHECK(output.find("session_data") != std::string::npos);
    CHECK(output.find("one row per session") != std::string::npos);
}

// ===========================================================================
// PrintList / PrintText / PrintJson
// ===========================================================================

TEST_CASE("OutputFormatter: list one per line or JSON array", "[cli][output]") {
    std::ostringstream plain_out, plain_err;
    OutputFormatter(false, false, plain_out, plain_err).PrintList({"b", "a"});
    CHECK(plain_out.str() == "b\na\n");

    std::ostringstream json_out, json_err;
    OutputFormatter(true, false, json_out, json_err).PrintList({"b", "a"});
    CHECK(json_out.str() == "[\"b\",\"a\"]\n");

    std::ostringstream empty_out, empty_err;
    OutputFormatter(true, false, empty_out, empty_err).PrintList({});
    CHECK(empty_out.str() == "[]\n");
}

TEST_CASE("OutputFormatter: text is printed verbatim", "[cli][output]") {
    std::ostringstream out, err;
    OutputFormatter fmt(false, true, out, err);
    fmt.PrintText("WITH a AS (\n    SELECT 1\n)\nSELECT * FROM a");
    CHECK(out.str() == "WITH a AS (\n    SELECT 1\n)\nSELECT * FROM a\n");
}

TEST_CASE("OutputFormatter: PrintJson pretty-prints", "[cli][output]") {
    std::ostringstream out, err;
    OutputFormatter fmt(true, false, out, err);
    fmt.PrintJson({{"valid", true}});
    CHECK(out.str() == "{\n  \"valid\": true\n}\n");
}

// ===========================================================================
// PrintError
// ===========================================================================

TEST_CASE("OutputFormatter: plain error with cycle path", "[cli][output]") {
    std::ostringstream out, err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintError(Error::CircularDependency("OrderForTarget", {"a", "b", "a"}));

    auto text = err.str();
    CHECK(text.find("Error: OrderForTarget [a]") != std::string::npos);
    CHECK(text.find("  Cycle: a -> b -> a\n") != std::string::npos);
    CHECK(out.str().empty());
}

TEST_CASE("OutputFormatter: plain error without subject", "[cli][output]") {
    std::ostringstream out, err;
    OutputFormatter fmt(false, false, out, err);

    fmt.PrintError(Error{"ctekit sql compose", "", "Workspace has no main query",
                         ErrorCategory::Config, {}});

    CHECK(err.str() == "Error: ctekit sql compose\n  Workspace has no main query\n");
}

TEST_CASE("OutputFormatter: JSON error goes to stderr", "[cli][output]") {
    std::ostringstream out, err;
    OutputFormatter fmt(true, false, out, err);

    fmt.PrintError(Error::NotFound("OrderForTarget", "missing"));

    auto j = nlohmann::json::parse(err.str());
    CHECK(j["error"]["category"] == "not_found");
    CHECK(j["error"]["subject"] == "missing");
    CHECK(out.str().empty());
}

TEST_CASE("OutputFormatter: color error carries ANSI codes", "[cli][output]") {
    std::ostringstream out, err;
    OutputFormatter fmt(false, true, out, err);

    fmt.PrintError(Error::CircularDependency("CheckNoCycles", {"x", "x"}));

    CHECK(err.str().find("\033[") != std::string::npos);
    CHECK(err.str().find("x -> x") != std::string::npos);
}

// ===========================================================================
// PrintWarning / PrintSuccess
// ===========================================================================

TEST_CASE("OutputFormatter: warnings are silent in JSON mode", "[cli][output]") {
    std::ostringstream out, err;
    OutputFormatter(true, false, out, err).PrintWarning("dangling reference");
    CHECK(err.str().empty());

    std::ostringstream plain_out, plain_err;
    OutputFormatter(false, false, plain_out, plain_err).PrintWarning("dangling reference");
    CHECK(plain_err.str() == "Warning: dangling reference\n");
}

TEST_CASE("OutputFormatter: success message", "[cli][output]") {
    std::ostringstream plain_out, plain_err;
    OutputFormatter(false, false, plain_out, plain_err).PrintSuccess("No cycles");
    CHECK(plain_out.str() == "No cycles\n");

    std::ostringstream json_out, json_err;
    OutputFormatter(true, false, json_out, json_err).PrintSuccess("No cycles");
    auto j = nlohmann::json::parse(json_out.str());
    CHECK(j["success"] == true);
    CHECK(j["message"] == "No cycles");
}
