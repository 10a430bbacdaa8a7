#include "sqlsense/tools/completion_log_formatter.hpp"

#include "sqlsense/catalog/catalog_errors.hpp"

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <chrono>
#include <string>

using Catch::Matchers::ContainsSubstring;
using namespace sqlsense;

namespace {

shell::CompletionMetrics make_metrics()
{
    shell::CompletionMetrics metrics{};
    metrics.smart = true;
    metrics.text = "SELECT \"fir\nst";
    metrics.cursor = 14U;
    metrics.word = "st";
    metrics.suggestion_kinds = {"column", "function"};
    metrics.completions = {"FIRST_NAME"};
    metrics.duration_ms = 1.5;
    metrics.correlation_id = "cmp-7";
    metrics.started_at = std::chrono::system_clock::time_point{std::chrono::seconds{1'700'000'000}};
    metrics.finished_at = metrics.started_at + std::chrono::microseconds{1500};
    metrics.diagnostics.push_back(parser::ContextDiagnostic{parser::ContextSeverity::Warning, "unable to tokenize statement", 3U});
    return metrics;
}

}  // namespace

TEST_CASE("completion log lines carry the request and its outcome")
{
    const auto json = tools::format_completion_log_json(make_metrics());

    CHECK(json.front() == '{');
    CHECK(json.back() == '}');
    CHECK(json.find('\n') == std::string::npos);
    CHECK_THAT(json, ContainsSubstring("\"event\":\"completion\""));
    CHECK_THAT(json, ContainsSubstring("\"correlation_id\":\"cmp-7\""));
    CHECK_THAT(json, ContainsSubstring("\"mode\":\"smart\""));
    CHECK_THAT(json, ContainsSubstring("\"text\":\"SELECT \\\"fir\\nst\""));
    CHECK_THAT(json, ContainsSubstring("\"cursor\":14"));
    CHECK_THAT(json, ContainsSubstring("\"suggestions\":[\"column\",\"function\"]"));
    CHECK_THAT(json, ContainsSubstring("\"completion_count\":1"));
    CHECK_THAT(json, ContainsSubstring("\"completions\":[\"FIRST_NAME\"]"));
    CHECK_THAT(json, ContainsSubstring("\"started_at\":\"2023-11-14T22:13:20.000000Z\""));
    CHECK_THAT(json, ContainsSubstring("\"finished_at\":\"2023-11-14T22:13:20.001500Z\""));
    CHECK_THAT(json,
               ContainsSubstring("\"diagnostics\":[{\"severity\":\"warning\",\"message\":\"unable to tokenize statement\",\"offset\":3}]"));
}

TEST_CASE("completion log marks dumb mode and missing timestamps")
{
    shell::CompletionMetrics metrics{};
    metrics.smart = false;
    const auto json = tools::format_completion_log_json(metrics);

    CHECK_THAT(json, ContainsSubstring("\"mode\":\"dumb\""));
    CHECK_THAT(json, ContainsSubstring("\"started_at\":null"));
    CHECK_THAT(json, ContainsSubstring("\"completions\":[]"));
    CHECK_THAT(json, ContainsSubstring("\"diagnostics\":[]"));
}

TEST_CASE("catalog diagnostics serialise their error category")
{
    catalog::CatalogDiagnostic diagnostic{};
    diagnostic.severity = catalog::DiagnosticSeverity::Error;
    diagnostic.error = catalog::make_error_code(catalog::CatalogErrc::SchemaNotFound);
    diagnostic.message = "table entry listed in unrecognized schema";
    diagnostic.schema = "NOWHERE";
    diagnostic.relation = "ORDERS";

    const auto json = tools::format_catalog_diagnostic_json(diagnostic);
    CHECK_THAT(json, ContainsSubstring("\"event\":\"catalog\""));
    CHECK_THAT(json, ContainsSubstring("\"severity\":\"error\""));
    CHECK_THAT(json, ContainsSubstring("\"error\":\"schema not found\""));
    CHECK_THAT(json, ContainsSubstring("\"category\":\"sqlsense.catalog\""));
    CHECK_THAT(json, ContainsSubstring("\"schema\":\"NOWHERE\""));
    CHECK_THAT(json, ContainsSubstring("\"relation\":\"ORDERS\""));
    CHECK_THAT(json, ContainsSubstring("\"logged_at\":\""));

    catalog::CatalogDiagnostic info{};
    info.severity = catalog::DiagnosticSeverity::Info;
    const auto plain = tools::format_catalog_diagnostic_json(info);
    CHECK_THAT(plain, ContainsSubstring("\"severity\":\"info\""));
    CHECK_THAT(plain, ContainsSubstring("\"error\":null"));
}

TEST_CASE("loader diagnostics serialise line and text")
{
    const shell::LoaderDiagnostic diagnostic{12U, "unknown directive 'bogus'", "bogus\tline"};
    const auto json = tools::format_loader_diagnostic_json(diagnostic);

    CHECK_THAT(json, ContainsSubstring("\"event\":\"metadata_loader\""));
    CHECK_THAT(json, ContainsSubstring("\"line\":12"));
    CHECK_THAT(json, ContainsSubstring("\"message\":\"unknown directive 'bogus'\""));
    CHECK_THAT(json, ContainsSubstring("\"text\":\"bogus\\tline\""));
}
