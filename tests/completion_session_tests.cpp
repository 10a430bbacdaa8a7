#include "sqlsense/shell/completion_session.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace sqlsense::shell;
using sqlsense::completion::Completion;

namespace {

std::filesystem::path make_temp_dir(const std::string& prefix)
{
    auto root = std::filesystem::temp_directory_path();
    auto dir = root / (prefix + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    (void)std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

struct SessionFixture final {
    SessionFixture()
        : dir{make_temp_dir("sqlsense_session_")}
        , script{dir / "hr.meta"}
    {
        std::ofstream stream{script};
        stream << "database HR\n"
                  "database SALES\n"
                  "schema hr\n"
                  "schema sales\n"
                  "use hr\n"
                  "table hr employees\n"
                  "column hr employees employee_id\n"
                  "column hr employees first_name\n"
                  "function hr get_salary\n"
                  "table nowhere orders\n";
    }

    ~SessionFixture() { (void)std::filesystem::remove_all(dir); }

    [[nodiscard]] CompletionSession::Config config() const
    {
        CompletionSession::Config config{};
        config.metadata_files.push_back(script);
        return config;
    }

    std::filesystem::path dir;
    std::filesystem::path script;
};

bool contains(const std::vector<Completion>& completions, std::string_view text)
{
    return std::any_of(completions.begin(), completions.end(), [&](const Completion& completion) {
        return completion.text == text;
    });
}

}  // namespace

TEST_CASE("completion session loads metadata on construction")
{
    SessionFixture fixture;
    std::vector<LoaderDiagnostic> diagnostics;
    auto config = fixture.config();
    config.loader_logger = [&diagnostics](const LoaderDiagnostic& diagnostic) { diagnostics.push_back(diagnostic); };

    CompletionSession session{std::move(config)};
    CHECK(session.catalog().current_database() == "HR");
    CHECK(session.catalog().object_names(sqlsense::catalog::ObjectKind::Table, "HR")
          == std::vector<std::string>{"EMPLOYEES"});
    REQUIRE(diagnostics.size() == 1U);
    CHECK(diagnostics.front().line == 10U);
    CHECK(diagnostics.front().message == "unknown schema 'nowhere'");
}

TEST_CASE("completion session completes columns in context")
{
    SessionFixture fixture;
    std::vector<CompletionMetrics> logged;
    auto config = fixture.config();
    config.completion_logger = [&logged](const CompletionMetrics& metrics) { logged.push_back(metrics); };

    CompletionSession session{std::move(config)};
    const auto outcome = session.complete("SELECT fir FROM employees", 10U);

    REQUIRE_FALSE(outcome.completions.empty());
    CHECK(outcome.completions.front() == Completion{"first_name", -3});

    const auto& metrics = outcome.metrics;
    CHECK(metrics.smart);
    CHECK(metrics.cursor == 10U);
    CHECK(metrics.word == "fir");
    CHECK(metrics.correlation_id == "cmp-1");
    CHECK(metrics.suggestion_kinds == std::vector<std::string>{"column", "function", "keyword"});
    CHECK(metrics.completions.front() == "first_name");
    CHECK(metrics.duration_ms >= 0.0);
    CHECK(metrics.finished_at >= metrics.started_at);

    const auto second = session.complete("SELECT * FROM emp");
    CHECK(second.metrics.correlation_id == "cmp-2");
    CHECK(contains(second.completions, "EMPLOYEES"));

    REQUIRE(logged.size() == 2U);
    CHECK(logged[0].correlation_id == "cmp-1");
}

TEST_CASE("dumb mode skips classification")
{
    SessionFixture fixture;
    CompletionSession session{fixture.config()};

    const auto toggled = session.execute_meta("\\dumb");
    CHECK(toggled.success);
    CHECK(toggled.summary == "Smart completion disabled.");
    CHECK_FALSE(session.smart_completion());

    const auto outcome = session.complete("SELECT emp");
    CHECK_FALSE(outcome.metrics.smart);
    CHECK(outcome.metrics.suggestion_kinds.empty());
    CHECK(contains(outcome.completions, "EMPLOYEES"));
    CHECK(contains(outcome.completions, "employee_id"));

    CHECK(session.execute_meta("\\smart").summary == "Smart completion enabled.");
    CHECK(session.smart_completion());
}

TEST_CASE("refresh reloads scripts and reports skipped entries")
{
    SessionFixture fixture;
    CompletionSession session{fixture.config()};

    {
        std::ofstream stream{fixture.script, std::ios::app};
        stream << "table hr jobs\n";
    }

    const auto result = session.execute_meta("\\refresh");
    CHECK(result.success);
    CHECK(result.summary == "Loaded 10 metadata entries (1 skipped)");
    CHECK(result.detail_lines == std::vector<std::string>{"line 10: unknown schema 'nowhere' (table nowhere orders)"});
    CHECK(session.catalog().object_names(sqlsense::catalog::ObjectKind::Table, "HR")
          == std::vector<std::string>{"EMPLOYEES", "JOBS"});
}

TEST_CASE("refresh reports unreadable scripts")
{
    SessionFixture fixture;
    auto config = fixture.config();
    config.metadata_files.push_back(fixture.dir / "missing.meta");
    CompletionSession session{std::move(config)};

    const auto result = session.execute_meta("\\refresh");
    CHECK_FALSE(result.success);
    REQUIRE(result.detail_lines.size() == 2U);
    CHECK(result.detail_lines[1] == "line 0: unable to open metadata script (" + (fixture.dir / "missing.meta").string() + ")");
}

TEST_CASE("use changes the current database and survives refresh")
{
    SessionFixture fixture;
    auto config = fixture.config();
    config.default_database = "sales";
    CompletionSession session{std::move(config)};
    CHECK(session.catalog().current_database() == "SALES");

    const auto known = session.execute_meta("\\use hr");
    CHECK(known.success);
    CHECK(known.summary == "Current database is now HR.");
    CHECK(known.detail_lines.empty());

    const auto unknown = session.execute_meta("\\u nowhere");
    CHECK(unknown.success);
    CHECK(unknown.summary == "Current database is now NOWHERE.");
    CHECK(unknown.detail_lines == std::vector<std::string>{"No metadata is loaded for NOWHERE."});

    (void)session.refresh();
    CHECK(session.catalog().current_database() == "NOWHERE");

    CHECK_FALSE(session.execute_meta("\\use").success);
}

TEST_CASE("favourite queries are saved, listed and completed")
{
    SessionFixture fixture;
    auto config = fixture.config();
    config.favorite_queries = {"daily"};
    CompletionSession session{std::move(config)};

    CHECK(session.execute_meta("\\fs weekly").success);
    CHECK(session.execute_meta("\\fs weekly").success);
    CHECK(session.favorite_queries() == std::vector<std::string>{"daily", "weekly"});

    const auto completion = session.complete("\\fd we");
    CHECK(completion.completions == std::vector<Completion>{Completion{"weekly", -2}});

    CHECK(session.execute_meta("\\fd daily").summary == "Deleted favourite query daily.");
    const auto missing = session.execute_meta("\\fd daily");
    CHECK_FALSE(missing.success);
    CHECK(missing.summary == "No favourite query named 'daily'.");

    const auto listing = session.execute_meta("\\f");
    CHECK(listing.summary == "1 favourite query");
    CHECK(listing.detail_lines == std::vector<std::string>{"weekly"});
}

TEST_CASE("meta command recognition and fallbacks")
{
    CHECK(CompletionSession::is_meta_command("  \\use hr"));
    CHECK_FALSE(CompletionSession::is_meta_command("SELECT 1"));
    CHECK_FALSE(CompletionSession::is_meta_command("   "));

    CompletionSession session;
    const auto unknown = session.execute_meta("\\zzz");
    CHECK_FALSE(unknown.success);
    CHECK(unknown.summary == "Unsupported meta command.");

    const auto empty = session.execute_meta("   ");
    CHECK(empty.success);
    CHECK(empty.summary == "Empty command.");

    const auto help = session.execute_meta("\\?");
    CHECK(help.success);
    CHECK_FALSE(help.detail_lines.empty());
}

TEST_CASE("session telemetry is visible through the registry")
{
    SessionFixture fixture;
    sqlsense::completion::CompletionTelemetryRegistry registry;
    auto config = fixture.config();
    config.telemetry_registry = &registry;
    config.telemetry_identifier = "session";

    CompletionSession session{std::move(config)};
    (void)session.complete("SELECT ");
    (void)session.complete("SEL");

    const auto totals = registry.aggregate();
    CHECK(totals.requests == 2U);
    CHECK(totals.smart_requests == 2U);
    CHECK(totals.suggestions_dispatched == 5U);
}
