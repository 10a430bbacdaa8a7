#include "sqlsense/catalog/metadata_catalog.hpp"
#include "sqlsense/completion/completion_engine.hpp"
#include "sqlsense/parser/context_classifier.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace
{

using Clock = std::chrono::steady_clock;

struct Scenario final {
    std::string_view name;
    std::string_view text;
    bool smart = true;
};

constexpr std::array scenarios{
    Scenario{"select_list", "SELECT t1.col_1, co FROM schema_0.table_1 t1 JOIN schema_0.table_2 t2 ON t1.", true},
    Scenario{"from_clause", "SELECT * FROM schema_1.tab", true},
    Scenario{"keyword", "SEL", true},
    Scenario{"function", "SELECT SU", true},
    Scenario{"dumb_prefix", "SELECT TABLE_1", false},
};

std::size_t parse_iterations_from_args(int argc, char** argv, std::size_t default_iterations)
{
    for (int index = 1; index < argc; ++index) {
        std::string_view arg{argv[index]};
        if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: sqlsense_benchmarks [--iterations N]\n";
            std::exit(EXIT_SUCCESS);
        }
        if ((arg == "--iterations" || arg == "-n") && index + 1 < argc) {
            const auto value = std::strtoull(argv[index + 1], nullptr, 10);
            if (value > 0U) {
                return static_cast<std::size_t>(value);
            }
        }
    }

    return default_iterations;
}

// Four schemas of 64 tables with 24 columns each.
sqlsense::catalog::MetadataCatalog make_catalog()
{
    using sqlsense::catalog::MetadataRow;
    using sqlsense::catalog::ObjectKind;

    sqlsense::catalog::MetadataCatalog catalog;
    std::vector<std::string> schemas;
    for (int schema = 0; schema < 4; ++schema) {
        schemas.push_back("schema_" + std::to_string(schema));
    }
    (void)catalog.extend_schemas(schemas);
    catalog.set_current_database(schemas.front());

    for (const auto& schema : schemas) {
        std::vector<MetadataRow> tables;
        std::vector<MetadataRow> columns;
        std::vector<MetadataRow> functions;
        for (int table = 0; table < 64; ++table) {
            const auto table_name = "table_" + std::to_string(table);
            tables.push_back(MetadataRow{table_name});
            for (int column = 0; column < 24; ++column) {
                columns.push_back(MetadataRow{table_name, "col_" + std::to_string(column)});
            }
            functions.push_back(MetadataRow{"fn_" + std::to_string(table)});
        }
        (void)catalog.extend_relations(sqlsense::catalog::rows_from(std::move(tables)), ObjectKind::Table, schema);
        (void)catalog.extend_columns(sqlsense::catalog::rows_from(std::move(columns)), ObjectKind::Table, schema);
        (void)catalog.extend_functions(sqlsense::catalog::rows_from(std::move(functions)), schema);
    }
    return catalog;
}

struct BenchmarkSummary final {
    std::size_t iterations = 0U;
    std::size_t completions = 0U;
    Clock::duration elapsed{};
};

BenchmarkSummary run_scenario(sqlsense::completion::CompletionEngine& engine, const Scenario& scenario, std::size_t iterations)
{
    BenchmarkSummary summary{};
    summary.iterations = iterations;

    const auto input = sqlsense::completion::make_input(std::string{scenario.text});
    const auto start = Clock::now();
    for (std::size_t iteration = 0; iteration < iterations; ++iteration) {
        const auto completions = engine.complete(input, scenario.smart);
        summary.completions += completions.size();
    }
    summary.elapsed = Clock::now() - start;

    return summary;
}

void report_summary(const Scenario& scenario, const BenchmarkSummary& summary)
{
    const auto seconds = std::chrono::duration<double>(summary.elapsed).count();
    const auto requests_per_second = seconds > 0.0 ? static_cast<double>(summary.iterations) / seconds : 0.0;

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Scenario: " << scenario.name << "\n";
    std::cout << "  Requests: " << summary.iterations << "\n";
    std::cout << "  Completions/request: "
              << (summary.iterations > 0U ? static_cast<double>(summary.completions) / summary.iterations : 0.0)
              << "\n";
    std::cout << "  Elapsed: " << seconds << " s\n";
    std::cout << "  Requests/s: " << requests_per_second << "\n";
    std::cout << std::defaultfloat;
}

}  // namespace

int main(int argc, char** argv)
{
    constexpr std::size_t default_iterations = 1000U;
    const auto iterations = parse_iterations_from_args(argc, argv, default_iterations);

    const auto catalog = make_catalog();
    const sqlsense::parser::ContextClassifier classifier{
        sqlsense::parser::ContextClassifier::Config{catalog.reserved_words()}};

    sqlsense::completion::CompletionEngine::Config config{};
    config.classifier = [&classifier](std::string_view text, std::string_view before) {
        return classifier.classify(text, before).suggestions;
    };
    sqlsense::completion::CompletionEngine engine{catalog, std::move(config)};

    for (const auto& scenario : scenarios) {
        const auto summary = run_scenario(engine, scenario, iterations);
        report_summary(scenario, summary);
    }

    const auto telemetry = engine.telemetry().snapshot();
    std::cout << "Candidates considered: " << telemetry.candidates_considered << "\n";

    return 0;
}
