#include "sqlsense/completion/completion_telemetry.hpp"
#include "sqlsense/completion/match_ranker.hpp"
#include "sqlsense/shell/completion_session.hpp"
#include "sqlsense/tools/completion_log_formatter.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace {

std::string trim(std::string_view text)
{
    std::size_t start = 0U;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start])) != 0) {
        ++start;
    }

    std::size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }

    return std::string{text.substr(start, end - start)};
}

std::filesystem::path history_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return {};
    }

    std::filesystem::path path{home};
    path /= ".sqlsense_history";
    return path;
}

void render_result(const sqlsense::shell::CommandResult& result)
{
    const auto status = result.success ? "OK" : "ERROR";
    std::cout << status << ": " << result.summary;
    std::cout << " [" << std::fixed << std::setprecision(2) << result.duration_ms << " ms]" << '\n';
    for (const auto& line : result.detail_lines) {
        std::cout << "    " << line << '\n';
    }
}

void render_completions(const sqlsense::shell::CompletionOutcome& outcome)
{
    const auto& metrics = outcome.metrics;
    std::cout << "-- " << metrics.text << " [" << metrics.correlation_id << ']';
    std::cout << " [" << std::fixed << std::setprecision(2) << metrics.duration_ms << " ms]" << '\n';
    for (const auto& completion : outcome.completions) {
        std::cout << completion.text << '\t' << completion.start_position << '\n';
    }
}

int run_repl(bool quiet, sqlsense::shell::CompletionSession& session)
{
    replxx::Replxx repl;
    std::string buffer;

    repl.set_completion_callback([&session, &buffer](const std::string& input, int& context_len) {
        const auto text = buffer + input;
        const auto outcome = session.complete(text);
        replxx::Replxx::completions_t completions;
        if (outcome.completions.empty()) {
            return completions;
        }

        // Offsets are in code points, the unit replxx measures its context in.
        context_len = std::min(-outcome.completions.front().start_position,
                               sqlsense::completion::code_point_count(input));
        completions.reserve(outcome.completions.size());
        for (const auto& completion : outcome.completions) {
            completions.emplace_back(completion.text);
        }
        return completions;
    });

    const auto history = history_path();
    if (!history.empty()) {
        (void)repl.history_load(history.string());
    }

    if (!quiet) {
        std::cout << "sqlsense shell. Press TAB to complete, \\? for meta commands, \\quit to exit.\n";
    }

    while (true) {
        const char* line = repl.input(buffer.empty() ? "sqlsense> " : "...> ");
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        const auto trimmed = trim(line);
        if (buffer.empty() && sqlsense::shell::CompletionSession::is_meta_command(trimmed)) {
            if (trimmed == "\\q" || trimmed == "\\quit") {
                break;
            }
            repl.history_add(trimmed);
            render_result(session.execute_meta(trimmed));
            continue;
        }

        if (trimmed.empty()) {
            continue;
        }

        buffer.append(line);
        buffer.push_back('\n');
        if (trimmed.back() != ';') {
            continue;
        }

        repl.history_add(trim(buffer));
        if (!history.empty()) {
            (void)repl.history_save(history.string());
        }
        if (!quiet) {
            std::cout << "Statement recorded; sqlsense completes SQL but does not execute it.\n";
        }
        buffer.clear();
    }

    if (!history.empty()) {
        (void)repl.history_save(history.string());
    }
    return 0;
}

int run_batch(const std::vector<std::string>& texts, sqlsense::shell::CompletionSession& session)
{
    for (const auto& text : texts) {
        render_completions(session.complete(text));
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Context aware SQL completion shell."};

    bool quiet = false;
    bool dumb = false;
    std::vector<std::string> catalog_files;
    std::vector<std::string> complete_texts;
    std::string database;
    std::string log_json_path;

    app.add_flag("-q,--quiet", quiet, "Suppress the startup banner and warnings");
    app.add_flag("--dumb", dumb, "Disable context aware completion");
    app.add_option("--catalog", catalog_files, "Load database metadata from the specified script")
        ->type_name("PATH")
        ->expected(1)
        ->check(CLI::ExistingFile);
    app.add_option("--database", database, "Current database used for unqualified names")->type_name("NAME");
    app.add_option("-c,--complete", complete_texts, "Print completions for TEXT (cursor at the end) and exit")
        ->type_name("TEXT")
        ->expected(1);
    app.add_option("--log-json", log_json_path, "Write structured completion logs as JSON Lines (use '-' for stdout)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    }

    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    std::mutex log_mutex;

    if (!log_json_path.empty()) {
        if (log_json_path == "-") {
            log_stream = &std::cout;
        } else {
            auto file = std::make_unique<std::ofstream>(log_json_path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                std::cerr << "error: failed to open log file '" << log_json_path << "'" << '\n';
                return 1;
            }
            log_stream = file.get();
            log_file = std::move(file);
        }
    }

    auto write_log_line = [log_stream, &log_mutex](const std::string& line) {
        std::lock_guard<std::mutex> guard{log_mutex};
        (*log_stream) << line << '\n';
        log_stream->flush();
    };

    sqlsense::completion::CompletionTelemetryRegistry telemetry_registry;

    sqlsense::shell::CompletionSession::Config config{};
    config.smart_completion = !dumb;
    config.default_database = database;
    config.metadata_files.assign(catalog_files.begin(), catalog_files.end());
    config.telemetry_registry = &telemetry_registry;
    config.telemetry_identifier = "shell";

    if (log_stream != nullptr) {
        config.catalog.diagnostic_sink = [write_log_line](const sqlsense::catalog::CatalogDiagnostic& diagnostic) {
            write_log_line(sqlsense::tools::format_catalog_diagnostic_json(diagnostic));
        };
        config.loader_logger = [write_log_line](const sqlsense::shell::LoaderDiagnostic& diagnostic) {
            write_log_line(sqlsense::tools::format_loader_diagnostic_json(diagnostic));
        };
        config.completion_logger = [write_log_line](const sqlsense::shell::CompletionMetrics& metrics) {
            write_log_line(sqlsense::tools::format_completion_log_json(metrics));
        };
    } else if (!quiet) {
        config.catalog.diagnostic_sink = [](const sqlsense::catalog::CatalogDiagnostic& diagnostic) {
            std::cerr << "warning: " << diagnostic.message;
            if (!diagnostic.schema.empty()) {
                std::cerr << " (schema " << diagnostic.schema << ')';
            }
            std::cerr << '\n';
        };
        config.loader_logger = [](const sqlsense::shell::LoaderDiagnostic& diagnostic) {
            std::cerr << "warning: line " << diagnostic.line << ": " << diagnostic.message;
            if (!diagnostic.text.empty()) {
                std::cerr << " (" << diagnostic.text << ')';
            }
            std::cerr << '\n';
        };
    }

    try {
        sqlsense::shell::CompletionSession session{std::move(config)};
        if (!complete_texts.empty()) {
            return run_batch(complete_texts, session);
        }
        const auto code = run_repl(quiet, session);
        if (!quiet) {
            const auto totals = telemetry_registry.aggregate();
            std::cout << totals.requests << " completion request" << (totals.requests == 1U ? "" : "s") << ", "
                      << totals.completions_emitted << " candidates offered\n";
        }
        return code;
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return 1;
    }
}
