#pragma once

#include "sqlsense/catalog/metadata_catalog.hpp"
#include "sqlsense/completion/completion_engine.hpp"
#include "sqlsense/parser/context_classifier.hpp"
#include "sqlsense/shell/metadata_loader.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace sqlsense::shell {

struct CompletionMetrics final {
    bool smart = true;
    std::string text{};
    std::size_t cursor = 0U;
    std::string word{};
    std::vector<std::string> suggestion_kinds{};
    std::vector<std::string> completions{};
    std::vector<parser::ContextDiagnostic> diagnostics{};
    double duration_ms = 0.0;
    std::string correlation_id{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

struct CompletionOutcome final {
    std::vector<completion::Completion> completions{};
    CompletionMetrics metrics{};
};

struct CommandResult final {
    bool success = false;
    std::string summary{};
    std::vector<std::string> detail_lines{};
    double duration_ms = 0.0;
};

class CompletionSession final {
public:
    struct Config final {
        catalog::MetadataCatalog::Config catalog{};
        bool smart_completion = true;
        std::vector<std::filesystem::path> metadata_files{};
        std::string default_database{};
        std::vector<std::string> favorite_queries{};
        std::function<void(const CompletionMetrics&)> completion_logger{};
        std::function<void(const LoaderDiagnostic&)> loader_logger{};
        completion::CompletionTelemetryRegistry* telemetry_registry = nullptr;
        std::string telemetry_identifier{};
    };

    CompletionSession();
    explicit CompletionSession(Config config);

    CompletionSession(const CompletionSession&) = delete;
    CompletionSession& operator=(const CompletionSession&) = delete;

    // Clears the catalog and replays every configured metadata script.
    LoadSummary refresh();

    [[nodiscard]] CompletionOutcome complete(std::string_view buffer, std::size_t cursor);
    [[nodiscard]] CompletionOutcome complete(std::string_view buffer);

    // Backslash commands that change session state: \refresh, \use, \smart, \dumb, \fs, \fd, \?
    CommandResult execute_meta(std::string_view command);
    [[nodiscard]] static bool is_meta_command(std::string_view text) noexcept;

    [[nodiscard]] const catalog::MetadataCatalog& catalog() const noexcept { return catalog_; }
    [[nodiscard]] catalog::MetadataCatalog& catalog() noexcept { return catalog_; }
    [[nodiscard]] const completion::CompletionEngine& engine() const noexcept { return engine_; }
    [[nodiscard]] const std::vector<std::string>& favorite_queries() const noexcept { return favorites_; }
    [[nodiscard]] bool smart_completion() const noexcept { return engine_.smart_completion(); }

private:
    [[nodiscard]] std::vector<completion::SuggestionRequest> classify(std::string_view text,
                                                                      std::string_view text_before_cursor);
    [[nodiscard]] std::string next_correlation_id();
    void rebuild_classifier();

    Config config_{};
    catalog::MetadataCatalog catalog_;
    parser::ContextClassifier classifier_{};
    std::vector<std::string> favorites_{};
    parser::ContextClassification last_classification_{};
    completion::CompletionEngine engine_;
    std::string selected_database_{};
    std::atomic<std::uint64_t> correlation_counter_{1U};
};

}  // namespace sqlsense::shell
