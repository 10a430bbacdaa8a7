#include "sqlsense/shell/completion_session.hpp"

#include "sqlsense/catalog/identifier_normalizer.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

using sqlsense::completion::CompletionEngine;
using sqlsense::completion::SuggestionRequest;

namespace sqlsense::shell {

namespace {

using Clock = std::chrono::steady_clock;

[[nodiscard]] double elapsed_ms(Clock::time_point start)
{
    const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start);
    return static_cast<double>(duration_ns.count()) / 1'000'000.0;
}

[[nodiscard]] std::string trim(std::string_view text)
{
    std::size_t begin = 0U;
    while (begin < text.size() && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
        ++begin;
    }
    std::size_t end = text.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
        --end;
    }
    return std::string{text.substr(begin, end - begin)};
}

[[nodiscard]] std::vector<std::string> split_tokens(std::string_view text)
{
    std::vector<std::string> tokens;
    std::istringstream stream{std::string{text}};
    std::string token;
    while (stream >> token) {
        tokens.push_back(std::move(token));
    }
    return tokens;
}

[[nodiscard]] std::string rest_after_first(const std::vector<std::string>& tokens)
{
    std::string rest;
    for (std::size_t i = 1U; i < tokens.size(); ++i) {
        if (!rest.empty()) {
            rest.push_back(' ');
        }
        rest.append(tokens[i]);
    }
    return rest;
}

constexpr std::string_view kHelpLines[] = {
    "\\refresh        reload metadata scripts",
    "\\use NAME       change the current database",
    "\\smart          enable context aware completion",
    "\\dumb           complete every known identifier by prefix",
    "\\fs NAME        save a favourite query name",
    "\\fd NAME        delete a favourite query name",
    "\\f              list favourite query names",
};

}  // namespace

CompletionSession::CompletionSession()
    : CompletionSession(Config{})
{
}

CompletionSession::CompletionSession(Config config)
    : config_{std::move(config)}
    , catalog_{config_.catalog}
    , favorites_(config_.favorite_queries)
    , engine_{catalog_,
              CompletionEngine::Config{
                  .smart_completion = config_.smart_completion,
                  .boundary = completion::WordBoundary::MostPunctuations,
                  .classifier = [this](std::string_view text, std::string_view before) { return classify(text, before); },
                  .favorite_queries = [this] { return favorites_; },
                  .telemetry_registry = config_.telemetry_registry,
                  .telemetry_identifier = config_.telemetry_identifier,
              }}
    , selected_database_{config_.default_database}
{
    refresh();
}

LoadSummary CompletionSession::refresh()
{
    catalog_.reset();

    LoadSummary total{};
    for (const auto& path : config_.metadata_files) {
        auto summary = load_metadata_file(path, catalog_);
        total.entries += summary.entries;
        total.applied += summary.applied;
        total.skipped += summary.skipped;
        total.read_failed = total.read_failed || summary.read_failed;
        for (auto& diagnostic : summary.diagnostics) {
            if (diagnostic.text.empty()) {
                diagnostic.text = path.string();
            }
            if (config_.loader_logger) {
                config_.loader_logger(diagnostic);
            }
            total.diagnostics.push_back(std::move(diagnostic));
        }
    }

    if (!selected_database_.empty()) {
        catalog_.set_current_database(selected_database_);
    }

    rebuild_classifier();
    return total;
}

CompletionOutcome CompletionSession::complete(std::string_view buffer, std::size_t cursor)
{
    CompletionOutcome outcome{};
    auto& metrics = outcome.metrics;
    metrics.started_at = std::chrono::system_clock::now();
    metrics.correlation_id = next_correlation_id();
    const auto start = Clock::now();

    completion::CompletionInput input{std::string{buffer}, std::min(cursor, buffer.size())};
    metrics.smart = engine_.smart_completion();
    metrics.text = input.text;
    metrics.cursor = input.cursor;
    metrics.word = input.word_before_cursor();

    last_classification_ = {};
    outcome.completions = engine_.complete(input);

    for (const auto& request : last_classification_.suggestions) {
        metrics.suggestion_kinds.emplace_back(completion::suggestion_kind_to_string(completion::suggestion_kind(request)));
    }
    metrics.diagnostics = std::move(last_classification_.diagnostics);
    metrics.completions.reserve(outcome.completions.size());
    for (const auto& item : outcome.completions) {
        metrics.completions.push_back(item.text);
    }

    metrics.duration_ms = elapsed_ms(start);
    metrics.finished_at = std::chrono::system_clock::now();
    if (config_.completion_logger) {
        config_.completion_logger(metrics);
    }
    return outcome;
}

CompletionOutcome CompletionSession::complete(std::string_view buffer)
{
    return complete(buffer, buffer.size());
}

bool CompletionSession::is_meta_command(std::string_view text) noexcept
{
    const auto first = text.find_first_not_of(" \t\r\n");
    return first != std::string_view::npos && text[first] == '\\';
}

CommandResult CompletionSession::execute_meta(std::string_view command)
{
    CommandResult result{};
    const auto start = Clock::now();
    const auto tokens = split_tokens(trim(command));
    if (tokens.empty()) {
        result.success = true;
        result.summary = "Empty command.";
        return result;
    }

    const auto& name = tokens.front();
    const auto argument = rest_after_first(tokens);

    if (name == "\\refresh") {
        const auto summary = refresh();
        std::ostringstream stream;
        stream << "Loaded " << summary.applied << " metadata entr" << (summary.applied == 1U ? "y" : "ies");
        if (summary.skipped > 0U) {
            stream << " (" << summary.skipped << " skipped)";
        }
        result.summary = stream.str();
        for (const auto& diagnostic : summary.diagnostics) {
            std::ostringstream line;
            line << "line " << diagnostic.line << ": " << diagnostic.message;
            if (!diagnostic.text.empty()) {
                line << " (" << diagnostic.text << ')';
            }
            result.detail_lines.push_back(line.str());
        }
        result.success = !summary.read_failed;
    } else if (name == "\\use" || name == "\\u") {
        if (argument.empty()) {
            result.summary = "\\use requires a database name.";
        } else {
            selected_database_ = argument;
            catalog_.set_current_database(argument);
            result.summary = "Current database is now " + catalog_.current_database() + ".";
            const auto& known = catalog_.vocabulary(catalog::VocabularyKind::Databases);
            const auto canonical = catalog::canonical_name(argument);
            const bool listed = std::any_of(known.begin(), known.end(), [&](const std::string& database) {
                return catalog::canonical_name(database) == canonical;
            });
            if (!listed && !catalog_.has_schema(catalog::ObjectKind::Table, canonical)) {
                result.detail_lines.push_back("No metadata is loaded for " + canonical + ".");
            }
            result.success = true;
        }
    } else if (name == "\\smart") {
        engine_.set_smart_completion(true);
        result.summary = "Smart completion enabled.";
        result.success = true;
    } else if (name == "\\dumb") {
        engine_.set_smart_completion(false);
        result.summary = "Smart completion disabled.";
        result.success = true;
    } else if (name == "\\fs") {
        if (argument.empty()) {
            result.summary = "\\fs requires a favourite query name.";
        } else {
            if (std::find(favorites_.begin(), favorites_.end(), argument) == favorites_.end()) {
                favorites_.push_back(argument);
            }
            result.summary = "Saved favourite query " + argument + ".";
            result.success = true;
        }
    } else if (name == "\\fd") {
        const auto it = std::find(favorites_.begin(), favorites_.end(), argument);
        if (argument.empty() || it == favorites_.end()) {
            result.summary = "No favourite query named '" + argument + "'.";
        } else {
            favorites_.erase(it);
            result.summary = "Deleted favourite query " + argument + ".";
            result.success = true;
        }
    } else if (name == "\\f") {
        result.detail_lines = favorites_;
        std::ostringstream stream;
        stream << favorites_.size() << " favourite quer" << (favorites_.size() == 1U ? "y" : "ies");
        result.summary = stream.str();
        result.success = true;
    } else if (name == "\\?") {
        result.detail_lines.assign(std::begin(kHelpLines), std::end(kHelpLines));
        result.summary = "Meta commands";
        result.success = true;
    } else {
        result.summary = "Unsupported meta command.";
        result.detail_lines.push_back("Use \\? to list available commands.");
    }

    result.duration_ms = elapsed_ms(start);
    return result;
}

std::vector<SuggestionRequest> CompletionSession::classify(std::string_view text, std::string_view text_before_cursor)
{
    last_classification_ = classifier_.classify(text, text_before_cursor);
    return last_classification_.suggestions;
}

std::string CompletionSession::next_correlation_id()
{
    return "cmp-" + std::to_string(correlation_counter_.fetch_add(1U, std::memory_order_relaxed));
}

void CompletionSession::rebuild_classifier()
{
    classifier_ = parser::ContextClassifier{parser::ContextClassifier::Config{catalog_.reserved_words()}};
}

}  // namespace sqlsense::shell
