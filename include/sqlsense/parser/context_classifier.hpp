#pragma once

#include "sqlsense/catalog/identifier_normalizer.hpp"
#include "sqlsense/completion/suggestion.hpp"
#include "sqlsense/parser/sql_tokenizer.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sqlsense::parser {

enum class ContextSeverity : std::uint8_t {
    Info = 0,
    Warning
};

struct ContextDiagnostic final {
    ContextSeverity severity = ContextSeverity::Warning;
    std::string message{};
    std::size_t offset = 0U;
};

struct ContextClassification final {
    std::vector<completion::SuggestionRequest> suggestions{};
    // Every relation the statement under the cursor references, in statement order.
    std::vector<completion::TableReference> tables{};
    std::string current_word{};
    std::vector<ContextDiagnostic> diagnostics{};
};

class ContextClassifier final {
public:
    struct Config final {
        // Words that never act as aliases; normally the catalog's reserved word set.
        catalog::ReservedWordSet reserved_words{};
    };

    ContextClassifier();
    explicit ContextClassifier(Config config);

    [[nodiscard]] ContextClassification classify(std::string_view text, std::string_view text_before_cursor) const;

    [[nodiscard]] std::vector<completion::TableReference> extract_tables(std::span<const SqlToken> statement) const;

private:
    [[nodiscard]] bool is_reserved(std::string_view word) const;

    Config config_{};
};

}  // namespace sqlsense::parser
