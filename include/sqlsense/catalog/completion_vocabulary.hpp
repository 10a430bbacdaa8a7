#pragma once

#include "sqlsense/catalog/identifier_normalizer.hpp"

#include <string>
#include <vector>

namespace sqlsense::catalog {

struct FunctionCategories final {
    std::vector<std::string> string_functions{};
    std::vector<std::string> numeric_functions{};
    std::vector<std::string> date_functions{};
    std::vector<std::string> conversion_functions{};
    std::vector<std::string> analytic_functions{};
    std::vector<std::string> miscellaneous_functions{};
};

// Immutable bootstrap vocabulary handed to a catalog at construction.
struct CompletionVocabulary final {
    std::vector<std::string> keywords{};
    std::vector<std::string> functions{};
    std::vector<std::string> special_commands{};
    std::vector<std::string> table_formats{};
};

[[nodiscard]] std::vector<std::string> merge_function_categories(const FunctionCategories& categories);
[[nodiscard]] ReservedWordSet derive_reserved_words(const std::vector<std::string>& keywords);

[[nodiscard]] FunctionCategories make_default_function_categories();
[[nodiscard]] std::vector<std::string> make_default_keywords();
[[nodiscard]] CompletionVocabulary make_default_vocabulary();

}  // namespace sqlsense::catalog
