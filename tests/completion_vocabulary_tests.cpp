#include "sqlsense/catalog/completion_vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace sqlsense::catalog;

TEST_CASE("merge_function_categories deduplicates and sorts once")
{
    FunctionCategories categories;
    categories.string_functions = {"UPPER", "SUBSTR"};
    categories.numeric_functions = {"SUM", "ROUND"};
    categories.date_functions = {"ROUND", "SYSDATE"};
    categories.miscellaneous_functions = {"NVL"};

    const auto merged = merge_function_categories(categories);
    const std::vector<std::string> expected{"NVL", "ROUND", "SUBSTR", "SUM", "SYSDATE", "UPPER"};
    CHECK(merged == expected);
}

TEST_CASE("derive_reserved_words splits keyword phrases into uppercase tokens")
{
    const auto words = derive_reserved_words({"select", "GROUP BY", "  left   outer join "});
    CHECK(words.size() == 6U);
    CHECK(words.contains("SELECT"));
    CHECK(words.contains("GROUP"));
    CHECK(words.contains("BY"));
    CHECK(words.contains("LEFT"));
    CHECK(words.contains("OUTER"));
    CHECK(words.contains("JOIN"));
}

TEST_CASE("default vocabulary carries keywords, sorted functions, special commands and formats")
{
    const auto vocabulary = make_default_vocabulary();

    CHECK(std::find(vocabulary.keywords.begin(), vocabulary.keywords.end(), "SELECT") != vocabulary.keywords.end());
    CHECK(std::find(vocabulary.keywords.begin(), vocabulary.keywords.end(), "ORDER BY") != vocabulary.keywords.end());

    CHECK(std::is_sorted(vocabulary.functions.begin(), vocabulary.functions.end()));
    CHECK(std::adjacent_find(vocabulary.functions.begin(), vocabulary.functions.end()) == vocabulary.functions.end());
    CHECK(std::binary_search(vocabulary.functions.begin(), vocabulary.functions.end(), std::string{"SUM"}));
    CHECK(std::binary_search(vocabulary.functions.begin(), vocabulary.functions.end(), std::string{"SUBSTR"}));
    CHECK(std::binary_search(vocabulary.functions.begin(), vocabulary.functions.end(), std::string{"ROUND"}));

    CHECK(std::find(vocabulary.special_commands.begin(), vocabulary.special_commands.end(), "\\dt")
          != vocabulary.special_commands.end());
    CHECK(std::find(vocabulary.table_formats.begin(), vocabulary.table_formats.end(), "psql")
          != vocabulary.table_formats.end());
}
