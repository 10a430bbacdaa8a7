#include "sqlsense/catalog/identifier_normalizer.hpp"

#include <algorithm>
#include <cctype>

namespace sqlsense::catalog {

std::string uppercase_copy(std::string_view text)
{
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return result;
}

std::string lowercase_copy(std::string_view text)
{
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return result;
}

std::string canonical_name(std::string_view name)
{
    return uppercase_copy(name);
}

std::string unescape_name(std::string_view name)
{
    if (name.size() >= 2U && name.front() == '"' && name.back() == '"') {
        name.remove_prefix(1U);
        name.remove_suffix(1U);
    }
    return std::string{name};
}

bool is_plain_identifier(std::string_view name) noexcept
{
    if (name.empty()) {
        return false;
    }

    const auto head = static_cast<unsigned char>(name.front());
    if (head != '_' && (std::islower(head) == 0)) {
        return false;
    }

    return std::all_of(name.begin() + 1, name.end(), [](char ch) {
        const auto value = static_cast<unsigned char>(ch);
        return value == '_' || value == '$' || std::islower(value) != 0 || std::isdigit(value) != 0;
    });
}

std::string escape_name(std::string_view name, const ReservedWordSet& reserved_words, bool quote_special_names)
{
    if (!quote_special_names || name.empty()) {
        return std::string{name};
    }

    // Already quoted; quoting again would make it a different identifier.
    if (name.size() >= 2U && name.front() == '"' && name.back() == '"') {
        return std::string{name};
    }

    const auto lowered = lowercase_copy(name);
    if (is_plain_identifier(lowered) && !reserved_words.contains(uppercase_copy(name))) {
        return std::string{name};
    }

    std::string quoted;
    quoted.reserve(name.size() + 2U);
    quoted.push_back('"');
    quoted.append(name);
    quoted.push_back('"');
    return quoted;
}

}  // namespace sqlsense::catalog
