#pragma once

#include <system_error>

namespace sqlsense::catalog {

enum class CatalogErrc {
    Success = 0,
    SchemaNotFound,
    RelationNotFound,
    MalformedRow,
    EnumerationFailed
};

const std::error_category& catalog_error_category() noexcept;
std::error_code make_error_code(CatalogErrc value) noexcept;

}  // namespace sqlsense::catalog

namespace std {

template <>
struct is_error_code_enum<sqlsense::catalog::CatalogErrc> : true_type {
};

}  // namespace std
