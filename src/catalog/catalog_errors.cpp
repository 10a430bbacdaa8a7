#include "sqlsense/catalog/catalog_errors.hpp"

#include <string>

namespace sqlsense::catalog {

namespace {

class CatalogErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "sqlsense.catalog";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<CatalogErrc>(condition)) {
        case CatalogErrc::Success:
            return "success";
        case CatalogErrc::SchemaNotFound:
            return "schema not found";
        case CatalogErrc::RelationNotFound:
            return "relation not found";
        case CatalogErrc::MalformedRow:
            return "malformed metadata row";
        case CatalogErrc::EnumerationFailed:
            return "metadata enumeration failed";
        default:
            return "unknown catalog error";
        }
    }
};

const CatalogErrorCategory kCategory{};

}  // namespace

const std::error_category& catalog_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(CatalogErrc value) noexcept
{
    return {static_cast<int>(value), catalog_error_category()};
}

}  // namespace sqlsense::catalog
