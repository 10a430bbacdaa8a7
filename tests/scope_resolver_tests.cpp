#include "sqlsense/completion/scope_resolver.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace sqlsense::catalog;
using namespace sqlsense::completion;

namespace {

MetadataCatalog make_hr_catalog()
{
    MetadataCatalog catalog;
    catalog.extend_schemas(std::vector<std::string>{"hr", "sales"});
    catalog.set_current_database("hr");
    catalog.extend_relations(rows_from({{"employees"}, {"departments"}}), ObjectKind::Table, "hr");
    catalog.extend_relations(rows_from({{"emp_details"}}), ObjectKind::View, "hr");
    catalog.extend_relations(rows_from({{"orders"}}), ObjectKind::Table, "sales");
    catalog.extend_columns(rows_from({{"employees", "EMPLOYEE_ID"},
                                      {"employees", "FIRST_NAME"},
                                      {"employees", "DEPARTMENT_ID"},
                                      {"departments", "DEPARTMENT_ID"},
                                      {"departments", "DEPARTMENT_NAME"}}),
                           ObjectKind::Table, "hr");
    catalog.extend_columns(rows_from({{"emp_details", "FULL_NAME"}}), ObjectKind::View, "hr");
    catalog.extend_columns(rows_from({{"orders", "ORDER_ID"}, {"orders", "EMPLOYEE_ID"}}), ObjectKind::Table,
                           "sales");
    return catalog;
}

TableReference ref(std::string name,
                   std::optional<std::string> schema = std::nullopt,
                   std::optional<std::string> alias = std::nullopt)
{
    return TableReference{std::move(schema), std::move(name), std::move(alias)};
}

}  // namespace

TEST_CASE("resolver returns a relation's columns in registration order")
{
    const auto catalog = make_hr_catalog();
    const ScopeResolver resolver{catalog};

    const std::vector<TableReference> tables{ref("EMPLOYEES", "HR")};
    const std::vector<std::string> expected{"*", "EMPLOYEE_ID", "FIRST_NAME", "DEPARTMENT_ID"};
    CHECK(resolver.resolve(tables) == expected);
}

TEST_CASE("resolver defaults to the current database and ignores case")
{
    const auto catalog = make_hr_catalog();
    const ScopeResolver resolver{catalog};

    const std::vector<TableReference> tables{ref("employees", std::nullopt, "e")};
    CHECK(resolver.resolve(tables).size() == 4U);

    const std::vector<TableReference> other_schema{ref("orders", "sales")};
    CHECK(resolver.resolve(other_schema) == std::vector<std::string>{"*", "ORDER_ID", "EMPLOYEE_ID"});
}

TEST_CASE("resolver concatenates references and keeps duplicates")
{
    const auto catalog = make_hr_catalog();
    const ScopeResolver resolver{catalog};

    const std::vector<TableReference> tables{ref("employees"), ref("departments")};
    const std::vector<std::string> expected{"*", "EMPLOYEE_ID", "FIRST_NAME", "DEPARTMENT_ID",
                                            "*", "DEPARTMENT_ID", "DEPARTMENT_NAME"};
    CHECK(resolver.resolve(tables) == expected);
}

TEST_CASE("unique filter keeps only columns shared by several relations")
{
    const auto catalog = make_hr_catalog();
    const ScopeResolver resolver{catalog};

    const std::vector<TableReference> tables{ref("employees"), ref("departments")};
    CHECK(resolver.resolve(tables, true) == std::vector<std::string>{"DEPARTMENT_ID"});

    const std::vector<TableReference> cross_schema{ref("employees", "hr"), ref("orders", "sales")};
    CHECK(resolver.resolve(cross_schema, true) == std::vector<std::string>{"EMPLOYEE_ID"});
}

TEST_CASE("views are consulted only when no table matches")
{
    const auto catalog = make_hr_catalog();
    const ScopeResolver resolver{catalog};

    const std::vector<TableReference> tables{ref("emp_details")};
    CHECK(resolver.resolve(tables) == std::vector<std::string>{"*", "FULL_NAME"});
}

TEST_CASE("quoted references fall back to their unescaped name")
{
    const auto catalog = make_hr_catalog();
    const ScopeResolver resolver{catalog};

    const std::vector<TableReference> tables{ref("\"EMPLOYEES\"")};
    CHECK(resolver.resolve(tables).size() == 4U);

    const auto lookup = resolver.lookup(ref("\"departments\""));
    REQUIRE(lookup.found());
    CHECK(lookup.columns.size() == 3U);
}

TEST_CASE("resolver finds relations stored under quoted keys")
{
    MetadataCatalog::Config config;
    config.quote_special_names = true;
    MetadataCatalog catalog{config};
    catalog.extend_schemas(std::vector<std::string>{"hr"});
    catalog.set_current_database("hr");
    catalog.extend_relations(rows_from({{"order"}, {"employees"}}), ObjectKind::Table, "hr");
    catalog.extend_columns(rows_from({{"order", "ORDER_ID"}, {"employees", "EMPLOYEE_ID"}}), ObjectKind::Table, "hr");
    const ScopeResolver resolver{catalog};

    CHECK(resolver.resolve(std::vector<TableReference>{ref("order", "hr")})
          == std::vector<std::string>{"*", "ORDER_ID"});
    CHECK(resolver.resolve(std::vector<TableReference>{ref("\"employees\"")})
          == std::vector<std::string>{"*", "EMPLOYEE_ID"});
}

TEST_CASE("unknown relations and schemas contribute nothing")
{
    const auto catalog = make_hr_catalog();
    const ScopeResolver resolver{catalog};

    const std::vector<TableReference> tables{ref("missing"), ref("employees", "nowhere")};
    CHECK(resolver.resolve(tables).empty());
    CHECK(resolver.lookup(ref("missing")).error == CatalogErrc::RelationNotFound);
    CHECK(resolver.lookup(ref("employees", "nowhere")).error == CatalogErrc::SchemaNotFound);
}
