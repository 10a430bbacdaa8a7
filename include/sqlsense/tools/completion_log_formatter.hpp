#pragma once

#include "sqlsense/catalog/metadata_catalog.hpp"
#include "sqlsense/shell/completion_session.hpp"
#include "sqlsense/shell/metadata_loader.hpp"

#include <string>

namespace sqlsense::tools {

[[nodiscard]] std::string format_completion_log_json(const sqlsense::shell::CompletionMetrics& metrics);
[[nodiscard]] std::string format_catalog_diagnostic_json(const sqlsense::catalog::CatalogDiagnostic& diagnostic);
[[nodiscard]] std::string format_loader_diagnostic_json(const sqlsense::shell::LoaderDiagnostic& diagnostic);

}  // namespace sqlsense::tools
