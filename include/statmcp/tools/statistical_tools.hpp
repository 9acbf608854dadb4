#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Built-in Content
// ═══════════════════════════════════════════════════════════════════════════
// The statistical tools (each backed by r_scripts/<name>.R), the catalog, env
// and file resources, and the analysis prompts.
//
// Tools:     correlation_analysis, linear_model, logistic_regression,
//            summary_statistics, t_test, chi_square_test, normality_test,
//            frequency_table, data_info, read_csv
// Resources: statmcp://catalog, statmcp://env, file:// (allowed paths only)
// Prompts:   statistical_workflow, model_diagnostic

#include "statmcp/protocol/errors.hpp"

#include <nlohmann/json.hpp>

namespace statmcp {

using Json = nlohmann::json;

class Server;

enum class ColumnValues {
    Any,      // numbers, strings, booleans and nulls
    Numeric,
};

/// Schema of a data frame argument: an object of equal-length, non-empty columns
[[nodiscard]] Json columnar_data_schema(ColumnValues values = ColumnValues::Any);

[[nodiscard]] ServerResult<void> register_statistical_tools(Server& server);
[[nodiscard]] ServerResult<void> register_builtin_resources(Server& server);
[[nodiscard]] ServerResult<void> register_builtin_prompts(Server& server);

/// All of the above, stopping at the first failure
[[nodiscard]] ServerResult<void> register_builtins(Server& server);

}  // namespace statmcp
