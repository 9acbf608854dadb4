#include "statmcp/tools/statistical_tools.hpp"
#include "statmcp/execution/execution_bridge.hpp"
#include "statmcp/format/result_formatter.hpp"
#include "statmcp/log/logger.hpp"
#include "statmcp/server/server.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace statmcp {
namespace {

namespace fs = std::filesystem;

constexpr std::uintmax_t kMaxFileResourceBytes = 1u << 20;
constexpr const char* kToolLogger = "statmcp.tools";

// ─────────────────────────────────────────────────────────────────────────────
// Engine-backed handlers
// ─────────────────────────────────────────────────────────────────────────────

asio::awaitable<ServerResult<CallToolResult>> run_engine(ExecutionBridge& bridge,
                                                         std::string script,
                                                         std::string title,
                                                         std::optional<std::chrono::milliseconds> timeout,
                                                         RequestContext& context,
                                                         Json arguments) {
    context.log(LoggingLevel::Debug, Json{{"tool", script}, {"event", "start"}}, kToolLogger);

    Invocation invocation{script, std::move(arguments), timeout};
    ExecutionOutcome result = co_await bridge.execute(std::move(invocation), context.shared_token());

    if (const auto* success = std::get_if<outcome::Success>(&result)) {
        co_return format_success(title, success->payload, success->formatted_text);
    }

    ServerError error = to_server_error(result, script);
    context.log(LoggingLevel::Warning,
                Json{{"tool", script}, {"outcome", std::string(outcome_name(result))}, {"message", error.message}},
                kToolLogger);
    co_return tl::unexpected(std::move(error));
}

ToolHandler engine_handler(ExecutionBridge& bridge,
                           std::string script,
                           std::string title,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt) {
    return [&bridge, script = std::move(script), title = std::move(title), timeout](RequestContext& context,
                                                                                   Json arguments) {
        return run_engine(bridge, script, title, timeout, context, std::move(arguments));
    };
}

// The file must lie under an allowed root; the engine gets the resolved path
asio::awaitable<ServerResult<CallToolResult>> run_read_csv(ExecutionBridge& bridge,
                                                           RequestContext& context,
                                                           Json arguments) {
    const std::string requested = arguments["file_path"].get<std::string>();
    if (context.lifespan().is_path_allowed(requested) == false) {
        STATMCP_LOG_WARN("read_csv refused path outside allowed roots: " + requested);
        co_return tl::unexpected(ServerError::invalid_params(
            "path is not under an allowed directory: " + requested, Json{{"path", requested}}));
    }

    std::error_code ec;
    const fs::path resolved = fs::weakly_canonical(fs::absolute(requested, ec), ec);
    if (ec) {
        co_return tl::unexpected(ServerError::invalid_params(
            "cannot resolve path " + requested + ": " + ec.message(), Json{{"path", requested}}));
    }
    arguments["file_path"] = resolved.string();

    co_return co_await run_engine(bridge, "read_csv", "CSV file", std::nullopt, context, std::move(arguments));
}

// ─────────────────────────────────────────────────────────────────────────────
// Input schemas
// ─────────────────────────────────────────────────────────────────────────────

// Names of columns of the `data` argument
Json column_list_schema(std::size_t min_items) {
    return {
        {"type", "array"},
        {"items", {{"type", "string"}, {"minLength", 1}}},
        {"minItems", min_items},
        {"x-column-of", "data"}
    };
}

Json column_name_schema(std::string description) {
    return {
        {"type", "string"},
        {"minLength", 1},
        {"description", std::move(description)},
        {"x-column-of", "data"}
    };
}

Json correlation_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"data", columnar_data_schema(ColumnValues::Numeric)},
            {"variables", column_list_schema(2)},
            {"method", {
                {"type", "string"},
                {"enum", {"pearson", "spearman", "kendall"}},
                {"default", "pearson"}
            }}
        }},
        {"required", Json::array({"data", "variables"})},
        {"additionalProperties", false}
    };
}

Json linear_model_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"data", columnar_data_schema()},
            {"formula", {
                {"type", "string"},
                {"minLength", 3},
                {"description", "R model formula, e.g. \"y ~ x1 + x2\""}
            }}
        }},
        {"required", Json::array({"data", "formula"})},
        {"additionalProperties", false}
    };
}

Json logistic_regression_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"data", columnar_data_schema()},
            {"formula", {
                {"type", "string"},
                {"minLength", 3},
                {"description", "R model formula with a 0/1 response, e.g. \"bought ~ income\""}
            }},
            {"link", {
                {"type", "string"},
                {"enum", {"logit", "probit", "cloglog"}},
                {"default", "logit"}
            }}
        }},
        {"required", Json::array({"data", "formula"})},
        {"additionalProperties", false}
    };
}

Json summary_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"data", columnar_data_schema(ColumnValues::Numeric)},
            {"variables", column_list_schema(1)}
        }},
        {"required", Json::array({"data"})},
        {"additionalProperties", false}
    };
}

Json t_test_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"data", columnar_data_schema()},
            {"variable", column_name_schema("Numeric column to test")},
            {"group", column_name_schema("Two-level grouping column; omit for a one-sample test")},
            {"mu", {{"type", "number"}, {"default", 0}}},
            {"alternative", {
                {"type", "string"},
                {"enum", {"two.sided", "less", "greater"}},
                {"default", "two.sided"}
            }},
            {"paired", {{"type", "boolean"}, {"default", false}}}
        }},
        {"required", Json::array({"data", "variable"})},
        {"additionalProperties", false}
    };
}

Json chi_square_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"data", columnar_data_schema()},
            {"x", column_name_schema("Categorical column")},
            {"y", column_name_schema("Second categorical column (independence test)")},
            {"test_type", {
                {"type", "string"},
                {"enum", {"independence", "goodness_of_fit"}},
                {"default", "independence"}
            }},
            {"expected", {
                {"type", "array"},
                {"items", {{"type", "number"}, {"minimum", 0}}},
                {"minItems", 1},
                {"description", "Expected proportions per category (goodness of fit); uniform when omitted"}
            }}
        }},
        {"required", Json::array({"data", "x"})},
        {"additionalProperties", false}
    };
}

Json normality_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"data", columnar_data_schema(ColumnValues::Numeric)},
            {"variable", column_name_schema("Column to test")}
        }},
        {"required", Json::array({"data", "variable"})},
        {"additionalProperties", false}
    };
}

Json frequency_table_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"data", columnar_data_schema()},
            {"variables", column_list_schema(1)},
            {"include_percentages", {{"type", "boolean"}, {"default", true}}},
            {"sort_by", {
                {"type", "string"},
                {"enum", {"frequency", "value"}},
                {"default", "frequency"}
            }}
        }},
        {"required", Json::array({"data", "variables"})},
        {"additionalProperties", false}
    };
}

Json data_info_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"data", columnar_data_schema()},
            {"include_sample", {{"type", "boolean"}, {"default", true}}},
            {"sample_size", {{"type", "integer"}, {"minimum", 1}, {"maximum", 100}, {"default", 5}}}
        }},
        {"required", Json::array({"data"})},
        {"additionalProperties", false}
    };
}

Json read_csv_schema() {
    return {
        {"type", "object"},
        {"properties", {
            {"file_path", {{"type", "string"}, {"minLength", 1}}},
            {"max_rows", {{"type", "integer"}, {"minimum", 1}}}
        }},
        {"required", Json::array({"file_path"})},
        {"additionalProperties", false}
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Output schemas
// ─────────────────────────────────────────────────────────────────────────────
// Only the members every successful run produces. R turns NA and NaN into
// null, so statistics admit null.

Json statistic() {
    return {{"type", Json::array({"number", "null"})}};
}

Json typed(const char* type) {
    return {{"type", type}};
}

Json result_schema(Json properties) {
    Json required = Json::array();
    for (const auto& [name, schema] : properties.items()) {
        required.push_back(name);
    }
    return {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)}
    };
}

Json correlation_output() {
    return result_schema({
        {"correlation_matrix", typed("object")},
        {"method", typed("string")},
        {"n_obs", typed("integer")}
    });
}

Json linear_model_output() {
    return result_schema({
        {"coefficients", typed("array")},
        {"r_squared", statistic()},
        {"n_obs", typed("integer")}
    });
}

Json logistic_regression_output() {
    return result_schema({
        {"coefficients", typed("array")},
        {"deviance", statistic()},
        {"accuracy", statistic()},
        {"n_obs", typed("integer")}
    });
}

Json summary_output() {
    return result_schema({
        {"statistics", typed("object")},
        {"n_obs", typed("integer")}
    });
}

Json t_test_output() {
    return result_schema({
        {"test_type", typed("string")},
        {"statistic", statistic()},
        {"p_value", statistic()}
    });
}

Json chi_square_output() {
    return result_schema({
        {"test_type", typed("string")},
        {"statistic", statistic()},
        {"df", statistic()},
        {"p_value", statistic()}
    });
}

Json normality_output() {
    return result_schema({
        {"statistic", statistic()},
        {"p_value", statistic()},
        {"is_normal", typed("boolean")},
        {"n_obs", typed("integer")}
    });
}

Json frequency_table_output() {
    return result_schema({
        {"frequency_tables", typed("object")},
        {"total_observations", typed("integer")}
    });
}

Json data_info_output() {
    return result_schema({
        {"dimensions", typed("object")},
        {"variables", typed("object")}
    });
}

Json read_csv_output() {
    return result_schema({
        {"data", typed("object")},
        {"rows", typed("integer")},
        {"column_names", typed("array")}
    });
}

ToolAnnotations read_only_annotations(std::string title) {
    ToolAnnotations annotations;
    annotations.title = std::move(title);
    annotations.read_only_hint = true;
    annotations.destructive_hint = false;
    annotations.idempotent_hint = true;
    annotations.open_world_hint = false;
    return annotations;
}

ToolDescriptor engine_tool(ExecutionBridge& bridge,
                           std::string name,
                           std::string title,
                           std::string description,
                           Json input_schema,
                           Json output_schema) {
    ToolDescriptor tool;
    tool.name = name;
    tool.title = title;
    tool.description = std::move(description);
    tool.input_schema = std::move(input_schema);
    tool.output_schema = std::move(output_schema);
    tool.annotations = read_only_annotations(title);
    tool.handler = engine_handler(bridge, std::move(name), std::move(title));
    return tool;
}

// ─────────────────────────────────────────────────────────────────────────────
// Resources
// ─────────────────────────────────────────────────────────────────────────────

ReadResourceResult json_contents(const std::string& uri, const Json& body) {
    ReadResourceResult result;
    result.contents.push_back(ResourceContents{
        uri, "application/json", body.dump(2, ' ', false, Json::error_handler_t::replace), std::nullopt});
    return result;
}

std::string mime_type_for(const fs::path& path) {
    const std::string extension = path.extension().string();
    if (extension == ".csv") return "text/csv";
    if (extension == ".json") return "application/json";
    if (extension == ".md") return "text/markdown";
    return "text/plain";
}

ServerResult<ReadResourceResult> read_file_resource(RequestContext& context, const std::string& uri) {
    constexpr std::string_view kPrefix = "file://";
    if (uri.starts_with(kPrefix) == false) {
        return tl::unexpected(ServerError::invalid_params("not a file URI: " + uri));
    }
    const fs::path path(uri.substr(kPrefix.size()));
    if (path.is_absolute() == false) {
        return tl::unexpected(ServerError::invalid_params("file URI must carry an absolute path: " + uri));
    }
    if (context.lifespan().is_path_allowed(path) == false) {
        return tl::unexpected(ServerError::invalid_params(
            "path is not under an allowed directory: " + path.string(), Json{{"path", path.string()}}));
    }

    std::error_code ec;
    if (fs::is_regular_file(path, ec) == false) {
        return tl::unexpected(ServerError::resource_not_found(uri));
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return tl::unexpected(ServerError::resource_not_found(uri));
    }
    if (size > kMaxFileResourceBytes) {
        return tl::unexpected(ServerError::invalid_params(
            "file is larger than " + std::to_string(kMaxFileResourceBytes) + " bytes",
            Json{{"path", path.string()}, {"size", size}}));
    }

    std::ifstream in(path, std::ios::binary);
    if (in.is_open() == false) {
        return tl::unexpected(ServerError::resource_not_found(uri));
    }
    std::ostringstream text;
    text << in.rdbuf();

    ReadResourceResult result;
    result.contents.push_back(ResourceContents{uri, mime_type_for(path), text.str(), std::nullopt});
    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Prompts
// ─────────────────────────────────────────────────────────────────────────────

GetPromptResult user_prompt(std::string description, std::string text) {
    GetPromptResult result;
    result.description = std::move(description);
    result.messages.push_back(PromptMessage{"user", TextContent{std::move(text), std::nullopt}});
    return result;
}

ServerResult<GetPromptResult> statistical_workflow(RequestContext& /*context*/, const PromptArguments& arguments) {
    std::string text;
    text += "I need help analysing a dataset.\n\n";
    text += "Dataset: " + arguments.at("dataset_description") + "\n";
    text += "Goals: " + arguments.at("analysis_goals") + "\n";
    if (const auto it = arguments.find("variables_of_interest"); it != arguments.end()) {
        text += "Variables of interest: " + it->second + "\n";
    }
    text += "\nPlease work through it step by step:\n"
            "1. Load the data with read_csv if it is in a file.\n"
            "2. Describe it with summary_statistics.\n"
            "3. Explore relationships with correlation_analysis.\n"
            "4. Test hypotheses with t_test or fit a linear_model, as the goals require.\n"
            "5. Interpret every result in plain language and state its limitations.";
    return user_prompt("Guided statistical analysis workflow", std::move(text));
}

ServerResult<GetPromptResult> model_diagnostic(RequestContext& /*context*/, const PromptArguments& arguments) {
    const auto it = arguments.find("model_type");
    const std::string model = (it != arguments.end()) ? it->second : std::string("linear regression");

    std::string text = "Please check the assumptions of my " + model + " model.\n\n";
    text += "Look at the residuals for non-linearity and unequal variance, check whether the "
            "residuals are roughly normal, and flag influential observations. For each problem "
            "you find, suggest a remedy and say how it would change the interpretation.";
    return user_prompt("Model diagnostic checklist", std::move(text));
}

}  // namespace

Json columnar_data_schema(ColumnValues values) {
    const bool numeric = (values == ColumnValues::Numeric);
    const Json item_type = numeric ? Json("number") : Json::array({"number", "string", "boolean", "null"});
    return {
        {"type", "object"},
        {"description", numeric ? "Data frame as an object of equal-length numeric columns"
                                : "Data frame as an object of equal-length columns"},
        {"minProperties", 1},
        {"additionalProperties", {
            {"type", "array"},
            {"minItems", 1},
            {"items", {{"type", item_type}}}
        }},
        {"x-columnar", true}
    };
}

ServerResult<void> register_statistical_tools(Server& server) {
    ExecutionBridge& bridge = server.bridge();
    ToolRegistry& tools = server.tools();

    std::vector<ToolDescriptor> descriptors;
    descriptors.push_back(engine_tool(
        bridge, "correlation_analysis", "Correlation analysis",
        "Pairwise correlation matrix (Pearson, Spearman or Kendall) for two or more numeric variables.",
        correlation_schema(), correlation_output()));
    descriptors.push_back(engine_tool(
        bridge, "linear_model", "Linear regression",
        "Fit an ordinary least squares model from an R formula; reports coefficients, R-squared and fit statistics.",
        linear_model_schema(), linear_model_output()));
    descriptors.push_back(engine_tool(
        bridge, "logistic_regression", "Logistic regression",
        "Fit a binomial GLM from an R formula; reports coefficients with odds ratios, "
        "McFadden's pseudo R-squared and classification accuracy.",
        logistic_regression_schema(), logistic_regression_output()));
    descriptors.push_back(engine_tool(
        bridge, "summary_statistics", "Summary statistics",
        "Count, mean, standard deviation, minimum, median and maximum for each numeric variable.",
        summary_schema(), summary_output()));
    descriptors.push_back(engine_tool(
        bridge, "t_test", "t-test",
        "One-sample, two-sample or paired t-test on a numeric variable.",
        t_test_schema(), t_test_output()));
    descriptors.push_back(engine_tool(
        bridge, "chi_square_test", "Chi-square test",
        "Chi-square test of independence between two categorical columns, or goodness of fit for one.",
        chi_square_schema(), chi_square_output()));
    descriptors.push_back(engine_tool(
        bridge, "normality_test", "Normality test",
        "Shapiro-Wilk normality test for a numeric column, with skewness and excess kurtosis.",
        normality_schema(), normality_output()));
    descriptors.push_back(engine_tool(
        bridge, "frequency_table", "Frequency table",
        "Counts and percentages of each distinct value in one or more columns.",
        frequency_table_schema(), frequency_table_output()));
    descriptors.push_back(engine_tool(
        bridge, "data_info", "Dataset information",
        "Dimensions, column types, missing values and sample rows of a data frame.",
        data_info_schema(), data_info_output()));

    ToolDescriptor read_csv;
    read_csv.name = "read_csv";
    read_csv.title = "Read CSV";
    read_csv.description = "Load a CSV file from an allowed directory into columnar data.";
    read_csv.input_schema = read_csv_schema();
    read_csv.output_schema = read_csv_output();
    read_csv.annotations = read_only_annotations("Read CSV");
    read_csv.handler = [&bridge](RequestContext& context, Json arguments) {
        return run_read_csv(bridge, context, std::move(arguments));
    };
    descriptors.push_back(std::move(read_csv));

    for (auto& descriptor : descriptors) {
        auto added = tools.register_tool(std::move(descriptor));
        if (!added) {
            return added;
        }
    }
    return {};
}

ServerResult<void> register_builtin_resources(Server& server) {
    ResourceRegistry& resources = server.resources();

    ResourceDescriptor catalog;
    catalog.uri = "statmcp://catalog";
    catalog.name = "Tool catalog";
    catalog.description = "Every registered tool with its input schema";
    catalog.mime_type = "application/json";
    catalog.reader = [&server](RequestContext& /*context*/, const std::string& uri)
        -> ServerResult<ReadResourceResult> {
        Json tools = Json::array();
        for (const auto& tool : server.tools().all()) {
            tools.push_back(tool.to_json());
        }
        return json_contents(uri, Json{{"tools", std::move(tools)}});
    };

    ResourceDescriptor env;
    env.uri = "statmcp://env";
    env.name = "Server environment";
    env.description = "Server identity, negotiated protocol version and statistical runtime";
    env.mime_type = "application/json";
    env.reader = [&server](RequestContext& context, const std::string& uri) -> ServerResult<ReadResourceResult> {
        const ServerConfig& config = server.config();
        Json body = {
            {"serverName", config.server_name},
            {"serverVersion", config.server_version},
            {"protocolVersion", context.session().protocol_version()},
            {"runtime", {
                {"command", config.runtime.command},
                {"args", config.runtime.args},
                {"scriptRoot", config.runtime.script_root.string()},
                {"timeoutMs", config.runtime.default_timeout.count()}
            }},
            {"config", to_json(config)}
        };
        return json_contents(uri, body);
    };

    for (auto* descriptor : {&catalog, &env}) {
        auto added = resources.register_resource(std::move(*descriptor));
        if (!added) {
            return added;
        }
    }
    return resources.add_scheme_reader("file", read_file_resource);
}

ServerResult<void> register_builtin_prompts(Server& server) {
    PromptRegistry& prompts = server.prompts();

    PromptDescriptor workflow;
    workflow.name = "statistical_workflow";
    workflow.title = "Statistical workflow";
    workflow.description = "Plan and run an analysis from a dataset description and goals";
    workflow.arguments = {
        PromptArgument{"dataset_description", "What the data is and where it comes from", true},
        PromptArgument{"analysis_goals", "The questions the analysis should answer", true},
        PromptArgument{"variables_of_interest", "Comma-separated variable names", false},
    };
    workflow.handler = statistical_workflow;

    PromptDescriptor diagnostic;
    diagnostic.name = "model_diagnostic";
    diagnostic.title = "Model diagnostics";
    diagnostic.description = "Checklist for validating a fitted model's assumptions";
    diagnostic.arguments = {
        PromptArgument{"model_type", "Kind of model, e.g. linear regression", false},
    };
    diagnostic.handler = model_diagnostic;

    auto added = prompts.register_prompt(std::move(workflow));
    if (!added) {
        return added;
    }
    return prompts.register_prompt(std::move(diagnostic));
}

ServerResult<void> register_builtins(Server& server) {
    auto tools = register_statistical_tools(server);
    if (!tools) {
        return tools;
    }
    auto resources = register_builtin_resources(server);
    if (!resources) {
        return resources;
    }
    return register_builtin_prompts(server);
}

}  // namespace statmcp
