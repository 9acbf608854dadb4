#ifndef STATMCP_PROTOCOL_MCP_TYPES_HPP
#define STATMCP_PROTOCOL_MCP_TYPES_HPP

#include "statmcp/protocol/json_rpc.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace statmcp {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Version
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr std::string_view MCP_LATEST_PROTOCOL_VERSION = "2025-06-18";

// Newest first
inline constexpr std::array<std::string_view, 3> MCP_SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-06-18",
    "2025-03-26",
    "2024-11-05"
};

/// Echo the client's version when we speak it, otherwise offer our latest.
[[nodiscard]] inline std::string negotiate_protocol_version(std::string_view requested) {
    for (const auto& supported : MCP_SUPPORTED_PROTOCOL_VERSIONS) {
        if (supported == requested) {
            return std::string(supported);
        }
    }
    return std::string(MCP_LATEST_PROTOCOL_VERSION);
}

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        if (j.is_object() == false) {
            return {};
        }
        return {
            j.value("name", ""),
            j.value("version", "")
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════

struct ClientCapabilities {
    bool roots = false;
    bool roots_list_changed = false;
    bool sampling = false;
    bool elicitation = false;
    Json raw = Json::object();  // Kept verbatim for logging and resources

    static ClientCapabilities from_json(const Json& j) {
        ClientCapabilities caps;
        if (j.is_object() == false) {
            return caps;
        }
        caps.raw = j;
        if (j.contains("roots") && j["roots"].is_object()) {
            caps.roots = true;
            caps.roots_list_changed = j["roots"].value("listChanged", false);
        }
        caps.sampling = j.contains("sampling");
        caps.elicitation = j.contains("elicitation");
        return caps;
    }
};

struct ServerCapabilities {
    struct Prompts {
        bool list_changed = false;
    };
    struct Resources {
        bool subscribe = false;
        bool list_changed = false;
    };
    struct Tools {
        bool list_changed = false;
    };
    struct Logging {};

    std::optional<Prompts> prompts;
    std::optional<Resources> resources;
    std::optional<Tools> tools;
    std::optional<Logging> logging;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (tools) {
            j["tools"] = {{"listChanged", tools->list_changed}};
        }
        if (resources) {
            j["resources"] = {
                {"subscribe", resources->subscribe},
                {"listChanged", resources->list_changed}
            };
        }
        if (prompts) {
            j["prompts"] = {{"listChanged", prompts->list_changed}};
        }
        if (logging) {
            j["logging"] = Json::object();
        }
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize Request/Response
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version;
    ClientCapabilities capabilities;
    Implementation client_info;

    /// Only protocolVersion is mandatory; missing capabilities or clientInfo
    /// are tolerated because several clients omit them.
    static JsonResult<InitializeParams> from_json(const Json& j) {
        if (j.is_object() == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidParams,
                "initialize params must be an object"});
        }
        if ((j.contains("protocolVersion") == false) || (j["protocolVersion"].is_string() == false)) {
            return tl::unexpected(JsonError{
                JsonError::Code::MissingField,
                "protocolVersion must be a string"});
        }

        InitializeParams params;
        params.protocol_version = j["protocolVersion"].get<std::string>();
        if (j.contains("capabilities")) {
            params.capabilities = ClientCapabilities::from_json(j["capabilities"]);
        }
        if (j.contains("clientInfo")) {
            params.client_info = Implementation::from_json(j["clientInfo"]);
        }
        return params;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;

    [[nodiscard]] Json to_json() const {
        Json j = {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"serverInfo", server_info.to_json()}
        };
        if (instructions) {
            j["instructions"] = *instructions;
        }
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

// ─────────────────────────────────────────────────────────────────────────────
// Tool Annotations
// ─────────────────────────────────────────────────────────────────────────────
// Hints about tool behavior; clients use them to decide on confirmation.

struct ToolAnnotations {
    std::optional<std::string> title;
    std::optional<bool> read_only_hint;
    std::optional<bool> destructive_hint;
    std::optional<bool> idempotent_hint;
    std::optional<bool> open_world_hint;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (title) j["title"] = *title;
        if (read_only_hint) j["readOnlyHint"] = *read_only_hint;
        if (destructive_hint) j["destructiveHint"] = *destructive_hint;
        if (idempotent_hint) j["idempotentHint"] = *idempotent_hint;
        if (open_world_hint) j["openWorldHint"] = *open_world_hint;
        return j;
    }

    [[nodiscard]] bool empty() const {
        return !title && !read_only_hint && !destructive_hint &&
               !idempotent_hint && !open_world_hint;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Content Types
// ═══════════════════════════════════════════════════════════════════════════

struct TextContent {
    std::string text;
    std::optional<Json> annotations;

    [[nodiscard]] Json to_json() const {
        Json j = {{"type", "text"}, {"text", text}};
        if (annotations) {
            j["annotations"] = *annotations;
        }
        return j;
    }
};

struct CallToolResult {
    std::vector<TextContent> content;
    std::optional<Json> structured_content;
    bool is_error = false;

    [[nodiscard]] Json to_json() const {
        Json blocks = Json::array();
        for (const auto& block : content) {
            blocks.push_back(block.to_json());
        }
        Json j = {{"content", std::move(blocks)}, {"isError", is_error}};
        if (structured_content) {
            j["structuredContent"] = *structured_content;
        }
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Resources
// ═══════════════════════════════════════════════════════════════════════════

struct ResourceContents {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // Base64 encoded

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}};
        if (mime_type) j["mimeType"] = *mime_type;
        if (text) j["text"] = *text;
        if (blob) j["blob"] = *blob;
        return j;
    }
};

struct ReadResourceResult {
    std::vector<ResourceContents> contents;

    [[nodiscard]] Json to_json() const {
        Json arr = Json::array();
        for (const auto& c : contents) {
            arr.push_back(c.to_json());
        }
        return {{"contents", std::move(arr)}};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Prompts
// ═══════════════════════════════════════════════════════════════════════════

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) j["description"] = *description;
        j["required"] = required;
        return j;
    }
};

struct PromptMessage {
    std::string role;  // "user" or "assistant"
    TextContent content;

    [[nodiscard]] Json to_json() const {
        return {{"role", role}, {"content", content.to_json()}};
    }
};

struct GetPromptResult {
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;

    [[nodiscard]] Json to_json() const {
        Json arr = Json::array();
        for (const auto& m : messages) {
            arr.push_back(m.to_json());
        }
        Json j = {{"messages", std::move(arr)}};
        if (description) j["description"] = *description;
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Cancellation
// ═══════════════════════════════════════════════════════════════════════════
// MCP notification: "notifications/cancelled"

struct CancelledNotification {
    JsonRpcId request_id{JsonRpcId::integer(0)};
    std::optional<std::string> reason;

    [[nodiscard]] static JsonResult<CancelledNotification> from_json(const Json& j) {
        if ((j.is_object() == false) || (j.contains("requestId") == false)) {
            return tl::unexpected(JsonError{
                JsonError::Code::MissingField,
                "cancelled notification requires requestId"});
        }
        auto id = JsonRpcId::from_json(j["requestId"]);
        if (id.has_value() == false) {
            return tl::unexpected(id.error());
        }

        CancelledNotification result;
        result.request_id = std::move(*id);
        if (j.contains("reason") && j["reason"].is_string()) {
            result.reason = j["reason"].get<std::string>();
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Logging Control
// ═══════════════════════════════════════════════════════════════════════════
// MCP method: "logging/setLevel"; notifications go out as "notifications/message".
// Levels follow RFC 5424 severity order.

enum class LoggingLevel {
    Debug,
    Info,
    Notice,
    Warning,
    Error,
    Critical,
    Alert,
    Emergency
};

[[nodiscard]] constexpr std::string_view to_string(LoggingLevel level) noexcept {
    switch (level) {
        case LoggingLevel::Debug:     return "debug";
        case LoggingLevel::Info:      return "info";
        case LoggingLevel::Notice:    return "notice";
        case LoggingLevel::Warning:   return "warning";
        case LoggingLevel::Error:     return "error";
        case LoggingLevel::Critical:  return "critical";
        case LoggingLevel::Alert:     return "alert";
        case LoggingLevel::Emergency: return "emergency";
    }
    return "info";
}

[[nodiscard]] inline std::optional<LoggingLevel> logging_level_from_string(std::string_view s) {
    if (s == "debug") return LoggingLevel::Debug;
    if (s == "info") return LoggingLevel::Info;
    if (s == "notice") return LoggingLevel::Notice;
    if (s == "warning") return LoggingLevel::Warning;
    if (s == "error") return LoggingLevel::Error;
    if (s == "critical") return LoggingLevel::Critical;
    if (s == "alert") return LoggingLevel::Alert;
    if (s == "emergency") return LoggingLevel::Emergency;
    return std::nullopt;
}

}  // namespace statmcp

#endif  // STATMCP_PROTOCOL_MCP_TYPES_HPP
