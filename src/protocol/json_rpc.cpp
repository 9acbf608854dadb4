#include "statmcp/protocol/json_rpc.hpp"

#include <stdexcept>

namespace statmcp {
namespace {
constexpr std::string_view kJsonRpcVersion{"2.0"};

bool is_valid_params_type(const Json& node) {
    const bool is_object = node.is_object();
    const bool is_array = node.is_array();
    return (is_object == true) || (is_array == true);
}

JsonResult<void> check_envelope(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidShape,
            "message must be a JSON object"});
    }

    const bool has_version_field = payload.contains("jsonrpc");
    if (has_version_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing jsonrpc version field"});
    }

    const Json& version_node = payload.at("jsonrpc");
    const bool version_is_string = version_node.is_string();
    if ((version_is_string == false) || (version_node != kJsonRpcVersion)) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidVersion,
            "jsonrpc must equal \"2.0\""});
    }
    return {};
}

JsonResult<std::optional<Json>> extract_params(const Json& payload) {
    std::optional<Json> parsed_params;
    const bool has_params_field = payload.contains("params");
    if (has_params_field == true) {
        const Json& params_node = payload.at("params");
        const bool params_are_valid = is_valid_params_type(params_node);
        if (params_are_valid == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidParams,
                "params must be an object or array"});
        }
        parsed_params = params_node;
    }
    return parsed_params;
}

JsonResult<std::string> extract_method(const Json& payload) {
    const bool has_method_field = payload.contains("method");
    if (has_method_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::MissingField,
            "missing method field"});
    }

    const Json& method_node = payload.at("method");
    if ((method_node.is_string() == false) || method_node.get_ref<const std::string&>().empty()) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidShape,
            "method must be a non-empty string"});
    }
    return method_node.get<std::string>();
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

JsonResult<JsonRpcId> JsonRpcId::from_json(const Json& id_node) {
    if (id_node.is_number_integer() == true) {
        return JsonRpcId::integer(id_node.get<std::int64_t>());
    }
    if (id_node.is_string() == true) {
        return JsonRpcId::string(id_node.get<std::string>());
    }

    return tl::unexpected(JsonError{
        JsonError::Code::InvalidId,
        "id must be an integer or string"});
}

Json JsonRpcId::to_json() const {
    Json node;
    std::visit([&node](const auto& id_value) { node = id_value; }, value);
    return node;
}

std::string JsonRpcId::key() const {
    if (std::holds_alternative<std::int64_t>(value)) {
        return "i:" + std::to_string(std::get<std::int64_t>(value));
    }
    return "s:" + std::get<std::string>(value);
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               JsonRpcId id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const JsonRpcId& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.to_json();
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (envelope.has_value() == false) {
        return tl::unexpected(envelope.error());
    }

    auto method = extract_method(payload);
    if (method.has_value() == false) {
        return tl::unexpected(method.error());
    }

    const bool has_id_field = payload.contains("id");
    if (has_id_field == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }
    auto parsed_id = JsonRpcId::from_json(payload.at("id"));
    if (parsed_id.has_value() == false) {
        return tl::unexpected(parsed_id.error());
    }

    auto params = extract_params(payload);
    if (params.has_value() == false) {
        return tl::unexpected(params.error());
    }

    return JsonRpcRequest(std::move(*method), std::move(*parsed_id), std::move(*params));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcNotification
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcNotification::JsonRpcNotification(std::string method,
                                         std::optional<Json> params)
    : method_(std::move(method)),
      params_(std::move(params)) {}

const std::string& JsonRpcNotification::method() const noexcept {
    return method_;
}

const std::optional<Json>& JsonRpcNotification::params() const noexcept {
    return params_;
}

Json JsonRpcNotification::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcNotification> JsonRpcNotification::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (envelope.has_value() == false) {
        return tl::unexpected(envelope.error());
    }
    if (payload.contains("id")) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidShape,
            "notifications must not carry an id"});
    }

    auto method = extract_method(payload);
    if (method.has_value() == false) {
        return tl::unexpected(method.error());
    }

    auto params = extract_params(payload);
    if (params.has_value() == false) {
        return tl::unexpected(params.error());
    }

    return JsonRpcNotification(std::move(*method), std::move(*params));
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload;
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonResult<JsonRpcError> JsonRpcError::from_json(const Json& node) {
    const bool well_formed = node.is_object()
        && node.contains("code") && node.at("code").is_number_integer()
        && node.contains("message") && node.at("message").is_string();
    if (well_formed == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidShape,
            "error must be an object with integer code and string message"});
    }

    JsonRpcError error;
    error.code = node.at("code").get<std::int64_t>();
    error.message = node.at("message").get<std::string>();
    if (node.contains("data")) {
        error.data = node.at("data");
    }
    return error;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcResponse::JsonRpcResponse(std::optional<JsonRpcId> id,
                                 std::variant<Json, JsonRpcError> outcome)
    : id_(std::move(id)),
      outcome_(std::move(outcome)) {}

JsonRpcResponse JsonRpcResponse::success(JsonRpcId id, Json result) {
    return JsonRpcResponse(std::move(id), std::move(result));
}

JsonRpcResponse JsonRpcResponse::failure(std::optional<JsonRpcId> id, JsonRpcError error) {
    return JsonRpcResponse(std::move(id), std::move(error));
}

const std::optional<JsonRpcId>& JsonRpcResponse::id() const noexcept {
    return id_;
}

bool JsonRpcResponse::is_error() const noexcept {
    return std::holds_alternative<JsonRpcError>(outcome_);
}

const Json& JsonRpcResponse::result() const {
    if (is_error()) {
        throw std::logic_error("JsonRpcResponse::result() called on an error response");
    }
    return std::get<Json>(outcome_);
}

const JsonRpcError& JsonRpcResponse::error() const {
    if (is_error() == false) {
        throw std::logic_error("JsonRpcResponse::error() called on a success response");
    }
    return std::get<JsonRpcError>(outcome_);
}

Json JsonRpcResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_.has_value() ? id_->to_json() : Json(nullptr);
    if (is_error()) {
        payload["error"] = std::get<JsonRpcError>(outcome_).to_json();
    } else {
        payload["result"] = std::get<Json>(outcome_);
    }
    return payload;
}

JsonResult<JsonRpcResponse> JsonRpcResponse::from_json(const Json& payload) {
    auto envelope = check_envelope(payload);
    if (envelope.has_value() == false) {
        return tl::unexpected(envelope.error());
    }

    const bool has_result = payload.contains("result");
    const bool has_error = payload.contains("error");
    if (has_result == has_error) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidShape,
            "response must carry exactly one of result or error"});
    }

    if (payload.contains("id") == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidId,
            "missing id field"});
    }

    std::optional<JsonRpcId> id;
    const Json& id_node = payload.at("id");
    if (id_node.is_null() == false) {
        auto parsed_id = JsonRpcId::from_json(id_node);
        if (parsed_id.has_value() == false) {
            return tl::unexpected(parsed_id.error());
        }
        id = std::move(*parsed_id);
    }

    if (has_result) {
        if (id.has_value() == false) {
            return tl::unexpected(JsonError{
                JsonError::Code::InvalidId,
                "success response requires a non-null id"});
        }
        return JsonRpcResponse::success(std::move(*id), payload.at("result"));
    }

    auto error = JsonRpcError::from_json(payload.at("error"));
    if (error.has_value() == false) {
        return tl::unexpected(error.error());
    }
    return JsonRpcResponse::failure(std::move(id), std::move(*error));
}

// ─────────────────────────────────────────────────────────────────────────────
// Message classification
// ─────────────────────────────────────────────────────────────────────────────

JsonResult<JsonRpcMessage> parse_message(const Json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(JsonError{
            JsonError::Code::InvalidShape,
            "message must be a JSON object"});
    }

    const bool has_method = payload.contains("method");
    const bool has_id = payload.contains("id");

    if (has_method && has_id) {
        auto request = JsonRpcRequest::from_json(payload);
        if (request.has_value() == false) {
            return tl::unexpected(request.error());
        }
        return JsonRpcMessage{std::move(*request)};
    }
    if (has_method) {
        auto notification = JsonRpcNotification::from_json(payload);
        if (notification.has_value() == false) {
            return tl::unexpected(notification.error());
        }
        return JsonRpcMessage{std::move(*notification)};
    }

    auto response = JsonRpcResponse::from_json(payload);
    if (response.has_value() == false) {
        return tl::unexpected(response.error());
    }
    return JsonRpcMessage{std::move(*response)};
}

std::optional<JsonRpcId> recover_id(const Json& payload) {
    if ((payload.is_object() == false) || (payload.contains("id") == false)) {
        return std::nullopt;
    }
    auto id = JsonRpcId::from_json(payload.at("id"));
    if (id.has_value() == false) {
        return std::nullopt;
    }
    return *id;
}

}  // namespace statmcp
