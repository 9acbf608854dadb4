#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace statmcp {

using Json = nlohmann::json;

struct JsonError {
    enum class Code {
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidParams,
        InvalidShape,
        Internal
    };

    Code code{Code::Internal};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

struct JsonRpcId {
    std::variant<std::int64_t, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId string(std::string v);
    static JsonResult<JsonRpcId> from_json(const Json& node);

    [[nodiscard]] Json to_json() const;

    /// Stable map key; distinguishes 1 from "1".
    [[nodiscard]] std::string key() const;

    friend bool operator==(const JsonRpcId& lhs, const JsonRpcId& rhs) {
        return lhs.value == rhs.value;
    }
};

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method, JsonRpcId id, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const JsonRpcId& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    JsonRpcId id_;
    std::optional<Json> params_;
};

class JsonRpcNotification {
public:
    explicit JsonRpcNotification(std::string method, std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcNotification> from_json(const Json& payload);

private:
    std::string method_;
    std::optional<Json> params_;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcError> from_json(const Json& node);
};

class JsonRpcResponse {
public:
    static JsonRpcResponse success(JsonRpcId id, Json result);

    /// id is empty when the failing message had no usable id (serialized as null)
    static JsonRpcResponse failure(std::optional<JsonRpcId> id, JsonRpcError error);

    [[nodiscard]] const std::optional<JsonRpcId>& id() const noexcept;
    [[nodiscard]] bool is_error() const noexcept;
    [[nodiscard]] const Json& result() const;
    [[nodiscard]] const JsonRpcError& error() const;

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcResponse> from_json(const Json& payload);

private:
    JsonRpcResponse(std::optional<JsonRpcId> id, std::variant<Json, JsonRpcError> outcome);

    std::optional<JsonRpcId> id_;
    std::variant<Json, JsonRpcError> outcome_;
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcNotification, JsonRpcResponse>;

/// Classify an inbound frame. Requests carry "method" and "id", notifications
/// carry "method" only, responses carry "result" or "error".
[[nodiscard]] JsonResult<JsonRpcMessage> parse_message(const Json& payload);

/// Best-effort id recovery from a frame that failed validation, so the
/// error reply can still be correlated.
[[nodiscard]] std::optional<JsonRpcId> recover_id(const Json& payload);

}  // namespace statmcp
