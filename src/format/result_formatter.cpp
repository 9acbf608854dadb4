#include "statmcp/format/result_formatter.hpp"

#include <cmath>
#include <format>

namespace statmcp {
namespace {

constexpr const char* kFormattingKey = "_formatting";

std::string trim_zeros(std::string text) {
    if (text.find('.') == std::string::npos) {
        return text;
    }
    while ((text.empty() == false) && (text.back() == '0')) {
        text.pop_back();
    }
    if ((text.empty() == false) && (text.back() == '.')) {
        text.pop_back();
    }
    if (text == "-0") {
        return "0";
    }
    return text;
}

std::optional<std::string> formatting_text(const Json& payload, const char* field) {
    if ((payload.is_object() == false) || (payload.contains(kFormattingKey) == false)) {
        return std::nullopt;
    }
    const Json& formatting = payload[kFormattingKey];
    if ((formatting.is_object() == false) || (formatting.contains(field) == false) ||
        (formatting[field].is_string() == false)) {
        return std::nullopt;
    }
    const auto& text = formatting[field].get_ref<const std::string&>();
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

}  // namespace

std::string format_number(const Json& number) {
    if (number.is_number_integer()) {
        return number.dump();
    }
    if (number.is_number() == false) {
        return number.dump();
    }

    const double value = number.get<double>();
    if (std::isfinite(value) == false) {
        return std::isnan(value) ? "NaN" : (value > 0 ? "Inf" : "-Inf");
    }
    if ((value != 0.0) && (std::fabs(value) < 1e-4)) {
        return std::format("{:.4g}", value);
    }
    return trim_zeros(std::format("{:.4f}", value));
}

std::string build_summary(std::string_view title, const Json& payload) {
    std::string summary;

    if (auto custom = formatting_text(payload, "summary")) {
        summary = *custom;
    } else {
        summary = std::format("**{}** summary:", title);
        std::size_t bullets = 0;
        if (payload.is_object()) {
            for (const auto& [key, value] : payload.items()) {
                if (bullets == kMaxSummaryBullets) {
                    break;
                }
                if (key.starts_with('_')) {
                    continue;
                }
                std::string rendered;
                if (value.is_number()) {
                    rendered = format_number(value);
                } else if (value.is_string()) {
                    rendered = value.get<std::string>();
                } else if (value.is_boolean()) {
                    rendered = value.get<bool>() ? "true" : "false";
                } else {
                    continue;
                }
                summary += std::format("\n- **{}**: {}", key, rendered);
                ++bullets;
            }
        }
    }

    if (auto interpretation = formatting_text(payload, "interpretation")) {
        summary += "\n\n";
        summary += *interpretation;
    }
    return summary;
}

CallToolResult format_success(std::string_view title,
                              const Json& payload,
                              std::string_view formatted_text) {
    CallToolResult result;
    result.content.push_back(TextContent{build_summary(title, payload), std::nullopt});

    if (formatted_text.empty() == false) {
        result.content.push_back(TextContent{std::string(formatted_text), std::nullopt});
    }

    Json structured = payload;
    if (structured.is_object()) {
        structured.erase(std::string(kFormattingKey));
    }

    result.content.push_back(TextContent{
        structured.dump(2, ' ', false, Json::error_handler_t::replace),
        Json{{"mimeType", "application/json"}}
    });
    result.structured_content = std::move(structured);
    result.is_error = false;
    return result;
}

}  // namespace statmcp
