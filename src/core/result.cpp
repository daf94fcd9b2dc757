#include <mcp_bridge/core/result.hpp>

#include <nlohmann/json.hpp>

#include <array>
#include <sstream>
#include <utility>

namespace mcp_bridge {

namespace {

struct CategoryInfo {
    ErrorCategory category;
    const char* name;
    int http_status;
};

constexpr std::array<CategoryInfo, 10> kCategories = {{
    {ErrorCategory::LaunchError,         "launch_error",         502},
    {ErrorCategory::BackendUnavailable,  "backend_unavailable",  503},
    {ErrorCategory::BackendDisconnected, "backend_disconnected", 502},
    {ErrorCategory::DecodeError,         "decode_error",         502},
    {ErrorCategory::Timeout,             "timeout",              504},
    {ErrorCategory::ProtocolError,       "protocol_error",       502},
    {ErrorCategory::InvalidRequest,      "invalid_request",      400},
    {ErrorCategory::SessionNotFound,     "session_not_found",    404},
    {ErrorCategory::Config,              "config",               500},
    {ErrorCategory::Internal,            "internal",             500},
}};

const CategoryInfo& Lookup(ErrorCategory category) {
    for (const auto& info : kCategories) {
        if (info.category == category) {
            return info;
        }
    }
    return kCategories.back();
}

} // anonymous namespace

Error Error::Make(ErrorCategory category,
                  std::string operation,
                  std::string backend,
                  std::string message,
                  std::optional<std::string> detail) {
    return Error{std::move(operation), std::move(backend), std::move(message),
                 category, std::move(detail)};
}

std::string Error::CategoryName() const {
    return Lookup(category).name;
}

int Error::HttpStatus() const {
    return Lookup(category).http_status;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!backend.empty()) {
        oss << " [" << backend << "]";
    }
    oss << " (" << CategoryName() << "): " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << " | " << *detail;
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
    };
    if (!backend.empty()) {
        body["backend"] = backend;
    }
    if (detail.has_value() && !detail->empty()) {
        body["detail"] = *detail;
    }
    return nlohmann::json{{"error", body}}.dump();
}

ErrorCategory CategoryFromName(const std::string& name) {
    for (const auto& info : kCategories) {
        if (name == info.name) {
            return info.category;
        }
    }
    return ErrorCategory::Internal;
}

} // namespace mcp_bridge
