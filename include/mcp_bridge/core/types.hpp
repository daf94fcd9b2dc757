#pragma once

#include <mcp_bridge/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// BackendName: validated backend identifier.
//
// Rules:
//   - Non-empty, max 64 characters
//   - Lowercase ASCII letters, digits, '-' and '_'
//   - Starts with a letter
// The name appears in URL paths and in MCP_<NAME>_CMD environment keys.
// ---------------------------------------------------------------------------
class BackendName {
public:
    static Result<BackendName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    // "pricing-v2" -> "MCP_PRICING_V2_CMD"
    [[nodiscard]] std::string CommandEnvKey() const;

    bool operator==(const BackendName& other) const { return value_ == other.value_; }
    bool operator!=(const BackendName& other) const { return value_ != other.value_; }
    bool operator<(const BackendName& other) const { return value_ < other.value_; }

    BackendName(const BackendName&) = default;
    BackendName& operator=(const BackendName&) = default;
    BackendName(BackendName&&) noexcept = default;
    BackendName& operator=(BackendName&&) noexcept = default;

private:
    explicit BackendName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// SessionId: opaque session token handed to clients ("s-" + 16 hex digits).
// ---------------------------------------------------------------------------
class SessionId {
public:
    static Result<SessionId, std::string> Create(std::string_view token);
    static SessionId Generate();

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const SessionId& other) const { return value_ == other.value_; }
    bool operator!=(const SessionId& other) const { return value_ != other.value_; }
    bool operator<(const SessionId& other) const { return value_ < other.value_; }

    SessionId(const SessionId&) = default;
    SessionId& operator=(const SessionId&) = default;
    SessionId(SessionId&&) noexcept = default;
    SessionId& operator=(SessionId&&) noexcept = default;

private:
    explicit SessionId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace mcp_bridge

namespace std {

template <>
struct hash<mcp_bridge::SessionId> {
    size_t operator()(const mcp_bridge::SessionId& id) const noexcept {
        return hash<string>{}(id.Value());
    }
};

} // namespace std
