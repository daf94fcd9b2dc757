#include <mcp_bridge/core/types.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace mcp_bridge {

namespace {

bool IsLowerAlnumDashUnderscore(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
}

bool IsHexDigit(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

constexpr std::string_view kSessionPrefix = "s-";
constexpr size_t kSessionHexDigits = 16;

} // anonymous namespace

// ---------------------------------------------------------------------------
// BackendName
// ---------------------------------------------------------------------------
Result<BackendName, std::string> BackendName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<BackendName, std::string>::Err("Backend name must not be empty");
    }
    if (name.size() > 64) {
        return Result<BackendName, std::string>::Err(
            "Backend name must be at most 64 characters, got " +
            std::to_string(name.size()));
    }
    if (name[0] < 'a' || name[0] > 'z') {
        return Result<BackendName, std::string>::Err(
            "Backend name must start with a lowercase letter: " + std::string(name));
    }
    if (!std::all_of(name.begin(), name.end(), IsLowerAlnumDashUnderscore)) {
        return Result<BackendName, std::string>::Err(
            "Backend name must contain only lowercase letters, digits, '-' and '_': " +
            std::string(name));
    }
    return Result<BackendName, std::string>::Ok(BackendName(std::string(name)));
}

std::string BackendName::CommandEnvKey() const {
    std::string key = "MCP_";
    for (char c : value_) {
        key += (c == '-') ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    key += "_CMD";
    return key;
}

// ---------------------------------------------------------------------------
// SessionId
// ---------------------------------------------------------------------------
Result<SessionId, std::string> SessionId::Create(std::string_view token) {
    if (token.size() != kSessionPrefix.size() + kSessionHexDigits ||
        token.substr(0, kSessionPrefix.size()) != kSessionPrefix) {
        return Result<SessionId, std::string>::Err(
            "Session token must have the form s-<16 hex digits>");
    }
    auto digits = token.substr(kSessionPrefix.size());
    if (!std::all_of(digits.begin(), digits.end(), IsHexDigit)) {
        return Result<SessionId, std::string>::Err(
            "Session token must have the form s-<16 hex digits>");
    }
    return Result<SessionId, std::string>::Ok(SessionId(std::string(token)));
}

SessionId SessionId::Generate() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    uint64_t value = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        value = engine();
    }
    std::ostringstream oss;
    oss << kSessionPrefix << std::hex << std::setfill('0')
        << std::setw(kSessionHexDigits) << value;
    return SessionId(oss.str());
}

} // namespace mcp_bridge
