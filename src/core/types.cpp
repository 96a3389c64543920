#include <mcp_manager/core/types.hpp>

#include <algorithm>

namespace mcp_manager {

namespace {

bool IsIdChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ServerId
// ---------------------------------------------------------------------------
Result<ServerId, std::string> ServerId::Create(std::string_view id) {
    if (id.empty()) {
        return Result<ServerId, std::string>::Err("Server id must not be empty");
    }
    if (id.size() > 64) {
        return Result<ServerId, std::string>::Err(
            "Server id must be at most 64 characters, got " +
            std::to_string(id.size()));
    }
    if (!std::all_of(id.begin(), id.end(), IsIdChar)) {
        return Result<ServerId, std::string>::Err(
            "Server id must contain only letters, digits, '-', '_' and '.': " +
            std::string(id));
    }
    return Result<ServerId, std::string>::Ok(ServerId(std::string(id)));
}

} // namespace mcp_manager
