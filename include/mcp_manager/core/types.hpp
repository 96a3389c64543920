#pragma once

#include <mcp_manager/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace mcp_manager {

// ---------------------------------------------------------------------------
// ServerId: validated identifier of a configured MCP server.
//
// Rules:
//   - Non-empty, max 64 characters
//   - ASCII letters, digits, '-', '_' and '.'
// ---------------------------------------------------------------------------
class ServerId {
public:
    static Result<ServerId, std::string> Create(std::string_view id);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ServerId& other) const { return value_ == other.value_; }
    bool operator!=(const ServerId& other) const { return value_ != other.value_; }
    bool operator<(const ServerId& other) const { return value_ < other.value_; }

    ServerId(const ServerId&) = default;
    ServerId& operator=(const ServerId&) = default;
    ServerId(ServerId&&) noexcept = default;
    ServerId& operator=(ServerId&&) noexcept = default;

private:
    explicit ServerId(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace mcp_manager

namespace std {

template <>
struct hash<mcp_manager::ServerId> {
    size_t operator()(const mcp_manager::ServerId& id) const noexcept {
        return hash<string>{}(id.Value());
    }
};

} // namespace std
