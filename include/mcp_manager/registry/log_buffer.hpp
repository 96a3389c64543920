#pragma once

#include <mutex>
#include <string>
#include <string_view>

namespace mcp_manager {

// Append-only text log of one server. Readers take snapshots.
class LogBuffer {
public:
    void Append(std::string_view text);
    [[nodiscard]] std::string Snapshot() const;
    [[nodiscard]] size_t Size() const;

private:
    mutable std::mutex mutex_;
    std::string text_;
};

} // namespace mcp_manager
