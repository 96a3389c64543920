#include <mcp_manager/registry/log_buffer.hpp>

namespace mcp_manager {

void LogBuffer::Append(std::string_view text) {
    std::lock_guard<std::mutex> lock(mutex_);
    text_.append(text.data(), text.size());
}

std::string LogBuffer::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return text_;
}

size_t LogBuffer::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return text_.size();
}

} // namespace mcp_manager
