#include <mcp_manager/transport/line_splitter.hpp>

namespace mcp_manager {

namespace {

std::string StripCarriageReturn(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

} // anonymous namespace

std::vector<std::string> LineSplitter::Feed(std::string_view chunk) {
    std::vector<std::string> lines;
    buffer_.append(chunk.data(), chunk.size());

    size_t start = 0;
    size_t newline;
    while ((newline = buffer_.find('\n', start)) != std::string::npos) {
        lines.push_back(StripCarriageReturn(buffer_.substr(start, newline - start)));
        start = newline + 1;
    }
    buffer_.erase(0, start);
    return lines;
}

std::vector<std::string> LineSplitter::Flush() {
    std::vector<std::string> lines;
    if (!buffer_.empty()) {
        lines.push_back(StripCarriageReturn(std::move(buffer_)));
        buffer_.clear();
    }
    return lines;
}

} // namespace mcp_manager
