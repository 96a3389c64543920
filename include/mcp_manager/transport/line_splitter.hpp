#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace mcp_manager {

// ---------------------------------------------------------------------------
// LineSplitter: reassembles '\n'-terminated lines from arbitrary byte chunks.
// A trailing '\r' is stripped from every line.
// ---------------------------------------------------------------------------
class LineSplitter {
public:
    /// Append a chunk and return the lines it completed.
    std::vector<std::string> Feed(std::string_view chunk);

    /// Return the unterminated remainder (if any) as a final line.
    std::vector<std::string> Flush();

    [[nodiscard]] size_t Buffered() const { return buffer_.size(); }

private:
    std::string buffer_;
};

} // namespace mcp_manager
