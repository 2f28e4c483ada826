#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace mcpbridge::transport {

// Reassembles newline-delimited JSON objects from arbitrarily chunked input.
//
// The buffer always holds exactly the bytes after the last newline seen.
// Blank lines are skipped; lines that are not a JSON object are logged,
// counted and skipped without affecting the lines around them.
// Not thread-safe: one reader feeds it.
class FrameDecoder {
public:
    explicit FrameDecoder(std::size_t max_line_bytes = 16 * 1024 * 1024);

    std::vector<nlohmann::json> feed(std::string_view chunk);

    std::size_t buffered_bytes() const { return buffer_.size(); }
    std::size_t parse_failures() const { return parse_failures_; }
    void reset();

private:
    void decode_line(std::string_view line, std::vector<nlohmann::json>& out);

    std::size_t max_line_bytes_;
    std::string buffer_;
    bool discarding_ = false;
    std::size_t parse_failures_ = 0;
};

}  // namespace mcpbridge::transport
