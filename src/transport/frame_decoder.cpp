#include "transport/frame_decoder.hpp"

#include <cctype>
#include "core/logging/logger.hpp"

namespace mcpbridge::transport {

using nlohmann::json;

namespace {

std::string preview(std::string_view line) {
    constexpr std::size_t kMaxPreviewLength = 240;
    if (line.size() <= kMaxPreviewLength) {
        return std::string(line);
    }
    return std::string(line.substr(0, kMaxPreviewLength)) + "...";
}

bool is_blank(std::string_view line) {
    for (const char c : line) {
        if (std::isspace(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

}  // namespace

FrameDecoder::FrameDecoder(const std::size_t max_line_bytes)
    : max_line_bytes_(max_line_bytes) {}

void FrameDecoder::reset() {
    buffer_.clear();
    discarding_ = false;
}

std::vector<json> FrameDecoder::feed(std::string_view chunk) {
    std::vector<json> messages;

    std::size_t start = 0;
    while (true) {
        const std::size_t newline = chunk.find('\n', start);
        if (newline == std::string_view::npos) {
            break;
        }

        if (discarding_) {
            // Tail of an oversized line; it was already counted.
            discarding_ = false;
        } else {
            buffer_.append(chunk.substr(start, newline - start));
            decode_line(buffer_, messages);
        }
        buffer_.clear();
        start = newline + 1;
    }

    if (start < chunk.size() && !discarding_) {
        buffer_.append(chunk.substr(start));
        if (buffer_.size() > max_line_bytes_) {
            ++parse_failures_;
            LOG_WARN("FrameDecoder: dropping line longer than " +
                     std::to_string(max_line_bytes_) + " bytes");
            buffer_.clear();
            discarding_ = true;
        }
    }

    return messages;
}

void FrameDecoder::decode_line(std::string_view line, std::vector<json>& out) {
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }
    if (is_blank(line)) {
        return;
    }

    json parsed = json::parse(line.begin(), line.end(), nullptr, false);
    if (parsed.is_discarded()) {
        ++parse_failures_;
        LOG_WARN("FrameDecoder: discarding malformed line: " + preview(line));
        return;
    }
    if (!parsed.is_object()) {
        ++parse_failures_;
        LOG_WARN("FrameDecoder: discarding non-object line: " + preview(line));
        return;
    }
    out.push_back(std::move(parsed));
}

}  // namespace mcpbridge::transport
