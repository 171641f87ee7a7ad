#include "protocol/framer.hpp"

#include <cctype>

namespace mcproxy::protocol {

using core::errors::ErrorCategory;
using core::errors::ProxyError;

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1);
    }
    return text;
}

std::string excerpt(std::string_view text) {
    constexpr std::size_t kMaxExcerpt = 120;
    if (text.size() <= kMaxExcerpt) {
        return std::string(text);
    }
    return std::string(text.substr(0, kMaxExcerpt)) + "...";
}

}  // namespace

Framer::Framer(const std::size_t max_message_bytes)
    : max_message_bytes_(max_message_bytes) {}

std::vector<FrameEvent> Framer::feed(std::string_view chunk) {
    std::vector<FrameEvent> events;

    if (skipping_) {
        const auto newline = chunk.find('\n');
        if (newline == std::string_view::npos) {
            return events;
        }
        skipping_ = false;
        chunk.remove_prefix(newline + 1);
    }

    buffer_.append(chunk.data(), chunk.size());

    std::size_t segment_start = 0;
    std::size_t newline = buffer_.find('\n', scan_from_);
    while (newline != std::string::npos) {
        emit_segment(std::string_view(buffer_).substr(segment_start, newline - segment_start),
                     events);
        segment_start = newline + 1;
        newline = buffer_.find('\n', segment_start);
    }

    buffer_.erase(0, segment_start);
    scan_from_ = buffer_.size();

    if (buffer_.size() > max_message_bytes_) {
        events.push_back(ProxyError{
            ErrorCategory::Framing,
            "Message exceeds " + std::to_string(max_message_bytes_) +
                " bytes without a delimiter; discarding it.",
            "message_too_large"});
        buffer_.clear();
        scan_from_ = 0;
        skipping_ = true;
    }

    return events;
}

void Framer::reset() {
    buffer_.clear();
    scan_from_ = 0;
    skipping_ = false;
}

void Framer::emit_segment(std::string_view segment,
                          std::vector<FrameEvent>& events) const {
    segment = trim(segment);
    if (segment.empty()) {
        return;
    }

    Message parsed = Message::parse(segment.begin(), segment.end(), nullptr, false);
    if (parsed.is_discarded()) {
        events.push_back(ProxyError{ErrorCategory::Framing,
                                    "Malformed JSON line: " + excerpt(segment),
                                    "malformed_json"});
        return;
    }
    if (classify(parsed) == MessageKind::Invalid) {
        events.push_back(ProxyError{ErrorCategory::Framing,
                                    "Line is not a JSON-RPC message: " + excerpt(segment),
                                    "not_jsonrpc"});
        return;
    }
    events.push_back(std::move(parsed));
}

}  // namespace mcproxy::protocol
