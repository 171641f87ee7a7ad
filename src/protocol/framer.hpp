#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>
#include "core/errors/proxy_errors.hpp"
#include "protocol/jsonrpc.hpp"

namespace mcproxy::protocol {

// One framing outcome: a complete message or a FramingError for a segment
// that was discarded.
using FrameEvent = core::errors::Result<Message>;

// Reassembles newline-delimited JSON-RPC messages from arbitrarily sized
// chunks. The incomplete tail is kept between feeds. A newline byte cannot
// occur unescaped inside a JSON string, so every delimiter is a boundary and
// an escaped "\n" inside a value never splits a message.
class Framer {
public:
    static constexpr std::size_t kDefaultMaxMessageBytes = 16 * 1024 * 1024;

    explicit Framer(std::size_t max_message_bytes = kDefaultMaxMessageBytes);

    std::vector<FrameEvent> feed(std::string_view chunk);

    void reset();
    std::size_t buffered_bytes() const { return buffer_.size(); }

private:
    void emit_segment(std::string_view segment, std::vector<FrameEvent>& events) const;

    std::size_t max_message_bytes_;
    std::string buffer_;
    std::size_t scan_from_ = 0;
    // Set after an oversize segment; bytes are dropped up to the next delimiter.
    bool skipping_ = false;
};

}  // namespace mcproxy::protocol
