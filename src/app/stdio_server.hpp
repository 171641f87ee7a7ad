#pragma once

#include <cstddef>
#include <future>
#include <mutex>
#include <ostream>
#include <vector>
#include "protocol/framer.hpp"
#include "protocol/jsonrpc.hpp"
#include "proxy/proxy.hpp"

namespace mcproxy::app {

// Serves one caller over a pair of streams: newline-delimited JSON-RPC in on
// `input_fd`, responses and forwarded notifications out on `output`.
class StdioServer {
public:
    StdioServer(proxy::Proxy& proxy, int input_fd, std::ostream& output);
    ~StdioServer();

    StdioServer(const StdioServer&) = delete;
    StdioServer& operator=(const StdioServer&) = delete;

    // Returns at end of input, after every started request has been
    // answered and the proxy has been shut down.
    void run();

    std::size_t messages_written() const;

private:
    void dispatch(protocol::Message message);
    void answer(const protocol::Message& request);
    void write_message(const protocol::Message& message);
    void prune_finished();
    void wait_all();

    proxy::Proxy& proxy_;
    int input_fd_;
    std::ostream& output_;
    protocol::Framer framer_;

    mutable std::mutex write_mutex_;
    std::size_t written_ = 0;
    std::vector<std::future<void>> tasks_;
};

}  // namespace mcproxy::app
