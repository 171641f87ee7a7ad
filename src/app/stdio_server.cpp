#include "app/stdio_server.hpp"

#include <cerrno>
#include <chrono>
#include <string_view>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace mcproxy::app {

using protocol::Message;

namespace {

constexpr int kParseErrorCode = -32700;

}  // namespace

StdioServer::StdioServer(proxy::Proxy& proxy, const int input_fd, std::ostream& output)
    : proxy_(proxy), input_fd_(input_fd), output_(output) {
    proxy_.set_notification_sink([this](const std::string& backend, const Message& message) {
        LOG_DEBUG("StdioServer: forwarding " + protocol::describe(message) + " from " + backend);
        write_message(message);
    });
}

StdioServer::~StdioServer() {
    wait_all();
    proxy_.set_notification_sink(nullptr);
}

void StdioServer::run() {
    char buffer[8192];
    while (true) {
        const ssize_t n = read(input_fd_, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            LOG_ERROR("StdioServer: read failed, errno " + std::to_string(errno));
            break;
        }
        if (n == 0) {
            break;
        }

        for (auto& event : framer_.feed(std::string_view(buffer, static_cast<std::size_t>(n)))) {
            if (core::errors::is_error(event)) {
                const auto& err = core::errors::get_error(event);
                LOG_WARN("StdioServer: unreadable caller message [" + err.code + "]: " +
                         err.message);
                write_message(protocol::make_error_response(nullptr, kParseErrorCode,
                                                            "Parse error: " + err.message));
                continue;
            }
            dispatch(std::move(core::errors::get_value(event)));
        }
        prune_finished();
    }

    LOG_INFO("StdioServer: end of input, draining " + std::to_string(tasks_.size()) +
             " request(s)");
    wait_all();
    proxy_.shutdown();
}

void StdioServer::dispatch(Message message) {
    // Requests run concurrently; everything else is cheap and handled inline.
    if (protocol::classify(message) != protocol::MessageKind::Request) {
        answer(message);
        return;
    }
    tasks_.push_back(std::async(std::launch::async,
                                [this, request = std::move(message)]() { answer(request); }));
}

void StdioServer::answer(const Message& request) {
    auto response = proxy_.call(request);
    if (core::errors::is_error(response)) {
        const auto& err = core::errors::get_error(response);
        LOG_WARN("StdioServer: " + protocol::describe(request) + " failed [" + err.code +
                 "]: " + err.message);
        const bool has_id = request.is_object() && request.contains("id");
        write_message(protocol::make_error_response(has_id ? request["id"] : Message(), err));
        return;
    }
    const Message& message = core::errors::get_value(response);
    if (!message.is_null()) {
        write_message(message);
    }
}

void StdioServer::write_message(const Message& message) {
    const std::string line = message.dump();
    std::lock_guard<std::mutex> lock(write_mutex_);
    output_ << line << '\n';
    output_.flush();
    ++written_;
}

std::size_t StdioServer::messages_written() const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return written_;
}

void StdioServer::prune_finished() {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
            it->get();
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

void StdioServer::wait_all() {
    for (auto& task : tasks_) {
        if (task.valid()) {
            task.get();
        }
    }
    tasks_.clear();
}

}  // namespace mcproxy::app
