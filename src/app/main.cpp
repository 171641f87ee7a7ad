#include <iostream>
#include <string>
#include <unistd.h>
#include "app/cli_parser.hpp"
#include "app/stdio_server.hpp"
#include "core/config/proxy_config.hpp"
#include "core/errors/proxy_errors.hpp"
#include "core/logging/logger.hpp"
#include "proxy/proxy.hpp"

int main(int argc, char* argv[]) {
    // 1. Tag every log line of this process
    mcproxy::core::logging::Logger::get().start_session();

    // 2. Parse CLI input and return normalized input errors
    auto parsed = mcproxy::app::cli::parse_and_validate(argc, argv);
    if (mcproxy::core::errors::is_error(parsed)) {
        const auto& err = mcproxy::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = mcproxy::core::errors::get_value(parsed);

    // 3. Load configuration; CLI flags override the file
    mcproxy::core::config::ProxyConfig config;
    if (options.config_file) {
        auto loaded = mcproxy::core::config::load_proxy_config(*options.config_file);
        if (mcproxy::core::errors::is_error(loaded)) {
            const auto& err = mcproxy::core::errors::get_error(loaded);
            LOG_ERROR("Config error [" + err.code + "]: " + err.message);
            return 3;
        }
        config = mcproxy::core::errors::get_value(loaded);
    }
    if (options.timeout_ms) {
        config.request_timeout_ms = *options.timeout_ms;
    }
    if (!options.enable_builtins) {
        config.enable_builtin_servers = false;
    }
    if (options.log_level) {
        config.log_level = *options.log_level;
    }
    if (auto level = mcproxy::core::logging::Logger::parse_level(config.log_level)) {
        mcproxy::core::logging::Logger::get().set_level(*level);
    }

    // 4. Start backends and serve the caller until stdin closes
    LOG_INFO("mcproxy " + std::string(mcproxy::protocol::kImplementationVersion) +
             ": starting with " + std::to_string(config.backends.size()) +
             " configured backend(s)");
    mcproxy::proxy::Proxy proxy(config);
    for (const auto& outcome : proxy.start()) {
        if (!outcome.success) {
            LOG_WARN("Backend " + outcome.backend + " has no tools: " +
                     (outcome.error ? outcome.error->message : std::string("unknown error")));
        }
    }

    mcproxy::app::StdioServer server(proxy, STDIN_FILENO, std::cout);
    server.run();

    LOG_INFO("mcproxy: exited cleanly after " + std::to_string(server.messages_written()) +
             " message(s)");
    return 0;
}
