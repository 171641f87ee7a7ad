#include "cli_parser.hpp"
#include <charconv>
#include <system_error>
#include <vector>
#include "core/logging/logger.hpp"

namespace mcproxy::app::cli {

    using namespace mcproxy::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> config;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> log_level;
        bool no_builtins = false;
    };

    std::string usage() {
        return "Usage: mcproxy serve [--config FILE] [--timeout-ms N] [--no-builtins] "
               "[--log-level debug|info|warn|error]";
    }

    Result<ServeOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ProxyError{ErrorCategory::Input, "No command provided.", "missing_command", usage()};
        }

        std::string command = argv[1];
        if (command != "serve") {
            return ProxyError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'serve' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'serve' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return ProxyError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--timeout-ms") {
                if (i + 1 < args.size()) raw.timeout_ms = args[++i];
                else return ProxyError{ErrorCategory::Input, "Missing value for --timeout-ms", "missing_value"};
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return ProxyError{ErrorCategory::Input, "Missing value for --log-level", "missing_value"};
            } else if (args[i] == "--no-builtins") {
                raw.no_builtins = true;
            } else {
                return ProxyError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", usage()};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServeOptions options;
        options.enable_builtins = !raw.no_builtins;

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            uint32_t timeout = 0;
            const char* begin = raw.timeout_ms->data();
            const char* end = raw.timeout_ms->data() + raw.timeout_ms->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return ProxyError{ErrorCategory::Input, "Invalid number for --timeout-ms", "invalid_integer", "Provide a positive integer."};
            }
            if (timeout < 100 || timeout > 3600000) {
                return ProxyError{ErrorCategory::Input, "--timeout-ms out of bounds", "bounds_error", "Must be between 100 and 3600000."};
            }
            options.timeout_ms = timeout;
        }

        if (raw.log_level) {
            if (!mcproxy::core::logging::Logger::parse_level(raw.log_level.value())) {
                return ProxyError{ErrorCategory::Input, "Unknown log level: " + raw.log_level.value(), "invalid_log_level", "Use debug, info, warn or error."};
            }
            options.log_level = raw.log_level.value();
        }

        // Path validation
        if (raw.config) {
            std::filesystem::path p(raw.config.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return ProxyError{ErrorCategory::Input, "Config file does not exist or is not a regular file", "invalid_path"};
            }
            options.config_file = std::move(p);
        }

        return options;
    }

} // namespace mcproxy::app::cli
