#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/proxy_errors.hpp"

namespace mcproxy::app::cli {

    // Validated options of `mcproxy serve`.
    struct ServeOptions {
        std::optional<std::filesystem::path> config_file;
        std::optional<std::uint32_t> timeout_ms;
        bool enable_builtins = true;
        std::optional<std::string> log_level;
    };

    mcproxy::core::errors::Result<ServeOptions> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
