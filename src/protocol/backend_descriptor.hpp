#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mcproxy::protocol {

    // Immutable launch configuration of one backend. Identity is the name.
    struct BackendDescriptor {
        std::string name;
        // Executable plus leading arguments. std::nullopt marks a built-in
        // backend that is served in-process and never spawned.
        std::optional<std::vector<std::string>> command;
        std::vector<std::string> args;
        std::map<std::string, std::string> env;
        std::string description;

        bool is_builtin() const { return !command.has_value(); }
    };

} // namespace mcproxy::protocol
