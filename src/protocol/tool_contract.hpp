#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace mcproxy::protocol {

    // Separator between backend name and tool name in externally visible names.
    inline constexpr const char* kNamespaceSeparator = "::";

    // One tool as reported by a backend's tools/list.
    struct ToolDescriptor {
        std::string name;          // tool name as the backend knows it, e.g. "Read"
        std::string backend;       // owning backend, e.g. "filesystem"
        nlohmann::json input_schema = nlohmann::json::object();
        std::string description;
    };

    inline std::string namespaced_name(const std::string& backend,
                                       const std::string& tool) {
        return backend + kNamespaceSeparator + tool;
    }

    inline std::string namespaced_name(const ToolDescriptor& tool) {
        return namespaced_name(tool.backend, tool.name);
    }

    // Splits "<backend>::<tool>". Returns false when the separator is missing
    // or either side is empty.
    inline bool split_namespaced_name(const std::string& name, std::string& backend,
                                      std::string& tool) {
        const auto pos = name.find(kNamespaceSeparator);
        if (pos == std::string::npos || pos == 0) {
            return false;
        }
        const auto tool_start = pos + 2;
        if (tool_start >= name.size()) {
            return false;
        }
        backend = name.substr(0, pos);
        tool = name.substr(tool_start);
        return true;
    }

} // namespace mcproxy::protocol
