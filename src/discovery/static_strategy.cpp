#include "mcpenum/discovery/static_strategy.hpp"
#include "mcpenum/log/logger.hpp"
#include "mcpenum/protocol/mcp_types.hpp"

#include <vector>

namespace mcpenum {

namespace {

DiscoveredTool to_discovered(const std::string& server, Tool tool) {
    return DiscoveredTool{server, std::move(tool.name), std::move(tool.description), std::move(tool.input_schema)};
}

void collect_from_array(const std::string& server, const Json& entries, std::vector<DiscoveredTool>& out) {
    std::size_t index = 0;
    for (const auto& entry : entries) {
        if (entry.is_string()) {
            // Bare name, as capabilities.tools often declares
            const auto name = entry.get<std::string>();
            if (name.empty() == false) {
                out.push_back(DiscoveredTool{server, name, "", nullptr});
            }
            ++index;
            continue;
        }
        auto tool = Tool::from_json(entry, index);
        if (tool.has_value()) {
            out.push_back(to_discovered(server, std::move(*tool)));
        } else {
            get_logger().warn_fmt("Server '{}': skipping declared tool: {}", server, tool.error().message);
        }
        ++index;
    }
}

void collect_from_map(const std::string& server, const Json& entries, std::vector<DiscoveredTool>& out) {
    std::size_t index = 0;
    for (const auto& [key, value] : entries.items()) {
        if (value.is_string()) {
            out.push_back(DiscoveredTool{server, key, value.get<std::string>(), nullptr});
        } else if (value.is_object()) {
            auto tool = Tool::from_json(value, index);
            if (tool.has_value()) {
                if (value.contains("name") == false) {
                    tool->name = key;
                }
                out.push_back(to_discovered(server, std::move(*tool)));
            }
        } else {
            out.push_back(DiscoveredTool{server, key, "", nullptr});
        }
        ++index;
    }
}

}  // namespace

DiscoveryResult StaticDiscoveryStrategy::discover(
    const ServerDescriptor& descriptor,
    const Deadline& /*deadline*/
) {
    std::vector<DiscoveredTool> tools;
    const Json& metadata = descriptor.metadata;

    if (metadata.is_object()) {
        const auto tools_it = metadata.find("tools");
        if (tools_it != metadata.end()) {
            if (tools_it->is_array()) {
                collect_from_array(descriptor.name, *tools_it, tools);
                return tools;
            }
            if (tools_it->is_object()) {
                collect_from_map(descriptor.name, *tools_it, tools);
                return tools;
            }
        }

        const auto caps_it = metadata.find("capabilities");
        const bool has_capability_tools = (caps_it != metadata.end()) && caps_it->is_object() &&
                                          caps_it->contains("tools") && caps_it->at("tools").is_array();
        if (has_capability_tools) {
            collect_from_array(descriptor.name, caps_it->at("tools"), tools);
            return tools;
        }
    }

    if (config_.emit_placeholder) {
        tools.push_back(DiscoveredTool{
            descriptor.name,
            descriptor.name + "_config",
            "Configuration-based tool for " + descriptor.name,
            nullptr
        });
    }
    return tools;
}

}  // namespace mcpenum
