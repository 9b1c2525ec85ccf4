#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace mcpenum {

using Json = nlohmann::json;

/// One tool as reported in the enumeration, tagged with its server
struct DiscoveredTool {
    std::string server;
    std::string name;
    std::string description;
    Json input_schema;  // passed through untouched; null when absent
};

}  // namespace mcpenum
