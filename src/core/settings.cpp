#include <relgraph/core/settings.h>
#include "config.h"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string_view>

namespace relgraph {
namespace core {

namespace {

// Substitution markers survive when CMake had no value for the variable.
std::string CompiledValue(const char* value, std::string_view placeholder) {
    if (value[0] == '\0' || placeholder == value) return std::string();
    return std::string(value);
}

bool ParseInt(const char* name, const char* text, int min_value, int max_value, int& out) {
    try {
        std::size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed == std::string(text).size() && value >= min_value && value <= max_value) {
            out = value;
            return true;
        }
    } catch (const std::invalid_argument&) {
    } catch (const std::out_of_range&) {
    }
    std::cerr << "Warning: ignoring " << name << "='" << text << "' (expected an integer in ["
              << min_value << ", " << max_value << "])" << std::endl;
    return false;
}

} // namespace

Settings DefaultSettings() {
    Settings settings;
    settings.api_url = CompiledValue(RELGRAPH_DEFAULT_API_URL, "@RELGRAPH_DEFAULT_API_URL@");
    if (settings.api_url.empty()) {
        settings.api_url = "http://localhost:8000/api";
    }
    settings.api_token = CompiledValue(RELGRAPH_API_TOKEN, "@RELGRAPH_API_TOKEN@");
    return settings;
}

Settings LoadSettings(const EnvironmentLookup& lookup) {
    Settings settings = DefaultSettings();
    if (!lookup) return settings;

    if (const char* url = lookup("RELGRAPH_API_URL"); url && url[0] != '\0') {
        settings.api_url = url;
    }
    if (const char* token = lookup("RELGRAPH_API_TOKEN"); token && token[0] != '\0') {
        settings.api_token = token;
    }

    int value = 0;
    if (const char* limit = lookup("RELGRAPH_GRAPH_LIMIT")) {
        if (ParseInt("RELGRAPH_GRAPH_LIMIT", limit, 10, 500, value)) settings.graph_limit = value;
    }
    if (const char* width = lookup("RELGRAPH_CANVAS_WIDTH")) {
        if (ParseInt("RELGRAPH_CANVAS_WIDTH", width, 100, 10000, value)) settings.canvas_width = static_cast<float>(value);
    }
    if (const char* height = lookup("RELGRAPH_CANVAS_HEIGHT")) {
        if (ParseInt("RELGRAPH_CANVAS_HEIGHT", height, 100, 10000, value)) settings.canvas_height = static_cast<float>(value);
    }

    if (const char* policy = lookup("RELGRAPH_LINK_POLICY")) {
        std::string_view text(policy);
        if (text == "drop") {
            settings.link_policy = graph::LinkPolicy::kDrop;
        } else if (text == "reject") {
            settings.link_policy = graph::LinkPolicy::kReject;
        } else {
            std::cerr << "Warning: ignoring RELGRAPH_LINK_POLICY='" << text
                      << "' (expected 'drop' or 'reject')" << std::endl;
        }
    }

    return settings;
}

Settings LoadSettingsFromEnvironment() {
    return LoadSettings([](const char* name) -> const char* { return std::getenv(name); });
}

} // namespace core
} // namespace relgraph
