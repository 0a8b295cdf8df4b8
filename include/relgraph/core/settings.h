#ifndef RELGRAPH_CORE_SETTINGS_H
#define RELGRAPH_CORE_SETTINGS_H

#include <relgraph/graph/model/graph_model.h>
#include <functional>
#include <string>

namespace relgraph {
namespace core {

struct Settings {
    std::string api_url;
    std::string api_token;
    int graph_limit = 100;
    float canvas_width = 800.0f;
    float canvas_height = 600.0f;
    graph::LinkPolicy link_policy = graph::LinkPolicy::kDrop;
};

// Returns the value of an environment variable, or nullptr when unset.
using EnvironmentLookup = std::function<const char*(const char* name)>;

// Compiled defaults from config.h.
Settings DefaultSettings();

/**
 * @brief Overlay RELGRAPH_* variables on the compiled defaults.
 *
 * Unparseable or out-of-range values are reported on stderr and the default
 * is kept.
 */
Settings LoadSettings(const EnvironmentLookup& lookup);

Settings LoadSettingsFromEnvironment();

} // namespace core
} // namespace relgraph

#endif // RELGRAPH_CORE_SETTINGS_H
