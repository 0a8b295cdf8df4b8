#include "gtest/gtest.h"
#include <relgraph/core/settings.h>
#include <map>
#include <string>

using namespace relgraph;

namespace {

core::EnvironmentLookup LookupFrom(const std::map<std::string, std::string>& values) {
    return [values](const char* name) -> const char* {
        auto it = values.find(name);
        return it == values.end() ? nullptr : it->second.c_str();
    };
}

} // namespace

TEST(SettingsTest, DefaultsWithEmptyEnvironment) {
    core::Settings settings = core::LoadSettings(LookupFrom({}));
    core::Settings defaults = core::DefaultSettings();

    EXPECT_FALSE(settings.api_url.empty());
    EXPECT_EQ(settings.api_url, defaults.api_url);
    EXPECT_EQ(settings.graph_limit, 100);
    EXPECT_FLOAT_EQ(settings.canvas_width, 800.0f);
    EXPECT_FLOAT_EQ(settings.canvas_height, 600.0f);
    EXPECT_EQ(settings.link_policy, graph::LinkPolicy::kDrop);
}

TEST(SettingsTest, EnvironmentOverridesDefaults) {
    core::Settings settings = core::LoadSettings(LookupFrom({
        {"RELGRAPH_API_URL", "https://osint.example.com/api"},
        {"RELGRAPH_API_TOKEN", "secret"},
        {"RELGRAPH_GRAPH_LIMIT", "250"},
        {"RELGRAPH_CANVAS_WIDTH", "1024"},
        {"RELGRAPH_CANVAS_HEIGHT", "768"},
        {"RELGRAPH_LINK_POLICY", "reject"},
    }));

    EXPECT_EQ(settings.api_url, "https://osint.example.com/api");
    EXPECT_EQ(settings.api_token, "secret");
    EXPECT_EQ(settings.graph_limit, 250);
    EXPECT_FLOAT_EQ(settings.canvas_width, 1024.0f);
    EXPECT_FLOAT_EQ(settings.canvas_height, 768.0f);
    EXPECT_EQ(settings.link_policy, graph::LinkPolicy::kReject);
}

TEST(SettingsTest, InvalidValuesKeepDefaults) {
    core::Settings settings = core::LoadSettings(LookupFrom({
        {"RELGRAPH_API_URL", ""},
        {"RELGRAPH_GRAPH_LIMIT", "5000"},
        {"RELGRAPH_CANVAS_WIDTH", "wide"},
        {"RELGRAPH_CANVAS_HEIGHT", "600px"},
        {"RELGRAPH_LINK_POLICY", "ignore"},
    }));

    EXPECT_EQ(settings.api_url, core::DefaultSettings().api_url);
    EXPECT_EQ(settings.graph_limit, 100);
    EXPECT_FLOAT_EQ(settings.canvas_width, 800.0f);
    EXPECT_FLOAT_EQ(settings.canvas_height, 600.0f);
    EXPECT_EQ(settings.link_policy, graph::LinkPolicy::kDrop);
}

TEST(SettingsTest, LimitBoundsAreInclusive) {
    EXPECT_EQ(core::LoadSettings(LookupFrom({{"RELGRAPH_GRAPH_LIMIT", "10"}})).graph_limit, 10);
    EXPECT_EQ(core::LoadSettings(LookupFrom({{"RELGRAPH_GRAPH_LIMIT", "500"}})).graph_limit, 500);
    EXPECT_EQ(core::LoadSettings(LookupFrom({{"RELGRAPH_GRAPH_LIMIT", "9"}})).graph_limit, 100);
}
