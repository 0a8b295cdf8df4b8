#include <relgraph/app/viewer_window.h>
#include <relgraph/core/frame_scheduler.h>
#include <relgraph/core/settings.h>
#include <relgraph/graph/render/graph_renderer.h>
#include <relgraph/graph/view/graph_view.h>
#include <relgraph/net/graph_api_client.h>

#include <GLFW/glfw3.h>
#include <curl/curl.h>
#include <imgui.h>

#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

// Releases libcurl's global state on every exit path.
struct CurlGlobal {
    CurlGlobal() : ok(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}
    ~CurlGlobal() {
        if (ok) curl_global_cleanup();
    }
    bool ok;
};

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " [investigation-id]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
    using namespace relgraph;

    if (argc > 2) {
        PrintUsage(argv[0]);
        return 1;
    }

    core::Settings settings = core::LoadSettingsFromEnvironment();

    CurlGlobal curl_global;
    if (!curl_global.ok) {
        std::cerr << "Error: failed to initialize libcurl" << std::endl;
        return 1;
    }

    app::ViewerWindow window("Relationship Graph", static_cast<int>(settings.canvas_width),
                             static_cast<int>(settings.canvas_height) + 80);
    try {
        window.Initialize();
    } catch (const std::exception& e) {
        std::cerr << "GUI Initialization failed: " << e.what() << std::endl;
        return 1;
    }

    core::FrameScheduler scheduler;
    auto source = std::make_shared<net::GraphApiClient>(settings.api_url, settings.api_token);

    graph::GraphViewOptions options;
    options.link_policy = settings.link_policy;
    options.simulation.center = ImVec2(settings.canvas_width / 2.0f, settings.canvas_height / 2.0f);

    {
        graph::GraphView view(source, scheduler, options);
        graph::GraphRenderer renderer(view);

        graph::GraphScope scope;
        if (argc == 2) {
            scope.investigation_id = std::string(argv[1]);
        }
        scope.limit = settings.graph_limit;
        view.SetScope(scope);

        while (!window.ShouldClose()) {
            window.BeginFrame();

            // Install finished fetches before this frame's ticks run.
            view.Poll();
            scheduler.RunFrame(glfwGetTime());

            const ImGuiViewport* viewport = ImGui::GetMainViewport();
            ImGui::SetNextWindowPos(viewport->WorkPos);
            ImGui::SetNextWindowSize(viewport->WorkSize);
            ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                                     ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoBringToFrontOnFocus |
                                     ImGuiWindowFlags_NoScrollWithMouse;
            if (ImGui::Begin("Relationship Graph", nullptr, flags)) {
                // The renderer shrinks the canvas to fit the window.
                renderer.Render(ImVec2(settings.canvas_width, settings.canvas_height));
            }
            ImGui::End();

            window.EndFrame();
        }

        view.Unmount();
    }

    window.Shutdown();
    return 0;
}
