#ifndef RELGRAPH_APP_VIEWER_WINDOW_H
#define RELGRAPH_APP_VIEWER_WINDOW_H

#include <atomic>
#include <string>

struct GLFWwindow;

namespace relgraph {
namespace app {

/**
 * ViewerWindow owns the GLFW window, the OpenGL context and the Dear ImGui
 * context with its GLFW/OpenGL3 backends.
 * Initialize() throws std::runtime_error when any of them fails to come up.
 */
class ViewerWindow {
public:
    ViewerWindow(std::string title, int width, int height);
    ~ViewerWindow();

    ViewerWindow(const ViewerWindow&) = delete;
    ViewerWindow& operator=(const ViewerWindow&) = delete;

    void Initialize();
    void Shutdown();

    bool ShouldClose() const;
    void BeginFrame();
    void EndFrame();

    // Written by the GLFW framebuffer size callback.
    std::atomic<int> framebuffer_width{0};
    std::atomic<int> framebuffer_height{0};

private:
    std::string title_;
    int width_;
    int height_;
    GLFWwindow* window_ = nullptr;
    bool imgui_init_done_ = false;
};

} // namespace app
} // namespace relgraph

#endif // RELGRAPH_APP_VIEWER_WINDOW_H
