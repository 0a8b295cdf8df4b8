#include <relgraph/app/event_dispatch.h>
#include <relgraph/app/viewer_window.h>
#include <iostream>

namespace relgraph {
namespace app {
namespace EventDispatch {

void glfw_error_callback(int error, const char* description) {
    std::cerr << "GLFW Error " << error << ": " << description << std::endl;
}

void glfw_framebuffer_size_callback(GLFWwindow* window, int width, int height) {
    ViewerWindow* viewer = static_cast<ViewerWindow*>(glfwGetWindowUserPointer(window));
    if (viewer) {
        viewer->framebuffer_width = width;
        viewer->framebuffer_height = height;
    }
}

} // namespace EventDispatch
} // namespace app
} // namespace relgraph
