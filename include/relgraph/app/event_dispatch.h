#ifndef RELGRAPH_APP_EVENT_DISPATCH_H
#define RELGRAPH_APP_EVENT_DISPATCH_H

#include <GLFW/glfw3.h>

namespace relgraph {
namespace app {
namespace EventDispatch {

void glfw_error_callback(int error, const char* description);
void glfw_framebuffer_size_callback(GLFWwindow* window, int width, int height);

} // namespace EventDispatch
} // namespace app
} // namespace relgraph

#endif // RELGRAPH_APP_EVENT_DISPATCH_H
