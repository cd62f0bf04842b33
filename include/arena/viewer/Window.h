#pragma once
/// @file Window.h
/// @brief GLFW window with a legacy (2.1) OpenGL context for the 2D debug viewer.

#include "arena/math/Vec2.h"

#include <GLFW/glfw3.h>
#include <optional>
#include <string>
#include <unordered_set>
#include <stdexcept>

namespace arena::viewer {

/// Everything the user did since the previous frame.
struct FrameInput {
    std::unordered_set<int> pressedKeys;   ///< GLFW key codes pressed at least once
    Vec2                    drag;          ///< Left-drag delta in pixels
    float                   scrollSteps = 0.f;
    std::optional<Vec2>     rightClick;    ///< Cursor pixels of the last right click

    bool pressed(int glfwKey) const { return pressedKeys.count(glfwKey) != 0; }
};

/**
 * RAII wrapper around a GLFW window + OpenGL 2.1 context.
 *
 * The viewer only draws with fixed-function GL 1.x calls exported by the
 * system libGL, so no function loader is needed. GLFW callbacks accumulate
 * into a pending FrameInput that takeInput() hands over once per frame.
 *
 * @throws std::runtime_error if GLFW initialisation or context creation fails.
 */
class Window {
public:
    Window(int width, int height, const std::string& title);
    ~Window();

    Window(const Window&)            = delete;
    Window& operator=(const Window&) = delete;

    bool shouldClose() const;
    void swapBuffers();
    void setTitle(const std::string& title);

    int width()  const { return width_; }
    int height() const { return height_; }

    /// Poll GLFW and return the input gathered since the last call.
    FrameInput takeInput();

private:
    GLFWwindow* window_   = nullptr;
    int         width_    = 0;
    int         height_   = 0;
    Vec2        cursor_;
    bool        dragging_ = false;
    FrameInput  pending_;

    static Window& from(GLFWwindow* win);
    static void cbFramebufferSize(GLFWwindow*, int w, int h);
    static void cbKey           (GLFWwindow*, int key, int scancode, int action, int mods);
    static void cbCursorPos     (GLFWwindow*, double xpos, double ypos);
    static void cbMouseButton   (GLFWwindow*, int button, int action, int mods);
    static void cbScroll        (GLFWwindow*, double xoffset, double yoffset);
};

} // namespace arena::viewer
