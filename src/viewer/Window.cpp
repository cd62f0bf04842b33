/// @file Window.cpp
#include "arena/viewer/Window.h"

#include <utility>

namespace arena::viewer {

/* ── Construction / destruction ────────────────────────────────────────── */

Window::Window(int width, int height, const std::string& title)
    : width_(width), height_(height)
{
    if (!glfwInit()) {
        throw std::runtime_error("[Window] glfwInit() failed");
    }

    // Fixed-function drawing only, a 2.1 compatibility context is enough
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 2);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);
    glfwWindowHint(GLFW_SAMPLES, 4);

    window_ = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (!window_) {
        glfwTerminate();
        throw std::runtime_error("[Window] glfwCreateWindow() failed");
    }
    glfwMakeContextCurrent(window_);
    glfwSwapInterval(1);

    glfwSetWindowUserPointer(window_, this);
    glfwSetFramebufferSizeCallback(window_, cbFramebufferSize);
    glfwSetKeyCallback(window_, cbKey);
    glfwSetCursorPosCallback(window_, cbCursorPos);
    glfwSetMouseButtonCallback(window_, cbMouseButton);
    glfwSetScrollCallback(window_, cbScroll);

    // HiDPI displays report a framebuffer larger than the requested size
    glfwGetFramebufferSize(window_, &width_, &height_);
    glViewport(0, 0, width_, height_);
}

Window::~Window() {
    if (window_) glfwDestroyWindow(window_);
    glfwTerminate();
}

/* ── Frame control ──────────────────────────────────────────────────────── */

bool Window::shouldClose() const {
    return glfwWindowShouldClose(window_) != 0;
}

void Window::swapBuffers() {
    glfwSwapBuffers(window_);
}

void Window::setTitle(const std::string& title) {
    glfwSetWindowTitle(window_, title.c_str());
}

FrameInput Window::takeInput() {
    glfwPollEvents();
    return std::exchange(pending_, FrameInput{});
}

/* ── GLFW callbacks ─────────────────────────────────────────────────────── */

Window& Window::from(GLFWwindow* win) {
    return *static_cast<Window*>(glfwGetWindowUserPointer(win));
}

void Window::cbFramebufferSize(GLFWwindow* win, int w, int h) {
    Window& self = from(win);
    self.width_  = w;
    self.height_ = h;
    glViewport(0, 0, w, h);
}

void Window::cbKey(GLFWwindow* win, int key, int /*scancode*/, int action, int /*mods*/) {
    if (action == GLFW_PRESS) from(win).pending_.pressedKeys.insert(key);
}

void Window::cbCursorPos(GLFWwindow* win, double xpos, double ypos) {
    Window& self = from(win);
    const Vec2 pos(static_cast<float>(xpos), static_cast<float>(ypos));
    if (self.dragging_) self.pending_.drag += pos - self.cursor_;
    self.cursor_ = pos;
}

void Window::cbMouseButton(GLFWwindow* win, int button, int action, int /*mods*/) {
    Window& self = from(win);
    if (button == GLFW_MOUSE_BUTTON_LEFT) {
        self.dragging_ = (action == GLFW_PRESS);
    } else if (button == GLFW_MOUSE_BUTTON_RIGHT && action == GLFW_PRESS) {
        self.pending_.rightClick = self.cursor_;
    }
}

void Window::cbScroll(GLFWwindow* win, double /*xoffset*/, double yoffset) {
    from(win).pending_.scrollSteps += static_cast<float>(yoffset);
}

} // namespace arena::viewer
