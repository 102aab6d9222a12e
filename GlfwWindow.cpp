#include "GlfwWindow.hpp"

#include <iostream>

#include "FrameGovernor.hpp"

namespace digirain {

    GlfwWindowHost::~GlfwWindowHost() {
        destroy();
    }

    bool GlfwWindowHost::init(const AppConfig& config) {
        if (!glfwInit()) {
            std::cerr << "[ERROR] Could not start GLFW\n";
            return false;
        }
        glfwStarted = true;

        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 1);

#if defined (__APPLE__)
        glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif

        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
        glfwWindowHint(GLFW_SCALE_TO_MONITOR, GLFW_TRUE);
        // lets the surface report a GPU reset as a lost surface
        glfwWindowHint(GLFW_CONTEXT_ROBUSTNESS, GLFW_LOSE_CONTEXT_ON_RESET);

        glWindow = glfwCreateWindow(config.windowWidth, config.windowHeight,
            config.title.c_str(),
            nullptr, nullptr);
        if (!glWindow) {
            std::cerr << "[ERROR] Could not open window with GLFW3\n";
            return false;
        }

        glfwSetWindowUserPointer(glWindow, this);
        glfwSetFramebufferSizeCallback(glWindow, framebufferSizeCallback);
        glfwSetKeyCallback(glWindow, keyboardCallback);
        glfwSetWindowCloseCallback(glWindow, closeCallback);
        glfwSetWindowRefreshCallback(glWindow, refreshCallback);

        glfwMakeContextCurrent(glWindow);

        glewExperimental = GL_TRUE;
        GLenum glewStatus = glewInit();
        if (glewStatus != GLEW_OK) {
            std::cerr << "[ERROR] Could not initialize GLEW: " << glewGetErrorString(glewStatus) << "\n";
            return false;
        }
        // glewInit can leave a harmless INVALID_ENUM behind on core profiles
        glGetError();

        const GLubyte* renderer = glGetString(GL_RENDERER);
        const GLubyte* version = glGetString(GL_VERSION);
        std::cout << "[INFO] Renderer: " << renderer << "\n";
        std::cout << "[INFO] OpenGL version supported: " << version << "\n";

        return true;
    }

    void GlfwWindowHost::destroy() {
        if (glWindow) {
            glfwDestroyWindow(glWindow);
            glWindow = nullptr;
        }
        if (glfwStarted) {
            glfwTerminate();
            glfwStarted = false;
        }
        governor = nullptr;
    }

    void GlfwWindowHost::attach(FrameGovernor* frameGovernor) {
        governor = frameGovernor;
    }

    void GlfwWindowHost::framebufferSizeCallback(GLFWwindow* window, int width, int height) {
        GlfwWindowHost* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
        if (host && host->governor) {
            host->governor->onResize(width, height);
        }
    }

    void GlfwWindowHost::keyboardCallback(GLFWwindow* window, int key, int scancode, int action, int mode)
    {
        GlfwWindowHost* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
        if (!host || !host->governor || action != GLFW_PRESS) {
            return;
        }

        if (key == GLFW_KEY_ESCAPE) {
            host->governor->onEscape();
        }

        if (key == GLFW_KEY_F11) {
            host->governor->onToggleFullscreen();
            std::cout << "[INFO] Fullscreen = "
                << (host->isFullscreen() ? "true" : "false") << std::endl;
        }
    }

    void GlfwWindowHost::closeCallback(GLFWwindow* window) {
        GlfwWindowHost* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
        if (host && host->governor) {
            host->governor->onCloseRequested();
        }
    }

    void GlfwWindowHost::refreshCallback(GLFWwindow* window) {
        GlfwWindowHost* host = static_cast<GlfwWindowHost*>(glfwGetWindowUserPointer(window));
        if (host) {
            host->requestRedraw();
        }
    }

    void GlfwWindowHost::requestRedraw() {
        redrawRequested = true;
    }

    bool GlfwWindowHost::takeRedrawRequest() {
        bool requested = redrawRequested;
        redrawRequested = false;
        return requested;
    }

    bool GlfwWindowHost::isFullscreen() const {
        return glWindow && glfwGetWindowMonitor(glWindow) != nullptr;
    }

    GLFWmonitor* GlfwWindowHost::currentMonitor() const {
        int wx = 0;
        int wy = 0;
        int ww = 0;
        int wh = 0;
        glfwGetWindowPos(glWindow, &wx, &wy);
        glfwGetWindowSize(glWindow, &ww, &wh);
        int cx = wx + ww / 2;
        int cy = wy + wh / 2;

        int count = 0;
        GLFWmonitor** monitors = glfwGetMonitors(&count);
        for (int i = 0; i < count; i++) {
            int mx = 0;
            int my = 0;
            glfwGetMonitorPos(monitors[i], &mx, &my);
            const GLFWvidmode* mode = glfwGetVideoMode(monitors[i]);
            if (mode && cx >= mx && cx < mx + mode->width && cy >= my && cy < my + mode->height) {
                return monitors[i];
            }
        }
        return glfwGetPrimaryMonitor();
    }

    void GlfwWindowHost::setFullscreen(bool fullscreen) {
        if (!glWindow || fullscreen == isFullscreen()) {
            return;
        }

        if (fullscreen) {
            GLFWmonitor* monitor = currentMonitor();
            const GLFWvidmode* mode = monitor ? glfwGetVideoMode(monitor) : nullptr;
            if (!mode) {
                std::cerr << "[ERROR] No monitor available for fullscreen\n";
                return;
            }

            glfwGetWindowPos(glWindow, &windowedX, &windowedY);
            glfwGetWindowSize(glWindow, &windowedWidth, &windowedHeight);

            // borderless: keep the monitor's current video mode
            glfwSetWindowMonitor(glWindow, monitor, 0, 0, mode->width, mode->height, mode->refreshRate);
        }
        else {
            glfwSetWindowMonitor(glWindow, nullptr, windowedX, windowedY,
                windowedWidth, windowedHeight, GLFW_DONT_CARE);
        }
    }

    void GlfwWindowHost::close() {
        if (glWindow) {
            glfwSetWindowShouldClose(glWindow, GLFW_TRUE);
        }
    }

    void GlfwWindowHost::pollEvents() {
        glfwPollEvents();
    }

    bool GlfwWindowHost::shouldClose() const {
        return !glWindow || glfwWindowShouldClose(glWindow);
    }

    void GlfwWindowHost::framebufferSize(int& width, int& height) const {
        glfwGetFramebufferSize(glWindow, &width, &height);
    }

}
