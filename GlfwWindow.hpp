#ifndef DIGIRAIN_GLFW_WINDOW_HPP
#define DIGIRAIN_GLFW_WINDOW_HPP

#include <GL/glew.h>
#include <GLFW/glfw3.h>

#include "Config.hpp"
#include "WindowHost.hpp"

namespace digirain {

    class FrameGovernor;

    class GlfwWindowHost : public WindowHost {
    public:
        ~GlfwWindowHost();

        bool init(const AppConfig& config);
        void destroy();

        // Routes resize / close / key events to the governor from now on.
        void attach(FrameGovernor* frameGovernor);

        void requestRedraw() override;
        bool isFullscreen() const override;
        void setFullscreen(bool fullscreen) override;
        void close() override;

        void pollEvents();
        bool shouldClose() const;
        bool takeRedrawRequest();

        GLFWwindow* handle() const { return glWindow; }
        void framebufferSize(int& width, int& height) const;

    private:
        static void framebufferSizeCallback(GLFWwindow* window, int width, int height);
        static void keyboardCallback(GLFWwindow* window, int key, int scancode, int action, int mode);
        static void closeCallback(GLFWwindow* window);
        static void refreshCallback(GLFWwindow* window);

        GLFWmonitor* currentMonitor() const;

        GLFWwindow* glWindow = nullptr;
        FrameGovernor* governor = nullptr;
        bool redrawRequested = false;
        bool glfwStarted = false;

        // restored when leaving fullscreen
        int windowedX = 0;
        int windowedY = 0;
        int windowedWidth = 0;
        int windowedHeight = 0;
    };

}

#endif
