#ifndef DIGIRAIN_GLFW_SURFACE_HPP
#define DIGIRAIN_GLFW_SURFACE_HPP

#include <GL/glew.h>
#include <GLFW/glfw3.h>

#include "Surface.hpp"

namespace digirain {

    // Default framebuffer of a GLFW window's OpenGL context.
    class GlfwSurface : public Surface {
    public:
        GlfwSurface(GLFWwindow* window, int swapInterval);

        AcquireStatus acquire() override;
        void configure(int width, int height) override;
        void present() override;
        bool queryExtent(int& width, int& height) const override;

    private:
        AcquireStatus drainErrors();

        GLFWwindow* window;
        int swapInterval;
        int configuredWidth = 0;
        int configuredHeight = 0;
    };

}

#endif
