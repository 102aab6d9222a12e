#include "GlfwSurface.hpp"

#include <iostream>

#include "GlCheck.hpp"

namespace digirain {

    GlfwSurface::GlfwSurface(GLFWwindow* window, int swapInterval)
        : window(window), swapInterval(swapInterval)
    {
    }

    AcquireStatus GlfwSurface::acquire() {
        glfwMakeContextCurrent(window);

        // Only reported when the context was created with a reset notification strategy.
        GLenum reset = GL_NO_ERROR;
        if (GLEW_VERSION_4_5) {
            reset = glGetGraphicsResetStatus();
        }
        else if (GLEW_ARB_robustness) {
            reset = glGetGraphicsResetStatusARB();
        }
        if (reset != GL_NO_ERROR) {
            return AcquireStatus::Lost;
        }

        AcquireStatus pending = drainErrors();
        if (pending != AcquireStatus::Ok) {
            return pending;
        }

        int width = 0;
        int height = 0;
        glfwGetFramebufferSize(window, &width, &height);
        if (width == 0 || height == 0) {
            return AcquireStatus::Occluded;
        }
        if (width != configuredWidth || height != configuredHeight) {
            return AcquireStatus::Outdated;
        }

        glBindFramebuffer(GL_FRAMEBUFFER, 0);
        GLenum framebuffer = glCheckFramebufferStatus(GL_FRAMEBUFFER);
        if (framebuffer == GL_FRAMEBUFFER_UNDEFINED) {
            return AcquireStatus::Lost;
        }
        if (framebuffer != GL_FRAMEBUFFER_COMPLETE) {
            std::cerr << "[Renderer] Default framebuffer incomplete (0x" << std::hex << framebuffer << std::dec << ")\n";
            return AcquireStatus::Error;
        }

        return AcquireStatus::Ok;
    }

    AcquireStatus GlfwSurface::drainErrors() {
        AcquireStatus result = AcquireStatus::Ok;
        GLenum errorCode;
        while ((errorCode = glGetError()) != GL_NO_ERROR) {
            if (errorCode == GL_OUT_OF_MEMORY) {
                return AcquireStatus::OutOfMemory;
            }
#ifdef GL_CONTEXT_LOST
            if (errorCode == GL_CONTEXT_LOST) {
                return AcquireStatus::Lost;
            }
#endif
            std::cerr << "[OpenGL Error] " << glErrorName(errorCode) << " before frame acquire\n";
            result = AcquireStatus::Error;
        }
        return result;
    }

    void GlfwSurface::configure(int width, int height) {
        glfwMakeContextCurrent(window);
        glfwSwapInterval(swapInterval);

        configuredWidth = width;
        configuredHeight = height;
        glViewport(0, 0, width, height);
    }

    void GlfwSurface::present() {
        glfwSwapBuffers(window);
    }

    bool GlfwSurface::queryExtent(int& width, int& height) const {
        glfwGetFramebufferSize(window, &width, &height);
        return width > 0 && height > 0;
    }

}
