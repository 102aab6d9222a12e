#include "GlCheck.hpp"

#include <iostream>

namespace digirain {

    const char* glErrorName(GLenum errorCode) {
        switch (errorCode) {
        case GL_INVALID_ENUM:                  return "INVALID_ENUM";
        case GL_INVALID_VALUE:                 return "INVALID_VALUE";
        case GL_INVALID_OPERATION:             return "INVALID_OPERATION";
        case GL_OUT_OF_MEMORY:                 return "OUT_OF_MEMORY";
        case GL_INVALID_FRAMEBUFFER_OPERATION: return "INVALID_FBO";
#ifdef GL_CONTEXT_LOST
        case GL_CONTEXT_LOST:                  return "CONTEXT_LOST";
#endif
        default:                               return "UNKNOWN";
        }
    }

    GLenum glCheckError_(const char* file, int line) {
        GLenum last = GL_NO_ERROR;
        GLenum errorCode;
        while ((errorCode = glGetError()) != GL_NO_ERROR) {
            std::cerr << "[OpenGL Error] " << glErrorName(errorCode) << " | " << file << " (" << line << ")\n";
            last = errorCode;
#ifdef GL_CONTEXT_LOST
            // a lost context reports this forever
            if (errorCode == GL_CONTEXT_LOST) {
                break;
            }
#endif
        }
        return last;
    }

}
