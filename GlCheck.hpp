#ifndef DIGIRAIN_GL_CHECK_HPP
#define DIGIRAIN_GL_CHECK_HPP

#include <GL/glew.h>

namespace digirain {

    const char* glErrorName(GLenum errorCode);

    // Drains the GL error queue, printing each entry. Returns the last error seen.
    GLenum glCheckError_(const char* file, int line);

}

#define glCheckError() digirain::glCheckError_(__FILE__, __LINE__)

#endif
