#ifndef DIGIRAIN_SHADER_HPP
#define DIGIRAIN_SHADER_HPP

#include <string>

#include <GL/glew.h>

namespace digirain {

    class Shader {
    public:
        GLuint shaderProgram = 0;

        bool loadShader(const std::string& vertexShaderFileName, const std::string& fragmentShaderFileName);
        void useShaderProgram() const;
        void destroy();

    private:
        bool readShaderFile(const std::string& fileName, std::string& source);
        GLuint compileShader(GLenum type, const std::string& source, const std::string& fileName);
        bool linkProgram(GLuint vertexShader, GLuint fragmentShader);
    };

}

#endif
