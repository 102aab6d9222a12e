#include "Shader.hpp"

#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>

namespace digirain {

    bool Shader::readShaderFile(const std::string& fileName, std::string& source) {
        std::ifstream shaderFile(fileName);
        if (!shaderFile.is_open()) {
            std::cerr << "[ERROR] Could not open shader file " << fileName << "\n";
            return false;
        }

        std::stringstream buffer;
        buffer << shaderFile.rdbuf();
        source = buffer.str();
        return true;
    }

    GLuint Shader::compileShader(GLenum type, const std::string& source, const std::string& fileName) {
        GLuint shader = glCreateShader(type);
        const GLchar* text = source.c_str();
        glShaderSource(shader, 1, &text, nullptr);
        glCompileShader(shader);

        GLint success = GL_FALSE;
        glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
        if (!success) {
            GLint logLength = 0;
            glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLength);
            std::vector<GLchar> infoLog(logLength > 0 ? logLength : 1);
            glGetShaderInfoLog(shader, static_cast<GLsizei>(infoLog.size()), nullptr, infoLog.data());
            std::cerr << "[ERROR] Shader compilation failed (" << fileName << ")\n"
                << infoLog.data() << "\n";
            glDeleteShader(shader);
            return 0;
        }

        return shader;
    }

    bool Shader::linkProgram(GLuint vertexShader, GLuint fragmentShader) {
        shaderProgram = glCreateProgram();
        glAttachShader(shaderProgram, vertexShader);
        glAttachShader(shaderProgram, fragmentShader);
        glLinkProgram(shaderProgram);

        GLint success = GL_FALSE;
        glGetProgramiv(shaderProgram, GL_LINK_STATUS, &success);
        if (!success) {
            GLint logLength = 0;
            glGetProgramiv(shaderProgram, GL_INFO_LOG_LENGTH, &logLength);
            std::vector<GLchar> infoLog(logLength > 0 ? logLength : 1);
            glGetProgramInfoLog(shaderProgram, static_cast<GLsizei>(infoLog.size()), nullptr, infoLog.data());
            std::cerr << "[ERROR] Shader linking failed\n" << infoLog.data() << "\n";
            glDeleteProgram(shaderProgram);
            shaderProgram = 0;
            return false;
        }

        return true;
    }

    bool Shader::loadShader(const std::string& vertexShaderFileName, const std::string& fragmentShaderFileName) {
        std::string vertexSource;
        std::string fragmentSource;
        if (!readShaderFile(vertexShaderFileName, vertexSource) ||
            !readShaderFile(fragmentShaderFileName, fragmentSource)) {
            return false;
        }

        GLuint vertexShader = compileShader(GL_VERTEX_SHADER, vertexSource, vertexShaderFileName);
        if (!vertexShader) {
            return false;
        }
        GLuint fragmentShader = compileShader(GL_FRAGMENT_SHADER, fragmentSource, fragmentShaderFileName);
        if (!fragmentShader) {
            glDeleteShader(vertexShader);
            return false;
        }

        bool linked = linkProgram(vertexShader, fragmentShader);

        glDeleteShader(vertexShader);
        glDeleteShader(fragmentShader);
        return linked;
    }

    void Shader::useShaderProgram() const {
        glUseProgram(shaderProgram);
    }

    void Shader::destroy() {
        if (shaderProgram) {
            glDeleteProgram(shaderProgram);
            shaderProgram = 0;
        }
    }

}
