#include "Renderer.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <utility>

#include "GlCheck.hpp"

namespace digirain {

    Renderer::Renderer(const AppConfig& config, const GlyphAtlas& atlas, SurfaceFactory surfaceFactory)
        : config(config),
          atlas(atlas),
          surfaces(std::move(surfaceFactory)),
          meshBuilder(config.rain),
          maxQuads(static_cast<std::size_t>(std::max(1, config.maxColumns)) * kChainCapacity),
          mesh(maxQuads)
    {
    }

    Renderer::~Renderer() {
        destroy();
    }

    bool Renderer::init(int width, int height) {
        if (!surfaces.create(width, height)) {
            return false;
        }

        initPipelineState();
        if (!initShaders() || !initAtlasTexture()) {
            return false;
        }
        initBuffers();

        if (glCheckError() == GL_OUT_OF_MEMORY) {
            std::cerr << "[ERROR] Out of memory while creating GPU resources\n";
            return false;
        }

        std::cout << "[INFO] Renderer ready, buffers sized for " << maxQuads << " glyphs\n";
        isInitialized = true;
        return true;
    }

    void Renderer::initPipelineState() {
        glDisable(GL_DEPTH_TEST);

        glEnable(GL_CULL_FACE);
        glCullFace(GL_BACK);
        glFrontFace(GL_CCW);

        // src-alpha over for color, replace for alpha
        glEnable(GL_BLEND);
        glBlendFuncSeparate(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA, GL_ONE, GL_ZERO);
    }

    bool Renderer::initShaders() {
        if (!glyphShader.loadShader(config.shaderDir + "/glyph.vert", config.shaderDir + "/glyph.frag")) {
            return false;
        }

        glyphShader.useShaderProgram();
        glUniform1i(glGetUniformLocation(glyphShader.shaderProgram, "glyphAtlas"), 0);
        return true;
    }

    void Renderer::initBuffers() {
        glGenVertexArrays(1, &VAO);
        glGenBuffers(1, &VBO);
        glGenBuffers(1, &EBO);

        glBindVertexArray(VAO);

        glBindBuffer(GL_ARRAY_BUFFER, VBO);
        glBufferData(GL_ARRAY_BUFFER,
            maxQuads * 4 * sizeof(GlyphVertex),
            nullptr,
            GL_DYNAMIC_DRAW);

        glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, EBO);
        glBufferData(GL_ELEMENT_ARRAY_BUFFER,
            maxQuads * 6 * sizeof(GLuint),
            nullptr,
            GL_DYNAMIC_DRAW);

        glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(GlyphVertex),
            (GLvoid*)offsetof(GlyphVertex, position));
        glEnableVertexAttribArray(0);

        glVertexAttribPointer(1, 2, GL_FLOAT, GL_FALSE, sizeof(GlyphVertex),
            (GLvoid*)offsetof(GlyphVertex, uv));
        glEnableVertexAttribArray(1);

        glVertexAttribPointer(2, 4, GL_FLOAT, GL_FALSE, sizeof(GlyphVertex),
            (GLvoid*)offsetof(GlyphVertex, color));
        glEnableVertexAttribArray(2);

        glBindVertexArray(0);
    }

    bool Renderer::initAtlasTexture() {
        if (atlas.size() <= 0 || atlas.pixels().empty()) {
            std::cerr << "[ERROR] Font atlas has no image data\n";
            return false;
        }

        glGenTextures(1, &atlasTexture);
        glBindTexture(GL_TEXTURE_2D, atlasTexture);
        glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8,
            atlas.size(), atlas.size(),
            0, GL_RGBA, GL_UNSIGNED_BYTE, atlas.pixels().data());

        glGenSamplers(1, &atlasSampler);
        glSamplerParameteri(atlasSampler, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
        glSamplerParameteri(atlasSampler, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
        glSamplerParameteri(atlasSampler, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glSamplerParameteri(atlasSampler, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

        glBindTexture(GL_TEXTURE_2D, 0);
        return true;
    }

    void Renderer::uploadMesh() {
        glBindVertexArray(VAO);

        if (!mesh.vertices.empty()) {
            glBindBuffer(GL_ARRAY_BUFFER, VBO);
            glBufferSubData(GL_ARRAY_BUFFER,
                0,
                mesh.vertices.size() * sizeof(GlyphVertex),
                mesh.vertices.data());
        }

        if (!mesh.indices.empty()) {
            glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, EBO);
            glBufferSubData(GL_ELEMENT_ARRAY_BUFFER,
                0,
                mesh.indices.size() * sizeof(GLuint),
                mesh.indices.data());
        }

        glBindVertexArray(0);
    }

    FrameStatus Renderer::renderFrame(const RainSimulation& rain) {
        if (!isInitialized) {
            return FrameStatus::Skipped;
        }

        stats = meshBuilder.build(rain.streaks(), atlas, surfaces.width(), surfaces.height(), mesh);
        reportDiagnostics();
        uploadMesh();

        AcquireStatus acquired = surfaces.acquire();
        FrameStatus status = frameStatusFor(acquired);
        if (status != FrameStatus::Presented) {
            if (acquired == AcquireStatus::OutOfMemory) {
                std::cerr << "[ERROR] Out of memory acquiring the next frame\n";
            }
            else if (acquired == AcquireStatus::Error) {
                std::cerr << "[Renderer] Surface error: " << toString(acquired) << ", frame skipped\n";
            }
            return status;
        }

        glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);

        GLsizei indexCount = static_cast<GLsizei>(mesh.indices.size());
        if (indexCount > 0) {
            glyphShader.useShaderProgram();

            glActiveTexture(GL_TEXTURE0);
            glBindTexture(GL_TEXTURE_2D, atlasTexture);
            glBindSampler(0, atlasSampler);

            glBindVertexArray(VAO);
            glDrawElements(GL_TRIANGLES, indexCount, GL_UNSIGNED_INT, (GLvoid*)0);
            glBindVertexArray(0);
        }

        // no CPU wait; the swap chain throttles us
        glFlush();
        surfaces.present();
        return FrameStatus::Presented;
    }

    void Renderer::reportDiagnostics() {
        if (stats.misses > 0 && !reportedMisses) {
            std::cerr << "[WARN] " << stats.misses << " glyphs in this frame are missing from the atlas\n";
            reportedMisses = true;
        }
        if (stats.dropped > 0 && !reportedDrops) {
            std::cerr << "[WARN] Glyph buffer full, " << stats.dropped << " glyphs dropped (maxColumns = "
                << config.maxColumns << ")\n";
            reportedDrops = true;
        }
    }

    void Renderer::onResize(int width, int height) {
        surfaces.resize(width, height);
    }

    void Renderer::reconfigure() {
        surfaces.reconfigure();
    }

    void Renderer::destroy() {
        if (VAO) {
            glDeleteVertexArrays(1, &VAO);
            VAO = 0;
        }
        if (VBO) {
            glDeleteBuffers(1, &VBO);
            VBO = 0;
        }
        if (EBO) {
            glDeleteBuffers(1, &EBO);
            EBO = 0;
        }
        if (atlasSampler) {
            glDeleteSamplers(1, &atlasSampler);
            atlasSampler = 0;
        }
        if (atlasTexture) {
            glDeleteTextures(1, &atlasTexture);
            atlasTexture = 0;
        }
        glyphShader.destroy();

        isInitialized = false;
    }

}
