#ifndef DIGIRAIN_RENDERER_HPP
#define DIGIRAIN_RENDERER_HPP

#include <cstddef>

#include <GL/glew.h>

#include "Config.hpp"
#include "GlyphAtlas.hpp"
#include "GlyphMesh.hpp"
#include "Presenter.hpp"
#include "Shader.hpp"
#include "Surface.hpp"

namespace digirain {

    // Owns every GL object of the app. One indexed draw per frame.
    class Renderer : public FramePresenter {
    public:
        Renderer(const AppConfig& config, const GlyphAtlas& atlas, SurfaceFactory surfaceFactory);
        ~Renderer();

        bool init(int width, int height);
        void destroy();

        FrameStatus renderFrame(const RainSimulation& rain) override;
        void onResize(int width, int height) override;
        void reconfigure() override;

    private:
        void initPipelineState();
        bool initShaders();
        void initBuffers();
        bool initAtlasTexture();
        void uploadMesh();
        void reportDiagnostics();

        AppConfig config;
        const GlyphAtlas& atlas;
        SurfaceKeeper surfaces;

        GlyphMeshBuilder meshBuilder;
        std::size_t maxQuads;
        GlyphMesh mesh;
        MeshStats stats;

        Shader glyphShader;
        GLuint VAO = 0;
        GLuint VBO = 0;
        GLuint EBO = 0;
        GLuint atlasTexture = 0;
        GLuint atlasSampler = 0;

        bool isInitialized = false;
        bool reportedMisses = false;
        bool reportedDrops = false;
    };

}

#endif
