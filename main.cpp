#include <GL/glew.h>
#include <GLFW/glfw3.h>

#include <cstdlib>
#include <iostream>
#include <memory>

#include "Config.hpp"
#include "FrameGovernor.hpp"
#include "GlCheck.hpp"
#include "GlfwSurface.hpp"
#include "GlfwWindow.hpp"
#include "GlyphAtlas.hpp"
#include "Rain.hpp"
#include "Renderer.hpp"

using namespace digirain;

AppConfig appConfig;
GlfwWindowHost glWindow;
GlyphAtlas glyphAtlas;

std::unique_ptr<Renderer> renderer;
std::unique_ptr<RainSimulation> rain;
std::unique_ptr<FrameGovernor> governor;

// ----------------------------------------------------------------------
// Configuration
// ----------------------------------------------------------------------
void parseArguments(int argc, const char* argv[]) {
    if (argc > 1) {
        appConfig.atlasImage = argv[1];
    }
    if (argc > 2) {
        appConfig.atlasGlyphs = argv[2];
    }

    const char* seed = std::getenv("DIGIRAIN_SEED");
    if (seed) {
        appConfig.fixedSeed = true;
        appConfig.seed = static_cast<std::uint32_t>(std::strtoul(seed, nullptr, 10));
        std::cout << "[INFO] Using fixed seed " << appConfig.seed << "\n";
    }
}

// ----------------------------------------------------------------------
// Initialization
// ----------------------------------------------------------------------
bool initRenderer() {
    GLFWwindow* window = glWindow.handle();
    int swapInterval = appConfig.swapInterval;

    renderer = std::make_unique<Renderer>(appConfig, glyphAtlas, [window, swapInterval]() -> std::unique_ptr<Surface> {
        return std::make_unique<GlfwSurface>(window, swapInterval);
    });

    int width = 0;
    int height = 0;
    glWindow.framebufferSize(width, height);
    return renderer->init(width, height);
}

void initSimulation() {
    int width = 0;
    int height = 0;
    glWindow.framebufferSize(width, height);

    if (appConfig.fixedSeed) {
        rain = std::make_unique<RainSimulation>(width, height, appConfig.rain, appConfig.seed);
    }
    else {
        rain = std::make_unique<RainSimulation>(width, height, appConfig.rain);
    }
    std::cout << "[INFO] Spawned " << rain->streaks().size() << " streaks for "
        << width << "x" << height << "\n";
}

void cleanup() {
    glWindow.attach(nullptr);
    governor.reset();
    if (renderer) {
        renderer->destroy();
        renderer.reset();
    }
    rain.reset();
    glWindow.destroy();
}

int main(int argc, const char* argv[])
{
    parseArguments(argc, argv);

    if (!glWindow.init(appConfig)) {
        cleanup();
        return 1;
    }

    if (!glyphAtlas.load(appConfig.atlasImage, appConfig.atlasGlyphs)) {
        cleanup();
        return 1;
    }

    if (!initRenderer()) {
        cleanup();
        return 1;
    }

    initSimulation();

    governor = std::make_unique<FrameGovernor>(*rain, *renderer, glWindow, appConfig.targetFps);
    glWindow.attach(governor.get());

    glCheckError();

    while (!glWindow.shouldClose()) {
        glWindow.pollEvents();

        glWindow.requestRedraw();
        if (glWindow.takeRedrawRequest() && !glWindow.shouldClose()) {
            governor->onRedraw();
        }
    }

    std::cout << "[INFO] Rendered " << governor->framesRendered() << " frames\n";
    cleanup();
    return 0;
}
