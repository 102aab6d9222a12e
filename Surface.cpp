#include "Surface.hpp"

#include <iostream>
#include <utility>

namespace digirain {

    const char* toString(AcquireStatus status) {
        switch (status) {
        case AcquireStatus::Ok:          return "OK";
        case AcquireStatus::Outdated:    return "OUTDATED";
        case AcquireStatus::Lost:        return "LOST";
        case AcquireStatus::Occluded:    return "OCCLUDED";
        case AcquireStatus::OutOfMemory: return "OUT_OF_MEMORY";
        case AcquireStatus::Error:       return "ERROR";
        }
        return "UNKNOWN";
    }

    SurfaceKeeper::SurfaceKeeper(SurfaceFactory factory)
        : factory(std::move(factory))
    {
    }

    bool SurfaceKeeper::create(int width, int height) {
        surfaceWidth = width;
        surfaceHeight = height;

        surface = factory();
        if (!surface) {
            std::cerr << "[ERROR] Could not create presentation surface\n";
            return false;
        }
        surface->configure(surfaceWidth, surfaceHeight);
        return true;
    }

    bool SurfaceKeeper::recreate() {
        std::unique_ptr<Surface> fresh = factory();
        if (!fresh) {
            std::cerr << "[Renderer] Failed to recreate surface\n";
            return false;
        }

        int w = 0;
        int h = 0;
        if (fresh->queryExtent(w, h) && w > 0 && h > 0) {
            surfaceWidth = w;
            surfaceHeight = h;
        }

        surface = std::move(fresh);
        surface->configure(surfaceWidth, surfaceHeight);
        recreateCount++;

        std::cout << "[Renderer] Surface recreated (" << surfaceWidth << "x" << surfaceHeight << ")\n";
        return true;
    }

    AcquireStatus SurfaceKeeper::acquire() {
        if (!surface && !recreate()) {
            return AcquireStatus::Lost;
        }

        AcquireStatus status = surface->acquire();
        if (status != AcquireStatus::Lost && status != AcquireStatus::Outdated) {
            return status;
        }

        std::cerr << "[Renderer] Surface " << toString(status) << ", recreating...\n";
        if (!recreate()) {
            return status;
        }
        return surface->acquire();
    }

    void SurfaceKeeper::present() {
        if (surface) {
            surface->present();
        }
    }

    void SurfaceKeeper::resize(int width, int height) {
        surfaceWidth = width;
        surfaceHeight = height;
        recreate();
    }

    void SurfaceKeeper::reconfigure() {
        if (surface && surfaceWidth > 0 && surfaceHeight > 0) {
            surface->configure(surfaceWidth, surfaceHeight);
        }
    }

}
