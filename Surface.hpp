#ifndef DIGIRAIN_SURFACE_HPP
#define DIGIRAIN_SURFACE_HPP

#include <functional>
#include <memory>

namespace digirain {

    enum class AcquireStatus {
        Ok,
        Outdated,     // framebuffer no longer matches the configured size
        Lost,         // context reset or default framebuffer gone
        Occluded,     // zero-area framebuffer (minimized)
        OutOfMemory,
        Error
    };

    const char* toString(AcquireStatus status);

    // Something frames can be presented to. The GLFW window is the real one.
    class Surface {
    public:
        virtual ~Surface() {}

        virtual AcquireStatus acquire() = 0;
        virtual void configure(int width, int height) = 0;
        virtual void present() = 0;

        // Current drawable size of the underlying window, in pixels.
        virtual bool queryExtent(int& width, int& height) const = 0;
    };

    typedef std::function<std::unique_ptr<Surface>()> SurfaceFactory;

    // Owns the current surface and the recipe for making a new one.
    // acquire() retries exactly once after recreating on Lost / Outdated.
    class SurfaceKeeper {
    public:
        explicit SurfaceKeeper(SurfaceFactory factory);

        bool create(int width, int height);
        AcquireStatus acquire();
        void present();

        // Always recreates: some window state changes (fullscreen toggles)
        // silently invalidate the old surface.
        void resize(int width, int height);
        void reconfigure();

        int width() const { return surfaceWidth; }
        int height() const { return surfaceHeight; }
        int recreations() const { return recreateCount; }
        bool valid() const { return surface != nullptr; }

    private:
        bool recreate();

        SurfaceFactory factory;
        std::unique_ptr<Surface> surface;
        int surfaceWidth = 0;
        int surfaceHeight = 0;
        int recreateCount = 0;
    };

}

#endif
