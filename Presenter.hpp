#ifndef DIGIRAIN_PRESENTER_HPP
#define DIGIRAIN_PRESENTER_HPP

#include "Rain.hpp"
#include "Surface.hpp"

namespace digirain {

    enum class FrameStatus {
        Presented,
        Skipped,      // nothing drawn this frame, keep going
        SurfaceLost,  // recreate + retry already failed
        Fatal         // out of memory, stop the loop
    };

    const char* toString(FrameStatus status);

    // What a frame amounts to once the surface has answered (after any retry).
    FrameStatus frameStatusFor(AcquireStatus status);

    class FramePresenter {
    public:
        virtual ~FramePresenter() {}

        virtual FrameStatus renderFrame(const RainSimulation& rain) = 0;
        virtual void onResize(int width, int height) = 0;
        virtual void reconfigure() = 0;
    };

}

#endif
