#ifndef DIGIRAIN_FRAME_GOVERNOR_HPP
#define DIGIRAIN_FRAME_GOVERNOR_HPP

#include <chrono>
#include <cstdint>

#include "Presenter.hpp"
#include "Rain.hpp"
#include "WindowHost.hpp"

namespace digirain {

    // Sits between the window callbacks and the simulation / presenter.
    // Each redraw runs exactly one update and one render, no faster than targetFps.
    class FrameGovernor {
    public:
        typedef std::chrono::steady_clock Clock;

        FrameGovernor(RainSimulation& rain, FramePresenter& presenter, WindowHost& window, float targetFps);

        void onRedraw();
        void onResize(int width, int height);
        void onCloseRequested();
        void onEscape();
        void onToggleFullscreen();

        std::uint32_t framesRendered() const { return frameCount; }
        Clock::duration frameInterval() const { return targetFrameTime; }
        bool stopped() const { return isStopped; }
        FrameStatus lastFrameStatus() const { return lastStatus; }

    private:
        RainSimulation& rain;
        FramePresenter& presenter;
        WindowHost& window;

        Clock::duration targetFrameTime;
        Clock::time_point lastFrameTime;
        bool hasLastFrame = false;
        std::uint32_t frameCount = 0;
        FrameStatus lastStatus = FrameStatus::Presented;
        bool isStopped = false;
    };

}

#endif
