#include "FrameGovernor.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace digirain {

    FrameGovernor::FrameGovernor(RainSimulation& rain, FramePresenter& presenter, WindowHost& window, float targetFps)
        : rain(rain), presenter(presenter), window(window)
    {
        double fps = std::max(1.0, static_cast<double>(targetFps));
        targetFrameTime = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / fps));
    }

    void FrameGovernor::onRedraw() {
        if (isStopped) {
            return;
        }

        if (hasLastFrame) {
            Clock::duration elapsed = Clock::now() - lastFrameTime;
            if (elapsed < targetFrameTime) {
                std::this_thread::sleep_for(targetFrameTime - elapsed);
            }
        }

        Clock::time_point frameStart = Clock::now();
        frameCount++;

        if (frameCount % 60 == 0) {
            std::cout << "[INFO] Frame: " << frameCount << "\n";
        }

        rain.update();

        FrameStatus status = presenter.renderFrame(rain);
        if (status != lastStatus) {
            std::cout << "[INFO] Frame " << frameCount << ": " << toString(lastStatus)
                << " -> " << toString(status) << "\n";
            lastStatus = status;
        }

        switch (status) {
        case FrameStatus::SurfaceLost:
            presenter.reconfigure();
            break;
        case FrameStatus::Fatal:
            std::cerr << "[ERROR] Fatal render error, shutting down\n";
            isStopped = true;
            window.close();
            break;
        default:
            break;
        }

        lastFrameTime = frameStart;
        hasLastFrame = true;
    }

    void FrameGovernor::onResize(int width, int height) {
        // minimized
        if (width <= 0 || height <= 0) {
            return;
        }

        presenter.onResize(width, height);
        rain.resize(width, height);
    }

    void FrameGovernor::onCloseRequested() {
        isStopped = true;
        window.close();
    }

    void FrameGovernor::onEscape() {
        if (window.isFullscreen()) {
            window.setFullscreen(false);
        }
        else {
            onCloseRequested();
        }
    }

    void FrameGovernor::onToggleFullscreen() {
        window.setFullscreen(!window.isFullscreen());
    }

}
