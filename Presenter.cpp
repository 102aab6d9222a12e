#include "Presenter.hpp"

namespace digirain {

    const char* toString(FrameStatus status) {
        switch (status) {
        case FrameStatus::Presented:   return "PRESENTED";
        case FrameStatus::Skipped:     return "SKIPPED";
        case FrameStatus::SurfaceLost: return "SURFACE_LOST";
        case FrameStatus::Fatal:       return "FATAL";
        }
        return "UNKNOWN";
    }

    FrameStatus frameStatusFor(AcquireStatus status) {
        switch (status) {
        case AcquireStatus::Ok:
            return FrameStatus::Presented;
        case AcquireStatus::OutOfMemory:
            return FrameStatus::Fatal;
        case AcquireStatus::Lost:
        case AcquireStatus::Outdated:
            return FrameStatus::SurfaceLost;
        case AcquireStatus::Occluded:
        case AcquireStatus::Error:
            return FrameStatus::Skipped;
        }
        return FrameStatus::Skipped;
    }

}
