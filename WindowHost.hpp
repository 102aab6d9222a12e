#ifndef DIGIRAIN_WINDOW_HOST_HPP
#define DIGIRAIN_WINDOW_HOST_HPP

namespace digirain {

    // The calls the core makes back into the windowing layer.
    class WindowHost {
    public:
        virtual ~WindowHost() {}

        virtual void requestRedraw() = 0;
        virtual bool isFullscreen() const = 0;
        virtual void setFullscreen(bool fullscreen) = 0;
        virtual void close() = 0;
    };

}

#endif
