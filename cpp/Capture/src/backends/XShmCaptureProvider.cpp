#include "backends/XShmCaptureProvider.hpp"
#include "backends/X11Displays.hpp"
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/XShm.h>
#include <sys/ipc.h>
#include <sys/shm.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace Capture {

namespace {

template <typename T>
std::future<T> failedFuture(const std::string& message) {
    std::promise<T> promise;
    promise.set_exception(std::make_exception_ptr(std::runtime_error(message)));
    return promise.get_future();
}

/**
 * @brief A ZPixmap XImage backed by a SysV shared memory segment attached to the X server
 */
class ShmImage {
public:
    ShmImage() { m_shmInfo.shmid = -1; }
    ~ShmImage() { cleanup(); }

    ShmImage(const ShmImage&) = delete;
    ShmImage& operator=(const ShmImage&) = delete;

    bool create(Display* display, int w, int h, std::string& error) {
        m_display = display;
        const int screen = DefaultScreen(display);

        // 1. ZPixmap gives us the full pixel data in one block
        m_image = XShmCreateImage(display, DefaultVisual(display, screen), DefaultDepth(display, screen),
                                  ZPixmap, nullptr, &m_shmInfo, w, h);
        if (!m_image) {
            error = "Failed to create XShmImage";
            return false;
        }

        // 2. Allocate Linux Shared Memory (IPC)
        const size_t shmSize = static_cast<size_t>(m_image->bytes_per_line) * m_image->height;
        m_shmInfo.shmid = shmget(IPC_PRIVATE, shmSize, IPC_CREAT | 0600);
        if (m_shmInfo.shmid == -1) {
            error = std::string("Failed to allocate shared memory: ") + strerror(errno);
            return false;
        }

        // 3. Attach memory to our process address space
        m_shmInfo.shmaddr = static_cast<char*>(shmat(m_shmInfo.shmid, nullptr, 0));
        if (m_shmInfo.shmaddr == reinterpret_cast<char*>(-1)) {
            m_shmInfo.shmaddr = nullptr;
            error = std::string("Failed to attach shared memory: ") + strerror(errno);
            return false;
        }
        m_image->data = m_shmInfo.shmaddr;
        m_shmInfo.readOnly = False;

        // 4. Attach memory to the X Server, and wait for it to complete
        if (!XShmAttach(display, &m_shmInfo)) {
            error = "Failed to attach shared memory to X server";
            return false;
        }
        XSync(display, False);
        if (takeX11Error() != 0) {
            error = "X server refused the shared memory segment";
            return false;
        }
        m_attached = true;

        // The segment disappears once both sides detach
        shmctl(m_shmInfo.shmid, IPC_RMID, nullptr);
        m_shmInfo.shmid = -1;
        return true;
    }

    bool grab(Window root, int x, int y) {
        if (!XShmGetImage(m_display, root, m_image, x, y, AllPlanes)) {
            return false;
        }
        return takeX11Error() == 0;
    }

    XImage* image() const { return m_image; }

private:
    void cleanup() {
        if (m_attached) {
            XShmDetach(m_display, &m_shmInfo);
            XSync(m_display, False);
            m_attached = false;
        }
        if (m_shmInfo.shmaddr) {
            shmdt(m_shmInfo.shmaddr);
            m_shmInfo.shmaddr = nullptr;
        }
        if (m_shmInfo.shmid != -1) {
            shmctl(m_shmInfo.shmid, IPC_RMID, nullptr);
            m_shmInfo.shmid = -1;
        }
        if (m_image) {
            // data belongs to the shared segment, not to Xlib
            m_image->data = nullptr;
            XDestroyImage(m_image);
            m_image = nullptr;
        }
    }

    Display* m_display = nullptr;
    XImage* m_image = nullptr;
    XShmSegmentInfo m_shmInfo{};
    bool m_attached = false;
};

} // namespace

struct XShmCaptureProvider::Stream {
    ProviderHandle handle = kInvalidProviderHandle;
    CaptureDescriptor descriptor;
    int rootX = 0; // source rect in root window pixels
    int rootY = 0;
    int failureBudget = 10;
    FrameCallback onFrame;
    ErrorCallback onError;

    std::atomic<bool> running{true};
    std::mutex mutex;
    std::condition_variable wake;
    std::thread thread;
};

XShmCaptureProvider::XShmCaptureProvider(int failureBudget)
    : m_failureBudget(failureBudget) {
    installX11ErrorHandler();
    m_display = XOpenDisplay(nullptr);
    if (!m_display) {
        std::cerr << "[X11] Failed to open X11 display" << std::endl;
    }
}

XShmCaptureProvider::~XShmCaptureProvider() {
    std::map<ProviderHandle, std::shared_ptr<Stream>> streams;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        streams.swap(m_streams);
    }
    for (auto& entry : streams) {
        halt(*entry.second);
    }
    if (m_display) {
        XCloseDisplay(m_display);
        m_display = nullptr;
    }
}

std::vector<PixelMath::Display> XShmCaptureProvider::enumerateDisplays() {
    if (!m_display) {
        std::cerr << "[X11] X11 display not available" << std::endl;
        return {};
    }
    return queryX11Layout(m_display).displays();
}

std::future<ProviderHandle> XShmCaptureProvider::startSession(const PixelMath::Display& display,
                                                              const CaptureDescriptor& descriptor,
                                                              const std::set<std::string>& exclusions,
                                                              FrameCallback onFrame,
                                                              ErrorCallback onError) {
    if (!m_display) {
        return failedFuture<ProviderHandle>("X11 display not available");
    }

    const PixelMath::DisplayLayout layout = queryX11Layout(m_display);
    const auto origin = layout.rootOrigin(display.id);
    if (!origin) {
        return failedFuture<ProviderHandle>("display '" + display.name + "' is no longer connected");
    }

    if (!exclusions.empty()) {
        std::cout << "[X11] Root window grabs cannot exclude windows; move the mirror window off the region" << std::endl;
    }
    if (descriptor.showCursor) {
        std::cout << "[X11] Cursor overlay is not available for root window grabs" << std::endl;
    }

    auto stream = std::make_shared<Stream>();
    stream->descriptor = descriptor;
    stream->rootX = origin->first + descriptor.sourceRect.x;
    stream->rootY = origin->second + descriptor.sourceRect.y;
    stream->failureBudget = m_failureBudget;
    stream->onFrame = std::move(onFrame);
    stream->onError = std::move(onError);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        stream->handle = m_nextHandle++;
        m_streams[stream->handle] = stream;
    }

    std::promise<ProviderHandle> started;
    std::future<ProviderHandle> result = started.get_future();
    stream->thread = std::thread(&XShmCaptureProvider::run, stream, std::move(started));
    return result;
}

std::future<void> XShmCaptureProvider::stopSession(ProviderHandle handle) {
    std::shared_ptr<Stream> stream;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_streams.find(handle);
        if (it != m_streams.end()) {
            stream = it->second;
            m_streams.erase(it);
        }
    }

    if (!stream) {
        return failedFuture<void>("unknown capture session " + std::to_string(handle));
    }

    return std::async(std::launch::async, [stream] { halt(*stream); });
}

void XShmCaptureProvider::halt(Stream& stream) {
    {
        std::lock_guard<std::mutex> lock(stream.mutex);
        stream.running.store(false, std::memory_order_release);
    }
    stream.wake.notify_all();
    if (stream.thread.joinable()) {
        stream.thread.join();
    }
}

void XShmCaptureProvider::run(std::shared_ptr<Stream> stream, std::promise<ProviderHandle> started) {
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        started.set_exception(std::make_exception_ptr(std::runtime_error("Failed to open X11 display")));
        return;
    }

    {
        const PixelMath::PixelRect& source = stream->descriptor.sourceRect;
        const Window root = DefaultRootWindow(display);
        ShmImage image;
        std::string error;

        XWindowAttributes rootAttrs;
        XGetWindowAttributes(display, root, &rootAttrs);

        int x = stream->rootX;
        int y = stream->rootY;
        if (source.width > rootAttrs.width || source.height > rootAttrs.height) {
            error = "capture region " + PixelMath::toString(source) + " is larger than the screen";
        } else if (!XShmQueryExtension(display)) {
            error = "XShm extension not supported";
        } else if (image.create(display, source.width, source.height, error) &&
                   image.image()->bits_per_pixel != 32) {
            error = "unsupported visual: " + std::to_string(image.image()->bits_per_pixel) + " bits per pixel";
        }

        if (!error.empty()) {
            started.set_exception(std::make_exception_ptr(std::runtime_error(error)));
        } else {
            // Minimum-size clamping can push the rect past the screen edge; keep its size, shift it in
            const int clampedX = std::clamp(x, 0, rootAttrs.width - source.width);
            const int clampedY = std::clamp(y, 0, rootAttrs.height - source.height);
            if (clampedX != x || clampedY != y) {
                std::cout << "[X11] Region shifted from (" << x << ", " << y << ") to (" << clampedX << ", "
                          << clampedY << ") to stay on screen" << std::endl;
                x = clampedX;
                y = clampedY;
            }

            started.set_value(stream->handle);
            std::cout << "[X11] Session " << stream->handle << " grabbing " << source.width << "x" << source.height
                      << " at (" << x << ", " << y << ")" << std::endl;

            const auto interval = std::chrono::microseconds(1000000 / std::max(1, stream->descriptor.frameRateCap));
            auto next = std::chrono::steady_clock::now();
            int failCount = 0;

            while (stream->running.load(std::memory_order_acquire)) {
                next += interval;

                if (image.grab(root, x, y)) {
                    failCount = 0;
                    XImage* xi = image.image();
                    IMGBuffer::FrameView frame;
                    frame.data = reinterpret_cast<const std::uint8_t*>(xi->data);
                    frame.width = static_cast<std::size_t>(xi->width);
                    frame.height = static_cast<std::size_t>(xi->height);
                    frame.stride = static_cast<std::size_t>(xi->bytes_per_line);
                    frame.format = IMGBuffer::PixelFormat::BGRA8;
                    stream->onFrame(frame);
                } else {
                    failCount++;
                    if (failCount % 100 == 1) {
                        std::cerr << "[X11] Grab failing (count: " << failCount << ")" << std::endl;
                    }
                    if (failCount >= stream->failureBudget) {
                        stream->onError("the X server rejected " + std::to_string(failCount) +
                                        " consecutive screen grabs");
                        break;
                    }
                }

                // Don't burst to catch up after a stall
                const auto now = std::chrono::steady_clock::now();
                if (now > next + interval) {
                    next = now;
                }

                std::unique_lock<std::mutex> lock(stream->mutex);
                stream->wake.wait_until(lock, next, [&] { return !stream->running.load(std::memory_order_acquire); });
            }

            std::cout << "[X11] Session " << stream->handle << " grab loop exited" << std::endl;
        }
    }

    XCloseDisplay(display);
}

bool X11PermissionGate::isCapturePermitted() {
    installX11ErrorHandler();
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        return false;
    }
    const bool shm = XShmQueryExtension(display);
    XCloseDisplay(display);
    return shm;
}

void X11PermissionGate::requestPermission() {
    // X11 has no capture consent prompt; access follows X server authorization
    std::cout << "[X11] " << remediation() << std::endl;
}

std::string X11PermissionGate::remediation() const {
    return "Make sure DISPLAY points at a reachable X server (check xhost/XAUTHORITY) "
           "and that it supports the MIT-SHM extension.";
}

} // namespace Capture
