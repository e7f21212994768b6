#include "backends/ScreencopyCaptureProvider.hpp"

#ifdef WAYLAND_BACKEND_ENABLED

#include <DisplayLayout.hpp>
#include <PixelMath.hpp>
#include <wayland-client.h>
#include "wlr-screencopy-unstable-v1-client-protocol.h"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <stdexcept>
#include <sys/mman.h>
#include <sys/syscall.h>
#include <thread>
#include <unistd.h>

#ifndef MFD_CLOEXEC
#define MFD_CLOEXEC 0x0001U
#endif

namespace Capture {

namespace {

template <typename T>
std::future<T> failedFuture(const std::string& message) {
    std::promise<T> promise;
    promise.set_exception(std::make_exception_ptr(std::runtime_error(message)));
    return promise.get_future();
}

int createAnonymousFile(off_t size) {
    int fd = static_cast<int>(syscall(SYS_memfd_create, "regionmirror-shm", MFD_CLOEXEC));
    if (fd < 0) {
        std::cerr << "[Wayland] memfd_create failed: " << strerror(errno) << std::endl;
        return -1;
    }
    if (ftruncate(fd, size) < 0) {
        std::cerr << "[Wayland] ftruncate failed: " << strerror(errno) << std::endl;
        close(fd);
        return -1;
    }
    return fd;
}

struct OutputInfo {
    wl_output* output = nullptr;
    std::uint32_t globalName = 0;
    std::string name;
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::int32_t pixelWidth = 0;
    std::int32_t pixelHeight = 0;
    std::int32_t scale = 1;
    std::int32_t transform = WL_OUTPUT_TRANSFORM_NORMAL;
};

void outputGeometry(void* data, wl_output*, std::int32_t x, std::int32_t y, std::int32_t, std::int32_t,
                    std::int32_t, const char*, const char*, std::int32_t transform) {
    auto* info = static_cast<OutputInfo*>(data);
    info->x = x;
    info->y = y;
    info->transform = transform;
}

void outputMode(void* data, wl_output*, std::uint32_t flags, std::int32_t width, std::int32_t height, std::int32_t) {
    if (flags & WL_OUTPUT_MODE_CURRENT) {
        auto* info = static_cast<OutputInfo*>(data);
        info->pixelWidth = width;
        info->pixelHeight = height;
    }
}

void outputDone(void*, wl_output*) {}

void outputScale(void* data, wl_output*, std::int32_t factor) {
    static_cast<OutputInfo*>(data)->scale = factor > 0 ? factor : 1;
}

void outputName(void* data, wl_output*, const char* name) {
    static_cast<OutputInfo*>(data)->name = name;
}

void outputDescription(void*, wl_output*, const char*) {}

const wl_output_listener kOutputListener = {
    outputGeometry,
    outputMode,
    outputDone,
    outputScale,
    outputName,
    outputDescription
};

/**
 * @brief One wl_display connection with the globals capture needs
 */
class Connection {
public:
    Connection() {
        m_display = wl_display_connect(nullptr);
        if (!m_display) {
            std::cerr << "[Wayland] Failed to connect to Wayland display" << std::endl;
            return;
        }
        m_registry = wl_display_get_registry(m_display);
        wl_registry_add_listener(m_registry, &kRegistryListener, this);

        // First roundtrip announces globals, the second delivers output properties
        wl_display_roundtrip(m_display);
        wl_display_roundtrip(m_display);
    }

    ~Connection() {
        if (m_screencopy) {
            zwlr_screencopy_manager_v1_destroy(m_screencopy);
        }
        for (auto& info : m_outputs) {
            if (info->output) {
                wl_output_destroy(info->output);
            }
        }
        if (m_shm) {
            wl_shm_destroy(m_shm);
        }
        if (m_registry) {
            wl_registry_destroy(m_registry);
        }
        if (m_display) {
            wl_display_disconnect(m_display);
        }
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    bool connected() const { return m_display != nullptr; }
    wl_display* display() const { return m_display; }
    wl_shm* shm() const { return m_shm; }
    zwlr_screencopy_manager_v1* screencopy() const { return m_screencopy; }

    PixelMath::DisplayLayout layout() const {
        std::vector<PixelMath::LayoutOutput> outputs;
        for (const auto& info : m_outputs) {
            if (info->pixelWidth <= 0 || info->pixelHeight <= 0) {
                continue;
            }
            int pw = info->pixelWidth;
            int ph = info->pixelHeight;
            if (info->transform & 1) { // 90 / 270, flipped or not
                std::swap(pw, ph);
            }
            const double s = static_cast<double>(info->scale);

            PixelMath::LayoutOutput out;
            out.name = nameOf(*info);
            out.x = info->x;
            out.y = info->y;
            out.width = pw / s;
            out.height = ph / s;
            out.pixelWidth = pw;
            out.pixelHeight = ph;
            out.scale = PixelMath::Scale{s, s};
            out.rootX = static_cast<int>(std::lround(info->x * s));
            out.rootY = static_cast<int>(std::lround(info->y * s));
            outputs.push_back(out);
        }
        return PixelMath::DisplayLayout(outputs);
    }

    const OutputInfo* outputFor(PixelMath::DisplayId id) const {
        for (const auto& info : m_outputs) {
            if (PixelMath::DisplayLayout::idFor(nameOf(*info)) == id) {
                return info.get();
            }
        }
        return nullptr;
    }

private:
    static std::string nameOf(const OutputInfo& info) {
        // wl_output older than v4 has no name event
        return info.name.empty() ? "wl_output-" + std::to_string(info.globalName) : info.name;
    }

    static void registryGlobal(void* data, wl_registry* registry, std::uint32_t name, const char* interface,
                               std::uint32_t version) {
        auto* self = static_cast<Connection*>(data);

        if (strcmp(interface, wl_shm_interface.name) == 0) {
            self->m_shm = static_cast<wl_shm*>(wl_registry_bind(registry, name, &wl_shm_interface, 1));
        } else if (strcmp(interface, wl_output_interface.name) == 0) {
            auto info = std::make_unique<OutputInfo>();
            info->globalName = name;
            info->output = static_cast<wl_output*>(
                wl_registry_bind(registry, name, &wl_output_interface, std::min<std::uint32_t>(version, 4)));
            wl_output_add_listener(info->output, &kOutputListener, info.get());
            self->m_outputs.push_back(std::move(info));
        } else if (strcmp(interface, zwlr_screencopy_manager_v1_interface.name) == 0) {
            // v2 keeps the frame to a single wl_shm buffer event
            self->m_screencopy = static_cast<zwlr_screencopy_manager_v1*>(wl_registry_bind(
                registry, name, &zwlr_screencopy_manager_v1_interface, std::min<std::uint32_t>(version, 2)));
        }
    }

    static void registryGlobalRemove(void*, wl_registry*, std::uint32_t) {}

    static const wl_registry_listener kRegistryListener;

    wl_display* m_display = nullptr;
    wl_registry* m_registry = nullptr;
    wl_shm* m_shm = nullptr;
    zwlr_screencopy_manager_v1* m_screencopy = nullptr;
    std::vector<std::unique_ptr<OutputInfo>> m_outputs;
};

const wl_registry_listener Connection::kRegistryListener = {
    Connection::registryGlobal,
    Connection::registryGlobalRemove
};

/**
 * @brief wl_shm buffer the compositor copies frames into, recreated when the frame layout changes
 */
class ShmBuffer {
public:
    ~ShmBuffer() { cleanup(); }

    bool matches(std::uint32_t format, std::uint32_t width, std::uint32_t height, std::uint32_t stride) const {
        return m_buffer && m_format == format && m_width == width && m_height == height && m_stride == stride;
    }

    bool setup(wl_shm* shm, std::uint32_t format, std::uint32_t width, std::uint32_t height, std::uint32_t stride) {
        cleanup();
        m_size = static_cast<std::size_t>(stride) * height;

        m_fd = createAnonymousFile(static_cast<off_t>(m_size));
        if (m_fd < 0) {
            return false;
        }

        m_data = mmap(nullptr, m_size, PROT_READ | PROT_WRITE, MAP_SHARED, m_fd, 0);
        if (m_data == MAP_FAILED) {
            std::cerr << "[Wayland] mmap failed: " << strerror(errno) << std::endl;
            m_data = nullptr;
            return false;
        }

        wl_shm_pool* pool = wl_shm_create_pool(shm, m_fd, static_cast<std::int32_t>(m_size));
        if (!pool) {
            std::cerr << "[Wayland] Failed to create wl_shm_pool" << std::endl;
            return false;
        }
        m_buffer = wl_shm_pool_create_buffer(pool, 0, static_cast<std::int32_t>(width),
                                             static_cast<std::int32_t>(height), static_cast<std::int32_t>(stride),
                                             format);
        wl_shm_pool_destroy(pool);
        if (!m_buffer) {
            std::cerr << "[Wayland] Failed to create wl_buffer" << std::endl;
            return false;
        }

        m_format = format;
        m_width = width;
        m_height = height;
        m_stride = stride;
        return true;
    }

    wl_buffer* buffer() const { return m_buffer; }
    const std::uint8_t* data() const { return static_cast<const std::uint8_t*>(m_data); }
    std::uint32_t format() const { return m_format; }
    std::uint32_t width() const { return m_width; }
    std::uint32_t height() const { return m_height; }
    std::uint32_t stride() const { return m_stride; }

private:
    void cleanup() {
        if (m_buffer) {
            wl_buffer_destroy(m_buffer);
            m_buffer = nullptr;
        }
        if (m_data) {
            munmap(m_data, m_size);
            m_data = nullptr;
        }
        if (m_fd >= 0) {
            close(m_fd);
            m_fd = -1;
        }
        m_size = 0;
    }

    int m_fd = -1;
    void* m_data = nullptr;
    std::size_t m_size = 0;
    wl_buffer* m_buffer = nullptr;
    std::uint32_t m_format = 0;
    std::uint32_t m_width = 0;
    std::uint32_t m_height = 0;
    std::uint32_t m_stride = 0;
};

/**
 * @brief State of one in-flight screencopy frame
 */
struct FrameRequest {
    wl_shm* shm = nullptr;
    ShmBuffer* target = nullptr;
    bool yInvert = false;
    bool ready = false;
    bool failed = false;
};

void frameBuffer(void* data, zwlr_screencopy_frame_v1* frame, std::uint32_t format, std::uint32_t width,
                 std::uint32_t height, std::uint32_t stride) {
    auto* request = static_cast<FrameRequest*>(data);
    if (!request->target->matches(format, width, height, stride)) {
        std::cout << "[Wayland] Frame buffer: " << width << "x" << height << " stride=" << stride << std::endl;
        if (!request->target->setup(request->shm, format, width, height, stride)) {
            request->failed = true;
            return;
        }
    }
    zwlr_screencopy_frame_v1_copy(frame, request->target->buffer());
}

void frameFlags(void* data, zwlr_screencopy_frame_v1*, std::uint32_t flags) {
    static_cast<FrameRequest*>(data)->yInvert = (flags & ZWLR_SCREENCOPY_FRAME_V1_FLAGS_Y_INVERT) != 0;
}

void frameReady(void* data, zwlr_screencopy_frame_v1*, std::uint32_t, std::uint32_t, std::uint32_t) {
    static_cast<FrameRequest*>(data)->ready = true;
}

void frameFailed(void* data, zwlr_screencopy_frame_v1*) {
    static_cast<FrameRequest*>(data)->failed = true;
}

void frameDamage(void*, zwlr_screencopy_frame_v1*, std::uint32_t, std::uint32_t, std::uint32_t, std::uint32_t) {}

void frameLinuxDmabuf(void*, zwlr_screencopy_frame_v1*, std::uint32_t, std::uint32_t, std::uint32_t) {}

void frameBufferDone(void*, zwlr_screencopy_frame_v1*) {}

const zwlr_screencopy_frame_v1_listener kFrameListener = {
    frameBuffer,
    frameFlags,
    frameReady,
    frameFailed,
    frameDamage,
    frameLinuxDmabuf,
    frameBufferDone
};

IMGBuffer::PixelFormat toPixelFormat(std::uint32_t shmFormat) {
    switch (shmFormat) {
        case WL_SHM_FORMAT_ABGR8888:
        case WL_SHM_FORMAT_XBGR8888:
            return IMGBuffer::PixelFormat::RGBA8;
        default:
            return IMGBuffer::PixelFormat::BGRA8;
    }
}

} // namespace

struct ScreencopyCaptureProvider::Stream {
    ProviderHandle handle = kInvalidProviderHandle;
    PixelMath::DisplayId displayId = 0;
    CaptureDescriptor descriptor;
    PixelMath::Scale scale;
    int failureBudget = 10;
    FrameCallback onFrame;
    ErrorCallback onError;

    std::atomic<bool> running{true};
    std::mutex mutex;
    std::condition_variable wake;
    std::thread thread;
};

ScreencopyCaptureProvider::ScreencopyCaptureProvider(int failureBudget)
    : m_failureBudget(failureBudget) {}

ScreencopyCaptureProvider::~ScreencopyCaptureProvider() {
    std::map<ProviderHandle, std::shared_ptr<Stream>> streams;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        streams.swap(m_streams);
    }
    for (auto& entry : streams) {
        halt(*entry.second);
    }
}

std::vector<PixelMath::Display> ScreencopyCaptureProvider::enumerateDisplays() {
    Connection connection;
    if (!connection.connected()) {
        return {};
    }
    return connection.layout().displays();
}

std::future<ProviderHandle> ScreencopyCaptureProvider::startSession(const PixelMath::Display& display,
                                                                    const CaptureDescriptor& descriptor,
                                                                    const std::set<std::string>& exclusions,
                                                                    FrameCallback onFrame,
                                                                    ErrorCallback onError) {
    if (!exclusions.empty()) {
        std::cout << "[Wayland] Screencopy captures every surface; move the mirror window off the region"
                  << std::endl;
    }

    auto stream = std::make_shared<Stream>();
    stream->displayId = display.id;
    stream->descriptor = descriptor;
    stream->scale = display.scale;
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
    stream->thread = std::thread(&ScreencopyCaptureProvider::run, stream, std::move(started));
    return result;
}

std::future<void> ScreencopyCaptureProvider::stopSession(ProviderHandle handle) {
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

void ScreencopyCaptureProvider::halt(Stream& stream) {
    {
        std::lock_guard<std::mutex> lock(stream.mutex);
        stream.running.store(false, std::memory_order_release);
    }
    stream.wake.notify_all();
    if (stream.thread.joinable()) {
        stream.thread.join();
    }
}

void ScreencopyCaptureProvider::run(std::shared_ptr<Stream> stream, std::promise<ProviderHandle> started) {
    Connection connection;
    const OutputInfo* output = connection.connected() ? connection.outputFor(stream->displayId) : nullptr;

    std::string error;
    if (!connection.connected()) {
        error = "Wayland display not connected";
    } else if (!connection.screencopy()) {
        error = "compositor does not support wlr-screencopy-unstable-v1";
    } else if (!connection.shm()) {
        error = "wl_shm not available";
    } else if (!output) {
        error = "output is no longer connected";
    }
    if (!error.empty()) {
        started.set_exception(std::make_exception_ptr(std::runtime_error(error)));
        return;
    }

    // Screencopy regions are in logical output coordinates, top-left origin
    const PixelMath::LogicalRect region = PixelMath::toTopLeftLogical(stream->descriptor.sourceRect, stream->scale);
    const auto rx = static_cast<std::int32_t>(std::lround(region.x));
    const auto ry = static_cast<std::int32_t>(std::lround(region.y));
    const auto rw = static_cast<std::int32_t>(std::lround(region.width));
    const auto rh = static_cast<std::int32_t>(std::lround(region.height));

    started.set_value(stream->handle);
    std::cout << "[Wayland] Session " << stream->handle << " capturing " << rw << "x" << rh << " at (" << rx << ", "
              << ry << ") on output " << output->name << std::endl;

    ShmBuffer target;
    std::vector<std::uint8_t> flipped;
    const auto interval = std::chrono::microseconds(1000000 / std::max(1, stream->descriptor.frameRateCap));
    auto next = std::chrono::steady_clock::now();
    int failCount = 0;

    while (stream->running.load(std::memory_order_acquire)) {
        next += interval;

        FrameRequest request;
        request.shm = connection.shm();
        request.target = &target;

        zwlr_screencopy_frame_v1* frame = zwlr_screencopy_manager_v1_capture_output_region(
            connection.screencopy(), stream->descriptor.showCursor ? 1 : 0, output->output, rx, ry, rw, rh);
        zwlr_screencopy_frame_v1_add_listener(frame, &kFrameListener, &request);

        bool connectionLost = false;
        while (!request.ready && !request.failed) {
            if (wl_display_dispatch(connection.display()) == -1) {
                connectionLost = true;
                break;
            }
        }
        zwlr_screencopy_frame_v1_destroy(frame);

        if (connectionLost) {
            stream->onError("lost the connection to the Wayland compositor");
            break;
        }

        if (request.ready) {
            failCount = 0;
            IMGBuffer::FrameView view;
            view.data = target.data();
            view.width = target.width();
            view.height = target.height();
            view.stride = target.stride();
            view.format = toPixelFormat(target.format());

            if (request.yInvert) {
                flipped.resize(view.stride * view.height);
                for (std::size_t row = 0; row < view.height; ++row) {
                    std::memcpy(flipped.data() + row * view.stride,
                                view.data + (view.height - 1 - row) * view.stride, view.stride);
                }
                view.data = flipped.data();
            }
            stream->onFrame(view);
        } else {
            failCount++;
            if (failCount % 100 == 1) {
                std::cerr << "[Wayland] Frame capture failing (count: " << failCount << ")" << std::endl;
            }
            if (failCount >= stream->failureBudget) {
                stream->onError("the compositor failed " + std::to_string(failCount) + " consecutive frames");
                break;
            }
        }

        const auto now = std::chrono::steady_clock::now();
        if (now > next + interval) {
            next = now;
        }

        std::unique_lock<std::mutex> lock(stream->mutex);
        stream->wake.wait_until(lock, next, [&] { return !stream->running.load(std::memory_order_acquire); });
    }

    std::cout << "[Wayland] Session " << stream->handle << " capture loop exited" << std::endl;
}

bool WaylandPermissionGate::isCapturePermitted() {
    Connection connection;
    return connection.connected() && connection.screencopy() != nullptr;
}

void WaylandPermissionGate::requestPermission() {
    // No runtime prompt exists for wlr-screencopy
    std::cout << "[Wayland] " << remediation() << std::endl;
}

std::string WaylandPermissionGate::remediation() const {
    return "Screen capture on Wayland needs a wlroots-based compositor (Sway, Hyprland, ...) "
           "that exposes wlr-screencopy-unstable-v1.";
}

} // namespace Capture

#endif // WAYLAND_BACKEND_ENABLED
