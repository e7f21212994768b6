#pragma once
#include "CaptureTypes.hpp"
#include "FrameMailbox.hpp"
#include "ICaptureProvider.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Capture {

struct SessionOptions {
    int frameRateCap = 30;
    bool showCursor = true;
    std::chrono::milliseconds startTimeout{5000};
};

struct StartResult {
    std::uint64_t sessionId = 0;
    std::optional<CaptureError> error;

    explicit operator bool() const { return !error.has_value(); }
};

/**
 * @brief Owns at most one capture session end to end
 *
 * start() and stop() are called from the control thread only and never wait
 * on the provider. Start results come back through the dispatcher, which
 * must run them on the control thread. Frames and runtime errors arrive on
 * the provider's delivery thread.
 */
class CaptureSessionManager {
public:
    using RuntimeErrorCallback = std::function<void(std::uint64_t sessionId, const CaptureError&)>;
    using StartCallback = std::function<void(const StartResult&)>;
    using Dispatcher = std::function<void(std::function<void()>)>;

    CaptureSessionManager(ICaptureProvider& provider, Dispatcher dispatch, SessionOptions options = {});
    ~CaptureSessionManager();

    CaptureSessionManager(const CaptureSessionManager&) = delete;
    CaptureSessionManager& operator=(const CaptureSessionManager&) = delete;

    /**
     * @brief Requests a capture of a global region of a display into a mailbox
     *
     * A session that is still running or starting is stopped first. The
     * provider is only asked for the new session once the previous one has
     * shut down (bounded by the start timeout).
     * @param onError Called on the delivery thread for provider failures after start
     * @param onStarted Called through the dispatcher once the provider answered,
     *                  unless stop() or another start() came first
     * @return Id of the new session
     */
    std::uint64_t start(const PixelMath::LogicalRect& globalRegion,
                        const PixelMath::Display& display,
                        const std::set<std::string>& exclusions,
                        std::shared_ptr<FrameMailbox> mailbox,
                        RuntimeErrorCallback onError,
                        StartCallback onStarted);

    /**
     * @brief Idempotent teardown: flag, unregister delivery, then async provider stop
     *
     * A session that is still starting is abandoned; should the provider
     * bring it up later it is stopped right away.
     * @return Completes once the provider has stopped. Safe to ignore.
     */
    std::shared_future<void> stop();

    SessionState state() const;
    std::optional<CaptureDescriptor> descriptor() const;

    // Frames that reached the delivery callback after teardown began
    std::uint64_t framesRejected() const { return m_framesRejected->load(std::memory_order_relaxed); }

    static CaptureDescriptor makeDescriptor(const PixelMath::LogicalRect& globalRegion,
                                            const PixelMath::Display& display,
                                            const SessionOptions& options);

private:
    struct Session;

    void runStart(std::shared_ptr<Session> session,
                  PixelMath::Display display,
                  std::set<std::string> exclusions,
                  std::shared_future<void> previous,
                  StartCallback onStarted);
    void awaitLateStart(const std::shared_ptr<Session>& session, std::future<ProviderHandle> pending);
    void complete(const std::shared_ptr<Session>& session, const StartResult& result, const StartCallback& onStarted);

    static void deliver(Session& session, const IMGBuffer::FrameView& frame);
    static void fail(Session& session, const std::string& message);

    ICaptureProvider& m_provider;
    Dispatcher m_dispatch;
    SessionOptions m_options;

    std::shared_ptr<Session> m_current;
    std::shared_future<void> m_teardown;
    std::uint64_t m_nextSessionId = 1;
    bool m_everStarted = false;

    // Start threads; each one gives up once m_closing is set
    std::vector<std::future<void>> m_workers;
    std::atomic<bool> m_closing{false};

    std::shared_ptr<std::atomic<std::uint64_t>> m_framesRejected;
    std::shared_ptr<CaptureSessionManager*> m_self;
};

} // namespace Capture
