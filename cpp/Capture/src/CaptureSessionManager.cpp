#include "CaptureSessionManager.hpp"
#include <PixelMath.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace Capture {

namespace {

// How often start threads look at their cancellation flags
constexpr std::chrono::milliseconds kPollInterval{10};

} // namespace

struct CaptureSessionManager::Session {
    std::uint64_t id = 0;
    CaptureDescriptor descriptor;
    ProviderHandle handle = kInvalidProviderHandle;

    std::atomic<SessionState> state{SessionState::Idle};
    // Sole gate between the delivery thread and a torn-down mailbox
    std::atomic<bool> tearingDown{false};
    std::atomic<bool> errorReported{false};

    // Registration: cleared on unregister, guarded by slotMutex
    std::mutex slotMutex;
    std::shared_ptr<FrameMailbox> slot;
    RuntimeErrorCallback onError;

    std::shared_ptr<std::atomic<std::uint64_t>> rejected;

    // Hand-over between the start thread and stop(): whoever comes second stops the provider
    std::mutex startMutex;
    bool started = false;

    // Resolved once the start thread is done with the provider
    std::promise<void> closedPromise;
    std::shared_future<void> closed = closedPromise.get_future().share();
    bool closedSet = false;

    void unregister() {
        std::lock_guard<std::mutex> lock(slotMutex);
        slot.reset();
        onError = nullptr;
    }

    void markClosed() {
        std::lock_guard<std::mutex> lock(startMutex);
        if (!closedSet) {
            closedSet = true;
            closedPromise.set_value();
        }
    }
};

CaptureSessionManager::CaptureSessionManager(ICaptureProvider& provider, Dispatcher dispatch, SessionOptions options)
    : m_provider(provider),
      m_dispatch(std::move(dispatch)),
      m_options(options),
      m_framesRejected(std::make_shared<std::atomic<std::uint64_t>>(0)),
      m_self(std::make_shared<CaptureSessionManager*>(this)) {
    if (!m_dispatch) {
        throw std::invalid_argument("CaptureSessionManager requires a dispatcher");
    }
}

CaptureSessionManager::~CaptureSessionManager() {
    stop();
    m_closing.store(true);
    for (auto& worker : m_workers) {
        worker.wait();
    }
    if (m_teardown.valid()) {
        m_teardown.wait();
    }
    m_self.reset();
}

CaptureDescriptor CaptureSessionManager::makeDescriptor(const PixelMath::LogicalRect& globalRegion,
                                                        const PixelMath::Display& display,
                                                        const SessionOptions& options) {
    if (display.scale.x <= 0.0 || display.scale.y <= 0.0) {
        throw std::invalid_argument("display '" + display.name + "' reports a non-positive scale factor");
    }

    const PixelMath::LogicalRect local = PixelMath::toLocal(globalRegion, display);

    // Rounding origin and size independently can leave a one pixel gutter on
    // fractional edges; on dense displays align the edges instead.
    const PixelMath::PixelRect source = display.scale.isHighDensity()
        ? PixelMath::toPixelRectAligned(local, display.scale, display.frame.height)
        : PixelMath::toPixelRect(local, display.scale, display.frame.height);

    CaptureDescriptor descriptor;
    descriptor.sourceRect = source;
    descriptor.destinationWidth = source.width;
    descriptor.destinationHeight = source.height;
    descriptor.frameRateCap = options.frameRateCap;
    descriptor.outputFormat = IMGBuffer::PixelFormat::BGRA8;
    descriptor.exactSize = true;
    descriptor.showCursor = options.showCursor;
    return descriptor;
}

std::uint64_t CaptureSessionManager::start(const PixelMath::LogicalRect& globalRegion,
                                           const PixelMath::Display& display,
                                           const std::set<std::string>& exclusions,
                                           std::shared_ptr<FrameMailbox> mailbox,
                                           RuntimeErrorCallback onError,
                                           StartCallback onStarted) {
    if (!mailbox) {
        throw std::invalid_argument("CaptureSessionManager::start requires a mailbox");
    }

    if (m_current) {
        std::cout << "[Capture] Session " << m_current->id << " still running, stopping it first" << std::endl;
        stop();
    }

    // Forget start threads that already finished
    m_workers.erase(std::remove_if(m_workers.begin(), m_workers.end(), [](const std::future<void>& worker) {
        return worker.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }), m_workers.end());

    auto session = std::make_shared<Session>();
    session->id = m_nextSessionId++;
    session->descriptor = makeDescriptor(globalRegion, display, m_options);
    session->slot = std::move(mailbox);
    session->onError = std::move(onError);
    session->rejected = m_framesRejected;
    session->state.store(SessionState::Starting);
    m_everStarted = true;
    m_current = session;

    const CaptureDescriptor& descriptor = session->descriptor;
    std::cout << "[Capture] Starting session " << session->id << " on display '" << display.name
              << "' (id " << display.id << ", scale " << display.scale.x << "x" << display.scale.y << ")" << std::endl;
    std::cout << "[Capture]   region " << PixelMath::toString(globalRegion) << " -> source "
              << PixelMath::toString(descriptor.sourceRect) << " @ " << descriptor.frameRateCap << " fps"
              << (display.scale.isHighDensity() ? " (edge aligned)" : " (rounded)") << std::endl;

    m_workers.push_back(std::async(std::launch::async, &CaptureSessionManager::runStart, this, session, display,
                                   exclusions, m_teardown, std::move(onStarted)));
    return session->id;
}

void CaptureSessionManager::runStart(std::shared_ptr<Session> session,
                                     PixelMath::Display display,
                                     std::set<std::string> exclusions,
                                     std::shared_future<void> previous,
                                     StartCallback onStarted) {
    StartResult result;
    result.sessionId = session->id;

    auto finish = [&](const std::optional<std::string>& failure) {
        if (failure) {
            std::cerr << "[Capture] Session " << session->id << " failed to start: " << *failure << std::endl;
            session->tearingDown.store(true, std::memory_order_release);
            session->unregister();
            session->state.store(SessionState::Closed);
            session->markClosed();
            result.error = CaptureError{CaptureErrorKind::SessionStartFailure, *failure};
        }
        std::weak_ptr<CaptureSessionManager*> weak = m_self;
        m_dispatch([weak, session, result, onStarted] {
            if (auto self = weak.lock()) {
                (*self)->complete(session, result, onStarted);
            }
        });
    };

    const std::string timeoutText = std::to_string(m_options.startTimeout.count()) + " ms";

    // The previous session must be fully closed before the next one can go Active
    if (previous.valid()) {
        const auto deadline = std::chrono::steady_clock::now() + m_options.startTimeout;
        while (previous.wait_for(kPollInterval) != std::future_status::ready) {
            if (m_closing.load() || session->tearingDown.load(std::memory_order_acquire)) {
                session->state.store(SessionState::Closed);
                session->markClosed();
                return;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                finish("the previous capture session did not shut down within " + timeoutText);
                return;
            }
        }
    }
    if (session->tearingDown.load(std::memory_order_acquire)) {
        session->state.store(SessionState::Closed);
        session->markClosed();
        return;
    }

    std::future<ProviderHandle> pending;
    try {
        pending = m_provider.startSession(
            display, session->descriptor, exclusions,
            [session](const IMGBuffer::FrameView& frame) { deliver(*session, frame); },
            [session](const std::string& message) { fail(*session, message); });
    } catch (const std::exception& e) {
        finish(std::string(e.what()));
        return;
    }

    const auto deadline = std::chrono::steady_clock::now() + m_options.startTimeout;
    while (pending.wait_for(kPollInterval) != std::future_status::ready) {
        if (m_closing.load() || session->tearingDown.load(std::memory_order_acquire)) {
            // Abandoned while the provider was still starting
            session->state.store(SessionState::Closed);
            awaitLateStart(session, std::move(pending));
            return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            finish("the capture provider did not start within " + timeoutText);
            awaitLateStart(session, std::move(pending));
            return;
        }
    }

    ProviderHandle handle = kInvalidProviderHandle;
    try {
        handle = pending.get();
    } catch (const std::exception& e) {
        finish(std::string(e.what()));
        return;
    }

    bool abandoned = false;
    {
        std::lock_guard<std::mutex> lock(session->startMutex);
        if (session->tearingDown.load(std::memory_order_acquire)) {
            abandoned = true;
        } else {
            session->handle = handle;
            session->started = true;
            session->state.store(SessionState::Active);
        }
    }

    if (abandoned) {
        std::cout << "[Capture] Session " << session->id << " came up after it was stopped, stopping it" << std::endl;
        try {
            m_provider.stopSession(handle).get();
        } catch (const std::exception& e) {
            std::cerr << "[Capture] Error stopping session " << session->id << ": " << e.what() << std::endl;
        }
        session->state.store(SessionState::Closed);
        session->markClosed();
        return;
    }

    session->markClosed();
    finish(std::nullopt);
}

void CaptureSessionManager::awaitLateStart(const std::shared_ptr<Session>& session,
                                           std::future<ProviderHandle> pending) {
    session->markClosed();

    // It may still come up later; stop it as soon as it does
    while (!m_closing.load()) {
        if (pending.wait_for(kPollInterval) != std::future_status::ready) {
            continue;
        }
        try {
            const ProviderHandle handle = pending.get();
            std::cout << "[Capture] Session " << session->id << " started late, stopping it" << std::endl;
            m_provider.stopSession(handle).get();
        } catch (const std::exception& e) {
            std::cerr << "[Capture] Late start could not be stopped cleanly: " << e.what() << std::endl;
        }
        return;
    }
    std::cerr << "[Capture] Giving up on the pending start of session " << session->id << std::endl;
}

void CaptureSessionManager::complete(const std::shared_ptr<Session>& session,
                                     const StartResult& result,
                                     const StartCallback& onStarted) {
    if (m_current != session) {
        // Stopped or replaced while the provider was starting
        return;
    }
    if (!result) {
        m_current.reset();
        m_teardown = session->closed;
    } else {
        std::cout << "[Capture] Session " << session->id << " active" << std::endl;
    }
    if (onStarted) {
        onStarted(result);
    }
}

std::shared_future<void> CaptureSessionManager::stop() {
    if (!m_current) {
        if (!m_teardown.valid()) {
            std::promise<void> done;
            done.set_value();
            m_teardown = done.get_future().share();
        }
        return m_teardown;
    }

    std::shared_ptr<Session> session = std::move(m_current);
    m_current.reset();
    std::cout << "[Capture] Stopping session " << session->id << std::endl;

    // 1. Flag first, so deliveries already past registration bail out
    session->tearingDown.store(true, std::memory_order_release);
    session->state.store(SessionState::TearingDown);

    // 2. Unregister; returns only after any delivery holding the slot is done
    session->unregister();

    bool started = false;
    {
        std::lock_guard<std::mutex> lock(session->startMutex);
        started = session->started;
    }
    if (!started) {
        // The start thread sees the flag and winds the provider down itself
        m_teardown = session->closed;
        return m_teardown;
    }

    // 3. Provider shutdown finishes in the background
    ICaptureProvider& provider = m_provider;
    m_teardown = std::async(std::launch::async, [&provider, session] {
        try {
            provider.stopSession(session->handle).get();
            std::cout << "[Capture] Session " << session->id << " stopped" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[Capture] Error stopping session " << session->id << ": " << e.what() << std::endl;
        }
        session->state.store(SessionState::Closed);
    }).share();

    return m_teardown;
}

SessionState CaptureSessionManager::state() const {
    if (m_current) {
        return m_current->state.load();
    }
    if (!m_everStarted) {
        return SessionState::Idle;
    }
    if (m_teardown.valid() &&
        m_teardown.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return SessionState::TearingDown;
    }
    return SessionState::Closed;
}

std::optional<CaptureDescriptor> CaptureSessionManager::descriptor() const {
    if (!m_current) {
        return std::nullopt;
    }
    return m_current->descriptor;
}

void CaptureSessionManager::deliver(Session& session, const IMGBuffer::FrameView& frame) {
    if (session.tearingDown.load(std::memory_order_acquire)) {
        session.rejected->fetch_add(1, std::memory_order_relaxed);
        return;
    }

    std::lock_guard<std::mutex> lock(session.slotMutex);
    if (!session.slot || session.tearingDown.load(std::memory_order_acquire)) {
        session.rejected->fetch_add(1, std::memory_order_relaxed);
        return;
    }

    try {
        session.slot->publish(frame);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[Capture] Session " << session.id << " dropped a malformed frame: " << e.what() << std::endl;
    }
}

void CaptureSessionManager::fail(Session& session, const std::string& message) {
    if (session.tearingDown.load(std::memory_order_acquire) && !session.errorReported.load()) {
        // Optimistic teardown already discarded this session
        std::cerr << "[Capture] Ignoring provider error for closed session " << session.id
                  << ": " << message << std::endl;
        return;
    }
    if (session.errorReported.exchange(true)) {
        return;
    }

    // In-flight frames are discarded from here on
    session.tearingDown.store(true, std::memory_order_release);

    RuntimeErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(session.slotMutex);
        callback = session.onError;
    }

    std::cerr << "[Capture] Session " << session.id << " runtime error: " << message << std::endl;
    if (callback) {
        callback(session.id, CaptureError{CaptureErrorKind::SessionRuntimeError, message});
    }
}

} // namespace Capture
