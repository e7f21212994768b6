#include "SessionOrchestrator.hpp"
#include <PixelMath.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace Session {

const char* toString(OrchestratorState state) {
    switch (state) {
        case OrchestratorState::NoSelection: return "NoSelection";
        case OrchestratorState::Selecting: return "Selecting";
        case OrchestratorState::Resolving: return "Resolving";
        case OrchestratorState::Mirroring: return "Mirroring";
        default: return "Unknown";
    }
}

SessionOrchestrator::SessionOrchestrator(Capture::ICaptureProvider& provider,
                                         Capture::IPermissionGate& permissions,
                                         IWindowToolkit& toolkit,
                                         TaskQueue& tasks,
                                         Capture::SessionOptions sessionOptions,
                                         OrchestratorOptions options)
    : m_provider(provider),
      m_permissions(permissions),
      m_toolkit(toolkit),
      m_tasks(tasks),
      m_options(options),
      m_sessionOptions(sessionOptions),
      m_capture(provider, [&tasks](std::function<void()> task) { tasks.post(std::move(task)); }, sessionOptions),
      m_self(std::make_shared<SessionOrchestrator*>(this)) {}

SessionOrchestrator::~SessionOrchestrator() {
    shutdown();
    m_self.reset();
}

void SessionOrchestrator::postSelf(std::function<void(SessionOrchestrator&)> task) {
    std::weak_ptr<SessionOrchestrator*> weak = m_self;
    m_tasks.post([weak, task = std::move(task)] {
        if (auto self = weak.lock()) {
            task(**self);
        }
    });
}

void SessionOrchestrator::addObserver(CapturingObserver observer) {
    m_observers.push_back(std::move(observer));
}

void SessionOrchestrator::notify(bool capturing) {
    for (const auto& observer : m_observers) {
        observer(capturing);
    }
}

void SessionOrchestrator::beginSelection() {
    // At most one active operation: close the previous overlay or session first
    closeSelection();
    if (m_state == OrchestratorState::Mirroring || m_state == OrchestratorState::Resolving) {
        teardown();
    }

    if (!m_permissions.isCapturePermitted()) {
        m_permissions.requestPermission();
        if (!m_permissions.isCapturePermitted()) {
            report(Capture::CaptureErrorKind::PermissionDenied,
                   "Screen capture is not permitted. " + m_permissions.remediation());
            return;
        }
    }

    const std::vector<PixelMath::Display> displays = m_provider.enumerateDisplays();
    if (displays.empty()) {
        report(Capture::CaptureErrorKind::DisplayMatchFailure, "No display is available to capture.");
        return;
    }

    const PixelMath::LogicalPoint pointer = m_toolkit.pointerLocation();
    auto under = std::find_if(displays.begin(), displays.end(), [&](const PixelMath::Display& d) {
        return d.frame.contains(pointer);
    });
    const PixelMath::Display& display = under != displays.end() ? *under : displays.front();

    std::cout << "[Session] Selecting on display '" << display.name << "' (id " << display.id << ")" << std::endl;

    const std::uint64_t generation = ++m_selectionGeneration;
    m_selector = std::make_unique<Selection::RegionSelector>(display);
    m_selector->setCompletionCallback([this, generation](const std::optional<PixelMath::LogicalRect>& region) {
        // Deferred: the overlay is still inside its own event handler here
        postSelf([generation, region](SessionOrchestrator& self) {
            self.onSelectionFinished(generation, region);
        });
    });
    m_overlay = m_toolkit.openOverlay(*m_selector);
    if (!m_overlay) {
        closeSelection();
        report(Capture::CaptureErrorKind::SessionStartFailure, "Could not open the selection overlay.");
        return;
    }
    m_state = OrchestratorState::Selecting;
}

void SessionOrchestrator::closeSelection() {
    if (m_overlay) {
        m_overlay->close();
        m_overlay.reset();
    }
    m_selector.reset();
    if (m_state == OrchestratorState::Selecting) {
        m_state = OrchestratorState::NoSelection;
    }
}

void SessionOrchestrator::onSelectionFinished(std::uint64_t generation,
                                              const std::optional<PixelMath::LogicalRect>& region) {
    if (generation != m_selectionGeneration || m_state != OrchestratorState::Selecting || !m_selector) {
        return;
    }

    const PixelMath::DisplayId displayId = m_selector->display().id;
    const bool degenerate = m_selector->wasDegenerate();
    closeSelection();

    if (!region) {
        // Degenerate or cancelled drag: nothing to tell the user
        if (degenerate) {
            m_lastError = Capture::CaptureError{Capture::CaptureErrorKind::SelectionDegenerate,
                                                "Selection is too small to capture."};
        }
        m_state = OrchestratorState::NoSelection;
        return;
    }

    m_state = OrchestratorState::Resolving;

    // Match by identity against a fresh enumeration; never guess another display
    const std::vector<PixelMath::Display> displays = m_provider.enumerateDisplays();
    auto match = std::find_if(displays.begin(), displays.end(), [&](const PixelMath::Display& d) {
        return d.id == displayId;
    });
    if (match == displays.end()) {
        report(Capture::CaptureErrorKind::DisplayMatchFailure, "Could not find a matching display to capture.");
        return;
    }

    startMirroring(*region, *match);
}

void SessionOrchestrator::startMirroring(const PixelMath::LogicalRect& region, const PixelMath::Display& display) {
    Capture::CaptureDescriptor planned;
    try {
        planned = Capture::CaptureSessionManager::makeDescriptor(region, display, m_sessionOptions);
    } catch (const std::invalid_argument& e) {
        report(Capture::CaptureErrorKind::SessionStartFailure, std::string("Failed to start capture: ") + e.what());
        return;
    }
    const PixelMath::LogicalSize contentSize{planned.destinationWidth / display.scale.x,
                                             planned.destinationHeight / display.scale.y};

    MirrorWindowEvents events;
    events.onResize = [this](const PixelMath::LogicalSize& size) {
        if (m_renderer) {
            m_renderer->handleResize(size);
        }
    };
    events.onDisplayChanged = [this] {
        if (m_renderer) {
            m_renderer->handleDisplayChange();
        }
    };
    events.onCloseRequested = [this] {
        postSelf([](SessionOrchestrator& self) { self.closeMirror(); });
    };
    m_mirror = m_toolkit.openMirrorWindow(display, contentSize, std::move(events));
    if (!m_mirror) {
        report(Capture::CaptureErrorKind::SessionStartFailure, "Failed to start capture: could not open the mirror window.");
        return;
    }

    auto mailbox = std::make_shared<Capture::FrameMailbox>();
    TaskQueue& tasks = m_tasks;
    mailbox->setWakeCallback([&tasks] { tasks.wake(); });

    std::set<std::string> exclusions;
    if (m_options.excludeSelf) {
        exclusions.insert(m_toolkit.applicationId());
    }

    // Runs on the delivery thread: touch nothing but the queue and our own copies
    std::weak_ptr<SessionOrchestrator*> weak = m_self;
    auto onError = [weak, &tasks](std::uint64_t sessionId, const Capture::CaptureError& error) {
        tasks.post([weak, sessionId, error] {
            if (auto self = weak.lock()) {
                (*self)->onRuntimeError(sessionId, error);
            }
        });
    };
    // Runs on the control thread, once the provider answered
    auto onStarted = [weak, region, mailbox](const Capture::StartResult& started) {
        if (auto self = weak.lock()) {
            (*self)->onCaptureStarted(started, region, mailbox);
        }
    };

    m_sessionId = m_capture.start(region, display, exclusions, mailbox, onError, onStarted);
    std::cout << "[Session] Waiting for capture session " << m_sessionId << " to start" << std::endl;
}

void SessionOrchestrator::onCaptureStarted(const Capture::StartResult& started,
                                           const PixelMath::LogicalRect& region,
                                           const std::shared_ptr<Capture::FrameMailbox>& mailbox) {
    if (m_state != OrchestratorState::Resolving || started.sessionId != m_sessionId || !m_mirror) {
        std::cerr << "[Session] Ignoring start result of discarded session " << started.sessionId << std::endl;
        return;
    }

    if (!started) {
        m_mirror->close();
        m_mirror.reset();
        report(Capture::CaptureErrorKind::SessionStartFailure,
               "Failed to start capture: " + started.error->message + "\n" + m_permissions.remediation());
        return;
    }

    m_renderer = std::make_unique<Render::PixelExactRenderer>(*m_mirror);
    m_renderer->attach(mailbox, *m_capture.descriptor());

    if (m_options.showBorder) {
        m_border = m_toolkit.showBorder(region);
    }

    std::cout << "[Session] Mirroring " << PixelMath::toString(region)
              << ". Keep the mirror window outside this region to avoid recursive capture." << std::endl;
    m_state = OrchestratorState::Mirroring;
    notify(true);
}

void SessionOrchestrator::onRuntimeError(std::uint64_t sessionId, const Capture::CaptureError& error) {
    const bool live = m_state == OrchestratorState::Mirroring || m_state == OrchestratorState::Resolving;
    if (!live || sessionId != m_sessionId || m_closing) {
        std::cerr << "[Session] Ignoring error from discarded session " << sessionId << ": "
                  << error.message << std::endl;
        return;
    }
    teardown();
    report(Capture::CaptureErrorKind::SessionRuntimeError, "Screen capture stopped: " + error.message);
}

void SessionOrchestrator::closeMirror() {
    const bool open = m_state == OrchestratorState::Mirroring || m_state == OrchestratorState::Resolving;
    if (!open || !m_mirror || m_closing) {
        return;
    }
    std::cout << "[Session] Mirror window closed" << std::endl;
    teardown();
}

void SessionOrchestrator::teardown() {
    m_closing = true;
    const bool wasMirroring = m_state == OrchestratorState::Mirroring;

    // 1. Capture first: nothing reaches the surface after this returns
    m_lastTeardown = m_capture.stop();

    // 2. Surface and its window
    if (m_renderer) {
        m_renderer->detach();
        m_renderer.reset();
    }
    if (m_mirror) {
        m_mirror->close();
        m_mirror.reset();
    }

    // 3. Border indicator
    m_border.reset();

    m_state = OrchestratorState::NoSelection;
    m_closing = false;

    // 4. Observers
    if (wasMirroring) {
        notify(false);
    }
}

void SessionOrchestrator::shutdown() {
    closeSelection();
    if (m_state == OrchestratorState::Mirroring || m_state == OrchestratorState::Resolving) {
        teardown();
    }
    std::shared_future<void> done = m_capture.stop();
    done.wait();
}

bool SessionOrchestrator::renderPending() {
    if (!m_renderer || m_closing) {
        return false;
    }
    return m_renderer->renderPending();
}

void SessionOrchestrator::report(Capture::CaptureErrorKind kind, const std::string& message) {
    m_lastError = Capture::CaptureError{kind, message};
    m_state = OrchestratorState::NoSelection;
    std::cerr << "[Session] " << Capture::toString(kind) << ": " << message << std::endl;
    m_toolkit.showNotice(message);
}

} // namespace Session
