#pragma once
#include "IWindowToolkit.hpp"
#include "TaskQueue.hpp"
#include <CaptureSessionManager.hpp>
#include <ICaptureProvider.hpp>
#include <PixelExactRenderer.hpp>
#include <RegionSelector.hpp>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <vector>

namespace Session {

enum class OrchestratorState {
    NoSelection,
    Selecting,
    Resolving,
    Mirroring
};

const char* toString(OrchestratorState state);

struct OrchestratorOptions {
    bool showBorder = true;
    bool excludeSelf = true;
};

/**
 * @brief Top-level controller: selection -> display resolution -> one mirroring session
 *
 * Holds at most one of each resource (overlay, capture session, mirror
 * window, border) and tears them down as one ordered sequence. Runs on the
 * control thread; work from other threads arrives through the TaskQueue.
 */
class SessionOrchestrator {
public:
    using CapturingObserver = std::function<void(bool capturing)>;

    SessionOrchestrator(Capture::ICaptureProvider& provider,
                        Capture::IPermissionGate& permissions,
                        IWindowToolkit& toolkit,
                        TaskQueue& tasks,
                        Capture::SessionOptions sessionOptions = {},
                        OrchestratorOptions options = {});
    ~SessionOrchestrator();

    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    // User asked for a new region; closes whatever is open first
    void beginSelection();

    // Mirror window closed by the user, also while capture is still starting
    void closeMirror();

    // Ends everything and waits for the capture provider to stop
    void shutdown();

    // Presents the newest captured frame, if any. Control thread only.
    bool renderPending();

    void addObserver(CapturingObserver observer);

    OrchestratorState state() const { return m_state; }
    const std::optional<Capture::CaptureError>& lastError() const { return m_lastError; }
    std::shared_future<void> lastTeardown() const { return m_lastTeardown; }
    const Render::PixelExactRenderer* renderer() const { return m_renderer.get(); }
    Capture::CaptureSessionManager& captureManager() { return m_capture; }

private:
    void closeSelection();
    void onSelectionFinished(std::uint64_t generation, const std::optional<PixelMath::LogicalRect>& region);
    void startMirroring(const PixelMath::LogicalRect& region, const PixelMath::Display& display);
    void onCaptureStarted(const Capture::StartResult& started,
                          const PixelMath::LogicalRect& region,
                          const std::shared_ptr<Capture::FrameMailbox>& mailbox);
    void onRuntimeError(std::uint64_t sessionId, const Capture::CaptureError& error);
    void teardown();
    void report(Capture::CaptureErrorKind kind, const std::string& message);
    void notify(bool capturing);

    // Runs a task on the control thread unless this orchestrator is gone by then
    void postSelf(std::function<void(SessionOrchestrator&)> task);

    Capture::ICaptureProvider& m_provider;
    Capture::IPermissionGate& m_permissions;
    IWindowToolkit& m_toolkit;
    TaskQueue& m_tasks;
    OrchestratorOptions m_options;
    Capture::SessionOptions m_sessionOptions;

    OrchestratorState m_state = OrchestratorState::NoSelection;
    bool m_closing = false;

    // At most one of each; released together by teardown()
    std::unique_ptr<Selection::RegionSelector> m_selector;
    std::unique_ptr<IOverlayWindow> m_overlay;
    Capture::CaptureSessionManager m_capture;
    std::uint64_t m_sessionId = 0;
    std::unique_ptr<IMirrorWindow> m_mirror;
    std::unique_ptr<Render::PixelExactRenderer> m_renderer;
    std::unique_ptr<IBorderIndicator> m_border;

    std::uint64_t m_selectionGeneration = 0;
    std::optional<Capture::CaptureError> m_lastError;
    std::shared_future<void> m_lastTeardown;
    std::vector<CapturingObserver> m_observers;

    std::shared_ptr<SessionOrchestrator*> m_self;
};

} // namespace Session
