#include "Fakes.hpp"
#include <SessionOrchestrator.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>

using namespace Session;
using Capture::CaptureErrorKind;
using Fakes::TestFrame;
using PixelMath::CoordSpace;
using PixelMath::LogicalPoint;
using PixelMath::LogicalRect;

namespace {

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest() {
        provider.displays = {panel, monitor};
        toolkit.pointer = LogicalPoint{200, 300};
        orchestrator.addObserver([this](bool capturing) {
            log.add(capturing ? "observer:on" : "observer:off");
        });
    }

    // Drags on the open overlay and runs the control loop until capture has answered
    void drag(LogicalPoint from, LogicalPoint to) {
        ASSERT_NE(toolkit.selector, nullptr);
        toolkit.selector->pointerDown(from);
        toolkit.selector->pointerMove(to);
        toolkit.selector->pointerUp(to);
        ASSERT_TRUE(Fakes::pumpUntil(tasks, [this] { return orchestrator.state() != OrchestratorState::Resolving; }));
    }

    void startMirroring() {
        orchestrator.beginSelection();
        drag(LogicalPoint{100, 50}, LogicalPoint{400, 250});
        ASSERT_EQ(orchestrator.state(), OrchestratorState::Mirroring);
    }

    PixelMath::Display panel = Fakes::makeDisplay(1, "eDP-1", LogicalRect{0, 0, 1280, 800}, 2.0);
    PixelMath::Display monitor = Fakes::makeDisplay(2, "HDMI-1", LogicalRect{1280, 0, 1920, 1080}, 1.0);

    Fakes::EventLog log;
    Fakes::FakeCaptureProvider provider{&log};
    Fakes::FakePermissionGate gate;
    Fakes::FakeToolkit toolkit{log};
    TaskQueue tasks;
    SessionOrchestrator orchestrator{provider, gate, toolkit, tasks};
};

} // namespace

TEST_F(OrchestratorTest, SelectionOpensOnTheDisplayUnderThePointer) {
    toolkit.pointer = LogicalPoint{1500, 500};
    orchestrator.beginSelection();

    EXPECT_EQ(orchestrator.state(), OrchestratorState::Selecting);
    ASSERT_NE(toolkit.selector, nullptr);
    EXPECT_EQ(toolkit.selector->display().id, monitor.id);
    EXPECT_EQ(toolkit.overlaysOpened, 1);
}

TEST_F(OrchestratorTest, FullFlowMirrorsTheSelectedRegion) {
    startMirroring();

    ASSERT_EQ(provider.sessionCount(), 1u);
    const auto session = provider.session(0);
    EXPECT_EQ(session.display.id, panel.id);
    EXPECT_EQ(session.descriptor.sourceRect, (PixelMath::PixelRect{200, 1100, 600, 400}));
    EXPECT_EQ(session.exclusions.count(toolkit.applicationId()), 1u);

    // The overlay is gone before capture starts
    EXPECT_EQ(toolkit.overlayCloses, 1);

    // Mirror sized to show the frame 1:1
    ASSERT_NE(toolkit.mirror, nullptr);
    EXPECT_DOUBLE_EQ(toolkit.mirrorContentSize.width, 300.0);
    EXPECT_DOUBLE_EQ(toolkit.mirrorContentSize.height, 200.0);
    EXPECT_EQ(toolkit.borderRegion, (LogicalRect{100, 50, 300, 200, CoordSpace::Global}));
    EXPECT_TRUE(log.contains("observer:on"));

    TestFrame frame(600, 400);
    session.onFrame(frame.view());
    EXPECT_TRUE(orchestrator.renderPending());
    EXPECT_EQ(toolkit.mirror->presents, 1);
    EXPECT_EQ(toolkit.mirror->lastFrameWidth, 600u);
}

TEST_F(OrchestratorTest, DisplayMissingFromFreshEnumerationIsReported) {
    orchestrator.beginSelection();

    // The panel disappears between selection and resolution
    provider.displays = {monitor};
    drag(LogicalPoint{100, 50}, LogicalPoint{400, 250});

    EXPECT_EQ(orchestrator.state(), OrchestratorState::NoSelection);
    ASSERT_TRUE(orchestrator.lastError().has_value());
    EXPECT_EQ(orchestrator.lastError()->kind, CaptureErrorKind::DisplayMatchFailure);
    ASSERT_EQ(toolkit.notices.size(), 1u);
    EXPECT_EQ(toolkit.notices[0], "Could not find a matching display to capture.");
    EXPECT_EQ(provider.startRequests.load(), 0);
    EXPECT_EQ(toolkit.mirrorsOpened, 0);
}

TEST_F(OrchestratorTest, TinyDragIsDiscardedSilently) {
    orchestrator.beginSelection();
    drag(LogicalPoint{100, 100}, LogicalPoint{105, 105});

    EXPECT_EQ(orchestrator.state(), OrchestratorState::NoSelection);
    ASSERT_TRUE(orchestrator.lastError().has_value());
    EXPECT_EQ(orchestrator.lastError()->kind, CaptureErrorKind::SelectionDegenerate);
    EXPECT_TRUE(toolkit.notices.empty());
    EXPECT_EQ(provider.startRequests.load(), 0);
}

TEST_F(OrchestratorTest, CancelledSelectionReturnsToIdle) {
    orchestrator.beginSelection();
    toolkit.selector->cancel();
    tasks.drain();

    EXPECT_EQ(orchestrator.state(), OrchestratorState::NoSelection);
    EXPECT_FALSE(orchestrator.lastError().has_value());
    EXPECT_TRUE(toolkit.notices.empty());
}

TEST_F(OrchestratorTest, PermissionDeniedShowsRemediation) {
    gate.permitted = false;
    orchestrator.beginSelection();

    EXPECT_EQ(gate.requests, 1);
    EXPECT_EQ(orchestrator.state(), OrchestratorState::NoSelection);
    ASSERT_TRUE(orchestrator.lastError().has_value());
    EXPECT_EQ(orchestrator.lastError()->kind, CaptureErrorKind::PermissionDenied);
    ASSERT_EQ(toolkit.notices.size(), 1u);
    EXPECT_NE(toolkit.notices[0].find(gate.remediation()), std::string::npos);
    EXPECT_EQ(toolkit.overlaysOpened, 0);
}

TEST_F(OrchestratorTest, PermissionGrantedOnRequestContinues) {
    gate.permitted = false;
    gate.grantOnRequest = true;
    orchestrator.beginSelection();

    EXPECT_EQ(orchestrator.state(), OrchestratorState::Selecting);
    EXPECT_TRUE(toolkit.notices.empty());
}

TEST_F(OrchestratorTest, StartFailureClosesTheMirrorAndReports) {
    provider.startMode = Fakes::FakeCaptureProvider::StartMode::Fail;
    orchestrator.beginSelection();
    drag(LogicalPoint{100, 50}, LogicalPoint{400, 250});

    EXPECT_EQ(orchestrator.state(), OrchestratorState::NoSelection);
    ASSERT_TRUE(orchestrator.lastError().has_value());
    EXPECT_EQ(orchestrator.lastError()->kind, CaptureErrorKind::SessionStartFailure);
    EXPECT_NE(orchestrator.lastError()->message.find("display went away"), std::string::npos);
    EXPECT_EQ(toolkit.mirror, nullptr);
    EXPECT_TRUE(log.contains("mirror.close"));
    EXPECT_FALSE(log.contains("border.show"));
}

TEST_F(OrchestratorTest, TeardownStopsCaptureBeforeClosingWindows) {
    startMirroring();

    Capture::SessionState stateAtClose = Capture::SessionState::Active;
    toolkit.onMirrorClose = [this, &stateAtClose] { stateAtClose = orchestrator.captureManager().state(); };

    toolkit.events.onCloseRequested();
    tasks.drain();

    EXPECT_NE(stateAtClose, Capture::SessionState::Active);
    EXPECT_EQ(orchestrator.state(), OrchestratorState::NoSelection);

    // Window, then border, then observers
    ASSERT_TRUE(log.contains("mirror.close"));
    ASSERT_TRUE(log.contains("border.remove"));
    ASSERT_TRUE(log.contains("observer:off"));
    const std::vector<std::string> events = log.events();
    auto at = [&events](const std::string& e) {
        return std::find(events.begin(), events.end(), e) - events.begin();
    };
    EXPECT_LT(at("mirror.close"), at("border.remove"));
    EXPECT_LT(at("border.remove"), at("observer:off"));

    orchestrator.lastTeardown().wait();
    EXPECT_TRUE(log.contains("stopped:1"));
}

TEST_F(OrchestratorTest, RuntimeErrorTearsDownAndReports) {
    startMirroring();
    provider.session(0).onError("output unplugged");
    tasks.drain();

    EXPECT_EQ(orchestrator.state(), OrchestratorState::NoSelection);
    ASSERT_TRUE(orchestrator.lastError().has_value());
    EXPECT_EQ(orchestrator.lastError()->kind, CaptureErrorKind::SessionRuntimeError);
    ASSERT_EQ(toolkit.notices.size(), 1u);
    EXPECT_EQ(toolkit.notices[0], "Screen capture stopped: output unplugged");
    EXPECT_EQ(toolkit.mirror, nullptr);
    EXPECT_TRUE(log.contains("observer:off"));
}

TEST_F(OrchestratorTest, NewSelectionReplacesTheRunningSession) {
    startMirroring();
    const auto first = provider.session(0);

    orchestrator.beginSelection();
    EXPECT_EQ(orchestrator.state(), OrchestratorState::Selecting);
    EXPECT_TRUE(log.contains("observer:off"));

    // An error from the replaced session is not shown
    first.onError("late");
    tasks.drain();
    EXPECT_TRUE(toolkit.notices.empty());

    drag(LogicalPoint{10, 10}, LogicalPoint{110, 110});
    EXPECT_EQ(orchestrator.state(), OrchestratorState::Mirroring);
    EXPECT_EQ(provider.sessionCount(), 2u);
}

TEST_F(OrchestratorTest, SecondSelectionClosesTheFirstOverlay) {
    orchestrator.beginSelection();
    orchestrator.beginSelection();

    EXPECT_EQ(toolkit.overlaysOpened, 2);
    EXPECT_EQ(toolkit.overlayCloses, 1);
    ASSERT_NE(toolkit.selector, nullptr);
    EXPECT_EQ(Selection::RegionSelector::openInstance(), toolkit.selector);
    EXPECT_EQ(orchestrator.state(), OrchestratorState::Selecting);
}

TEST_F(OrchestratorTest, DisplayChangeReachesTheRenderer) {
    startMirroring();
    toolkit.mirror->scale = PixelMath::Scale{1.0, 1.0};
    toolkit.events.onDisplayChanged();

    ASSERT_NE(orchestrator.renderer(), nullptr);
    EXPECT_DOUBLE_EQ(orchestrator.renderer()->surface().displayScale.x, 1.0);
}

TEST_F(OrchestratorTest, ShutdownWaitsForCaptureToStop) {
    startMirroring();
    orchestrator.shutdown();

    EXPECT_EQ(orchestrator.state(), OrchestratorState::NoSelection);
    EXPECT_TRUE(log.contains("stopped:1"));
}

TEST_F(OrchestratorTest, OverlayThatFailsToOpenIsReported) {
    toolkit.failOverlay = true;
    orchestrator.beginSelection();

    EXPECT_EQ(orchestrator.state(), OrchestratorState::NoSelection);
    EXPECT_EQ(Selection::RegionSelector::openInstance(), nullptr);
    ASSERT_TRUE(orchestrator.lastError().has_value());
    ASSERT_EQ(toolkit.notices.size(), 1u);
    EXPECT_EQ(toolkit.notices[0], "Could not open the selection overlay.");

    // The next attempt starts from scratch
    toolkit.failOverlay = false;
    orchestrator.beginSelection();
    EXPECT_EQ(orchestrator.state(), OrchestratorState::Selecting);
    EXPECT_EQ(toolkit.overlaysOpened, 1);
}

TEST_F(OrchestratorTest, ControlLoopKeepsRunningWhileCaptureStarts) {
    provider.startMode = Fakes::FakeCaptureProvider::StartMode::Hang;
    orchestrator.beginSelection();
    toolkit.selector->pointerDown(LogicalPoint{100, 50});
    toolkit.selector->pointerMove(LogicalPoint{400, 250});
    toolkit.selector->pointerUp(LogicalPoint{400, 250});
    tasks.drain();

    EXPECT_EQ(orchestrator.state(), OrchestratorState::Resolving);
    ASSERT_NE(toolkit.mirror, nullptr);
    EXPECT_EQ(orchestrator.renderer(), nullptr);

    // Closing the mirror before capture is up abandons the start
    toolkit.events.onCloseRequested();
    tasks.drain();
    EXPECT_EQ(orchestrator.state(), OrchestratorState::NoSelection);
    EXPECT_EQ(toolkit.mirror, nullptr);
    EXPECT_FALSE(log.contains("observer:on"));
    EXPECT_FALSE(log.contains("observer:off"));
    EXPECT_EQ(orchestrator.lastTeardown().wait_for(std::chrono::seconds(2)), std::future_status::ready);

    provider.releaseHung();
    ASSERT_TRUE(Fakes::pumpUntil(tasks, [this] { return log.contains("stop:1"); }));
    EXPECT_EQ(orchestrator.state(), OrchestratorState::NoSelection);
    EXPECT_TRUE(toolkit.notices.empty());
}
