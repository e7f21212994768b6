#include "CaptureTypes.hpp"

namespace Capture {

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Starting: return "Starting";
        case SessionState::Active: return "Active";
        case SessionState::TearingDown: return "TearingDown";
        case SessionState::Closed: return "Closed";
        default: return "Unknown";
    }
}

const char* toString(CaptureErrorKind kind) {
    switch (kind) {
        case CaptureErrorKind::SelectionDegenerate: return "SelectionDegenerate";
        case CaptureErrorKind::DisplayMatchFailure: return "DisplayMatchFailure";
        case CaptureErrorKind::PermissionDenied: return "PermissionDenied";
        case CaptureErrorKind::SessionStartFailure: return "SessionStartFailure";
        case CaptureErrorKind::SessionRuntimeError: return "SessionRuntimeError";
        case CaptureErrorKind::TeardownError: return "TeardownError";
        default: return "Unknown";
    }
}

} // namespace Capture
