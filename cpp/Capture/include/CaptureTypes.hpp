#pragma once
#include <Geometry.hpp>
#include <buffer.hpp>
#include <cstdint>
#include <string>

namespace Capture {

struct CaptureDescriptor {
    int destinationWidth = 0;   // pixels, equals sourceRect.width (no scaling)
    int destinationHeight = 0;  // pixels, equals sourceRect.height
    PixelMath::PixelRect sourceRect;
    int frameRateCap = 30;
    IMGBuffer::PixelFormat outputFormat = IMGBuffer::PixelFormat::BGRA8;
    bool exactSize = true;      // provider must not scale internally
    bool showCursor = true;
};

enum class SessionState {
    Idle,
    Starting,
    Active,
    TearingDown,
    Closed
};

enum class CaptureErrorKind {
    SelectionDegenerate,
    DisplayMatchFailure,
    PermissionDenied,
    SessionStartFailure,
    SessionRuntimeError,
    TeardownError
};

struct CaptureError {
    CaptureErrorKind kind = CaptureErrorKind::SessionStartFailure;
    std::string message;
};

// Opaque per-session token issued by a provider.
using ProviderHandle = std::uint64_t;
constexpr ProviderHandle kInvalidProviderHandle = 0;

const char* toString(SessionState state);
const char* toString(CaptureErrorKind kind);

} // namespace Capture
