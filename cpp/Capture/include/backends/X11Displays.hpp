#pragma once
#include <DisplayLayout.hpp>

struct _XDisplay;

namespace Capture {

// Xft.dpi / 96, or 1 when the resource is not set
double queryXftScale(_XDisplay* display);

/**
 * @brief Current outputs of an X server
 *
 * Uses the i3/Sway output list when available, else the default screen as a single display.
 */
PixelMath::DisplayLayout queryX11Layout(_XDisplay* display);

/**
 * @brief Replaces Xlib's exit-on-error default with one that logs and records the error
 *
 * Process wide, and enables Xlib threading; safe to call more than once.
 */
void installX11ErrorHandler();

// Last X protocol error code raised on the calling thread (0 if none), then resets it
int takeX11Error();

} // namespace Capture
