#pragma once
#include <DisplayLayout.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace Capture {

enum class DisplayServer {
    Unknown,
    I3,          // i3 window manager
    Sway,        // Sway (Wayland compositor)
    XWayland,    // X11 clients on a Wayland compositor
    Wayland,     // Wayland compositor without XWayland
    X11          // Pure X11
};

// Sway, XWayland and bare Wayland sessions; native capture beats a root grab there
bool isWaylandSession(DisplayServer server);

/**
 * @brief Parses an i3/Sway GET_OUTPUTS reply into layout outputs
 *
 * Inactive outputs and entries with fields of the wrong type are skipped.
 * Sway reports logical rects, which are also XWayland root coordinates, so
 * they map 1:1; i3 reports X11 pixel rects, which are divided by fallbackScale.
 */
std::vector<PixelMath::LayoutOutput> parseOutputs(const std::string& json, double fallbackScale);

class I3Ipc {
public:
    I3Ipc();
    ~I3Ipc();

    I3Ipc(const I3Ipc&) = delete;
    I3Ipc& operator=(const I3Ipc&) = delete;

    bool connected() const { return m_sock != -1; }

    /**
     * @brief Queries the active outputs
     * @return Empty when not connected or the reply could not be read
     */
    std::vector<PixelMath::LayoutOutput> queryOutputs(double fallbackScale);

    /**
     * @brief Detects which display server we're running on
     */
    static DisplayServer detectDisplayServer();

private:
    int m_sock = -1;

    static std::string getSocketPath();
    bool connectToSocket();
    bool sendMessage(std::uint32_t type);
    std::string receiveResponse();
};

} // namespace Capture
