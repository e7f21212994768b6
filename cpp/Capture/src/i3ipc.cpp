#include "i3ipc.hpp"
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

namespace Capture {

namespace {

constexpr std::uint32_t kGetOutputs = 3;
const std::string kMagic = "i3-ipc";

// One GET_OUTPUTS entry; throws nlohmann::json::type_error on fields of the wrong type
bool parseOutput(const nlohmann::json& node, double fallbackScale, PixelMath::LayoutOutput& out) {
    if (!node.is_object() || !node.contains("rect") || !node.contains("name")) {
        return false;
    }
    if (node.contains("active") && node["active"].is_boolean() && !node["active"].get<bool>()) {
        return false;
    }

    const auto& rect = node["rect"];
    const int rx = rect.value("x", 0);
    const int ry = rect.value("y", 0);
    const int rw = rect.value("width", 0);
    const int rh = rect.value("height", 0);
    if (rw <= 0 || rh <= 0) {
        return false;
    }

    out.name = node["name"].get<std::string>();

    if (node.contains("scale") && node["scale"].is_number()) {
        // Sway: rects are logical, and XWayland's root window uses the same
        // logical coordinates, so root grabs run at one pixel per unit
        const double s = node["scale"].get<double>();
        if (s != 1.0) {
            std::cout << "[i3ipc] Output " << out.name << " has scale " << s
                      << "; X11 grabs on it run at logical resolution" << std::endl;
        }
        out.scale = PixelMath::Scale{1.0, 1.0};
        out.x = rx;
        out.y = ry;
        out.width = rw;
        out.height = rh;
        out.pixelWidth = rw;
        out.pixelHeight = rh;
        out.rootX = rx;
        out.rootY = ry;
        return true;
    }

    // i3: rect is X11 root pixels
    const double s = fallbackScale > 0.0 ? fallbackScale : 1.0;
    out.scale = PixelMath::Scale{s, s};
    out.x = rx / s;
    out.y = ry / s;
    out.width = rw / s;
    out.height = rh / s;
    out.pixelWidth = rw;
    out.pixelHeight = rh;
    out.rootX = rx;
    out.rootY = ry;
    return true;
}

} // namespace

std::vector<PixelMath::LayoutOutput> parseOutputs(const std::string& json, double fallbackScale) {
    std::vector<PixelMath::LayoutOutput> outputs;

    nlohmann::json reply;
    try {
        reply = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[i3ipc] JSON parse error: " << e.what() << std::endl;
        return outputs;
    }
    if (!reply.is_array()) {
        std::cerr << "[i3ipc] GET_OUTPUTS reply is not an array" << std::endl;
        return outputs;
    }

    for (const auto& node : reply) {
        PixelMath::LayoutOutput out;
        try {
            if (!parseOutput(node, fallbackScale, out)) {
                continue;
            }
        } catch (const nlohmann::json::type_error& e) {
            std::cerr << "[i3ipc] Skipping malformed output: " << e.what() << std::endl;
            continue;
        }
        outputs.push_back(out);
    }

    return outputs;
}

bool isWaylandSession(DisplayServer server) {
    return server == DisplayServer::Sway || server == DisplayServer::XWayland || server == DisplayServer::Wayland;
}

I3Ipc::I3Ipc() {
    connectToSocket();
}

I3Ipc::~I3Ipc() {
    if (m_sock != -1) close(m_sock);
}

DisplayServer I3Ipc::detectDisplayServer() {
    const char* swaysock = std::getenv("SWAYSOCK");
    const char* i3sock = std::getenv("I3SOCK");
    const char* waylandDisplay = std::getenv("WAYLAND_DISPLAY");
    const char* x11Display = std::getenv("DISPLAY");

    // Prioritize Sway
    if (swaysock) return DisplayServer::Sway;
    if (i3sock) return DisplayServer::I3;
    if (waylandDisplay && x11Display) return DisplayServer::XWayland;
    if (waylandDisplay) return DisplayServer::Wayland;
    if (x11Display) return DisplayServer::X11;
    return DisplayServer::Unknown;
}

std::string I3Ipc::getSocketPath() {
    // Check Sway first, then i3
    const char* env = std::getenv("SWAYSOCK");
    if (!env) env = std::getenv("I3SOCK");
    return env ? env : "";
}

bool I3Ipc::connectToSocket() {
    std::string path = getSocketPath();
    if (path.empty()) {
        return false;
    }

    m_sock = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (m_sock == -1) {
        std::cerr << "[i3ipc] Failed to create socket: " << strerror(errno) << std::endl;
        return false;
    }

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(m_sock, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        std::cerr << "[i3ipc] Failed to connect to i3/Sway socket " << path << ": " << strerror(errno) << std::endl;
        close(m_sock);
        m_sock = -1;
        return false;
    }

    return true;
}

bool I3Ipc::sendMessage(std::uint32_t type) {
    if (m_sock == -1) return false;

    std::uint32_t payload_len = 0;

    // 14 byte header: magic, payload length, message type (native byte order)
    std::vector<std::uint8_t> header;
    header.insert(header.end(), kMagic.begin(), kMagic.end());
    header.insert(header.end(), (std::uint8_t*)&payload_len, (std::uint8_t*)&payload_len + 4);
    header.insert(header.end(), (std::uint8_t*)&type, (std::uint8_t*)&type + 4);

    ssize_t written = write(m_sock, header.data(), header.size());
    if (written != static_cast<ssize_t>(header.size())) {
        std::cerr << "[i3ipc] Failed to send request" << std::endl;
        return false;
    }
    return true;
}

std::string I3Ipc::receiveResponse() {
    if (m_sock == -1) return "";

    char header[14];
    std::size_t got = 0;
    while (got < sizeof(header)) {
        ssize_t r = read(m_sock, header + got, sizeof(header) - got);
        if (r <= 0) {
            std::cerr << "[i3ipc] Failed to read reply header" << std::endl;
            return "";
        }
        got += static_cast<std::size_t>(r);
    }

    // Payload length sits in bytes 6-9
    std::uint32_t length;
    std::memcpy(&length, &header[6], 4);

    std::string json_data;
    json_data.resize(length);

    std::uint32_t total_read = 0;
    while (total_read < length) {
        ssize_t r = read(m_sock, &json_data[total_read], length - total_read);
        if (r <= 0) {
            std::cerr << "[i3ipc] Failed to read reply payload" << std::endl;
            return "";
        }
        total_read += r;
    }

    return json_data;
}

std::vector<PixelMath::LayoutOutput> I3Ipc::queryOutputs(double fallbackScale) {
    if (m_sock == -1 || !sendMessage(kGetOutputs)) {
        return {};
    }

    std::string reply = receiveResponse();
    if (reply.empty()) {
        std::cerr << "[i3ipc] Received empty GET_OUTPUTS reply" << std::endl;
        return {};
    }
    return parseOutputs(reply, fallbackScale);
}

} // namespace Capture
