#include "Config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>

namespace Config {

namespace {

int readInt(const nlohmann::json& obj, const char* key, int current, int lo, int hi) {
    if (!obj.contains(key)) {
        return current;
    }
    const auto& item = obj[key];
    if (!item.is_number()) {
        std::cerr << "[Config] '" << key << "' must be a number, keeping " << current << std::endl;
        return current;
    }
    // Read wide so huge or fractional numbers are clamped before they become an int
    const double value = item.get<double>();
    if (!std::isfinite(value)) {
        std::cerr << "[Config] '" << key << "' is not finite, keeping " << current << std::endl;
        return current;
    }
    const double bounded = std::clamp(value, static_cast<double>(lo), static_cast<double>(hi));
    const int clamped = static_cast<int>(bounded);
    if (bounded != value) {
        std::cerr << "[Config] '" << key << "' = " << value << " out of range, using " << clamped << std::endl;
    }
    return clamped;
}

bool readBool(const nlohmann::json& obj, const char* key, bool current) {
    if (!obj.contains(key)) {
        return current;
    }
    const auto& item = obj[key];
    if (!item.is_boolean()) {
        std::cerr << "[Config] '" << key << "' must be true or false" << std::endl;
        return current;
    }
    return item.get<bool>();
}

bool isKnownBackend(const std::string& name) {
    return name == "auto" || name == "x11" || name == "wayland";
}

} // namespace

bool parseConfig(const std::string& json, AppConfig& out) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[Config] JSON parse error: " << e.what() << std::endl;
        return false;
    }

    if (!root.is_object()) {
        std::cerr << "[Config] Top level must be an object" << std::endl;
        return false;
    }

    // Parse into a copy so a half-valid file never leaves out half-applied
    AppConfig parsed = out;

    if (root.contains("backend")) {
        if (root["backend"].is_string() && isKnownBackend(root["backend"].get<std::string>())) {
            parsed.backend = root["backend"].get<std::string>();
        } else {
            std::cerr << "[Config] 'backend' must be \"auto\", \"x11\" or \"wayland\"" << std::endl;
        }
    }

    if (root.contains("capture") && root["capture"].is_object()) {
        const auto& capture = root["capture"];
        parsed.frameRate = readInt(capture, "frame_rate", parsed.frameRate, 1, 240);
        parsed.showCursor = readBool(capture, "show_cursor", parsed.showCursor);
        parsed.failureBudget = readInt(capture, "failure_budget", parsed.failureBudget, 1, 1000);
        parsed.startTimeoutMs = readInt(capture, "start_timeout_ms", parsed.startTimeoutMs, 100, 60000);
    }

    if (root.contains("ui") && root["ui"].is_object()) {
        const auto& ui = root["ui"];
        parsed.showBorder = readBool(ui, "show_border", parsed.showBorder);
        parsed.borderWidth = readInt(ui, "border_width", parsed.borderWidth, 1, 16);
        parsed.excludeSelf = readBool(ui, "exclude_self", parsed.excludeSelf);
    }

    out = parsed;
    return true;
}

bool loadConfig(const std::string& path, AppConfig& out) {
    std::ifstream file(path);
    if (!file) {
        std::cout << "[Config] No config at " << path << ", using defaults" << std::endl;
        return false;
    }

    std::stringstream contents;
    contents << file.rdbuf();
    if (!parseConfig(contents.str(), out)) {
        std::cerr << "[Config] Ignoring " << path << ", using defaults" << std::endl;
        return false;
    }

    std::cout << "[Config] Loaded from: " << path << std::endl;
    return true;
}

std::string defaultConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (*xdg) {
            return std::string(xdg) + "/regionmirror/config.json";
        }
    }
    const char* home = std::getenv("HOME");
    return std::string(home ? home : ".") + "/.config/regionmirror/config.json";
}

bool parseCommandLine(int argc, char** argv, CommandLine& out, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--config") == 0 || std::strcmp(arg, "--backend") == 0) {
            if (i + 1 >= argc) {
                error = std::string(arg) + " needs a value";
                return false;
            }
            std::string value = argv[++i];
            if (std::strcmp(arg, "--config") == 0) {
                out.configPath = value;
            } else if (isKnownBackend(value)) {
                out.backendOverride = value;
            } else {
                error = "unknown backend '" + value + "'";
                return false;
            }
        } else if (std::strcmp(arg, "--select") == 0) {
            out.selectOnStart = true;
        } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            out.help = true;
        } else {
            error = std::string("unknown argument '") + arg + "'";
            return false;
        }
    }
    return true;
}

void printConfig(const AppConfig& config) {
    std::cout << "[Config] Current settings:" << std::endl;
    std::cout << "  Backend: " << config.backend << std::endl;
    std::cout << "  Capture: " << config.frameRate << " fps, cursor " << (config.showCursor ? "on" : "off")
              << ", failure budget " << config.failureBudget
              << ", start timeout " << config.startTimeoutMs << " ms" << std::endl;
    std::cout << "  UI: border " << (config.showBorder ? "on" : "off") << " (" << config.borderWidth
              << " px), exclude self " << (config.excludeSelf ? "on" : "off") << std::endl;
}

void printUsage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--config <path>] [--backend auto|x11|wayland] [--select]" << std::endl;
    std::cout << "  --config   JSON settings file (default " << defaultConfigPath() << ")" << std::endl;
    std::cout << "  --backend  capture provider override" << std::endl;
    std::cout << "  --select   start a region selection immediately" << std::endl;
}

} // namespace Config
