#pragma once
#include <string>

namespace Config {

struct AppConfig {
    // Capture provider: "auto", "x11" or "wayland"
    std::string backend = "auto";

    // capture.*
    int frameRate = 30;
    bool showCursor = true;
    int failureBudget = 10;      // consecutive failed grabs before the session errors out
    int startTimeoutMs = 5000;

    // ui.*
    bool showBorder = true;
    int borderWidth = 2;         // device pixels
    bool excludeSelf = true;
};

struct CommandLine {
    std::string configPath;      // empty: defaultConfigPath()
    std::string backendOverride; // empty: use the config file
    bool selectOnStart = false;
    bool help = false;
};

/**
 * @brief Loads a JSON config file over the defaults already in out
 * @return false if the file is missing or malformed; out then keeps its defaults
 */
bool loadConfig(const std::string& path, AppConfig& out);

// Same as loadConfig for an in-memory document
bool parseConfig(const std::string& json, AppConfig& out);

// $XDG_CONFIG_HOME/regionmirror/config.json, falling back to ~/.config
std::string defaultConfigPath();

/**
 * @brief Parses argv
 * @param error Set when false is returned
 */
bool parseCommandLine(int argc, char** argv, CommandLine& out, std::string& error);

void printConfig(const AppConfig& config);
void printUsage(const char* argv0);

} // namespace Config
