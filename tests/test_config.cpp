#include <Config.hpp>
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

using namespace Config;

namespace {

// argv built from string literals, as main() would receive it
struct Args {
    explicit Args(std::vector<std::string> values) : storage(std::move(values)) {
        for (auto& s : storage) {
            pointers.push_back(&s[0]);
        }
    }

    int argc() const { return static_cast<int>(pointers.size()); }
    char** argv() { return pointers.data(); }

    std::vector<std::string> storage;
    std::vector<char*> pointers;
};

} // namespace

TEST(ConfigTest, Defaults) {
    const AppConfig config;
    EXPECT_EQ(config.backend, "auto");
    EXPECT_EQ(config.frameRate, 30);
    EXPECT_TRUE(config.showCursor);
    EXPECT_EQ(config.failureBudget, 10);
    EXPECT_EQ(config.startTimeoutMs, 5000);
    EXPECT_TRUE(config.showBorder);
    EXPECT_EQ(config.borderWidth, 2);
    EXPECT_TRUE(config.excludeSelf);
}

TEST(ConfigTest, ParsesNestedSections) {
    AppConfig config;
    const std::string json = R"({
        "backend": "x11",
        "capture": { "frame_rate": 60, "show_cursor": false, "failure_budget": 3, "start_timeout_ms": 2000 },
        "ui": { "show_border": false, "border_width": 4, "exclude_self": false }
    })";

    ASSERT_TRUE(parseConfig(json, config));
    EXPECT_EQ(config.backend, "x11");
    EXPECT_EQ(config.frameRate, 60);
    EXPECT_FALSE(config.showCursor);
    EXPECT_EQ(config.failureBudget, 3);
    EXPECT_EQ(config.startTimeoutMs, 2000);
    EXPECT_FALSE(config.showBorder);
    EXPECT_EQ(config.borderWidth, 4);
    EXPECT_FALSE(config.excludeSelf);
}

TEST(ConfigTest, MissingKeysKeepCurrentValues) {
    AppConfig config;
    config.frameRate = 15;
    ASSERT_TRUE(parseConfig(R"({"ui": {"border_width": 3}})", config));
    EXPECT_EQ(config.frameRate, 15);
    EXPECT_EQ(config.borderWidth, 3);
}

TEST(ConfigTest, OutOfRangeValuesAreClamped) {
    AppConfig config;
    ASSERT_TRUE(parseConfig(R"({"capture": {"frame_rate": 1000, "start_timeout_ms": 1}, "ui": {"border_width": 0}})",
                            config));
    EXPECT_EQ(config.frameRate, 240);
    EXPECT_EQ(config.startTimeoutMs, 100);
    EXPECT_EQ(config.borderWidth, 1);
}

TEST(ConfigTest, NumbersBeyondIntRangeAreClamped) {
    AppConfig config;
    ASSERT_TRUE(parseConfig(
        R"({"capture": {"frame_rate": 1e20, "start_timeout_ms": -1e20, "failure_budget": 4294967296}})", config));
    EXPECT_EQ(config.frameRate, 240);
    EXPECT_EQ(config.startTimeoutMs, 100);
    EXPECT_EQ(config.failureBudget, 1000);
}

TEST(ConfigTest, WrongTypesAndUnknownBackendAreIgnored) {
    AppConfig config;
    ASSERT_TRUE(parseConfig(R"({"backend": "directx", "capture": {"frame_rate": "fast", "show_cursor": 1}})", config));
    EXPECT_EQ(config.backend, "auto");
    EXPECT_EQ(config.frameRate, 30);
    EXPECT_TRUE(config.showCursor);
}

TEST(ConfigTest, MalformedDocumentLeavesConfigUntouched) {
    AppConfig config;
    config.frameRate = 12;
    EXPECT_FALSE(parseConfig("{ \"capture\": { \"frame_rate\": 60 ", config));
    EXPECT_FALSE(parseConfig("[1, 2, 3]", config));
    EXPECT_EQ(config.frameRate, 12);
}

TEST(ConfigTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "regionmirror_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"capture": {"frame_rate": 24}})";
    }

    AppConfig config;
    EXPECT_TRUE(loadConfig(path, config));
    EXPECT_EQ(config.frameRate, 24);
    std::remove(path.c_str());

    AppConfig missing;
    EXPECT_FALSE(loadConfig(path, missing));
    EXPECT_EQ(missing.frameRate, 30);
}

TEST(ConfigTest, DefaultPathFollowsXdgConfigHome) {
    const char* previous = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = previous ? previous : "";

    setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    EXPECT_EQ(defaultConfigPath(), "/tmp/xdg/regionmirror/config.json");

    if (previous) {
        setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    } else {
        unsetenv("XDG_CONFIG_HOME");
    }
}

TEST(CommandLineTest, ParsesAllOptions) {
    Args args({"regionmirror", "--config", "/etc/rm.json", "--backend", "wayland", "--select"});
    CommandLine cli;
    std::string error;

    ASSERT_TRUE(parseCommandLine(args.argc(), args.argv(), cli, error));
    EXPECT_EQ(cli.configPath, "/etc/rm.json");
    EXPECT_EQ(cli.backendOverride, "wayland");
    EXPECT_TRUE(cli.selectOnStart);
    EXPECT_FALSE(cli.help);
}

TEST(CommandLineTest, Help) {
    Args args({"regionmirror", "-h"});
    CommandLine cli;
    std::string error;
    ASSERT_TRUE(parseCommandLine(args.argc(), args.argv(), cli, error));
    EXPECT_TRUE(cli.help);
}

TEST(CommandLineTest, RejectsBadInput) {
    CommandLine cli;
    std::string error;

    Args unknown({"regionmirror", "--fullscreen"});
    EXPECT_FALSE(parseCommandLine(unknown.argc(), unknown.argv(), cli, error));
    EXPECT_NE(error.find("--fullscreen"), std::string::npos);

    Args missing({"regionmirror", "--config"});
    EXPECT_FALSE(parseCommandLine(missing.argc(), missing.argv(), cli, error));

    Args backend({"regionmirror", "--backend", "gdi"});
    EXPECT_FALSE(parseCommandLine(backend.argc(), backend.argv(), cli, error));
    EXPECT_NE(error.find("gdi"), std::string::npos);
}
