#include "config.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

const char* kDefaultLink = "/dev/input/by-id/usb-1038_SteelSeries_Stratus_Duo-event-joystick";

std::optional<CommandLine> parse(std::vector<const char*> args, const Config& base = Config()) {
    args.insert(args.begin(), "padmirror");
    return parse_args(static_cast<int>(args.size()), args.data(), base);
}

class TempFile {
public:
    TempFile() {
        char tmpl[] = "/tmp/padmirror-config-XXXXXX";
        int fd = mkstemp(tmpl);
        EXPECT_GE(fd, 0);
        if (fd >= 0) {
            close(fd);
        }
        path = tmpl;
    }
    ~TempFile() { unlink(path.c_str()); }

    void write(const std::string& contents) {
        std::ofstream out(path);
        out << contents;
    }

    std::string path;
};

} // namespace

TEST(ParseArgs, DefaultsWithoutArguments) {
    auto cli = parse({});
    ASSERT_TRUE(cli);
    EXPECT_EQ(cli->mode, RunMode::Run);
    EXPECT_EQ(cli->config.device_link, kDefaultLink);
    EXPECT_EQ(cli->config.event_path, "/tmp/gamepad-event");
    EXPECT_EQ(cli->config.js_path, "/tmp/gamepad-js");
    EXPECT_EQ(cli->config.virtual_name, "VirtualGamepad");
    EXPECT_EQ(cli->config.poll_interval_ms, 1000);
    EXPECT_TRUE(cli->config.grab);
    EXPECT_FALSE(cli->config.verbose);
    EXPECT_FALSE(cli->config.unlink_on_exit);
}

TEST(ParseArgs, CustomDeviceLinkLeavesOthersAlone) {
    auto cli = parse({"--device-link", "/dev/input/my-custom-device"});
    ASSERT_TRUE(cli);
    EXPECT_EQ(cli->config.device_link, "/dev/input/my-custom-device");
    EXPECT_EQ(cli->config.event_path, "/tmp/gamepad-event");
    EXPECT_EQ(cli->config.js_path, "/tmp/gamepad-js");
    EXPECT_EQ(cli->config.virtual_name, "VirtualGamepad");
}

TEST(ParseArgs, AllSettings) {
    auto cli = parse({"--device-link", "/dev/input/another-device",
                      "--event-path", "/opt/ev",
                      "--js-path", "/opt/js",
                      "--virtual-name", "SuperGamepad",
                      "--poll-interval-ms", "250",
                      "--no-grab", "--verbose", "--unlink-on-exit"});
    ASSERT_TRUE(cli);
    EXPECT_EQ(cli->config.device_link, "/dev/input/another-device");
    EXPECT_EQ(cli->config.event_path, "/opt/ev");
    EXPECT_EQ(cli->config.js_path, "/opt/js");
    EXPECT_EQ(cli->config.virtual_name, "SuperGamepad");
    EXPECT_EQ(cli->config.poll_interval_ms, 250);
    EXPECT_FALSE(cli->config.grab);
    EXPECT_TRUE(cli->config.verbose);
    EXPECT_TRUE(cli->config.unlink_on_exit);
}

TEST(ParseArgs, EmptyValuesAreKeptVerbatim) {
    auto cli = parse({"--device-link", "", "--event-path", "", "--js-path", "", "--virtual-name", ""});
    ASSERT_TRUE(cli);
    EXPECT_EQ(cli->config.device_link, "");
    EXPECT_EQ(cli->config.event_path, "");
    EXPECT_EQ(cli->config.js_path, "");
    EXPECT_EQ(cli->config.virtual_name, "");
}

TEST(ParseArgs, RejectsUnknownOption) {
    EXPECT_FALSE(parse({"--unknown-arg", "value"}));
}

TEST(ParseArgs, RejectsMissingValue) {
    EXPECT_FALSE(parse({"--event-path"}));
}

TEST(ParseArgs, RejectsBadPollInterval) {
    EXPECT_FALSE(parse({"--poll-interval-ms", "0"}));
    EXPECT_FALSE(parse({"--poll-interval-ms", "-5"}));
    EXPECT_FALSE(parse({"--poll-interval-ms", "10ms"}));
}

TEST(ParseArgs, Modes) {
    EXPECT_EQ(parse({"--help"})->mode, RunMode::Help);
    EXPECT_EQ(parse({"--diagnostics"})->mode, RunMode::Diagnostics);

    auto cli = parse({"--write-config", "/tmp/out.json"});
    ASSERT_TRUE(cli);
    EXPECT_EQ(cli->mode, RunMode::WriteConfig);
    EXPECT_EQ(cli->write_path, "/tmp/out.json");

    cli = parse({"--config", "/etc/padmirror.json"});
    ASSERT_TRUE(cli);
    EXPECT_EQ(cli->config_path, "/etc/padmirror.json");
}

TEST(ParseArgs, CommandLineOverridesBase) {
    Config base;
    base.event_path = "/run/pad-event";
    base.grab = false;

    auto cli = parse({"--js-path", "/run/pad-js"}, base);
    ASSERT_TRUE(cli);
    EXPECT_EQ(cli->config.event_path, "/run/pad-event");
    EXPECT_EQ(cli->config.js_path, "/run/pad-js");
    EXPECT_FALSE(cli->config.grab);
}

TEST(ConfigManager, MissingFileIsNullopt) {
    EXPECT_FALSE(ConfigManager::load("/nonexistent/padmirror/config.json"));
}

TEST(ConfigManager, LoadsSettingsOverBase) {
    TempFile file;
    file.write(R"({
  "settings": {
    "device_link": "/dev/input/by-id/usb-Test_Pad-event-joystick",
    "virtual_name": "Pad \"One\"",
    "poll_interval_ms": 200,
    "grab": false
  }
})");

    Config base;
    base.js_path = "/run/js";

    auto config = ConfigManager::load(file.path, base);
    ASSERT_TRUE(config);
    EXPECT_EQ(config->device_link, "/dev/input/by-id/usb-Test_Pad-event-joystick");
    EXPECT_EQ(config->virtual_name, "Pad \"One\"");
    EXPECT_EQ(config->poll_interval_ms, 200);
    EXPECT_FALSE(config->grab);
    EXPECT_EQ(config->js_path, "/run/js");
    EXPECT_EQ(config->event_path, "/tmp/gamepad-event");
}

TEST(ConfigManager, InvalidIntervalKeepsBase) {
    TempFile file;
    file.write(R"({"settings": {"poll_interval_ms": "soon"}})");

    auto config = ConfigManager::load(file.path);
    ASSERT_TRUE(config);
    EXPECT_EQ(config->poll_interval_ms, 1000);
}

TEST(ConfigManager, SavedSettingsLoadBack) {
    TempFile file;
    Config config;
    config.event_path = "/srv/pad\\event";
    config.virtual_name = "Tab\tName";
    config.poll_interval_ms = 75;
    config.verbose = true;

    ASSERT_TRUE(ConfigManager::save(file.path, config));

    auto loaded = ConfigManager::load(file.path);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->event_path, config.event_path);
    EXPECT_EQ(loaded->virtual_name, config.virtual_name);
    EXPECT_EQ(loaded->poll_interval_ms, 75);
    EXPECT_TRUE(loaded->verbose);
    EXPECT_TRUE(loaded->grab);
}

TEST(ConfigManager, ValuesNamedLikeKeysLoadBack) {
    TempFile file;
    Config config;
    config.virtual_name = "grab";
    config.device_link = "verbose";
    config.event_path = "poll_interval_ms";
    config.grab = false;
    config.verbose = true;
    config.poll_interval_ms = 333;

    ASSERT_TRUE(ConfigManager::save(file.path, config));

    auto loaded = ConfigManager::load(file.path);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded->virtual_name, "grab");
    EXPECT_EQ(loaded->device_link, "verbose");
    EXPECT_EQ(loaded->event_path, "poll_interval_ms");
    EXPECT_FALSE(loaded->grab);
    EXPECT_TRUE(loaded->verbose);
    EXPECT_EQ(loaded->poll_interval_ms, 333);
}

TEST(ConfigManager, PathFromEnvironment) {
    const char* old_home = getenv("HOME");
    const std::string saved_home = old_home ? old_home : "";

    setenv("PADMIRROR_CONFIG", "/tmp/padmirror-env.json", 1);
    EXPECT_EQ(ConfigManager::get_config_path(), "/tmp/padmirror-env.json");
    unsetenv("PADMIRROR_CONFIG");

    setenv("HOME", "/home/tester", 1);
    EXPECT_EQ(ConfigManager::get_config_path(), "/home/tester/.config/padmirror/config.json");

    unsetenv("HOME");
    EXPECT_EQ(ConfigManager::get_config_path(), "/etc/padmirror/config.json");

    if (old_home) {
        setenv("HOME", saved_home.c_str(), 1);
    }
    EXPECT_EQ(getenv("HOME") != nullptr, old_home != nullptr);
}
