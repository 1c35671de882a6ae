#pragma once

#include <optional>
#include <string>
#include <string_view>

// Settings are read once at startup and passed by const reference from then on.
struct Config {
    std::string device_link = "/dev/input/by-id/usb-1038_SteelSeries_Stratus_Duo-event-joystick";
    std::string event_path = "/tmp/gamepad-event";
    std::string js_path = "/tmp/gamepad-js";
    std::string virtual_name = "VirtualGamepad";
    int poll_interval_ms = 1000;
    bool grab = true;
    bool verbose = false;
    bool unlink_on_exit = false;
};

enum class RunMode {
    Run,
    Diagnostics,
    WriteConfig,
    Help
};

struct CommandLine {
    Config config;
    RunMode mode = RunMode::Run;
    std::string config_path;  // set by --config
    std::string write_path;   // set by --write-config
};

// Applies argv on top of `base`. Unknown flags, missing values and invalid
// numbers print a message to stderr and return nullopt.
std::optional<CommandLine> parse_args(int argc, const char* const argv[],
                                      const Config& base = Config());

void print_usage(const char* program_name);

class ConfigManager {
public:
    static std::string get_config_path();

    // Reads a JSON settings file over `base`. Returns nullopt if the file
    // cannot be opened; keys that are absent keep their base value.
    static std::optional<Config> load(const std::string& config_path,
                                      const Config& base = Config());
    static bool save(const std::string& config_path, const Config& config);

private:
    static std::string escape_json_string(const std::string& str);
    static std::string unescape_json_string(const std::string& str);
    static std::optional<std::string> get_json_value(const std::string& json, std::string_view key);
};
