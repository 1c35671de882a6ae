// config.cpp - settings file and command line
#include "config.hpp"
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

static bool parse_positive_int(const std::string& text, int& out) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long value = strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0' || value <= 0 || value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTION]...\n";
    std::cout << "Mirror a physical gamepad onto a virtual device that survives unplug/replug.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --device-link PATH       Physical device discovery path\n";
    std::cout << "  --event-path PATH        Stable symlink to the virtual event node\n";
    std::cout << "  --js-path PATH           Stable symlink to the virtual joystick node\n";
    std::cout << "  --virtual-name NAME      Display name of the virtual device\n";
    std::cout << "  --poll-interval-ms MS    Delay between discovery attempts (default 1000)\n";
    std::cout << "  --no-grab                Do not take exclusive access to the physical device\n";
    std::cout << "  --verbose                Log every forwarded event\n";
    std::cout << "  --unlink-on-exit         Remove the stable symlinks on shutdown\n";
    std::cout << "  --config PATH            Settings file (default $PADMIRROR_CONFIG or\n";
    std::cout << "                           ~/.config/padmirror/config.json)\n";
    std::cout << "  --write-config PATH      Write the effective settings to PATH and exit\n";
    std::cout << "  --diagnostics            Report device detection and link state, then exit\n";
    std::cout << "  --help                   Show this help message\n";
}

std::optional<CommandLine> parse_args(int argc, const char* const argv[], const Config& base) {
    CommandLine cli;
    cli.config = base;

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];

        auto take_value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Option " << arg << " requires a value\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            cli.mode = RunMode::Help;
        } else if (arg == "--device-link") {
            if (!take_value(cli.config.device_link)) return std::nullopt;
        } else if (arg == "--event-path") {
            if (!take_value(cli.config.event_path)) return std::nullopt;
        } else if (arg == "--js-path") {
            if (!take_value(cli.config.js_path)) return std::nullopt;
        } else if (arg == "--virtual-name") {
            if (!take_value(cli.config.virtual_name)) return std::nullopt;
        } else if (arg == "--poll-interval-ms") {
            std::string value;
            if (!take_value(value)) return std::nullopt;
            if (!parse_positive_int(value, cli.config.poll_interval_ms)) {
                std::cerr << "Invalid poll interval: " << value << "\n";
                return std::nullopt;
            }
        } else if (arg == "--no-grab") {
            cli.config.grab = false;
        } else if (arg == "--verbose") {
            cli.config.verbose = true;
        } else if (arg == "--unlink-on-exit") {
            cli.config.unlink_on_exit = true;
        } else if (arg == "--config") {
            if (!take_value(cli.config_path)) return std::nullopt;
        } else if (arg == "--write-config") {
            if (!take_value(cli.write_path)) return std::nullopt;
            cli.mode = RunMode::WriteConfig;
        } else if (arg == "--diagnostics") {
            cli.mode = RunMode::Diagnostics;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }

    return cli;
}

// Get config path from environment or use default
std::string ConfigManager::get_config_path() {
    const char* env_path = getenv("PADMIRROR_CONFIG");
    if (env_path && *env_path) {
        return std::string(env_path);
    }

    const char* home = getenv("HOME");
    if (!home) {
        return "/etc/padmirror/config.json";
    }

    return std::string(home) + "/.config/padmirror/config.json";
}

std::optional<Config> ConfigManager::load(const std::string& config_path, const Config& base) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string json = buffer.str();

    Config config = base;

    // Settings may sit at the root or inside a "settings" object
    std::string settings = get_json_value(json, "settings").value_or(json);

    if (auto value = get_json_value(settings, "device_link")) config.device_link = unescape_json_string(*value);
    if (auto value = get_json_value(settings, "event_path")) config.event_path = unescape_json_string(*value);
    if (auto value = get_json_value(settings, "js_path")) config.js_path = unescape_json_string(*value);
    if (auto value = get_json_value(settings, "virtual_name")) config.virtual_name = unescape_json_string(*value);

    if (auto value = get_json_value(settings, "poll_interval_ms")) {
        if (!parse_positive_int(*value, config.poll_interval_ms)) {
            std::cerr << "WARNING: ignoring invalid poll_interval_ms '" << *value
                      << "' in " << config_path << "\n";
        }
    }

    if (auto value = get_json_value(settings, "grab")) config.grab = (*value == "true");
    if (auto value = get_json_value(settings, "verbose")) config.verbose = (*value == "true");
    if (auto value = get_json_value(settings, "unlink_on_exit")) config.unlink_on_exit = (*value == "true");

    return config;
}

bool ConfigManager::save(const std::string& config_path, const Config& config) {
    std::filesystem::path path(config_path);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            std::cerr << "Cannot create " << path.parent_path().string() << ": " << ec.message() << "\n";
            return false;
        }
    }

    std::ofstream file(config_path);
    if (!file.is_open()) {
        return false;
    }

    file << "{\n";
    file << "  \"settings\": {\n";
    file << "    \"device_link\": \"" << escape_json_string(config.device_link) << "\",\n";
    file << "    \"event_path\": \"" << escape_json_string(config.event_path) << "\",\n";
    file << "    \"js_path\": \"" << escape_json_string(config.js_path) << "\",\n";
    file << "    \"virtual_name\": \"" << escape_json_string(config.virtual_name) << "\",\n";
    file << "    \"poll_interval_ms\": " << config.poll_interval_ms << ",\n";
    file << "    \"grab\": " << (config.grab ? "true" : "false") << ",\n";
    file << "    \"verbose\": " << (config.verbose ? "true" : "false") << ",\n";
    file << "    \"unlink_on_exit\": " << (config.unlink_on_exit ? "true" : "false") << "\n";
    file << "  }\n";
    file << "}\n";

    return file.good();
}

std::string ConfigManager::escape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 10);

    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default: result += c; break;
        }
    }

    return result;
}

std::string ConfigManager::unescape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '\\' && i + 1 < str.size()) {
            switch (str[i + 1]) {
                case '"': result += '"'; ++i; break;
                case '\\': result += '\\'; ++i; break;
                case '/': result += '/'; ++i; break;
                case 'n': result += '\n'; ++i; break;
                case 'r': result += '\r'; ++i; break;
                case 't': result += '\t'; ++i; break;
                default: result += str[i]; break;
            }
        } else {
            result += str[i];
        }
    }

    return result;
}

std::optional<std::string> ConfigManager::get_json_value(const std::string& json, std::string_view key) {
    std::string search_key = "\"";
    search_key += key;
    search_key += "\"";

    // Only a quoted key followed by a colon counts, not the same text used as a value
    size_t colon_pos = std::string::npos;
    for (size_t key_pos = json.find(search_key); key_pos != std::string::npos;
         key_pos = json.find(search_key, key_pos + 1)) {
        size_t next = json.find_first_not_of(" \t\r\n", key_pos + search_key.size());
        if (next != std::string::npos && json[next] == ':') {
            colon_pos = next;
            break;
        }
    }
    if (colon_pos == std::string::npos) {
        return std::nullopt;
    }

    size_t value_start = json.find_first_not_of(" \t\r\n", colon_pos + 1);
    if (value_start == std::string::npos) {
        return std::nullopt;
    }

    // Objects are returned whole, braces included
    if (json[value_start] == '{') {
        int depth = 0;
        bool in_string = false;
        bool escape = false;

        for (size_t i = value_start; i < json.size(); ++i) {
            const char c = json[i];

            if (in_string) {
                if (escape) { escape = false; continue; }
                if (c == '\\') { escape = true; continue; }
                if (c == '"') in_string = false;
                continue;
            }

            if (c == '"') { in_string = true; continue; }
            if (c == '{') { depth++; continue; }
            if (c == '}') {
                depth--;
                if (depth == 0) {
                    return json.substr(value_start, (i - value_start) + 1);
                }
            }
        }
        return std::nullopt;
    }

    if (json[value_start] == '"') {
        bool escape = false;
        for (size_t i = value_start + 1; i < json.size(); ++i) {
            if (escape) { escape = false; continue; }
            if (json[i] == '\\') { escape = true; continue; }
            if (json[i] == '"') {
                return json.substr(value_start + 1, i - (value_start + 1));
            }
        }
        return std::nullopt;
    }

    size_t value_end = json.find_first_of(",}\n", value_start);
    if (value_end == std::string::npos) {
        value_end = json.size();
    }

    std::string value = json.substr(value_start, value_end - value_start);
    value.erase(0, value.find_first_not_of(" \t\r\n"));
    value.erase(value.find_last_not_of(" \t\r\n") + 1);
    return value;
}
