#include "settings.hpp"
#include "verbose.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <filesystem>
#include <stdexcept>

namespace memomark {

using json = nlohmann::json;

std::optional<Settings> load_settings(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        json j;
        file >> j;
        if (!j.is_object()) {
            verbose_err("Settings", path + " is not a JSON object");
            return std::nullopt;
        }

        Settings settings;
        settings.images_dir = j.value("images_dir", settings.images_dir);
        settings.colors = j.value("colors", settings.colors);
        settings.watch_debounce_ms = j.value("watch_debounce_ms", settings.watch_debounce_ms);
        settings.server_address = j.value("server_address", settings.server_address);
        settings.server_port = j.value("server_port", settings.server_port);

        verbose_log("Settings", "Loaded " + path);
        return settings;
    } catch (const json::exception& e) {
        verbose_err("Settings", path + ": " + e.what());
        return std::nullopt;
    }
}

void save_settings(const Settings& settings, const std::string& path) {
    json j;
    j["images_dir"] = settings.images_dir;
    j["colors"] = settings.colors;
    j["watch_debounce_ms"] = settings.watch_debounce_ms;
    j["server_address"] = settings.server_address;
    j["server_port"] = settings.server_port;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write settings to " + path);
    }
    file << j.dump(2) << std::endl;
}

} // namespace memomark
