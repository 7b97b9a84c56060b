#include "settings.hpp"
#include "verbose.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace mdstream {

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

        Settings settings;
        settings.style = j.value("style", settings.style);
        settings.width = j.value("width", settings.width);
        settings.partial_preview = j.value("partial_preview", settings.partial_preview);
        settings.chunk_size = j.value("chunk_size", settings.chunk_size);
        settings.chunk_delay_ms = j.value("chunk_delay_ms", settings.chunk_delay_ms);
        return settings;
    } catch (const json::exception& e) {
        verbose_err("settings", path + ": " + e.what());
        return std::nullopt;
    }
}

void save_settings(const Settings& settings, const std::string& path) {
    json j;
    j["style"] = settings.style;
    j["width"] = settings.width;
    j["partial_preview"] = settings.partial_preview;
    j["chunk_size"] = settings.chunk_size;
    j["chunk_delay_ms"] = settings.chunk_delay_ms;

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write settings file: " + path);
    }
    file << j.dump(2) << std::endl;
}

} // namespace mdstream
