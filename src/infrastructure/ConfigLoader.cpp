/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace scratchpad::infrastructure {

namespace fs = std::filesystem;

namespace {

// Limits must be non-negative integers; get<std::size_t>() would wrap a negative value.
std::size_t ReadLimit(const nlohmann::json& settings, const char* key) {
    const nlohmann::json& value = settings[key];
    if (!value.is_number_unsigned()) {
        throw std::runtime_error(std::string("invalid settings value: ") + key + " must be a non-negative integer");
    }
    return value.get<std::size_t>();
}

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : std::string();
}

} // namespace

fs::path ConfigLoader::DefaultSettingsPath(const fs::path& workspaceRoot) {
    return workspaceRoot / ".scratchpad" / "settings.json";
}

application::ScratchpadConfig ConfigLoader::Load() {
    std::string workspace = GetEnv("WORKSPACE_PATH");
    fs::path root = workspace.empty() ? fs::current_path() : fs::path(workspace);

    std::string configOverride = GetEnv("SCRATCHPAD_CONFIG");
    fs::path settingsPath = configOverride.empty() ? DefaultSettingsPath(root) : fs::path(configOverride);

    application::ScratchpadConfig config = LoadFrom(root, settingsPath);

    std::string globalPath = GetEnv("SCRATCHPAD_GLOBAL_PATH");
    if (!globalPath.empty()) {
        config.globalLocation = fs::path(globalPath);
    }
    return config;
}

application::ScratchpadConfig ConfigLoader::LoadFrom(const fs::path& workspaceRoot, const fs::path& settingsPath) {
    std::error_code ec;
    if (!fs::exists(workspaceRoot, ec)) {
        throw std::runtime_error("Workspace path does not exist: " + workspaceRoot.string());
    }
    if (!fs::is_directory(workspaceRoot, ec)) {
        throw std::runtime_error("Workspace path is not a directory: " + workspaceRoot.string());
    }

    application::ScratchpadConfig config;
    config.root = fs::canonical(workspaceRoot);

    if (!fs::exists(settingsPath, ec)) {
        return config;
    }

    try {
        std::ifstream f(settingsPath);
        nlohmann::json j;
        f >> j;
        Apply(j, config);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Error reading " + settingsPath.string() + ": " + e.what());
    }
    std::cerr << "[ConfigLoader] Loaded settings from " << settingsPath.string() << std::endl;
    return config;
}

void ConfigLoader::Apply(const nlohmann::json& settings, application::ScratchpadConfig& config) {
    if (!settings.is_object()) {
        throw std::runtime_error("settings must be a JSON object");
    }

    try {
        if (settings.contains("allowed_directories")) {
            config.allowedDirs = settings["allowed_directories"].get<std::set<std::string>>();
        }
        if (settings.contains("max_note_length")) {
            config.maxNoteLen = ReadLimit(settings, "max_note_length");
        }
        if (settings.contains("max_task_length")) {
            config.maxTaskLen = ReadLimit(settings, "max_task_length");
        }
        if (settings.contains("max_requests_per_minute")) {
            config.maxRequestsPerWindow = ReadLimit(settings, "max_requests_per_minute");
            config.rateWindow = std::chrono::seconds(60);
        }
        if (settings.contains("default_location")) {
            config.defaultLocation = settings["default_location"].get<std::string>();
        }
        if (settings.contains("search_locations")) {
            config.searchLocations = settings["search_locations"].get<std::vector<std::string>>();
        }
        if (settings.contains("global_location")) {
            config.globalLocation = fs::path(settings["global_location"].get<std::string>());
        }
        if (settings.contains("overwrite_on_create")) {
            config.overwriteOnCreate = settings["overwrite_on_create"].get<bool>();
        }
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error(std::string("invalid settings value: ") + e.what());
    }
}

} // namespace scratchpad::infrastructure
