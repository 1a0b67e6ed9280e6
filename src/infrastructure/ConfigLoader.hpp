/**
 * @file ConfigLoader.hpp
 * @brief Static utility building the ScratchpadConfig from settings.json and the environment.
 *
 * Keeps JSON parsing and environment lookups in one place so the service only ever
 * sees an explicit configuration object.
 */

#pragma once

#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "application/ScratchpadConfig.hpp"

namespace scratchpad::infrastructure {

class ConfigLoader {
public:
    /**
     * @brief Resolves the workspace (WORKSPACE_PATH, else the current directory), reads the
     *        optional settings file and applies SCRATCHPAD_GLOBAL_PATH.
     * @throws std::runtime_error if the workspace is not an existing directory or the
     *         settings file exists but cannot be parsed.
     */
    static application::ScratchpadConfig Load();

    /**
     * @brief Builds a config for @p workspaceRoot, overlaying @p settingsPath when it exists.
     */
    static application::ScratchpadConfig LoadFrom(const std::filesystem::path& workspaceRoot,
                                                  const std::filesystem::path& settingsPath);

    /**
     * @brief Applies recognized keys from @p settings onto @p config. Unknown keys are ignored.
     * @throws std::runtime_error on a key with the wrong JSON type.
     */
    static void Apply(const nlohmann::json& settings, application::ScratchpadConfig& config);

    /** @brief Default settings location: <root>/.scratchpad/settings.json. */
    static std::filesystem::path DefaultSettingsPath(const std::filesystem::path& workspaceRoot);
};

} // namespace scratchpad::infrastructure
