/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading application configuration (settings.json).
 *
 * Provides a unified way to access backend, rendering and batching settings
 * without scattering JSON parsing logic throughout the codebase.
 */

#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "infrastructure/OpenAiVisionBackend.hpp"

namespace smartocr::infrastructure {

/**
 * @struct AppConfig
 * @brief Effective settings. Every field has a usable default.
 */
struct AppConfig {
    std::string backend = "openai";  ///< "openai" or "command".
    OpenAiVisionSettings server;
    std::string command;             ///< Recognizer command line for the "command" backend.
    std::string prompt;              ///< Empty means the built-in transcription prompt.
    int batchSize = 10;
    int renderDpi = 150;
    int renderTimeoutSeconds = 30;
    int infoTimeoutSeconds = 15;
    std::string autosavePath;        ///< When set, results are rewritten there after each committed batch.
};

class ConfigLoader {
public:
    /** @brief $XDG_CONFIG_HOME/SmartOcr/settings.json (or ~/.config/...). */
    static std::string DefaultConfigPath();

    /**
     * @brief Reads settings from a file. Missing keys keep their defaults.
     * A missing or unreadable file yields the defaults and a logged message.
     */
    static AppConfig Load(const std::string& path);

    /** @brief Applies the keys present in j on top of config. */
    static void Apply(const nlohmann::json& j, AppConfig& config);

    /** @brief Serializes config, e.g. to write a starter settings.json. */
    static nlohmann::json ToJson(const AppConfig& config);

    /** @brief Writes settings.json, creating the parent directory. @return false on failure. */
    static bool Save(const std::string& path, const AppConfig& config);
};

} // namespace smartocr::infrastructure
