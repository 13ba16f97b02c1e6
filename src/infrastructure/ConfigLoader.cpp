/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace smartocr::infrastructure {

namespace {

template<typename T>
void ReadKey(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key) || j[key].is_null()) return;
    try {
        out = j[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Ignoring invalid value for '" << key << "': " << e.what() << std::endl;
    }
}

} // namespace

std::string ConfigLoader::DefaultConfigPath() {
    return (PathUtils::GetConfigHome() / "SmartOcr" / "settings.json").string();
}

void ConfigLoader::Apply(const nlohmann::json& j, AppConfig& config) {
    if (!j.is_object()) {
        std::cerr << "[ConfigLoader] settings root is not an object, ignoring." << std::endl;
        return;
    }
    ReadKey(j, "backend", config.backend);
    ReadKey(j, "host", config.server.host);
    ReadKey(j, "port", config.server.port);
    ReadKey(j, "model", config.server.model);
    ReadKey(j, "api_path", config.server.chatPath);
    ReadKey(j, "models_path", config.server.modelsPath);
    ReadKey(j, "api_key", config.server.apiKey);
    ReadKey(j, "request_timeout_seconds", config.server.readTimeoutSeconds);
    ReadKey(j, "command", config.command);
    ReadKey(j, "prompt", config.prompt);
    ReadKey(j, "batch_size", config.batchSize);
    ReadKey(j, "render_dpi", config.renderDpi);
    ReadKey(j, "render_timeout_seconds", config.renderTimeoutSeconds);
    ReadKey(j, "info_timeout_seconds", config.infoTimeoutSeconds);
    ReadKey(j, "autosave_path", config.autosavePath);
}

AppConfig ConfigLoader::Load(const std::string& path) {
    AppConfig config;
    if (path.empty() || !std::filesystem::exists(path)) {
        std::cout << "[ConfigLoader] No settings at '" << path << "', using defaults." << std::endl;
        return config;
    }

    try {
        std::ifstream f(path);
        nlohmann::json j;
        f >> j;
        Apply(j, config);
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error reading " << path << ": " << e.what() << std::endl;
    }
    return config;
}

nlohmann::json ConfigLoader::ToJson(const AppConfig& config) {
    return nlohmann::json{
        {"backend", config.backend},
        {"host", config.server.host},
        {"port", config.server.port},
        {"model", config.server.model},
        {"api_path", config.server.chatPath},
        {"models_path", config.server.modelsPath},
        {"request_timeout_seconds", config.server.readTimeoutSeconds},
        {"command", config.command},
        {"prompt", config.prompt},
        {"batch_size", config.batchSize},
        {"render_dpi", config.renderDpi},
        {"render_timeout_seconds", config.renderTimeoutSeconds},
        {"info_timeout_seconds", config.infoTimeoutSeconds},
        {"autosave_path", config.autosavePath}
    };
}

bool ConfigLoader::Save(const std::string& path, const AppConfig& config) {
    try {
        std::filesystem::path configPath(path);
        if (configPath.has_parent_path()) {
            std::filesystem::create_directories(configPath.parent_path());
        }
        std::ofstream f(configPath);
        if (!f.is_open()) {
            std::cerr << "[ConfigLoader] Cannot open " << path << " for writing." << std::endl;
            return false;
        }
        f << ToJson(config).dump(4);
        return !f.fail();
    } catch (const std::exception& e) {
        std::cerr << "[ConfigLoader] Error writing " << path << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace smartocr::infrastructure
