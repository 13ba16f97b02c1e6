/**
 * @file SmartOcrApp.hpp
 * @brief Command-line shell for SmartOcr.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/ConversionSession.hpp"
#include "infrastructure/ConfigLoader.hpp"

namespace smartocr::domain {
class RecognitionBackend;
}

namespace smartocr::application {
class ConversionSession;
}

namespace smartocr::app {

/**
 * @struct CommandLine
 * @brief Parsed arguments.
 */
struct CommandLine {
    std::string command;                 ///< info | preview | convert | models | init-config
    std::vector<std::string> positional;
    std::string configPath;
    std::string fromPage;
    std::string toPage;
    std::optional<int> batchSize;
    std::string outputPath;
};

/**
 * @class SmartOcrApp
 * @brief Composition root and control loop. Owns the session and pumps its events on the main thread.
 */
class SmartOcrApp {
public:
    /**
     * @brief Runs one command.
     * @return Exit code: 0 success, 1 error, 2 completed with page errors, 130 cancelled.
     */
    int Run(int argc, char** argv);

    /** @brief Parses argv. @return nullopt (after printing usage) on malformed input. */
    static std::optional<CommandLine> ParseArguments(int argc, char** argv);

private:
    bool Init(const CommandLine& cli);
    void Shutdown();

    int RunInfo(const CommandLine& cli);
    int RunPreview(const CommandLine& cli);
    int RunConvert(const CommandLine& cli);
    int RunModels();
    int RunInitConfig(const CommandLine& cli);

    /** @brief Loads the file and pumps events until the page count is known. @return false on load error. */
    bool LoadAndWait(const std::string& path);

    infrastructure::AppConfig m_config;
    std::shared_ptr<domain::RecognitionBackend> m_backend;
    std::unique_ptr<application::ConversionSession> m_session;
};

} // namespace smartocr::app
