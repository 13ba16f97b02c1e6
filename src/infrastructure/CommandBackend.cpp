#include "infrastructure/CommandBackend.hpp"
#include "infrastructure/ProcessRunner.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace smartocr::infrastructure {

CommandBackend::CommandBackend(const std::string& commandLine)
    : m_commandLine(commandLine)
{}

nlohmann::json CommandBackend::respond(const domain::StagedImage& image, const std::string& prompt) {
    if (m_commandLine.empty()) {
        throw std::runtime_error("No recognition command configured.");
    }

    // SMARTOCR_PROMPT lets scripts that drive a model reuse the instruction.
    std::stringstream cmd;
    cmd << "SMARTOCR_PROMPT=" << ProcessRunner::Quote(prompt) << " "
        << m_commandLine << " " << ProcessRunner::Quote(image.path) << " 2>/dev/null";

    std::cout << "[CommandBackend] Running recognizer on page " << image.image.pageNumber << std::endl;

    auto result = ProcessRunner::RunShell(cmd.str());
    if (!result.succeeded()) {
        throw std::runtime_error("Recognition command failed with code: " + std::to_string(result.exitCode));
    }
    return nlohmann::json(result.output);
}

} // namespace smartocr::infrastructure
