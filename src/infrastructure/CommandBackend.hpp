#pragma once

#include <string>
#include "domain/RecognitionBackend.hpp"

namespace smartocr::infrastructure {

/**
 * @class CommandBackend
 * @brief Runs an external recognizer (e.g. a local script or `tesseract <img> -`) per page.
 *
 * The staged image path is appended as last argument; stdout becomes the
 * plain-string response.
 */
class CommandBackend : public domain::RecognitionBackend {
public:
    explicit CommandBackend(const std::string& commandLine);
    ~CommandBackend() override = default;

    nlohmann::json respond(const domain::StagedImage& image, const std::string& prompt) override;

    std::string getName() const override { return "CommandBackend"; }

private:
    std::string m_commandLine;
};

} // namespace smartocr::infrastructure
