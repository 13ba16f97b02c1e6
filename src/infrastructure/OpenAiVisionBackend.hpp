/**
 * @file OpenAiVisionBackend.hpp
 * @brief HTTP client for OpenAI-compatible vision chat servers (LM Studio, llama.cpp server, vLLM).
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/RecognitionBackend.hpp"

namespace smartocr::infrastructure {

/**
 * @struct OpenAiVisionSettings
 * @brief Connection parameters of the recognition server.
 */
struct OpenAiVisionSettings {
    std::string host = "localhost";
    int port = 1234;
    std::string model = "gemma-3-12b-it-qat";
    std::string chatPath = "/v1/chat/completions";
    std::string modelsPath = "/v1/models";
    std::string apiKey;
    int readTimeoutSeconds = 600;
};

/**
 * @class OpenAiVisionBackend
 * @brief Sends one page image per chat request and returns the decoded JSON body.
 */
class OpenAiVisionBackend : public domain::RecognitionBackend {
public:
    explicit OpenAiVisionBackend(OpenAiVisionSettings settings);

    /** @brief Posts prompt + image as a data URI to the chat endpoint. @throws std::runtime_error */
    nlohmann::json respond(const domain::StagedImage& image, const std::string& prompt) override;

    /** @brief Fetches available models from the models endpoint. */
    std::vector<std::string> getAvailableModels() override;

    std::string getName() const override { return "OpenAiVisionBackend"; }

    /** @brief Builds the chat request body. Exposed for inspection. */
    static nlohmann::json BuildRequest(const std::string& model,
                                       const std::string& prompt,
                                       const std::string& imageDataUri);

private:
    OpenAiVisionSettings m_settings;
};

} // namespace smartocr::infrastructure
