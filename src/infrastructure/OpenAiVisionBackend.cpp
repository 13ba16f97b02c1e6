#include "infrastructure/OpenAiVisionBackend.hpp"
#include "infrastructure/Base64.hpp"
#include "infrastructure/ScopedTempFile.hpp"
#include <httplib.h>
#include <iostream>
#include <stdexcept>

namespace smartocr::infrastructure {

using json = nlohmann::json;

namespace {
constexpr double kDeterministicTemperature = 0.0;

std::string MimeTypeFor(const std::string& format) {
    if (format == "jpg" || format == "jpeg") return "image/jpeg";
    if (format == "tif" || format == "tiff") return "image/tiff";
    return "image/png";
}
}

OpenAiVisionBackend::OpenAiVisionBackend(OpenAiVisionSettings settings)
    : m_settings(std::move(settings)) {}

json OpenAiVisionBackend::BuildRequest(const std::string& model,
                                       const std::string& prompt,
                                       const std::string& imageDataUri) {
    json content = json::array();
    content.push_back({{"type", "text"}, {"text", prompt}});
    content.push_back({{"type", "image_url"}, {"image_url", {{"url", imageDataUri}}}});

    return json{
        {"model", model},
        {"messages", json::array({json{{"role", "user"}, {"content", content}}})},
        {"temperature", kDeterministicTemperature},
        {"stream", false}
    };
}

json OpenAiVisionBackend::respond(const domain::StagedImage& image, const std::string& prompt) {
    // The staged file is the source of truth; the in-memory copy is only a fallback.
    std::vector<std::uint8_t> bytes = image.path.empty() ? image.image.bytes : ReadFileBytes(image.path);
    const std::string dataUri = "data:" + MimeTypeFor(image.image.format) + ";base64," + Base64Encode(bytes);

    httplib::Client cli(m_settings.host, m_settings.port);
    cli.set_read_timeout(m_settings.readTimeoutSeconds);
    cli.set_write_timeout(60);

    httplib::Headers headers;
    if (!m_settings.apiKey.empty()) {
        headers.emplace("Authorization", "Bearer " + m_settings.apiKey);
    }

    json requestData = BuildRequest(m_settings.model, prompt, dataUri);
    auto res = cli.Post(m_settings.chatPath, headers, requestData.dump(), "application/json");
    if (!res) {
        throw std::runtime_error("Connection to " + m_settings.host + ":" + std::to_string(m_settings.port) +
                                 " failed (httplib error " + std::to_string(static_cast<int>(res.error())) + ")");
    }
    if (res->status != 200) {
        throw std::runtime_error("HTTP Error " + std::to_string(res->status) + ": " + res->body);
    }

    try {
        return json::parse(res->body);
    } catch (const json::parse_error& e) {
        std::cerr << "[OpenAiVisionBackend] Response is not JSON (" << e.what() << "), using raw body." << std::endl;
        return json(res->body);
    }
}

std::vector<std::string> OpenAiVisionBackend::getAvailableModels() {
    httplib::Client cli(m_settings.host, m_settings.port);
    cli.set_read_timeout(5);

    httplib::Headers headers;
    if (!m_settings.apiKey.empty()) {
        headers.emplace("Authorization", "Bearer " + m_settings.apiKey);
    }

    std::vector<std::string> models;
    auto res = cli.Get(m_settings.modelsPath, headers);
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (body.contains("data") && body["data"].is_array()) {
                for (const auto& item : body["data"]) {
                    if (item.contains("id") && item["id"].is_string()) {
                        models.push_back(item["id"].get<std::string>());
                    }
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[OpenAiVisionBackend] Error parsing models: " << e.what() << std::endl;
        }
    } else if (res) {
        std::cerr << "[OpenAiVisionBackend] HTTP Error " << res->status << " listing models." << std::endl;
    } else {
        std::cerr << "[OpenAiVisionBackend] Failed to list models. Is the server running?" << std::endl;
    }
    return models;
}

} // namespace smartocr::infrastructure
