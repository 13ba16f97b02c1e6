/**
 * @file ResponseNormalizer.cpp
 * @brief Implementation of ResponseNormalizer.
 */

#include "application/ResponseNormalizer.hpp"
#include <iostream>

namespace smartocr::application {

using json = nlohmann::json;

namespace {

constexpr const char* kFence = "```";
constexpr const char* kTextFence = "```text";

std::string Trim(const std::string& value) {
    const char* ws = " \t\r\n\f\v";
    const auto start = value.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    const auto end = value.find_last_not_of(ws);
    return value.substr(start, end - start + 1);
}

bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool HasString(const json& obj, const char* key) {
    return obj.is_object() && obj.contains(key) && obj[key].is_string();
}

DecodedResponse DecodeChoice(const json& choice) {
    if (choice.is_object() && choice.contains("message")) {
        const json& message = choice["message"];
        if (HasString(message, "content") && !message["content"].get_ref<const std::string&>().empty()) {
            return {ResponseShape::ChoiceMessage, message["content"].get<std::string>()};
        }
    }
    if (HasString(choice, "text")) {
        return {ResponseShape::ChoiceText, choice["text"].get<std::string>()};
    }
    std::cerr << "[ResponseNormalizer] Unexpected choice structure, using raw value." << std::endl;
    return {ResponseShape::ChoiceUnknown, choice.dump()};
}

} // namespace

DecodedResponse ResponseNormalizer::Decode(const json& response) {
    if (response.is_string()) {
        return {ResponseShape::PlainString, response.get<std::string>()};
    }
    if (HasString(response, "content")) {
        return {ResponseShape::Content, response["content"].get<std::string>()};
    }
    if (HasString(response, "text")) {
        return {ResponseShape::Text, response["text"].get<std::string>()};
    }
    if (response.is_object() && response.contains("choices") &&
        response["choices"].is_array() && !response["choices"].empty()) {
        return DecodeChoice(response["choices"][0]);
    }

    std::cerr << "[ResponseNormalizer] Unknown response shape, using raw value." << std::endl;
    return {ResponseShape::Unknown, response.dump()};
}

std::string ResponseNormalizer::StripFences(const std::string& text) {
    std::string out = Trim(text);
    if (StartsWith(out, kTextFence)) {
        out = Trim(out.substr(std::char_traits<char>::length(kTextFence)));
    }
    if (StartsWith(out, kFence)) {
        out = Trim(out.substr(3));
    }
    if (EndsWith(out, kFence)) {
        out = Trim(out.substr(0, out.size() - 3));
    }
    return out;
}

std::string ResponseNormalizer::Normalize(const json& response) {
    return StripFences(Decode(response).text);
}

const char* ResponseNormalizer::ShapeToString(ResponseShape shape) {
    switch (shape) {
        case ResponseShape::PlainString: return "PlainString";
        case ResponseShape::Content: return "Content";
        case ResponseShape::Text: return "Text";
        case ResponseShape::ChoiceMessage: return "ChoiceMessage";
        case ResponseShape::ChoiceText: return "ChoiceText";
        case ResponseShape::ChoiceUnknown: return "ChoiceUnknown";
        case ResponseShape::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace smartocr::application
