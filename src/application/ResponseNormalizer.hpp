/**
 * @file ResponseNormalizer.hpp
 * @brief Reduces the response shapes of recognition backends to plain text.
 */

#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace smartocr::application {

/**
 * @enum ResponseShape
 * @brief Which branch of the decision table matched a backend response.
 */
enum class ResponseShape {
    PlainString,   ///< "..."
    Content,       ///< {"content": "..."}
    Text,          ///< {"text": "..."}
    ChoiceMessage, ///< {"choices": [{"message": {"content": "..."}}]}
    ChoiceText,    ///< {"choices": [{"text": "..."}]}
    ChoiceUnknown, ///< {"choices": [<anything else>]}, stringified
    Unknown        ///< anything else, stringified
};

/**
 * @struct DecodedResponse
 * @brief Text extracted from a response together with the shape it came from.
 */
struct DecodedResponse {
    ResponseShape shape = ResponseShape::Unknown;
    std::string text;
};

/**
 * @class ResponseNormalizer
 * @brief Decision table over backend response shapes plus code-fence cleanup.
 *
 * Shapes are tried in fixed priority order: plain string, "content", "text",
 * "choices". Unrecognized shapes are serialized and logged instead of failing.
 */
class ResponseNormalizer {
public:
    static DecodedResponse Decode(const nlohmann::json& response);

    /**
     * @brief Strips a ```text / ``` fence wrapping the whole text and surrounding whitespace.
     */
    static std::string StripFences(const std::string& text);

    /** @brief Decode followed by StripFences. */
    static std::string Normalize(const nlohmann::json& response);

    static const char* ShapeToString(ResponseShape shape);
};

} // namespace smartocr::application
