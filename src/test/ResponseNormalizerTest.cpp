#include <cassert>
#include <iostream>
#include "application/ResponseNormalizer.hpp"

using smartocr::application::ResponseNormalizer;
using smartocr::application::ResponseShape;
using json = nlohmann::json;

void testDecisionTable() {
    std::cout << "[Test] Decision table..." << std::endl;

    auto plain = ResponseNormalizer::Decode(json("Hello"));
    assert(plain.shape == ResponseShape::PlainString);
    assert(plain.text == "Hello");

    auto content = ResponseNormalizer::Decode(json{{"content", "From content"}, {"text", "ignored"}});
    assert(content.shape == ResponseShape::Content);
    assert(content.text == "From content");

    auto text = ResponseNormalizer::Decode(json{{"text", "From text"}});
    assert(text.shape == ResponseShape::Text);
    assert(text.text == "From text");

    json chat = json::parse(R"({"choices":[{"message":{"content":"Hello"}}]})");
    auto choiceMessage = ResponseNormalizer::Decode(chat);
    assert(choiceMessage.shape == ResponseShape::ChoiceMessage);
    assert(choiceMessage.text == "Hello");

    json completion = json::parse(R"({"choices":[{"text":"Legacy"}]})");
    auto choiceText = ResponseNormalizer::Decode(completion);
    assert(choiceText.shape == ResponseShape::ChoiceText);
    assert(choiceText.text == "Legacy");

    // Empty message content falls through to the choice's text.
    json emptyMessage = json::parse(R"({"choices":[{"message":{"content":""},"text":"Fallback"}]})");
    assert(ResponseNormalizer::Decode(emptyMessage).shape == ResponseShape::ChoiceText);

    json odd = json::parse(R"({"choices":[{"delta":{"content":"x"}}]})");
    auto choiceUnknown = ResponseNormalizer::Decode(odd);
    assert(choiceUnknown.shape == ResponseShape::ChoiceUnknown);
    assert(choiceUnknown.text.find("delta") != std::string::npos);

    auto unknown = ResponseNormalizer::Decode(json{{"result", 42}});
    assert(unknown.shape == ResponseShape::Unknown);
    assert(unknown.text == R"({"result":42})");

    // An empty choices array is not a choices response.
    assert(ResponseNormalizer::Decode(json::parse(R"({"choices":[]})")).shape == ResponseShape::Unknown);
    // A non-string content key is skipped.
    assert(ResponseNormalizer::Decode(json{{"content", 5}, {"text", "t"}}).shape == ResponseShape::Text);

    std::cout << "[PASS] Decision table" << std::endl;
}

void testStripFences() {
    std::cout << "[Test] Strip fences..." << std::endl;
    assert(ResponseNormalizer::StripFences("```text\nHello\n```") == "Hello");
    assert(ResponseNormalizer::StripFences("  ```\nLine 1\nLine 2\n```  ") == "Line 1\nLine 2");
    assert(ResponseNormalizer::StripFences("\n\nPlain text\n") == "Plain text");
    assert(ResponseNormalizer::StripFences("Ends with fence```") == "Ends with fence");
    assert(ResponseNormalizer::StripFences("```") == "");
    assert(ResponseNormalizer::StripFences("") == "");
    // Inner fences are content.
    assert(ResponseNormalizer::StripFences("a ``` b") == "a ``` b");
    std::cout << "[PASS] Strip fences" << std::endl;
}

void testNormalize() {
    std::cout << "[Test] Normalize..." << std::endl;
    json fenced = json::parse(R"({"choices":[{"message":{"content":"```text\n  Title\n\nBody\n```\n"}}]})");
    assert(ResponseNormalizer::Normalize(fenced) == "Title\n\nBody");
    assert(ResponseNormalizer::Normalize(json("  spaced  ")) == "spaced");
    std::cout << "[PASS] Normalize" << std::endl;
}

int main() {
    testDecisionTable();
    testStripFences();
    testNormalize();
    std::cout << "[Test] All ResponseNormalizer tests passed." << std::endl;
    return 0;
}
