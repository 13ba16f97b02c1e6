/**
 * @file ExtractedObject.hpp
 * @brief Domain entity for a piece of content recognized on a document page.
 */

#pragma once
#include <array>
#include <optional>
#include <string>

namespace smartocr::domain {

/**
 * @enum ObjectKind
 * @brief Kind of payload held by an ExtractedObject.
 */
enum class ObjectKind {
    Text,
    Image,
    Table
};

/** @brief Bounding region as (left, top, right, bottom). */
using Coordinates = std::array<int, 4>;

class Document;

/**
 * @class ExtractedObject
 * @brief Immutable object owned by a Document. Only Document::addObject creates instances.
 */
class ExtractedObject {
public:
    int getIndex() const { return m_index; }
    const std::optional<int>& getPage() const { return m_page; }
    ObjectKind getKind() const { return m_kind; }
    const std::string& getContent() const { return m_content; }
    const std::optional<Coordinates>& getCoordinates() const { return m_coordinates; }

private:
    friend class Document;

    ExtractedObject(int index,
                    std::optional<int> page,
                    ObjectKind kind,
                    std::string content,
                    std::optional<Coordinates> coordinates)
        : m_index(index),
          m_page(page),
          m_kind(kind),
          m_content(std::move(content)),
          m_coordinates(coordinates) {}

    int m_index;                              ///< Unique, never reused.
    std::optional<int> m_page;                ///< 0-based owning page, unset for page-agnostic content.
    ObjectKind m_kind;
    std::string m_content;
    std::optional<Coordinates> m_coordinates; ///< Absent for plain text.
};

} // namespace smartocr::domain
