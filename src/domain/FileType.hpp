/**
 * @file FileType.hpp
 * @brief Source document formats recognized by the detector.
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <string>

namespace smartocr::domain {

/**
 * @enum FileType
 * @brief Classified format of a source document.
 */
enum class FileType {
    PDF,
    PPTX,
    TIFF,
    DOCX,
    ODT,
    RTF,
    Unknown
};

inline std::string FileTypeToString(FileType type) {
    switch (type) {
        case FileType::PDF: return "PDF";
        case FileType::PPTX: return "PPTX";
        case FileType::TIFF: return "TIFF";
        case FileType::DOCX: return "DOCX";
        case FileType::ODT: return "ODT";
        case FileType::RTF: return "RTF";
        case FileType::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

/**
 * @brief Maps a file extension (with or without the leading dot, any case) to a FileType.
 */
inline FileType FileTypeFromExtension(std::string ext) {
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);

    if (ext == "pdf") return FileType::PDF;
    if (ext == "pptx") return FileType::PPTX;
    if (ext == "tif" || ext == "tiff") return FileType::TIFF;
    if (ext == "docx") return FileType::DOCX;
    if (ext == "odt") return FileType::ODT;
    if (ext == "rtf") return FileType::RTF;
    return FileType::Unknown;
}

/** @brief Flow formats have no native page count and must be converted to PDF first. */
inline bool IsFlowDocument(FileType type) {
    return type == FileType::DOCX || type == FileType::ODT || type == FileType::RTF;
}

} // namespace smartocr::domain
