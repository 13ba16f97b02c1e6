/**
 * @file ScopedTempFile.hpp
 * @brief RAII owners for transient files and directories.
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace smartocr::infrastructure {

/**
 * @class ScopedTempFile
 * @brief Creates a uniquely named file in the system temp directory and removes it on destruction.
 */
class ScopedTempFile {
public:
    /**
     * @param suffix File suffix including the dot (e.g. ".png").
     * @throws std::runtime_error if the file cannot be created.
     */
    explicit ScopedTempFile(const std::string& suffix);
    ~ScopedTempFile();

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    /** @brief Replaces the file content. @throws std::runtime_error on write failure. */
    void write(const std::vector<std::uint8_t>& bytes);

    const std::filesystem::path& getPath() const { return m_path; }

private:
    std::filesystem::path m_path;
};

/**
 * @class ScopedTempDirectory
 * @brief Creates a unique scratch directory and removes it recursively on destruction.
 */
class ScopedTempDirectory {
public:
    /** @throws std::runtime_error if the directory cannot be created. */
    explicit ScopedTempDirectory(const std::string& prefix = "smartocr");
    ~ScopedTempDirectory();

    ScopedTempDirectory(const ScopedTempDirectory&) = delete;
    ScopedTempDirectory& operator=(const ScopedTempDirectory&) = delete;

    const std::filesystem::path& getPath() const { return m_path; }

private:
    std::filesystem::path m_path;
};

/** @brief Reads a whole file as bytes. @throws std::runtime_error when it cannot be opened. */
std::vector<std::uint8_t> ReadFileBytes(const std::filesystem::path& path);

} // namespace smartocr::infrastructure
