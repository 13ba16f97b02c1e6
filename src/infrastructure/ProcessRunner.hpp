/**
 * @file ProcessRunner.hpp
 * @brief Runs external command-line tools and captures their output.
 */

#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace smartocr::infrastructure {

/**
 * @struct ProcessResult
 * @brief Exit status and standard output of a finished command.
 */
struct ProcessResult {
    int exitCode = -1;
    std::string output;

    bool succeeded() const { return exitCode == 0; }
    /** @brief coreutils `timeout` exits with 124 when the limit was hit. */
    bool timedOut() const { return exitCode == 124; }
};

/**
 * @class ProcessRunner
 * @brief Thin wrapper over /bin/sh for the document tooling (Poppler, LibreOffice, ImageMagick).
 */
class ProcessRunner {
public:
    /**
     * @brief Runs a program with arguments through the shell, every argument quoted.
     * @param timeout Zero for no limit, otherwise enforced with `timeout`.
     * @param mergeStderr Capture stderr along with stdout.
     */
    static ProcessResult Run(const std::string& program,
                             const std::vector<std::string>& args,
                             std::chrono::seconds timeout = std::chrono::seconds(0),
                             bool mergeStderr = false);

    /**
     * @brief Runs a raw shell command line as given, in its own process group.
     * Signals sent to the terminal's foreground group do not reach the command.
     */
    static ProcessResult RunShell(const std::string& commandLine);

    /** @brief True when the program can be found on PATH. */
    static bool IsAvailable(const std::string& program);

    /** @brief Single-quotes a value for /bin/sh. */
    static std::string Quote(const std::string& value);
};

} // namespace smartocr::infrastructure
