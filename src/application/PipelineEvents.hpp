/**
 * @file PipelineEvents.hpp
 * @brief Events posted from background work to the control thread.
 */

#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "domain/Document.hpp"
#include "domain/RasterImage.hpp"

namespace smartocr::application {

/**
 * @enum RunState
 * @brief Lifecycle of one pipeline run.
 */
enum class RunState {
    Idle,
    Running,
    Completed,
    CompletedWithErrors,
    Cancelled,
    Failed
};

inline const char* RunStateToString(RunState state) {
    switch (state) {
        case RunState::Idle: return "Idle";
        case RunState::Running: return "Running";
        case RunState::Completed: return "Completed";
        case RunState::CompletedWithErrors: return "CompletedWithErrors";
        case RunState::Cancelled: return "Cancelled";
        case RunState::Failed: return "Failed";
    }
    return "Idle";
}

/**
 * @enum ErrorKind
 * @brief Error taxonomy surfaced to the control surface.
 */
enum class ErrorKind {
    InputValidation,
    Tooling,
    Load,
    BatchRender,
    Save,
    Internal
};

inline const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InputValidation: return "InputValidation";
        case ErrorKind::Tooling: return "Tooling";
        case ErrorKind::Load: return "Load";
        case ErrorKind::BatchRender: return "BatchRender";
        case ErrorKind::Save: return "Save";
        case ErrorKind::Internal: return "Internal";
    }
    return "Internal";
}

/**
 * @struct PageBlock
 * @brief Result for one page of a committed batch.
 */
struct PageBlock {
    int pageNumber = 0;  ///< 1-based, as shown to the operator.
    int pageIndex = 0;   ///< 0-based, as stored in the Document.
    std::string text;    ///< Normalized text, or the error annotation when failed.
    bool failed = false;
};

struct PageCountKnown {
    static constexpr const char* Type = "PageCountKnown";
    std::string path;
    std::string typeTag;
    int pageCount = 0;
    std::shared_ptr<domain::Document> document; ///< Detection result; the session adopts its format, path and page count.
};

struct PreviewReady {
    static constexpr const char* Type = "PreviewReady";
    int pageIndex = 0; ///< 0-based.
    domain::RasterImage image;
};

struct StatusChanged {
    static constexpr const char* Type = "StatusChanged";
    std::string message;
};

struct BatchCommitted {
    static constexpr const char* Type = "BatchCommitted";
    int firstPage = 0;
    int lastPage = 0;
    std::vector<PageBlock> blocks;
    std::string text;          ///< Labeled page blocks joined for display and export.
    bool hadErrors = false;
    bool renderFailed = false; ///< The batch could not be rendered; text is the error placeholder.
};

struct RunFinished {
    static constexpr const char* Type = "RunFinished";
    RunState state = RunState::Idle;
    std::string message;
    int pagesAttempted = 0;
    int batchesCommitted = 0;
};

struct ErrorRaised {
    static constexpr const char* Type = "ErrorRaised";
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

using SessionEvent = std::variant<
    PageCountKnown,
    PreviewReady,
    StatusChanged,
    BatchCommitted,
    RunFinished,
    ErrorRaised
>;

} // namespace smartocr::application
