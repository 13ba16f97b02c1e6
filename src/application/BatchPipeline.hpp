/**
 * @file BatchPipeline.hpp
 * @brief Cancellable batch conversion of a page range into recognized text.
 */

#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "application/CancellationToken.hpp"
#include "application/PipelineEvents.hpp"
#include "application/RecognitionAdapter.hpp"
#include "domain/PageRenderer.hpp"

namespace smartocr::application {

/**
 * @struct BatchRange
 * @brief Contiguous, inclusive range of 1-based pages rendered together.
 */
struct BatchRange {
    int firstPage = 0;
    int lastPage = 0;

    int size() const { return lastPage - firstPage + 1; }
    bool operator==(const BatchRange& other) const {
        return firstPage == other.firstPage && lastPage == other.lastPage;
    }
};

/**
 * @struct RunRequest
 * @brief Parameters of one run. Pages are 1-based and inclusive.
 */
struct RunRequest {
    std::string sourcePath;
    int startPage = 1;
    int endPage = 1;
    int batchSize = 10;
    int pageCount = 0; ///< Total pages of the document, used for validation.
};

/**
 * @struct RunOutcome
 * @brief Terminal state of a run and its counters.
 */
struct RunOutcome {
    RunState state = RunState::Idle;
    std::string message;
    int pagesAttempted = 0;
    int batchesCommitted = 0;
};

struct PipelineOptions {
    int defaultBatchSize = 10;
    std::chrono::seconds renderTimeout{30};
};

/**
 * @class BatchPipeline
 * @brief Drives renderer and recognition adapter over a page range, one batch at a time.
 *
 * Cancellation is polled before each batch and before and after every
 * recognition call. A batch's results are posted as one BatchCommitted event,
 * only when no cancellation was observed while it was being processed.
 * Render and per-page recognition failures are folded into the result stream;
 * only faults outside those guarded sections end the run as Failed.
 */
class BatchPipeline {
public:
    using EventSink = std::function<void(SessionEvent)>;
    using ProgressSink = std::function<void(int pagesAttempted, int pagesTotal)>;

    BatchPipeline(std::shared_ptr<domain::PageRenderer> renderer,
                  std::shared_ptr<RecognitionAdapter> adapter,
                  PipelineOptions options = {});

    /**
     * @brief Splits [startPage, endPage] into consecutive batches of at most batchSize pages.
     * A batchSize below 1 is replaced by defaultBatchSize.
     */
    static std::vector<BatchRange> PlanBatches(int startPage, int endPage, int batchSize, int defaultBatchSize = 10);

    /**
     * @brief Checks 1 <= startPage <= endPage <= pageCount.
     * @return nullopt when valid, otherwise a message for the operator.
     */
    static std::optional<std::string> ValidateRange(int startPage, int endPage, int pageCount);

    /** @brief Formats the labeled block of one page: "--- Page N ---\n<text>\n". */
    static std::string FormatPageBlock(int pageNumber, const std::string& text);

    /**
     * @brief Executes one run to completion, cancellation or failure. Blocks the calling thread.
     * @throws std::invalid_argument when the range is invalid (nothing is started).
     * @throws std::logic_error when another run is already active on this pipeline.
     */
    RunOutcome run(const RunRequest& request,
                   const CancellationToken& token,
                   const EventSink& sink,
                   const ProgressSink& progress = nullptr);

    RunState getState() const { return m_state.load(); }
    bool isRunning() const { return m_state.load() == RunState::Running; }

private:
    RunOutcome execute(const RunRequest& request,
                       const CancellationToken& token,
                       const EventSink& sink,
                       const ProgressSink& progress);

    std::shared_ptr<domain::PageRenderer> m_renderer;
    std::shared_ptr<RecognitionAdapter> m_adapter;
    PipelineOptions m_options;
    std::atomic<RunState> m_state{RunState::Idle};
};

} // namespace smartocr::application
