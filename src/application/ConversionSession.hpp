/**
 * @file ConversionSession.hpp
 * @brief Control-surface facade: loads documents, starts and cancels runs, keeps results.
 */

#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "application/AsyncTaskManager.hpp"
#include "application/BatchPipeline.hpp"
#include "application/CancellationToken.hpp"
#include "application/EventQueue.hpp"
#include "application/PipelineEvents.hpp"
#include "application/RecognitionAdapter.hpp"
#include "domain/Document.hpp"
#include "domain/PageCounter.hpp"
#include "domain/PageRenderer.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace smartocr::application {

/**
 * @struct SessionOptions
 * @brief Tunables of a session, usually taken from AppConfig.
 */
struct SessionOptions {
    int defaultBatchSize = 10;
    std::chrono::seconds renderTimeout{30};
    std::chrono::seconds previewTimeout{15};
    std::string autosavePath; ///< Empty disables autosave.
    bool previewOnLoad = true; ///< Render page 1 as soon as the page count is known.
};

/**
 * @class ConversionSession
 * @brief Owns the Document and the cumulative results; runs all slow work in the background.
 *
 * Commands are issued from the owning (control) thread. Background tasks never
 * touch session state directly: they post SessionEvents, which processEvents()
 * applies on the owning thread before forwarding them to the listener.
 * cancelRun() may be called from any thread.
 */
class ConversionSession {
public:
    enum class StartStatus { Started, Busy, InvalidInput };

    struct StartResult {
        StartStatus status = StartStatus::InvalidInput;
        std::string message;
        bool started() const { return status == StartStatus::Started; }
    };

    using Listener = std::function<void(const SessionEvent&)>;

    ConversionSession(std::shared_ptr<domain::PageCounter> counter,
                      std::shared_ptr<domain::PageRenderer> renderer,
                      std::shared_ptr<RecognitionAdapter> adapter,
                      SessionOptions options = {});
    ~ConversionSession();

    ConversionSession(const ConversionSession&) = delete;
    ConversionSession& operator=(const ConversionSession&) = delete;

    /**
     * @brief Detects type and page count in the background, then previews page 1.
     * @return false when a run or another load is in progress.
     */
    bool loadDocument(const std::string& path);

    /**
     * @brief Starts a run over [fromPage, toPage] (1-based). Both empty means the whole document.
     * A second start while a run is active is rejected, not queued.
     */
    StartResult startRun(std::optional<int> fromPage, std::optional<int> toPage, int batchSize);

    /** @brief Same as startRun, taking the raw text of the operator's from/to fields. */
    StartResult startRun(const std::string& fromField, const std::string& toField, int batchSize);

    /** @brief Requests cancellation of the active run. @return false when nothing is running. */
    bool cancelRun();

    /** @brief Renders a 0-based page for preview in the background. @return false for an invalid index. */
    bool getPage(int index);

    /**
     * @brief Writes the accumulated results to path (UTF-8, overwriting).
     * @param message Receives the outcome description for the operator.
     */
    bool saveResults(const std::string& path, std::string& message);

    /** @brief Applies every queued event without blocking. @return Number of events processed. */
    size_t processEvents();

    /** @brief Waits up to timeout for an event, then drains the queue. @return Number of events processed. */
    size_t waitAndProcessEvents(std::chrono::milliseconds timeout);

    void setListener(Listener listener) { m_listener = std::move(listener); }

    /** @brief Cancels any run and waits for all background work to finish. */
    void shutdown();

    bool isRunning() const { return m_running.load(); }
    bool isLoading() const { return m_loading.load(); }
    const domain::Document& getDocument() const { return m_document; }
    const std::string& getResultsText() const { return m_results; }
    int getCurrentPage() const { return m_currentPage; }
    std::optional<RunFinished> getLastRun() const { return m_lastRun; }

    /**
     * @brief Parses a page field. Blank input is nullopt.
     * @param valid Set to false when the text is not an integer.
     */
    static std::optional<int> ParsePageField(const std::string& text, bool& valid);

private:
    void post(SessionEvent event);
    void apply(const SessionEvent& event);
    void applyBatch(const BatchCommitted& batch);
    void submitPreview(const std::string& path, int index);
    StartResult reject(StartStatus status, const std::string& message);

    std::shared_ptr<domain::PageCounter> m_counter;
    std::shared_ptr<domain::PageRenderer> m_renderer;
    SessionOptions m_options;
    BatchPipeline m_pipeline;

    EventQueue<SessionEvent> m_events;
    Listener m_listener;

    // Owned by the control thread.
    domain::Document m_document;
    std::string m_results;
    int m_currentPage = 0;
    std::optional<RunFinished> m_lastRun;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_loading{false};
    std::mutex m_tokenMutex;
    std::shared_ptr<CancellationToken> m_cancelToken;

    std::unique_ptr<infrastructure::PersistenceService> m_autosave;
    AsyncTaskManager m_tasks; ///< Declared last: joined before the members above are destroyed.
};

} // namespace smartocr::application
