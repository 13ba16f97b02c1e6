/**
 * @file ConversionSession.cpp
 * @brief Implementation of ConversionSession.
 */

#include "application/ConversionSession.hpp"
#include <iostream>
#include <sstream>
#include <type_traits>

namespace smartocr::application {

namespace {

std::string Trim(const std::string& value) {
    const char* ws = " \t\r\n";
    const auto start = value.find_first_not_of(ws);
    if (start == std::string::npos) return "";
    const auto end = value.find_last_not_of(ws);
    return value.substr(start, end - start + 1);
}

bool IsBlank(const std::string& value) {
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

ConversionSession::ConversionSession(std::shared_ptr<domain::PageCounter> counter,
                                     std::shared_ptr<domain::PageRenderer> renderer,
                                     std::shared_ptr<RecognitionAdapter> adapter,
                                     SessionOptions options)
    : m_counter(std::move(counter)),
      m_renderer(renderer),
      m_options(options),
      m_pipeline(std::move(renderer), std::move(adapter),
                 PipelineOptions{options.defaultBatchSize, options.renderTimeout}) {
    if (!m_options.autosavePath.empty()) {
        m_autosave = std::make_unique<infrastructure::PersistenceService>();
    }
}

ConversionSession::~ConversionSession() {
    shutdown();
}

void ConversionSession::shutdown() {
    if (m_running.load()) {
        std::cout << "[ConversionSession] Run still active, requesting cancellation before shutdown." << std::endl;
        cancelRun();
    }
    m_tasks.WaitAll();
    if (m_autosave) {
        m_autosave->stop();
    }
}

void ConversionSession::post(SessionEvent event) {
    m_events.push(std::move(event));
}

bool ConversionSession::loadDocument(const std::string& path) {
    if (m_running.load()) {
        std::cerr << "[ConversionSession] An OCR conversion is in progress, load rejected." << std::endl;
        post(ErrorRaised{ErrorKind::InputValidation, "An OCR conversion is currently in progress. Please wait."});
        return false;
    }
    bool expected = false;
    if (!m_loading.compare_exchange_strong(expected, true)) {
        post(ErrorRaised{ErrorKind::InputValidation, "A document is already being loaded."});
        return false;
    }

    std::cout << "[ConversionSession] Loading " << path << std::endl;
    m_results.clear();
    m_document.clear();
    m_currentPage = 0;
    post(StatusChanged{"Loading Document Info..."});

    auto counter = m_counter;
    m_tasks.SubmitTask(TaskType::DocumentInfo, "Detect " + path,
        [this, counter, path](std::shared_ptr<TaskStatus>) {
            auto document = std::make_shared<domain::Document>();
            try {
                document->detectType(path, *counter);
            } catch (const domain::ToolingUnavailableError& e) {
                m_loading = false;
                post(ErrorRaised{ErrorKind::Tooling, e.what()});
                post(StatusChanged{"Error loading document info."});
                return;
            } catch (const std::exception& e) {
                m_loading = false;
                post(ErrorRaised{ErrorKind::Load, std::string("Could not retrieve document info: ") + e.what()});
                post(StatusChanged{"Error loading document info."});
                return;
            }

            const int pages = document->getPageCount();
            const std::string typeTag = document->getTypeTag();
            // m_loading is cleared when the event is applied, so no run can start on the old document.
            post(PageCountKnown{path, typeTag, pages, std::move(document)});
            if (pages <= 0) {
                post(StatusChanged{"Document loaded, but reports 0 pages."});
            }
        });
    return true;
}

std::optional<int> ConversionSession::ParsePageField(const std::string& text, bool& valid) {
    valid = true;
    const std::string trimmed = Trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(trimmed, &consumed);
    } catch (const std::exception&) {
        valid = false;
        return std::nullopt;
    }
    if (consumed != trimmed.size()) {
        valid = false;
        return std::nullopt;
    }
    return value;
}

ConversionSession::StartResult ConversionSession::reject(StartStatus status, const std::string& message) {
    std::cerr << "[ConversionSession] Start rejected: " << message << std::endl;
    if (status == StartStatus::InvalidInput) {
        post(ErrorRaised{ErrorKind::InputValidation, message});
    }
    return StartResult{status, message};
}

ConversionSession::StartResult ConversionSession::startRun(const std::string& fromField,
                                                           const std::string& toField,
                                                           int batchSize) {
    bool fromValid = true;
    bool toValid = true;
    auto from = ParsePageField(fromField, fromValid);
    auto to = ParsePageField(toField, toValid);
    if (!fromValid || !toValid) {
        return reject(StartStatus::InvalidInput, "Page numbers must be integers.");
    }
    return startRun(from, to, batchSize);
}

ConversionSession::StartResult ConversionSession::startRun(std::optional<int> fromPage,
                                                           std::optional<int> toPage,
                                                           int batchSize) {
    if (m_running.load()) {
        return reject(StartStatus::Busy, "An OCR conversion is already in progress.");
    }
    if (m_loading.load()) {
        return reject(StartStatus::Busy, "The document is still loading.");
    }
    if (m_document.getSourcePath().empty()) {
        return reject(StartStatus::InvalidInput, "No document loaded.");
    }
    const int pageCount = m_document.getPageCount();
    if (pageCount <= 0) {
        return reject(StartStatus::InvalidInput, "Cannot determine total pages or the document has 0 pages. Please reload.");
    }
    if (fromPage.has_value() != toPage.has_value()) {
        return reject(StartStatus::InvalidInput, "Both 'from' and 'to' must be filled or both empty.");
    }
    if (batchSize < 1) {
        std::cerr << "[ConversionSession] Invalid batch size '" << batchSize << "'. Using "
                  << m_options.defaultBatchSize << "." << std::endl;
        batchSize = m_options.defaultBatchSize;
    }

    RunRequest request;
    request.sourcePath = m_document.getSourcePath();
    request.startPage = fromPage.value_or(1);
    request.endPage = toPage.value_or(pageCount);
    request.batchSize = batchSize;
    request.pageCount = pageCount;

    if (auto error = BatchPipeline::ValidateRange(request.startPage, request.endPage, pageCount)) {
        return reject(StartStatus::InvalidInput, *error);
    }

    bool expected = false;
    if (!m_running.compare_exchange_strong(expected, true)) {
        return reject(StartStatus::Busy, "An OCR conversion is already in progress.");
    }

    auto token = std::make_shared<CancellationToken>();
    {
        std::lock_guard<std::mutex> lock(m_tokenMutex);
        m_cancelToken = token;
    }

    std::stringstream status;
    status << "Starting OCR for pages " << request.startPage << " to " << request.endPage << "...";
    post(StatusChanged{status.str()});

    m_tasks.SubmitTask(TaskType::Conversion, status.str(),
        [this, request, token](std::shared_ptr<TaskStatus> task) {
            auto sink = [this](SessionEvent event) {
                // RunFinished is the run's last event; the session is free again once it is queued.
                if (std::holds_alternative<RunFinished>(event)) {
                    m_running = false;
                }
                post(std::move(event));
            };
            auto progress = [task](int attempted, int total) {
                task->progress = total > 0 ? static_cast<float>(attempted) / static_cast<float>(total) : 0.0f;
            };

            try {
                m_pipeline.run(request, *token, sink, progress);
            } catch (const std::exception& e) {
                std::cerr << "[ConversionSession] Run could not start: " << e.what() << std::endl;
                post(ErrorRaised{ErrorKind::Internal, e.what()});
                sink(RunFinished{RunState::Failed, std::string("OCR process failed unexpectedly: ") + e.what(), 0, 0});
            }
        });

    return StartResult{StartStatus::Started, status.str()};
}

bool ConversionSession::cancelRun() {
    if (!m_running.load()) {
        std::cout << "[ConversionSession] Cancel requested, but no OCR run is active." << std::endl;
        return false;
    }

    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(m_tokenMutex);
        token = m_cancelToken;
    }
    if (!token) {
        return false;
    }

    std::cout << "[ConversionSession] Requesting OCR cancellation..." << std::endl;
    token->cancel();
    post(StatusChanged{"Cancellation requested..."});
    return true;
}

bool ConversionSession::getPage(int index) {
    const std::string path = m_document.getSourcePath();
    if (path.empty() || index < 0 || index >= m_document.getPageCount()) {
        std::cerr << "[ConversionSession] Attempted to show invalid page index " << index << " or no document loaded." << std::endl;
        post(ErrorRaised{ErrorKind::InputValidation,
                         "Page number must be between 1 and " + std::to_string(m_document.getPageCount()) + "."});
        return false;
    }

    post(StatusChanged{"Loading page " + std::to_string(index + 1) + " preview..."});
    submitPreview(path, index);
    return true;
}

void ConversionSession::submitPreview(const std::string& path, int index) {
    auto renderer = m_renderer;
    const auto timeout = m_options.previewTimeout;
    m_tasks.SubmitTask(TaskType::PagePreview, "Preview page " + std::to_string(index + 1),
        [this, renderer, path, index, timeout](std::shared_ptr<TaskStatus>) {
            const int pageNumber = index + 1;
            try {
                auto images = renderer->render(path, pageNumber, pageNumber, timeout);
                if (images.empty()) {
                    post(ErrorRaised{ErrorKind::Load, "Could not load page " + std::to_string(pageNumber) + "."});
                    return;
                }
                post(PreviewReady{index, std::move(images.front())});
            } catch (const domain::ToolingUnavailableError& e) {
                post(ErrorRaised{ErrorKind::Tooling, e.what()});
            } catch (const std::exception& e) {
                post(ErrorRaised{ErrorKind::Load,
                                 "Failed to load page " + std::to_string(pageNumber) + ": " + e.what()});
            }
        });
}

bool ConversionSession::saveResults(const std::string& path, std::string& message) {
    const std::string text = Trim(m_results);
    if (text.empty()) {
        message = "There is no text content to save.";
        return false;
    }

    std::string error;
    if (!infrastructure::PersistenceService::saveText(path, text, error)) {
        message = "Could not save OCR output: " + error;
        std::cerr << "[ConversionSession] " << message << std::endl;
        if (!m_running.load()) post(StatusChanged{"Error saving file."});
        return false;
    }

    message = "OCR text saved to: " + path;
    std::cout << "[ConversionSession] " << message << std::endl;
    if (!m_running.load()) post(StatusChanged{"Results saved."});
    return true;
}

size_t ConversionSession::processEvents() {
    size_t processed = 0;
    while (auto event = m_events.tryPop()) {
        apply(*event);
        if (m_listener) m_listener(*event);
        ++processed;
    }
    return processed;
}

size_t ConversionSession::waitAndProcessEvents(std::chrono::milliseconds timeout) {
    auto first = m_events.waitPop(timeout);
    if (!first) {
        return 0;
    }
    apply(*first);
    if (m_listener) m_listener(*first);
    return 1 + processEvents();
}

void ConversionSession::apply(const SessionEvent& event) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PageCountKnown>) {
            if (e.document) {
                m_document.adoptDetection(*e.document);
            }
            m_currentPage = 0;
            m_loading = false;
            std::cout << "[ConversionSession] Total pages in " << e.typeTag << ": " << e.pageCount << std::endl;
            if (e.pageCount > 0 && m_options.previewOnLoad) {
                submitPreview(e.path, 0);
            }
        } else if constexpr (std::is_same_v<T, PreviewReady>) {
            m_currentPage = e.pageIndex;
        } else if constexpr (std::is_same_v<T, BatchCommitted>) {
            applyBatch(e);
        } else if constexpr (std::is_same_v<T, RunFinished>) {
            m_lastRun = e;
        }
    }, event);
}

void ConversionSession::applyBatch(const BatchCommitted& batch) {
    for (const auto& block : batch.blocks) {
        // A re-run replaces what an earlier run extracted for the same page.
        m_document.deletePageObjects(block.pageIndex);
        m_document.addObject(block.pageIndex, block.text);
    }

    if (batch.renderFailed) {
        m_results += batch.text;
    } else {
        if (!IsBlank(m_results)) m_results += "\n";
        m_results += batch.text;
    }

    if (m_autosave) {
        m_autosave->saveTextAsync(m_options.autosavePath, Trim(m_results));
    }
}

} // namespace smartocr::application
