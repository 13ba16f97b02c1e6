/**
 * @file BatchPipeline.cpp
 * @brief Implementation of BatchPipeline.
 */

#include "application/BatchPipeline.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace smartocr::application {

namespace {

constexpr const char* kStatusCompleted = "OCR process completed.";
constexpr const char* kStatusCompletedWithErrors = "OCR finished, but encountered errors or no text was processed.";
constexpr const char* kStatusCancelled = "OCR process cancelled by user.";
constexpr const char* kStatusFailedPrefix = "OCR process failed unexpectedly: ";
constexpr const char* kStatusToolingPrefix = "OCR process stopped: ";

// The renderer must hand back exactly one image per page of the batch, in page order.
void CheckRenderedBatch(const BatchRange& batch, const std::vector<domain::RasterImage>& images) {
    if (static_cast<int>(images.size()) != batch.size()) {
        throw domain::RenderError("renderer returned " + std::to_string(images.size()) + " of " +
                                  std::to_string(batch.size()) + " pages.");
    }
    for (size_t i = 0; i < images.size(); ++i) {
        const int expected = batch.firstPage + static_cast<int>(i);
        if (images[i].pageNumber != expected) {
            throw domain::RenderError("renderer returned page " + std::to_string(images[i].pageNumber) +
                                      " where page " + std::to_string(expected) + " was expected.");
        }
    }
}

std::string JoinBlocks(const std::vector<PageBlock>& blocks) {
    std::string out;
    for (size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) out += "\n";
        out += BatchPipeline::FormatPageBlock(blocks[i].pageNumber, blocks[i].text);
    }
    return out;
}

BatchCommitted MakeRenderFailure(const BatchRange& batch, const std::string& error) {
    BatchCommitted committed;
    committed.firstPage = batch.firstPage;
    committed.lastPage = batch.lastPage;
    committed.hadErrors = true;
    committed.renderFailed = true;
    for (int page = batch.firstPage; page <= batch.lastPage; ++page) {
        committed.blocks.push_back(PageBlock{page, page - 1, "Error: " + error, true});
    }
    std::stringstream ss;
    ss << "\n--- ERROR LOADING BATCH: Pages " << batch.firstPage << "-" << batch.lastPage << " ---\n"
       << "Error: " << error << "\n";
    committed.text = ss.str();
    return committed;
}

} // namespace

BatchPipeline::BatchPipeline(std::shared_ptr<domain::PageRenderer> renderer,
                             std::shared_ptr<RecognitionAdapter> adapter,
                             PipelineOptions options)
    : m_renderer(std::move(renderer)), m_adapter(std::move(adapter)), m_options(options) {
    if (m_options.defaultBatchSize < 1) {
        m_options.defaultBatchSize = 10;
    }
}

std::vector<BatchRange> BatchPipeline::PlanBatches(int startPage, int endPage, int batchSize, int defaultBatchSize) {
    if (batchSize < 1) {
        std::cerr << "[BatchPipeline] Invalid batch size '" << batchSize << "'. Using " << defaultBatchSize << "." << std::endl;
        batchSize = defaultBatchSize;
    }

    std::vector<BatchRange> batches;
    for (int first = startPage; first <= endPage; first += batchSize) {
        batches.push_back(BatchRange{first, std::min(first + batchSize - 1, endPage)});
    }
    return batches;
}

std::optional<std::string> BatchPipeline::ValidateRange(int startPage, int endPage, int pageCount) {
    if (pageCount <= 0) {
        return std::string("Cannot determine total pages or the document has 0 pages. Please reload.");
    }
    if (startPage < 1 || startPage > pageCount) {
        return "'From' page must be 1-" + std::to_string(pageCount) + ".";
    }
    if (endPage < 1 || endPage > pageCount) {
        return "'To' page must be 1-" + std::to_string(pageCount) + ".";
    }
    if (startPage > endPage) {
        return std::string("'From' page > 'to' page.");
    }
    return std::nullopt;
}

std::string BatchPipeline::FormatPageBlock(int pageNumber, const std::string& text) {
    return "--- Page " + std::to_string(pageNumber) + " ---\n" + text + "\n";
}

RunOutcome BatchPipeline::run(const RunRequest& request,
                              const CancellationToken& token,
                              const EventSink& sink,
                              const ProgressSink& progress) {
    if (auto error = ValidateRange(request.startPage, request.endPage, request.pageCount)) {
        throw std::invalid_argument(*error);
    }

    RunState current = m_state.load();
    do {
        if (current == RunState::Running) {
            throw std::logic_error("A conversion is already in progress.");
        }
    } while (!m_state.compare_exchange_weak(current, RunState::Running));

    RunOutcome outcome = execute(request, token, sink, progress);
    m_state.store(outcome.state);

    std::cout << "[BatchPipeline] Worker finished. State=" << RunStateToString(outcome.state)
              << ", Status='" << outcome.message << "'" << std::endl;
    if (sink) {
        sink(StatusChanged{outcome.message});
        sink(RunFinished{outcome.state, outcome.message, outcome.pagesAttempted, outcome.batchesCommitted});
    }
    return outcome;
}

RunOutcome BatchPipeline::execute(const RunRequest& request,
                                  const CancellationToken& token,
                                  const EventSink& sink,
                                  const ProgressSink& progress) {
    RunOutcome outcome;
    outcome.state = RunState::Running;

    const int pagesTotal = request.endPage - request.startPage + 1;
    bool anyBatchSucceeded = false;
    bool cancelled = false;
    std::string toolingError;

    auto emit = [&sink](SessionEvent event) {
        if (sink) sink(std::move(event));
    };
    auto reportProgress = [&]() {
        if (progress) progress(outcome.pagesAttempted, pagesTotal);
    };

    try {
        const auto batches = PlanBatches(request.startPage, request.endPage, request.batchSize, m_options.defaultBatchSize);

        for (const auto& batch : batches) {
            if (token.isCancelled()) {
                std::cout << "[BatchPipeline] Cancel detected before batch." << std::endl;
                cancelled = true;
                break;
            }

            std::stringstream loading;
            loading << "Loading batch: Pages " << batch.firstPage << " to " << batch.lastPage << "...";
            emit(StatusChanged{loading.str()});
            std::cout << "[BatchPipeline] Loading batch: " << batch.firstPage << "-" << batch.lastPage << std::endl;

            std::vector<domain::RasterImage> images;
            try {
                images = m_renderer->render(request.sourcePath, batch.firstPage, batch.lastPage, m_options.renderTimeout);
                if (images.empty()) {
                    throw domain::RenderError("renderer returned no images.");
                }
                CheckRenderedBatch(batch, images);
            } catch (const domain::ToolingUnavailableError& e) {
                if (token.isCancelled()) {
                    cancelled = true;
                    break;
                }
                std::cerr << "[BatchPipeline] Renderer tooling missing: " << e.what() << std::endl;
                emit(ErrorRaised{ErrorKind::Tooling, e.what()});
                toolingError = e.what();
                break;
            } catch (const std::exception& e) {
                if (token.isCancelled()) {
                    std::cout << "[BatchPipeline] Cancel detected during load error." << std::endl;
                    cancelled = true;
                    break;
                }
                std::stringstream msg;
                msg << "Could not load batch " << batch.firstPage << "-" << batch.lastPage << ": " << e.what();
                std::cerr << "[BatchPipeline] " << msg.str() << std::endl;
                emit(ErrorRaised{ErrorKind::BatchRender, msg.str() + "\nSkipping batch."});

                outcome.pagesAttempted += batch.size();
                emit(MakeRenderFailure(batch, e.what()));
                ++outcome.batchesCommitted;
                reportProgress();
                continue;
            }

            std::vector<PageBlock> blocks;
            bool batchHadErrors = false;

            for (size_t i = 0; i < images.size(); ++i) {
                if (token.isCancelled()) {
                    std::cout << "[BatchPipeline] Cancel detected before page." << std::endl;
                    cancelled = true;
                    break;
                }

                const int pageNumber = images[i].pageNumber;
                ++outcome.pagesAttempted;

                std::stringstream status;
                status << "OCR processing page " << pageNumber << " (" << outcome.pagesAttempted << "/" << pagesTotal << ")...";
                emit(StatusChanged{status.str()});
                reportProgress();

                if (token.isCancelled()) {
                    cancelled = true;
                    break;
                }
                RecognitionOutcome recognized = m_adapter->recognize(images[i]);
                if (token.isCancelled()) {
                    std::cout << "[BatchPipeline] Cancel detected after recognition of page " << pageNumber << "." << std::endl;
                    cancelled = true;
                    break;
                }

                PageBlock block;
                block.pageNumber = pageNumber;
                block.pageIndex = pageNumber - 1;
                if (recognized.succeeded()) {
                    block.text = recognized.text;
                } else {
                    block.text = "Error processing page " + std::to_string(pageNumber) + ": " + recognized.error;
                    block.failed = true;
                    batchHadErrors = true;
                }
                blocks.push_back(std::move(block));
            }

            if (cancelled) {
                break;
            }

            if (!blocks.empty()) {
                BatchCommitted committed;
                committed.firstPage = batch.firstPage;
                committed.lastPage = batch.lastPage;
                committed.text = JoinBlocks(blocks);
                committed.blocks = std::move(blocks);
                committed.hadErrors = batchHadErrors;
                emit(std::move(committed));

                ++outcome.batchesCommitted;
                if (!batchHadErrors) {
                    anyBatchSucceeded = true;
                }
                std::cout << "[BatchPipeline] Committed batch " << batch.firstPage << "-" << batch.lastPage << "." << std::endl;
            }
        }

        if (cancelled) {
            outcome.state = RunState::Cancelled;
            outcome.message = kStatusCancelled;
        } else if (!toolingError.empty()) {
            outcome.state = RunState::Failed;
            outcome.message = std::string(kStatusToolingPrefix) + toolingError;
        } else if (anyBatchSucceeded) {
            outcome.state = RunState::Completed;
            outcome.message = kStatusCompleted;
        } else {
            outcome.state = RunState::CompletedWithErrors;
            outcome.message = kStatusCompletedWithErrors;
        }
    } catch (const std::exception& e) {
        std::cerr << "[BatchPipeline] Unexpected error in worker: " << e.what() << std::endl;
        outcome.state = RunState::Failed;
        outcome.message = std::string(kStatusFailedPrefix) + e.what();
        emit(ErrorRaised{ErrorKind::Internal, std::string("An unexpected error occurred: ") + e.what()});
    }

    return outcome;
}

} // namespace smartocr::application
