/**
 * @file SmartOcrApp.cpp
 * @brief Implementation of the SmartOcrApp class.
 */
#include "app/SmartOcrApp.hpp"

#include "application/ConversionSession.hpp"
#include "application/RecognitionAdapter.hpp"
#include "domain/Document.hpp"
#include "infrastructure/CommandBackend.hpp"
#include "infrastructure/OpenAiVisionBackend.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/PopplerPageRenderer.hpp"
#include "infrastructure/ToolPageCounter.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <type_traits>
#include <variant>

namespace smartocr::app {

namespace {

std::atomic<bool> g_interrupted{false};

// First Ctrl-C cancels the run; a second one terminates the process.
extern "C" void HandleInterrupt(int sig) {
    g_interrupted.store(true);
    std::signal(sig, SIG_DFL);
}

constexpr auto kPumpInterval = std::chrono::milliseconds(200);

void PrintUsage() {
    std::cerr <<
        "Usage: smartocr [--config settings.json] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  info <file>                        Show detected type and page count.\n"
        "  preview <file> <page> <out.png>    Render one page (1-based).\n"
        "  convert <file> [--from N --to M] [--batch-size K] [--output out.txt]\n"
        "                                     Transcribe pages. Ctrl-C cancels and keeps finished batches.\n"
        "  models                             List models offered by the recognition server.\n"
        "  init-config [path]                 Write a settings.json with the defaults.\n";
}

} // namespace

std::optional<CommandLine> SmartOcrApp::ParseArguments(int argc, char** argv) {
    CommandLine cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](const std::string& flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << flag << std::endl;
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--config" || arg == "--from" || arg == "--to" || arg == "--output" || arg == "--batch-size") {
            auto value = needValue(arg);
            if (!value) {
                PrintUsage();
                return std::nullopt;
            }
            if (arg == "--config") cli.configPath = *value;
            else if (arg == "--from") cli.fromPage = *value;
            else if (arg == "--to") cli.toPage = *value;
            else if (arg == "--output") cli.outputPath = *value;
            else {
                try {
                    cli.batchSize = std::stoi(*value);
                } catch (const std::exception&) {
                    std::cerr << "Invalid batch size: " << *value << std::endl;
                    return std::nullopt;
                }
            }
        } else if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return std::nullopt;
        } else if (cli.command.empty()) {
            cli.command = arg;
        } else {
            cli.positional.push_back(arg);
        }
    }

    if (cli.command.empty()) {
        PrintUsage();
        return std::nullopt;
    }
    return cli;
}

int SmartOcrApp::Run(int argc, char** argv) {
    auto cli = ParseArguments(argc, argv);
    if (!cli) {
        return 1;
    }

    if (cli->command == "init-config") {
        return RunInitConfig(*cli);
    }

    if (!Init(*cli)) {
        Shutdown();
        return 1;
    }

    int code = 1;
    if (cli->command == "info") {
        code = RunInfo(*cli);
    } else if (cli->command == "preview") {
        code = RunPreview(*cli);
    } else if (cli->command == "convert") {
        code = RunConvert(*cli);
    } else if (cli->command == "models") {
        code = RunModels();
    } else {
        std::cerr << "Unknown command: " << cli->command << std::endl;
        PrintUsage();
    }

    Shutdown();
    return code;
}

bool SmartOcrApp::Init(const CommandLine& cli) {
    const std::string configPath = cli.configPath.empty() ? infrastructure::ConfigLoader::DefaultConfigPath() : cli.configPath;
    m_config = infrastructure::ConfigLoader::Load(configPath);

    // Composition Root
    if (m_config.backend == "openai") {
        m_backend = std::make_shared<infrastructure::OpenAiVisionBackend>(m_config.server);
    } else if (m_config.backend == "command") {
        if (m_config.command.empty()) {
            std::cerr << "[SmartOcrApp] backend 'command' needs a 'command' entry in " << configPath << std::endl;
            return false;
        }
        m_backend = std::make_shared<infrastructure::CommandBackend>(m_config.command);
    } else {
        std::cerr << "[SmartOcrApp] Unknown backend '" << m_config.backend << "' (expected 'openai' or 'command')." << std::endl;
        return false;
    }
    std::cout << "[SmartOcrApp] Recognition backend: " << m_backend->getName() << std::endl;

    auto counter = std::make_shared<infrastructure::ToolPageCounter>(std::chrono::seconds(m_config.infoTimeoutSeconds));
    auto renderer = std::make_shared<infrastructure::PopplerPageRenderer>(m_config.renderDpi);
    auto adapter = std::make_shared<application::RecognitionAdapter>(
        m_backend, m_config.prompt.empty() ? application::RecognitionAdapter::kDefaultPrompt : m_config.prompt);

    application::SessionOptions options;
    options.defaultBatchSize = m_config.batchSize > 0 ? m_config.batchSize : 10;
    options.renderTimeout = std::chrono::seconds(m_config.renderTimeoutSeconds);
    options.previewTimeout = std::chrono::seconds(m_config.infoTimeoutSeconds);
    options.autosavePath = m_config.autosavePath;
    options.previewOnLoad = false; // The shell renders only the pages it is asked for.

    m_session = std::make_unique<application::ConversionSession>(counter, renderer, adapter, options);

    std::signal(SIGINT, HandleInterrupt);
    std::signal(SIGTERM, HandleInterrupt);
    return true;
}

void SmartOcrApp::Shutdown() {
    if (m_session) {
        m_session->shutdown();
        m_session.reset();
    }
    m_backend.reset();
}

bool SmartOcrApp::LoadAndWait(const std::string& path) {
    bool known = false;
    bool failed = false;
    m_session->setListener([&](const application::SessionEvent& event) {
        if (auto* count = std::get_if<application::PageCountKnown>(&event)) {
            known = true;
            std::cout << "Type: " << count->typeTag << "\nPages: " << count->pageCount << std::endl;
        } else if (auto* error = std::get_if<application::ErrorRaised>(&event)) {
            failed = true;
            std::cerr << "[" << application::ErrorKindToString(error->kind) << "] " << error->message << std::endl;
        }
    });

    if (!m_session->loadDocument(path)) {
        m_session->processEvents();
        return false;
    }
    while (!known && !failed && !g_interrupted.load()) {
        m_session->waitAndProcessEvents(kPumpInterval);
    }
    m_session->setListener(nullptr);
    return known;
}

int SmartOcrApp::RunInfo(const CommandLine& cli) {
    if (cli.positional.size() != 1) {
        PrintUsage();
        return 1;
    }
    return LoadAndWait(cli.positional[0]) ? 0 : 1;
}

int SmartOcrApp::RunPreview(const CommandLine& cli) {
    if (cli.positional.size() != 3) {
        PrintUsage();
        return 1;
    }
    bool valid = true;
    auto page = application::ConversionSession::ParsePageField(cli.positional[1], valid);
    if (!valid || !page) {
        std::cerr << "Please enter a valid page number." << std::endl;
        return 1;
    }
    if (!LoadAndWait(cli.positional[0])) {
        return 1;
    }

    const int wanted = *page - 1;
    std::optional<domain::RasterImage> image;
    bool failed = false;
    m_session->setListener([&](const application::SessionEvent& event) {
        if (auto* preview = std::get_if<application::PreviewReady>(&event)) {
            if (preview->pageIndex == wanted) image = preview->image;
        } else if (auto* error = std::get_if<application::ErrorRaised>(&event)) {
            failed = true;
            std::cerr << "[" << application::ErrorKindToString(error->kind) << "] " << error->message << std::endl;
        }
    });

    if (!m_session->getPage(wanted)) {
        m_session->processEvents();
        return 1;
    }
    while (!image && !failed && !g_interrupted.load()) {
        m_session->waitAndProcessEvents(kPumpInterval);
    }
    m_session->setListener(nullptr);
    if (!image) {
        return 1;
    }

    std::ofstream out(cli.positional[2], std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(image->bytes.data()), static_cast<std::streamsize>(image->bytes.size()));
    if (!out) {
        std::cerr << "Could not write " << cli.positional[2] << std::endl;
        return 1;
    }
    std::cout << "Previewing page " << *page << " of " << m_session->getDocument().getPageCount()
              << " -> " << cli.positional[2] << std::endl;
    return 0;
}

int SmartOcrApp::RunConvert(const CommandLine& cli) {
    if (cli.positional.size() != 1) {
        PrintUsage();
        return 1;
    }
    const std::string input = cli.positional[0];
    if (!LoadAndWait(input)) {
        return 1;
    }

    std::optional<application::RunFinished> finished;
    m_session->setListener([&](const application::SessionEvent& event) {
        std::visit([&](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, application::StatusChanged>) {
                std::cerr << "[Status] " << e.message << std::endl;
            } else if constexpr (std::is_same_v<T, application::BatchCommitted>) {
                std::cout << e.text << std::endl;
            } else if constexpr (std::is_same_v<T, application::ErrorRaised>) {
                std::cerr << "[" << application::ErrorKindToString(e.kind) << "] " << e.message << std::endl;
            } else if constexpr (std::is_same_v<T, application::RunFinished>) {
                finished = e;
            }
        }, event);
    });

    const int batchSize = cli.batchSize.value_or(m_config.batchSize);
    auto started = m_session->startRun(cli.fromPage, cli.toPage, batchSize);
    if (!started.started()) {
        m_session->processEvents();
        std::cerr << started.message << std::endl;
        return 1;
    }

    bool cancelRequested = false;
    while (!finished) {
        if (g_interrupted.load() && !cancelRequested) {
            cancelRequested = m_session->cancelRun();
        }
        m_session->waitAndProcessEvents(kPumpInterval);
    }
    m_session->setListener(nullptr);

    const std::string output = cli.outputPath.empty()
        ? infrastructure::PathUtils::DefaultOutputPath(input).string()
        : cli.outputPath;
    std::string message;
    const bool saved = m_session->saveResults(output, message);
    std::cerr << message << std::endl;
    if (!saved && finished->state == application::RunState::Completed) {
        return 1;
    }

    switch (finished->state) {
        case application::RunState::Completed: return 0;
        case application::RunState::CompletedWithErrors: return 2;
        case application::RunState::Cancelled: return 130;
        default: return 1;
    }
}

int SmartOcrApp::RunModels() {
    auto models = m_backend->getAvailableModels();
    if (models.empty()) {
        std::cerr << "No models reported by " << m_backend->getName() << "." << std::endl;
        return 1;
    }
    for (const auto& model : models) {
        std::cout << model << (model == m_config.server.model ? "  (configured)" : "") << std::endl;
    }
    return 0;
}

int SmartOcrApp::RunInitConfig(const CommandLine& cli) {
    const std::string path = !cli.positional.empty() ? cli.positional[0]
                           : (!cli.configPath.empty() ? cli.configPath : infrastructure::ConfigLoader::DefaultConfigPath());
    if (!infrastructure::ConfigLoader::Save(path, infrastructure::AppConfig{})) {
        return 1;
    }
    std::cout << "Wrote " << path << std::endl;
    return 0;
}

} // namespace smartocr::app
