#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <cassert>
#include "application/ConversionSession.hpp"
#include "application/EventQueue.hpp"
#include "TestFakes.hpp"

using namespace smartocr;
using namespace smartocr::application;

// Slow backend to keep the run busy while other threads poke at the session.
class SlowBackend : public test::FakeRecognitionBackend {
public:
    nlohmann::json respond(const domain::StagedImage& image, const std::string& prompt) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return test::FakeRecognitionBackend::respond(image, prompt);
    }
};

void testEventQueueManyProducers() {
    std::cout << "[Test] EventQueue with many producers..." << std::endl;
    EventQueue<int> queue;
    const int NUM_PRODUCERS = 8;
    const int PER_PRODUCER = 500;

    std::vector<std::thread> producers;
    for (int p = 0; p < NUM_PRODUCERS; ++p) {
        producers.emplace_back([&queue, p]() {
            for (int i = 0; i < PER_PRODUCER; ++i) queue.push(p * PER_PRODUCER + i);
        });
    }

    std::vector<int> lastSeen(NUM_PRODUCERS, -1);
    int received = 0;
    while (received < NUM_PRODUCERS * PER_PRODUCER) {
        auto item = queue.waitPop(std::chrono::milliseconds(500));
        assert(item.has_value());
        const int producer = *item / PER_PRODUCER;
        // Per-producer order is preserved.
        assert(*item > lastSeen[producer]);
        lastSeen[producer] = *item;
        ++received;
    }
    for (auto& t : producers) t.join();
    assert(queue.empty());

    queue.interrupt();
    assert(!queue.waitPop(std::chrono::seconds(5)).has_value());
    std::cout << "[PASS] EventQueue with many producers" << std::endl;
}

void testCancelFromManyThreads() {
    std::cout << "[Test] Cancel requested from many threads..." << std::endl;
    auto counter = std::make_shared<test::FakePageCounter>();
    counter->pages = 200;
    auto renderer = std::make_shared<test::FakePageRenderer>();
    auto backend = std::make_shared<SlowBackend>();

    SessionOptions options;
    options.previewOnLoad = false;
    ConversionSession session(counter, renderer, std::make_shared<RecognitionAdapter>(backend), options);

    bool known = false;
    std::optional<RunFinished> finished;
    int batches = 0;
    session.setListener([&](const SessionEvent& e) {
        if (std::holds_alternative<PageCountKnown>(e)) known = true;
        if (std::holds_alternative<BatchCommitted>(e)) ++batches;
        if (auto* f = std::get_if<RunFinished>(&e)) finished = *f;
    });

    assert(session.loadDocument("/tmp/big.pdf"));
    while (!known) session.waitAndProcessEvents(std::chrono::milliseconds(20));

    assert(session.startRun(std::nullopt, std::nullopt, 5).started());

    // Let a few batches through, then hammer cancel from several threads at once.
    while (batches < 2) session.waitAndProcessEvents(std::chrono::milliseconds(20));

    std::atomic<int> accepted{0};
    std::vector<std::thread> cancellers;
    for (int i = 0; i < 16; ++i) {
        cancellers.emplace_back([&session, &accepted]() {
            if (session.cancelRun()) accepted++;
        });
    }
    for (auto& t : cancellers) t.join();
    assert(accepted.load() >= 1);

    auto start = std::chrono::steady_clock::now();
    while (!finished) {
        session.waitAndProcessEvents(std::chrono::milliseconds(20));
        assert(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
    }

    std::cout << "[Test] Batches committed before cancel: " << batches << std::endl;
    assert(finished->state == RunState::Cancelled);
    assert(batches < 40);
    assert(!session.isRunning());

    // Every committed page holds exactly one object and the batches are contiguous from page 1.
    const auto& doc = session.getDocument();
    assert(static_cast<int>(doc.getObjects().size()) == batches * 5);
    for (int page = 0; page < batches * 5; ++page) {
        assert(doc.getPageObjects(page).size() == 1);
    }

    // The session accepts a new run afterwards.
    assert(!session.cancelRun());
    finished.reset();
    auto again = session.startRun(1, 3, 5);
    assert(again.started());
    while (!finished) {
        session.waitAndProcessEvents(std::chrono::milliseconds(20));
    }
    assert(finished->state == RunState::Completed);
    session.shutdown();
    std::cout << "[PASS] Cancel requested from many threads" << std::endl;
}

int main() {
    std::cout << "[Test] Starting Concurrency Stress Test..." << std::endl;
    testEventQueueManyProducers();
    testCancelFromManyThreads();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
