#include <gtest/gtest.h>
#include "session/WatchService.hpp"
#include "session/Summary.hpp"
#include "session/KeyListener.hpp"
#include "pipeline/Pipeline.hpp"
#include "policy/Resolver.hpp"
#include "catalog/Registry.hpp"
#include "convert/Gateway.hpp"
#include "volume/VolumeLocator.hpp"
#include "watch/PollingWatcher.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace ss::session;
using namespace std::chrono_literals;

namespace {

class StaticLocator final : public ss::volume::VolumeLocator {
public:
    explicit StaticLocator(fs::path root) : root_(std::move(root)) {}

    [[nodiscard]] std::vector<ss::volume::VolumeCandidate> listCandidates() const override { return {{root_, "STICK"}}; }
    [[nodiscard]] std::string backendName() const override { return "static"; }

private:
    fs::path root_;
};

}

class WatchServiceTest : public ::testing::Test {
protected:
    fs::path test_dir, watch_dir, stick;
    std::shared_ptr<std::atomic<bool>> cancel = std::make_shared<std::atomic<bool>>(false);
    std::unique_ptr<WatchService> service;

    std::mutex mutex;
    std::vector<ss::pipeline::CopyOutcome> outcomes;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / ("stitchsync_service_test_" + std::to_string(::getpid()));
        watch_dir = test_dir / "Downloads";
        stick = test_dir / "STICK";
        fs::create_directories(watch_dir);
        fs::create_directories(stick);

        const auto registry = ss::catalog::Registry::loadFile(STITCHSYNC_TEST_CATALOG);
        auto policy = ss::policy::Resolver(registry).resolve({watch_dir, "Brother PE800", std::nullopt});
        auto pipeline = std::make_shared<ss::pipeline::Pipeline>(
            std::move(policy),
            std::make_shared<ss::convert::Gateway>(ss::convert::ConverterInfo{}, ss::config::ConverterConfig{}),
            std::make_shared<StaticLocator>(stick), registry,
            ss::pipeline::PipelineOptions{50ms, 10ms, 5000ms}, cancel);

        service = std::make_unique<WatchService>(
            std::make_unique<ss::watch::PollingWatcher>(watch_dir), pipeline, cancel,
            [this](const ss::pipeline::CopyOutcome& o) {
                std::scoped_lock lock(mutex);
                outcomes.push_back(o);
            });
    }

    void TearDown() override {
        service.reset();
        fs::remove_all(test_dir);
    }

    size_t outcomeCount() {
        std::scoped_lock lock(mutex);
        return outcomes.size();
    }

    bool waitForOutcomes(const size_t n, const std::chrono::milliseconds deadline = 5000ms) {
        const auto until = std::chrono::steady_clock::now() + deadline;
        while (std::chrono::steady_clock::now() < until) {
            if (outcomeCount() >= n) return true;
            std::this_thread::sleep_for(20ms);
        }
        return false;
    }
};

TEST_F(WatchServiceTest, ProcessesFilesInArrivalOrder) {
    service->start();
    ASSERT_TRUE(service->isRunning());

    std::ofstream(watch_dir / "first.pes") << "one";
    ASSERT_TRUE(waitForOutcomes(1));
    std::ofstream(watch_dir / "second.dst") << "two";
    ASSERT_TRUE(waitForOutcomes(2));

    service->stop();
    EXPECT_FALSE(service->isRunning());

    std::scoped_lock lock(mutex);
    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].source.filename(), "first.pes");
    EXPECT_EQ(outcomes[1].source.filename(), "second.dst");
    EXPECT_TRUE(fs::exists(stick / "first.pes"));
    EXPECT_TRUE(fs::exists(stick / "second.dst"));
}

TEST_F(WatchServiceTest, SummaryCountsOutcomes) {
    service->start();

    std::ofstream(watch_dir / "design.pes") << "stitches";
    std::ofstream(watch_dir / "notes.txt") << "not a design";
    ASSERT_TRUE(waitForOutcomes(2));
    service->stop();

    const auto s = service->summary();
    EXPECT_EQ(s.copied_remote, 1u);
    EXPECT_EQ(s.ignored, 1u);
    EXPECT_EQ(s.failed, 0u);
    EXPECT_EQ(s.processed(), 1u);
}

TEST_F(WatchServiceTest, CancelFlagEndsLoop) {
    service->start();
    cancel->store(true);

    const auto until = std::chrono::steady_clock::now() + 2s;
    while (service->isRunning() && std::chrono::steady_clock::now() < until) std::this_thread::sleep_for(10ms);
    EXPECT_FALSE(service->isRunning());
}

TEST(SummaryTest, RecordsEachKind) {
    Summary s;
    using Kind = ss::pipeline::CopyOutcome::Kind;
    s.record({Kind::CopiedRemote, "a.jef", "a.jef", fs::path("/media/STICK/a.jef"), "", true});
    s.record({Kind::CopiedLocal, "b.dst", "b.dst"});
    s.record({Kind::Ignored, "c.txt", "c.txt"});
    s.record({Kind::Failed, "d.pes", "d.pes", std::nullopt, "converter exited with code 1"});

    EXPECT_EQ(s.copied_remote, 1u);
    EXPECT_EQ(s.copied_local, 1u);
    EXPECT_EQ(s.ignored, 1u);
    EXPECT_EQ(s.failed, 1u);
    EXPECT_EQ(s.converted, 1u);
    EXPECT_EQ(s.processed(), 3u);
    EXPECT_FALSE(s.str().empty());
}

TEST(KeyListenerTest, QuitKeys) {
    EXPECT_TRUE(KeyListener::isQuitKey('q'));
    EXPECT_TRUE(KeyListener::isQuitKey('Q'));
    EXPECT_TRUE(KeyListener::isQuitKey('\x03'));
    EXPECT_FALSE(KeyListener::isQuitKey('u'));
    EXPECT_FALSE(KeyListener::isQuitKey('\n'));
}

TEST(KeyListenerTest, QuitKeyOnPipeRaisesCancel) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    const auto cancel = std::make_shared<std::atomic<bool>>(false);

    KeyListener listener(cancel, fds[0]);
    listener.start();
    ASSERT_EQ(::write(fds[1], "xq", 2), 2);

    const auto until = std::chrono::steady_clock::now() + 2s;
    while (!cancel->load() && std::chrono::steady_clock::now() < until) std::this_thread::sleep_for(10ms);
    EXPECT_TRUE(cancel->load());

    listener.stop();
    ::close(fds[0]);
    ::close(fds[1]);
}
