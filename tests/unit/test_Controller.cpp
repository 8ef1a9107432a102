#include <gtest/gtest.h>
#include "sync/Controller.hpp"
#include "store/Error.hpp"
#include "MemoryStore.hpp"
#include "TempTree.hpp"

#include <cmath>

using namespace mfsync::sync;
using namespace mfsync::sync::model;
using namespace mfsync::test;
using namespace std::chrono_literals;

class ControllerTest : public ::testing::Test {
protected:
    TempTree src;
    std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>();
    Options options;
    const fs::path dst = "/backup";

    RunResult run() {
        Controller controller(store, options);
        auto result = controller.run(src.root(), dst);
        EXPECT_EQ(controller.phase(), Phase::Report);
        return result;
    }
};

TEST_F(ControllerTest, ScenarioA_FirstRunCreatesTreeSecondRunIsIdempotent) {
    src.writeFile("a.txt", "0123456789");
    src.writeFile("b/c.txt", "see");

    const auto first = run();

    EXPECT_EQ(first.outcome, Outcome::Clean);
    EXPECT_EQ(store->childNames(dst), (std::set<std::string>{"a.txt", "b"}));
    EXPECT_EQ(store->contentOf(dst / "b/c.txt"), "see");
    EXPECT_EQ(first.root_hash, store->hashOf(dst));

    store->resetCounters();
    const auto second = run();

    EXPECT_EQ(second.outcome, Outcome::Clean);
    EXPECT_EQ(second.root_hash, first.root_hash);
    EXPECT_EQ(store->counters().adds, 0u);
    EXPECT_EQ(store->counters().removes, 0u);
    EXPECT_EQ(store->counters().copies, 0u);
}

TEST_F(ControllerTest, ScenarioB_LocalDeletionRemovesRemoteEntry) {
    src.writeFile("a.txt", "0123456789");
    src.writeFile("b/c.txt", "see");
    const auto first = run();

    src.remove("a.txt");
    const auto second = run();

    EXPECT_EQ(second.outcome, Outcome::Clean);
    EXPECT_EQ(store->childNames(dst), (std::set<std::string>{"b"}));
    EXPECT_EQ(store->removedPaths(), (std::vector<std::string>{"/backup/a.txt"}));
    EXPECT_NE(second.root_hash, first.root_hash);
}

TEST_F(ControllerTest, ScenarioC_SymlinkFollowsItsTarget) {
    src.writeFile("b/c.txt", "one");
    src.symlink("s", "b/c.txt");

    const auto first = run();
    EXPECT_EQ(first.outcome, Outcome::Clean);
    EXPECT_EQ(store->hashOf(dst / "s"), store->hashOf(dst / "b/c.txt"));

    src.writeFile("b/c.txt", "two, longer");
    const auto second = run();

    EXPECT_EQ(second.outcome, Outcome::Clean);
    EXPECT_EQ(store->contentOf(dst / "s"), "two, longer");
    EXPECT_EQ(store->hashOf(dst / "s"), store->hashOf(dst / "b/c.txt"));
}

TEST_F(ControllerTest, UnchangedSymlinkIsNotCopiedOnRerun) {
    src.writeFile("b/c.txt", "one");
    src.symlink("s", "b/c.txt");
    run();
    store->resetCounters();

    run();

    EXPECT_EQ(store->counters().copies, 0u);
}

TEST_F(ControllerTest, PhaseFlushesHappenEvenWithoutInterval) {
    src.writeFile("a.txt", "a");
    run();
    EXPECT_EQ(store->counters().flushes, 2u);
    EXPECT_FALSE(store->autoflush());
}

TEST_F(ControllerTest, ZeroIntervalEnablesDaemonAutoflush) {
    options.flush_interval = 0ms;
    src.writeFile("a.txt", "a");
    run();
    EXPECT_TRUE(store->autoflush());
    EXPECT_EQ(store->counters().flushes, 2u);
}

TEST_F(ControllerTest, FlushCadenceDependsOnElapsedTimeNotUploads) {
    constexpr int uploads = 30;
    constexpr auto interval = 10s;
    for (int i = 0; i < uploads; ++i) src.writeFile("f" + std::to_string(i), std::string(static_cast<size_t>(i + 1), 'x'));

    // every clock read advances one second
    auto t = FlushScheduler::Clock::time_point{};
    options.flush_interval = interval;
    Controller controller(store, options, [&t] {
        const auto now = t;
        t += 1s;
        return now;
    });

    const auto result = controller.run(src.root(), dst);

    const auto elapsed = static_cast<double>(uploads);
    const auto expected = static_cast<uint64_t>(std::ceil(elapsed / std::chrono::duration<double>(interval).count()));
    EXPECT_EQ(result.outcome, Outcome::Clean);
    EXPECT_FALSE(store->autoflush());
    EXPECT_EQ(store->counters().adds, static_cast<uint64_t>(uploads));
    EXPECT_EQ(store->counters().flushes, expected + 2);
}

TEST_F(ControllerTest, EntryErrorsAreCountedAndRunCompletes) {
    src.writeFile("a.txt", "a");
    src.writeFile("b.txt", "b");
    src.symlink("dangling", "missing");
    store->failOn("add", fs::canonical(src.root()) / "a.txt");

    const auto result = run();

    EXPECT_EQ(result.errors, 2u);
    EXPECT_EQ(result.outcome, Outcome::WithErrors);
    EXPECT_FALSE(result.root_hash.empty());
    EXPECT_TRUE(store->exists(dst / "b.txt"));
}

TEST_F(ControllerTest, MissingSourceIsFatal) {
    Controller controller(store, options);
    EXPECT_THROW(controller.run(src / "does-not-exist", dst), std::runtime_error);
    EXPECT_EQ(controller.phase(), Phase::Init);
    EXPECT_EQ(store->counters().lists, 0u);
}

TEST_F(ControllerTest, SourceThatIsAFileIsFatal) {
    const auto file = src.writeFile("plain.txt", "x");
    Controller controller(store, options);
    EXPECT_THROW(controller.run(file, dst), std::runtime_error);
}

TEST_F(ControllerTest, RelativeDestinationIsFatal) {
    Controller controller(store, options);
    EXPECT_THROW(controller.run(src.root(), "backup"), std::runtime_error);
}

TEST_F(ControllerTest, TrailingSlashOnDestinationIsIgnored) {
    src.writeFile("a.txt", "a");
    Controller controller(store, options);
    const auto result = controller.run(src.root(), "/backup/");
    EXPECT_EQ(result.root_hash, store->hashOf("/backup"));
    EXPECT_EQ(store->childNames("/"), (std::set<std::string>{"backup"}));
}

TEST_F(ControllerTest, FailedPhaseFlushIsFatal) {
    src.writeFile("a.txt", "a");
    store->failOn("files/flush", dst);
    Controller controller(store, options);
    EXPECT_THROW(controller.run(src.root(), dst), mfsync::store::Error);
    EXPECT_EQ(controller.phase(), Phase::Flush1);
}

TEST(PhaseTest, Names) {
    EXPECT_EQ(to_string(Phase::TreeWalk), "tree walk");
    EXPECT_EQ(to_string(Phase::SymlinkPass), "symlink pass");
}
