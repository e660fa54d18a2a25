#include <gtest/gtest.h>
#include "watch/Watcher.hpp"
#include "TempDir.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <future>
#include <set>
#include <string>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace fk::watch;
using fk::test::TempDir;
using fk::test::touch;
using fk::test::waitUntil;

class WatcherTest : public ::testing::Test {
protected:
    TempDir dir;
    fs::path root = dir / "root";
    fs::path outside = dir / "outside";
    std::unique_ptr<Watcher> watcher;

    std::mutex mutex;
    std::vector<Event> events;

    void SetUp() override {
        fs::create_directories(root);
        fs::create_directories(outside);
    }

    void TearDown() override {
        if (watcher) watcher->stop();
    }

    void startWatcher() {
        fk::config::WatchConfig config;
        config.poll_interval_ms = 20;
        config.move_pair_timeout_ms = 100;

        watcher = std::make_unique<Watcher>("TestWatcher", root, config);
        watcher->subscribe([this](const Event& e) {
            std::scoped_lock lock(mutex);
            events.push_back(e);
        });
        watcher->start();
    }

    bool sawEvent(const Event::Type type, const fs::path& src, const fs::path& dest = {}) {
        return waitUntil([&] {
            std::scoped_lock lock(mutex);
            return std::ranges::any_of(events, [&](const Event& e) {
                return e.type == type && e.src == src && e.dest == dest;
            });
        });
    }

    std::size_t count(const Event::Type type) {
        std::scoped_lock lock(mutex);
        return static_cast<std::size_t>(std::ranges::count_if(events, [&](const Event& e) { return e.type == type; }));
    }
};

TEST_F(WatcherTest, StartOnMissingRootThrows) {
    Watcher w("Missing", dir / "nope", fk::config::WatchConfig{});
    EXPECT_THROW(w.start(), std::runtime_error);
    EXPECT_FALSE(w.isRunning());
}

TEST_F(WatcherTest, ReportsCreatedFile) {
    startWatcher();
    touch(root / "a.tsv", "x");
    EXPECT_TRUE(sawEvent(Event::Type::Created, root / "a.tsv"));
}

TEST_F(WatcherTest, ReportsDeletedFile) {
    touch(root / "a.tsv");
    startWatcher();
    fs::remove(root / "a.tsv");
    EXPECT_TRUE(sawEvent(Event::Type::Deleted, root / "a.tsv"));
}

TEST_F(WatcherTest, ReportsFilesInNewDirectories) {
    startWatcher();
    touch(root / "run" / "MHC_Class_I" / "a.final.tsv");
    EXPECT_TRUE(sawEvent(Event::Type::Created, root / "run" / "MHC_Class_I" / "a.final.tsv"));

    // Watches were added for the new directories too
    touch(root / "run" / "MHC_Class_I" / "b.tsv");
    EXPECT_TRUE(sawEvent(Event::Type::Created, root / "run" / "MHC_Class_I" / "b.tsv"));
    EXPECT_EQ(count(Event::Type::Created), 2u);
}

TEST_F(WatcherTest, RenameWithinRootIsMove) {
    touch(root / "a.tsv");
    fs::create_directories(root / "sub");
    startWatcher();

    fs::rename(root / "a.tsv", root / "sub" / "b.tsv");
    EXPECT_TRUE(sawEvent(Event::Type::Moved, root / "a.tsv", root / "sub" / "b.tsv"));
}

TEST_F(WatcherTest, DirectoryRenameMovesEveryFile) {
    touch(root / "old" / "a.tsv");
    touch(root / "old" / "deep" / "b.tsv");
    startWatcher();

    fs::rename(root / "old", root / "new");
    EXPECT_TRUE(sawEvent(Event::Type::Moved, root / "old" / "a.tsv", root / "new" / "a.tsv"));
    EXPECT_TRUE(sawEvent(Event::Type::Moved, root / "old" / "deep" / "b.tsv", root / "new" / "deep" / "b.tsv"));

    // The moved directory is still watched under its new name
    touch(root / "new" / "deep" / "c.tsv");
    EXPECT_TRUE(sawEvent(Event::Type::Created, root / "new" / "deep" / "c.tsv"));
}

TEST_F(WatcherTest, MoveOutOfRootIsDeletion) {
    touch(root / "a.tsv");
    startWatcher();

    fs::rename(root / "a.tsv", outside / "a.tsv");
    EXPECT_TRUE(sawEvent(Event::Type::Deleted, root / "a.tsv"));
}

TEST_F(WatcherTest, MoveIntoRootIsCreation) {
    touch(outside / "a.tsv");
    startWatcher();

    fs::rename(outside / "a.tsv", root / "a.tsv");
    EXPECT_TRUE(sawEvent(Event::Type::Created, root / "a.tsv"));
}

TEST_F(WatcherTest, TypedSubscriptionFiltersEvents) {
    fk::config::WatchConfig config;
    config.poll_interval_ms = 20;
    Watcher w("Typed", root, config);

    std::atomic<int> deletes = 0;
    std::atomic<int> creates = 0;
    w.subscribe(Event::Type::Deleted, [&](const Event&) { ++deletes; });
    w.subscribe(Event::Type::Created, [&](const Event&) { ++creates; });
    w.start();

    touch(root / "a.tsv");
    ASSERT_TRUE(waitUntil([&] { return creates.load() == 1; }));
    EXPECT_EQ(deletes.load(), 0);

    fs::remove(root / "a.tsv");
    EXPECT_TRUE(waitUntil([&] { return deletes.load() == 1; }));
    w.stop();
}

TEST_F(WatcherTest, FailingHandlerDoesNotStopDispatch) {
    fk::config::WatchConfig config;
    config.poll_interval_ms = 20;
    Watcher w("Failing", root, config);

    std::atomic<int> seen = 0;
    w.subscribe([](const Event&) { throw std::runtime_error("boom"); });
    w.subscribe([&](const Event&) { ++seen; });
    w.start();

    touch(root / "a.tsv");
    touch(root / "b.tsv");
    EXPECT_TRUE(waitUntil([&] { return seen.load() == 2; }));
    EXPECT_TRUE(w.isRunning());
    w.stop();
}

TEST_F(WatcherTest, NoDispatchAfterStop) {
    startWatcher();
    touch(root / "a.tsv");
    ASSERT_TRUE(sawEvent(Event::Type::Created, root / "a.tsv"));

    watcher->stop();
    EXPECT_FALSE(watcher->isRunning());

    touch(root / "b.tsv");
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(count(Event::Type::Created), 1u);
}

namespace {

// Creates and removes nested directories under root as fast as possible.
void churnDirectories(const fs::path& root, const int rounds) {
    for (int i = 0; i < rounds; ++i) {
        const auto top = root / ("tmp" + std::to_string(i % 4));
        std::error_code ec;
        fs::create_directories(top / "a" / "b" / "c", ec);
        std::ofstream(top / "a" / "b" / "c" / "scratch.tsv") << i;
        fs::remove_all(top, ec);
    }
}

}

TEST_F(WatcherTest, SurvivesDirectoriesVanishingMidWalk) {
    startWatcher();

    churnDirectories(root, 1000);
    EXPECT_TRUE(watcher->isRunning());

    touch(root / "after.tsv");
    EXPECT_TRUE(sawEvent(Event::Type::Created, root / "after.tsv"));
    EXPECT_TRUE(watcher->isRunning());
}

TEST_F(WatcherTest, FailingHandlerDuringDirectoryExpansionKeepsWatching) {
    fk::config::WatchConfig config;
    config.poll_interval_ms = 20;
    Watcher w("Expanding", root, config);

    std::atomic<int> seen = 0;
    w.subscribe(Event::Type::Created, [](const Event& e) {
        if (e.src.parent_path().filename() == "deep") throw std::runtime_error("boom");
    });
    w.subscribe(Event::Type::Created, [&](const Event&) { ++seen; });
    w.start();

    touch(root / "run" / "deep" / "a.tsv");
    ASSERT_TRUE(waitUntil([&] { return seen.load() >= 1; }));

    touch(root / "after.tsv");
    EXPECT_TRUE(waitUntil([&] { return seen.load() >= 2; }));
    EXPECT_TRUE(w.isRunning());
    w.stop();
}

TEST_F(WatcherTest, QueueOverflowRescansRoot) {
    std::size_t limit = 0;
    std::ifstream("/proc/sys/fs/inotify/max_queued_events") >> limit;
    if (limit == 0 || limit > 100000) GTEST_SKIP() << "inotify queue limit unsuitable: " << limit;

    fk::config::WatchConfig config;
    config.poll_interval_ms = 20;
    Watcher w("Overflow", root, config);

    std::promise<void> release;
    const auto released = release.get_future().share();
    std::atomic<bool> blocked = false;
    std::mutex createdMutex;
    std::set<fs::path> created;

    w.subscribe(Event::Type::Created, [&](const Event& e) {
        if (!blocked.exchange(true)) static_cast<void>(released.wait_for(std::chrono::seconds(30)));
        std::scoped_lock lock(createdMutex);
        created.insert(e.src);
    });
    w.start();

    // Hold the watcher thread in a handler while the kernel queue fills up.
    touch(root / "first.tsv");
    ASSERT_TRUE(waitUntil([&] { return blocked.load(); }));

    const std::size_t files = limit + 500;
    for (std::size_t i = 0; i < files; ++i) std::ofstream(root / ("f" + std::to_string(i) + ".tsv"));
    release.set_value();

    EXPECT_TRUE(waitUntil([&] {
        std::scoped_lock lock(createdMutex);
        return created.size() == files + 1;
    }, std::chrono::seconds(60)));
    EXPECT_TRUE(w.isRunning());
    w.stop();
}
