#include <gtest/gtest.h>
#include "services/Initializer.hpp"
#include "store/KeyedFileStore.hpp"
#include "manifest/Scope.hpp"
#include "FakeAuxTables.hpp"
#include "TempDir.hpp"

#include <nlohmann/json.hpp>
#include <climits>
#include <set>
#include <stdexcept>
#include <thread>
#include <sys/inotify.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace fk::services;
using namespace fk::manifest;
using fk::test::FakeAuxTables;
using fk::test::TempDir;
using fk::test::touch;
using fk::test::waitUntil;
using nlohmann::json;

class InitializerTest : public ::testing::Test {
protected:
    TempDir dir;
    fs::path data = dir / "data";
    fs::path processes = dir / "processes.json";
    fs::path dropbox = dir / "dropbox.json";
    fk::config::Config config;
    std::shared_ptr<FakeAuxTables> tables = std::make_shared<FakeAuxTables>();

    void SetUp() override {
        config.files.entries = {{"processes", processes}, {"dropbox", dropbox}, {"data-dir", data}};
        config.watch.poll_interval_ms = 20;
        config.watch.move_pair_timeout_ms = 100;
    }

    [[nodiscard]] fs::path archive() const { return data / "archive"; }
    [[nodiscard]] fs::path results() const { return data / "results"; }
};

TEST_F(InitializerTest, FreshStartCreatesDefaultsAndLayout) {
    Initializer init(config, tables);
    init.init();

    for (const auto* sub : {"input", "results", "archive", ".tmp"}) EXPECT_TRUE(fs::is_directory(data / sub)) << sub;

    const auto p = json::parse(fk::test::slurp(processes));
    const auto d = json::parse(fk::test::slurp(dropbox));
    EXPECT_EQ(p, json({{"processid", 0}}));
    EXPECT_EQ(d, json({{"dropbox", json::object()}}));

    init.shutdown();
}

TEST_F(InitializerTest, StartupMigratesAndReconciles) {
    touch(archive() / "old.tsv");
    touch(archive() / "new.final.tsv");
    touch(results() / "run0" / "a.tsv");
    touch(results() / "run0" / "b.tsv");
    touch(results() / "run1" / "c.chop.tsv");

    touch(dropbox, json({{"dropbox", {{"0", "old.tsv"}}}}).dump());
    touch(processes, json({
        {"processid", 2},
        {"reboot", "not-this-boot"},
        {"process-0", {
            {"output", (results() / "run0").string()},
            {"files", {(results() / "run0" / "a.tsv").string(), (results() / "run0" / "gone.tsv").string()}}
        }},
        {"process-1", {{"output", (results() / "run1").string()}}},
        {"process-2", {{"output", (results() / "missing").string()}}}
    }).dump());

    Initializer init(config, tables);
    init.init();

    const auto store = init.loader();

    const auto box = Scope::dropbox(archive()).read(store);
    ASSERT_EQ(box.size(), 2u);
    EXPECT_EQ(box.at("0").full_path, archive() / "old.tsv");
    EXPECT_EQ(box.at("1").full_path, archive() / "new.final.tsv");
    EXPECT_EQ(box.at("1").description, "Final output data");

    const auto run0 = Scope::forProcess(0, results() / "run0").read(store);
    ASSERT_EQ(run0.size(), 2u);
    EXPECT_EQ(run0.at("0").full_path, results() / "run0" / "a.tsv");
    EXPECT_EQ(run0.at("1").full_path, results() / "run0" / "b.tsv");

    const auto run1 = Scope::forProcess(1, results() / "run1").read(store);
    ASSERT_EQ(run1.size(), 1u);
    EXPECT_EQ(run1.at("0").display_name, "c.chop.tsv");

    // A missing output directory is left alone, beyond getting the current shape
    EXPECT_TRUE(store.at("process-2").at("files").empty());
    EXPECT_EQ(store.at("reboot"), "not-this-boot");

    init.shutdown();
}

TEST_F(InitializerTest, LiveEventsUpdateManifests) {
    touch(processes, json({
        {"processid", 0},
        {"process-0", {{"output", (results() / "run0").string()}, {"files", json::object()}}}
    }).dump());
    fs::create_directories(results() / "run0");

    Initializer init(config, tables);
    init.init();

    touch(archive() / "live.tsv");
    touch(results() / "run0" / "x.final.tsv");

    EXPECT_TRUE(waitUntil([&] {
        const auto store = init.loader();
        return Scope::dropbox(archive()).read(store).size() == 1 &&
               Scope::forProcess(0, results() / "run0").read(store).size() == 1;
    }));

    tables->create("data_0_0");
    fs::remove(results() / "run0" / "x.final.tsv");
    EXPECT_TRUE(waitUntil([&] { return Scope::forProcess(0, results() / "run0").read(init.loader()).empty(); }));
    EXPECT_EQ(tables->dropped(), std::vector<std::string>{"data_0_0"});

    init.shutdown();
}

TEST_F(InitializerTest, FileAddedDuringStartupScanIsTracked) {
    fs::create_directories(archive());
    touch(archive() / "existing.tsv");

    // The first read of the archive directory during startup is the moment
    // a file dropped in can race the scan.
    const int fd = inotify_init1(IN_CLOEXEC);
    ASSERT_NE(fd, -1);
    ASSERT_NE(inotify_add_watch(fd, archive().c_str(), IN_OPEN | IN_ONLYDIR), -1);

    std::thread dropper([&] {
        alignas(inotify_event) char buffer[sizeof(inotify_event) + NAME_MAX + 1];
        if (::read(fd, buffer, sizeof(buffer)) > 0) touch(archive() / "racer.tsv");
    });

    Initializer init(config, tables);
    init.init();
    dropper.join();
    ::close(fd);

    EXPECT_TRUE(waitUntil([&] {
        const auto box = Scope::dropbox(archive()).read(init.loader());
        return box.size() == 2;
    }));

    std::set<fs::path> tracked;
    for (const auto& [id, entry] : Scope::dropbox(archive()).read(init.loader())) tracked.insert(entry.full_path);
    EXPECT_EQ(tracked, (std::set<fs::path>{archive() / "existing.tsv", archive() / "racer.tsv"}));

    init.shutdown();
}

TEST_F(InitializerTest, InvalidProcessIdIsFatal) {
    touch(processes, json({{"processid", -1}}).dump());
    Initializer init(config, tables);
    EXPECT_THROW(init.init(), std::out_of_range);
}

TEST_F(InitializerTest, ShutdownDropsFlaggedTablesOnce) {
    tables->create("scratch");
    tables->flagForCleanup("scratch");

    {
        Initializer init(config, tables);
        init.init();
        init.shutdown();
        EXPECT_TRUE(tables->closed());
        EXPECT_EQ(tables->dropped(), std::vector<std::string>{"scratch"});

        init.shutdown();
    }
    EXPECT_EQ(tables->dropped().size(), 1u);
}

TEST_F(InitializerTest, DestructorShutsDown) {
    {
        Initializer init(config, tables);
        init.init();
    }
    EXPECT_TRUE(tables->closed());
}

TEST_F(InitializerTest, MalformedDataFileIsFatal) {
    touch(processes, "{ broken");
    Initializer init(config, tables);
    EXPECT_THROW(init.init(), fk::store::ParseError);
}

TEST_F(InitializerTest, RequiresTables) {
    EXPECT_THROW(Initializer(config, nullptr), std::invalid_argument);
}
