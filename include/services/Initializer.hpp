#pragma once

#include "config/Config.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace fk::store {
class KeyedFileStore;
class StoreGate;
}

namespace fk::database {
class AuxTables;
}

namespace fk::watch {
class Watcher;
}

namespace fk::services {

/**
 * Startup and shutdown of the manifest daemon.
 *
 * init() loads the data files, brings the dropbox and every process manifest
 * in line with disk, starts one watcher on the archive and one on the results
 * tree, and saves. shutdown() stops the watchers, drops the auxiliary tables
 * flagged for cleanup and closes the database; it runs once, whether called
 * explicitly or from the destructor.
 */
class Initializer {
public:
    Initializer(config::Config config, std::shared_ptr<database::AuxTables> tables);
    ~Initializer();

    Initializer(const Initializer&) = delete;
    Initializer& operator=(const Initializer&) = delete;

    void init();
    void shutdown();

    // Fresh copy of the data files, for request handlers.
    [[nodiscard]] store::KeyedFileStore loader() const;

    [[nodiscard]] const std::string& bootId() const { return bootId_; }
    [[nodiscard]] std::filesystem::path dropboxRoot() const;
    [[nodiscard]] std::filesystem::path resultsRoot() const;

private:
    config::Config config_;
    std::shared_ptr<database::AuxTables> tables_;
    std::shared_ptr<store::StoreGate> gate_;
    std::vector<std::shared_ptr<watch::Watcher>> watchers_;
    std::string bootId_;
    std::atomic<bool> shutdown_{false};

    void ensureDefaults(store::KeyedFileStore& store) const;
    void checkReboot(const store::KeyedFileStore& store);
    void ensureDirectories() const;
    void reconcileDropbox(store::KeyedFileStore& store) const;
    void reconcileProcesses(store::KeyedFileStore& store) const;
    void startWatchers();
};

} // namespace fk::services
