#include "services/Initializer.hpp"
#include "store/StoreGate.hpp"
#include "manifest/Migration.hpp"
#include "manifest/Reconciler.hpp"
#include "manifest/Scope.hpp"
#include "watch/Watcher.hpp"
#include "watch/EventHandlers.hpp"
#include "database/AuxTables.hpp"
#include "logging/LogRegistry.hpp"
#include "util/bootId.hpp"

#include <array>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

using namespace fk::services;
using namespace fk::store;
using namespace fk::manifest;
using namespace fk::watch;
using namespace fk::logging;

namespace fs = std::filesystem;

namespace {

constexpr auto REBOOT_KEY = "reboot";
constexpr std::array SUBDIRECTORIES = {"input", "results", "archive", ".tmp"};

void logDelta(const std::string& scope, const Delta& delta) {
    if (delta.empty()) return;
    LogRegistry::manifest()->info("[Initializer] Reconciled {}: {} removed, {} added",
                                  scope, delta.removed.size(), delta.added.size());
}

}

Initializer::Initializer(config::Config config, std::shared_ptr<database::AuxTables> tables)
    : config_(std::move(config)),
      tables_(std::move(tables)),
      gate_(std::make_shared<StoreGate>(config_.files.destinations())),
      bootId_(util::currentBootId()) {
    if (!tables_) throw std::invalid_argument("Initializer requires an auxiliary table backend");
}

Initializer::~Initializer() {
    try {
        shutdown();
    } catch (const std::exception& e) {
        LogRegistry::filekeeper()->error("[Initializer] Shutdown failed: {}", e.what());
    }
}

fs::path Initializer::dropboxRoot() const { return config_.files.dataDir() / "archive"; }

fs::path Initializer::resultsRoot() const { return config_.files.dataDir() / "results"; }

KeyedFileStore Initializer::loader() const {
    return gate_->read("Initializer::loader", [](const KeyedFileStore& store) { return store; });
}

void Initializer::init() {
    LogRegistry::filekeeper()->info("[Initializer] Loading data files from {} destinations", gate_->destinations().size());

    // Watchers start under the gate and before the scans, so a change racing
    // the scan is still delivered once the startup save is done.
    gate_->update("Initializer::init", [this](KeyedFileStore& store) {
        for (const auto& [dest, keys] : store.registry())
            LogRegistry::store()->debug("[Initializer] {} holds {} keys", dest.string(), keys.size());

        ensureDefaults(store);
        checkReboot(store);
        ensureDirectories();
        startWatchers();
        reconcileDropbox(store);
        reconcileProcesses(store);
        return true;
    });

    LogRegistry::filekeeper()->info("[Initializer] Startup complete, watching {} and {}",
                                    dropboxRoot().string(), resultsRoot().string());
}

void Initializer::shutdown() {
    if (shutdown_.exchange(true)) return;

    LogRegistry::filekeeper()->info("[Initializer] Shutting down");
    for (const auto& watcher : watchers_) watcher->stop();
    watchers_.clear();

    tables_->dropFlagged();
    tables_->close();
    LogRegistry::filekeeper()->info("[Initializer] Shutdown complete");
}

void Initializer::ensureDefaults(KeyedFileStore& store) const {
    if (!store.contains(PROCESS_ID_KEY)) store.addKey(PROCESS_ID_KEY, 0, config_.files.at("processes"));
    if (!store.contains(DROPBOX_KEY)) store.addKey(DROPBOX_KEY, nlohmann::json::object(), config_.files.at("dropbox"));
}

void Initializer::checkReboot(const KeyedFileStore& store) {
    if (bootId_.empty()) {
        LogRegistry::filekeeper()->debug("[Initializer] Boot id unavailable, skipping reboot check");
        return;
    }
    if (!store.contains(REBOOT_KEY) || !store.at(REBOOT_KEY).is_string()) return;

    if (store.at(REBOOT_KEY).get<std::string>() != bootId_)
        LogRegistry::filekeeper()->warn("[Initializer] System was rebooted since the last run. "
                                        "PIDs recorded for processes 0-{} may be stale",
                                        store.at(PROCESS_ID_KEY).dump());
}

void Initializer::ensureDirectories() const {
    for (const auto* name : SUBDIRECTORIES) {
        const auto dir = config_.files.dataDir() / name;
        if (fs::create_directories(dir)) LogRegistry::filekeeper()->debug("[Initializer] Created {}", dir.string());
    }
}

void Initializer::reconcileDropbox(KeyedFileStore& store) const {
    const auto scope = Scope::dropbox(dropboxRoot());
    migration::upgradeDropbox(store.at(DROPBOX_KEY), scope.root);

    auto manifest = scope.read(store);
    logDelta(scope.key, Reconciler{}.reconcile(manifest, scope.root));
    scope.write(store, manifest);
}

void Initializer::reconcileProcesses(KeyedFileStore& store) const {
    for (const auto& scope : processScopes(store)) {
        migration::upgradeProcessFiles(store.at(scope.key));

        if (!fs::is_directory(scope.root)) {
            LogRegistry::manifest()->warn("[Initializer] Output directory of {} is missing: {}", scope.key, scope.root.string());
            continue;
        }

        auto manifest = scope.read(store);
        logDelta(scope.key, Reconciler{}.reconcile(manifest, scope.root));
        scope.write(store, manifest);
    }
}

void Initializer::startWatchers() {
    const auto subscribe = [this](const std::string& name, const fs::path& root, ScopeResolver resolver) {
        auto watcher = std::make_shared<Watcher>(name, root, config_.watch);
        const auto handlers = std::make_shared<const EventHandlers>(name, gate_, tables_, std::move(resolver));
        EventHandlers::attach(*watcher, handlers);

        watcher->start();
        watchers_.push_back(std::move(watcher));
        LogRegistry::watch()->info("[Initializer] {} watching {}", name, root.string());
    };

    subscribe("DropboxWatcher", dropboxRoot(), dropboxResolver(dropboxRoot()));
    subscribe("ResultsWatcher", resultsRoot(), processResolver());
}
