#pragma once

#include "services/AsyncService.hpp"
#include "config/Config.hpp"
#include "watch/Event.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

struct inotify_event;

namespace fk::watch {

/**
 * Recursive inotify subscription on one root, run on its own thread.
 *
 * Reports file-level events only: a directory that is created, deleted or
 * moved is expanded into one event per file below it. A move whose other
 * half is outside the root is reported as a creation or a deletion. Once
 * stop() has been requested no further event is dispatched. A kernel queue
 * overflow triggers a rescan that reports whatever changed in the meantime.
 */
class Watcher final : public services::AsyncService {
public:
    using Handler = std::function<void(const Event&)>;

    Watcher(const std::string& name, const std::filesystem::path& root, const config::WatchConfig& config);
    ~Watcher() override;

    // Handlers run on the watcher thread, in subscription order.
    void subscribe(Handler handler);
    void subscribe(Event::Type type, Handler handler);

    // Installs the watches synchronously, so changes made after start()
    // returns are never missed, then spawns the dispatch thread.
    void start() override;
    void stop() override;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

protected:
    void runLoop() override;

private:
    struct PendingMove {
        std::filesystem::path path;
        bool isDir;
        std::chrono::steady_clock::time_point deadline;
    };

    std::filesystem::path root_;
    config::WatchConfig config_;
    int fd_{-1};

    std::unordered_map<int, std::filesystem::path> wdToPath_;
    std::set<std::filesystem::path> snapshot_;
    std::unordered_map<uint32_t, PendingMove> pendingMoves_;

    std::vector<std::pair<std::optional<Event::Type>, Handler>> handlers_;
    std::mutex handlersMutex_;

    void addWatch(const std::filesystem::path& dir);
    void watchTree(const std::filesystem::path& dir, std::vector<Event>* created);
    void unwatchTree(const std::filesystem::path& dir);
    void retargetTree(const std::filesystem::path& from, const std::filesystem::path& to);
    void forgetTree(const std::filesystem::path& dir, std::vector<Event>& out);

    // Diffs a fresh walk of the root against the snapshot after lost events.
    void resync(std::vector<Event>& out);

    void translate(const inotify_event& ev, std::vector<Event>& out);
    void expireMoves(std::vector<Event>& out);
    void dispatch(const Event& event);
};

} // namespace fk::watch
