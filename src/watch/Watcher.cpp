#include "watch/Watcher.hpp"
#include "core/DirectoryWalker.hpp"
#include "util/fsPath.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <climits>
#include <stdexcept>
#include <system_error>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

using namespace fk::watch;
using namespace fk::logging;
using namespace std::chrono;

namespace {

constexpr uint32_t WATCH_MASK = IN_CREATE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF | IN_ONLYDIR;
constexpr std::size_t BUFFER_SIZE = 64 * (sizeof(inotify_event) + NAME_MAX + 1);

fs::path rebase(const fs::path& path, const fs::path& from, const fs::path& to) {
    if (path == from) return to;
    return to / path.lexically_relative(from);
}

}

std::string fk::watch::to_string(const Event::Type type) {
    switch (type) {
        case Event::Type::Created: return "created";
        case Event::Type::Deleted: return "deleted";
        case Event::Type::Moved: return "moved";
    }
    return "unknown";
}

Watcher::Watcher(const std::string& name, const fs::path& root, const config::WatchConfig& config)
    : AsyncService(name), root_(fs::absolute(root).lexically_normal()), config_(config) {}

Watcher::~Watcher() { Watcher::stop(); }

void Watcher::subscribe(Handler handler) {
    std::scoped_lock lock(handlersMutex_);
    handlers_.emplace_back(std::nullopt, std::move(handler));
}

void Watcher::subscribe(const Event::Type type, Handler handler) {
    std::scoped_lock lock(handlersMutex_);
    handlers_.emplace_back(type, std::move(handler));
}

void Watcher::start() {
    if (isRunning()) return;

    if (!fs::is_directory(root_)) throw std::runtime_error("Cannot watch " + root_.string() + ": not a directory");

    fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ == -1) throw std::system_error(errno, std::generic_category(), "inotify_init1");
    watchTree(root_, nullptr);

    LogRegistry::watch()->info("[{}] Watching {} ({} directories, {} files)",
                               serviceName_, root_.string(), wdToPath_.size(), snapshot_.size());
    AsyncService::start();
}

void Watcher::stop() {
    AsyncService::stop();

    if (fd_ != -1) {
        ::close(fd_);
        fd_ = -1;
    }
    wdToPath_.clear();
    pendingMoves_.clear();
    snapshot_.clear();
}

void Watcher::runLoop() {
    alignas(inotify_event) char buffer[BUFFER_SIZE];

    while (!interruptFlag_.load()) {
        pollfd pfd{fd_, POLLIN, 0};
        const int ready = ::poll(&pfd, 1, static_cast<int>(config_.poll_interval_ms));
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }

        std::vector<Event> events;
        if (ready > 0 && (pfd.revents & POLLIN)) {
            const ssize_t length = ::read(fd_, buffer, sizeof(buffer));
            if (length < 0 && errno != EAGAIN && errno != EINTR)
                throw std::system_error(errno, std::generic_category(), "read");

            for (char* ptr = buffer; length > 0 && ptr < buffer + length;) {
                const auto* ev = reinterpret_cast<const inotify_event*>(ptr);
                try {
                    translate(*ev, events);
                } catch (const std::exception& e) {
                    LogRegistry::watch()->error("[{}] Failed to process inotify event (mask {:#x}): {}", serviceName_, ev->mask, e.what());
                }
                ptr += sizeof(inotify_event) + ev->len;
            }
        }
        expireMoves(events);

        for (const auto& event : events) {
            if (interruptFlag_.load()) return;
            dispatch(event);
        }
    }
}

void Watcher::addWatch(const fs::path& dir) {
    const int wd = inotify_add_watch(fd_, dir.c_str(), WATCH_MASK);
    if (wd == -1) {
        LogRegistry::watch()->warn("[{}] Failed to watch {}: {}", serviceName_, dir.string(),
                                   std::generic_category().message(errno));
        return;
    }
    wdToPath_[wd] = dir;
}

void Watcher::watchTree(const fs::path& dir, std::vector<Event>* created) {
    addWatch(dir);
    for (const auto& path : core::DirectoryWalker().walk(dir)) {
        std::error_code ec;
        if (fs::is_directory(path, ec)) addWatch(path);
        else if (fs::is_regular_file(path, ec) && snapshot_.insert(path).second && created)
            created->push_back({Event::Type::Created, path, {}});
    }
}

void Watcher::resync(std::vector<Event>& out) {
    pendingMoves_.clear();

    std::set<fs::path> current;
    for (const auto& path : core::DirectoryWalker().walk(root_)) {
        std::error_code ec;
        if (fs::is_directory(path, ec)) addWatch(path);
        else if (fs::is_regular_file(path, ec)) current.insert(path);
    }

    for (const auto& file : snapshot_)
        if (!current.contains(file)) out.push_back({Event::Type::Deleted, file, {}});
    for (const auto& file : current)
        if (!snapshot_.contains(file)) out.push_back({Event::Type::Created, file, {}});

    snapshot_ = std::move(current);
}

void Watcher::unwatchTree(const fs::path& dir) {
    for (auto it = wdToPath_.begin(); it != wdToPath_.end();) {
        if (!util::isUnder(it->second, dir)) {
            ++it;
            continue;
        }
        inotify_rm_watch(fd_, it->first);
        it = wdToPath_.erase(it);
    }
}

void Watcher::retargetTree(const fs::path& from, const fs::path& to) {
    for (auto& [wd, path] : wdToPath_)
        if (util::isUnder(path, from)) path = rebase(path, from, to);
}

void Watcher::forgetTree(const fs::path& dir, std::vector<Event>& out) {
    for (auto it = snapshot_.begin(); it != snapshot_.end();) {
        if (!util::isUnder(*it, dir)) {
            ++it;
            continue;
        }
        out.push_back({Event::Type::Deleted, *it, {}});
        it = snapshot_.erase(it);
    }
}

void Watcher::translate(const inotify_event& ev, std::vector<Event>& out) {
    if (ev.mask & IN_Q_OVERFLOW) {
        LogRegistry::watch()->warn("[{}] inotify queue overflow, rescanning {}", serviceName_, root_.string());
        resync(out);
        return;
    }
    if (ev.mask & IN_IGNORED) {
        wdToPath_.erase(ev.wd);
        return;
    }
    if (ev.mask & IN_DELETE_SELF) return;

    const auto dir = wdToPath_.find(ev.wd);
    if (dir == wdToPath_.end()) return;

    const fs::path path = ev.len > 0 ? dir->second / ev.name : dir->second;
    const bool isDir = ev.mask & IN_ISDIR;

    if (ev.mask & IN_CREATE) {
        if (isDir) watchTree(path, &out);
        else if (snapshot_.insert(path).second) out.push_back({Event::Type::Created, path, {}});
    } else if (ev.mask & IN_DELETE) {
        if (isDir) forgetTree(path, out);
        else {
            snapshot_.erase(path);
            out.push_back({Event::Type::Deleted, path, {}});
        }
    } else if (ev.mask & IN_MOVED_FROM) {
        pendingMoves_[ev.cookie] = {path, isDir, steady_clock::now() + milliseconds(config_.move_pair_timeout_ms)};
    } else if (ev.mask & IN_MOVED_TO) {
        const auto pending = pendingMoves_.find(ev.cookie);
        if (pending == pendingMoves_.end()) {
            // Moved in from outside the root.
            if (isDir) watchTree(path, &out);
            else if (snapshot_.insert(path).second) out.push_back({Event::Type::Created, path, {}});
            return;
        }

        const fs::path src = pending->second.path;
        pendingMoves_.erase(pending);

        if (!isDir) {
            snapshot_.erase(src);
            snapshot_.insert(path);
            out.push_back({Event::Type::Moved, src, path});
            return;
        }

        std::vector<fs::path> moved;
        for (const auto& file : snapshot_)
            if (util::isUnder(file, src)) moved.push_back(file);
        for (const auto& file : moved) {
            const auto dest = rebase(file, src, path);
            snapshot_.erase(file);
            snapshot_.insert(dest);
            out.push_back({Event::Type::Moved, file, dest});
        }
        retargetTree(src, path);
    }
}

void Watcher::expireMoves(std::vector<Event>& out) {
    const auto now = steady_clock::now();
    for (auto it = pendingMoves_.begin(); it != pendingMoves_.end();) {
        if (it->second.deadline > now) {
            ++it;
            continue;
        }

        // Moved out of the root.
        const auto& path = it->second.path;
        if (it->second.isDir) {
            forgetTree(path, out);
            unwatchTree(path);
        } else {
            snapshot_.erase(path);
            out.push_back({Event::Type::Deleted, path, {}});
        }
        it = pendingMoves_.erase(it);
    }
}

void Watcher::dispatch(const Event& event) {
    if (event.type == Event::Type::Moved)
        LogRegistry::watch()->debug("[{}] Event: {} {} -> {}", serviceName_, to_string(event.type), event.src.string(), event.dest.string());
    else
        LogRegistry::watch()->debug("[{}] Event: {} {}", serviceName_, to_string(event.type), event.src.string());

    std::vector<std::pair<std::optional<Event::Type>, Handler>> handlers;
    {
        std::scoped_lock lock(handlersMutex_);
        handlers = handlers_;
    }

    for (const auto& [type, handler] : handlers) {
        if (type && *type != event.type) continue;
        try {
            handler(event);
        } catch (const std::exception& e) {
            LogRegistry::watch()->error("[{}] Handler failed for {} {}: {}", serviceName_, to_string(event.type), event.src.string(), e.what());
        }
    }
}
