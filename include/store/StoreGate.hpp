#pragma once

#include "store/KeyedFileStore.hpp"
#include "logging/LogRegistry.hpp"

#include <mutex>
#include <string>
#include <utility>

namespace fk::store {

/**
 * Serializes every reload-mutate-save round trip on the data files.
 *
 * Each call reloads a fresh store from disk under the gate's lock, so two
 * watch handlers can no longer interleave and drop each other's writes.
 * One gate is shared by all subscriptions because save() rewrites every
 * destination file.
 */
class StoreGate {
public:
    explicit StoreGate(KeyedFileStore::Destinations destinations) : destinations_(std::move(destinations)) {}

    // func(KeyedFileStore&) returns true when the store must be saved.
    template <typename Func>
    void update(const std::string& ctx, Func&& func) {
        std::scoped_lock lock(mutex_);
        logging::LogRegistry::store()->trace("[StoreGate::update] Reloading store: {}", ctx);

        auto store = KeyedFileStore::load(destinations_);
        if (!func(store)) return;

        store.save();
        logging::LogRegistry::store()->trace("[StoreGate::update] Store saved: {}", ctx);
    }

    // Returns func(const KeyedFileStore&) on a fresh reload; nothing is saved.
    template <typename Func>
    auto read(const std::string& ctx, Func&& func) const {
        std::scoped_lock lock(mutex_);
        logging::LogRegistry::store()->trace("[StoreGate::read] Reloading store: {}", ctx);
        const auto store = KeyedFileStore::load(destinations_);
        return func(store);
    }

    [[nodiscard]] const KeyedFileStore::Destinations& destinations() const { return destinations_; }

private:
    KeyedFileStore::Destinations destinations_;
    mutable std::mutex mutex_;
};

} // namespace fk::store
