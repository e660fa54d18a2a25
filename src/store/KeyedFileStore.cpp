#include "store/KeyedFileStore.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fstream>

using namespace fk::store;
using namespace fk::logging;

namespace fs = std::filesystem;

ParseError::ParseError(const fs::path& file, const std::string& reason)
    : std::runtime_error("Failed to parse " + file.string() + ": " + reason), file(file) {}

KeyedFileStore KeyedFileStore::create(const Destinations& destinations) {
    KeyedFileStore store;
    for (const auto& dest : destinations) store.destinations_[dest] = {};
    return store;
}

KeyedFileStore KeyedFileStore::load(const Destinations& destinations) {
    auto store = create(destinations);

    for (const auto& dest : destinations) {
        if (!fs::is_regular_file(dest)) {
            LogRegistry::store()->debug("[KeyedFileStore] No data file yet at {}", dest.string());
            continue;
        }

        std::ifstream in(dest);
        if (!in.is_open()) throw std::runtime_error("Failed to open data file: " + dest.string());

        nlohmann::json current;
        try {
            current = nlohmann::json::parse(in);
        } catch (const nlohmann::json::parse_error& e) {
            throw ParseError(dest, e.what());
        }
        if (!current.is_object()) throw ParseError(dest, "top-level value is not an object");

        for (auto& [key, value] : current.items()) store.addKey(key, std::move(value), dest);
        LogRegistry::store()->trace("[KeyedFileStore] Loaded {} keys from {}", current.size(), dest.string());
    }

    return store;
}

void KeyedFileStore::addKey(const std::string& key, nlohmann::json value, const fs::path& destination) {
    for (auto& [dest, keys] : destinations_)
        if (dest != destination) std::erase(keys, key);

    auto& keys = destinations_[destination];
    if (std::ranges::find(keys, key) == keys.end()) keys.push_back(key);
    values_[key] = std::move(value);
}

void KeyedFileStore::set(const std::string& key, nlohmann::json value) {
    if (!isRegistered(key)) throw KeyError("Key " + key + " has no associated file. Use addKey() first");
    values_[key] = std::move(value);
}

bool KeyedFileStore::isRegistered(const std::string& key) const {
    return std::ranges::any_of(destinations_, [&](const auto& dest) {
        return std::ranges::find(dest.second, key) != dest.second.end();
    });
}

const nlohmann::json& KeyedFileStore::at(const std::string& key) const {
    const auto it = values_.find(key);
    if (it == values_.end()) throw KeyError("Key " + key + " is not set");
    return it->second;
}

nlohmann::json& KeyedFileStore::at(const std::string& key) {
    const auto it = values_.find(key);
    if (it == values_.end()) throw KeyError("Key " + key + " is not set");
    return it->second;
}

void KeyedFileStore::save() const {
    for (const auto& [dest, keys] : destinations_) {
        if (dest.has_parent_path()) fs::create_directories(dest.parent_path());

        nlohmann::json out = nlohmann::json::object();
        for (const auto& key : keys)
            if (const auto it = values_.find(key); it != values_.end()) out[key] = it->second;

        std::ofstream writer(dest, std::ios::trunc);
        if (!writer.is_open()) throw std::runtime_error("Failed to write data file: " + dest.string());
        writer << out.dump(1, '\t');
        writer.close();
        if (writer.fail()) throw std::runtime_error("Failed to flush data file: " + dest.string());

        LogRegistry::store()->trace("[KeyedFileStore] Saved {} keys to {}", out.size(), dest.string());
    }
}
