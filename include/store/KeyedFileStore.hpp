#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fk::store {

// Raised by set() for a key that was never registered to a destination file.
struct KeyError : std::out_of_range {
    using std::out_of_range::out_of_range;
};

// Raised by load() when a destination file exists but does not hold a JSON object.
struct ParseError : std::runtime_error {
    ParseError(const std::filesystem::path& file, const std::string& reason);

    std::filesystem::path file;
};

/**
 * Top-level keys partitioned by the destination file each one is flushed to.
 * A key must be registered to a destination (addKey) before set() accepts it,
 * so every value held here is persisted by save().
 */
class KeyedFileStore {
public:
    using Destinations = std::set<std::filesystem::path>;

    static KeyedFileStore create(const Destinations& destinations);
    static KeyedFileStore load(const Destinations& destinations);

    void addKey(const std::string& key, nlohmann::json value, const std::filesystem::path& destination);
    void set(const std::string& key, nlohmann::json value);

    [[nodiscard]] bool contains(const std::string& key) const { return values_.contains(key); }
    [[nodiscard]] bool isRegistered(const std::string& key) const;

    [[nodiscard]] const nlohmann::json& at(const std::string& key) const;
    nlohmann::json& at(const std::string& key);

    void save() const;

    [[nodiscard]] const std::map<std::filesystem::path, std::vector<std::string>>& registry() const { return destinations_; }

private:
    KeyedFileStore() = default;

    std::map<std::string, nlohmann::json> values_;
    std::map<std::filesystem::path, std::vector<std::string>> destinations_;
};

} // namespace fk::store
