#pragma once

#include <filesystem>
#include <nlohmann/json_fwd.hpp>

// Upgrades of on-disk shapes written by older releases. Each step is applied
// once per record at startup, before reconciliation, and only ever produces
// the current entry shape.
namespace fk::manifest::migration {

// Dropbox entries stored as a bare path string become full entries under the
// same ID. Relative strings are resolved against root. Returns true if
// anything changed.
bool upgradeDropbox(nlohmann::json& dropbox, const std::filesystem::path& root);

// A process record whose "files" is an array of paths becomes a manifest keyed
// "0".."n-1" in array order. A record without "files" gets an empty manifest.
bool upgradeProcessFiles(nlohmann::json& record);

} // namespace fk::manifest::migration
