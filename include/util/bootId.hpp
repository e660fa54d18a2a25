#pragma once

#include <filesystem>
#include <fstream>
#include <string>

namespace fk::util {

inline constexpr auto BOOT_ID_PATH = "/proc/sys/kernel/random/boot_id";

// Kernel boot identifier, changes on every reboot. Empty if unavailable.
inline std::string currentBootId(const std::filesystem::path& source = BOOT_ID_PATH) {
    std::ifstream in(source);
    std::string id;
    if (!in.is_open() || !(in >> id)) return {};
    return id;
}

} // namespace fk::util
