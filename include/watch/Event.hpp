#pragma once

#include <filesystem>
#include <string>

namespace fk::watch {

struct Event {
    enum class Type { Created, Deleted, Moved };

    Type type;
    std::filesystem::path src;
    std::filesystem::path dest;   // Moved only
};

std::string to_string(Event::Type type);

} // namespace fk::watch
