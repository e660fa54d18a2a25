#pragma once

#include "manifest/Entry.hpp"

#include <set>
#include <string>

namespace fk::manifest {

// Smallest n >= 0 whose decimal form is not already an ID, so IDs freed by
// a deletion are handed out again first.
std::string nextId(const std::set<std::string>& existing);
std::string nextId(const Manifest& manifest);

} // namespace fk::manifest
