#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace fk::manifest {

// Human-readable label for an extension suffix such as "chop.tsv".
// Anything not in the catalog is "Unknown File".
std::string describe(std::string_view suffix);

// Every dot-separated segment of the file name after the first one,
// so "sample.chop.tsv" yields "chop.tsv" and "README" yields "".
std::string suffixOf(const std::filesystem::path& file);

} // namespace fk::manifest
