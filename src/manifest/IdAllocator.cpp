#include "manifest/IdAllocator.hpp"

namespace fk::manifest {

namespace {

template <typename Container>
std::string lowestFree(const Container& ids) {
    unsigned long long n = 0;
    while (ids.contains(std::to_string(n))) ++n;
    return std::to_string(n);
}

}

std::string nextId(const std::set<std::string>& existing) { return lowestFree(existing); }

std::string nextId(const Manifest& manifest) { return lowestFree(manifest); }

} // namespace fk::manifest
