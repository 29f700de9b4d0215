#include "larder/storage/memory_backend.hpp"

namespace larder {
namespace storage {

std::optional<std::string> MemoryMap::get(uint64_t key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void MemoryMap::insert(uint64_t key, const std::string& value) {
    entries_[key] = value;
}

std::optional<std::string> MemoryMap::remove(uint64_t key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    std::string previous = std::move(it->second);
    entries_.erase(it);
    return previous;
}

} // namespace storage
} // namespace larder
