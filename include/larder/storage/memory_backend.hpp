#pragma once

#include <map>
#include "larder/storage/backend.hpp"

namespace larder {
namespace storage {

/// Volatile backend. State lives as long as the object.
class MemoryMap final : public StableMap {
public:
    std::optional<std::string> get(uint64_t key) const override;
    void insert(uint64_t key, const std::string& value) override;
    std::optional<std::string> remove(uint64_t key) override;
    bool contains(uint64_t key) const override { return entries_.count(key) != 0; }
    std::size_t size() const override { return entries_.size(); }

private:
    std::map<uint64_t, std::string> entries_;
};

class MemoryCell final : public StableCell {
public:
    explicit MemoryCell(uint64_t initial = 0) : value_(initial) {}

    uint64_t get() const override { return value_; }
    void set(uint64_t value) override { value_ = value; }

private:
    uint64_t value_;
};

class MemoryBackend final : public Backend {
public:
    StableCell& counter() override { return counter_; }
    StableMap& records() override { return records_; }

private:
    MemoryCell counter_;
    MemoryMap records_;
};

} // namespace storage
} // namespace larder
