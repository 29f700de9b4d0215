#pragma once

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include "larder/storage/backend.hpp"

namespace larder {
namespace storage {

/**
 * Record map persisted as an append-only log of put/erase entries.
 *
 * Entry layout: tag (u8), key (u64 LE), length (u32 LE), payload[length].
 * The log is replayed into an in-memory index on open. A torn entry at the
 * tail is cut off. The log is rewritten when dead entries outnumber live ones.
 * Not thread-safe.
 */
class FileMap final : public StableMap {
public:
    explicit FileMap(std::filesystem::path path);

    std::optional<std::string> get(uint64_t key) const override;
    void insert(uint64_t key, const std::string& value) override;
    std::optional<std::string> remove(uint64_t key) override;
    bool contains(uint64_t key) const override { return index_.count(key) != 0; }
    std::size_t size() const override { return index_.size(); }

    /// Number of entries currently in the log, live or dead.
    std::size_t log_entries() const { return log_entries_; }

    /// Rewrites the log so that it holds exactly one put per live key.
    void compact();

private:
    void replay_();
    void open_for_append_();
    void append_(uint8_t tag, uint64_t key, const std::string& value);

    std::filesystem::path path_;
    std::ofstream log_;
    std::map<uint64_t, std::string> index_;
    std::size_t log_entries_ = 0;
};

/**
 * Scalar cell stored as 8 little-endian bytes. Writes go to a temporary
 * file that is renamed over the old one.
 */
class FileCell final : public StableCell {
public:
    explicit FileCell(std::filesystem::path path, uint64_t initial = 0);

    uint64_t get() const override { return value_; }
    void set(uint64_t value) override;

private:
    std::filesystem::path path_;
    uint64_t value_;
};

/**
 * Backend rooted at a data directory holding counter.bin and products.log.
 */
class FileBackend final : public Backend {
public:
    static constexpr const char* COUNTER_FILE = "counter.bin";
    static constexpr const char* RECORDS_FILE = "products.log";

    explicit FileBackend(const std::filesystem::path& data_dir);

    StableCell& counter() override { return *counter_; }
    StableMap& records() override { return *records_; }

    const std::filesystem::path& data_dir() const { return data_dir_; }

private:
    std::filesystem::path data_dir_;
    std::unique_ptr<FileCell> counter_;
    std::unique_ptr<FileMap> records_;
};

} // namespace storage
} // namespace larder
