#include "larder/storage/file_backend.hpp"
#include "larder/errors.hpp"

#include <array>
#include <system_error>

namespace larder {
namespace storage {

namespace {

constexpr uint8_t TAG_PUT = 1;
constexpr uint8_t TAG_ERASE = 2;
constexpr std::size_t ENTRY_HEADER_SIZE = 1 + 8 + 4;

template<typename Word>
void put_le(Word value, char* out) {
    for (std::size_t i = 0; i < sizeof(Word); ++i) {
        out[i] = static_cast<char>((value >> (8 * i)) & 0xFF);
    }
}

template<typename Word>
Word get_le(const char* in) {
    Word value = 0;
    for (std::size_t i = 0; i < sizeof(Word); ++i) {
        value |= static_cast<Word>(static_cast<unsigned char>(in[i])) << (8 * i);
    }
    return value;
}

void write_entry(std::ostream& out, uint8_t tag, uint64_t key, const std::string& value) {
    std::array<char, ENTRY_HEADER_SIZE> header{};
    header[0] = static_cast<char>(tag);
    put_le<uint64_t>(key, header.data() + 1);
    put_le<uint32_t>(static_cast<uint32_t>(value.size()), header.data() + 9);
    out.write(header.data(), static_cast<std::streamsize>(header.size()));
    out.write(value.data(), static_cast<std::streamsize>(value.size()));
}

} // anonymous namespace

// =============================================================================
// FileMap
// =============================================================================

FileMap::FileMap(std::filesystem::path path)
    : path_(std::move(path)) {
    replay_();
    if (log_entries_ > 2 * index_.size()) {
        compact();
    } else {
        open_for_append_();
    }
}

std::optional<std::string> FileMap::get(uint64_t key) const {
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

void FileMap::insert(uint64_t key, const std::string& value) {
    append_(TAG_PUT, key, value);
    index_[key] = value;
}

std::optional<std::string> FileMap::remove(uint64_t key) {
    auto it = index_.find(key);
    if (it == index_.end()) return std::nullopt;

    append_(TAG_ERASE, key, std::string());
    std::string previous = std::move(it->second);
    index_.erase(it);
    return previous;
}

void FileMap::compact() {
    if (log_.is_open()) log_.close();

    auto tmp_path = path_;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StorageError("Cannot open " + tmp_path.string() + " for compaction");
        }
        for (const auto& [key, value] : index_) {
            write_entry(out, TAG_PUT, key, value);
        }
        out.flush();
        if (!out) {
            throw StorageError("Failed to write compacted log " + tmp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        throw StorageError("Cannot replace " + path_.string() + ": " + ec.message());
    }
    log_entries_ = index_.size();
    open_for_append_();
}

void FileMap::replay_() {
    std::ifstream in(path_, std::ios::binary);
    if (!in) return;  // fresh store

    std::error_code ec;
    const uint64_t file_size = std::filesystem::file_size(path_, ec);
    if (ec) {
        throw StorageError("Cannot stat " + path_.string() + ": " + ec.message());
    }

    uint64_t good_offset = 0;
    std::array<char, ENTRY_HEADER_SIZE> header{};
    while (in.read(header.data(), static_cast<std::streamsize>(header.size()))) {
        const auto tag = static_cast<uint8_t>(header[0]);
        const auto key = get_le<uint64_t>(header.data() + 1);
        const auto length = get_le<uint32_t>(header.data() + 9);
        if (good_offset + ENTRY_HEADER_SIZE + length > file_size) {
            break;
        }

        std::string value(length, '\0');
        if (length > 0 && !in.read(&value[0], static_cast<std::streamsize>(length))) {
            break;
        }

        if (tag == TAG_PUT) {
            index_[key] = std::move(value);
        } else if (tag == TAG_ERASE) {
            index_.erase(key);
        } else {
            throw StorageError("Corrupt entry in " + path_.string() +
                               " at offset " + std::to_string(good_offset));
        }
        good_offset += ENTRY_HEADER_SIZE + length;
        ++log_entries_;
    }
    in.close();

    if (file_size > good_offset) {
        std::filesystem::resize_file(path_, good_offset, ec);
        if (ec) {
            throw StorageError("Cannot truncate torn tail of " + path_.string() + ": " + ec.message());
        }
    }
}

void FileMap::open_for_append_() {
    log_.open(path_, std::ios::binary | std::ios::app);
    if (!log_) {
        throw StorageError("Cannot open " + path_.string() + " for writing");
    }
}

void FileMap::append_(uint8_t tag, uint64_t key, const std::string& value) {
    write_entry(log_, tag, key, value);
    log_.flush();
    if (!log_) {
        throw StorageError("Failed to append to " + path_.string());
    }
    ++log_entries_;
}

// =============================================================================
// FileCell
// =============================================================================

FileCell::FileCell(std::filesystem::path path, uint64_t initial)
    : path_(std::move(path)), value_(initial) {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        set(initial);
        return;
    }

    std::array<char, 8> raw{};
    if (!in.read(raw.data(), static_cast<std::streamsize>(raw.size()))) {
        throw StorageError("Truncated counter file " + path_.string());
    }
    value_ = get_le<uint64_t>(raw.data());
}

void FileCell::set(uint64_t value) {
    auto tmp_path = path_;
    tmp_path += ".tmp";
    {
        std::array<char, 8> raw{};
        put_le<uint64_t>(value, raw.data());

        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        out.write(raw.data(), static_cast<std::streamsize>(raw.size()));
        out.flush();
        if (!out) {
            throw StorageError("Failed to write " + tmp_path.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        throw StorageError("Cannot replace " + path_.string() + ": " + ec.message());
    }
    value_ = value;
}

// =============================================================================
// FileBackend
// =============================================================================

FileBackend::FileBackend(const std::filesystem::path& data_dir)
    : data_dir_(data_dir) {
    std::error_code ec;
    std::filesystem::create_directories(data_dir_, ec);
    if (ec) {
        throw StorageError("Cannot create data directory " + data_dir_.string() + ": " + ec.message());
    }
    counter_ = std::make_unique<FileCell>(data_dir_ / COUNTER_FILE);
    records_ = std::make_unique<FileMap>(data_dir_ / RECORDS_FILE);
}

} // namespace storage
} // namespace larder
