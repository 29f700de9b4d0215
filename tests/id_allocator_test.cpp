#include <gtest/gtest.h>
#include <limits>
#include "larder/errors.hpp"
#include "larder/id_allocator.hpp"
#include "larder/storage/memory_backend.hpp"

using namespace larder;

namespace {

/// Cell whose writes always fail.
class FailingCell : public storage::StableCell {
public:
    uint64_t get() const override { return value_; }
    void set(uint64_t) override { throw StorageError("counter write failed"); }

private:
    uint64_t value_ = 3;
};

} // anonymous namespace

TEST(IdAllocatorTest, FreshCounter_ShouldStartAtOne) {
    storage::MemoryCell cell;
    IdAllocator ids(cell);

    EXPECT_EQ(ids.current(), 0u);
    EXPECT_EQ(ids.next_id(), 1u);
    EXPECT_EQ(ids.current(), 1u);
}

TEST(IdAllocatorTest, NextId_ShouldBeStrictlyIncreasing) {
    storage::MemoryCell cell;
    IdAllocator ids(cell);

    uint64_t previous = 0;
    for (int i = 0; i < 100; ++i) {
        uint64_t id = ids.next_id();
        EXPECT_EQ(id, previous + 1);
        previous = id;
    }
    EXPECT_EQ(cell.get(), 100u);
}

TEST(IdAllocatorTest, ExistingCounter_ShouldContinueFromStoredValue) {
    storage::MemoryCell cell(41);
    IdAllocator ids(cell);

    EXPECT_EQ(ids.next_id(), 42u);
}

TEST(IdAllocatorTest, FailedPersist_ShouldThrowAndNotAdvance) {
    FailingCell cell;
    IdAllocator ids(cell);

    EXPECT_THROW(ids.next_id(), StorageError);
    EXPECT_EQ(ids.current(), 3u);
}

TEST(IdAllocatorTest, ExhaustedCounter_ShouldThrowInternalError) {
    storage::MemoryCell cell(std::numeric_limits<uint64_t>::max());
    IdAllocator ids(cell);

    EXPECT_THROW(ids.next_id(), InternalError);
}
