#include <gtest/gtest.h>
#include <limits>
#include "larder/errors.hpp"
#include "larder/inventory.hpp"
#include "larder/state.hpp"
#include "larder/storage/memory_backend.hpp"

using namespace larder;

class StockAdjustmentTest : public ::testing::Test {
protected:
    uint64_t add_bread(uint32_t quantity = 10) {
        return inventory_.add_product({"Bread", quantity, Category::Bakery}).id;
    }

    storage::MemoryBackend backend_;
    State state_{backend_};
    Inventory inventory_{state_};
};

// =============================================================================
// Offload Tests
// =============================================================================

TEST_F(StockAdjustmentTest, Offload_BreadScenario_ShouldGuardUnderflow) {
    // Given Bread with 10 in stock
    auto id = add_bread(10);
    ASSERT_EQ(id, 1u);

    // When offloading more than available
    try {
        inventory_.offload_quantity(id, {15});
        FAIL() << "Expected InvalidOperationError";
    } catch (const InvalidOperationError& e) {
        EXPECT_STREQ(e.what(),
            "Cannot offload more than available quantity. Available: 10, Trying to offload: 15");
    }
    EXPECT_EQ(inventory_.get_stock(id), 10u);

    // When offloading everything
    auto emptied = inventory_.offload_quantity(id, {10});
    EXPECT_EQ(emptied.quantity, 0u);
    EXPECT_TRUE(emptied.updated_at.has_value());

    // Then further offloads are rejected
    try {
        inventory_.offload_quantity(id, {1});
        FAIL() << "Expected InvalidOperationError";
    } catch (const InvalidOperationError& e) {
        EXPECT_STREQ(e.what(), "Product with id=1 cannot be offloaded because the quantity is 0");
    }
    EXPECT_EQ(inventory_.get_stock(id), 0u);
}

TEST_F(StockAdjustmentTest, Offload_WithZeroAmount_ShouldThrowInvalidOperation) {
    auto id = add_bread();

    EXPECT_THROW(inventory_.offload_quantity(id, {0}), InvalidOperationError);
    EXPECT_EQ(inventory_.get_stock(id), 10u);
}

TEST_F(StockAdjustmentTest, Offload_OfMissingId_ShouldThrowNotFound) {
    try {
        inventory_.offload_quantity(3, {1});
        FAIL() << "Expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_STREQ(e.what(), "Couldn't offload a product with id=3. Product not found");
    }
}

TEST_F(StockAdjustmentTest, Offload_ThenAdd_ShouldRestoreQuantity) {
    auto id = add_bread(25);

    for (uint32_t amount : {1u, 7u, 25u}) {
        inventory_.offload_quantity(id, {amount});
        auto restored = inventory_.add_quantity(id, {amount});
        EXPECT_EQ(restored.quantity, 25u);
    }
}

TEST_F(StockAdjustmentTest, Offload_ShouldPreserveOtherFields) {
    auto created = inventory_.add_product({"Macaron", 8, Category::Cookies});

    auto after = inventory_.offload_quantity(created.id, {3});

    EXPECT_EQ(after.name, created.name);
    EXPECT_EQ(after.category, created.category);
    EXPECT_EQ(after.created_at, created.created_at);
    EXPECT_EQ(after.quantity, 5u);
}

// =============================================================================
// Add Quantity Tests
// =============================================================================

TEST_F(StockAdjustmentTest, AddQuantity_ShouldIncreaseAndStamp) {
    auto id = add_bread(10);

    auto updated = inventory_.add_quantity(id, {5});

    EXPECT_EQ(updated.quantity, 15u);
    EXPECT_TRUE(updated.updated_at.has_value());
    EXPECT_EQ(inventory_.get_product(id), updated);
}

TEST_F(StockAdjustmentTest, AddQuantity_AfterEmptying_ShouldAllowOffloadAgain) {
    auto id = add_bread(2);
    inventory_.offload_quantity(id, {2});

    inventory_.add_quantity(id, {3});

    EXPECT_EQ(inventory_.offload_quantity(id, {1}).quantity, 2u);
}

TEST_F(StockAdjustmentTest, AddQuantity_WithZeroAmount_ShouldThrowInvalidOperation) {
    auto id = add_bread();

    EXPECT_THROW(inventory_.add_quantity(id, {0}), InvalidOperationError);
}

TEST_F(StockAdjustmentTest, AddQuantity_OfMissingId_ShouldThrowNotFound) {
    try {
        inventory_.add_quantity(8, {0});
        FAIL() << "Expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_STREQ(e.what(), "Couldn't add quantity to product with id=8. Product not found");
    }
}

TEST_F(StockAdjustmentTest, AddQuantity_PastMaximum_ShouldThrowInternalErrorAndKeepRecord) {
    auto id = add_bread(std::numeric_limits<uint32_t>::max() - 1);
    auto before = inventory_.get_product(id);

    EXPECT_THROW(inventory_.add_quantity(id, {2}), InternalError);
    EXPECT_EQ(inventory_.get_product(id), before);

    EXPECT_EQ(inventory_.add_quantity(id, {1}).quantity, std::numeric_limits<uint32_t>::max());
}
