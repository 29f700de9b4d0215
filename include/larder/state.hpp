#pragma once

#include "larder/id_allocator.hpp"
#include "larder/product_repository.hpp"
#include "larder/storage/backend.hpp"

namespace larder {

/// Process-owned store state: the id counter and the record map.
struct State {
    explicit State(storage::Backend& backend)
        : ids(backend.counter()), products(backend.records()) {}

    IdAllocator ids;
    ProductRepository products;
};

} // namespace larder
