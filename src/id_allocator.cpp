#include "larder/id_allocator.hpp"
#include "larder/errors.hpp"

#include <limits>

namespace larder {

uint64_t IdAllocator::next_id() {
    const uint64_t current_value = counter_.get();
    if (current_value == std::numeric_limits<uint64_t>::max()) {
        throw InternalError("Id counter exhausted");
    }
    const uint64_t id = current_value + 1;
    counter_.set(id);
    return id;
}

} // namespace larder
