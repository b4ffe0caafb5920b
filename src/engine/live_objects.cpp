#include "live_objects.hpp"

#include <atomic>

namespace sigil::engine {

namespace {
    std::atomic<size_t> live_count{0};
}

void LiveObjects::Acquire() noexcept {
    live_count.fetch_add(1, std::memory_order_relaxed);
}

void LiveObjects::Release() noexcept {
    live_count.fetch_sub(1, std::memory_order_relaxed);
}

size_t LiveObjects::Count() noexcept {
    return live_count.load(std::memory_order_relaxed);
}

}
