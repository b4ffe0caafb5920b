#pragma once

#include <cstddef>

namespace sigil::engine {

/// Process-wide count of engine allocations handed across the C ABI.
class LiveObjects {
public:
    static void Acquire() noexcept;
    static void Release() noexcept;
    static size_t Count() noexcept;
};

/// Base for every object type exported through the C ABI; construction and
/// destruction keep LiveObjects in step.
struct Tracked {
    Tracked() noexcept { LiveObjects::Acquire(); }
    Tracked(const Tracked&) noexcept { LiveObjects::Acquire(); }
    Tracked(Tracked&&) noexcept { LiveObjects::Acquire(); }
    Tracked& operator=(const Tracked&) noexcept = default;
    Tracked& operator=(Tracked&&) noexcept = default;
    ~Tracked() { LiveObjects::Release(); }
};

}
