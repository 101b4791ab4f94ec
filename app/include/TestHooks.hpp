#pragma once

#include <functional>
#include <optional>

#include "Types.hpp"

namespace TestHooks {

// Substitutes the free-space measurement of SpaceGuard.
using FreeSpaceOverride = std::function<std::optional<SpaceInfo>(const DriveRecord& drive)>;
void set_free_space_override(FreeSpaceOverride override_fn);
void reset_free_space_override();

} // namespace TestHooks
