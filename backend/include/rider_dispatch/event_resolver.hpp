#pragma once

#include <optional>

#include "types.hpp"

namespace rider_dispatch
{

std::optional<Event> resolve_event(const Plan &plan, const TestEvent &test_event);

} // namespace rider_dispatch
