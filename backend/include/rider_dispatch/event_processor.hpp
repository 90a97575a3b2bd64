#pragma once

#include <vector>

#include "types.hpp"

namespace rider_dispatch
{

// RiderRejected moves the order to the least loaded other rider and throws
// PlanError(NoAlternateRider) when the rejecting rider is alone. Events naming
// a rider or order the plan does not hold leave it unchanged.
Plan apply_event(Plan plan, const Event &event);
Plan apply_events(Plan plan, const std::vector<Event> &events);

// True when apply_event would return the plan unchanged.
bool is_noop(const Plan &plan, const Event &event);

} // namespace rider_dispatch
