#pragma once

#include <vector>

#include "types.hpp"

namespace rider_dispatch
{

// Round robin: the i-th order goes to riders[i % riders.size()]. Every input
// rider is a key of the result, possibly with an empty sequence.
// Ids are assumed unique within each input. Throws PlanError(EmptyRiderSet).
Plan build_plan(const std::vector<Rider> &riders, const std::vector<Order> &orders);

} // namespace rider_dispatch
