#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "types.hpp"

namespace rider_dispatch
{

std::vector<RiderId> sorted_rider_ids(const Plan &plan);
std::vector<OrderId> sorted_order_ids(const Plan &plan);
std::vector<OrderId> collect_order_ids(const Plan &plan);

std::size_t rider_load(const Plan &plan, RiderId rider_id);
std::optional<RiderId> find_holder(const Plan &plan, OrderId order_id);
// Fewest held orders among riders other than `excluded`, smallest id on ties.
// Empty when no other rider exists.
std::optional<RiderId> select_least_loaded_rider(const Plan &plan, RiderId excluded);

std::vector<OrderId> find_duplicate_orders(const Plan &plan);
bool is_fair(const Plan &plan);
PlanReport check_plan(const Plan &plan);

} // namespace rider_dispatch
