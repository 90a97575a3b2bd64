#pragma once

#include <nlohmann/json.hpp>

#include <vector>

#include "types.hpp"

namespace rider_dispatch
{

nlohmann::json riders_to_json(const std::vector<Rider> &riders);
nlohmann::json orders_to_json(const std::vector<Order> &orders);
std::vector<Rider> riders_from_json(const nlohmann::json &riders_json);
std::vector<Order> orders_from_json(const nlohmann::json &orders_json);

nlohmann::json plan_to_json(const Plan &plan);
Plan plan_from_json(const nlohmann::json &plan_json);

nlohmann::json event_to_json(const Event &event);
Event event_from_json(const nlohmann::json &event_json);
TestEvent test_event_from_json(const nlohmann::json &event_json);

nlohmann::json report_to_json(const PlanReport &report);

} // namespace rider_dispatch
