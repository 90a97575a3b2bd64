#include "rider_dispatch/event_processor.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "rider_dispatch/plan_checks.hpp"

namespace rider_dispatch
{
namespace
{

bool holds_order(const Plan &plan, RiderId rider_id, OrderId order_id)
{
    const auto it = plan.find(rider_id);
    if (it == plan.end())
    {
        return false;
    }
    return std::find(it->second.begin(), it->second.end(), order_id) != it->second.end();
}

void handle_rejection(Plan &plan, const RiderRejected &event)
{
    if (!holds_order(plan, event.rider_id, event.order_id))
    {
        std::cout << "Ignoring rejection: rider " << event.rider_id
                  << " does not hold order " << event.order_id << "." << std::endl;
        return;
    }

    const auto target = select_least_loaded_rider(plan, event.rider_id);
    if (!target)
    {
        throw PlanError(PlanErrorCode::NoAlternateRider,
                        "Rider " + std::to_string(event.rider_id) + " is the only rider; order " +
                            std::to_string(event.order_id) + " cannot be relocated.");
    }

    auto &orders = plan[event.rider_id];
    orders.erase(std::find(orders.begin(), orders.end(), event.order_id));
    plan[*target].push_back(event.order_id);

    std::cout << "Order " << event.order_id << " moved from rider " << event.rider_id
              << " to rider " << *target << "." << std::endl;
}

void handle_cancellation(Plan &plan, const OrderCanceled &event)
{
    for (auto &entry : plan)
    {
        auto &orders = entry.second;
        const auto it = std::find(orders.begin(), orders.end(), event.order_id);
        if (it != orders.end())
        {
            orders.erase(it);
            std::cout << "Order " << event.order_id << " canceled (was held by rider "
                      << entry.first << ")." << std::endl;
            return;
        }
    }

    std::cout << "Ignoring cancellation: order " << event.order_id << " is not planned." << std::endl;
}

} // namespace

Plan apply_event(Plan plan, const Event &event)
{
    std::visit(
        [&plan](const auto &e)
        {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, RiderRejected>)
            {
                handle_rejection(plan, e);
            }
            else
            {
                handle_cancellation(plan, e);
            }
        },
        event);
    return plan;
}

Plan apply_events(Plan plan, const std::vector<Event> &events)
{
    for (const auto &event : events)
    {
        plan = apply_event(std::move(plan), event);
    }
    return plan;
}

bool is_noop(const Plan &plan, const Event &event)
{
    if (const auto *rejection = std::get_if<RiderRejected>(&event))
    {
        return !holds_order(plan, rejection->rider_id, rejection->order_id);
    }
    return !find_holder(plan, std::get<OrderCanceled>(event).order_id).has_value();
}

} // namespace rider_dispatch
