#include "rider_dispatch/codec.hpp"

#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

#include "rider_dispatch/plan_checks.hpp"

namespace rider_dispatch
{
namespace
{

using json = nlohmann::json;

// Accepts either a bare integer or an object carrying "id".
template <typename Id>
Id read_id(const json &value)
{
    if (value.is_object())
    {
        return value.at("id").get<Id>();
    }
    return value.get<Id>();
}

} // namespace

json riders_to_json(const std::vector<Rider> &riders)
{
    json riders_json = json::array();
    for (const auto &rider : riders)
    {
        riders_json.push_back({{"id", rider.id}});
    }
    return riders_json;
}

json orders_to_json(const std::vector<Order> &orders)
{
    json orders_json = json::array();
    for (const auto &order : orders)
    {
        orders_json.push_back({{"id", order.id}});
    }
    return orders_json;
}

std::vector<Rider> riders_from_json(const json &riders_json)
{
    if (!riders_json.is_array())
    {
        throw std::runtime_error("Expected an array of riders.");
    }

    std::vector<Rider> riders;
    riders.reserve(riders_json.size());
    for (const auto &r : riders_json)
    {
        riders.push_back({read_id<RiderId>(r)});
    }
    return riders;
}

std::vector<Order> orders_from_json(const json &orders_json)
{
    if (!orders_json.is_array())
    {
        throw std::runtime_error("Expected an array of orders.");
    }

    std::vector<Order> orders;
    orders.reserve(orders_json.size());
    for (const auto &o : orders_json)
    {
        orders.push_back({read_id<OrderId>(o)});
    }
    return orders;
}

json plan_to_json(const Plan &plan)
{
    json plan_json = json::array();
    for (const auto rider_id : sorted_rider_ids(plan))
    {
        plan_json.push_back({
            {"rider_id", rider_id},
            {"orders", plan.at(rider_id)}});
    }
    return plan_json;
}

Plan plan_from_json(const json &plan_json)
{
    if (!plan_json.is_array())
    {
        throw std::runtime_error("Expected a plan array.");
    }

    Plan plan;
    for (const auto &entry : plan_json)
    {
        const auto rider_id = entry.at("rider_id").get<RiderId>();
        if (plan.count(rider_id))
        {
            throw std::runtime_error("Rider " + std::to_string(rider_id) + " listed twice in plan.");
        }
        plan[rider_id] = entry.value("orders", std::vector<OrderId>{});
    }
    return plan;
}

json event_to_json(const Event &event)
{
    return std::visit(
        [](const auto &e) -> json
        {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, RiderRejected>)
            {
                return {{"type", "rider_rejected"}, {"rider_id", e.rider_id}, {"order_id", e.order_id}};
            }
            else
            {
                return {{"type", "order_canceled"}, {"order_id", e.order_id}};
            }
        },
        event);
}

Event event_from_json(const json &event_json)
{
    const std::string type = event_json.at("type").get<std::string>();
    if (type == "rider_rejected")
    {
        return RiderRejected{
            event_json.at("rider_id").get<RiderId>(),
            event_json.at("order_id").get<OrderId>()};
    }
    if (type == "order_canceled")
    {
        return OrderCanceled{event_json.at("order_id").get<OrderId>()};
    }
    throw std::runtime_error("Unknown event type: " + type);
}

TestEvent test_event_from_json(const json &event_json)
{
    const std::string type = event_json.at("type").get<std::string>();
    if (type == "rider_rejected")
    {
        return RejectionDraw{
            event_json.value("which_rider", std::size_t{0}),
            event_json.value("which_order", std::size_t{0})};
    }
    if (type == "order_canceled")
    {
        return CancellationDraw{event_json.value("which_order", std::size_t{0})};
    }
    throw std::runtime_error("Unknown event type: " + type);
}

json report_to_json(const PlanReport &report)
{
    return {
        {"rider_count", report.rider_count},
        {"order_count", report.order_count},
        {"min_load", report.min_load},
        {"max_load", report.max_load},
        {"duplicate_orders", report.duplicate_orders},
        {"idle_riders", report.idle_riders},
        {"fair", report.fair}};
}

} // namespace rider_dispatch
