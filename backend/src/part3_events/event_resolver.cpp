#include "rider_dispatch/event_resolver.hpp"

#include <optional>
#include <variant>

#include "rider_dispatch/plan_checks.hpp"

namespace rider_dispatch
{

std::optional<Event> resolve_event(const Plan &plan, const TestEvent &test_event)
{
    if (const auto *draw = std::get_if<RejectionDraw>(&test_event))
    {
        const auto rider_ids = sorted_rider_ids(plan);
        if (rider_ids.empty())
        {
            return std::nullopt;
        }

        const RiderId rider_id = rider_ids[draw->which_rider % rider_ids.size()];
        const auto &orders = plan.at(rider_id);
        if (orders.empty())
        {
            return std::nullopt;
        }

        return Event{RiderRejected{rider_id, orders[draw->which_order % orders.size()]}};
    }

    const auto &draw = std::get<CancellationDraw>(test_event);
    const auto order_ids = sorted_order_ids(plan);
    if (order_ids.empty())
    {
        return std::nullopt;
    }

    return Event{OrderCanceled{order_ids[draw.which_order % order_ids.size()]}};
}

} // namespace rider_dispatch
