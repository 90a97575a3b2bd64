#include "rider_dispatch/plan_builder.hpp"

#include <iostream>
#include <vector>

namespace rider_dispatch
{

Plan build_plan(const std::vector<Rider> &riders, const std::vector<Order> &orders)
{
    if (riders.empty())
    {
        throw PlanError(PlanErrorCode::EmptyRiderSet, "Cannot build a plan without riders.");
    }

    Plan plan;
    plan.reserve(riders.size());
    for (const auto &rider : riders)
    {
        plan.try_emplace(rider.id);
    }

    for (size_t i = 0; i < orders.size(); i++)
    {
        const auto &rider = riders[i % riders.size()];
        plan[rider.id].push_back(orders[i].id);
    }

    std::cout << "Built plan: " << orders.size() << " orders across "
              << riders.size() << " riders." << std::endl;

    return plan;
}

} // namespace rider_dispatch
