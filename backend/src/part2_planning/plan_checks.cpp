#include "rider_dispatch/plan_checks.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <vector>

namespace rider_dispatch
{

std::vector<RiderId> sorted_rider_ids(const Plan &plan)
{
    std::vector<RiderId> rider_ids;
    rider_ids.reserve(plan.size());
    for (const auto &entry : plan)
    {
        rider_ids.push_back(entry.first);
    }
    std::sort(rider_ids.begin(), rider_ids.end());
    return rider_ids;
}

std::vector<OrderId> collect_order_ids(const Plan &plan)
{
    std::vector<OrderId> order_ids;
    for (const auto &[rider_id, orders] : plan)
    {
        order_ids.insert(order_ids.end(), orders.begin(), orders.end());
    }
    std::sort(order_ids.begin(), order_ids.end());
    return order_ids;
}

std::vector<OrderId> sorted_order_ids(const Plan &plan)
{
    auto order_ids = collect_order_ids(plan);
    order_ids.erase(std::unique(order_ids.begin(), order_ids.end()), order_ids.end());
    return order_ids;
}

std::size_t rider_load(const Plan &plan, RiderId rider_id)
{
    const auto it = plan.find(rider_id);
    return it == plan.end() ? 0 : it->second.size();
}

std::optional<RiderId> find_holder(const Plan &plan, OrderId order_id)
{
    for (const auto rider_id : sorted_rider_ids(plan))
    {
        const auto &orders = plan.at(rider_id);
        if (std::find(orders.begin(), orders.end(), order_id) != orders.end())
        {
            return rider_id;
        }
    }
    return std::nullopt;
}

std::optional<RiderId> select_least_loaded_rider(const Plan &plan, RiderId excluded)
{
    std::optional<RiderId> best;
    std::size_t best_load = std::numeric_limits<std::size_t>::max();

    // Ascending ids, so a strict comparison keeps the smallest id on ties.
    for (const auto rider_id : sorted_rider_ids(plan))
    {
        if (rider_id == excluded)
        {
            continue;
        }

        const std::size_t load = plan.at(rider_id).size();
        if (load < best_load)
        {
            best = rider_id;
            best_load = load;
        }
    }

    return best;
}

std::vector<OrderId> find_duplicate_orders(const Plan &plan)
{
    const auto order_ids = collect_order_ids(plan);

    std::vector<OrderId> duplicates;
    for (size_t i = 1; i < order_ids.size(); i++)
    {
        if (order_ids[i] == order_ids[i - 1] && (duplicates.empty() || duplicates.back() != order_ids[i]))
        {
            duplicates.push_back(order_ids[i]);
        }
    }
    return duplicates;
}

bool is_fair(const Plan &plan)
{
    if (plan.empty())
    {
        return true;
    }

    const auto [min_it, max_it] = std::minmax_element(
        plan.begin(), plan.end(),
        [](const auto &a, const auto &b)
        { return a.second.size() < b.second.size(); });

    return max_it->second.size() - min_it->second.size() <= 1;
}

PlanReport check_plan(const Plan &plan)
{
    PlanReport report;
    report.rider_count = plan.size();
    report.duplicate_orders = find_duplicate_orders(plan);
    report.fair = is_fair(plan);

    if (plan.empty())
    {
        return report;
    }

    report.min_load = std::numeric_limits<std::size_t>::max();
    for (const auto rider_id : sorted_rider_ids(plan))
    {
        const std::size_t load = plan.at(rider_id).size();
        report.order_count += load;
        report.min_load = std::min(report.min_load, load);
        report.max_load = std::max(report.max_load, load);
        if (load == 0)
        {
            report.idle_riders.push_back(rider_id);
        }
    }

    return report;
}

} // namespace rider_dispatch
