#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <optional>
#include <set>
#include <variant>
#include <vector>

#include "rider_dispatch/event_processor.hpp"
#include "rider_dispatch/event_resolver.hpp"
#include "rider_dispatch/plan_builder.hpp"
#include "rider_dispatch/plan_checks.hpp"
#include "test_support.hpp"

namespace rider_dispatch
{
namespace
{

bool holds(const Plan &plan, RiderId rider_id, OrderId order_id)
{
    const auto &orders = plan.at(rider_id);
    return std::find(orders.begin(), orders.end(), order_id) != orders.end();
}

Plan scenario_plan()
{
    return build_plan({{1}, {2}, {3}}, {{10}, {20}, {30}, {40}, {50}});
}

TEST(EventProcessorTest, RejectionMovesOrderToLeastLoadedRider)
{
    const Plan plan = apply_event(scenario_plan(), RiderRejected{1, 10});

    const Plan expected{{1, {40}}, {2, {20, 50}}, {3, {30, 10}}};
    EXPECT_EQ(plan, expected);
}

TEST(EventProcessorTest, RejectionThenCancellation)
{
    Plan plan = apply_event(scenario_plan(), RiderRejected{1, 10});
    plan = apply_event(plan, OrderCanceled{50});

    const Plan expected{{1, {40}}, {2, {20}}, {3, {30, 10}}};
    EXPECT_EQ(plan, expected);
}

TEST(EventProcessorTest, ApplyEventsFoldsInOrder)
{
    const Plan plan = apply_events(scenario_plan(), {RiderRejected{1, 10}, OrderCanceled{50}});

    const Plan expected{{1, {40}}, {2, {20}}, {3, {30, 10}}};
    EXPECT_EQ(plan, expected);
}

TEST(EventProcessorTest, TieGoesToSmallestRiderId)
{
    const Plan start{{8, {1, 2}}, {5, {3}}, {2, {4}}, {9, {5}}};

    const Plan plan = apply_event(start, RiderRejected{8, 2});

    EXPECT_EQ(plan.at(2), (std::vector<OrderId>{4, 2}));
    EXPECT_EQ(plan.at(5), std::vector<OrderId>{3});
    EXPECT_EQ(plan.at(9), std::vector<OrderId>{5});
    EXPECT_EQ(plan.at(8), std::vector<OrderId>{1});
}

TEST(EventProcessorTest, RejectionIgnoresTheRejectingRidersOwnLoad)
{
    const Plan start{{1, {10}}, {2, {20, 30, 40}}};

    const Plan plan = apply_event(start, RiderRejected{1, 10});

    EXPECT_TRUE(plan.at(1).empty());
    EXPECT_EQ(plan.at(2), (std::vector<OrderId>{20, 30, 40, 10}));
}

TEST(EventProcessorTest, RejectionByUnknownRiderIsNoop)
{
    const Plan start = scenario_plan();

    EXPECT_EQ(apply_event(start, RiderRejected{42, 10}), start);
    EXPECT_TRUE(is_noop(start, RiderRejected{42, 10}));
}

TEST(EventProcessorTest, RejectionOfOrderHeldElsewhereIsNoop)
{
    const Plan start = scenario_plan();

    EXPECT_EQ(apply_event(start, RiderRejected{1, 20}), start);
    EXPECT_TRUE(is_noop(start, RiderRejected{1, 20}));
}

TEST(EventProcessorTest, RejectionBySoleRiderFails)
{
    const Plan start{{1, {10, 20}}};

    try
    {
        apply_event(start, RiderRejected{1, 10});
        FAIL() << "expected PlanError";
    }
    catch (const PlanError &ex)
    {
        EXPECT_EQ(ex.code(), PlanErrorCode::NoAlternateRider);
    }
    EXPECT_EQ(start.at(1), (std::vector<OrderId>{10, 20}));
}

TEST(EventProcessorTest, SoleRiderMismatchIsStillNoop)
{
    const Plan start{{1, {10}}};

    EXPECT_EQ(apply_event(start, RiderRejected{1, 99}), start);
}

TEST(EventProcessorTest, FailedEventInBatchLeavesCallerPlanUntouched)
{
    const Plan start{{1, {10, 20}}};

    EXPECT_THROW(apply_events(start, {OrderCanceled{20}, RiderRejected{1, 10}}), PlanError);
    EXPECT_EQ(start.at(1), (std::vector<OrderId>{10, 20}));
}

TEST(EventProcessorTest, CancellationRemovesOnlyThatOrder)
{
    const Plan plan = apply_event(scenario_plan(), OrderCanceled{20});

    const Plan expected{{1, {10, 40}}, {2, {50}}, {3, {30}}};
    EXPECT_EQ(plan, expected);
}

TEST(EventProcessorTest, CancellationOfUnknownOrderIsNoop)
{
    const Plan start = scenario_plan();

    EXPECT_EQ(apply_event(start, OrderCanceled{777}), start);
    EXPECT_TRUE(is_noop(start, OrderCanceled{777}));
}

TEST(EventProcessorTest, CancellationTwiceEqualsOnce)
{
    const Plan once = apply_event(scenario_plan(), OrderCanceled{30});
    const Plan twice = apply_event(once, OrderCanceled{30});

    EXPECT_EQ(once, twice);
    EXPECT_TRUE(once.at(3).empty());
    EXPECT_EQ(once.size(), 3u);
}

class EventProcessorPropertyTest : public ::testing::Test
{
protected:
    test_support::RosterGenerator generator{77};

    Plan random_plan(std::size_t min_riders)
    {
        const auto riders = generator.riders(generator.size_between(min_riders, 15));
        const auto orders = generator.orders(riders.size() + generator.size_between(0, 40));
        return build_plan(riders, orders);
    }
};

TEST_F(EventProcessorPropertyTest, CancellationRemovesExactlyOneOrder)
{
    for (int round = 0; round < 200; round++)
    {
        const Plan plan = random_plan(1);
        const auto event = resolve_event(plan, generator.test_event());
        if (!event || !std::holds_alternative<OrderCanceled>(*event))
        {
            continue;
        }
        const OrderId order_id = std::get<OrderCanceled>(*event).order_id;

        const Plan after = apply_event(plan, *event);

        auto expected = collect_order_ids(plan);
        expected.erase(std::find(expected.begin(), expected.end(), order_id));
        ASSERT_EQ(collect_order_ids(after), expected);
        ASSERT_EQ(apply_event(after, *event), after);
    }
}

TEST_F(EventProcessorPropertyTest, RejectionConservesOrders)
{
    for (int round = 0; round < 200; round++)
    {
        const Plan plan = random_plan(2);
        const auto event = resolve_event(plan, RejectionDraw{generator.size_between(0, 100), generator.size_between(0, 100)});
        ASSERT_TRUE(event.has_value());
        const auto rejection = std::get<RiderRejected>(*event);

        const Plan after = apply_event(plan, *event);

        ASSERT_EQ(collect_order_ids(after), collect_order_ids(plan));
        ASSERT_FALSE(holds(after, rejection.rider_id, rejection.order_id));
        const auto holder = find_holder(after, rejection.order_id);
        ASSERT_TRUE(holder.has_value());
        ASSERT_NE(*holder, rejection.rider_id);
        ASSERT_TRUE(find_duplicate_orders(after).empty());
    }
}

TEST_F(EventProcessorPropertyTest, EventsOverTime)
{
    for (int round = 0; round < 100; round++)
    {
        const Plan starting_plan = random_plan(2);

        std::vector<Event> events;
        const std::size_t event_count = generator.size_between(0, 30);
        for (std::size_t i = 0; i < event_count; i++)
        {
            const auto event = resolve_event(starting_plan, generator.test_event());
            ASSERT_TRUE(event.has_value());
            events.push_back(*event);
        }

        std::set<OrderId> canceled;
        Plan current = starting_plan;
        for (const auto &event : events)
        {
            const auto before = sorted_order_ids(current);
            current = apply_event(current, event);

            if (const auto *rejection = std::get_if<RiderRejected>(&event))
            {
                ASSERT_EQ(sorted_order_ids(current), before);
                ASSERT_FALSE(holds(current, rejection->rider_id, rejection->order_id));
            }
            else
            {
                canceled.insert(std::get<OrderCanceled>(event).order_id);
            }
            ASSERT_EQ(current.size(), starting_plan.size());
        }

        const auto remaining = sorted_order_ids(current);
        for (const auto order_id : canceled)
        {
            ASSERT_FALSE(std::binary_search(remaining.begin(), remaining.end(), order_id));
        }

        std::vector<OrderId> reunited;
        std::set_union(remaining.begin(), remaining.end(), canceled.begin(), canceled.end(),
                       std::back_inserter(reunited));
        ASSERT_EQ(reunited, sorted_order_ids(starting_plan));
    }
}

} // namespace
} // namespace rider_dispatch
