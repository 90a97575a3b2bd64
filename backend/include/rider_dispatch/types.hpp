#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace rider_dispatch
{

using RiderId = std::uint32_t;
using OrderId = std::uint64_t;

struct Rider
{
    RiderId id{};
};

struct Order
{
    OrderId id{};
};

// Rider id -> orders in delivery order. Iteration order is unspecified and
// must never drive a selection.
using Plan = std::unordered_map<RiderId, std::vector<OrderId>>;

struct RiderRejected
{
    RiderId rider_id{};
    OrderId order_id{};
};

struct OrderCanceled
{
    OrderId order_id{};
};

using Event = std::variant<RiderRejected, OrderCanceled>;

// Index-based event description, resolved against a plan's sorted views.
struct RejectionDraw
{
    std::size_t which_rider{};
    std::size_t which_order{};
};

struct CancellationDraw
{
    std::size_t which_order{};
};

using TestEvent = std::variant<RejectionDraw, CancellationDraw>;

struct Roster
{
    std::vector<Rider> riders;
    std::vector<Order> orders;
};

struct PlanReport
{
    std::size_t rider_count{0};
    std::size_t order_count{0};
    std::size_t min_load{0};
    std::size_t max_load{0};
    std::vector<OrderId> duplicate_orders;
    std::vector<RiderId> idle_riders;
    bool fair{true};
};

enum class PlanErrorCode
{
    EmptyRiderSet,
    NoAlternateRider
};

class PlanError : public std::runtime_error
{
public:
    PlanError(PlanErrorCode code, const std::string &message)
        : std::runtime_error(message), code_(code) {}

    PlanErrorCode code() const
    {
        return code_;
    }

private:
    PlanErrorCode code_;
};

const char *to_string(PlanErrorCode code);

bool operator==(const RiderRejected &lhs, const RiderRejected &rhs);
bool operator==(const OrderCanceled &lhs, const OrderCanceled &rhs);

} // namespace rider_dispatch
