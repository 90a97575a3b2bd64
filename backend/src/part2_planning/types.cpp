#include "rider_dispatch/types.hpp"

namespace rider_dispatch
{

const char *to_string(PlanErrorCode code)
{
    switch (code)
    {
    case PlanErrorCode::EmptyRiderSet:
        return "EmptyRiderSet";
    case PlanErrorCode::NoAlternateRider:
        return "NoAlternateRider";
    }
    return "Unknown";
}

bool operator==(const RiderRejected &lhs, const RiderRejected &rhs)
{
    return lhs.rider_id == rhs.rider_id && lhs.order_id == rhs.order_id;
}

bool operator==(const OrderCanceled &lhs, const OrderCanceled &rhs)
{
    return lhs.order_id == rhs.order_id;
}

} // namespace rider_dispatch
