#include "rider_dispatch/state.hpp"

namespace rider_dispatch
{

std::mutex session_mutex;
Roster roster;
Plan current_plan;
bool plan_ready = false;
std::vector<Event> event_log;
std::size_t events_applied = 0;
std::size_t events_ignored = 0;
std::size_t events_failed = 0;

void reset_session()
{
    current_plan.clear();
    plan_ready = false;
    event_log.clear();
    events_applied = 0;
    events_ignored = 0;
    events_failed = 0;
}

} // namespace rider_dispatch
