#pragma once

#include <cstddef>
#include <mutex>
#include <vector>

#include "types.hpp"

namespace rider_dispatch
{

extern std::mutex session_mutex;
extern Roster roster;
extern Plan current_plan;
extern bool plan_ready;
extern std::vector<Event> event_log;
extern std::size_t events_applied;
extern std::size_t events_ignored;
extern std::size_t events_failed;

void reset_session();

} // namespace rider_dispatch
