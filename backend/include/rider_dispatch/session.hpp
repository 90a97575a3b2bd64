#pragma once

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace rider_dispatch
{

// Operations on the shared session in state.hpp. Each one takes
// session_mutex, and either commits a complete update and returns the
// response payload, or throws with the session left as it was.

// Body carries inline "riders"/"orders", or "source_url" to fetch them from.
// A fetched roster with neither riders nor orders is treated as a failed fetch.
nlohmann::json load_session_roster(const nlohmann::json &body);

// Builds from the inline roster in the body, else from the stored roster.
nlohmann::json build_session_plan(const nlohmann::json &body);

nlohmann::json apply_session_event(const Event &event);
nlohmann::json resolve_session_event(const TestEvent &test_event);
nlohmann::json session_plan();
nlohmann::json collect_diagnostics();

} // namespace rider_dispatch
