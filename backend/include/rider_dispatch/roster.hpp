#pragma once

#include <nlohmann/json.hpp>

#include <string>

#include "types.hpp"

namespace rider_dispatch
{

Roster parse_roster(const nlohmann::json &roster_json);
std::string fetch_roster_payload(const std::string &url);

} // namespace rider_dispatch
