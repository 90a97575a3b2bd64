#pragma once

#include <string>

namespace rider_dispatch
{

constexpr const char *kDefaultHost = "0.0.0.0";
constexpr int kDefaultPort = 8080;

struct ServerConfig
{
    std::string host{kDefaultHost};
    int port{kDefaultPort};
};

// Whole string must be a decimal port in 1-65535. Throws std::invalid_argument.
int parse_port(const std::string &text);

// RIDER_DISPATCH_HOST / RIDER_DISPATCH_PORT override the defaults; an invalid
// port is reported and the default kept.
ServerConfig load_server_config();

} // namespace rider_dispatch
