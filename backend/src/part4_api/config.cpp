#include "rider_dispatch/config.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace rider_dispatch
{

int parse_port(const std::string &text)
{
    size_t consumed = 0;
    int port = 0;
    try
    {
        port = std::stoi(text, &consumed);
    }
    catch (const std::exception &)
    {
        throw std::invalid_argument("Port is not a number: '" + text + "'.");
    }

    if (consumed != text.size())
    {
        throw std::invalid_argument("Port has trailing characters: '" + text + "'.");
    }
    if (port < 1 || port > 65535)
    {
        throw std::invalid_argument("Port out of range 1-65535: " + text + ".");
    }
    return port;
}

ServerConfig load_server_config()
{
    ServerConfig config;

    const char *host = std::getenv("RIDER_DISPATCH_HOST");
    if (host && *host)
    {
        config.host = host;
    }

    const char *port = std::getenv("RIDER_DISPATCH_PORT");
    if (port && *port)
    {
        try
        {
            config.port = parse_port(port);
        }
        catch (const std::invalid_argument &ex)
        {
            std::cerr << "Ignoring RIDER_DISPATCH_PORT: " << ex.what()
                      << " Falling back to " << kDefaultPort << "." << std::endl;
        }
    }

    return config;
}

} // namespace rider_dispatch
