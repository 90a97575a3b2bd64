#include <httplib.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <string>

#include "rider_dispatch/codec.hpp"
#include "rider_dispatch/config.hpp"
#include "rider_dispatch/session.hpp"
#include "rider_dispatch/types.hpp"

namespace rider_dispatch
{
namespace
{

using json = nlohmann::json;

void send_error(httplib::Response &res, const std::string &message)
{
    json error;
    error["status"] = "error";
    error["message"] = message;
    res.set_content(error.dump(), "application/json");
}

void send_plan_error(httplib::Response &res, const PlanError &ex)
{
    json error;
    error["status"] = "error";
    error["error_code"] = to_string(ex.code());
    error["message"] = ex.what();
    res.set_content(error.dump(), "application/json");
}

json parse_body(const httplib::Request &req)
{
    return req.body.empty() ? json::object() : json::parse(req.body);
}

} // namespace
} // namespace rider_dispatch

int main()
{
    using namespace rider_dispatch;

    httplib::Server server;

    server.set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res)
                                   {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (req.method == "OPTIONS")
        {
            res.status = 200;
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled; });

    server.Post("/load-roster", [](const httplib::Request &req, httplib::Response &res)
                {
        try
        {
            res.set_content(load_session_roster(parse_body(req)).dump(), "application/json");
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what());
        } });

    server.Post("/build-plan", [](const httplib::Request &req, httplib::Response &res)
                {
        try
        {
            res.set_content(build_session_plan(parse_body(req)).dump(), "application/json");
        }
        catch (const PlanError &ex)
        {
            send_plan_error(res, ex);
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what());
        } });

    server.Post("/apply-event", [](const httplib::Request &req, httplib::Response &res)
                {
        try
        {
            const Event event = event_from_json(json::parse(req.body));
            res.set_content(apply_session_event(event).dump(), "application/json");
        }
        catch (const PlanError &ex)
        {
            send_plan_error(res, ex);
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what());
        } });

    server.Post("/resolve-event", [](const httplib::Request &req, httplib::Response &res)
                {
        try
        {
            const TestEvent test_event = test_event_from_json(json::parse(req.body));
            res.set_content(resolve_session_event(test_event).dump(), "application/json");
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what());
        } });

    server.Get("/plan", [](const httplib::Request &, httplib::Response &res)
               {
        try
        {
            res.set_content(session_plan().dump(), "application/json");
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what());
        } });

    server.Get("/export-diagnostics", [](const httplib::Request &, httplib::Response &res)
               {
        try
        {
            res.set_content(collect_diagnostics().dump(2), "application/json");
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what());
        } });

    const ServerConfig config = load_server_config();

    std::cout << "Server starting on http://" << config.host << ":" << config.port << std::endl;
    if (!server.listen(config.host.c_str(), config.port))
    {
        std::cerr << "Failed to bind " << config.host << ":" << config.port << std::endl;
        return 1;
    }
    return 0;
}
