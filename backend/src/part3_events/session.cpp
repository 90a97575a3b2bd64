#include "rider_dispatch/session.hpp"

#include <chrono>
#include <ctime>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "rider_dispatch/codec.hpp"
#include "rider_dispatch/event_processor.hpp"
#include "rider_dispatch/event_resolver.hpp"
#include "rider_dispatch/plan_builder.hpp"
#include "rider_dispatch/plan_checks.hpp"
#include "rider_dispatch/roster.hpp"
#include "rider_dispatch/state.hpp"

namespace rider_dispatch
{
namespace
{

using json = nlohmann::json;

json plan_payload(const Plan &plan)
{
    json response;
    response["status"] = "success";
    response["plan"] = plan_to_json(plan);
    response["report"] = report_to_json(check_plan(plan));
    return response;
}

void require_plan_ready()
{
    if (!plan_ready)
    {
        throw std::runtime_error("Plan not built. Call /build-plan first.");
    }
}

} // namespace

json load_session_roster(const json &body)
{
    const std::string source_url = body.value("source_url", "");

    const auto fetch_start = std::chrono::high_resolution_clock::now();
    Roster loaded;
    if (!source_url.empty())
    {
        loaded = parse_roster(json::parse(fetch_roster_payload(source_url)));
        if (loaded.riders.empty() && loaded.orders.empty())
        {
            throw std::runtime_error("No roster data received from " + source_url + ".");
        }
    }
    else
    {
        loaded = parse_roster(body);
    }
    const auto fetch_end = std::chrono::high_resolution_clock::now();

    std::lock_guard<std::mutex> lock(session_mutex);
    roster = std::move(loaded);
    reset_session();

    json response;
    response["status"] = "success";
    response["riders_count"] = roster.riders.size();
    response["orders_count"] = roster.orders.size();
    response["timing"] = {
        {"load_roster_ms", std::chrono::duration_cast<std::chrono::milliseconds>(fetch_end - fetch_start).count()}};
    return response;
}

json build_session_plan(const json &body)
{
    const bool inline_roster = body.contains("riders") || body.contains("orders");
    Roster requested;
    if (inline_roster)
    {
        requested = parse_roster(body);
    }

    std::lock_guard<std::mutex> lock(session_mutex);
    if (!inline_roster)
    {
        requested = roster;
    }

    const auto build_start = std::chrono::high_resolution_clock::now();
    Plan plan = build_plan(requested.riders, requested.orders);
    const auto build_end = std::chrono::high_resolution_clock::now();

    roster = std::move(requested);
    reset_session();
    current_plan = std::move(plan);
    plan_ready = true;

    json response = plan_payload(current_plan);
    response["timing"] = {
        {"build_plan_ms", std::chrono::duration_cast<std::chrono::milliseconds>(build_end - build_start).count()}};
    return response;
}

json apply_session_event(const Event &event)
{
    std::lock_guard<std::mutex> lock(session_mutex);
    require_plan_ready();

    const bool changed = !is_noop(current_plan, event);
    Plan next;
    try
    {
        next = apply_event(current_plan, event);
    }
    catch (const PlanError &ex)
    {
        events_failed++;
        std::cerr << "Event not applied: " << ex.what() << std::endl;
        throw;
    }

    current_plan = std::move(next);
    event_log.push_back(event);
    if (changed)
    {
        events_applied++;
    }
    else
    {
        events_ignored++;
    }

    json response = plan_payload(current_plan);
    response["event"] = event_to_json(event);
    response["changed"] = changed;
    return response;
}

json resolve_session_event(const TestEvent &test_event)
{
    std::lock_guard<std::mutex> lock(session_mutex);
    const auto event = resolve_event(current_plan, test_event);
    if (!event)
    {
        throw std::runtime_error("Current plan has nothing to resolve the event against.");
    }

    json response;
    response["status"] = "success";
    response["event"] = event_to_json(*event);
    return response;
}

json session_plan()
{
    std::lock_guard<std::mutex> lock(session_mutex);
    require_plan_ready();
    return plan_payload(current_plan);
}

json collect_diagnostics()
{
    std::lock_guard<std::mutex> lock(session_mutex);

    json diagnostic_report;

    const auto now = std::chrono::system_clock::now();
    const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    char timestamp[64];
    std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&now_time));

    diagnostic_report["metadata"] = {
        {"run_id", std::string("run_") + timestamp},
        {"timestamp", timestamp},
        {"num_riders", roster.riders.size()},
        {"num_orders", roster.orders.size()},
        {"plan_ready", plan_ready}};

    json riders_json = json::array();
    for (const auto rider_id : sorted_rider_ids(current_plan))
    {
        riders_json.push_back({
            {"rider_id", rider_id},
            {"load", rider_load(current_plan, rider_id)},
            {"orders", current_plan.at(rider_id)}});
    }
    diagnostic_report["riders"] = riders_json;
    diagnostic_report["report"] = report_to_json(check_plan(current_plan));

    json events_json = json::array();
    for (const auto &event : event_log)
    {
        events_json.push_back(event_to_json(event));
    }
    diagnostic_report["events"] = events_json;
    diagnostic_report["summary"] = {
        {"events_applied", events_applied},
        {"events_ignored", events_ignored},
        {"events_failed", events_failed}};

    return diagnostic_report;
}

} // namespace rider_dispatch
