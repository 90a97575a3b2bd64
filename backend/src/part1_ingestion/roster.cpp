#include "rider_dispatch/roster.hpp"

#include <curl/curl.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "rider_dispatch/codec.hpp"

namespace rider_dispatch
{
namespace
{

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp)
{
    static_cast<std::string *>(userp)->append(static_cast<char *>(contents), size * nmemb);
    return size * nmemb;
}

template <typename Item>
void require_unique_ids(const std::vector<Item> &items, const char *kind)
{
    std::unordered_set<decltype(Item::id)> seen;
    for (const auto &item : items)
    {
        if (!seen.insert(item.id).second)
        {
            throw std::runtime_error(std::string("Duplicate ") + kind + " id " + std::to_string(item.id) + " in roster.");
        }
    }
}

} // namespace

Roster parse_roster(const nlohmann::json &roster_json)
{
    Roster result;
    if (roster_json.contains("riders"))
    {
        result.riders = riders_from_json(roster_json["riders"]);
    }
    if (roster_json.contains("orders"))
    {
        result.orders = orders_from_json(roster_json["orders"]);
    }

    require_unique_ids(result.riders, "rider");
    require_unique_ids(result.orders, "order");

    std::cout << "Parsed roster with " << result.riders.size() << " riders and "
              << result.orders.size() << " orders." << std::endl;

    return result;
}

std::string fetch_roster_payload(const std::string &url)
{
    std::cout << "Fetching roster from " << url << "..." << std::endl;

    CURL *curl = curl_easy_init();
    if (!curl)
    {
        std::cerr << "Failed to initialize CURL" << std::endl;
        return "{}";
    }

    std::string response_data;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "RiderDispatch/1.0");
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

    const CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    if (res == CURLE_OK)
    {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    }

    curl_easy_cleanup(curl);

    if (res != CURLE_OK)
    {
        std::cerr << "Roster fetch failed: " << curl_easy_strerror(res) << std::endl;
        return "{}";
    }

    if (http_code != 200)
    {
        std::cerr << "Roster fetch returned HTTP " << http_code << std::endl;
        return "{}";
    }

    std::cout << "Fetched " << response_data.size() << " bytes of roster data." << std::endl;
    return response_data;
}

} // namespace rider_dispatch
