#include "description_fetcher.hpp"

#include "log.hpp"
#include "utils.hpp"

#include <exception>
#include <iterator>

namespace upnp
{

std::string_view to_string(fetch_error error)
{
    switch(error)
    {
        case fetch_error::fetch_failed:
            return "fetch failed";
        case fetch_error::parse_failed:
            return "malformed document";
        case fetch_error::no_device:
            return "no device element";
        default:
            return "unknown";
    }
}

fetch_result description_fetcher::fetch(const discovery::ssdp_notification& notification) const
{
    http::response res;
    try {
        res = m_client.get(notification.location);
    } catch(const std::exception& e) {
        logging::warn("cannot fetch description of {} from {}: {}", notification.usn, notification.location, e.what());
        return fetch_error::fetch_failed;
    }

    if(!res.success())
    {
        logging::warn("fetching {} returned {} {}", notification.location, res.get_code(), res.get_phrase());
        return fetch_error::fetch_failed;
    }

    // Ill-formed bytes (Latin-1 text, for one) become U+FFFD
    std::string document {utils::strip_bom(res.get_body())};
    if(!utils::is_valid_utf8(document))
    {
        logging::debug("description at {} is not valid UTF-8, replacing invalid bytes", notification.location);
        document = utils::replace_invalid_utf8(document);
    }

    std::vector<upnp_device> devices;
    try {
        devices = parse_description(document, notification.location);
    } catch(const description_error& e) {
        logging::warn("cannot parse description at {}: {}", notification.location, e.what());
        return fetch_error::parse_failed;
    }

    if(devices.empty())
    {
        logging::warn("description at {} has no device element", notification.location);
        return fetch_error::no_device;
    }

    return devices;
}

std::vector<upnp_device> description_fetcher::fetch_all(const std::vector<discovery::ssdp_notification>& notifications) const
{
    std::vector<upnp_device> devices;

    for(const auto& notification : notifications)
    {
        fetch_result res = fetch(notification);
        if(auto* found = std::get_if<std::vector<upnp_device>>(&res))
        {
            devices.insert(devices.end(), std::make_move_iterator(found->begin()), std::make_move_iterator(found->end()));
        }
    }

    return devices;
}

} // namespace upnp
