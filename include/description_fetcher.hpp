#ifndef DESCRIPTION_FETCHER_HPP
#define DESCRIPTION_FETCHER_HPP

#include <string_view>
#include <variant>
#include <vector>

#include "http/client.hpp"
#include "ssdp_notification.hpp"
#include "upnp_device.hpp"

namespace upnp
{

enum class fetch_error
{
    fetch_failed,
    parse_failed,
    no_device
};

std::string_view to_string(fetch_error error);

using fetch_result = std::variant<std::vector<upnp_device>, fetch_error>;

// Turns notifications into devices by retrieving their description documents
class description_fetcher
{
public:

    description_fetcher() = delete;
    description_fetcher(const description_fetcher&) = delete;
    description_fetcher& operator=(const description_fetcher&) = delete;

    explicit description_fetcher(http::client& client)
        : m_client {client}
    {}

    fetch_result fetch(const discovery::ssdp_notification& notification) const;

    // Notifications that cannot be resolved are skipped
    std::vector<upnp_device> fetch_all(const std::vector<discovery::ssdp_notification>& notifications) const;

private:

    http::client& m_client;

};

} // namespace upnp

#endif
