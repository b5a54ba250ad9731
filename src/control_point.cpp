#include "control_point.hpp"

#include "log.hpp"

#include "fmt/format.h"

#include <stdexcept>
#include <utility>

namespace upnp
{

std::string device_urn(std::string_view device_type, int version)
{
    return fmt::format("urn:schemas-upnp-org:device:{}:{}", device_type, version);
}

control_point::control_point(const discovery::address_provider& addresses, discovery::socket_factory make_socket,
    http::client& client, discovery::search_options options)
    : m_addresses {addresses},
      m_searcher {addresses, std::move(make_socket), options},
      m_fetcher {client}
{}

std::vector<discovery::ssdp_notification> control_point::search_devices(std::string_view search_target) const
{
    std::vector<discovery::local_address> addresses;
    try {
        addresses = m_addresses.list_local_addresses();
    } catch(const std::runtime_error& e) {
        logging::error("cannot list local addresses: {}", e.what());
        return {};
    }

    logging::info("searching {} on {} local address(es)", search_target, addresses.size());
    std::vector<std::string> responses = discovery::search_all(m_searcher, addresses, search_target);

    std::vector<discovery::ssdp_notification> notifications = discovery::parse_notifications(responses);
    logging::info("{} response(s), {} unique notification(s)", responses.size(), notifications.size());

    return notifications;
}

std::vector<upnp_device> control_point::search_devices_of_type(std::string_view device_type, int version) const
{
    return m_fetcher.fetch_all(search_devices(device_urn(device_type, version)));
}

} // namespace upnp
