#ifndef CONTROL_POINT_HPP
#define CONTROL_POINT_HPP

#include <string>
#include <string_view>
#include <vector>

#include "local_address.hpp"
#include "socket.hpp"
#include "ssdp_discovery.hpp"
#include "ssdp_notification.hpp"
#include "description_fetcher.hpp"
#include "http/client.hpp"
#include "upnp_device.hpp"

namespace upnp
{

// urn:schemas-upnp-org:device:{device_type}:{version}
std::string device_urn(std::string_view device_type, int version = 1);

// Entry point for discovering devices on every local interface. Neither
// operation fails: whatever could not be searched, fetched or parsed is
// logged and left out of the result.
class control_point
{
public:

    control_point() = delete;
    control_point(const control_point&) = delete;
    control_point& operator=(const control_point&) = delete;

    control_point(const discovery::address_provider& addresses, discovery::socket_factory make_socket,
        http::client& client, discovery::search_options options = {});

    // Notifications for search_target, unique by USN
    std::vector<discovery::ssdp_notification> search_devices(std::string_view search_target) const;

    std::vector<upnp_device> search_devices_of_type(std::string_view device_type, int version = 1) const;

private:

    const discovery::address_provider& m_addresses;

    discovery::searcher m_searcher;

    description_fetcher m_fetcher;

};

} // namespace upnp

#endif
