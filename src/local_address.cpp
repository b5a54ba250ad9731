#include "local_address.hpp"

#include <array>
#include <memory>
#include <stdexcept>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <netdb.h>
#include <net/if.h>
#include <arpa/inet.h>

namespace discovery
{

static const char* error_msg = "Unable to enumerate local ip addresses";

std::string_view to_string(address_type type)
{
    switch(type)
    {
        case address_type::ipv4:
            return "IPv4";
        case address_type::ipv6_link_local:
            return "IPv6 link-local";
        case address_type::ipv6_site_local:
            return "IPv6 site-local";
        default:
            return "unknown";
    }
}

address_type classify_address(std::string_view ip)
{
    // inet_pton needs a terminated string without the zone suffix
    std::string addr {ip.substr(0, ip.find('%'))};

    in_addr v4;
    if(inet_pton(AF_INET, addr.c_str(), &v4) == 1)
        return address_type::ipv4;

    in6_addr v6;
    if(inet_pton(AF_INET6, addr.c_str(), &v6) != 1)
        return address_type::unknown;

    // fe80::/10 and fec0::/10
    if(v6.s6_addr[0] == 0xFE && (v6.s6_addr[1] & 0xC0) == 0x80)
        return address_type::ipv6_link_local;
    if(v6.s6_addr[0] == 0xFE && (v6.s6_addr[1] & 0xC0) == 0xC0)
        return address_type::ipv6_site_local;

    return address_type::unknown;
}

std::vector<local_address> system_address_provider::list_local_addresses() const
{
    ifaddrs* addrs;
    if(getifaddrs(&addrs))
        throw std::runtime_error {error_msg};

    std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> guard {addrs, &freeifaddrs};
    std::vector<local_address> result;

    for(ifaddrs* curr_addr = addrs; curr_addr != nullptr; curr_addr = curr_addr->ifa_next)
    {
        if(curr_addr->ifa_addr == nullptr)
            continue;

        int family = curr_addr->ifa_addr->sa_family;
        if(family != AF_INET && family != AF_INET6)
            continue;

        if(!(curr_addr->ifa_flags & IFF_UP) || (curr_addr->ifa_flags & IFF_LOOPBACK))
            continue;

        std::array<char, NI_MAXHOST> host;
        int s = getnameinfo(curr_addr->ifa_addr, (family == AF_INET) ? sizeof(sockaddr_in) : sizeof(sockaddr_in6),
            host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST);
        if(s != 0)
            throw std::runtime_error {error_msg};

        std::string_view ip {host.data()};
        result.push_back(local_address {
            std::string {ip.substr(0, ip.find('%'))},
            curr_addr->ifa_name
        });
    }

    return result;
}

} // namespace discovery
