#ifndef LOCAL_ADDRESS_HPP
#define LOCAL_ADDRESS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace discovery
{

enum class address_type
{
    ipv4,
    ipv6_link_local,
    ipv6_site_local,
    unknown
};

struct local_address
{
    std::string ip;
    std::string interface_name;
};

inline bool operator==(const local_address& lhs, const local_address& rhs)
{
    return lhs.ip == rhs.ip && lhs.interface_name == rhs.interface_name;
}

std::string_view to_string(address_type type);

// Classifies a numeric address literal. Anything that is neither IPv4 nor
// link/site local IPv6 is unknown and will not be searched on.
address_type classify_address(std::string_view ip);

class address_provider
{
public:

    virtual ~address_provider() = default;

    virtual std::vector<local_address> list_local_addresses() const = 0;

    virtual address_type classify(const local_address& address) const = 0;
};

// Enumerates the addresses of all interfaces that are up and not loopback
class system_address_provider : public address_provider
{
public:

    std::vector<local_address> list_local_addresses() const override;

    address_type classify(const local_address& address) const override
    {
        return classify_address(address.ip);
    }
};

} // namespace discovery

#endif
