#ifndef SSDP_DISCOVERY_HPP
#define SSDP_DISCOVERY_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <string>
#include <string_view>
#include <vector>

#include "local_address.hpp"
#include "socket.hpp"

namespace discovery
{

#define SSDP_MULTICAST_IPV4 "239.255.255.250"
#define SSDP_MULTICAST_IPV6_LINK_LOCAL "FF02::C"
#define SSDP_MULTICAST_IPV6_SITE_LOCAL "FF05::C"
#define SSDP_PORT 1900

struct search_options
{
    unsigned int send_count = 3;
    std::chrono::milliseconds reception_window {3000};
    unsigned int mx = 3;
    uint16_t port = SSDP_PORT;
    int multicast_ttl = 4;
    size_t receive_buffer_size = 4096;
};

enum class search_error
{
    none,
    address_unknown,
    bind_timeout,
    bind_failed,
    send_failed,
    socket_closed
};

std::string_view to_string(search_error error);

struct search_result
{
    std::vector<std::string> responses;
    search_error error = search_error::none;
};

// Empty for address_type::unknown
std::string_view multicast_group(address_type type);

std::string build_search_request(std::string_view group, std::string_view search_target,
    unsigned int mx = 3, uint16_t port = SSDP_PORT);

// Runs the M-SEARCH exchange on one local address
class searcher
{
public:

    searcher(const address_provider& addresses, socket_factory make_socket, search_options options = {});

    search_result search(const local_address& address, std::string_view search_target) const;

private:

    const address_provider& m_addresses;

    socket_factory m_make_socket;

    search_options m_options;

};

using search_task = std::function<search_result()>;
using task_launcher = std::function<std::future<search_result>(search_task)>;

// Runs the task on a thread of its own, throws std::system_error if no
// thread can be started
std::future<search_result> launch_async(search_task task);

// Searches all local addresses concurrently and merges their raw responses.
// An address whose search cannot be started on its own thread is searched
// in place when its result is collected.
std::vector<std::string> search_all(const searcher& srch, const std::vector<local_address>& addresses,
    std::string_view search_target, const task_launcher& launch = launch_async);

} // namespace discovery

#endif
