#include "ssdp_discovery.hpp"

#include "log.hpp"

#include "fmt/format.h"

#include <future>
#include <thread>
#include <exception>
#include <system_error>
#include <iterator>
#include <utility>

namespace discovery
{

std::string_view to_string(search_error error)
{
    switch(error)
    {
        case search_error::none:
            return "none";
        case search_error::address_unknown:
            return "unknown address type";
        case search_error::bind_timeout:
            return "bind timeout";
        case search_error::bind_failed:
            return "bind failed";
        case search_error::send_failed:
            return "send failed";
        case search_error::socket_closed:
            return "socket closed";
        default:
            return "unknown";
    }
}

std::string_view multicast_group(address_type type)
{
    switch(type)
    {
        case address_type::ipv4:
            return SSDP_MULTICAST_IPV4;
        case address_type::ipv6_link_local:
            return SSDP_MULTICAST_IPV6_LINK_LOCAL;
        case address_type::ipv6_site_local:
            return SSDP_MULTICAST_IPV6_SITE_LOCAL;
        default:
            return {};
    }
}

std::string build_search_request(std::string_view group, std::string_view search_target, unsigned int mx, uint16_t port)
{
    return fmt::format("M-SEARCH * HTTP/1.1\r\nHOST: {}:{}\r\nST: {}\r\nMAN: \"ssdp:discover\"\r\nMX: {}\r\n\r\n",
        group, port, search_target, mx);
}

searcher::searcher(const address_provider& addresses, socket_factory make_socket, search_options options)
    : m_addresses {addresses},
      m_make_socket {std::move(make_socket)},
      m_options {options}
{}

search_result searcher::search(const local_address& address, std::string_view search_target) const
{
    search_result res;

    address_type type = m_addresses.classify(address);
    if(type == address_type::unknown)
    {
        logging::debug("skipping {} ({}), unsupported address type", address.ip, address.interface_name);
        res.error = search_error::address_unknown;
        return res;
    }

    // The inbox is declared first so it outlives the socket's receive context
    message_queue inbox;
    socket_ptr sock = m_make_socket();
    if(!sock)
    {
        res.error = search_error::bind_failed;
        return res;
    }
    socket_guard guard {*sock};

    socket_status status = sock->bind(address, type, inbox);
    if(status != socket_status::ok)
    {
        logging::debug("cannot search on {}: {}", address.ip, to_string(status));
        res.error = (status == socket_status::bind_timeout) ? search_error::bind_timeout : search_error::bind_failed;
        return res;
    }

    std::string_view group = multicast_group(type);
    std::string request = build_search_request(group, search_target, m_options.mx, m_options.port);

    unsigned int sent = 0;
    for(unsigned int i = 0; i < m_options.send_count; i++)
    {
        status = sock->send_to(group, m_options.port, request);
        if(status != socket_status::ok)
        {
            logging::debug("search request {} on {} failed: {}", i + 1, address.ip, to_string(status));
            res.error = (status == socket_status::closed) ? search_error::socket_closed : search_error::send_failed;
            break;
        }
        sent++;
    }

    // Responses keep arriving in the inbox while we wait
    if(res.error == search_error::none || sent > 0)
        std::this_thread::sleep_for(m_options.reception_window);

    inbox.close();
    res.responses = inbox.drain();
    logging::debug("{} response(s) on {} ({})", res.responses.size(), address.ip, to_string(type));

    return res;
}

std::future<search_result> launch_async(search_task task)
{
    return std::async(std::launch::async, std::move(task));
}

std::vector<std::string> search_all(const searcher& srch, const std::vector<local_address>& addresses,
    std::string_view search_target, const task_launcher& launch)
{
    std::vector<std::future<search_result>> tasks;
    tasks.reserve(addresses.size());
    for(const auto& address : addresses)
    {
        search_task task = [&srch, address, st = std::string {search_target}]() {
            return srch.search(address, st);
        };

        try {
            tasks.push_back(launch(task));
        } catch(const std::system_error& e) {
            logging::warn("cannot start search thread for {}, searching in place: {}", address.ip, e.what());
            tasks.push_back(std::async(std::launch::deferred, std::move(task)));
        }
    }

    std::vector<std::string> responses;
    for(size_t i = 0; i < tasks.size(); i++)
    {
        try {
            search_result res = tasks[i].get();
            responses.insert(responses.end(), std::make_move_iterator(res.responses.begin()),
                std::make_move_iterator(res.responses.end()));
        } catch(const std::exception& e) {
            logging::warn("search on {} failed: {}", addresses[i].ip, e.what());
        }
    }

    return responses;
}

} // namespace discovery
