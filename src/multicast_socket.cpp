#include "multicast_socket.hpp"

#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <poll.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/socket.h>

namespace discovery
{

static constexpr int poll_interval_ms = 100;

template<typename socket_type>
static void receive_loop(socket_type& sock, const std::atomic<bool>& keep, message_queue& inbox, size_t buffer_size)
{
    pollfd pfd {sock.get(), POLLIN, 0};
    while(keep.load())
    {
        int ready = ::poll(&pfd, 1, poll_interval_ms);
        if(ready < 0 && errno != EINTR)
        {
            logging::debug("poll on ssdp socket failed: {}", std::strerror(errno));
            break;
        }
        if(ready <= 0)
            continue;

        try {
            auto [buffer, peer] = sock.template read<char>(buffer_size);
            inbox.push(buffer.data(), buffer.size());
        } catch(std::runtime_error& e) {
            // The socket is gone, nothing more will arrive
            logging::debug("ssdp receive stopped: {}", e.what());
            break;
        }
    }
}

multicast_socket::multicast_socket(int multicast_ttl, size_t receive_buffer_size)
    : m_ttl {multicast_ttl},
      m_buffer_size {receive_buffer_size}
{}

multicast_socket::~multicast_socket()
{
    close();
}

socket_status multicast_socket::bind(const local_address& address, address_type type, message_queue& inbox)
{
    if(m_sock_v4 || m_sock_v6)
        return socket_status::bind_failed;

    try {
        if(type == address_type::ipv4)
        {
            m_sock_v4 = std::make_unique<net::udp_socket<net::ip_version::v4>>(address.ip, 0);

            in_addr ifaddr;
            if(inet_pton(AF_INET, address.ip.c_str(), &ifaddr) != 1)
                return socket_status::bind_failed;

            unsigned char ttl = static_cast<unsigned char>(m_ttl);
            if(setsockopt(m_sock_v4->get(), IPPROTO_IP, IP_MULTICAST_IF, &ifaddr, sizeof(ifaddr)) < 0 ||
                setsockopt(m_sock_v4->get(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0)
            {
                logging::debug("multicast setup on {} failed: {}", address.ip, std::strerror(errno));
                return socket_status::bind_failed;
            }

            m_keep.store(true);
            m_receiver = std::async(std::launch::async, [this, &inbox]() {
                receive_loop(*m_sock_v4, m_keep, inbox, m_buffer_size);
            });
        }
        else if(type == address_type::ipv6_link_local || type == address_type::ipv6_site_local)
        {
            unsigned int ifindex = if_nametoindex(address.interface_name.c_str());
            if(ifindex == 0)
                return socket_status::bind_failed;

            m_sock_v6 = std::make_unique<net::udp_socket<net::ip_version::v6>>("::", 0);

            int hops = m_ttl;
            if(setsockopt(m_sock_v6->get(), IPPROTO_IPV6, IPV6_MULTICAST_IF, &ifindex, sizeof(ifindex)) < 0 ||
                setsockopt(m_sock_v6->get(), IPPROTO_IPV6, IPV6_MULTICAST_HOPS, &hops, sizeof(hops)) < 0)
            {
                logging::debug("multicast setup on {} failed: {}", address.interface_name, std::strerror(errno));
                return socket_status::bind_failed;
            }

            m_keep.store(true);
            m_receiver = std::async(std::launch::async, [this, &inbox]() {
                receive_loop(*m_sock_v6, m_keep, inbox, m_buffer_size);
            });
        }
        else
        {
            return socket_status::bind_failed;
        }
    } catch(std::runtime_error& e) {
        logging::debug("binding ssdp socket to {} failed: {}", address.ip, e.what());
        return socket_status::bind_failed;
    }

    return socket_status::ok;
}

socket_status multicast_socket::send_to(std::string_view group, uint16_t port, std::string_view payload)
{
    if(!m_keep.load())
        return socket_status::closed;

    std::string addr {group};
    std::string data {payload};
    try {
        if(m_sock_v4)
            m_sock_v4->send(addr, port, net::span {data.begin(), data.end()});
        else if(m_sock_v6)
            m_sock_v6->send(addr, port, net::span {data.begin(), data.end()});
        else
            return socket_status::closed;
    } catch(std::runtime_error& e) {
        logging::debug("sending to {}:{} failed: {}", group, port, e.what());
        return socket_status::send_failed;
    }

    return socket_status::ok;
}

void multicast_socket::close() noexcept
{
    m_keep.store(false);
    if(m_receiver.valid())
        m_receiver.wait();

    m_sock_v4.reset();
    m_sock_v6.reset();
}

socket_factory make_multicast_socket_factory(int multicast_ttl, size_t receive_buffer_size)
{
    return [multicast_ttl, receive_buffer_size]() -> socket_ptr {
        return std::make_unique<multicast_socket>(multicast_ttl, receive_buffer_size);
    };
}

} // namespace discovery
