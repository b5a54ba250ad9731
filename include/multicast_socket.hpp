#ifndef MULTICAST_SOCKET_HPP
#define MULTICAST_SOCKET_HPP

#include <atomic>
#include <future>
#include <memory>

#include "socket.hpp"
#include "socketwrapper.hpp"

namespace discovery
{

// UDP socket used for SSDP searches on a single interface. IPv4 sockets are
// bound to the interface address, IPv6 sockets to the wildcard address and
// steered to the interface by index. A receive thread forwards every
// datagram into the inbox handed to bind() until close().
class multicast_socket : public datagram_socket
{
public:

    multicast_socket(const multicast_socket&) = delete;
    multicast_socket& operator=(const multicast_socket&) = delete;
    multicast_socket(multicast_socket&&) = delete;
    multicast_socket& operator=(multicast_socket&&) = delete;
    ~multicast_socket() override;

    explicit multicast_socket(int multicast_ttl = 4, size_t receive_buffer_size = 4096);

    socket_status bind(const local_address& address, address_type type, message_queue& inbox) override;

    socket_status send_to(std::string_view group, uint16_t port, std::string_view payload) override;

    void close() noexcept override;

private:

    int m_ttl;

    size_t m_buffer_size;

    std::atomic<bool> m_keep {false};

    std::future<void> m_receiver;

    std::unique_ptr<net::udp_socket<net::ip_version::v4>> m_sock_v4 {nullptr};

    std::unique_ptr<net::udp_socket<net::ip_version::v6>> m_sock_v6 {nullptr};

};

socket_factory make_multicast_socket_factory(int multicast_ttl = 4, size_t receive_buffer_size = 4096);

} // namespace discovery

#endif
