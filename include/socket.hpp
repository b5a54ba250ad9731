#ifndef DATAGRAM_SOCKET_HPP
#define DATAGRAM_SOCKET_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "local_address.hpp"

namespace discovery
{

enum class socket_status
{
    ok,
    bind_timeout,
    bind_failed,
    send_failed,
    closed
};

std::string_view to_string(socket_status status);

// Inbox shared between a socket's receive context and the searcher.
// After close() every push is dropped, so nothing arriving past the
// reception window is kept.
class message_queue
{
public:

    message_queue() = default;
    message_queue(const message_queue&) = delete;
    message_queue& operator=(const message_queue&) = delete;

    // Returns false if the message was dropped (queue closed or empty payload)
    bool push(const char* payload, size_t length);

    bool push(std::string_view payload)
    {
        return push(payload.data(), payload.size());
    }

    void close();

    bool closed() const;

    size_t size() const;

    std::vector<std::string> drain();

private:

    mutable std::mutex m_mutex;

    std::vector<std::string> m_messages;

    bool m_closed = false;

};

class datagram_socket
{
public:

    virtual ~datagram_socket() = default;

    // Binds to the local address; inbound datagrams are pushed into inbox
    // until close() is called. The inbox must outlive the binding.
    virtual socket_status bind(const local_address& address, address_type type, message_queue& inbox) = 0;

    virtual socket_status send_to(std::string_view group, uint16_t port, std::string_view payload) = 0;

    // Idempotent, safe to call in any state
    virtual void close() noexcept = 0;
};

using socket_ptr = std::unique_ptr<datagram_socket>;
using socket_factory = std::function<socket_ptr()>;

// Closes the socket on every exit path of the scope owning it
class socket_guard
{
public:

    socket_guard() = delete;
    socket_guard(const socket_guard&) = delete;
    socket_guard& operator=(const socket_guard&) = delete;

    explicit socket_guard(datagram_socket& sock)
        : m_sock {sock}
    {}

    ~socket_guard()
    {
        m_sock.close();
    }

private:

    datagram_socket& m_sock;

};

} // namespace discovery

#endif
