#include "socket.hpp"

namespace discovery
{

std::string_view to_string(socket_status status)
{
    switch(status)
    {
        case socket_status::ok:
            return "ok";
        case socket_status::bind_timeout:
            return "bind timeout";
        case socket_status::bind_failed:
            return "bind failed";
        case socket_status::send_failed:
            return "send failed";
        case socket_status::closed:
            return "socket closed";
        default:
            return "unknown";
    }
}

bool message_queue::push(const char* payload, size_t length)
{
    if(payload == nullptr || length == 0)
        return false;

    std::lock_guard<std::mutex> lock {m_mutex};
    if(m_closed)
        return false;

    m_messages.emplace_back(payload, length);
    return true;
}

void message_queue::close()
{
    std::lock_guard<std::mutex> lock {m_mutex};
    m_closed = true;
}

bool message_queue::closed() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_closed;
}

size_t message_queue::size() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_messages.size();
}

std::vector<std::string> message_queue::drain()
{
    std::lock_guard<std::mutex> lock {m_mutex};
    std::vector<std::string> drained = std::move(m_messages);
    m_messages.clear();
    return drained;
}

} // namespace discovery
