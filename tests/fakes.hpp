#ifndef UPNP_SCOUT_TEST_FAKES_HPP
#define UPNP_SCOUT_TEST_FAKES_HPP

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "local_address.hpp"
#include "socket.hpp"
#include "http/client.hpp"

namespace fakes
{

class address_list : public discovery::address_provider
{
public:

    explicit address_list(std::vector<discovery::local_address> addresses)
        : m_addresses {std::move(addresses)}
    {}

    std::vector<discovery::local_address> list_local_addresses() const override
    {
        if(m_fail)
            throw std::runtime_error {"getifaddrs failed"};
        return m_addresses;
    }

    discovery::address_type classify(const discovery::local_address& address) const override
    {
        return discovery::classify_address(address.ip);
    }

    void fail(bool fail)
    {
        m_fail = fail;
    }

private:

    std::vector<discovery::local_address> m_addresses;

    bool m_fail = false;

};

// What a fake socket bound to a given address does
struct socket_script
{
    discovery::socket_status bind_status = discovery::socket_status::ok;
    discovery::socket_status send_status = discovery::socket_status::ok;

    // Delivered once the first request went out, or after reply_delay from a
    // separate thread if that is set
    std::vector<std::string> replies;
    std::chrono::milliseconds reply_delay {0};

    // Delivered while the socket is being closed, past the reception window
    std::vector<std::string> late_replies;
};

// What happened to the sockets bound to a given address
struct socket_record
{
    discovery::local_address address;
    discovery::address_type type = discovery::address_type::unknown;
    std::vector<std::string> groups;
    std::vector<uint16_t> ports;
    std::vector<std::string> payloads;
    int close_count = 0;
};

class network
{
public:

    void script(const std::string& ip, socket_script script)
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        m_scripts[ip] = std::move(script);
    }

    socket_script script_for(const std::string& ip) const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        auto it = m_scripts.find(ip);
        return (it != m_scripts.end()) ? it->second : socket_script {};
    }

    socket_record record(const std::string& ip) const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        auto it = m_records.find(ip);
        return (it != m_records.end()) ? it->second : socket_record {};
    }

    bool has_record(const std::string& ip) const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        return m_records.find(ip) != m_records.end();
    }

    template<typename F>
    void update(const std::string& ip, F&& f)
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        f(m_records[ip]);
    }

    int sockets_created() const
    {
        return m_created.load();
    }

    discovery::socket_factory factory();

private:

    mutable std::mutex m_mutex;

    std::map<std::string, socket_script> m_scripts;

    std::map<std::string, socket_record> m_records;

    std::atomic<int> m_created {0};

};

class socket : public discovery::datagram_socket
{
public:

    explicit socket(network& net)
        : m_net {net}
    {}

    ~socket() override
    {
        close();
    }

    discovery::socket_status bind(const discovery::local_address& address, discovery::address_type type,
        discovery::message_queue& inbox) override
    {
        m_ip = address.ip;
        m_script = m_net.script_for(address.ip);
        m_net.update(m_ip, [&](socket_record& rec) {
            rec.address = address;
            rec.type = type;
        });

        if(m_script.bind_status != discovery::socket_status::ok)
            return m_script.bind_status;

        m_inbox = &inbox;
        if(m_script.reply_delay.count() > 0)
        {
            m_delivery = std::thread {[this]() {
                std::this_thread::sleep_for(m_script.reply_delay);
                for(const auto& reply : m_script.replies)
                    m_inbox->push(reply);
            }};
        }
        return discovery::socket_status::ok;
    }

    discovery::socket_status send_to(std::string_view group, uint16_t port, std::string_view payload) override
    {
        if(m_inbox == nullptr)
            return discovery::socket_status::closed;

        m_net.update(m_ip, [&](socket_record& rec) {
            rec.groups.emplace_back(group);
            rec.ports.push_back(port);
            rec.payloads.emplace_back(payload);
        });

        if(m_script.send_status != discovery::socket_status::ok)
            return m_script.send_status;

        if(!m_delivered && m_script.reply_delay.count() == 0)
        {
            m_delivered = true;
            for(const auto& reply : m_script.replies)
                m_inbox->push(reply);
        }
        return discovery::socket_status::ok;
    }

    void close() noexcept override
    {
        if(m_delivery.joinable())
            m_delivery.join();

        if(m_inbox != nullptr)
        {
            for(const auto& reply : m_script.late_replies)
                m_inbox->push(reply);
            m_inbox = nullptr;
        }

        if(!m_ip.empty() && !m_closed)
        {
            m_closed = true;
            m_net.update(m_ip, [](socket_record& rec) {
                rec.close_count++;
            });
        }
    }

private:

    network& m_net;

    std::string m_ip;

    socket_script m_script;

    discovery::message_queue* m_inbox = nullptr;

    std::thread m_delivery;

    bool m_delivered = false;

    bool m_closed = false;

};

inline discovery::socket_factory network::factory()
{
    return [this]() -> discovery::socket_ptr {
        m_created++;
        return std::make_unique<fakes::socket>(*this);
    };
}

// Serves canned raw HTTP responses by url
class http_client : public http::client
{
public:

    void serve(const std::string& location, const std::string& raw_response)
    {
        m_responses[location] = raw_response;
    }

    void serve_xml(const std::string& location, const std::string& document)
    {
        serve(location, "HTTP/1.1 200 OK\r\nContent-Type: text/xml\r\nContent-Length: " +
            std::to_string(document.size()) + "\r\n\r\n" + document);
    }

    http::response get(const std::string& location) override
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        m_requests.push_back(location);

        auto it = m_responses.find(location);
        if(it == m_responses.end())
            throw http::error {"connection refused"};
        return http::response {it->second};
    }

    std::vector<std::string> requests() const
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        return m_requests;
    }

private:

    mutable std::mutex m_mutex;

    std::map<std::string, std::string> m_responses;

    std::vector<std::string> m_requests;

};

} // namespace fakes

#endif
