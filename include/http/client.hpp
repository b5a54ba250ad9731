#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "http/response.hpp"

namespace http
{

struct url
{
    std::string scheme;
    std::string host;
    uint16_t port = 80;
    std::string path = "/";
};

// Accepts absolute http urls: http://host[:port][/path], IPv6 hosts in brackets
std::optional<url> parse_url(std::string_view view);

// Resolves reference against base the way browsers resolve hrefs, without
// dot-segment removal
std::string resolve_url(std::string_view base, std::string_view reference);

class client
{
public:

    virtual ~client() = default;

    // Throws http::error on transport failures and malformed responses
    virtual response get(const std::string& location) = 0;
};

// Plain HTTP/1.1 GET over a fresh TCP connection per request
class tcp_client : public client
{
public:

    explicit tcp_client(std::chrono::milliseconds read_timeout = std::chrono::milliseconds {5000},
        size_t max_response_size = 1024 * 1024);

    response get(const std::string& location) override;

private:

    std::chrono::milliseconds m_read_timeout;

    size_t m_max_response_size;

};

} // namespace http

#endif
