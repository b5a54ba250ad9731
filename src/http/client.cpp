#include "http/client.hpp"

#include "utils.hpp"
#include "socketwrapper.hpp"

#include "fmt/format.h"

#include <array>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <memory>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>

namespace http
{

std::optional<url> parse_url(std::string_view view)
{
    url parsed;

    std::string::size_type tmp = view.find("://");
    if(tmp == std::string_view::npos || tmp == 0)
        return std::nullopt;

    parsed.scheme = utils::to_lower(view.substr(0, tmp));
    view.remove_prefix(tmp + 3);

    size_t path_start = view.find_first_of("/?#");
    std::string_view authority = view.substr(0, path_start);
    if(path_start != std::string_view::npos)
    {
        std::string_view path = view.substr(path_start);
        path = path.substr(0, path.find('#'));
        parsed.path = (path.empty() || path[0] != '/') ? "/" + std::string {path} : std::string {path};
    }

    // Drop user information
    if(size_t at = authority.rfind('@'); at != std::string_view::npos)
        authority.remove_prefix(at + 1);

    std::string_view port_view;
    if(!authority.empty() && authority[0] == '[')
    {
        size_t close = authority.find(']');
        if(close == std::string_view::npos)
            return std::nullopt;
        parsed.host = std::string {authority.substr(1, close - 1)};
        port_view = authority.substr(close + 1);
    }
    else
    {
        size_t colon = authority.rfind(':');
        parsed.host = std::string {authority.substr(0, colon)};
        port_view = (colon == std::string_view::npos) ? std::string_view {} : authority.substr(colon);
    }

    if(parsed.host.empty())
        return std::nullopt;

    if(port_view.empty())
    {
        parsed.port = (parsed.scheme == "https") ? 443 : 80;
    }
    else
    {
        if(port_view[0] != ':' || port_view.size() == 1)
            return std::nullopt;
        port_view.remove_prefix(1);

        unsigned int port;
        auto res = std::from_chars(port_view.data(), port_view.data() + port_view.size(), port);
        if(res.ec != std::errc {} || res.ptr != port_view.data() + port_view.size() || port == 0 || port > 65535)
            return std::nullopt;
        parsed.port = static_cast<uint16_t>(port);
    }

    return parsed;
}

std::string resolve_url(std::string_view base, std::string_view reference)
{
    if(reference.empty())
        return std::string {base};
    if(reference.find("://") != std::string_view::npos)
        return std::string {reference};

    size_t scheme_end = base.find("://");
    if(scheme_end == std::string_view::npos)
        return std::string {reference};

    if(utils::starts_with(reference, "//"))
        return std::string {base.substr(0, scheme_end + 1)} + std::string {reference};

    // Query or fragment only, the base path stays
    if(reference[0] == '?')
        return std::string {base.substr(0, base.find_first_of("?#"))} + std::string {reference};
    if(reference[0] == '#')
        return std::string {base.substr(0, base.find('#'))} + std::string {reference};

    size_t authority_end = base.find_first_of("/?#", scheme_end + 3);
    std::string origin {base.substr(0, authority_end)};
    if(reference[0] == '/')
        return origin + std::string {reference};

    std::string_view path = (authority_end == std::string_view::npos) ? std::string_view {"/"} : base.substr(authority_end);
    path = path.substr(0, path.find_first_of("?#"));
    if(path.empty())
        path = "/";
    path = path.substr(0, path.rfind('/') + 1);

    return origin + std::string {path} + std::string {reference};
}

template<net::ip_version ip_ver>
static std::string exchange(const std::string& addr, uint16_t port, std::string request,
    std::chrono::milliseconds timeout, size_t max_size)
{
    std::string raw;

    try {
        net::tcp_connection<ip_ver> sock {addr, port};
        sock.send(net::span {request.begin(), request.end()});

        std::array<char, 4096> buffer;
        pollfd pfd {sock.get(), POLLIN, 0};
        while(true)
        {
            int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
            if(ready == 0)
                throw error {fmt::format("reading from {}:{} timed out", addr, port)};
            if(ready < 0)
            {
                if(errno == EINTR)
                    continue;
                throw error {std::strerror(errno)};
            }

            size_t br = sock.read(net::span {buffer});
            if(br == 0)
                break;

            raw.append(buffer.data(), br);
            if(raw.size() > max_size)
                throw error {fmt::format("response from {}:{} exceeds {} bytes", addr, port, max_size)};

            // Some devices keep the connection open despite Connection: close
            if(response::complete(raw))
                break;
        }
    } catch(const error&) {
        throw;
    } catch(std::runtime_error& e) {
        throw error {e.what()};
    }

    return raw;
}

tcp_client::tcp_client(std::chrono::milliseconds read_timeout, size_t max_response_size)
    : m_read_timeout {read_timeout},
      m_max_response_size {max_response_size}
{}

response tcp_client::get(const std::string& location)
{
    std::optional<url> target = parse_url(location);
    if(!target || target->scheme != "http")
        throw error {fmt::format("unsupported url '{}'", location)};

    addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result;
    if(int rc = getaddrinfo(target->host.c_str(), nullptr, &hints, &result); rc != 0)
        throw error {fmt::format("cannot resolve {}: {}", target->host, gai_strerror(rc))};
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> guard {result, &freeaddrinfo};

    std::array<char, NI_MAXHOST> host;
    if(getnameinfo(result->ai_addr, result->ai_addrlen, host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST) != 0)
        throw error {fmt::format("cannot resolve {}", target->host)};

    std::string host_header = (target->host.find(':') != std::string::npos) ?
        fmt::format("[{}]:{}", target->host, target->port) : fmt::format("{}:{}", target->host, target->port);
    std::string req_str = fmt::format("GET {} HTTP/1.1\r\nHOST: {}\r\nConnection: close\r\nAccept: text/xml, application/xml\r\n\r\n",
        target->path, host_header);

    std::string raw = (result->ai_family == AF_INET6) ?
        exchange<net::ip_version::v6>(host.data(), target->port, std::move(req_str), m_read_timeout, m_max_response_size) :
        exchange<net::ip_version::v4>(host.data(), target->port, std::move(req_str), m_read_timeout, m_max_response_size);

    return response {raw};
}

} // namespace http
