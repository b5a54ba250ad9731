#include <http/response.hpp>

#include <utils.hpp>

#include <charconv>

namespace http
{

static constexpr std::string_view header_termination {"\r\n\r\n"};

static bool parse_size(std::string_view view, size_t& value, int base = 10)
{
    view = utils::trim(view);
    if(view.empty())
        return false;

    auto res = std::from_chars(view.data(), view.data() + view.size(), value, base);
    return res.ec == std::errc {} && res.ptr == view.data() + view.size();
}

void response::parse(std::string_view raw)
{
    m_headers.clear();
    m_body.clear();

    size_t header_end = raw.find(header_termination);
    if(header_end == std::string_view::npos)
        throw error {"incomplete http response header"};

    std::string_view head {raw.data(), header_end};
    std::string_view body = raw.substr(header_end + header_termination.size());

    size_t endl = head.find("\r\n");
    parse_statusline(head.substr(0, endl));

    /* Read and parse response headers */
    while(endl != std::string_view::npos)
    {
        head.remove_prefix(endl + 2);
        endl = head.find("\r\n");
        std::string_view headerline = head.substr(0, endl);

        size_t sep = headerline.find(':');
        if(sep == std::string_view::npos)
            throw error {"invalid http header line"};

        m_headers[utils::to_lower(utils::trim(headerline.substr(0, sep)))] =
            std::string {utils::trim(headerline.substr(sep + 1))};
    }

    /* Extract the body according to its framing */
    if(utils::iequals(get_header("transfer-encoding"), "chunked"))
    {
        m_body = decode_chunked(body);
    }
    else if(check_header("content-length"))
    {
        size_t length;
        if(!parse_size(get_header("content-length"), length))
            throw error {"invalid content-length"};
        if(body.size() < length)
            throw error {"truncated http body"};
        m_body = std::string {body.substr(0, length)};
    }
    else
    {
        m_body = std::string {body};
    }
}

bool response::complete(std::string_view raw)
{
    size_t header_end = raw.find(header_termination);
    if(header_end == std::string_view::npos)
        return false;

    response parsed;
    try {
        parsed.parse(raw);
    } catch(const error&) {
        return false;
    }

    // Without any framing the body ends when the peer closes
    return parsed.check_header("content-length") || utils::iequals(parsed.get_header("transfer-encoding"), "chunked");
}

bool response::check_header(const std::string& key) const
{
    return m_headers.find(utils::to_lower(key)) != m_headers.end();
}

std::string response::get_header(const std::string& key) const
{
    auto it = m_headers.find(utils::to_lower(key));
    if(it == m_headers.end())
        return "";
    else
        return it->second;
}

void response::parse_statusline(std::string_view statusline)
{
    size_t first = statusline.find(' ');
    if(first == std::string_view::npos || !utils::starts_with(statusline, "HTTP/"))
        throw error {"invalid http status line"};

    m_protocol = std::string {statusline.substr(0, first)};

    std::string_view rest = statusline.substr(first + 1);
    size_t second = rest.find(' ');
    std::string_view code = rest.substr(0, second);

    auto res = std::from_chars(code.data(), code.data() + code.size(), m_code);
    if(res.ec != std::errc {} || res.ptr != code.data() + code.size())
        throw error {"invalid http status code"};

    m_phrase = (second == std::string_view::npos) ? std::string {} : std::string {rest.substr(second + 1)};
}

std::string response::decode_chunked(std::string_view body)
{
    std::string decoded;

    while(true)
    {
        size_t endl = body.find("\r\n");
        if(endl == std::string_view::npos)
            throw error {"truncated chunked body"};

        // Chunk extensions after ';' are ignored
        std::string_view size_line = body.substr(0, endl);
        size_line = size_line.substr(0, size_line.find(';'));

        size_t chunk_size;
        if(!parse_size(size_line, chunk_size, 16))
            throw error {"invalid chunk size"};

        body.remove_prefix(endl + 2);
        if(chunk_size == 0)
            break;

        if(chunk_size > body.size() || body.size() - chunk_size < 2)
            throw error {"truncated chunked body"};

        decoded.append(body.data(), chunk_size);
        body.remove_prefix(chunk_size + 2);
    }

    return decoded;
}

} // namespace http
