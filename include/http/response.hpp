#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

namespace http
{

class error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// HTTP/1.x response as received from a device. Header names are case
// insensitive and kept lower-cased.
class response
{
public:

    response() = default;

    explicit response(std::string_view raw)
    {
        parse(raw);
    }

    // Throws http::error if raw is not a complete HTTP/1.x response
    void parse(std::string_view raw);

    bool check_header(const std::string& key) const;

    std::string get_header(const std::string& key) const;

    int get_code() const
    {
        return m_code;
    }

    const std::string& get_phrase() const
    {
        return m_phrase;
    }

    const std::string& get_protocol() const
    {
        return m_protocol;
    }

    const std::string& get_body() const
    {
        return m_body;
    }

    bool success() const
    {
        return m_code >= 200 && m_code < 300;
    }

    // True once raw holds the complete header block and, when announced by
    // Content-Length, the complete body
    static bool complete(std::string_view raw);

private:

    void parse_statusline(std::string_view statusline);

    static std::string decode_chunked(std::string_view body);

    int m_code = 0;
    std::string m_protocol;
    std::string m_phrase;
    std::string m_body;

    std::map<std::string, std::string> m_headers;

};

} // namespace http

#endif
