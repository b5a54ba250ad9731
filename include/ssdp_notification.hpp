#ifndef SSDP_NOTIFICATION_HPP
#define SSDP_NOTIFICATION_HPP

#include <array>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace discovery
{

// Header names are stored lower-cased
using header_map = std::map<std::string, std::string>;

struct ssdp_notification
{
    std::string location;
    std::string usn;
    std::string st;
    std::string server;
    std::string cache_control;
    std::string ext;
    std::string date;
    std::string boot_id;
    std::string config_id;

    header_map headers; /// every header of the response, verbatim
};

struct notification_field
{
    std::string_view header;
    std::string ssdp_notification::* member;
    bool required;
};

inline constexpr std::array<notification_field, 9> notification_fields {{
    {"location", &ssdp_notification::location, true},
    {"usn", &ssdp_notification::usn, true},
    {"st", &ssdp_notification::st, false},
    {"server", &ssdp_notification::server, false},
    {"cache-control", &ssdp_notification::cache_control, false},
    {"ext", &ssdp_notification::ext, false},
    {"date", &ssdp_notification::date, false},
    {"bootid.upnp.org", &ssdp_notification::boot_id, false},
    {"configid.upnp.org", &ssdp_notification::config_id, false},
}};

struct notification_error
{
    std::string missing_header;
};

using notification_result = std::variant<ssdp_notification, notification_error>;

header_map parse_headers(std::string_view response);

notification_result bind_notification(header_map&& headers);

notification_result parse_notification(std::string_view response);

// Keeps the first notification of every USN, in order
std::vector<ssdp_notification> unique_by_usn(std::vector<ssdp_notification>&& notifications);

// Parses every response, skips the malformed ones and removes duplicates
std::vector<ssdp_notification> parse_notifications(const std::vector<std::string>& responses);

} // namespace discovery

#endif
