#include "ssdp_notification.hpp"

#include "log.hpp"
#include "utils.hpp"

#include <unordered_set>
#include <utility>

namespace discovery
{

header_map parse_headers(std::string_view view)
{
    header_map res;

    while(!view.empty())
    {
        size_t endl = view.find('\n');
        std::string_view line = view.substr(0, endl);
        view.remove_prefix((endl == std::string_view::npos) ? view.size() : endl + 1);

        if(!line.empty() && line.back() == '\r')
            line.remove_suffix(1);

        size_t sep = line.find(':');
        if(line.empty() || sep == std::string_view::npos)
            continue;

        std::string_view key = utils::trim(line.substr(0, sep));
        if(key.empty())
            continue;

        res[utils::to_lower(key)] = std::string {utils::trim(line.substr(sep + 1))};
    }

    return res;
}

notification_result bind_notification(header_map&& headers)
{
    ssdp_notification notification;

    for(const auto& field : notification_fields)
    {
        auto it = headers.find(std::string {field.header});
        if(it != headers.end())
            notification.*(field.member) = it->second;
        else if(field.required)
            return notification_error {std::string {field.header}};
    }

    notification.headers = std::move(headers);
    return notification;
}

notification_result parse_notification(std::string_view response)
{
    return bind_notification(parse_headers(response));
}

std::vector<ssdp_notification> unique_by_usn(std::vector<ssdp_notification>&& notifications)
{
    std::unordered_set<std::string> seen;
    std::vector<ssdp_notification> unique;
    unique.reserve(notifications.size());

    for(auto& it : notifications)
    {
        if(seen.insert(it.usn).second)
            unique.push_back(std::move(it));
    }

    return unique;
}

std::vector<ssdp_notification> parse_notifications(const std::vector<std::string>& responses)
{
    std::vector<ssdp_notification> notifications;
    notifications.reserve(responses.size());

    for(const auto& response : responses)
    {
        notification_result res = parse_notification(response);
        if(auto* err = std::get_if<notification_error>(&res))
        {
            logging::debug("skipping ssdp response without {} header", err->missing_header);
            continue;
        }

        notifications.push_back(std::get<ssdp_notification>(std::move(res)));
    }

    return unique_by_usn(std::move(notifications));
}

} // namespace discovery
