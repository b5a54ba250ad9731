#ifndef UPNP_DEVICE_HPP
#define UPNP_DEVICE_HPP

#include <array>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace upnp
{

struct upnp_service
{
    std::string service_type;
    std::string id;
    std::string scpd_url;
    std::string control_url;
    std::string event_sub_url;
};

struct upnp_icon
{
    std::string mime_type;
    int width = 0;
    int height = 0;
    int depth = 0;
    std::string url;
};

struct upnp_device
{
    std::string device_type;
    std::string friendly_name;
    std::string manufacturer;
    std::string manufacturer_url;
    std::string model_description;
    std::string model_name;
    std::string model_number;
    std::string model_url;
    std::string serial_number;
    std::string udn;
    std::string upc;
    std::string presentation_url;

    // URLBase of the description document, or the location it was fetched from
    std::string base_url;

    std::vector<upnp_icon> icons;
    std::vector<upnp_service> services;
    std::vector<upnp_device> embedded_devices;

    // service_id is either the full id (urn:upnp-org:serviceId:AVTransport)
    // or its last segment (AVTransport)
    bool service_available(std::string_view service_id) const;

    std::optional<std::reference_wrapper<const upnp_service>> get_service_information(std::string_view service_id) const;

    // Resolves a URL from the description (SCPDURL, controlURL, ...) against base_url
    std::string absolute_url(std::string_view reference) const;
};

// Tag-name to member binding tables of the description document records
template<typename record>
struct text_field
{
    std::string_view tag;
    std::string record::* member;
};

template<typename record>
struct number_field
{
    std::string_view tag;
    int record::* member;
};

inline constexpr std::array<text_field<upnp_device>, 12> device_fields {{
    {"deviceType", &upnp_device::device_type},
    {"friendlyName", &upnp_device::friendly_name},
    {"manufacturer", &upnp_device::manufacturer},
    {"manufacturerURL", &upnp_device::manufacturer_url},
    {"modelDescription", &upnp_device::model_description},
    {"modelName", &upnp_device::model_name},
    {"modelNumber", &upnp_device::model_number},
    {"modelURL", &upnp_device::model_url},
    {"serialNumber", &upnp_device::serial_number},
    {"UDN", &upnp_device::udn},
    {"UPC", &upnp_device::upc},
    {"presentationURL", &upnp_device::presentation_url},
}};

inline constexpr std::array<text_field<upnp_service>, 5> service_fields {{
    {"serviceType", &upnp_service::service_type},
    {"serviceId", &upnp_service::id},
    {"SCPDURL", &upnp_service::scpd_url},
    {"controlURL", &upnp_service::control_url},
    {"eventSubURL", &upnp_service::event_sub_url},
}};

inline constexpr std::array<text_field<upnp_icon>, 2> icon_text_fields {{
    {"mimetype", &upnp_icon::mime_type},
    {"url", &upnp_icon::url},
}};

inline constexpr std::array<number_field<upnp_icon>, 3> icon_number_fields {{
    {"width", &upnp_icon::width},
    {"height", &upnp_icon::height},
    {"depth", &upnp_icon::depth},
}};

class description_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Walks the description document once. Every top-level device element
// becomes one upnp_device, its base_url set to the URLBase element if the
// document has one and to location otherwise. Throws description_error if
// the document is not well-formed XML.
std::vector<upnp_device> parse_description(std::string_view document, std::string_view location);

} // namespace upnp

#endif
