#include "upnp_device.hpp"

#include "http/client.hpp"
#include "utils.hpp"

#include "fmt/format.h"
#include "rapidxml/rapidxml.hpp"

#include <algorithm>
#include <charconv>

using namespace rapidxml;

namespace upnp
{

struct walk_state
{
    std::optional<std::string> url_base;
    std::vector<upnp_device> devices;
};

// Element name without namespace prefix
static std::string_view local_name(const xml_node<char>* node)
{
    std::string_view name {node->name(), node->name_size()};
    size_t colon = name.find(':');
    return (colon == std::string_view::npos) ? name : name.substr(colon + 1);
}

static std::string text_of(const xml_node<char>* node)
{
    return std::string {utils::trim(std::string_view {node->value(), node->value_size()})};
}

template<typename record, size_t N>
static bool bind_text(record& rec, const std::array<text_field<record>, N>& fields, const xml_node<char>* node)
{
    std::string_view name = local_name(node);
    auto it = std::find_if(fields.begin(), fields.end(), [name](const text_field<record>& field) {
        return field.tag == name;
    });
    if(it == fields.end())
        return false;

    rec.*(it->member) = text_of(node);
    return true;
}

template<typename record, size_t N>
static bool bind_number(record& rec, const std::array<number_field<record>, N>& fields, const xml_node<char>* node)
{
    std::string_view name = local_name(node);
    auto it = std::find_if(fields.begin(), fields.end(), [name](const number_field<record>& field) {
        return field.tag == name;
    });
    if(it == fields.end())
        return false;

    // Devices send garbage here now and then, keep 0 in that case
    std::string text = text_of(node);
    int value = 0;
    auto res = std::from_chars(text.data(), text.data() + text.size(), value);
    rec.*(it->member) = (res.ec == std::errc {}) ? value : 0;
    return true;
}

template<typename callback_type>
static void for_each_element(const xml_node<char>* parent, callback_type&& callback)
{
    for(xml_node<char>* child = parent->first_node(); child; child = child->next_sibling())
    {
        if(child->type() == node_element)
            callback(child);
    }
}

static upnp_service bind_service(const xml_node<char>* service_node)
{
    upnp_service service;
    for_each_element(service_node, [&service](const xml_node<char>* child) {
        bind_text(service, service_fields, child);
    });
    return service;
}

static upnp_icon bind_icon(const xml_node<char>* icon_node)
{
    upnp_icon icon;
    for_each_element(icon_node, [&icon](const xml_node<char>* child) {
        if(!bind_text(icon, icon_text_fields, child))
            bind_number(icon, icon_number_fields, child);
    });
    return icon;
}

static upnp_device bind_device(const xml_node<char>* device_node)
{
    upnp_device device;

    for_each_element(device_node, [&device](const xml_node<char>* child) {
        if(bind_text(device, device_fields, child))
            return;

        std::string_view name = local_name(child);
        if(name == "iconList")
        {
            for_each_element(child, [&device](const xml_node<char>* icon) {
                if(local_name(icon) == "icon")
                    device.icons.push_back(bind_icon(icon));
            });
        }
        else if(name == "serviceList")
        {
            for_each_element(child, [&device](const xml_node<char>* service) {
                if(local_name(service) == "service")
                    device.services.push_back(bind_service(service));
            });
        }
        else if(name == "deviceList")
        {
            for_each_element(child, [&device](const xml_node<char>* embedded) {
                if(local_name(embedded) == "device")
                    device.embedded_devices.push_back(bind_device(embedded));
            });
        }
    });

    return device;
}

// Device subtrees are bound as a whole and not descended into
static void walk(const xml_node<char>* node, walk_state& state)
{
    for_each_element(node, [&state](const xml_node<char>* child) {
        std::string_view name = local_name(child);
        if(name == "URLBase")
            state.url_base = text_of(child);
        else if(name == "device")
            state.devices.push_back(bind_device(child));
        else
            walk(child, state);
    });
}

static void set_base_url(upnp_device& device, const std::string& base_url)
{
    device.base_url = base_url;
    for(auto& embedded : device.embedded_devices)
        set_base_url(embedded, base_url);
}

std::vector<upnp_device> parse_description(std::string_view document, std::string_view location)
{
    // rapidxml parses in place and needs a terminated, writable buffer
    std::vector<char> buffer {document.begin(), document.end()};
    buffer.push_back('\0');

    xml_document<char> doc;
    try {
        doc.parse<parse_validate_closing_tags>(buffer.data());
    } catch(rapidxml::parse_error& e) {
        throw description_error {fmt::format("malformed description document: {}", e.what())};
    }

    walk_state state;
    walk(&doc, state);

    std::string base_url = (state.url_base && !state.url_base->empty()) ? *state.url_base : std::string {location};
    for(auto& device : state.devices)
        set_base_url(device, base_url);

    return std::move(state.devices);
}

bool upnp_device::service_available(std::string_view service_id) const
{
    return get_service_information(service_id).has_value();
}

std::optional<std::reference_wrapper<const upnp_service>> upnp_device::get_service_information(std::string_view service_id) const
{
    // Devices typically have around 3 to 4 services, a linear search is fine
    auto it = std::find_if(services.begin(), services.end(), [&s_id = service_id](const upnp_service& service) {
        // The serviceId is a schema string like urn:upnp-org:serviceId:RenderingControl
        std::string_view id_view {service.id};
        return id_view == s_id || id_view.substr(id_view.find_last_of(':') + 1) == s_id;
    });

    if(it != services.end())
        return *it;
    else
        return std::nullopt;
}

std::string upnp_device::absolute_url(std::string_view reference) const
{
    return http::resolve_url(base_url, reference);
}

} // namespace upnp
