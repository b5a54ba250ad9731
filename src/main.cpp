#include <charconv>
#include <chrono>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

#include "fmt/format.h"
#include <nlohmann/json.hpp>

#include "control_point.hpp"
#include "local_address.hpp"
#include "log.hpp"
#include "multicast_socket.hpp"
#include "http/client.hpp"

using nlohmann::json;

#define DEFAULT_DEVICE_TYPE "MediaRenderer"

struct cli_options
{
    std::string device_type = DEFAULT_DEVICE_TYPE;
    int version = 1;
    std::optional<std::string> search_target;
    discovery::search_options search;
    bool print_json = false;
    bool debug = false;
};

static void print_usage(const char* prog)
{
    fmt::print(
        "Usage: {} [options] [device-type]\n"
        "Discover UPnP devices of device-type (default " DEFAULT_DEVICE_TYPE ") on all local interfaces.\n\n"
        "  -v, --version <n>   device version used in the search urn (default 1)\n"
        "  -s, --st <target>   raw search target, prints the ssdp notifications only\n"
        "  -t, --timeout <ms>  reception window per interface (default 3000)\n"
        "  -n, --sends <n>     search requests sent per interface (default 3)\n"
        "      --json          print the result as json\n"
        "  -d, --debug         enable debug logging\n"
        "  -h, --help          show this help\n",
        prog);
}

template<typename T>
static bool parse_number(std::string_view view, T& value)
{
    auto res = std::from_chars(view.data(), view.data() + view.size(), value);
    return res.ec == std::errc {} && res.ptr == view.data() + view.size();
}

// Returns std::nullopt and prints the reason on invalid arguments
static std::optional<cli_options> parse_args(int argc, char* argv[])
{
    cli_options opts;

    for(int i = 1; i < argc; i++)
    {
        std::string_view arg {argv[i]};
        auto next = [&]() -> std::optional<std::string_view> {
            if(i + 1 >= argc)
            {
                fmt::print(stderr, "Missing value for {}\n", arg);
                return std::nullopt;
            }
            return std::string_view {argv[++i]};
        };

        if(arg == "-h" || arg == "--help")
        {
            print_usage(argv[0]);
            std::exit(EXIT_SUCCESS);
        }
        else if(arg == "--json")
        {
            opts.print_json = true;
        }
        else if(arg == "-d" || arg == "--debug")
        {
            opts.debug = true;
        }
        else if(arg == "-v" || arg == "--version")
        {
            auto val = next();
            if(!val || !parse_number(*val, opts.version) || opts.version < 1)
                return std::nullopt;
        }
        else if(arg == "-s" || arg == "--st")
        {
            auto val = next();
            if(!val)
                return std::nullopt;
            opts.search_target = std::string {*val};
        }
        else if(arg == "-t" || arg == "--timeout")
        {
            unsigned int ms;
            auto val = next();
            if(!val || !parse_number(*val, ms))
                return std::nullopt;
            opts.search.reception_window = std::chrono::milliseconds {ms};
        }
        else if(arg == "-n" || arg == "--sends")
        {
            auto val = next();
            if(!val || !parse_number(*val, opts.search.send_count) || opts.search.send_count == 0)
                return std::nullopt;
        }
        else if(!arg.empty() && arg[0] != '-')
        {
            opts.device_type = std::string {arg};
        }
        else
        {
            fmt::print(stderr, "Unknown option {}\n", arg);
            return std::nullopt;
        }
    }

    return opts;
}

static json to_json(const discovery::ssdp_notification& notification)
{
    return json {
        {"usn", notification.usn},
        {"location", notification.location},
        {"st", notification.st},
        {"server", notification.server},
        {"headers", notification.headers}
    };
}

static json to_json(const upnp::upnp_device& device)
{
    json services = json::array();
    for(const auto& service : device.services)
    {
        services.push_back({
            {"serviceType", service.service_type},
            {"serviceId", service.id},
            {"SCPDURL", device.absolute_url(service.scpd_url)},
            {"controlURL", device.absolute_url(service.control_url)},
            {"eventSubURL", device.absolute_url(service.event_sub_url)}
        });
    }

    json icons = json::array();
    for(const auto& icon : device.icons)
    {
        icons.push_back({
            {"mimetype", icon.mime_type},
            {"width", icon.width},
            {"height", icon.height},
            {"depth", icon.depth},
            {"url", device.absolute_url(icon.url)}
        });
    }

    json embedded = json::array();
    for(const auto& it : device.embedded_devices)
        embedded.push_back(to_json(it));

    return json {
        {"deviceType", device.device_type},
        {"friendlyName", device.friendly_name},
        {"manufacturer", device.manufacturer},
        {"modelName", device.model_name},
        {"modelNumber", device.model_number},
        {"serialNumber", device.serial_number},
        {"UDN", device.udn},
        {"URLBase", device.base_url},
        {"presentationURL", device.presentation_url},
        {"services", services},
        {"icons", icons},
        {"devices", embedded}
    };
}

static void print_device(const upnp::upnp_device& device, int indent = 0)
{
    std::string pad(indent, ' ');
    fmt::print("{}{} | {}\n", pad, device.friendly_name, device.device_type);
    fmt::print("{}  UDN:     {}\n", pad, device.udn);
    fmt::print("{}  Model:   {} {} {}\n", pad, device.manufacturer, device.model_name, device.model_number);
    fmt::print("{}  URLBase: {}\n", pad, device.base_url);
    for(const auto& service : device.services)
        fmt::print("{}  Service: {} -> {}\n", pad, service.id, device.absolute_url(service.control_url));
    for(const auto& embedded : device.embedded_devices)
        print_device(embedded, indent + 4);
}

int main(int argc, char* argv[])
{
    std::optional<cli_options> opts = parse_args(argc, argv);
    if(!opts)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if(opts->debug)
        logging::set_level(logging::level::debug);

    discovery::system_address_provider addresses;
    http::tcp_client client;
    upnp::control_point cp {addresses,
        discovery::make_multicast_socket_factory(opts->search.multicast_ttl, opts->search.receive_buffer_size),
        client, opts->search};

    if(opts->search_target)
    {
        std::vector<discovery::ssdp_notification> notifications = cp.search_devices(*opts->search_target);
        if(opts->print_json)
        {
            json out = json::array();
            for(const auto& it : notifications)
                out.push_back(to_json(it));
            fmt::print("{}\n", out.dump(2));
            return EXIT_SUCCESS;
        }

        fmt::print("Received {} notification(s).\n-------------------------------\n", notifications.size());
        for(const auto& it : notifications)
            fmt::print("{}\n  LOCATION: {}\n  SERVER:   {}\n", it.usn, it.location, it.server);
        return EXIT_SUCCESS;
    }

    std::vector<upnp::upnp_device> devices = cp.search_devices_of_type(opts->device_type, opts->version);
    if(opts->print_json)
    {
        json out = json::array();
        for(const auto& it : devices)
            out.push_back(to_json(it));
        fmt::print("{}\n", out.dump(2));
        return EXIT_SUCCESS;
    }

    fmt::print("Detected {} device(s) in your local network.\n-------------------------------\n", devices.size());
    for(const auto& it : devices)
        print_device(it);

    return EXIT_SUCCESS;
}
