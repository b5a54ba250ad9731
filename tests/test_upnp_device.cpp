#include <gtest/gtest.h>

#include "upnp_device.hpp"

using namespace upnp;

namespace
{

const char* renderer_description = R"(<?xml version="1.0" encoding="utf-8"?>
<root xmlns="urn:schemas-upnp-org:device-1-0" xmlns:dlna="urn:schemas-dlna-org:device-1-0">
  <specVersion>
    <major>1</major>
    <minor>0</minor>
  </specVersion>
  <URLBase>http://192.168.1.30:8080/</URLBase>
  <device>
    <deviceType>urn:schemas-upnp-org:device:MediaRenderer:1</deviceType>
    <friendlyName>Living Room &amp; Kitchen</friendlyName>
    <manufacturer>ACME</manufacturer>
    <manufacturerURL>http://acme.example</manufacturerURL>
    <modelDescription>Network renderer</modelDescription>
    <modelName>Renderer 3000</modelName>
    <modelNumber>3000</modelNumber>
    <serialNumber>SN-42</serialNumber>
    <UDN>uuid:5f9ec1b3-ed59-49e5-9f1d-6fe2d14d4b30</UDN>
    <dlna:X_DLNADOC>DMR-1.50</dlna:X_DLNADOC>
    <iconList>
      <icon>
        <mimetype>image/png</mimetype>
        <width>120</width>
        <height>120</height>
        <depth>24</depth>
        <url>/icons/large.png</url>
      </icon>
      <icon>
        <mimetype>image/jpeg</mimetype>
        <width>n/a</width>
        <height>48</height>
        <depth>24</depth>
        <url>icons/small.jpg</url>
      </icon>
    </iconList>
    <serviceList>
      <service>
        <serviceType>urn:schemas-upnp-org:service:AVTransport:1</serviceType>
        <serviceId>urn:upnp-org:serviceId:AVTransport</serviceId>
        <SCPDURL>/AVTransport/scpd.xml</SCPDURL>
        <controlURL>/AVTransport/control</controlURL>
        <eventSubURL>/AVTransport/event</eventSubURL>
      </service>
      <service>
        <serviceType>urn:schemas-upnp-org:service:RenderingControl:1</serviceType>
        <serviceId>urn:upnp-org:serviceId:RenderingControl</serviceId>
        <SCPDURL>/RenderingControl/scpd.xml</SCPDURL>
        <controlURL>/RenderingControl/control</controlURL>
        <eventSubURL>/RenderingControl/event</eventSubURL>
      </service>
    </serviceList>
    <deviceList>
      <device>
        <deviceType>urn:schemas-upnp-org:device:MediaServer:1</deviceType>
        <friendlyName>Embedded server</friendlyName>
        <UDN>uuid:embedded</UDN>
      </device>
    </deviceList>
    <presentationURL>/index.html</presentationURL>
  </device>
</root>
)";

const char* minimal_description = R"(<?xml version="1.0"?>
<root xmlns="urn:schemas-upnp-org:device-1-0">
  <device>
    <deviceType>urn:schemas-upnp-org:device:MediaServer:1</deviceType>
    <friendlyName>NAS</friendlyName>
    <UDN>uuid:1</UDN>
  </device>
</root>
)";

} // namespace

TEST(UpnpDescriptionTest, BindsDeviceFields)
{
    std::vector<upnp_device> devices = parse_description(renderer_description, "http://192.168.1.30:8080/desc.xml");
    ASSERT_EQ(devices.size(), 1u);

    const upnp_device& dev = devices.front();
    EXPECT_EQ(dev.device_type, "urn:schemas-upnp-org:device:MediaRenderer:1");
    EXPECT_EQ(dev.friendly_name, "Living Room & Kitchen");
    EXPECT_EQ(dev.manufacturer, "ACME");
    EXPECT_EQ(dev.manufacturer_url, "http://acme.example");
    EXPECT_EQ(dev.model_description, "Network renderer");
    EXPECT_EQ(dev.model_name, "Renderer 3000");
    EXPECT_EQ(dev.model_number, "3000");
    EXPECT_EQ(dev.serial_number, "SN-42");
    EXPECT_EQ(dev.udn, "uuid:5f9ec1b3-ed59-49e5-9f1d-6fe2d14d4b30");
    EXPECT_EQ(dev.presentation_url, "/index.html");
    EXPECT_TRUE(dev.upc.empty());
}

TEST(UpnpDescriptionTest, ExplicitUrlBaseWins)
{
    std::vector<upnp_device> devices = parse_description(renderer_description, "http://192.168.1.30:8080/desc.xml");
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices.front().base_url, "http://192.168.1.30:8080/");
}

TEST(UpnpDescriptionTest, LocationIsBaseUrlWithoutUrlBase)
{
    std::vector<upnp_device> devices = parse_description(minimal_description, "http://host1/desc.xml");
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices.front().base_url, "http://host1/desc.xml");
    EXPECT_EQ(devices.front().friendly_name, "NAS");
}

TEST(UpnpDescriptionTest, UrlBaseAfterDeviceStillApplies)
{
    std::vector<upnp_device> devices = parse_description(
        "<root><device><UDN>uuid:x</UDN></device><URLBase>http://late/</URLBase></root>", "http://loc/d.xml");
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices.front().base_url, "http://late/");
}

TEST(UpnpDescriptionTest, BindsServicesAndIcons)
{
    upnp_device dev = parse_description(renderer_description, "http://192.168.1.30:8080/desc.xml").front();

    ASSERT_EQ(dev.services.size(), 2u);
    EXPECT_EQ(dev.services[0].service_type, "urn:schemas-upnp-org:service:AVTransport:1");
    EXPECT_EQ(dev.services[0].id, "urn:upnp-org:serviceId:AVTransport");
    EXPECT_EQ(dev.services[0].scpd_url, "/AVTransport/scpd.xml");
    EXPECT_EQ(dev.services[0].control_url, "/AVTransport/control");
    EXPECT_EQ(dev.services[0].event_sub_url, "/AVTransport/event");

    ASSERT_EQ(dev.icons.size(), 2u);
    EXPECT_EQ(dev.icons[0].mime_type, "image/png");
    EXPECT_EQ(dev.icons[0].width, 120);
    EXPECT_EQ(dev.icons[0].height, 120);
    EXPECT_EQ(dev.icons[0].depth, 24);
    EXPECT_EQ(dev.icons[0].url, "/icons/large.png");
    EXPECT_EQ(dev.icons[1].width, 0);
    EXPECT_EQ(dev.icons[1].height, 48);
}

TEST(UpnpDescriptionTest, EmbeddedDevicesShareBaseUrl)
{
    upnp_device dev = parse_description(renderer_description, "http://192.168.1.30:8080/desc.xml").front();

    ASSERT_EQ(dev.embedded_devices.size(), 1u);
    EXPECT_EQ(dev.embedded_devices[0].friendly_name, "Embedded server");
    EXPECT_EQ(dev.embedded_devices[0].udn, "uuid:embedded");
    EXPECT_EQ(dev.embedded_devices[0].base_url, "http://192.168.1.30:8080/");
}

TEST(UpnpDescriptionTest, MalformedDocumentThrows)
{
    EXPECT_THROW(parse_description("<root><device><UDN>uuid:1</device></root>", "http://h/d.xml"), description_error);
    EXPECT_THROW(parse_description("<root><device><UDN>uuid:1</UDN>", "http://h/d.xml"), description_error);
    EXPECT_THROW(parse_description("plain text", "http://h/d.xml"), description_error);
}

TEST(UpnpDescriptionTest, DocumentWithoutDeviceYieldsNothing)
{
    EXPECT_TRUE(parse_description("<root><specVersion><major>1</major></specVersion></root>", "http://h/d.xml").empty());
}

TEST(UpnpDeviceTest, FindsServicesByFullOrShortId)
{
    upnp_device dev = parse_description(renderer_description, "http://192.168.1.30:8080/desc.xml").front();

    EXPECT_TRUE(dev.service_available("AVTransport"));
    EXPECT_TRUE(dev.service_available("urn:upnp-org:serviceId:RenderingControl"));
    EXPECT_FALSE(dev.service_available("ConnectionManager"));

    auto service = dev.get_service_information("RenderingControl");
    ASSERT_TRUE(service.has_value());
    EXPECT_EQ(service->get().control_url, "/RenderingControl/control");
}

TEST(UpnpDeviceTest, ResolvesUrlsAgainstBase)
{
    upnp_device dev = parse_description(renderer_description, "http://192.168.1.30:8080/desc.xml").front();

    EXPECT_EQ(dev.absolute_url(dev.services[0].control_url), "http://192.168.1.30:8080/AVTransport/control");
    EXPECT_EQ(dev.absolute_url(dev.icons[1].url), "http://192.168.1.30:8080/icons/small.jpg");
}
