/* Copyright (C) 2026 The upcast authors
 *	 This program is free software; you can redistribute it and/or modify
 *	 it under the terms of the GNU General Public License as published by
 *	 the Free Software Foundation; either version 2 of the License, or
 *	 (at your option) any later version.
 *
 *	 This program is distributed in the hope that it will be useful,
 *	 but WITHOUT ANY WARRANTY; without even the implied warranty of
 *	 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *	 GNU General Public License for more details.
 *
 *	 You should have received a copy of the GNU General Public License
 *	 along with this program; if not, write to the
 *	 Free Software Foundation, Inc.,
 *	 59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */
#include <gtest/gtest.h>

#include <string>
#include <vector>
#include <mutex>

#include "libupcast/control/rendererdevice.hxx"
#include "libupcast/control/rendererdirectory.hxx"

using namespace std;
using namespace UPnPClient;
using namespace UpCastClient;

static const char avtType[] = "urn:schemas-upnp-org:service:AVTransport:1";
static const char rdcType[] =
    "urn:schemas-upnp-org:service:RenderingControl:1";

static UPnPDeviceDesc makeDesc(const string& udn, const string& name,
                               bool withavt = true)
{
    UPnPDeviceDesc desc;
    desc.ok = true;
    desc.deviceType = "urn:schemas-upnp-org:device:MediaRenderer:1";
    desc.UDN = udn;
    desc.friendlyName = name;
    desc.URLBase = "http://10.0.0.9:1400/";
    UPnPServiceDesc svc;
    svc.serviceType = rdcType;
    svc.controlURL = "/MediaRenderer/RenderingControl/Control";
    desc.services.push_back(svc);
    if (withavt) {
        svc.serviceType = avtType;
        svc.controlURL = "/MediaRenderer/AVTransport/Control";
        desc.services.push_back(svc);
    }
    return desc;
}

TEST(RendererDevice, DeviceIds)
{
    EXPECT_EQ("5a3b-77",
              usnToDeviceId(
                  "uuid:5a3b-77::urn:schemas-upnp-org:device:MediaRenderer:1"));
    EXPECT_EQ("5a3b-77", usnToDeviceId("uuid:5a3b-77"));
    EXPECT_EQ("5a3b-77", usnToDeviceId("uuid:5a3b-77::upnp:rootdevice"));
    // No prefix: unchanged
    EXPECT_EQ("whatever", usnToDeviceId("whatever"));
    EXPECT_EQ("", usnToDeviceId(""));
}

TEST(RendererDevice, ServiceTypes)
{
    EXPECT_TRUE(isTransportService(avtType));
    EXPECT_TRUE(isTransportService(
                    "urn:schemas-upnp-org:service:AVTransport:2"));
    EXPECT_FALSE(isTransportService(rdcType));
    EXPECT_TRUE(isRenderingService(rdcType));
    EXPECT_FALSE(isRenderingService(
                     "urn:schemas-upnp-org:service:ConnectionManager:1"));
}

TEST(RendererDevice, FromDesc)
{
    UPnPDeviceDesc desc = makeDesc("uuid:5a3b-77", "Kitchen");
    RendererDevice dev;
    ASSERT_TRUE(rendererFromDesc(desc, dev));
    EXPECT_EQ("5a3b-77", dev.id);
    EXPECT_EQ("Kitchen", dev.friendlyName);
    EXPECT_EQ("Unknown", dev.manufacturer);
    EXPECT_EQ("Unknown", dev.modelName);
    ASSERT_TRUE(dev.hasTransport());
    EXPECT_EQ("http://10.0.0.9:1400/MediaRenderer/AVTransport/Control",
              dev.avtURL);
    EXPECT_EQ(avtType, dev.avtServiceType);
    ASSERT_TRUE(dev.hasRendering());
    EXPECT_EQ("http://10.0.0.9:1400/MediaRenderer/RenderingControl/Control",
              dev.rdcURL);
    EXPECT_EQ(avtType, dev.avtService.serviceType);

    // First match wins, and absolute URLs are kept
    UPnPServiceDesc svc;
    svc.serviceType = avtType;
    svc.controlURL = "http://10.0.0.10/other";
    desc.services.push_back(svc);
    desc.manufacturer = "Acme";
    desc.modelName = "Box";
    ASSERT_TRUE(rendererFromDesc(desc, dev));
    EXPECT_EQ("http://10.0.0.9:1400/MediaRenderer/AVTransport/Control",
              dev.avtURL);
    EXPECT_EQ("Acme", dev.manufacturer);
    EXPECT_EQ("Box", dev.modelName);

    desc.services.clear();
    desc.services.push_back(svc);
    ASSERT_TRUE(rendererFromDesc(desc, dev));
    EXPECT_EQ("http://10.0.0.10/other", dev.avtURL);
    EXPECT_FALSE(dev.hasRendering());
}

TEST(RendererDevice, Rejected)
{
    RendererDevice dev;
    UPnPDeviceDesc desc = makeDesc("uuid:5a3b-77", "");
    EXPECT_FALSE(rendererFromDesc(desc, dev));
    desc = makeDesc("uuid:5a3b-77", "Kitchen");
    desc.ok = false;
    EXPECT_FALSE(rendererFromDesc(desc, dev));

    // Service without a control URL is ignored
    desc = makeDesc("uuid:5a3b-77", "Kitchen", false);
    UPnPServiceDesc svc;
    svc.serviceType = avtType;
    desc.services.push_back(svc);
    ASSERT_TRUE(rendererFromDesc(desc, dev));
    EXPECT_FALSE(dev.hasTransport());
}

TEST(RendererDevice, ParsedDescription)
{
    const string xml =
        "<?xml version=\"1.0\"?>"
        "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">"
        "<specVersion><major>1</major><minor>0</minor></specVersion>"
        "<device>"
        "<deviceType>urn:schemas-upnp-org:device:MediaRenderer:1</deviceType>"
        "<friendlyName>Living Room</friendlyName>"
        "<manufacturer>Acme</manufacturer>"
        "<modelName>Streamer 2</modelName>"
        "<UDN>uuid:0011-2233</UDN>"
        "<serviceList>"
        "<service>"
        "<serviceType>urn:schemas-upnp-org:service:AVTransport:1"
        "</serviceType>"
        "<serviceId>urn:upnp-org:serviceId:AVTransport</serviceId>"
        "<SCPDURL>/avt.xml</SCPDURL>"
        "<controlURL>ctl/avt</controlURL>"
        "<eventSubURL>/evt/avt</eventSubURL>"
        "</service>"
        "</serviceList>"
        "</device>"
        "</root>";
    UPnPDeviceDesc desc("http://192.168.1.20:49152/desc/device.xml", xml);
    ASSERT_TRUE(desc.ok);
    RendererDevice dev;
    ASSERT_TRUE(rendererFromDesc(desc, dev));
    EXPECT_EQ("0011-2233", dev.id);
    EXPECT_EQ("Living Room", dev.friendlyName);
    EXPECT_EQ("Acme", dev.manufacturer);
    EXPECT_EQ("Streamer 2", dev.modelName);
    EXPECT_EQ("http://192.168.1.20:49152/ctl/avt", dev.avtURL);
    EXPECT_FALSE(dev.hasRendering());
}

class DirectoryTest : public ::testing::Test {
protected:
    virtual void SetUp() {
        directory.setAddedCallback([this] (const RendererDevice& dev) {
                std::unique_lock<std::mutex> lock(mutex);
                added.push_back(dev.id);
            });
        ASSERT_TRUE(directory.start());
    }
    vector<string> addedIds() {
        std::unique_lock<std::mutex> lock(mutex);
        return added;
    }

    std::mutex mutex;
    vector<string> added;
    RendererDirectory directory;
};

TEST_F(DirectoryTest, AddAndDedupe)
{
    directory.onDevice(makeDesc("uuid:aaa", "Kitchen"));
    directory.onDevice(makeDesc("uuid:bbb", "Den"));
    // Once per service from a pool walk, and again on the next walk
    directory.onDevice(makeDesc("uuid:aaa", "Kitchen"));
    directory.onDevice(makeDesc("uuid:aaa", "Kitchen renamed"));
    ASSERT_TRUE(directory.waitIdle());

    vector<RendererDevice> devs;
    ASSERT_TRUE(directory.getDevices(devs));
    ASSERT_EQ(2u, devs.size());
    EXPECT_EQ("aaa", devs[0].id);
    EXPECT_EQ("Kitchen", devs[0].friendlyName);
    EXPECT_EQ("bbb", devs[1].id);
    vector<string> expected{"aaa", "bbb"};
    EXPECT_EQ(expected, addedIds());

    RendererDevice dev;
    ASSERT_TRUE(directory.getDevice("bbb", dev));
    EXPECT_EQ("Den", dev.friendlyName);
    ASSERT_TRUE(directory.getDevice("Kitchen", dev));
    EXPECT_EQ("aaa", dev.id);
    EXPECT_FALSE(directory.getDevice("ccc", dev));
}

TEST_F(DirectoryTest, Rejections)
{
    // No transport: never registered, and not looked at again
    directory.onDevice(makeDesc("uuid:tv", "Television", false));
    directory.onDevice(makeDesc("uuid:tv", "Television"));
    // Nameless
    directory.onDevice(makeDesc("uuid:anon", ""));
    // No UDN
    directory.onDevice(makeDesc("", "Ghost"));
    ASSERT_TRUE(directory.waitIdle());
    vector<RendererDevice> devs;
    directory.getDevices(devs);
    EXPECT_TRUE(devs.empty());
    EXPECT_TRUE(addedIds().empty());

    // A description which did not parse can be retried
    UPnPDeviceDesc bad = makeDesc("uuid:late", "Late");
    bad.ok = false;
    directory.onDevice(bad);
    ASSERT_TRUE(directory.waitIdle());
    directory.onDevice(makeDesc("uuid:late", "Late"));
    ASSERT_TRUE(directory.waitIdle());
    directory.getDevices(devs);
    ASSERT_EQ(1u, devs.size());
    EXPECT_EQ("late", devs[0].id);
}

TEST_F(DirectoryTest, StopClears)
{
    directory.onDevice(makeDesc("uuid:aaa", "Kitchen"));
    ASSERT_TRUE(directory.waitIdle());
    directory.stop();
    vector<RendererDevice> devs;
    directory.getDevices(devs);
    EXPECT_TRUE(devs.empty());

    // Ignored while stopped
    directory.onDevice(makeDesc("uuid:bbb", "Den"));
    ASSERT_TRUE(directory.waitIdle());
    directory.getDevices(devs);
    EXPECT_TRUE(devs.empty());

    // Restart: known devices are registered again
    ASSERT_TRUE(directory.start());
    directory.onDevice(makeDesc("uuid:aaa", "Kitchen"));
    ASSERT_TRUE(directory.waitIdle());
    directory.getDevices(devs);
    ASSERT_EQ(1u, devs.size());
    vector<string> expected{"aaa", "aaa"};
    EXPECT_EQ(expected, addedIds());
}
