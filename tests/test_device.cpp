#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "device.h"
#include "errors.h"
#include "fake_transport.h"

namespace {

// The collections a stock keyboard shows on Windows: keyboard, consumer
// control and system control on interface 0, vendor collections on 1
std::vector<HidInterfaceInfo> stock_keyboard() {
    std::vector<HidInterfaceInfo> out;

    HidInterfaceInfo kbd = vendor_iface("\\\\?\\HID#VID_05AC&PID_024F&MI_00#kbd", 0);
    kbd.usage_page = 0x0001;
    kbd.usage      = 0x0006;
    out.push_back(kbd);

    for (int col = 1; col <= 4; ++col) {
        HidInterfaceInfo info = vendor_iface(col_path(col));
        info.usage_page = 0x000c;
        out.push_back(info);
    }
    out.push_back(vendor_iface(col_path(5)));
    out.push_back(vendor_iface(col_path(6)));

    HidInterfaceInfo extra = vendor_iface(col_path(7));
    extra.usage = 0x0002;
    out.push_back(extra);
    return out;
}

}  // namespace

TEST(ChannelKindTest, ClassifiesByMarker) {
    DeviceConfig cfg;
    EXPECT_EQ(channel_kind(vendor_iface(col_path(5)), cfg), ChannelKind::Request);
    EXPECT_EQ(channel_kind(vendor_iface(col_path(6)), cfg), ChannelKind::Data);
    EXPECT_EQ(channel_kind(vendor_iface(col_path(7)), cfg), ChannelKind::Unrelated);
}

TEST(ChannelKindTest, IgnoresCompositeEntry) {
    DeviceConfig cfg;
    EXPECT_EQ(channel_kind(vendor_iface(col_path(5), -1), cfg), ChannelKind::Unrelated);
}

TEST(ChannelKindTest, RequiresVendorUsage) {
    DeviceConfig cfg;

    HidInterfaceInfo wrong_page = vendor_iface(col_path(5));
    wrong_page.usage_page = 0x000c;
    EXPECT_EQ(channel_kind(wrong_page, cfg), ChannelKind::Unrelated);

    HidInterfaceInfo wrong_usage = vendor_iface(col_path(6));
    wrong_usage.usage = 0x0002;
    EXPECT_EQ(channel_kind(wrong_usage, cfg), ChannelKind::Unrelated);
}

TEST(ChannelKindTest, MarkersAreCaseSensitive) {
    DeviceConfig cfg;
    EXPECT_EQ(channel_kind(vendor_iface("\\\\?\\hid#vid_05ac&col05#x"), cfg),
              ChannelKind::Unrelated);
}

TEST(ChannelKindTest, CustomMarkers) {
    DeviceConfig cfg;
    cfg.request_marker = "hidraw3";
    cfg.data_marker    = "hidraw4";
    EXPECT_EQ(channel_kind(vendor_iface("/dev/hidraw3"), cfg), ChannelKind::Request);
    EXPECT_EQ(channel_kind(vendor_iface("/dev/hidraw4"), cfg), ChannelKind::Data);
    EXPECT_EQ(channel_kind(vendor_iface(col_path(5)), cfg), ChannelKind::Unrelated);
}

TEST(ChannelKindTest, MarkerMatchesAsSubstring) {
    DeviceConfig cfg;
    cfg.request_marker = "/dev/hidraw5";
    cfg.data_marker    = "/dev/hidraw6";
    EXPECT_EQ(channel_kind(vendor_iface("/dev/hidraw50"), cfg), ChannelKind::Request);
    EXPECT_EQ(channel_kind(vendor_iface("/dev/hidraw61"), cfg), ChannelKind::Data);
    EXPECT_EQ(channel_kind(vendor_iface("/dev/hidraw7"), cfg), ChannelKind::Unrelated);
}

TEST(SelectChannelsTest, PicksRequestAndData) {
    ChannelSelection sel = select_channels(stock_keyboard(), DeviceConfig{});
    EXPECT_EQ(sel.request_path, col_path(5));
    EXPECT_EQ(sel.data_path, col_path(6));
}

TEST(SelectChannelsTest, OrderOfEnumerationDoesNotMatter) {
    auto ifaces = stock_keyboard();
    std::reverse(ifaces.begin(), ifaces.end());
    ChannelSelection sel = select_channels(ifaces, DeviceConfig{});
    EXPECT_EQ(sel.request_path, col_path(5));
    EXPECT_EQ(sel.data_path, col_path(6));
}

TEST(SelectChannelsTest, EmptyEnumerationIsDeviceNotFound) {
    try {
        select_channels({}, DeviceConfig{});
        FAIL() << "expected DeviceNotFoundError";
    } catch (const DeviceNotFoundError& e) {
        EXPECT_NE(std::string(e.what()).find("05ac:024f"), std::string::npos);
    }
}

TEST(SelectChannelsTest, DuplicateRequestIsAmbiguous) {
    const std::string first  = col_path(5);
    const std::string second = "\\\\?\\HID#VID_05AC&PID_024F&MI_02&Col05#other";
    std::vector<HidInterfaceInfo> ifaces = {
        vendor_iface(first), vendor_iface(col_path(6)), vendor_iface(second, 2)};

    try {
        select_channels(ifaces, DeviceConfig{});
        FAIL() << "expected AmbiguousDeviceError";
    } catch (const AmbiguousDeviceError& e) {
        EXPECT_EQ(e.first_path(), first);
        EXPECT_EQ(e.second_path(), second);
        std::string msg = e.what();
        EXPECT_NE(msg.find("request"), std::string::npos);
        EXPECT_NE(msg.find(first), std::string::npos);
        EXPECT_NE(msg.find(second), std::string::npos);
    }
}

TEST(SelectChannelsTest, DuplicateDataIsAmbiguous) {
    std::vector<HidInterfaceInfo> ifaces = {
        vendor_iface(col_path(6)), vendor_iface(col_path(5)),
        vendor_iface(col_path(6) + "#dup")};
    EXPECT_THROW(select_channels(ifaces, DeviceConfig{}), AmbiguousDeviceError);
}

TEST(SelectChannelsTest, MissingRequestChannel) {
    std::vector<HidInterfaceInfo> ifaces = {vendor_iface(col_path(6))};
    try {
        select_channels(ifaces, DeviceConfig{});
        FAIL() << "expected ChannelNotFoundError";
    } catch (const ChannelNotFoundError& e) {
        EXPECT_EQ(e.channel(), "request");
    }
}

TEST(SelectChannelsTest, MissingDataChannel) {
    std::vector<HidInterfaceInfo> ifaces = {vendor_iface(col_path(5))};
    try {
        select_channels(ifaces, DeviceConfig{});
        FAIL() << "expected ChannelNotFoundError";
    } catch (const ChannelNotFoundError& e) {
        EXPECT_EQ(e.channel(), "data");
    }
}

TEST(SelectChannelsTest, OnlyUnrelatedInterfacesReportsRequestFirst) {
    std::vector<HidInterfaceInfo> ifaces = {vendor_iface(col_path(1), -1)};
    try {
        select_channels(ifaces, DeviceConfig{});
        FAIL() << "expected ChannelNotFoundError";
    } catch (const ChannelNotFoundError& e) {
        EXPECT_EQ(e.channel(), "request");
    }
}

TEST(ResolveChannelsTest, EnumeratesConfiguredIdsAndOpensNothing) {
    FakeTransport hid;
    hid.interfaces = stock_keyboard();

    ChannelSelection sel = resolve_channels(hid, DeviceConfig{});
    EXPECT_EQ(sel.request_path, col_path(5));
    EXPECT_EQ(sel.data_path, col_path(6));
    EXPECT_EQ(hid.enumerate_calls, 1);
    EXPECT_TRUE(hid.opened.empty());
}

TEST(ResolveChannelsTest, OtherProductIsDeviceNotFound) {
    FakeTransport hid;
    hid.interfaces = stock_keyboard();

    DeviceConfig cfg;
    cfg.product_id = 0x0250;
    EXPECT_THROW(resolve_channels(hid, cfg), DeviceNotFoundError);
}
