#include <cstdint>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>

#include "usb_tree/tree_formatter.hpp"
#include "usb_tree/tree_style.hpp"
#include "usb_tree/usb_device.hpp"

namespace usb_tree
{
namespace
{

auto receiver() -> usb_device
{
    return usb_device{
        .vid = 0x046d,
        .pid = 0xc52b,
        .bus = 1,
        .address = 5,
        .name = "USB Receiver",
        .port_path = {2, 3},
    };
}

TEST(UsbDeviceTest, VidPidIsZeroPaddedHex)
{
    EXPECT_EQ(receiver().vid_pid(), "046d:c52b");
    EXPECT_EQ((usb_device{.vid = 0x1, .pid = 0xabc}).vid_pid(), "0001:0abc");
}

TEST(UsbDeviceTest, FormatsLikeLsusb)
{
    EXPECT_EQ(fmt::format("{}", receiver()), "Device 005: ID 046d:c52b USB Receiver");

    auto unnamed = receiver();
    unnamed.name.clear();
    unnamed.address = 112;
    EXPECT_EQ(fmt::format("{}", unnamed), "Device 112: ID 046d:c52b Unknown Device");
}

TEST(UsbDeviceTest, PathFromBusAndPorts)
{
    EXPECT_EQ(receiver().path(), (device_path{1, {2, 3}}));
    EXPECT_EQ(receiver().path_key(), "1:2.3");
    EXPECT_EQ((usb_device{.bus = 4}).path_key(), "4:");
}

TEST(UsbDeviceTest, HubsAreClassNine)
{
    EXPECT_FALSE(receiver().is_hub());
    EXPECT_TRUE((usb_device{.device_class = 9}).is_hub());
}

TEST(UsbDeviceTest, VidPidFilters)
{
    auto const device = receiver();

    EXPECT_TRUE(matches_vid_pid(device, {}));

    auto const matching = std::vector<vid_pid_filter>{{0x1234, 0x5678}, {0x046d, 0xc52b}};
    EXPECT_TRUE(matches_vid_pid(device, matching));

    auto const other = std::vector<vid_pid_filter>{{0x046d, 0xc52c}, {0x046e, 0xc52b}};
    EXPECT_FALSE(matches_vid_pid(device, other));
}

TEST(UsbDeviceTest, ParsesVidPidText)
{
    EXPECT_EQ(parse_vid_pid("046d:c52b"), (vid_pid_filter{0x046d, 0xc52b}));
    EXPECT_EQ(parse_vid_pid("046D:C52B"), (vid_pid_filter{0x046d, 0xc52b}));
    EXPECT_EQ(parse_vid_pid("1:ffff"), (vid_pid_filter{0x0001, 0xffff}));

    EXPECT_FALSE(parse_vid_pid("046d").has_value());
    EXPECT_FALSE(parse_vid_pid("046d:").has_value());
    EXPECT_FALSE(parse_vid_pid(":c52b").has_value());
    EXPECT_FALSE(parse_vid_pid("zz:c52b").has_value());
    EXPECT_FALSE(parse_vid_pid("10000:1").has_value());
    EXPECT_FALSE(parse_vid_pid("046d:c52b:1").has_value());
}

TEST(UsbDeviceTest, MakeDeviceTreeIndexesEveryRecord)
{
    auto const devices = std::vector<usb_device>{
        {.vid = 0x1d6b, .pid = 0x0002, .bus = 1, .address = 1, .name = "Root Hub", .device_class = 9},
        {.vid = 0x05e3, .pid = 0x0610, .bus = 1, .address = 2, .name = "Hub", .device_class = 9, .port_path = {2}},
        receiver(),
        {.vid = 0x0781, .pid = 0x5583, .bus = 1, .address = 6, .name = "Flash", .port_path = {2, 4}},
    };

    auto const tree = make_device_tree(devices);
    EXPECT_EQ(tree.size(), 4u);
    EXPECT_EQ(tree.get_subtree("1:2").size(), 3u);
    ASSERT_NE(tree.get("1:2.3"), nullptr);
    EXPECT_EQ(tree.get("1:2.3")->address, 5);

    EXPECT_EQ(
        (tree_formatter{tree, tree_style::plain()}.to_string()),
        "Bus 001\n"
        "└── Device 002: ID 05e3:0610 Hub\n"
        "    ├── Device 005: ID 046d:c52b USB Receiver\n"
        "    └── Device 006: ID 0781:5583 Flash\n"
        "\n");
}

TEST(UsbDeviceTest, MakeDeviceTreeAppliesFilters)
{
    auto const devices = std::vector<usb_device>{
        receiver(),
        {.vid = 0x0781, .pid = 0x5583, .bus = 1, .address = 6, .name = "Flash", .port_path = {2, 4}},
    };
    auto const filters = std::vector<vid_pid_filter>{{0x0781, 0x5583}};

    auto const tree = make_device_tree(devices, filters);
    EXPECT_EQ(tree.size(), 1u);
    EXPECT_EQ(tree.get("1:2.3"), nullptr);
    EXPECT_NE(tree.get("1:2.4"), nullptr);
}

}  // namespace
}  // namespace usb_tree
