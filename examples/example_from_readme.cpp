#include <cstdint>
#include <cstdlib>
#include <vector>

#include <fmt/core.h>
#include <usb_tree/usb_tree.hpp>

auto main() -> int
{
    auto const devices = std::vector<usb_tree::usb_device>{
        {.vid = 0x1d6b, .pid = 0x0002, .bus = 1, .address = 1, .name = "xHCI Host Controller", .device_class = 9},
        {.vid = 0x05e3, .pid = 0x0610, .bus = 1, .address = 2, .name = "USB2.1 Hub", .device_class = 9, .port_path = {2}},
        {.vid = 0x046d, .pid = 0xc52b, .bus = 1, .address = 5, .name = "USB Receiver", .port_path = {2, 3}},
        {.vid = 0x0781, .pid = 0x5583, .bus = 1, .address = 6, .name = "Ultra Fit", .port_path = {2, 4}},
        {.vid = 0x8087, .pid = 0x0aaa, .bus = 1, .address = 3, .port_path = {10}},
        {.vid = 0x1d6b, .pid = 0x0003, .bus = 2, .address = 1, .name = "xHCI Host Controller", .device_class = 9},
        {.vid = 0x0bda, .pid = 0x8153, .bus = 2, .address = 2, .name = "USB 10/100/1000 LAN", .port_path = {1}},
    };

    auto const tree = usb_tree::make_device_tree(devices);

    // Direct lookup by path
    if (auto const* const device = tree.get("1:2.3"))
    {
        fmt::print("Found device: {}\n", *device);
    }

    // Everything behind the hub on port 2
    fmt::print("Devices under 1:2:\n");
    for (auto const* const device : tree.get_subtree("1:2"))
    {
        fmt::print("  - {}\n", *device);
    }
    fmt::print("\n");

    fmt::print("{}", usb_tree::tree_formatter{tree});
    fmt::print("{}", usb_tree::tree_formatter{tree, usb_tree::tree_style::ascii().with_color(false)});

    return EXIT_SUCCESS;
}
