#pragma once

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "usb_tree/device_path.hpp"
#include "usb_tree/device_tree.hpp"

namespace usb_tree
{
    // Values match libusb's enum libusb_speed.
    enum class usb_speed
    {
        unknown = 0,
        low = 1,
        full = 2,
        high = 3,
        super = 4,
        super_plus = 5,
    };

    inline constexpr auto hub_device_class = std::uint8_t{9};

    struct usb_device
    {
        std::uint16_t vid = 0;
        std::uint16_t pid = 0;
        std::uint8_t bus = 0;
        std::uint8_t address = 0;
        std::string name;
        std::optional<std::string> manufacturer;
        std::optional<std::string> product;
        std::optional<std::string> serial;
        std::uint8_t device_class = 0;
        std::uint8_t subclass = 0;
        std::uint8_t protocol = 0;
        usb_speed speed = usb_speed::unknown;
        std::vector<std::uint8_t> port_path;

        [[nodiscard]] auto vid_pid() const -> std::string
        {
            return fmt::format("{:04x}:{:04x}", vid, pid);
        }

        [[nodiscard]] auto is_hub() const noexcept -> bool
        {
            return device_class == hub_device_class;
        }

        [[nodiscard]] auto path() const -> device_path
        {
            return device_path{bus, port_path};
        }

        [[nodiscard]] auto path_key() const -> std::string
        {
            return path().to_string();
        }
    };

    using vid_pid_filter = std::pair<std::uint16_t, std::uint16_t>;

    // An empty filter list matches every device.
    [[nodiscard]] inline auto matches_vid_pid(
        usb_device const& device,
        std::span<vid_pid_filter const> const filters) noexcept
        -> bool
    {
        if (filters.empty()) { return true; }

        return std::ranges::any_of(filters, [&](auto const& filter) {
            return device.vid == filter.first && device.pid == filter.second;
        });
    }

    // Parses "vvvv:pppp" with both halves in hex.
    [[nodiscard]] inline auto parse_vid_pid(std::string_view const text) noexcept
        -> std::optional<vid_pid_filter>
    {
        auto const parse_hex = [](std::string_view const part) -> std::optional<std::uint16_t> {
            auto value = std::uint16_t{};
            auto const last = part.data() + part.size();
            auto const [ptr, errc] = std::from_chars(part.data(), last, value, 16);
            if (errc != std::errc{} || ptr != last) { return std::nullopt; }

            return value;
        };

        auto const colon = text.find(':');
        if (colon == std::string_view::npos) { return std::nullopt; }

        auto const vid = parse_hex(text.substr(0, colon));
        auto const pid = parse_hex(text.substr(colon + 1));
        if (!vid || !pid) { return std::nullopt; }

        return vid_pid_filter{*vid, *pid};
    }

    // Indexes every device that passes `filters` under its own path.
    [[nodiscard]] inline auto make_device_tree(
        std::span<usb_device const> const devices,
        std::span<vid_pid_filter const> const filters = {})
        -> device_tree<usb_device>
    {
        auto tree = device_tree<usb_device>{};
        for (auto const& device : devices)
        {
            if (!matches_vid_pid(device, filters)) { continue; }

            tree.insert_path(device.path(), device);
        }

        return tree;
    }
}  // namespace usb_tree

template <>
struct fmt::formatter<usb_tree::usb_device> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(usb_tree::usb_device const& device, FormatContext& ctx) const
    {
        auto const name = device.name.empty()
            ? std::string_view{"Unknown Device"}
            : std::string_view{device.name};

        return fmt::formatter<std::string_view>::format(
            fmt::format("Device {:03}: ID {} {}", device.address, device.vid_pid(), name),
            ctx);
    }
};
