#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

#include <libusb.h>
#include <spdlog/spdlog.h>

#include "usb_tree/asio.hpp"
#include "usb_tree/device_tree.hpp"
#include "usb_tree/error.hpp"
#include "usb_tree/libusb.hpp"
#include "usb_tree/usb_device.hpp"
#include "usb_tree/usb_service.hpp"

namespace usb_tree
{
    namespace detail
    {
        // A device is at most seven tiers below its root hub.
        inline constexpr auto max_port_depth = std::size_t{7};

        // String descriptors are not read; that needs the device opened.
        [[nodiscard]] inline auto to_usb_device(::libusb_device* const handle, error_code& ec)
            -> usb_device
        {
            auto ports = std::array<std::uint8_t, max_port_depth>{};
            auto const depth = ::libusb_get_port_numbers(
                handle,
                ports.data(),
                static_cast<int>(ports.size()));
            if (!libusb_succeeded(depth, ec)) { return {}; }

            auto descriptor = ::libusb_device_descriptor{};
            if (!libusb_succeeded(::libusb_get_device_descriptor(handle, &descriptor), ec))
            {
                return {};
            }

            auto device = usb_device{};
            device.vid = descriptor.idVendor;
            device.pid = descriptor.idProduct;
            device.bus = ::libusb_get_bus_number(handle);
            device.address = ::libusb_get_device_address(handle);
            device.device_class = descriptor.bDeviceClass;
            device.subclass = descriptor.bDeviceSubClass;
            device.protocol = descriptor.bDeviceProtocol;
            device.speed = static_cast<usb_speed>(::libusb_get_device_speed(handle));
            device.port_path.assign(ports.begin(), ports.begin() + depth);

            return device;
        }
    }  // namespace detail

    // Failures carry a libusb_category() code, which matches
    // tree_errc::list_devices.
    [[nodiscard]] inline auto list_usb_devices(
        asio::execution_context& context,
        error_code& ec)
        -> std::vector<usb_device>
    {
        auto* const usb = asio::use_service<usb_service>(context).context(ec);
        if (ec) { return {}; }

        auto* raw_list = static_cast<::libusb_device**>(nullptr);
        auto const count = ::libusb_get_device_list(usb, &raw_list);
        if (!libusb_succeeded(count, ec)) { return {}; }

        auto const list = libusb_device_list_ptr{raw_list};
        spdlog::debug("libusb reported {} devices", count);

        auto result = std::vector<usb_device>{};
        result.reserve(static_cast<std::size_t>(count));
        for (auto const handle : std::span{list.get(), static_cast<std::size_t>(count)})
        {
            auto device = detail::to_usb_device(handle, ec);
            if (ec)
            {
                spdlog::debug(
                    "reading device {} on bus {} failed: {}",
                    ::libusb_get_device_address(handle),
                    ::libusb_get_bus_number(handle),
                    ec.message());
                return {};
            }

            result.push_back(std::move(device));
        }

        return result;
    }

    [[nodiscard]] inline auto list_usb_devices(asio::execution_context& context)
        -> std::vector<usb_device>
    {
        return try_with_ec([&](auto& ec) {
            return list_usb_devices(context, ec);
        });
    }

    // Both overloads report the libusb code that stopped enumeration; it
    // compares equal to make_error_condition(tree_errc::list_devices).
    [[nodiscard]] inline auto build_usb_tree(
        asio::execution_context& context,
        std::span<vid_pid_filter const> const filters,
        error_code& ec)
        -> device_tree<usb_device>
    {
        auto const devices = list_usb_devices(context, ec);
        if (ec)
        {
            spdlog::debug("listing USB devices failed: {}", ec.message());
            return {};
        }

        return make_device_tree(devices, filters);
    }

    [[nodiscard]] inline auto build_usb_tree(
        asio::execution_context& context,
        std::span<vid_pid_filter const> const filters = {})
        -> device_tree<usb_device>
    {
        auto ec = error_code{};
        auto tree = build_usb_tree(context, filters, ec);
        if (ec)
        {
            throw system_error{ec, make_error_code(tree_errc::list_devices).message()};
        }

        return tree;
    }
}  // namespace usb_tree
