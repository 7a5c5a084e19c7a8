#pragma once

#include <concepts>
#include <memory>
#include <string>

#include <libusb.h>
#include "usb_tree/asio.hpp"
#include "usb_tree/error.hpp"

namespace usb_tree
{
    // Negative libusb return codes. Every code in this category matches
    // tree_errc::list_devices, so enumeration failures keep the libusb
    // reason while still comparing equal to the broad error kind.
    [[nodiscard]] inline auto libusb_category() noexcept -> error_category const&
    {
        class libusb_error_category final : public error_category
        {
          public:
            [[nodiscard]] auto name() const noexcept -> const char* override
            {
                return "libusb";
            }

            [[nodiscard]] auto message(int const ev) const -> std::string override
            {
                return ::libusb_strerror(static_cast<::libusb_error>(ev));
            }

            [[nodiscard]] auto equivalent(int const code, error_condition const& condition) const noexcept
                -> bool override
            {
                return condition == make_error_condition(tree_errc::list_devices)
                    || error_category::equivalent(code, condition);
            }
        };

        static auto category = libusb_error_category{};
        return category;
    }

    [[nodiscard]] inline auto make_libusb_error(int const ret_code) noexcept -> error_code
    {
        return error_code{ret_code, libusb_category()};
    }

    // Stores a negative `ret_code` in `ec` and returns false; clears `ec`
    // otherwise.
    template <std::signed_integral RetCode>
    [[nodiscard]] auto libusb_succeeded(RetCode const ret_code, error_code& ec) noexcept -> bool
    {
        if (ret_code < 0)
        {
            ec = make_libusb_error(static_cast<int>(ret_code));
            return false;
        }

        ec.clear();
        return true;
    }

    struct libusb_context_deleter
    {
        void operator()(::libusb_context* const context) const noexcept
        {
            ::libusb_exit(context);
        }
    };

    using libusb_context_ptr = std::unique_ptr<::libusb_context, libusb_context_deleter>;

    // Frees the list and drops the reference it holds on each device.
    struct libusb_device_list_deleter
    {
        void operator()(::libusb_device** const list) const noexcept
        {
            ::libusb_free_device_list(list, 1);
        }
    };

    using libusb_device_list_ptr = std::unique_ptr<::libusb_device*[], libusb_device_list_deleter>;
}  // namespace usb_tree
