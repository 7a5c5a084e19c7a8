#pragma once

#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

#include "usb_tree/asio.hpp"

namespace usb_tree
{
    enum class path_errc : int
    {
        missing_bus = 1,
        invalid_bus,
        invalid_port,
        invalid_format,
    };

    // invalid_path and list_devices are also matched as error conditions by
    // every path_errc and every libusb error respectively, so the specific
    // cause can be reported while callers test for the broad kind:
    //
    //   if (ec == make_error_condition(tree_errc::invalid_path)) { ... }
    enum class tree_errc : int
    {
        list_devices = 1,
        device_not_found,
        invalid_path,
    };
}  // namespace usb_tree

#ifdef USB_TREE_USE_STANDALONE_ASIO
template <>
struct std::is_error_code_enum<usb_tree::path_errc>
  : std::true_type
{
};

template <>
struct std::is_error_code_enum<usb_tree::tree_errc>
  : std::true_type
{
};
#else
template <>
struct boost::system::is_error_code_enum<usb_tree::path_errc>
  : std::true_type
{
};

template <>
struct boost::system::is_error_code_enum<usb_tree::tree_errc>
  : std::true_type
{
};
#endif

namespace usb_tree
{
    [[nodiscard]] inline auto path_category() noexcept -> error_category const&
    {
        class path_error_category final : public error_category
        {
          public:
            [[nodiscard]] auto name() const noexcept -> const char* override
            {
                return "usb_tree.path";
            }

            [[nodiscard]] auto message(int const ev) const -> std::string override
            {
                switch (static_cast<path_errc>(ev))
                {
                case path_errc::missing_bus:
                    return "missing bus number";
                case path_errc::invalid_bus:
                    return "invalid bus number";
                case path_errc::invalid_port:
                    return "invalid port number";
                case path_errc::invalid_format:
                    return "invalid format, expected 'bus:port.path'";
                default:
                    return {};
                }
            }
        };

        static auto category = path_error_category{};
        return category;
    }

    [[nodiscard]] inline auto make_error_code(path_errc const errc) noexcept
        -> error_code
    {
        return error_code{static_cast<int>(errc), path_category()};
    }

    [[nodiscard]] inline auto tree_category() noexcept -> error_category const&
    {
        class tree_error_category final : public error_category
        {
          public:
            [[nodiscard]] auto name() const noexcept -> const char* override
            {
                return "usb_tree";
            }

            [[nodiscard]] auto message(int const ev) const -> std::string override
            {
                switch (static_cast<tree_errc>(ev))
                {
                case tree_errc::list_devices:
                    return "failed to list USB devices";
                case tree_errc::device_not_found:
                    return "device not found at path";
                case tree_errc::invalid_path:
                    return "invalid device path";
                default:
                    return {};
                }
            }

            [[nodiscard]] auto equivalent(error_code const& code, int const condition) const noexcept
                -> bool override
            {
                if (static_cast<tree_errc>(condition) == tree_errc::invalid_path
                    && code.category() == path_category())
                {
                    return true;
                }

                return error_category::equivalent(code, condition);
            }
        };

        static auto category = tree_error_category{};
        return category;
    }

    [[nodiscard]] inline auto make_error_code(tree_errc const errc) noexcept
        -> error_code
    {
        return error_code{static_cast<int>(errc), tree_category()};
    }

    [[nodiscard]] inline auto make_error_condition(tree_errc const errc) noexcept
        -> error_condition
    {
        return error_condition{static_cast<int>(errc), tree_category()};
    }

    // Thrown by the throwing overload of device_path::parse. Keeps the bus
    // text or port token that failed to parse.
    class path_error : public system_error
    {
      public:
        path_error(error_code const ec, std::string_view const offending)
          : system_error{ec, quote(offending)}
          , offending_{offending}
        {
        }

        [[nodiscard]] auto offending() const noexcept -> std::string const&
        {
            return offending_;
        }

      private:
        std::string offending_;

        [[nodiscard]] static auto quote(std::string_view const text) -> std::string
        {
            if (text.empty()) { return {}; }

            auto quoted = std::string{"'"};
            quoted.append(text);
            quoted.push_back('\'');
            return quoted;
        }
    };

    // clang-format off
    template <typename Fn>
    void try_with_ec(Fn&& fn)
    requires std::invocable<Fn&&, error_code&>
        && std::is_void_v<std::invoke_result_t<Fn&&, error_code&>>
    // clang-format on
    {
        auto ec = error_code{};
        std::invoke(std::forward<Fn>(fn), ec);
        if (ec) { throw system_error{ec}; }
    }

    // clang-format off
    template <typename Fn>
    auto try_with_ec(Fn&& fn)
    requires std::invocable<Fn&&, error_code&>
    // clang-format on
    {
        auto ec = error_code{};
        auto result = std::invoke(std::forward<Fn>(fn), ec);
        if (ec) { throw system_error{ec}; }

        return result;
    }
}  // namespace usb_tree
