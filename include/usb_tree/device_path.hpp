#pragma once

#include <algorithm>
#include <charconv>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "usb_tree/error.hpp"

namespace usb_tree
{
    namespace detail
    {
        // Plain decimal digits only; no sign, no whitespace.
        [[nodiscard]] inline auto parse_u8(std::string_view const text) noexcept
            -> std::optional<std::uint8_t>
        {
            auto value = std::uint8_t{};
            auto const last = text.data() + text.size();
            auto const [ptr, errc] = std::from_chars(text.data(), last, value);
            if (errc != std::errc{} || ptr != last) { return std::nullopt; }

            return value;
        }
    }  // namespace detail

    // Location of a device in the topology: a bus number plus the chain of
    // hub ports leading to it. Canonical text form is "bus:port.port.port",
    // or "bus:" for the bus root.
    class device_path
    {
      public:
        device_path() noexcept = default;

        device_path(std::uint8_t const bus, std::vector<std::uint8_t> ports) noexcept
          : bus_{bus}
          , ports_{std::move(ports)}
        {
        }

        [[nodiscard]] static auto bus_only(std::uint8_t const bus) noexcept -> device_path
        {
            return device_path{bus, {}};
        }

        [[nodiscard]] static auto parse(std::string_view const text) -> device_path
        {
            auto ec = error_code{};
            auto offending = std::string_view{};
            auto path = parse(text, ec, offending);
            if (ec) { throw path_error{ec, offending}; }

            return path;
        }

        [[nodiscard]] static auto parse(std::string_view const text, error_code& ec)
            -> device_path
        {
            auto offending = std::string_view{};
            return parse(text, ec, offending);
        }

        // On failure `offending` points into `text` at the bus text or port
        // token that was rejected.
        [[nodiscard]] static auto parse(
            std::string_view const text,
            error_code& ec,
            std::string_view& offending)
            -> device_path
        {
            ec.clear();
            offending = {};

            auto const colon = text.find(':');
            if (colon == std::string_view::npos)
            {
                ec = make_error_code(path_errc::invalid_format);
                return {};
            }

            auto const bus_text = text.substr(0, colon);
            if (bus_text.empty())
            {
                ec = make_error_code(path_errc::missing_bus);
                return {};
            }

            auto const bus = detail::parse_u8(bus_text);
            if (!bus)
            {
                offending = bus_text;
                ec = make_error_code(path_errc::invalid_bus);
                return {};
            }

            auto rest = text.substr(colon + 1);
            if (rest.empty()) { return bus_only(*bus); }

            auto ports = std::vector<std::uint8_t>{};
            while (true)
            {
                auto const dot = rest.find('.');
                auto const token = rest.substr(0, dot);

                auto const port = detail::parse_u8(token);
                if (!port)
                {
                    offending = token;
                    ec = make_error_code(path_errc::invalid_port);
                    return {};
                }
                ports.push_back(*port);

                if (dot == std::string_view::npos) { break; }
                rest.remove_prefix(dot + 1);
            }

            return device_path{*bus, std::move(ports)};
        }

        [[nodiscard]] auto bus() const noexcept -> std::uint8_t
        {
            return bus_;
        }

        [[nodiscard]] auto ports() const noexcept -> std::span<std::uint8_t const>
        {
            return ports_;
        }

        [[nodiscard]] auto depth() const noexcept -> std::size_t
        {
            return ports_.size();
        }

        [[nodiscard]] auto is_bus_only() const noexcept -> bool
        {
            return ports_.empty();
        }

        [[nodiscard]] auto parent() const -> std::optional<device_path>
        {
            if (ports_.empty()) { return std::nullopt; }

            return device_path{bus_, {ports_.begin(), std::prev(ports_.end())}};
        }

        [[nodiscard]] auto child(std::uint8_t const port) const -> device_path
        {
            auto ports = ports_;
            ports.push_back(port);
            return device_path{bus_, std::move(ports)};
        }

        [[nodiscard]] auto is_ancestor_of(device_path const& other) const noexcept -> bool
        {
            return bus_ == other.bus_
                && ports_.size() < other.ports_.size()
                && std::equal(ports_.begin(), ports_.end(), other.ports_.begin());
        }

        [[nodiscard]] auto is_descendant_of(device_path const& other) const noexcept -> bool
        {
            return other.is_ancestor_of(*this);
        }

        // Decimal bus number, used to key the per-bus tries.
        [[nodiscard]] auto bus_key() const -> std::string
        {
            return fmt::format("{}", bus_);
        }

        [[nodiscard]] auto to_string() const -> std::string
        {
            return fmt::format("{}:{}", bus_, fmt::join(ports_, "."));
        }

        friend auto operator==(device_path const&, device_path const&) -> bool = default;

        friend auto operator<=>(device_path const&, device_path const&) = default;

      private:
        std::uint8_t bus_ = 0;
        std::vector<std::uint8_t> ports_;
    };
}  // namespace usb_tree

template <>
struct std::hash<usb_tree::device_path>
{
    auto operator()(usb_tree::device_path const& path) const noexcept -> std::size_t
    {
        auto seed = std::size_t{path.bus()};
        for (auto const port : path.ports())
        {
            seed = seed * 257 + port + 1;
        }
        return std::hash<std::size_t>{}(seed);
    }
};

template <>
struct fmt::formatter<usb_tree::device_path> : fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(usb_tree::device_path const& path, FormatContext& ctx) const
    {
        return fmt::formatter<std::string_view>::format(path.to_string(), ctx);
    }
};
