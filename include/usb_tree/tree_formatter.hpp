#pragma once

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/color.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "usb_tree/device_path.hpp"
#include "usb_tree/device_tree.hpp"
#include "usb_tree/port_trie.hpp"
#include "usb_tree/tree_style.hpp"

namespace usb_tree
{
    // Renders a device_tree as one indented section per bus:
    //
    //   Bus 001
    //   ├── Device 002: ID 1d6b:0002 Hub
    //   │   └── Device 005: ID 046d:c52b Receiver
    //   └── Device 003: ID 8087:0aaa Bluetooth
    //
    // Siblings are listed in ascending port order. The value stored at a bus
    // root is represented by the bus header and not printed separately.
    template <typename T>
    class tree_formatter
    {
      public:
        using tree_type = device_tree<T>;
        using trie_type = typename tree_type::trie_type;

        explicit tree_formatter(tree_type const& tree, tree_style style = {})
          : tree_{&tree}
          , style_{std::move(style)}
        {
        }

        [[nodiscard]] auto style() const noexcept -> tree_style const&
        {
            return style_;
        }

        template <typename OutputIt>
        auto format_to(OutputIt out) const -> OutputIt
        {
            for (auto const bus : tree_->buses())
            {
                if (style_.show_header)
                {
                    out = fmt::format_to(out, "{}\n", colorize(bus_label(bus), 0));
                }

                if (auto const* const trie = tree_->bus_tree(bus))
                {
                    out = format_children(out, *trie, std::string{}, 1);
                }

                out = fmt::format_to(out, "\n");
            }

            return out;
        }

        [[nodiscard]] auto to_string() const -> std::string
        {
            auto text = std::string{};
            format_to(std::back_inserter(text));
            return text;
        }

      private:
        tree_type const* tree_;
        tree_style style_;

        [[nodiscard]] static auto bus_label(std::string_view const bus) -> std::string
        {
            if (auto const number = detail::parse_u8(bus))
            {
                return fmt::format("Bus {:03}", *number);
            }

            return fmt::format("Bus {}", bus);
        }

        [[nodiscard]] auto colorize(std::string_view const text, std::size_t const depth) const
            -> std::string
        {
            if (!style_.colored) { return std::string{text}; }

            return fmt::format(fmt::fg(depth_color(depth)), "{}", text);
        }

        template <typename OutputIt>
        auto format_children(
            OutputIt out,
            trie_type const& node,
            std::string const& prefix,
            std::size_t const depth) const
            -> OutputIt
        {
            auto const ports = node.child_ports();
            for (auto i = std::size_t{0}; i < ports.size(); ++i)
            {
                auto const is_last = i + 1 == ports.size();
                out = format_node(out, *node.child(ports[i]), prefix, is_last, depth);
            }

            return out;
        }

        template <typename OutputIt>
        auto format_node(
            OutputIt out,
            trie_type const& node,
            std::string const& prefix,
            bool const is_last,
            std::size_t const depth) const
            -> OutputIt
        {
            if (auto const* const key = node.value())
            {
                auto const& devices = tree_->devices();
                if (auto const it = devices.find(*key); it != devices.end())
                {
                    auto const& connector = is_last ? style_.corner : style_.branch;

                    out = fmt::format_to(
                        out,
                        "{}{}{}\n",
                        prefix,
                        connector,
                        colorize(fmt::format("{}", it->second), depth));
                }
                else
                {
                    spdlog::debug("skipping unresolved tree key {}", *key);
                }
            }

            auto const child_prefix = prefix + (is_last ? style_.indent : style_.vertical);

            return format_children(out, node, child_prefix, depth + 1);
        }
    };
}  // namespace usb_tree

template <typename T>
struct fmt::formatter<usb_tree::tree_formatter<T>>
{
    constexpr auto parse(fmt::format_parse_context& ctx)
    {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(usb_tree::tree_formatter<T> const& tree, FormatContext& ctx) const
    {
        return tree.format_to(ctx.out());
    }
};
