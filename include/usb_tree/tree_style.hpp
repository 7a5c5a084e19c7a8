#pragma once

#include <array>
#include <cstddef>
#include <string>

#include <fmt/color.h>

namespace usb_tree
{
    struct tree_style
    {
        bool colored = true;
        bool show_header = true;
        std::string indent = "    ";
        std::string branch = "├── ";
        std::string corner = "└── ";
        std::string vertical = "│   ";

        [[nodiscard]] static auto unicode() -> tree_style
        {
            return tree_style{};
        }

        [[nodiscard]] static auto plain() -> tree_style
        {
            return unicode().with_color(false);
        }

        // Colors are kept; only the box-drawing glyphs change.
        [[nodiscard]] static auto ascii() -> tree_style
        {
            auto style = unicode();
            style.branch = "|-- ";
            style.corner = "`-- ";
            style.vertical = "|   ";
            return style;
        }

        [[nodiscard]] auto with_color(bool const enabled) const -> tree_style
        {
            auto style = *this;
            style.colored = enabled;
            return style;
        }

        [[nodiscard]] auto with_header(bool const enabled) const -> tree_style
        {
            auto style = *this;
            style.show_header = enabled;
            return style;
        }
    };

    inline constexpr auto depth_palette = std::array{
        fmt::terminal_color::red,
        fmt::terminal_color::yellow,
        fmt::terminal_color::green,
        fmt::terminal_color::cyan,
        fmt::terminal_color::blue,
        fmt::terminal_color::magenta,
        fmt::terminal_color::bright_red,
        fmt::terminal_color::bright_yellow,
        fmt::terminal_color::bright_green,
        fmt::terminal_color::bright_cyan,
    };

    // Depth 0 is the bus header; the palette repeats every ten levels.
    [[nodiscard]] constexpr auto depth_color(std::size_t const depth) noexcept
        -> fmt::terminal_color
    {
        return depth_palette[depth % depth_palette.size()];
    }
}  // namespace usb_tree
