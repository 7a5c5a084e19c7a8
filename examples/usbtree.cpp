#include <algorithm>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <usb_tree/list_usb_devices.hpp>
#include <usb_tree/usb_tree.hpp>

namespace asio = usb_tree::asio;

using usb_tree::build_usb_tree;
using usb_tree::device_tree;
using usb_tree::tree_formatter;
using usb_tree::tree_style;
using usb_tree::usb_device;
using usb_tree::vid_pid_filter;

namespace
{

auto log_level(int const verbosity) -> spdlog::level::level_enum
{
    switch (verbosity)
    {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::debug;
    default:
        return spdlog::level::trace;
    }
}

auto parse_filters(std::vector<std::string> const& texts)
    -> std::optional<std::vector<vid_pid_filter>>
{
    auto filters = std::vector<vid_pid_filter>{};
    for (auto const& text : texts)
    {
        auto const filter = usb_tree::parse_vid_pid(text);
        if (!filter)
        {
            spdlog::error("invalid filter '{}', expected VID:PID in hex", text);
            return std::nullopt;
        }
        filters.push_back(*filter);
    }

    return filters;
}

auto print_subtree(device_tree<usb_device> const& tree, std::string const& path) -> bool
{
    auto ec = usb_tree::error_code{};
    auto offending = std::string_view{};
    auto devices = tree.get_subtree(path, ec, offending);
    if (ec)
    {
        if (offending.empty())
        {
            spdlog::error("{}: {}", path, ec.message());
        }
        else
        {
            spdlog::error("{}: {} '{}'", path, ec.message(), offending);
        }
        return false;
    }

    std::ranges::sort(devices, {}, [](auto const* const device) {
        return device->path();
    });

    for (auto const* const device : devices)
    {
        fmt::print("{:<12} {}\n", device->path_key(), *device);
    }

    return true;
}

}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto program = argparse::ArgumentParser{"usbtree", "0.1.0"};
    program.add_description("Show connected USB devices as a tree");

    program.add_argument("--plain")
        .flag()
        .help("Disable colored output");
    program.add_argument("--ascii")
        .flag()
        .help("Use ASCII connectors instead of box-drawing characters");
    program.add_argument("--no-header")
        .flag()
        .help("Omit the per-bus header lines");
    program.add_argument("--filter")
        .append()
        .metavar("VID:PID")
        .help("Only show devices with this vendor and product id (repeatable)");
    program.add_argument("--path")
        .metavar("BUS:PORTS")
        .help("List the devices at and below this path instead of the tree");

    auto verbosity = 0;
    program.add_argument("-v", "--verbose")
        .action([&](auto const&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .help("Increase log output (repeatable)");

    try
    {
        program.parse_args(argc, argv);
    }
    catch (std::exception const& err)
    {
        spdlog::error("{}", err.what());
        std::cerr << program;
        return EXIT_FAILURE;
    }

    spdlog::set_default_logger(spdlog::stderr_color_mt("usbtree"));
    spdlog::set_level(log_level(verbosity));

    auto const filters = parse_filters(
        program.present<std::vector<std::string>>("--filter")
            .value_or(std::vector<std::string>{}));
    if (!filters) { return EXIT_FAILURE; }

    auto style = program.get<bool>("--ascii") ? tree_style::ascii() : tree_style::unicode();
    style = style
                .with_color(!program.get<bool>("--plain"))
                .with_header(!program.get<bool>("--no-header"));

    auto ioc = asio::io_context{};
    auto tree = device_tree<usb_device>{};
    try
    {
        tree = build_usb_tree(ioc, *filters);
    }
    catch (usb_tree::system_error const& err)
    {
        spdlog::error("{}", err.what());
        return EXIT_FAILURE;
    }

    spdlog::debug("indexed {} devices on {} buses", tree.size(), tree.buses().size());

    if (auto const path = program.present("--path"))
    {
        return print_subtree(tree, *path) ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    fmt::print("{}", tree_formatter{tree, style});

    return EXIT_SUCCESS;
}
