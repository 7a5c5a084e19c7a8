#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "usb_tree/device_path.hpp"
#include "usb_tree/error.hpp"
#include "usb_tree/port_trie.hpp"

namespace usb_tree
{
    namespace detail
    {
        struct string_hash
        {
            using is_transparent = void;

            [[nodiscard]] auto operator()(std::string_view const text) const noexcept
                -> std::size_t
            {
                return std::hash<std::string_view>{}(text);
            }
        };
    }  // namespace detail

    // Devices indexed two ways: a flat map from canonical path string to
    // device, and one port_trie per bus whose values are keys into that map.
    //
    // Every key held by a trie is present in the flat map. insert_path() is
    // the only operation that writes to either structure.
    template <typename T>
    class device_tree
    {
      public:
        using value_type = T;
        using trie_type = port_trie<std::string>;
        using device_map = std::unordered_map<
            std::string,
            T,
            detail::string_hash,
            std::equal_to<>>;

        device_tree() = default;

        void insert_path(device_path const& path, T value)
        {
            auto key = path.to_string();

            auto const inserted = devices_.insert_or_assign(key, std::move(value)).second;
            if (inserted)
            {
                spdlog::trace("indexed device at {}", key);
            }
            else
            {
                spdlog::debug("replaced device at {}", key);
            }

            tree_[path.bus_key()].insert(path.ports(), std::move(key));
        }

        void insert(
            std::string_view const bus,
            std::span<std::uint8_t const> const ports,
            T value)
        {
            auto ec = error_code{};
            insert(bus, ports, std::move(value), ec);
            if (ec) { throw path_error{ec, bus}; }
        }

        // A bus that is not a decimal number in 0-255 is rejected with
        // path_errc::missing_bus or path_errc::invalid_bus, both of which
        // match tree_errc::invalid_path. Nothing is inserted.
        void insert(
            std::string_view const bus,
            std::span<std::uint8_t const> const ports,
            T value,
            error_code& ec)
        {
            ec.clear();

            auto const bus_number = detail::parse_u8(bus);
            if (!bus_number)
            {
                spdlog::debug("rejected device on bus '{}'", bus);
                ec = make_error_code(bus.empty() ? path_errc::missing_bus : path_errc::invalid_bus);
                return;
            }

            insert_path(
                device_path{*bus_number, {ports.begin(), ports.end()}},
                std::move(value));
        }

        [[nodiscard]] auto get_by_path(device_path const& path) const -> T const*
        {
            return find(path.to_string());
        }

        // Accepts the canonical key as well as any text that parses to a
        // valid path, e.g. "1:02.3".
        [[nodiscard]] auto get(std::string_view const path) const -> T const*
        {
            if (auto const* const device = find(path)) { return device; }

            auto ec = error_code{};
            auto const parsed = device_path::parse(path, ec);
            if (ec) { return nullptr; }

            return get_by_path(parsed);
        }

        [[nodiscard]] auto try_get(std::string_view const path) const -> T const&
        {
            auto ec = error_code{};
            auto const* const device = try_get(path, ec);
            if (ec) { throw system_error{ec, std::string{path}}; }

            return *device;
        }

        [[nodiscard]] auto try_get(std::string_view const path, error_code& ec) const
            -> T const*
        {
            ec.clear();

            auto const* const device = get(path);
            if (device == nullptr)
            {
                ec = make_error_code(tree_errc::device_not_found);
            }

            return device;
        }

        [[nodiscard]] auto try_get_by_path(device_path const& path) const -> T const&
        {
            auto ec = error_code{};
            auto const* const device = try_get_by_path(path, ec);
            if (ec) { throw system_error{ec, path.to_string()}; }

            return *device;
        }

        [[nodiscard]] auto try_get_by_path(device_path const& path, error_code& ec) const
            -> T const*
        {
            ec.clear();

            auto const* const device = get_by_path(path);
            if (device == nullptr)
            {
                ec = make_error_code(tree_errc::device_not_found);
            }

            return device;
        }

        // The device at `path` (if any) followed by everything below it.
        // Empty when the bus or the path is not part of the tree.
        [[nodiscard]] auto get_subtree_by_path(device_path const& path) const
            -> std::vector<T const*>
        {
            auto const* const bus = bus_tree(path.bus_key());
            if (bus == nullptr) { return {}; }

            auto const* const node = bus->lookup(path.ports());
            if (node == nullptr) { return {}; }

            auto result = std::vector<T const*>{};
            for (auto const* const key : node->descendants())
            {
                if (auto const* const device = find(*key))
                {
                    result.push_back(device);
                }
                else
                {
                    spdlog::warn("dangling tree key {} under {}", *key, path.to_string());
                }
            }

            return result;
        }

        [[nodiscard]] auto get_subtree(std::string_view const path) const
            -> std::vector<T const*>
        {
            auto ec = error_code{};
            auto offending = std::string_view{};
            auto result = get_subtree(path, ec, offending);
            if (ec) { throw path_error{ec, offending}; }

            return result;
        }

        // Unparsable text is reported with the path_errc that rejected it,
        // which matches tree_errc::invalid_path.
        [[nodiscard]] auto get_subtree(std::string_view const path, error_code& ec) const
            -> std::vector<T const*>
        {
            auto offending = std::string_view{};
            return get_subtree(path, ec, offending);
        }

        [[nodiscard]] auto get_subtree(
            std::string_view const path,
            error_code& ec,
            std::string_view& offending) const
            -> std::vector<T const*>
        {
            auto const parsed = device_path::parse(path, ec, offending);
            if (ec)
            {
                spdlog::debug("cannot resolve subtree '{}': {}", path, ec.message());
                return {};
            }

            return get_subtree_by_path(parsed);
        }

        // Bus keys in lexicographic order, so "10" comes before "2".
        [[nodiscard]] auto buses() const -> std::vector<std::string_view>
        {
            auto result = std::vector<std::string_view>{};
            result.reserve(tree_.size());
            for (auto const& [bus, trie] : tree_)
            {
                result.emplace_back(bus);
            }

            return result;
        }

        [[nodiscard]] auto bus_tree(std::string_view const bus) const noexcept
            -> trie_type const*
        {
            auto const it = tree_.find(bus);
            return it != tree_.end() ? &it->second : nullptr;
        }

        [[nodiscard]] auto devices() const noexcept -> device_map const&
        {
            return devices_;
        }

        [[nodiscard]] auto size() const noexcept -> std::size_t
        {
            return devices_.size();
        }

        [[nodiscard]] auto empty() const noexcept -> bool
        {
            return devices_.empty();
        }

      private:
        device_map devices_;
        std::map<std::string, trie_type, std::less<>> tree_;

        [[nodiscard]] auto find(std::string_view const key) const -> T const*
        {
            auto const it = devices_.find(key);
            return it != devices_.end() ? &it->second : nullptr;
        }
    };
}  // namespace usb_tree
