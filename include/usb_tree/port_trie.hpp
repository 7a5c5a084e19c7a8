#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

namespace usb_tree
{
    // Prefix tree keyed by chains of port numbers. Each node owns its
    // children and holds at most one value; intermediate nodes created by
    // insert() stay empty until a value is stored at them.
    //
    // Children are kept in an unordered map. Only child_ports() imposes an
    // order; every other traversal visits siblings in unspecified order.
    template <typename T>
    class port_trie
    {
      public:
        using value_type = T;
        using port_type = std::uint8_t;

        port_trie() = default;

        port_trie(port_trie const&) = delete;

        port_trie(port_trie&&) = default;

        // Stores `value` at the node for `ports`, replacing any value already
        // there. Missing intermediate nodes are created empty.
        void insert(std::span<port_type const> const ports, T value)
        {
            auto* node = this;
            for (auto const port : ports)
            {
                auto& child = node->children_[port];
                if (!child) { child = std::make_unique<port_trie>(); }
                node = child.get();
            }

            node->value_ = std::move(value);
        }

        [[nodiscard]] auto lookup(std::span<port_type const> const ports) const noexcept
            -> port_trie const*
        {
            auto const* node = this;
            for (auto const port : ports)
            {
                node = node->child(port);
                if (node == nullptr) { return nullptr; }
            }

            return node;
        }

        [[nodiscard]] auto child(port_type const port) const noexcept -> port_trie const*
        {
            auto const it = children_.find(port);
            return it != children_.end() ? it->second.get() : nullptr;
        }

        [[nodiscard]] auto value() const noexcept -> T const*
        {
            return value_ ? &*value_ : nullptr;
        }

        [[nodiscard]] auto has_value() const noexcept -> bool
        {
            return value_.has_value();
        }

        [[nodiscard]] auto empty() const noexcept -> bool
        {
            return !value_ && children_.empty();
        }

        // Values of this node and every node below it, parents before their
        // children. Uses an explicit stack rather than recursion.
        [[nodiscard]] auto descendants() const -> std::vector<T const*>
        {
            auto result = std::vector<T const*>{};
            auto pending = std::vector<port_trie const*>{this};

            while (!pending.empty())
            {
                auto const* const node = pending.back();
                pending.pop_back();

                if (node->value_) { result.push_back(&*node->value_); }
                for (auto const& [port, child] : node->children_)
                {
                    pending.push_back(child.get());
                }
            }

            return result;
        }

        [[nodiscard]] auto child_ports() const -> std::vector<port_type>
        {
            auto ports = std::vector<port_type>{};
            ports.reserve(children_.size());
            for (auto const& [port, child] : children_)
            {
                ports.push_back(port);
            }

            std::ranges::sort(ports);
            return ports;
        }

        [[nodiscard]] auto direct_children() const
            -> std::vector<std::pair<port_type, T const*>>
        {
            auto result = std::vector<std::pair<port_type, T const*>>{};
            for (auto const& [port, child] : children_)
            {
                if (auto const* const value = child->value())
                {
                    result.emplace_back(port, value);
                }
            }

            return result;
        }

        auto operator=(port_trie const&) -> port_trie& = delete;

        auto operator=(port_trie&&) -> port_trie& = default;

      private:
        std::optional<T> value_;
        std::unordered_map<port_type, std::unique_ptr<port_trie>> children_;
    };
}  // namespace usb_tree
