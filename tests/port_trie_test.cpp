#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "usb_tree/port_trie.hpp"

namespace usb_tree
{
namespace
{

using ports = std::vector<std::uint8_t>;

auto sorted_values(std::vector<std::string const*> const& values) -> std::vector<std::string>
{
    auto result = std::vector<std::string>{};
    for (auto const* const value : values)
    {
        result.push_back(*value);
    }
    std::ranges::sort(result);
    return result;
}

TEST(PortTrieTest, StartsEmpty)
{
    auto const trie = port_trie<std::string>{};
    EXPECT_TRUE(trie.empty());
    EXPECT_FALSE(trie.has_value());
    EXPECT_EQ(trie.value(), nullptr);
    EXPECT_TRUE(trie.child_ports().empty());
    EXPECT_TRUE(trie.descendants().empty());
}

TEST(PortTrieTest, InsertCreatesIntermediateNodes)
{
    auto trie = port_trie<std::string>{};
    trie.insert(ports{1, 2, 3}, "leaf");

    auto const* const intermediate = trie.lookup(ports{1, 2});
    ASSERT_NE(intermediate, nullptr);
    EXPECT_FALSE(intermediate->has_value());
    EXPECT_FALSE(intermediate->empty());

    auto const* const leaf = trie.lookup(ports{1, 2, 3});
    ASSERT_NE(leaf, nullptr);
    ASSERT_TRUE(leaf->has_value());
    EXPECT_EQ(*leaf->value(), "leaf");
}

TEST(PortTrieTest, LookupOfEmptyChainIsTheRoot)
{
    auto trie = port_trie<std::string>{};
    trie.insert(ports{}, "root");

    EXPECT_EQ(trie.lookup(ports{}), &trie);
    EXPECT_EQ(*trie.value(), "root");
}

TEST(PortTrieTest, LookupOfMissingChainIsNull)
{
    auto trie = port_trie<std::string>{};
    trie.insert(ports{1, 2}, "a");

    EXPECT_EQ(trie.lookup(ports{2}), nullptr);
    EXPECT_EQ(trie.lookup(ports{1, 3}), nullptr);
    EXPECT_EQ(trie.lookup(ports{1, 2, 3}), nullptr);
    EXPECT_EQ(trie.child(9), nullptr);
}

TEST(PortTrieTest, InsertOverwritesOnlyThatNode)
{
    auto trie = port_trie<std::string>{};
    trie.insert(ports{1}, "hub");
    trie.insert(ports{1, 4}, "child");
    trie.insert(ports{1}, "hub v2");

    EXPECT_EQ(*trie.lookup(ports{1})->value(), "hub v2");
    EXPECT_EQ(*trie.lookup(ports{1, 4})->value(), "child");
    EXPECT_FALSE(trie.has_value());
}

TEST(PortTrieTest, DescendantsCoverTheWholeSubtree)
{
    auto trie = port_trie<std::string>{};
    trie.insert(ports{2}, "2");
    trie.insert(ports{2, 3}, "2.3");
    trie.insert(ports{2, 4}, "2.4");
    trie.insert(ports{2, 4, 1}, "2.4.1");
    trie.insert(ports{5}, "5");

    EXPECT_EQ(
        sorted_values(trie.descendants()),
        (std::vector<std::string>{"2", "2.3", "2.4", "2.4.1", "5"}));

    auto const* const hub = trie.lookup(ports{2});
    ASSERT_NE(hub, nullptr);

    auto const below_hub = hub->descendants();
    ASSERT_EQ(below_hub.size(), 4u);
    EXPECT_EQ(*below_hub.front(), "2");
    EXPECT_EQ(
        sorted_values(below_hub),
        (std::vector<std::string>{"2", "2.3", "2.4", "2.4.1"}));
}

TEST(PortTrieTest, DescendantsListParentsBeforeChildren)
{
    auto trie = port_trie<std::string>{};
    trie.insert(ports{1, 1, 1}, "1.1.1");
    trie.insert(ports{1, 1}, "1.1");
    trie.insert(ports{1}, "1");

    auto const values = trie.descendants();
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(*values[0], "1");
    EXPECT_EQ(*values[1], "1.1");
    EXPECT_EQ(*values[2], "1.1.1");
}

TEST(PortTrieTest, DescendantsSkipEmptyNodes)
{
    auto trie = port_trie<std::string>{};
    trie.insert(ports{7, 1}, "7.1");

    auto const values = trie.lookup(ports{7})->descendants();
    ASSERT_EQ(values.size(), 1u);
    EXPECT_EQ(*values.front(), "7.1");
}

TEST(PortTrieTest, ChildPortsAreSortedNumerically)
{
    auto trie = port_trie<int>{};
    for (auto const port : {10, 2, 200, 7, 1})
    {
        trie.insert(ports{static_cast<std::uint8_t>(port)}, port);
    }

    EXPECT_EQ(trie.child_ports(), (ports{1, 2, 7, 10, 200}));
}

TEST(PortTrieTest, DirectChildrenOnlyReportNodesWithValues)
{
    auto trie = port_trie<std::string>{};
    trie.insert(ports{1}, "one");
    trie.insert(ports{2, 1}, "two.one");
    trie.insert(ports{3}, "three");

    auto children = trie.direct_children();
    std::ranges::sort(children, {}, [](auto const& child) { return child.first; });

    ASSERT_EQ(children.size(), 2u);
    EXPECT_EQ(children[0].first, 1);
    EXPECT_EQ(*children[0].second, "one");
    EXPECT_EQ(children[1].first, 3);
    EXPECT_EQ(*children[1].second, "three");
}

TEST(PortTrieTest, MovePreservesStructure)
{
    auto trie = port_trie<std::string>{};
    trie.insert(ports{1, 2}, "a");

    auto moved = std::move(trie);
    ASSERT_NE(moved.lookup(ports{1, 2}), nullptr);
    EXPECT_EQ(*moved.lookup(ports{1, 2})->value(), "a");
}

}  // namespace
}  // namespace usb_tree
