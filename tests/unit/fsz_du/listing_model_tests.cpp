#include <gtest/gtest.h>

#include "listing_model.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

namespace
{

fsz::du::FileNode makeNode(const std::string &name, bool isDirectory, std::optional<std::uint64_t> size,
                           std::uint64_t fileCount = 0)
{
    fsz::du::FileNode node;
    node.name = name;
    node.path = "/r/" + name;
    node.isDirectory = isDirectory;
    node.size = size;
    node.baseSize = isDirectory ? 0 : size.value_or(0);
    node.fileCount = isDirectory ? fileCount : 1;
    return node;
}

fsz::du::FileNode makeListing(std::vector<fsz::du::FileNode> children)
{
    fsz::du::FileNode root;
    root.name = "r";
    root.path = "/r";
    root.isDirectory = true;
    fsz::du::sortListing(children);
    root.children = std::move(children);
    return root;
}

std::vector<std::string> names(const fsz::du::FileNode &root)
{
    std::vector<std::string> result;
    for (const auto &child : *root.children)
        result.push_back(child.name);
    return result;
}

} // namespace

TEST(ListingModel, OrdersDirectoriesSizesAndNames)
{
    std::vector<fsz::du::FileNode> entries{
        makeNode("fileZ", false, 300),
        makeNode("dirA", true, std::nullopt),
        makeNode("fileC", false, 300),
        makeNode("dirB", true, 500, 4),
    };
    fsz::du::sortListing(entries);

    std::vector<std::string> order;
    for (const auto &entry : entries)
        order.push_back(entry.name);
    EXPECT_EQ(order, (std::vector<std::string>{"dirB", "dirA", "fileC", "fileZ"}));
}

TEST(ListingModel, ComparesNamesIgnoringCase)
{
    EXPECT_TRUE(fsz::du::listingOrder(makeNode("alpha", false, 1), makeNode("Beta", false, 1)));
    EXPECT_FALSE(fsz::du::listingOrder(makeNode("Beta", false, 1), makeNode("alpha", false, 1)));
    EXPECT_TRUE(fsz::du::listingOrder(makeNode("empty", true, std::nullopt), makeNode("huge", false, 1u << 30)));
}

TEST(ListingModel, AppliesUpdateToChildAndResorts)
{
    auto root = makeListing({makeNode("small", true, 10, 1), makeNode("pending", true, std::nullopt)});
    EXPECT_EQ(names(root), (std::vector<std::string>{"small", "pending"}));

    EXPECT_TRUE(fsz::du::applySizeUpdate(root, {"/r/pending/", 900, 12}));
    EXPECT_EQ(names(root), (std::vector<std::string>{"pending", "small"}));
    EXPECT_EQ(root.children->front().size, std::optional<std::uint64_t>(900));
    EXPECT_EQ(root.children->front().fileCount, 12u);
}

TEST(ListingModel, AppliesUpdateToRoot)
{
    auto root = makeListing({makeNode("a", false, 5)});
    EXPECT_TRUE(fsz::du::applySizeUpdate(root, {"/r", 5, 1}));
    EXPECT_EQ(root.size, std::optional<std::uint64_t>(5));
    EXPECT_EQ(root.fileCount, 1u);
}

TEST(ListingModel, IgnoresUnrelatedUpdates)
{
    auto root = makeListing({makeNode("a", true, std::nullopt)});
    EXPECT_FALSE(fsz::du::applySizeUpdate(root, {"/r/a/deeper", 5, 1}));
    EXPECT_FALSE(fsz::du::applySizeUpdate(root, {"/elsewhere", 5, 1}));
    EXPECT_FALSE(root.children->front().size.has_value());
}

TEST(ListingModel, SummarizesKnownChildren)
{
    auto root = makeListing({makeNode("dir", true, 100, 7), makeNode("pending", true, std::nullopt),
                             makeNode("file", false, 20)});

    auto summary = fsz::du::summarizeListing(root);
    EXPECT_EQ(summary.partialSize, 120u);
    EXPECT_EQ(summary.partialFileCount, 8u);
    EXPECT_TRUE(summary.hasPending);

    fsz::du::applySizeUpdate(root, {"/r/pending", 30, 2});
    summary = fsz::du::summarizeListing(root);
    EXPECT_EQ(summary.partialSize, 150u);
    EXPECT_EQ(summary.partialFileCount, 10u);
    EXPECT_FALSE(summary.hasPending);
}

TEST(ListingModel, SummaryOfChildlessNodeIsEmpty)
{
    fsz::du::FileNode node = makeNode("a", false, 4);
    auto summary = fsz::du::summarizeListing(node);
    EXPECT_EQ(summary.partialSize, 0u);
    EXPECT_FALSE(summary.hasPending);
}

TEST(ListingModel, AppliesLargeBatchInOnePass)
{
    constexpr int kChildren = 5000;
    std::vector<fsz::du::FileNode> children;
    children.reserve(kChildren);
    for (int i = 0; i < kChildren; ++i)
        children.push_back(makeNode("d" + std::to_string(i), true, std::nullopt));
    auto root = makeListing(std::move(children));

    std::vector<fsz::du::SizeUpdate> batch;
    batch.reserve(2 * kChildren + 1);
    for (int i = 0; i < kChildren; ++i)
    {
        // Descendants of a child arrive before the child itself and match nothing.
        batch.push_back({"/r/d" + std::to_string(i) + "/inner", 1, 1});
        batch.push_back({"/r/d" + std::to_string(i), static_cast<std::uint64_t>(i), 1});
    }
    batch.push_back({"/r", 12497500, kChildren});

    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(fsz::du::applySizeUpdates(root, batch), static_cast<std::size_t>(kChildren + 1));
    auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);

    ASSERT_EQ(root.children->size(), static_cast<std::size_t>(kChildren));
    EXPECT_EQ(root.children->front().name, "d4999");
    EXPECT_EQ(root.children->back().name, "d0");
    EXPECT_EQ(root.size, std::optional<std::uint64_t>(12497500));
    EXPECT_FALSE(fsz::du::summarizeListing(root).hasPending);
    EXPECT_TRUE(std::is_sorted(root.children->begin(), root.children->end(), fsz::du::listingOrder));
}

TEST(ListingModel, EmptyBatchLeavesListingUntouched)
{
    auto root = makeListing({makeNode("a", true, std::nullopt)});
    EXPECT_EQ(fsz::du::applySizeUpdates(root, {}), 0u);
    EXPECT_FALSE(root.children->front().size.has_value());
}
