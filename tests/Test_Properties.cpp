#include <gtest/gtest.h>
#include <string>

import Geometry;

using Geometry::PropertyRegistry;

// -----------------------------------------------------------------------------
// Registry
// -----------------------------------------------------------------------------

TEST(PropertyRegistry, AddResizesToRegistrySize)
{
    PropertyRegistry registry;
    registry.Resize(3);

    auto weights = registry.Add<double>("weight", 1.5);
    ASSERT_TRUE(weights.IsValid());
    EXPECT_EQ(weights.Vector().size(), 3u);
    EXPECT_DOUBLE_EQ(weights[2], 1.5);

    registry.Resize(5);
    EXPECT_EQ(weights.Vector().size(), 5u);
    EXPECT_DOUBLE_EQ(weights[4], 1.5);
}

TEST(PropertyRegistry, DuplicateAddReturnsInvalid)
{
    PropertyRegistry registry;
    auto first = registry.Add<int>("id");
    auto second = registry.Add<int>("id");
    EXPECT_TRUE(first.IsValid());
    EXPECT_FALSE(second.IsValid());
    EXPECT_EQ(registry.PropertyCount(), 1u);
}

TEST(PropertyRegistry, GetChecksType)
{
    PropertyRegistry registry;
    (void)registry.Add<int>("id");

    EXPECT_TRUE(registry.Get<int>("id").IsValid());
    EXPECT_FALSE(registry.Get<double>("id").IsValid());
    EXPECT_FALSE(registry.Get<int>("missing").IsValid());
}

TEST(PropertyRegistry, GetOrAddSharesColumn)
{
    PropertyRegistry registry;
    registry.Resize(2);

    auto a = registry.GetOrAdd<std::string>("label", "none");
    a[1] = "tip";
    auto b = registry.GetOrAdd<std::string>("label", "ignored");
    EXPECT_EQ(b[0], "none");
    EXPECT_EQ(b[1], "tip");
    EXPECT_EQ(registry.PropertyCount(), 1u);
}

TEST(PropertyRegistry, FindAndClear)
{
    PropertyRegistry registry;
    registry.Resize(4);
    (void)registry.Add<int>("a");
    (void)registry.Add<int>("b");

    EXPECT_EQ(registry.Find("a"), 0u);
    EXPECT_EQ(registry.Find("b"), 1u);
    EXPECT_FALSE(registry.Find("c").has_value());

    registry.Clear();
    EXPECT_EQ(registry.Size(), 0u);
    EXPECT_EQ(registry.PropertyCount(), 0u);
    EXPECT_FALSE(registry.Find("a").has_value());
}

TEST(PropertyRegistry, CopyClonesColumns)
{
    PropertyRegistry original;
    original.Resize(1);
    auto values = original.Add<int>("value", 7);

    PropertyRegistry copy(original);
    auto copied = copy.Get<int>("value");
    ASSERT_TRUE(copied.IsValid());
    copied[0] = 42;

    EXPECT_EQ(values[0], 7);
    EXPECT_EQ(copied[0], 42);
}

// -----------------------------------------------------------------------------
// Handles
// -----------------------------------------------------------------------------

TEST(Handles, DefaultIsInvalid)
{
    Geometry::VertexHandle v;
    EXPECT_FALSE(v.IsValid());
    EXPECT_EQ(v.Index, Geometry::kInvalidIndex);
}

TEST(Handles, OrderingFollowsIndex)
{
    const Geometry::LoopHandle a{1};
    const Geometry::LoopHandle b{2};
    EXPECT_LT(a, b);
    EXPECT_EQ(a, Geometry::LoopHandle{1});
}

TEST(Handles, HandlePropertyIndexesByHandle)
{
    PropertyRegistry registry;
    registry.Resize(3);
    Geometry::VertexProperty<int> ids(registry.Add<int>("id"));

    ids[Geometry::VertexHandle{1}] = 11;
    EXPECT_EQ(ids.Vector()[1], 11);
}
