#include <gtest/gtest.h>
#include <limits>
#include "rendering/DurationFitter.h"

using TimelineTypes::MediaItem;

namespace
{
    std::vector<MediaItem> makeItems(std::initializer_list<double> durations)
    {
        std::vector<MediaItem> items;
        int n = 0;
        for (double d : durations)
        {
            MediaItem item;
            item.file = juce::File("/media/clip_" + juce::String(n++) + ".mp4");
            item.duration = d;
            item.valid = true;
            items.push_back(item);
        }
        return items;
    }
}

TEST(DurationFitter, ThreeClipsLongerThanTargetAreUsedOnce)
{
    juce::Random random(1);
    const auto plan = DurationFitter::fit(makeItems({ 40.0, 40.0, 40.0 }), 100.0, false, random);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->loopCount, 1);
    EXPECT_EQ(plan->orderedItems.size(), 3u);
    EXPECT_DOUBLE_EQ(plan->accumulated, 120.0);
    EXPECT_DOUBLE_EQ(plan->trimLastBy, 20.0);
    EXPECT_TRUE(plan->needsTrim());
}

TEST(DurationFitter, ShortSingleClipIsReplicated)
{
    juce::Random random(1);
    const auto plan = DurationFitter::fit(makeItems({ 30.0 }), 100.0, false, random);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->loopCount, 4);
    EXPECT_EQ(plan->orderedItems.size(), 4u);
    EXPECT_DOUBLE_EQ(plan->trimLastBy, 20.0);

    for (const auto& item : plan->orderedItems)
        EXPECT_EQ(item.file, juce::File("/media/clip_0.mp4"));
}

TEST(DurationFitter, SingleClipLongerThanTargetNeedsOnlyTrim)
{
    juce::Random random(1);
    const auto plan = DurationFitter::fit(makeItems({ 150.0 }), 100.0, false, random);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->loopCount, 1);
    EXPECT_EQ(plan->orderedItems.size(), 1u);
    EXPECT_DOUBLE_EQ(plan->trimLastBy, 50.0);
}

TEST(DurationFitter, ExactFitNeedsNoTrim)
{
    juce::Random random(1);
    const auto plan = DurationFitter::fit(makeItems({ 25.0, 25.0 }), 50.0, false, random);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->orderedItems.size(), 2u);
    EXPECT_DOUBLE_EQ(plan->trimLastBy, 0.0);
    EXPECT_FALSE(plan->needsTrim());
}

TEST(DurationFitter, StopsAtFirstItemReachingTarget)
{
    juce::Random random(1);
    const auto plan = DurationFitter::fit(makeItems({ 10.0, 20.0, 30.0 }), 25.0, false, random);

    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->orderedItems.size(), 2u);
    EXPECT_EQ(plan->orderedItems[1].file, juce::File("/media/clip_1.mp4"));
    EXPECT_DOUBLE_EQ(plan->trimLastBy, 5.0);
}

TEST(DurationFitter, EmptyOrZeroLengthInputHasNoPlan)
{
    juce::Random random(1);
    EXPECT_FALSE(DurationFitter::fit({}, 100.0, false, random).has_value());
    EXPECT_FALSE(DurationFitter::fit(makeItems({ 0.0, 0.0 }), 100.0, false, random).has_value());
}

TEST(DurationFitter, UnreachableTargetHasNoPlan)
{
    juce::Random random(1);
    EXPECT_FALSE(DurationFitter::fit(makeItems({ 1.0 }), std::numeric_limits<double>::infinity(),
                                     false, random).has_value());
    EXPECT_FALSE(DurationFitter::fit(makeItems({ 0.001 }), 1.0e12, false, random).has_value());
}

TEST(DurationFitter, PlanAlwaysCoversTargetWithLessThanOneItemOfOvershoot)
{
    juce::Random random(42);

    for (int trial = 0; trial < 200; ++trial)
    {
        std::vector<MediaItem> items;
        const int count = 1 + random.nextInt(6);
        double longest = 0.0;

        for (int i = 0; i < count; ++i)
        {
            MediaItem item;
            item.file = juce::File("/media/random_" + juce::String(i) + ".mp4");
            item.duration = DurationFitter::uniform(random, 0.5, 60.0);
            longest = juce::jmax(longest, item.duration);
            items.push_back(item);
        }

        const double target = DurationFitter::uniform(random, 1.0, 600.0);
        const auto plan = DurationFitter::fit(items, target, trial % 2 == 0, random);

        ASSERT_TRUE(plan.has_value());
        EXPECT_GE(plan->accumulated + TimelineTypes::kDurationTolerance, target);
        EXPECT_GE(plan->trimLastBy, 0.0);
        EXPECT_LT(plan->trimLastBy, longest);
        EXPECT_NEAR(plan->accumulated - plan->trimLastBy, target, 1.0e-6);
    }
}

TEST(DurationFitter, ShuffleKeepsEveryItem)
{
    juce::Random random(7);
    const auto plan = DurationFitter::fit(makeItems({ 10.0, 20.0, 30.0, 40.0 }), 100.0, true, random);

    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->orderedItems.size(), 4u);

    juce::StringArray names;
    for (const auto& item : plan->orderedItems)
        names.addIfNotAlreadyThere(item.file.getFileName());

    EXPECT_EQ(names.size(), 4);
}

TEST(DurationFitter, ShuffleIsReproducibleForTheSameSeed)
{
    std::vector<int> first { 1, 2, 3, 4, 5, 6, 7, 8 };
    std::vector<int> second = first;

    juce::Random a(1234), b(1234);
    DurationFitter::shuffleInPlace(first, a);
    DurationFitter::shuffleInPlace(second, b);

    EXPECT_EQ(first, second);
}

TEST(DurationFitter, UniformStaysInRange)
{
    juce::Random random(99);

    for (int i = 0; i < 1000; ++i)
    {
        const double value = DurationFitter::uniform(random, 10.0, 30.0);
        EXPECT_GE(value, 10.0);
        EXPECT_LE(value, 30.0);
    }
}
