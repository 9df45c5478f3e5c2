#pragma once
#include <juce_core/juce_core.h>
#include <optional>
#include "TimelineTypes.h"

/**
 * Decides how to cover a target duration with a finite list of items.
 *
 * The list is optionally shuffled, replicated whole until it is long enough,
 * and then cut at the first item that reaches the target. Whatever that item
 * overshoots by is reported as trimLastBy.
 */
namespace DurationFitter
{
    /**
     * Computes a FitPlan.
     *
     * @param items          Items with their probed durations, in the order to use
     * @param targetDuration Seconds to cover, must be > 0
     * @param shuffle        Permute items with random before laying them out
     * @param random         Source used for the permutation
     * @return The plan, or std::nullopt when items is empty or sums to zero, or
     *         when the target is not finite or needs more replicas than an int holds
     */
    std::optional<TimelineTypes::FitPlan> fit(std::vector<TimelineTypes::MediaItem> items,
                                              double targetDuration,
                                              bool shuffle,
                                              juce::Random& random);

    /** Uniform Fisher-Yates permutation driven by random. */
    template <typename ElementType>
    void shuffleInPlace(std::vector<ElementType>& elements, juce::Random& random)
    {
        for (int i = static_cast<int>(elements.size()) - 1; i > 0; --i)
        {
            const int j = random.nextInt(i + 1);
            std::swap(elements[static_cast<size_t>(i)], elements[static_cast<size_t>(j)]);
        }
    }

    /** Returns a + (b - a) * u with u uniform in [0, 1). */
    double uniform(juce::Random& random, double a, double b);
}
