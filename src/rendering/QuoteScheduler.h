#pragma once
#include <juce_core/juce_core.h>
#include "TimelineTypes.h"

/**
 * Lays out non-overlapping quote display windows over the timeline.
 *
 * Quotes are used round-robin from the pool (shuffled once if requested).
 * The first window starts after a random gap in [minBetween, maxBetween],
 * every following one after the previous window plus a fresh random gap.
 * Scheduling stops at the first window that would run past the target.
 */
class QuoteScheduler
{
public:
    struct Settings
    {
        double targetDuration = 0.0;
        double quoteDuration = 5.0;
        double minBetween = 10.0;
        double maxBetween = 30.0;
        bool shuffle = false;
    };

    explicit QuoteScheduler(juce::Random& random);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /** Verbose mode logs every scheduled window. */
    void setVerbose(bool shouldLogWindows) { verbose = shouldLogWindows; }

    /**
     * @return The windows in time order; empty when the pool is empty
     * @throws ValidationError if quoteDuration is not positive or the gap bounds are inverted
     */
    std::vector<TimelineTypes::QuoteWindow> schedule(const juce::StringArray& pool, const Settings& settings);

private:
    juce::Random& random;
    bool verbose = false;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(QuoteScheduler)
};
