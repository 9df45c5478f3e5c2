#include "QuoteScheduler.h"
#include "DurationFitter.h"
#include "TimelineErrors.h"

QuoteScheduler::QuoteScheduler(juce::Random& random)
    : random(random)
{
}

void QuoteScheduler::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

std::vector<TimelineTypes::QuoteWindow> QuoteScheduler::schedule(const juce::StringArray& pool,
                                                                  const Settings& settings)
{
    std::vector<TimelineTypes::QuoteWindow> windows;

    if (pool.isEmpty())
    {
        if (logCallback)
            logCallback("No quotes to display");
        return windows;
    }

    if (settings.quoteDuration <= 0.0)
        throw ValidationError("Quote duration must be positive, got: " + juce::String(settings.quoteDuration));

    if (settings.minBetween < 0.0 || settings.maxBetween < settings.minBetween)
        throw ValidationError("Invalid quote gap range [" + juce::String(settings.minBetween) + ", "
                              + juce::String(settings.maxBetween) + "]");

    std::vector<juce::String> quotesInUse(pool.begin(), pool.end());
    if (settings.shuffle)
    {
        DurationFitter::shuffleInPlace(quotesInUse, random);
        if (logCallback)
            logCallback("Shuffled quotes");
    }

    double current = DurationFitter::uniform(random, settings.minBetween, settings.maxBetween);
    int index = 0;

    while (current + settings.quoteDuration <= settings.targetDuration)
    {
        TimelineTypes::QuoteWindow window;
        window.text = quotesInUse[static_cast<size_t>(index) % quotesInUse.size()];
        window.start = current;
        window.end = current + settings.quoteDuration;
        window.index = index;
        windows.push_back(window);

        current += settings.quoteDuration + DurationFitter::uniform(random, settings.minBetween, settings.maxBetween);
        ++index;
    }

    if (logCallback)
    {
        logCallback("Generated " + juce::String(static_cast<int>(windows.size())) + " quote timing(s)");

        if (verbose)
            for (const auto& w : windows)
                logCallback("  Quote " + juce::String(w.index) + ": " + juce::String(w.start, 2) + "s - "
                            + juce::String(w.end, 2) + "s: " + w.text.substring(0, 50));
    }

    return windows;
}
