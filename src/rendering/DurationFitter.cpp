#include "DurationFitter.h"
#include <cmath>
#include <limits>

namespace DurationFitter
{
    std::optional<TimelineTypes::FitPlan> fit(std::vector<TimelineTypes::MediaItem> items,
                                              double targetDuration,
                                              bool shuffle,
                                              juce::Random& random)
    {
        if (items.empty() || !std::isfinite(targetDuration))
            return std::nullopt;

        if (shuffle)
            shuffleInPlace(items, random);

        double total = 0.0;
        for (const auto& item : items)
            total += item.duration;

        if (total <= 0.0)
            return std::nullopt;

        const double loops = total < targetDuration ? std::floor(targetDuration / total) + 1.0 : 1.0;
        if (loops > static_cast<double>(std::numeric_limits<int>::max()))
            return std::nullopt;

        TimelineTypes::FitPlan plan;
        plan.loopCount = static_cast<int>(loops);

        // Walk the replicas in order and stop at the first item that reaches the target
        for (int loop = 0; loop < plan.loopCount && plan.accumulated < targetDuration; ++loop)
        {
            for (const auto& item : items)
            {
                plan.orderedItems.push_back(item);
                plan.accumulated += item.duration;

                if (plan.accumulated >= targetDuration)
                    break;
            }
        }

        plan.trimLastBy = juce::jmax(0.0, plan.accumulated - targetDuration);
        return plan;
    }

    double uniform(juce::Random& random, double a, double b)
    {
        return a + (b - a) * random.nextDouble();
    }
}
