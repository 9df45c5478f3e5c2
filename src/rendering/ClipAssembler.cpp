#include "ClipAssembler.h"
#include "BatchConcatenator.h"
#include "DurationFitter.h"
#include "TimelineErrors.h"
#include "../core/MediaLibrary.h"

ClipAssembler::ClipAssembler(TranscodeEngine& engine, juce::Random& random, NormalizedClipCache& cache)
    : engine(engine),
      random(random),
      cache(cache)
{
}

void ClipAssembler::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

//==============================================================================
juce::File ClipAssembler::assemble(const juce::File& videoDirectory, const Settings& settings)
{
    auto scan = MediaLibrary::scan(videoDirectory, MediaLibrary::videoExtensions, logCallback);

    if (scan.files.empty())
        throw IntegrityError("No valid video files found in " + videoDirectory.getFullPathName());

    if (logCallback)
        logCallback("Found " + juce::String(static_cast<int>(scan.files.size())) + " video file(s)");

    return assemble(std::move(scan.files), settings);
}

juce::File ClipAssembler::assemble(std::vector<juce::File> sources, const Settings& settings)
{
    if (sources.empty())
        throw IntegrityError("No video sources to assemble");

    for (const auto& source : sources)
        if (!MediaLibrary::isIntact(source))
            throw IntegrityError("Video source is missing or empty: " + source.getFullPathName());

    if (settings.shuffle)
    {
        DurationFitter::shuffleInPlace(sources, random);
        if (logCallback)
            logCallback("Shuffled video order");
    }

    // Normalize each distinct source once; the fitter sees the normalized durations
    std::vector<TimelineTypes::MediaItem> items;
    items.reserve(sources.size());

    for (const auto& source : sources)
        items.push_back(normalize(source, settings));

    auto plan = DurationFitter::fit(items, settings.targetDuration, false, random);
    if (!plan.has_value())
        throw IntegrityError("Video sources have no usable duration");

    if (logCallback)
        logCallback("Video plan: " + juce::String(static_cast<int>(plan->orderedItems.size())) + " segment(s), "
                    + juce::String(plan->loopCount) + " loop(s), trim "
                    + juce::String(plan->trimLastBy, 3) + "s");

    if (plan->orderedItems.size() == 1 && !plan->needsTrim())
        return plan->orderedItems.front().file;

    std::vector<juce::File> segments;
    segments.reserve(plan->orderedItems.size());
    for (const auto& item : plan->orderedItems)
        segments.push_back(item.file);

    BatchConcatenator concatenator(engine);
    concatenator.setLogCallback(logCallback);
    juce::File result = concatenator.concatenate(segments, settings.transition);

    if (plan->needsTrim())
    {
        if (logCallback)
            logCallback("Trimming video to " + juce::String(settings.targetDuration, 3) + "s");

        result = engine.trim(result, settings.targetDuration);
    }

    return result;
}

//==============================================================================
const TimelineTypes::MediaItem& ClipAssembler::normalize(const juce::File& source, const Settings& settings)
{
    const juce::String key = source.getFullPathName();

    auto existing = cache.find(key);
    if (existing != cache.end())
        return existing->second;

    TimelineTypes::MediaItem item;
    item.file = engine.scaleAndPad(source, settings.width, settings.height, settings.fps);
    item.duration = engine.probeDuration(item.file);
    item.valid = true;

    return cache.emplace(key, item).first->second;
}
