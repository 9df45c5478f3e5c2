#pragma once
#include <juce_core/juce_core.h>
#include <map>
#include "TimelineTypes.h"
#include "TranscodeEngine.h"

/**
 * Normalized artifact and its probed duration for each source path.
 * Owned by the run that fills it and dropped with it.
 */
using NormalizedClipCache = std::map<juce::String, TimelineTypes::MediaItem>;

/**
 * Produces one video segment that covers the target duration exactly.
 *
 * Sources are scanned, ordered, normalized once each, fitted to the target
 * with DurationFitter, joined through BatchConcatenator and finally trimmed.
 */
class ClipAssembler
{
public:
    struct Settings
    {
        double targetDuration = 0.0;
        int width = 1920;
        int height = 1080;
        int fps = 30;
        bool shuffle = false;
        TimelineTypes::Transition transition = TimelineTypes::CrossfadeTransition{};
    };

    /**
     * @param engine Engine for every media operation
     * @param random Source for the shuffle
     * @param cache  Per-run memo of normalized sources
     */
    ClipAssembler(TranscodeEngine& engine, juce::Random& random, NormalizedClipCache& cache);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Builds the video timeline from every intact video in videoDirectory.
     *
     * @throws IntegrityError if no usable video remains, before any engine call
     * @throws BatchError, EngineError from the stages below
     */
    juce::File assemble(const juce::File& videoDirectory, const Settings& settings);

    /**
     * Builds the video timeline from an explicit list of sources, used in
     * the given order unless settings.shuffle is set.
     */
    juce::File assemble(std::vector<juce::File> sources, const Settings& settings);

private:
    const TimelineTypes::MediaItem& normalize(const juce::File& source, const Settings& settings);

    TranscodeEngine& engine;
    juce::Random& random;
    NormalizedClipCache& cache;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ClipAssembler)
};
