#pragma once
#include <juce_core/juce_core.h>
#include <optional>
#include "TimelineTypes.h"
#include "TranscodeEngine.h"
#include "ClipAssembler.h"
#include "../core/BuildConfig.h"

/**
 * One pipeline run.
 *
 * Owns everything that must not outlive the run (the normalized clip memo,
 * the work directory used for quote text files) and hands the injected
 * engine and random source to each stage. Create a new instance per build.
 */
class TimelineAssembler
{
public:
    /**
     * Creates a new TimelineAssembler.
     * @param engine        The engine every stage runs against
     * @param random        Source for all shuffles and quote gaps
     * @param workDirectory Scratch directory for this run
     */
    TimelineAssembler(TranscodeEngine& engine, juce::Random& random, const juce::File& workDirectory);
    ~TimelineAssembler();

    /**
     * Sets a callback for receiving log messages.
     * @param callback Function called with log messages
     */
    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Builds a video segment exactly config.duration seconds long from the
     * videos in videoDirectory.
     */
    juce::File buildVideoTimeline(const juce::File& videoDirectory, const BuildConfig& config);

    /**
     * Builds the mixed music and sound track.
     * @return The audio file, or std::nullopt when neither directory has audio
     */
    std::optional<juce::File> buildAudioTimeline(const juce::File& musicDirectory,
                                                 const juce::File& soundsDirectory,
                                                 const BuildConfig& config);

    /** Loads the quotes of quotesDirectory and schedules their display windows. */
    std::vector<TimelineTypes::QuoteWindow> scheduleQuotes(const juce::File& quotesDirectory,
                                                           const BuildConfig& config);

    /** Combines everything into config.outputFile. */
    void finalize(const juce::File& video,
                  const std::optional<juce::File>& audio,
                  const std::vector<TimelineTypes::QuoteWindow>& windows,
                  const BuildConfig& config);

    /** Number of distinct sources normalized so far in this run. */
    int getNumNormalizedClips() const { return static_cast<int>(normalizedClips.size()); }

private:
    void log(const juce::String& message) const;

    TranscodeEngine& engine;
    juce::Random& random;
    juce::File workDirectory;
    NormalizedClipCache normalizedClips;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TimelineAssembler)
};
