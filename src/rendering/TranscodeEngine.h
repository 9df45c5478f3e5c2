#pragma once
#include <juce_core/juce_core.h>
#include <optional>
#include <vector>

/**
 * The media-processing capability the timeline pipeline treats as a black box.
 *
 * Every operation blocks until the underlying work has finished and returns the
 * file it produced. Any failure is reported by throwing EngineError (ProbeError
 * for probeDuration); implementations never retry.
 */
class TranscodeEngine
{
public:
    virtual ~TranscodeEngine() = default;

    /** Returns the duration of a media file in seconds. */
    virtual double probeDuration(const juce::File& file) = 0;

    /**
     * Scales a video to fit width x height preserving aspect ratio, centre-pads
     * the remainder, resamples to fps and strips audio.
     */
    virtual juce::File scaleAndPad(const juce::File& file, int width, int height, int fps) = 0;

    /**
     * Concatenates video segments in order.
     * @param reencode false for a stream copy, true to re-encode the joined video
     */
    virtual juce::File concat(const std::vector<juce::File>& files, bool reencode) = 0;

    /** Re-encodes a single audio file into the pipeline's working audio format. */
    virtual juce::File normalizeAudio(const juce::File& file) = 0;

    /** Joins audio files end to end without crossfading. */
    virtual juce::File concatAudio(const std::vector<juce::File>& files) = 0;

    /** Repeats an audio file indefinitely and cuts it at exactly seconds. */
    virtual juce::File loopToDuration(const juce::File& file, double seconds) = 0;

    /** Runs an audio filter chain (e.g. "volume=0.5,afade=...") over a file. */
    virtual juce::File applyAudioFilter(const juce::File& file, const juce::String& filterExpression) = 0;

    /**
     * Mixes several audio tracks into one.
     * @param referenceIndex the track whose duration the mix follows
     */
    virtual juce::File mixTracks(const std::vector<juce::File>& files, int referenceIndex) = 0;

    /** Stream-copies the first seconds of a video. */
    virtual juce::File trim(const juce::File& file, double seconds) = 0;

    /**
     * Combines the final video, optional audio and optional video filter graph
     * into the output file, truncated to the shortest mapped stream.
     */
    virtual juce::File renderOverlayAndMux(const juce::File& video,
                                           const std::optional<juce::File>& audio,
                                           const juce::String& videoFilter,
                                           const juce::File& outputFile) = 0;
};
