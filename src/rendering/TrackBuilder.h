#pragma once
#include <juce_core/juce_core.h>
#include <optional>
#include "TimelineTypes.h"
#include "TranscodeEngine.h"

/**
 * Builds the audio bed.
 *
 * Music files are fitted to the target, joined, looped to the exact length
 * and given a volume and 2 second edge fades. Every sound file is looped on
 * its own for the whole duration with its own volume. When more than one
 * track results they are mixed, music first so that it sets the length.
 */
class TrackBuilder
{
public:
    struct Settings
    {
        double targetDuration = 0.0;
        double musicVolume = 0.7;
        double soundsVolume = 0.5;
        bool shuffleMusic = false;
    };

    TrackBuilder(TranscodeEngine& engine, juce::Random& random);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Builds the final track from the audio files of both directories.
     * Missing or empty directories simply contribute no track.
     *
     * @return The mixed track, or std::nullopt when there is no audio at all
     */
    std::optional<juce::File> build(const juce::File& musicDirectory,
                                    const juce::File& soundsDirectory,
                                    const Settings& settings);

    /** Builds the music bed from the given files, or nullopt if they have no duration. */
    std::optional<juce::File> buildMusicTrack(const std::vector<juce::File>& musicFiles, const Settings& settings);

    /** Loops each sound file to the target and applies the sounds volume. */
    std::vector<juce::File> buildSoundTracks(const std::vector<juce::File>& soundFiles, const Settings& settings);

    /** Combines the finished tracks; tracks[0] is the length reference. */
    std::optional<juce::File> mix(const std::vector<juce::File>& tracks);

    /** Volume plus fade-in at 0 and fade-out ending at trackDuration. */
    static juce::String buildMusicFilter(double volume, double trackDuration);

    static juce::String buildVolumeFilter(double volume);

private:
    TranscodeEngine& engine;
    juce::Random& random;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TrackBuilder)
};
