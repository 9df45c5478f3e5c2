#include "TrackBuilder.h"
#include "DurationFitter.h"
#include "../core/MediaLibrary.h"

TrackBuilder::TrackBuilder(TranscodeEngine& engine, juce::Random& random)
    : engine(engine),
      random(random)
{
}

void TrackBuilder::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

//==============================================================================
std::optional<juce::File> TrackBuilder::build(const juce::File& musicDirectory,
                                              const juce::File& soundsDirectory,
                                              const Settings& settings)
{
    const auto music = MediaLibrary::scan(musicDirectory, MediaLibrary::audioExtensions, logCallback);
    const auto sounds = MediaLibrary::scan(soundsDirectory, MediaLibrary::audioExtensions, logCallback);

    if (music.files.empty() && logCallback)
        logCallback("WARNING: No music files found in " + musicDirectory.getFullPathName()
                    + ", video will be created without background music");

    std::vector<juce::File> tracks;

    if (auto musicTrack = buildMusicTrack(music.files, settings))
        tracks.push_back(*musicTrack);

    for (const auto& soundTrack : buildSoundTracks(sounds.files, settings))
        tracks.push_back(soundTrack);

    return mix(tracks);
}

//==============================================================================
std::optional<juce::File> TrackBuilder::buildMusicTrack(const std::vector<juce::File>& musicFiles,
                                                        const Settings& settings)
{
    std::vector<TimelineTypes::MediaItem> items;
    items.reserve(musicFiles.size());

    for (const auto& file : musicFiles)
    {
        TimelineTypes::MediaItem item;
        item.file = file;
        item.duration = engine.probeDuration(file);
        item.valid = true;
        items.push_back(item);
    }

    const auto plan = DurationFitter::fit(items, settings.targetDuration, settings.shuffleMusic, random);
    if (!plan.has_value())
        return std::nullopt;

    if (logCallback)
        logCallback("Building music track from " + juce::String(static_cast<int>(plan->orderedItems.size()))
                    + " item(s)" + (settings.shuffleMusic ? " (shuffled)" : ""));

    juce::File joined;
    if (plan->orderedItems.size() == 1)
    {
        joined = engine.normalizeAudio(plan->orderedItems.front().file);
    }
    else
    {
        std::vector<juce::File> files;
        files.reserve(plan->orderedItems.size());
        for (const auto& item : plan->orderedItems)
            files.push_back(item.file);

        joined = engine.concatAudio(files);
    }

    const juce::File looped = engine.loopToDuration(joined, settings.targetDuration);

    // The fade-out is placed against what the loop actually produced
    const double loopedDuration = engine.probeDuration(looped);

    return engine.applyAudioFilter(looped, buildMusicFilter(settings.musicVolume, loopedDuration));
}

std::vector<juce::File> TrackBuilder::buildSoundTracks(const std::vector<juce::File>& soundFiles,
                                                       const Settings& settings)
{
    std::vector<juce::File> tracks;
    tracks.reserve(soundFiles.size());

    for (const auto& file : soundFiles)
    {
        if (logCallback)
            logCallback("Creating looping sound: " + file.getFileName());

        const juce::File looped = engine.loopToDuration(file, settings.targetDuration);
        tracks.push_back(engine.applyAudioFilter(looped, buildVolumeFilter(settings.soundsVolume)));
    }

    return tracks;
}

std::optional<juce::File> TrackBuilder::mix(const std::vector<juce::File>& tracks)
{
    if (tracks.empty())
    {
        if (logCallback)
            logCallback("No audio tracks, output will be video only");
        return std::nullopt;
    }

    if (tracks.size() == 1)
        return tracks.front();

    if (logCallback)
        logCallback("Mixing " + juce::String(static_cast<int>(tracks.size())) + " audio tracks");

    return engine.mixTracks(tracks, 0);
}

//==============================================================================
juce::String TrackBuilder::buildMusicFilter(double volume, double trackDuration)
{
    using TimelineTypes::formatNumber;
    using TimelineTypes::kMusicFadeSeconds;

    const double fadeOutStart = juce::jmax(0.0, trackDuration - kMusicFadeSeconds);

    return "volume=" + formatNumber(volume)
         + ",afade=t=in:st=0:d=" + formatNumber(kMusicFadeSeconds)
         + ",afade=t=out:st=" + formatNumber(fadeOutStart) + ":d=" + formatNumber(kMusicFadeSeconds);
}

juce::String TrackBuilder::buildVolumeFilter(double volume)
{
    return "volume=" + TimelineTypes::formatNumber(volume);
}
