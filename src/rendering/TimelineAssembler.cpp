#include "TimelineAssembler.h"
#include "MuxPlanner.h"
#include "QuoteScheduler.h"
#include "TrackBuilder.h"
#include "../core/MediaLibrary.h"

TimelineAssembler::TimelineAssembler(TranscodeEngine& engine, juce::Random& random, const juce::File& workDirectory)
    : engine(engine),
      random(random),
      workDirectory(workDirectory)
{
}

TimelineAssembler::~TimelineAssembler()
{
}

void TimelineAssembler::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

void TimelineAssembler::log(const juce::String& message) const
{
    if (logCallback)
        logCallback(message);
}

//==============================================================================
juce::File TimelineAssembler::buildVideoTimeline(const juce::File& videoDirectory, const BuildConfig& config)
{
    log("=== VIDEO TIMELINE ===");

    if (!std::holds_alternative<TimelineTypes::NoTransition>(config.transition))
        log("Transition '" + TimelineTypes::transitionName(config.transition)
            + "': segments are joined by re-encoding without a blend between clips");

    ClipAssembler::Settings settings;
    settings.targetDuration = config.duration;
    settings.width = config.width;
    settings.height = config.height;
    settings.fps = config.fps;
    settings.shuffle = config.shouldShuffleVideo();
    settings.transition = config.transition;

    ClipAssembler assembler(engine, random, normalizedClips);
    assembler.setLogCallback(logCallback);

    const juce::File video = assembler.assemble(videoDirectory, settings);
    log("Video timeline ready: " + video.getFullPathName());
    return video;
}

std::optional<juce::File> TimelineAssembler::buildAudioTimeline(const juce::File& musicDirectory,
                                                                const juce::File& soundsDirectory,
                                                                const BuildConfig& config)
{
    log("=== AUDIO TIMELINE ===");

    TrackBuilder::Settings settings;
    settings.targetDuration = config.duration;
    settings.musicVolume = config.musicVolume;
    settings.soundsVolume = config.soundsVolume;
    settings.shuffleMusic = config.musicShuffle;

    TrackBuilder builder(engine, random);
    builder.setLogCallback(logCallback);

    auto audio = builder.build(musicDirectory, soundsDirectory, settings);
    if (audio.has_value())
        log("Audio timeline ready: " + audio->getFullPathName());

    return audio;
}

std::vector<TimelineTypes::QuoteWindow> TimelineAssembler::scheduleQuotes(const juce::File& quotesDirectory,
                                                                          const BuildConfig& config)
{
    log("=== QUOTES ===");

    const juce::StringArray pool = MediaLibrary::loadQuotes(quotesDirectory, logCallback);

    QuoteScheduler::Settings settings;
    settings.targetDuration = config.duration;
    settings.quoteDuration = config.quotesDuration;
    settings.minBetween = config.quotesMinBetween;
    settings.maxBetween = config.quotesMaxBetween;
    settings.shuffle = config.quotesShuffle;

    QuoteScheduler scheduler(random);
    scheduler.setLogCallback(logCallback);
    scheduler.setVerbose(config.verbose);

    return scheduler.schedule(pool, settings);
}

void TimelineAssembler::finalize(const juce::File& video,
                                 const std::optional<juce::File>& audio,
                                 const std::vector<TimelineTypes::QuoteWindow>& windows,
                                 const BuildConfig& config)
{
    log("=== FINAL RENDER ===");

    MuxPlanner::Settings settings;
    settings.targetDuration = config.duration;
    settings.quoteStyle = config.quoteStyle;
    settings.transition = config.transition;
    settings.fontFile = config.fontFile;
    settings.workDirectory = workDirectory.getChildFile("quotes");

    MuxPlanner planner(engine);
    planner.setLogCallback(logCallback);

    const juce::File output = planner.finalize(video, audio, windows, settings, config.outputFile);
    log("Output written: " + output.getFullPathName()
        + " (" + juce::File::descriptionOfSizeInBytes(output.getSize()) + ")");
}
