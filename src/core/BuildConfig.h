#pragma once
#include <juce_core/juce_core.h>
#include <juce_data_structures/juce_data_structures.h>
#include <optional>
#include "../rendering/TimelineTypes.h"

/**
 * Everything one build needs to know, read-only once loaded.
 *
 * Values are layered from lowest to highest priority: built-in defaults, an
 * optional LoopReelSettings XML file, LOOPREEL_* environment variables and
 * finally command-line options. Every layer goes through applyOption(), so
 * the same names and parsing rules apply everywhere.
 */
struct BuildConfig
{
    // Duration and quote timing, in seconds
    double duration = 0.0;
    double quotesDuration = 5.0;
    double quotesMinBetween = 10.0;
    double quotesMaxBetween = 30.0;

    // Shuffle options
    bool musicShuffle = false;
    std::optional<bool> videoShuffle;   // Falls back to musicShuffle when unset
    bool quotesShuffle = false;

    // Output options
    juce::File outputFile;
    int fps = 30;
    int width = 1920;
    int height = 1080;
    TimelineTypes::Transition transition = TimelineTypes::CrossfadeTransition{};

    // Audio options
    double musicVolume = 0.7;
    double soundsVolume = 0.5;

    // Visual options
    TimelineTypes::QuoteStyle quoteStyle = TimelineTypes::QuoteStyle::Centered;
    juce::File fontFile;

    // Directories
    juce::File videosDir;
    juce::File musicDir;
    juce::File soundsDir;
    juce::File quotesDir;
    juce::File workDir;

    // Engine
    juce::String videoEncodingParams;
    juce::String ffmpegPath;
    juce::String ffprobePath;

    // Utility options
    std::optional<juce::int64> seed;
    bool verbose = false;
    bool dryRun = false;

    //==========================================================================
    /** Defaults with every relative directory resolved against baseDirectory. */
    static BuildConfig withDefaults(const juce::File& baseDirectory);

    /**
     * Builds the effective configuration for a command line.
     *
     * @param args        Parsed command line; "--settings <file>" names an XML settings file
     * @param environment Environment variables by name (see readEnvironment())
     * @param baseDirectory Directory relative paths are resolved against
     * @throws ValidationError for unreadable settings or malformed values
     */
    static BuildConfig load(const juce::ArgumentList& args,
                            const juce::StringPairArray& environment,
                            const juce::File& baseDirectory);

    /** Collects the LOOPREEL_* variables of the current process. */
    static juce::StringPairArray readEnvironment();

    /** Returns the environment variable name for a command-line option name. */
    static juce::String environmentNameFor(const juce::String& optionName);

    /**
     * Sets one option from its textual value.
     * @param optionName Command-line name without dashes, e.g. "quotes-duration"
     * @throws ValidationError if the name is unknown or the value doesn't parse
     */
    void applyOption(const juce::String& optionName, const juce::String& value);

    /** Applies every known property of a LoopReelSettings tree. */
    void applySettings(const juce::ValueTree& settings);

    /** Loads and applies a LoopReelSettings XML file. */
    void applySettingsFile(const juce::File& settingsFile);

    void applyEnvironment(const juce::StringPairArray& environment);
    void applyArguments(const juce::ArgumentList& args);

    /** The effective configuration as a LoopReelSettings tree. */
    juce::ValueTree toValueTree() const;

    /**
     * Checks every value range and that the videos directory exists.
     * @throws ValidationError describing the first violation found
     */
    void validate() const;

    bool shouldShuffleVideo() const { return videoShuffle.value_or(musicShuffle); }

    juce::String getResolutionString() const { return juce::String(width) + "x" + juce::String(height); }

    /** All recognised option names, in help order. */
    static juce::StringArray getOptionNames();

private:
    juce::File baseDirectory;
};
