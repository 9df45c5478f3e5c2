#include "BuildConfig.h"
#include "../rendering/TimelineErrors.h"
#include <cmath>

namespace
{
    struct OptionInfo
    {
        const char* name;       // Command-line name without dashes
        const char* property;   // Attribute name in the settings file
        bool isFlag;            // May be given without a value on the command line
    };

    const OptionInfo knownOptions[] =
    {
        { "duration",           "duration",            false },
        { "quotes-duration",    "quotesDuration",      false },
        { "quotes-min-between", "quotesMinBetween",    false },
        { "quotes-max-between", "quotesMaxBetween",    false },
        { "music-shuffle",      "musicShuffle",        true  },
        { "video-shuffle",      "videoShuffle",        true  },
        { "quotes-shuffle",     "quotesShuffle",       true  },
        { "output",             "output",              false },
        { "fps",                "fps",                 false },
        { "resolution",         "resolution",          false },
        { "transition",         "transition",          false },
        { "music-volume",       "musicVolume",         false },
        { "sounds-volume",      "soundsVolume",        false },
        { "quote-style",        "quoteStyle",          false },
        { "videos-dir",         "videosDir",           false },
        { "music-dir",          "musicDir",            false },
        { "sounds-dir",         "soundsDir",           false },
        { "quotes-dir",         "quotesDir",           false },
        { "work-dir",           "workDir",             false },
        { "font-file",          "fontFile",            false },
        { "encoding-params",    "encodingParams",      false },
        { "ffmpeg",             "ffmpegPath",          false },
        { "ffprobe",            "ffprobePath",         false },
        { "seed",               "seed",                false },
        { "verbose",            "verbose",             true  },
        { "dry-run",            "dryRun",              true  }
    };

    juce::String describeOption(const juce::String& name)
    {
        return "--" + name;
    }

    double parseDouble(const juce::String& name, const juce::String& value)
    {
        const juce::String text = value.trim();
        if (text.isEmpty() || !text.containsOnly("0123456789.-+eE"))
            throw ValidationError(describeOption(name) + " expects a number, got: '" + value + "'");
        return text.getDoubleValue();
    }

    juce::int64 parseInteger(const juce::String& name, const juce::String& value)
    {
        const juce::String text = value.trim();
        if (text.isEmpty() || !text.containsOnly("0123456789-+"))
            throw ValidationError(describeOption(name) + " expects an integer, got: '" + value + "'");
        return text.getLargeIntValue();
    }

    bool parseBool(const juce::String& name, const juce::String& value)
    {
        const juce::String text = value.trim().toLowerCase();

        if (text == "true" || text == "1" || text == "yes" || text == "on")
            return true;
        if (text == "false" || text == "0" || text == "no" || text == "off")
            return false;

        throw ValidationError(describeOption(name) + " expects true or false, got: '" + value + "'");
    }

    // Long options accept "--name=value" and "--name value"; "-o" only the latter
    std::optional<juce::String> findOptionValue(const juce::ArgumentList& args, const juce::String& pattern, bool isFlag)
    {
        for (int i = 0; i < args.arguments.size(); ++i)
        {
            const auto& arg = args.arguments.getReference(i);
            if (!(arg == pattern))
                continue;

            if (arg.isLongOption() && arg.text.containsChar('='))
                return arg.getLongOptionValue();

            if (isFlag)
                return juce::String("true");

            if (i + 1 < args.arguments.size() && !args.arguments.getReference(i + 1).text.startsWith("--"))
                return args.arguments.getReference(i + 1).text;

            throw ValidationError(arg.text + " requires a value");
        }

        return std::nullopt;
    }
}

//==============================================================================
BuildConfig BuildConfig::withDefaults(const juce::File& baseDirectory)
{
    BuildConfig config;
    config.baseDirectory = baseDirectory;
    config.outputFile = baseDirectory.getChildFile("output.mp4");
    config.videosDir = baseDirectory.getChildFile("videos");
    config.musicDir = baseDirectory.getChildFile("music");
    config.soundsDir = baseDirectory.getChildFile("sounds");
    config.quotesDir = baseDirectory.getChildFile("quotes");
    config.workDir = baseDirectory.getChildFile(".tmp");
    return config;
}

BuildConfig BuildConfig::load(const juce::ArgumentList& args,
                              const juce::StringPairArray& environment,
                              const juce::File& baseDirectory)
{
    BuildConfig config = withDefaults(baseDirectory);

    if (const auto settingsPath = findOptionValue(args, "--settings", false))
        config.applySettingsFile(baseDirectory.getChildFile(*settingsPath));

    config.applyEnvironment(environment);
    config.applyArguments(args);
    return config;
}

juce::StringArray BuildConfig::getOptionNames()
{
    juce::StringArray names;
    for (const auto& option : knownOptions)
        names.add(option.name);
    return names;
}

juce::String BuildConfig::environmentNameFor(const juce::String& optionName)
{
    return "LOOPREEL_" + optionName.toUpperCase().replaceCharacter('-', '_');
}

juce::StringPairArray BuildConfig::readEnvironment()
{
    juce::StringPairArray environment;

    for (const auto& option : knownOptions)
    {
        const juce::String name = environmentNameFor(option.name);
        const juce::String value = juce::SystemStats::getEnvironmentVariable(name, {});
        if (value.isNotEmpty())
            environment.set(name, value);
    }

    return environment;
}

//==============================================================================
void BuildConfig::applyOption(const juce::String& optionName, const juce::String& value)
{
    const juce::String& n = optionName;

    if (n == "duration")                 duration = parseDouble(n, value);
    else if (n == "quotes-duration")     quotesDuration = parseDouble(n, value);
    else if (n == "quotes-min-between")  quotesMinBetween = parseDouble(n, value);
    else if (n == "quotes-max-between")  quotesMaxBetween = parseDouble(n, value);
    else if (n == "music-shuffle")       musicShuffle = parseBool(n, value);
    else if (n == "video-shuffle")       videoShuffle = parseBool(n, value);
    else if (n == "quotes-shuffle")      quotesShuffle = parseBool(n, value);
    else if (n == "output")              outputFile = baseDirectory.getChildFile(value.trim());
    else if (n == "fps")                 fps = static_cast<int>(parseInteger(n, value));
    else if (n == "music-volume")        musicVolume = parseDouble(n, value);
    else if (n == "sounds-volume")       soundsVolume = parseDouble(n, value);
    else if (n == "videos-dir")          videosDir = baseDirectory.getChildFile(value.trim());
    else if (n == "music-dir")           musicDir = baseDirectory.getChildFile(value.trim());
    else if (n == "sounds-dir")          soundsDir = baseDirectory.getChildFile(value.trim());
    else if (n == "quotes-dir")          quotesDir = baseDirectory.getChildFile(value.trim());
    else if (n == "work-dir")            workDir = baseDirectory.getChildFile(value.trim());
    else if (n == "font-file")           fontFile = value.trim().isEmpty() ? juce::File() : baseDirectory.getChildFile(value.trim());
    else if (n == "encoding-params")     videoEncodingParams = value.trim();
    else if (n == "ffmpeg")              ffmpegPath = value.trim();
    else if (n == "ffprobe")             ffprobePath = value.trim();
    else if (n == "seed")                seed = parseInteger(n, value);
    else if (n == "verbose")             verbose = parseBool(n, value);
    else if (n == "dry-run")             dryRun = parseBool(n, value);
    else if (n == "resolution")
    {
        const juce::String text = value.trim().toLowerCase();
        const juce::String w = text.upToFirstOccurrenceOf("x", false, false);
        const juce::String h = text.fromFirstOccurrenceOf("x", false, false);

        if (!text.containsChar('x') || w.isEmpty() || h.isEmpty())
            throw ValidationError("--resolution expects WIDTHxHEIGHT, got: '" + value + "'");

        width = static_cast<int>(parseInteger(n, w));
        height = static_cast<int>(parseInteger(n, h));
    }
    else if (n == "transition")
    {
        if (!TimelineTypes::parseTransition(value, transition))
            throw ValidationError("--transition must be one of none, fade, crossfade; got: '" + value + "'");
    }
    else if (n == "quote-style")
    {
        if (!TimelineTypes::parseQuoteStyle(value, quoteStyle))
            throw ValidationError("--quote-style must be one of minimal, centered, top, bottom; got: '" + value + "'");
    }
    else
    {
        throw ValidationError("Unknown option: " + describeOption(n));
    }
}

//==============================================================================
void BuildConfig::applySettings(const juce::ValueTree& settings)
{
    for (const auto& option : knownOptions)
        if (settings.hasProperty(option.property))
            applyOption(option.name, settings.getProperty(option.property).toString());
}

void BuildConfig::applySettingsFile(const juce::File& settingsFile)
{
    if (!settingsFile.existsAsFile())
        throw ValidationError("Settings file does not exist: " + settingsFile.getFullPathName());

    const juce::ValueTree settings = juce::ValueTree::fromXml(settingsFile.loadFileAsString());

    if (!settings.isValid() || !settings.hasType("LoopReelSettings"))
        throw ValidationError("Not a LoopReelSettings file: " + settingsFile.getFullPathName());

    applySettings(settings);
}

void BuildConfig::applyEnvironment(const juce::StringPairArray& environment)
{
    for (const auto& option : knownOptions)
    {
        const juce::String name = environmentNameFor(option.name);
        if (environment.getAllKeys().contains(name))
            applyOption(option.name, environment[name]);
    }
}

void BuildConfig::applyArguments(const juce::ArgumentList& args)
{
    for (const auto& option : knownOptions)
    {
        juce::String pattern = describeOption(option.name);
        if (juce::String(option.name) == "output")
            pattern = "-o|--output";
        else if (juce::String(option.name) == "verbose")
            pattern = "-v|--verbose";

        if (const auto value = findOptionValue(args, pattern, option.isFlag))
            applyOption(option.name, *value);
    }
}

//==============================================================================
juce::ValueTree BuildConfig::toValueTree() const
{
    juce::ValueTree settings("LoopReelSettings");

    settings.setProperty("duration", duration, nullptr);
    settings.setProperty("quotesDuration", quotesDuration, nullptr);
    settings.setProperty("quotesMinBetween", quotesMinBetween, nullptr);
    settings.setProperty("quotesMaxBetween", quotesMaxBetween, nullptr);
    settings.setProperty("musicShuffle", musicShuffle, nullptr);
    settings.setProperty("videoShuffle", shouldShuffleVideo(), nullptr);
    settings.setProperty("quotesShuffle", quotesShuffle, nullptr);
    settings.setProperty("output", outputFile.getFullPathName(), nullptr);
    settings.setProperty("fps", fps, nullptr);
    settings.setProperty("resolution", getResolutionString(), nullptr);
    settings.setProperty("transition", TimelineTypes::transitionName(transition), nullptr);
    settings.setProperty("musicVolume", musicVolume, nullptr);
    settings.setProperty("soundsVolume", soundsVolume, nullptr);
    settings.setProperty("quoteStyle", TimelineTypes::quoteStyleName(quoteStyle), nullptr);
    settings.setProperty("videosDir", videosDir.getFullPathName(), nullptr);
    settings.setProperty("musicDir", musicDir.getFullPathName(), nullptr);
    settings.setProperty("soundsDir", soundsDir.getFullPathName(), nullptr);
    settings.setProperty("quotesDir", quotesDir.getFullPathName(), nullptr);
    settings.setProperty("workDir", workDir.getFullPathName(), nullptr);

    if (fontFile != juce::File())
        settings.setProperty("fontFile", fontFile.getFullPathName(), nullptr);
    if (videoEncodingParams.isNotEmpty())
        settings.setProperty("encodingParams", videoEncodingParams, nullptr);
    if (ffmpegPath.isNotEmpty())
        settings.setProperty("ffmpegPath", ffmpegPath, nullptr);
    if (ffprobePath.isNotEmpty())
        settings.setProperty("ffprobePath", ffprobePath, nullptr);
    if (seed.has_value())
        settings.setProperty("seed", *seed, nullptr);

    settings.setProperty("verbose", verbose, nullptr);
    settings.setProperty("dryRun", dryRun, nullptr);
    return settings;
}

//==============================================================================
void BuildConfig::validate() const
{
    if (!std::isfinite(duration) || duration <= 0.0)
        throw ValidationError("Duration must be positive, got: " + juce::String(duration));

    if (duration > TimelineTypes::kMaxDurationSeconds)
        throw ValidationError("Duration must be at most " + juce::String(TimelineTypes::kMaxDurationSeconds)
                              + " seconds, got: " + juce::String(duration));

    if (!std::isfinite(quotesDuration) || quotesDuration <= 0.0)
        throw ValidationError("Quote duration must be positive, got: " + juce::String(quotesDuration));

    if (!std::isfinite(quotesMinBetween) || !std::isfinite(quotesMaxBetween))
        throw ValidationError("Quote gaps must be finite numbers");

    if (quotesMinBetween < 0.0)
        throw ValidationError("Quotes min between must be non-negative, got: " + juce::String(quotesMinBetween));

    if (quotesMaxBetween < quotesMinBetween)
        throw ValidationError("Quotes max between (" + juce::String(quotesMaxBetween)
                              + ") must be >= quotes min between (" + juce::String(quotesMinBetween) + ")");

    if (musicVolume < 0.0 || musicVolume > 1.0)
        throw ValidationError("Music volume must be between 0.0 and 1.0, got: " + juce::String(musicVolume));

    if (soundsVolume < 0.0 || soundsVolume > 1.0)
        throw ValidationError("Sounds volume must be between 0.0 and 1.0, got: " + juce::String(soundsVolume));

    if (fps <= 0)
        throw ValidationError("FPS must be positive, got: " + juce::String(fps));

    if (width <= 0 || height <= 0)
        throw ValidationError("Resolution must have positive dimensions, got: " + getResolutionString());

    if (!videosDir.isDirectory())
        throw ValidationError("Videos directory does not exist: " + videosDir.getFullPathName());
}
