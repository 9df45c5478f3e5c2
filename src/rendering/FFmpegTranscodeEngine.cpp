#include "FFmpegTranscodeEngine.h"
#include "TimelineErrors.h"
#include "TimelineTypes.h"

namespace
{
    const juce::StringArray mp3Codec { "-c:a", "libmp3lame", "-b:a", "192k" };

    juce::String escapeConcatPath(const juce::String& path)
    {
        // The concat demuxer reads single-quoted paths; a quote is closed, escaped and reopened
        return path.replace("'", "'\\''");
    }
}

FFmpegTranscodeEngine::FFmpegTranscodeEngine(FFmpegExecutor& executor, const juce::File& workDirectory)
    : executor(executor),
      workDirectory(workDirectory)
{
    setEncodingParams({});
}

FFmpegTranscodeEngine::~FFmpegTranscodeEngine()
{
}

void FFmpegTranscodeEngine::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

void FFmpegTranscodeEngine::setEncodingParams(const juce::String& videoParams)
{
    videoCodecArgs = tokenizeParams(videoParams.trim().isEmpty() ? juce::String(defaultVideoEncodingParams)
                                                                   : videoParams);
}

//==============================================================================
juce::File FFmpegTranscodeEngine::nextWorkFile(const juce::String& label, const juce::String& extension)
{
    ++fileCounter;
    return workDirectory.getChildFile(juce::String::formatted("step_%04d_", fileCounter) + label + extension);
}

juce::File FFmpegTranscodeEngine::run(const juce::StringArray& arguments,
                                      const juce::String& description,
                                      const juce::File& output)
{
    executor.executeCommand(arguments, description);

    if (!output.existsAsFile() || output.getSize() == 0)
        throw EngineError(description + ": no output written to " + output.getFullPathName(), 0, {});

    return output;
}

//==============================================================================
double FFmpegTranscodeEngine::probeDuration(const juce::File& file)
{
    return executor.getFileDuration(file);
}

juce::File FFmpegTranscodeEngine::scaleAndPad(const juce::File& file, int width, int height, int fps)
{
    if (logCallback)
        logCallback("Normalizing video: " + file.getFileName());

    const juce::File output = nextWorkFile("normalized", ".mp4");
    return run(buildScaleAndPadArgs(executor.getFFmpegPath(), file, width, height, fps, videoCodecArgs, output),
               "normalize " + file.getFileName(), output);
}

juce::File FFmpegTranscodeEngine::concat(const std::vector<juce::File>& files, bool reencode)
{
    const juce::File listFile = nextWorkFile("concat", ".txt");
    if (!listFile.replaceWithText(buildConcatList(files)))
        throw EngineError("Could not write concat list " + listFile.getFullPathName(), -1, {});

    const juce::File output = nextWorkFile("concat", ".mp4");
    return run(buildConcatArgs(executor.getFFmpegPath(), listFile, reencode, videoCodecArgs, output),
               "concatenate " + juce::String(files.size()) + " segments", output);
}

juce::File FFmpegTranscodeEngine::normalizeAudio(const juce::File& file)
{
    const juce::File output = nextWorkFile("audio", ".mp3");

    juce::StringArray args { executor.getFFmpegPath(), "-y", "-i", file.getFullPathName() };
    args.addArray(mp3Codec);
    args.add(output.getFullPathName());

    return run(args, "normalize audio " + file.getFileName(), output);
}

juce::File FFmpegTranscodeEngine::concatAudio(const std::vector<juce::File>& files)
{
    const juce::File listFile = nextWorkFile("audio_concat", ".txt");
    if (!listFile.replaceWithText(buildConcatList(files)))
        throw EngineError("Could not write concat list " + listFile.getFullPathName(), -1, {});

    const juce::File output = nextWorkFile("audio_concat", ".mp3");

    juce::StringArray args { executor.getFFmpegPath(), "-y", "-f", "concat", "-safe", "0",
                             "-i", listFile.getFullPathName() };
    args.addArray(mp3Codec);
    args.add(output.getFullPathName());

    return run(args, "concatenate " + juce::String(files.size()) + " audio files", output);
}

juce::File FFmpegTranscodeEngine::loopToDuration(const juce::File& file, double seconds)
{
    const juce::File output = nextWorkFile("looped", ".mp3");

    return run(buildLoopArgs(executor.getFFmpegPath(), file, seconds, output),
               "loop " + file.getFileName() + " to " + formatSeconds(seconds) + "s", output);
}

juce::File FFmpegTranscodeEngine::applyAudioFilter(const juce::File& file, const juce::String& filterExpression)
{
    const juce::File output = nextWorkFile("filtered", ".mp3");

    juce::StringArray args { executor.getFFmpegPath(), "-y", "-i", file.getFullPathName(),
                             "-filter:a", filterExpression };
    args.addArray(mp3Codec);
    args.add(output.getFullPathName());

    return run(args, "audio filter " + filterExpression, output);
}

juce::File FFmpegTranscodeEngine::mixTracks(const std::vector<juce::File>& files, int referenceIndex)
{
    const juce::File output = nextWorkFile("mix", ".mp3");
    return run(buildMixArgs(executor.getFFmpegPath(), files, referenceIndex, output),
               "mix " + juce::String(files.size()) + " audio tracks", output);
}

juce::File FFmpegTranscodeEngine::trim(const juce::File& file, double seconds)
{
    const juce::File output = nextWorkFile("trimmed", ".mp4");

    const juce::StringArray args { executor.getFFmpegPath(), "-y", "-i", file.getFullPathName(),
                                   "-t", formatSeconds(seconds), "-c", "copy", output.getFullPathName() };

    return run(args, "trim to " + formatSeconds(seconds) + "s", output);
}

juce::File FFmpegTranscodeEngine::renderOverlayAndMux(const juce::File& video,
                                                      const std::optional<juce::File>& audio,
                                                      const juce::String& videoFilter,
                                                      const juce::File& outputFile)
{
    if (!outputFile.getParentDirectory().createDirectory().wasOk())
        throw EngineError("Could not create output directory for " + outputFile.getFullPathName(), -1, {});

    return run(buildMuxArgs(executor.getFFmpegPath(), video, audio, videoFilter, videoCodecArgs, outputFile),
               "final render", outputFile);
}

//==============================================================================
juce::StringArray FFmpegTranscodeEngine::tokenizeParams(const juce::String& params)
{
    juce::StringArray tokens;
    tokens.addTokens(params, " ", "\"'");
    tokens.trim();
    tokens.removeEmptyStrings();

    for (auto& token : tokens)
        token = token.unquoted();

    return tokens;
}

juce::String FFmpegTranscodeEngine::buildConcatList(const std::vector<juce::File>& files)
{
    juce::String list;
    for (const auto& file : files)
        list << "file '" << escapeConcatPath(file.getFullPathName()) << "'\n";
    return list;
}

juce::String FFmpegTranscodeEngine::formatSeconds(double seconds)
{
    return juce::String(seconds, 3);
}

juce::StringArray FFmpegTranscodeEngine::buildScaleAndPadArgs(const juce::String& ffmpeg, const juce::File& input,
                                                              int width, int height, int fps,
                                                              const juce::StringArray& videoCodec,
                                                              const juce::File& output)
{
    const juce::String w(width), h(height);
    const juce::String filter = "scale=" + w + ":" + h + ":force_original_aspect_ratio=decrease,"
                              + "pad=" + w + ":" + h + ":(ow-iw)/2:(oh-ih)/2";

    juce::StringArray args { ffmpeg, "-y", "-i", input.getFullPathName(),
                             "-vf", filter, "-r", juce::String(fps) };
    args.addArray(videoCodec);
    args.add("-an");
    args.add(output.getFullPathName());
    return args;
}

juce::StringArray FFmpegTranscodeEngine::buildConcatArgs(const juce::String& ffmpeg, const juce::File& listFile,
                                                         bool reencode, const juce::StringArray& videoCodec,
                                                         const juce::File& output)
{
    juce::StringArray args { ffmpeg, "-y", "-f", "concat", "-safe", "0", "-i", listFile.getFullPathName() };

    if (reencode)
        args.addArray(videoCodec);
    else
        args.addArray(juce::StringArray { "-c", "copy" });

    args.add(output.getFullPathName());
    return args;
}

juce::StringArray FFmpegTranscodeEngine::buildLoopArgs(const juce::String& ffmpeg, const juce::File& input,
                                                       double seconds, const juce::File& output)
{
    juce::StringArray args { ffmpeg, "-y", "-stream_loop", "-1", "-i", input.getFullPathName(),
                             "-t", formatSeconds(seconds) };
    args.addArray(mp3Codec);
    args.add(output.getFullPathName());
    return args;
}

juce::StringArray FFmpegTranscodeEngine::buildMixArgs(const juce::String& ffmpeg, const std::vector<juce::File>& inputs,
                                                      int referenceIndex, const juce::File& output)
{
    // amix follows the duration of its first input, so the reference track goes first
    std::vector<juce::File> ordered;
    if (juce::isPositiveAndBelow(referenceIndex, static_cast<int>(inputs.size())))
        ordered.push_back(inputs[static_cast<size_t>(referenceIndex)]);

    for (size_t i = 0; i < inputs.size(); ++i)
        if (static_cast<int>(i) != referenceIndex)
            ordered.push_back(inputs[i]);

    juce::StringArray args { ffmpeg, "-y" };
    juce::String filterInputs;

    for (size_t i = 0; i < ordered.size(); ++i)
    {
        args.add("-i");
        args.add(ordered[i].getFullPathName());
        filterInputs << "[" << juce::String(static_cast<int>(i)) << ":a]";
    }

    args.add("-filter_complex");
    args.add(filterInputs + "amix=inputs=" + juce::String(static_cast<int>(ordered.size()))
             + ":duration=first:dropout_transition=" + juce::String(static_cast<int>(TimelineTypes::kMixDropoutSeconds))
             + "[aout]");
    args.add("-map");
    args.add("[aout]");
    args.addArray(mp3Codec);
    args.add(output.getFullPathName());
    return args;
}

juce::StringArray FFmpegTranscodeEngine::buildMuxArgs(const juce::String& ffmpeg, const juce::File& video,
                                                      const std::optional<juce::File>& audio,
                                                      const juce::String& videoFilter,
                                                      const juce::StringArray& videoCodec,
                                                      const juce::File& output)
{
    juce::StringArray args { ffmpeg, "-y", "-i", video.getFullPathName() };

    if (audio.has_value())
    {
        args.add("-i");
        args.add(audio->getFullPathName());
    }

    if (videoFilter.isNotEmpty())
    {
        args.add("-vf");
        args.add(videoFilter);
    }

    args.add("-map");
    args.add("0:v");

    if (audio.has_value())
    {
        args.add("-map");
        args.add("1:a");
    }

    args.addArray(videoCodec);
    args.addArray(juce::StringArray { "-pix_fmt", "yuv420p" });

    if (audio.has_value())
        args.addArray(juce::StringArray { "-c:a", "aac", "-b:a", "192k" });

    args.add("-shortest");
    args.add(output.getFullPathName());
    return args;
}
