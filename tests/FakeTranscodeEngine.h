#pragma once
#include <juce_core/juce_core.h>
#include <algorithm>
#include <map>
#include <optional>
#include <vector>
#include "rendering/TimelineErrors.h"
#include "rendering/TranscodeEngine.h"

/** Temporary directory removed when it goes out of scope. */
class ScopedTempDirectory
{
public:
    ScopedTempDirectory()
        : directory(juce::File::getSpecialLocation(juce::File::tempDirectory)
                        .getNonexistentChildFile("loopreel_test", "", false))
    {
        directory.createDirectory();
    }

    ~ScopedTempDirectory()
    {
        directory.deleteRecursively();
    }

    const juce::File& get() const { return directory; }

    /** Creates or replaces a file, making parent directories as needed. */
    juce::File createFile(const juce::String& relativePath, const juce::String& content = "data") const
    {
        const juce::File file = directory.getChildFile(relativePath);
        file.getParentDirectory().createDirectory();

        if (content.isEmpty())
        {
            file.deleteFile();
            file.create();
        }
        else
            file.replaceWithText(content);

        return file;
    }

private:
    juce::File directory;
};

/**
 * In-memory TranscodeEngine that records every call.
 *
 * Outputs are real non-empty files in its output directory, and each one is
 * given the duration the real operation would produce, so stages that probe
 * their own intermediate results behave as they would against FFmpeg.
 */
class FakeTranscodeEngine : public TranscodeEngine
{
public:
    struct ConcatCall
    {
        std::vector<juce::File> files;
        bool reencode = false;
    };

    struct MuxCall
    {
        juce::File video;
        std::optional<juce::File> audio;
        juce::String videoFilter;
        juce::File outputFile;
    };

    explicit FakeTranscodeEngine(const juce::File& outputDirectory)
        : outputDirectory(outputDirectory)
    {
        outputDirectory.createDirectory();
    }

    /** Registers the duration probeDuration() reports for a file. */
    void setDuration(const juce::File& file, double seconds)
    {
        durations[file.getFullPathName()] = seconds;
    }

    /** Makes the named operation throw EngineError the next time it runs. */
    void failOn(const juce::String& operation) { failingOperation = operation; }

    /** Makes concat() report a file it never writes. */
    void setConcatWritesNothing(bool shouldWriteNothing) { concatWritesNothing = shouldWriteNothing; }

    int getNumCalls() const { return static_cast<int>(calls.size()); }

    int countCalls(const juce::String& operation) const
    {
        return static_cast<int>(std::count(calls.begin(), calls.end(), operation));
    }

    //==========================================================================
    double probeDuration(const juce::File& file) override
    {
        record("probeDuration");

        const auto found = durations.find(file.getFullPathName());
        if (found == durations.end())
            throw ProbeError(file, 1, "unknown file");

        return found->second;
    }

    juce::File scaleAndPad(const juce::File& file, int width, int height, int fps) override
    {
        record("scaleAndPad");
        lastScale = { width, height, fps };
        scaledSources.push_back(file);
        return produce("normalized", ".mp4", durationOf(file));
    }

    juce::File concat(const std::vector<juce::File>& files, bool reencode) override
    {
        record("concat");
        concatCalls.push_back({ files, reencode });

        if (concatWritesNothing)
            return outputDirectory.getChildFile("never_written.mp4");

        double total = 0.0;
        for (const auto& f : files)
            total += durationOf(f);

        concatOutputs.push_back(produce("concat", ".mp4", total));
        return concatOutputs.back();
    }

    juce::File normalizeAudio(const juce::File& file) override
    {
        record("normalizeAudio");
        return produce("audio", ".mp3", durationOf(file));
    }

    juce::File concatAudio(const std::vector<juce::File>& files) override
    {
        record("concatAudio");
        audioConcatCalls.push_back(files);

        double total = 0.0;
        for (const auto& f : files)
            total += durationOf(f);

        return produce("audio_concat", ".mp3", total);
    }

    juce::File loopToDuration(const juce::File& file, double seconds) override
    {
        record("loopToDuration");
        loopedSources.push_back(file);
        return produce("looped", ".mp3", seconds);
    }

    juce::File applyAudioFilter(const juce::File& file, const juce::String& filterExpression) override
    {
        record("applyAudioFilter");
        audioFilters.add(filterExpression);
        return produce("filtered", ".mp3", durationOf(file));
    }

    juce::File mixTracks(const std::vector<juce::File>& files, int referenceIndex) override
    {
        record("mixTracks");
        mixCalls.push_back(files);
        mixReferenceIndex = referenceIndex;

        const double reference = files.empty() ? 0.0 : durationOf(files[static_cast<size_t>(referenceIndex)]);
        return produce("mix", ".mp3", reference);
    }

    juce::File trim(const juce::File& file, double seconds) override
    {
        record("trim");
        trimCalls.push_back({ file, seconds });
        return produce("trimmed", ".mp4", seconds);
    }

    juce::File renderOverlayAndMux(const juce::File& video,
                                   const std::optional<juce::File>& audio,
                                   const juce::String& videoFilter,
                                   const juce::File& outputFile) override
    {
        record("renderOverlayAndMux");
        muxCalls.push_back({ video, audio, videoFilter, outputFile });

        outputFile.getParentDirectory().createDirectory();
        outputFile.replaceWithText("final");
        setDuration(outputFile, durationOf(video));
        return outputFile;
    }

    //==========================================================================
    struct ScaleCall { int width = 0, height = 0, fps = 0; };

    std::vector<juce::String> calls;
    std::vector<juce::File> scaledSources;
    std::vector<ConcatCall> concatCalls;
    std::vector<juce::File> concatOutputs;
    std::vector<std::vector<juce::File>> audioConcatCalls;
    std::vector<juce::File> loopedSources;
    std::vector<std::vector<juce::File>> mixCalls;
    std::vector<std::pair<juce::File, double>> trimCalls;
    std::vector<MuxCall> muxCalls;
    juce::StringArray audioFilters;
    ScaleCall lastScale;
    int mixReferenceIndex = -1;

private:
    void record(const juce::String& operation)
    {
        calls.push_back(operation);

        if (failingOperation == operation)
        {
            failingOperation.clear();
            throw EngineError(operation + " failed", 1, "fake diagnostic output");
        }
    }

    double durationOf(const juce::File& file) const
    {
        const auto found = durations.find(file.getFullPathName());
        return found != durations.end() ? found->second : 0.0;
    }

    juce::File produce(const juce::String& label, const juce::String& extension, double duration)
    {
        ++counter;
        const juce::File file = outputDirectory.getChildFile(juce::String::formatted("fake_%04d_", counter)
                                                             + label + extension);
        file.replaceWithText(label);
        setDuration(file, duration);
        return file;
    }

    juce::File outputDirectory;
    std::map<juce::String, double> durations;
    juce::String failingOperation;
    bool concatWritesNothing = false;
    int counter = 0;
};
