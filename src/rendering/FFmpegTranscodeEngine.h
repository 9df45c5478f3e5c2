#pragma once
#include <juce_core/juce_core.h>
#include "TranscodeEngine.h"
#include "FFmpegExecutor.h"

/**
 * TranscodeEngine backed by the ffmpeg and ffprobe executables.
 *
 * Every operation writes a fresh numbered file into the work directory and
 * returns it. The argument lists are built by the static build* helpers so
 * they can be inspected without running anything.
 */
class FFmpegTranscodeEngine : public TranscodeEngine
{
public:
    /** Default video codec settings for intermediate and final encodes */
    static constexpr const char* defaultVideoEncodingParams = "-c:v libx264 -preset medium -crf 23";

    /**
     * Creates an engine.
     * @param executor      Runs the commands; must outlive this engine
     * @param workDirectory Where intermediate files are written
     */
    FFmpegTranscodeEngine(FFmpegExecutor& executor, const juce::File& workDirectory);
    ~FFmpegTranscodeEngine() override;

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /** Changes the directory the following operations write into. */
    void setWorkDirectory(const juce::File& directory) { workDirectory = directory; }

    /**
     * Sets the video codec arguments, e.g. "-c:v libx264 -preset medium -crf 23".
     * An empty string restores the default.
     */
    void setEncodingParams(const juce::String& videoParams);

    double probeDuration(const juce::File& file) override;
    juce::File scaleAndPad(const juce::File& file, int width, int height, int fps) override;
    juce::File concat(const std::vector<juce::File>& files, bool reencode) override;
    juce::File normalizeAudio(const juce::File& file) override;
    juce::File concatAudio(const std::vector<juce::File>& files) override;
    juce::File loopToDuration(const juce::File& file, double seconds) override;
    juce::File applyAudioFilter(const juce::File& file, const juce::String& filterExpression) override;
    juce::File mixTracks(const std::vector<juce::File>& files, int referenceIndex) override;
    juce::File trim(const juce::File& file, double seconds) override;
    juce::File renderOverlayAndMux(const juce::File& video,
                                   const std::optional<juce::File>& audio,
                                   const juce::String& videoFilter,
                                   const juce::File& outputFile) override;

    //==========================================================================
    // Command construction

    /** Splits an encoding parameter string into arguments, honouring quotes. */
    static juce::StringArray tokenizeParams(const juce::String& params);

    /** Contents of an ffmpeg concat demuxer list for the given files. */
    static juce::String buildConcatList(const std::vector<juce::File>& files);

    static juce::StringArray buildScaleAndPadArgs(const juce::String& ffmpeg, const juce::File& input,
                                                  int width, int height, int fps,
                                                  const juce::StringArray& videoCodec,
                                                  const juce::File& output);

    static juce::StringArray buildConcatArgs(const juce::String& ffmpeg, const juce::File& listFile,
                                             bool reencode, const juce::StringArray& videoCodec,
                                             const juce::File& output);

    static juce::StringArray buildLoopArgs(const juce::String& ffmpeg, const juce::File& input,
                                           double seconds, const juce::File& output);

    static juce::StringArray buildMixArgs(const juce::String& ffmpeg, const std::vector<juce::File>& inputs,
                                          int referenceIndex, const juce::File& output);

    static juce::StringArray buildMuxArgs(const juce::String& ffmpeg, const juce::File& video,
                                          const std::optional<juce::File>& audio,
                                          const juce::String& videoFilter,
                                          const juce::StringArray& videoCodec,
                                          const juce::File& output);

    /** Formats seconds the way every duration is passed to ffmpeg. */
    static juce::String formatSeconds(double seconds);

private:
    juce::File nextWorkFile(const juce::String& label, const juce::String& extension);
    juce::File run(const juce::StringArray& arguments, const juce::String& description, const juce::File& output);

    FFmpegExecutor& executor;
    juce::File workDirectory;
    juce::StringArray videoCodecArgs;
    int fileCounter = 0;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FFmpegTranscodeEngine)
};
