#pragma once
#include <juce_core/juce_core.h>
#include "../core/BuildConfig.h"
#include "TranscodeEngine.h"
#include "FFmpegExecutor.h"
#include "FFmpegTranscodeEngine.h"

/**
 * Runs one complete build.
 *
 * Validates the configuration, checks disk space, opens a logging session,
 * drives the four TimelineAssembler steps and cleans up the work directory.
 * Every TimelineError ends the run; it is logged and returned as a failed
 * juce::Result rather than thrown.
 */
class RenderSession
{
public:
    /**
     * Creates a session.
     * @param config The build configuration
     * @param engine Engine to use instead of FFmpeg, or nullptr for FFmpeg.
     *               Must outlive the session.
     */
    explicit RenderSession(const BuildConfig& config, TranscodeEngine* engine = nullptr);
    ~RenderSession();

    /**
     * Sets a callback that receives every log line, in addition to
     * juce::Logger and the session's render.log.
     */
    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Sets the directory session folders are created in. Without one the
     * session writes no render.log or FFmpeg command logs.
     */
    void setLogsDirectory(const juce::File& directory) { logsDirectory = directory; }

    /** Performs the build. */
    juce::Result run();

    /** The render_<timestamp> folder of the last run, if one was created. */
    juce::File getSessionDirectory() const { return sessionDirectory; }

    /**
     * The run_ folder inside the work directory that held the last run's
     * intermediate files. It only still exists after a verbose run.
     */
    juce::File getRunDirectory() const { return runDirectory; }

private:
    void build();
    void initialiseLoggingSession();
    void teardownLoggingSession();
    void createWorkDirectory();
    void cleanup();
    void logFailure(const std::exception& error);
    void log(const juce::String& message);
    juce::String getElapsedTimeString() const;

    BuildConfig config;
    TranscodeEngine* externalEngine = nullptr;
    std::unique_ptr<FFmpegExecutor> ffmpegExecutor;
    std::unique_ptr<FFmpegTranscodeEngine> ffmpegEngine;

    juce::File runDirectory;
    bool createdWorkDirectory = false;
    bool createdRunDirectory = false;

    juce::File logsDirectory;
    juce::File sessionDirectory;
    juce::File ffmpegLogDirectory;
    std::unique_ptr<juce::FileOutputStream> renderLogStream;
    juce::CriticalSection logWriteLock;

    juce::Time startTime;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RenderSession)
};
