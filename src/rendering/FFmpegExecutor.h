#pragma once
#include <juce_core/juce_core.h>
#include <atomic>
#include <functional>

//==============================================================================
/**
 * @file FFmpegExecutor.h
 *
 * This file declares the FFmpegExecutor class which is responsible for running
 * FFmpeg and FFprobe as child processes and monitoring their execution.
 *
 * The class handles:
 * - Command execution with output capture and per-command session logs
 * - Progress tracking and reporting via callbacks
 * - Mapping non-zero exits to EngineError with a diagnostic tail
 * - Querying file durations via FFprobe
 */

//==============================================================================
/**
 * The FFmpegExecutor class handles all interaction with FFmpeg as an external process.
 *
 * @note This class doesn't build any media commands itself - it only runs
 *       them and reports results. FFmpegTranscodeEngine decides what to run.
 */
class FFmpegExecutor
{
public:
    /** Captured result of a finished process */
    struct CommandResult
    {
        int exitCode = 0;
        juce::String output;
        juce::String diagnosticTail;
    };

    /** Number of output lines kept for error diagnostics */
    static constexpr int diagnosticTailLines = 50;

    FFmpegExecutor();

    /**
     * Destructor - ensures any running process is killed.
     */
    ~FFmpegExecutor();

    /**
     * Sets a callback function that will be called with progress updates.
     *
     * The callback receives a value between 0.0-1.0, computed from FFmpeg's
     * time= output against the duration set with setExpectedDuration().
     */
    void setProgressCallback(std::function<void(double)> callback);

    /**
     * Sets a callback function that will be called with log messages.
     */
    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /** When enabled every command line is echoed to the log callback. */
    void setVerbose(bool shouldEchoCommands) { verbose = shouldEchoCommands; }

    /**
     * Sets the media duration the next commands are expected to produce.
     * Used only to turn FFmpeg's time= output into a progress fraction.
     */
    void setExpectedDuration(double seconds) { expectedDuration = seconds; }

    /**
     * Sets the directory where FFmpeg command output should be recorded.
     * A per-command log file plus an aggregate log will be created in this directory.
     */
    void setSessionLogDirectory(const juce::File& directory);

    /**
     * Executes a command as a child process, capturing its output.
     *
     * @param arguments   The executable followed by its arguments
     * @param description Short label used in logs and error messages
     * @throws EngineError if the process cannot start, is cancelled or exits non-zero
     */
    CommandResult executeCommand(const juce::StringArray& arguments, const juce::String& description);

    /**
     * Executes a command and returns its result without throwing on a
     * non-zero exit. Used for queries such as FFprobe.
     */
    CommandResult executeCommandAndGetOutput(const juce::StringArray& arguments);

    /**
     * Cancels the currently running process.
     *
     * This will set the cancellation flag and kill the process if it's running.
     * The flag stays set, so every later command fails without starting until
     * resetCancellation() is called.
     */
    void cancelExecution();

    /** Clears a previous cancellation. Called once at the start of a run. */
    void resetCancellation();

    /** Gets the path to the FFmpeg executable (next to this binary, else PATH). */
    juce::String getFFmpegPath() const;

    /** Gets the path to the FFprobe executable (next to this binary, else PATH). */
    juce::String getFFprobePath() const;

    /** Overrides executable lookup, e.g. from configuration. Empty strings keep the default. */
    void setExecutablePaths(const juce::String& ffmpeg, const juce::String& ffprobe);

    /**
     * Checks if FFmpeg and FFprobe are available on the system.
     */
    bool checkFFmpegAvailability();

    /**
     * Gets the duration of a media file in seconds using FFprobe.
     *
     * @throws ProbeError if the file is missing, unreadable or not decodable
     */
    double getFileDuration(const juce::File& file);

    /**
     * Parses an FFmpeg status line to extract the processed media time.
     *
     * @param line The FFmpeg output line to parse
     * @return     Seconds processed so far, or -1.0 if no progress info found
     */
    static double parseFFmpegProgress(const juce::String& line);

    /** Returns the last maxLines lines of a process output. */
    static juce::String extractTail(const juce::String& output, int maxLines);

private:
    juce::File getNextCommandLogFile(int& outIndex);
    void writeToAggregateLog(const juce::String& message);
    void reportProgress(const juce::String& chunk);
    void releaseActiveProcess();

    /** Guards activeProcess against cancelExecution() from another thread */
    juce::CriticalSection processLock;

    /** The active child process being monitored */
    std::unique_ptr<juce::ChildProcess> activeProcess;

    /** Flag to indicate if the current process should be cancelled */
    std::atomic<bool> shouldCancel { false };

    std::function<void(double)> progressCallback;
    std::function<void(const juce::String&)> logCallback;

    bool verbose = false;
    double expectedDuration = 0.0;
    double lastReportedFraction = -1.0;

    juce::String ffmpegOverride;
    juce::String ffprobeOverride;

    //==========================================================================
    // Logging helpers
    juce::CriticalSection logDirectoryLock;
    juce::File sessionLogDirectory;
    juce::File sessionAggregateLogFile;
    bool sessionLoggingEnabled { false };
    int sessionCommandIndex { 0 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FFmpegExecutor)
};
