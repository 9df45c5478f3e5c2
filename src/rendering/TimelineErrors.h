#pragma once
#include <juce_core/juce_core.h>
#include <stdexcept>
#include <vector>

/**
 * Failure taxonomy of the timeline pipeline.
 *
 * Every error is fatal for the run that raised it; nothing in the pipeline
 * retries. RenderSession catches TimelineError at the top of a run and turns
 * it into a logged, failed juce::Result.
 */
class TimelineError : public std::runtime_error
{
public:
    explicit TimelineError(const juce::String& message)
        : std::runtime_error(message.toStdString())
    {
    }

    juce::String getMessage() const { return juce::String::fromUTF8(what()); }
};

/** Invalid configuration values. Raised before any processing starts. */
class ValidationError : public TimelineError
{
public:
    using TimelineError::TimelineError;
};

/** A required category of source material has no usable files. */
class IntegrityError : public TimelineError
{
public:
    using TimelineError::TimelineError;
};

/** Not enough free disk space for the estimated output. */
class ResourceError : public TimelineError
{
public:
    using TimelineError::TimelineError;
};

/** The transcode engine exited with a non-zero status. */
class EngineError : public TimelineError
{
public:
    EngineError(const juce::String& message, int exitCode, const juce::String& diagnosticTail)
        : TimelineError(message + " (exit code " + juce::String(exitCode) + ")"),
          exitCode(exitCode),
          diagnosticTail(diagnosticTail)
    {
    }

    int getExitCode() const { return exitCode; }
    const juce::String& getDiagnosticTail() const { return diagnosticTail; }

private:
    int exitCode;
    juce::String diagnosticTail;
};

/** A file could not be probed for its duration. */
class ProbeError : public EngineError
{
public:
    ProbeError(const juce::File& file, int exitCode, const juce::String& diagnosticTail)
        : EngineError("Failed to probe duration of " + file.getFullPathName(), exitCode, diagnosticTail),
          file(file)
    {
    }

    const juce::File& getFile() const { return file; }

private:
    juce::File file;
};

/** A concat batch is missing one of its inputs, or produced no output. */
class BatchError : public TimelineError
{
public:
    BatchError(const juce::String& message, int batchIndex, const std::vector<juce::File>& batchFiles)
        : TimelineError(message),
          batchIndex(batchIndex),
          batchFiles(batchFiles)
    {
    }

    int getBatchIndex() const { return batchIndex; }
    const std::vector<juce::File>& getBatchFiles() const { return batchFiles; }

    /** One path per line, for diagnostics */
    juce::String describeFiles() const
    {
        juce::StringArray lines;
        for (const auto& file : batchFiles)
            lines.add("  " + file.getFullPathName() + (file.existsAsFile() ? "" : " (missing)"));
        return lines.joinIntoString("\n");
    }

private:
    int batchIndex;
    std::vector<juce::File> batchFiles;
};
