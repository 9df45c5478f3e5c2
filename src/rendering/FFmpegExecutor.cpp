//==============================================================================
/**
 * @file FFmpegExecutor.cpp
 *
 * Implementation file for the FFmpegExecutor class, which handles running
 * FFmpeg commands as external processes and monitoring their execution.
 *
 * Output is read as UTF-8 in blocking chunks until the process closes its
 * pipe, so neither stdout nor stderr can fill up and stall the child.
 */

#include "FFmpegExecutor.h"
#include "TimelineErrors.h"

namespace
{
    juce::String findExecutable(const juce::String& name)
    {
       #if JUCE_WINDOWS
        const juce::String fileName = name + ".exe";
       #else
        const juce::String fileName = name;
       #endif

        // Look next to our own executable first, then fall back to PATH
        juce::File appDir = juce::File::getSpecialLocation(juce::File::currentExecutableFile).getParentDirectory();
        juce::File local = appDir.getChildFile(fileName);
        if (local.existsAsFile())
            return local.getFullPathName();

        return fileName;
    }

    juce::String describeCommand(const juce::StringArray& arguments)
    {
        juce::StringArray quoted;
        for (const auto& arg : arguments)
            quoted.add(arg.containsAnyOf(" '\"") ? arg.quoted() : arg);
        return quoted.joinIntoString(" ");
    }
}

//==============================================================================
FFmpegExecutor::FFmpegExecutor()
{
}

//==============================================================================
FFmpegExecutor::~FFmpegExecutor()
{
    // Make sure any running process is terminated when this object is destroyed
    cancelExecution();
}

//==============================================================================
void FFmpegExecutor::setProgressCallback(std::function<void(double)> callback)
{
    progressCallback = std::move(callback);
}

void FFmpegExecutor::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

void FFmpegExecutor::setExecutablePaths(const juce::String& ffmpeg, const juce::String& ffprobe)
{
    ffmpegOverride = ffmpeg.trim();
    ffprobeOverride = ffprobe.trim();
}

//==============================================================================
void FFmpegExecutor::setSessionLogDirectory(const juce::File& directory)
{
    juce::ScopedLock sl(logDirectoryLock);

    sessionLoggingEnabled = false;
    sessionLogDirectory = juce::File();
    sessionAggregateLogFile = juce::File();
    sessionCommandIndex = 0;

    if (directory == juce::File())
        return;

    if (!directory.isDirectory() && !directory.createDirectory().wasOk())
        return;

    sessionLogDirectory = directory;
    sessionAggregateLogFile = sessionLogDirectory.getChildFile("ffmpeg.log");
    if (sessionAggregateLogFile.existsAsFile())
        sessionAggregateLogFile.deleteFile();

    sessionLoggingEnabled = true;
}

//==============================================================================
juce::File FFmpegExecutor::getNextCommandLogFile(int& outIndex)
{
    juce::ScopedLock sl(logDirectoryLock);

    if (!sessionLoggingEnabled)
    {
        outIndex = -1;
        return juce::File();
    }

    ++sessionCommandIndex;
    outIndex = sessionCommandIndex;
    return sessionLogDirectory.getChildFile(juce::String::formatted("ffmpeg_%03d.log", sessionCommandIndex));
}

//==============================================================================
void FFmpegExecutor::writeToAggregateLog(const juce::String& message)
{
    juce::ScopedLock sl(logDirectoryLock);

    if (!sessionLoggingEnabled)
        return;

    juce::FileOutputStream stream(sessionAggregateLogFile, 1024);
    if (stream.openedOk())
        stream.writeText(message + "\n", false, false, nullptr);
}

//==============================================================================
void FFmpegExecutor::reportProgress(const juce::String& chunk)
{
    if (!progressCallback || expectedDuration <= 0.0)
        return;

    juce::StringArray lines;
    lines.addLines(chunk.replace("\r", "\n"));

    for (const auto& line : lines)
    {
        const double seconds = parseFFmpegProgress(line);
        if (seconds <= 0.0)
            continue;

        const double fraction = juce::jlimit(0.0, 1.0, seconds / expectedDuration);

        // Report at most every 5%
        if (fraction - lastReportedFraction >= 0.05)
        {
            lastReportedFraction = fraction;
            progressCallback(fraction);
        }
    }
}

//==============================================================================
FFmpegExecutor::CommandResult FFmpegExecutor::executeCommand(const juce::StringArray& arguments,
                                                             const juce::String& description)
{
    const juce::String commandLine = describeCommand(arguments);
    const juce::String startTimeString = juce::Time::getCurrentTime().toString(true, true);

    int commandLogIndex = -1;
    juce::File commandLogFile = getNextCommandLogFile(commandLogIndex);
    std::unique_ptr<juce::FileOutputStream> commandLogStream;
    const juce::String commandIndexLabel = (commandLogIndex > 0)
        ? juce::String::formatted("#%03d", commandLogIndex)
        : juce::String("#---");

    if (commandLogFile != juce::File())
    {
        auto stream = std::make_unique<juce::FileOutputStream>(commandLogFile);
        if (stream->openedOk())
        {
            stream->writeText("Started: " + startTimeString + "\n", false, false, nullptr);
            stream->writeText("Command: " + commandLine + "\n", false, false, nullptr);
            stream->writeText("------------------------------------------------------------\n", false, false, nullptr);
            stream->flush();
            commandLogStream = std::move(stream);
        }
    }

    writeToAggregateLog(commandIndexLabel + " [" + startTimeString + "] START " + commandLine);

    if (verbose && logCallback)
        logCallback("  Running: " + commandLine);

    lastReportedFraction = -1.0;
    bool cancelledBeforeStart = false;
    bool started = false;

    {
        const juce::ScopedLock sl(processLock);

        if (shouldCancel.load())
        {
            cancelledBeforeStart = true;
        }
        else
        {
            activeProcess = std::make_unique<juce::ChildProcess>();
            started = activeProcess->start(arguments, juce::ChildProcess::wantStdOut | juce::ChildProcess::wantStdErr);
            if (!started)
                activeProcess.reset();
        }
    }

    if (cancelledBeforeStart)
    {
        if (commandLogStream)
        {
            commandLogStream->writeText("Cancelled before start\n", false, false, nullptr);
            commandLogStream->flush();
        }
        writeToAggregateLog(commandIndexLabel + " CANCELLED");
        throw EngineError(description + ": cancelled", -1, {});
    }

    if (!started)
    {
        if (commandLogStream)
        {
            commandLogStream->writeText("Failed to start process\n", false, false, nullptr);
            commandLogStream->flush();
        }
        writeToAggregateLog(commandIndexLabel + " START_FAILED");
        throw EngineError(description + ": failed to start " + arguments[0], -1, {});
    }

    CommandResult result;
    juce::MemoryOutputStream captured;
    char buffer[4096];

    for (;;)
    {
        const int bytesRead = activeProcess->readProcessOutput(buffer, static_cast<int>(sizeof(buffer)));
        if (bytesRead <= 0)
            break;

        captured.write(buffer, static_cast<size_t>(bytesRead));

        const juce::String chunk = juce::String::fromUTF8(buffer, bytesRead);
        if (commandLogStream)
            commandLogStream->writeText(chunk.replace("\r", "\n"), false, false, nullptr);

        reportProgress(chunk);
    }

    activeProcess->waitForProcessToFinish(-1);

    if (shouldCancel.load())
    {
        if (commandLogStream)
        {
            commandLogStream->writeText("Cancelled\n", false, false, nullptr);
            commandLogStream->flush();
        }
        writeToAggregateLog(commandIndexLabel + " CANCELLED");
        releaseActiveProcess();
        throw EngineError(description + ": cancelled", -1, {});
    }

    result.exitCode = static_cast<int>(activeProcess->getExitCode());
    result.output = captured.toUTF8();
    result.diagnosticTail = extractTail(result.output, diagnosticTailLines);
    releaseActiveProcess();

    const juce::String finishTimeString = juce::Time::getCurrentTime().toString(true, true);
    if (commandLogStream)
    {
        commandLogStream->writeText("\n------------------------------------------------------------\n", false, false, nullptr);
        commandLogStream->writeText("Finished: " + finishTimeString + "\n", false, false, nullptr);
        commandLogStream->writeText("Exit code: " + juce::String(result.exitCode) + "\n", false, false, nullptr);
        commandLogStream->flush();
    }
    writeToAggregateLog(commandIndexLabel + " [" + finishTimeString + "] END exitCode=" + juce::String(result.exitCode));

    if (result.exitCode != 0)
    {
        if (logCallback)
        {
            logCallback("ERROR: FFmpeg failed during " + description + " (exit code: " + juce::String(result.exitCode) + ")");
            logCallback("  Command: " + commandLine);
        }
        throw EngineError(description + " failed", result.exitCode, result.diagnosticTail);
    }

    if (progressCallback && expectedDuration > 0.0)
        progressCallback(1.0);

    return result;
}

//==============================================================================
void FFmpegExecutor::cancelExecution()
{
    const juce::ScopedLock sl(processLock);
    shouldCancel.store(true);

    if (activeProcess != nullptr && activeProcess->isRunning())
        activeProcess->kill();
}

void FFmpegExecutor::resetCancellation()
{
    const juce::ScopedLock sl(processLock);
    shouldCancel.store(false);
}

void FFmpegExecutor::releaseActiveProcess()
{
    const juce::ScopedLock sl(processLock);
    activeProcess.reset();
}

//==============================================================================
FFmpegExecutor::CommandResult FFmpegExecutor::executeCommandAndGetOutput(const juce::StringArray& arguments)
{
    CommandResult result;
    juce::ChildProcess process;

    if (!process.start(arguments, juce::ChildProcess::wantStdOut | juce::ChildProcess::wantStdErr))
    {
        result.exitCode = -1;
        result.diagnosticTail = "Failed to start " + arguments[0];
        return result;
    }

    result.output = process.readAllProcessOutput();
    process.waitForProcessToFinish(-1);
    result.exitCode = static_cast<int>(process.getExitCode());
    result.diagnosticTail = extractTail(result.output, diagnosticTailLines);
    return result;
}

//==============================================================================
juce::String FFmpegExecutor::getFFmpegPath() const
{
    return ffmpegOverride.isNotEmpty() ? ffmpegOverride : findExecutable("ffmpeg");
}

juce::String FFmpegExecutor::getFFprobePath() const
{
    return ffprobeOverride.isNotEmpty() ? ffprobeOverride : findExecutable("ffprobe");
}

//==============================================================================
bool FFmpegExecutor::checkFFmpegAvailability()
{
    // Run "-version" on both tools; each must exit cleanly
    for (const auto& tool : { getFFmpegPath(), getFFprobePath() })
    {
        const CommandResult result = executeCommandAndGetOutput(juce::StringArray { tool, "-version" });
        if (result.exitCode != 0)
        {
            if (logCallback)
                logCallback("ERROR: " + tool + " is not available");
            return false;
        }
    }

    return true;
}

//==============================================================================
double FFmpegExecutor::getFileDuration(const juce::File& file)
{
    if (!file.existsAsFile())
        throw ProbeError(file, -1, "File does not exist");

    const juce::StringArray arguments {
        getFFprobePath(),
        "-v", "error",
        "-show_entries", "format=duration",
        "-of", "default=noprint_wrappers=1:nokey=1",
        file.getFullPathName()
    };

    const CommandResult result = executeCommandAndGetOutput(arguments);
    if (result.exitCode != 0)
        throw ProbeError(file, result.exitCode, result.diagnosticTail);

    // ffprobe prints the duration alone on the first non-empty line
    juce::StringArray lines;
    lines.addLines(result.output);
    lines.trim();
    lines.removeEmptyStrings();

    const juce::String value = lines.isEmpty() ? juce::String() : lines[0];
    if (!value.containsOnly("0123456789.eE+-") || value.getDoubleValue() <= 0.0)
        throw ProbeError(file, result.exitCode, "Unexpected ffprobe output: " + result.output.trim());

    return value.getDoubleValue();
}

//==============================================================================
double FFmpegExecutor::parseFFmpegProgress(const juce::String& line)
{
    // FFmpeg outputs progress information in lines like:
    // frame=  123 fps= 42 q=29.0 size=    1234kB time=00:00:12.34 bitrate= 123.4kbits/s speed=1.23x
    const int timePos = line.indexOf("time=");
    if (timePos < 0)
        return -1.0;

    const int valueStart = timePos + 5;
    int endPos = line.indexOfChar(valueStart, ' ');
    if (endPos < 0)
        endPos = line.length();

    const juce::String timeStr = line.substring(valueStart, endPos).trim();
    double seconds = 0.0;

    if (timeStr.contains(":"))
    {
        // Format is HH:MM:SS.ms
        juce::StringArray parts;
        parts.addTokens(timeStr, ":", "");

        if (parts.size() < 3)
            return -1.0;

        seconds = parts[0].getDoubleValue() * 3600.0
                + parts[1].getDoubleValue() * 60.0
                + parts[2].getDoubleValue();
    }
    else
    {
        seconds = timeStr.getDoubleValue();
    }

    return seconds > 0.0 ? seconds : -1.0;
}

//==============================================================================
juce::String FFmpegExecutor::extractTail(const juce::String& output, int maxLines)
{
    juce::StringArray lines;
    lines.addLines(output.replace("\r", "\n"));
    lines.removeEmptyStrings();

    if (lines.size() > maxLines)
        lines.removeRange(0, lines.size() - maxLines);

    return lines.joinIntoString("\n");
}
