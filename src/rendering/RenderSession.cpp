#include "RenderSession.h"
#include "TimelineAssembler.h"
#include "TimelineErrors.h"
#include "../core/MediaLibrary.h"

RenderSession::RenderSession(const BuildConfig& config, TranscodeEngine* engine)
    : config(config),
      externalEngine(engine)
{
}

RenderSession::~RenderSession()
{
    teardownLoggingSession();
}

void RenderSession::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

//==============================================================================
void RenderSession::initialiseLoggingSession()
{
    teardownLoggingSession();

    if (logsDirectory == juce::File())
        return;

    const juce::String timestamp = juce::Time::getCurrentTime().formatted("%Y%m%d_%H%M%S");
    sessionDirectory = logsDirectory.getChildFile("render_" + timestamp).getNonexistentSibling(false);

    if (!sessionDirectory.createDirectory().wasOk())
    {
        sessionDirectory = juce::File();
        return;
    }

    ffmpegLogDirectory = sessionDirectory.getChildFile("ffmpeg");
    ffmpegLogDirectory.createDirectory();

    if (ffmpegExecutor)
        ffmpegExecutor->setSessionLogDirectory(ffmpegLogDirectory);

    const juce::File renderLogFile = sessionDirectory.getChildFile("render.log");
    renderLogStream = std::make_unique<juce::FileOutputStream>(renderLogFile);

    if (renderLogStream->openedOk())
    {
        renderLogStream->writeText("Render session started at " + juce::Time::getCurrentTime().toString(true, true) + "\n",
                                   false, false, nullptr);
        renderLogStream->flush();
    }
    else
    {
        renderLogStream.reset();
    }
}

void RenderSession::teardownLoggingSession()
{
    {
        juce::ScopedLock lock(logWriteLock);
        if (renderLogStream && renderLogStream->openedOk())
            renderLogStream->flush();
        renderLogStream.reset();
    }

    if (ffmpegExecutor)
        ffmpegExecutor->setSessionLogDirectory(juce::File());

    ffmpegLogDirectory = juce::File();
}

void RenderSession::log(const juce::String& message)
{
    juce::Logger::writeToLog("[RENDER] " + message);

    {
        juce::ScopedLock lock(logWriteLock);
        if (renderLogStream && renderLogStream->openedOk())
        {
            renderLogStream->writeText(juce::Time::getCurrentTime().toString(true, true) + ": " + message + "\n",
                                       false, false, nullptr);
            renderLogStream->flush();
        }
    }

    if (logCallback)
        logCallback(message);
}

juce::String RenderSession::getElapsedTimeString() const
{
    const juce::RelativeTime elapsed = juce::Time::getCurrentTime() - startTime;
    return elapsed.getDescription();
}

//==============================================================================
juce::Result RenderSession::run()
{
    startTime = juce::Time::getCurrentTime();
    runDirectory = juce::File();
    createdWorkDirectory = false;
    createdRunDirectory = false;

    if (externalEngine == nullptr && ffmpegExecutor == nullptr)
    {
        ffmpegExecutor = std::make_unique<FFmpegExecutor>();
        ffmpegExecutor->setExecutablePaths(config.ffmpegPath, config.ffprobePath);
        ffmpegEngine = std::make_unique<FFmpegTranscodeEngine>(*ffmpegExecutor, config.workDir);
        ffmpegEngine->setEncodingParams(config.videoEncodingParams);
    }

    initialiseLoggingSession();

    auto logFunction = [this](const juce::String& message) { log(message); };

    if (ffmpegExecutor)
    {
        ffmpegExecutor->resetCancellation();
        ffmpegExecutor->setLogCallback(logFunction);
        ffmpegExecutor->setVerbose(config.verbose);
        ffmpegExecutor->setExpectedDuration(config.duration);

        if (config.verbose)
            ffmpegExecutor->setProgressCallback([this](double fraction)
            {
                log("  Progress: " + juce::String(juce::roundToInt(fraction * 100.0)) + "%");
            });
    }

    if (ffmpegEngine)
        ffmpegEngine->setLogCallback(logFunction);

    log("=== LOOPREEL BUILD ===");
    if (sessionDirectory.isDirectory())
        log("Log directory: " + sessionDirectory.getFullPathName());

    juce::Result result = juce::Result::ok();

    try
    {
        build();
        log("Build completed in " + getElapsedTimeString());
    }
    catch (const TimelineError& e)
    {
        logFailure(e);
        result = juce::Result::fail(e.getMessage());
    }
    catch (const std::exception& e)
    {
        logFailure(e);
        result = juce::Result::fail(juce::String("Unexpected error: ") + e.what());
    }

    cleanup();
    teardownLoggingSession();
    return result;
}

void RenderSession::build()
{
    config.validate();

    log("Duration: " + juce::String(config.duration) + " seconds");
    log("Output file: " + config.outputFile.getFullPathName());
    log("Resolution: " + config.getResolutionString() + " @ " + juce::String(config.fps) + " fps");
    log("Transition: " + TimelineTypes::transitionName(config.transition));
    log("Quote style: " + TimelineTypes::quoteStyleName(config.quoteStyle));

    if (config.dryRun)
    {
        log("DRY RUN - effective settings:");
        log(config.toValueTree().toXmlString());
        log("No video will be rendered in dry-run mode.");
        return;
    }

    const juce::int64 estimatedSize = MediaLibrary::estimateOutputSize(config.width, config.height, config.duration);
    log("Estimated output size: " + juce::File::descriptionOfSizeInBytes(estimatedSize));
    MediaLibrary::checkDiskSpace(config.outputFile.getParentDirectory(), estimatedSize);

    createWorkDirectory();

    if (ffmpegExecutor && !ffmpegExecutor->checkFFmpegAvailability())
        throw EngineError("FFmpeg is not available. Install ffmpeg and ffprobe or set their paths", -1, {});

    juce::Random random;
    if (config.seed.has_value())
    {
        random.setSeed(*config.seed);
        log("Random seed: " + juce::String(*config.seed));
    }

    TranscodeEngine& engine = externalEngine != nullptr ? *externalEngine : *ffmpegEngine;

    TimelineAssembler assembler(engine, random, runDirectory);
    assembler.setLogCallback([this](const juce::String& message) { log(message); });

    const juce::File video = assembler.buildVideoTimeline(config.videosDir, config);
    const auto audio = assembler.buildAudioTimeline(config.musicDir, config.soundsDir, config);
    const auto windows = assembler.scheduleQuotes(config.quotesDir, config);

    assembler.finalize(video, audio, windows, config);
}

//==============================================================================
void RenderSession::createWorkDirectory()
{
    // Intermediate files go into a fresh run_ folder so nothing already in
    // the work directory is ever touched by cleanup
    createdWorkDirectory = !config.workDir.exists();

    juce::Result created = config.workDir.createDirectory();
    if (created.failed())
        throw ResourceError("Failed to create work directory " + config.workDir.getFullPathName()
                            + ": " + created.getErrorMessage());

    runDirectory = config.workDir.getNonexistentChildFile("run_", "", false);
    created = runDirectory.createDirectory();
    if (created.failed())
        throw ResourceError("Failed to create work directory " + runDirectory.getFullPathName()
                            + ": " + created.getErrorMessage());

    createdRunDirectory = true;
    log("Work directory: " + runDirectory.getFullPathName());

    if (ffmpegEngine)
        ffmpegEngine->setWorkDirectory(runDirectory);
}

void RenderSession::cleanup()
{
    if (!createdRunDirectory)
        return;

    if (config.verbose)
    {
        log("Keeping work directory: " + runDirectory.getFullPathName());
        return;
    }

    if (!runDirectory.deleteRecursively())
    {
        log("WARNING: Failed to clean up work directory " + runDirectory.getFullPathName());
        return;
    }

    createdRunDirectory = false;

    // Only remove the parent when this session made it and left it empty
    if (createdWorkDirectory && config.workDir.getNumberOfChildFiles(juce::File::findFilesAndDirectories) == 0
        && !config.workDir.deleteFile())
        log("WARNING: Failed to remove work directory " + config.workDir.getFullPathName());
}

void RenderSession::logFailure(const std::exception& error)
{
    log("ERROR: " + juce::String(error.what()));

    if (const auto* engineError = dynamic_cast<const EngineError*>(&error))
    {
        if (engineError->getDiagnosticTail().isNotEmpty())
        {
            log("Engine output (last " + juce::String(FFmpegExecutor::diagnosticTailLines) + " lines):");
            log(engineError->getDiagnosticTail());
        }
    }
    else if (const auto* batchError = dynamic_cast<const BatchError*>(&error))
    {
        log("Files in batch " + juce::String(batchError->getBatchIndex()) + ":");
        log(batchError->describeFiles());
    }

    if (sessionDirectory.isDirectory())
        log("See logs in " + sessionDirectory.getFullPathName());
}
