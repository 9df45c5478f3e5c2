/*
  ==============================================================================
    Main.cpp - Command-line entry point
  ==============================================================================
*/

#include <juce_core/juce_core.h>
#include <iostream>
#include "BuildConfig.h"
#include "../rendering/RenderSession.h"
#include "../rendering/TimelineErrors.h"

#ifndef LOOPREEL_VERSION
 #define LOOPREEL_VERSION "0.0.0"
#endif

namespace
{
    juce::File getLogsDirectory()
    {
        juce::File logsDirectory = juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
                                        .getChildFile("LoopReel")
                                        .getChildFile("Logs");

        if (!logsDirectory.isDirectory() && !logsDirectory.createDirectory())
            logsDirectory = juce::File::getCurrentWorkingDirectory();

        return logsDirectory;
    }

    juce::String getUsage()
    {
        juce::String usage;
        usage << "Usage: loopreel [--build] --duration <seconds> [options]\n\n"
              << "Builds a looping video from the clips in videos/, with music/ and sounds/\n"
              << "as the audio bed and quotes/*.txt drawn over the picture.\n\n"
              << "Options (each also readable from LOOPREEL_<NAME> or a --settings file):\n";

        for (const auto& name : BuildConfig::getOptionNames())
            usage << "  --" << name << "\n";

        usage << "  --settings <file>   LoopReelSettings XML file\n"
              << "  -o <file>           Same as --output\n"
              << "  -v                  Same as --verbose\n";
        return usage;
    }

    void runBuild(const juce::ArgumentList& args)
    {
        const juce::File logsDirectory = getLogsDirectory();
        const juce::String sessionStamp = juce::Time::getCurrentTime().formatted("%Y%m%d_%H%M%S");
        const juce::File logFile = logsDirectory.getChildFile("loopreel_" + sessionStamp + ".log");

        std::unique_ptr<juce::FileLogger> fileLogger(new juce::FileLogger(logFile, "LoopReel Session Log", 0));
        juce::Logger::setCurrentLogger(fileLogger.get());

        juce::Logger::writeToLog("----------------------------------------------------");
        juce::Logger::writeToLog("Build started: " + juce::Time::getCurrentTime().toString(true, true));
        juce::Logger::writeToLog("Version: " + juce::String(LOOPREEL_VERSION));
        juce::StringArray argumentTexts;
        for (const auto& arg : args.arguments)
            argumentTexts.add(arg.text);
        juce::Logger::writeToLog("Arguments: " + argumentTexts.joinIntoString(" "));
        juce::Logger::writeToLog("----------------------------------------------------");

        juce::Result result = juce::Result::ok();

        try
        {
            const BuildConfig config = BuildConfig::load(args,
                                                         BuildConfig::readEnvironment(),
                                                         juce::File::getCurrentWorkingDirectory());

            RenderSession session(config);
            session.setLogsDirectory(logsDirectory);
            session.setLogCallback([](const juce::String& message)
            {
                std::cout << message << std::endl;
            });

            result = session.run();
        }
        catch (const TimelineError& e)
        {
            juce::Logger::writeToLog("ERROR: " + e.getMessage());
            result = juce::Result::fail(e.getMessage());
        }

        juce::Logger::writeToLog("Build finished: " + juce::String(result.wasOk() ? "success" : "failure"));
        juce::Logger::setCurrentLogger(nullptr);
        fileLogger.reset();

        if (result.failed())
            juce::ConsoleApplication::fail("ERROR: " + result.getErrorMessage(), 1);
    }
}

int main(int argc, char* argv[])
{
    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h", getUsage(), false);
    app.addVersionCommand("--version", "loopreel " LOOPREEL_VERSION);

    app.addDefaultCommand({ "--build",
                            "--build [options]",
                            "Builds the video",
                            getUsage(),
                            [](const juce::ArgumentList& args) { runBuild(args); } });

    return app.findAndRunCommand(argc, argv);
}
