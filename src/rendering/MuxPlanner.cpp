#include "MuxPlanner.h"
#include "TimelineErrors.h"

namespace
{
    using TimelineTypes::formatNumber;

    struct EdgeFilterVisitor
    {
        double targetDuration;

        juce::String operator()(const TimelineTypes::NoTransition&) const        { return {}; }
        juce::String operator()(const TimelineTypes::CrossfadeTransition&) const { return {}; }

        juce::String operator()(const TimelineTypes::FadeTransition&) const
        {
            const double fadeOutStart = juce::jmax(0.0, targetDuration - TimelineTypes::kEdgeFadeSeconds);
            const juce::String d = formatNumber(TimelineTypes::kEdgeFadeSeconds);

            return "fade=t=in:st=0:d=" + d + ",fade=t=out:st=" + formatNumber(fadeOutStart) + ":d=" + d;
        }
    };
}

MuxPlanner::MuxPlanner(TranscodeEngine& engine)
    : engine(engine)
{
}

void MuxPlanner::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

//==============================================================================
juce::File MuxPlanner::finalize(const juce::File& video,
                                const std::optional<juce::File>& audio,
                                const std::vector<TimelineTypes::QuoteWindow>& windows,
                                const Settings& settings,
                                const juce::File& outputFile)
{
    const auto textFiles = writeQuoteTextFiles(windows, settings.workDirectory);
    const juce::String filter = buildOverlayFilter(windows, textFiles, settings);

    if (logCallback)
    {
        logCallback("Combining video" + juce::String(audio.has_value() ? ", audio" : "")
                    + " and " + juce::String(static_cast<int>(windows.size())) + " quote(s)");
        logCallback("Output file: " + outputFile.getFullPathName());
    }

    return engine.renderOverlayAndMux(video, audio, filter, outputFile);
}

std::vector<juce::File> MuxPlanner::writeQuoteTextFiles(const std::vector<TimelineTypes::QuoteWindow>& windows,
                                                        const juce::File& directory)
{
    std::vector<juce::File> files;
    files.reserve(windows.size());

    if (!windows.empty() && !directory.createDirectory().wasOk())
        throw EngineError("Could not create quote directory " + directory.getFullPathName(), -1, {});

    for (const auto& window : windows)
    {
        const juce::File file = directory.getChildFile(juce::String::formatted("quote_%03d.txt", window.index));

        if (!file.replaceWithText(window.text))
            throw EngineError("Could not write quote file " + file.getFullPathName(), -1, {});

        files.push_back(file);
    }

    return files;
}

//==============================================================================
juce::String MuxPlanner::verticalPosition(TimelineTypes::QuoteStyle style)
{
    switch (style)
    {
        case TimelineTypes::QuoteStyle::Top:      return "h*0.1";
        case TimelineTypes::QuoteStyle::Bottom:   return "h*0.8";
        case TimelineTypes::QuoteStyle::Centered:
        case TimelineTypes::QuoteStyle::Minimal:  break;
    }

    return "(h-text_h)/2";
}

juce::String MuxPlanner::escapeFilterPath(const juce::File& file)
{
    // Inside single quotes only the quote itself needs escaping
    const juce::String path = file.getFullPathName().replaceCharacter('\\', '/');
    return "'" + path.replace("'", "'\\''") + "'";
}

juce::String MuxPlanner::buildQuoteFilter(const TimelineTypes::QuoteWindow& window,
                                          const juce::File& textFile,
                                          const Settings& settings)
{
    const juce::String start = formatNumber(window.start);
    const juce::String end = formatNumber(window.end);
    const juce::String fade = formatNumber(TimelineTypes::kQuoteFadeSeconds);

    juce::String filter = "drawtext=textfile=" + escapeFilterPath(textFile);

    if (settings.fontFile != juce::File())
        filter << ":fontfile=" << escapeFilterPath(settings.fontFile);

    // Quote text is drawn verbatim; % and \ in it are not drawtext sequences
    filter << ":expansion=none"
           << ":fontsize=h/20"
           << ":fontcolor=white"
           << ":borderw=2"
           << ":bordercolor=black"
           << ":x=(w-text_w)/2"
           << ":y=" << verticalPosition(settings.quoteStyle);

    if (settings.quoteStyle != TimelineTypes::QuoteStyle::Minimal)
        filter << ":box=1:boxcolor=black@0.7:boxborderw=20";

    filter << ":enable='between(t," << start << "," << end << ")'"
           << ":alpha='if(lt(t," << formatNumber(window.fadeInEnd()) << "),(t-" << start << ")/" << fade
           << ",if(gt(t," << formatNumber(window.fadeOutStart()) << "),(" << end << "-t)/" << fade << ",1))'";

    return filter;
}

juce::String MuxPlanner::buildEdgeFilter(const TimelineTypes::Transition& transition, double targetDuration)
{
    return std::visit(EdgeFilterVisitor { targetDuration }, transition);
}

juce::String MuxPlanner::buildOverlayFilter(const std::vector<TimelineTypes::QuoteWindow>& windows,
                                            const std::vector<juce::File>& textFiles,
                                            const Settings& settings)
{
    jassert(windows.size() == textFiles.size());

    juce::StringArray filters;

    for (size_t i = 0; i < windows.size() && i < textFiles.size(); ++i)
        filters.add(buildQuoteFilter(windows[i], textFiles[i], settings));

    const juce::String edge = buildEdgeFilter(settings.transition, settings.targetDuration);
    if (edge.isNotEmpty())
        filters.add(edge);

    return filters.joinIntoString(",");
}
