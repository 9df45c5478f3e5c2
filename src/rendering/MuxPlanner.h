#pragma once
#include <juce_core/juce_core.h>
#include <optional>
#include "TimelineTypes.h"
#include "TranscodeEngine.h"

/**
 * Final combine step: maps the assembled video, the optional audio bed and a
 * drawtext overlay built from the quote windows into one engine invocation.
 */
class MuxPlanner
{
public:
    struct Settings
    {
        double targetDuration = 0.0;
        TimelineTypes::QuoteStyle quoteStyle = TimelineTypes::QuoteStyle::Centered;
        TimelineTypes::Transition transition = TimelineTypes::CrossfadeTransition{};
        juce::File fontFile;        // Empty for the engine's default font
        juce::File workDirectory;   // Receives one text file per quote window
    };

    explicit MuxPlanner(TranscodeEngine& engine);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Writes the final output.
     * @throws EngineError if the engine fails or a quote text file can't be written
     */
    juce::File finalize(const juce::File& video,
                        const std::optional<juce::File>& audio,
                        const std::vector<TimelineTypes::QuoteWindow>& windows,
                        const Settings& settings,
                        const juce::File& outputFile);

    /** Writes quote_NNN.txt for each window and returns the files in window order. */
    static std::vector<juce::File> writeQuoteTextFiles(const std::vector<TimelineTypes::QuoteWindow>& windows,
                                                       const juce::File& directory);

    /** One drawtext filter for one window, reading its text from textFile. */
    static juce::String buildQuoteFilter(const TimelineTypes::QuoteWindow& window,
                                         const juce::File& textFile,
                                         const Settings& settings);

    /**
     * The complete -vf chain: every quote filter followed by the transition's
     * edge filter. Empty when there is nothing to draw.
     */
    static juce::String buildOverlayFilter(const std::vector<TimelineTypes::QuoteWindow>& windows,
                                           const std::vector<juce::File>& textFiles,
                                           const Settings& settings);

    /** Programme-edge filter for a transition; empty for none and crossfade. */
    static juce::String buildEdgeFilter(const TimelineTypes::Transition& transition, double targetDuration);

    /** Vertical drawtext position for a quote style. */
    static juce::String verticalPosition(TimelineTypes::QuoteStyle style);

    /** Quotes a path as a single filter option value. */
    static juce::String escapeFilterPath(const juce::File& file);

private:
    TranscodeEngine& engine;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MuxPlanner)
};
