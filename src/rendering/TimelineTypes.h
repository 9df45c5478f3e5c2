#pragma once
#include <juce_core/juce_core.h>
#include <variant>
#include <vector>

/**
 * Common types used across the timeline assembly pipeline.
 * These types are shared by multiple components to ensure consistency.
 */
namespace TimelineTypes
{
    //==========================================================================
    // Tunable constants

    /** Maximum number of segments handed to a single concat invocation */
    constexpr int kConcatBatchSize = 25;

    /** Fade-in / fade-out applied to the edges of the music bed */
    constexpr double kMusicFadeSeconds = 2.0;

    /** Dropout transition used when mixing music and sound tracks */
    constexpr double kMixDropoutSeconds = 2.0;

    /** Alpha envelope applied to every quote window */
    constexpr double kQuoteFadeSeconds = 0.5;

    /** Programme-edge fade used by the "fade" transition at mux time */
    constexpr double kEdgeFadeSeconds = 1.0;

    /** Longest programme a build accepts, in seconds */
    constexpr double kMaxDurationSeconds = 24.0 * 60.0 * 60.0;

    /** Tolerance used when comparing accumulated durations */
    constexpr double kDurationTolerance = 1.0e-6;

    //==========================================================================
    /** A scanned and probed source file */
    struct MediaItem
    {
        juce::File file;
        double duration = 0.0;   // Probed duration in seconds
        bool valid = false;      // Passed integrity validation
    };

    /** Loop/trim decision for covering a target duration */
    struct FitPlan
    {
        std::vector<MediaItem> orderedItems;   // May repeat items across loop iterations
        double trimLastBy = 0.0;               // Seconds to drop from the tail
        double accumulated = 0.0;              // Sum of orderedItems durations
        int loopCount = 1;                     // Number of replicas laid out

        bool needsTrim() const { return trimLastBy > kDurationTolerance; }
    };

    /** A bounded group of segments concatenated in one engine call */
    struct Batch
    {
        std::vector<juce::File> items;
        int index = 0;
    };

    /** A scheduled interval during which one quote is displayed */
    struct QuoteWindow
    {
        juce::String text;
        double start = 0.0;
        double end = 0.0;
        int index = 0;

        double fadeInEnd() const    { return start + kQuoteFadeSeconds; }
        double fadeOutStart() const { return end - kQuoteFadeSeconds; }
    };

    //==========================================================================
    // Transition kinds. Consumers map each alternative to their own
    // filter-graph strategy through std::visit.

    struct NoTransition {};
    struct FadeTransition {};
    struct CrossfadeTransition {};

    using Transition = std::variant<NoTransition, FadeTransition, CrossfadeTransition>;

    /** Parses "none", "fade" or "crossfade"; returns false for anything else */
    bool parseTransition(const juce::String& name, Transition& result);

    /** Returns the configuration name of a transition */
    juce::String transitionName(const Transition& transition);

    //==========================================================================
    enum class QuoteStyle
    {
        Minimal,
        Centered,
        Top,
        Bottom
    };

    /** Parses "minimal", "centered", "top" or "bottom"; returns false for anything else */
    bool parseQuoteStyle(const juce::String& name, QuoteStyle& result);

    /** Returns the configuration name of a quote style */
    juce::String quoteStyleName(QuoteStyle style);

    //==========================================================================
    /** Formats a number for a filter expression: at most 3 decimals, no trailing zeros */
    juce::String formatNumber(double value);
}
