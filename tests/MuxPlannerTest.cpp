#include <gtest/gtest.h>
#include "FakeTranscodeEngine.h"
#include "rendering/MuxPlanner.h"

using TimelineTypes::QuoteStyle;
using TimelineTypes::QuoteWindow;

namespace
{
    QuoteWindow makeWindow(const juce::String& text, double start, double end, int index)
    {
        QuoteWindow window;
        window.text = text;
        window.start = start;
        window.end = end;
        window.index = index;
        return window;
    }

    MuxPlanner::Settings makeSettings(QuoteStyle style)
    {
        MuxPlanner::Settings settings;
        settings.targetDuration = 60.0;
        settings.quoteStyle = style;
        settings.transition = TimelineTypes::NoTransition{};
        return settings;
    }
}

TEST(MuxPlanner, VerticalPositionFollowsStyle)
{
    EXPECT_EQ(MuxPlanner::verticalPosition(QuoteStyle::Top), "h*0.1");
    EXPECT_EQ(MuxPlanner::verticalPosition(QuoteStyle::Bottom), "h*0.8");
    EXPECT_EQ(MuxPlanner::verticalPosition(QuoteStyle::Centered), "(h-text_h)/2");
    EXPECT_EQ(MuxPlanner::verticalPosition(QuoteStyle::Minimal), "(h-text_h)/2");
}

TEST(MuxPlanner, QuoteFilterShowsWindowWithAlphaEnvelope)
{
    const auto window = makeWindow("Stay curious", 12.0, 17.0, 0);
    const juce::String filter = MuxPlanner::buildQuoteFilter(window, juce::File("/work/quotes/quote_000.txt"),
                                                             makeSettings(QuoteStyle::Top));

    EXPECT_TRUE(filter.startsWith("drawtext=textfile='/work/quotes/quote_000.txt'"));
    EXPECT_TRUE(filter.contains(":expansion=none"));
    EXPECT_TRUE(filter.contains(":y=h*0.1"));
    EXPECT_TRUE(filter.contains(":x=(w-text_w)/2"));
    EXPECT_TRUE(filter.contains(":fontsize=h/20"));
    EXPECT_TRUE(filter.contains(":box=1:boxcolor=black@0.7:boxborderw=20"));
    EXPECT_TRUE(filter.contains(":enable='between(t,12,17)'"));
    EXPECT_TRUE(filter.endsWith(":alpha='if(lt(t,12.5),(t-12)/0.5,if(gt(t,16.5),(17-t)/0.5,1))'"));
    EXPECT_FALSE(filter.contains("fontfile"));
}

TEST(MuxPlanner, MinimalStyleHasNoBox)
{
    const auto window = makeWindow("Less is more", 5.5, 10.5, 0);
    const juce::String filter = MuxPlanner::buildQuoteFilter(window, juce::File("/q.txt"),
                                                             makeSettings(QuoteStyle::Minimal));

    EXPECT_FALSE(filter.contains("box=1"));
    EXPECT_TRUE(filter.contains(":borderw=2:bordercolor=black"));
    EXPECT_TRUE(filter.contains(":enable='between(t,5.5,10.5)'"));
}

TEST(MuxPlanner, FontFileIsPassedWhenSet)
{
    auto settings = makeSettings(QuoteStyle::Centered);
    settings.fontFile = juce::File("/fonts/Serif.ttf");

    const juce::String filter = MuxPlanner::buildQuoteFilter(makeWindow("x", 1.0, 2.0, 0), juce::File("/q.txt"), settings);
    EXPECT_TRUE(filter.contains(":fontfile='/fonts/Serif.ttf'"));
}

TEST(MuxPlanner, FilterPathsAreQuoted)
{
    EXPECT_EQ(MuxPlanner::escapeFilterPath(juce::File("/tmp/it's here/q.txt")), "'/tmp/it'\\''s here/q.txt'");
}

TEST(MuxPlanner, EdgeFilterOnlyForFade)
{
    EXPECT_EQ(MuxPlanner::buildEdgeFilter(TimelineTypes::FadeTransition{}, 60.0),
              "fade=t=in:st=0:d=1,fade=t=out:st=59:d=1");
    EXPECT_TRUE(MuxPlanner::buildEdgeFilter(TimelineTypes::NoTransition{}, 60.0).isEmpty());
    EXPECT_TRUE(MuxPlanner::buildEdgeFilter(TimelineTypes::CrossfadeTransition{}, 60.0).isEmpty());
}

TEST(MuxPlanner, OverlayJoinsQuotesThenEdgeFilter)
{
    const std::vector<QuoteWindow> windows { makeWindow("a", 10.0, 15.0, 0), makeWindow("b", 30.0, 35.0, 1) };
    const std::vector<juce::File> files { juce::File("/q/quote_000.txt"), juce::File("/q/quote_001.txt") };

    auto settings = makeSettings(QuoteStyle::Bottom);
    settings.transition = TimelineTypes::FadeTransition{};

    const juce::String filter = MuxPlanner::buildOverlayFilter(windows, files, settings);

    EXPECT_TRUE(filter.startsWith("drawtext=textfile='/q/quote_000.txt'"));
    EXPECT_TRUE(filter.contains(",drawtext=textfile='/q/quote_001.txt'"));
    EXPECT_TRUE(filter.endsWith(",fade=t=in:st=0:d=1,fade=t=out:st=59:d=1"));

    EXPECT_TRUE(MuxPlanner::buildOverlayFilter({}, {}, makeSettings(QuoteStyle::Centered)).isEmpty());
}

TEST(MuxPlanner, FinalizeWritesQuoteFilesAndMuxesOnce)
{
    ScopedTempDirectory temp;
    FakeTranscodeEngine engine(temp.get().getChildFile("out"));

    const juce::File video = temp.createFile("video.mp4");
    const juce::File audio = temp.createFile("audio.mp3");
    const juce::File output = temp.get().getChildFile("final/result.mp4");

    auto settings = makeSettings(QuoteStyle::Centered);
    settings.workDirectory = temp.get().getChildFile("quotes");

    const std::vector<QuoteWindow> windows { makeWindow("First quote", 10.0, 15.0, 0),
                                             makeWindow("Second quote", 40.0, 45.0, 1) };

    MuxPlanner planner(engine);
    const juce::File result = planner.finalize(video, audio, windows, settings, output);

    EXPECT_EQ(result, output);
    EXPECT_TRUE(output.existsAsFile());
    EXPECT_EQ(settings.workDirectory.getChildFile("quote_000.txt").loadFileAsString(), "First quote");
    EXPECT_EQ(settings.workDirectory.getChildFile("quote_001.txt").loadFileAsString(), "Second quote");

    ASSERT_EQ(engine.muxCalls.size(), 1u);
    const auto& call = engine.muxCalls[0];
    EXPECT_EQ(call.video, video);
    ASSERT_TRUE(call.audio.has_value());
    EXPECT_EQ(*call.audio, audio);
    EXPECT_EQ(call.videoFilter.indexOf("drawtext"), 0);
    EXPECT_TRUE(call.videoFilter.contains("quote_001.txt"));
}

TEST(MuxPlanner, QuoteTextIsWrittenVerbatimAndNotExpanded)
{
    ScopedTempDirectory temp;
    FakeTranscodeEngine engine(temp.get().getChildFile("out"));
    const juce::File video = temp.createFile("video.mp4");

    auto settings = makeSettings(QuoteStyle::Bottom);
    settings.workDirectory = temp.get().getChildFile("quotes");

    const juce::String text = "Give 100% of C:\\dreams, %{pts} and 'quotes'";
    const std::vector<QuoteWindow> windows { makeWindow(text, 10.0, 15.0, 0) };

    MuxPlanner planner(engine);
    planner.finalize(video, std::nullopt, windows, settings, temp.get().getChildFile("final.mp4"));

    EXPECT_EQ(settings.workDirectory.getChildFile("quote_000.txt").loadFileAsString(), text);

    ASSERT_EQ(engine.muxCalls.size(), 1u);
    const juce::String& filter = engine.muxCalls[0].videoFilter;
    EXPECT_TRUE(filter.contains(":expansion=none"));
    EXPECT_FALSE(filter.contains("100%"));
    EXPECT_FALSE(filter.contains("%{pts}"));
}

TEST(MuxPlanner, NoAudioAndNoQuotesStillMuxesVideo)
{
    ScopedTempDirectory temp;
    FakeTranscodeEngine engine(temp.get().getChildFile("out"));

    auto settings = makeSettings(QuoteStyle::Centered);
    settings.workDirectory = temp.get().getChildFile("quotes");

    MuxPlanner planner(engine);
    planner.finalize(temp.createFile("video.mp4"), std::nullopt, {}, settings, temp.get().getChildFile("out.mp4"));

    ASSERT_EQ(engine.muxCalls.size(), 1u);
    EXPECT_FALSE(engine.muxCalls[0].audio.has_value());
    EXPECT_TRUE(engine.muxCalls[0].videoFilter.isEmpty());
    EXPECT_FALSE(settings.workDirectory.exists());
}
