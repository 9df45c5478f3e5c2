#include <gtest/gtest.h>
#include "FakeTranscodeEngine.h"
#include "rendering/TrackBuilder.h"

namespace
{
    TrackBuilder::Settings makeSettings(double target)
    {
        TrackBuilder::Settings settings;
        settings.targetDuration = target;
        settings.musicVolume = 0.7;
        settings.soundsVolume = 0.5;
        return settings;
    }

    struct AudioFixture
    {
        AudioFixture() : engine(temp.get().getChildFile("out")) {}

        juce::File addMusic(const juce::String& name, double duration)
        {
            const juce::File file = temp.createFile("music/" + name);
            engine.setDuration(file, duration);
            return file;
        }

        juce::File addSound(const juce::String& name)
        {
            return temp.createFile("sounds/" + name);
        }

        juce::File musicDir() const  { return temp.get().getChildFile("music"); }
        juce::File soundsDir() const { return temp.get().getChildFile("sounds"); }

        ScopedTempDirectory temp;
        FakeTranscodeEngine engine;
        juce::Random random { 1 };
    };
}

TEST(TrackBuilder, MusicFilterHasVolumeAndEdgeFades)
{
    EXPECT_EQ(TrackBuilder::buildMusicFilter(0.7, 100.0),
              "volume=0.7,afade=t=in:st=0:d=2,afade=t=out:st=98:d=2");
    EXPECT_EQ(TrackBuilder::buildMusicFilter(1.0, 61.25),
              "volume=1,afade=t=in:st=0:d=2,afade=t=out:st=59.25:d=2");
    EXPECT_EQ(TrackBuilder::buildMusicFilter(0.5, 1.0),
              "volume=0.5,afade=t=in:st=0:d=2,afade=t=out:st=0:d=2");
    EXPECT_EQ(TrackBuilder::buildVolumeFilter(0.25), "volume=0.25");
}

TEST(TrackBuilder, MusicAndSoundsAreMixedWithMusicAsReference)
{
    AudioFixture f;
    f.addMusic("a.mp3", 30.0);
    f.addMusic("b.mp3", 50.0);
    f.addSound("rain.wav");
    f.addSound("wind.ogg");

    TrackBuilder builder(f.engine, f.random);
    const auto track = builder.build(f.musicDir(), f.soundsDir(), makeSettings(100.0));

    ASSERT_TRUE(track.has_value());

    // 30 + 50 + 30 covers 100s
    ASSERT_EQ(f.engine.audioConcatCalls.size(), 1u);
    EXPECT_EQ(f.engine.audioConcatCalls[0].size(), 3u);

    // Music bed plus one loop per sound
    EXPECT_EQ(f.engine.countCalls("loopToDuration"), 3);
    ASSERT_EQ(f.engine.audioFilters.size(), 3);
    EXPECT_EQ(f.engine.audioFilters[0], "volume=0.7,afade=t=in:st=0:d=2,afade=t=out:st=98:d=2");
    EXPECT_EQ(f.engine.audioFilters[1], "volume=0.5");
    EXPECT_EQ(f.engine.audioFilters[2], "volume=0.5");

    ASSERT_EQ(f.engine.mixCalls.size(), 1u);
    EXPECT_EQ(f.engine.mixCalls[0].size(), 3u);
    EXPECT_EQ(f.engine.mixReferenceIndex, 0);
    EXPECT_DOUBLE_EQ(f.engine.probeDuration(*track), 100.0);
}

TEST(TrackBuilder, SingleMusicFileIsNormalizedInsteadOfJoined)
{
    AudioFixture f;
    f.addMusic("long.mp3", 300.0);

    TrackBuilder builder(f.engine, f.random);
    const auto track = builder.build(f.musicDir(), f.soundsDir(), makeSettings(100.0));

    ASSERT_TRUE(track.has_value());
    EXPECT_EQ(f.engine.countCalls("normalizeAudio"), 1);
    EXPECT_EQ(f.engine.countCalls("concatAudio"), 0);

    // One track needs no mix
    EXPECT_EQ(f.engine.countCalls("mixTracks"), 0);
    EXPECT_TRUE(track->getFileName().contains("filtered"));
}

TEST(TrackBuilder, SoundsOnlyStillProduceATrack)
{
    AudioFixture f;
    const juce::File rain = f.addSound("rain.mp3");

    TrackBuilder builder(f.engine, f.random);
    const auto track = builder.build(f.musicDir(), f.soundsDir(), makeSettings(45.0));

    ASSERT_TRUE(track.has_value());
    ASSERT_EQ(f.engine.loopedSources.size(), 1u);
    EXPECT_EQ(f.engine.loopedSources[0], rain);
    EXPECT_EQ(f.engine.countCalls("mixTracks"), 0);
}

TEST(TrackBuilder, NoAudioAtAllGivesNoTrack)
{
    AudioFixture f;

    TrackBuilder builder(f.engine, f.random);
    juce::StringArray log;
    builder.setLogCallback([&log](const juce::String& message) { log.add(message); });

    EXPECT_FALSE(builder.build(f.musicDir(), f.soundsDir(), makeSettings(60.0)).has_value());
    EXPECT_EQ(f.engine.getNumCalls(), 0);
    EXPECT_TRUE(log.joinIntoString("\n").contains("WARNING: No music files found"));
}

TEST(TrackBuilder, BrokenMusicFilesAreDropped)
{
    AudioFixture f;
    f.temp.createFile("music/empty.mp3", {});
    f.addSound("birds.m4a");

    TrackBuilder builder(f.engine, f.random);
    const auto track = builder.build(f.musicDir(), f.soundsDir(), makeSettings(30.0));

    ASSERT_TRUE(track.has_value());
    EXPECT_EQ(f.engine.countCalls("probeDuration"), 0);
    EXPECT_EQ(f.engine.countCalls("loopToDuration"), 1);
}

TEST(TrackBuilder, UnreadableMusicIsFatal)
{
    AudioFixture f;
    f.temp.createFile("music/corrupt.mp3");

    TrackBuilder builder(f.engine, f.random);
    EXPECT_THROW(builder.build(f.musicDir(), f.soundsDir(), makeSettings(30.0)), ProbeError);
}

TEST(TrackBuilder, MixOfNothingIsNone)
{
    AudioFixture f;
    TrackBuilder builder(f.engine, f.random);

    EXPECT_FALSE(builder.mix({}).has_value());
}
