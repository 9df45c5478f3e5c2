#include <gtest/gtest.h>
#include <limits>
#include "FakeTranscodeEngine.h"
#include "core/MediaLibrary.h"

TEST(MediaLibrary, FindsMatchingFilesInPathOrder)
{
    ScopedTempDirectory temp;
    temp.createFile("videos/b.mov");
    temp.createFile("videos/a.mp4");
    temp.createFile("videos/c.mkv");
    temp.createFile("videos/readme.txt");
    temp.createFile("videos/nested/d.mp4");

    const auto files = MediaLibrary::findFiles(temp.get().getChildFile("videos"), MediaLibrary::videoExtensions);

    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].getFileName(), "a.mp4");
    EXPECT_EQ(files[1].getFileName(), "b.mov");
    EXPECT_EQ(files[2].getFileName(), "c.mkv");

    EXPECT_TRUE(MediaLibrary::findFiles(temp.get().getChildFile("missing"), MediaLibrary::videoExtensions).empty());
}

TEST(MediaLibrary, ScanDropsEmptyFilesWithWarning)
{
    ScopedTempDirectory temp;
    temp.createFile("music/good.mp3");
    temp.createFile("music/empty.wav", {});

    juce::StringArray log;
    const auto result = MediaLibrary::scan(temp.get().getChildFile("music"), MediaLibrary::audioExtensions,
                                           [&log](const juce::String& message) { log.add(message); });

    ASSERT_EQ(result.files.size(), 1u);
    EXPECT_EQ(result.files[0].getFileName(), "good.mp3");
    EXPECT_EQ(result.numDropped, 1);

    ASSERT_EQ(log.size(), 2);
    EXPECT_TRUE(log[0].startsWith("WARNING: Skipping empty file"));
    EXPECT_TRUE(log[1].contains("Dropped 1 invalid file(s)"));
}

TEST(MediaLibrary, IntactMeansExistingAndNonEmpty)
{
    ScopedTempDirectory temp;

    EXPECT_TRUE(MediaLibrary::isIntact(temp.createFile("a.mp4")));
    EXPECT_FALSE(MediaLibrary::isIntact(temp.createFile("b.mp4", {})));
    EXPECT_FALSE(MediaLibrary::isIntact(temp.get().getChildFile("c.mp4")));
    EXPECT_FALSE(MediaLibrary::isIntact(temp.get()));
}

TEST(MediaLibrary, LoadsTrimmedQuotesAndSkipsEmptyOnes)
{
    ScopedTempDirectory temp;
    temp.createFile("quotes/02.txt", "  Second quote\n\n");
    temp.createFile("quotes/01.txt", "First quote");
    temp.createFile("quotes/03.txt", "   \n");
    temp.createFile("quotes/notes.md", "not a quote");

    juce::StringArray log;
    const auto quotes = MediaLibrary::loadQuotes(temp.get().getChildFile("quotes"),
                                                 [&log](const juce::String& message) { log.add(message); });

    ASSERT_EQ(quotes.size(), 2);
    EXPECT_EQ(quotes[0], "First quote");
    EXPECT_EQ(quotes[1], "Second quote");
    EXPECT_TRUE(log.joinIntoString("\n").contains("WARNING: Empty quote file"));
    EXPECT_EQ(log[log.size() - 1], "Loaded 2 quote(s)");
}

TEST(MediaLibrary, MissingQuotesDirectoryGivesNoQuotes)
{
    ScopedTempDirectory temp;
    EXPECT_TRUE(MediaLibrary::loadQuotes(temp.get().getChildFile("quotes"), nullptr).isEmpty());
}

TEST(MediaLibrary, EstimatesSizeFromResolutionBand)
{
    EXPECT_EQ(MediaLibrary::estimateOutputSize(1920, 1080, 60.0), 37500000);
    EXPECT_EQ(MediaLibrary::estimateOutputSize(3840, 2160, 8.0), 5000000);
    EXPECT_EQ(MediaLibrary::estimateOutputSize(1280, 720, 60.0), 18750000);
    EXPECT_EQ(MediaLibrary::estimateOutputSize(640, 360, 60.0), 11250000);
}

TEST(MediaLibrary, DiskSpaceCheckRequiresMargin)
{
    ScopedTempDirectory temp;
    const juce::int64 available = temp.get().getBytesFreeOnVolume();

    EXPECT_NO_THROW(MediaLibrary::checkDiskSpace(temp.get(), 1024));
    EXPECT_THROW(MediaLibrary::checkDiskSpace(temp.get(), available), ResourceError);
    EXPECT_THROW(MediaLibrary::checkDiskSpace(temp.get(), std::numeric_limits<juce::int64>::max() / 2), ResourceError);
}
