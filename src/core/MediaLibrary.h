#pragma once
#include <juce_core/juce_core.h>
#include <functional>
#include <vector>

/**
 * File-system side of a build: finding source media, checking it isn't
 * obviously broken, reading quotes and making sure the output will fit.
 */
namespace MediaLibrary
{
    using LogCallback = std::function<void(const juce::String&)>;

    /** Extension lists in juce::File::hasFileExtension() form */
    constexpr const char* videoExtensions = ".mp4;.mov;.avi;.mkv";
    constexpr const char* audioExtensions = ".mp3;.wav;.m4a;.aac;.ogg";
    constexpr const char* quoteExtensions = ".txt";

    /** Result of scanning one source directory */
    struct ScanResult
    {
        std::vector<juce::File> files;   // Intact files, sorted by path
        int numDropped = 0;              // Files rejected by isIntact()
    };

    /**
     * Lists the files of a directory (not recursive) with one of the given
     * extensions, sorted by full path. A missing directory yields nothing.
     */
    std::vector<juce::File> findFiles(const juce::File& directory, const juce::String& extensions);

    /** A file is intact when it exists and is not empty. */
    bool isIntact(const juce::File& file);

    /**
     * findFiles() followed by isIntact(). Every rejected file is logged as a
     * warning, then a summary of how many were dropped.
     */
    ScanResult scan(const juce::File& directory, const juce::String& extensions, const LogCallback& log);

    /**
     * Reads every quote file of a directory in path order. Each file holds one
     * quote; surrounding whitespace is removed and empty files are skipped.
     */
    juce::StringArray loadQuotes(const juce::File& directory, const LogCallback& log);

    /** Rough size of an H.264 output of the given resolution and duration. */
    juce::int64 estimateOutputSize(int width, int height, double durationSeconds);

    /**
     * Throws ResourceError unless the volume holding directory has at least
     * requiredBytes plus a 10% margin free.
     */
    void checkDiskSpace(const juce::File& directory, juce::int64 requiredBytes);
}
