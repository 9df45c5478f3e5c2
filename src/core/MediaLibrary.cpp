#include "MediaLibrary.h"
#include "../rendering/TimelineErrors.h"
#include <algorithm>

namespace MediaLibrary
{
    std::vector<juce::File> findFiles(const juce::File& directory, const juce::String& extensions)
    {
        std::vector<juce::File> files;

        if (!directory.isDirectory())
            return files;

        for (const auto& file : directory.findChildFiles(juce::File::findFiles, false))
            if (file.hasFileExtension(extensions))
                files.push_back(file);

        std::sort(files.begin(), files.end(),
                  [](const juce::File& a, const juce::File& b) { return a.getFullPathName() < b.getFullPathName(); });

        return files;
    }

    bool isIntact(const juce::File& file)
    {
        return file.existsAsFile() && file.getSize() > 0;
    }

    ScanResult scan(const juce::File& directory, const juce::String& extensions, const LogCallback& log)
    {
        ScanResult result;

        for (const auto& file : findFiles(directory, extensions))
        {
            if (isIntact(file))
            {
                result.files.push_back(file);
                continue;
            }

            ++result.numDropped;
            if (log)
                log("WARNING: Skipping " + juce::String(file.existsAsFile() ? "empty" : "missing")
                    + " file: " + file.getFullPathName());
        }

        if (result.numDropped > 0 && log)
            log("WARNING: Dropped " + juce::String(result.numDropped) + " invalid file(s) from "
                + directory.getFullPathName());

        return result;
    }

    juce::StringArray loadQuotes(const juce::File& directory, const LogCallback& log)
    {
        juce::StringArray quotes;

        for (const auto& file : findFiles(directory, quoteExtensions))
        {
            juce::FileInputStream stream(file);
            if (!stream.openedOk())
            {
                if (log)
                    log("ERROR: Failed to read quote file " + file.getFullPathName() + ": "
                        + stream.getStatus().getErrorMessage());
                continue;
            }

            const juce::String text = stream.readEntireStreamAsString().trim();
            if (text.isEmpty())
            {
                if (log)
                    log("WARNING: Empty quote file: " + file.getFullPathName());
                continue;
            }

            quotes.add(text);
        }

        if (log)
            log("Loaded " + juce::String(quotes.size()) + " quote(s)");

        return quotes;
    }

    juce::int64 estimateOutputSize(int width, int height, double durationSeconds)
    {
        const juce::int64 pixels = static_cast<juce::int64>(width) * height;

        double bitrateMbps = 1.5;
        if (pixels >= 1920 * 1080)
            bitrateMbps = 5.0;
        else if (pixels >= 1280 * 720)
            bitrateMbps = 2.5;

        const double bytesPerSecond = bitrateMbps * 1000000.0 / 8.0;
        return static_cast<juce::int64>(bytesPerSecond * durationSeconds);
    }

    void checkDiskSpace(const juce::File& directory, juce::int64 requiredBytes)
    {
        const juce::int64 available = directory.getBytesFreeOnVolume();
        const double requiredWithMargin = static_cast<double>(requiredBytes) * 1.1;

        if (static_cast<double>(available) < requiredWithMargin)
        {
            constexpr double bytesPerGB = 1024.0 * 1024.0 * 1024.0;
            throw ResourceError("Insufficient disk space. Available: "
                                + juce::String(static_cast<double>(available) / bytesPerGB, 2) + " GB, Required: "
                                + juce::String(requiredWithMargin / bytesPerGB, 2) + " GB");
        }
    }
}
