#include "BatchConcatenator.h"
#include "TimelineErrors.h"

namespace
{
    struct ReencodeVisitor
    {
        bool operator()(const TimelineTypes::NoTransition&) const        { return false; }
        bool operator()(const TimelineTypes::FadeTransition&) const      { return true; }
        bool operator()(const TimelineTypes::CrossfadeTransition&) const { return true; }
    };
}

BatchConcatenator::BatchConcatenator(TranscodeEngine& engine, int batchSize)
    : engine(engine),
      batchSize(juce::jmax(1, batchSize))
{
}

void BatchConcatenator::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

bool BatchConcatenator::requiresReencode(const TimelineTypes::Transition& transition)
{
    return std::visit(ReencodeVisitor{}, transition);
}

std::vector<TimelineTypes::Batch> BatchConcatenator::partition(const std::vector<juce::File>& segments, int batchSize)
{
    std::vector<TimelineTypes::Batch> batches;
    const size_t size = static_cast<size_t>(juce::jmax(1, batchSize));

    for (size_t start = 0; start < segments.size(); start += size)
    {
        TimelineTypes::Batch batch;
        batch.index = static_cast<int>(batches.size());

        const size_t end = juce::jmin(start + size, segments.size());
        batch.items.assign(segments.begin() + static_cast<std::ptrdiff_t>(start),
                           segments.begin() + static_cast<std::ptrdiff_t>(end));

        batches.push_back(std::move(batch));
    }

    return batches;
}

//==============================================================================
juce::File BatchConcatenator::concatenate(const std::vector<juce::File>& segments,
                                          const TimelineTypes::Transition& transition)
{
    if (segments.empty())
        throw BatchError("No segments to concatenate", 0, {});

    const bool reencode = requiresReencode(transition);
    const auto batches = partition(segments, batchSize);

    if (logCallback)
        logCallback("Concatenating " + juce::String(static_cast<int>(segments.size())) + " segments in "
                    + juce::String(static_cast<int>(batches.size())) + " batch(es)"
                    + (reencode ? " with re-encode" : " by stream copy"));

    std::vector<juce::File> batchOutputs;
    batchOutputs.reserve(batches.size());

    for (const auto& batch : batches)
        batchOutputs.push_back(concatenateBatch(batch, reencode));

    if (batchOutputs.size() == 1)
        return batchOutputs.front();

    // Batch outputs already share one encoding, so the final join never re-encodes
    TimelineTypes::Batch finalBatch;
    finalBatch.items = batchOutputs;
    finalBatch.index = static_cast<int>(batches.size());

    if (logCallback)
        logCallback("Joining " + juce::String(static_cast<int>(batchOutputs.size())) + " batch outputs");

    return concatenateBatch(finalBatch, false);
}

//==============================================================================
juce::File BatchConcatenator::concatenateBatch(const TimelineTypes::Batch& batch, bool reencode)
{
    juce::StringArray missing;
    for (const auto& item : batch.items)
        if (!item.existsAsFile())
            missing.add(item.getFullPathName());

    if (!missing.isEmpty())
        throw BatchError("Batch " + juce::String(batch.index) + " is missing input file(s): "
                         + missing.joinIntoString(", "),
                         batch.index, batch.items);

    const juce::File output = engine.concat(batch.items, reencode);
    verifyOutput(output, batch);

    if (logCallback)
        logCallback("  Batch " + juce::String(batch.index) + ": "
                    + juce::String(static_cast<int>(batch.items.size())) + " segments -> " + output.getFileName());

    return output;
}

void BatchConcatenator::verifyOutput(const juce::File& output, const TimelineTypes::Batch& batch)
{
    if (!output.existsAsFile() || output.getSize() == 0)
        throw BatchError("Batch " + juce::String(batch.index) + " produced no output at "
                         + output.getFullPathName(),
                         batch.index, batch.items);
}
