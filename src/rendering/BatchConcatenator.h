#pragma once
#include <juce_core/juce_core.h>
#include "TimelineTypes.h"
#include "TranscodeEngine.h"

/**
 * Joins an arbitrarily long ordered list of normalized video segments.
 *
 * The list is split into batches of at most kConcatBatchSize files so that no
 * single engine invocation has to open too many inputs. Each batch is joined
 * on its own and the batch outputs are then joined once more by stream copy.
 */
class BatchConcatenator
{
public:
    /**
     * @param engine    Engine used for every concat call; must outlive this object
     * @param batchSize Maximum number of segments per engine call
     */
    explicit BatchConcatenator(TranscodeEngine& engine, int batchSize = TimelineTypes::kConcatBatchSize);

    void setLogCallback(std::function<void(const juce::String&)> callback);

    /**
     * Concatenates segments in order.
     *
     * Batches are stream-copied for NoTransition and re-encoded otherwise; the
     * second-level join is always a stream copy.
     *
     * @throws BatchError  if an input is missing or a batch produced no output
     * @throws EngineError if the engine fails
     */
    juce::File concatenate(const std::vector<juce::File>& segments, const TimelineTypes::Transition& transition);

    /** Splits segments into contiguous batches of at most batchSize. */
    static std::vector<TimelineTypes::Batch> partition(const std::vector<juce::File>& segments, int batchSize);

    /** True when the transition's batch join has to re-encode. */
    static bool requiresReencode(const TimelineTypes::Transition& transition);

private:
    juce::File concatenateBatch(const TimelineTypes::Batch& batch, bool reencode);
    static void verifyOutput(const juce::File& output, const TimelineTypes::Batch& batch);

    TranscodeEngine& engine;
    int batchSize;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(BatchConcatenator)
};
