#include "Sequencer.h"

#include <deque>

using WeaveTypes::ExitCode;
using WeaveTypes::SequenceStrategy;
using WeaveTypes::WeaveStatus;

//==============================================================================
RealtimeDropout::RealtimeDropout(bool enabled, int firstPeriod, int period) noexcept
    : enabled(enabled),
      countdown(firstPeriod),
      period(juce::jmax(1, period))
{
}

bool RealtimeDropout::shouldDrop() noexcept
{
    if (!enabled)
        return false;

    if (--countdown <= 0)
    {
        skip = !skip;
        countdown = period;
    }

    return skip;
}

//==============================================================================
Sequencer::Sequencer(const Workspace& workspace)
    : workspace(workspace)
{
}

Sequencer::~Sequencer()
{
}

void Sequencer::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = callback;
}

SequenceStrategy Sequencer::selectStrategy(const WeaveTypes::Pattern& pattern, bool random)
{
    if (random)
        return SequenceStrategy::Random;

    for (int weight : pattern)
        if (weight != 1)
            return SequenceStrategy::WeightedGrouped;

    return SequenceStrategy::Standard;
}

std::vector<int> Sequencer::expandPattern(const WeaveTypes::Pattern& pattern)
{
    std::vector<int> indexes;

    for (size_t group = 0; group < pattern.size(); ++group)
        for (int i = 0; i < pattern[group]; ++i)
            indexes.push_back(static_cast<int>(group));

    return indexes;
}

//==============================================================================
Sequencer::Plan Sequencer::planStandard(const std::vector<juce::File>& inventory,
                                        const WeaveTypes::Pattern& pattern,
                                        bool realtime)
{
    Plan result;
    const int patternLength = static_cast<int>(pattern.size());
    RealtimeDropout dropout(realtime, patternLength + 1, patternLength);

    for (const auto& slice : inventory)
    {
        if (dropout.shouldDrop())
            result.dropped.push_back(slice);
        else
            result.kept.push_back(slice);
    }

    return result;
}

Sequencer::Plan Sequencer::planWeightedGrouped(const std::vector<juce::File>& inventory,
                                               const WeaveTypes::Pattern& pattern,
                                               bool realtime)
{
    Plan result;

    const auto patternIndexes = expandPattern(pattern);
    if (pattern.empty() || patternIndexes.empty())
    {
        result.unused = inventory;
        return result;
    }

    // Dealt by position in the listing, not by source
    const size_t numGroups = pattern.size();
    std::vector<std::deque<juce::File>> groups(numGroups);

    for (size_t i = 0; i < inventory.size(); ++i)
        groups[i % numGroups].push_back(inventory[i]);

    const size_t cycleLength = patternIndexes.size();
    const size_t numLoops = (inventory.size() + cycleLength - 1) / cycleLength;

    RealtimeDropout dropout(realtime, static_cast<int>(cycleLength) + 1, static_cast<int>(numGroups));

    for (size_t loop = 0; loop < numLoops; ++loop)
    {
        for (int group : patternIndexes)
        {
            auto& queue = groups[static_cast<size_t>(group)];
            if (queue.empty())
                continue;

            const juce::File slice = queue.front();
            queue.pop_front();

            if (dropout.shouldDrop())
                result.dropped.push_back(slice);
            else
                result.kept.push_back(slice);
        }
    }

    for (auto& queue : groups)
        result.unused.insert(result.unused.end(), queue.begin(), queue.end());

    return result;
}

Sequencer::Plan Sequencer::planRandom(const std::vector<juce::File>& inventory,
                                      const WeaveTypes::Pattern& pattern,
                                      bool realtime,
                                      juce::Random& random)
{
    std::vector<juce::File> shuffled(inventory);

    // Fisher-Yates
    for (int i = static_cast<int>(shuffled.size()) - 1; i > 0; --i)
        std::swap(shuffled[static_cast<size_t>(i)], shuffled[static_cast<size_t>(random.nextInt(i + 1))]);

    Plan result;
    size_t keepCount = shuffled.size();

    if (realtime && !pattern.empty())
        keepCount = shuffled.size() / pattern.size();

    result.kept.assign(shuffled.begin(), shuffled.begin() + static_cast<std::ptrdiff_t>(keepCount));
    result.dropped.assign(shuffled.begin() + static_cast<std::ptrdiff_t>(keepCount), shuffled.end());

    return result;
}

Sequencer::Plan Sequencer::plan(SequenceStrategy strategy,
                                const std::vector<juce::File>& inventory,
                                const WeaveTypes::Pattern& pattern,
                                bool realtime,
                                juce::Random& random)
{
    switch (strategy)
    {
        case SequenceStrategy::Standard:        return planStandard(inventory, pattern, realtime);
        case SequenceStrategy::WeightedGrouped: return planWeightedGrouped(inventory, pattern, realtime);
        case SequenceStrategy::Random:          return planRandom(inventory, pattern, realtime, random);
    }

    return planStandard(inventory, pattern, realtime);
}

//==============================================================================
WeaveStatus Sequencer::apply(const Plan& plan, WeaveTypes::SequencePlan& rendered)
{
    rendered.clear();
    rendered.reserve(plan.kept.size());

    for (size_t i = 0; i < plan.kept.size(); ++i)
    {
        const juce::File& slice = plan.kept[i];
        const juce::File target = workspace.getRenderFile(static_cast<int>(i));

        if (!slice.moveFileTo(target))
            return WeaveStatus::fail(ExitCode::renameFailed,
                                     "Failed to rename " + slice.getFileName() + " to " + target.getFileName());

        rendered.push_back(target);
    }

    numDropped = 0;

    auto discard = [this](const std::vector<juce::File>& files)
    {
        for (const auto& file : files)
        {
            if (!file.deleteFile() && logCallback)
                logCallback("WARNING: Failed to delete " + file.getFullPathName());

            ++numDropped;
        }
    };

    discard(plan.dropped);
    discard(plan.unused);

    return WeaveStatus::ok();
}

WeaveStatus Sequencer::weave(const WeaveTypes::Pattern& pattern,
                             bool realtime,
                             bool random,
                             juce::Random& randomSource,
                             WeaveTypes::SequencePlan& rendered)
{
    rendered.clear();

    if (pattern.empty())
        return WeaveStatus::fail(ExitCode::weaveFailed, "Empty pattern");

    for (int weight : pattern)
        if (weight <= 0)
            return WeaveStatus::fail(ExitCode::weaveFailed, "Pattern weights must be positive");

    const auto inventory = workspace.listExportedSlices();
    if (inventory.empty())
        return WeaveStatus::fail(ExitCode::weaveFailed, "No slices found in " + workspace.getRoot().getFullPathName());

    const SequenceStrategy strategy = selectStrategy(pattern, random);

    if (logCallback)
        logCallback("Weaving " + juce::String((int) inventory.size()) + " slices ("
                    + WeaveTypes::getStrategyName(strategy) + (realtime ? ", realtime" : "") + ")");

    const Plan result = plan(strategy, inventory, pattern, realtime, randomSource);

    if (!result.unused.empty() && logCallback)
        logCallback("WARNING: " + juce::String((int) result.unused.size()) + " slices were not reached by the pattern cycle");

    const WeaveStatus status = apply(result, rendered);
    if (status.failed())
        return status;

    if (rendered.empty())
        return WeaveStatus::fail(ExitCode::weaveFailed, "Every slice was dropped");

    if (logCallback)
        logCallback("Kept " + juce::String((int) rendered.size()) + " slices, dropped " + juce::String(numDropped));

    return WeaveStatus::ok();
}
