#pragma once
#include <JuceHeader.h>
#include "WeaveTypes.h"
#include "Workspace.h"

//==============================================================================
/**
 * Period based thinning used by realtime mode.
 *
 * Every consumed element decrements a countdown. When it reaches zero the
 * skip flag flips and the countdown restarts at the period. The first period
 * is usually one longer than the rest, so with period k the flag flips on
 * element k+1, then every k elements after that. Elements consumed while the
 * flag is set are dropped.
 */
class RealtimeDropout
{
public:
    RealtimeDropout(bool enabled, int firstPeriod, int period) noexcept;

    /** Consumes one element and returns true if it should be dropped. */
    bool shouldDrop() noexcept;

private:
    bool enabled;
    bool skip = false;
    int countdown;
    int period;
};

//==============================================================================
/**
 * Reorders and thins the extracted slices, then renames the survivors into a
 * single gapless render_<index> sequence.
 *
 * Planning is pure and works on the sorted slice listing; apply() is the only
 * part that touches the disk.
 */
class Sequencer
{
public:
    /** Outcome of planning, before anything is renamed or deleted */
    struct Plan
    {
        std::vector<juce::File> kept;       // In render order
        std::vector<juce::File> dropped;    // Removed by realtime thinning
        std::vector<juce::File> unused;     // Never reached by the weighted loop count
    };

    explicit Sequencer(const Workspace& workspace);
    ~Sequencer();

    void setLogCallback(std::function<void(const juce::String&)> logCallback);

    /** Random wins; otherwise any weight other than 1 selects weighted grouping. */
    static WeaveTypes::SequenceStrategy selectStrategy(const WeaveTypes::Pattern& pattern, bool random);

    /**
     * Flattens a pattern into group indices, group g repeated pattern[g] times.
     * [2, 1, 3] becomes [0, 0, 1, 2, 2, 2].
     */
    static std::vector<int> expandPattern(const WeaveTypes::Pattern& pattern);

    /** Keeps the listing order, thinning it in realtime mode. */
    static Plan planStandard(const std::vector<juce::File>& inventory,
                             const WeaveTypes::Pattern& pattern,
                             bool realtime);

    /**
     * Deals the listing round robin into pattern.size() groups, then draws from
     * the groups following the expanded pattern for ceil(total / expanded size)
     * cycles. An exhausted group contributes nothing to the rest of the cycle.
     */
    static Plan planWeightedGrouped(const std::vector<juce::File>& inventory,
                                    const WeaveTypes::Pattern& pattern,
                                    bool realtime);

    /**
     * Shuffles the listing. In realtime mode only the first
     * floor(total / pattern.size()) shuffled slices are kept.
     */
    static Plan planRandom(const std::vector<juce::File>& inventory,
                           const WeaveTypes::Pattern& pattern,
                           bool realtime,
                           juce::Random& random);

    /** Dispatches to the planner for a strategy. */
    static Plan plan(WeaveTypes::SequenceStrategy strategy,
                     const std::vector<juce::File>& inventory,
                     const WeaveTypes::Pattern& pattern,
                     bool realtime,
                     juce::Random& random);

    /**
     * Renames kept slices to render_00000, render_00001, ... and deletes the
     * rest. A failed rename is fatal; a failed delete is only logged.
     */
    WeaveTypes::WeaveStatus apply(const Plan& plan, WeaveTypes::SequencePlan& rendered);

    /**
     * Lists the workspace, plans with the selected strategy and applies the plan.
     * @param rendered Receives the renamed files in render order
     */
    WeaveTypes::WeaveStatus weave(const WeaveTypes::Pattern& pattern,
                                  bool realtime,
                                  bool random,
                                  juce::Random& randomSource,
                                  WeaveTypes::SequencePlan& rendered);

    int getNumDropped() const { return numDropped; }

private:
    const Workspace& workspace;
    int numDropped = 0;

    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(Sequencer)
};
