#pragma once

#include "status/BuffTypes.hpp"
#include "engine/Ticker.hpp"

#include <cstdint>
#include <string>

namespace tickwell {

class BuffTimerService;

/// Runtime state of one tracked buff. Owned by BuffTimerService; entities
/// never own their buff instances.
///
/// Countdown invariant: remainingTicks() is in [1, intervalTicks()] for
/// recurring buffs, in [1, durationTicks()] for finite buffs, and exactly
/// IndefiniteTicks for indefinite buffs.
class BuffTimerInstance {
public:
    BuffTimerInstance(const BuffEventContext& ctx, uint64_t sequenceId, double tickPeriod);

    const BuffKey& key() const { return m_key; }
    Entity entity() const { return m_key.entity; }
    BuffKind kind() const { return m_key.kind; }
    const BuffDefinition& definition() const { return m_definition; }
    BuffSourceType sourceType() const { return m_sourceType; }
    const std::string& sourceId() const { return m_sourceId; }

    int64_t remainingTicks() const { return m_remainingTicks; }
    int64_t durationTicks() const { return m_durationTicks; }
    int64_t intervalTicks() const { return m_intervalTicks; }
    int64_t warningTicks() const { return m_warningTicks; }
    uint64_t sequenceId() const { return m_sequenceId; }

    bool isRecurring() const { return m_definition.isRecurring; }
    bool hasDuration() const { return m_durationTicks > 0; }
    bool isIndefinite() const { return m_durationTicks < 0 && !m_definition.isRecurring; }
    bool canWarn() const { return m_definition.showExpiryWarning && m_warningTicks > 0; }
    std::string displayName() const { return m_definition.resolveDisplayName(); }

    /// Normalised elapsed fraction of a finite buff, for presentation.
    /// Recurring and indefinite buffs report 0.
    float progress01() const;

private:
    friend class BuffTimerService;

    /// Replace the definition and source metadata. Resets the countdown on
    /// creation or when ctx.resetTimer is set; otherwise keeps it, pulling
    /// it back into range if the new definition invalidates it.
    void applyContext(const BuffEventContext& ctx, bool initial);

    /// Reset the countdown from the current definition
    void resetTimer();

    /// Set an explicit countdown, clamped into the invariant range
    void restoreRemaining(int64_t remainingTicks);

    /// Advance one tick. Returns true when a recurring cycle wrapped or a
    /// finite countdown reached zero.
    bool step();

    int64_t resolveWarningTicks() const;

    BuffKey m_key;
    BuffDefinition m_definition;
    BuffSourceType m_sourceType = BuffSourceType::Scripted;
    std::string m_sourceId;
    int64_t m_remainingTicks = IndefiniteTicks;
    int64_t m_durationTicks = IndefiniteTicks;
    int64_t m_intervalTicks = 0;
    int64_t m_warningTicks = 0;
    uint64_t m_sequenceId = 0;
    double m_tickPeriod = DefaultTickPeriod;
};

} // namespace tickwell
