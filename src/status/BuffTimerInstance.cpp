#include "status/BuffTimerInstance.hpp"

#include <algorithm>

namespace tickwell {

BuffTimerInstance::BuffTimerInstance(const BuffEventContext& ctx, uint64_t sequenceId, double tickPeriod)
    : m_key(ctx.entity, ctx.definition.kind)
    , m_sequenceId(sequenceId)
    , m_tickPeriod(tickPeriod > 0.0 ? tickPeriod : DefaultTickPeriod) {
    applyContext(ctx, true);
}

void BuffTimerInstance::applyContext(const BuffEventContext& ctx, bool initial) {
    const bool wasRecurring = m_definition.isRecurring;
    const int64_t previousInterval = m_intervalTicks;

    m_definition = ctx.definition.normalized();
    m_definition.kind = m_key.kind;
    m_sourceType = ctx.sourceType;
    m_sourceId = ctx.sourceId.empty() ? std::string(buffKindToString(m_key.kind)) : ctx.sourceId;
    m_durationTicks = m_definition.durationTicks(m_tickPeriod);
    m_intervalTicks = m_definition.isRecurring ? m_definition.intervalTicks(m_tickPeriod) : 0;
    m_warningTicks = resolveWarningTicks();

    if (initial || ctx.resetTimer) {
        resetTimer();
        return;
    }

    if (m_definition.isRecurring) {
        // A changed cycle length invalidates the countdown entirely
        if (wasRecurring && previousInterval != m_intervalTicks) {
            resetTimer();
        } else if (m_remainingTicks <= 0 || m_remainingTicks > m_intervalTicks) {
            m_remainingTicks = std::max<int64_t>(1, m_intervalTicks);
        }
    } else if (m_durationTicks > 0) {
        if (m_remainingTicks <= 0) {
            resetTimer();
        } else if (m_remainingTicks > m_durationTicks) {
            m_remainingTicks = m_durationTicks;
        }
    } else {
        m_remainingTicks = IndefiniteTicks;
    }
}

void BuffTimerInstance::resetTimer() {
    if (m_definition.isRecurring) {
        m_remainingTicks = std::max<int64_t>(1, m_intervalTicks);
    } else if (m_durationTicks > 0) {
        m_remainingTicks = m_durationTicks;
    } else {
        m_remainingTicks = IndefiniteTicks;
    }
}

void BuffTimerInstance::restoreRemaining(int64_t remainingTicks) {
    if (m_definition.isRecurring) {
        m_remainingTicks = std::clamp<int64_t>(remainingTicks, 1, std::max<int64_t>(1, m_intervalTicks));
    } else if (m_durationTicks > 0) {
        m_remainingTicks = std::clamp<int64_t>(remainingTicks, 1, m_durationTicks);
    } else {
        m_remainingTicks = IndefiniteTicks;
    }
}

bool BuffTimerInstance::step() {
    if (isIndefinite()) return false;

    if (m_definition.isRecurring) {
        m_remainingTicks = std::max<int64_t>(0, m_remainingTicks - 1);
        if (m_remainingTicks <= 0) {
            resetTimer();
            return true;
        }
        return false;
    }

    if (!hasDuration()) return false;

    m_remainingTicks = std::max<int64_t>(0, m_remainingTicks - 1);
    return m_remainingTicks <= 0;
}

float BuffTimerInstance::progress01() const {
    if (m_definition.isRecurring || m_durationTicks <= 0) return 0.0f;
    float elapsed = 1.0f - static_cast<float>(m_remainingTicks) / static_cast<float>(m_durationTicks);
    return std::clamp(elapsed, 0.0f, 1.0f);
}

int64_t BuffTimerInstance::resolveWarningTicks() const {
    if (!m_definition.showExpiryWarning) return 0;
    if (m_definition.expiryWarningTicks > 0) return m_definition.expiryWarningTicks;
    if (m_durationTicks <= 0) return 0;
    // Default to 10% of the duration, never the full duration for short buffs
    return std::clamp<int64_t>(m_durationTicks / 10, 1, std::max<int64_t>(1, m_durationTicks - 1));
}

} // namespace tickwell
