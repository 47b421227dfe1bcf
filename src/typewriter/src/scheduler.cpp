#include "inkwell/typewriter/scheduler.hpp"
#include "inkwell/core/logger.hpp"
#include <algorithm>
#include <chrono>

namespace inkwell::typewriter {

// ============================================================================
// Clocks
// ============================================================================

f64 SteadyClock::now_ms() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<f64, std::milli>(now.time_since_epoch()).count();
}

std::string_view suspension_kind_name(SuspensionKind kind) {
    switch (kind) {
        case SuspensionKind::Pacing:   return "pacing";
        case SuspensionKind::Delay:    return "delay";
        case SuspensionKind::External: return "external";
    }
    return "unknown";
}

// ============================================================================
// Scheduler
// ============================================================================

Scheduler::Scheduler(Clock& clock) : m_clock(clock) {}

Scheduler::~Scheduler() {
    cancel_all();
}

SuspensionId Scheduler::schedule(f64 delay_ms, SuspensionKind kind, Callback callback) {
    f64 delay = std::max(delay_ms, 0.0);
    return install(kind, m_clock.now_ms() + delay, std::move(callback));
}

SuspensionId Scheduler::suspend(Callback callback) {
    return install(SuspensionKind::External, std::nullopt, std::move(callback));
}

SuspensionId Scheduler::install(SuspensionKind kind, std::optional<f64> deadline, Callback callback) {
    if (m_slot) {
        logging::get("scheduler").debug_fmt("Replacing outstanding {} suspension #{}",
            suspension_kind_name(m_slot->kind), m_slot->id);
    }

    SuspensionId id = m_next_id++;
    if (m_next_id == NO_SUSPENSION) {
        m_next_id = 1;
    }

    m_slot = Slot{id, kind, deadline, std::move(callback)};
    return id;
}

bool Scheduler::resolve(SuspensionId id) {
    if (!m_slot || m_slot->id != id) {
        return false;
    }

    // Clear the slot first; the callback usually schedules the next step
    auto callback = std::move(m_slot->callback);
    m_slot.reset();

    if (callback) {
        callback();
    }
    return true;
}

void Scheduler::cancel(SuspensionId id) {
    if (m_slot && m_slot->id == id) {
        m_slot.reset();
    }
}

void Scheduler::cancel_all() {
    m_slot.reset();
}

bool Scheduler::process() {
    if (!m_slot || !m_slot->deadline) {
        return false;
    }
    if (m_clock.now_ms() < *m_slot->deadline) {
        return false;
    }
    return resolve(m_slot->id);
}

std::optional<SuspensionId> Scheduler::pending_id() const {
    if (!m_slot) return std::nullopt;
    return m_slot->id;
}

std::optional<SuspensionKind> Scheduler::pending_kind() const {
    if (!m_slot) return std::nullopt;
    return m_slot->kind;
}

std::optional<f64> Scheduler::next_deadline() const {
    if (!m_slot) return std::nullopt;
    return m_slot->deadline;
}

} // namespace inkwell::typewriter
