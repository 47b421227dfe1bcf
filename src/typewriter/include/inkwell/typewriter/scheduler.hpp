#pragma once

#include "inkwell/core/types.hpp"
#include <functional>
#include <optional>
#include <string_view>

namespace inkwell::typewriter {

// ============================================================================
// Clocks
// ============================================================================

class Clock {
public:
    virtual ~Clock() = default;

    // Milliseconds from an arbitrary, monotonic origin
    [[nodiscard]] virtual f64 now_ms() const = 0;
};

class SteadyClock : public Clock {
public:
    [[nodiscard]] f64 now_ms() const override;
};

// Time only moves when told to; used by tests and offline rendering
class ManualClock : public Clock {
public:
    [[nodiscard]] f64 now_ms() const override { return m_now; }

    void advance(f64 ms) { m_now += ms; }
    void set(f64 ms) { m_now = ms; }

private:
    f64 m_now{0};
};

// ============================================================================
// Scheduler - single-slot suspension primitive
// ============================================================================
//
// Holds at most one outstanding suspension. A timed suspension fires from
// process() once its deadline has passed; an external suspension has no
// deadline and only ends through resolve(). Either kind can be cancelled
// (callback dropped) or forced (callback run now).

enum class SuspensionKind : u8 {
    Pacing,    // between two literal tokens
    Delay,     // [@delay:...]
    External,  // waiting on an asynchronous completion
};

[[nodiscard]] std::string_view suspension_kind_name(SuspensionKind kind);

using SuspensionId = u32;
constexpr SuspensionId NO_SUSPENSION = 0;

class Scheduler {
public:
    using Callback = std::function<void()>;

    explicit Scheduler(Clock& clock);
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Replaces (cancels) any suspension already outstanding
    SuspensionId schedule(f64 delay_ms, SuspensionKind kind, Callback callback);
    SuspensionId suspend(Callback callback);

    // Runs the callback if `id` is still outstanding. Returns whether it ran.
    bool resolve(SuspensionId id);
    bool force_resolve(SuspensionId id) { return resolve(id); }

    void cancel(SuspensionId id);
    void cancel_all();

    // Fires the outstanding timer when due. Returns whether it fired.
    bool process();

    [[nodiscard]] bool has_pending() const { return m_slot.has_value(); }
    [[nodiscard]] std::optional<SuspensionId> pending_id() const;
    [[nodiscard]] std::optional<SuspensionKind> pending_kind() const;
    [[nodiscard]] std::optional<f64> next_deadline() const;

    [[nodiscard]] Clock& clock() const { return m_clock; }

private:
    struct Slot {
        SuspensionId id;
        SuspensionKind kind;
        std::optional<f64> deadline;
        Callback callback;
    };

    SuspensionId install(SuspensionKind kind, std::optional<f64> deadline, Callback callback);

    Clock& m_clock;
    std::optional<Slot> m_slot;
    SuspensionId m_next_id{1};
};

} // namespace inkwell::typewriter
