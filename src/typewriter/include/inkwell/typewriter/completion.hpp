#pragma once

#include "inkwell/typewriter/value.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace inkwell::typewriter {

// Outcome of an asynchronous function
struct Settlement {
    bool fulfilled{true};
    Value value;
    String error;
};

// ============================================================================
// Completion - settle-once result of an asynchronous function
// ============================================================================
//
// Copies share one state. The producer keeps a copy and calls resolve() or
// reject() later; the engine waits on another copy via on_settled().
// Only the first settlement counts.

class Completion {
public:
    using SettledCallback = std::function<void(const Settlement&)>;

    Completion();

    [[nodiscard]] static Completion resolved(Value value = {});
    [[nodiscard]] static Completion rejected(String error);

    void resolve(Value value = {});
    void reject(String error);

    [[nodiscard]] bool is_settled() const;
    [[nodiscard]] std::optional<Settlement> settlement() const;

    // Runs immediately when already settled
    void on_settled(SettledCallback callback);

private:
    struct State {
        std::optional<Settlement> settlement;
        std::vector<SettledCallback> callbacks;
    };

    void settle(Settlement settlement);

    std::shared_ptr<State> m_state;
};

} // namespace inkwell::typewriter
