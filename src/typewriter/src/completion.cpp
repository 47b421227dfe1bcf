#include "inkwell/typewriter/completion.hpp"

namespace inkwell::typewriter {

Completion::Completion() : m_state(std::make_shared<State>()) {}

Completion Completion::resolved(Value value) {
    Completion completion;
    completion.resolve(std::move(value));
    return completion;
}

Completion Completion::rejected(String error) {
    Completion completion;
    completion.reject(std::move(error));
    return completion;
}

void Completion::resolve(Value value) {
    Settlement settlement;
    settlement.fulfilled = true;
    settlement.value = std::move(value);
    settle(std::move(settlement));
}

void Completion::reject(String error) {
    Settlement settlement;
    settlement.fulfilled = false;
    settlement.error = std::move(error);
    settle(std::move(settlement));
}

bool Completion::is_settled() const {
    return m_state->settlement.has_value();
}

std::optional<Settlement> Completion::settlement() const {
    return m_state->settlement;
}

void Completion::on_settled(SettledCallback callback) {
    if (!callback) {
        return;
    }
    if (m_state->settlement) {
        callback(*m_state->settlement);
        return;
    }
    m_state->callbacks.push_back(std::move(callback));
}

void Completion::settle(Settlement settlement) {
    if (m_state->settlement) {
        return;
    }

    // Keep the state alive while callbacks run; they may drop other copies
    auto state = m_state;
    state->settlement = std::move(settlement);

    auto callbacks = std::move(state->callbacks);
    state->callbacks.clear();
    for (auto& callback : callbacks) {
        callback(*state->settlement);
    }
}

} // namespace inkwell::typewriter
