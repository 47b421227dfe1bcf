#pragma once

#include <gtest/gtest.h>
#include "inkwell/typewriter/engine.hpp"

#include <algorithm>
#include <memory>
#include <vector>

namespace inkwell::typewriter::test_support {

// Engine on an in-memory surface with a clock that only moves when asked
class EngineFixture : public ::testing::Test {
protected:
    BufferSurface surface;
    ManualClock clock;
    std::unique_ptr<Engine> engine;

    int starts{0};
    int typed{0};
    int finishes{0};
    int halts{0};

    // Options with counting hooks; speed 0 unless a test needs pacing
    EngineOptions counting_options(f64 speed = 0) {
        EngineOptions options;
        options.speed = speed;
        options.on_start = [this](const PlaybackView&) { ++starts; };
        options.on_typing = [this](const PlaybackView&) { ++typed; };
        options.on_finish = [this](const PlaybackView&) { ++finishes; };
        options.on_halt = [this](const PlaybackView&) { ++halts; };
        return options;
    }

    Engine& make_engine(EngineOptions options) {
        engine = std::make_unique<Engine>(surface, clock, std::move(options));
        return *engine;
    }

    Engine& make_engine() {
        return make_engine(counting_options());
    }

    // Fires every timer in deadline order, moving the clock forward as needed.
    // Stops when nothing timed is left (finished, halted, or waiting on a
    // completion). Returns the non-zero clock jumps that were made.
    std::vector<f64> run_timers(usize limit = 100000) {
        std::vector<f64> jumps;
        for (usize i = 0; i < limit; ++i) {
            engine->process_tasks();
            auto next = engine->next_task_time();
            if (!next) {
                break;
            }
            f64 jump = std::max(*next - clock.now_ms(), 0.0);
            if (jump > 0) {
                jumps.push_back(jump);
                clock.advance(jump);
            }
        }
        return jumps;
    }

    [[nodiscard]] bool has_diagnostic(const String& message) const {
        const auto& diagnostics = engine->diagnostics().diagnostics();
        return std::any_of(diagnostics.begin(), diagnostics.end(), [&](const Diagnostic& d) {
            return d.message == message;
        });
    }
};

} // namespace inkwell::typewriter::test_support
