#pragma once

#include "inkwell/core/types.hpp"
#include "inkwell/core/string.hpp"
#include "inkwell/typewriter/context.hpp"
#include "inkwell/typewriter/diagnostic.hpp"
#include "inkwell/typewriter/directive.hpp"
#include "inkwell/typewriter/scheduler.hpp"
#include "inkwell/typewriter/surface.hpp"
#include "inkwell/typewriter/tokenizer.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace inkwell::typewriter {

enum class Status : u8 {
    Idle,
    Typing,
    Paused,
    Skipping,
    Halted,   // loop guard tripped; only write() leaves this state
};

[[nodiscard]] std::string_view status_name(Status status);

struct Progress {
    f64 raw{0};
    String percent;
};

class Engine;

// Read-only window onto the running session, handed to hooks
class PlaybackView {
public:
    explicit PlaybackView(const Engine& engine) : m_engine(engine) {}

    [[nodiscard]] const std::vector<Token>& tokens() const;
    [[nodiscard]] usize cursor() const;
    [[nodiscard]] Progress progress() const;
    [[nodiscard]] Status status() const;
    [[nodiscard]] f64 speed() const;

private:
    const Engine& m_engine;
};

using Hook = std::function<void(const PlaybackView& view)>;

struct EngineOptions {
    // Milliseconds between two literal tokens
    f64 speed = 25;

    // Consecutive steps without literal output before playback halts
    usize max_executions = 1000;

    Hook on_start;
    Hook on_typing;
    Hook on_finish;
    Hook on_halt;
};

// ============================================================================
// Engine - types text token by token and interprets embedded directives
// ============================================================================
//
// Single-threaded. The host drives time by calling process_tasks(), usually
// after sleeping until next_task_time(). Asynchronous functions resume the
// engine from whatever thread-of-control settles their Completion, which must
// be the host's.

class Engine {
public:
    Engine(Surface& surface, Clock& clock, EngineOptions options = {});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Playback control
    void write(const String& text);
    void pause();
    void resume();
    void skip();

    // Registration
    void set_variable(const String& key, Value value) { m_context.set_variable(key, std::move(value)); }
    void set_function(const String& key, SyncFunction fn) { m_context.set_function(key, std::move(fn)); }
    void set_async_function(const String& key, AsyncFunction fn) { m_context.set_async_function(key, std::move(fn)); }
    void set_alias(const String& key, const String& target_function, AliasKind kind = AliasKind::Run) {
        m_context.set_alias(key, target_function, kind);
    }

    [[nodiscard]] Context& context() { return m_context; }
    [[nodiscard]] const Context& context() const { return m_context; }

    [[nodiscard]] bool is_only_directives(const String& text) const;

    // Host event loop integration
    void process_tasks();
    [[nodiscard]] std::optional<f64> next_task_time() const;
    [[nodiscard]] bool has_pending_task() const { return m_scheduler.has_pending(); }

    // State
    [[nodiscard]] Status status() const { return m_state.status; }
    [[nodiscard]] f64 speed() const { return m_speed; }
    [[nodiscard]] const std::vector<Token>& tokens() const { return m_state.tokens; }
    [[nodiscard]] usize cursor() const { return m_state.cursor; }
    [[nodiscard]] Progress progress() const;
    [[nodiscard]] PlaybackView view() const { return PlaybackView(*this); }

    [[nodiscard]] const DiagnosticSink& diagnostics() const { return m_diagnostics; }

private:
    // Everything a single write() session owns
    struct PlaybackState {
        std::vector<Token> tokens;
        usize cursor{0};
        Status status{Status::Idle};
        usize executions{0};
        SuspensionId suspension{NO_SUSPENSION};
        bool directive_wait{false};
        bool executing{false};
        bool looping{false};    // a run_loop frame is on the stack
    };

    enum class StepResult {
        Done,       // directive finished; advance and continue
        Suspended,  // a wait continuation will advance and continue
    };

    void run_loop();
    void type_token();
    void finish();
    void halt();
    void abort_detached();
    void reset_session();

    StepResult execute_directive(const Directive& directive);
    StepResult dispatch(const ResolvedDirective& directive);
    StepResult execute_function(const ResolvedDirective& directive);
    StepResult wait_for(Completion completion, const String& function_name);
    void watch_for_rejection(Completion completion, const String& function_name);
    void begin_directive_wait(SuspensionId id);
    void on_directive_wait_resolved(u64 session);

    // Splices text in right after the cursor
    void inject(const String& text);
    void fire_hook(const Hook& hook, std::string_view name);

    void report_unknown(const Directive& directive);
    void report_rejection(const String& function_name, const String& error);
    void report(DiagnosticStage stage, DiagnosticLevel level, String message);

    Surface& m_surface;
    EngineOptions m_options;
    Scheduler m_scheduler;
    Tokenizer m_tokenizer;
    Context m_context;
    DiagnosticSink m_diagnostics;

    PlaybackState m_state;
    f64 m_speed;

    // Bumped whenever the session is reset; stale continuations compare against it
    u64 m_session{0};

    // Lets completions that outlive the engine detect it
    std::shared_ptr<bool> m_lifetime;
};

} // namespace inkwell::typewriter
