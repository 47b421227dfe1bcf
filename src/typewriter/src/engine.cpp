#include "inkwell/typewriter/engine.hpp"
#include "inkwell/typewriter/error.hpp"
#include "inkwell/core/logger.hpp"
#include <algorithm>
#include <cmath>

namespace inkwell::typewriter {

namespace {

Logger& typewriter_log() {
    return logging::get("typewriter");
}

// Sets a flag for the guard's lifetime and restores the previous value on exit
class FlagScope {
public:
    explicit FlagScope(bool& flag) : m_flag(flag), m_previous(flag) { m_flag = true; }
    ~FlagScope() { m_flag = m_previous; }

    FlagScope(const FlagScope&) = delete;
    FlagScope& operator=(const FlagScope&) = delete;

private:
    bool& m_flag;
    bool m_previous;
};

} // anonymous namespace

std::string_view status_name(Status status) {
    switch (status) {
        case Status::Idle:     return "idle";
        case Status::Typing:   return "typing";
        case Status::Paused:   return "paused";
        case Status::Skipping: return "skipping";
        case Status::Halted:   return "halted";
    }
    return "unknown";
}

// ============================================================================
// PlaybackView
// ============================================================================

const std::vector<Token>& PlaybackView::tokens() const { return m_engine.tokens(); }
usize PlaybackView::cursor() const { return m_engine.cursor(); }
Progress PlaybackView::progress() const { return m_engine.progress(); }
Status PlaybackView::status() const { return m_engine.status(); }
f64 PlaybackView::speed() const { return m_engine.speed(); }

// ============================================================================
// Construction
// ============================================================================

Engine::Engine(Surface& surface, Clock& clock, EngineOptions options)
    : m_surface(surface)
    , m_options(std::move(options))
    , m_scheduler(clock)
    , m_speed(m_options.speed)
    , m_lifetime(std::make_shared<bool>(true)) {
    if (!std::isfinite(m_options.speed) || m_options.speed < 0) {
        throw ConfigurationError("Invalid 'speed' value. It must be a non-negative number."_s);
    }
    if (m_options.max_executions == 0) {
        throw ConfigurationError("Invalid 'max_executions' value. It must be positive."_s);
    }

    m_tokenizer.set_warning_callback([this](const String& message) {
        m_diagnostics.add(DiagnosticStage::Tokenizer, DiagnosticLevel::Warning, message);
    });
}

Engine::~Engine() {
    m_scheduler.cancel_all();
}

// ============================================================================
// Playback control
// ============================================================================

void Engine::write(const String& text) {
    reset_session();
    m_diagnostics.clear();

    m_state.tokens = m_tokenizer.tokenize(text);
    m_state.status = Status::Typing;
    typewriter_log().debug_fmt("Starting playback of {} tokens", m_state.tokens.size());

    const u64 session = m_session;
    FlagScope looping(m_state.looping);
    fire_hook(m_options.on_start, "on_start");
    if (session != m_session) {
        return;
    }

    run_loop();
}

void Engine::pause() {
    if (m_state.status != Status::Typing) {
        return;
    }

    // A delay or async wait keeps running; only the pacing timer is dropped
    if (m_state.suspension != NO_SUSPENSION && !m_state.directive_wait) {
        m_scheduler.cancel(m_state.suspension);
        m_state.suspension = NO_SUSPENSION;
    }
    m_state.status = Status::Paused;
}

void Engine::resume() {
    if (m_state.status != Status::Paused) {
        return;
    }

    m_state.status = Status::Typing;
    // A wait continuation or the frame already stepping picks playback back up
    if (m_state.directive_wait || m_state.looping) {
        return;
    }
    run_loop();
}

void Engine::skip() {
    if (m_state.status != Status::Typing) {
        return;
    }
    if (!m_surface.is_attached()) {
        return;
    }

    const u64 session = m_session;
    m_state.status = Status::Skipping;

    // Called from inside a function the current directive is running
    if (m_state.executing) {
        ++m_state.cursor;
    }

    if (m_state.suspension != NO_SUSPENSION) {
        if (m_state.directive_wait) {
            // The continuation steps past the directive that was waiting
            m_scheduler.force_resolve(m_state.suspension);
        } else {
            m_scheduler.cancel(m_state.suspension);
            m_state.suspension = NO_SUSPENSION;
        }
    }

    StringBuilder pending;
    while (m_state.cursor < m_state.tokens.size()) {
        if (++m_state.executions > m_options.max_executions) {
            report(DiagnosticStage::Engine, DiagnosticLevel::Error,
                   "Skip aborted due to a potential infinite loop."_s);
            break;
        }

        const Token& token = m_state.tokens[m_state.cursor];
        if (!is_directive_token(token)) {
            pending.append(token);
            ++m_state.cursor;
            m_state.executions = 0;
            continue;
        }

        Directive directive = parse_directive(token);
        auto resolved = m_context.resolve(directive);
        if (!resolved) {
            report_unknown(directive);
        } else if (!is_suspending(resolved->type)) {
            dispatch(*resolved);
            if (session != m_session || m_state.status != Status::Skipping) {
                return;
            }
        }
        ++m_state.cursor;
    }

    if (!pending.empty()) {
        m_surface.append(pending.build());
    }
    finish();
}

bool Engine::is_only_directives(const String& text) const {
    return m_tokenizer.is_only_directives(text);
}

// ============================================================================
// Host event loop integration
// ============================================================================

void Engine::process_tasks() {
    while (m_scheduler.process()) {
    }
}

std::optional<f64> Engine::next_task_time() const {
    return m_scheduler.next_deadline();
}

Progress Engine::progress() const {
    Progress progress;
    if (!m_state.tokens.empty()) {
        progress.raw = static_cast<f64>(m_state.cursor) / static_cast<f64>(m_state.tokens.size());
    }
    progress.percent = String(std::format("{}%", std::lround(progress.raw * 100)));
    return progress;
}

// ============================================================================
// Step loop
// ============================================================================

void Engine::run_loop() {
    const u64 session = m_session;
    FlagScope looping(m_state.looping);

    while (m_state.status == Status::Typing) {
        if (!m_surface.is_attached()) {
            abort_detached();
            return;
        }

        if (++m_state.executions > m_options.max_executions) {
            halt();
            return;
        }

        if (m_state.cursor >= m_state.tokens.size()) {
            finish();
            return;
        }

        if (!is_directive_token(m_state.tokens[m_state.cursor])) {
            type_token();
            if (session != m_session || m_state.status != Status::Typing) {
                return;
            }
            m_state.suspension = m_scheduler.schedule(m_speed, SuspensionKind::Pacing, [this, session]() {
                if (session != m_session) {
                    return;
                }
                m_state.suspension = NO_SUSPENSION;
                run_loop();
            });
            return;
        }

        m_state.executing = true;
        StepResult result = execute_directive(parse_directive(m_state.tokens[m_state.cursor]));
        if (session != m_session) {
            return;
        }
        m_state.executing = false;

        if (result == StepResult::Suspended) {
            return;
        }
        ++m_state.cursor;
    }
}

void Engine::type_token() {
    m_surface.append(m_state.tokens[m_state.cursor]);
    ++m_state.cursor;
    m_state.executions = 0;
    fire_hook(m_options.on_typing, "on_typing");
}

void Engine::finish() {
    m_state.status = Status::Idle;
    typewriter_log().debug("Playback finished");

    const u64 session = m_session;
    fire_hook(m_options.on_finish, "on_finish");
    if (session == m_session) {
        reset_session();
    }
}

void Engine::halt() {
    m_state.status = Status::Halted;
    if (m_state.suspension != NO_SUSPENSION) {
        m_scheduler.cancel(m_state.suspension);
        m_state.suspension = NO_SUSPENSION;
        m_state.directive_wait = false;
    }

    report(DiagnosticStage::Engine, DiagnosticLevel::Error,
           "Execution stopped due to a potential infinite loop."_s);
    fire_hook(m_options.on_halt, "on_halt");
}

void Engine::abort_detached() {
    report(DiagnosticStage::Engine, DiagnosticLevel::Warning,
           "Output surface is no longer attached. Execution aborted."_s);
    m_state.status = Status::Idle;
    reset_session();
}

void Engine::reset_session() {
    ++m_session;

    // Waits of the old session are resolved; their continuations see a stale session
    SuspensionId pending = m_state.suspension;
    bool directive_wait = m_state.directive_wait;
    m_state.suspension = NO_SUSPENSION;
    m_state.directive_wait = false;
    if (pending != NO_SUSPENSION) {
        if (directive_wait) {
            m_scheduler.force_resolve(pending);
        } else {
            m_scheduler.cancel(pending);
        }
    }
    m_scheduler.cancel_all();

    m_state.tokens.clear();
    m_state.cursor = 0;
    m_state.executions = 0;
    m_state.executing = false;
}

// ============================================================================
// Directive dispatch
// ============================================================================

Engine::StepResult Engine::execute_directive(const Directive& directive) {
    auto resolved = m_context.resolve(directive);
    if (!resolved) {
        report_unknown(directive);
        return StepResult::Done;
    }
    return dispatch(*resolved);
}

Engine::StepResult Engine::dispatch(const ResolvedDirective& directive) {
    if (m_state.status != Status::Typing && m_state.status != Status::Skipping) {
        return StepResult::Done;
    }

    const String& value = directive.value;
    if (value.empty()) {
        return StepResult::Done;
    }

    switch (directive.type) {
        case DirectiveType::Speed: {
            auto speed = parse_duration(value);
            if (!speed) {
                report(DiagnosticStage::Directive, DiagnosticLevel::Warning, String(std::format(
                    "Invalid speed value '{}' ({}). Directive ignored.", value, speed.error())));
                return StepResult::Done;
            }
            m_speed = speed.value();
            return StepResult::Done;
        }

        case DirectiveType::Delay: {
            auto delay = parse_duration(value);
            if (!delay) {
                report(DiagnosticStage::Directive, DiagnosticLevel::Warning, String(std::format(
                    "Invalid delay value '{}' ({}). Directive ignored.", value, delay.error())));
                return StepResult::Done;
            }
            const u64 session = m_session;
            begin_directive_wait(m_scheduler.schedule(delay.value(), SuspensionKind::Delay, [this, session]() {
                on_directive_wait_resolved(session);
            }));
            return StepResult::Suspended;
        }

        case DirectiveType::Var: {
            const Value* variable = m_context.find_variable(value);
            if (!variable) {
                report(DiagnosticStage::Directive, DiagnosticLevel::Warning, String(std::format(
                    "Variable '{}' is not defined.", value)));
                return StepResult::Done;
            }
            inject(variable->to_display_string());
            return StepResult::Done;
        }

        case DirectiveType::Run:
        case DirectiveType::Async:
        case DirectiveType::Eval:
            return execute_function(directive);
    }

    return StepResult::Done;
}

Engine::StepResult Engine::execute_function(const ResolvedDirective& directive) {
    FunctionCall call = unwrap_function_call(directive.value);

    const Callable* found = m_context.find_function(call.function_name);
    if (!found) {
        report(DiagnosticStage::Directive, DiagnosticLevel::Warning, String(std::format(
            "Function '{}' is not defined or not callable.", call.function_name)));
        return StepResult::Done;
    }

    if (directive.type == DirectiveType::Eval && found->is_async()) {
        report(DiagnosticStage::Directive, DiagnosticLevel::Warning, String(std::format(
            "Function '{}' is asynchronous and cannot be used with eval.", call.function_name)));
        return StepResult::Done;
    }

    // The function may re-register itself while running
    Callable fn = *found;
    const u64 session = m_session;

    std::optional<Value> produced;
    std::optional<Completion> completion;
    try {
        if (fn.is_async()) {
            completion = fn.async()(call.argument);
        } else {
            produced = fn.sync()(call.argument);
        }
    } catch (const std::exception& e) {
        report(DiagnosticStage::Callback, DiagnosticLevel::Error, String(std::format(
            "Failed to execute function '{}': {}", call.function_name, e.what())));
        return StepResult::Done;
    } catch (...) {
        report(DiagnosticStage::Callback, DiagnosticLevel::Error, String(std::format(
            "Failed to execute function '{}': unknown exception", call.function_name)));
        return StepResult::Done;
    }

    if (session != m_session) {
        return StepResult::Done;
    }

    switch (directive.type) {
        case DirectiveType::Eval:
            inject(produced->to_display_string());
            return StepResult::Done;
        case DirectiveType::Async:
            if (completion) {
                return wait_for(std::move(*completion), call.function_name);
            }
            return StepResult::Done;
        default:
            if (completion) {
                watch_for_rejection(*completion, call.function_name);
            }
            return StepResult::Done;
    }
}

Engine::StepResult Engine::wait_for(Completion completion, const String& function_name) {
    if (auto settled = completion.settlement()) {
        if (!settled->fulfilled) {
            report_rejection(function_name, settled->error);
        }
        return StepResult::Done;
    }

    const u64 session = m_session;
    SuspensionId id = m_scheduler.suspend([this, session]() {
        on_directive_wait_resolved(session);
    });
    begin_directive_wait(id);

    std::weak_ptr<bool> lifetime = m_lifetime;
    completion.on_settled([this, lifetime, session, id, function_name](const Settlement& settlement) {
        if (lifetime.expired()) {
            return;
        }
        if (!settlement.fulfilled) {
            // A write or skip already closed this wait; keep the error out of the new diagnostics
            if (session == m_session) {
                report_rejection(function_name, settlement.error);
            } else {
                typewriter_log().warn_fmt("Asynchronous function '{}' failed after its session ended: {}",
                                          function_name, settlement.error);
            }
        }
        m_scheduler.resolve(id);
    });
    return StepResult::Suspended;
}

void Engine::watch_for_rejection(Completion completion, const String& function_name) {
    std::weak_ptr<bool> lifetime = m_lifetime;
    completion.on_settled([this, lifetime, function_name](const Settlement& settlement) {
        if (!lifetime.expired() && !settlement.fulfilled) {
            report_rejection(function_name, settlement.error);
        }
    });
}

void Engine::begin_directive_wait(SuspensionId id) {
    m_state.suspension = id;
    m_state.directive_wait = true;
}

void Engine::on_directive_wait_resolved(u64 session) {
    if (session != m_session) {
        return;
    }

    m_state.suspension = NO_SUSPENSION;
    m_state.directive_wait = false;
    ++m_state.cursor;
    run_loop();
}

void Engine::inject(const String& text) {
    String sanitized = strip_directive_markers(text);
    if (sanitized.empty()) {
        return;
    }

    auto injected = m_tokenizer.tokenize(sanitized);
    usize position = std::min(m_state.cursor + 1, m_state.tokens.size());
    m_state.tokens.insert(m_state.tokens.begin() + static_cast<isize>(position),
                          injected.begin(), injected.end());
}

// ============================================================================
// Hooks and diagnostics
// ============================================================================

void Engine::fire_hook(const Hook& hook, std::string_view name) {
    if (!hook) {
        return;
    }

    try {
        hook(view());
    } catch (const std::exception& e) {
        report(DiagnosticStage::Callback, DiagnosticLevel::Error, String(std::format(
            "Error occurred in hook '{}': {}", name, e.what())));
    } catch (...) {
        report(DiagnosticStage::Callback, DiagnosticLevel::Error, String(std::format(
            "Error occurred in hook '{}': unknown exception", name)));
    }
}

void Engine::report_unknown(const Directive& directive) {
    report(DiagnosticStage::Directive, DiagnosticLevel::Warning, String(std::format(
        "Unknown directive '{}'. It will be ignored.", directive.type)));
}

void Engine::report_rejection(const String& function_name, const String& error) {
    report(DiagnosticStage::Callback, DiagnosticLevel::Error, String(std::format(
        "Asynchronous function '{}' failed: {}", function_name, error)));
}

void Engine::report(DiagnosticStage stage, DiagnosticLevel level, String message) {
    switch (level) {
        case DiagnosticLevel::Info:    typewriter_log().info(message.view()); break;
        case DiagnosticLevel::Warning: typewriter_log().warn(message.view()); break;
        case DiagnosticLevel::Error:   typewriter_log().error(message.view()); break;
    }
    m_diagnostics.add(stage, level, std::move(message));
}

} // namespace inkwell::typewriter
