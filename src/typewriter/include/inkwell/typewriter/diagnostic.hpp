#pragma once

#include "inkwell/core/string.hpp"
#include <algorithm>
#include <vector>

namespace inkwell::typewriter {

enum class DiagnosticStage {
    Tokenizer,
    Directive,
    Callback,
    Engine,
};

enum class DiagnosticLevel {
    Info,
    Warning,
    Error,
};

struct Diagnostic {
    DiagnosticStage stage{DiagnosticStage::Engine};
    DiagnosticLevel level{DiagnosticLevel::Warning};
    String message;
};

class DiagnosticSink {
public:
    void add(DiagnosticStage stage, DiagnosticLevel level, String message) {
        Diagnostic d;
        d.stage = stage;
        d.level = level;
        d.message = std::move(message);
        m_diags.push_back(std::move(d));
    }

    void clear() { m_diags.clear(); }

    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return m_diags; }
    [[nodiscard]] bool empty() const { return m_diags.empty(); }
    [[nodiscard]] usize size() const { return m_diags.size(); }

    [[nodiscard]] bool has_errors() const {
        return std::any_of(m_diags.begin(), m_diags.end(), [](const Diagnostic& d) {
            return d.level == DiagnosticLevel::Error;
        });
    }

    [[nodiscard]] usize count(DiagnosticStage stage) const {
        return static_cast<usize>(std::count_if(m_diags.begin(), m_diags.end(),
            [stage](const Diagnostic& d) { return d.stage == stage; }));
    }

private:
    std::vector<Diagnostic> m_diags;
};

} // namespace inkwell::typewriter
