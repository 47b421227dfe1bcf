#pragma once

#include "inkwell/core/string.hpp"
#include <iosfwd>

namespace inkwell::typewriter {

// ============================================================================
// Surface - append-only sink for typed text
// ============================================================================
//
// Markup and entities are passed through untouched; the surface decides how
// to present them.

class Surface {
public:
    virtual ~Surface() = default;

    virtual void append(const String& text) = 0;

    // False once the sink has gone away; playback aborts when it sees this
    [[nodiscard]] virtual bool is_attached() const = 0;
};

// In-memory surface
class BufferSurface : public Surface {
public:
    void append(const String& text) override;
    [[nodiscard]] bool is_attached() const override { return m_attached; }

    void detach() { m_attached = false; }
    void attach() { m_attached = true; }
    void clear();

    [[nodiscard]] const String& content() const { return m_content; }
    [[nodiscard]] usize append_count() const { return m_append_count; }

private:
    String m_content;
    usize m_append_count{0};
    bool m_attached{true};
};

// Writes straight to a stream, flushing after every fragment
class StreamSurface : public Surface {
public:
    explicit StreamSurface(std::ostream& out);

    void append(const String& text) override;
    [[nodiscard]] bool is_attached() const override;

private:
    std::ostream& m_out;
};

} // namespace inkwell::typewriter
