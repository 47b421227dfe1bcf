#include "inkwell/typewriter/surface.hpp"
#include <ostream>

namespace inkwell::typewriter {

void BufferSurface::append(const String& text) {
    m_content += text;
    ++m_append_count;
}

void BufferSurface::clear() {
    m_content.clear();
    m_append_count = 0;
}

StreamSurface::StreamSurface(std::ostream& out) : m_out(out) {}

void StreamSurface::append(const String& text) {
    m_out.write(text.data(), static_cast<std::streamsize>(text.size()));
    m_out.flush();
}

bool StreamSurface::is_attached() const {
    return m_out.good();
}

} // namespace inkwell::typewriter
