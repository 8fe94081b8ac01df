#include "tcomp/escape_terminal.h"

#include "dius/sync_file.h"
#include "tcomp/escape_encoder.h"
#include "tcomp/size.h"

namespace tcomp {
auto EscapeTerminal::write(di::StringView text) -> di::Result<> {
    if (text.empty()) {
        return {};
    }
    auto result = m_output.write_exactly(di::as_bytes(text.span()));
    if (!result) {
        m_encoder.forget_state();
    }
    return result;
}

auto EscapeTerminal::setup(TerminalSettings const& settings) -> di::Result<> {
    auto text = m_encoder.setup(settings);
    return write(text.view());
}

auto EscapeTerminal::cleanup() -> di::Result<> {
    auto text = m_encoder.cleanup();
    return write(text.view());
}

auto EscapeTerminal::size() -> di::Result<Size> {
    auto size = Size::from_window_size(TRY(m_output.get_tty_window_size()));
    m_encoder.set_size(size);
    return size;
}

auto EscapeTerminal::apply(di::Span<TerminalCommand const> commands) -> di::Result<> {
    auto text = m_encoder.encode(commands);
    return write(text.view());
}

auto EscapeTerminal::device() -> TerminalDevice {
    return {
        [this] {
            return size();
        },
        [this](di::Span<TerminalCommand const> commands) {
            return apply(commands);
        },
    };
}
}
