#pragma once

#include "di/container/string/prelude.h"
#include "di/vocab/error/result.h"
#include "di/vocab/span/prelude.h"
#include "dius/sync_file.h"
#include "tcomp/escape_encoder.h"
#include "tcomp/size.h"
#include "tcomp/terminal_command.h"
#include "tcomp/terminal_device.h"

namespace tcomp {
/// @brief Terminal device which writes VT escape sequences to a tty
class EscapeTerminal {
public:
    explicit EscapeTerminal(dius::SyncFile& output) : m_output(output) {}

    auto setup(TerminalSettings const& settings) -> di::Result<>;
    auto cleanup() -> di::Result<>;

    auto size() -> di::Result<Size>;

    /// @brief Encode the commands and write them with a single write
    ///
    /// If the write fails, the terminal state is unknown and the next apply() positions the cursor absolutely.
    auto apply(di::Span<TerminalCommand const> commands) -> di::Result<>;

    auto encoder() -> EscapeEncoder& { return m_encoder; }

    /// @brief Device hooks which forward to this terminal
    ///
    /// The returned device refers to this object, and must not outlive it.
    auto device() -> TerminalDevice;

private:
    auto write(di::StringView text) -> di::Result<>;

    dius::SyncFile& m_output;
    EscapeEncoder m_encoder;
};
}
