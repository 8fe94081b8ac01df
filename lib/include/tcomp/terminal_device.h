#pragma once

#include "di/function/container/function.h"
#include "di/vocab/error/result.h"
#include "di/vocab/span/prelude.h"
#include "tcomp/size.h"
#include "tcomp/terminal_command.h"

namespace tcomp {
/// @brief The terminal a renderer draws to
///
/// The device is provided as a set of callbacks so that tests and headless hosts can capture the output
/// without a real tty.
struct TerminalDevice {
    /// @brief Query the current terminal size, in cells and pixels.
    di::Function<di::Result<Size>()> size;

    /// @brief Apply all commands for a tick. This is called exactly once per successful tick.
    di::Function<di::Result<>(di::Span<TerminalCommand const>)> apply;
};
}
