#include "di/cli/parser.h"
#include "di/container/string/string_view.h"
#include "di/util/scope_exit.h"
#include "dius/main.h"
#include "dius/print.h"
#include "dius/steady_clock.h"
#include "dius/sync_file.h"
#include "dius/thread.h"
#include "scene.h"
#include "tcomp/escape_encoder.h"
#include "tcomp/escape_terminal.h"
#include "tcomp/features.h"
#include "tcomp/renderer.h"
#include "tcomp/terminal_device.h"

namespace tcomp {
struct Args {
    u32 fps { 30 };
    u32 ticks { 300 };
    u32 sprites { 12 };
    u32 band_height { 8 };
    bool no_sync { false };
    bool undercurl { false };
    bool no_title { false };
    di::Optional<di::PathView> log_path;
    bool headless { false };
    bool help { false };

    constexpr static auto get_cli_parser() {
        return di::cli_parser<Args>("tcomp"_sv, "Terminal sprite compositor demo"_sv)
            .option<&Args::fps>('f', "fps"_tsv, "Ticks per second"_sv)
            .option<&Args::ticks>('t', "ticks"_tsv, "Number of ticks to run before exiting"_sv)
            .option<&Args::sprites>('n', "sprites"_tsv, "Number of sprites in the scene"_sv)
            .option<&Args::band_height>('b', "band-height"_tsv, "Rows per compositor band"_sv)
            .option<&Args::no_sync>('S', "no-sync"_tsv, "Disable synchronized output (DEC mode 2026)"_sv)
            .option<&Args::undercurl>('u', "undercurl"_tsv, "Emit styled underlines and underline colors"_sv)
            .option<&Args::no_title>('T', "no-title"_tsv, "Don't set the window title"_sv)
            .option<&Args::log_path>('l', "log-path"_tsv, "Log file path (defaults to /tmp/tcomp.log)"_sv)
            .option<&Args::headless>('h', "headless"_tsv, "Headless mode"_sv)
            .help();
    }
};

static auto features_from_args(Args const& args) -> Feature {
    auto features = Feature::None;
    if (!args.no_sync) {
        features |= Feature::SyncronizedOutput;
    }
    if (args.undercurl) {
        features |= Feature::Undercurl;
    }
    return features;
}

// Render into an in-memory device, and print statistics about the generated output.
static auto run_headless(Args const& args, Renderer& renderer, Scene& scene, Feature features) -> di::Result<> {
    auto size = Size { 24, 80, 80 * 8, 24 * 16 };
    auto encoder = EscapeEncoder(features);
    encoder.set_size(size);

    auto bytes = 0_usize;
    auto cells_written = 0_usize;
    auto full_redraws = 0_usize;
    auto device = TerminalDevice {
        [&] -> di::Result<Size> {
            return size;
        },
        [&](di::Span<TerminalCommand const> commands) -> di::Result<> {
            bytes += encoder.encode(commands).size_bytes();
            return {};
        },
    };

    for (auto _ : di::range(args.ticks)) {
        scene.tick(renderer.previous().size());
        TRY(renderer.render(device, scene.sprites(), scene.cursor()));
        cells_written += renderer.stats().cells_written;
        if (renderer.stats().full_redraw) {
            full_redraws++;
        }
    }

    dius::println("ticks: {}"_sv, args.ticks);
    dius::println("sprites: {}"_sv, scene.sprites().size());
    dius::println("bytes written: {}"_sv, bytes);
    dius::println("cells written: {}"_sv, cells_written);
    dius::println("full redraws: {}"_sv, full_redraws);
    return {};
}

static auto main(Args& args) -> di::Result<void> {
    if (args.fps == 0) {
        dius::eprintln("error: tcomp requires a positive tick rate"_sv);
        return di::Unexpected(di::BasicError::InvalidArgument);
    }
    auto const features = features_from_args(args);

    // Setup - log to file.
    [[maybe_unused]] auto& log = dius::stderr =
        TRY(dius::open_sync(args.log_path.value_or("/tmp/tcomp.log"_pv), dius::OpenMode::WriteClobber));

    auto renderer = Renderer({ .band_height = args.band_height });

    if (args.headless) {
        auto scene = Scene::create(args.sprites, { 24, 80 });
        return run_headless(args, renderer, scene, features);
    }

    // Setup - initial scene, laid out for the current terminal size.
    auto scene = Scene::create(args.sprites, Size::from_window_size(TRY(dius::stdin.get_tty_window_size())));

    // Setup - raw mode
    auto _ = TRY(dius::stdin.enter_raw_mode());

    // Setup - terminal modes.
    auto terminal = EscapeTerminal(dius::stdin);
    TRY(terminal.setup({ args.no_title ? ""_s : "tcomp"_s, features }));
    auto _ = di::ScopeExit([&] {
        (void) terminal.cleanup();
    });

    auto device = terminal.device();
    auto deadline = dius::SteadyClock::now();
    auto const frame_duration = di::Milliseconds(1000 / args.fps);
    for (auto tick : di::range(args.ticks)) {
        while (deadline < dius::SteadyClock::now()) {
            deadline += frame_duration;
        }
        dius::this_thread::sleep_until(deadline);

        scene.tick(renderer.previous().size());
        if (!renderer.render(device, scene.sprites(), scene.cursor())) {
            // The renderer redraws everything on the next tick, so just note the failure.
            dius::eprintln("tick {}: failed to render frame"_sv, tick);
        }
    }
    return {};
}
}

DIUS_MAIN(tcomp::Args, tcomp)
