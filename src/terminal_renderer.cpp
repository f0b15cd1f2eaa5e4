#include "bandscope/audio_analyzer.hpp"
#include "bandscope/logging.hpp"
#include "bandscope/portaudio_backend.hpp"

#include <ncurses.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <thread>

namespace bandscope {

/// Terminal meter for the analyzer: three band gauges above a 64-column
/// spectrum. Reads the analyzer at ~60 FPS and never writes to it.
class TerminalRenderer {
public:
    TerminalRenderer() { init_ncurses(); }

    ~TerminalRenderer() { shutdown_ncurses(); }

    /// Main render loop. Blocks until user quits (q, Esc or Ctrl+C).
    void run(AudioAnalyzer& analyzer) {
        analyzer.start();

        constexpr auto frame_duration = std::chrono::milliseconds(16);  // ~60 FPS

        while (running_.load(std::memory_order_relaxed)) {
            auto frame_start = std::chrono::steady_clock::now();

            int ch = getch();
            if (ch == 'q' || ch == 'Q' || ch == 27) {  // q or Escape
                break;
            }

            // Handle terminal resize
            if (ch == KEY_RESIZE) {
                handle_resize();
            }

            render(analyzer);

            // Frame rate limiting
            auto elapsed = std::chrono::steady_clock::now() - frame_start;
            if (elapsed < frame_duration) {
                std::this_thread::sleep_for(frame_duration - elapsed);
            }
        }

        analyzer.stop();
    }

    void stop() { running_.store(false, std::memory_order_relaxed); }

private:
    void init_ncurses() {
        initscr();
        cbreak();
        noecho();
        curs_set(0);            // Hide cursor
        nodelay(stdscr, TRUE);  // Non-blocking getch
        keypad(stdscr, TRUE);   // Enable special keys

        if (has_colors()) {
            start_color();
            use_default_colors();

            // Color pairs for level gradient (low to high)
            init_pair(1, COLOR_BLUE, -1);
            init_pair(2, COLOR_GREEN, -1);
            init_pair(3, COLOR_YELLOW, -1);
            init_pair(4, COLOR_RED, -1);  // Near the cap
            has_color_ = true;
        }

        getmaxyx(stdscr, term_height_, term_width_);
    }

    void shutdown_ncurses() { endwin(); }

    void handle_resize() {
        endwin();
        refresh();
        getmaxyx(stdscr, term_height_, term_width_);
    }

    int color_for(float ratio) const {
        if (ratio > 0.85f) return 4;
        if (ratio > 0.6f) return 3;
        if (ratio > 0.3f) return 2;
        return 1;
    }

    void draw_gauge(int y, const char* label, float level) {
        const int width = term_width_ - 12;
        const float ratio = std::clamp(level / kMaxBandLevel, 0.0f, 1.0f);
        const int filled = static_cast<int>(ratio * static_cast<float>(width));

        mvprintw(y, 1, "%-7s", label);
        if (has_color_) attron(COLOR_PAIR(color_for(ratio)));
        for (int x = 0; x < filled; ++x) {
            mvaddch(y, 9 + x, ACS_CKBOARD);
        }
        if (has_color_) attroff(COLOR_PAIR(color_for(ratio)));
    }

    void render(const AudioAnalyzer& analyzer) {
        erase();

        // Reserve space for header and footer
        constexpr int header_lines = 6;
        constexpr int footer_lines = 2;
        const int viz_height = term_height_ - header_lines - footer_lines;

        if (viz_height < 3 || term_width_ < 20) {
            mvprintw(0, 0, "Terminal too small");
            refresh();
            return;
        }

        // One snapshot so gauges and bars come from the same update.
        const AnalysisFrame frame = analyzer.snapshot();

        // Header
        attron(A_BOLD);
        mvprintw(0, 1, "BANDSCOPE");
        attroff(A_BOLD);
        const auto& device = analyzer.device();
        mvprintw(0, 12, "%s", device ? device->name.c_str() : "No loopback device");
        mvhline(1, 0, ACS_HLINE, term_width_);

        draw_gauge(2, "bass", frame.levels.bass);
        draw_gauge(3, "mid", frame.levels.mid);
        draw_gauge(4, "treble", frame.levels.treble);
        mvhline(5, 0, ACS_HLINE, term_width_);

        const int usable = term_width_ - 2;
        const int bar_width = std::max(1, usable / static_cast<int>(kSpectrumBins));
        const int base_y = header_lines + viz_height - 1;

        int x = 1;  // Start with margin
        for (std::size_t i = 0; i < kSpectrumBins && x + bar_width <= term_width_ - 1; ++i) {
            const float ratio = std::clamp(frame.spectrum[i] / kMaxSpectrumLevel, 0.0f, 1.0f);
            const int bar_height = static_cast<int>(ratio * static_cast<float>(viz_height));

            for (int y = 0; y < bar_height; ++y) {
                const int pair = color_for(static_cast<float>(y) / static_cast<float>(viz_height));
                if (has_color_) attron(COLOR_PAIR(pair));
                for (int bx = 0; bx < bar_width; ++bx) {
                    mvaddch(base_y - y, x + bx, ACS_BLOCK);
                }
                if (has_color_) attroff(COLOR_PAIR(pair));
            }
            x += bar_width;
        }

        // Footer separator
        mvhline(term_height_ - footer_lines, 0, ACS_HLINE, term_width_);

        // Footer info
        const auto stats = analyzer.stats();
        mvprintw(term_height_ - 1, 1, "%s  %.0f Hz  Frames: %llu  Overflows: %llu  Dropped: %llu",
                 to_string(analyzer.status()).data(), analyzer.sample_rate(),
                 static_cast<unsigned long long>(stats.frames_processed),
                 static_cast<unsigned long long>(stats.overflows),
                 static_cast<unsigned long long>(stats.dropped_frames));
        mvprintw(term_height_ - 1, term_width_ - 10, "[q] Quit");

        refresh();
    }

    std::atomic<bool> running_{true};
    bool has_color_ = false;
    int term_width_ = 0;
    int term_height_ = 0;
};

/// Prints every host API and device with its loopback classification.
int list_devices() {
    PortAudioDeviceProvider provider;  // One PortAudio session for both listings
    const auto apis = provider.host_apis();
    const auto devices = provider.devices();

    for (const auto& api : apis) {
        std::printf("%s (default output: %d)\n", api.name.c_str(), api.default_output_device);
        for (const auto& dev : devices) {
            if (dev.host_api != api.index) {
                continue;
            }
            std::printf("  [%d] %s  in:%d out:%d  %.0f Hz%s\n", dev.index, dev.name.c_str(),
                        dev.max_input_channels, dev.max_output_channels, dev.default_sample_rate,
                        dev.is_loopback ? "  (loopback)" : "");
        }
    }
    return 0;
}

}  // namespace bandscope

// Global renderer pointer for signal handling
static bandscope::TerminalRenderer* g_renderer = nullptr;

static void signal_handler(int /*signum*/) {
    if (g_renderer != nullptr) {
        g_renderer->stop();
    }
}

int main(int argc, char** argv) {
    try {
        if (argc > 1 && std::strcmp(argv[1], "--list-devices") == 0) {
            return bandscope::list_devices();
        }
        if (argc > 1) {
            std::fprintf(stderr, "Usage: %s [--list-devices]\n", argv[0]);
            return 2;
        }

        bandscope::log_to_file("bandscope.log");

        bool worker_detached = false;
        {
            bandscope::AudioAnalyzer analyzer{bandscope::AnalyzerConfig{}};
            bandscope::TerminalRenderer renderer;

            // Set up signal handling for clean shutdown
            g_renderer = &renderer;
            std::signal(SIGINT, signal_handler);
            std::signal(SIGTERM, signal_handler);

            // Run until user quits
            renderer.run(analyzer);

            g_renderer = nullptr;
            worker_detached = analyzer.has_detached_worker();
        }

        // A capture worker still stuck in the driver would touch statics
        // after they are destroyed; leave without running their destructors.
        if (worker_detached) {
            bandscope::logger()->warn("Exiting with a capture worker still blocked");
            bandscope::logger()->flush();
            std::fflush(stdout);
            std::quick_exit(0);
        }
        return 0;

    } catch (const std::exception& e) {
        // Ensure terminal is restored before printing error
        endwin();
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
