#include "config.hpp"
#include "console.hpp"
#include "document_renderer.hpp"
#include "errors.hpp"
#include "output_sink.hpp"
#include "settings.hpp"
#include "stream_renderer.hpp"
#include "terminal.hpp"
#include "verbose.hpp"

#include <CLI/CLI.hpp>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mdstream;

// ========== Signal Handling ==========

static Console* g_console = nullptr;               // Global console for signal handler.
static std::atomic<bool> g_resized{false};         // Set on SIGWINCH, consumed between chunks.

// Handles SIGINT (Ctrl+C) for graceful shutdown.
void signal_handler(int) {
    if (g_console) {
        // Reset styling and show the cursor in case output stopped mid-sequence.
        g_console->print_raw(std::string(ansi::RESET) + terminal::cursor::show());
        g_console->flush();
        g_console->println();
        g_console->print_warning("Interrupted.");
    }
    std::exit(0);
}

// Handles SIGWINCH. Only records the event; the resize runs on the main loop.
void resize_handler(int) {
    g_resized.store(true);
}

// ========== Input ==========

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

// Feeds input to the renderer in fixed-size chunks, like tokens from a model.
class ChunkFeeder {
public:
    ChunkFeeder(StreamRenderer* renderer, int chunk_size, int delay_ms, bool follow_resize)
        : renderer_(renderer)
        , chunk_size_(static_cast<size_t>(chunk_size))
        , delay_ms_(delay_ms)
        , follow_resize_(follow_resize)
    {
    }

    void feed(const std::string& data) {
        for (size_t pos = 0; pos < data.size(); pos += chunk_size_) {
            std::string chunk = data.substr(pos, chunk_size_);
            if (follow_resize_ && g_resized.exchange(false)) {
                renderer_->resize(terminal::get_width());
            }
            if (renderer_) {
                renderer_->write(chunk);
            } else {
                std::cout << chunk << std::flush;
            }
            if (delay_ms_ > 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
            }
        }
    }

private:
    StreamRenderer* renderer_;  // Null in --plain mode: pass text through.
    size_t chunk_size_;
    int delay_ms_;
    bool follow_resize_;
};

// Streams stdin as it arrives. Each read() returns whatever is available, so
// piped model output is rendered as it is produced.
void feed_stdin(ChunkFeeder& feeder) {
    char buf[4096];
    while (true) {
        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;  // SIGWINCH interrupted the read
            }
            throw std::runtime_error(std::string("Error reading stdin: ") + std::strerror(errno));
        }
        feeder.feed(std::string(buf, static_cast<size_t>(n)));
    }
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Render streaming markdown to the terminal as it arrives"};
    app.footer("\nExamples:\n"
               "  mdstream README.md                   Render a file\n"
               "  llm 'explain tcp' | mdstream         Render model output as it streams\n"
               "  mdstream --delay-ms 20 notes.md      Replay a file like a token stream\n"
               "  mdstream --partial notes.md          Preview the block being written\n");

    Settings settings = load_settings().value_or(Settings{});

    std::vector<std::string> files;
    app.add_option("files", files, "Markdown files to render (default: stdin)");

    std::string style = settings.style;
    app.add_option("--style", style, "Render style: dark, light, plain")
        ->check(CLI::IsMember({"dark", "light", "plain", "notty"}));

    int width = settings.width;
    app.add_option("-w,--width", width, "Terminal width in columns (0 = auto-detect)")
        ->check(CLI::NonNegativeNumber);

    bool partial = settings.partial_preview;
    app.add_flag("--partial", partial, "Preview the block that is still being written");

    int chunk_size = settings.chunk_size;
    app.add_option("--chunk-size", chunk_size, "Bytes per write when replaying files")
        ->check(CLI::PositiveNumber);

    int delay_ms = settings.chunk_delay_ms;
    app.add_option("--delay-ms", delay_ms, "Pause between chunks in milliseconds")
        ->check(CLI::NonNegativeNumber);

    bool plain_output = false;
    app.add_flag("--plain", plain_output, "Disable markdown rendering, output raw text");

    bool save = false;
    app.add_flag("--save-settings", save, "Save these options to " + std::string(config::SETTINGS_FILE));

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Trace block commits and terminal writes on stderr");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);

    Console console;
    g_console = &console;

    // Set up signal handlers for Ctrl+C and terminal resizes.
    std::signal(SIGINT, signal_handler);

    if (save) {
        settings.style = style;
        settings.width = width;
        settings.partial_preview = partial;
        settings.chunk_size = chunk_size;
        settings.chunk_delay_ms = delay_ms;
        try {
            save_settings(settings);
            console.print_success("Settings saved to " + std::string(config::SETTINGS_FILE));
        } catch (const std::exception& e) {
            console.print_error("Error: " + std::string(e.what()));
            return 1;
        }
    }

    bool interactive = terminal::is_tty();
    bool auto_width = (width == 0);
    if (auto_width && interactive) {
        width = terminal::get_width();
    }
    verbose_log("main", "style=" + style + " width=" + std::to_string(width) +
                " tty=" + (interactive ? "yes" : "no"));

    try {
        // A terminal can be rewritten in place. Anything else gets the final
        // render written once at the end.
        std::unique_ptr<OutputSink> sink;
        if (interactive) {
            // Auto width is re-detected on every reset so resizes are followed
            sink = std::make_unique<TerminalSink>(auto_width ? 0 : width);
        } else {
            sink = std::make_unique<BufferSink>();
        }

        StreamOptions options;
        options.partial_preview = partial && interactive;
        options.terminal_width = width;

        std::unique_ptr<StreamRenderer> renderer;
        if (!plain_output) {
            renderer = std::make_unique<StreamRenderer>(*sink, style_by_name(style), options);
        }

        bool follow_resize = renderer && interactive && auto_width;
        if (follow_resize) {
            std::signal(SIGWINCH, resize_handler);
        }

        ChunkFeeder feeder(renderer.get(), chunk_size, delay_ms, follow_resize);
        if (files.empty()) {
            if (isatty(STDIN_FILENO)) {
                console.print_info("Reading markdown from stdin (Ctrl+D to finish)");
            }
            feed_stdin(feeder);
        } else {
            for (const auto& path : files) {
                feeder.feed(read_file(path));
            }
        }

        if (renderer) {
            if (follow_resize && g_resized.exchange(false)) {
                renderer->resize(terminal::get_width());
            }
            renderer->close();
        }

        if (auto* buffer = dynamic_cast<BufferSink*>(sink.get())) {
            console.print_raw(buffer->str());
        }
        console.flush();
    } catch (const std::exception& e) {
        console.println();
        console.print_error("Error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
