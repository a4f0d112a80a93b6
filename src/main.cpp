#include "config.hpp"
#include "console.hpp"
#include "file_watcher.hpp"
#include "http_server.hpp"
#include "image_cache.hpp"
#include "image_store.hpp"
#include "ir_json.hpp"
#include "memo_file.hpp"
#include "settings.hpp"
#include "terminal.hpp"
#include "terminal_renderer.hpp"
#include "verbose.hpp"
#include "markdown/inline_scanner.hpp"
#include "markdown/render_ir.hpp"

#include <CLI/CLI.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

using namespace memomark;

// ========== Signal Handling ==========

static std::atomic<bool> g_interrupted{false};  // Set by Ctrl+C in watch mode.
static HttpServer* g_server = nullptr;          // Stopped by Ctrl+C in serve mode.

void signal_handler(int) {
    g_interrupted.store(true);
    if (g_server) {
        g_server->stop();
    }
}

// ========== Modes ==========

// Prints the memo once. Images referenced by the memo are fetched before the
// final render so their placeholders show the outcome, not "loading".
int render_once(const std::string& text, TerminalRenderer& renderer, ImageCache& cache,
                Console& console) {
    markdown::RenderDocument ir = markdown::render_ir_from_text(text);
    std::string output = renderer.render(ir);

    if (cache.fetch_count() > 0) {
        cache.wait_idle();
        output = renderer.render(ir);
    }

    console.print(output);
    console.flush();
    return 0;
}

// Re-renders the memo whenever the file changes or an image resolves.
int watch(const std::string& path, const Settings& settings, TerminalRenderer& renderer,
          ImageCache& cache, Console& console) {
    std::mutex render_mutex;

    auto redraw = [&]() {
        std::lock_guard<std::mutex> lock(render_mutex);
        std::string output;
        try {
            output = renderer.render(markdown::render_ir_from_text(read_memo(path)));
        } catch (const std::exception& e) {
            verbose_err("Watch", e.what());
            output = "(" + std::string(e.what()) + ")\n";
        }
        if (terminal::is_tty()) {
            console.print(terminal::redraw_prefix());
        }
        console.print(output);
        console.flush();
    };

    cache.on_resolved([&](const std::string& key) {
        verbose_log("Watch", "Image resolved: " + key);
        redraw();
    });

    FileWatcher watcher(path, settings.watch_debounce_ms);
    watcher.on_change(redraw);

    redraw();
    watcher.start();
    console.print_info("Watching " + path + " (Ctrl+C to stop)");

    while (!g_interrupted.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    watcher.stop();
    cache.on_resolved(nullptr);
    cache.wait_idle();
    console.println();
    return 0;
}

int serve(const std::string& memo_path, const Settings& settings,
          std::shared_ptr<ImageStore> store, std::shared_ptr<ImageCache> cache,
          Console& console) {
    HttpServer server(std::move(store), std::move(cache));
    if (!memo_path.empty()) {
        server.set_memo_path(memo_path);
    }

    server.on_start([&console, &memo_path](const std::string& address, int port) {
        console.print_header("=== memomark preview API ===");
        console.print_info("Listening on http://" + address + ":" + std::to_string(port));
        if (!memo_path.empty()) {
            console.print_info("Serving memo: " + memo_path);
        }
    });

    g_server = &server;
    bool ok = server.start(settings.server_address, settings.server_port);
    g_server = nullptr;

    if (!ok && !g_interrupted.load()) {
        console.print_error("Failed to start server on " + settings.server_address + ":" +
                            std::to_string(settings.server_port));
        return 1;
    }
    return 0;
}

int attach(const std::string& image_path, ImageStore& store, Console& console) {
    std::string bytes = read_memo(image_path);
    std::string name = std::filesystem::path(image_path).filename().string();
    std::string filename = store.save(bytes, name).get();

    std::string alt = std::filesystem::path(image_path).stem().string();
    console.println(image_markdown(alt.empty() ? "image" : alt, filename));
    return 0;
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Render markdown memos in the terminal"};
    app.footer("\nExamples:\n"
               "  memomark notes.md               Render a memo\n"
               "  memomark -w notes.md            Re-render on every save\n"
               "  memomark --json notes.md        Print the render IR as JSON\n"
               "  memomark --attach shot.png      Store an image, print its reference\n"
               "  memomark -s notes.md            Serve the preview API\n"
               "  memomark --images-dir pics --save-config\n"
               "                                  Remember the image directory\n");

    std::string file;
    app.add_option("file", file, "Memo to render ('-' or omitted: stdin)");

    bool json_output = false;
    app.add_flag("--json", json_output, "Print the render IR as JSON instead of rendering");

    std::string inline_text;
    auto* inline_opt = app.add_option("--inline", inline_text,
                                      "Print the inline matches of TEXT as JSON");

    bool watch_mode = false;
    app.add_flag("-w,--watch", watch_mode, "Re-render whenever the memo file changes");

    bool serve_mode = false;
    app.add_flag("-s,--serve", serve_mode, "Run the HTTP preview API");

    int port = DEFAULT_SERVER_PORT;
    auto* port_opt = app.add_option("-p,--port", port, "Port for the preview API")
        ->check(CLI::Range(1, 65535));

    std::string address;
    auto* address_opt = app.add_option("--address", address, "Bind address for the preview API");

    std::string images_dir;
    auto* images_opt = app.add_option("--images-dir", images_dir, "Directory of stored images");

    std::string attach_path;
    app.add_option("--attach", attach_path, "Store an image and print its markdown reference")
        ->check(CLI::ExistingFile);

    bool plain_output = false;
    app.add_flag("--plain", plain_output, "Disable colors and hyperlinks");

    std::string config_path = SETTINGS_FILE;
    auto* config_opt = app.add_option("--config", config_path, "Settings file");

    bool save_config = false;
    app.add_flag("--save-config", save_config,
                 "Write the effective settings to the settings file and exit");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log diagnostics to stderr");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);

    Console console;
    if (plain_output) {
        console.disable_colors();
    }

    try {
        // Flags override the settings file, which overrides defaults
        Settings settings;
        if (auto loaded = load_settings(config_path)) {
            settings = *loaded;
        } else if (config_opt->count() > 0) {
            console.print_warning("Could not load " + config_path + ", using defaults");
        }
        if (images_opt->count() > 0) settings.images_dir = images_dir;
        if (port_opt->count() > 0) settings.server_port = port;
        if (address_opt->count() > 0) settings.server_address = address;

        if (save_config) {
            save_settings(settings, config_path);
            console.print_info("Saved settings to " + config_path);
            return 0;
        }

        auto store = std::make_shared<FileImageStore>(settings.images_dir);
        auto cache = std::make_shared<ImageCache>(store);

        if (inline_opt->count() > 0) {
            console.println(matches_to_json(markdown::parse_inline(inline_text)).dump(2));
            return 0;
        }

        if (!attach_path.empty()) {
            return attach(attach_path, *store, console);
        }

        std::signal(SIGINT, signal_handler);

        bool from_stdin = file.empty() || file == "-";

        if (serve_mode) {
            return serve(from_stdin ? "" : file, settings, store, cache, console);
        }

        bool colors = settings.colors && !plain_output && terminal::supports_color();
        TerminalRenderer renderer(colors, cache.get());

        if (watch_mode) {
            if (from_stdin) {
                console.print_error("--watch needs a memo file");
                return 1;
            }
            return watch(file, settings, renderer, *cache, console);
        }

        std::string text = from_stdin ? read_memo(std::cin) : read_memo(file);

        if (json_output) {
            console.println(to_json(markdown::render_ir_from_text(text)).dump(2));
            return 0;
        }

        return render_once(text, renderer, *cache, console);
    } catch (const std::exception& e) {
        console.print_error("Error: " + std::string(e.what()));
        return 1;
    }
}
