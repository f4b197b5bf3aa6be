/**
 * prom-file-server
 *
 * Serves the contents of one file over HTTP and keeps it fresh:
 * - inotify for writes, removal and rename of the file
 * - symlink chain polling for atomically swapped mounted volumes
 * - automatic re-watch whenever the watch ends on its own
 */

#include "content_store.hpp"
#include "file_follower.hpp"
#include "http_server.hpp"
#include "logger.hpp"
#include "settings.hpp"
#include <iostream>
#include <chrono>
#include <utility>
#include <vector>
#include <memory>
#include <string>
#include <glib.h>
#include <glib-unix.h>
#include <signal.h>
#include <unistd.h>

using namespace promfile;

/**
 * Graceful shutdown handler for SIGTERM/SIGINT (GLib version)
 */
static gboolean shutdown_handler_glib(gpointer user_data) {
    Logger::info("[Shutdown] Signal received, shutting down...");
    g_main_loop_quit(static_cast<GMainLoop*>(user_data));
    return G_SOURCE_REMOVE;
}

static void install_signal_handlers(GMainLoop* loop) {
    // A client hanging up mid-response must not kill the server
    signal(SIGPIPE, SIG_IGN);

    g_unix_signal_add(SIGTERM, shutdown_handler_glib, loop);
    g_unix_signal_add(SIGINT, shutdown_handler_glib, loop);
}

static void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config FILE     Settings file (default: ~/.config/prom-file-server/settings.json)\n"
              << "  --file PATH       File to serve\n"
              << "  --address ADDR    Listen address (default: 0.0.0.0)\n"
              << "  --port N          Listen port (default: 8080)\n"
              << "  --endpoint PATH   HTTP path serving the file (default: /metrics)\n"
              << "  --debug           Enable debug logging\n"
              << "  --help            Show this help message\n";
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::vector<std::pair<std::string, std::string>> overrides;
    bool debug_mode = false;

    // Parse arguments; options taking a value accept "--opt value" and "--opt=value"
    for (int i = 1; i < argc; i++) {
        std::string arg(argv[i]);
        std::string value;
        bool has_inline_value = false;
        size_t eq = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            has_inline_value = true;
        }

        if (arg == "--debug") {
            debug_mode = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }

        std::string key;
        if (arg == "--config") key = "config";
        else if (arg == "--file") key = "file_path";
        else if (arg == "--address") key = "listen_address";
        else if (arg == "--port") key = "listen_port";
        else if (arg == "--endpoint") key = "endpoint_path";
        else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 2;
        }

        if (!has_inline_value) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return 2;
            }
            value = argv[++i];
        }

        if (key == "config") {
            config_path = value;
        } else {
            overrides.emplace_back(key, value);
        }
    }

    Logger::init(debug_mode ? LogLevel::DEBUG : LogLevel::INFO);

    auto& settings = Settings::getInstance();
    settings.load(config_path);
    for (const auto& [key, value] : overrides) {
        settings.set_string(key, value);
    }

    LogLevel level = LogLevel::INFO;
    if (!debug_mode && !parse_log_level(settings.get_log_level(), level)) {
        Logger::warn("[Main] Unknown log_level '" + settings.get_log_level() + "', using info");
    }
    Logger::init(debug_mode ? LogLevel::DEBUG : level, settings.get_log_file());

    std::string file_path = settings.get_file_path();
    if (file_path.empty()) {
        Logger::error("[Main] No file to serve: set file_path in " + settings.get_config_path() + " or pass --file");
        return 1;
    }

    ContentStore store;
    if (!store.load(file_path)) {
        Logger::error("[Main] Failed to load " + file_path);
        return 1;
    }

    GMainLoop* loop = g_main_loop_new(nullptr, FALSE);
    install_signal_handlers(loop);

    HttpServer server(store, settings.get_endpoint_path());
    GError* error = nullptr;
    if (!server.start(settings.get_listen_address(), settings.get_listen_port(), &error)) {
        Logger::error("[Main] Failed to start HTTP server: " + std::string(error ? error->message : "unknown error"));
        g_clear_error(&error);
        g_main_loop_unref(loop);
        return 1;
    }

    WatchOptions options;
    options.symlink_poll_interval = std::chrono::milliseconds(settings.get_symlink_poll_interval_ms());
    FileFollower follower(store, file_path, options,
                          std::chrono::milliseconds(settings.get_rewatch_delay_ms()));
    if (!follower.start()) {
        Logger::error("[Main] Failed to start following " + file_path);
        server.stop();
        g_main_loop_unref(loop);
        return 1;
    }

    Logger::info("[Main] prom-file-server running (pid " + std::to_string(getpid()) + ")");
    g_main_loop_run(loop);

    follower.stop();
    server.stop();
    g_main_loop_unref(loop);

    Logger::info("[Main] Shutdown complete");
    return 0;
}
