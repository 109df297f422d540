#include "config.hpp"
#include "http_server.hpp"
#include "log.hpp"
#include "origin_fetcher.hpp"
#include "request_handler.hpp"
#include "settings.hpp"

#include <CLI/CLI.hpp>
#include <iostream>
#include <csignal>
#include <filesystem>
#include <stdexcept>

using namespace blackhole;

// ========== Signal Handling ==========

static HttpServer* g_server = nullptr;  // Global server for signal handler.

// Handles SIGINT/SIGTERM by stopping the listener so main can return.
void signal_handler(int) {
    if (g_server) {
        g_server->stop();
    }
}

// Applies log.enabled / log.level, with -v forcing at least debug.
static void configure_logging(const Settings& settings, bool verbose) {
    if (!settings.log.enabled && !verbose) {
        set_log_level(LogLevel::Off);
        return;
    }
    LogLevel level = parse_log_level(settings.log.level);
    if (verbose && level > LogLevel::Debug) {
        level = LogLevel::Debug;
    }
    set_log_level(level);
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Static asset server with a caching unpkg proxy"};
    app.footer("\nExamples:\n"
               "  blackhole                            Serve using ./blackhole.json\n"
               "  blackhole -c /etc/blackhole.json     Use another settings file\n"
               "  blackhole --enable-proxy -p 9000     Proxy unpkg on port 9000\n"
               "  blackhole --write-config             Write the effective settings and exit\n");

    std::string config_path = SETTINGS_FILE;
    app.add_option("-c,--config", config_path, "Settings file (default: blackhole.json)");

    std::string host;
    app.add_option("--host", host, "Bind address, overrides server.host");

    int port = 0;
    app.add_option("-p,--port", port, "Port, overrides server.port")
        ->check(CLI::Range(1, 65535));

    bool enable_proxy = false;
    app.add_flag("--enable-proxy", enable_proxy, "Enable the unpkg proxy, overrides proxy.enabled");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    bool write_config = false;
    app.add_flag("--write-config", write_config,
                 "Write the effective settings to the settings file and exit");

    CLI11_PARSE(app, argc, argv);

    Settings settings;
    try {
        auto loaded = load_settings(config_path);
        if (loaded) {
            settings = *loaded;
        }
        configure_logging(settings, verbose);
        if (!loaded) {
            log_warn("Main", "Settings file " + config_path + " not found, using defaults");
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (!host.empty()) {
        settings.server.host = host;
    }
    if (port != 0) {
        settings.server.port = port;
    }
    if (enable_proxy) {
        settings.proxy.enabled = true;
    }

    if (write_config) {
        try {
            save_settings(settings, config_path);
        } catch (const std::exception& e) {
            log_error("Main", e.what());
            return 1;
        }
        log_info("Main", "Wrote settings to " + config_path);
        return 0;
    }

    try {
        ensure_directories(settings);
    } catch (const std::filesystem::filesystem_error& e) {
        log_error("Main", std::string("Failed to create directories: ") + e.what());
        return 1;
    }

    CurlOriginFetcher fetcher(settings.proxy.fetch_timeout_seconds);
    RequestHandler handler(settings, fetcher);
    HttpServer server(handler, settings.server.threads);

    g_server = &server;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    server.on_start([&settings](const std::string& address, int bound_port) {
        log_info("Main", "Server started at http://" + address + ":" + std::to_string(bound_port));
        log_info("Main", std::string("Proxy feature status: ") + (settings.proxy.enabled ? "enabled" : "disabled"));
        log_info("Main", "Static dir: " + settings.proxy.static_dir + ", cache dir: " + settings.proxy.cache_dir);
    });

    // Start HTTP server (blocks until stopped).
    bool ok = server.start(settings.server.host, settings.server.port);
    g_server = nullptr;

    if (!ok) {
        log_error("Main", "Failed to start HTTP server on " + settings.server.host + ":" +
                              std::to_string(settings.server.port));
        return 1;
    }

    log_info("Main", "Server stopped");
    return 0;
}
