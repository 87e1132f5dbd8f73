#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <thread>

#include "skybridge/api/SnapshotApi.hpp"
#include "skybridge/link/LinkReader.hpp"
#include "skybridge/link/LinkUri.hpp"
#include "skybridge/net/HttpServer.hpp"
#include "skybridge/runtime/Config.hpp"
#include "skybridge/runtime/Context.hpp"

using namespace skybridge;

static std::atomic<bool> g_running{true};
static void on_signal(int) { g_running.store(false); }

int main(int argc, char** argv) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::string config_path;
    if (argc > 1) {
        config_path = argv[1];
    } else if (const char* env = std::getenv("SKYBRIDGE_CONFIG")) {
        config_path = env;
    }

    Config cfg;
    try {
        cfg = load_config(config_path);
        apply_env_overrides(cfg);
        validate(cfg);
    } catch (const ConfigError& e) {
        std::cout << "[CONFIG] " << e.what() << "\n";
        return 2;
    }

    const LinkUri link_uri = parse_link_uri(cfg.link_uri);

    std::cout << "[SKYBRIDGE] Starting\n";
    std::cout << "[CONFIG] link=" << link_uri.to_string()
              << " http=" << cfg.http_address << ":" << cfg.http_port
              << " tls=" << (cfg.tls_enabled() ? "on" : "off")
              << " queue_depth=" << cfg.queue_depth
              << " stale_after_ms=" << cfg.stale_after.count()
              << (config_path.empty() ? "" : " file=" + config_path) << "\n";

    Context ctx(cfg);

    LinkReaderOptions link_opts;
    link_opts.timeout         = cfg.link_timeout;
    link_opts.backoff_initial = cfg.backoff_initial;
    link_opts.backoff_max     = cfg.backoff_max;

    LinkReader reader(ctx.store, ctx.hub,
                      make_transport_factory(link_uri),
                      link_opts);

    SnapshotApi api(ctx.store, ctx.hub,
                    [&reader]() { return reader.status(); },
                    cfg.stale_after);

    HttpServerOptions http_opts;
    http_opts.address     = cfg.http_address;
    http_opts.port        = cfg.http_port;
    http_opts.threads     = cfg.http_threads;
    http_opts.static_root = cfg.static_root;
    if (cfg.tls_enabled()) {
        http_opts.tls_cert = cfg.tls_cert;
        http_opts.tls_key  = cfg.tls_key;
    }

    HttpServer server(http_opts, api, ctx.hub);
    try {
        server.start();
    } catch (const std::exception& e) {
        std::cout << "[SKYBRIDGE] Fatal: " << e.what() << "\n";
        return 1;
    }

    std::thread link_thread([&reader]() { reader.run(g_running); });

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "[SKYBRIDGE] Shutting down\n";
    link_thread.join();
    ctx.hub.close_all();
    server.stop();
    std::cout << "[SKYBRIDGE] Bye\n";
    return 0;
}
