#include "skybridge/runtime/Config.hpp"
#include "skybridge/link/LinkUri.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace skybridge {

namespace {

std::chrono::milliseconds millis(const json& section, const char* key,
                                 std::chrono::milliseconds def) {
    const int64_t v = section.value(key, static_cast<int64_t>(def.count()));
    if (v < 0) throw ConfigError(std::string(key) + " must not be negative");
    return std::chrono::milliseconds(v);
}

uint16_t port_number(int64_t v, const std::string& what) {
    if (v < 0 || v > 65535) throw ConfigError(what + " out of range: " + std::to_string(v));
    return static_cast<uint16_t>(v);
}

} // namespace

Config config_from_json(const json& j) {
    Config cfg;
    if (!j.is_object()) throw ConfigError("config root must be a JSON object");

    try {
        if (j.contains("link")) {
            const json& link = j.at("link");
            cfg.link_uri        = link.value("uri", cfg.link_uri);
            cfg.link_timeout    = millis(link, "timeout_ms", cfg.link_timeout);
            cfg.backoff_initial = millis(link, "backoff_initial_ms", cfg.backoff_initial);
            cfg.backoff_max     = millis(link, "backoff_max_ms", cfg.backoff_max);
        }

        if (j.contains("http")) {
            const json& http = j.at("http");
            cfg.http_address = http.value("address", cfg.http_address);
            cfg.http_port    = port_number(http.value("port", static_cast<int64_t>(cfg.http_port)),
                                           "http.port");
            const int64_t threads = http.value("threads", static_cast<int64_t>(cfg.http_threads));
            if (threads < 1 || threads > 64) throw ConfigError("http.threads must be 1..64");
            cfg.http_threads = static_cast<unsigned>(threads);
            cfg.static_root  = http.value("static_root", cfg.static_root);
            cfg.tls_cert     = http.value("tls_cert", cfg.tls_cert);
            cfg.tls_key      = http.value("tls_key", cfg.tls_key);
        }

        if (j.contains("push")) {
            const json& push = j.at("push");
            const int64_t depth = push.value("queue_depth", static_cast<int64_t>(cfg.queue_depth));
            if (depth < 1) throw ConfigError("push.queue_depth must be >= 1");
            cfg.queue_depth = static_cast<std::size_t>(depth);
            cfg.stale_after = millis(push, "stale_after_ms", cfg.stale_after);
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("config: ") + e.what());
    }

    return cfg;
}

Config load_config(const std::string& path) {
    if (path.empty()) return Config{};

    std::ifstream f(path);
    if (!f.good()) throw ConfigError("cannot open config file " + path);

    json j;
    try {
        f >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("config " + path + ": " + e.what());
    }
    return config_from_json(j);
}

void apply_env_overrides(Config& cfg) {
    if (const char* link = std::getenv("SKYBRIDGE_LINK")) {
        cfg.link_uri = link;
    }
    if (const char* port = std::getenv("SKYBRIDGE_HTTP_PORT")) {
        long long value = 0;
        std::size_t used = 0;
        try {
            value = std::stoll(port, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used == 0 || port[used] != '\0') {
            throw ConfigError(std::string("SKYBRIDGE_HTTP_PORT is not a number: ") + port);
        }
        cfg.http_port = port_number(value, "SKYBRIDGE_HTTP_PORT");
    }
    if (const char* root = std::getenv("SKYBRIDGE_STATIC_ROOT")) {
        cfg.static_root = root;
    }
}

void validate(const Config& cfg) {
    try {
        parse_link_uri(cfg.link_uri);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }

    if (cfg.link_timeout.count() == 0) throw ConfigError("link.timeout_ms must be > 0");
    if (cfg.backoff_initial.count() == 0) throw ConfigError("link.backoff_initial_ms must be > 0");
    if (cfg.backoff_max < cfg.backoff_initial) {
        throw ConfigError("link.backoff_max_ms must be >= link.backoff_initial_ms");
    }
    if (cfg.queue_depth == 0) throw ConfigError("push.queue_depth must be >= 1");
    if (cfg.http_threads == 0) throw ConfigError("http.threads must be >= 1");
    if (cfg.tls_cert.empty() != cfg.tls_key.empty()) {
        throw ConfigError("http.tls_cert and http.tls_key must be set together");
    }
}

} // namespace skybridge
