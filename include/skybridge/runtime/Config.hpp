#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace skybridge {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    // link
    std::string link_uri{"udp:0.0.0.0:14557"};
    std::chrono::milliseconds link_timeout{3000};
    std::chrono::milliseconds backoff_initial{250};
    std::chrono::milliseconds backoff_max{8000};

    // http
    std::string http_address{"0.0.0.0"};
    uint16_t    http_port{8000};
    unsigned    http_threads{2};
    std::string static_root;
    std::string tls_cert;
    std::string tls_key;

    // push
    std::size_t queue_depth{64};
    std::chrono::milliseconds stale_after{2000};

    bool tls_enabled() const { return !tls_cert.empty(); }
};

// Every key is optional; missing keys keep their defaults.
Config config_from_json(const nlohmann::json& j);

// Empty path returns the defaults. Throws ConfigError.
Config load_config(const std::string& path);

// SKYBRIDGE_LINK, SKYBRIDGE_HTTP_PORT, SKYBRIDGE_STATIC_ROOT.
void apply_env_overrides(Config& cfg);

// Throws ConfigError on the first invalid setting.
void validate(const Config& cfg);

} // namespace skybridge
