/*
 * File: include/glasses/config.hpp
 * Project: Glasses Controller
 * Purpose: Controller configuration: defaults, JSON file, command line
 * Notes:
 *  - Precedence: built-in defaults < --config file < other flags
 *  - Durations in the JSON file are given in milliseconds ("*_ms")
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

#include "glasses/log.hpp"
#include "glasses/platform.hpp"

// Timing of the streaming duties.
struct SessionTiming
{
    std::chrono::milliseconds keepalive_interval{1000};
    std::chrono::milliseconds receive_grace{1000};
    std::chrono::milliseconds receive_timeout{5000};
};

struct ControllerConfig
{
    // Empty address means "run discovery".
    std::string address;
    bool video_scene = false;
    std::optional<std::chrono::milliseconds> connect_timeout;

    unsigned short udp_port = 49152;
    unsigned short http_port = 80;
    std::optional<std::chrono::milliseconds> request_timeout;
    std::chrono::milliseconds status_poll_interval{1000};

    unsigned short discovery_port = 13006;
    std::chrono::milliseconds discovery_timeout{30000};
    std::string discovery_address = "ff02::1";
    // Empty means every interface with a link-local IPv6 address.
    std::string discovery_interface;
    bool probe_on_listen_port = kProbeOnListenPort;
    bool strip_address_scope = kStripAddressScope;

    SessionTiming timing{};
    std::string log_level = "info";
};

namespace detail
{
inline std::optional<std::chrono::milliseconds> optional_ms(const nlohmann::json &j, const char *key,
                                                            std::optional<std::chrono::milliseconds> fallback)
{
    if (!j.contains(key))
        return fallback;
    const auto &v = j.at(key);
    if (v.is_null())
        return std::nullopt;
    return std::chrono::milliseconds(v.get<long long>());
}

inline unsigned short checked_port(long long value, const char *what)
{
    if (value < 1 || value > 65535)
        throw std::runtime_error(std::string(what) + " out of range: " + std::to_string(value));
    return static_cast<unsigned short>(value);
}

inline unsigned short port(const nlohmann::json &j, const char *key, unsigned short fallback)
{
    if (!j.contains(key))
        return fallback;
    return checked_port(j.at(key).get<long long>(), key);
}

inline unsigned short port_arg(const char *text, const char *flag)
{
    std::size_t used = 0;
    long long value = std::stoll(text, &used);
    if (text[used] != '\0')
        throw std::runtime_error(std::string(flag) + " is not a port number: " + text);
    return checked_port(value, flag);
}

inline std::chrono::milliseconds ms(const nlohmann::json &j, const char *key, std::chrono::milliseconds fallback)
{
    return std::chrono::milliseconds(j.value(key, static_cast<long long>(fallback.count())));
}
} // namespace detail

// Overlays the keys present in `j` onto `cfg`. Throws nlohmann::json::exception on wrong types
// and std::runtime_error on ports outside 1..65535.
inline void apply_config_json(ControllerConfig &cfg, const nlohmann::json &j)
{
    cfg.address = j.value("address", cfg.address);
    cfg.video_scene = j.value("video_scene", cfg.video_scene);
    cfg.connect_timeout = detail::optional_ms(j, "connect_timeout_ms", cfg.connect_timeout);
    cfg.udp_port = detail::port(j, "udp_port", cfg.udp_port);
    cfg.http_port = detail::port(j, "http_port", cfg.http_port);
    cfg.request_timeout = detail::optional_ms(j, "request_timeout_ms", cfg.request_timeout);
    cfg.status_poll_interval = detail::ms(j, "status_poll_interval_ms", cfg.status_poll_interval);
    cfg.discovery_port = detail::port(j, "discovery_port", cfg.discovery_port);
    cfg.discovery_timeout = detail::ms(j, "discovery_timeout_ms", cfg.discovery_timeout);
    cfg.discovery_address = j.value("discovery_address", cfg.discovery_address);
    cfg.discovery_interface = j.value("discovery_interface", cfg.discovery_interface);
    cfg.probe_on_listen_port = j.value("probe_on_listen_port", cfg.probe_on_listen_port);
    cfg.strip_address_scope = j.value("strip_address_scope", cfg.strip_address_scope);
    cfg.timing.keepalive_interval = detail::ms(j, "keepalive_interval_ms", cfg.timing.keepalive_interval);
    cfg.timing.receive_grace = detail::ms(j, "receive_grace_ms", cfg.timing.receive_grace);
    cfg.timing.receive_timeout = detail::ms(j, "receive_timeout_ms", cfg.timing.receive_timeout);
    cfg.log_level = j.value("log_level", cfg.log_level);
}

inline void load_config_file(ControllerConfig &cfg, const std::string &path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("failed to open config file " + path);
    nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        throw std::runtime_error("config file is not a JSON object: " + path);
    apply_config_json(cfg, j);
}

// Controller flags out of argv. Unknown flags are left for the caller.
inline ControllerConfig parse_config_args(int argc, char **argv)
{
    ControllerConfig cfg;
    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::string(argv[i]) == "--config")
        {
            load_config_file(cfg, argv[i + 1]);
            break;
        }
    }
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--address" && i + 1 < argc)
            cfg.address = argv[++i];
        else if (a == "--video")
            cfg.video_scene = true;
        else if (a == "--timeout" && i + 1 < argc)
            cfg.connect_timeout = std::chrono::milliseconds(static_cast<long long>(std::stod(argv[++i]) * 1000));
        else if (a == "--udp-port" && i + 1 < argc)
            cfg.udp_port = detail::port_arg(argv[++i], "--udp-port");
        else if (a == "--http-port" && i + 1 < argc)
            cfg.http_port = detail::port_arg(argv[++i], "--http-port");
        else if (a == "--interface" && i + 1 < argc)
            cfg.discovery_interface = argv[++i];
        else if (a == "--log-level" && i + 1 < argc)
            cfg.log_level = argv[++i];
        else if (a == "--config" && i + 1 < argc)
            ++i;
    }
    if (!set_log_level(cfg.log_level))
        log_warn("unknown log level '", cfg.log_level, "', keeping the default");
    return cfg;
}
