/*
 * File: include/glasses/discovery.hpp
 * Project: Glasses Controller
 * Purpose: Locate glasses on the local link with an IPv6 multicast probe
 * Notes:
 *  - Probe {"type":"discover"} to ff02::1 (or a configured target), one interface at a time
 *  - First interface with a JSON reply wins; failures move on to the next one
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#if defined(__unix__) || defined(__APPLE__)
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#define GLASSES_HAVE_IFADDRS 1
#endif

#include "glasses/errors.hpp"
#include "glasses/log.hpp"
#include "glasses/platform.hpp"
#include "glasses/transport.hpp"

inline constexpr const char *kDiscoveryMulticastAddr = "ff02::1";
inline constexpr const char *kDiscoveryRequest = R"({"type":"discover"})";

struct DiscoveryOptions
{
    unsigned short listen_port = 13006;
    bool probe_on_listen_port = kProbeOnListenPort;
    std::chrono::milliseconds timeout{30000};
    std::string target_address = kDiscoveryMulticastAddr;
    // Probe only this interface instead of every link-scoped one.
    std::string interface_name;
};

struct DiscoveryResult
{
    nlohmann::json metadata; // the device's announcement
    std::string address;     // source address of the reply, scoped for link-local
};

struct ScopedInterface
{
    std::string name;
    unsigned int index = 0;
};

// Interfaces whose first IPv6 address is link-scoped, in enumeration order.
inline std::vector<ScopedInterface> scoped_ipv6_interfaces()
{
#ifdef GLASSES_HAVE_IFADDRS
    ifaddrs *list = nullptr;
    if (::getifaddrs(&list) != 0)
        throw DiscoveryUnavailable(std::string("cannot enumerate network interfaces: ") + std::strerror(errno));

    std::vector<std::string> seen;
    std::vector<ScopedInterface> out;
    for (ifaddrs *it = list; it != nullptr; it = it->ifa_next)
    {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET6 || !it->ifa_name)
            continue;
        std::string name = it->ifa_name;
        if (std::find(seen.begin(), seen.end(), name) != seen.end())
            continue;
        seen.push_back(name);

        const auto *sin6 = reinterpret_cast<const sockaddr_in6 *>(it->ifa_addr);
        if (sin6->sin6_scope_id == 0)
            continue;
        unsigned int idx = ::if_nametoindex(it->ifa_name);
        if (idx == 0)
            continue;
        out.push_back({name, idx});
    }
    ::freeifaddrs(list);
    return out;
#else
    throw DiscoveryUnavailable("network interface enumeration is not available on this platform");
#endif
}

// Probes a single interface. nullopt on timeout, transport error or a reply that is not JSON.
inline std::optional<DiscoveryResult> probe_interface(const ScopedInterface &iface, const DiscoveryOptions &opts)
{
    namespace ip = boost::asio::ip;
    const unsigned short out_port = discovery_probe_port(opts.listen_port, opts.probe_on_listen_port);
    try
    {
        boost::asio::io_context io;
        udp::socket s6{io};
        s6.open(udp::v6());
        s6.set_option(ip::multicast::outbound_interface(iface.index));
        s6.set_option(boost::asio::socket_base::reuse_address(true));
        s6.bind(udp::endpoint(udp::v6(), opts.listen_port));

        auto group = ip::make_address_v6(opts.target_address);
        if (group.is_multicast() || group.is_link_local())
            group.scope_id(iface.index);
        udp::endpoint target{group, out_port};
        std::string req = kDiscoveryRequest;
        s6.send_to(boost::asio::buffer(req), target);
        log_debug("Discover request sent to ", opts.target_address, ":", out_port, " on interface ", iface.name);
        log_debug("Waiting for a response from the device ...");

        std::array<char, 1024> buf{};
        udp::endpoint from;
        nlohmann::json j;
        std::string body;
        const auto deadline = std::chrono::steady_clock::now() + opts.timeout;
        while (true)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
            auto n = left.count() > 0 ? receive_with_timeout(io, s6, boost::asio::buffer(buf), from, left) : std::nullopt;
            if (!n)
            {
                log_debug("No device found on interface ", iface.name);
                return std::nullopt;
            }
            body.assign(buf.data(), *n);
            j = nlohmann::json::parse(body, nullptr, false);
            if (j.is_discarded())
            {
                log_debug("Ignoring non-JSON discovery reply on interface ", iface.name, ": ", body);
                return std::nullopt;
            }
            // Our own probe looped back when probing on the listen port.
            if (j.is_object() && j.contains("type") && j["type"] == "discover")
                continue;
            break;
        }
        std::string addr = from.address().to_string();
        log_debug("From: ", addr, " ", body);
        log_debug("Glasses found with address: [", addr, "]");
        return DiscoveryResult{std::move(j), addr};
    }
    catch (const boost::system::system_error &e)
    {
        log_debug("No device found on interface ", iface.name, " (", e.what(), ")");
        return std::nullopt;
    }
}

// Looks up a named interface. Throws DiscoveryUnavailable when it does not exist.
inline ScopedInterface named_interface(const std::string &name)
{
#ifdef GLASSES_HAVE_IFADDRS
    unsigned int idx = ::if_nametoindex(name.c_str());
    if (idx == 0)
        throw DiscoveryUnavailable("no network interface named " + name);
    return {name, idx};
#else
    throw DiscoveryUnavailable("network interface lookup is not available on this platform");
#endif
}

// Throws DiscoveryUnavailable when interfaces cannot be enumerated.
inline std::optional<DiscoveryResult> discover(const DiscoveryOptions &opts = {})
{
    log_debug("Looking for glasses on the local network ...");
    auto interfaces = opts.interface_name.empty() ? scoped_ipv6_interfaces()
                                                  : std::vector<ScopedInterface>{named_interface(opts.interface_name)};
    for (const auto &iface : interfaces)
    {
        if (auto found = probe_interface(iface, opts))
            return found;
    }
    log_debug("The discovery process did not find any device!");
    return std::nullopt;
}
