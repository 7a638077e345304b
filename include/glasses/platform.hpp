/*
 * File: include/glasses/platform.hpp
 * Project: Glasses Controller
 * Purpose: Per-OS network behaviour of the device protocol
 * Notes:
 *  - Fixed at compile time, copied into ControllerConfig as defaults
 * Last updated: 2026-10-18
 */

#pragma once

// The discovery probe goes to the listen port itself on Windows and macOS
// and to listen port + 1 everywhere else. On Windows a scoped IPv6 address
// ("fe80::1%12") is split and only the bare address is used as the peer.

#if defined(_WIN32) || defined(__APPLE__)
inline constexpr bool kProbeOnListenPort = true;
#else
inline constexpr bool kProbeOnListenPort = false;
#endif

#if defined(_WIN32)
inline constexpr bool kStripAddressScope = true;
#else
inline constexpr bool kStripAddressScope = false;
#endif

inline constexpr unsigned short discovery_probe_port(unsigned short listen_port, bool probe_on_listen_port)
{
    return probe_on_listen_port ? listen_port : static_cast<unsigned short>(listen_port + 1);
}
