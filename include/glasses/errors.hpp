/*
 * File: include/glasses/errors.hpp
 * Project: Glasses Controller
 * Purpose: Exception types raised by the controller
 * Notes:
 *  - Setup failures propagate out of the GlassesController constructor
 *  - Streaming duties never let these escape; they log instead
 * Last updated: 2026-10-18
 */

#pragma once
#include <stdexcept>
#include <string>

// No interface enumeration on this host; an explicit address is required.
struct DiscoveryUnavailable : std::runtime_error
{
    explicit DiscoveryUnavailable(const std::string &what) : std::runtime_error(what) {}
};

struct NoDeviceFound : std::runtime_error
{
    NoDeviceFound() : std::runtime_error("No device found using discovery process") {}
};

struct ConnectFailed : std::runtime_error
{
    explicit ConnectFailed(const std::string &address)
        : std::runtime_error("Failed to connect to the glasses at " + address) {}
};

// Transport or HTTP-level failure of a control-plane request.
struct RequestFailed : std::runtime_error
{
    explicit RequestFailed(const std::string &what) : std::runtime_error(what) {}
};

struct AlreadyStreaming : std::runtime_error
{
    AlreadyStreaming() : std::runtime_error("streaming is already active") {}
};
