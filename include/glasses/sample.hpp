/*
 * File: include/glasses/sample.hpp
 * Project: Glasses Controller
 * Purpose: Live data channels, samples and the latest-sample store
 * Notes:
 *  - One datagram may carry several channel keys; each is merged on its own
 *  - Store readers get copies; the receive duty is the only writer
 * Last updated: 2026-10-18
 */

#pragma once
#include <array>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

#include "glasses/log.hpp"

enum class Channel : std::size_t
{
    accelerometer,
    gyroscope,
    left_pupil_center,
    left_pupil_diameter,
    left_gaze_direction,
    right_pupil_center,
    right_pupil_diameter,
    right_gaze_direction,
    gaze_point,
    gaze_point_3d,
    presentation_ts,
    video_ts,
    pts_video_sync,
};

inline constexpr std::size_t kChannelCount = 13;

struct ChannelInfo
{
    Channel channel;
    const char *key;   // field carried in the datagram
    const char *group; // snapshot group ("mems", "left_eye", ...) or nullptr
    const char *eye;   // required "eye" value, or nullptr
};

inline constexpr std::array<ChannelInfo, kChannelCount> kChannels{{
    {Channel::accelerometer, "ac", "mems", nullptr},
    {Channel::gyroscope, "gy", "mems", nullptr},
    {Channel::left_pupil_center, "pc", "left_eye", "left"},
    {Channel::left_pupil_diameter, "pd", "left_eye", "left"},
    {Channel::left_gaze_direction, "gd", "left_eye", "left"},
    {Channel::right_pupil_center, "pc", "right_eye", "right"},
    {Channel::right_pupil_diameter, "pd", "right_eye", "right"},
    {Channel::right_gaze_direction, "gd", "right_eye", "right"},
    {Channel::gaze_point, "gp", nullptr, nullptr},
    {Channel::gaze_point_3d, "gp3", nullptr, nullptr},
    {Channel::presentation_ts, "pts", nullptr, nullptr},
    {Channel::video_ts, "vts", nullptr, nullptr},
    {Channel::pts_video_sync, "pv", nullptr, nullptr},
}};

inline const ChannelInfo &channel_info(Channel c) { return kChannels[static_cast<std::size_t>(c)]; }

// "mems.ac", "left_eye.pd", "gp", ...
inline std::string channel_name(Channel c)
{
    const auto &info = channel_info(c);
    return info.group ? std::string(info.group) + "." + info.key : std::string(info.key);
}

struct Sample
{
    double ts = -1; // -1: nothing received yet
    std::vector<double> values;
    nlohmann::json message = nlohmann::json{{"ts", -1}};

    bool has_data() const { return ts >= 0; }
};

// Value of a channel field: a number or an array of numbers.
inline std::optional<std::vector<double>> extract_values(const nlohmann::json &field)
{
    if (field.is_number())
        return std::vector<double>{field.get<double>()};
    if (!field.is_array())
        return std::nullopt;
    std::vector<double> out;
    out.reserve(field.size());
    for (const auto &v : field)
    {
        if (!v.is_number())
            return std::nullopt;
        out.push_back(v.get<double>());
    }
    return out;
}

class Snapshot
{
    std::array<Sample, kChannelCount> samples_{};

public:
    const Sample &at(Channel c) const { return samples_[static_cast<std::size_t>(c)]; }
    Sample &at(Channel c) { return samples_[static_cast<std::size_t>(c)]; }

    // Nested device layout: {"mems":{"ac":..,"gy":..},"left_eye":{..},"right_eye":{..},"gp":..,...}
    nlohmann::json to_json() const
    {
        nlohmann::json out = nlohmann::json::object();
        for (const auto &info : kChannels)
        {
            const auto &msg = at(info.channel).message;
            if (info.group)
                out[info.group][info.key] = msg;
            else
                out[info.key] = msg;
        }
        return out;
    }
};

class SampleStore
{
    mutable std::mutex m_;
    Snapshot latest_{};

public:
    // Applies the merge rule for every channel key in `msg`: a channel takes
    // the whole message when s == 0 and ts is newer than what it holds.
    // Returns the number of channels updated.
    std::size_t merge(const nlohmann::json &msg)
    {
        if (!msg.is_object())
            return 0;
        auto ts_it = msg.find("ts");
        auto s_it = msg.find("s");
        if (ts_it == msg.end() || !ts_it->is_number())
            return 0;
        if (s_it == msg.end() || !s_it->is_number())
            return 0;
        const double ts = ts_it->get<double>();
        const bool valid = s_it->get<double>() == 0;

        std::string eye;
        if (auto e = msg.find("eye"); e != msg.end() && e->is_string())
            eye = e->get<std::string>();

        std::size_t updated = 0;
        std::scoped_lock lk(m_);
        for (const auto &info : kChannels)
        {
            auto field = msg.find(info.key);
            if (field == msg.end())
                continue;
            if (info.eye && eye != info.eye)
                continue;
            auto values = extract_values(*field);
            if (!values)
            {
                log_debug("skipping malformed '", info.key, "' field at ts=", ts);
                continue;
            }
            Sample &slot = latest_.at(info.channel);
            if (!valid || !(ts > slot.ts))
                continue;
            slot.ts = ts;
            slot.values = std::move(*values);
            slot.message = msg;
            ++updated;
        }
        return updated;
    }

    // Datagram payload straight off the socket; unparseable text updates nothing.
    std::size_t merge_datagram(std::string_view payload)
    {
        auto j = nlohmann::json::parse(payload.begin(), payload.end(), nullptr, false);
        if (j.is_discarded())
        {
            log_debug("dropping datagram that is not JSON (", payload.size(), " bytes)");
            return 0;
        }
        return merge(j);
    }

    Sample get(Channel c) const
    {
        std::scoped_lock lk(m_);
        return latest_.at(c);
    }

    Snapshot snapshot() const
    {
        std::scoped_lock lk(m_);
        return latest_;
    }
};
