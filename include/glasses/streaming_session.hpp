/*
 * File: include/glasses/streaming_session.hpp
 * Project: Glasses Controller
 * Purpose: Keepalive and receive duties behind live data streaming
 * Notes:
 *  - Duties stop cooperatively: each loop checks the streaming flag once per pass
 *  - A receive timeout ends streaming from inside (flag cleared, duties wind down)
 *  - Nothing thrown inside a duty leaves it; errors are logged
 * Last updated: 2026-10-18
 */

#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

#include "glasses/config.hpp"
#include "glasses/errors.hpp"
#include "glasses/log.hpp"
#include "glasses/sample.hpp"
#include "glasses/transport.hpp"

inline std::string random_uuid()
{
    return boost::uuids::to_string(boost::uuids::random_generator()());
}

// {"type":"live.data.unicast","key":"<uuid>","op":"start"}
inline std::string data_keepalive_message(const std::string &key)
{
    return nlohmann::json{{"type", "live.data.unicast"}, {"key", key}, {"op", "start"}}.dump();
}

// {"type":"live.video.unicast","key":"<uuid>_video","op":"start"}
inline std::string video_keepalive_message(const std::string &key)
{
    return nlohmann::json{{"type", "live.video.unicast"}, {"key", key + "_video"}, {"op", "start"}}.dump();
}

class StreamingSession
{
    UdpChannel &data_;
    UdpChannel *video_; // null when scene video is off
    SampleStore &store_;
    SessionTiming timing_;
    std::string data_ka_;
    std::string video_ka_;

    std::atomic<bool> streaming_{false};
    std::mutex wake_mtx_;
    std::condition_variable wake_;
    std::mutex duties_mtx_;
    std::vector<std::thread> duties_;

public:
    StreamingSession(UdpChannel &data, UdpChannel *video, SampleStore &store, SessionTiming timing)
        : data_(data), video_(video), store_(store), timing_(timing),
          data_ka_(data_keepalive_message(random_uuid())),
          video_ka_(video_keepalive_message(random_uuid())) {}

    StreamingSession(const StreamingSession &) = delete;
    StreamingSession &operator=(const StreamingSession &) = delete;
    ~StreamingSession() { stop(); }

    bool streaming() const { return streaming_.load(); }
    const std::string &data_keepalive() const { return data_ka_; }
    const std::string &video_keepalive() const { return video_ka_; }

    // Throws AlreadyStreaming while duties are running.
    void start()
    {
        std::scoped_lock lk(duties_mtx_);
        if (streaming_.load())
            throw AlreadyStreaming();
        // Duties left over from a stream that ended on a receive timeout.
        join_all();

        streaming_.store(true);
        try
        {
            duties_.emplace_back([this]
                                 { keepalive_duty(data_, data_ka_, "data"); });
            duties_.emplace_back([this]
                                 { receive_duty(); });
            if (video_)
            {
                duties_.emplace_back([this]
                                     { keepalive_duty(*video_, video_ka_, "video"); });
                log_debug("Video streaming started...");
            }
        }
        catch (const std::system_error &)
        {
            streaming_.store(false);
            wake_.notify_all();
            join_all();
            throw;
        }
        log_debug("Data streaming started...");
    }

    // Clears the flag and joins every duty. Worst case waits one receive timeout.
    void stop()
    {
        std::scoped_lock lk(duties_mtx_);
        {
            std::scoped_lock wl(wake_mtx_);
            streaming_.store(false);
        }
        wake_.notify_all();
        join_all();
    }

private:
    void join_all()
    {
        for (auto &t : duties_)
        {
            if (!t.joinable())
                continue;
            try
            {
                t.join();
            }
            catch (const std::system_error &e)
            {
                log_error("An error occurs trying to stop data streaming: ", e.what());
            }
        }
        duties_.clear();
    }

    // Sleeps up to `d`; returns early (false) once streaming stops.
    bool pause_while_streaming(std::chrono::milliseconds d)
    {
        std::unique_lock lk(wake_mtx_);
        return !wake_.wait_for(lk, d, [this]
                               { return !streaming_.load(); });
    }

    void end_streaming()
    {
        {
            std::scoped_lock wl(wake_mtx_);
            streaming_.store(false);
        }
        wake_.notify_all();
    }

    void keepalive_duty(UdpChannel &channel, const std::string &msg, const char *what)
    {
        while (streaming_.load())
        {
            try
            {
                channel.send(msg);
            }
            catch (const std::exception &e)
            {
                log_error("sending ", what, " keepalive failed: ", e.what());
            }
            if (!pause_while_streaming(timing_.keepalive_interval))
                break;
        }
    }

    void receive_duty()
    {
        if (!pause_while_streaming(timing_.receive_grace))
            return;
        while (streaming_.load())
        {
            try
            {
                auto datagram = data_.receive();
                if (!datagram)
                {
                    log_error("A timeout occurred while receiving data");
                    end_streaming();
                    break;
                }
                store_.merge_datagram(*datagram);
            }
            catch (const std::exception &e)
            {
                log_error("receiving live data failed: ", e.what());
                end_streaming();
                break;
            }
        }
    }
};
