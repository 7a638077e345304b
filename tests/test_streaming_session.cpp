/*
 * File: tests/test_streaming_session.cpp
 * Project: Glasses Controller
 * Purpose: Keepalive/receive duties against a fake glasses UDP peer
 * Last updated: 2026-10-18
 */

#include <chrono>
#include <thread>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "fake_device.hpp"
#include "glasses/sample.hpp"
#include "glasses/streaming_session.hpp"
#include "glasses/transport.hpp"

using namespace std::chrono_literals;
using nlohmann::json;

namespace
{
SessionTiming fast_timing()
{
    SessionTiming t;
    t.keepalive_interval = 100ms;
    t.receive_grace = 50ms;
    t.receive_timeout = 400ms;
    return t;
}
} // namespace

TEST_CASE("streaming sends the data keepalive repeatedly")
{
    FakeUdpPeer device;
    auto ch = make_socket("127.0.0.1", device.port(), "", 400ms);
    SampleStore store;
    StreamingSession session(*ch, nullptr, store, fast_timing());

    session.start();
    REQUIRE(session.streaming());

    auto first = device.receive(1s);
    REQUIRE(first.has_value());
    auto msg = json::parse(first->first);
    REQUIRE(msg["type"] == "live.data.unicast");
    REQUIRE(msg["op"] == "start");
    REQUIRE(first->first == session.data_keepalive());

    auto second = device.receive(1s);
    REQUIRE(second.has_value());
    REQUIRE(second->first == first->first);

    session.stop();
    REQUIRE_FALSE(session.streaming());
}

TEST_CASE("live data from the peer reaches the store")
{
    FakeUdpPeer device;
    auto ch = make_socket("127.0.0.1", device.port(), "", 400ms);
    SampleStore store;
    StreamingSession session(*ch, nullptr, store, fast_timing());
    session.start();

    auto ka = device.receive(1s);
    REQUIRE(ka.has_value());
    auto host = ka->second;

    REQUIRE(eventually([&]
                       {
        device.send(json{{"gp", {0.25, 0.75}}, {"ts", 1000}, {"s", 0}}, host);
        device.send(json{{"pd", 3.9}, {"eye", "left"}, {"ts", 1001}, {"s", 0}}, host);
        return store.get(Channel::gaze_point).ts == 1000 && store.get(Channel::left_pupil_diameter).ts == 1001; }));

    device.send(json{{"gp", {0.9, 0.9}}, {"ts", 900}, {"s", 0}}, host);
    device.send(std::string("garbage"), host);
    device.send(json{{"gp", {0.5, 0.5}}, {"ts", 1100}, {"s", 0}}, host);
    REQUIRE(eventually([&]
                       { return store.get(Channel::gaze_point).ts == 1100; }));
    REQUIRE(store.get(Channel::gaze_point).values == std::vector<double>{0.5, 0.5});

    session.stop();
    REQUIRE_FALSE(session.streaming());
}

TEST_CASE("a silent peer ends streaming without a stop call")
{
    FakeUdpPeer device;
    auto ch = make_socket("127.0.0.1", device.port(), "", 300ms);
    SampleStore store;
    StreamingSession session(*ch, nullptr, store, fast_timing());
    session.start();

    REQUIRE(eventually([&]
                       { return !session.streaming(); },
                       2s));

    SECTION("streaming can be started again afterwards")
    {
        REQUIRE_NOTHROW(session.start());
        REQUIRE(session.streaming());
        session.stop();
    }
}

TEST_CASE("starting twice is rejected")
{
    FakeUdpPeer device;
    auto ch = make_socket("127.0.0.1", device.port(), "", 400ms);
    SampleStore store;
    StreamingSession session(*ch, nullptr, store, fast_timing());
    session.start();
    REQUIRE_THROWS_AS(session.start(), AlreadyStreaming);
    REQUIRE(session.streaming());
    session.stop();
}

TEST_CASE("stop returns within one receive timeout")
{
    FakeUdpPeer device;
    auto ch = make_socket("127.0.0.1", device.port(), "", 400ms);
    SampleStore store;
    StreamingSession session(*ch, nullptr, store, fast_timing());
    session.start();
    std::this_thread::sleep_for(150ms);

    auto t0 = std::chrono::steady_clock::now();
    session.stop();
    auto took = std::chrono::steady_clock::now() - t0;
    REQUIRE_FALSE(session.streaming());
    REQUIRE(took < 400ms + 100ms + 300ms);

    // No duty is left sending keepalives.
    while (device.receive(150ms))
    {
    }
    REQUIRE_FALSE(device.receive(300ms).has_value());
}

TEST_CASE("stop without start does nothing")
{
    FakeUdpPeer device;
    auto ch = make_socket("127.0.0.1", device.port(), "", 400ms);
    SampleStore store;
    StreamingSession session(*ch, nullptr, store, fast_timing());
    REQUIRE_NOTHROW(session.stop());
    REQUIRE_FALSE(session.streaming());
}

TEST_CASE("scene video adds a video keepalive on its own socket")
{
    FakeUdpPeer device;
    FakeUdpPeer video_device;
    auto data = make_socket("127.0.0.1", device.port(), "", 400ms);
    auto video = make_socket("127.0.0.1", video_device.port(), "", 400ms);
    SampleStore store;
    StreamingSession session(*data, video.get(), store, fast_timing());
    session.start();

    auto ka = video_device.receive(1s);
    REQUIRE(ka.has_value());
    auto msg = json::parse(ka->first);
    REQUIRE(msg["type"] == "live.video.unicast");
    REQUIRE(msg["key"].get<std::string>().size() == 36 + 6);
    REQUIRE(msg["key"].get<std::string>().substr(36) == "_video");

    auto data_ka = device.receive(1s);
    REQUIRE(data_ka.has_value());
    REQUIRE(json::parse(data_ka->first)["type"] == "live.data.unicast");

    session.stop();
}

TEST_CASE("back-to-back keepalives while the receive duty runs")
{
    FakeUdpPeer device;
    auto ch = make_socket("127.0.0.1", device.port(), "", 400ms);
    SampleStore store;
    SessionTiming timing;
    timing.keepalive_interval = 1ms;
    timing.receive_grace = 0ms;
    timing.receive_timeout = 400ms;
    StreamingSession session(*ch, nullptr, store, timing);

    for (int round = 0; round < 20; ++round)
    {
        session.start();
        std::this_thread::sleep_for(80ms);
        REQUIRE(session.streaming());
        session.stop();
        REQUIRE_FALSE(session.streaming());
    }

    int keepalives = 0;
    while (auto got = device.receive(150ms))
    {
        REQUIRE(json::parse(got->first)["type"] == "live.data.unicast");
        ++keepalives;
    }
    REQUIRE(keepalives >= 20);
}
