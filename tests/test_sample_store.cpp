/*
 * File: tests/test_sample_store.cpp
 * Project: Glasses Controller
 * Purpose: Merge rule of the latest-sample store
 * Last updated: 2026-10-18
 */

#include <atomic>
#include <random>
#include <thread>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "glasses/sample.hpp"

using nlohmann::json;

TEST_CASE("fresh store holds sentinels for every channel")
{
    SampleStore store;
    auto snap = store.snapshot();
    for (const auto &info : kChannels)
    {
        REQUIRE(snap.at(info.channel).ts == -1);
        REQUIRE_FALSE(snap.at(info.channel).has_data());
    }
    auto j = snap.to_json();
    REQUIRE(j["mems"]["ac"] == json{{"ts", -1}});
    REQUIRE(j["left_eye"]["gd"] == json{{"ts", -1}});
    REQUIRE(j["right_eye"]["pc"] == json{{"ts", -1}});
    REQUIRE(j["gp3"] == json{{"ts", -1}});
    REQUIRE(j["pv"] == json{{"ts", -1}});
}

TEST_CASE("older gaze point is rejected as stale")
{
    SampleStore store;
    REQUIRE(store.merge(json{{"gp", {0.5, 0.5}}, {"ts", 5}, {"s", 0}}) == 1);
    REQUIRE(store.merge(json{{"gp", {0.1, 0.9}}, {"ts", 3}, {"s", 0}}) == 0);

    auto gp = store.get(Channel::gaze_point);
    REQUIRE(gp.ts == 5);
    REQUIRE(gp.values == std::vector<double>{0.5, 0.5});
    REQUIRE(gp.message["gp"] == json{0.5, 0.5});
}

TEST_CASE("equal timestamp does not replace the stored sample")
{
    SampleStore store;
    store.merge(json{{"gp", {0.5, 0.5}}, {"ts", 5}, {"s", 0}});
    REQUIRE(store.merge(json{{"gp", {0.7, 0.7}}, {"ts", 5}, {"s", 0}}) == 0);
    REQUIRE(store.get(Channel::gaze_point).values[0] == 0.5);
}

TEST_CASE("sample with a non-zero status is ignored")
{
    SampleStore store;
    REQUIRE(store.merge(json{{"gp", {0.5, 0.5}}, {"ts", 5}, {"s", 1}}) == 0);
    REQUIRE(store.get(Channel::gaze_point).ts == -1);

    store.merge(json{{"gp", {0.2, 0.2}}, {"ts", 6}, {"s", 0}});
    REQUIRE(store.merge(json{{"gp", {0.9, 0.9}}, {"ts", 7}, {"s", 3}}) == 0);
    REQUIRE(store.get(Channel::gaze_point).ts == 6);
}

TEST_CASE("one datagram updates every channel it carries")
{
    SampleStore store;
    json msg{{"ac", {0.1, -9.8, 0.2}}, {"gy", {1.0, 2.0, 3.0}}, {"ts", 42}, {"s", 0}};
    REQUIRE(store.merge(msg) == 2);

    auto snap = store.snapshot();
    REQUIRE(snap.at(Channel::accelerometer).ts == 42);
    REQUIRE(snap.at(Channel::gyroscope).ts == 42);
    REQUIRE(snap.at(Channel::accelerometer).message == msg);
    REQUIRE(snap.at(Channel::gyroscope).message == msg);
    REQUIRE(snap.at(Channel::gaze_point).ts == -1);
}

TEST_CASE("absent keys leave their channels alone")
{
    SampleStore store;
    store.merge(json{{"gp3", {10.0, 20.0, 500.0}}, {"ts", 10}, {"s", 0}});
    store.merge(json{{"gp", {0.3, 0.4}}, {"ts", 20}, {"s", 0}});

    REQUIRE(store.get(Channel::gaze_point_3d).ts == 10);
    REQUIRE(store.get(Channel::gaze_point).ts == 20);
}

TEST_CASE("eye fields land on the eye named in the message")
{
    SampleStore store;
    REQUIRE(store.merge(json{{"pd", 4.2}, {"eye", "left"}, {"ts", 100}, {"s", 0}}) == 1);
    REQUIRE(store.merge(json{{"pd", 4.6}, {"eye", "right"}, {"ts", 101}, {"s", 0}}) == 1);

    REQUIRE(store.get(Channel::left_pupil_diameter).values == std::vector<double>{4.2});
    REQUIRE(store.get(Channel::right_pupil_diameter).values == std::vector<double>{4.6});
    REQUIRE(store.get(Channel::left_pupil_center).ts == -1);

    SECTION("without an eye tag nothing is stored")
    {
        REQUIRE(store.merge(json{{"pc", {1.0, 2.0, 3.0}}, {"ts", 200}, {"s", 0}}) == 0);
        REQUIRE(store.merge(json{{"gd", {0.0, 0.0, 1.0}}, {"eye", "middle"}, {"ts", 200}, {"s", 0}}) == 0);
    }
}

TEST_CASE("a malformed field does not stop its siblings")
{
    SampleStore store;
    json msg{{"gp", "not-a-vector"}, {"gp3", {1.0, 2.0, 3.0}}, {"ts", 9}, {"s", 0}};
    REQUIRE(store.merge(msg) == 1);
    REQUIRE(store.get(Channel::gaze_point).ts == -1);
    REQUIRE(store.get(Channel::gaze_point_3d).ts == 9);

    REQUIRE(store.merge(json{{"ac", {1.0, "x", 3.0}}, {"ts", 10}, {"s", 0}}) == 0);
    REQUIRE(store.get(Channel::accelerometer).ts == -1);
}

TEST_CASE("messages without ts or s update nothing")
{
    SampleStore store;
    REQUIRE(store.merge(json{{"gp", {0.5, 0.5}}, {"s", 0}}) == 0);
    REQUIRE(store.merge(json{{"gp", {0.5, 0.5}}, {"ts", 5}}) == 0);
    REQUIRE(store.merge(json{{"gp", {0.5, 0.5}}, {"ts", "5"}, {"s", 0}}) == 0);
    REQUIRE(store.merge(json::array({1, 2, 3})) == 0);
    REQUIRE(store.get(Channel::gaze_point).ts == -1);
}

TEST_CASE("raw datagrams are parsed before merging")
{
    SampleStore store;
    REQUIRE(store.merge_datagram(R"({"ts":1234,"s":0,"pts":96000,"pv":7})") == 2);
    REQUIRE(store.get(Channel::presentation_ts).values == std::vector<double>{96000});
    REQUIRE(store.get(Channel::pts_video_sync).ts == 1234);
    REQUIRE(store.merge_datagram("{\"ts\":12") == 0);
    REQUIRE(store.merge_datagram("") == 0);
}

TEST_CASE("stored timestamps never go backwards")
{
    SampleStore store;
    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> ts_dist(0, 1000);
    std::uniform_int_distribution<int> status_dist(0, 3);
    double best = -1;
    for (int i = 0; i < 2000; ++i)
    {
        int ts = ts_dist(rng);
        int s = status_dist(rng) == 0 ? 1 : 0;
        store.merge(json{{"vts", ts}, {"ts", ts}, {"s", s}});
        if (s == 0 && ts > best)
            best = ts;
        REQUIRE(store.get(Channel::video_ts).ts == best);
    }
}

TEST_CASE("readers see whole samples while the writer merges")
{
    SampleStore store;
    std::atomic<bool> done{false};
    std::atomic<bool> torn{false};
    std::thread reader([&]
                       {
        double last = -1;
        while (!done.load())
        {
            auto gp = store.get(Channel::gaze_point);
            if (gp.ts < last)
                torn = true;
            if (gp.has_data() && (gp.values.size() != 2 || gp.values[0] != gp.ts))
                torn = true;
            last = gp.ts;
        } });
    for (int ts = 0; ts < 5000; ++ts)
        store.merge(json{{"gp", {ts, ts}}, {"ts", ts}, {"s", 0}});
    done = true;
    reader.join();
    REQUIRE_FALSE(torn.load());
    REQUIRE(store.get(Channel::gaze_point).ts == 4999);
}

TEST_CASE("channel names follow the snapshot layout")
{
    REQUIRE(channel_name(Channel::accelerometer) == "mems.ac");
    REQUIRE(channel_name(Channel::right_gaze_direction) == "right_eye.gd");
    REQUIRE(channel_name(Channel::gaze_point_3d) == "gp3");
}
