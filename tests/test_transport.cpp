/*
 * File: tests/test_transport.cpp
 * Project: Glasses Controller
 * Purpose: UDP socket factory and timed receives
 * Last updated: 2026-10-18
 */

#include <atomic>
#include <chrono>
#include <thread>

#include <catch2/catch.hpp>

#include "fake_device.hpp"
#include "glasses/transport.hpp"

using namespace std::chrono_literals;

TEST_CASE("ipv4 peer gives an ipv4 socket aimed at the peer")
{
    auto ch = make_socket("127.0.0.1", 49152, "", 200ms);
    REQUIRE(ch->is_open());
    REQUIRE(ch->peer().address().is_v4());
    REQUIRE(ch->peer().port() == 49152);
    REQUIRE(ch->receive_timeout() == 200ms);
    REQUIRE_FALSE(ch->bound_to_interface());
}

TEST_CASE("interface name is ignored for ipv4 peers")
{
    auto ch = make_socket("127.0.0.1", 49152, "eth0", 200ms);
    REQUIRE_FALSE(ch->bound_to_interface());
}

TEST_CASE("refused interface binding leaves the socket usable")
{
    FakeUdpPeer peer;
    auto ch = make_socket("127.0.0.1", peer.port(), "", 500ms);
    REQUIRE_FALSE(ch->bind_to_interface("nosuchif0"));
    REQUIRE(ch->is_open());
    ch->send("hello");
    auto got = peer.receive(1s);
    REQUIRE(got.has_value());
    REQUIRE(got->first == "hello");
}

TEST_CASE("receive returns nothing once the timeout passes")
{
    auto ch = make_socket("127.0.0.1", 9, "", 150ms);
    auto start = std::chrono::steady_clock::now();
    auto got = ch->receive();
    auto took = std::chrono::steady_clock::now() - start;
    REQUIRE_FALSE(got.has_value());
    REQUIRE(took >= 140ms);
    REQUIRE(took < 2s);
}

TEST_CASE("datagrams from the peer come back whole")
{
    FakeUdpPeer peer;
    auto ch = make_socket("127.0.0.1", peer.port(), "", 1s);
    ch->send(R"({"type":"live.data.unicast"})");

    auto ka = peer.receive(1s);
    REQUIRE(ka.has_value());
    peer.send(std::string(R"({"ts":1,"s":0,"gp":[0.5,0.5]})"), ka->second);

    auto got = ch->receive();
    REQUIRE(got.has_value());
    REQUIRE(*got == R"({"ts":1,"s":0,"gp":[0.5,0.5]})");
}

TEST_CASE("closing twice is harmless")
{
    auto ch = make_socket("127.0.0.1", 49152, "", 100ms);
    ch->close();
    REQUIRE_FALSE(ch->is_open());
    ch->close();
}

TEST_CASE("sending while another thread waits in receive")
{
    FakeUdpPeer peer;
    auto ch = make_socket("127.0.0.1", peer.port(), "", 5ms);
    constexpr int kSends = 100;

    std::atomic<bool> sending{true};
    std::thread sender([&]
                       {
        for (int i = 0; i < kSends; ++i)
        {
            ch->send("ping");
            std::this_thread::sleep_for(1ms);
        }
        sending = false; });

    int receives = 0;
    int unexpected = 0;
    while (sending)
    {
        if (ch->receive())
            ++unexpected;
        ++receives;
    }
    sender.join();
    REQUIRE(unexpected == 0);
    REQUIRE(receives > 1);

    int pings = 0;
    udp::endpoint from;
    while (auto got = peer.receive(200ms))
    {
        REQUIRE(got->first == "ping");
        from = got->second;
        ++pings;
    }
    REQUIRE(pings == kSends);

    peer.send(std::string("pong"), from);
    std::optional<std::string> reply;
    REQUIRE(eventually([&]
                       { reply = ch->receive(); return reply.has_value(); }));
    REQUIRE(*reply == "pong");
}
