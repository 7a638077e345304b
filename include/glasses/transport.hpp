/*
 * File: include/glasses/transport.hpp
 * Project: Glasses Controller
 * Purpose: UDP sockets towards the glasses (data and video channels)
 * Notes:
 *  - Receives are bounded by a timeout; a timeout is not an error
 *  - One thread may receive while others send on the same UdpChannel
 *  - Interface binding needs CAP_NET_RAW/root; without it the socket stays unscoped
 * Last updated: 2026-10-18
 */

#pragma once
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>

#include <sys/socket.h>

#include "glasses/log.hpp"

using boost::asio::ip::udp;

inline constexpr std::size_t kMaxDatagram = 4096;

// "fe80::1%eth0" -> {"fe80::1%eth0", "eth0"}; with strip_scope -> {"fe80::1", "eth0"}.
inline std::pair<std::string, std::string> split_scoped_address(const std::string &address, bool strip_scope)
{
    auto pct = address.find('%');
    if (pct == std::string::npos)
        return {address, std::string()};
    std::string iface = address.substr(pct + 1);
    return {strip_scope ? address.substr(0, pct) : address, iface};
}

inline bool is_ipv6_literal(const std::string &address) { return address.find(':') != std::string::npos; }

// Starts one async receive on `socket` and drives `io` until it completes or
// `timeout` elapses. Returns the byte count, or nullopt on timeout. Throws
// boost::system::system_error for any other failure.
// When `socket_mtx` is given, the receive initiation and the cancel hold it so
// another thread may send on the same socket meanwhile.
template <typename Buffer>
std::optional<std::size_t> receive_with_timeout(boost::asio::io_context &io, udp::socket &socket,
                                                const Buffer &buffer, udp::endpoint &sender,
                                                std::chrono::milliseconds timeout,
                                                std::mutex *socket_mtx = nullptr)
{
    auto guard = [socket_mtx]
    { return socket_mtx ? std::unique_lock<std::mutex>(*socket_mtx) : std::unique_lock<std::mutex>(); };

    boost::system::error_code ec = boost::asio::error::would_block;
    std::size_t n = 0;
    {
        auto lk = guard();
        socket.async_receive_from(buffer, sender, [&](const boost::system::error_code &e, std::size_t len)
                                  { ec = e; n = len; });
    }
    io.restart();
    io.run_for(timeout);
    if (!io.stopped())
    {
        // Deadline hit with the receive still pending.
        {
            auto lk = guard();
            boost::system::error_code ignored;
            socket.cancel(ignored);
        }
        io.run();
    }
    if (ec == boost::asio::error::operation_aborted || ec == boost::asio::error::would_block)
        return std::nullopt;
    if (ec)
        throw boost::system::system_error(ec, "receive");
    return n;
}

class UdpChannel
{
    boost::asio::io_context io_;
    udp::socket socket_;
    udp::endpoint peer_;
    std::chrono::milliseconds recv_timeout_;
    std::mutex socket_mtx_; // send, receive initiation, cancel and close
    std::array<char, kMaxDatagram> buf_{};
    bool iface_bound_ = false;

public:
    UdpChannel(const udp::endpoint &peer, std::chrono::milliseconds recv_timeout)
        : socket_(io_), peer_(peer), recv_timeout_(recv_timeout)
    {
        socket_.open(peer.protocol());
        socket_.bind(udp::endpoint(peer.protocol(), 0));
    }

    UdpChannel(const UdpChannel &) = delete;
    UdpChannel &operator=(const UdpChannel &) = delete;
    ~UdpChannel() { close(); }

    const udp::endpoint &peer() const { return peer_; }
    udp::endpoint local_endpoint() const { return socket_.local_endpoint(); }
    std::chrono::milliseconds receive_timeout() const { return recv_timeout_; }
    bool is_open() const { return socket_.is_open(); }
    bool bound_to_interface() const { return iface_bound_; }

    // SO_BINDTODEVICE where the platform has it. Returns false (and logs) when refused.
    bool bind_to_interface(const std::string &iface)
    {
#ifdef SO_BINDTODEVICE
        std::string name = iface;
        if (::setsockopt(socket_.native_handle(), SOL_SOCKET, SO_BINDTODEVICE, name.c_str(),
                         static_cast<socklen_t>(name.size() + 1)) != 0)
        {
            int err = errno;
            if (err == EPERM || err == EACCES)
                log_warn("Binding to a network interface is permitted only for root users.");
            else
                log_warn("could not bind socket to interface ", iface, ": ", std::strerror(err));
            return false;
        }
        iface_bound_ = true;
        return true;
#else
        log_warn("binding a socket to interface ", iface, " is not supported on this platform");
        return false;
#endif
    }

    void send(std::string_view payload)
    {
        std::scoped_lock lk(socket_mtx_);
        socket_.send_to(boost::asio::buffer(payload.data(), payload.size()), peer_);
    }

    // Next datagram, or nullopt when nothing arrived within the receive timeout.
    std::optional<std::string> receive()
    {
        udp::endpoint sender;
        auto n = receive_with_timeout(io_, socket_, boost::asio::buffer(buf_), sender, recv_timeout_, &socket_mtx_);
        if (!n)
            return std::nullopt;
        return std::string(buf_.data(), *n);
    }

    void close()
    {
        std::scoped_lock lk(socket_mtx_);
        boost::system::error_code ec;
        if (socket_.is_open())
            socket_.close(ec);
        if (ec)
            log_warn("closing UDP socket: ", ec.message());
    }
};

// Opens a datagram socket towards (host, port). The family follows the host
// (':' means IPv6); the interface binding is attempted only for IPv6 peers
// when an interface name is given.
inline std::unique_ptr<UdpChannel> make_socket(const std::string &host, unsigned short port,
                                               const std::string &iface,
                                               std::chrono::milliseconds recv_timeout = std::chrono::milliseconds(5000))
{
    const bool v6 = is_ipv6_literal(host);
    boost::asio::io_context ioc;
    udp::resolver resolver{ioc};
    auto results = resolver.resolve(v6 ? udp::v6() : udp::v4(), host, std::to_string(port),
                                    udp::resolver::passive);
    udp::endpoint peer = results.begin()->endpoint();

    auto channel = std::make_unique<UdpChannel>(peer, recv_timeout);
    if (v6 && !iface.empty())
        channel->bind_to_interface(iface);
    return channel;
}
