/*
 * File: include/glasses/rest_client.hpp
 * Project: Glasses Controller
 * Purpose: JSON over HTTP/1.1 towards the glasses' control API
 * Notes:
 *  - One connection per request, like the device's own web UI
 *  - wait_for_status() reports failures as an empty result, never throws
 *  - post_detached() requests finish in the background; drain() joins them
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <nlohmann/json.hpp>

#include "glasses/errors.hpp"
#include "glasses/log.hpp"
#include "glasses/transport.hpp"

namespace http = boost::beast::http;

class RestClient
{
    std::string host_; // may carry an IPv6 scope ("fe80::1%eth0")
    unsigned short port_;
    std::optional<std::chrono::milliseconds> request_timeout_;
    std::chrono::milliseconds poll_interval_;

    std::mutex pending_mtx_;
    std::vector<std::future<void>> pending_;

public:
    RestClient(std::string host, unsigned short port,
               std::optional<std::chrono::milliseconds> request_timeout = std::nullopt,
               std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000))
        : host_(std::move(host)), port_(port), request_timeout_(request_timeout), poll_interval_(poll_interval) {}

    RestClient(const RestClient &) = delete;
    RestClient &operator=(const RestClient &) = delete;
    ~RestClient() { drain(); }

    // Host as it appears in a URL: brackets around IPv6, no scope.
    std::string url_host() const
    {
        if (!is_ipv6_literal(host_))
            return host_;
        return "[" + split_scoped_address(host_, true).first + "]";
    }

    std::string base_url() const
    {
        std::string url = "http://" + url_host();
        if (port_ != 80)
            url += ":" + std::to_string(port_);
        return url;
    }

    // GET target; the body must be JSON.
    nlohmann::json get(const std::string &target, std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    {
        auto res = request(http::verb::get, target, std::nullopt, timeout ? timeout : request_timeout_);
        auto j = nlohmann::json::parse(res.body(), nullptr, false);
        if (j.is_discarded())
            throw RequestFailed("GET " + target + ": response is not JSON");
        return j;
    }

    // POST a JSON body. A non-JSON response body comes back as a JSON string.
    nlohmann::json post(const std::string &target, const nlohmann::json &body = nullptr)
    {
        const std::string payload = body.dump();
        log_debug("Sending JSON: ", payload);
        auto res = request(http::verb::post, target, payload, request_timeout_);
        log_debug("Response: ", res.body());
        auto j = nlohmann::json::parse(res.body(), nullptr, false);
        if (j.is_discarded())
            return nlohmann::json(res.body());
        return j;
    }

    // POST without waiting for the response; failures are only logged.
    void post_detached(const std::string &target, const nlohmann::json &body)
    {
        reap_finished();
        auto fut = std::async(std::launch::async, [this, target, body]
                              {
            try
            {
                post(target, body);
            }
            catch (const std::exception &e)
            {
                log_error("POST ", target, " failed: ", e.what());
            } });
        std::scoped_lock lk(pending_mtx_);
        pending_.push_back(std::move(fut));
    }

    // Blocks until every detached request has finished.
    void drain()
    {
        std::vector<std::future<void>> waiting;
        {
            std::scoped_lock lk(pending_mtx_);
            waiting.swap(pending_);
        }
        for (auto &f : waiting)
            f.wait();
    }

    // Polls GET target until json[key] is one of `accepted` and returns it.
    // Empty result when a request fails, the key is missing, or `timeout`
    // (overall, and per request) runs out.
    std::optional<std::string> wait_for_status(const std::string &target, const std::string &key,
                                               const std::vector<std::string> &accepted,
                                               std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    {
        using clock = std::chrono::steady_clock;
        const auto deadline = timeout ? std::optional<clock::time_point>(clock::now() + *timeout) : std::nullopt;
        while (true)
        {
            nlohmann::json j;
            try
            {
                j = get(target, timeout);
            }
            catch (const std::exception &e)
            {
                log_error(e.what());
                return std::nullopt;
            }
            auto it = j.find(key);
            if (!j.is_object() || it == j.end() || !it->is_string())
            {
                log_error("GET ", target, ": no '", key, "' in response");
                return std::nullopt;
            }
            std::string value = it->get<std::string>();
            if (std::find(accepted.begin(), accepted.end(), value) != accepted.end())
                return value;
            if (deadline && clock::now() + poll_interval_ > *deadline)
            {
                log_error("GET ", target, ": '", key, "' still '", value, "' at timeout");
                return std::nullopt;
            }
            std::this_thread::sleep_for(poll_interval_);
        }
    }

private:
    static std::string verb_name(http::verb verb)
    {
        auto sv = http::to_string(verb);
        return std::string(sv.data(), sv.size());
    }

    void reap_finished()
    {
        std::scoped_lock lk(pending_mtx_);
        pending_.erase(std::remove_if(pending_.begin(), pending_.end(), [](std::future<void> &f)
                                      { return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready; }),
                       pending_.end());
    }

    http::response<http::string_body> request(http::verb verb, const std::string &target,
                                              const std::optional<std::string> &body,
                                              std::optional<std::chrono::milliseconds> timeout)
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver resolver{ioc};
        boost::beast::tcp_stream stream{ioc};

        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, url_host());
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req.set(http::field::content_type, "application/json");
        if (body)
            req.body() = *body;
        req.prepare_payload();

        boost::beast::flat_buffer buffer;
        http::response<http::string_body> res;
        boost::beast::error_code ec;

        auto arm = [&]
        {
            if (timeout)
                stream.expires_after(*timeout);
            else
                stream.expires_never();
        };

        try
        {
            auto results = resolver.resolve(host_, std::to_string(port_));
            arm();
            stream.async_connect(results, [&](boost::beast::error_code e, const auto &)
                                 {
                if (e) { ec = e; return; }
                arm();
                http::async_write(stream, req, [&](boost::beast::error_code e, std::size_t)
                                  {
                    if (e) { ec = e; return; }
                    arm();
                    http::async_read(stream, buffer, res, [&](boost::beast::error_code e, std::size_t)
                                     { ec = e; });
                }); });
            ioc.run();
        }
        catch (const boost::system::system_error &e)
        {
            throw RequestFailed(verb_name(verb) + " " + target + ": " + e.what());
        }
        if (ec)
            throw RequestFailed(verb_name(verb) + " " + target + ": " + ec.message());

        boost::beast::error_code ignored;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);

        if (http::to_status_class(res.result()) != http::status_class::successful)
            throw RequestFailed(verb_name(verb) + " " + target + ": HTTP " +
                                std::to_string(res.result_int()));
        return res;
    }
};
