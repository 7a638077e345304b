/*
 * File: include/glasses/controller.hpp
 * Project: Glasses Controller
 * Purpose: Public controller: connect, stream, snapshot, control API wrappers
 * Notes:
 *  - Construction either yields a connected controller or throws
 *  - get_data(), state() and is_streaming() may be called from any thread;
 *    they are ordered against close() by the session mutex
 *  - Control calls throw RequestFailed; waits return empty/false instead
 * Last updated: 2026-10-18
 */

#pragma once
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

#include "glasses/config.hpp"
#include "glasses/discovery.hpp"
#include "glasses/errors.hpp"
#include "glasses/log.hpp"
#include "glasses/rest_client.hpp"
#include "glasses/sample.hpp"
#include "glasses/streaming_session.hpp"
#include "glasses/transport.hpp"

inline constexpr const char *kDeviceTimeFormat = "%Y-%m-%dT%H:%M:%S+000000";
inline constexpr const char *kHumanTimeFormat = "%d/%m/%Y %H:%M:%S";

// Local wall-clock time, whole seconds.
inline std::string local_time_string(const char *format)
{
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[64];
    std::strftime(buf, sizeof(buf), format, &tm);
    return buf;
}

// uuid5 in the DNS namespace, used by the device as "EagleId".
inline std::string eagle_id(const std::string &name)
{
    boost::uuids::name_generator_sha1 gen(boost::uuids::ns::dns());
    return boost::uuids::to_string(gen(name));
}

// Device address out of a discovery reply: its "ipv4" field when present,
// otherwise the address the reply came from.
inline std::string device_address(const DiscoveryResult &found)
{
    auto ipv4 = found.metadata.find("ipv4");
    if (ipv4 != found.metadata.end() && ipv4->is_string())
        return ipv4->get<std::string>();
    return found.address;
}

enum class ControllerState
{
    idle,
    connecting,
    connected,
    streaming,
    disconnected
};

inline const char *to_string(ControllerState s)
{
    switch (s)
    {
    case ControllerState::idle:
        return "idle";
    case ControllerState::connecting:
        return "connecting";
    case ControllerState::connected:
        return "connected";
    case ControllerState::streaming:
        return "streaming";
    case ControllerState::disconnected:
        return "disconnected";
    }
    return "unknown";
}

class GlassesController
{
    ControllerConfig cfg_;
    std::string address_;
    std::string iface_name_;
    std::atomic<ControllerState> state_{ControllerState::idle};

    std::unique_ptr<RestClient> rest_;
    std::unique_ptr<UdpChannel> data_socket_;
    std::unique_ptr<UdpChannel> video_socket_;
    SampleStore store_;
    std::unique_ptr<StreamingSession> session_;

    mutable std::mutex session_mtx_; // session_ lifetime against close()
    std::string participant_name_ = "DefaultUser";
    int recn_ = 0;

public:
    // Throws DiscoveryUnavailable, NoDeviceFound or ConnectFailed.
    explicit GlassesController(ControllerConfig cfg) : cfg_(std::move(cfg))
    {
        address_ = cfg_.address;
        if (address_.empty())
        {
            DiscoveryOptions opts;
            opts.listen_port = cfg_.discovery_port;
            opts.probe_on_listen_port = cfg_.probe_on_listen_port;
            opts.timeout = cfg_.discovery_timeout;
            opts.target_address = cfg_.discovery_address;
            opts.interface_name = cfg_.discovery_interface;
            auto found = discover(opts);
            if (!found)
                throw NoDeviceFound();
            address_ = device_address(*found);
        }
        auto [peer_host, iface] = split_scoped_address(address_, cfg_.strip_address_scope);
        address_ = peer_host;
        iface_name_ = iface;

        rest_ = std::make_unique<RestClient>(address_, cfg_.http_port, cfg_.request_timeout, cfg_.status_poll_interval);
        if (!connect(cfg_.connect_timeout))
            throw ConnectFailed(address_);
    }

    GlassesController(const GlassesController &) = delete;
    GlassesController &operator=(const GlassesController &) = delete;

    ~GlassesController()
    {
        try
        {
            close();
        }
        catch (const std::exception &e)
        {
            log_error("closing controller: ", e.what());
        }
    }

    // ---- session ----

    ControllerState state() const
    {
        std::scoped_lock lk(session_mtx_);
        ControllerState s = state_;
        if (s == ControllerState::connected && session_ && session_->streaming())
            return ControllerState::streaming;
        return s;
    }

    const std::string &get_address() const { return address_; }
    const std::string &interface_name() const { return iface_name_; }
    std::string base_url() const { return rest_->base_url(); }
    bool video_scene() const { return cfg_.video_scene; }
    bool is_streaming() const
    {
        std::scoped_lock lk(session_mtx_);
        return session_ && session_->streaming();
    }

    const UdpChannel &data_socket() const { return *data_socket_; }

    // Throws AlreadyStreaming if a stream is active.
    void start_streaming()
    {
        log_debug("Start streaming ...");
        std::scoped_lock lk(session_mtx_);
        if (state_ != ControllerState::connected)
            throw std::logic_error(std::string("cannot stream while ") + to_string(state_.load()));
        try
        {
            session_->start();
        }
        catch (const std::system_error &e)
        {
            log_error("An error occurs trying to start streaming: ", e.what());
        }
    }

    void stop_streaming()
    {
        log_debug("Stop data streaming ...");
        std::scoped_lock lk(session_mtx_);
        if (session_)
            session_->stop();
        log_debug("Data streaming successful stopped!");
    }

    void close()
    {
        std::scoped_lock lk(session_mtx_);
        if (state_ == ControllerState::disconnected || state_ == ControllerState::idle)
            return;
        if (session_)
            session_->stop();
        session_.reset();
        disconnect();
        if (rest_)
            rest_->drain();
    }

    Snapshot get_data() const { return store_.snapshot(); }
    Sample get_sample(Channel c) const { return store_.get(c); }
    SampleStore &store() { return store_; }

    // ---- system ----

    nlohmann::json get_status() { return rest_->get("/api/system/status"); }
    nlohmann::json get_configuration() { return rest_->get("/api/system/conf"); }

    bool wait_until_status_is_ok(std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    {
        return rest_->wait_for_status("/api/system/status", "sys_status", {"ok"}, timeout) == std::optional<std::string>("ok");
    }

    nlohmann::json get_battery_status() { return get_status().at("sys_battery"); }
    double get_battery_level() { return get_battery_status().at("level").get<double>(); }
    double get_battery_remaining_time() { return get_battery_status().at("remaining_time").get<double>(); }

    std::string get_battery_info()
    {
        auto b = get_battery_status();
        char buf[128];
        std::snprintf(buf, sizeof(buf), "Battery info = [ Level: %.2f %% - Remaining Time: %.2f s ]",
                      b.at("level").get<double>(), b.at("remaining_time").get<double>());
        return buf;
    }

    nlohmann::json get_storage_status() { return get_status().at("sys_storage"); }
    double get_storage_remaining_time() { return get_storage_status().at("remaining_time").get<double>(); }

    std::string get_storage_info()
    {
        char buf[96];
        std::snprintf(buf, sizeof(buf), "Storage info = [ Remaining Time: %.2f s ]", get_storage_remaining_time());
        return buf;
    }

    int get_et_freq() { return get_configuration().at("sys_et_freq").get<int>(); }
    nlohmann::json get_et_frequencies() { return get_status().at("sys_et").at("frequencies"); }
    int get_video_freq() { return get_configuration().at("sys_sc_fps").get<int>(); }

    void set_et_freq_50() { set_config({{"sys_et_freq", 50}}); }
    // Not every head unit supports 100 Hz; check get_et_frequencies() first.
    void set_et_freq_100() { set_config({{"sys_et_freq", 100}}); }
    void set_et_indoor_preset() { set_config({{"sys_sc_preset", "Indoor"}}); }
    void set_et_outdoor_preset() { set_config({{"sys_ec_preset", "ClearWeather"}}); }
    void set_video_auto_preset() { set_config({{"sys_sc_preset", "Auto"}}); }
    void set_video_gaze_preset() { set_config({{"sys_sc_preset", "GazeBasedExposure"}}); }
    void set_video_freq_25() { set_config({{"sys_sc_fps", 25}}); }
    void set_video_freq_50() { set_config({{"sys_sc_fps", 50}}); }

    void identify() { rest_->get("/api/identify"); }
    void eject_sd() { rest_->get("/api/eject"); }

    // ---- projects / participants ----

    nlohmann::json get_projects() { return rest_->get("/api/projects"); }
    nlohmann::json get_participants() { return rest_->get("/api/participants"); }

    std::optional<std::string> get_project_id(const std::string &project_name)
    {
        return find_id(get_projects(), "pr_info", "pr_id", project_name);
    }

    std::optional<std::string> get_participant_id(const std::string &participant_name)
    {
        return find_id(get_participants(), "pa_info", "pa_id", participant_name);
    }

    // Reuses a project with the same name when one exists.
    std::string create_project(const std::string &project_name = "DefaultProjectName")
    {
        if (auto id = get_project_id(project_name))
        {
            log_debug("Project ", *id, " already exists ...");
            return *id;
        }
        nlohmann::json data = {
            {"pr_info", {{"CreationDate", local_time_string(kHumanTimeFormat)},
                         {"EagleId", eagle_id(project_name)},
                         {"Name", project_name}}},
            {"pr_created", local_time_string(kDeviceTimeFormat)}};
        auto id = rest_->post("/api/projects", data).at("pr_id").get<std::string>();
        log_debug("Project ", id, " created!");
        return id;
    }

    std::string create_participant(const std::string &project_id, const std::string &participant_name = "DefaultUser",
                                   const std::string &participant_notes = "")
    {
        participant_name_ = participant_name;
        if (auto id = get_participant_id(participant_name))
        {
            log_debug("Participant ", *id, " already exists ...");
            return *id;
        }
        nlohmann::json data = {
            {"pa_project", project_id},
            {"pa_info", {{"EagleId", eagle_id(participant_name)},
                         {"Name", participant_name},
                         {"Notes", participant_notes}}},
            {"pa_created", local_time_string(kDeviceTimeFormat)}};
        auto id = rest_->post("/api/participants", data).at("pa_id").get<std::string>();
        log_debug("Participant ", id, " created! Project ", project_id);
        return id;
    }

    // ---- calibration ----

    std::string create_calibration(const std::string &project_id, const std::string &participant_id)
    {
        nlohmann::json data = {
            {"ca_project", project_id},
            {"ca_type", "default"},
            {"ca_participant", participant_id},
            {"ca_created", local_time_string(kDeviceTimeFormat)}};
        auto id = rest_->post("/api/calibrations", data).at("ca_id").get<std::string>();
        log_debug("Calibration ", id, " created! Project: ", project_id, ", Participant: ", participant_id);
        return id;
    }

    void start_calibration(const std::string &calibration_id)
    {
        rest_->post("/api/calibrations/" + calibration_id + "/start");
    }

    // True once calibrated; false on uncalibrated/stale/failed or a failed status request.
    bool wait_until_calibration_is_done(const std::string &calibration_id,
                                        std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    {
        while (true)
        {
            auto status = rest_->wait_for_status("/api/calibrations/" + calibration_id + "/status", "ca_state",
                                                 {"calibrating", "calibrated", "stale", "uncalibrated", "failed"},
                                                 timeout);
            if (!status)
            {
                log_debug("Calibration ", calibration_id, " status unavailable");
                return false;
            }
            log_debug("Calibration status ", *status);
            if (*status == "uncalibrated" || *status == "stale" || *status == "failed")
            {
                log_debug("Calibration ", calibration_id, " failed ");
                return false;
            }
            if (*status == "calibrated")
            {
                log_debug("Calibration ", calibration_id, " successful ");
                return true;
            }
            std::this_thread::sleep_for(cfg_.status_poll_interval);
        }
    }

    // ---- recordings ----

    nlohmann::json get_recordings() { return rest_->get("/api/recordings"); }
    nlohmann::json get_recording_status() { return get_status().at("sys_recording"); }

    std::string get_current_recording_id() { return get_recording_status().at("rec_id").get<std::string>(); }

    bool is_recording()
    {
        auto rec = get_recording_status();
        return rec.is_object() && rec.value("rec_state", std::string()) == "recording";
    }

    std::string create_recording(const std::string &participant_id, const std::string &recording_notes = "")
    {
        ++recn_;
        nlohmann::json data = {
            {"rec_participant", participant_id},
            {"rec_info", {{"EagleId", eagle_id(participant_name_)},
                          {"Name", "Recording_" + std::to_string(recn_)},
                          {"Notes", recording_notes}}},
            {"rec_created", local_time_string(kDeviceTimeFormat)}};
        return rest_->post("/api/recordings", data).at("rec_id").get<std::string>();
    }

    bool start_recording(const std::string &recording_id) { return recording_action(recording_id, "start", "recording"); }
    bool pause_recording(const std::string &recording_id) { return recording_action(recording_id, "pause", "paused"); }
    bool stop_recording(const std::string &recording_id) { return recording_action(recording_id, "stop", "done"); }

    std::optional<std::string> wait_for_recording_status(
        const std::string &recording_id,
        const std::vector<std::string> &accepted = {"init", "starting", "recording", "pausing", "paused",
                                                    "stopping", "stopped", "done", "stale", "failed"},
        std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    {
        return rest_->wait_for_status("/api/recordings/" + recording_id + "/status", "rec_state", accepted, timeout);
    }

    // ---- events ----

    void send_custom_event(const std::string &event_type, const std::string &event_tag = "")
    {
        rest_->post_detached("/api/events", {{"type", event_type}, {"tag", event_tag}});
    }

    void send_experimental_var(const std::string &variable_name, const std::string &variable_value)
    {
        send_custom_event("#" + variable_name + "#", variable_value);
    }

    // Tags are rendered like "@['a', 'b']@" / "['1', '2']", the format the desktop analyzer parses.
    void send_experimental_vars(const std::vector<std::string> &variable_names,
                                const std::vector<std::string> &variable_values)
    {
        send_custom_event("@" + quoted_list(variable_names) + "@", quoted_list(variable_values));
    }

    void send_tobiipro_event(const std::string &event_type, const std::string &event_value)
    {
        send_custom_event("JsonEvent",
                          "{'event_type': '" + event_type + "','event_value': '" + event_value + "'}");
    }

private:
    bool connect(std::optional<std::chrono::milliseconds> timeout)
    {
        state_ = ControllerState::connecting;
        log_debug("Connecting to the glasses ...");
        try
        {
            data_socket_ = make_socket(address_, cfg_.udp_port, iface_name_, cfg_.timing.receive_timeout);
            if (cfg_.video_scene)
                video_socket_ = make_socket(address_, cfg_.udp_port, iface_name_, cfg_.timing.receive_timeout);
        }
        catch (const boost::system::system_error &e)
        {
            log_error("cannot open UDP socket towards ", address_, ": ", e.what());
            disconnect();
            return false;
        }

        if (!wait_until_status_is_ok(timeout))
        {
            log_error("An error occurs trying to connect to the glasses");
            disconnect();
            return false;
        }
        session_ = std::make_unique<StreamingSession>(*data_socket_, video_socket_.get(), store_, cfg_.timing);
        state_ = ControllerState::connected;
        log_debug("Glasses successful connected!");
        return true;
    }

    void disconnect()
    {
        log_debug("Disconnecting from the glasses");
        if (data_socket_)
            data_socket_->close();
        if (video_socket_)
            video_socket_->close();
        state_ = ControllerState::disconnected;
        log_debug("Glasses successful disconnected!");
    }

    void set_config(const nlohmann::json &data) { rest_->post("/api/system/conf", data); }

    bool recording_action(const std::string &recording_id, const std::string &action, const std::string &target)
    {
        rest_->post("/api/recordings/" + recording_id + "/" + action);
        return wait_for_recording_status(recording_id, {target}) == std::optional<std::string>(target);
    }

    static std::optional<std::string> find_id(const nlohmann::json &items, const char *info_key, const char *id_key,
                                              const std::string &name)
    {
        std::optional<std::string> id;
        if (!items.is_array())
            return id;
        for (const auto &item : items)
        {
            if (!item.is_object() || !item.contains(id_key) || !item[id_key].is_string())
                continue;
            auto info = item.find(info_key);
            if (info == item.end() || !info->is_object())
                continue;
            auto n = info->find("Name");
            if (n != info->end() && n->is_string() && n->get<std::string>() == name)
                id = item[id_key].get<std::string>();
        }
        return id;
    }

    static std::string quoted_list(const std::vector<std::string> &items)
    {
        std::string out = "[";
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            if (i)
                out += ", ";
            out += "'" + items[i] + "'";
        }
        return out + "]";
    }
};
