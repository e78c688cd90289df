#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "device_attributes.hpp"

namespace ykmon::server {

class SubscriberHub {
public:
    using SessionId = std::uint64_t;
    // Returns false when the session is gone.
    using Sender = std::function<bool(SessionId, const std::string&)>;
    using LoopStarter = std::function<bool()>;
    using LoopStopper = std::function<void()>;

    static constexpr const char* kUpdateEvent = "yubikeys_update";

    SubscriberHub(Sender sender, bool stop_when_idle);

    // The starter runs on every connect and must be idempotent. The stopper only
    // runs when stop_when_idle is set and the last subscriber leaves.
    void set_loop_control(LoopStarter starter, LoopStopper stopper);
    // Detaches the loop; later connects and disconnects only track membership.
    void clear_loop_control();

    void on_connect(SessionId session_id);
    void on_disconnect(SessionId session_id);

    // Returns the number of sessions the message was handed to.
    std::size_t broadcast(const nlohmann::json& message);
    std::size_t publish_devices(const std::vector<DeviceAttributes>& devices);

    std::size_t subscriber_count() const;

private:
    Sender sender_;
    const bool stop_when_idle_;
    LoopStarter loop_starter_;
    LoopStopper loop_stopper_;

    // Serializes membership changes together with the start/stop decision.
    std::mutex lifecycle_mutex_;
    mutable std::mutex sessions_mutex_;
    std::set<SessionId> sessions_;
};

nlohmann::json make_update_message(const std::vector<DeviceAttributes>& devices);

}  // namespace ykmon::server
