#include "subscriber_hub.hpp"

#include <utility>

#include "util/logging.hpp"

namespace ykmon::server {

SubscriberHub::SubscriberHub(Sender sender, bool stop_when_idle)
    : sender_(std::move(sender)), stop_when_idle_(stop_when_idle) {}

void SubscriberHub::set_loop_control(LoopStarter starter, LoopStopper stopper) {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    loop_starter_ = std::move(starter);
    loop_stopper_ = std::move(stopper);
}

void SubscriberHub::clear_loop_control() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    loop_starter_ = nullptr;
    loop_stopper_ = nullptr;
}

void SubscriberHub::on_connect(SessionId session_id) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.insert(session_id);
        count = sessions_.size();
    }
    util::log::info("Client " + std::to_string(session_id) + " connected. Active clients: " + std::to_string(count));

    if (loop_starter_ && loop_starter_()) {
        util::log::debug("Monitor loop started by session " + std::to_string(session_id));
    }
}

void SubscriberHub::on_disconnect(SessionId session_id) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::size_t count = 0;
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        removed = sessions_.erase(session_id) > 0;
        count = sessions_.size();
    }
    if (!removed) {
        return;
    }
    util::log::info("Client " + std::to_string(session_id) + " disconnected. Remaining clients: " +
                    std::to_string(count));

    if (count == 0 && stop_when_idle_ && loop_stopper_) {
        loop_stopper_();
        util::log::info("No subscribers left, stopping monitor loop");
    }
}

std::size_t SubscriberHub::broadcast(const nlohmann::json& message) {
    std::vector<SessionId> targets;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        targets.assign(sessions_.begin(), sessions_.end());
    }
    if (targets.empty() || !sender_) {
        return 0;
    }

    const auto text = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::size_t delivered = 0;
    for (auto session_id : targets) {
        if (sender_(session_id, text)) {
            ++delivered;
        }
    }
    return delivered;
}

std::size_t SubscriberHub::publish_devices(const std::vector<DeviceAttributes>& devices) {
    return broadcast(make_update_message(devices));
}

std::size_t SubscriberHub::subscriber_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

nlohmann::json make_update_message(const std::vector<DeviceAttributes>& devices) {
    auto list = nlohmann::json::array();
    for (const auto& device : devices) {
        list.push_back(attributes_to_json(device));
    }
    return nlohmann::json{
        {"type", SubscriberHub::kUpdateEvent},
        {"payload", {{"yubikeys", std::move(list)}}},
    };
}

}  // namespace ykmon::server
