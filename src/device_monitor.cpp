#include "device_monitor.hpp"

#include <sstream>
#include <utility>

#include "util/logging.hpp"

namespace ykmon::server {

namespace {

std::string describe(const std::set<Serial>& serials) {
    std::ostringstream oss;
    oss << '{';
    bool first = true;
    for (auto serial : serials) {
        if (!first) {
            oss << ", ";
        }
        oss << serial;
        first = false;
    }
    oss << '}';
    return oss.str();
}

}  // namespace

DeviceMonitor::DeviceMonitor(DeviceProbe& probe, DeviceStore& store, std::chrono::milliseconds poll_interval)
    : probe_(probe), store_(store), poll_interval_(poll_interval) {}

DeviceMonitor::~DeviceMonitor() {
    stop();
}

void DeviceMonitor::set_update_callback(UpdateCallback callback) {
    update_callback_ = std::move(callback);
}

bool DeviceMonitor::start() {
    std::lock_guard<std::mutex> control(control_mutex_);
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (shut_down_ || running_) {
            return false;
        }
        running_ = true;
        generation = generation_;
    }
    reap_finished_workers();

    auto finished = std::make_shared<std::atomic_bool>(false);
    workers_.push_back(Worker{std::thread([this, generation, finished] {
                                  run_loop(generation);
                                  finished->store(true);
                              }),
                              finished});
    ++start_count_;
    util::log::info("Started device monitor loop");
    return true;
}

void DeviceMonitor::stop() {
    std::lock_guard<std::mutex> control(control_mutex_);
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        shut_down_ = true;
    }
    request_stop();
    if (workers_.empty()) {
        return;
    }
    for (auto& worker : workers_) {
        worker.thread.join();
    }
    workers_.clear();
    util::log::info("Stopped device monitor loop");
}

void DeviceMonitor::request_stop() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (running_) {
            ++generation_;
        }
        running_ = false;
    }
    wake_cv_.notify_all();
}

void DeviceMonitor::reap_finished_workers() {
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (it->finished->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

bool DeviceMonitor::running() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return running_;
}

std::set<Serial> DeviceMonitor::known_serials() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return previous_serials_;
}

void DeviceMonitor::run_loop(std::uint64_t generation) {
    while (true) {
        try {
            poll_once();
        } catch (const std::exception& ex) {
            util::log::error(std::string("Error in monitor task: ") + ex.what());
        }

        std::unique_lock<std::mutex> lock(lifecycle_mutex_);
        if (wake_cv_.wait_for(lock, poll_interval_, [this, generation] { return generation_ != generation; })) {
            return;
        }
    }
}

DeviceMonitor::CycleResult DeviceMonitor::poll_once() {
    std::lock_guard<std::mutex> cycle(cycle_mutex_);
    CycleResult result;

    std::set<Serial> current;
    try {
        current = probe_.list_serials();
    } catch (const std::exception& ex) {
        util::log::warn(std::string("Device enumeration failed, keeping previous state: ") + ex.what());
        result.probe_failed = true;
        return result;
    }

    std::set<Serial> previous = known_serials();
    if (current == previous) {
        return result;
    }

    util::log::info("Change detected: " + describe(previous) + " -> " + describe(current));
    result.changed = true;
    result.devices.reserve(current.size());
    const auto now = std::chrono::system_clock::now();
    for (auto serial : current) {
        auto reading = read_device_or_fallback(probe_, serial);
        try {
            store_.upsert_and_log(reading.attributes, reading.raw_info, now);
        } catch (const PersistenceError& ex) {
            util::log::error("Failed to persist YubiKey " + std::to_string(serial) + ": " + ex.what());
            ++result.persist_failures;
        }
        result.devices.push_back(std::move(reading.attributes));
    }

    if (update_callback_) {
        update_callback_(result.devices);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        previous_serials_ = std::move(current);
    }
    return result;
}

}  // namespace ykmon::server
