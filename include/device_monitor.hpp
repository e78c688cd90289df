#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "device_attributes.hpp"
#include "device_store.hpp"
#include "ykman_probe.hpp"

namespace ykmon::server {

// Samples attached devices, diffs against the last successful enumeration, and
// on change persists and publishes the full current attribute list.
class DeviceMonitor {
public:
    using UpdateCallback = std::function<void(const std::vector<DeviceAttributes>&)>;

    struct CycleResult {
        bool probe_failed{false};
        bool changed{false};
        std::vector<DeviceAttributes> devices;
        std::size_t persist_failures{0};
    };

    DeviceMonitor(DeviceProbe& probe, DeviceStore& store, std::chrono::milliseconds poll_interval);
    ~DeviceMonitor();

    DeviceMonitor(const DeviceMonitor&) = delete;
    DeviceMonitor& operator=(const DeviceMonitor&) = delete;

    void set_update_callback(UpdateCallback callback);

    // Starts the background loop unless it is already running or the monitor was
    // shut down. Returns true when this call started it. Never waits for a
    // previous loop that is still finishing its cycle.
    bool start();
    // Shuts the monitor down for good: signals every loop and joins it. Later
    // start() calls return false.
    void stop();
    // Signals the current loop without waiting for its cycle to finish. The
    // thread is joined by a later start() once it has exited, or by stop().
    void request_stop();
    bool running() const;
    std::uint64_t start_count() const { return start_count_.load(); }

    // One reconciliation cycle. Only the loop thread calls this while running.
    CycleResult poll_once();

    std::set<Serial> known_serials() const;

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic_bool> finished;
    };

    void run_loop(std::uint64_t generation);
    void reap_finished_workers();

    DeviceProbe& probe_;
    DeviceStore& store_;
    const std::chrono::milliseconds poll_interval_;
    UpdateCallback update_callback_;

    // Serializes cycles of a retiring loop with those of its successor.
    std::mutex cycle_mutex_;
    mutable std::mutex state_mutex_;
    std::set<Serial> previous_serials_;

    std::mutex control_mutex_;
    mutable std::mutex lifecycle_mutex_;
    std::condition_variable wake_cv_;
    bool running_{false};
    bool shut_down_{false};
    // A loop keeps running while this still equals the value it was started with.
    std::uint64_t generation_{0};
    std::vector<Worker> workers_;
    std::atomic_uint64_t start_count_{0};
};

}  // namespace ykmon::server
