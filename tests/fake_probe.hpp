#pragma once

#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <string>

#include "ykman_probe.hpp"

namespace ykmon::testing {

// Scripted DeviceProbe: the attached set and per-device info text are set by the
// test; missing info text fails like a non-zero ykman exit.
class FakeProbe : public server::DeviceProbe {
public:
    void attach(server::Serial serial, std::string info_text) {
        std::lock_guard<std::mutex> lock(mutex_);
        serials_.insert(serial);
        info_[serial] = std::move(info_text);
    }

    void attach_without_info(server::Serial serial) {
        std::lock_guard<std::mutex> lock(mutex_);
        serials_.insert(serial);
        info_.erase(serial);
    }

    void detach(server::Serial serial) {
        std::lock_guard<std::mutex> lock(mutex_);
        serials_.erase(serial);
    }

    void fail_enumeration(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_enumeration_ = fail;
    }

    // While held, enumeration blocks like a ykman call that has not answered yet.
    void hold_enumeration(bool hold) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hold_ = hold;
        }
        released_.notify_all();
    }

    int list_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return list_calls_;
    }

    std::set<server::Serial> list_serials() override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++list_calls_;
        released_.wait(lock, [this] { return !hold_; });
        if (fail_enumeration_) {
            throw server::ProbeError(server::ProbeError::Reason::BinaryNotFound,
                                     "ykman command not found. Please install yubikey-manager.");
        }
        return serials_;
    }

    std::string fetch_info(server::Serial serial) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = info_.find(serial);
        if (it == info_.end()) {
            throw server::ProbeError(server::ProbeError::Reason::NonZeroExit,
                                     "ykman error: Failed to connect to YubiKey " + std::to_string(serial));
        }
        return it->second;
    }

    std::string tool_version() override { return "YubiKey Manager (ykman) version: 5.2.1"; }

private:
    mutable std::mutex mutex_;
    std::set<server::Serial> serials_;
    std::map<server::Serial, std::string> info_;
    std::condition_variable released_;
    bool fail_enumeration_{false};
    bool hold_{false};
    int list_calls_{0};
};

inline const char* kYubiKey5Info =
    "Device type: YubiKey 5\n"
    "Serial number: 12345678\n"
    "Firmware version: 5.4.3\n"
    "Form factor: USB-A Keychain\n"
    "Enabled USB interfaces: OTP, FIDO, CCID\n";

}  // namespace ykmon::testing
