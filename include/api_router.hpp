#pragma once

#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "device_store.hpp"
#include "util/config_loader.hpp"
#include "ykman_probe.hpp"

namespace ykmon::server {

// Maps method + target onto the /api surface. Never throws; failures become
// {"success": false, "error": ...} bodies with the matching status.
class ApiRouter {
public:
    struct Response {
        unsigned status{200};
        nlohmann::json body;
    };

    ApiRouter(DeviceProbe& probe, DeviceStore& store, ApiConfig config);

    Response handle(const std::string& method, const std::string& target);

private:
    using Query = std::map<std::string, std::string>;

    Response list_connected(const Query& query);
    Response device_info(Serial serial, const Query& query);
    Response save_device(Serial serial);
    Response stored_devices();
    Response detections();
    Response stats();
    Response test_ykman();
    Response test_database();
    Response init_database();

    DeviceProbe& probe_;
    DeviceStore& store_;
    ApiConfig config_;
};

}  // namespace ykmon::server
