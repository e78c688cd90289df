#include "api_router.hpp"
#include "fake_probe.hpp"

#include <catch2/catch.hpp>

using ykmon::server::ApiConfig;
using ykmon::server::ApiRouter;
using ykmon::server::DeviceStore;
using ykmon::testing::FakeProbe;

namespace {

struct RouterFixture {
    FakeProbe probe;
    DeviceStore store{":memory:"};
    ApiRouter router{probe, store, ApiConfig{}};
};

}  // namespace

TEST_CASE("listing with nothing attached", "[api]") {
    RouterFixture fixture;

    const auto response = fixture.router.handle("GET", "/api/yubikeys");

    CHECK(response.status == 200);
    CHECK(response.body == nlohmann::json::parse(R"({"success":true,"yubikeys":[],"count":0})"));
    CHECK(fixture.store.stats().total_detections == 0);
}

TEST_CASE("listing attached devices", "[api]") {
    RouterFixture fixture;
    fixture.probe.attach(12345678, ykmon::testing::kYubiKey5Info);
    fixture.probe.attach_without_info(5);

    SECTION("without auto_save nothing is written") {
        const auto response = fixture.router.handle("GET", "/api/yubikeys?auto_save=false");
        REQUIRE(response.status == 200);
        CHECK(response.body["count"] == 2);
        CHECK(response.body["yubikeys"][0]["serial"] == 5);
        CHECK(response.body["yubikeys"][0]["version"].is_null());
        CHECK(response.body["yubikeys"][1]["version"] == "5.4.3");
        CHECK(fixture.store.stats().total_yubikeys == 0);
    }

    SECTION("auto_save is case insensitive and saves fallbacks too") {
        const auto response = fixture.router.handle("GET", "/api/yubikeys?auto_save=TRUE");
        REQUIRE(response.status == 200);
        CHECK(fixture.store.stats().total_yubikeys == 2);
        CHECK(fixture.store.find(5)->raw_info.find("Failed to connect") != std::string::npos);
    }

    SECTION("other values do not enable auto_save") {
        fixture.router.handle("GET", "/api/yubikeys?auto_save=1");
        CHECK(fixture.store.stats().total_yubikeys == 0);
    }
}

TEST_CASE("listing fails when ykman is unavailable", "[api]") {
    RouterFixture fixture;
    fixture.probe.fail_enumeration(true);

    const auto response = fixture.router.handle("GET", "/api/yubikeys");

    CHECK(response.status == 500);
    CHECK(response.body["success"] == false);
    CHECK(response.body["error"].get<std::string>().find("yubikey-manager") != std::string::npos);
}

TEST_CASE("single device info", "[api]") {
    RouterFixture fixture;
    fixture.probe.attach(12345678, ykmon::testing::kYubiKey5Info);

    SECTION("known device") {
        const auto response = fixture.router.handle("GET", "/api/yubikey/12345678/info");
        REQUIRE(response.status == 200);
        CHECK(response.body["success"] == true);
        CHECK(response.body["info"]["form_factor"] == "USB-A Keychain");
        CHECK(fixture.store.stats().total_yubikeys == 0);
    }

    SECTION("auto_save persists the lookup") {
        fixture.router.handle("GET", "/api/yubikey/12345678/info?auto_save=true");
        CHECK(fixture.store.stats().total_detections == 1);
    }

    SECTION("a failed lookup is a 404") {
        const auto response = fixture.router.handle("GET", "/api/yubikey/999/info");
        CHECK(response.status == 404);
        CHECK(response.body["success"] == false);
    }
}

TEST_CASE("saving a device returns the stored record", "[api]") {
    RouterFixture fixture;
    fixture.probe.attach(12345678, ykmon::testing::kYubiKey5Info);

    const auto response = fixture.router.handle("POST", "/api/yubikey/12345678/save");

    REQUIRE(response.status == 200);
    CHECK(response.body["message"] == "YubiKey 12345678 saved to database");
    CHECK(response.body["info"]["serial"] == 12345678);
    CHECK(response.body["info"]["version"] == "5.4.3");
    CHECK(response.body["info"]["raw_info"].get<std::string>().find("Firmware version") != std::string::npos);

    const auto failed = fixture.router.handle("POST", "/api/yubikey/1/save");
    CHECK(failed.status == 500);
    CHECK(failed.body["success"] == false);
}

TEST_CASE("database views", "[api]") {
    RouterFixture fixture;
    fixture.probe.attach(12345678, ykmon::testing::kYubiKey5Info);
    fixture.router.handle("POST", "/api/yubikey/12345678/save");
    fixture.router.handle("POST", "/api/yubikey/12345678/save");

    const auto devices = fixture.router.handle("GET", "/api/database/yubikeys");
    REQUIRE(devices.status == 200);
    CHECK(devices.body["count"] == 1);
    CHECK(devices.body["yubikeys"][0]["serial"] == 12345678);

    const auto detections = fixture.router.handle("GET", "/api/database/detections");
    REQUIRE(detections.status == 200);
    CHECK(detections.body["count"] == 2);
    CHECK(detections.body["detections"][0]["device_type"] == "YubiKey 5");
    CHECK(detections.body["detections"][0]["info_snapshot"]["version"] == "5.4.3");

    const auto stats = fixture.router.handle("GET", "/api/database/stats");
    REQUIRE(stats.status == 200);
    CHECK(stats.body["stats"]["total_yubikeys"] == 1);
    CHECK(stats.body["stats"]["total_detections"] == 2);
    CHECK(stats.body["stats"]["recent_detections_24h"] == 2);
}

TEST_CASE("detection history honours the configured limit", "[api]") {
    FakeProbe probe;
    DeviceStore store(":memory:");
    ApiConfig config;
    config.detection_history_limit = 1;
    ApiRouter router(probe, store, config);
    probe.attach(1, ykmon::testing::kYubiKey5Info);
    router.handle("POST", "/api/yubikey/1/save");
    router.handle("POST", "/api/yubikey/1/save");

    CHECK(router.handle("GET", "/api/database/detections").body["count"] == 1);
}

TEST_CASE("health checks", "[api]") {
    RouterFixture fixture;

    const auto ykman = fixture.router.handle("GET", "/api/yubikey/test");
    REQUIRE(ykman.status == 200);
    CHECK(ykman.body["ykman_version"] == "YubiKey Manager (ykman) version: 5.2.1");
    CHECK(ykman.body["message"] == "ykman is working");

    const auto database = fixture.router.handle("GET", "/api/database/test");
    REQUIRE(database.status == 200);
    CHECK(database.body["message"] == "Database connection successful");
    CHECK_FALSE(database.body["sqlite_version"].get<std::string>().empty());

    const auto init = fixture.router.handle("POST", "/api/database/init");
    REQUIRE(init.status == 200);
    CHECK(init.body["success"] == true);
}

TEST_CASE("routing errors", "[api]") {
    RouterFixture fixture;

    CHECK(fixture.router.handle("GET", "/api/nothing").status == 404);
    CHECK(fixture.router.handle("GET", "/").status == 404);
    CHECK(fixture.router.handle("GET", "/api/yubikey/abc/info").status == 404);
    CHECK(fixture.router.handle("GET", "/api/yubikey/-5/info").status == 404);
    CHECK(fixture.router.handle("GET", "/api/yubikey/12/unknown").status == 404);
    CHECK(fixture.router.handle("POST", "/api/yubikeys").status == 405);
    CHECK(fixture.router.handle("GET", "/api/yubikey/12/save").status == 405);
    CHECK(fixture.router.handle("DELETE", "/api/database/stats").status == 405);
    CHECK(fixture.router.handle("GET", "/api/database/init").status == 405);

    const auto preflight = fixture.router.handle("OPTIONS", "/api/yubikeys");
    CHECK(preflight.status == 204);
    CHECK(preflight.body.is_null());
}
