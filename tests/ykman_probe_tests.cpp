#include "ykman_probe.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using ykmon::server::ProbeError;
using ykmon::server::YkmanProbe;
using namespace std::chrono_literals;

namespace {

// Writes an executable shell script that stands in for ykman.
std::filesystem::path write_fake_ykman(const std::string& body) {
    static std::size_t counter = 0;
    const auto suffix = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count() + counter++);
    const auto path = std::filesystem::temp_directory_path() / ("fake-ykman-" + suffix + ".sh");
    std::ofstream output(path);
    REQUIRE(output.good());
    output << "#!/bin/sh\n" << body;
    output.close();
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec);
    return path;
}

const char* kScript = R"(case "$1" in
  list) printf '12345678\n87654321\n\n' ;;
  --version) echo "YubiKey Manager (ykman) version: 5.2.1" ;;
  --device)
    if [ "$2" = "12345678" ]; then
      printf 'Device type: YubiKey 5\nFirmware version: 5.4.3\nForm factor: USB-A Keychain\n'
    else
      echo "Failed to connect to the YubiKey." 1>&2
      exit 2
    fi ;;
esac
)";

}  // namespace

TEST_CASE("YkmanProbe runs the ykman subcommands", "[probe]") {
    const auto script = write_fake_ykman(kScript);
    YkmanProbe probe(script.string(), 5s);

    SECTION("serials are listed one per line") {
        const auto serials = probe.list_serials();
        CHECK(serials == std::set<ykmon::server::Serial>{12345678, 87654321});
    }

    SECTION("device info is returned trimmed") {
        const auto info = probe.fetch_info(12345678);
        CHECK(info.rfind("Device type: YubiKey 5", 0) == 0);
        CHECK(info.back() == 'n');
    }

    SECTION("tool version") {
        CHECK(probe.tool_version() == "YubiKey Manager (ykman) version: 5.2.1");
    }

    SECTION("a non-zero exit carries stderr") {
        try {
            probe.fetch_info(87654321);
            FAIL("expected ProbeError");
        } catch (const ProbeError& ex) {
            CHECK(ex.reason() == ProbeError::Reason::NonZeroExit);
            CHECK(std::string(ex.what()).find("Failed to connect to the YubiKey.") != std::string::npos);
        }
    }

    std::filesystem::remove(script);
}

TEST_CASE("YkmanProbe reports a missing binary", "[probe]") {
    YkmanProbe probe("ykmon-missing-ykman", 5s);
    try {
        probe.list_serials();
        FAIL("expected ProbeError");
    } catch (const ProbeError& ex) {
        CHECK(ex.reason() == ProbeError::Reason::BinaryNotFound);
        CHECK(std::string(ex.what()).find("Please install yubikey-manager") != std::string::npos);
    }
}

TEST_CASE("YkmanProbe reports a hung binary as a timeout", "[probe]") {
    const auto script = write_fake_ykman("sleep 5\n");
    YkmanProbe probe(script.string(), 200ms);

    try {
        probe.list_serials();
        FAIL("expected ProbeError");
    } catch (const ProbeError& ex) {
        CHECK(ex.reason() == ProbeError::Reason::Timeout);
    }
    std::filesystem::remove(script);
}

TEST_CASE("read_device_or_fallback substitutes defaults on failure", "[probe]") {
    const auto script = write_fake_ykman(kScript);
    YkmanProbe probe(script.string(), 5s);

    const auto good = ykmon::server::read_device_or_fallback(probe, 12345678);
    CHECK(good.probe_ok);
    CHECK(good.attributes.firmware_version.value() == "5.4.3");

    const auto bad = ykmon::server::read_device_or_fallback(probe, 87654321);
    CHECK_FALSE(bad.probe_ok);
    CHECK(bad.attributes.serial == 87654321);
    CHECK_FALSE(bad.attributes.firmware_version.is_known());
    CHECK(bad.attributes.device_type == "YubiKey");
    CHECK(bad.raw_info.find("Failed to connect") != std::string::npos);

    std::filesystem::remove(script);
}

TEST_CASE("parse_serial_list skips blank and malformed lines", "[probe]") {
    const auto serials = ykmon::server::parse_serial_list("  123 \n\nabc\n456\n12x\n123\n");
    CHECK(serials == std::set<ykmon::server::Serial>{123, 456});
}
