#include <string>

#include <CLI/CLI.hpp>

#include "app.hpp"

int main(int argc, char** argv) {
    CLI::App app{"YubiKey monitor server"};
    std::string config_path;
    std::string log_level;

    app.add_option("-c,--config", config_path, "YAML configuration file")->check(CLI::ExistingFile);
    app.add_option("-l,--log-level", log_level, "trace, debug, info, warn, error or critical");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    return ykmon::server::run(config_path, log_level);
}
