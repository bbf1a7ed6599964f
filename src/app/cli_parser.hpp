#pragma once
#include "core/config/gateway_config.hpp"
#include "core/errors/bridge_errors.hpp"

namespace toolbridge::app::cli {

    enum class Command {
        Serve,
        ListTools
    };

    struct CliOptions {
        Command command = Command::Serve;
        toolbridge::core::config::GatewayConfig config;
        bool verbose = false;
    };

    // Flags override `base`, which normally comes from the environment.
    toolbridge::core::errors::Result<CliOptions> parse_and_validate(
        int argc, char* argv[], toolbridge::core::config::GatewayConfig base = {});

}  // namespace toolbridge::app::cli
