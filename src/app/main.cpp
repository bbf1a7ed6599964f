#include <csignal>
#include <iostream>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/config/gateway_config.hpp"
#include "core/config/instance_id.hpp"
#include "core/errors/bridge_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/gateway.hpp"
#include "server/http_server.hpp"

namespace {

void report_input_error(const toolbridge::core::errors::BridgeError& err) {
    LOG_ERROR("Input error [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace errors = toolbridge::core::errors;
    namespace config = toolbridge::core::config;
    using toolbridge::core::logging::Logger;

    // 1. Tag every log line with this process' instance id
    Logger::get().set_instance_id(config::generate_instance_id());

    // 2. Environment first, flags on top
    auto from_env = config::load_config_from_env();
    if (errors::is_error(from_env)) {
        report_input_error(errors::get_error(from_env));
        return 2;
    }
    auto parsed = toolbridge::app::cli::parse_and_validate(argc, argv,
                                                           errors::get_value(from_env));
    if (errors::is_error(parsed)) {
        report_input_error(errors::get_error(parsed));
        return 2;
    }
    const auto& options = errors::get_value(parsed);
    Logger::get().set_min_level(toolbridge::core::logging::parse_log_level(options.config.log_level));

    toolbridge::runtime::Gateway gateway(options.config);

    // 3. `tools` prints the enabled catalog and exits
    if (options.command == toolbridge::app::cli::Command::ListTools) {
        nlohmann::json catalog = nlohmann::json::array();
        for (const auto& descriptor : gateway.tools().list()) {
            catalog.push_back(toolbridge::protocol::to_json(descriptor));
        }
        std::cout << catalog.dump(2) << std::endl;
        return 0;
    }

    // 4. Serve until SIGINT/SIGTERM
    LOG_INFO("toolbridge " + std::string(toolbridge::runtime::kServerVersion) + ": sandbox " +
             options.config.sandbox.base_directory.string() + ", " +
             std::to_string(gateway.tools().size()) + " tools registered");
    gateway.start();

    toolbridge::server::HttpServer server(gateway, options.config.listen);
    auto started = server.start();
    if (errors::is_error(started)) {
        const auto& err = errors::get_error(started);
        LOG_ERROR("Failed to start server [" + err.code + "]: " + err.message);
        gateway.shutdown();
        return 3;
    }

    boost::asio::io_context signals_ioc;
    boost::asio::signal_set signals(signals_ioc, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            LOG_INFO("Received signal " + std::to_string(signal_number) + ", shutting down");
        }
    });
    signals_ioc.run();

    // Clients get their closing notice before the transport goes away.
    gateway.shutdown();
    server.stop();
    LOG_INFO("Shutdown complete");
    return 0;
}
