#include "cli_parser.hpp"
#include <charconv>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace toolbridge::app::cli {

    using namespace toolbridge::core::errors;
    using toolbridge::core::config::GatewayConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> host;
        std::optional<std::string> port;
        std::optional<std::string> base_dir;
        std::optional<std::string> max_connections;
        std::optional<std::string> device_url;
        bool verbose = false;
    };

    namespace {

        template <typename T>
        Result<T> parse_number(const std::string& flag, const std::string& raw) {
            T value = 0;
            const char* begin = raw.data();
            const char* end = raw.data() + raw.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return BridgeError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            return value;
        }

    }  // namespace

    Result<CliOptions> parse_and_validate(int argc, char* argv[], GatewayConfig base) {
        if (argc < 2) {
            return BridgeError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: toolbridge serve [--port N] | toolbridge tools"};
        }

        CliOptions options;
        std::string command = argv[1];
        if (command == "serve") {
            options.command = Command::Serve;
        } else if (command == "tools") {
            options.command = Command::ListTools;
        } else {
            return BridgeError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands: serve, tools."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and the command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--host") {
                if (i + 1 < args.size()) raw.host = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --host", "missing_value"};
            } else if (args[i] == "--port") {
                if (i + 1 < args.size()) raw.port = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --port", "missing_value"};
            } else if (args[i] == "--base-dir") {
                if (i + 1 < args.size()) raw.base_dir = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --base-dir", "missing_value"};
            } else if (args[i] == "--max-connections") {
                if (i + 1 < args.size()) raw.max_connections = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --max-connections", "missing_value"};
            } else if (args[i] == "--device-url") {
                if (i + 1 < args.size()) raw.device_url = args[++i];
                else return BridgeError{ErrorCategory::Input, "Missing value for --device-url", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return BridgeError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        GatewayConfig config = std::move(base);
        options.verbose = raw.verbose;
        if (raw.verbose) config.log_level = "debug";

        if (raw.host) config.listen.host = raw.host.value();

        // Exception-free integer parsing
        if (raw.port) {
            auto port = parse_number<std::uint16_t>("--port", raw.port.value());
            if (is_error(port)) return get_error(port);
            if (get_value(port) == 0) {
                return BridgeError{ErrorCategory::Input, "--port out of bounds", "bounds_error", "Must be between 1 and 65535."};
            }
            config.listen.port = get_value(port);
        }

        if (raw.max_connections) {
            auto max = parse_number<std::size_t>("--max-connections", raw.max_connections.value());
            if (is_error(max)) return get_error(max);
            if (get_value(max) == 0 || get_value(max) > 10000) {
                return BridgeError{ErrorCategory::Input, "--max-connections out of bounds", "bounds_error", "Must be between 1 and 10000."};
            }
            config.connections.max_connections = get_value(max);
        }

        if (raw.device_url) {
            auto device = toolbridge::core::config::parse_device_url(raw.device_url.value(), config.device);
            if (is_error(device)) return get_error(device);
            config.device = get_value(device);
        }

        // Path validation
        if (raw.base_dir) {
            std::filesystem::path p(raw.base_dir.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return BridgeError{ErrorCategory::Input, "Base directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return BridgeError{ErrorCategory::Input, "Failed to canonicalize base directory", "invalid_path"};
            }
            config.sandbox.base_directory = std::move(canonical_path);
        }

        auto validated = toolbridge::core::config::validate_config(std::move(config));
        if (is_error(validated)) return get_error(validated);
        options.config = get_value(validated);
        return options;
    }

}  // namespace toolbridge::app::cli
