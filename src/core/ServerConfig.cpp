#include "core/ServerConfig.hpp"
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace core {

    namespace {

        common::Result<uint16_t> parse_port(const std::string& text) {
            try {
                size_t used = 0;
                long value = std::stol(text, &used);
                if (used != text.size() || value < 0 || value > 65535) {
                    return common::Result<uint16_t>::err(common::ErrorCode::InvalidArgument,
                                                         "Port out of range: " + text);
                }
                return common::Result<uint16_t>::ok(static_cast<uint16_t>(value));
            } catch (const std::exception&) {
                return common::Result<uint16_t>::err(common::ErrorCode::InvalidArgument,
                                                     "Invalid port: " + text);
            }
        }

        common::Result<double> parse_positive_double(const std::string& name, const std::string& text) {
            try {
                size_t used = 0;
                double value = std::stod(text, &used);
                if (used != text.size() || !(value > 0.0)) {
                    return common::Result<double>::err(common::ErrorCode::InvalidArgument,
                                                       name + " must be > 0: " + text);
                }
                return common::Result<double>::ok(value);
            } catch (const std::exception&) {
                return common::Result<double>::err(common::ErrorCode::InvalidArgument,
                                                   "Invalid " + name + ": " + text);
            }
        }

        bool is_false_flag(const std::string& value) {
            return value == "0" || value == "false" || value == "off" || value == "no";
        }

    } // namespace

    common::Result<ServerConfig> parse_config(const std::vector<std::string>& args, EnvLookup env) {
        ServerConfig cfg;

        if (env) {
            if (const char* v = env("TOUCHBRIDGE_ENABLED")) {
                cfg.enabled = !is_false_flag(v);
            }
            if (const char* v = env("TOUCHBRIDGE_PORT")) {
                auto port = parse_port(v);
                if (port.is_err()) return common::Result<ServerConfig>::err(port.error());
                cfg.port = port.unwrap();
            }
            if (const char* v = env("TOUCHBRIDGE_WINDOW")) {
                cfg.window_name = v;
            }
        }

        auto missing = [](const std::string& flag) {
            return common::Result<ServerConfig>::err(common::ErrorCode::InvalidArgument,
                                                     "Missing value for " + flag);
        };

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];

            if (arg == "--help" || arg == "-h") {
                cfg.show_help = true;
            } else if (arg == "--port" || arg == "-p") {
                if (i + 1 >= args.size()) return missing(arg);
                auto port = parse_port(args[++i]);
                if (port.is_err()) return common::Result<ServerConfig>::err(port.error());
                cfg.port = port.unwrap();
            } else if (arg == "--window" || arg == "-w") {
                if (i + 1 >= args.size()) return missing(arg);
                cfg.window_name = args[++i];
            } else if (arg == "--scale") {
                if (i + 1 >= args.size()) return missing(arg);
                auto scale = parse_positive_double("scale", args[++i]);
                if (scale.is_err()) return common::Result<ServerConfig>::err(scale.error());
                cfg.scale = scale.unwrap();
            } else if (arg == "--poll-ms") {
                if (i + 1 >= args.size()) return missing(arg);
                auto ms = parse_positive_double("poll interval", args[++i]);
                if (ms.is_err()) return common::Result<ServerConfig>::err(ms.error());
                cfg.poll_interval_ms = static_cast<int>(ms.unwrap());
            } else if (arg == "--disable") {
                cfg.enabled = false;
            } else if (arg == "--mock") {
                cfg.use_mock_platform = true;
            } else if (arg == "--verbose" || arg == "-v") {
                cfg.verbose = true;
            } else if (i == 0 && !arg.empty() && arg[0] != '-') {
                // Legacy form: agent <port>
                auto port = parse_port(arg);
                if (port.is_err()) return common::Result<ServerConfig>::err(port.error());
                cfg.port = port.unwrap();
            } else {
                return common::Result<ServerConfig>::err(common::ErrorCode::InvalidArgument,
                                                         "Unknown argument: " + arg);
            }
        }

        return common::Result<ServerConfig>::ok(cfg);
    }

    common::Result<ServerConfig> parse_config(int argc, const char* const* argv) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
        return parse_config(args, [](const char* name) -> const char* { return std::getenv(name); });
    }

    std::string usage(const std::string& program) {
        std::ostringstream ss;
        ss << "Usage: " << program << " [port] [options]\n"
           << "  -p, --port N      TCP port to listen on (0 = any, default 0)\n"
           << "  -w, --window STR  Control the X11 window whose title contains STR\n"
           << "      --scale S     Device pixels per logical point (default 1.0)\n"
           << "      --poll-ms N   Display readiness poll interval (default 1000)\n"
           << "      --disable     Start with the control server disabled\n"
           << "      --mock        Use the in-memory mock platform\n"
           << "  -v, --verbose     Debug logging\n"
           << "  -h, --help        Show this help\n"
           << "Environment: TOUCHBRIDGE_PORT, TOUCHBRIDGE_ENABLED, TOUCHBRIDGE_WINDOW\n";
        return ss.str();
    }

} // namespace core
