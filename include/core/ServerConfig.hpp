#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "common/Result.hpp"

namespace core {

    struct ServerConfig {
        bool enabled = true;
        uint16_t port = 0;          // 0 = any available port
        std::string window_name;    // Title substring of the target window, empty = root
        double scale = 1.0;         // Device pixels per logical point
        int poll_interval_ms = 1000;
        bool use_mock_platform = false;
        bool verbose = false;
        bool show_help = false;
    };

    // Parses argv (argv[0] skipped) on top of environment defaults:
    //   TOUCHBRIDGE_ENABLED  0/false/off disables the agent
    //   TOUCHBRIDGE_PORT     TCP port
    //   TOUCHBRIDGE_WINDOW   target window title
    // A bare first positional argument is taken as the port.
    common::Result<ServerConfig> parse_config(int argc, const char* const* argv);

    // Same, with an explicit environment lookup (tests)
    using EnvLookup = const char* (*)(const char*);
    common::Result<ServerConfig> parse_config(const std::vector<std::string>& args, EnvLookup env);

    std::string usage(const std::string& program);

} // namespace core
