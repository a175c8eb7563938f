#include "common/Cancellation.hpp"
#include "common/Logger.hpp"
#include "core/CommandDispatcher.hpp"
#include "core/ControlServer.hpp"
#include "core/DisplayGate.hpp"
#include "core/ServerConfig.hpp"
#include "handlers/AppCommandHandler.hpp"
#include "handlers/DisplayCommandHandler.hpp"
#include "handlers/TouchCommandHandler.hpp"
#include "interfaces/IPlatformFactory.hpp"
#include "testing/MockPlatform.hpp"

// Conditional Includes
#ifdef PLATFORM_LINUX
    #include "platform/linux/LinuxPlatformFactory.hpp"
#endif

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>
#include <unistd.h>

namespace {

    // SIGINT/SIGTERM are blocked in every thread and collected here, so the
    // shutdown path runs in normal thread context instead of a handler.
    class SignalWatcher {
    public:
        SignalWatcher() {
            sigemptyset(&set_);
            sigaddset(&set_, SIGINT);
            sigaddset(&set_, SIGTERM);
            pthread_sigmask(SIG_BLOCK, &set_, nullptr);

            thread_ = std::thread([this]() {
                int sig = 0;
                sigwait(&set_, &sig);
                signal_ = sig;
                source_.cancel();
            });
        }

        ~SignalWatcher() {
            if (!source_.is_cancelled()) {
                // Wake the watcher so it can be joined
                ::kill(::getpid(), SIGTERM);
            }
            if (thread_.joinable()) thread_.join();
        }

        common::CancellationToken token() const { return source_.get_token(); }
        int received() const { return signal_; }

    private:
        sigset_t set_;
        common::CancellationSource source_;
        std::atomic<int> signal_{0};
        std::thread thread_;
    };

    std::shared_ptr<interfaces::IPlatformFactory> make_platform(const core::ServerConfig& cfg) {
        if (cfg.use_mock_platform) {
            return std::make_shared<testing::MockPlatformFactory>();
        }
#ifdef PLATFORM_LINUX
        return std::make_shared<platform::linux_os::LinuxPlatformFactory>(cfg.window_name, cfg.scale);
#else
        return nullptr;
#endif
    }

} // namespace

int main(int argc, char** argv) {
    auto parsed = core::parse_config(argc, argv);
    if (parsed.is_err()) {
        std::cerr << "[Main] " << parsed.error().message << "\n\n" << core::usage(argv[0]);
        return 1;
    }
    const core::ServerConfig cfg = parsed.unwrap();

    if (cfg.show_help) {
        std::cout << core::usage(argv[0]);
        return 0;
    }

    auto logger = std::make_shared<common::ConsoleLogger>(cfg.verbose);

    if (!cfg.enabled) {
        logger->info("[Main] Agent disabled by configuration, exiting");
        return 0;
    }

    // Peers vanishing mid-write must surface as EPIPE, not kill the process
    std::signal(SIGPIPE, SIG_IGN);
    SignalWatcher signals;

    // 1. Platform
    auto platform = make_platform(cfg);
    if (!platform) {
        logger->error("[Main] No native platform in this build; run with --mock");
        return 1;
    }
    if (!platform->is_fully_supported()) {
        logger->error(std::string("[Main] Platform ") + platform->platform_name() + " is not available");
        return 1;
    }
    logger->info(std::string("[Main] Platform: ") + platform->platform_name());

    auto display = platform->create_display_info();
    auto frames = platform->create_frame_provider();
    auto injector = platform->create_input_injector();
    auto lifecycle = platform->create_lifecycle_controller();

    // 2. Wait for the display
    core::DisplayGate gate(display, logger, std::chrono::milliseconds(cfg.poll_interval_ms));
    auto ready = gate.wait_until_ready(signals.token(), cfg.scale);
    if (ready.is_err()) {
        if (ready.error().code == common::ErrorCode::Cancelled) {
            logger->info("[Main] Stopped before the display became ready");
            return 0;
        }
        logger->error("[Main] Display gate failed: " + ready.error().message);
        return 1;
    }
    std::shared_ptr<const core::ServerState> server_state = ready.unwrap();

    // 3. Command routing
    auto dispatcher = std::make_shared<core::command::CommandDispatcher>(logger);
    dispatcher->register_handler(std::make_shared<handlers::DisplayCommandHandler>(frames, logger));
    if (injector) {
        dispatcher->register_handler(std::make_shared<handlers::TouchCommandHandler>(injector));
    } else {
        logger->error("[Main] Input injection unavailable; touch commands will be ignored");
    }
    dispatcher->register_handler(std::make_shared<handlers::AppCommandHandler>(lifecycle, logger));

    // 4. Server
    core::ControlServer server(cfg.port, server_state, dispatcher, logger);
    server.set_state_handler([display, server_state, logger](core::ListenerState state, const std::string& detail) {
        logger->debug(std::string("[Main] Listener ") + core::to_string(state));
        if (state != core::ListenerState::Ready) return;
        auto labelled = display->set_window_label(
            server_state->window_label + " [localhost:" + detail + "]");
        if (labelled.is_err()) {
            logger->error("[Main] Could not update window label: " + labelled.error().message);
        }
    });

    auto started = server.start();
    if (started.is_err()) {
        return 1;
    }

    // 5. Run until signalled
    auto token = signals.token();
    while (!token.wait_for(std::chrono::seconds(1))) {
    }
    logger->info("[Main] Signal " + std::to_string(signals.received()) + " received, shutting down");

    server.stop();

    auto stats = dispatcher->get_stats();
    logger->info("[Main] Dispatched " + std::to_string(stats.total_dispatched) +
                 " commands (" + std::to_string(stats.ignored_commands) + " ignored, " +
                 std::to_string(stats.execution_errors) + " failed)");
    return 0;
}
