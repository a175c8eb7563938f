// ============================================================================
// Linux Platform HAL Test Program
// ============================================================================
// Tests the X11 platform components against a live display:
// - DisplayInfo (geometry, window label, label update)
// - FrameProvider (capture + normalization to the display size)
// - InputInjector (XTest touch gesture)
// - PlatformFactory wiring
//
// Run with: ./LinuxPlatformTest [window title]
// Output: Console log with PASS/FAIL for each test.
// Without DISPLAY every test is reported as SKIP and the program succeeds.
// ============================================================================

#ifdef PLATFORM_LINUX

#include <iostream>
#include <thread>
#include <chrono>
#include <iomanip>
#include <vector>
#include <string>
#include <cstdlib>

// Platform includes
#include "LinuxPlatformFactory.hpp"
#include "LinuxX11Connection.hpp"
#include "LinuxX11DisplayInfo.hpp"
#include "LinuxX11FrameProvider.hpp"
#include "LinuxXTestInjector.hpp"

using namespace platform::linux_os;
using namespace std::chrono_literals;

// ============================================================================
// Test Result Tracking
// ============================================================================

struct TestResult {
    std::string name;
    bool passed;
    std::string details;
    double duration_ms;
};

std::vector<TestResult> g_results;

void log_test(const std::string& name, bool passed,
              const std::string& details = "", double duration_ms = 0) {
    TestResult r{name, passed, details, duration_ms};
    g_results.push_back(r);

    std::cout << (passed ? "[PASS]" : "[FAIL]")
              << " " << name;
    if (duration_ms > 0) {
        std::cout << " (" << std::fixed << std::setprecision(1)
                  << duration_ms << "ms)";
    }
    if (!details.empty()) {
        std::cout << " - " << details;
    }
    std::cout << std::endl;
}

void log_skip(const std::string& name, const std::string& reason) {
    std::cout << "[SKIP] " << name << " - " << reason << std::endl;
}

// ============================================================================
// Test: DisplayInfo
// ============================================================================

common::DisplayGeometry test_display_info(const std::shared_ptr<LinuxX11Connection>& connection) {
    std::cout << "\n=== Testing DisplayInfo ===" << std::endl;

    LinuxX11DisplayInfo info(connection, 2.0);
    common::DisplayGeometry geometry;

    // Test 1: Geometry
    {
        auto start = std::chrono::high_resolution_clock::now();
        auto result = info.get_display_geometry();
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        if (result.is_ok()) geometry = result.unwrap();
        bool ok = result.is_ok() && geometry.is_known() && geometry.scale == 2.0;
        log_test("DisplayInfo::get_display_geometry", ok,
                 ok ? std::to_string(geometry.width) + "x" + std::to_string(geometry.height)
                    : (result.is_err() ? result.error().message : "zero size"), ms);
    }

    // Test 2: Label
    {
        auto result = info.get_window_label();
        log_test("DisplayInfo::get_window_label", result.is_ok(),
                 result.is_ok() ? "\"" + result.unwrap() + "\"" : result.error().message);

        // Test 3: Rename and restore
        if (result.is_ok() && !connection->targets_root()) {
            const std::string original = result.unwrap();
            auto set = info.set_window_label(original + " [localhost:0]");
            auto read_back = info.get_window_label();
            bool ok = set.is_ok() && read_back.is_ok() &&
                      read_back.unwrap() == original + " [localhost:0]";
            info.set_window_label(original);
            log_test("DisplayInfo::set_window_label", ok);
        }
    }

    return geometry;
}

// ============================================================================
// Test: FrameProvider
// ============================================================================

void test_frame_provider(const std::shared_ptr<LinuxX11Connection>& connection,
                         const common::DisplayGeometry& geometry) {
    std::cout << "\n=== Testing FrameProvider ===" << std::endl;

    if (!geometry.is_known()) {
        log_skip("FrameProvider::capture_frame", "no geometry");
        return;
    }

    LinuxX11FrameProvider provider(connection);

    // Test 1: Full-size capture
    {
        auto start = std::chrono::high_resolution_clock::now();
        auto result = provider.capture_frame(geometry.width, geometry.height);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        bool ok = result.is_ok() &&
                  result.unwrap().pixels.size() == static_cast<size_t>(geometry.width) * geometry.height * 4 &&
                  result.unwrap().pixels[3] == 0xFF;
        log_test("FrameProvider::capture_frame(native size)", ok,
                 result.is_ok() ? std::to_string(result.unwrap().pixels.size()) + " bytes"
                                : result.error().message, ms);
    }

    // Test 2: Downscaled capture
    {
        auto result = provider.capture_frame(geometry.width / 2 + 1, geometry.height / 2 + 1);
        bool ok = result.is_ok() && result.unwrap().width == geometry.width / 2 + 1;
        log_test("FrameProvider::capture_frame(half size)", ok,
                 result.is_ok() ? "" : result.error().message);
    }
}

// ============================================================================
// Test: InputInjector
// ============================================================================

void test_input_injector(const std::shared_ptr<LinuxX11Connection>& connection,
                         const common::DisplayGeometry& geometry) {
    std::cout << "\n=== Testing InputInjector ===" << std::endl;

    LinuxXTestInjector injector(connection);
    if (!injector.is_available()) {
        log_test("XTestInjector::init", false, "XTest extension not available");
        return;
    }

    // A short drag near the bottom-right corner
    const int x = geometry.is_known() ? static_cast<int>(geometry.width) - 20 : 10;
    const int y = geometry.is_known() ? static_cast<int>(geometry.height) - 20 : 10;

    std::optional<int> touch_id;
    auto start = std::chrono::high_resolution_clock::now();

    auto down = injector.inject_touch(x, y, interfaces::TouchPhase::Began, touch_id);
    bool has_id = touch_id.has_value();
    std::this_thread::sleep_for(20ms);
    auto move = injector.inject_touch(x - 5, y - 5, interfaces::TouchPhase::Moved, touch_id);
    std::this_thread::sleep_for(20ms);
    auto up = injector.inject_touch(x - 5, y - 5, interfaces::TouchPhase::Ended, touch_id);

    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(end - start).count();

    log_test("XTestInjector::inject_touch(drag)",
             down.is_ok() && move.is_ok() && up.is_ok() && has_id,
             "Drag near bottom-right corner", ms);
}

// ============================================================================
// Test: PlatformFactory
// ============================================================================

void test_platform_factory(const std::string& window) {
    std::cout << "\n=== Testing PlatformFactory ===" << std::endl;

    LinuxPlatformFactory factory(window, 1.0);
    bool ok = factory.is_fully_supported() &&
              factory.create_display_info() != nullptr &&
              factory.create_frame_provider() != nullptr &&
              factory.create_lifecycle_controller() != nullptr;
    log_test("LinuxPlatformFactory::create_*", ok, factory.platform_name());
}

// ============================================================================
// Main Test Runner
// ============================================================================

void print_summary() {
    std::cout << "\n" << std::string(60, '=') << std::endl;
    std::cout << "TEST SUMMARY" << std::endl;
    std::cout << std::string(60, '=') << std::endl;

    int passed = 0, failed = 0;
    for (const auto& r : g_results) {
        if (r.passed) passed++;
        else failed++;
    }

    std::cout << "Passed: " << passed << std::endl;
    std::cout << "Failed: " << failed << std::endl;
    std::cout << "Total:  " << g_results.size() << std::endl;

    if (failed > 0) {
        std::cout << "\nFailed tests:" << std::endl;
        for (const auto& r : g_results) {
            if (!r.passed) {
                std::cout << "  - " << r.name << ": " << r.details << std::endl;
            }
        }
    }

    std::cout << std::string(60, '=') << std::endl;
}

int main(int argc, char** argv) {
    std::cout << "Linux Platform HAL Test Suite" << std::endl;
    std::cout << "==============================" << std::endl;
    std::cout << "Some tests will move the mouse and click!" << std::endl;
    std::cout << std::endl;

    // Check DISPLAY environment
    const char* display = std::getenv("DISPLAY");
    if (!display || !*display) {
        log_skip("Linux platform", "DISPLAY not set");
        return 0;
    }

    const std::string window = argc > 1 ? argv[1] : "";
    auto connection = std::make_shared<LinuxX11Connection>(window);
    if (!connection->is_open()) {
        log_skip("Linux platform", std::string("cannot open display ") + display);
        return 0;
    }

    // Run all tests
    auto geometry = test_display_info(connection);
    test_frame_provider(connection, geometry);
    test_input_injector(connection, geometry);
    test_platform_factory(window);

    // Print summary
    print_summary();

    for (const auto& r : g_results) {
        if (!r.passed) return 1;
    }
    return 0;
}

#else
// Non-Linux stub
#include <iostream>
int main() {
    std::cout << "[SKIP] This test is only for Linux platform." << std::endl;
    return 0;
}
#endif
