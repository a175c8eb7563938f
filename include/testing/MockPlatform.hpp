#pragma once
#include "interfaces/IPlatformFactory.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace testing {

    // Reports no display until `ready_after` queries have been made
    class MockDisplayInfo : public interfaces::IDisplayInfo {
    public:
        MockDisplayInfo(common::DisplayGeometry geometry, std::string label, int ready_after = 0)
            : geometry_(geometry), label_(std::move(label)), ready_after_(ready_after) {}

        common::Result<common::DisplayGeometry> get_display_geometry() override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queries_++ < ready_after_) {
                return common::Result<common::DisplayGeometry>::err(common::ErrorCode::Unavailable, "No window yet");
            }
            return common::Result<common::DisplayGeometry>::ok(geometry_);
        }

        common::Result<std::string> get_window_label() override {
            std::lock_guard<std::mutex> lock(mutex_);
            return common::Result<std::string>::ok(label_);
        }

        common::EmptyResult set_window_label(const std::string& label) override {
            std::lock_guard<std::mutex> lock(mutex_);
            label_ = label;
            return common::EmptyResult::success();
        }

        std::string label() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return label_;
        }

        int queries() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return queries_;
        }

    private:
        mutable std::mutex mutex_;
        common::DisplayGeometry geometry_;
        std::string label_;
        int ready_after_;
        int queries_ = 0;
    };

    // Solid gray frames of the requested size, optionally slow or absent
    class MockFrameProvider : public interfaces::IFrameProvider {
    public:
        common::Result<common::RawFrame> capture_frame(uint32_t width, uint32_t height) override {
            auto delay = std::chrono::milliseconds(delay_ms.load());
            if (delay.count() > 0) std::this_thread::sleep_for(delay);

            if (!available.load()) {
                return common::Result<common::RawFrame>::err(common::ErrorCode::Unavailable, "No image");
            }

            common::RawFrame frame;
            frame.width = width;
            frame.height = height;
            frame.stride = width * 4;
            frame.pixels.resize(static_cast<size_t>(width) * height * 4, 0x80);
            return common::Result<common::RawFrame>::ok(std::move(frame));
        }

        std::atomic<bool> available{true};
        std::atomic<int> delay_ms{0};
    };

    class MockInputInjector : public interfaces::IInputInjector {
    public:
        struct TouchEvent {
            int x;
            int y;
            interfaces::TouchPhase phase;
            int touch_id;
        };

        common::EmptyResult inject_touch(int x, int y, interfaces::TouchPhase phase,
                                         std::optional<int>& touch_id) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!touch_id) touch_id = next_id_++;
            events_.push_back(TouchEvent{x, y, phase, *touch_id});
            return common::EmptyResult::success();
        }

        std::vector<TouchEvent> events() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return events_;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<TouchEvent> events_;
        int next_id_ = 1;
    };

    class MockLifecycleController : public interfaces::ILifecycleController {
    public:
        common::EmptyResult terminate_application() override {
            ++terminations;
            return common::EmptyResult::success();
        }

        std::atomic<int> terminations{0};
    };

    class MockPlatformFactory : public interfaces::IPlatformFactory {
    public:
        explicit MockPlatformFactory(common::DisplayGeometry geometry = {1280, 720, 1.0},
                                     std::string label = "Mock Window")
            : display_(std::make_shared<MockDisplayInfo>(geometry, std::move(label))),
              frames_(std::make_shared<MockFrameProvider>()),
              injector_(std::make_shared<MockInputInjector>()),
              lifecycle_(std::make_shared<MockLifecycleController>()) {}

        std::shared_ptr<interfaces::IDisplayInfo> create_display_info() override { return display_; }
        std::shared_ptr<interfaces::IFrameProvider> create_frame_provider() override { return frames_; }
        std::shared_ptr<interfaces::IInputInjector> create_input_injector() override { return injector_; }
        std::shared_ptr<interfaces::ILifecycleController> create_lifecycle_controller() override { return lifecycle_; }

        const char* platform_name() const noexcept override { return "Mock"; }

        std::shared_ptr<MockDisplayInfo> display() const { return display_; }
        std::shared_ptr<MockFrameProvider> frames() const { return frames_; }
        std::shared_ptr<MockInputInjector> injector() const { return injector_; }
        std::shared_ptr<MockLifecycleController> lifecycle() const { return lifecycle_; }

    private:
        std::shared_ptr<MockDisplayInfo> display_;
        std::shared_ptr<MockFrameProvider> frames_;
        std::shared_ptr<MockInputInjector> injector_;
        std::shared_ptr<MockLifecycleController> lifecycle_;
    };

} // namespace testing
