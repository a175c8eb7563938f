#pragma once
#include "interfaces/INetworkSocket.hpp"
#include <algorithm>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace testing {

    // In-memory socket. Reads drain `input`; once it is empty the peer
    // either hangs up (EOF) or, with hold_open, stays silent forever.
    class MockSocket : public core::network::INetworkSocket {
    public:
        explicit MockSocket(std::vector<uint8_t> input = {}, bool hold_open = false)
            : input_(std::move(input)), hold_open_(hold_open) {}

        bool set_non_blocking(bool) override { return true; }
        bool set_no_delay(bool) override { return true; }

        std::pair<size_t, core::network::SocketError> send(const uint8_t* data, size_t size) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || fail_writes_) return {0, core::network::SocketError::Disconnected};
            size_t n = std::min(size, max_chunk_);
            output_.insert(output_.end(), data, data + n);
            return {n, core::network::SocketError::Ok};
        }

        std::pair<size_t, core::network::SocketError> recv(uint8_t* buffer, size_t max_size) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return {0, core::network::SocketError::Fatal};
            if (read_pos_ >= input_.size()) {
                if (hold_open_) return {0, core::network::SocketError::WouldBlock};
                return {0, core::network::SocketError::Disconnected};
            }
            size_t n = std::min({max_size, max_chunk_, input_.size() - read_pos_});
            std::copy(input_.begin() + read_pos_, input_.begin() + read_pos_ + n, buffer);
            read_pos_ += n;
            return {n, core::network::SocketError::Ok};
        }

        core::network::WaitResult wait_readable(int timeout_ms) override {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) return core::network::WaitResult::Failed;
                if (read_pos_ < input_.size() || !hold_open_) return core::network::WaitResult::Ready;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
            return core::network::WaitResult::Timeout;
        }

        core::network::WaitResult wait_writable(int) override {
            return core::network::WaitResult::Ready;
        }

        void close_socket() override {
            std::lock_guard<std::mutex> lock(mutex_);
            ++close_count_;
            closed_ = true;
        }

        bool is_valid() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return !closed_;
        }

        // Test helpers
        std::vector<uint8_t> output() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return output_;
        }

        // Number of close_socket() calls, repeated ones included
        int close_count() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return close_count_;
        }

        size_t bytes_consumed() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return read_pos_;
        }

        // Deliver at most `n` bytes per recv/send call
        void set_max_chunk(size_t n) {
            std::lock_guard<std::mutex> lock(mutex_);
            max_chunk_ = n == 0 ? 1 : n;
        }

        void set_fail_writes(bool fail) {
            std::lock_guard<std::mutex> lock(mutex_);
            fail_writes_ = fail;
        }

    private:
        mutable std::mutex mutex_;
        std::vector<uint8_t> input_;
        std::vector<uint8_t> output_;
        size_t read_pos_ = 0;
        size_t max_chunk_ = static_cast<size_t>(-1);
        bool hold_open_;
        bool closed_ = false;
        bool fail_writes_ = false;
        int close_count_ = 0;
    };

} // namespace testing
