#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace common {

    // The Token (View) - Passed to workers
    class CancellationToken {
        struct State {
            std::atomic<bool> requested{false};
            std::mutex mutex;
            std::condition_variable cv;
        };
        std::shared_ptr<State> state;

    public:
        CancellationToken() : state(std::make_shared<State>()) {}

        // Check with ACQUIRE memory order (sees writes from owner)
        bool is_cancellation_requested() const {
            return state && state->requested.load(std::memory_order_acquire);
        }

        // Sleeps for `timeout` or until cancelled, whichever comes first.
        // Returns true if cancellation was requested.
        template <typename Rep, typename Period>
        bool wait_for(std::chrono::duration<Rep, Period> timeout) const {
            if (!state) return false;
            std::unique_lock<std::mutex> lock(state->mutex);
            return state->cv.wait_for(lock, timeout, [this]() {
                return state->requested.load(std::memory_order_acquire);
            });
        }

        friend class CancellationSource;
    };

    // The Source (Owner) - Held by controller
    class CancellationSource {
        CancellationToken token;

    public:
        CancellationSource() {
            // Token wraps the shared state created in its constructor
        }

        // Set with RELEASE memory order (flushes prior writes)
        void cancel() {
            if (token.state) {
                {
                    std::lock_guard<std::mutex> lock(token.state->mutex);
                    token.state->requested.store(true, std::memory_order_release);
                }
                token.state->cv.notify_all();
            }
        }

        bool is_cancelled() const { return token.is_cancellation_requested(); }

        CancellationToken get_token() const { return token; }

        void reset() {
            token = CancellationToken(); // Create fresh state
        }
    };

} // namespace common
