/**
 * @file cancel_token.hpp
 * @brief Cooperative cancellation flag and a sleep that honours it.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <thread>

namespace freeprobe {
namespace core {

/**
 * @class CancelToken
 * @brief Set once, observed by long-running loops.
 *
 * cancel() only stores to a lock-free atomic and may be called from a
 * signal handler.
 */
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};

using SleepFunction = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Sleep in short slices, returning early once `token` is cancelled.
 */
inline SleepFunction makeCancellableSleep(const CancelToken& token) {
    return [&token](std::chrono::milliseconds duration) {
        const auto slice = std::chrono::milliseconds(100);
        auto deadline = std::chrono::steady_clock::now() + duration;
        while (!token.isCancelled()) {
            auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                break;
            }
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(slice, left));
        }
    };
}

}  // namespace core
}  // namespace freeprobe
