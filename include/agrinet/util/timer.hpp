#pragma once

#include "../core/types.hpp"

namespace agrinet {
    namespace util {

        // ─── Periodic timer driven by update(elapsed) ───────────────────────────────
        class Timer {
            u32 interval_ms_ = 0;
            u32 elapsed_ms_ = 0;
            bool running_ = false;

          public:
            Timer() = default;
            explicit Timer(u32 interval_ms) : interval_ms_(interval_ms) {}

            void set_interval(u32 ms) noexcept { interval_ms_ = ms; }
            u32 interval() const noexcept { return interval_ms_; }

            void start() noexcept {
                running_ = true;
                elapsed_ms_ = 0;
            }
            void stop() noexcept { running_ = false; }
            bool running() const noexcept { return running_; }

            // Number of whole periods that elapsed during this update
            u32 update(u32 delta_ms) noexcept {
                if (!running_ || interval_ms_ == 0)
                    return 0;
                elapsed_ms_ += delta_ms;
                u32 fired = elapsed_ms_ / interval_ms_;
                elapsed_ms_ %= interval_ms_;
                return fired;
            }
        };

        // ─── One-shot timeout ─────────────────────────────────────────────────────────
        class Timeout {
            u32 timeout_ms_ = 0;
            u32 elapsed_ms_ = 0;
            bool active_ = false;

          public:
            Timeout() = default;
            explicit Timeout(u32 timeout_ms) : timeout_ms_(timeout_ms) {}

            void start(u32 timeout_ms) noexcept {
                timeout_ms_ = timeout_ms;
                start();
            }

            void start() noexcept {
                elapsed_ms_ = 0;
                active_ = true;
            }

            // Restart the countdown without changing the limit
            void touch() noexcept { elapsed_ms_ = 0; }

            void cancel() noexcept { active_ = false; }

            // Returns true exactly once, on the update that crosses the limit
            bool update(u32 delta_ms) noexcept {
                if (!active_)
                    return false;
                elapsed_ms_ += delta_ms;
                if (elapsed_ms_ >= timeout_ms_) {
                    active_ = false;
                    return true;
                }
                return false;
            }

            bool active() const noexcept { return active_; }
            u32 elapsed() const noexcept { return elapsed_ms_; }
            u32 remaining() const noexcept { return elapsed_ms_ >= timeout_ms_ ? 0 : timeout_ms_ - elapsed_ms_; }
        };

    } // namespace util
    using namespace util;
} // namespace agrinet
