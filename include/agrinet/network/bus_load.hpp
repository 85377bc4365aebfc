#pragma once

#include "../core/constants.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace agrinet {
    namespace network {

        // ─── Frame size on the wire (bits) ───────────────────────────────────────────
        // Standard: SOF(1) + ID(11) + RTR(1) + IDE(1) + r0(1) + DLC(4) + CRC(15) +
        //           CRC_del(1) + ACK(2) + EOF(7) + IFS(3) = 47 + data
        // Extended adds SRR(1) + IDE(1) + ID ext(18) + r1(1) - IDE(1) = 67 + data
        // Both plus ~20% stuff bits.
        inline constexpr u32 frame_bits(u8 dlc, bool extended) noexcept {
            u32 bits = (extended ? 67u : 47u) + static_cast<u32>(dlc) * 8u;
            return bits * 120u / 100u;
        }

        // ─── Sliding-window bus utilisation ──────────────────────────────────────────
        class BusLoad {
            static constexpr usize WINDOW_SIZE = 50;

            dp::Array<u32, WINDOW_SIZE> bit_counts_ = {};
            dp::Array<u32, WINDOW_SIZE> frame_counts_ = {};
            usize write_idx_ = 0;
            u32 current_bits_ = 0;
            u32 current_frames_ = 0;
            u32 timer_ms_ = 0;
            bool filled_ = false;
            u32 bitrate_ = BITRATE_250K;
            u32 sample_period_ms_ = LOAD_SAMPLE_PERIOD_MS;

          public:
            BusLoad() = default;
            BusLoad(u32 bitrate, u32 sample_period_ms) : bitrate_(bitrate), sample_period_ms_(sample_period_ms) {}

            void set_bitrate(u32 bitrate) noexcept { bitrate_ = bitrate; }
            u32 bitrate() const noexcept { return bitrate_; }

            void add_frame(u8 dlc, bool extended) noexcept {
                current_bits_ += frame_bits(dlc, extended);
                ++current_frames_;
            }

            void update(u32 elapsed_ms) noexcept {
                if (sample_period_ms_ == 0)
                    return;
                timer_ms_ += elapsed_ms;
                while (timer_ms_ >= sample_period_ms_) {
                    timer_ms_ -= sample_period_ms_;
                    bit_counts_[write_idx_] = current_bits_;
                    frame_counts_[write_idx_] = current_frames_;
                    write_idx_ = (write_idx_ + 1) % WINDOW_SIZE;
                    if (write_idx_ == 0)
                        filled_ = true;
                    current_bits_ = 0;
                    current_frames_ = 0;
                }
            }

            // Fraction of the bitrate used over the window, 0.0 .. 1.0
            f64 load() const noexcept {
                f64 seconds = window_seconds();
                if (seconds <= 0.0 || bitrate_ == 0)
                    return 0.0;
                f64 fraction = static_cast<f64>(sum(bit_counts_)) / seconds / static_cast<f64>(bitrate_);
                return fraction > 1.0 ? 1.0 : fraction;
            }

            f64 frames_per_second() const noexcept {
                f64 seconds = window_seconds();
                if (seconds <= 0.0)
                    return 0.0;
                return static_cast<f64>(sum(frame_counts_)) / seconds;
            }

            void reset() noexcept {
                bit_counts_ = {};
                frame_counts_ = {};
                write_idx_ = 0;
                current_bits_ = 0;
                current_frames_ = 0;
                timer_ms_ = 0;
                filled_ = false;
            }

          private:
            usize samples() const noexcept { return filled_ ? WINDOW_SIZE : write_idx_; }

            f64 window_seconds() const noexcept {
                return static_cast<f64>(samples()) * static_cast<f64>(sample_period_ms_) / 1000.0;
            }

            u64 sum(const dp::Array<u32, WINDOW_SIZE> &counts) const noexcept {
                u64 total = 0;
                for (usize i = 0; i < samples(); ++i) {
                    total += counts[i];
                }
                return total;
            }
        };

    } // namespace network
    using namespace network;
} // namespace agrinet
