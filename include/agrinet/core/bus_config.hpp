#pragma once

#include "constants.hpp"
#include "error.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace agrinet {

    inline constexpr bool is_supported_bitrate(u32 bitrate) noexcept {
        return bitrate == BITRATE_125K || bitrate == BITRATE_250K || bitrate == BITRATE_500K || bitrate == BITRATE_1M;
    }

    // ─── Simulated bus configuration ─────────────────────────────────────────────
    struct BusConfig {
        u32 bitrate = BITRATE_250K;
        usize tx_queue_capacity = DEFAULT_TX_QUEUE_CAPACITY;
        usize rx_queue_capacity = DEFAULT_RX_QUEUE_CAPACITY;
        u32 load_sample_period_ms = LOAD_SAMPLE_PERIOD_MS;
        bool loopback = false; // deliver a node's own frames back to it

        // Fluent API
        BusConfig &set_bitrate(u32 br) {
            bitrate = br;
            return *this;
        }
        BusConfig &tx_capacity(usize n) {
            tx_queue_capacity = n;
            return *this;
        }
        BusConfig &rx_capacity(usize n) {
            rx_queue_capacity = n;
            return *this;
        }
        BusConfig &sample_period(u32 ms) {
            load_sample_period_ms = ms;
            return *this;
        }
        BusConfig &set_loopback(bool l) {
            loopback = l;
            return *this;
        }
    };

    inline Result<void> validate_bus_config(const BusConfig &config) {
        dp::String problem;
        if (!is_supported_bitrate(config.bitrate)) {
            problem = "unsupported bitrate " + dp::String(std::to_string(config.bitrate));
        } else if (config.tx_queue_capacity == 0 || config.rx_queue_capacity == 0) {
            problem = "queue capacity must be non-zero";
        } else if (config.load_sample_period_ms == 0) {
            problem = "load sample period must be non-zero";
        }

        if (!problem.empty()) {
            echo::category("agrinet.bus").warn("bus config rejected: ", problem);
            return Result<void>::err(Error::invalid_config(problem));
        }
        return {};
    }

} // namespace agrinet
