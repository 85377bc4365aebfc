#pragma once

#include "../pgn_defs.hpp"
#include "types.hpp"

namespace agrinet {

    // ─── Identifier widths ───────────────────────────────────────────────────────
    inline constexpr u32 STANDARD_ID_MAX = 0x7FF;
    inline constexpr u32 EXTENDED_ID_MAX = 0x1FFFFFFF;

    // ─── Application addresses ───────────────────────────────────────────────────
    inline constexpr Address NULL_ADDRESS = 0xFE;
    inline constexpr Address BROADCAST_ADDRESS = 0xFF;
    inline constexpr Address MAX_ADDRESS = 0xFD;

    // ─── Supported bus bitrates (bit/s) ──────────────────────────────────────────
    inline constexpr u32 BITRATE_125K = 125000;
    inline constexpr u32 BITRATE_250K = 250000;
    inline constexpr u32 BITRATE_500K = 500000;
    inline constexpr u32 BITRATE_1M = 1000000;

    // ─── Frame limits ────────────────────────────────────────────────────────────
    inline constexpr u32 CAN_DATA_LENGTH = 8;
    inline constexpr usize WIRE_HEADER_SIZE = 6; // flags + 4 byte id + dlc
    inline constexpr usize WIRE_TAG_SIZE = 2;

    // ─── Queue defaults ──────────────────────────────────────────────────────────
    inline constexpr usize DEFAULT_TX_QUEUE_CAPACITY = 64;
    inline constexpr usize DEFAULT_RX_QUEUE_CAPACITY = 128;

    // ─── Identifier layout of the domain ranges ─────────────────────────────────
    inline constexpr u32 SENSOR_ID_BASE = 0x100;
    inline constexpr u32 ACTUATOR_ID_BASE = 0x200;

    // ─── Timing defaults (ms) ────────────────────────────────────────────────────
    inline constexpr u32 LOAD_SAMPLE_PERIOD_MS = 100;
    inline constexpr u32 LIVENESS_WINDOW_MS = 3000;
    inline constexpr u32 ALIVE_INTERVAL_MS = 1000;
    inline constexpr u32 ADDRESS_HOLD_MS = 5000;
    inline constexpr u32 REQUEST_TIMEOUT_MS = 1000;

} // namespace agrinet
