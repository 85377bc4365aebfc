#pragma once

#include "core/types.hpp"

namespace agrinet {

    // ═════════════════════════════════════════════════════════════════════════════
    // APPLICATION PROTOCOL PGNs
    //
    // All are PDU1 (PF < 240), so the PS byte of the identifier always carries the
    // destination address and 0xFF addresses every device.
    // ═════════════════════════════════════════════════════════════════════════════

    // ─── Connection management ───────────────────────────────────────────────────
    inline constexpr PGN PGN_CONNECTION = 0xD000;

    // ─── Acknowledgment of actuator commands ─────────────────────────────────────
    inline constexpr PGN PGN_ACKNOWLEDGMENT = 0xE800;

    // ─── Task controller <-> implement ───────────────────────────────────────────
    inline constexpr PGN PGN_TASK_TO_IMPLEMENT = 0xCB00;
    inline constexpr PGN PGN_IMPLEMENT_TO_TASK = 0xCC00;

    // ─── Operator interface (virtual terminal) ───────────────────────────────────
    inline constexpr PGN PGN_TERMINAL_TO_ECU = 0xE600;
    inline constexpr PGN PGN_ECU_TO_TERMINAL = 0xE700;

} // namespace agrinet
