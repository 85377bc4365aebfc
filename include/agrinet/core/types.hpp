#pragma once

#include <datapod/datapod.hpp>

namespace agrinet {

    // ─── Numeric type aliases ────────────────────────────────────────────────────
    using dp::f32;
    using dp::f64;
    using dp::i16;
    using dp::i32;
    using dp::i64;
    using dp::i8;
    using dp::isize;
    using dp::u16;
    using dp::u32;
    using dp::u64;
    using dp::u8;
    using dp::usize;

    // ─── Domain-specific types ───────────────────────────────────────────────────
    using Address = u8;
    using PGN = u32;
    using DDI = u16;
    using TaskId = u8;
    using NodeHandle = u32;
    using RequestId = u32;

    // ─── Identifier width discriminant ───────────────────────────────────────────
    enum class IdFormat : u8 { Standard = 0, Extended = 1 };

    // ─── Frame direction relative to the node holding it ─────────────────────────
    enum class Direction : u8 { Outbound, Inbound };

    // ─── Priority (3-bit field of an extended identifier) ───────────────────────
    enum class Priority : u8 {
        Highest = 0,
        High = 1,
        AboveNormal = 2,
        Normal = 3,
        BelowNormal = 4,
        Low = 5,
        Default = 6,
        Lowest = 7
    };

} // namespace agrinet
