#pragma once

#include "constants.hpp"
#include "types.hpp"

namespace agrinet {

    // ─── Bus identifier (11-bit standard or 29-bit extended) ─────────────────────
    // The raw value is stored unmasked so that an out-of-width value can be
    // rejected by Frame::encode instead of silently truncated.
    //
    // Extended identifiers carried by the application protocol use the layout
    //   [Priority:3][Reserved:1][DataPage:1][PDU Format:8][PDU Specific:8][Source:8]
    struct Identifier {
        u32 raw = 0;
        IdFormat format = IdFormat::Standard;

        constexpr Identifier() = default;
        constexpr Identifier(u32 id, IdFormat fmt) : raw(id), format(fmt) {}

        static constexpr Identifier standard(u32 id) noexcept { return Identifier(id, IdFormat::Standard); }
        static constexpr Identifier extended(u32 id) noexcept { return Identifier(id, IdFormat::Extended); }

        constexpr bool is_extended() const noexcept { return format == IdFormat::Extended; }

        constexpr u32 max_value() const noexcept { return is_extended() ? EXTENDED_ID_MAX : STANDARD_ID_MAX; }

        constexpr bool valid() const noexcept { return raw <= max_value(); }

        // CAN arbitration order: the 11 base bits decide first, a standard frame
        // beats an extended one with the same base bits (recessive IDE), then the
        // 18 extension bits. Lower key wins.
        constexpr u32 arbitration_key() const noexcept {
            if (!is_extended()) {
                return (raw & STANDARD_ID_MAX) << 19;
            }
            u32 base = (raw >> 18) & STANDARD_ID_MAX;
            return (base << 19) | (1u << 18) | (raw & 0x3FFFF);
        }

        // ─── Extended layout accessors ───────────────────────────────────────────
        constexpr Priority priority() const noexcept { return static_cast<Priority>((raw >> 26) & 0x07); }

        constexpr u8 pdu_format() const noexcept { return static_cast<u8>((raw >> 16) & 0xFF); }

        constexpr u8 pdu_specific() const noexcept { return static_cast<u8>((raw >> 8) & 0xFF); }

        constexpr Address source() const noexcept { return static_cast<Address>(raw & 0xFF); }

        constexpr bool is_pdu2() const noexcept { return pdu_format() >= 240; }

        constexpr PGN pgn() const noexcept {
            u32 page = (raw >> 24) & 0x03;
            if (is_pdu2()) {
                return (page << 16) | (static_cast<u32>(pdu_format()) << 8) | pdu_specific();
            }
            return (page << 16) | (static_cast<u32>(pdu_format()) << 8);
        }

        constexpr Address destination() const noexcept { return is_pdu2() ? BROADCAST_ADDRESS : pdu_specific(); }

        static constexpr Identifier encode(Priority prio, PGN pgn, Address src,
                                           Address dst = BROADCAST_ADDRESS) noexcept {
            u32 id = (static_cast<u32>(prio) & 0x07) << 26;
            id |= ((pgn >> 16) & 0x03) << 24;
            u8 pf = static_cast<u8>((pgn >> 8) & 0xFF);
            id |= static_cast<u32>(pf) << 16;
            if (pf < 240) {
                id |= static_cast<u32>(dst) << 8;
            } else {
                id |= (pgn & 0xFF) << 8;
            }
            id |= static_cast<u32>(src);
            return Identifier::extended(id);
        }

        constexpr bool operator==(const Identifier &other) const noexcept {
            return raw == other.raw && format == other.format;
        }
        constexpr bool operator!=(const Identifier &other) const noexcept { return !(*this == other); }
    };

} // namespace agrinet
