#pragma once

#include "../core/types.hpp"

namespace agrinet {
    namespace util {

        // ─── CRC-15 (CAN polynomial x^15+x^14+x^10+x^8+x^7+x^4+x^3+1) ─────────────
        // Computed bytewise, MSB first. Only used as an integrity tag; it is not
        // the bit-stuffed field a CAN controller would put on the wire.
        inline constexpr u16 CRC15_POLY = 0x4599;

        class Crc15 {
            u16 crc_ = 0;

          public:
            constexpr void add(u8 byte) noexcept {
                for (i32 bit = 7; bit >= 0; --bit) {
                    bool in = ((byte >> bit) & 0x01) != 0;
                    bool top = ((crc_ >> 14) & 0x01) != 0;
                    crc_ = static_cast<u16>((crc_ << 1) & 0x7FFF);
                    if (in != top) {
                        crc_ ^= CRC15_POLY;
                    }
                }
            }

            constexpr void add_u32_le(u32 value) noexcept {
                for (u32 i = 0; i < 4; ++i) {
                    add(static_cast<u8>((value >> (i * 8)) & 0xFF));
                }
            }

            constexpr u16 value() const noexcept { return crc_; }
        };

        inline constexpr u16 crc15(const u8 *data, usize len) noexcept {
            Crc15 crc;
            for (usize i = 0; i < len; ++i) {
                crc.add(data[i]);
            }
            return crc.value();
        }

    } // namespace util
    using namespace util;
} // namespace agrinet
