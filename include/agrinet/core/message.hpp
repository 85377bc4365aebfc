#pragma once

#include "constants.hpp"
#include "frame.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>

namespace agrinet {

    // ─── Application message (one extended frame seen through its J1939 fields) ──
    struct Message {
        PGN pgn = 0;
        dp::Vector<u8> data;
        Address source = NULL_ADDRESS;
        Address destination = BROADCAST_ADDRESS;
        Priority priority = Priority::Default;
        u64 timestamp_us = 0;

        Message() = default;

        Message(PGN p, dp::Vector<u8> d, Address src, Address dst = BROADCAST_ADDRESS,
                Priority prio = Priority::Default)
            : pgn(p), data(std::move(d)), source(src), destination(dst), priority(prio) {}

        static Message from_frame(const Frame &frame) {
            Message msg;
            msg.pgn = frame.pgn();
            msg.source = frame.source();
            msg.destination = frame.destination();
            msg.priority = frame.priority();
            msg.timestamp_us = frame.timestamp_us;
            msg.data = frame.payload();
            return msg;
        }

        // ─── Data extraction helpers ─────────────────────────────────────────────
        u8 get_u8(usize offset) const noexcept {
            if (offset >= data.size())
                return 0xFF;
            return data[offset];
        }

        u16 get_u16_le(usize offset) const noexcept {
            if (offset + 1 >= data.size())
                return 0xFFFF;
            return static_cast<u16>(data[offset]) | (static_cast<u16>(data[offset + 1]) << 8);
        }

        u32 get_u32_le(usize offset) const noexcept {
            if (offset + 3 >= data.size())
                return 0xFFFFFFFF;
            return static_cast<u32>(data[offset]) | (static_cast<u32>(data[offset + 1]) << 8) |
                   (static_cast<u32>(data[offset + 2]) << 16) | (static_cast<u32>(data[offset + 3]) << 24);
        }

        i32 get_i32_le(usize offset) const noexcept { return static_cast<i32>(get_u32_le(offset)); }

        bool is_broadcast() const noexcept { return destination == BROADCAST_ADDRESS; }

        usize size() const noexcept { return data.size(); }

        // ─── Data setter helpers ─────────────────────────────────────────────────
        void set_u8(usize offset, u8 val) {
            if (offset >= data.size())
                data.resize(offset + 1, 0xFF);
            data[offset] = val;
        }

        void set_u16_le(usize offset, u16 val) {
            if (offset + 1 >= data.size())
                data.resize(offset + 2, 0xFF);
            data[offset] = static_cast<u8>(val & 0xFF);
            data[offset + 1] = static_cast<u8>((val >> 8) & 0xFF);
        }

        void set_i32_le(usize offset, i32 val) {
            if (offset + 3 >= data.size())
                data.resize(offset + 4, 0xFF);
            u32 raw = static_cast<u32>(val);
            for (usize i = 0; i < 4; ++i) {
                data[offset + i] = static_cast<u8>((raw >> (i * 8)) & 0xFF);
            }
        }

        Result<Frame> to_frame() const { return Frame::from_message(priority, pgn, source, destination, data); }
    };

} // namespace agrinet
