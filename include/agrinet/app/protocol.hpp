#pragma once

#include "../core/message.hpp"
#include "../core/types.hpp"
#include "../pgn_defs.hpp"
#include <datapod/datapod.hpp>

namespace agrinet::app {

    // ─── Connection management (PGN_CONNECTION) ──────────────────────────────────
    namespace conn_cmd {
        inline constexpr u8 ANNOUNCE = 0x01;    // [cmd, role, caps lo, caps hi]
        inline constexpr u8 CONNECT_ACK = 0x02; // [cmd, result]
        inline constexpr u8 DISCONNECT = 0x03;  // [cmd, reason]
        inline constexpr u8 ALIVE = 0x04;       // [cmd, sequence]
    } // namespace conn_cmd

    // ─── Controller -> implement (PGN_TASK_TO_IMPLEMENT) ─────────────────────────
    namespace task_cmd {
        inline constexpr u8 REQUEST_VALUE = 0x04; // [cmd, task, ddi:2]
        inline constexpr u8 TASK_START = 0x10;    // [cmd, task, parameter count]
        inline constexpr u8 PARAM_DEFINE = 0x11;  // [cmd, task, ddi:2, raw:4]
        inline constexpr u8 TASK_PAUSE = 0x12;    // [cmd, task]
        inline constexpr u8 TASK_RESUME = 0x13;
        inline constexpr u8 TASK_COMPLETE = 0x14;
        inline constexpr u8 TASK_ABORT = 0x15;
        inline constexpr u8 SET_VALUE = 0x24; // [cmd, task, ddi:2, raw:4]
    } // namespace task_cmd

    // ─── Implement -> controller (PGN_IMPLEMENT_TO_TASK) ─────────────────────────
    namespace impl_cmd {
        inline constexpr u8 VALUE_RESPONSE = 0x05; // [cmd, task, ddi:2, raw:4]
        inline constexpr u8 TASK_ACK = 0x20;       // [cmd, task, result]
        inline constexpr u8 TASK_STATUS = 0x21;    // [cmd, task, status]
        inline constexpr u8 VALUE_ACK = 0x25;      // [cmd, task, ddi:2, raw:4]
        inline constexpr u8 VALUE_NACK = 0x26;     // [cmd, task, ddi:2, reason]
    } // namespace impl_cmd

    // ─── Implement task status values ────────────────────────────────────────────
    enum class TaskStatus : u8 { Running = 1, Finished = 2, Fault = 3 };

    // ─── Result byte of acknowledgments ──────────────────────────────────────────
    inline constexpr u8 ACK_OK = 0x00;
    inline constexpr u8 ACK_REJECTED = 0x01;

    // ─── Payload builders ────────────────────────────────────────────────────────
    inline dp::Vector<u8> make_announce(u8 role, u16 capabilities) {
        return {conn_cmd::ANNOUNCE, role, static_cast<u8>(capabilities & 0xFF),
                static_cast<u8>((capabilities >> 8) & 0xFF)};
    }

    inline dp::Vector<u8> make_command(u8 cmd, u8 arg) { return {cmd, arg}; }

    inline dp::Vector<u8> make_value_command(u8 cmd, TaskId task, DDI ddi, i32 raw) {
        Message m;
        m.set_u8(0, cmd);
        m.set_u8(1, task);
        m.set_u16_le(2, ddi);
        m.set_i32_le(4, raw);
        return m.data;
    }

    inline dp::Vector<u8> make_value_request(TaskId task, DDI ddi) {
        return {task_cmd::REQUEST_VALUE, task, static_cast<u8>(ddi & 0xFF), static_cast<u8>((ddi >> 8) & 0xFF)};
    }

    inline dp::Vector<u8> make_value_nack(TaskId task, DDI ddi, u8 reason) {
        return {impl_cmd::VALUE_NACK, task, static_cast<u8>(ddi & 0xFF), static_cast<u8>((ddi >> 8) & 0xFF), reason};
    }

    // ─── Decoded value frame (set / ack / response / define) ────────────────────
    struct ValueFrame {
        u8 cmd = 0;
        TaskId task = 0;
        DDI ddi = 0;
        i32 raw = 0;

        static dp::Optional<ValueFrame> parse(const Message &msg) {
            if (msg.size() < 8)
                return dp::nullopt;
            ValueFrame v;
            v.cmd = msg.get_u8(0);
            v.task = msg.get_u8(1);
            v.ddi = msg.get_u16_le(2);
            v.raw = msg.get_i32_le(4);
            return v;
        }
    };

} // namespace agrinet::app
