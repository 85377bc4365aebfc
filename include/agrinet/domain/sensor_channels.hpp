#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <cmath>
#include <limits>
#include <datapod/datapod.hpp>

namespace agrinet::domain {

    // ─── Sensor channels: offset of each sensor class inside the Sensor range ────
    enum class SensorChannel : u8 {
        Temperature = 0x00,
        Humidity = 0x01,
        Pressure = 0x02,
        SoilMoisture = 0x03,
        Npk = 0x04,
        Generic = 0xFF,
    };

    // ─── Actuator command codes (first payload byte of an actuator frame) ────────
    namespace actuator_cmd {
        inline constexpr u8 START = 0x01;
        inline constexpr u8 STOP = 0x02;
        inline constexpr u8 SET_RATE = 0x03;
        inline constexpr u8 STATUS = 0x04;
    } // namespace actuator_cmd

    // ─── Fixed-point sensor reading: i32 LE of value * scale, zero padded to 8 ───
    inline constexpr f64 READING_SCALE = 100.0;

    // Truncates toward zero; NaN or a value outside i32 after scaling is refused
    inline Result<dp::Vector<u8>> encode_reading(f64 value, f64 scale = READING_SCALE) {
        f64 scaled = std::trunc(value * scale);
        if (std::isnan(scaled) || scaled < static_cast<f64>(std::numeric_limits<i32>::min()) ||
            scaled > static_cast<f64>(std::numeric_limits<i32>::max())) {
            return Result<dp::Vector<u8>>::err(Error::out_of_range("sensor reading does not fit the wire format"));
        }
        u32 raw = static_cast<u32>(static_cast<i32>(scaled));
        dp::Vector<u8> out(8, 0x00);
        for (usize i = 0; i < 4; ++i) {
            out[i] = static_cast<u8>((raw >> (i * 8)) & 0xFF);
        }
        return Result<dp::Vector<u8>>::ok(std::move(out));
    }

    inline Result<f64> decode_reading(const dp::Vector<u8> &payload, f64 scale = READING_SCALE) {
        if (payload.size() < 4) {
            return Result<f64>::err(Error::invalid_payload(static_cast<isize>(payload.size())));
        }
        u32 raw = static_cast<u32>(payload[0]) | (static_cast<u32>(payload[1]) << 8) |
                  (static_cast<u32>(payload[2]) << 16) | (static_cast<u32>(payload[3]) << 24);
        return Result<f64>::ok(static_cast<f64>(static_cast<i32>(raw)) / scale);
    }

    // Rate argument of SET_RATE: 16-bit big-endian
    inline dp::Vector<u8> rate_parameters(u16 value) {
        return {static_cast<u8>((value >> 8) & 0xFF), static_cast<u8>(value & 0xFF)};
    }

    inline u16 parse_rate(const dp::Vector<u8> &parameters) {
        if (parameters.size() < 2)
            return 0;
        return static_cast<u16>((static_cast<u16>(parameters[0]) << 8) | parameters[1]);
    }

} // namespace agrinet::domain
