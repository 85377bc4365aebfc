#pragma once

#include "../core/error.hpp"
#include "../core/types.hpp"
#include <cmath>
#include <datapod/datapod.hpp>
#include <limits>

namespace agrinet::app {

    // ─── Well-known process data definitions ─────────────────────────────────────
    namespace ddi {
        inline constexpr DDI SETPOINT_APPLICATION_RATE = 0x0001;
        inline constexpr DDI ACTUAL_APPLICATION_RATE = 0x0002;
        inline constexpr DDI WORKING_WIDTH = 0x0043;
        inline constexpr DDI TANK_LEVEL = 0x0048;
        inline constexpr DDI SECTION_STATE = 0x00A1;
    } // namespace ddi

    // ─── Definition: identity, unit, valid range and wire resolution ─────────────
    struct ProcessDataDefinition {
        DDI ddi = 0;
        dp::String name;
        dp::String unit;
        f64 low = 0.0;
        f64 high = 0.0;
        f64 resolution = 1.0; // engineering units per raw count

        bool in_range(f64 value) const noexcept { return value >= low && value <= high; }

        // Raw wire value: round(value / resolution), must fit an i32
        Result<i32> to_raw(f64 value) const {
            if (resolution <= 0.0) {
                return Result<i32>::err(Error::invalid_state("non-positive resolution for " + name));
            }
            f64 scaled = std::round(value / resolution);
            if (scaled < static_cast<f64>(std::numeric_limits<i32>::min()) ||
                scaled > static_cast<f64>(std::numeric_limits<i32>::max())) {
                return Result<i32>::err(Error::out_of_range(name + " does not fit the wire format"));
            }
            return Result<i32>::ok(static_cast<i32>(scaled));
        }

        f64 from_raw(i32 raw) const noexcept { return static_cast<f64>(raw) * resolution; }
    };

    // ─── Parameter: definition plus the value the implement has confirmed ───────
    struct ProcessDataParameter {
        ProcessDataDefinition definition;
        f64 value = 0.0;
        dp::Optional<f64> pending; // awaiting the implement's acknowledgment
        i32 pending_raw = 0;

        ProcessDataParameter() = default;
        ProcessDataParameter(ProcessDataDefinition def, f64 initial) : definition(std::move(def)), value(initial) {}

        DDI ddi() const noexcept { return definition.ddi; }
    };

    // Definitions the engine and implements agree on when nothing else is configured
    inline dp::Optional<ProcessDataDefinition> standard_definition(DDI id) {
        switch (id) {
        case ddi::SETPOINT_APPLICATION_RATE:
            return ProcessDataDefinition{id, "applicationRate", "l/ha", 0.0, 1000.0, 0.01};
        case ddi::ACTUAL_APPLICATION_RATE:
            return ProcessDataDefinition{id, "actualApplicationRate", "l/ha", 0.0, 1000.0, 0.01};
        case ddi::WORKING_WIDTH:
            return ProcessDataDefinition{id, "workingWidth", "mm", 0.0, 100000.0, 1.0};
        case ddi::TANK_LEVEL:
            return ProcessDataDefinition{id, "tankLevel", "l", 0.0, 20000.0, 0.1};
        case ddi::SECTION_STATE:
            return ProcessDataDefinition{id, "sectionState", "", 0.0, 65535.0, 1.0};
        default:
            return dp::nullopt;
        }
    }

} // namespace agrinet::app
