#pragma once

#include "types.hpp"
#include <datapod/datapod.hpp>
#include <string>
#include <utility>

namespace agrinet {

    // ─── Error codes ─────────────────────────────────────────────────────────────
    enum class ErrorCode : u32 {
        Ok = 0,
        // Frame model
        InvalidPayload,
        InvalidIdentifier,
        CorruptFrame,
        // Transport
        BusNotActive,
        QueueFull,
        UnknownNode,
        NodeInactive,
        AddressConflict,
        InvalidConfig,
        DriverError,
        // Addressing
        RangeConflict,
        UnknownAddress,
        RegistryFrozen,
        Unclassified,
        // Application engine
        TaskNotActive,
        OutOfRange,
        UnknownParameter,
        Timeout,
        Cancelled,
        NoHandler,
        AddressReserved,
        InvalidState,
    };

    inline const char *to_string(ErrorCode code) noexcept {
        switch (code) {
        case ErrorCode::Ok:
            return "Ok";
        case ErrorCode::InvalidPayload:
            return "InvalidPayload";
        case ErrorCode::InvalidIdentifier:
            return "InvalidIdentifier";
        case ErrorCode::CorruptFrame:
            return "CorruptFrame";
        case ErrorCode::BusNotActive:
            return "BusNotActive";
        case ErrorCode::QueueFull:
            return "QueueFull";
        case ErrorCode::UnknownNode:
            return "UnknownNode";
        case ErrorCode::NodeInactive:
            return "NodeInactive";
        case ErrorCode::AddressConflict:
            return "AddressConflict";
        case ErrorCode::InvalidConfig:
            return "InvalidConfig";
        case ErrorCode::DriverError:
            return "DriverError";
        case ErrorCode::RangeConflict:
            return "RangeConflict";
        case ErrorCode::UnknownAddress:
            return "UnknownAddress";
        case ErrorCode::RegistryFrozen:
            return "RegistryFrozen";
        case ErrorCode::Unclassified:
            return "Unclassified";
        case ErrorCode::TaskNotActive:
            return "TaskNotActive";
        case ErrorCode::OutOfRange:
            return "OutOfRange";
        case ErrorCode::UnknownParameter:
            return "UnknownParameter";
        case ErrorCode::Timeout:
            return "Timeout";
        case ErrorCode::Cancelled:
            return "Cancelled";
        case ErrorCode::NoHandler:
            return "NoHandler";
        case ErrorCode::AddressReserved:
            return "AddressReserved";
        case ErrorCode::InvalidState:
            return "InvalidState";
        }
        return "Unknown";
    }

    // ─── Error type ──────────────────────────────────────────────────────────────
    struct Error : dp::Error {
        ErrorCode code = ErrorCode::Ok;

        Error() = default;
        Error(ErrorCode c, dp::String msg = "") : dp::Error{static_cast<dp::u32>(c), std::move(msg)}, code(c) {}

        static Error invalid_payload(isize length) noexcept {
            return Error(ErrorCode::InvalidPayload,
                         "payload length " + dp::String(std::to_string(length)) + " outside 0..8");
        }
        static Error invalid_identifier(u32 raw) noexcept {
            return Error(ErrorCode::InvalidIdentifier, "identifier out of range: " + dp::String(std::to_string(raw)));
        }
        static Error corrupt_frame(dp::String msg = "integrity tag mismatch") noexcept {
            return Error(ErrorCode::CorruptFrame, std::move(msg));
        }
        static Error bus_not_active() noexcept { return Error(ErrorCode::BusNotActive, "bus not active"); }
        static Error queue_full() noexcept { return Error(ErrorCode::QueueFull, "transmit queue full"); }
        static Error unknown_node(NodeHandle handle) noexcept {
            return Error(ErrorCode::UnknownNode, "unknown node handle: " + dp::String(std::to_string(handle)));
        }
        static Error driver_error(dp::String msg = "") noexcept {
            return Error(ErrorCode::DriverError, std::move(msg));
        }
        static Error unknown_address(Address addr) noexcept {
            return Error(ErrorCode::UnknownAddress, "unknown address: " + dp::String(std::to_string(addr)));
        }
        static Error registry_frozen() noexcept { return Error(ErrorCode::RegistryFrozen, "registry is frozen"); }
        static Error task_not_active(TaskId task) noexcept {
            return Error(ErrorCode::TaskNotActive, "task not active: " + dp::String(std::to_string(task)));
        }
        static Error out_of_range(dp::String msg = "") noexcept { return Error(ErrorCode::OutOfRange, std::move(msg)); }
        static Error timeout(dp::String msg = "") noexcept { return Error(ErrorCode::Timeout, std::move(msg)); }
        static Error cancelled(dp::String msg = "") noexcept { return Error(ErrorCode::Cancelled, std::move(msg)); }
        static Error invalid_state(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidState, std::move(msg));
        }
        static Error invalid_config(dp::String msg = "") noexcept {
            return Error(ErrorCode::InvalidConfig, std::move(msg));
        }
    };

    // ─── Result alias ────────────────────────────────────────────────────────────
    template <typename T> using Result = dp::Result<T, Error>;

} // namespace agrinet
