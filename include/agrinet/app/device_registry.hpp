#pragma once

#include "../addressing/registry.hpp"
#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/types.hpp"
#include "../util/event.hpp"
#include "../util/timer.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace agrinet::app {

    // ─── Device lifecycle ────────────────────────────────────────────────────────
    enum class DeviceState : u8 { Unknown, Discovered, Connected, Active, Disconnected };

    inline const char *to_string(DeviceState s) noexcept {
        switch (s) {
        case DeviceState::Unknown:
            return "Unknown";
        case DeviceState::Discovered:
            return "Discovered";
        case DeviceState::Connected:
            return "Connected";
        case DeviceState::Active:
            return "Active";
        case DeviceState::Disconnected:
            return "Disconnected";
        }
        return "Unknown";
    }

    // ─── Declared capabilities (bit set) ─────────────────────────────────────────
    namespace capability {
        inline constexpr u16 PROCESS_DATA = 0x0001;
        inline constexpr u16 SECTION_CONTROL = 0x0002;
        inline constexpr u16 OPERATOR_INTERFACE = 0x0004;
        inline constexpr u16 DOCUMENTATION = 0x0008;
    } // namespace capability

    struct DeviceRecord {
        Address address = NULL_ADDRESS;
        Role role = Role::Implement;
        u16 capabilities = 0;
        DeviceState state = DeviceState::Unknown;
        Timeout liveness;

        bool has(u16 cap) const noexcept { return (capabilities & cap) == cap; }
        bool online() const noexcept { return state == DeviceState::Connected || state == DeviceState::Active; }
    };

    // ─── Device registry with liveness tracking and address reservation ─────────
    // A device that disconnects keeps its address reserved for hold_ms so frames
    // still in flight from it cannot be mistaken for a new device.
    class DeviceRegistry {
        struct Reservation {
            Address address = NULL_ADDRESS;
            Timeout hold;
        };

        dp::Vector<DeviceRecord> devices_;
        dp::Vector<Reservation> reserved_;
        u32 liveness_ms_;
        u32 hold_ms_;

      public:
        DeviceRegistry(u32 liveness_ms = LIVENESS_WINDOW_MS, u32 hold_ms = ADDRESS_HOLD_MS)
            : liveness_ms_(liveness_ms), hold_ms_(hold_ms) {}

        DeviceRecord *find(Address address) {
            for (auto &d : devices_) {
                if (d.address == address)
                    return &d;
            }
            return nullptr;
        }

        const DeviceRecord *find(Address address) const {
            for (const auto &d : devices_) {
                if (d.address == address)
                    return &d;
            }
            return nullptr;
        }

        bool is_reserved(Address address) const noexcept {
            for (const auto &r : reserved_) {
                if (r.address == address)
                    return true;
            }
            return false;
        }

        // Unknown -> Discovered
        Result<DeviceRecord *> discover(Address address, Role role, u16 capabilities) {
            if (is_reserved(address)) {
                return Result<DeviceRecord *>::err(
                    Error(ErrorCode::AddressReserved, "address reserved after disconnect: " +
                                                          dp::String(std::to_string(address))));
            }
            if (auto *existing = find(address)) {
                existing->liveness.touch();
                return Result<DeviceRecord *>::ok(existing);
            }

            DeviceRecord record;
            record.address = address;
            record.role = role;
            record.capabilities = capabilities;
            record.liveness.start(liveness_ms_);
            devices_.push_back(record);
            set_state(devices_.back(), DeviceState::Discovered);
            return Result<DeviceRecord *>::ok(&devices_.back());
        }

        Result<void> set_state(Address address, DeviceState state) {
            auto *d = find(address);
            if (!d) {
                return Result<void>::err(Error::unknown_address(address));
            }
            set_state(*d, state);
            return {};
        }

        // Any frame from a device proves it is alive
        void touch(Address address) {
            if (auto *d = find(address))
                d->liveness.touch();
        }

        // -> Disconnected: drop the record and reserve its address
        Result<DeviceRecord> remove(Address address) {
            for (auto it = devices_.begin(); it != devices_.end(); ++it) {
                if (it->address == address) {
                    DeviceRecord record = *it;
                    devices_.erase(it);
                    DeviceState old = record.state;
                    record.state = DeviceState::Disconnected;
                    Reservation r;
                    r.address = address;
                    r.hold.start(hold_ms_);
                    reserved_.push_back(r);
                    echo::category("agrinet.engine.devices")
                        .info("device ", address, " ", to_string(old), " -> Disconnected, address held for ", hold_ms_,
                              " ms");
                    on_state_change.emit(address, DeviceState::Disconnected);
                    return Result<DeviceRecord>::ok(record);
                }
            }
            return Result<DeviceRecord>::err(Error::unknown_address(address));
        }

        // Advances liveness and reservation timers. Returns devices that went silent
        // for longer than the liveness window; the caller disconnects them.
        dp::Vector<Address> update(u32 elapsed_ms) {
            dp::Vector<Address> expired;
            for (auto &d : devices_) {
                if (d.liveness.update(elapsed_ms)) {
                    expired.push_back(d.address);
                }
            }
            for (auto it = reserved_.begin(); it != reserved_.end();) {
                if (it->hold.update(elapsed_ms)) {
                    echo::category("agrinet.engine.devices").debug("address released: ", it->address);
                    it = reserved_.erase(it);
                } else {
                    ++it;
                }
            }
            return expired;
        }

        const dp::Vector<DeviceRecord> &devices() const noexcept { return devices_; }

        usize online_count() const noexcept {
            usize n = 0;
            for (const auto &d : devices_) {
                if (d.online())
                    ++n;
            }
            return n;
        }

        Event<Address, DeviceState> on_state_change;

      private:
        void set_state(DeviceRecord &d, DeviceState state) {
            if (d.state == state)
                return;
            echo::category("agrinet.engine.devices")
                .info("device ", d.address, " ", to_string(d.state), " -> ", to_string(state));
            d.state = state;
            on_state_change.emit(d.address, state);
        }
    };

} // namespace agrinet::app
