#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/frame.hpp"
#include "../core/identifier.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace agrinet {
    namespace addressing {

        // ─── Message categories ──────────────────────────────────────────────────────
        enum class Category : u8 { Sensor, Actuator, SystemControl, Unclassified };

        inline const char *to_string(Category c) noexcept {
            switch (c) {
            case Category::Sensor:
                return "Sensor";
            case Category::Actuator:
                return "Actuator";
            case Category::SystemControl:
                return "SystemControl";
            case Category::Unclassified:
                return "Unclassified";
            }
            return "Unclassified";
        }

        // ─── Application roles ───────────────────────────────────────────────────────
        enum class Role : u8 { Controller, TaskController, VirtualTerminal, Implement, Broadcast };

        inline const char *to_string(Role r) noexcept {
            switch (r) {
            case Role::Controller:
                return "Controller";
            case Role::TaskController:
                return "TaskController";
            case Role::VirtualTerminal:
                return "VirtualTerminal";
            case Role::Implement:
                return "Implement";
            case Role::Broadcast:
                return "Broadcast";
            }
            return "Implement";
        }

        // ─── Closed identifier interval bound to a category ─────────────────────────
        struct IdentifierRange {
            Category category = Category::Unclassified;
            IdFormat format = IdFormat::Standard;
            u32 low = 0;
            u32 high = 0;

            bool contains(const Identifier &id) const noexcept {
                return id.format == format && id.raw >= low && id.raw <= high;
            }

            bool overlaps(IdFormat fmt, u32 lo, u32 hi) const noexcept {
                return fmt == format && lo <= high && low <= hi;
            }
        };

        // ─── Closed address interval bound to a role ─────────────────────────────────
        struct AddressRange {
            Role role = Role::Implement;
            Address low = 0;
            Address high = 0;

            bool contains(Address a) const noexcept { return a >= low && a <= high; }
            bool overlaps(Address lo, Address hi) const noexcept { return lo <= high && low <= hi; }
        };

        // ─── Identifier and address registry ─────────────────────────────────────────
        // Filled once at startup, then frozen. After freeze() it is read-only, so
        // concurrent classify()/resolve_role() calls need no locking.
        class IdentifierRegistry {
            dp::Vector<IdentifierRange> ranges_;
            dp::Vector<AddressRange> roles_;
            bool frozen_ = false;

          public:
            IdentifierRegistry() = default;

            // Sensor [0x100,0x1FF], Actuator [0x200,0x2FF] and SystemControl [0x000,0x0FF]
            // in the standard space, SystemControl for the whole extended space, and
            // the role layout used by the application protocol.
            static IdentifierRegistry default_layout() {
                IdentifierRegistry reg;
                reg.register_range(Category::SystemControl, 0x000, 0x0FF);
                reg.register_range(Category::Sensor, SENSOR_ID_BASE, SENSOR_ID_BASE + 0xFF);
                reg.register_range(Category::Actuator, ACTUATOR_ID_BASE, ACTUATOR_ID_BASE + 0xFF);
                reg.register_range(Category::SystemControl, 0, EXTENDED_ID_MAX, IdFormat::Extended);
                reg.register_role(Role::Controller, 0x00, 0x0F);
                reg.register_role(Role::Implement, 0x10, 0x25);
                reg.register_role(Role::VirtualTerminal, 0x26, 0x26);
                reg.register_role(Role::Implement, 0x80, 0xEF);
                reg.register_role(Role::TaskController, 0xF7, 0xF7);
                reg.register_role(Role::Broadcast, BROADCAST_ADDRESS, BROADCAST_ADDRESS);
                return reg;
            }

            Result<void> register_range(Category category, u32 low, u32 high, IdFormat format = IdFormat::Standard) {
                if (frozen_) {
                    return Result<void>::err(Error::registry_frozen());
                }
                if (category == Category::Unclassified) {
                    return Result<void>::err(Error::invalid_state("cannot register a range as Unclassified"));
                }
                u32 max = format == IdFormat::Extended ? EXTENDED_ID_MAX : STANDARD_ID_MAX;
                if (low > high || high > max) {
                    return Result<void>::err(Error(ErrorCode::InvalidIdentifier, "invalid range bounds"));
                }

                for (const auto &r : ranges_) {
                    if (r.category != category && r.overlaps(format, low, high)) {
                        echo::category("agrinet.registry")
                            .warn("range [0x", low, ",0x", high, "] for ", to_string(category), " overlaps ",
                                  to_string(r.category));
                        return Result<void>::err(Error(ErrorCode::RangeConflict, "range overlaps " +
                                                                                   dp::String(to_string(r.category))));
                    }
                }

                // Same-category overlaps are folded into one interval
                for (auto it = ranges_.begin(); it != ranges_.end();) {
                    if (it->category == category && it->overlaps(format, low, high)) {
                        low = it->low < low ? it->low : low;
                        high = it->high > high ? it->high : high;
                        it = ranges_.erase(it);
                    } else {
                        ++it;
                    }
                }
                ranges_.push_back({category, format, low, high});
                echo::category("agrinet.registry").debug("range registered: ", to_string(category), " [0x", low, ",0x",
                                                         high, "]");
                return {};
            }

            Result<void> register_role(Role role, Address low, Address high) {
                if (frozen_) {
                    return Result<void>::err(Error::registry_frozen());
                }
                if (low > high) {
                    return Result<void>::err(Error(ErrorCode::InvalidState, "invalid address range bounds"));
                }
                for (const auto &r : roles_) {
                    if (r.role != role && r.overlaps(low, high)) {
                        return Result<void>::err(
                            Error(ErrorCode::RangeConflict, "address range overlaps " + dp::String(to_string(r.role))));
                    }
                }
                roles_.push_back({role, low, high});
                return {};
            }

            void freeze() noexcept {
                if (!frozen_) {
                    frozen_ = true;
                    echo::category("agrinet.registry")
                        .info("registry frozen: ", ranges_.size(), " ranges, ", roles_.size(), " role ranges");
                }
            }

            bool frozen() const noexcept { return frozen_; }

            // ─── Lookup ──────────────────────────────────────────────────────────────
            Category classify(const Identifier &id) const noexcept {
                for (const auto &r : ranges_) {
                    if (r.contains(id))
                        return r.category;
                }
                return Category::Unclassified;
            }

            Result<Category> classify_frame(const Frame &frame) const {
                Category c = classify(frame.id);
                if (c == Category::Unclassified) {
                    return Result<Category>::err(
                        Error(ErrorCode::Unclassified, "unclassified identifier: " +
                                                           dp::String(std::to_string(frame.id.raw))));
                }
                return Result<Category>::ok(c);
            }

            Result<Role> resolve_role(Address address) const {
                for (const auto &r : roles_) {
                    if (r.contains(address))
                        return Result<Role>::ok(r.role);
                }
                return Result<Role>::err(Error::unknown_address(address));
            }

            // Standard identifier of a category: base of its first standard range + offset
            Result<Identifier> standard_id(Category category, u32 offset) const {
                for (const auto &r : ranges_) {
                    if (r.category == category && r.format == IdFormat::Standard && r.low + offset <= r.high) {
                        return Result<Identifier>::ok(Identifier::standard(r.low + offset));
                    }
                }
                return Result<Identifier>::err(
                    Error(ErrorCode::InvalidIdentifier, "no " + dp::String(to_string(category)) + " range covers offset"));
            }

            const dp::Vector<IdentifierRange> &ranges() const noexcept { return ranges_; }
            const dp::Vector<AddressRange> &roles() const noexcept { return roles_; }
        };

    } // namespace addressing
    using namespace addressing;
} // namespace agrinet
