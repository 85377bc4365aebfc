#pragma once

#include "../core/constants.hpp"
#include "../core/identifier.hpp"
#include "../core/types.hpp"
#include <datapod/datapod.hpp>

namespace agrinet {
    namespace network {

        enum class FilterKind : u8 { Exact, Range, MaskMatch, AcceptAll };

        // ─── Receive filter ──────────────────────────────────────────────────────────
        // Every kind except AcceptAll applies to one identifier format only, so a
        // standard 0x101 filter never matches extended 0x101.
        struct Filter {
            FilterKind kind = FilterKind::Exact;
            IdFormat format = IdFormat::Standard;
            u32 a = 0; // exact id | range low | mask
            u32 b = 0; // range high | match

            static constexpr Filter exact(u32 id, IdFormat fmt = IdFormat::Standard) noexcept {
                return {FilterKind::Exact, fmt, id, id};
            }
            static constexpr Filter exact(Identifier id) noexcept { return exact(id.raw, id.format); }

            static constexpr Filter range(u32 low, u32 high, IdFormat fmt = IdFormat::Standard) noexcept {
                return {FilterKind::Range, fmt, low, high};
            }

            // Matches when (id & mask) == (match & mask)
            static constexpr Filter mask_match(u32 mask, u32 match, IdFormat fmt = IdFormat::Extended) noexcept {
                return {FilterKind::MaskMatch, fmt, mask, match};
            }

            // Extended application frames addressed to `address` (PS byte)
            static constexpr Filter destination(Address address) noexcept {
                return mask_match(0x0000FF00u, static_cast<u32>(address) << 8, IdFormat::Extended);
            }

            static constexpr Filter accept_all() noexcept { return {FilterKind::AcceptAll, IdFormat::Standard, 0, 0}; }

            constexpr bool matches(const Identifier &id) const noexcept {
                if (kind == FilterKind::AcceptAll)
                    return true;
                if (id.format != format)
                    return false;
                switch (kind) {
                case FilterKind::Exact:
                    return id.raw == a;
                case FilterKind::Range:
                    return id.raw >= a && id.raw <= b;
                case FilterKind::MaskMatch:
                    return (id.raw & a) == (b & a);
                default:
                    return false;
                }
            }
        };

        // No filters means nothing is received
        inline bool passes(const dp::Vector<Filter> &filters, const Identifier &id) noexcept {
            for (const auto &f : filters) {
                if (f.matches(id))
                    return true;
            }
            return false;
        }

    } // namespace network
    using namespace network;
} // namespace agrinet
