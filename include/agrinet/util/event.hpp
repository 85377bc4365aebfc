#pragma once

#include "../core/types.hpp"
#include <datapod/datapod.hpp>
#include <functional>

namespace agrinet {
    namespace util {

        using ListenerToken = u32;
        inline constexpr ListenerToken INVALID_TOKEN = 0;

        // ─── Synchronous event dispatcher ────────────────────────────────────────────
        // Listeners run on the thread calling emit(). Unsubscribing from inside a
        // listener is allowed; the slot is compacted after the dispatch finishes.
        template <typename... Args> class Event {
            struct Slot {
                ListenerToken token = INVALID_TOKEN;
                std::function<void(Args...)> fn;
            };

            dp::Vector<Slot> slots_;
            ListenerToken next_token_ = 1;
            u32 depth_ = 0;

          public:
            ListenerToken subscribe(std::function<void(Args...)> fn) {
                if (!fn)
                    return INVALID_TOKEN;
                ListenerToken token = next_token_++;
                slots_.push_back({token, std::move(fn)});
                return token;
            }

            bool unsubscribe(ListenerToken token) {
                for (auto &slot : slots_) {
                    if (slot.token == token && token != INVALID_TOKEN) {
                        slot.token = INVALID_TOKEN;
                        if (depth_ == 0)
                            compact();
                        return true;
                    }
                }
                return false;
            }

            void emit(Args... args) {
                ++depth_;
                // Listeners added during dispatch wait for the next emit
                usize n = slots_.size();
                for (usize i = 0; i < n; ++i) {
                    if (slots_[i].token != INVALID_TOKEN) {
                        slots_[i].fn(args...);
                    }
                }
                if (--depth_ == 0)
                    compact();
            }

            usize count() const noexcept {
                usize active = 0;
                for (const auto &slot : slots_) {
                    if (slot.token != INVALID_TOKEN)
                        ++active;
                }
                return active;
            }

            void clear() {
                for (auto &slot : slots_)
                    slot.token = INVALID_TOKEN;
                if (depth_ == 0)
                    compact();
            }

          private:
            void compact() {
                for (auto it = slots_.begin(); it != slots_.end();) {
                    if (it->token == INVALID_TOKEN) {
                        it = slots_.erase(it);
                    } else {
                        ++it;
                    }
                }
            }
        };

    } // namespace util
    using namespace util;
} // namespace agrinet
