#pragma once

#include "../core/error.hpp"
#include "event.hpp"
#include <functional>

namespace agrinet {
    namespace util {

        // ─── State machine with an optional transition guard ────────────────────────
        // transition() refuses moves the guard rejects; force() bypasses the guard
        // and is meant for teardown paths (stop, device loss).
        template <typename StateEnum> class StateMachine {
            StateEnum state_;
            std::function<bool(StateEnum, StateEnum)> allowed_;

          public:
            explicit StateMachine(StateEnum initial, std::function<bool(StateEnum, StateEnum)> allowed = {})
                : state_(initial), allowed_(std::move(allowed)) {}

            StateEnum state() const noexcept { return state_; }

            bool is(StateEnum s) const noexcept { return state_ == s; }

            bool can_transition(StateEnum to) const {
                if (to == state_)
                    return true;
                return !allowed_ || allowed_(state_, to);
            }

            Result<void> transition(StateEnum to) {
                if (!can_transition(to)) {
                    return Result<void>::err(Error::invalid_state("transition not allowed"));
                }
                force(to);
                return {};
            }

            void force(StateEnum to) {
                if (to != state_) {
                    StateEnum old = state_;
                    state_ = to;
                    on_transition.emit(old, to);
                }
            }

            Event<StateEnum, StateEnum> on_transition; // (from, to)
        };

    } // namespace util
    using namespace util;
} // namespace agrinet
