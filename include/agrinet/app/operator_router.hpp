#pragma once

#include "../core/error.hpp"
#include "../core/frame.hpp"
#include "../core/message.hpp"
#include "../core/types.hpp"
#include "../pgn_defs.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <functional>

namespace agrinet::app {

    // ─── Operator-interface function codes ───────────────────────────────────────
    namespace op_cmd {
        inline constexpr u8 SOFT_KEY_ACTIVATION = 0x00;
        inline constexpr u8 BUTTON_ACTIVATION = 0x01;
        inline constexpr u8 NUMERIC_VALUE_CHANGE = 0x03;
        inline constexpr u8 CHANGE_ACTIVE_SCREEN = 0xAD;
        inline constexpr u8 CHANGE_NUMERIC_VALUE = 0xA8;
    } // namespace op_cmd

    // ─── Screen / command message: [function, id:2, value:4] ─────────────────────
    struct OperatorMessage {
        Address source = NULL_ADDRESS;
        Address destination = BROADCAST_ADDRESS;
        u8 function = 0;
        u16 object_id = 0;
        i32 value = 0;

        static Result<OperatorMessage> decode(const Frame &frame) {
            if (!frame.is_extended() || frame.pgn() != PGN_TERMINAL_TO_ECU) {
                return Result<OperatorMessage>::err(Error::invalid_state("not an operator-interface frame"));
            }
            Message msg = Message::from_frame(frame);
            if (msg.size() < 3) {
                return Result<OperatorMessage>::err(Error::invalid_payload(static_cast<isize>(msg.size())));
            }
            OperatorMessage out;
            out.source = msg.source;
            out.destination = msg.destination;
            out.function = msg.get_u8(0);
            out.object_id = msg.get_u16_le(1);
            out.value = msg.size() >= 7 ? msg.get_i32_le(3) : 0;
            return Result<OperatorMessage>::ok(out);
        }

        dp::Vector<u8> encode() const {
            Message m;
            m.set_u8(0, function);
            m.set_u16_le(1, object_id);
            m.set_i32_le(3, value);
            return m.data;
        }
    };

    // ─── Routing table: screen/command identifier -> handler ────────────────────
    class OperatorRouter {
      public:
        using Handler = std::function<void(const OperatorMessage &)>;

      private:
        dp::Map<u16, Handler> handlers_;
        u64 routed_ = 0;
        u64 unhandled_ = 0;

      public:
        // Replaces an existing handler for the same identifier
        Result<void> register_handler(u16 object_id, Handler handler) {
            if (!handler) {
                return Result<void>::err(Error::invalid_state("null handler"));
            }
            handlers_[object_id] = std::move(handler);
            echo::category("agrinet.engine.router").debug("handler registered for id=", object_id);
            return {};
        }

        bool unregister_handler(u16 object_id) {
            auto it = handlers_.find(object_id);
            if (it == handlers_.end())
                return false;
            handlers_.erase(object_id);
            return true;
        }

        bool has_handler(u16 object_id) const { return handlers_.find(object_id) != handlers_.end(); }

        Result<void> route_message(const Frame &frame) {
            auto decoded = OperatorMessage::decode(frame);
            if (!decoded.is_ok()) {
                return Result<void>::err(decoded.error());
            }
            const OperatorMessage &msg = decoded.value();

            auto it = handlers_.find(msg.object_id);
            if (it == handlers_.end()) {
                unhandled_++;
                echo::category("agrinet.engine.router")
                    .warn("no handler for id=", msg.object_id, " fn=0x", msg.function, " from ", msg.source,
                          ", frame dropped");
                return Result<void>::err(
                    Error(ErrorCode::NoHandler, "no handler for id " + dp::String(std::to_string(msg.object_id))));
            }
            routed_++;
            it->second(msg);
            return {};
        }

        u64 routed() const noexcept { return routed_; }
        u64 unhandled() const noexcept { return unhandled_; }
    };

} // namespace agrinet::app
