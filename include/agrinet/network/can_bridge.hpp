#pragma once

#include "../core/error.hpp"
#include "../core/frame.hpp"
#include "../core/types.hpp"
#include "bus.hpp"
#include "filter.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <string>
#include <wirebit/can/can_endpoint.hpp>

namespace agrinet {
    namespace network {

        // ─── Bridge counters ─────────────────────────────────────────────────────────
        struct BridgeStatistics {
            u64 to_endpoint = 0;   // bus -> wirebit
            u64 from_endpoint = 0; // wirebit -> bus
            u64 inbound_rejected = 0;
            u64 outbound_failed = 0; // drained from the bus but not accepted by the endpoint
        };

        // ─── CanBridge: mirrors one bus node onto a wirebit CAN endpoint ─────────────
        // Frames the node receives on the simulated bus are sent out through the
        // endpoint; frames read from the endpoint are transmitted on the bus from the
        // bridge node. Call process() from the same loop that runs bus.cycle().
        //
        // Usage:
        //   wirebit::CanEndpoint ep(link, wirebit::CanConfig{.bitrate = 250000}, 1);
        //   CanBridge bridge(bus, ep, 0xF0);
        //   bridge.attach();
        //   // loop: bridge.process(); bus.cycle(10);
        class CanBridge {
            Bus &bus_;
            wirebit::CanEndpoint &endpoint_;
            Address address_;
            dp::Vector<Filter> filters_;
            dp::Optional<NodeHandle> node_;
            BridgeStatistics stats_;

          public:
            CanBridge(Bus &bus, wirebit::CanEndpoint &endpoint, Address address,
                      dp::Vector<Filter> filters = {Filter::accept_all()})
                : bus_(bus), endpoint_(endpoint), address_(address), filters_(std::move(filters)) {}

            Result<void> attach() {
                if (node_.has_value()) {
                    return Result<void>::err(Error::invalid_state("bridge already attached"));
                }
                auto handle = bus_.register_node(address_, filters_);
                if (!handle.is_ok()) {
                    return Result<void>::err(handle.error());
                }
                node_ = handle.value();
                echo::category("agrinet.bus.bridge").info("bridge attached at addr=", address_);
                return {};
            }

            Result<void> detach() {
                if (!node_.has_value()) {
                    return Result<void>::err(Error::invalid_state("bridge not attached"));
                }
                auto result = bus_.deregister_node(*node_);
                node_ = dp::nullopt;
                echo::category("agrinet.bus.bridge").info("bridge detached");
                return result;
            }

            bool attached() const noexcept { return node_.has_value(); }

            // Best effort in both directions: a failed send is counted and the
            // remaining frames still go out. Returns DriverError if any send failed.
            Result<void> process() {
                if (!node_.has_value()) {
                    return Result<void>::err(Error::invalid_state("bridge not attached"));
                }

                auto polled = bus_.poll(*node_);
                if (!polled.is_ok()) {
                    return Result<void>::err(polled.error());
                }
                u64 failed = 0;
                for (const auto &frame : polled.value()) {
                    can_frame cf = to_can_frame(frame);
                    auto sent = endpoint_.send_can(cf);
                    if (!sent.is_ok()) {
                        echo::category("agrinet.bus.bridge").error("send_can failed for id=0x", frame.id.raw);
                        failed++;
                        continue;
                    }
                    stats_.to_endpoint++;
                }
                stats_.outbound_failed += failed;

                while (true) {
                    can_frame cf;
                    auto received = endpoint_.recv_can(cf);
                    if (!received.is_ok())
                        break;

                    auto frame = from_can_frame(cf);
                    if (!frame.is_ok()) {
                        stats_.inbound_rejected++;
                        echo::category("agrinet.bus.bridge").warn("invalid CAN frame from endpoint");
                        continue;
                    }
                    auto tx = bus_.transmit(*node_, frame.value());
                    if (!tx.is_ok()) {
                        stats_.inbound_rejected++;
                        echo::category("agrinet.bus.bridge")
                            .warn("endpoint frame not queued: ", to_string(tx.error().code));
                        continue;
                    }
                    stats_.from_endpoint++;
                }
                if (failed > 0) {
                    return Result<void>::err(
                        Error::driver_error(dp::String(std::to_string(failed)) + " frames not sent to the endpoint"));
                }
                return {};
            }

            const BridgeStatistics &statistics() const noexcept { return stats_; }

            // ─── Frame conversion helpers ─────────────────────────────────────────────
            static can_frame to_can_frame(const Frame &frame) {
                can_frame cf = {};
                cf.can_id = frame.is_extended() ? ((frame.id.raw & CAN_EFF_MASK) | CAN_EFF_FLAG)
                                                : (frame.id.raw & CAN_SFF_MASK);
                cf.can_dlc = frame.length;
                for (u8 i = 0; i < frame.length && i < 8; ++i) {
                    cf.data[i] = frame.data[i];
                }
                return cf;
            }

            // The integrity tag is recomputed: it is not carried on a real CAN link
            static Result<Frame> from_can_frame(const can_frame &cf) {
                Identifier id = (cf.can_id & CAN_EFF_FLAG) ? Identifier::extended(cf.can_id & CAN_EFF_MASK)
                                                           : Identifier::standard(cf.can_id & CAN_SFF_MASK);
                return Frame::encode(id, cf.data, static_cast<isize>(cf.can_dlc));
            }
        };

    } // namespace network
    using namespace network;
} // namespace agrinet
