#pragma once

#include "../core/bus_config.hpp"
#include "../core/error.hpp"
#include "../core/frame.hpp"
#include "../util/event.hpp"
#include "bus_load.hpp"
#include "filter.hpp"
#include "node.hpp"
#include <algorithm>
#include <atomic>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <memory>
#include <mutex>
#include <shared_mutex>

namespace agrinet {
    namespace network {

        // ─── Bus-wide counters ───────────────────────────────────────────────────────
        struct BusStatistics {
            u64 transmitted = 0; // accepted by transmit()
            u64 delivered = 0;   // copies placed in receive queues
            u64 dropped = 0;     // copies lost to full receive queues
            u64 rejected = 0;    // transmit() calls refused (QueueFull)
            u64 cycles = 0;
            f64 load = 0.0;

            f64 error_rate() const noexcept {
                u64 total = transmitted + rejected;
                if (total == 0)
                    return 0.0;
                return static_cast<f64>(rejected + dropped) / static_cast<f64>(total);
            }
        };

        // ─── Simulated shared broadcast medium ───────────────────────────────────────
        // transmit() only enqueues. cycle() is the delivery pass: it arbitrates every
        // pending frame (lowest identifier first) and copies each one into the receive
        // queue of every active node whose filters accept it.
        //
        // Locking: register/deregister/stop and cycle() hold the bus lock exclusively;
        // transmit() and poll() hold it shared plus the node's queue lock.
        class Bus {
            BusConfig config_;
            mutable std::shared_mutex mutex_;
            dp::Map<NodeHandle, std::unique_ptr<BusNode>> nodes_;
            NodeHandle next_handle_ = 1;
            std::atomic<bool> active_{false};
            std::atomic<u64> sequence_{0};
            std::atomic<u64> transmitted_{0};
            std::atomic<u64> rejected_{0};
            u64 delivered_ = 0;
            u64 dropped_ = 0;
            u64 cycles_ = 0;
            u64 time_us_ = 0;
            BusLoad load_;

          public:
            explicit Bus(BusConfig config = {})
                : config_(config), load_(config.bitrate, config.load_sample_period_ms) {}

            Bus(const Bus &) = delete;
            Bus &operator=(const Bus &) = delete;

            // ─── Lifecycle ───────────────────────────────────────────────────────────
            Result<void> start() { return start(config_.bitrate); }

            Result<void> start(u32 bitrate) {
                BusConfig candidate = config_;
                candidate.bitrate = bitrate;
                auto valid = validate_bus_config(candidate);
                if (!valid.is_ok()) {
                    return valid;
                }

                std::unique_lock lock(mutex_);
                config_.bitrate = bitrate;
                load_.set_bitrate(bitrate);
                load_.reset();
                active_ = true;
                echo::category("agrinet.bus").info("bus started at ", bitrate, " bit/s with ", nodes_.size(), " nodes");
                return {};
            }

            void stop() {
                std::unique_lock lock(mutex_);
                usize discarded = 0;
                for (auto &[handle, node] : nodes_) {
                    discarded += node->tx.size() + node->rx.size();
                    node->clear_queues();
                }
                active_ = false;
                echo::category("agrinet.bus").info("bus stopped, discarded ", discarded, " queued frames");
            }

            bool is_active() const noexcept { return active_; }
            const BusConfig &config() const noexcept { return config_; }

            // ─── Node management ─────────────────────────────────────────────────────
            Result<NodeHandle> register_node(Address address, dp::Vector<Filter> filters = {}) {
                std::unique_lock lock(mutex_);
                for (const auto &[handle, node] : nodes_) {
                    if (node->address == address) {
                        echo::category("agrinet.bus").warn("address already registered: ", address);
                        return Result<NodeHandle>::err(
                            Error(ErrorCode::AddressConflict, "address already registered: " +
                                                                  dp::String(std::to_string(address))));
                    }
                }
                NodeHandle handle = next_handle_++;
                nodes_[handle] = std::make_unique<BusNode>(handle, address, std::move(filters),
                                                           config_.tx_queue_capacity, config_.rx_queue_capacity);
                echo::category("agrinet.bus").debug("node registered: handle=", handle, " addr=", address);
                return Result<NodeHandle>::ok(handle);
            }

            Result<void> deregister_node(NodeHandle handle) {
                std::unique_lock lock(mutex_);
                auto it = nodes_.find(handle);
                if (it == nodes_.end()) {
                    return Result<void>::err(Error::unknown_node(handle));
                }
                nodes_.erase(handle);
                echo::category("agrinet.bus").debug("node deregistered: handle=", handle);
                return {};
            }

            Result<void> activate(NodeHandle handle) {
                std::unique_lock lock(mutex_);
                auto *node = find(handle);
                if (!node) {
                    return Result<void>::err(Error::unknown_node(handle));
                }
                node->state = NodeState::Active;
                return {};
            }

            Result<void> deactivate(NodeHandle handle) {
                std::unique_lock lock(mutex_);
                auto *node = find(handle);
                if (!node) {
                    return Result<void>::err(Error::unknown_node(handle));
                }
                node->state = NodeState::Inactive;
                node->clear_queues();
                echo::category("agrinet.bus").debug("node deactivated: handle=", handle);
                return {};
            }

            Result<void> set_filters(NodeHandle handle, dp::Vector<Filter> filters) {
                std::unique_lock lock(mutex_);
                auto *node = find(handle);
                if (!node) {
                    return Result<void>::err(Error::unknown_node(handle));
                }
                node->filters = std::move(filters);
                return {};
            }

            Result<void> add_filter(NodeHandle handle, Filter filter) {
                std::unique_lock lock(mutex_);
                auto *node = find(handle);
                if (!node) {
                    return Result<void>::err(Error::unknown_node(handle));
                }
                node->filters.push_back(filter);
                return {};
            }

            Result<void> clear_filters(NodeHandle handle) { return set_filters(handle, {}); }

            usize node_count() const {
                std::shared_lock lock(mutex_);
                return nodes_.size();
            }

            // ─── Traffic ─────────────────────────────────────────────────────────────
            // The active check happens under the bus lock so a concurrent stop()
            // cannot leave a frame queued on a stopped bus.
            Result<void> transmit(NodeHandle handle, const Frame &frame) {
                std::shared_lock lock(mutex_);
                if (!active_) {
                    return Result<void>::err(Error::bus_not_active());
                }
                if (frame.length > CAN_DATA_LENGTH) {
                    return Result<void>::err(Error::invalid_payload(frame.length));
                }
                if (!frame.id.valid()) {
                    return Result<void>::err(Error::invalid_identifier(frame.id.raw));
                }

                auto *node = find(handle);
                if (!node) {
                    return Result<void>::err(Error::unknown_node(handle));
                }
                if (!node->is_active()) {
                    return Result<void>::err(Error(ErrorCode::NodeInactive, "node inactive"));
                }

                std::lock_guard node_lock(node->tx_mutex);
                PendingFrame pending{frame, sequence_++, handle};
                pending.frame.direction = Direction::Outbound;
                if (!node->tx.push(std::move(pending))) {
                    node->stats.rejected++;
                    rejected_++;
                    echo::category("agrinet.bus").warn("tx queue full: addr=", node->address);
                    return Result<void>::err(Error::queue_full());
                }
                node->stats.sent++;
                transmitted_++;
                echo::category("agrinet.bus").trace("queued id=0x", frame.id.raw, " from addr=", node->address);
                return {};
            }

            // Drains what is pending for the node right now. Filters are re-applied, so
            // frames delivered before a filter change are not handed out afterwards.
            Result<dp::Vector<Frame>> poll(NodeHandle handle) {
                std::shared_lock lock(mutex_);
                auto *node = find(handle);
                if (!node) {
                    return Result<dp::Vector<Frame>>::err(Error::unknown_node(handle));
                }
                dp::Vector<Frame> out;
                if (!active_ || !node->is_active()) {
                    return Result<dp::Vector<Frame>>::ok(std::move(out));
                }

                std::lock_guard node_lock(node->rx_mutex);
                for (auto &frame : node->rx.drain()) {
                    if (passes(node->filters, frame.id)) {
                        out.push_back(std::move(frame));
                    }
                }
                node->stats.polled += out.size();
                return Result<dp::Vector<Frame>>::ok(std::move(out));
            }

            // ─── Delivery pass ───────────────────────────────────────────────────────
            // Returns the number of frames that won arbitration in this pass.
            usize cycle(u32 elapsed_ms) {
                std::unique_lock lock(mutex_);
                time_us_ += static_cast<u64>(elapsed_ms) * 1000;
                if (!active_) {
                    return 0;
                }
                cycles_++;

                dp::Vector<PendingFrame> pending;
                for (auto &[handle, node] : nodes_) {
                    if (!node->is_active())
                        continue;
                    for (auto &p : node->tx.drain()) {
                        pending.push_back(std::move(p));
                    }
                }

                std::sort(pending.begin(), pending.end(), [](const PendingFrame &a, const PendingFrame &b) {
                    u32 ka = a.frame.id.arbitration_key();
                    u32 kb = b.frame.id.arbitration_key();
                    if (ka != kb)
                        return ka < kb;
                    return a.sequence < b.sequence;
                });

                for (auto &p : pending) {
                    p.frame.timestamp_us = time_us_;
                    p.frame.direction = Direction::Inbound;
                    load_.add_frame(p.frame.length, p.frame.is_extended());
                    deliver(p);
                }

                load_.update(elapsed_ms);
                if (!pending.empty()) {
                    echo::category("agrinet.bus").trace("cycle delivered ", pending.size(), " frames");
                }
                return pending.size();
            }

            // ─── Diagnostics ─────────────────────────────────────────────────────────
            f64 load() const {
                std::shared_lock lock(mutex_);
                return load_.load();
            }

            f64 frames_per_second() const {
                std::shared_lock lock(mutex_);
                return load_.frames_per_second();
            }

            u64 now_us() const {
                std::shared_lock lock(mutex_);
                return time_us_;
            }

            BusStatistics statistics() const {
                std::shared_lock lock(mutex_);
                BusStatistics s;
                s.transmitted = transmitted_;
                s.rejected = rejected_;
                s.delivered = delivered_;
                s.dropped = dropped_;
                s.cycles = cycles_;
                s.load = load_.load();
                return s;
            }

            Result<NodeStatistics> node_statistics(NodeHandle handle) const {
                std::shared_lock lock(mutex_);
                auto it = nodes_.find(handle);
                if (it == nodes_.end()) {
                    return Result<NodeStatistics>::err(Error::unknown_node(handle));
                }
                BusNode &node = *it->second;
                NodeStatistics s;
                {
                    std::lock_guard tx_lock(node.tx_mutex);
                    s = node.stats;
                    s.tx_pending = node.tx.size();
                }
                {
                    std::lock_guard rx_lock(node.rx_mutex);
                    s.rx_pending = node.rx.size();
                }
                return Result<NodeStatistics>::ok(s);
            }

          private:
            BusNode *find(NodeHandle handle) const {
                auto it = nodes_.find(handle);
                if (it == nodes_.end())
                    return nullptr;
                return it->second.get();
            }

            // Caller holds the bus lock exclusively
            void deliver(const PendingFrame &p) {
                for (auto &[handle, node] : nodes_) {
                    if (!node->is_active())
                        continue;
                    if (handle == p.sender && !config_.loopback)
                        continue;
                    if (!passes(node->filters, p.frame.id))
                        continue;

                    if (node->rx.push(p.frame)) {
                        node->stats.received++;
                        delivered_++;
                    } else {
                        node->stats.dropped++;
                        dropped_++;
                        echo::category("agrinet.bus")
                            .warn("rx queue full, dropped id=0x", p.frame.id.raw, " for addr=", node->address);
                    }
                }
            }
        };

    } // namespace network
    using namespace network;
} // namespace agrinet
