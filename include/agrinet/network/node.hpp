#pragma once

#include "../core/frame.hpp"
#include "../core/types.hpp"
#include "filter.hpp"
#include <datapod/datapod.hpp>
#include <mutex>

namespace agrinet {
    namespace network {

        // ─── Fixed-capacity FIFO ─────────────────────────────────────────────────────
        template <typename T> class BoundedQueue {
            dp::Vector<T> slots_;
            usize head_ = 0;
            usize size_ = 0;

          public:
            explicit BoundedQueue(usize capacity = 1) : slots_(capacity == 0 ? 1 : capacity) {}

            usize capacity() const noexcept { return slots_.size(); }
            usize size() const noexcept { return size_; }
            bool empty() const noexcept { return size_ == 0; }
            bool full() const noexcept { return size_ == slots_.size(); }

            bool push(T value) {
                if (full())
                    return false;
                slots_[(head_ + size_) % slots_.size()] = std::move(value);
                ++size_;
                return true;
            }

            // Moves every element out, oldest first
            dp::Vector<T> drain() {
                dp::Vector<T> out;
                out.reserve(size_);
                for (usize i = 0; i < size_; ++i) {
                    out.push_back(std::move(slots_[(head_ + i) % slots_.size()]));
                }
                clear();
                return out;
            }

            void clear() noexcept {
                head_ = 0;
                size_ = 0;
            }
        };

        enum class NodeState : u8 { Active, Inactive };

        // ─── Per-node counters ───────────────────────────────────────────────────────
        struct NodeStatistics {
            u64 sent = 0;        // accepted into the transmit queue
            u64 rejected = 0;    // refused with QueueFull
            u64 received = 0;    // placed in the receive queue
            u64 dropped = 0;     // lost because the receive queue was full
            u64 polled = 0;      // handed out by poll()
            usize tx_pending = 0;
            usize rx_pending = 0;
        };

        // ─── Outbound frame tagged with its global enqueue order ─────────────────────
        struct PendingFrame {
            Frame frame;
            u64 sequence = 0;
            NodeHandle sender = 0;
        };

        // ─── Bus node ────────────────────────────────────────────────────────────────
        // Each queue has its own lock: concurrent transmits on one node serialise on
        // tx_mutex, concurrent polls on rx_mutex. The bus lock orders both against
        // the delivery pass.
        struct BusNode {
            NodeHandle handle = 0;
            Address address = NULL_ADDRESS;
            NodeState state = NodeState::Active;
            dp::Vector<Filter> filters;
            BoundedQueue<PendingFrame> tx;
            BoundedQueue<Frame> rx;
            NodeStatistics stats;
            std::mutex tx_mutex;
            std::mutex rx_mutex;

            BusNode(NodeHandle h, Address addr, dp::Vector<Filter> f, usize tx_capacity, usize rx_capacity)
                : handle(h), address(addr), filters(std::move(f)), tx(tx_capacity), rx(rx_capacity) {}

            bool is_active() const noexcept { return state == NodeState::Active; }

            void clear_queues() {
                tx.clear();
                rx.clear();
            }
        };

    } // namespace network
    using namespace network;
} // namespace agrinet
