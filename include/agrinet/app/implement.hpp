#pragma once

#include "../addressing/registry.hpp"
#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/frame.hpp"
#include "../core/message.hpp"
#include "../network/bus.hpp"
#include "../network/filter.hpp"
#include "../pgn_defs.hpp"
#include "../util/event.hpp"
#include "../util/state_machine.hpp"
#include "../util/timer.hpp"
#include "device_registry.hpp"
#include "protocol.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <functional>

namespace agrinet::app {

    // ─── Implement configuration ─────────────────────────────────────────────────
    struct ImplementConfig {
        Address address = 0x10;
        u16 capabilities = capability::PROCESS_DATA;
        u32 alive_interval_ms = ALIVE_INTERVAL_MS;
        bool auto_accept_tasks = true;
        bool auto_acknowledge_values = true;
        u32 actuator_id_base = ACTUATOR_ID_BASE;
        usize task_history = 8;

        ImplementConfig &set_address(Address a) {
            address = a;
            return *this;
        }
        ImplementConfig &caps(u16 c) {
            capabilities = c;
            return *this;
        }
        ImplementConfig &alive_interval(u32 ms) {
            alive_interval_ms = ms;
            return *this;
        }
        ImplementConfig &auto_accept(bool enable) {
            auto_accept_tasks = enable;
            return *this;
        }
        ImplementConfig &auto_acknowledge(bool enable) {
            auto_acknowledge_values = enable;
            return *this;
        }
        ImplementConfig &history(usize n) {
            task_history = n;
            return *this;
        }
    };

    enum class LinkState : u8 { Idle, Announcing, Connected };

    enum class LocalTaskState : u8 { Offered, Accepted, Running, Paused, Finished, Aborted };

    // ─── Task as seen by the implement ───────────────────────────────────────────
    struct LocalTask {
        struct Value {
            DDI ddi = 0;
            i32 raw = 0;
            dp::Optional<i32> pending;
        };

        TaskId id = 0;
        u8 expected_parameters = 0;
        LocalTaskState state = LocalTaskState::Offered;
        dp::Vector<Value> values;

        Value *find(DDI ddi) {
            for (auto &v : values) {
                if (v.ddi == ddi)
                    return &v;
            }
            return nullptr;
        }

        const Value *find(DDI ddi) const {
            for (const auto &v : values) {
                if (v.ddi == ddi)
                    return &v;
            }
            return nullptr;
        }
    };

    // ─── Implement-side protocol peer ────────────────────────────────────────────
    // Announces itself, keeps the link alive, accepts tasks and answers
    // process-data commands. Actuator frames addressed to it are reported through
    // on_actuator_command and acknowledged to the controller.
    class ImplementClient {
        Bus &bus_;
        ImplementConfig config_;
        dp::Optional<NodeHandle> node_;
        StateMachine<LinkState> link_{LinkState::Idle};
        Timer alive_timer_;
        Address controller_ = NULL_ADDRESS;
        u8 alive_sequence_ = 0;
        dp::Vector<LocalTask> tasks_;

        using SetValueCallback = std::function<bool(TaskId, DDI, i32)>;
        SetValueCallback set_value_cb_;

      public:
        ImplementClient(Bus &bus, ImplementConfig config = {})
            : bus_(bus), config_(config), alive_timer_(config.alive_interval_ms) {}

        ImplementClient(const ImplementClient &) = delete;
        ImplementClient &operator=(const ImplementClient &) = delete;

        ~ImplementClient() {
            if (node_.has_value()) {
                auto r = bus_.deregister_node(*node_);
                (void)r;
            }
        }

        // Joins the bus on first use; after disconnect() it only announces again
        Result<void> start() {
            if (!link_.is(LinkState::Idle)) {
                return Result<void>::err(Error::invalid_state("implement already started"));
            }
            if (!node_.has_value()) {
                dp::Vector<Filter> filters;
                filters.push_back(Filter::destination(config_.address));
                filters.push_back(Filter::destination(BROADCAST_ADDRESS));
                filters.push_back(Filter::exact(config_.actuator_id_base + config_.address, IdFormat::Standard));
                filters.push_back(Filter::exact(config_.actuator_id_base + BROADCAST_ADDRESS, IdFormat::Standard));

                auto handle = bus_.register_node(config_.address, std::move(filters));
                if (!handle.is_ok()) {
                    echo::category("agrinet.implement").error("start failed: ", handle.error().message);
                    return Result<void>::err(handle.error());
                }
                node_ = handle.value();
            }
            link_.force(LinkState::Announcing);
            alive_timer_.start();
            echo::category("agrinet.implement").info("implement ", config_.address, " announcing");
            return announce();
        }

        // The node stays on the bus so the notice still goes out on the next cycle
        Result<void> disconnect() {
            if (!node_.has_value() || link_.is(LinkState::Idle)) {
                return Result<void>::err(Error::invalid_state("implement not started"));
            }
            auto sent = send(PGN_CONNECTION, controller_ == NULL_ADDRESS ? BROADCAST_ADDRESS : controller_,
                             make_command(conn_cmd::DISCONNECT, 0));
            go_idle();
            return sent;
        }

        LinkState state() const noexcept { return link_.state(); }
        bool connected() const noexcept { return link_.is(LinkState::Connected); }
        Address address() const noexcept { return config_.address; }
        Address controller() const noexcept { return controller_; }

        // Returning false rejects the value with a NACK
        void on_set_value(SetValueCallback cb) { set_value_cb_ = std::move(cb); }

        // ─── Update loop ─────────────────────────────────────────────────────────
        void update(u32 elapsed_ms) {
            if (!node_.has_value())
                return;

            auto polled = bus_.poll(*node_);
            if (polled.is_ok()) {
                for (const auto &frame : polled.value()) {
                    handle_frame(frame);
                }
            } else {
                echo::category("agrinet.implement").warn("poll failed: ", polled.error().message);
            }

            if (alive_timer_.update(elapsed_ms) == 0)
                return;
            if (link_.is(LinkState::Announcing)) {
                auto r = announce();
                (void)r;
            } else if (link_.is(LinkState::Connected)) {
                auto r = send(PGN_CONNECTION, controller_, make_command(conn_cmd::ALIVE, alive_sequence_++));
                if (!r.is_ok())
                    echo::category("agrinet.implement").warn("alive not sent: ", r.error().message);
            }
        }

        // ─── Tasks ───────────────────────────────────────────────────────────────
        Result<void> accept_task(TaskId id) { return answer_task(id, ACK_OK); }
        Result<void> reject_task(TaskId id) { return answer_task(id, ACK_REJECTED); }

        Result<void> send_status(TaskId id, TaskStatus status) {
            LocalTask *t = find_task(id);
            if (!t) {
                return Result<void>::err(Error::task_not_active(id));
            }
            auto sent = send(PGN_IMPLEMENT_TO_TASK, controller_, {impl_cmd::TASK_STATUS, id, static_cast<u8>(status)});
            if (!sent.is_ok())
                return sent;
            switch (status) {
            case TaskStatus::Running:
                t->state = LocalTaskState::Running;
                break;
            case TaskStatus::Finished:
                t->state = LocalTaskState::Finished;
                break;
            case TaskStatus::Fault:
                t->state = LocalTaskState::Aborted;
                break;
            }
            return {};
        }

        // Sends the ack for a value held back because auto-acknowledge is off
        Result<void> acknowledge_value(TaskId id, DDI ddi) {
            LocalTask *t = find_task(id);
            if (!t)
                return Result<void>::err(Error::task_not_active(id));
            LocalTask::Value *v = t->find(ddi);
            if (!v || !v->pending.has_value()) {
                return Result<void>::err(Error::invalid_state("no value awaiting acknowledgment"));
            }
            i32 raw = *v->pending;
            auto sent = send(PGN_IMPLEMENT_TO_TASK, controller_, make_value_command(impl_cmd::VALUE_ACK, id, ddi, raw));
            if (!sent.is_ok())
                return sent;
            v->raw = raw;
            v->pending = dp::nullopt;
            return {};
        }

        Result<void> reject_value(TaskId id, DDI ddi, u8 reason) {
            LocalTask *t = find_task(id);
            if (!t)
                return Result<void>::err(Error::task_not_active(id));
            if (LocalTask::Value *v = t->find(ddi))
                v->pending = dp::nullopt;
            return send(PGN_IMPLEMENT_TO_TASK, controller_, make_value_nack(id, ddi, reason));
        }

        // Measured value reported on the next REQUEST_VALUE
        Result<void> set_local_value(TaskId id, DDI ddi, i32 raw) {
            LocalTask *t = find_task(id);
            if (!t)
                return Result<void>::err(Error::task_not_active(id));
            if (LocalTask::Value *v = t->find(ddi)) {
                v->raw = raw;
            } else {
                t->values.push_back({ddi, raw, dp::nullopt});
            }
            return {};
        }

        dp::Optional<i32> value(TaskId id, DDI ddi) const {
            const LocalTask *t = task(id);
            if (!t)
                return dp::nullopt;
            const LocalTask::Value *v = t->find(ddi);
            if (!v)
                return dp::nullopt;
            return v->raw;
        }

        const LocalTask *task(TaskId id) const {
            for (const auto &t : tasks_) {
                if (t.id == id)
                    return &t;
            }
            return nullptr;
        }

        const dp::Vector<LocalTask> &tasks() const noexcept { return tasks_; }

        // ─── Events ──────────────────────────────────────────────────────────────
        Event<Address> on_connected;
        Event<> on_disconnected;
        Event<TaskId> on_task_offered;
        Event<TaskId, u8> on_task_command;
        Event<u8, const dp::Vector<u8> &> on_actuator_command;

      private:
        Result<void> announce() {
            return send(PGN_CONNECTION, BROADCAST_ADDRESS,
                        make_announce(static_cast<u8>(Role::Implement), config_.capabilities));
        }

        Result<void> answer_task(TaskId id, u8 result) {
            LocalTask *t = find_task(id);
            if (!t || t->state != LocalTaskState::Offered) {
                return Result<void>::err(Error::task_not_active(id));
            }
            auto sent = send(PGN_IMPLEMENT_TO_TASK, controller_, {impl_cmd::TASK_ACK, id, result});
            if (!sent.is_ok())
                return sent;
            t->state = result == ACK_OK ? LocalTaskState::Accepted : LocalTaskState::Aborted;
            echo::category("agrinet.implement")
                .info("task ", id, result == ACK_OK ? " accepted" : " rejected");
            return {};
        }

        void go_idle() {
            link_.force(LinkState::Idle);
            alive_timer_.stop();
            controller_ = NULL_ADDRESS;
            tasks_.clear();
            on_disconnected.emit();
        }

        static bool finished(const LocalTask &t) noexcept {
            return t.state == LocalTaskState::Finished || t.state == LocalTaskState::Aborted;
        }

        // Keeps at most task_history finished tasks, oldest dropped first
        void prune_history() {
            usize done = 0;
            for (const auto &t : tasks_) {
                if (finished(t))
                    ++done;
            }
            for (auto it = tasks_.begin(); it != tasks_.end() && done > config_.task_history;) {
                if (finished(*it)) {
                    it = tasks_.erase(it);
                    --done;
                } else {
                    ++it;
                }
            }
        }

        LocalTask *find_task(TaskId id) {
            for (auto &t : tasks_) {
                if (t.id == id)
                    return &t;
            }
            return nullptr;
        }

        void handle_frame(const Frame &frame) {
            if (link_.is(LinkState::Idle))
                return;
            if (!frame.intact()) {
                echo::category("agrinet.implement").warn("dropping corrupt frame");
                return;
            }
            if (!frame.is_extended()) {
                handle_actuator(frame);
                return;
            }
            Message msg = Message::from_frame(frame);
            if (msg.source == config_.address || msg.data.empty())
                return;
            if (msg.destination != config_.address && !msg.is_broadcast())
                return;

            switch (msg.pgn) {
            case PGN_CONNECTION:
                handle_connection(msg);
                break;
            case PGN_TASK_TO_IMPLEMENT:
                if (msg.source == controller_)
                    handle_task_command(msg);
                break;
            default:
                break;
            }
        }

        void handle_connection(const Message &msg) {
            switch (msg.get_u8(0)) {
            case conn_cmd::CONNECT_ACK:
                if (msg.get_u8(1) != ACK_OK) {
                    echo::category("agrinet.implement").warn("connection refused by ", msg.source);
                    return;
                }
                if (!link_.is(LinkState::Connected)) {
                    controller_ = msg.source;
                    link_.force(LinkState::Connected);
                    echo::category("agrinet.implement").info("connected to controller ", controller_);
                    on_connected.emit(controller_);
                }
                break;
            case conn_cmd::DISCONNECT:
                if (msg.source == controller_) {
                    echo::category("agrinet.implement").info("controller closed the connection");
                    go_idle();
                }
                break;
            default:
                break;
            }
        }

        void handle_task_command(const Message &msg) {
            u8 cmd = msg.get_u8(0);
            TaskId id = msg.get_u8(1);

            if (cmd == task_cmd::TASK_START) {
                LocalTask t;
                t.id = id;
                t.expected_parameters = msg.get_u8(2);
                // The controller reuses ids: an old entry under this id is dropped.
                // A new task replaces whatever the controller ran before.
                for (auto it = tasks_.begin(); it != tasks_.end();) {
                    if (it->id == id) {
                        it = tasks_.erase(it);
                        continue;
                    }
                    if (!finished(*it))
                        it->state = LocalTaskState::Aborted;
                    ++it;
                }
                prune_history();
                tasks_.push_back(t);
                echo::category("agrinet.implement").info("task ", id, " offered");
                on_task_offered.emit(id);
                if (config_.auto_accept_tasks) {
                    auto r = accept_task(id);
                    if (!r.is_ok())
                        echo::category("agrinet.implement").warn("task ", id, " not accepted: ", r.error().message);
                }
                return;
            }

            LocalTask *t = find_task(id);
            if (!t) {
                echo::category("agrinet.implement").debug("command 0x", cmd, " for unknown task ", id);
                return;
            }

            switch (cmd) {
            case task_cmd::PARAM_DEFINE: {
                auto v = ValueFrame::parse(msg);
                if (v.has_value()) {
                    auto r = set_local_value(id, v->ddi, v->raw);
                    (void)r;
                }
                break;
            }
            case task_cmd::SET_VALUE:
                handle_set_value(*t, msg);
                break;
            case task_cmd::REQUEST_VALUE: {
                DDI ddi = msg.get_u16_le(2);
                const LocalTask::Value *v = t->find(ddi);
                auto r = v ? send(PGN_IMPLEMENT_TO_TASK, controller_,
                                  make_value_command(impl_cmd::VALUE_RESPONSE, id, ddi, v->raw))
                           : send(PGN_IMPLEMENT_TO_TASK, controller_, make_value_nack(id, ddi, ACK_REJECTED));
                (void)r;
                break;
            }
            case task_cmd::TASK_PAUSE:
                t->state = LocalTaskState::Paused;
                on_task_command.emit(id, cmd);
                break;
            case task_cmd::TASK_RESUME:
                t->state = LocalTaskState::Running;
                on_task_command.emit(id, cmd);
                break;
            case task_cmd::TASK_COMPLETE:
                t->state = LocalTaskState::Finished;
                on_task_command.emit(id, cmd);
                break;
            case task_cmd::TASK_ABORT:
                t->state = LocalTaskState::Aborted;
                on_task_command.emit(id, cmd);
                break;
            default:
                echo::category("agrinet.implement").trace("unknown task command 0x", cmd);
                break;
            }
        }

        void handle_set_value(LocalTask &t, const Message &msg) {
            auto v = ValueFrame::parse(msg);
            if (!v.has_value())
                return;
            bool accepted = !set_value_cb_ || set_value_cb_(t.id, v->ddi, v->raw);
            if (!accepted) {
                auto r = reject_value(t.id, v->ddi, ACK_REJECTED);
                (void)r;
                return;
            }
            LocalTask::Value *value = t.find(v->ddi);
            if (!value) {
                t.values.push_back({v->ddi, 0, dp::nullopt});
                value = &t.values.back();
            }
            value->pending = v->raw;
            if (config_.auto_acknowledge_values) {
                auto r = acknowledge_value(t.id, v->ddi);
                (void)r;
            }
        }

        void handle_actuator(const Frame &frame) {
            dp::Vector<u8> payload = frame.payload();
            if (payload.empty())
                return;
            u8 command = payload[0];
            dp::Vector<u8> parameters(payload.begin() + 1, payload.end());
            bool addressed = frame.id.raw == config_.actuator_id_base + config_.address;
            echo::category("agrinet.implement").debug("actuator command 0x", command, addressed ? "" : " (broadcast)");
            on_actuator_command.emit(command, parameters);
            if (addressed) {
                auto r = send(PGN_ACKNOWLEDGMENT, controller_ == NULL_ADDRESS ? BROADCAST_ADDRESS : controller_,
                              {command, ACK_OK});
                (void)r;
            }
        }

        Result<void> send(PGN pgn, Address destination, const dp::Vector<u8> &payload) {
            if (!node_.has_value()) {
                return Result<void>::err(Error::invalid_state("implement not started"));
            }
            auto frame = Frame::from_message(Priority::Default, pgn, config_.address, destination, payload);
            if (!frame.is_ok())
                return Result<void>::err(frame.error());
            return bus_.transmit(*node_, frame.value());
        }
    };

} // namespace agrinet::app
