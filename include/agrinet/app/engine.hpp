#pragma once

#include "../addressing/registry.hpp"
#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/frame.hpp"
#include "../core/message.hpp"
#include "../domain/sensor_channels.hpp"
#include "../network/bus.hpp"
#include "../network/filter.hpp"
#include "../pgn_defs.hpp"
#include "../util/event.hpp"
#include "../util/timer.hpp"
#include "device_registry.hpp"
#include "operator_router.hpp"
#include "process_data.hpp"
#include "protocol.hpp"
#include "task.hpp"
#include <chrono>
#include <condition_variable>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>
#include <functional>
#include <mutex>

namespace agrinet::app {

    // ─── Engine configuration ────────────────────────────────────────────────────
    struct EngineConfig {
        Address address = 0xF7;
        u32 liveness_ms = LIVENESS_WINDOW_MS;
        u32 address_hold_ms = ADDRESS_HOLD_MS;
        u32 request_timeout_ms = REQUEST_TIMEOUT_MS;
        usize error_log_capacity = 64;
        usize task_history = 32;
        u32 settled_retention_ms = REQUEST_TIMEOUT_MS;
        usize settled_capacity = 64;

        EngineConfig &set_address(Address a) {
            address = a;
            return *this;
        }
        EngineConfig &liveness(u32 ms) {
            liveness_ms = ms;
            return *this;
        }
        EngineConfig &address_hold(u32 ms) {
            address_hold_ms = ms;
            return *this;
        }
        EngineConfig &request_timeout(u32 ms) {
            request_timeout_ms = ms;
            return *this;
        }
        EngineConfig &error_log(usize capacity) {
            error_log_capacity = capacity;
            return *this;
        }
        EngineConfig &history(usize n) {
            task_history = n;
            return *this;
        }
        // Answered or expired requests nobody collects are released after this
        // long, or once more than `capacity` of them are held
        EngineConfig &settled(u32 retention_ms, usize capacity) {
            settled_retention_ms = retention_ms;
            settled_capacity = capacity;
            return *this;
        }
    };

    // ─── Recorded protocol error (frame-level failures never stop the engine) ────
    struct ErrorRecord {
        ErrorCode code = ErrorCode::Ok;
        dp::String message;
        u64 timestamp_us = 0;
    };

    // ─── Actuator command awaiting its acknowledgment ────────────────────────────
    struct PendingCommand {
        Address address = NULL_ADDRESS;
        u8 command = 0;
    };

    enum class RequestState : u8 { Pending, Resolved, TimedOut, Cancelled, Rejected };

    // ─── Application protocol engine ─────────────────────────────────────────────
    // Drives the controller side of the protocol: device discovery and liveness,
    // task lifecycle, process-data exchange, operator-interface routing and the
    // sensor/actuator adapter. All protocol work happens inside update(); only
    // await_parameter() may be called from another thread.
    class ApplicationEngine {
        struct PendingRequest {
            RequestId id = 0;
            TaskId task = 0;
            DDI ddi = 0;
            Address implement = NULL_ADDRESS;
            RequestState state = RequestState::Pending;
            f64 value = 0.0;
            u32 waiters = 0;
            Timeout timeout;
        };

        Bus &bus_;
        IdentifierRegistry &registry_;
        EngineConfig config_;
        dp::Optional<NodeHandle> node_;

        DeviceRegistry devices_;
        dp::Vector<Task> tasks_;
        TaskId next_task_ = 1;
        OperatorRouter router_;

        struct CycleFrame {
            Category category = Category::Unclassified;
            Frame frame;
        };

        dp::Array<Event<const Frame &>, 4> frame_events_;
        dp::Vector<CycleFrame> cycle_frames_;

        dp::Vector<PendingCommand> pending_commands_;

        mutable std::mutex requests_mutex_;
        std::condition_variable requests_cv_;
        dp::Vector<PendingRequest> requests_;
        RequestId next_request_ = 1;

        dp::Vector<ErrorRecord> errors_;
        u64 error_count_ = 0;

      public:
        ApplicationEngine(Bus &bus, IdentifierRegistry &registry, EngineConfig config = {})
            : bus_(bus), registry_(registry), config_(config), devices_(config.liveness_ms, config.address_hold_ms) {
            devices_.on_state_change.subscribe([this](Address a, DeviceState s) { on_device_state.emit(a, s); });
        }

        ApplicationEngine(const ApplicationEngine &) = delete;
        ApplicationEngine &operator=(const ApplicationEngine &) = delete;

        ~ApplicationEngine() {
            if (node_.has_value()) {
                auto r = bus_.deregister_node(*node_);
                (void)r;
            }
        }

        // Freezes the registry and joins the bus with filters for our address,
        // broadcasts and every standard range the registry knows.
        Result<void> start() {
            if (node_.has_value()) {
                return Result<void>::err(Error::invalid_state("engine already started"));
            }
            registry_.freeze();

            dp::Vector<Filter> filters;
            filters.push_back(Filter::destination(config_.address));
            filters.push_back(Filter::destination(BROADCAST_ADDRESS));
            for (const auto &r : registry_.ranges()) {
                if (r.format == IdFormat::Standard) {
                    filters.push_back(Filter::range(r.low, r.high, IdFormat::Standard));
                }
            }

            auto handle = bus_.register_node(config_.address, std::move(filters));
            if (!handle.is_ok()) {
                echo::category("agrinet.engine").error("start failed: ", handle.error().message);
                return Result<void>::err(handle.error());
            }
            node_ = handle.value();
            echo::category("agrinet.engine").info("engine started at address ", config_.address);
            return {};
        }

        Result<void> stop() {
            if (!node_.has_value()) {
                return Result<void>::err(Error::invalid_state("engine not started"));
            }
            for (auto &t : tasks_) {
                if (!t.terminal()) {
                    auto r = send_task_command(t, task_cmd::TASK_ABORT);
                    (void)r;
                    set_task_state(t, TaskState::Aborted, true);
                }
            }
            cancel_all_requests();
            pending_commands_.clear();
            auto r = bus_.deregister_node(*node_);
            node_ = dp::nullopt;
            echo::category("agrinet.engine").info("engine stopped");
            return r;
        }

        bool running() const noexcept { return node_.has_value(); }
        Address address() const noexcept { return config_.address; }
        const EngineConfig &config() const noexcept { return config_; }

        // ─── Update loop ─────────────────────────────────────────────────────────
        // Drains our node, processes every frame, advances liveness, address
        // reservations and request timeouts, then notifies frame subscribers.
        void update(u32 elapsed_ms) {
            if (!node_.has_value())
                return;

            auto polled = bus_.poll(*node_);
            if (!polled.is_ok()) {
                record_error(polled.error());
                return;
            }
            for (const auto &frame : polled.value()) {
                process_frame(frame);
            }

            for (Address lost : devices_.update(elapsed_ms)) {
                echo::category("agrinet.engine.devices").warn("device ", lost, " silent, disconnecting");
                record_error(Error::timeout("device " + dp::String(std::to_string(lost)) + " liveness expired"));
                handle_device_lost(lost);
            }

            expire_requests(elapsed_ms);
            prune_history();

            dp::Vector<CycleFrame> batch;
            batch.swap(cycle_frames_);
            for (const auto &entry : batch) {
                frame_events_[static_cast<usize>(entry.category)].emit(entry.frame);
            }
        }

        // ─── Devices ─────────────────────────────────────────────────────────────
        const dp::Vector<DeviceRecord> &devices() const noexcept { return devices_.devices(); }

        DeviceState device_state(Address address) const {
            const auto *d = devices_.find(address);
            if (d)
                return d->state;
            return devices_.is_reserved(address) ? DeviceState::Disconnected : DeviceState::Unknown;
        }

        bool address_reserved(Address address) const noexcept { return devices_.is_reserved(address); }

        Result<void> disconnect_device(Address address) {
            if (!devices_.find(address)) {
                return Result<void>::err(Error::unknown_address(address));
            }
            auto sent = send(PGN_CONNECTION, address, make_command(conn_cmd::DISCONNECT, 0));
            if (!sent.is_ok()) {
                echo::category("agrinet.engine.devices").warn("disconnect notice to ", address, " not sent");
            }
            handle_device_lost(address);
            return {};
        }

        // ─── Tasks ───────────────────────────────────────────────────────────────
        // A still-running task on the same implement is aborted first.
        Result<TaskId> start_task(Address implement, dp::Vector<ProcessDataParameter> parameters) {
            if (!node_.has_value()) {
                return Result<TaskId>::err(Error::invalid_state("engine not started"));
            }
            const auto *device = devices_.find(implement);
            if (!device || !device->online()) {
                return Result<TaskId>::err(Error::unknown_address(implement));
            }
            if (device->role != Role::Implement) {
                return Result<TaskId>::err(
                    Error::invalid_state("device " + dp::String(std::to_string(implement)) + " is not an implement"));
            }
            if (parameters.size() > 0xFF) {
                return Result<TaskId>::err(Error::out_of_range("too many parameters"));
            }

            dp::Vector<i32> raws;
            for (const auto &p : parameters) {
                if (!p.definition.in_range(p.value)) {
                    return Result<TaskId>::err(Error::out_of_range(p.definition.name + " outside [" +
                                                                   dp::String(std::to_string(p.definition.low)) + ", " +
                                                                   dp::String(std::to_string(p.definition.high)) + "]"));
                }
                auto raw = p.definition.to_raw(p.value);
                if (!raw.is_ok())
                    return Result<TaskId>::err(raw.error());
                raws.push_back(raw.value());
            }

            auto id = allocate_task_id();
            if (!id.is_ok())
                return id;

            for (auto &t : tasks_) {
                if (t.implement == implement && !t.terminal()) {
                    echo::category("agrinet.engine.tasks").info("task ", t.id, " superseded by task ", id.value());
                    auto r = send_task_command(t, task_cmd::TASK_ABORT);
                    (void)r;
                    set_task_state(t, TaskState::Aborted, true);
                }
            }

            auto sent = send(PGN_TASK_TO_IMPLEMENT, implement,
                             {task_cmd::TASK_START, id.value(), static_cast<u8>(parameters.size())});
            if (!sent.is_ok()) {
                return Result<TaskId>::err(sent.error());
            }

            tasks_.emplace_back(id.value(), implement, std::move(parameters));
            Task &task = tasks_.back();
            echo::category("agrinet.engine.tasks")
                .info("task ", task.id, " requested on implement ", implement, " with ", task.parameters.size(),
                      " parameters");
            on_task_state.emit(task.id, TaskState::Requested);

            for (usize i = 0; i < task.parameters.size(); ++i) {
                auto def = send(PGN_TASK_TO_IMPLEMENT, implement,
                                make_value_command(task_cmd::PARAM_DEFINE, task.id, task.parameters[i].ddi(), raws[i]));
                if (!def.is_ok()) {
                    find_task(id.value())->machine.force(TaskState::Aborted);
                    on_task_state.emit(id.value(), TaskState::Aborted);
                    return Result<TaskId>::err(def.error());
                }
            }
            return id;
        }

        Result<void> pause_task(TaskId id) { return command_task(id, task_cmd::TASK_PAUSE, TaskState::Suspended); }
        Result<void> resume_task(TaskId id) { return command_task(id, task_cmd::TASK_RESUME, TaskState::Running); }
        Result<void> complete_task(TaskId id) { return command_task(id, task_cmd::TASK_COMPLETE, TaskState::Completed); }
        Result<void> abort_task(TaskId id) { return command_task(id, task_cmd::TASK_ABORT, TaskState::Aborted); }

        const Task *task(TaskId id) const {
            for (const auto &t : tasks_) {
                if (t.id == id)
                    return &t;
            }
            return nullptr;
        }

        Result<TaskState> task_state(TaskId id) const {
            const auto *t = task(id);
            if (!t)
                return Result<TaskState>::err(Error::task_not_active(id));
            return Result<TaskState>::ok(t->state());
        }

        const dp::Vector<Task> &tasks() const noexcept { return tasks_; }

        usize active_task_count() const noexcept {
            usize n = 0;
            for (const auto &t : tasks_) {
                if (!t.terminal())
                    ++n;
            }
            return n;
        }

        // ─── Process data ────────────────────────────────────────────────────────
        // Sends the new value; the stored value changes once the implement echoes it.
        Result<void> set_parameter(TaskId id, DDI ddi, f64 value) {
            Task *t = find_task(id);
            if (!t || !accepts_process_data(t->state())) {
                return Result<void>::err(Error::task_not_active(id));
            }
            ProcessDataParameter *p = t->find(ddi);
            if (!p) {
                return Result<void>::err(
                    Error(ErrorCode::UnknownParameter, "ddi " + dp::String(std::to_string(ddi)) + " not in task"));
            }
            if (!p->definition.in_range(value)) {
                return Result<void>::err(Error::out_of_range(p->definition.name + " = " +
                                                             dp::String(std::to_string(value)) + " outside [" +
                                                             dp::String(std::to_string(p->definition.low)) + ", " +
                                                             dp::String(std::to_string(p->definition.high)) + "]"));
            }
            auto raw = p->definition.to_raw(value);
            if (!raw.is_ok())
                return Result<void>::err(raw.error());

            auto sent = send(PGN_TASK_TO_IMPLEMENT, t->implement,
                             make_value_command(task_cmd::SET_VALUE, id, ddi, raw.value()));
            if (!sent.is_ok())
                return sent;

            p->pending = value;
            p->pending_raw = raw.value();
            echo::category("agrinet.engine.tasks")
                .debug("task ", id, " ", p->definition.name, " -> ", value, " (raw ", raw.value(), "), awaiting ack");
            return {};
        }

        Result<void> set_parameter(TaskId id, const dp::String &name, f64 value) {
            auto ddi = resolve_parameter(id, name);
            if (!ddi.is_ok())
                return Result<void>::err(ddi.error());
            return set_parameter(id, ddi.value(), value);
        }

        Result<f64> parameter_value(TaskId id, const dp::String &name) const {
            auto ddi = resolve_parameter(id, name);
            if (!ddi.is_ok())
                return Result<f64>::err(ddi.error());
            return parameter_value(id, ddi.value());
        }

        Result<f64> parameter_value(TaskId id, DDI ddi) const {
            const Task *t = task(id);
            if (!t)
                return Result<f64>::err(Error::task_not_active(id));
            const ProcessDataParameter *p = t->find(ddi);
            if (!p) {
                return Result<f64>::err(
                    Error(ErrorCode::UnknownParameter, "ddi " + dp::String(std::to_string(ddi)) + " not in task"));
            }
            return Result<f64>::ok(p->value);
        }

        // Asks the implement for its current value. The answer arrives through
        // update(); collect it with await_parameter() or poll_parameter().
        Result<RequestId> request_parameter(TaskId id, DDI ddi) {
            Task *t = find_task(id);
            if (!t || !accepts_process_data(t->state())) {
                return Result<RequestId>::err(Error::task_not_active(id));
            }
            if (!t->find(ddi)) {
                return Result<RequestId>::err(
                    Error(ErrorCode::UnknownParameter, "ddi " + dp::String(std::to_string(ddi)) + " not in task"));
            }
            auto sent = send(PGN_TASK_TO_IMPLEMENT, t->implement, make_value_request(id, ddi));
            if (!sent.is_ok())
                return Result<RequestId>::err(sent.error());

            std::lock_guard<std::mutex> lock(requests_mutex_);
            PendingRequest req;
            req.id = next_request_++;
            if (next_request_ == 0)
                next_request_ = 1;
            req.task = id;
            req.ddi = ddi;
            req.implement = t->implement;
            req.timeout.start(config_.request_timeout_ms);
            requests_.push_back(req);
            return Result<RequestId>::ok(req.id);
        }

        // Blocks until the response arrives, the request times out or is cancelled,
        // or timeout_ms passes. Any outcome other than Pending releases the request.
        Result<f64> await_parameter(RequestId id, u32 timeout_ms) {
            std::unique_lock<std::mutex> lock(requests_mutex_);
            PendingRequest *req = find_request(id);
            if (!req) {
                return Result<f64>::err(Error::invalid_state("unknown request " + dp::String(std::to_string(id))));
            }
            req->waiters++;
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
            requests_cv_.wait_until(lock, deadline, [&] {
                const PendingRequest *r = find_request(id);
                return !r || r->state != RequestState::Pending;
            });
            req = find_request(id);
            if (!req) {
                return Result<f64>::err(Error::cancelled("request " + dp::String(std::to_string(id)) + " released"));
            }
            req->waiters--;
            if (req->state == RequestState::Pending) {
                req->state = RequestState::TimedOut;
            }
            return take_result(id);
        }

        // Non-blocking: nullopt while the response is outstanding
        Result<dp::Optional<f64>> poll_parameter(RequestId id) {
            std::lock_guard<std::mutex> lock(requests_mutex_);
            PendingRequest *req = find_request(id);
            if (!req) {
                return Result<dp::Optional<f64>>::err(
                    Error::invalid_state("unknown request " + dp::String(std::to_string(id))));
            }
            if (req->state == RequestState::Pending) {
                return Result<dp::Optional<f64>>::ok(dp::Optional<f64>{});
            }
            auto r = take_result(id);
            if (!r.is_ok())
                return Result<dp::Optional<f64>>::err(r.error());
            return Result<dp::Optional<f64>>::ok(dp::Optional<f64>{r.value()});
        }

        Result<void> cancel_request(RequestId id) {
            std::lock_guard<std::mutex> lock(requests_mutex_);
            PendingRequest *req = find_request(id);
            if (!req) {
                return Result<void>::err(Error::invalid_state("unknown request " + dp::String(std::to_string(id))));
            }
            if (req->state != RequestState::Pending) {
                return Result<void>::err(Error::invalid_state("request already settled"));
            }
            cancel_locked(*req);
            requests_cv_.notify_all();
            return {};
        }

        // Threads currently blocked in await_parameter()
        usize waiting() const {
            std::lock_guard<std::mutex> lock(requests_mutex_);
            usize n = 0;
            for (const auto &r : requests_)
                n += r.waiters;
            return n;
        }

        usize pending_requests() const {
            std::lock_guard<std::mutex> lock(requests_mutex_);
            usize n = 0;
            for (const auto &r : requests_) {
                if (r.state == RequestState::Pending)
                    ++n;
            }
            return n;
        }

        // ─── Operator interface ──────────────────────────────────────────────────
        Result<void> register_operator_handler(u16 object_id, OperatorRouter::Handler handler) {
            return router_.register_handler(object_id, std::move(handler));
        }

        bool unregister_operator_handler(u16 object_id) { return router_.unregister_handler(object_id); }

        // Routes one operator-interface frame; NoHandler is recorded and returned
        Result<void> route_message(const Frame &frame) {
            auto r = router_.route_message(frame);
            if (!r.is_ok())
                record_error(r.error());
            return r;
        }

        Result<void> send_operator_message(Address destination, u8 function, u16 object_id, i32 value) {
            OperatorMessage msg;
            msg.function = function;
            msg.object_id = object_id;
            msg.value = value;
            return send(PGN_ECU_TO_TERMINAL, destination, msg.encode());
        }

        const OperatorRouter &router() const noexcept { return router_; }

        // ─── Sensor / actuator adapter ───────────────────────────────────────────
        Result<void> publish_sensor_reading(u8 channel, const dp::Vector<u8> &payload) {
            if (!node_.has_value()) {
                return Result<void>::err(Error::invalid_state("engine not started"));
            }
            auto id = registry_.standard_id(Category::Sensor, channel);
            if (!id.is_ok())
                return Result<void>::err(id.error());
            auto frame = Frame::encode(id.value(), payload);
            if (!frame.is_ok())
                return Result<void>::err(frame.error());
            return bus_.transmit(*node_, frame.value());
        }

        Result<void> publish_sensor_value(domain::SensorChannel channel, f64 value) {
            auto payload = domain::encode_reading(value);
            if (!payload.is_ok())
                return Result<void>::err(payload.error());
            return publish_sensor_reading(static_cast<u8>(channel), payload.value());
        }

        // Broadcast commands are not acknowledged and are not tracked
        Result<void> issue_actuator_command(Address target, u8 command, const dp::Vector<u8> &parameters = {}) {
            if (!node_.has_value()) {
                return Result<void>::err(Error::invalid_state("engine not started"));
            }
            if (parameters.size() + 1 > CAN_DATA_LENGTH) {
                return Result<void>::err(Error::invalid_payload(static_cast<isize>(parameters.size() + 1)));
            }
            if (target != BROADCAST_ADDRESS) {
                const auto *d = devices_.find(target);
                if (!d || !d->online())
                    return Result<void>::err(Error::unknown_address(target));
            }
            auto id = registry_.standard_id(Category::Actuator, target);
            if (!id.is_ok())
                return Result<void>::err(id.error());

            dp::Vector<u8> payload;
            payload.push_back(command);
            for (u8 b : parameters)
                payload.push_back(b);
            auto frame = Frame::encode(id.value(), payload);
            if (!frame.is_ok())
                return Result<void>::err(frame.error());
            auto sent = bus_.transmit(*node_, frame.value());
            if (!sent.is_ok())
                return sent;

            if (target != BROADCAST_ADDRESS) {
                pending_commands_.push_back({target, command});
            }
            echo::category("agrinet.engine").debug("actuator command 0x", command, " -> ", target);
            return {};
        }

        const dp::Vector<PendingCommand> &pending_acknowledgments() const noexcept { return pending_commands_; }

        // Handler runs once per update() with each frame of that category
        ListenerToken on_frame(Category category, std::function<void(const Frame &)> handler) {
            return frame_events_[static_cast<usize>(category)].subscribe(std::move(handler));
        }

        bool remove_frame_handler(Category category, ListenerToken token) {
            return frame_events_[static_cast<usize>(category)].unsubscribe(token);
        }

        // ─── Error log ───────────────────────────────────────────────────────────
        const dp::Vector<ErrorRecord> &errors() const noexcept { return errors_; }
        u64 error_count() const noexcept { return error_count_; }
        void clear_errors() { errors_.clear(); }

        usize error_count(ErrorCode code) const noexcept {
            usize n = 0;
            for (const auto &e : errors_) {
                if (e.code == code)
                    ++n;
            }
            return n;
        }

        // ─── Events ──────────────────────────────────────────────────────────────
        Event<Address, DeviceState> on_device_state;
        Event<TaskId, TaskState> on_task_state;
        Event<TaskId, DDI, f64> on_parameter_confirmed;
        Event<TaskId, DDI, u8> on_parameter_rejected;
        Event<Address, u8, bool> on_command_ack;
        Event<const ErrorRecord &> on_error;

      private:
        // ─── Inbound path ────────────────────────────────────────────────────────
        void process_frame(const Frame &frame) {
            auto decoded = Frame::decode(frame);
            if (!decoded.is_ok()) {
                record_error(decoded.error());
                return;
            }
            auto category = registry_.classify_frame(frame);
            if (!category.is_ok()) {
                record_error(category.error());
                return;
            }
            cycle_frames_.push_back({category.value(), frame});

            if (category.value() != Category::SystemControl || !frame.is_extended())
                return;
            Message msg = Message::from_frame(frame);
            if (msg.source == config_.address)
                return;
            if (msg.destination != config_.address && !msg.is_broadcast())
                return;
            if (msg.data.empty())
                return;

            devices_.touch(msg.source);

            switch (msg.pgn) {
            case PGN_CONNECTION:
                handle_connection(msg);
                break;
            case PGN_IMPLEMENT_TO_TASK:
                handle_implement(msg);
                break;
            case PGN_ACKNOWLEDGMENT:
                handle_command_ack(msg);
                break;
            case PGN_TERMINAL_TO_ECU: {
                auto r = route_message(frame);
                (void)r;
                break;
            }
            default:
                echo::category("agrinet.engine").trace("unhandled pgn 0x", msg.pgn, " from ", msg.source);
                break;
            }
        }

        void handle_connection(const Message &msg) {
            switch (msg.get_u8(0)) {
            case conn_cmd::ANNOUNCE:
                handle_announce(msg);
                break;
            case conn_cmd::DISCONNECT:
                if (devices_.find(msg.source)) {
                    echo::category("agrinet.engine.devices").info("device ", msg.source, " disconnected");
                    handle_device_lost(msg.source);
                }
                break;
            case conn_cmd::ALIVE:
                break;
            default:
                echo::category("agrinet.engine").trace("unknown connection command from ", msg.source);
                break;
            }
        }

        void handle_announce(const Message &msg) {
            auto role = registry_.resolve_role(msg.source);
            if (!role.is_ok()) {
                record_error(role.error());
                return;
            }
            if (role.value() == Role::Broadcast) {
                record_error(Error::invalid_state("announce from broadcast address"));
                return;
            }
            u16 caps = msg.size() >= 4 ? msg.get_u16_le(2) : 0;

            if (const auto *existing = devices_.find(msg.source); existing && existing->online()) {
                // Repeated announce: the implement missed our ack
                auto r = send(PGN_CONNECTION, msg.source, make_command(conn_cmd::CONNECT_ACK, ACK_OK));
                if (!r.is_ok())
                    record_error(r.error());
                return;
            }

            auto device = devices_.discover(msg.source, role.value(), caps);
            if (!device.is_ok()) {
                record_error(device.error());
                return;
            }
            auto r = send(PGN_CONNECTION, msg.source, make_command(conn_cmd::CONNECT_ACK, ACK_OK));
            if (!r.is_ok()) {
                record_error(r.error());
                return;
            }
            auto s = devices_.set_state(msg.source, DeviceState::Connected);
            (void)s;
        }

        void handle_implement(const Message &msg) {
            const auto *device = devices_.find(msg.source);
            if (!device || !device->online()) {
                record_error(Error::unknown_address(msg.source));
                return;
            }
            u8 cmd = msg.get_u8(0);
            TaskId id = msg.get_u8(1);
            Task *t = find_task(id);
            if (!t || t->implement != msg.source) {
                record_error(Error::task_not_active(id));
                return;
            }

            switch (cmd) {
            case impl_cmd::TASK_ACK:
                handle_task_ack(*t, msg.get_u8(2));
                break;
            case impl_cmd::TASK_STATUS:
                handle_task_status(*t, msg.get_u8(2));
                break;
            case impl_cmd::VALUE_ACK:
            case impl_cmd::VALUE_RESPONSE:
            case impl_cmd::VALUE_NACK:
                handle_value(*t, msg);
                break;
            default:
                echo::category("agrinet.engine").trace("unknown implement command 0x", cmd, " from ", msg.source);
                break;
            }
        }

        void handle_task_ack(Task &t, u8 result) {
            if (!t.machine.is(TaskState::Requested)) {
                echo::category("agrinet.engine.tasks").debug("duplicate ack for task ", t.id);
                return;
            }
            if (result == ACK_OK) {
                set_task_state(t, TaskState::Assigned, false);
            } else {
                echo::category("agrinet.engine.tasks").warn("implement ", t.implement, " rejected task ", t.id);
                set_task_state(t, TaskState::Aborted, false);
            }
        }

        void handle_task_status(Task &t, u8 status) {
            if (t.terminal()) {
                record_error(Error::task_not_active(t.id));
                return;
            }
            switch (static_cast<TaskStatus>(status)) {
            case TaskStatus::Running:
                if (t.machine.is(TaskState::Assigned))
                    set_task_state(t, TaskState::Running, false);
                break;
            case TaskStatus::Finished:
                set_task_state(t, TaskState::Completed, false);
                break;
            case TaskStatus::Fault:
                echo::category("agrinet.engine.tasks").warn("implement ", t.implement, " reports fault on task ", t.id);
                set_task_state(t, TaskState::Aborted, false);
                break;
            default:
                echo::category("agrinet.engine.tasks").trace("unknown task status ", status);
                break;
            }
        }

        void handle_value(Task &t, const Message &msg) {
            if (!accepts_process_data(t.state())) {
                record_error(Error::task_not_active(t.id));
                return;
            }
            u8 cmd = msg.get_u8(0);
            DDI ddi = msg.get_u16_le(2);
            ProcessDataParameter *p = t.find(ddi);
            if (!p) {
                record_error(Error(ErrorCode::UnknownParameter,
                                   "ddi " + dp::String(std::to_string(ddi)) + " not in task " +
                                       dp::String(std::to_string(t.id))));
                return;
            }

            if (cmd == impl_cmd::VALUE_NACK) {
                u8 reason = msg.get_u8(4);
                p->pending = dp::nullopt;
                echo::category("agrinet.engine.tasks")
                    .warn("task ", t.id, " ", p->definition.name, " rejected, reason ", reason);
                reject_request(t.id, ddi, t.implement);
                on_parameter_rejected.emit(t.id, ddi, reason);
                return;
            }

            auto value = ValueFrame::parse(msg);
            if (!value.has_value()) {
                record_error(Error::invalid_payload(static_cast<isize>(msg.size())));
                return;
            }

            if (cmd == impl_cmd::VALUE_ACK) {
                if (!p->pending.has_value() || p->pending_raw != value->raw) {
                    record_error(Error::invalid_state("unexpected acknowledgment for " + p->definition.name));
                    return;
                }
                p->value = *p->pending;
                p->pending = dp::nullopt;
                echo::category("agrinet.engine.tasks").info("task ", t.id, " ", p->definition.name, " = ", p->value);
                on_parameter_confirmed.emit(t.id, ddi, p->value);
                return;
            }

            resolve_request(t.id, ddi, t.implement, p->definition.from_raw(value->raw));
        }

        void handle_command_ack(const Message &msg) {
            u8 command = msg.get_u8(0);
            bool ok = msg.get_u8(1) == ACK_OK;
            for (auto it = pending_commands_.begin(); it != pending_commands_.end(); ++it) {
                if (it->address == msg.source && it->command == command) {
                    pending_commands_.erase(it);
                    on_command_ack.emit(msg.source, command, ok);
                    return;
                }
            }
            echo::category("agrinet.engine").debug("untracked acknowledgment from ", msg.source);
        }

        // Removes the device, aborts its tasks and releases its requests
        void handle_device_lost(Address address) {
            auto removed = devices_.remove(address);
            (void)removed;
            for (auto &t : tasks_) {
                if (t.implement == address && !t.terminal()) {
                    set_task_state(t, TaskState::Aborted, true);
                }
            }
            for (auto it = pending_commands_.begin(); it != pending_commands_.end();) {
                if (it->address == address)
                    it = pending_commands_.erase(it);
                else
                    ++it;
            }
            {
                std::lock_guard<std::mutex> lock(requests_mutex_);
                for (auto &r : requests_) {
                    if (r.implement == address && r.state == RequestState::Pending)
                        r.state = RequestState::Cancelled;
                }
                release_unwatched();
            }
            requests_cv_.notify_all();
        }

        // ─── Task helpers ────────────────────────────────────────────────────────
        Result<DDI> resolve_parameter(TaskId id, const dp::String &name) const {
            const Task *t = task(id);
            if (!t)
                return Result<DDI>::err(Error::task_not_active(id));
            const ProcessDataParameter *p = t->find(name);
            if (!p)
                return Result<DDI>::err(Error(ErrorCode::UnknownParameter, "no parameter named " + name));
            return Result<DDI>::ok(p->ddi());
        }

        Task *find_task(TaskId id) {
            for (auto &t : tasks_) {
                if (t.id == id)
                    return &t;
            }
            return nullptr;
        }

        Result<TaskId> allocate_task_id() {
            for (usize attempt = 0; attempt < 0xFF; ++attempt) {
                TaskId candidate = next_task_;
                next_task_ = next_task_ == 0xFE ? 1 : static_cast<TaskId>(next_task_ + 1);
                if (!task(candidate))
                    return Result<TaskId>::ok(candidate);
            }
            // Every id is taken: reuse the oldest finished one
            for (auto it = tasks_.begin(); it != tasks_.end(); ++it) {
                if (it->terminal()) {
                    TaskId reused = it->id;
                    tasks_.erase(it);
                    return Result<TaskId>::ok(reused);
                }
            }
            return Result<TaskId>::err(Error::invalid_state("no free task id"));
        }

        Result<void> send_task_command(const Task &t, u8 cmd) {
            return send(PGN_TASK_TO_IMPLEMENT, t.implement, make_command(cmd, t.id));
        }

        Result<void> command_task(TaskId id, u8 cmd, TaskState to) {
            Task *t = find_task(id);
            if (!t || t->terminal()) {
                return Result<void>::err(Error::task_not_active(id));
            }
            if (!t->machine.can_transition(to)) {
                return Result<void>::err(Error::invalid_state("task " + dp::String(std::to_string(id)) + " is " +
                                                              to_string(t->state()) + ", cannot become " +
                                                              to_string(to)));
            }
            auto sent = send_task_command(*t, cmd);
            if (!sent.is_ok())
                return sent;
            set_task_state(*t, to, false);
            return {};
        }

        void set_task_state(Task &t, TaskState to, bool forced) {
            TaskState from = t.state();
            if (from == to)
                return;
            if (forced) {
                t.machine.force(to);
            } else if (!t.machine.transition(to).is_ok()) {
                record_error(Error::invalid_state("task " + dp::String(std::to_string(t.id)) + " " + to_string(from) +
                                                  " -> " + to_string(to) + " refused"));
                return;
            }
            echo::category("agrinet.engine.tasks").info("task ", t.id, " ", to_string(from), " -> ", to_string(to));

            if (is_terminal(to)) {
                std::lock_guard<std::mutex> lock(requests_mutex_);
                for (auto &r : requests_) {
                    if (r.task == t.id && r.state == RequestState::Pending)
                        r.state = RequestState::Cancelled;
                }
                release_unwatched();
                requests_cv_.notify_all();
            }

            Address implement = t.implement;
            TaskId id = t.id;
            refresh_device(implement);
            on_task_state.emit(id, to);
        }

        // Active while the implement holds an acknowledged, unfinished task
        void refresh_device(Address implement) {
            const auto *d = devices_.find(implement);
            if (!d || !d->online())
                return;
            bool busy = false;
            for (const auto &t : tasks_) {
                if (t.implement == implement && accepts_process_data(t.state()))
                    busy = true;
            }
            auto r = devices_.set_state(implement, busy ? DeviceState::Active : DeviceState::Connected);
            (void)r;
        }

        void prune_history() {
            usize finished = 0;
            for (const auto &t : tasks_) {
                if (t.terminal())
                    ++finished;
            }
            for (auto it = tasks_.begin(); it != tasks_.end() && finished > config_.task_history;) {
                if (it->terminal()) {
                    it = tasks_.erase(it);
                    --finished;
                } else {
                    ++it;
                }
            }
        }

        // ─── Request helpers (requests_mutex_ held unless noted) ─────────────────
        PendingRequest *find_request(RequestId id) {
            for (auto &r : requests_) {
                if (r.id == id)
                    return &r;
            }
            return nullptr;
        }

        Result<f64> take_result(RequestId id) {
            PendingRequest *req = find_request(id);
            RequestState state = req->state;
            f64 value = req->value;
            erase_request(id);
            switch (state) {
            case RequestState::Resolved:
                return Result<f64>::ok(value);
            case RequestState::Cancelled:
                return Result<f64>::err(Error::cancelled("request " + dp::String(std::to_string(id)) + " cancelled"));
            case RequestState::Rejected:
                return Result<f64>::err(
                    Error::cancelled("request " + dp::String(std::to_string(id)) + " rejected by the implement"));
            default:
                return Result<f64>::err(Error::timeout("request " + dp::String(std::to_string(id)) + " timed out"));
            }
        }

        void erase_request(RequestId id) {
            for (auto it = requests_.begin(); it != requests_.end(); ++it) {
                if (it->id == id) {
                    requests_.erase(it);
                    return;
                }
            }
        }

        void cancel_locked(PendingRequest &req) {
            req.state = RequestState::Cancelled;
            echo::category("agrinet.engine").debug("request ", req.id, " cancelled");
            release_unwatched();
        }

        // Cancelled requests nobody waits on hold no matching state
        void release_unwatched() {
            for (auto it = requests_.begin(); it != requests_.end();) {
                if (it->state == RequestState::Cancelled && it->waiters == 0)
                    it = requests_.erase(it);
                else
                    ++it;
            }
        }

        // Settled requests keep their outcome for settled_retention_ms so a
        // caller can still collect it
        void settle_locked(PendingRequest &req, RequestState state) {
            req.state = state;
            req.timeout.start(config_.settled_retention_ms);
        }

        // Oldest first, skipping entries someone waits on
        void trim_settled() {
            usize settled = 0;
            for (const auto &r : requests_) {
                if (r.state != RequestState::Pending && r.waiters == 0)
                    ++settled;
            }
            for (auto it = requests_.begin(); it != requests_.end() && settled > config_.settled_capacity;) {
                if (it->state != RequestState::Pending && it->waiters == 0) {
                    it = requests_.erase(it);
                    --settled;
                } else {
                    ++it;
                }
            }
        }

        // Takes the lock itself
        bool settle_request(TaskId task_id, DDI ddi, Address implement, RequestState state, f64 value) {
            bool matched = false;
            {
                std::lock_guard<std::mutex> lock(requests_mutex_);
                for (auto &r : requests_) {
                    if (r.state == RequestState::Pending && r.task == task_id && r.ddi == ddi &&
                        r.implement == implement) {
                        r.value = value;
                        settle_locked(r, state);
                        matched = true;
                        break;
                    }
                }
                if (matched)
                    trim_settled();
            }
            if (matched)
                requests_cv_.notify_all();
            return matched;
        }

        void resolve_request(TaskId task_id, DDI ddi, Address implement, f64 value) {
            if (!settle_request(task_id, ddi, implement, RequestState::Resolved, value)) {
                echo::category("agrinet.engine").debug("unsolicited value for task ", task_id, " ddi ", ddi);
            }
        }

        void reject_request(TaskId task_id, DDI ddi, Address implement) {
            if (settle_request(task_id, ddi, implement, RequestState::Rejected, 0.0)) {
                echo::category("agrinet.engine").debug("request for task ", task_id, " ddi ", ddi, " rejected");
            }
        }

        // Takes the lock itself
        void expire_requests(u32 elapsed_ms) {
            dp::Vector<RequestId> expired;
            {
                std::lock_guard<std::mutex> lock(requests_mutex_);
                for (auto it = requests_.begin(); it != requests_.end();) {
                    if (it->state == RequestState::Pending) {
                        if (it->timeout.update(elapsed_ms)) {
                            settle_locked(*it, RequestState::TimedOut);
                            expired.push_back(it->id);
                        }
                    } else if (it->waiters == 0 && it->timeout.update(elapsed_ms)) {
                        echo::category("agrinet.engine").debug("request ", it->id, " released uncollected");
                        it = requests_.erase(it);
                        continue;
                    }
                    ++it;
                }
                trim_settled();
            }
            if (expired.empty())
                return;
            requests_cv_.notify_all();
            for (RequestId id : expired) {
                record_error(Error::timeout("request " + dp::String(std::to_string(id)) + " timed out"));
            }
        }

        // Takes the lock itself
        void cancel_all_requests() {
            {
                std::lock_guard<std::mutex> lock(requests_mutex_);
                for (auto &r : requests_) {
                    if (r.state == RequestState::Pending)
                        r.state = RequestState::Cancelled;
                }
                release_unwatched();
            }
            requests_cv_.notify_all();
        }

        // ─── Outbound path ───────────────────────────────────────────────────────
        Result<void> send(PGN pgn, Address destination, const dp::Vector<u8> &payload,
                          Priority prio = Priority::Default) {
            if (!node_.has_value()) {
                return Result<void>::err(Error::invalid_state("engine not started"));
            }
            auto frame = Frame::from_message(prio, pgn, config_.address, destination, payload);
            if (!frame.is_ok())
                return Result<void>::err(frame.error());
            return bus_.transmit(*node_, frame.value());
        }

        void record_error(const Error &error) {
            ErrorRecord rec;
            rec.code = error.code;
            rec.message = error.message;
            rec.timestamp_us = bus_.now_us();
            if (config_.error_log_capacity > 0) {
                if (errors_.size() >= config_.error_log_capacity)
                    errors_.erase(errors_.begin());
                errors_.push_back(rec);
            }
            error_count_++;
            echo::category("agrinet.engine").warn(to_string(error.code), ": ", error.message);
            on_error.emit(rec);
        }
    };

} // namespace agrinet::app
