#include <doctest/doctest.h>
#include <agrinet.hpp>

using namespace agrinet;
using namespace agrinet::app;

namespace {
    constexpr Address TC = 0xF7;
    constexpr Address IMPL = 0x10;

    ProcessDataDefinition rate_definition() {
        return ProcessDataDefinition{ddi::SETPOINT_APPLICATION_RATE, "applicationRate", "l/ha", 0.0, 120.0, 0.01};
    }

    // Controller and implement on one simulated bus
    struct Field {
        Bus bus;
        IdentifierRegistry registry = IdentifierRegistry::default_layout();
        ApplicationEngine engine;
        ImplementClient implement;

        explicit Field(ImplementConfig impl_config = {}, EngineConfig engine_config = {})
            : engine(bus, registry, engine_config), implement(bus, impl_config) {
            REQUIRE(bus.start().is_ok());
            REQUIRE(engine.start().is_ok());
            REQUIRE(implement.start().is_ok());
        }

        void step(u32 ms = 10) {
            implement.update(ms);
            bus.cycle(ms);
            engine.update(ms);
            bus.cycle(0);
        }

        void run(u32 total_ms, u32 tick_ms = 10) {
            for (u32 t = 0; t < total_ms; t += tick_ms)
                step(tick_ms);
        }

        void connect() {
            run(30);
            REQUIRE(implement.connected());
            REQUIRE(engine.device_state(IMPL) == DeviceState::Connected);
        }

        TaskId start_task(f64 rate = 80.0) {
            auto id = engine.start_task(IMPL, {ProcessDataParameter(rate_definition(), rate)});
            REQUIRE(id.is_ok());
            run(30);
            return id.value();
        }
    };
} // namespace

TEST_CASE("Implement announces and connects") {
    Field field;
    dp::Vector<DeviceState> states;
    field.engine.on_device_state.subscribe([&](Address a, DeviceState s) {
        if (a == IMPL)
            states.push_back(s);
    });
    Address connected_to = NULL_ADDRESS;
    field.implement.on_connected.subscribe([&](Address a) { connected_to = a; });

    CHECK(field.implement.state() == LinkState::Announcing);
    field.connect();

    CHECK(connected_to == TC);
    CHECK(field.implement.controller() == TC);
    REQUIRE(states.size() == 2);
    CHECK(states[0] == DeviceState::Discovered);
    CHECK(states[1] == DeviceState::Connected);

    const auto &devices = field.engine.devices();
    REQUIRE(devices.size() == 1);
    CHECK(devices[0].role == Role::Implement);
    CHECK(devices[0].has(capability::PROCESS_DATA));
    CHECK(field.engine.error_count() == 0);
}

TEST_CASE("Alive messages keep the implement online") {
    Field field;
    field.connect();

    field.run(10000, 100);
    CHECK(field.engine.device_state(IMPL) == DeviceState::Connected);
    CHECK(field.implement.connected());
    CHECK(field.engine.error_count(ErrorCode::Timeout) == 0);
}

TEST_CASE("Silent implement is dropped and its task aborted") {
    Field field;
    field.connect();
    TaskId id = field.start_task();
    REQUIRE(field.engine.task_state(id).value() == TaskState::Assigned);

    // The implement stops talking; only the controller side keeps running
    for (u32 t = 0; t < 3100; t += 100) {
        field.bus.cycle(100);
        field.engine.update(100);
    }
    CHECK(field.engine.device_state(IMPL) == DeviceState::Disconnected);
    CHECK(field.engine.address_reserved(IMPL));
    CHECK(field.engine.task_state(id).value() == TaskState::Aborted);
    CHECK(field.engine.error_count(ErrorCode::Timeout) == 1);
}

TEST_CASE("Task with an application rate") {
    Field field;
    field.connect();

    dp::Vector<TaskState> states;
    field.engine.on_task_state.subscribe([&](TaskId, TaskState s) { states.push_back(s); });

    TaskId id = field.start_task(80.0);
    CHECK(field.engine.task_state(id).value() == TaskState::Assigned);
    CHECK(field.engine.device_state(IMPL) == DeviceState::Active);
    REQUIRE(states.size() == 2);
    CHECK(states[0] == TaskState::Requested);
    CHECK(states[1] == TaskState::Assigned);

    const LocalTask *local = field.implement.task(id);
    REQUIRE(local != nullptr);
    CHECK(local->state == LocalTaskState::Accepted);
    CHECK(local->expected_parameters == 1);
    CHECK(field.implement.value(id, ddi::SETPOINT_APPLICATION_RATE).value() == 8000);

    SUBCASE("value outside the range is refused locally") {
        auto r = field.engine.set_parameter(id, dp::String("applicationRate"), 150.0);
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::OutOfRange);
        field.run(30);
        CHECK(field.engine.parameter_value(id, dp::String("applicationRate")).value() == doctest::Approx(80.0));
        CHECK(field.implement.value(id, ddi::SETPOINT_APPLICATION_RATE).value() == 8000);
    }

    SUBCASE("value inside the range is applied after the acknowledgment") {
        f64 confirmed = 0.0;
        field.engine.on_parameter_confirmed.subscribe([&](TaskId, DDI, f64 v) { confirmed = v; });

        REQUIRE(field.engine.set_parameter(id, dp::String("applicationRate"), 95.0).is_ok());
        CHECK(field.engine.parameter_value(id, dp::String("applicationRate")).value() == doctest::Approx(80.0));

        field.run(30);
        CHECK(confirmed == doctest::Approx(95.0));
        CHECK(field.engine.parameter_value(id, dp::String("applicationRate")).value() == doctest::Approx(95.0));
        CHECK(field.implement.value(id, ddi::SETPOINT_APPLICATION_RATE).value() == 9500);
    }

    SUBCASE("implement reports its measured value on request") {
        REQUIRE(field.implement.set_local_value(id, ddi::SETPOINT_APPLICATION_RATE, 8750).is_ok());
        auto req = field.engine.request_parameter(id, ddi::SETPOINT_APPLICATION_RATE);
        REQUIRE(req.is_ok());
        field.run(30);

        auto polled = field.engine.poll_parameter(req.value());
        REQUIRE(polled.is_ok());
        REQUIRE(polled.value().has_value());
        CHECK(*polled.value() == doctest::Approx(87.5));
        CHECK(field.engine.pending_requests() == 0);
    }

    SUBCASE("run, pause, resume and complete") {
        REQUIRE(field.implement.send_status(id, TaskStatus::Running).is_ok());
        field.run(30);
        CHECK(field.engine.task_state(id).value() == TaskState::Running);

        REQUIRE(field.engine.pause_task(id).is_ok());
        field.run(30);
        CHECK(field.implement.task(id)->state == LocalTaskState::Paused);

        REQUIRE(field.engine.resume_task(id).is_ok());
        field.run(30);
        CHECK(field.implement.task(id)->state == LocalTaskState::Running);

        REQUIRE(field.engine.complete_task(id).is_ok());
        field.run(30);
        CHECK(field.engine.task_state(id).value() == TaskState::Completed);
        CHECK(field.implement.task(id)->state == LocalTaskState::Finished);
        CHECK(field.engine.device_state(IMPL) == DeviceState::Connected);

        auto late = field.engine.set_parameter(id, ddi::SETPOINT_APPLICATION_RATE, 90.0);
        REQUIRE_FALSE(late.is_ok());
        CHECK(late.error().code == ErrorCode::TaskNotActive);
    }

    SUBCASE("second task supersedes the first") {
        TaskId second = field.start_task(60.0);
        CHECK(field.engine.task_state(id).value() == TaskState::Aborted);
        CHECK(field.engine.task_state(second).value() == TaskState::Assigned);
        CHECK(field.implement.task(id)->state == LocalTaskState::Aborted);
        CHECK(field.engine.active_task_count() == 1);
    }

    CHECK(field.engine.error_count() == 0);
}

TEST_CASE("Task ids wrap around on a long session") {
    Field field;
    field.connect();

    usize stuck = 0;
    dp::Vector<TaskId> seen;
    for (i32 round = 0; round < 300; ++round) {
        TaskId id = field.start_task(50.0);
        seen.push_back(id);
        if (field.engine.task_state(id).value() != TaskState::Assigned)
            ++stuck;
        REQUIRE(field.engine.abort_task(id).is_ok());
        field.run(30);
    }
    CHECK(stuck == 0);
    CHECK(seen[254] == seen[0]);

    // Values land on the task that now owns the id
    TaskId id = field.start_task(70.0);
    CHECK(field.engine.task_state(id).value() == TaskState::Assigned);
    REQUIRE(field.engine.set_parameter(id, ddi::SETPOINT_APPLICATION_RATE, 65.0).is_ok());
    field.run(30);
    CHECK(field.engine.parameter_value(id, ddi::SETPOINT_APPLICATION_RATE).value() == doctest::Approx(65.0));
    CHECK(field.implement.task(id)->state == LocalTaskState::Accepted);
    CHECK(field.implement.value(id, ddi::SETPOINT_APPLICATION_RATE).value() == 6500);

    CHECK(field.implement.tasks().size() <= ImplementConfig{}.task_history + 1);
    CHECK(field.engine.error_count() == 0);
}

TEST_CASE("Implement rejecting values and tasks") {
    SUBCASE("set-value callback refuses the value") {
        Field field;
        field.implement.on_set_value([](TaskId, DDI, i32 raw) { return raw <= 10000; });
        field.connect();
        TaskId id = field.start_task();

        u8 reason = 0;
        bool rejected = false;
        field.engine.on_parameter_rejected.subscribe([&](TaskId, DDI, u8 r) {
            rejected = true;
            reason = r;
        });

        REQUIRE(field.engine.set_parameter(id, ddi::SETPOINT_APPLICATION_RATE, 110.0).is_ok());
        field.run(30);
        CHECK(rejected);
        CHECK(reason == ACK_REJECTED);
        CHECK(field.engine.parameter_value(id, ddi::SETPOINT_APPLICATION_RATE).value() == doctest::Approx(80.0));

        REQUIRE(field.engine.set_parameter(id, ddi::SETPOINT_APPLICATION_RATE, 100.0).is_ok());
        field.run(30);
        CHECK(field.engine.parameter_value(id, ddi::SETPOINT_APPLICATION_RATE).value() == doctest::Approx(100.0));
    }

    SUBCASE("manual acknowledgment") {
        Field field(ImplementConfig{}.auto_acknowledge(false));
        field.connect();
        TaskId id = field.start_task();

        REQUIRE(field.engine.set_parameter(id, ddi::SETPOINT_APPLICATION_RATE, 95.0).is_ok());
        field.run(30);
        CHECK(field.engine.parameter_value(id, ddi::SETPOINT_APPLICATION_RATE).value() == doctest::Approx(80.0));

        REQUIRE(field.implement.acknowledge_value(id, ddi::SETPOINT_APPLICATION_RATE).is_ok());
        field.run(30);
        CHECK(field.engine.parameter_value(id, ddi::SETPOINT_APPLICATION_RATE).value() == doctest::Approx(95.0));
        CHECK_FALSE(field.implement.acknowledge_value(id, ddi::SETPOINT_APPLICATION_RATE).is_ok());
    }

    SUBCASE("task refused by the implement") {
        Field field(ImplementConfig{}.auto_accept(false));
        TaskId offered = 0;
        field.implement.on_task_offered.subscribe([&](TaskId t) { offered = t; });
        field.connect();

        TaskId id = field.start_task();
        CHECK(offered == id);
        CHECK(field.engine.task_state(id).value() == TaskState::Requested);

        REQUIRE(field.implement.reject_task(id).is_ok());
        field.run(30);
        CHECK(field.engine.task_state(id).value() == TaskState::Aborted);
        CHECK(field.implement.task(id)->state == LocalTaskState::Aborted);
    }
}

TEST_CASE("Actuator commands are acknowledged by the implement") {
    Field field;
    field.connect();

    u8 received = 0;
    u16 rate = 0;
    field.implement.on_actuator_command.subscribe([&](u8 cmd, const dp::Vector<u8> &params) {
        received = cmd;
        rate = domain::parse_rate(params);
    });
    dp::Vector<bool> acks;
    field.engine.on_command_ack.subscribe([&](Address a, u8 cmd, bool ok) {
        CHECK(a == IMPL);
        CHECK(cmd == domain::actuator_cmd::SET_RATE);
        acks.push_back(ok);
    });

    REQUIRE(field.engine.issue_actuator_command(IMPL, domain::actuator_cmd::SET_RATE, domain::rate_parameters(750))
                .is_ok());
    CHECK(field.engine.pending_acknowledgments().size() == 1);

    field.run(30);
    CHECK(received == domain::actuator_cmd::SET_RATE);
    CHECK(rate == 750);
    REQUIRE(acks.size() == 1);
    CHECK(acks[0]);
    CHECK(field.engine.pending_acknowledgments().empty());

    SUBCASE("broadcast command reaches the implement without an ack") {
        received = 0;
        REQUIRE(field.engine.issue_actuator_command(BROADCAST_ADDRESS, domain::actuator_cmd::STOP).is_ok());
        field.run(30);
        CHECK(received == domain::actuator_cmd::STOP);
        CHECK(acks.size() == 1);
        CHECK(field.engine.pending_acknowledgments().empty());
    }
}

TEST_CASE("Disconnect in both directions") {
    SUBCASE("implement leaves") {
        Field field;
        field.connect();
        TaskId id = field.start_task();

        REQUIRE(field.implement.disconnect().is_ok());
        CHECK(field.implement.state() == LinkState::Idle);
        field.run(30);

        CHECK(field.engine.device_state(IMPL) == DeviceState::Disconnected);
        CHECK(field.engine.address_reserved(IMPL));
        CHECK(field.engine.task_state(id).value() == TaskState::Aborted);

        // Re-announcing during the hold period is refused
        REQUIRE(field.implement.start().is_ok());
        field.run(30);
        CHECK_FALSE(field.implement.connected());
        CHECK(field.engine.error_count(ErrorCode::AddressReserved) >= 1);

        // After the hold period the periodic announce gets through
        field.run(ADDRESS_HOLD_MS + ALIVE_INTERVAL_MS, 100);
        CHECK(field.implement.connected());
        CHECK(field.engine.device_state(IMPL) == DeviceState::Connected);
    }

    SUBCASE("controller closes the link") {
        Field field;
        field.connect();
        bool closed = false;
        field.implement.on_disconnected.subscribe([&]() { closed = true; });

        REQUIRE(field.engine.disconnect_device(IMPL).is_ok());
        field.run(30);
        CHECK(closed);
        CHECK(field.implement.state() == LinkState::Idle);
        CHECK(field.engine.device_state(IMPL) == DeviceState::Disconnected);
    }
}
