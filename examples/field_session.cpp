#include <agrinet.hpp>
#include <echo/echo.hpp>

using namespace agrinet;
using namespace agrinet::app;

int main() {
    echo::info("=== Field Session Demo ===");

    Bus bus(BusConfig{}.set_bitrate(BITRATE_250K));
    if (!bus.start().is_ok()) {
        echo::error("bus did not start");
        return 1;
    }

    IdentifierRegistry registry = IdentifierRegistry::default_layout();
    ApplicationEngine controller(bus, registry, EngineConfig{}.set_address(0xF7));
    ImplementClient sprayer(bus, ImplementConfig{}.set_address(0x10).caps(capability::PROCESS_DATA |
                                                                          capability::SECTION_CONTROL));

    controller.on_device_state.subscribe([](Address a, DeviceState s) {
        echo::info("device 0x", a, " state ", static_cast<u8>(s));
    });
    controller.on_task_state.subscribe([](TaskId id, TaskState s) {
        echo::info("task ", id, " state ", static_cast<u8>(s));
    });
    controller.on_parameter_confirmed.subscribe([](TaskId id, DDI ddi, f64 value) {
        echo::info("task ", id, " ddi ", ddi, " confirmed at ", value);
    });
    sprayer.on_actuator_command.subscribe([](u8 cmd, const dp::Vector<u8> &params) {
        echo::info("sprayer actuator command ", cmd, " rate ", domain::parse_rate(params));
    });

    if (!controller.start().is_ok() || !sprayer.start().is_ok()) {
        echo::error("participants did not join the bus");
        return 1;
    }

    auto tick = [&](u32 ms) {
        sprayer.update(ms);
        bus.cycle(ms);
        controller.update(ms);
        bus.cycle(0);
    };

    for (int i = 0; i < 5; ++i)
        tick(10);

    auto rate = standard_definition(ddi::SETPOINT_APPLICATION_RATE);
    if (!rate.has_value()) {
        echo::error("no definition for the application rate");
        return 1;
    }
    auto task = controller.start_task(0x10, {ProcessDataParameter(*rate, 80.0)});
    if (!task.is_ok()) {
        echo::error("task not started: ", task.error().message);
        return 1;
    }
    for (int i = 0; i < 5; ++i)
        tick(10);

    auto refused = controller.set_parameter(task.value(), dp::String("applicationRate"), 150.0);
    if (!refused.is_ok()) {
        echo::warn("150 l/ha refused: ", refused.error().message);
    }
    auto applied = controller.set_parameter(task.value(), dp::String("applicationRate"), 95.0);
    if (!applied.is_ok()) {
        echo::error("set failed: ", applied.error().message);
    }

    auto cmd = controller.issue_actuator_command(0x10, domain::actuator_cmd::SET_RATE, domain::rate_parameters(950));
    if (!cmd.is_ok()) {
        echo::error("actuator command failed: ", cmd.error().message);
    }

    for (u32 t = 0; t < 2000; t += 100) {
        auto reading = controller.publish_sensor_value(domain::SensorChannel::Temperature, 21.5 + t / 1000.0);
        (void)reading;
        tick(100);
    }

    auto value = controller.parameter_value(task.value(), dp::String("applicationRate"));
    if (value.is_ok()) {
        echo::info("applicationRate now ", value.value(), " l/ha");
    }

    auto done = controller.abort_task(task.value());
    (void)done;
    auto left = sprayer.disconnect();
    (void)left;
    for (int i = 0; i < 3; ++i)
        tick(10);

    auto stats = bus.statistics();
    echo::info("bus load ", bus.load() * 100.0, "% delivered=", stats.delivered, " errors=", controller.error_count());
    echo::info("=== Field Session Demo Complete ===");
    return 0;
}
