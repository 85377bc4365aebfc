#include <agrinet.hpp>
#include <echo/echo.hpp>
#include <wirebit/can/can_endpoint.hpp>
#include <wirebit/can/socketcan_link.hpp>

using namespace agrinet;

// Mirrors the simulated bus onto a virtual CAN interface, so candump on
// vcan_agri shows the controller's traffic and cansend frames reach it.
int main() {
    echo::info("=== SocketCAN Bridge Demo ===");

    auto link_result = wirebit::SocketCanLink::create({.interface_name = "vcan_agri", .create_if_missing = true});
    if (!link_result.is_ok()) {
        echo::error("Failed to create SocketCanLink");
        return 1;
    }
    auto link = std::make_shared<wirebit::SocketCanLink>(std::move(link_result.value()));
    wirebit::CanEndpoint endpoint(std::static_pointer_cast<wirebit::Link>(link),
                                  wirebit::CanConfig{.bitrate = 250000}, 1);

    Bus bus;
    if (!bus.start().is_ok()) {
        echo::error("bus did not start");
        return 1;
    }

    CanBridge bridge(bus, endpoint, 0xF0);
    if (!bridge.attach().is_ok()) {
        echo::error("bridge did not attach");
        return 1;
    }

    IdentifierRegistry registry = IdentifierRegistry::default_layout();
    app::ApplicationEngine controller(bus, registry);
    controller.on_device_state.subscribe([](Address a, app::DeviceState s) {
        echo::info("device 0x", a, " state ", static_cast<u8>(s));
    });
    controller.on_frame(Category::Sensor, [](const Frame &f) {
        auto value = domain::decode_reading(f.payload());
        if (value.is_ok())
            echo::info("sensor 0x", f.id.raw, " reading ", value.value());
    });
    if (!controller.start().is_ok()) {
        echo::error("controller did not start");
        return 1;
    }

    for (u32 i = 0; i < 100; ++i) {
        auto relayed = bridge.process();
        if (!relayed.is_ok()) {
            echo::warn("bridge: ", relayed.error().message);
        }
        bus.cycle(100);
        controller.update(100);
        if (i % 10 == 0) {
            auto r = controller.publish_sensor_value(domain::SensorChannel::SoilMoisture, 31.0);
            (void)r;
        }
    }

    const auto &stats = bridge.statistics();
    echo::info("relayed out=", stats.to_endpoint, " in=", stats.from_endpoint, " rejected=", stats.inbound_rejected,
               " failed=", stats.outbound_failed);
    echo::info("=== SocketCAN Bridge Demo Complete ===");
    return 0;
}
