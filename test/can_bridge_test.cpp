#include <doctest/doctest.h>
#include <agrinet/network/can_bridge.hpp>
#include <wirebit/can/can_endpoint.hpp>
#include <wirebit/link.hpp>
#include <cstring>
#include <memory>

using namespace agrinet;

// wirebit Link without hardware: records sends, replays injected CAN frames
class MockLink : public wirebit::Link {
    dp::Vector<wirebit::Frame> rx_queue_;
    dp::Vector<wirebit::Frame> tx_log_;
    usize send_limit_ = static_cast<usize>(-1);

  public:
    wirebit::Result<wirebit::Unit, wirebit::Error> send(const wirebit::Frame &frame) override {
        if (tx_log_.size() >= send_limit_)
            return wirebit::Result<wirebit::Unit, wirebit::Error>::err(wirebit::Error::timeout("tx full"));
        tx_log_.push_back(frame);
        return wirebit::Result<wirebit::Unit, wirebit::Error>::ok(wirebit::Unit{});
    }

    wirebit::Result<wirebit::Frame, wirebit::Error> recv() override {
        if (rx_queue_.empty())
            return wirebit::Result<wirebit::Frame, wirebit::Error>::err(wirebit::Error::timeout("empty"));
        wirebit::Frame f = std::move(rx_queue_[0]);
        rx_queue_.erase(rx_queue_.begin());
        return wirebit::Result<wirebit::Frame, wirebit::Error>::ok(std::move(f));
    }

    bool can_send() const override { return true; }
    bool can_recv() const override { return !rx_queue_.empty(); }
    wirebit::String name() const override { return "mock_vcan0"; }

    void inject(const can_frame &cf) {
        wirebit::Bytes payload(sizeof(can_frame));
        std::memcpy(payload.data(), &cf, sizeof(can_frame));
        rx_queue_.push_back(wirebit::make_frame(wirebit::FrameType::CAN, std::move(payload), 0, 0));
    }

    dp::Vector<can_frame> transmitted() const {
        dp::Vector<can_frame> result;
        for (const auto &f : tx_log_) {
            if (f.payload.size() == sizeof(can_frame)) {
                can_frame cf;
                std::memcpy(&cf, f.payload.data(), sizeof(can_frame));
                result.push_back(cf);
            }
        }
        return result;
    }

    usize tx_count() const { return tx_log_.size(); }

    // Sends beyond the first n fail
    void limit_sends(usize n) { send_limit_ = n; }
};

namespace {
    can_frame standard_can(u32 id, dp::Vector<u8> data) {
        can_frame cf = {};
        cf.can_id = id & CAN_SFF_MASK;
        cf.can_dlc = static_cast<u8>(data.size());
        for (usize i = 0; i < data.size() && i < 8; ++i)
            cf.data[i] = data[i];
        return cf;
    }
} // namespace

TEST_CASE("CanBridge frame conversion") {
    SUBCASE("extended frames carry the EFF flag") {
        auto f = Frame::from_message(Priority::Default, PGN_TASK_TO_IMPLEMENT, 0xF7, 0x10, {0x10, 0x01, 0x01});
        REQUIRE(f.is_ok());
        can_frame cf = CanBridge::to_can_frame(f.value());
        CHECK((cf.can_id & CAN_EFF_FLAG) != 0);
        CHECK((cf.can_id & CAN_EFF_MASK) == 0x18CB10F7);
        CHECK(cf.can_dlc == 8);
        CHECK(cf.data[0] == 0x10);
        CHECK(cf.data[3] == 0xFF);
    }

    SUBCASE("standard frames keep their length") {
        auto f = Frame::encode(Identifier::standard(0x101), dp::Vector<u8>{0x0A, 0x0B, 0x0C});
        REQUIRE(f.is_ok());
        can_frame cf = CanBridge::to_can_frame(f.value());
        CHECK((cf.can_id & CAN_EFF_FLAG) == 0);
        CHECK(cf.can_id == 0x101);
        CHECK(cf.can_dlc == 3);
    }

    SUBCASE("inbound frames get a fresh integrity tag") {
        auto back = CanBridge::from_can_frame(standard_can(0x101, {0x0A, 0x0B, 0x0C}));
        REQUIRE(back.is_ok());
        CHECK(back.value().intact());
        CHECK_FALSE(back.value().is_extended());
        CHECK(back.value().id.raw == 0x101);
        CHECK(back.value().payload() == dp::Vector<u8>{0x0A, 0x0B, 0x0C});

        auto original = Frame::encode(Identifier::standard(0x101), dp::Vector<u8>{0x0A, 0x0B, 0x0C});
        REQUIRE(original.is_ok());
        CHECK(back.value().tag == original.value().tag);
    }

    SUBCASE("oversized length is rejected") {
        can_frame cf = standard_can(0x101, {0x01});
        cf.can_dlc = 9;
        auto r = CanBridge::from_can_frame(cf);
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::InvalidPayload);
    }
}

TEST_CASE("CanBridge relays between bus and endpoint") {
    Bus bus;
    REQUIRE(bus.start().is_ok());

    auto link = std::make_shared<MockLink>();
    wirebit::CanEndpoint ep(link, wirebit::CanConfig{}, 1);
    CanBridge bridge(bus, ep, 0xF0);

    auto peer = bus.register_node(0x10, {Filter::accept_all()});
    REQUIRE(peer.is_ok());

    CHECK_FALSE(bridge.process().is_ok());
    REQUIRE(bridge.attach().is_ok());
    CHECK(bridge.attached());
    CHECK_FALSE(bridge.attach().is_ok());

    SUBCASE("bus frames go out through the endpoint") {
        auto f = Frame::from_message(Priority::Default, PGN_CONNECTION, 0x10, BROADCAST_ADDRESS, {0x01, 0x03});
        REQUIRE(f.is_ok());
        REQUIRE(bus.transmit(peer.value(), f.value()).is_ok());
        bus.cycle(10);

        REQUIRE(bridge.process().is_ok());
        auto sent = link->transmitted();
        REQUIRE(sent.size() == 1);
        CHECK((sent[0].can_id & CAN_EFF_MASK) == 0x18D0FF10);
        CHECK(sent[0].data[0] == 0x01);
        CHECK(bridge.statistics().to_endpoint == 1);
    }

    SUBCASE("endpoint frames are transmitted on the bus") {
        link->inject(standard_can(0x101, {0x29, 0x09, 0x00, 0x00}));
        REQUIRE(bridge.process().is_ok());
        CHECK(bridge.statistics().from_endpoint == 1);

        bus.cycle(10);
        auto polled = bus.poll(peer.value());
        REQUIRE(polled.is_ok());
        REQUIRE(polled.value().size() == 1);
        const Frame &f = polled.value()[0];
        CHECK(f.id.raw == 0x101);
        CHECK(f.intact());
        CHECK(f.length == 4);
        CHECK(f.data[0] == 0x29);

        // The bridge does not hear its own relay
        REQUIRE(bridge.process().is_ok());
        CHECK(link->tx_count() == 0);
    }

    SUBCASE("failed sends do not stop the rest of the pass") {
        link->limit_sends(1);
        for (u8 i = 0; i < 3; ++i) {
            auto f = Frame::encode(Identifier::standard(0x201), dp::Vector<u8>{i});
            REQUIRE(f.is_ok());
            REQUIRE(bus.transmit(peer.value(), f.value()).is_ok());
        }
        link->inject(standard_can(0x101, {0x01}));
        bus.cycle(10);

        auto r = bridge.process();
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::DriverError);
        CHECK(link->tx_count() == 1);
        CHECK(bridge.statistics().to_endpoint == 1);
        CHECK(bridge.statistics().outbound_failed == 2);
        CHECK(bridge.statistics().from_endpoint == 1);

        // Nothing is retried on the next pass
        CHECK(bridge.process().is_ok());
        CHECK(bridge.statistics().outbound_failed == 2);
    }

    SUBCASE("detach leaves the bus") {
        CHECK(bus.node_count() == 2);
        REQUIRE(bridge.detach().is_ok());
        CHECK_FALSE(bridge.attached());
        CHECK(bus.node_count() == 1);
        CHECK_FALSE(bridge.detach().is_ok());
    }
}
