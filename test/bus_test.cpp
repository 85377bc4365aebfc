#include <doctest/doctest.h>
#include <agrinet/network/bus.hpp>
#include <atomic>
#include <thread>

using namespace agrinet;

namespace {
    Frame std_frame(u32 id, dp::Vector<u8> payload = {0x00}) {
        auto f = Frame::encode(Identifier::standard(id), payload);
        REQUIRE(f.is_ok());
        return f.value();
    }
} // namespace

TEST_CASE("Bus lifecycle") {
    SUBCASE("supported bitrates start the bus") {
        for (u32 br : {BITRATE_125K, BITRATE_250K, BITRATE_500K, BITRATE_1M}) {
            Bus bus;
            CHECK(bus.start(br).is_ok());
            CHECK(bus.is_active());
            CHECK(bus.config().bitrate == br);
        }
    }

    SUBCASE("other bitrates are refused") {
        Bus bus;
        auto r = bus.start(100000);
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::InvalidConfig);
        CHECK_FALSE(bus.is_active());
    }

    SUBCASE("transmit before start fails") {
        Bus bus;
        auto node = bus.register_node(0x10, {Filter::accept_all()});
        REQUIRE(node.is_ok());
        auto r = bus.transmit(node.value(), std_frame(0x101));
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::BusNotActive);
    }

    SUBCASE("stop discards queued frames") {
        Bus bus;
        REQUIRE(bus.start().is_ok());
        auto a = bus.register_node(0x10, {Filter::accept_all()});
        auto b = bus.register_node(0x11, {Filter::accept_all()});
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        REQUIRE(bus.transmit(a.value(), std_frame(0x101)).is_ok());
        bus.cycle(1);
        REQUIRE(bus.transmit(a.value(), std_frame(0x102)).is_ok());
        bus.stop();
        CHECK_FALSE(bus.is_active());

        REQUIRE(bus.start().is_ok());
        bus.cycle(1);
        auto polled = bus.poll(b.value());
        REQUIRE(polled.is_ok());
        CHECK(polled.value().empty());
    }
}

TEST_CASE("Bus node registration") {
    Bus bus;
    REQUIRE(bus.start().is_ok());

    auto a = bus.register_node(0x10);
    REQUIRE(a.is_ok());
    auto dup = bus.register_node(0x10);
    REQUIRE_FALSE(dup.is_ok());
    CHECK(dup.error().code == ErrorCode::AddressConflict);
    CHECK(bus.node_count() == 1);

    CHECK(bus.deregister_node(a.value()).is_ok());
    CHECK(bus.node_count() == 0);
    auto again = bus.deregister_node(a.value());
    REQUIRE_FALSE(again.is_ok());
    CHECK(again.error().code == ErrorCode::UnknownNode);

    auto unknown = bus.transmit(999, std_frame(0x101));
    REQUIRE_FALSE(unknown.is_ok());
    CHECK(unknown.error().code == ErrorCode::UnknownNode);

    CHECK(bus.register_node(0x10).is_ok());
}

TEST_CASE("Bus filtering") {
    Bus bus;
    REQUIRE(bus.start().is_ok());
    auto sender = bus.register_node(0x10, {Filter::accept_all()});
    auto receiver = bus.register_node(0x20, {Filter::exact(0x101)});
    REQUIRE(sender.is_ok());
    REQUIRE(receiver.is_ok());

    SUBCASE("non-matching frame is not delivered") {
        REQUIRE(bus.transmit(sender.value(), std_frame(0x102)).is_ok());
        bus.cycle(1);
        auto polled = bus.poll(receiver.value());
        REQUIRE(polled.is_ok());
        CHECK(polled.value().empty());
    }

    SUBCASE("matching frame is delivered exactly once") {
        REQUIRE(bus.transmit(sender.value(), std_frame(0x101, {0x19})).is_ok());
        bus.cycle(1);
        auto first = bus.poll(receiver.value());
        REQUIRE(first.is_ok());
        REQUIRE(first.value().size() == 1);
        CHECK(first.value()[0].id.raw == 0x101);
        CHECK(first.value()[0].data[0] == 0x19);
        CHECK(first.value()[0].direction == Direction::Inbound);

        auto second = bus.poll(receiver.value());
        REQUIRE(second.is_ok());
        CHECK(second.value().empty());
    }

    SUBCASE("empty filter set receives nothing") {
        REQUIRE(bus.clear_filters(receiver.value()).is_ok());
        REQUIRE(bus.transmit(sender.value(), std_frame(0x101)).is_ok());
        bus.cycle(1);
        CHECK(bus.poll(receiver.value()).value().empty());
    }

    SUBCASE("filter change applies to frames already queued") {
        REQUIRE(bus.transmit(sender.value(), std_frame(0x101)).is_ok());
        bus.cycle(1);
        REQUIRE(bus.set_filters(receiver.value(), {Filter::exact(0x300)}).is_ok());
        CHECK(bus.poll(receiver.value()).value().empty());
    }

    SUBCASE("add_filter widens the set") {
        REQUIRE(bus.add_filter(receiver.value(), Filter::range(0x200, 0x2FF)).is_ok());
        REQUIRE(bus.transmit(sender.value(), std_frame(0x210)).is_ok());
        bus.cycle(1);
        CHECK(bus.poll(receiver.value()).value().size() == 1);
    }

    SUBCASE("sender does not hear itself") {
        REQUIRE(bus.transmit(sender.value(), std_frame(0x101)).is_ok());
        bus.cycle(1);
        CHECK(bus.poll(sender.value()).value().empty());
    }
}

TEST_CASE("Bus loopback") {
    Bus bus(BusConfig{}.set_loopback(true));
    REQUIRE(bus.start().is_ok());
    auto node = bus.register_node(0x10, {Filter::accept_all()});
    REQUIRE(node.is_ok());
    REQUIRE(bus.transmit(node.value(), std_frame(0x101)).is_ok());
    bus.cycle(1);
    CHECK(bus.poll(node.value()).value().size() == 1);
}

TEST_CASE("Bus arbitration") {
    Bus bus;
    REQUIRE(bus.start().is_ok());
    auto a = bus.register_node(0x10, {Filter::accept_all()});
    auto b = bus.register_node(0x11, {Filter::accept_all()});
    auto rx = bus.register_node(0x20, {Filter::accept_all()});
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    REQUIRE(rx.is_ok());

    REQUIRE(bus.transmit(a.value(), std_frame(0x300)).is_ok());
    REQUIRE(bus.transmit(b.value(), std_frame(0x100)).is_ok());
    REQUIRE(bus.transmit(a.value(), std_frame(0x200)).is_ok());
    REQUIRE(bus.transmit(b.value(), std_frame(0x200, {0x02})).is_ok());
    CHECK(bus.cycle(1) == 4);

    auto polled = bus.poll(rx.value());
    REQUIRE(polled.is_ok());
    REQUIRE(polled.value().size() == 4);
    CHECK(polled.value()[0].id.raw == 0x100);
    CHECK(polled.value()[1].id.raw == 0x200);
    CHECK(polled.value()[1].data[0] == 0x00);
    CHECK(polled.value()[2].id.raw == 0x200);
    CHECK(polled.value()[2].data[0] == 0x02);
    CHECK(polled.value()[3].id.raw == 0x300);
}

TEST_CASE("Bus queue limits") {
    SUBCASE("full transmit queue rejects with QueueFull") {
        Bus bus(BusConfig{}.tx_capacity(2));
        REQUIRE(bus.start().is_ok());
        auto node = bus.register_node(0x10);
        REQUIRE(node.is_ok());
        CHECK(bus.transmit(node.value(), std_frame(0x101)).is_ok());
        CHECK(bus.transmit(node.value(), std_frame(0x102)).is_ok());
        auto r = bus.transmit(node.value(), std_frame(0x103));
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::QueueFull);

        auto stats = bus.node_statistics(node.value());
        REQUIRE(stats.is_ok());
        CHECK(stats.value().sent == 2);
        CHECK(stats.value().rejected == 1);
        CHECK(stats.value().tx_pending == 2);
        CHECK(bus.statistics().rejected == 1);
    }

    SUBCASE("full receive queue drops only the newest frame for that node") {
        Bus bus(BusConfig{}.rx_capacity(2));
        REQUIRE(bus.start().is_ok());
        auto sender = bus.register_node(0x10, {Filter::accept_all()});
        auto slow = bus.register_node(0x20, {Filter::accept_all()});
        auto other = bus.register_node(0x30, {Filter::exact(0x103)});
        REQUIRE(sender.is_ok());
        REQUIRE(slow.is_ok());
        REQUIRE(other.is_ok());

        REQUIRE(bus.transmit(sender.value(), std_frame(0x101)).is_ok());
        REQUIRE(bus.transmit(sender.value(), std_frame(0x102)).is_ok());
        bus.cycle(1);
        REQUIRE(bus.transmit(sender.value(), std_frame(0x103)).is_ok());
        bus.cycle(1);

        auto stats = bus.node_statistics(slow.value());
        REQUIRE(stats.is_ok());
        CHECK(stats.value().dropped == 1);
        CHECK(stats.value().received == 2);

        auto polled = bus.poll(slow.value());
        REQUIRE(polled.is_ok());
        REQUIRE(polled.value().size() == 2);
        CHECK(polled.value()[0].id.raw == 0x101);
        CHECK(polled.value()[1].id.raw == 0x102);

        auto other_polled = bus.poll(other.value());
        REQUIRE(other_polled.is_ok());
        REQUIRE(other_polled.value().size() == 1);
        CHECK(other_polled.value()[0].id.raw == 0x103);
        CHECK(bus.node_statistics(other.value()).value().dropped == 0);
        CHECK(bus.statistics().dropped == 1);
    }
}

TEST_CASE("Bus node activation") {
    Bus bus;
    REQUIRE(bus.start().is_ok());
    auto sender = bus.register_node(0x10, {Filter::accept_all()});
    auto rx = bus.register_node(0x20, {Filter::accept_all()});
    REQUIRE(sender.is_ok());
    REQUIRE(rx.is_ok());

    REQUIRE(bus.deactivate(sender.value()).is_ok());
    auto r = bus.transmit(sender.value(), std_frame(0x101));
    REQUIRE_FALSE(r.is_ok());
    CHECK(r.error().code == ErrorCode::NodeInactive);

    REQUIRE(bus.activate(sender.value()).is_ok());
    REQUIRE(bus.deactivate(rx.value()).is_ok());
    REQUIRE(bus.transmit(sender.value(), std_frame(0x101)).is_ok());
    bus.cycle(1);
    REQUIRE(bus.activate(rx.value()).is_ok());
    CHECK(bus.poll(rx.value()).value().empty());
}

TEST_CASE("Bus timestamps and statistics") {
    Bus bus;
    REQUIRE(bus.start().is_ok());
    auto a = bus.register_node(0x10, {Filter::accept_all()});
    auto b = bus.register_node(0x20, {Filter::accept_all()});
    auto c = bus.register_node(0x30, {Filter::accept_all()});
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    REQUIRE(c.is_ok());

    bus.cycle(5);
    REQUIRE(bus.transmit(a.value(), std_frame(0x101)).is_ok());
    bus.cycle(5);

    auto polled = bus.poll(b.value());
    REQUIRE(polled.is_ok());
    REQUIRE(polled.value().size() == 1);
    CHECK(polled.value()[0].timestamp_us == 10000);
    CHECK(bus.now_us() == 10000);

    auto stats = bus.statistics();
    CHECK(stats.transmitted == 1);
    CHECK(stats.delivered == 2);
    CHECK(stats.dropped == 0);
    CHECK(stats.cycles == 2);
    CHECK(stats.error_rate() == doctest::Approx(0.0));
    CHECK(bus.node_statistics(b.value()).value().polled == 1);
}

TEST_CASE("Bus concurrent traffic") {
    SUBCASE("transmit and poll run alongside delivery passes") {
        constexpr u32 PER_SENDER = 500;
        Bus bus(BusConfig{}.tx_capacity(PER_SENDER + 1).rx_capacity(2 * PER_SENDER + 1));
        REQUIRE(bus.start().is_ok());
        auto a = bus.register_node(0x10);
        auto b = bus.register_node(0x11);
        auto rx = bus.register_node(0x20, {Filter::accept_all()});
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        REQUIRE(rx.is_ok());

        std::atomic<u32> senders_done{0};
        auto sender = [&](NodeHandle node, u32 id) {
            for (u32 i = 0; i < PER_SENDER; ++i) {
                auto f = Frame::encode(Identifier::standard(id),
                                       dp::Vector<u8>{static_cast<u8>(i & 0xFF), static_cast<u8>(i >> 8)});
                CHECK(f.is_ok());
                CHECK(bus.transmit(node, f.value()).is_ok());
            }
            senders_done++;
        };

        dp::Vector<Frame> received;
        std::atomic<bool> cycling{true};
        std::thread poller([&] {
            while (cycling || received.size() < 2 * PER_SENDER) {
                auto polled = bus.poll(rx.value());
                if (!polled.is_ok())
                    break;
                for (auto &f : polled.value())
                    received.push_back(f);
                if (!cycling && polled.value().empty())
                    break;
            }
        });
        std::thread ta(sender, a.value(), 0x101);
        std::thread tb(sender, b.value(), 0x102);

        while (senders_done < 2)
            bus.cycle(1);
        ta.join();
        tb.join();
        bus.cycle(1);
        cycling = false;
        poller.join();

        // Every frame arrives exactly once and each sender's order survives
        REQUIRE(received.size() == 2 * PER_SENDER);
        u32 next_a = 0;
        u32 next_b = 0;
        for (const auto &f : received) {
            CHECK(f.intact());
            u32 seq = static_cast<u32>(f.data[0]) | (static_cast<u32>(f.data[1]) << 8);
            if (f.id.raw == 0x101) {
                CHECK(seq == next_a);
                ++next_a;
            } else {
                CHECK(seq == next_b);
                ++next_b;
            }
        }
        CHECK(next_a == PER_SENDER);
        CHECK(next_b == PER_SENDER);
        auto stats = bus.statistics();
        CHECK(stats.transmitted == 2 * PER_SENDER);
        CHECK(stats.delivered == 2 * PER_SENDER);
        CHECK(stats.dropped == 0);
    }

    SUBCASE("stop racing a transmit leaves nothing queued") {
        Bus bus;
        REQUIRE(bus.start().is_ok());
        auto tx = bus.register_node(0x10);
        auto rx = bus.register_node(0x20, {Filter::accept_all()});
        REQUIRE(tx.is_ok());
        REQUIRE(rx.is_ok());

        std::atomic<u32> attempts{0};
        std::thread sender([&] {
            while (true) {
                auto r = bus.transmit(tx.value(), std_frame(0x101));
                if (!r.is_ok() && r.error().code == ErrorCode::BusNotActive)
                    break;
                attempts++;
            }
        });
        while (attempts < 100)
            std::this_thread::yield();
        bus.stop();
        sender.join();

        REQUIRE(bus.start().is_ok());
        CHECK(bus.cycle(10) == 0);
        auto polled = bus.poll(rx.value());
        REQUIRE(polled.is_ok());
        CHECK(polled.value().empty());
    }
}
