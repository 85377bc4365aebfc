#include <doctest/doctest.h>
#include <agrinet/app/operator_router.hpp>

using namespace agrinet;
using namespace agrinet::app;

namespace {
    Frame operator_frame(u8 function, u16 object_id, i32 value, Address src = 0x26, Address dst = 0xF7) {
        OperatorMessage msg;
        msg.function = function;
        msg.object_id = object_id;
        msg.value = value;
        auto f = Frame::from_message(Priority::Default, PGN_TERMINAL_TO_ECU, src, dst, msg.encode());
        REQUIRE(f.is_ok());
        return f.value();
    }
} // namespace

TEST_CASE("OperatorMessage codec") {
    Frame f = operator_frame(op_cmd::NUMERIC_VALUE_CHANGE, 0x1234, -42);
    auto decoded = OperatorMessage::decode(f);
    REQUIRE(decoded.is_ok());
    CHECK(decoded.value().source == 0x26);
    CHECK(decoded.value().destination == 0xF7);
    CHECK(decoded.value().function == op_cmd::NUMERIC_VALUE_CHANGE);
    CHECK(decoded.value().object_id == 0x1234);
    CHECK(decoded.value().value == -42);

    SUBCASE("other PGNs are not operator messages") {
        auto other = Frame::from_message(Priority::Default, PGN_CONNECTION, 0x26, 0xF7, dp::Vector<u8>{0x01});
        REQUIRE(other.is_ok());
        CHECK_FALSE(OperatorMessage::decode(other.value()).is_ok());
    }

    SUBCASE("standard frames are not operator messages") {
        auto s = Frame::encode(Identifier::standard(0x101), dp::Vector<u8>{0x01, 0x02, 0x03});
        REQUIRE(s.is_ok());
        CHECK_FALSE(OperatorMessage::decode(s.value()).is_ok());
    }
}

TEST_CASE("OperatorRouter dispatch") {
    OperatorRouter router;
    dp::Vector<u16> hits;

    REQUIRE(router.register_handler(100, [&](const OperatorMessage &m) { hits.push_back(m.object_id); }).is_ok());
    CHECK(router.has_handler(100));

    SUBCASE("registered identifier is routed") {
        CHECK(router.route_message(operator_frame(op_cmd::SOFT_KEY_ACTIVATION, 100, 1)).is_ok());
        REQUIRE(hits.size() == 1);
        CHECK(hits[0] == 100);
        CHECK(router.routed() == 1);
    }

    SUBCASE("unknown identifier fails with NoHandler") {
        auto r = router.route_message(operator_frame(op_cmd::SOFT_KEY_ACTIVATION, 200, 1));
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::NoHandler);
        CHECK(hits.empty());
        CHECK(router.unhandled() == 1);
    }

    SUBCASE("re-registration replaces the handler") {
        i32 replaced = 0;
        REQUIRE(router.register_handler(100, [&](const OperatorMessage &) { ++replaced; }).is_ok());
        CHECK(router.route_message(operator_frame(op_cmd::BUTTON_ACTIVATION, 100, 0)).is_ok());
        CHECK(replaced == 1);
        CHECK(hits.empty());
    }

    SUBCASE("unregister") {
        CHECK(router.unregister_handler(100));
        CHECK_FALSE(router.unregister_handler(100));
        auto r = router.route_message(operator_frame(op_cmd::SOFT_KEY_ACTIVATION, 100, 1));
        REQUIRE_FALSE(r.is_ok());
        CHECK(r.error().code == ErrorCode::NoHandler);
    }

    SUBCASE("null handler is refused") {
        CHECK_FALSE(router.register_handler(300, nullptr).is_ok());
        CHECK_FALSE(router.has_handler(300));
    }
}
