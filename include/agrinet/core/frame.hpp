#pragma once

#include "../util/crc.hpp"
#include "error.hpp"
#include "identifier.hpp"
#include "types.hpp"
#include <datapod/datapod.hpp>

namespace agrinet {

    // ─── Decoded frame content (the wire identity of a frame) ────────────────────
    struct DecodedFrame {
        Identifier id;
        dp::Vector<u8> payload;

        bool operator==(const DecodedFrame &other) const noexcept {
            return id == other.id && payload == other.payload;
        }
    };

    // ─── Bus frame (0..8 data bytes) ─────────────────────────────────────────────
    // Direction and timestamp are transport metadata. They take no part in the
    // integrity tag or the wire image, so encoding the same identifier and payload
    // always yields the same frame.
    struct Frame {
        Identifier id;
        dp::Array<u8, 8> data = {};
        u8 length = 0;
        u16 tag = 0;
        Direction direction = Direction::Outbound;
        u64 timestamp_us = 0;

        Frame() = default;

        static Result<Frame> encode(Identifier identifier, const u8 *payload, isize len) {
            if (len < 0 || len > static_cast<isize>(CAN_DATA_LENGTH)) {
                return Result<Frame>::err(Error::invalid_payload(len));
            }
            if (!identifier.valid()) {
                return Result<Frame>::err(Error::invalid_identifier(identifier.raw));
            }
            Frame f;
            f.id = identifier;
            f.length = static_cast<u8>(len);
            for (u8 i = 0; i < f.length; ++i) {
                f.data[i] = payload[i];
            }
            f.tag = f.compute_tag();
            return Result<Frame>::ok(f);
        }

        static Result<Frame> encode(Identifier identifier, const dp::Vector<u8> &payload) {
            return encode(identifier, payload.data(), static_cast<isize>(payload.size()));
        }

        // Application message: J1939-style extended identifier, padded with 0xFF
        static Result<Frame> from_message(Priority prio, PGN pgn, Address src, Address dst,
                                          const dp::Vector<u8> &payload) {
            if (payload.size() > CAN_DATA_LENGTH) {
                return Result<Frame>::err(Error::invalid_payload(static_cast<isize>(payload.size())));
            }
            dp::Vector<u8> padded(CAN_DATA_LENGTH, 0xFF);
            for (usize i = 0; i < payload.size(); ++i) {
                padded[i] = payload[i];
            }
            return encode(Identifier::encode(prio, pgn, src, dst), padded);
        }

        static Result<DecodedFrame> decode(const Frame &frame) {
            if (frame.length > CAN_DATA_LENGTH) {
                return Result<DecodedFrame>::err(Error::invalid_payload(frame.length));
            }
            if (!frame.id.valid()) {
                return Result<DecodedFrame>::err(Error::invalid_identifier(frame.id.raw));
            }
            if (frame.tag != frame.compute_tag()) {
                return Result<DecodedFrame>::err(Error::corrupt_frame());
            }
            DecodedFrame out;
            out.id = frame.id;
            out.payload = frame.payload();
            return Result<DecodedFrame>::ok(std::move(out));
        }

        // ─── Wire image: [flags][id:4 LE][dlc][data...][tag:2 LE] ───────────────
        dp::Vector<u8> to_wire() const {
            dp::Vector<u8> out;
            out.reserve(WIRE_HEADER_SIZE + length + WIRE_TAG_SIZE);
            out.push_back(static_cast<u8>(id.format));
            for (u32 i = 0; i < 4; ++i) {
                out.push_back(static_cast<u8>((id.raw >> (i * 8)) & 0xFF));
            }
            out.push_back(length);
            for (u8 i = 0; i < length && i < CAN_DATA_LENGTH; ++i) {
                out.push_back(data[i]);
            }
            out.push_back(static_cast<u8>(tag & 0xFF));
            out.push_back(static_cast<u8>((tag >> 8) & 0xFF));
            return out;
        }

        static Result<Frame> from_wire(const dp::Vector<u8> &bytes) {
            if (bytes.size() < WIRE_HEADER_SIZE + WIRE_TAG_SIZE) {
                return Result<Frame>::err(Error::corrupt_frame("wire image too short"));
            }
            if (bytes[0] > static_cast<u8>(IdFormat::Extended)) {
                return Result<Frame>::err(Error::corrupt_frame("unknown identifier format"));
            }
            u8 dlc = bytes[5];
            if (dlc > CAN_DATA_LENGTH) {
                return Result<Frame>::err(Error::invalid_payload(dlc));
            }
            if (bytes.size() != WIRE_HEADER_SIZE + dlc + WIRE_TAG_SIZE) {
                return Result<Frame>::err(Error::corrupt_frame("wire length does not match dlc"));
            }

            Frame f;
            f.id.format = static_cast<IdFormat>(bytes[0]);
            f.id.raw = static_cast<u32>(bytes[1]) | (static_cast<u32>(bytes[2]) << 8) |
                       (static_cast<u32>(bytes[3]) << 16) | (static_cast<u32>(bytes[4]) << 24);
            f.length = dlc;
            for (u8 i = 0; i < dlc; ++i) {
                f.data[i] = bytes[WIRE_HEADER_SIZE + i];
            }
            usize t = WIRE_HEADER_SIZE + dlc;
            f.tag = static_cast<u16>(bytes[t]) | static_cast<u16>(static_cast<u16>(bytes[t + 1]) << 8);
            f.direction = Direction::Inbound;

            auto check = decode(f);
            if (!check.is_ok()) {
                return Result<Frame>::err(check.error());
            }
            return Result<Frame>::ok(f);
        }

        u16 compute_tag() const noexcept {
            Crc15 crc;
            crc.add(static_cast<u8>(id.format));
            crc.add_u32_le(id.raw);
            crc.add(length);
            for (u8 i = 0; i < length && i < CAN_DATA_LENGTH; ++i) {
                crc.add(data[i]);
            }
            return crc.value();
        }

        bool intact() const noexcept { return tag == compute_tag(); }

        dp::Vector<u8> payload() const {
            u8 len = length > CAN_DATA_LENGTH ? static_cast<u8>(CAN_DATA_LENGTH) : length;
            return dp::Vector<u8>(data.begin(), data.begin() + len);
        }

        bool is_extended() const noexcept { return id.is_extended(); }
        PGN pgn() const noexcept { return id.pgn(); }
        Address source() const noexcept { return id.source(); }
        Address destination() const noexcept { return id.destination(); }
        Priority priority() const noexcept { return id.priority(); }
        bool is_broadcast() const noexcept { return id.destination() == BROADCAST_ADDRESS; }
    };

} // namespace agrinet
