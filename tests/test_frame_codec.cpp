#include <catch2/catch_test_macros.hpp>

#include "protocol/frame_codec.hpp"

#include <string>

TEST_CASE("frame::encode", "[frame]") {

    SECTION("BigEndianHeader") {
        auto out = frame::encode("hello");
        REQUIRE(out.has_value());
        REQUIRE(out->size() == frame::HEADER_SIZE + 5);
        REQUIRE((*out)[0] == 0);
        REQUIRE((*out)[1] == 0);
        REQUIRE((*out)[2] == 0);
        REQUIRE((*out)[3] == 5);
        REQUIRE(out->substr(4) == "hello");
    }

    SECTION("LargeLengthByteOrder") {
        std::string payload(0x010203, 'x');
        auto out = frame::encode(payload);
        REQUIRE(out.has_value());
        REQUIRE(static_cast<unsigned char>((*out)[0]) == 0x00);
        REQUIRE(static_cast<unsigned char>((*out)[1]) == 0x01);
        REQUIRE(static_cast<unsigned char>((*out)[2]) == 0x02);
        REQUIRE(static_cast<unsigned char>((*out)[3]) == 0x03);
    }

    SECTION("EmptyPayload") {
        auto out = frame::encode("");
        REQUIRE(out.has_value());
        REQUIRE(*out == std::string(4, '\0'));
    }

    SECTION("OversizeRejected") {
        auto out = frame::encode(std::string(11, 'a'), 10);
        REQUIRE_FALSE(out.has_value());
    }

    SECTION("ExactlyAtLimit") {
        REQUIRE(frame::encode(std::string(10, 'a'), 10).has_value());
    }
}

TEST_CASE("frame::Decoder", "[frame]") {
    frame::Decoder dec;

    SECTION("SingleFrame") {
        dec.feed(*frame::encode(R"({"command":"PING"})"));
        auto next = dec.next();
        REQUIRE(next.has_value());
        REQUIRE(next->has_value());
        REQUIRE(**next == R"({"command":"PING"})");
        REQUIRE(dec.buffered() == 0);
        REQUIRE(dec.finish().has_value());
    }

    SECTION("ByteAtATime") {
        auto wire = *frame::encode("abcdef");
        for (size_t i = 0; i + 1 < wire.size(); ++i) {
            dec.feed(wire.data() + i, 1);
            auto next = dec.next();
            REQUIRE(next.has_value());
            REQUIRE_FALSE(next->has_value());
        }
        dec.feed(wire.data() + wire.size() - 1, 1);
        auto next = dec.next();
        REQUIRE(next.has_value());
        REQUIRE(**next == "abcdef");
    }

    SECTION("SeveralFramesInOneChunk") {
        std::string wire = *frame::encode("one") + *frame::encode("two") + *frame::encode("three");
        dec.feed(wire);

        REQUIRE(**dec.next() == "one");
        REQUIRE(**dec.next() == "two");
        REQUIRE(**dec.next() == "three");
        REQUIRE_FALSE(dec.next()->has_value());
    }

    SECTION("FrameSplitAcrossChunks") {
        std::string wire = *frame::encode("first") + *frame::encode("second");
        dec.feed(wire.substr(0, 11));
        REQUIRE(**dec.next() == "first");
        REQUIRE_FALSE(dec.next()->has_value());

        dec.feed(wire.substr(11));
        REQUIRE(**dec.next() == "second");
    }

    SECTION("OversizeDeclaredLength") {
        frame::Decoder small(16);
        small.feed(*frame::encode(std::string(17, 'x')));
        auto next = small.next();
        REQUIRE_FALSE(next.has_value());
        REQUIRE(next.error().find("exceeds") != std::string::npos);
        REQUIRE(small.failed());

        // Sticky until reset
        small.feed(*frame::encode("ok"));
        REQUIRE_FALSE(small.next().has_value());
        small.reset();
        small.feed(*frame::encode("ok"));
        REQUIRE(**small.next() == "ok");
    }

    SECTION("RawJsonIsProtocolMismatch") {
        dec.feed(std::string(R"({"command":"PING"})"));
        auto next = dec.next();
        REQUIRE_FALSE(next.has_value());
        REQUIRE(next.error().find("protocol mismatch") != std::string::npos);
    }

    SECTION("EndOfStreamMidHeader") {
        dec.feed(std::string("\0\0", 2));
        REQUIRE_FALSE(dec.next()->has_value());
        REQUIRE_FALSE(dec.finish().has_value());
    }

    SECTION("EndOfStreamMidPayload") {
        auto wire = *frame::encode("truncated payload");
        dec.feed(wire.substr(0, wire.size() - 3));
        REQUIRE_FALSE(dec.next()->has_value());
        auto fin = dec.finish();
        REQUIRE_FALSE(fin.has_value());
        REQUIRE(fin.error().find("mid-frame") != std::string::npos);
    }

    SECTION("Utf8PayloadPreserved") {
        std::string text = "caf\xc3\xa9 \xe2\x9c\x93";
        dec.feed(*frame::encode(text));
        REQUIRE(**dec.next() == text);
    }
}
