//
// parse(serialize(c)) == c and serialize(parse(b)) == b
//

#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>

#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;
using namespace test_utils;

namespace {
    std::vector<std::byte> pattern(std::size_t size, unsigned seed) {
        std::vector<std::byte> out(size);
        unsigned state = seed;
        for (auto& b : out) {
            state = state * 1103515245u + 12345u;
            b = static_cast<std::byte>(state >> 16);
        }
        return out;
    }
}

TEST_SUITE("ROUND_TRIP") {
    TEST_CASE("parse of serialize gives the same chunk") {
        const std::vector<std::string> types = {"IHDR", "IDAT", "IEND", "tEXt", "RuSt", "Rust", "zzzz"};
        const std::vector<std::size_t> sizes = {0, 1, 3, 13, 255, 256, 4096, 70000};

        for (const auto& type : types) {
            for (auto size : sizes) {
                chunk original{chunk_type(type), pattern(size, static_cast<unsigned>(size) + type[0])};
                auto bytes = original.serialize();
                REQUIRE(bytes.size() == size + chunk::frame_overhead);

                auto parsed = chunk::parse(bytes);
                INFO("type " << type << " size " << size);
                CHECK(parsed == original);
                CHECK(parsed.length() == original.length());
                CHECK(parsed.type() == original.type());
                CHECK(parsed.crc() == original.crc());
                CHECK(parsed.data() == original.data());
            }
        }
    }

    TEST_CASE("serialize of parse gives the same bytes") {
        SUBCASE("secret message frame") {
            auto frame = secret_frame();
            CHECK(chunk::parse(frame).serialize() == frame);
        }

        SUBCASE("IEND frame") {
            auto frame = make_frame(0, "IEND", "", 0xAE426082u);
            CHECK(chunk::parse(frame).serialize() == frame);
        }

        SUBCASE("text chunk with keyword separator") {
            std::string payload("Title\0Round trip", 16);
            chunk c("tEXt", to_bytes(payload));
            auto frame = c.serialize();
            CHECK(chunk::parse(frame).serialize() == frame);
            CHECK(chunk::parse(frame).data_as_text() == payload);
        }
    }

    TEST_CASE("text survives the round trip") {
        chunk c(chunk_type("RuSt"), to_bytes(secret_message));
        CHECK(chunk::parse(c.serialize()).data_as_text() == secret_message);
    }
}
