//
// Malformed, inconsistent and corrupted chunk frames
//

#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>
#include <pngchunk/parse_options.hh>

#include <functional>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngchunk;
using namespace test_utils;

// Helper to track warnings
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }
};

TEST_SUITE("CHUNK_PARSE_ERRORS") {
    TEST_CASE("frame too short") {
        SUBCASE("empty buffer") {
            CHECK_THROWS_AS(chunk::parse(std::vector<std::byte>{}), invalid_chunk_error);
        }

        SUBCASE("eleven bytes") {
            auto frame = make_frame(0, "IEND", "", 0xAE426082u);
            frame.pop_back();
            CHECK_THROWS_AS(chunk::parse(frame), invalid_chunk_error);
        }

        SUBCASE("minimal frame is twelve bytes") {
            auto c = chunk::parse(make_frame(0, "IEND", "", 0xAE426082u));
            CHECK(c.length() == 0);
            CHECK(c.type() == chunk_type("IEND"));
        }
    }

    TEST_CASE("invalid type tag") {
        auto frame = make_frame(0, "IE1D", "", 0);
        CHECK_THROWS_AS(chunk::parse(frame), invalid_chunk_error);

        try {
            (void)chunk::parse(frame);
            FAIL("Should have thrown exception");
        } catch (const invalid_chunk_error& e) {
            std::string msg = e.what();
            CHECK(msg.find("type tag") != std::string::npos);
            CHECK(msg.find("0x31") != std::string::npos);
        }
    }

    TEST_CASE("declared length disagrees with payload") {
        SUBCASE("declared length longer than the payload") {
            auto frame = make_frame(44, "RuSt", secret_message, secret_message_crc);
            REQUIRE(frame.size() == 54);
            CHECK_THROWS_AS(chunk::parse(frame), invalid_chunk_error);
        }

        SUBCASE("declared length shorter than the payload") {
            // The CRC is then read from inside the payload
            auto frame = make_frame(40, "RuSt", secret_message, secret_message_crc);
            CHECK_THROWS_AS(chunk::parse(frame), crc_mismatch_error);
        }

        SUBCASE("huge declared length") {
            auto frame = make_frame(0xFFFFFFF0u, "RuSt", secret_message, secret_message_crc);
            parse_options opts;
            opts.max_chunk_size = 0xFFFFFFFFu;
            CHECK_THROWS_AS(chunk::parse(frame, opts), invalid_chunk_error);
        }

        SUBCASE("correct length parses") {
            auto frame = make_frame(static_cast<std::uint32_t>(secret_message.size()), "RuSt",
                                    secret_message, secret_message_crc);
            auto c = chunk::parse(frame);
            CHECK(c.length() == c.data().size());
        }
    }

    TEST_CASE("stored CRC is verified") {
        auto frame = make_frame(42, "RuSt", secret_message, 2882656333u);

        CHECK_THROWS_AS(chunk::parse(frame), crc_mismatch_error);
        CHECK_THROWS_AS(chunk::parse(frame), parse_error);

        try {
            (void)chunk::parse(frame);
            FAIL("Should have thrown exception");
        } catch (const crc_mismatch_error& e) {
            CHECK(e.expected() == 2882656334u);
            CHECK(e.actual() == 2882656333u);
            std::string msg = e.what();
            CHECK(msg.find("RuSt") != std::string::npos);
            CHECK(msg.find("0xabd1d84d") != std::string::npos);
            CHECK(msg.find("0xabd1d84e") != std::string::npos);
        }
    }

    TEST_CASE("single byte tampering is detected") {
        const auto good = secret_frame();
        REQUIRE_NOTHROW((void)chunk::parse(good));

        for (std::size_t i = 0; i < good.size(); i++) {
            for (auto mask : {std::byte{0x01}, std::byte{0x20}, std::byte{0xFF}}) {
                auto bad = good;
                bad[i] ^= mask;
                INFO("offset " << i << " mask " << std::to_integer<int>(mask));
                CHECK_THROWS_AS((void)chunk::parse(bad), parse_error);
            }
        }
    }

    TEST_CASE("trailing bytes are ignored") {
        auto frame = secret_frame();
        auto next = make_frame(0, "IEND", "", 0xAE426082u);
        frame.insert(frame.end(), next.begin(), next.end());

        auto first = chunk::parse(frame);
        CHECK(first.data_as_text() == secret_message);
        REQUIRE(first.frame_size() == 54);

        auto second = chunk::parse(frame.data() + first.frame_size(), frame.size() - first.frame_size());
        CHECK(second.type() == chunk_type("IEND"));
    }

    TEST_CASE("lenient mode") {
        SUBCASE("CRC mismatch becomes a warning") {
            auto frame = make_frame(42, "RuSt", secret_message, 12345u);

            parse_options opts;
            opts.strict = false;
            warning_tracker tracker;
            opts.on_warning = std::ref(tracker);

            auto c = chunk::parse(frame, opts);
            REQUIRE(tracker.warnings.size() == 1);
            CHECK(tracker.warnings[0].category == "crc_mismatch");
            CHECK(tracker.warnings[0].offset == 0);
            CHECK(tracker.warnings[0].message.find("RuSt") != std::string::npos);

            // The chunk keeps a CRC that matches its contents
            CHECK(c.crc() == secret_message_crc);
            CHECK(c.data_as_text() == secret_message);
        }

        SUBCASE("no handler installed") {
            auto frame = make_frame(42, "RuSt", secret_message, 12345u);
            parse_options opts;
            opts.strict = false;
            CHECK_NOTHROW((void)chunk::parse(frame, opts));
        }

        SUBCASE("structural errors still throw") {
            parse_options opts;
            opts.strict = false;
            CHECK_THROWS_AS(chunk::parse(make_frame(44, "RuSt", secret_message, 0), opts),
                            invalid_chunk_error);
            CHECK_THROWS_AS(chunk::parse(make_frame(0, "Ru1t", "", 0), opts), invalid_chunk_error);
        }
    }

    TEST_CASE("length limit") {
        auto frame = secret_frame();

        SUBCASE("strict mode rejects") {
            parse_options opts;
            opts.max_chunk_size = 16;
            try {
                (void)chunk::parse(frame, opts);
                FAIL("Should have thrown exception");
            } catch (const invalid_chunk_error& e) {
                std::string msg = e.what();
                CHECK(msg.find("RuSt") != std::string::npos);
                CHECK(msg.find("42") != std::string::npos);
                CHECK(msg.find("16") != std::string::npos);
            }
        }

        SUBCASE("lenient mode warns and reads the whole payload") {
            parse_options opts;
            opts.strict = false;
            opts.max_chunk_size = 16;
            warning_tracker tracker;
            opts.on_warning = std::ref(tracker);

            auto c = chunk::parse(frame, opts);
            REQUIRE(tracker.warnings.size() == 1);
            CHECK(tracker.warnings[0].category == "size_limit");
            CHECK(c.length() == 42);
            CHECK(c.data_as_text() == secret_message);
        }

        SUBCASE("default limit is the PNG maximum") {
            parse_options opts;
            CHECK(opts.max_chunk_size == 0x7FFFFFFFu);
            CHECK_THROWS_AS(chunk::parse(make_frame(0x80000000u, "RuSt", "", 0), opts),
                            invalid_chunk_error);
        }
    }
}
