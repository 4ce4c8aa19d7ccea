//
// Created by igor on 14/08/2025.
//
// Hardening tests: corrupted and hostile chunk buffers

#include <doctest/doctest.h>

#include <pngme/chunk.hh>
#include <pngme/exceptions.hh>
#include <pngme/parse_options.hh>

#include "test_utils.hh"

using namespace pngme;

TEST_CASE("Security - single bit flips in type or payload break the CRC") {
    const auto original = secret_chunk_bytes();
    // Type starts at 4, payload ends where the CRC begins
    const std::size_t begin = 4;
    const std::size_t end = original.size() - 4;

    for (std::size_t i = begin; i < end; i++) {
        for (int bit = 0; bit < 8; bit++) {
            auto corrupted = original;
            corrupted[i] ^= std::byte(1u << bit);
            CAPTURE(i);
            CAPTURE(bit);
            CHECK_THROWS_AS(chunk::parse(corrupted), crc_mismatch_error);
        }
    }
}

TEST_CASE("Security - bit flips in the CRC field are detected") {
    const auto original = secret_chunk_bytes();
    for (std::size_t i = original.size() - 4; i < original.size(); i++) {
        auto corrupted = original;
        corrupted[i] ^= std::byte(0x01);
        CHECK_THROWS_AS(chunk::parse(corrupted), crc_mismatch_error);
    }
}

TEST_CASE("Security - bit flips in the length field never yield the original chunk") {
    const auto original = secret_chunk_bytes();
    const auto expected = chunk::parse(original);

    for (std::size_t i = 0; i < 4; i++) {
        for (int bit = 0; bit < 8; bit++) {
            auto corrupted = original;
            corrupted[i] ^= std::byte(1u << bit);
            CAPTURE(i);
            CAPTURE(bit);
            try {
                auto c = chunk::parse(corrupted);
                CHECK(c != expected);
            } catch (const parse_error& e) {
                bool expected_reason = e.reason() == parse_error::reason_t::truncated ||
                                       e.reason() == parse_error::reason_t::crc_mismatch;
                CHECK(expected_reason);
            }
        }
    }
}

TEST_CASE("Security - hostile declared lengths") {
    SUBCASE("maximum 32 bit length in a minimal buffer") {
        auto bytes = raw_chunk(0xFFFFFFFFu, "RuSt", "", 0);
        try {
            (void)chunk::parse(bytes);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.reason() == parse_error::reason_t::truncated);
        }
    }

    SUBCASE("length just past the buffer") {
        auto bytes = raw_chunk(5, "RuSt", "abcd", 0);
        try {
            (void)chunk::parse(bytes);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.reason() == parse_error::reason_t::truncated);
        }
    }

    SUBCASE("length above the PNG limit in strict mode") {
        // Buffer is large enough, the limit is what rejects it
        parse_options opts;
        opts.max_chunk_size = 16;
        chunk c(chunk_type::from_string("RuSt"), std::vector<std::byte>(17, std::byte('x')));
        try {
            (void)chunk::parse(c.as_bytes(), opts);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.reason() == parse_error::reason_t::size_limit);
        }
    }

    SUBCASE("length above the limit in lenient mode") {
        parse_options opts;
        opts.strict = false;
        opts.max_chunk_size = 16;
        chunk c(chunk_type::from_string("RuSt"), std::vector<std::byte>(17, std::byte('x')));
        auto back = chunk::parse(c.as_bytes(), opts);
        CHECK(back == c);
    }
}

TEST_CASE("Security - invalid chunk types") {
    chunk c(chunk_type('R', 'u', 's', 't'), bytes_of("payload"));

    SUBCASE("accepted by default") {
        auto back = chunk::parse(c.as_bytes());
        CHECK(back.type().to_string() == "Rust");
        CHECK_FALSE(back.type().is_valid());
    }

    SUBCASE("rejected on request") {
        parse_options opts;
        opts.require_valid_type = true;
        try {
            (void)chunk::parse(c.as_bytes(), opts);
            FAIL("Should have thrown exception");
        } catch (const parse_error& e) {
            CHECK(e.reason() == parse_error::reason_t::invalid_type);
        }
    }

    SUBCASE("CRC is checked before the type") {
        parse_options opts;
        opts.require_valid_type = true;
        auto bytes = c.as_bytes();
        bytes[8] ^= std::byte(0x40);
        CHECK_THROWS_AS(chunk::parse(bytes, opts), crc_mismatch_error);
    }
}
