// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "fastlz.hpp"

#include <limits>
#include <string_view>

#include <catch2/catch_test_macros.hpp>

#include <l1fee/core/common/util.hpp>

#include "param.hpp"

namespace l1fee::protocol {

// Linear congruential byte stream; no 3-byte window repeats within the sizes used here
static Bytes lcg_bytes(size_t size, uint32_t seed = 1) {
    Bytes out;
    out.reserve(size);
    uint32_t state{seed};
    for (size_t i{0}; i < size; ++i) {
        state = state * 1664525u + 1013904223u;
        out.push_back(static_cast<uint8_t>(state >> 24));
    }
    return out;
}

static Bytes ascii_bytes(std::string_view s) {
    return Bytes{reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

TEST_CASE("FastLZ literal cost") {
    CHECK(flz_literal_cost(0) == 0);
    CHECK(flz_literal_cost(1) == 2);
    CHECK(flz_literal_cost(12) == 13);
    CHECK(flz_literal_cost(31) == 32);
    CHECK(flz_literal_cost(32) == 33);
    CHECK(flz_literal_cost(33) == 35);
    CHECK(flz_literal_cost(64) == 66);
    CHECK(flz_literal_cost(65) == 68);
}

TEST_CASE("FastLZ match cost") {
    CHECK(flz_match_cost(3) == 2);
    CHECK(flz_match_cost(8) == 2);
    CHECK(flz_match_cost(9) == 3);
    CHECK(flz_match_cost(264) == 3);
    CHECK(flz_match_cost(265) == 6);
    CHECK(flz_match_cost(526) == 6);
    CHECK(flz_match_cost(527) == 9);
}

TEST_CASE("FastLZ short inputs are all literals") {
    CHECK(flz_compress_len(ByteView{}) == 0);
    for (size_t size{1}; size < 13; ++size) {
        const Bytes zeros(size, 0);
        CHECK(flz_compress_len(zeros) == flz_literal_cost(static_cast<uint32_t>(size)));
        const Bytes noise{lcg_bytes(size)};
        CHECK(flz_compress_len(noise) == flz_literal_cost(static_cast<uint32_t>(size)));
    }
    // Shortest input entering the scan has no room for a match either
    CHECK(flz_compress_len(Bytes(13, 0)) == 14);
    CHECK(flz_compress_len(Bytes(16, 0)) == 17);
}

TEST_CASE("FastLZ repeated bytes") {
    CHECK(flz_compress_len(Bytes(17, 0)) == 11);
    CHECK(flz_compress_len(Bytes(40, 0)) == 11);
    CHECK(flz_compress_len(Bytes(100, 0)) == 11);
    CHECK(flz_compress_len(Bytes(300, 0)) == 14);
    CHECK(flz_compress_len(Bytes(1000, 0)) == 20);
    CHECK(flz_compress_len(Bytes(4096, 0)) == 56);
}

TEST_CASE("FastLZ reference vectors") {
    SECTION("repeated text") {
        CHECK(flz_compress_len(ascii_bytes("hello world hello world hello world")) == 21);
        Bytes pattern;
        for (int i{0}; i < 40; ++i) {
            pattern += ascii_bytes("abcdefgh");
        }
        CHECK(flz_compress_len(pattern) == 20);
    }

    SECTION("byte counter") {
        Bytes counter;
        for (size_t i{0}; i < 1024; ++i) {
            counter.push_back(static_cast<uint8_t>(i));
        }
        CHECK(flz_compress_len(ByteView{counter}.substr(0, 256)) == 264);
        CHECK(flz_compress_len(counter) == 278);
    }

    SECTION("run followed by distinct bytes") {
        Bytes mixed(5, 0xaa);
        for (uint8_t i{1}; i < 20; ++i) {
            mixed.push_back(i);
        }
        CHECK(flz_compress_len(mixed) == 25);
    }

    SECTION("signed empty legacy transaction") {
        const auto txn{*from_hex("dd80808094095e7baea6a6c7c4c2dfeb977efac326af552d878080808080")};
        CHECK(flz_compress_len(txn) == 31);
    }

    SECTION("incompressible data") {
        CHECK(flz_compress_len(lcg_bytes(1000)) == flz_literal_cost(1000));
        CHECK(flz_compress_len(lcg_bytes(9000)) == flz_literal_cost(9000));
    }
}

TEST_CASE("FastLZ match distance limit") {
    Bytes head;
    for (uint8_t i{1}; i <= 32; ++i) {
        head.push_back(i);
    }
    const Bytes other_tail{lcg_bytes(32, 7)};

    // The two copies of head start 32 + filler bytes apart
    SECTION("within window") {
        const Bytes filler{lcg_bytes(8159)};
        const Bytes repeated{head + filler + head};
        CHECK(flz_compress_len(repeated) == 8455);
        CHECK(flz_compress_len(repeated) < flz_compress_len(head + filler + other_tail));
    }

    SECTION("out of window") {
        const Bytes filler{lcg_bytes(8160)};
        CHECK(flz_compress_len(head + filler + head) == 8481);
        CHECK(flz_compress_len(head + filler + head) == flz_compress_len(head + filler + other_tail));
    }
}

TEST_CASE("FastLZ large inputs") {
    static_assert(flz::kMaxInputLength == std::numeric_limits<uint32_t>::max());
    CHECK(flz_compress_len(Bytes(64 * 1024, 0)) == 761);
    CHECK(flz_compress_len(Bytes(1024 * 1024, 0)) == 12'017);
}

TEST_CASE("FastLZ is deterministic") {
    const Bytes data{lcg_bytes(512) + Bytes(300, 0x42) + lcg_bytes(512)};
    const uint32_t first{flz_compress_len(data)};
    CHECK(first == 547);
    for (int i{0}; i < 10; ++i) {
        CHECK(flz_compress_len(data) == first);
    }
}

}  // namespace l1fee::protocol
