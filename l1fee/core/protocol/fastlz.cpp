// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "fastlz.hpp"

#include <vector>

#include <l1fee/core/common/assert.hpp>
#include <l1fee/core/common/endian.hpp>

#include "param.hpp"

namespace l1fee::protocol {

// Multiplicative hash; the 32-bit product wraps around
static uint32_t flz_hash(uint32_t seq) noexcept {
    return (flz::kHashMultiplier * seq) >> (32 - flz::kHashLog);
}

uint32_t flz_literal_cost(uint32_t run_length) noexcept {
    uint32_t cost{(run_length / flz::kMaxLiteralRun) * (flz::kMaxLiteralRun + 1)};
    if (const uint32_t rest{run_length % flz::kMaxLiteralRun}; rest != 0) {
        cost += rest + 1;
    }
    return cost;
}

uint32_t flz_match_cost(uint32_t match_length) noexcept {
    uint32_t cost{3 * (1 + (match_length - flz::kMinMatchLength) / flz::kMaxMatchChunk)};
    if (match_length < flz::kShortMatchLength) {
        --cost;
    }
    return cost;
}

uint32_t flz_compress_len(ByteView data) noexcept {
    L1FEE_ASSERT(data.size() <= flz::kMaxInputLength);
    if (data.size() < flz::kMinInputLength) {
        return flz_literal_cost(static_cast<uint32_t>(data.size()));
    }

    const uint8_t* in{data.data()};
    const auto load_window = [in](uint32_t pos) {
        return endian::load_little_u32(in + pos) & flz::kWindowMask;
    };

    // Last position a 4-byte word can be loaded from
    const uint32_t last{static_cast<uint32_t>(data.size()) - 4};
    const uint32_t scan_limit{last - flz::kScanTailMargin};

    // Most recent position of each hashed window; 0 doubles as "unseen"
    std::vector<uint32_t> table(flz::kHashTableSize, 0);

    uint32_t cost{0};
    uint32_t anchor{0};  // first byte not charged yet
    uint32_t pos{flz::kScanStart};

    while (pos < scan_limit) {
        uint32_t ref{0};
        for (;;) {
            const uint32_t seq{load_window(pos)};
            const uint32_t hash{flz_hash(seq)};
            ref = table[hash];
            table[hash] = pos;
            // A reference too far back gets a value outside the mask so it never compares equal
            const uint32_t candidate{pos - ref < flz::kMaxDistance ? load_window(ref) : flz::kWindowMask + 1};
            if (pos >= scan_limit) {
                break;
            }
            ++pos;
            if (seq == candidate) {
                break;
            }
        }
        if (pos >= scan_limit) {
            break;
        }
        --pos;

        if (pos > anchor) {
            cost += flz_literal_cost(pos - anchor);
        }

        // The first 3 bytes are known to match
        uint32_t length{flz::kMinMatchLength};
        while (length < last - pos && in[ref + length] == in[pos + length]) {
            ++length;
        }
        pos += length - 2;
        cost += flz_match_cost(length);

        // Re-register the two windows straddling the match end
        const uint32_t word{endian::load_little_u32(in + pos)};
        table[flz_hash(word & flz::kWindowMask)] = pos++;
        table[flz_hash(word >> 8)] = pos++;
        anchor = pos;
    }

    return cost + flz_literal_cost(last + 4 - anchor);
}

}  // namespace l1fee::protocol
