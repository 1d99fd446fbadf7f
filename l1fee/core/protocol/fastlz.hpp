// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>

#include <l1fee/core/common/bytes.hpp>

namespace l1fee::protocol {

//! \brief Estimates the length of the data once compressed by FastLZ (level 1)
//! \details Greedy single-pass parse over a 13-bit hash table of 3-byte windows, charging literal runs
//! and back-references the way the FastLZ encoder would. It mirrors the flzCompressLen estimator of
//! https://github.com/Vectorized/solady/blob/5315d937d79b335c668896d7533ac603adac5315/js/solady.js
//! step for step, including its suboptimal parse: the result is consensus-critical.
//! \remarks Inputs shorter than 13 bytes are charged as literals only.
//! \pre data.size() <= flz::kMaxInputLength, checked even in release builds
uint32_t flz_compress_len(ByteView data) noexcept;

//! \brief Cost of a run of unmatched bytes: one control byte per chunk of up to 32 literals
uint32_t flz_literal_cost(uint32_t run_length) noexcept;

//! \brief Cost of a back-reference of the given length (at least 3)
uint32_t flz_match_cost(uint32_t match_length) noexcept;

}  // namespace l1fee::protocol
