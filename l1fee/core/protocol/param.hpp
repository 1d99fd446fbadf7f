// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <limits>

#include <evmc/evmc.hpp>

#include <l1fee/core/common/base.hpp>

namespace l1fee::protocol {
// Gas fee schedule, see Appendix G of the Yellow Paper
// https://ethereum.github.io/yellowpaper/paper.pdf
namespace fee {

    inline constexpr uint64_t kGTxDataZero{4};
    inline constexpr uint64_t kGTxDataNonZeroIstanbul{16};  // EIP-2028

    // Pre-Regolith L1 data gas charges this many extra non-zero bytes per transaction
    // to account for the signature that was not part of the measured payload
    inline constexpr uint64_t kL1LegacySignatureBytes{68};

    // The L1 fee scalar is expressed in millionths
    inline constexpr uint64_t kL1FeeScalarDivisor{kMega};

}  // namespace fee

// FastLZ length estimation
namespace flz {

    inline constexpr uint32_t kHashLog{13};
    inline constexpr uint32_t kHashTableSize{1u << kHashLog};  // 8192 entries
    inline constexpr uint32_t kMaxDistance{8192};
    inline constexpr uint32_t kHashMultiplier{2654435769u};  // Knuth's multiplicative constant
    inline constexpr uint32_t kWindowMask{0xffffff};          // only the low 3 bytes of a window are compared
    inline constexpr uint32_t kMinMatchLength{3};
    inline constexpr uint32_t kShortMatchLength{9};
    inline constexpr uint32_t kMaxMatchChunk{262};
    inline constexpr uint32_t kMaxLiteralRun{32};
    inline constexpr uint32_t kScanStart{2};
    inline constexpr uint32_t kScanTailMargin{9};

    // Inputs shorter than this are charged as literals only
    inline constexpr size_t kMinInputLength{4 + kScanTailMargin};
    // Positions and lengths are 32-bit
    inline constexpr size_t kMaxInputLength{std::numeric_limits<uint32_t>::max()};

}  // namespace flz

using namespace evmc::literals;

// L1Block predeploy holding the L1 fee oracle values
inline constexpr evmc::address kL1BlockAddress{0x4200000000000000000000000000000000000015_address};
inline constexpr evmc::bytes32 kL1BaseFeeSlot{0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
inline constexpr evmc::bytes32 kL1OverheadSlot{0x0000000000000000000000000000000000000000000000000000000000000005_bytes32};
inline constexpr evmc::bytes32 kL1ScalarSlot{0x0000000000000000000000000000000000000000000000000000000000000006_bytes32};

}  // namespace l1fee::protocol
