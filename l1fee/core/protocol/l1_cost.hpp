// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>

#include <intx/intx.hpp>

#include <l1fee/core/common/bytes.hpp>
#include <l1fee/core/protocol/data_gas.hpp>

namespace l1fee::protocol {

// Wide enough to hold (data gas + overhead) * l1_base_fee * scalar for any 256-bit oracle values
using L1CostInt = intx::uint<1024>;

//! \brief Whether the chain charges an L1 data fee at all
enum class FeatureGate {
    kDisabled,
    kEnabled,
};

//! \brief L1 fee oracle values as stored in the L1Block predeploy
struct L1OracleParams {
    intx::uint256 l1_base_fee{0};
    intx::uint256 overhead{0};
    intx::uint256 scalar{0};

    friend bool operator==(const L1OracleParams&, const L1OracleParams&) = default;
};

struct L1Cost {
    L1CostInt fee{0};
    L1CostInt gas_used{0};  // reported in receipts

    friend bool operator==(const L1Cost&, const L1Cost&) = default;
};

//! \brief Applies the oracle values to the L1 data gas of a payload
//! \details gas_used = data_gas + overhead; fee = gas_used * l1_base_fee * scalar / 10^6,
//! with a single truncating division after both multiplications
L1Cost l1_cost(uint64_t data_gas, const L1OracleParams& oracle) noexcept;

//! \brief Computes the L1 data fee charged to the sender of a transaction and the L1 gas it uses
//! \param data the serialized transaction
//! \return std::nullopt if the fee is not applicable on this chain, which differs from a zero fee
std::optional<L1Cost> compute_l1_cost(ByteView data, const L1OracleParams& oracle,
                                      const UpgradeActivation& upgrades, FeatureGate gate) noexcept;

}  // namespace l1fee::protocol
