// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "l1_cost.hpp"

#include <evmc/evmc.hpp>

#include "param.hpp"

namespace l1fee::protocol {

static L1CostInt widen(const intx::uint256& value) noexcept {
    const auto word{intx::be::store<evmc::bytes32>(value)};
    return intx::be::load<L1CostInt>(word.bytes);
}

L1Cost l1_cost(uint64_t data_gas, const L1OracleParams& oracle) noexcept {
    L1Cost cost;
    cost.gas_used = L1CostInt{data_gas} + widen(oracle.overhead);
    cost.fee = cost.gas_used * widen(oracle.l1_base_fee) * widen(oracle.scalar) / L1CostInt{fee::kL1FeeScalarDivisor};
    return cost;
}

std::optional<L1Cost> compute_l1_cost(ByteView data, const L1OracleParams& oracle,
                                      const UpgradeActivation& upgrades, FeatureGate gate) noexcept {
    if (gate == FeatureGate::kDisabled) {
        return std::nullopt;
    }
    const DataGasPolicy policy{select_data_gas_policy(upgrades)};
    return l1_cost(data_gas(data, policy), oracle);
}

}  // namespace l1fee::protocol
