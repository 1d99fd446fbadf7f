// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "l1_cost_func.hpp"

#include <string>

#include <l1fee/core/common/util.hpp>
#include <l1fee/core/protocol/param.hpp>
#include <l1fee/core/types/evmc_bytes32.hpp>
#include <l1fee/infra/common/log.hpp>

namespace l1fee {

protocol::L1OracleParams read_l1_oracle_params(const StorageReader& state) noexcept {
    return {
        .l1_base_fee = to_uint256(state.read_storage(protocol::kL1BlockAddress, protocol::kL1BaseFeeSlot)),
        .overhead = to_uint256(state.read_storage(protocol::kL1BlockAddress, protocol::kL1OverheadSlot)),
        .scalar = to_uint256(state.read_storage(protocol::kL1BlockAddress, protocol::kL1ScalarSlot)),
    };
}

L1CostFunc make_l1_cost_func(const ChainConfig& config, const StorageReader& state, BlockTime block_time) {
    if (config.l1_fee_gate() == protocol::FeatureGate::kDisabled) {
        L1FEE_TRACE_M("L1 data fee disabled", {"chain_id", std::to_string(config.chain_id)});
        return [](ByteView) -> std::optional<protocol::L1Cost> { return std::nullopt; };
    }

    const protocol::L1OracleParams oracle{read_l1_oracle_params(state)};
    const protocol::UpgradeActivation upgrades{config.upgrade_activation(block_time)};
    const protocol::DataGasPolicy policy{protocol::select_data_gas_policy(upgrades)};

    L1FEE_DEBUG_M("L1 data fee", {"block_time", std::to_string(block_time),
                                  "oracle", to_hex(ByteView{protocol::kL1BlockAddress.bytes}, true),
                                  "policy", std::string{protocol::policy_name(policy)},
                                  "l1_base_fee", intx::to_string(oracle.l1_base_fee),
                                  "overhead", intx::to_string(oracle.overhead),
                                  "scalar", intx::to_string(oracle.scalar)});

    return [oracle, policy](ByteView data) -> std::optional<protocol::L1Cost> {
        return protocol::l1_cost(protocol::data_gas(data, policy), oracle);
    };
}

}  // namespace l1fee
