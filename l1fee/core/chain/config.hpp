// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>

#include <nlohmann/json.hpp>

#include <l1fee/core/common/base.hpp>
#include <l1fee/core/protocol/data_gas.hpp>
#include <l1fee/core/protocol/l1_cost.hpp>

namespace l1fee {

using ChainId = uint64_t;

//! \brief Rollup section of a chain config
//! \remarks Its presence is what enables the L1 data fee
struct OptimismConfig {
    uint64_t eip1559_elasticity{0};
    uint64_t eip1559_denominator{0};

    friend bool operator==(const OptimismConfig&, const OptimismConfig&) = default;
};

struct ChainConfig {
    //! \brief Returns the chain identifier
    //! \see https://eips.ethereum.org/EIPS/eip-155
    ChainId chain_id{0};

    std::optional<OptimismConfig> optimism{std::nullopt};

    // Rollup upgrades are triggered by block time
    std::optional<BlockTime> regolith_time{std::nullopt};
    std::optional<BlockTime> eclipse_time{std::nullopt};

    bool is_regolith(BlockTime block_time) const noexcept;
    bool is_eclipse(BlockTime block_time) const noexcept;

    //! \brief Returns which rollup upgrades are active at given block time
    protocol::UpgradeActivation upgrade_activation(BlockTime block_time) const noexcept;

    //! \brief Chains without a rollup section charge no L1 data fee
    protocol::FeatureGate l1_fee_gate() const noexcept;

    //! \brief Return the JSON representation of this object
    nlohmann::json to_json() const noexcept;

    /*Sample JSON input:
    {
            "chainId":10,
            "regolithTime":0,
            "eclipseTime":1720627201,
            "optimism":{
                "eip1559Elasticity":6,
                "eip1559Denominator":50
            }
    }
    */
    //! \brief Try parse a JSON object into strongly typed ChainConfig
    //! \remark Should this return std::nullopt the parsing has failed
    static std::optional<ChainConfig> from_json(const nlohmann::json& json) noexcept;

    friend bool operator==(const ChainConfig&, const ChainConfig&) = default;
};

std::ostream& operator<<(std::ostream& out, const ChainConfig& obj);

}  // namespace l1fee
